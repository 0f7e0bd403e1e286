#pragma once

/**
 * @file identity.hpp
 * @brief Identifier rotation for idscrub
 *
 * Reads the host's identity file, replaces identifier values with fresh random
 * values of the same shape and writes the file back atomically. Old values are
 * not kept anywhere.
 */

#include "idscrub.hpp"
#include "fileio.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace idscrub {
namespace identity {

// ==================== Format Classes ====================

/// Structural shape of an identifier value
enum class FormatClass {
    Uuid,     // 8-4-4-4-12 hex, optionally in braces
    Hex,      // hex digits with at least one letter
    Generic   // anything else, replaced per character class
};

/// Convert format class to string
[[nodiscard]] constexpr const char* format_class_to_string(FormatClass format) noexcept {
    switch (format) {
        case FormatClass::Uuid:
            return "uuid";
        case FormatClass::Hex:
            return "hex";
        case FormatClass::Generic:
            return "generic";
    }
    return "generic";
}

/// Detect the format class of a value
[[nodiscard]] FormatClass classify(const std::string& value) noexcept;

/**
 * @brief Canonical description of a value's shape
 *
 * Two values have the same format class exactly when their signatures are
 * equal. Covers length, character classes, letter case, UUID version nibble and
 * variant bits, and every non-alphanumeric character.
 */
[[nodiscard]] std::string format_signature(const std::string& value);

/// Check whether two values share a format class
[[nodiscard]] inline bool same_format_class(const std::string& a, const std::string& b) {
    return format_signature(a) == format_signature(b);
}

/**
 * @brief Generate a fresh value of the same format class
 *
 * The result always differs from the input.
 *
 * @param old_value Current identifier value
 * @return New value, InvalidParameter if the value has nothing to randomize
 */
[[nodiscard]] Result<std::string> generate_replacement(const std::string& old_value);

// ==================== Identity File ====================

/**
 * @brief Parsed identity file that can be re-rendered byte-for-byte
 *
 * Only top-level string members whose key was requested are tracked. Rendering
 * reproduces the original text with just those values substituted.
 */
class IdentityDocument {
  public:
    /// Current identifier values (including any set() calls)
    [[nodiscard]] const IdentityRecord& record() const noexcept { return record_; }

    /// Original file content
    [[nodiscard]] const std::string& text() const noexcept { return text_; }

    /// Replace the value of a tracked key
    [[nodiscard]] Result<void> set(const std::string& key, const std::string& value);

    /// Original text with every tracked value substituted
    [[nodiscard]] std::string render() const;

  private:
    struct Span {
        std::size_t offset = 0;  // Opening quote of the value token
        std::size_t length = 0;  // Token length including quotes
    };

    friend Result<IdentityDocument> parse_identities(const std::string& text,
                                                     const std::vector<std::string>& keys);

    std::string text_;
    IdentityRecord record_;
    std::map<std::string, std::vector<Span>> spans_;
};

/**
 * @brief Parse identity JSON text
 *
 * @return ParseError if the text is not JSON or its root is not an object
 */
[[nodiscard]] Result<IdentityDocument> parse_identities(const std::string& text,
                                                        const std::vector<std::string>& keys);

/**
 * @brief Read the identity file
 *
 * @param path Identity file (storage.json)
 * @param keys Identifier keys to track
 * @return NotFound, PermissionDenied or ParseError on failure
 */
[[nodiscard]] Result<IdentityDocument> read_identities(const std::filesystem::path& path,
                                                       const std::vector<std::string>& keys);

/**
 * @brief Replace every tracked value with generate_replacement()
 *
 * Values with nothing to randomize (e.g. empty strings) are left alone.
 *
 * @return Number of values replaced
 */
[[nodiscard]] Result<std::size_t> rotate_identities(IdentityDocument& document);

/**
 * @brief Write the document back with an atomic replace
 *
 * The file keeps its permission bits.
 */
[[nodiscard]] Result<void> write_identities(const std::filesystem::path& path,
                                            const IdentityDocument& document,
                                            const fileio::ReplaceOptions& options = {});

// ==================== machineid File ====================

/// Read the identifier held by a plain-text machineid file (surrounding whitespace removed)
[[nodiscard]] Result<std::string> read_machine_id(const std::filesystem::path& path);

/**
 * @brief Rotate the identifier in a machineid file
 *
 * Trailing whitespace (usually a newline) is preserved.
 */
[[nodiscard]] Result<void> rewrite_machine_id_file(const std::filesystem::path& path,
                                                   const fileio::ReplaceOptions& options = {});

}  // namespace identity
}  // namespace idscrub
