#include "idscrub/identity.hpp"
#include "idscrub/crypto.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <string>
#include <tuple>

namespace idscrub {
namespace identity {

namespace fs = std::filesystem;

namespace {

constexpr const char* kHexLower = "0123456789abcdef";
constexpr const char* kHexUpper = "0123456789ABCDEF";
constexpr const char* kHexMixed = "0123456789abcdefABCDEF";
constexpr const char* kDigits = "0123456789";
constexpr const char* kLower = "abcdefghijklmnopqrstuvwxyz";
constexpr const char* kUpper = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
constexpr const char* kWhitespace = " \t\r\n";

// Replacements are redrawn until they differ and keep the shape
constexpr int kMaxAttempts = 256;

// Version and variant nibble positions in an unbraced UUID
constexpr std::size_t kUuidLength = 36;
constexpr std::size_t kVersionIndex = 14;
constexpr std::size_t kVariantIndex = 19;

bool is_digit(char c) { return c >= '0' && c <= '9'; }
bool is_lower(char c) { return c >= 'a' && c <= 'z'; }
bool is_upper(char c) { return c >= 'A' && c <= 'Z'; }
bool is_hex_letter(char c) { return (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F'); }
bool is_hex(char c) { return is_digit(c) || is_hex_letter(c); }

int hex_value(char c) {
    if (is_digit(c)) {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    return c - 'A' + 10;
}

bool is_braced(const std::string& value) {
    return value.size() == kUuidLength + 2 && value.front() == '{' && value.back() == '}';
}

bool is_uuid_body(const std::string& body) {
    if (body.size() != kUuidLength) {
        return false;
    }
    for (std::size_t i = 0; i < body.size(); ++i) {
        bool dash = i == 8 || i == 13 || i == 18 || i == 23;
        if (dash ? body[i] != '-' : !is_hex(body[i])) {
            return false;
        }
    }
    return true;
}

std::string uuid_body(const std::string& value) {
    return is_braced(value) ? value.substr(1, kUuidLength) : value;
}

// Variant bits kept from the variant nibble: 0xxx, 10xx, 110x, 111x
int variant_mask(int nibble) {
    if (nibble < 0x8) {
        return 0x8;
    }
    if (nibble < 0xC) {
        return 0xC;
    }
    return 0xE;
}

std::string variant_class(int nibble) {
    switch (variant_mask(nibble)) {
        case 0x8:
            return "0";
        case 0xC:
            return "10";
        default:
            return nibble < 0xE ? "110" : "111";
    }
}

std::string letter_case(const std::string& value) {
    bool lower = false;
    bool upper = false;
    for (char c : value) {
        lower = lower || is_lower(c);
        upper = upper || is_upper(c);
    }
    if (lower && upper) {
        return "mixed";
    }
    return upper ? "upper" : "lower";
}

Result<char> random_char(const char* alphabet) {
    auto drawn = crypto::random_string(alphabet, 1);
    if (drawn.is_error()) {
        return Result<char>::error(drawn.error_code(), drawn.error_message());
    }
    return Result<char>::ok(drawn.value()[0]);
}

Result<std::string> draw_uuid(const std::string& old_value) {
    std::string body = uuid_body(old_value);
    const char* alphabet = letter_case(body) == "lower" ? kHexLower : kHexUpper;

    auto random = crypto::random_string(alphabet, kUuidLength);
    if (random.is_error()) {
        return random;
    }

    std::string fresh = body;
    for (std::size_t i = 0; i < fresh.size(); ++i) {
        if (fresh[i] == '-' || i == kVersionIndex) {
            continue;
        }
        if (i == kVariantIndex) {
            int old_nibble = hex_value(body[i]);
            int mask = variant_mask(old_nibble);
            int nibble = (old_nibble & mask) | (hex_value(random.value()[i]) & ~mask & 0xF);
            fresh[i] = alphabet[nibble];
            continue;
        }
        fresh[i] = random.value()[i];
    }

    return Result<std::string>::ok(is_braced(old_value) ? "{" + fresh + "}" : fresh);
}

Result<std::string> draw_hex(const std::string& old_value) {
    std::string shape = letter_case(old_value);
    const char* alphabet = shape == "lower" ? kHexLower : shape == "upper" ? kHexUpper : kHexMixed;
    return crypto::random_string(alphabet, old_value.size());
}

Result<std::string> draw_generic(const std::string& old_value) {
    std::string fresh = old_value;
    for (char& c : fresh) {
        const char* alphabet = is_digit(c)   ? kDigits
                               : is_lower(c) ? kLower
                               : is_upper(c) ? kUpper
                                             : nullptr;
        if (alphabet == nullptr) {
            continue;
        }
        auto drawn = random_char(alphabet);
        if (drawn.is_error()) {
            return Result<std::string>::error(drawn.error_code(), drawn.error_message());
        }
        c = drawn.value();
    }
    return Result<std::string>::ok(std::move(fresh));
}

bool has_replaceable(const std::string& value) {
    return std::any_of(value.begin(), value.end(),
                       [](char c) { return is_digit(c) || is_lower(c) || is_upper(c); });
}

// ==================== Identity JSON scanner ====================
//
// Runs only on text nlohmann::json already accepted, so it can be lenient.

std::size_t skip_whitespace(const std::string& text, std::size_t pos) {
    while (pos < text.size() && std::char_traits<char>::find(kWhitespace, 4, text[pos])) {
        ++pos;
    }
    return pos;
}

// pos at the opening quote; returns the position after the closing quote
std::size_t skip_string(const std::string& text, std::size_t pos) {
    ++pos;
    while (pos < text.size()) {
        if (text[pos] == '\\') {
            pos += 2;
            continue;
        }
        if (text[pos] == '"') {
            return pos + 1;
        }
        ++pos;
    }
    return pos;
}

std::size_t skip_value(const std::string& text, std::size_t pos) {
    if (pos >= text.size()) {
        return pos;
    }
    if (text[pos] == '"') {
        return skip_string(text, pos);
    }
    if (text[pos] == '{' || text[pos] == '[') {
        int depth = 0;
        while (pos < text.size()) {
            char c = text[pos];
            if (c == '"') {
                pos = skip_string(text, pos);
                continue;
            }
            if (c == '{' || c == '[') {
                ++depth;
            } else if (c == '}' || c == ']') {
                if (--depth == 0) {
                    return pos + 1;
                }
            }
            ++pos;
        }
        return pos;
    }
    while (pos < text.size() && text[pos] != ',' && text[pos] != '}' && text[pos] != ']' &&
           !std::char_traits<char>::find(kWhitespace, 4, text[pos])) {
        ++pos;
    }
    return pos;
}

std::string decode_string(const std::string& token) {
    return nlohmann::json::parse(token).get<std::string>();
}

}  // namespace

// ==================== Format Classes ====================

FormatClass classify(const std::string& value) noexcept {
    if (is_uuid_body(uuid_body(value))) {
        return FormatClass::Uuid;
    }
    if (!value.empty() && std::all_of(value.begin(), value.end(), is_hex) &&
        std::any_of(value.begin(), value.end(), is_hex_letter)) {
        return FormatClass::Hex;
    }
    return FormatClass::Generic;
}

std::string format_signature(const std::string& value) {
    switch (classify(value)) {
        case FormatClass::Uuid: {
            std::string body = uuid_body(value);
            std::string version(1, static_cast<char>(std::tolower(
                                       static_cast<unsigned char>(body[kVersionIndex]))));
            return std::string("uuid|") + (is_braced(value) ? "braced" : "bare") + "|" +
                   (letter_case(body) == "lower" ? "lower" : "upper") + "|v" + version + "|" +
                   variant_class(hex_value(body[kVariantIndex]));
        }
        case FormatClass::Hex:
            return "hex|" + std::to_string(value.size()) + "|" + letter_case(value);
        case FormatClass::Generic:
            break;
    }

    std::string shape = "generic|";
    for (char c : value) {
        shape += is_digit(c) ? '9' : is_lower(c) ? 'a' : is_upper(c) ? 'A' : c;
    }
    return shape;
}

Result<std::string> generate_replacement(const std::string& old_value) {
    if (!has_replaceable(old_value)) {
        return Result<std::string>::error(ErrorCode::InvalidParameter,
                                          "Value has no characters to randomize");
    }

    FormatClass format = classify(old_value);
    std::string signature = format_signature(old_value);

    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        Result<std::string> candidate = format == FormatClass::Uuid  ? draw_uuid(old_value)
                                        : format == FormatClass::Hex ? draw_hex(old_value)
                                                                     : draw_generic(old_value);
        if (candidate.is_error()) {
            return candidate;
        }
        if (candidate.value() != old_value && format_signature(candidate.value()) == signature) {
            return candidate;
        }
    }

    return Result<std::string>::error(ErrorCode::Unknown,
                                      std::string("Could not generate a distinct ") +
                                          format_class_to_string(format) + " value");
}

// ==================== IdentityDocument ====================

Result<void> IdentityDocument::set(const std::string& key, const std::string& value) {
    if (spans_.find(key) == spans_.end()) {
        return Result<void>::error(ErrorCode::NotFound, "Key not present: " + key);
    }
    record_[key] = value;
    return Result<void>::ok();
}

std::string IdentityDocument::render() const {
    std::vector<std::tuple<std::size_t, std::size_t, std::string>> edits;
    for (const auto& [key, spans] : spans_) {
        std::string token = nlohmann::json(record_.at(key)).dump();
        for (const auto& span : spans) {
            edits.emplace_back(span.offset, span.length, token);
        }
    }
    std::sort(edits.begin(), edits.end());

    std::string out;
    out.reserve(text_.size());
    std::size_t cursor = 0;
    for (const auto& [offset, length, token] : edits) {
        out.append(text_, cursor, offset - cursor);
        out += token;
        cursor = offset + length;
    }
    out.append(text_, cursor, std::string::npos);
    return out;
}

Result<IdentityDocument> parse_identities(const std::string& text,
                                          const std::vector<std::string>& keys) {
    IdentityDocument doc;
    doc.text_ = text;

    try {
        auto json = nlohmann::json::parse(text);
        if (!json.is_object()) {
            return Result<IdentityDocument>::error(ErrorCode::ParseError,
                                                   "Identity file root is not an object");
        }

        std::size_t pos = text.compare(0, 3, "\xEF\xBB\xBF") == 0 ? 3 : 0;
        pos = skip_whitespace(text, pos) + 1;  // '{'

        while (true) {
            pos = skip_whitespace(text, pos);
            if (pos >= text.size() || text[pos] == '}') {
                break;
            }

            std::size_t key_end = skip_string(text, pos);
            std::string key = decode_string(text.substr(pos, key_end - pos));

            pos = skip_whitespace(text, key_end) + 1;  // ':'
            pos = skip_whitespace(text, pos);

            std::size_t value_end = skip_value(text, pos);
            bool wanted = std::find(keys.begin(), keys.end(), key) != keys.end();
            if (wanted && text[pos] == '"') {
                std::string token = text.substr(pos, value_end - pos);
                doc.record_[key] = decode_string(token);
                doc.spans_[key].push_back({pos, value_end - pos});
            }

            pos = skip_whitespace(text, value_end);
            if (pos < text.size() && text[pos] == ',') {
                ++pos;
            }
        }
    } catch (const nlohmann::json::exception& e) {
        return Result<IdentityDocument>::error(ErrorCode::ParseError,
                                               std::string("Invalid JSON: ") + e.what());
    }

    return Result<IdentityDocument>::ok(std::move(doc));
}

Result<IdentityDocument> read_identities(const fs::path& path,
                                         const std::vector<std::string>& keys) {
    auto content = fileio::read_file(path);
    if (content.is_error()) {
        return Result<IdentityDocument>::error(content.error_code(), content.error_message());
    }

    auto doc = parse_identities(content.value(), keys);
    if (doc.is_error()) {
        return Result<IdentityDocument>::error(doc.error_code(),
                                               path.string() + ": " + doc.error_message());
    }
    return doc;
}

Result<std::size_t> rotate_identities(IdentityDocument& document) {
    std::size_t rotated = 0;
    IdentityRecord current = document.record();

    for (const auto& [key, value] : current) {
        auto fresh = generate_replacement(value);
        if (fresh.is_error()) {
            if (fresh.error_code() == ErrorCode::InvalidParameter) {
                continue;
            }
            return Result<std::size_t>::error(fresh.error_code(),
                                              key + ": " + fresh.error_message());
        }

        auto updated = document.set(key, fresh.value());
        if (updated.is_error()) {
            return Result<std::size_t>::error(updated.error_code(), updated.error_message());
        }
        ++rotated;
    }

    return Result<std::size_t>::ok(rotated);
}

Result<void> write_identities(const fs::path& path, const IdentityDocument& document,
                              const fileio::ReplaceOptions& options) {
    return fileio::atomic_replace(path, document.render(), options);
}

// ==================== machineid File ====================

Result<std::string> read_machine_id(const fs::path& path) {
    auto content = fileio::read_file(path);
    if (content.is_error()) {
        return content;
    }

    const std::string& text = content.value();
    auto first = text.find_first_not_of(kWhitespace);
    if (first == std::string::npos) {
        return Result<std::string>::error(ErrorCode::ParseError,
                                          "Empty machineid file: " + path.string());
    }
    auto last = text.find_last_not_of(kWhitespace);
    return Result<std::string>::ok(text.substr(first, last - first + 1));
}

Result<void> rewrite_machine_id_file(const fs::path& path, const fileio::ReplaceOptions& options) {
    auto content = fileio::read_file(path);
    if (content.is_error()) {
        return Result<void>::error(content.error_code(), content.error_message());
    }

    const std::string& text = content.value();
    auto first = text.find_first_not_of(kWhitespace);
    if (first == std::string::npos) {
        return Result<void>::error(ErrorCode::ParseError, "Empty machineid file: " + path.string());
    }
    auto last = text.find_last_not_of(kWhitespace);

    auto fresh = generate_replacement(text.substr(first, last - first + 1));
    if (fresh.is_error()) {
        return Result<void>::error(ErrorCode::ParseError,
                                   path.string() + ": " + fresh.error_message());
    }

    std::string updated = text.substr(0, first) + fresh.value() + text.substr(last + 1);
    return fileio::atomic_replace(path, updated, options);
}

}  // namespace identity
}  // namespace idscrub
