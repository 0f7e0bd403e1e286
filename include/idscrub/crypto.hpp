#pragma once

/**
 * @file crypto.hpp
 * @brief Randomness and hashing utilities for idscrub
 *
 * Thin wrappers over OpenSSL's CSPRNG and SHA-256.
 */

#include "idscrub.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace idscrub {
namespace crypto {

// ==================== Random ====================

/// Fill a buffer with cryptographically secure random bytes
[[nodiscard]] Result<std::vector<uint8_t>> random_bytes(std::size_t count);

/**
 * @brief Draw characters uniformly from an alphabet
 *
 * Uses rejection sampling so every character is equally likely.
 *
 * @param alphabet Non-empty set of characters (at most 256)
 * @param count Number of characters to draw
 */
[[nodiscard]] Result<std::string> random_string(const std::string& alphabet, std::size_t count);

// ==================== Hashing ====================

/// Lowercase hex encoding of bytes
[[nodiscard]] std::string hex_encode(const std::vector<uint8_t>& data);

/// SHA-256 of a string as lowercase hex
[[nodiscard]] Result<std::string> sha256_hex(const std::string& input);

}  // namespace crypto
}  // namespace idscrub
