#include "idscrub/crypto.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <iomanip>
#include <limits>
#include <memory>
#include <sstream>

namespace idscrub {
namespace crypto {

namespace {

std::string last_openssl_error() {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return "unknown OpenSSL error";
    }
    char buffer[256] = {0};
    ERR_error_string_n(code, buffer, sizeof(buffer));
    return buffer;
}

}  // namespace

// ==================== Random ====================

Result<std::vector<uint8_t>> random_bytes(std::size_t count) {
    std::vector<uint8_t> buffer(count);
    if (count == 0) {
        return Result<std::vector<uint8_t>>::ok(std::move(buffer));
    }

    if (count > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        return Result<std::vector<uint8_t>>::error(ErrorCode::InvalidParameter,
                                                   "Requested too many random bytes");
    }

    if (RAND_bytes(buffer.data(), static_cast<int>(count)) != 1) {
        return Result<std::vector<uint8_t>>::error(
            ErrorCode::Unknown, "RAND_bytes failed: " + last_openssl_error());
    }

    return Result<std::vector<uint8_t>>::ok(std::move(buffer));
}

Result<std::string> random_string(const std::string& alphabet, std::size_t count) {
    if (alphabet.empty() || alphabet.size() > 256) {
        return Result<std::string>::error(ErrorCode::InvalidParameter,
                                          "Alphabet must hold 1 to 256 characters");
    }

    // Largest multiple of the alphabet size that fits in a byte; bytes above it are redrawn
    const unsigned limit = 256u - (256u % static_cast<unsigned>(alphabet.size()));

    std::string result;
    result.reserve(count);

    while (result.size() < count) {
        auto bytes = random_bytes((count - result.size()) * 2);
        if (bytes.is_error()) {
            return Result<std::string>::error(bytes.error_code(), bytes.error_message());
        }
        for (uint8_t byte : bytes.value()) {
            if (byte >= limit) {
                continue;
            }
            result.push_back(alphabet[byte % alphabet.size()]);
            if (result.size() == count) {
                break;
            }
        }
    }

    return Result<std::string>::ok(std::move(result));
}

// ==================== Hashing ====================

std::string hex_encode(const std::vector<uint8_t>& data) {
    std::ostringstream ss;
    for (uint8_t byte : data) {
        ss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(byte);
    }
    return ss.str();
}

Result<std::string> sha256_hex(const std::string& input) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(),
                                                                EVP_MD_CTX_free);
    if (!ctx) {
        return Result<std::string>::error(ErrorCode::Unknown,
                                          "EVP_MD_CTX_new failed: " + last_openssl_error());
    }

    std::vector<uint8_t> hash(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), hash.data(), &len) != 1) {
        return Result<std::string>::error(ErrorCode::Unknown,
                                          "SHA-256 failed: " + last_openssl_error());
    }
    hash.resize(len);

    return Result<std::string>::ok(hex_encode(hash));
}

}  // namespace crypto
}  // namespace idscrub
