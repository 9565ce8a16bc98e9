/// @file src/crypto/digest.cpp
/// @brief OpenSSL-backed SHA-256 and HMAC-SHA256.

#include "flash/crypto.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <cstdio>

namespace flash::crypto {

// ─── sha256 ───────────────────────────────────────────────────────────────────

std::optional<Digest> sha256(std::span<const std::uint8_t> data) noexcept {
    Digest out{};
    unsigned int out_len = 0;
    if (EVP_Digest(data.data(), data.size(), out.data(), &out_len,
                   EVP_sha256(), nullptr) != 1) {
        return std::nullopt;
    }
    if (out_len != DIGEST_SIZE) return std::nullopt;
    return out;
}

std::optional<Digest> sha256(std::string_view data) noexcept {
    return sha256(std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t*>(data.data()), data.size()));
}

// ─── hmac_sha256 ──────────────────────────────────────────────────────────────

std::optional<Digest>
hmac_sha256(std::string_view key, std::span<const std::uint8_t> message) noexcept {
    Digest out{};
    unsigned int out_len = 0;
    const unsigned char* mac = HMAC(EVP_sha256(),
                                    key.data(), static_cast<int>(key.size()),
                                    message.data(), message.size(),
                                    out.data(), &out_len);
    if (mac == nullptr || out_len != DIGEST_SIZE) return std::nullopt;
    return out;
}

std::optional<Digest>
hmac_sha256(std::string_view key, std::string_view message) noexcept {
    return hmac_sha256(key, std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t*>(message.data()), message.size()));
}

// ─── equal / to_hex ───────────────────────────────────────────────────────────

bool equal(std::span<const std::uint8_t> a, std::span<const std::uint8_t> b) noexcept {
    if (a.size() != b.size()) return false;
    if (a.empty()) return true;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string to_hex(std::span<const std::uint8_t> bytes) {
    std::string hex(bytes.size() * 2, '0');
    char buf[3];
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        std::snprintf(buf, sizeof(buf), "%02x", bytes[i]);
        hex[2 * i]     = buf[0];
        hex[2 * i + 1] = buf[1];
    }
    return hex;
}

} // namespace flash::crypto
