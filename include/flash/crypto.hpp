#pragma once

/// @file include/flash/crypto.hpp
/// @brief SHA-256 / HMAC-SHA256 helpers over OpenSSL libcrypto.
///
/// Used for market commitment hashes, outcome hashes in proof public inputs
/// and attestation signatures. All functions are `noexcept`; an OpenSSL
/// failure yields `std::nullopt`.

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace flash::crypto {

static constexpr std::size_t DIGEST_SIZE = 32;

/// 32-byte SHA-256 / HMAC-SHA256 output.
using Digest = std::array<std::uint8_t, DIGEST_SIZE>;

[[nodiscard]] std::optional<Digest> sha256(std::span<const std::uint8_t> data) noexcept;
[[nodiscard]] std::optional<Digest> sha256(std::string_view data) noexcept;

[[nodiscard]] std::optional<Digest>
hmac_sha256(std::string_view key, std::span<const std::uint8_t> message) noexcept;

[[nodiscard]] std::optional<Digest>
hmac_sha256(std::string_view key, std::string_view message) noexcept;

/// Constant-time comparison; false when sizes differ.
[[nodiscard]] bool equal(std::span<const std::uint8_t> a,
                         std::span<const std::uint8_t> b) noexcept;

/// Lower-case hex encoding.
[[nodiscard]] std::string to_hex(std::span<const std::uint8_t> bytes);

} // namespace flash::crypto
