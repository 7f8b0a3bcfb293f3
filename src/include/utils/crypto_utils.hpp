#pragma once
/**
 * @file crypto_utils.hpp
 * @brief Cryptographic helpers backed by libsodium.
 *
 * Every function initializes libsodium on first use, so the helpers are usable before
 * the lifecycle starts (pure tests). The "CryptoUtils" lifecycle module initializes it
 * eagerly and reports failure at startup.
 */
#include "mydiarelay_utils_export.h"
#include "utils/module_def.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace mydiarelay::crypto
{

/** HMAC-SHA256 output size in bytes. */
static constexpr size_t HMAC_SHA256_BYTES = 32;

// ============================================================================
// HMAC-SHA256
// ============================================================================

/**
 * @brief HMAC-SHA256 of @p message under @p key. Keys of any length are accepted.
 */
MYDIARELAY_UTILS_EXPORT std::array<uint8_t, HMAC_SHA256_BYTES>
hmac_sha256(std::string_view key, std::string_view message);

/** @brief Lowercase hex of hmac_sha256(). */
MYDIARELAY_UTILS_EXPORT std::string hmac_sha256_hex(std::string_view key,
                                                    std::string_view message);

/**
 * @brief Constant-time equality. Inputs of different length compare unequal; only the
 *        length is leaked.
 */
MYDIARELAY_UTILS_EXPORT bool constant_time_equal(std::string_view a, std::string_view b) noexcept;

// ============================================================================
// Random Number Generation
// ============================================================================

MYDIARELAY_UTILS_EXPORT void generate_random_bytes(uint8_t *out, size_t len) noexcept;

/** @brief @p len random bytes as a binary string. */
MYDIARELAY_UTILS_EXPORT std::string random_bytes(size_t len);

/**
 * @brief Uniform random integer in [0, upper_bound) without modulo bias
 *        (`randombytes_uniform`). Returns 0 when upper_bound < 2.
 */
MYDIARELAY_UTILS_EXPORT uint32_t random_uniform(uint32_t upper_bound) noexcept;

// ============================================================================
// Encodings
// ============================================================================

MYDIARELAY_UTILS_EXPORT std::string to_hex(std::span<const uint8_t> bytes);
MYDIARELAY_UTILS_EXPORT std::string to_hex(std::string_view bytes);

/** @return std::nullopt if @p hex has odd length or a non-hex character. */
MYDIARELAY_UTILS_EXPORT std::optional<std::string> from_hex(std::string_view hex);

/** @brief True if @p text is non-empty and only [0-9a-f]. */
MYDIARELAY_UTILS_EXPORT bool is_lower_hex(std::string_view text) noexcept;

enum class Base64Variant
{
    Standard,          ///< '+', '/', padded
    StandardNoPadding, ///< '+', '/', unpadded
    UrlSafeNoPadding   ///< '-', '_', unpadded
};

MYDIARELAY_UTILS_EXPORT std::string to_base64(std::string_view bytes,
                                              Base64Variant variant = Base64Variant::Standard);

/** @return std::nullopt if @p text is not valid base64 for @p variant. */
MYDIARELAY_UTILS_EXPORT std::optional<std::string>
from_base64(std::string_view text, Base64Variant variant = Base64Variant::Standard);

// ============================================================================
// Lifecycle Integration
// ============================================================================

/**
 * @brief Lifecycle module "CryptoUtils". Depends on the Logger.
 *        Startup throws std::runtime_error if libsodium cannot initialize.
 */
MYDIARELAY_UTILS_EXPORT mydiarelay::utils::ModuleDef GetLifecycleModule();

} // namespace mydiarelay::crypto
