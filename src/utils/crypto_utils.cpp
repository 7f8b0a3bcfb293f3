/**
 * @file crypto_utils.cpp
 * @brief Implementation of cryptographic utilities using libsodium.
 */
#include "utils/crypto_utils.hpp"
#include "mdr_service.hpp"

#include <sodium.h>

#include <chrono>
#include <cstring>
#include <stdexcept>

namespace mydiarelay::crypto
{

namespace
{
// sodium_init() is idempotent and thread-safe; the flag only avoids the call on the fast path.
std::atomic<bool> g_sodium_initialized{false};

bool ensure_sodium_init() noexcept
{
    if (g_sodium_initialized.load(std::memory_order_acquire))
    {
        return true;
    }

    const int result = sodium_init();
    if (result == -1)
    {
        LOGGER_ERROR("[CryptoUtils] FATAL: sodium_init() failed!");
        return false;
    }

    g_sodium_initialized.store(true, std::memory_order_release);
    if (result == 0)
    {
        LOGGER_INFO("[CryptoUtils] libsodium initialized successfully");
    }
    return true;
}

void require_sodium(const char *what)
{
    if (!ensure_sodium_init())
    {
        throw std::runtime_error(fmt::format("[CryptoUtils] {}: libsodium unavailable", what));
    }
}

int to_sodium_variant(Base64Variant variant) noexcept
{
    switch (variant)
    {
    case Base64Variant::Standard:
        return sodium_base64_VARIANT_ORIGINAL;
    case Base64Variant::StandardNoPadding:
        return sodium_base64_VARIANT_ORIGINAL_NO_PADDING;
    case Base64Variant::UrlSafeNoPadding:
        return sodium_base64_VARIANT_URLSAFE_NO_PADDING;
    }
    return sodium_base64_VARIANT_ORIGINAL;
}

} // anonymous namespace

// ============================================================================
// HMAC-SHA256
// ============================================================================

std::array<uint8_t, HMAC_SHA256_BYTES> hmac_sha256(std::string_view key, std::string_view message)
{
    require_sodium("hmac_sha256");

    std::array<uint8_t, HMAC_SHA256_BYTES> mac{};
    crypto_auth_hmacsha256_state state;
    // The init/update/final form accepts keys of arbitrary length.
    crypto_auth_hmacsha256_init(&state, reinterpret_cast<const unsigned char *>(key.data()),
                                key.size());
    crypto_auth_hmacsha256_update(&state, reinterpret_cast<const unsigned char *>(message.data()),
                                  message.size());
    crypto_auth_hmacsha256_final(&state, mac.data());
    sodium_memzero(&state, sizeof(state));
    return mac;
}

std::string hmac_sha256_hex(std::string_view key, std::string_view message)
{
    const auto mac = hmac_sha256(key, message);
    return to_hex(std::span<const uint8_t>(mac.data(), mac.size()));
}

bool constant_time_equal(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size() || !ensure_sodium_init())
    {
        return false;
    }
    if (a.empty())
    {
        return true;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

// ============================================================================
// Random Number Generation
// ============================================================================

void generate_random_bytes(uint8_t *out, size_t len) noexcept
{
    if (out == nullptr)
    {
        LOGGER_ERROR("[CryptoUtils] generate_random_bytes: null output pointer");
        return;
    }
    if (!ensure_sodium_init())
    {
        LOGGER_ERROR(
            "[CryptoUtils] FATAL: Cannot generate random bytes, libsodium not initialized!");
        std::memset(out, 0, len);
        return;
    }
    randombytes_buf(out, len);
}

std::string random_bytes(size_t len)
{
    require_sodium("random_bytes");
    std::string out(len, '\0');
    if (len > 0)
    {
        randombytes_buf(out.data(), len);
    }
    return out;
}

uint32_t random_uniform(uint32_t upper_bound) noexcept
{
    if (upper_bound < 2 || !ensure_sodium_init())
    {
        return 0;
    }
    return randombytes_uniform(upper_bound);
}

// ============================================================================
// Encodings
// ============================================================================

std::string to_hex(std::span<const uint8_t> bytes)
{
    std::string out(bytes.size() * 2 + 1, '\0');
    sodium_bin2hex(out.data(), out.size(), bytes.data(), bytes.size());
    out.pop_back(); // trailing NUL
    return out;
}

std::string to_hex(std::string_view bytes)
{
    return to_hex(
        std::span<const uint8_t>(reinterpret_cast<const uint8_t *>(bytes.data()), bytes.size()));
}

std::optional<std::string> from_hex(std::string_view hex)
{
    if (hex.size() % 2 != 0)
    {
        return std::nullopt;
    }
    require_sodium("from_hex");
    std::string out(hex.size() / 2, '\0');
    size_t bin_len = 0;
    const char *hex_end = nullptr;
    if (sodium_hex2bin(reinterpret_cast<unsigned char *>(out.data()), out.size(), hex.data(),
                       hex.size(), nullptr, &bin_len, &hex_end) != 0 ||
        hex_end != hex.data() + hex.size())
    {
        return std::nullopt;
    }
    out.resize(bin_len);
    return out;
}

bool is_lower_hex(std::string_view text) noexcept
{
    if (text.empty())
    {
        return false;
    }
    for (const char c : text)
    {
        const bool digit = c >= '0' && c <= '9';
        const bool lower = c >= 'a' && c <= 'f';
        if (!digit && !lower)
        {
            return false;
        }
    }
    return true;
}

std::string to_base64(std::string_view bytes, Base64Variant variant)
{
    require_sodium("to_base64");
    const int sv = to_sodium_variant(variant);
    std::string out(sodium_base64_ENCODED_LEN(bytes.size(), sv), '\0');
    sodium_bin2base64(out.data(), out.size(), reinterpret_cast<const unsigned char *>(bytes.data()),
                      bytes.size(), sv);
    out.resize(std::strlen(out.c_str()));
    return out;
}

std::optional<std::string> from_base64(std::string_view text, Base64Variant variant)
{
    require_sodium("from_base64");
    std::string out(text.size(), '\0'); // decoded is never longer than encoded
    size_t bin_len = 0;
    const char *b64_end = nullptr;
    if (sodium_base642bin(reinterpret_cast<unsigned char *>(out.data()), out.size(), text.data(),
                          text.size(), nullptr, &bin_len, &b64_end,
                          to_sodium_variant(variant)) != 0 ||
        b64_end != text.data() + text.size())
    {
        return std::nullopt;
    }
    out.resize(bin_len);
    return out;
}

// ============================================================================
// Lifecycle Integration
// ============================================================================

namespace
{
void crypto_startup(const char *arg)
{
    (void)arg;
    LOGGER_DEBUG("[CryptoUtils] Module starting up...");
    if (!ensure_sodium_init())
    {
        throw std::runtime_error("[CryptoUtils] Failed to initialize libsodium");
    }
    LOGGER_INFO("[CryptoUtils] Module initialized successfully");
}

void crypto_shutdown(const char *arg)
{
    (void)arg;
    // libsodium needs no explicit cleanup.
    LOGGER_DEBUG("[CryptoUtils] Module shutdown complete");
}

} // anonymous namespace

mydiarelay::utils::ModuleDef GetLifecycleModule()
{
    mydiarelay::utils::ModuleDef module("CryptoUtils");
    module.add_dependency("mydiarelay::utils::Logger");
    module.set_startup(crypto_startup);
    module.set_shutdown(crypto_shutdown, std::chrono::milliseconds(1000));
    return module;
}

} // namespace mydiarelay::crypto
