#pragma once
/**
 * @file claim_namespace.hpp
 * @brief Derivation and validation of claim rendezvous namespaces.
 *
 * A namespace is `"mydia-claim:" + hex(HMAC-SHA256(secret, code + decimal(epoch)))` where
 * `epoch = unix_seconds / 3600`. Both ends of a pairing compute it independently from the
 * claim code. Validation accepts the current and the previous epoch.
 */
#include "mydiarelay_utils_export.h"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace mydiarelay::relay
{

inline constexpr std::string_view kNamespacePrefix = "mydia-claim:";
inline constexpr int64_t kEpochLengthSeconds = 3600;

/// @brief `unix_seconds / 3600` for @p tp.
MYDIARELAY_UTILS_EXPORT int64_t epoch_of(std::chrono::system_clock::time_point tp) noexcept;
MYDIARELAY_UTILS_EXPORT int64_t current_epoch() noexcept;

/**
 * @class ClaimNamespace
 * @brief Stateless deriver keyed by a shared secret.
 *
 * Output depends only on (secret, code, epoch), so separate processes configured with the
 * same secret agree byte for byte.
 */
class MYDIARELAY_UTILS_EXPORT ClaimNamespace
{
  public:
    /// Uses RelayConfig::kDefaultNamespaceSecret.
    ClaimNamespace();
    explicit ClaimNamespace(std::string secret);

    std::string derive_namespace(std::string_view code) const;
    std::string derive_namespace(std::string_view code, int64_t epoch) const;

    /// @brief Lowercase hex HMAC-SHA256 of `code + decimal(epoch)`.
    std::string derive_token(std::string_view code, int64_t epoch) const;

    /**
     * @brief True if @p candidate is `prefix + token` for the current or previous epoch.
     *
     * A wrong prefix, a token that is not 64 lowercase hex characters, and a stale epoch
     * all give `false`. The token comparison is constant-time.
     */
    bool valid_namespace(std::string_view code, std::string_view candidate) const;
    bool valid_namespace(std::string_view code, std::string_view candidate,
                         int64_t now_epoch) const;

  private:
    std::string m_secret;
};

} // namespace mydiarelay::relay
