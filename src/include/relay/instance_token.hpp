#pragma once
/**
 * @file instance_token.hpp
 * @brief Signed bearer tokens that home-server instances present on `register`.
 *
 * Format: `base64(json + "." + base64(HMAC-SHA256(secret, json)))`, both base64 layers
 * unpadded, with `json = {"instance_id", "iat", "exp"}` and a validity of seven days.
 */
#include "mydiarelay_utils_export.h"
#include "utils/result.hpp"

#include <chrono>
#include <string>

namespace mydiarelay::relay
{

inline constexpr std::chrono::seconds kInstanceTokenLifetime = std::chrono::hours(24 * 7);

class MYDIARELAY_UTILS_EXPORT InstanceTokenIssuer
{
  public:
    /// @throws std::invalid_argument if @p secret is empty.
    explicit InstanceTokenIssuer(std::string secret);

    std::string generate(const std::string &instance_id) const;
    std::string generate(const std::string &instance_id,
                         std::chrono::system_clock::time_point issued_at) const;

    /// @return The instance id, or InvalidToken / Expired.
    utils::Result<std::string, utils::TokenError> verify(const std::string &token) const;
    utils::Result<std::string, utils::TokenError>
    verify(const std::string &token, std::chrono::system_clock::time_point now) const;

  private:
    std::string m_secret;
};

} // namespace mydiarelay::relay
