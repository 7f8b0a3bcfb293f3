#include "mdr_service.hpp"
#include "relay/instance_token.hpp"

#include <nlohmann/json.hpp>

namespace mydiarelay::relay
{

using utils::TokenError;
using TokenResult = utils::Result<std::string, TokenError>;

InstanceTokenIssuer::InstanceTokenIssuer(std::string secret) : m_secret(std::move(secret))
{
    if (m_secret.empty())
        throw std::invalid_argument("InstanceTokenIssuer: secret must not be empty");
}

std::string InstanceTokenIssuer::generate(const std::string &instance_id) const
{
    return generate(instance_id, std::chrono::system_clock::now());
}

std::string InstanceTokenIssuer::generate(const std::string &instance_id,
                                          std::chrono::system_clock::time_point issued_at) const
{
    const int64_t iat = format_tools::to_unix_seconds(issued_at);
    const nlohmann::json payload{
        {"instance_id", instance_id},
        {"iat", iat},
        {"exp", iat + kInstanceTokenLifetime.count()},
    };
    const std::string data = payload.dump();
    const auto mac = crypto::hmac_sha256(m_secret, data);
    const std::string signature = crypto::to_base64(
        std::string_view(reinterpret_cast<const char *>(mac.data()), mac.size()),
        crypto::Base64Variant::StandardNoPadding);
    return crypto::to_base64(data + "." + signature, crypto::Base64Variant::StandardNoPadding);
}

TokenResult InstanceTokenIssuer::verify(const std::string &token) const
{
    return verify(token, std::chrono::system_clock::now());
}

TokenResult InstanceTokenIssuer::verify(const std::string &token,
                                        std::chrono::system_clock::time_point now) const
{
    auto decoded = crypto::from_base64(token, crypto::Base64Variant::StandardNoPadding);
    if (!decoded)
        return TokenResult::error(TokenError::InvalidToken);

    // The signature is base64 and never contains '.', so the last dot splits the two parts.
    const auto dot = decoded->rfind('.');
    if (dot == std::string::npos)
        return TokenResult::error(TokenError::InvalidToken);
    const std::string data = decoded->substr(0, dot);
    const std::string signature = decoded->substr(dot + 1);

    const auto mac = crypto::hmac_sha256(m_secret, data);
    const std::string expected = crypto::to_base64(
        std::string_view(reinterpret_cast<const char *>(mac.data()), mac.size()),
        crypto::Base64Variant::StandardNoPadding);
    if (!crypto::constant_time_equal(expected, signature))
        return TokenResult::error(TokenError::InvalidToken);

    nlohmann::json payload = nlohmann::json::parse(data, nullptr, /*allow_exceptions=*/false);
    if (!payload.is_object() || !payload.contains("instance_id") ||
        !payload["instance_id"].is_string())
        return TokenResult::error(TokenError::InvalidToken);
    if (!payload.contains("exp") || !payload["exp"].is_number_integer() ||
        format_tools::to_unix_seconds(now) > payload["exp"].get<int64_t>())
        return TokenResult::error(TokenError::Expired);

    return TokenResult::ok(payload["instance_id"].get<std::string>());
}

} // namespace mydiarelay::relay
