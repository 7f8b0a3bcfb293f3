#include "mdr_service.hpp"
#include "relay/claim_namespace.hpp"

namespace mydiarelay::relay
{

namespace
{
constexpr size_t kTokenHexLength = crypto::HMAC_SHA256_BYTES * 2;
} // namespace

int64_t epoch_of(std::chrono::system_clock::time_point tp) noexcept
{
    const auto secs =
        std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
    return secs / kEpochLengthSeconds;
}

int64_t current_epoch() noexcept
{
    return epoch_of(std::chrono::system_clock::now());
}

ClaimNamespace::ClaimNamespace() : m_secret(RelayConfig::kDefaultNamespaceSecret) {}

ClaimNamespace::ClaimNamespace(std::string secret) : m_secret(std::move(secret))
{
    if (m_secret.empty())
        m_secret = RelayConfig::kDefaultNamespaceSecret;
}

std::string ClaimNamespace::derive_namespace(std::string_view code) const
{
    return derive_namespace(code, current_epoch());
}

std::string ClaimNamespace::derive_namespace(std::string_view code, int64_t epoch) const
{
    return fmt::format("{}{}", kNamespacePrefix, derive_token(code, epoch));
}

std::string ClaimNamespace::derive_token(std::string_view code, int64_t epoch) const
{
    const std::string message = fmt::format("{}{}", code, epoch);
    return crypto::hmac_sha256_hex(m_secret, message);
}

bool ClaimNamespace::valid_namespace(std::string_view code, std::string_view candidate) const
{
    return valid_namespace(code, candidate, current_epoch());
}

bool ClaimNamespace::valid_namespace(std::string_view code, std::string_view candidate,
                                     int64_t now_epoch) const
{
    if (candidate.substr(0, kNamespacePrefix.size()) != kNamespacePrefix)
        return false;
    const std::string_view token = candidate.substr(kNamespacePrefix.size());
    if (token.size() != kTokenHexLength || !crypto::is_lower_hex(token))
        return false;

    // Both epochs are always checked.
    const bool current = crypto::constant_time_equal(token, derive_token(code, now_epoch));
    const bool previous = crypto::constant_time_equal(token, derive_token(code, now_epoch - 1));
    return current || previous;
}

} // namespace mydiarelay::relay
