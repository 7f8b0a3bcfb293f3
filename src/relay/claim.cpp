#include "mdr_service.hpp"
#include "relay/claim.hpp"

#include <stdexcept>

namespace mydiarelay::relay
{

std::string generate_code(size_t length)
{
    if (length == 0)
        throw std::invalid_argument("generate_code: length must be positive");

    std::string code;
    code.reserve(length);
    const auto n = static_cast<uint32_t>(kClaimAlphabet.size());
    for (size_t i = 0; i < length; ++i)
        code.push_back(kClaimAlphabet[crypto::random_uniform(n)]);
    return code;
}

std::string normalize_code(std::string_view code)
{
    std::string out;
    out.reserve(code.size());
    for (const char c : code)
    {
        if (c == ' ' || c == '-')
            continue;
        out.push_back(c);
    }
    return format_tools::to_upper_ascii(out);
}

bool is_consumed(const Claim &claim) noexcept
{
    return claim.consumed_at.has_value();
}

bool is_expired(const Claim &claim, TimePoint now) noexcept
{
    return claim.expires_at <= now;
}

bool is_valid(const Claim &claim, TimePoint now) noexcept
{
    return !is_consumed(claim) && !is_expired(claim, now);
}

bool is_locked(const Claim &claim, TimePoint now) noexcept
{
    return claim.locked_at.has_value() && claim.lock_expires_at.has_value() &&
           *claim.lock_expires_at > now;
}

bool is_lockable(const Claim &claim, TimePoint now) noexcept
{
    return is_valid(claim, now) && !is_locked(claim, now);
}

nlohmann::json to_json(const Claim &claim)
{
    auto opt_time = [](const std::optional<TimePoint> &tp) -> nlohmann::json {
        return tp ? nlohmann::json(format_tools::to_iso8601(*tp)) : nlohmann::json(nullptr);
    };
    return nlohmann::json{
        {"id", claim.id},
        {"code", claim.code},
        {"instance_id", claim.instance_id},
        {"requester_ref", claim.requester_ref},
        {"expires_at", format_tools::to_iso8601(claim.expires_at)},
        {"locked_at", opt_time(claim.locked_at)},
        {"lock_expires_at", opt_time(claim.lock_expires_at)},
        {"consumed_at", opt_time(claim.consumed_at)},
        {"device_id", claim.device_id ? nlohmann::json(*claim.device_id) : nlohmann::json(nullptr)},
        {"inserted_at", format_tools::to_iso8601(claim.inserted_at)},
    };
}

} // namespace mydiarelay::relay
