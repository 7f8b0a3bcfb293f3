#include "mdr_service.hpp"
#include "relay/protocol_version.hpp"

#include <algorithm>
#include <charconv>

namespace mydiarelay::relay
{

namespace
{

struct ParsedVersion
{
    int major{0};
    int minor{0};
};

std::optional<ParsedVersion> parse_version(std::string_view v)
{
    const auto dot = v.find('.');
    const std::string_view major_part = v.substr(0, dot);
    ParsedVersion out;
    auto [p, ec] = std::from_chars(major_part.data(), major_part.data() + major_part.size(),
                                   out.major);
    if (ec != std::errc{} || p != major_part.data() + major_part.size() || major_part.empty())
        return std::nullopt;
    if (dot != std::string_view::npos)
    {
        const std::string_view minor_part = v.substr(dot + 1);
        auto [mp, mec] = std::from_chars(minor_part.data(),
                                         minor_part.data() + minor_part.size(), out.minor);
        if (mec != std::errc{} || mp != minor_part.data() + minor_part.size())
            return std::nullopt;
    }
    return out;
}

} // namespace

const VersionMap &supported_versions()
{
    static const VersionMap kSupported{
        {"relay_protocol", {"1.0"}},
        {"encryption_protocol", {"1.0"}},
        {"pairing_protocol", {"1.0"}},
        {"api_protocol", {"1.0"}},
    };
    return kSupported;
}

std::optional<std::string> negotiate_layer(std::string_view layer,
                                           const std::vector<std::string> &remote_versions)
{
    const auto &local = supported_versions();
    auto it = local.find(std::string(layer));
    if (it == local.end())
        return std::nullopt;

    std::vector<int> local_majors;
    for (const auto &v : it->second)
        if (auto pv = parse_version(v))
            local_majors.push_back(pv->major);

    std::optional<std::string> best;
    ParsedVersion best_parsed;
    for (const auto &v : remote_versions)
    {
        auto pv = parse_version(v);
        if (!pv)
            continue;
        if (std::find(local_majors.begin(), local_majors.end(), pv->major) == local_majors.end())
            continue;
        if (!best || pv->major > best_parsed.major ||
            (pv->major == best_parsed.major && pv->minor > best_parsed.minor))
        {
            best = v;
            best_parsed = *pv;
        }
    }
    return best;
}

NegotiationOutcome negotiate(const VersionMap &remote)
{
    NegotiationOutcome outcome;
    for (const auto &[layer, local_versions] : supported_versions())
    {
        auto it = remote.find(layer);
        if (it == remote.end())
            continue;
        if (auto v = negotiate_layer(layer, it->second))
        {
            outcome.negotiated.emplace(layer, *v);
        }
        else
        {
            LOGGER_WARN("No compatible version for {}: local={}, remote={}", layer,
                        nlohmann::json(local_versions).dump(), nlohmann::json(it->second).dump());
            outcome.incompatible_layers.push_back(layer);
        }
    }
    return outcome;
}

VersionMap version_map_from_json(const nlohmann::json &j)
{
    VersionMap out;
    if (!j.is_object())
        return out;
    for (auto it = j.begin(); it != j.end(); ++it)
    {
        if (!it.value().is_array())
            continue;
        std::vector<std::string> versions;
        for (const auto &v : it.value())
            if (v.is_string())
                versions.push_back(v.get<std::string>());
        out.emplace(it.key(), std::move(versions));
    }
    return out;
}

nlohmann::json update_required_response(const std::vector<std::string> &failed_layers)
{
    nlohmann::json details = nlohmann::json::array();
    const auto &local = supported_versions();
    for (const auto &layer : failed_layers)
    {
        auto it = local.find(layer);
        details.push_back({
            {"layer", layer},
            {"server_versions", it != local.end() ? nlohmann::json(it->second)
                                                  : nlohmann::json::array()},
            {"message", fmt::format("{} version incompatible", layer)},
        });
    }
    return {
        {"type", "error"},
        {"code", "update_required"},
        {"message", "Client version is incompatible. Please update your app."},
        {"incompatible_layers", std::move(details)},
    };
}

} // namespace mydiarelay::relay
