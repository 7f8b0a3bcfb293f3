#pragma once
/**
 * @file protocol_version.hpp
 * @brief Per-layer protocol version negotiation.
 *
 * Versions are "major.minor". Peers agree on a layer when they share a major version; the
 * highest such version offered by the remote side wins.
 */
#include "mydiarelay_utils_export.h"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mydiarelay::relay
{

using VersionMap = std::map<std::string, std::vector<std::string>>;

/// {"relay_protocol", "encryption_protocol", "pairing_protocol", "api_protocol"}, all ["1.0"].
MYDIARELAY_UTILS_EXPORT const VersionMap &supported_versions();

struct NegotiationOutcome
{
    std::map<std::string, std::string> negotiated; ///< layer -> version
    std::vector<std::string> incompatible_layers;

    bool compatible() const noexcept { return incompatible_layers.empty(); }
};

/**
 * @brief Highest version in @p remote_versions whose major is supported locally for @p layer.
 */
MYDIARELAY_UTILS_EXPORT std::optional<std::string>
negotiate_layer(std::string_view layer, const std::vector<std::string> &remote_versions);

/**
 * @brief Negotiates every local layer the remote also advertises. A layer absent on either
 *        side is skipped; a shared layer with no common major is reported incompatible.
 */
MYDIARELAY_UTILS_EXPORT NegotiationOutcome negotiate(const VersionMap &remote);

/// @brief Parses `{"layer": ["1.0", ...], ...}`. Non-array entries are ignored.
MYDIARELAY_UTILS_EXPORT VersionMap version_map_from_json(const nlohmann::json &j);

/// @brief `{type:"error", code:"update_required", message, incompatible_layers:[...]}`.
MYDIARELAY_UTILS_EXPORT nlohmann::json
update_required_response(const std::vector<std::string> &failed_layers);

} // namespace mydiarelay::relay
