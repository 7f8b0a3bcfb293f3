#pragma once
/**
 * @file tunnel_message.hpp
 * @brief Control messages exchanged over an open peer data channel.
 *
 * Every text message on the `mydia-api` and `mydia-media` channels is a JSON object whose
 * `type` is one of the wire names below. Binary messages on the media channel are frames
 * (see media_frame.hpp).
 */
#include "mydiarelay_utils_export.h"
#include "utils/result.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace mydiarelay::tunnel
{

inline constexpr const char *kApiChannelLabel = "mydia-api";
inline constexpr const char *kMediaChannelLabel = "mydia-media";

/// Media payload bytes per binary frame.
inline constexpr size_t kMediaChunkSize = 16 * 1024;

inline constexpr std::chrono::seconds kDefaultNegotiationTimeout{30};
inline constexpr std::chrono::seconds kDefaultRequestTimeout{30};

enum class TunnelMessageType
{
    // mydia-api
    Request,
    Response,
    Auth,
    AuthResponse,
    ClaimCode,
    PairingComplete,
    Ping,
    Pong,
    // mydia-media
    StreamRequest,
    ResponseHeader,
    End,
    // both
    Error
};

MYDIARELAY_UTILS_EXPORT const char *to_wire(TunnelMessageType type) noexcept;
MYDIARELAY_UTILS_EXPORT std::optional<TunnelMessageType>
tunnel_type_from_wire(std::string_view name);

struct TunnelMessage
{
    TunnelMessageType type{TunnelMessageType::Error};
    nlohmann::json body = nlohmann::json::object();
};

/// @brief Serializes @p msg as one JSON object with `type` merged into the body.
MYDIARELAY_UTILS_EXPORT std::string encode_message(const TunnelMessage &msg);

/**
 * @brief Parses a text message.
 * @return ProtocolError for invalid JSON, a non-object, or a missing or unknown `type`.
 */
MYDIARELAY_UTILS_EXPORT utils::Result<TunnelMessage, utils::TunnelError>
decode_message(std::string_view text);

// ---- field access ----
//
// Bodies come from the peer, so none of these throw: a missing field, or one holding the
// wrong JSON type, yields the fallback.

MYDIARELAY_UTILS_EXPORT std::string string_field(const nlohmann::json &body, const char *key,
                                                 std::string_view fallback = {});
MYDIARELAY_UTILS_EXPORT int int_field(const nlohmann::json &body, const char *key, int fallback);
MYDIARELAY_UTILS_EXPORT bool bool_field(const nlohmann::json &body, const char *key,
                                        bool fallback);
/// @return The object at @p key, or an empty object.
MYDIARELAY_UTILS_EXPORT nlohmann::json object_field(const nlohmann::json &body, const char *key);
/// @brief Correlation ids: a string as is, a number in its decimal form.
MYDIARELAY_UTILS_EXPORT std::string id_field(const nlohmann::json &body, const char *key);
/// @return true if @p key is absent, null or a string.
MYDIARELAY_UTILS_EXPORT bool string_or_absent(const nlohmann::json &body, const char *key);

// ---- API envelopes ----

struct ApiRequest
{
    std::string id;
    std::string method;
    std::string path;
    nlohmann::json headers = nlohmann::json::object();
    nlohmann::json body;
    /// Filled in by the receiving side once the peer has authenticated.
    std::string device_id;
};

struct ApiResponse
{
    std::string id;
    int status{200};
    nlohmann::json headers = nlohmann::json::object();
    nlohmann::json body;
};

MYDIARELAY_UTILS_EXPORT TunnelMessage make_request(const ApiRequest &req);
MYDIARELAY_UTILS_EXPORT TunnelMessage make_response(const ApiResponse &resp);
/// @brief A wrongly typed `method` or `path` falls back to GET and `/`; see
///        well_formed_request().
MYDIARELAY_UTILS_EXPORT ApiRequest request_from_body(const nlohmann::json &body);
/// @return false if `method`, `path` or `headers` is present with the wrong type.
MYDIARELAY_UTILS_EXPORT bool well_formed_request(const nlohmann::json &body);
MYDIARELAY_UTILS_EXPORT ApiResponse response_from_body(const nlohmann::json &body);

// ---- pairing ----

struct DeviceAttrs
{
    std::string device_name;
    std::string platform;
};

struct PairingGrant
{
    std::string device_id;
    std::string media_token;
    std::string access_token;
    std::string device_token;
};

MYDIARELAY_UTILS_EXPORT TunnelMessage make_pairing_success(const PairingGrant &grant);
MYDIARELAY_UTILS_EXPORT TunnelMessage make_pairing_failure(std::string_view reason);

// ---- media ----

struct StreamRequest
{
    std::string request_id;
    std::string file_id;
    uint64_t range_start{0};
    std::optional<uint64_t> range_end;
};

MYDIARELAY_UTILS_EXPORT TunnelMessage make_stream_request(const StreamRequest &req);
MYDIARELAY_UTILS_EXPORT StreamRequest stream_request_from_body(const nlohmann::json &body);

/// @brief `{request_id, status, message}` error on the media channel.
MYDIARELAY_UTILS_EXPORT TunnelMessage make_stream_error(const std::string &request_id, int status,
                                                        std::string_view message);

} // namespace mydiarelay::tunnel
