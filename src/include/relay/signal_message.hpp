#pragma once
/**
 * @file signal_message.hpp
 * @brief Relay signaling protocol: message types, envelopes and error bodies.
 *
 * On the wire every message is a ZeroMQ multipart `['C', type, json]` (a ROUTER prepends the
 * peer identity). `type` is the snake_case name returned by to_wire().
 */
#include "mydiarelay_utils_export.h"
#include "utils/result.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace mydiarelay::relay
{

enum class SignalType
{
    // instance <-> relay
    Register,
    Registered,
    Ping,
    Pong,
    UpdateUrls,
    CreateClaim,
    ClaimCreated,
    ConsumeClaim,
    ClaimConsumed,
    ClientConnected, ///< relay -> instance: a client is coming, join this namespace
    Request,         ///< relay -> instance: forwarded relay_request
    Response,        ///< instance -> relay: reply to Request
    // client <-> relay
    ResolveClaim,
    ClaimResolved,
    Connect,
    Connected,
    RelayRequest,
    RelayResponse,
    // rendezvous, both roles
    Join,
    Joined,
    PeerJoined,
    Leave,
    PeerLeft,
    WebrtcOffer,
    WebrtcAnswer,
    WebrtcCandidate,
    Disconnect,
    Error
};

MYDIARELAY_UTILS_EXPORT const char *to_wire(SignalType type) noexcept;
MYDIARELAY_UTILS_EXPORT std::optional<SignalType> signal_type_from_wire(std::string_view name);

/// True for the three relayed WebRTC types.
MYDIARELAY_UTILS_EXPORT bool is_webrtc_signal(SignalType type) noexcept;

struct SignalMessage
{
    SignalType type{SignalType::Error};
    nlohmann::json body = nlohmann::json::object();
};

/// @brief `{code, message}` plus the original `ref` (request correlation) when given.
MYDIARELAY_UTILS_EXPORT nlohmann::json make_error_body(std::string_view code,
                                                       std::string_view message,
                                                       const std::string &ref = {});

/// @brief Error body for a claim failure with user-facing remediation text.
MYDIARELAY_UTILS_EXPORT nlohmann::json make_claim_error_body(utils::ClaimError err,
                                                             const std::string &ref = {});

/// @brief The remediation text shown for @p err.
MYDIARELAY_UTILS_EXPORT const char *claim_error_message(utils::ClaimError err) noexcept;

/// @brief Parses the `code` of an error body back into a ClaimError.
MYDIARELAY_UTILS_EXPORT std::optional<utils::ClaimError>
claim_error_from_wire(std::string_view code) noexcept;

} // namespace mydiarelay::relay
