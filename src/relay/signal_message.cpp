#include "mdr_service.hpp"
#include "relay/signal_message.hpp"

#include <array>
#include <utility>

namespace mydiarelay::relay
{

namespace
{
constexpr std::array<std::pair<SignalType, std::string_view>, 28> kWireNames{{
    {SignalType::Register, "register"},
    {SignalType::Registered, "registered"},
    {SignalType::Ping, "ping"},
    {SignalType::Pong, "pong"},
    {SignalType::UpdateUrls, "update_urls"},
    {SignalType::CreateClaim, "create_claim"},
    {SignalType::ClaimCreated, "claim_created"},
    {SignalType::ConsumeClaim, "consume_claim"},
    {SignalType::ClaimConsumed, "claim_consumed"},
    {SignalType::ClientConnected, "client_connected"},
    {SignalType::Request, "request"},
    {SignalType::Response, "response"},
    {SignalType::ResolveClaim, "resolve_claim"},
    {SignalType::ClaimResolved, "claim_resolved"},
    {SignalType::Connect, "connect"},
    {SignalType::Connected, "connected"},
    {SignalType::RelayRequest, "relay_request"},
    {SignalType::RelayResponse, "relay_response"},
    {SignalType::Join, "join"},
    {SignalType::Joined, "joined"},
    {SignalType::PeerJoined, "peer_joined"},
    {SignalType::Leave, "leave"},
    {SignalType::PeerLeft, "peer_left"},
    {SignalType::WebrtcOffer, "webrtc_offer"},
    {SignalType::WebrtcAnswer, "webrtc_answer"},
    {SignalType::WebrtcCandidate, "webrtc_candidate"},
    {SignalType::Disconnect, "disconnect"},
    {SignalType::Error, "error"},
}};
} // namespace

const char *to_wire(SignalType type) noexcept
{
    for (const auto &[t, name] : kWireNames)
        if (t == type)
            return name.data();
    return "error";
}

std::optional<SignalType> signal_type_from_wire(std::string_view name)
{
    for (const auto &[t, wire] : kWireNames)
        if (wire == name)
            return t;
    return std::nullopt;
}

bool is_webrtc_signal(SignalType type) noexcept
{
    switch (type)
    {
    case SignalType::WebrtcOffer:
    case SignalType::WebrtcAnswer:
    case SignalType::WebrtcCandidate:
        return true;
    default:
        return false;
    }
}

nlohmann::json make_error_body(std::string_view code, std::string_view message,
                               const std::string &ref)
{
    nlohmann::json err{{"code", code}, {"message", message}};
    if (!ref.empty())
        err["ref"] = ref;
    return err;
}

const char *claim_error_message(utils::ClaimError err) noexcept
{
    switch (err)
    {
    case utils::ClaimError::NotFound:
        return "Code not found";
    case utils::ClaimError::Expired:
        return "Code expired, generate a new one";
    case utils::ClaimError::AlreadyConsumed:
        return "Code already used";
    case utils::ClaimError::Locked:
        return "Code is being redeemed, try again in a moment";
    case utils::ClaimError::Unauthorized:
        return "Claim belongs to another instance";
    case utils::ClaimError::StorageFailure:
        return "Claim storage unavailable";
    }
    return "Claim error";
}

nlohmann::json make_claim_error_body(utils::ClaimError err, const std::string &ref)
{
    return make_error_body(utils::to_string(err), claim_error_message(err), ref);
}

std::optional<utils::ClaimError> claim_error_from_wire(std::string_view code) noexcept
{
    using utils::ClaimError;
    for (const ClaimError e : {ClaimError::NotFound, ClaimError::Expired,
                               ClaimError::AlreadyConsumed, ClaimError::Locked,
                               ClaimError::Unauthorized, ClaimError::StorageFailure})
    {
        if (code == utils::to_string(e))
            return e;
    }
    return std::nullopt;
}

} // namespace mydiarelay::relay
