#pragma once
/**
 * @file peer_transport.hpp
 * @brief The peer-to-peer transport a TunnelSession runs on.
 *
 * Mirrors the subset of a WebRTC stack the tunnel needs: SDP offer/answer, trickled ICE
 * candidates and reliable, ordered data channels carrying text and binary messages.
 * Callbacks may fire on transport-owned threads; implementations never invoke them while
 * holding their own locks.
 */
#include "mydiarelay_utils_export.h"

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace mydiarelay::tunnel
{

enum class PeerState
{
    New,
    Connecting,
    Connected,
    Disconnected,
    Failed,
    Closed
};

inline const char *to_string(PeerState state) noexcept
{
    switch (state)
    {
    case PeerState::New:
        return "new";
    case PeerState::Connecting:
        return "connecting";
    case PeerState::Connected:
        return "connected";
    case PeerState::Disconnected:
        return "disconnected";
    case PeerState::Failed:
        return "failed";
    case PeerState::Closed:
        return "closed";
    }
    return "unknown";
}

/// `type` is "offer" or "answer".
struct SessionDescription
{
    std::string sdp;
    std::string type;
};

struct IceCandidate
{
    std::string candidate;
    std::string sdp_mid;
    int sdp_mline_index{0};
};

class MYDIARELAY_UTILS_EXPORT DataChannel
{
  public:
    using MessageHandler = std::function<void(std::string)>;

    virtual ~DataChannel() = default;

    virtual std::string label() const = 0;
    virtual bool is_open() const = 0;

    /// @return false if the channel is not open or the message could not be queued.
    virtual bool send_text(std::string_view text) = 0;
    virtual bool send_binary(std::string_view bytes) = 0;

    virtual void close() = 0;

    virtual void on_open(std::function<void()> cb) = 0;
    virtual void on_closed(std::function<void()> cb) = 0;
    virtual void on_text(MessageHandler cb) = 0;
    virtual void on_binary(MessageHandler cb) = 0;
};

class MYDIARELAY_UTILS_EXPORT PeerConnection
{
  public:
    virtual ~PeerConnection() = default;

    /// @brief Creates a local channel. Call before create_offer().
    virtual std::shared_ptr<DataChannel> create_data_channel(const std::string &label) = 0;

    /// @brief Generates the local offer, reported through on_local_description().
    virtual void create_offer() = 0;

    /// @brief Applies the peer's description. A remote offer produces a local answer.
    virtual void set_remote_description(const SessionDescription &desc) = 0;

    virtual void add_remote_candidate(const IceCandidate &candidate) = 0;

    virtual void close() = 0;

    virtual void on_local_description(std::function<void(const SessionDescription &)> cb) = 0;
    virtual void on_local_candidate(std::function<void(const IceCandidate &)> cb) = 0;
    /// Channels the peer created.
    virtual void on_data_channel(std::function<void(std::shared_ptr<DataChannel>)> cb) = 0;
    virtual void on_state_change(std::function<void(PeerState)> cb) = 0;
};

class MYDIARELAY_UTILS_EXPORT PeerConnectionFactory
{
  public:
    virtual ~PeerConnectionFactory() = default;

    /// @param ice_servers STUN/TURN urls, e.g. "stun:stun.l.google.com:19302".
    virtual std::shared_ptr<PeerConnection> create(const std::vector<std::string> &ice_servers) = 0;
};

} // namespace mydiarelay::tunnel
