#pragma once
/**
 * @file loopback_transport.hpp
 * @brief In-process PeerConnectionFactory.
 *
 * Connections created by the same LoopbackNetwork find each other through the SDP they
 * exchange, so the whole offer/answer/candidate flow still has to go through the relay.
 * Once the offerer applies the answer, its channels appear on the answering side and both
 * ends open. Messages are delivered synchronously on the sender's thread.
 */
#include "mydiarelay_utils_export.h"
#include "tunnel/peer_transport.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>

namespace mydiarelay::tunnel
{

class LoopbackPeerConnection;

class MYDIARELAY_UTILS_EXPORT LoopbackNetwork final
    : public PeerConnectionFactory,
      public std::enable_shared_from_this<LoopbackNetwork>
{
  public:
    std::shared_ptr<PeerConnection> create(const std::vector<std::string> &ice_servers) override;

    /// When false, local descriptions are swallowed and negotiation never completes.
    void set_signaling_enabled(bool enabled) noexcept;
    bool signaling_enabled() const noexcept;

    size_t connection_count() const;

    /// @brief The connection that announced @p sdp, or nullptr.
    std::shared_ptr<LoopbackPeerConnection> find(const std::string &sdp) const;

  private:
    mutable std::mutex m_mutex;
    std::map<uint64_t, std::weak_ptr<LoopbackPeerConnection>> m_connections;
    uint64_t m_next_id{1};
    std::atomic<bool> m_signaling_enabled{true};
};

} // namespace mydiarelay::tunnel
