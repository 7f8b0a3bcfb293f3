#pragma once
/**
 * @file rtc_peer_transport.hpp
 * @brief PeerConnectionFactory backed by libdatachannel.
 *
 * Only available when the library is built with MYDIARELAY_WITH_DATACHANNEL.
 */
#include "mydiarelay_utils_export.h"
#include "tunnel/peer_transport.hpp"

#include <cstdint>

namespace mydiarelay::tunnel
{

struct RtcTransportOptions
{
    /// 0 keeps libdatachannel's defaults.
    uint16_t port_range_begin{0};
    uint16_t port_range_end{0};
    size_t max_message_size{256 * 1024};
};

class MYDIARELAY_UTILS_EXPORT RtcPeerConnectionFactory final : public PeerConnectionFactory
{
  public:
    RtcPeerConnectionFactory() = default;
    explicit RtcPeerConnectionFactory(RtcTransportOptions options);

    std::shared_ptr<PeerConnection> create(const std::vector<std::string> &ice_servers) override;

  private:
    RtcTransportOptions m_options;
};

} // namespace mydiarelay::tunnel
