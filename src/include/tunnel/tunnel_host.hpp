#pragma once
/**
 * @file tunnel_host.hpp
 * @brief Home-server side of the tunnel.
 *
 * Registers the instance with the relay and answers every `client_connected` by joining
 * the announced namespace, answering the client's offer and serving the resulting
 * TunnelSession. Requests the relay forwards on the fallback path go to the same API
 * handler. After a successful pairing over a claim-code session the claim is consumed.
 */
#include "mydiarelay_utils_export.h"
#include "tunnel/tunnel_session.hpp"
#include "utils/result.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <vector>

namespace mydiarelay::relay
{
class RelayClient;
}

namespace mydiarelay::tunnel
{

class TunnelHostImpl;

class MYDIARELAY_UTILS_EXPORT TunnelHost
{
  public:
    struct Config
    {
        std::string instance_id;
        std::string relay_endpoint;
        /// Z85 relay key; empty when the relay runs without CurveZMQ.
        std::string relay_server_key;
        /// Sent on `register` when the relay requires one.
        std::string instance_token;
        /// Base64 X25519 public key advertised to clients.
        std::string public_key;
        std::vector<std::string> direct_urls;
        std::vector<std::string> ice_servers;
        std::string namespace_secret;
        TunnelSession::Options session_options;
    };

    /// @throws std::invalid_argument if @p factory is null or the instance id is empty.
    TunnelHost(Config config, std::shared_ptr<PeerConnectionFactory> factory,
               TunnelSession::Handlers handlers);
    ~TunnelHost();

    TunnelHost(const TunnelHost &) = delete;
    TunnelHost &operator=(const TunnelHost &) = delete;

    /**
     * @brief Connects to the relay and registers.
     * @return NotConnected if the relay is unreachable, otherwise the register error.
     */
    utils::Status<utils::TunnelError> start();

    /// @brief Closes every session and disconnects from the relay.
    void stop();

    /// @brief The `registered` reply of the last start().
    nlohmann::json registration() const;

    relay::RelayClient &relay();

    size_t session_count() const;
    std::shared_ptr<TunnelSession> session(const std::string &session_id) const;
    std::vector<std::shared_ptr<TunnelSession>> sessions() const;

  private:
#if defined(_MSC_VER)
#pragma warning(suppress : 4251)
#endif
    std::shared_ptr<TunnelHostImpl> pImpl;
};

} // namespace mydiarelay::tunnel
