#pragma once
/**
 * @file tunnel_client.hpp
 * @brief Remote-client side of the tunnel.
 *
 * Reaches an instance through the relay, either with a claim code or by instance id,
 * meets it in the rendezvous namespace, sends the offer and waits for both data channels
 * to open. Negotiation that does not finish within the session's negotiation timeout
 * fails with NegotiationFailed and the attempt is abandoned.
 */
#include "mydiarelay_utils_export.h"
#include "tunnel/tunnel_session.hpp"
#include "utils/result.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace mydiarelay::relay
{
class RelayClient;
}

namespace mydiarelay::tunnel
{

class TunnelClientImpl;

class MYDIARELAY_UTILS_EXPORT TunnelClient
{
  public:
    struct Config
    {
        std::string relay_endpoint;
        std::string relay_server_key;
        /// Must match the relay's, for the previous-epoch namespace retry.
        std::string namespace_secret;
        TunnelSession::Options session_options;
    };

    using SessionResult = utils::Result<std::shared_ptr<TunnelSession>, utils::TunnelError>;

    /// @throws std::invalid_argument if @p factory is null.
    TunnelClient(Config config, std::shared_ptr<PeerConnectionFactory> factory);
    ~TunnelClient();

    TunnelClient(const TunnelClient &) = delete;
    TunnelClient &operator=(const TunnelClient &) = delete;

    /**
     * @brief Redeems @p code: the relay resolves and locks the claim and names the
     *        namespace to meet the instance in.
     * @return ClaimRejected for a claim error (see last_relay_error() for which),
     *         NegotiationFailed if the data channels never opened.
     */
    SessionResult connect_with_code(const std::string &code);

    /// @brief Same, for a known instance id. NotConnected if it is unknown or offline.
    SessionResult connect_to_instance(const std::string &instance_id);

    /// @brief `{code, message}` of the relay's last error reply.
    nlohmann::json last_relay_error() const;

    /// @brief The claim_resolved / connected reply of the last attempt.
    nlohmann::json rendezvous() const;

    relay::RelayClient &relay();

    /// @brief Closes the current session and disconnects from the relay.
    void close();

  private:
#if defined(_MSC_VER)
#pragma warning(suppress : 4251)
#endif
    std::shared_ptr<TunnelClientImpl> pImpl;
};

} // namespace mydiarelay::tunnel
