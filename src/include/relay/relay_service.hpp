#pragma once
/**
 * @file relay_service.hpp
 * @brief The public rendezvous relay: instance registration, claim redemption, WebRTC
 *        signaling forwarding and the request fallback path.
 *
 * Home-server instances and remote clients hold a DEALER connection to the relay's ROUTER.
 * Each ROUTER identity gets a SignalingSession. Instances `register` and stay connected;
 * clients `resolve_claim` (or `connect` by instance id), then both sides `join` the derived
 * namespace and exchange `webrtc_offer` / `webrtc_answer` / `webrtc_candidate`, which the
 * relay stores and forwards to the other members.
 *
 * A session that sends `disconnect`, or stays silent longer than its timeout, is cleaned up:
 * its registry entry is removed (only if it still owns it), every pending request of its
 * instance is failed with tunnel_disconnected, and its namespace peers get `peer_left`.
 * Cleanup runs at most once per session.
 *
 * All socket I/O is single-threaded (run() loop); stop() and the accessors are thread-safe.
 */
#include "mydiarelay_utils_export.h"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace mydiarelay
{
class RelayConfig;
}

namespace mydiarelay::relay
{

class ClaimStore;
class ConnectionRegistry;
class PendingRequestLedger;
class RelayServiceImpl;

class MYDIARELAY_UTILS_EXPORT RelayService
{
  public:
    struct Config
    {
        std::string endpoint{"tcp://0.0.0.0:5580"};
        bool use_curve{false};

        /// An instance that has not sent anything within this window is disconnected.
        std::chrono::seconds heartbeat_timeout{60};

        /// Same for client sessions.
        std::chrono::seconds session_timeout{300};

        /// How long a relay_request waits for the instance's response.
        std::chrono::milliseconds request_timeout{30000};

        /// relay_requests waiting on instances, overall and per requesting session. Over
        /// either cap the request is answered with 503 at once.
        size_t max_relay_requests{256};
        size_t max_relay_requests_per_session{32};

        /// When non-empty, `register` must carry a valid instance token.
        std::string token_secret;

        /// Required.
        std::shared_ptr<ClaimStore> claims;

        /// Optional: called from run() after bind() with (bound_endpoint, server_public_key).
        std::function<void(const std::string &bound_endpoint, const std::string &pubkey)>
            on_ready;
    };

    /// @brief Copies the relay keys of @p cfg. @p claims is taken as is.
    static Config config_from(const RelayConfig &cfg, std::shared_ptr<ClaimStore> claims);

    /// @throws std::invalid_argument if `cfg.claims` is null.
    explicit RelayService(Config cfg);
    ~RelayService();

    RelayService(const RelayService &) = delete;
    RelayService &operator=(const RelayService &) = delete;

    /// @brief Z85 CurveZMQ public key; empty when Curve is off.
    [[nodiscard]] const std::string &server_public_key() const;

    /**
     * @brief Main event loop. Blocks until stop() is called.
     * @throws zmq::error_t if the endpoint cannot be bound.
     */
    void run();

    void stop();

    ConnectionRegistry &registry();
    PendingRequestLedger &ledger();

    /**
     * @brief Snapshot for operators, e.g.
     * @code
     * {"instances":["home-1"],"sessions":3,"pending_requests":0,"namespaces":1}
     * @endcode
     */
    [[nodiscard]] std::string status_json_str() const;

  private:
#if defined(_MSC_VER)
#pragma warning(suppress : 4251)
#endif
    std::unique_ptr<RelayServiceImpl> pImpl;
};

} // namespace mydiarelay::relay
