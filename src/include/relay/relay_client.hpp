#pragma once
/**
 * @file relay_client.hpp
 * @brief DEALER-side connection to the relay, used by both home-server instances and
 *        remote clients.
 *
 * Socket I/O runs on an internal worker thread fed by a command queue. Requests carry a
 * `ref` which the relay echoes in its reply; the waiting caller is parked in a
 * PendingRequestLedger until that reply arrives, the timeout elapses or the connection
 * is dropped (tunnel_disconnected).
 *
 * Messages the relay pushes without a matching `ref` (client_connected, request,
 * peer_joined, webrtc_*, ...) go to the on_message() handler. The handler runs on a
 * dispatcher thread of its own, so it may call the blocking request methods.
 */
#include "mydiarelay_utils_export.h"
#include "relay/signal_message.hpp"
#include "utils/result.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace mydiarelay::relay
{

class RelayClientImpl;

class MYDIARELAY_UTILS_EXPORT RelayClient
{
  public:
    using ReplyResult = utils::Result<nlohmann::json, utils::TunnelError>;
    using MessageHandler = std::function<void(const SignalMessage &)>;

    struct Options
    {
        std::chrono::milliseconds reply_timeout{5000};
        /// 0 disables the keepalive ping.
        std::chrono::seconds ping_interval{30};
        /// Used to derive the `epoch - 1` candidate when a join is rejected.
        std::string namespace_secret;
    };

    RelayClient();
    explicit RelayClient(Options options);
    ~RelayClient();

    RelayClient(const RelayClient &) = delete;
    RelayClient &operator=(const RelayClient &) = delete;

    /**
     * @brief Connects the DEALER socket and starts the worker.
     * @param server_key Z85 relay key; empty connects without CurveZMQ.
     */
    // NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
    [[nodiscard]] bool connect(const std::string &endpoint, const std::string &server_key = {});

    /// @brief Sends `disconnect`, closes the socket and fails every outstanding request.
    void disconnect();

    bool is_connected() const noexcept;

    void on_message(MessageHandler handler);

    /**
     * @brief Sends @p type with a fresh `ref` and waits for the reply carrying it.
     *
     * A reply of type @p expected yields its body. An `error` reply yields the mapped
     * TunnelError and its body becomes last_error().
     */
    ReplyResult request(SignalType type, nlohmann::json body, SignalType expected);
    ReplyResult request(SignalType type, nlohmann::json body, SignalType expected,
                        std::chrono::milliseconds timeout);

    /// @brief Fire-and-forget.
    void send(SignalType type, nlohmann::json body);

    /// @brief Body of the most recent `error` reply (`{code, message, ...}`).
    nlohmann::json last_error() const;

    // ---- instance role ----
    ReplyResult register_instance(const std::string &instance_id,
                                  nlohmann::json extra = nlohmann::json::object());
    ReplyResult create_claim(const std::string &requester_ref,
                             std::chrono::seconds ttl = std::chrono::seconds(0));
    ReplyResult consume_claim(int64_t claim_id, const std::string &device_id);
    void update_urls(const std::vector<std::string> &direct_urls);
    /// @brief Answers a relay-forwarded `request`.
    void send_response(const std::string &request_id, nlohmann::json response);

    // ---- client role ----
    ReplyResult resolve_claim(const std::string &code);
    ReplyResult connect_instance(const std::string &instance_id);
    ReplyResult relay_request(const std::string &instance_id, const std::string &method,
                              const std::string &path,
                              nlohmann::json headers = nlohmann::json::object(),
                              nlohmann::json body = nullptr,
                              std::chrono::milliseconds timeout = std::chrono::seconds(35));

    // ---- rendezvous ----
    /**
     * @brief Joins @p ns. If the relay answers invalid_namespace, retries once with the
     *        namespace derived for the previous epoch. The body's `namespace` is the one
     *        that was accepted.
     */
    ReplyResult join(const std::string &ns, const std::string &code);
    void leave(const std::string &ns);
    void send_signal(SignalType type, const std::string &ns, nlohmann::json payload);

    ReplyResult ping();

  private:
#if defined(_MSC_VER)
#pragma warning(suppress : 4251)
#endif
    std::unique_ptr<RelayClientImpl> pImpl;
};

/// @brief Maps an `error` reply body to the TunnelError a caller acts on.
MYDIARELAY_UTILS_EXPORT utils::TunnelError tunnel_error_from_body(const nlohmann::json &body);

} // namespace mydiarelay::relay
