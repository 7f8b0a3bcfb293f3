#include "mdr_service.hpp"
#include "relay/claim.hpp"
#include "relay/relay_client.hpp"
#include "tunnel/tunnel_host.hpp"

#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <thread>

namespace mydiarelay::tunnel
{

using relay::SignalMessage;
using relay::SignalType;
using utils::TunnelError;

namespace
{
constexpr std::chrono::milliseconds kWatchdogInterval{250};

struct HostPeer
{
    std::string ns;
    std::shared_ptr<TunnelSession> session;
    std::chrono::steady_clock::time_point accepted_at;
};
} // namespace

class TunnelHostImpl : public std::enable_shared_from_this<TunnelHostImpl>
{
  public:
    TunnelHostImpl(TunnelHost::Config cfg, std::shared_ptr<PeerConnectionFactory> f,
                   TunnelSession::Handlers h)
        : config(std::move(cfg)), factory(std::move(f)), handlers(std::move(h)),
          relay(relay::RelayClient::Options{std::chrono::milliseconds(5000),
                                            std::chrono::seconds(30), config.namespace_secret})
    {
    }

    ~TunnelHostImpl() { stop(); }

    const TunnelHost::Config config;
    const std::shared_ptr<PeerConnectionFactory> factory;
    const TunnelSession::Handlers handlers;

    utils::Status<TunnelError> start()
    {
        using S = utils::Status<TunnelError>;
        relay.on_message([this](const SignalMessage &msg) { on_relay_message(msg); });
        if (!relay.connect(config.relay_endpoint, config.relay_server_key))
            return S::error(TunnelError::NotConnected);

        nlohmann::json extra = {{"public_key", config.public_key},
                                {"direct_urls", config.direct_urls}};
        if (!config.instance_token.empty())
            extra["token"] = config.instance_token;
        auto registered = relay.register_instance(config.instance_id, std::move(extra));
        if (registered.is_error())
        {
            LOGGER_ERROR("TunnelHost[{}]: registration failed: {} {}", config.instance_id,
                         utils::to_string(registered.error()),
                         relay.last_error().value("message", ""));
            relay.disconnect();
            return S::error(registered.error());
        }
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_registration = std::move(registered).content();
            m_stopping = false;
        }
        if (!m_watchdog.joinable())
            m_watchdog = std::thread([this] { watchdog_loop(); });
        LOGGER_INFO("TunnelHost[{}]: registered with relay {}", config.instance_id,
                    config.relay_endpoint);
        return S::ok({});
    }

    void stop()
    {
        std::map<std::string, HostPeer> peers;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_stopping = true;
            peers = m_peers;
        }
        m_watchdog_cv.notify_all();
        if (m_watchdog.joinable())
            m_watchdog.join();
        for (auto &[id, peer] : peers)
            peer.session->close();
        relay.disconnect();
    }

    nlohmann::json registration() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_registration;
    }

    size_t session_count() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_peers.size();
    }

    std::shared_ptr<TunnelSession> session(const std::string &session_id) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_peers.find(session_id);
        return it == m_peers.end() ? nullptr : it->second.session;
    }

    std::vector<std::shared_ptr<TunnelSession>> sessions() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<std::shared_ptr<TunnelSession>> out;
        out.reserve(m_peers.size());
        for (const auto &[id, peer] : m_peers)
            out.push_back(peer.session);
        return out;
    }

  private:
    mutable std::mutex m_mutex;
    std::map<std::string, HostPeer> m_peers;
    nlohmann::json m_registration = nlohmann::json::object();
    bool m_stopping{false};
    std::condition_variable m_watchdog_cv;
    std::thread m_watchdog;

  public:
    // Destroyed first, so its dispatcher is joined while everything above is still alive.
    relay::RelayClient relay;

  private:
    // ── Relay messages (dispatcher thread) ───────────────────────────────────

    void on_relay_message(const SignalMessage &msg)
    {
        switch (msg.type)
        {
        case SignalType::ClientConnected:
            accept_client(msg.body);
            return;
        case SignalType::WebrtcOffer:
            if (auto session = session_for_namespace(string_field(msg.body, "namespace")))
                session->peer().set_remote_description(
                    {string_field(msg.body, "sdp"), string_field(msg.body, "type", "offer")});
            return;
        case SignalType::WebrtcCandidate:
            if (auto session = session_for_namespace(string_field(msg.body, "namespace")))
                session->peer().add_remote_candidate({string_field(msg.body, "candidate"),
                                                      string_field(msg.body, "sdpMid"),
                                                      int_field(msg.body, "sdpMLineIndex", 0)});
            return;
        case SignalType::Request:
            serve_relay_request(msg.body);
            return;
        case SignalType::WebrtcAnswer:
            LOGGER_WARN("TunnelHost[{}]: unexpected webrtc_answer in '{}'", config.instance_id,
                        string_field(msg.body, "namespace"));
            return;
        case SignalType::PeerJoined:
        case SignalType::PeerLeft:
            LOGGER_DEBUG("TunnelHost[{}]: {} {} in '{}'", config.instance_id,
                         string_field(msg.body, "session_id"), relay::to_wire(msg.type),
                         string_field(msg.body, "namespace"));
            return;
        case SignalType::Error:
            LOGGER_WARN("TunnelHost[{}]: relay error {}: {}", config.instance_id,
                        string_field(msg.body, "code"), string_field(msg.body, "message"));
            return;
        case SignalType::Register:
        case SignalType::Registered:
        case SignalType::Ping:
        case SignalType::Pong:
        case SignalType::UpdateUrls:
        case SignalType::CreateClaim:
        case SignalType::ClaimCreated:
        case SignalType::ConsumeClaim:
        case SignalType::ClaimConsumed:
        case SignalType::Response:
        case SignalType::ResolveClaim:
        case SignalType::ClaimResolved:
        case SignalType::Connect:
        case SignalType::Connected:
        case SignalType::RelayRequest:
        case SignalType::RelayResponse:
        case SignalType::Join:
        case SignalType::Joined:
        case SignalType::Leave:
        case SignalType::Disconnect:
            LOGGER_DEBUG("TunnelHost[{}]: ignoring pushed '{}'", config.instance_id,
                         relay::to_wire(msg.type));
            return;
        }
    }

    std::shared_ptr<TunnelSession> session_for_namespace(const std::string &ns) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto &[id, peer] : m_peers)
            if (peer.ns == ns)
                return peer.session;
        LOGGER_DEBUG("TunnelHost: no session in namespace '{}'", ns);
        return nullptr;
    }

    void accept_client(const nlohmann::json &body)
    {
        const std::string session_id = body.value("session_id", "");
        const std::string announced = body.value("namespace", "");
        const std::string code = body.value("code", "");
        if (session_id.empty() || announced.empty() || code.empty())
        {
            LOGGER_WARN("TunnelHost[{}]: incomplete client_connected", config.instance_id);
            return;
        }

        auto joined = relay.join(announced, code);
        if (joined.is_error())
        {
            LOGGER_WARN("TunnelHost[{}]: cannot join '{}': {}", config.instance_id, announced,
                        utils::to_string(joined.error()));
            return;
        }
        const std::string ns = joined.content().value("namespace", announced);

        TunnelSession::Handlers session_handlers = handlers;
        if (body.contains("claim_id") && session_handlers.complete_pairing)
            session_handlers.complete_pairing =
                claim_pairing(body.value("claim_id", int64_t{0}), relay::normalize_code(code));

        auto pc = factory->create(config.ice_servers);
        std::weak_ptr<TunnelHostImpl> weak = weak_from_this();
        pc->on_local_description([weak, ns](const SessionDescription &desc) {
            if (auto self = weak.lock())
                self->relay.send_signal(SignalType::WebrtcAnswer, ns,
                                        {{"sdp", desc.sdp}, {"type", desc.type}});
        });
        pc->on_local_candidate([weak, ns](const IceCandidate &candidate) {
            if (auto self = weak.lock())
                self->relay.send_signal(SignalType::WebrtcCandidate, ns,
                                        {{"candidate", candidate.candidate},
                                         {"sdpMid", candidate.sdp_mid},
                                         {"sdpMLineIndex", candidate.sdp_mline_index}});
        });

        auto session = TunnelSession::create(session_id, std::move(pc),
                                             std::move(session_handlers), config.session_options);
        session->on_closed([weak, ns](const std::string &id) {
            if (auto self = weak.lock())
                self->forget(id, ns);
        });

        std::shared_ptr<TunnelSession> replaced;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto &slot = m_peers[session_id];
            replaced = std::move(slot.session);
            slot = HostPeer{ns, session, std::chrono::steady_clock::now()};
        }
        if (replaced)
            replaced->close();
        session->mark_signaling_established();
        LOGGER_INFO("TunnelHost[{}]: client session {} waiting in '{}'", config.instance_id,
                    session_id, ns);
    }

    void forget(const std::string &session_id, const std::string &ns)
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_peers.find(session_id);
            if (it == m_peers.end() || it->second.ns != ns)
                return;
            m_peers.erase(it);
        }
        if (relay.is_connected())
            relay.leave(ns);
    }

    /**
     * Pairing over a claim-code session: only the session's own code is accepted, and the
     * grant is released only once the relay has consumed the claim. Calls on one session
     * run on its API worker one at a time.
     */
    TunnelSession::PairingCompleter claim_pairing(int64_t claim_id, std::string claim_code)
    {
        auto paired = std::make_shared<std::atomic<bool>>(false);
        std::weak_ptr<TunnelHostImpl> weak = weak_from_this();
        return [inner = handlers.complete_pairing, weak, claim_id, claim_code,
                paired](const std::string &code, const DeviceAttrs &attrs) -> PairingOutcome {
            if (code != claim_code)
                return PairingOutcome{std::nullopt, "invalid_code"};
            if (paired->load(std::memory_order_acquire))
                return PairingOutcome{std::nullopt, "already_consumed"};

            PairingOutcome outcome = inner(code, attrs);
            if (!outcome.grant)
                return outcome;
            auto self = weak.lock();
            if (!self)
                return PairingOutcome{std::nullopt, "instance_stopping"};
            if (auto failed = self->consume_claim(claim_id, outcome.grant->device_id))
                return PairingOutcome{std::nullopt, *failed};
            paired->store(true, std::memory_order_release);
            return outcome;
        };
    }

    /// @return The relay's error code if the claim could not be consumed.
    std::optional<std::string> consume_claim(int64_t claim_id, const std::string &device_id)
    {
        auto consumed = relay.consume_claim(claim_id, device_id);
        if (consumed.is_error())
        {
            const nlohmann::json err = relay.last_error();
            LOGGER_WARN("TunnelHost[{}]: consuming claim {} failed: {}", config.instance_id,
                        claim_id,
                        string_field(err, "message", utils::to_string(consumed.error())));
            std::string code = string_field(err, "code");
            return code.empty() ? std::string("already_consumed") : code;
        }
        LOGGER_INFO("TunnelHost[{}]: claim {} consumed by device {}", config.instance_id,
                    claim_id, device_id);
        return std::nullopt;
    }

    void serve_relay_request(const nlohmann::json &body)
    {
        const ApiRequest req = request_from_body(body);
        if (req.id.empty())
        {
            LOGGER_WARN("TunnelHost[{}]: relayed request without id", config.instance_id);
            return;
        }
        ApiResponse resp;
        if (!handlers.api)
        {
            resp.status = 501;
            resp.body = {{"error", "No API handler"}};
        }
        else
        {
            try
            {
                resp = handlers.api(req);
            }
            catch (const std::exception &e)
            {
                LOGGER_ERROR("TunnelHost[{}]: relayed {} {} failed: {}", config.instance_id,
                             req.method, req.path, e.what());
                resp = ApiResponse{};
                resp.status = 500;
                resp.body = "Internal Error";
            }
        }
        relay.send_response(req.id, {{"status", resp.status},
                                     {"headers", resp.headers},
                                     {"body", resp.body}});
    }

    // ── Negotiation watchdog ─────────────────────────────────────────────────

    void watchdog_loop()
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        while (!m_stopping)
        {
            m_watchdog_cv.wait_for(lock, kWatchdogInterval, [this] { return m_stopping; });
            if (m_stopping)
                return;

            const auto deadline = std::chrono::steady_clock::now() -
                                  config.session_options.negotiation_timeout;
            std::vector<std::shared_ptr<TunnelSession>> stale;
            for (const auto &[id, peer] : m_peers)
            {
                const TunnelState state = peer.session->state();
                if (state != TunnelState::Serving && state != TunnelState::Closed &&
                    peer.accepted_at < deadline)
                    stale.push_back(peer.session);
            }
            if (stale.empty())
                continue;

            lock.unlock();
            for (auto &session : stale)
            {
                LOGGER_WARN("TunnelHost[{}]: session {} did not open in time ({})",
                            config.instance_id, session->session_id(),
                            utils::to_string(TunnelError::NegotiationFailed));
                session->close();
            }
            lock.lock();
        }
    }
};

// ============================================================================
// TunnelHost
// ============================================================================

TunnelHost::TunnelHost(Config config, std::shared_ptr<PeerConnectionFactory> factory,
                       TunnelSession::Handlers handlers)
{
    if (!factory)
        throw std::invalid_argument("TunnelHost: peer connection factory is null");
    if (config.instance_id.empty())
        throw std::invalid_argument("TunnelHost: instance_id is empty");
    pImpl = std::make_shared<TunnelHostImpl>(std::move(config), std::move(factory),
                                             std::move(handlers));
}

TunnelHost::~TunnelHost()
{
    pImpl->stop();
}

utils::Status<utils::TunnelError> TunnelHost::start()
{
    return pImpl->start();
}

void TunnelHost::stop()
{
    pImpl->stop();
}

nlohmann::json TunnelHost::registration() const
{
    return pImpl->registration();
}

relay::RelayClient &TunnelHost::relay()
{
    return pImpl->relay;
}

size_t TunnelHost::session_count() const
{
    return pImpl->session_count();
}

std::shared_ptr<TunnelSession> TunnelHost::session(const std::string &session_id) const
{
    return pImpl->session(session_id);
}

std::vector<std::shared_ptr<TunnelSession>> TunnelHost::sessions() const
{
    return pImpl->sessions();
}

} // namespace mydiarelay::tunnel
