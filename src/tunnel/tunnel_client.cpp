#include "mdr_service.hpp"
#include "relay/claim.hpp"
#include "relay/relay_client.hpp"
#include "tunnel/tunnel_client.hpp"

#include <mutex>

namespace mydiarelay::tunnel
{

using relay::SignalMessage;
using relay::SignalType;
using utils::TunnelError;

class TunnelClientImpl : public std::enable_shared_from_this<TunnelClientImpl>
{
  public:
    using SessionResult = TunnelClient::SessionResult;

    TunnelClientImpl(TunnelClient::Config cfg, std::shared_ptr<PeerConnectionFactory> f)
        : config(std::move(cfg)), factory(std::move(f)),
          relay(relay::RelayClient::Options{std::chrono::milliseconds(5000),
                                            std::chrono::seconds(30), config.namespace_secret})
    {
    }

    ~TunnelClientImpl() { close(); }

    const TunnelClient::Config config;
    const std::shared_ptr<PeerConnectionFactory> factory;

    SessionResult connect_with_code(const std::string &code)
    {
        if (!ensure_connected())
            return SessionResult::error(TunnelError::NotConnected);

        auto resolved = relay.resolve_claim(code);
        if (resolved.is_error())
        {
            LOGGER_WARN("TunnelClient: claim not redeemed: {}",
                        relay.last_error().value("message", utils::to_string(resolved.error())));
            return SessionResult::error(resolved.error());
        }
        nlohmann::json reply = std::move(resolved).content();
        set_rendezvous(reply);
        return open(reply.value("session_id", ""), reply.value("namespace", ""),
                    reply.value("code", relay::normalize_code(code)),
                    ice_servers_from(reply, "rendezvous_points"));
    }

    SessionResult connect_to_instance(const std::string &instance_id)
    {
        if (!ensure_connected())
            return SessionResult::error(TunnelError::NotConnected);

        auto connected = relay.connect_instance(instance_id);
        if (connected.is_error())
        {
            LOGGER_WARN("TunnelClient: connect to {} failed: {}", instance_id,
                        relay.last_error().value("message", utils::to_string(connected.error())));
            return SessionResult::error(connected.error());
        }
        nlohmann::json reply = std::move(connected).content();
        set_rendezvous(reply);
        return open(reply.value("session_id", ""), reply.value("namespace", ""),
                    reply.value("code", ""), ice_servers_from(reply, "ice_servers"));
    }

    nlohmann::json rendezvous() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_rendezvous;
    }

    void close()
    {
        std::shared_ptr<TunnelSession> session;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            session = std::move(m_session);
        }
        if (session)
            session->close();
        relay.disconnect();
    }

  private:
    mutable std::mutex m_mutex;
    std::shared_ptr<TunnelSession> m_session;
    std::string m_namespace;
    nlohmann::json m_rendezvous = nlohmann::json::object();

  public:
    // Destroyed first, so its dispatcher is joined while everything above is still alive.
    relay::RelayClient relay;

  private:
    bool ensure_connected()
    {
        if (relay.is_connected())
            return true;
        relay.on_message([this](const SignalMessage &msg) { on_relay_message(msg); });
        if (relay.connect(config.relay_endpoint, config.relay_server_key))
            return true;
        LOGGER_ERROR("TunnelClient: relay {} unreachable", config.relay_endpoint);
        return false;
    }

    void set_rendezvous(const nlohmann::json &reply)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_rendezvous = reply;
    }

    static std::vector<std::string> ice_servers_from(const nlohmann::json &reply, const char *key)
    {
        std::vector<std::string> out;
        auto it = reply.find(key);
        if (it == reply.end() || !it->is_array())
            return out;
        for (const auto &entry : *it)
        {
            if (entry.is_string())
                out.push_back(entry.get<std::string>());
            else if (entry.is_object() && entry.contains("urls"))
            {
                const auto &urls = entry["urls"];
                if (urls.is_string())
                    out.push_back(urls.get<std::string>());
                else if (urls.is_array())
                    for (const auto &u : urls)
                        if (u.is_string())
                            out.push_back(u.get<std::string>());
            }
        }
        return out;
    }

    SessionResult open(const std::string &session_id, const std::string &ns,
                       const std::string &code, const std::vector<std::string> &ice_servers)
    {
        if (session_id.empty() || ns.empty() || code.empty())
        {
            LOGGER_ERROR("TunnelClient: relay reply lacks session_id/namespace/code");
            return SessionResult::error(TunnelError::ProtocolError);
        }

        auto joined = relay.join(ns, code);
        if (joined.is_error())
        {
            LOGGER_WARN("TunnelClient: cannot join '{}': {}", ns,
                        utils::to_string(joined.error()));
            return SessionResult::error(joined.error());
        }
        const std::string accepted = joined.content().value("namespace", ns);

        auto pc = factory->create(ice_servers);
        std::weak_ptr<TunnelClientImpl> weak = weak_from_this();
        pc->on_local_description([weak, accepted](const SessionDescription &desc) {
            if (auto self = weak.lock())
                self->relay.send_signal(SignalType::WebrtcOffer, accepted,
                                        {{"sdp", desc.sdp}, {"type", desc.type}});
        });
        pc->on_local_candidate([weak, accepted](const IceCandidate &candidate) {
            if (auto self = weak.lock())
                self->relay.send_signal(SignalType::WebrtcCandidate, accepted,
                                        {{"candidate", candidate.candidate},
                                         {"sdpMid", candidate.sdp_mid},
                                         {"sdpMLineIndex", candidate.sdp_mline_index}});
        });

        auto session = TunnelSession::create(session_id, std::move(pc), TunnelSession::Handlers{},
                                             config.session_options);
        session->on_closed([weak, accepted](const std::string &) {
            if (auto self = weak.lock())
                self->forget(accepted);
        });

        std::shared_ptr<TunnelSession> previous;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            previous = std::exchange(m_session, session);
            m_namespace = accepted;
        }
        if (previous)
            previous->close();

        session->mark_signaling_established();
        session->open_channels();
        auto ready = session->wait_until_serving();
        if (ready.is_error())
        {
            LOGGER_WARN("TunnelClient: session {} failed: {}", session_id,
                        utils::to_string(ready.error()));
            session->close();
            return SessionResult::error(ready.error());
        }
        LOGGER_INFO("TunnelClient: session {} serving", session_id);
        return SessionResult::ok(std::move(session));
    }

    void forget(const std::string &ns)
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_namespace != ns)
                return;
            m_namespace.clear();
        }
        if (relay.is_connected())
            relay.leave(ns);
    }

    std::shared_ptr<TunnelSession> current_session(const std::string &ns) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (ns != m_namespace)
            return nullptr;
        return m_session;
    }

    void on_relay_message(const SignalMessage &msg)
    {
        switch (msg.type)
        {
        case SignalType::WebrtcAnswer:
            if (auto session = current_session(string_field(msg.body, "namespace")))
                session->peer().set_remote_description(
                    {string_field(msg.body, "sdp"), string_field(msg.body, "type", "answer")});
            return;
        case SignalType::WebrtcCandidate:
            if (auto session = current_session(string_field(msg.body, "namespace")))
                session->peer().add_remote_candidate({string_field(msg.body, "candidate"),
                                                      string_field(msg.body, "sdpMid"),
                                                      int_field(msg.body, "sdpMLineIndex", 0)});
            return;
        case SignalType::WebrtcOffer:
            LOGGER_WARN("TunnelClient: unexpected webrtc_offer in '{}'",
                        string_field(msg.body, "namespace"));
            return;
        case SignalType::PeerJoined:
        case SignalType::PeerLeft:
            LOGGER_DEBUG("TunnelClient: {} {} in '{}'", string_field(msg.body, "session_id"),
                         relay::to_wire(msg.type), string_field(msg.body, "namespace"));
            return;
        case SignalType::Error:
            LOGGER_WARN("TunnelClient: relay error {}: {}", string_field(msg.body, "code"),
                        string_field(msg.body, "message"));
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
        case SignalType::ClientConnected:
        case SignalType::Request:
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
            LOGGER_DEBUG("TunnelClient: ignoring pushed '{}'", relay::to_wire(msg.type));
            return;
        }
    }
};

// ============================================================================
// TunnelClient
// ============================================================================

TunnelClient::TunnelClient(Config config, std::shared_ptr<PeerConnectionFactory> factory)
{
    if (!factory)
        throw std::invalid_argument("TunnelClient: peer connection factory is null");
    pImpl = std::make_shared<TunnelClientImpl>(std::move(config), std::move(factory));
}

TunnelClient::~TunnelClient()
{
    pImpl->close();
}

TunnelClient::SessionResult TunnelClient::connect_with_code(const std::string &code)
{
    return pImpl->connect_with_code(code);
}

TunnelClient::SessionResult TunnelClient::connect_to_instance(const std::string &instance_id)
{
    return pImpl->connect_to_instance(instance_id);
}

nlohmann::json TunnelClient::last_relay_error() const
{
    return pImpl->relay.last_error();
}

nlohmann::json TunnelClient::rendezvous() const
{
    return pImpl->rendezvous();
}

relay::RelayClient &TunnelClient::relay()
{
    return pImpl->relay;
}

void TunnelClient::close()
{
    pImpl->close();
}

} // namespace mydiarelay::tunnel
