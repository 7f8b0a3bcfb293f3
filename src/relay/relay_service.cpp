#include "relay/relay_service.hpp"

#include "relay/claim_store.hpp"
#include "relay/connection_registry.hpp"
#include "relay/instance_token.hpp"
#include "relay/pending_request_ledger.hpp"
#include "relay/protocol_version.hpp"
#include "relay/signaling_session.hpp"
#include "relay/zmq_context.hpp"

#include "mdr_service.hpp"

#include <zmq.hpp>
#include <zmq_addon.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <deque>
#include <optional>
#include <thread>
#include <unordered_map>
#include <vector>

namespace mydiarelay::relay
{

namespace
{
// Z85 keypair buffer: 40 printable chars + null terminator
constexpr size_t kZ85KeyBufSize = 41;
constexpr size_t kZ85KeyLen = 40;
// Kept short so session timeouts and worker replies are picked up promptly.
constexpr std::chrono::milliseconds kPollTimeout{100};
constexpr char kFrameTypeControl = 'C';
// Signals held for a namespace nobody else has joined yet.
constexpr size_t kMaxQueuedSignals = 64;
constexpr size_t kPublicKeyBytes = 32;

using SessionPtr = std::shared_ptr<SignalingSession>;

nlohmann::json relay_response_body(const std::string &ref, LedgerOutcome &outcome)
{
    nlohmann::json body;
    if (!ref.empty())
        body["ref"] = ref;
    if (outcome.is_ok())
    {
        const nlohmann::json &resp = outcome.content();
        body["status"] = resp.value("status", 200);
        body["headers"] = resp.value("headers", nlohmann::json::object());
        body["body"] = resp.value("body", nlohmann::json());
        return body;
    }
    switch (outcome.error())
    {
    case utils::LedgerError::Timeout:
        body["status"] = 504;
        body["error"] = "Timeout";
        break;
    case utils::LedgerError::TunnelDisconnected:
        body["status"] = 502;
        body["error"] = "tunnel_disconnected";
        break;
    case utils::LedgerError::NotFound:
    case utils::LedgerError::DuplicateId:
    case utils::LedgerError::Cancelled:
        body["status"] = 502;
        body["error"] = utils::to_string(outcome.error());
        break;
    }
    return body;
}
} // namespace

// ============================================================================
// RelayServiceImpl
// ============================================================================

class RelayServiceImpl
{
  public:
    struct Rendezvous
    {
        std::vector<std::string> members; ///< ROUTER identities, join order
        std::deque<OutboundSignal> queued;  ///< identity = sender
    };

    struct RequestWorker
    {
        std::thread thread;
        /// Set once the instance answered or the wait failed.
        std::shared_ptr<std::atomic<bool>> done;
        std::string owner;
    };

    explicit RelayServiceImpl(RelayService::Config c);
    ~RelayServiceImpl();

    RelayService::Config cfg;
    std::string server_public_z85;
    std::string server_secret_z85;
    std::optional<InstanceTokenIssuer> tokens;
    ConnectionRegistry registry;
    PendingRequestLedger ledger;
    std::shared_ptr<SignalOutbox> outbox = std::make_shared<SignalOutbox>();
    std::atomic<bool> stop_requested{false};
    std::atomic<size_t> session_count{0};
    std::atomic<size_t> namespace_count{0};

    void run();

  private:
    // Loop-thread state.
    std::unordered_map<std::string, SessionPtr> m_sessions;
    std::unordered_map<std::string, Rendezvous> m_rooms;
    std::vector<RequestWorker> m_workers;
    uint64_t m_next_request_id{0};

    SessionPtr session_for(const std::string &identity);
    SessionPtr find_session(const std::string &identity) const;

    void process_message(const std::string &identity, const std::string &msg_type,
                         const nlohmann::json &body);

    void handle_register(const SessionPtr &session, const nlohmann::json &body);
    void handle_update_urls(const SessionPtr &session, const nlohmann::json &body);
    void handle_create_claim(const SessionPtr &session, const nlohmann::json &body);
    void handle_consume_claim(const SessionPtr &session, const nlohmann::json &body);
    void handle_response(const SessionPtr &session, const nlohmann::json &body);
    void handle_resolve_claim(const SessionPtr &session, const nlohmann::json &body);
    void handle_connect(const SessionPtr &session, const nlohmann::json &body);
    void handle_relay_request(const SessionPtr &session, const nlohmann::json &body);
    void handle_join(const SessionPtr &session, const nlohmann::json &body);
    void handle_webrtc_signal(const SessionPtr &session, SignalType type,
                              const nlohmann::json &body);

    bool owns_registration(const SignalingSession &session) const;
    void leave_namespace(SignalingSession &session, const std::string &ns);
    void cleanup_session(const SessionPtr &session, const char *reason);

    void check_session_timeouts();
    void reap_workers(bool wait_all);
    void flush_outbox(zmq::socket_t &socket);

    static void reply(SignalingSession &session, SignalType type, nlohmann::json body);
    // NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
    static void reply_error(SignalingSession &session, std::string_view code,
                            std::string_view message, const std::string &ref);

    static void send_to_identity(zmq::socket_t &socket, const std::string &identity,
                                 const std::string &msg_type, const nlohmann::json &body);
};

RelayServiceImpl::RelayServiceImpl(RelayService::Config c) : cfg(std::move(c))
{
    if (!cfg.claims)
        throw std::invalid_argument("RelayService: a ClaimStore is required");
    if (!cfg.token_secret.empty())
        tokens.emplace(cfg.token_secret);
}

RelayServiceImpl::~RelayServiceImpl()
{
    // run() normally joins its workers; this covers a loop that exited by exception.
    for (const auto &entry : registry.list_online())
        ledger.fail_all(entry.instance_id, utils::LedgerError::Cancelled);
    reap_workers(true);
}

// ============================================================================
// Main loop
// ============================================================================

void RelayServiceImpl::run()
{
    zmq::socket_t router(get_zmq_context(), zmq::socket_type::router);
    router.set(zmq::sockopt::linger, 0);

    if (cfg.use_curve)
    {
        router.set(zmq::sockopt::curve_server, 1);
        router.set(zmq::sockopt::curve_secretkey, server_secret_z85);
        router.set(zmq::sockopt::curve_publickey, server_public_z85);
    }

    router.bind(cfg.endpoint);
    const std::string bound = router.get(zmq::sockopt::last_endpoint);
    if (cfg.on_ready)
    {
        cfg.on_ready(bound, server_public_z85);
    }
    LOGGER_INFO("Relay: listening on {}", bound);
    if (cfg.use_curve)
    {
        LOGGER_INFO("Relay: server_public_key = {}", server_public_z85);
    }

    while (!stop_requested.load(std::memory_order_acquire))
    {
        std::vector<zmq::pollitem_t> items = {{router.handle(), 0, ZMQ_POLLIN, 0}};
        zmq::poll(items, kPollTimeout);

        check_session_timeouts();
        reap_workers(false);

        if ((items[0].revents & ZMQ_POLLIN) != 0)
        {
            std::vector<zmq::message_t> frames;
            static_cast<void>(zmq::recv_multipart(router, std::back_inserter(frames)));
            // Expected layout: [identity, 'C', msg_type_string, json_body]
            if (frames.size() < 4)
            {
                LOGGER_WARN("Relay: malformed message (expected 4 frames, got {})",
                            frames.size());
            }
            else if (frames[1].size() != 1 ||
                     *static_cast<const char *>(frames[1].data()) != kFrameTypeControl)
            {
                LOGGER_WARN("Relay: unexpected frame type from {}",
                            crypto::to_hex(frames[0].to_string()));
            }
            else
            {
                const std::string identity = frames[0].to_string();
                try
                {
                    nlohmann::json body = nlohmann::json::parse(frames[3].to_string());
                    if (body.is_object())
                    {
                        process_message(identity, frames[2].to_string(), body);
                    }
                    else
                    {
                        LOGGER_WARN("Relay: message body from {} is not an object",
                                    crypto::to_hex(identity));
                        send_to_identity(router, identity, to_wire(SignalType::Error),
                                         make_error_body("malformed", "Malformed message"));
                    }
                }
                catch (const nlohmann::json::exception &e)
                {
                    LOGGER_WARN("Relay: malformed JSON from {}: {}", crypto::to_hex(identity),
                                e.what());
                    send_to_identity(router, identity, to_wire(SignalType::Error),
                                     make_error_body("malformed", "Malformed message"));
                }
            }
        }

        flush_outbox(router);
        session_count.store(m_sessions.size(), std::memory_order_relaxed);
        namespace_count.store(m_rooms.size(), std::memory_order_relaxed);
    }

    // Fail everything still in flight before waiting for the request workers.
    std::vector<SessionPtr> remaining;
    remaining.reserve(m_sessions.size());
    for (const auto &[id, s] : m_sessions)
        remaining.push_back(s);
    for (const auto &s : remaining)
        cleanup_session(s, "relay shutting down");
    reap_workers(true);
    flush_outbox(router);

    router.close();
    session_count.store(0);
    namespace_count.store(0);
    LOGGER_INFO("Relay: stopped.");
}

// ============================================================================
// Message dispatch
// ============================================================================

void RelayServiceImpl::process_message(const std::string &identity, const std::string &msg_type,
                                       const nlohmann::json &body)
{
    const SessionPtr session = session_for(identity);
    session->touch(SignalingSession::Clock::now());

    const auto type = signal_type_from_wire(msg_type);
    if (!type)
    {
        LOGGER_WARN("Relay: unknown msg_type '{}' from {}", msg_type, session->channel_id());
        reply_error(*session, "unknown_type", fmt::format("Unknown message type: {}", msg_type),
                    body.value("ref", ""));
        return;
    }

    switch (*type)
    {
    case SignalType::Register:
        handle_register(session, body);
        break;
    case SignalType::Ping:
    {
        nlohmann::json pong = nlohmann::json::object();
        if (body.contains("ref"))
            pong["ref"] = body["ref"];
        reply(*session, SignalType::Pong, std::move(pong));
        break;
    }
    case SignalType::Pong:
        break;
    case SignalType::UpdateUrls:
        handle_update_urls(session, body);
        break;
    case SignalType::CreateClaim:
        handle_create_claim(session, body);
        break;
    case SignalType::ConsumeClaim:
        handle_consume_claim(session, body);
        break;
    case SignalType::Response:
        handle_response(session, body);
        break;
    case SignalType::ResolveClaim:
        handle_resolve_claim(session, body);
        break;
    case SignalType::Connect:
        handle_connect(session, body);
        break;
    case SignalType::RelayRequest:
        handle_relay_request(session, body);
        break;
    case SignalType::Join:
        handle_join(session, body);
        break;
    case SignalType::Leave:
        leave_namespace(*session, body.value("namespace", ""));
        break;
    case SignalType::WebrtcOffer:
    case SignalType::WebrtcAnswer:
    case SignalType::WebrtcCandidate:
        handle_webrtc_signal(session, *type, body);
        break;
    case SignalType::Disconnect:
        cleanup_session(session, "peer disconnected");
        break;
    case SignalType::Registered:
    case SignalType::ClaimCreated:
    case SignalType::ClaimConsumed:
    case SignalType::ClientConnected:
    case SignalType::Request:
    case SignalType::ClaimResolved:
    case SignalType::Connected:
    case SignalType::RelayResponse:
    case SignalType::Joined:
    case SignalType::PeerJoined:
    case SignalType::PeerLeft:
    case SignalType::Error:
        LOGGER_WARN("Relay: '{}' is relay-originated; ignoring it from {}", msg_type,
                    session->channel_id());
        reply_error(*session, "unexpected_type",
                    fmt::format("'{}' cannot be sent to the relay", msg_type),
                    body.value("ref", ""));
        break;
    }
}

// ============================================================================
// Instance-side handlers
// ============================================================================

void RelayServiceImpl::handle_register(const SessionPtr &session, const nlohmann::json &body)
{
    const std::string ref = body.value("ref", "");
    const std::string instance_id = body.value("instance_id", "");
    if (instance_id.empty())
    {
        reply_error(*session, "invalid_request", "Missing or empty 'instance_id'", ref);
        return;
    }

    const std::string public_key = body.value("public_key", "");
    if (!public_key.empty())
    {
        auto raw = crypto::from_base64(public_key);
        if (!raw || raw->size() != kPublicKeyBytes)
        {
            LOGGER_WARN("Relay: instance '{}' sent a malformed public key", instance_id);
            reply_error(*session, "registration_failed", "Registration failed", ref);
            return;
        }
    }

    if (tokens)
    {
        auto verified = tokens->verify(body.value("token", ""));
        if (verified.is_error() || verified.content() != instance_id)
        {
            LOGGER_WARN("Relay: instance '{}' rejected: {}", instance_id,
                        verified.is_error() ? utils::to_string(verified.error())
                                            : "token issued for another instance");
            reply_error(*session, "unauthorized", "Invalid instance token", ref);
            return;
        }
    }

    NegotiationOutcome negotiation;
    if (body.contains("protocol_versions"))
    {
        negotiation = negotiate(version_map_from_json(body["protocol_versions"]));
        if (!negotiation.compatible())
        {
            LOGGER_WARN("Relay: instance '{}' rejected: incompatible protocol layers",
                        instance_id);
            auto err = update_required_response(negotiation.incompatible_layers);
            if (!ref.empty())
                err["ref"] = ref;
            reply(*session, SignalType::Error, std::move(err));
            return;
        }
    }

    // A session that re-registers under a new id gives up the old one.
    if (session->role() == SessionRole::Instance && !session->instance_id().empty() &&
        session->instance_id() != instance_id)
    {
        if (registry.unregister_if(session->instance_id(), session.get()))
            ledger.fail_all(session->instance_id());
    }

    nlohmann::json metadata = {
        {"public_key", public_key},
        {"direct_urls", body.value("direct_urls", nlohmann::json::array())},
        {"protocol_versions", body.value("protocol_versions", nlohmann::json::object())},
        {"connected_at", format_tools::to_iso8601(std::chrono::system_clock::now())},
    };
    registry.register_instance(instance_id, session, std::move(metadata));
    session->set_role(SessionRole::Instance);
    session->set_instance_id(instance_id);

    LOGGER_INFO("Relay: instance registered: {} ({})", instance_id, session->channel_id());

    nlohmann::json resp = {
        {"instance_id", instance_id},
        {"relay_protocol", supported_versions().at("relay_protocol").back()},
        {"negotiated", negotiation.negotiated},
    };
    if (!ref.empty())
        resp["ref"] = ref;
    reply(*session, SignalType::Registered, std::move(resp));
}

void RelayServiceImpl::handle_update_urls(const SessionPtr &session, const nlohmann::json &body)
{
    const std::string ref = body.value("ref", "");
    if (!owns_registration(*session))
    {
        reply_error(*session, "not_registered", "Not registered", ref);
        return;
    }
    auto it = body.find("direct_urls");
    if (it == body.end() || !it->is_array())
    {
        reply_error(*session, "invalid_request", "'direct_urls' must be an array", ref);
        return;
    }
    registry.update_metadata(session->instance_id(), "direct_urls", *it);
    LOGGER_DEBUG("Relay: {} direct url(s) for '{}'", it->size(), session->instance_id());
}

void RelayServiceImpl::handle_create_claim(const SessionPtr &session, const nlohmann::json &body)
{
    const std::string ref = body.value("ref", "");
    if (!owns_registration(*session))
    {
        reply_error(*session, "not_registered", "Not registered", ref);
        return;
    }

    const std::string requester = body.value("requester_ref", body.value("user_id", ""));
    const int64_t ttl_s = body.value("ttl_seconds", int64_t{0});
    auto created = ttl_s > 0 ? cfg.claims->create_claim(session->instance_id(), requester,
                                                        std::chrono::seconds(ttl_s))
                             : cfg.claims->create_claim(session->instance_id(), requester);
    if (created.is_error())
    {
        LOGGER_WARN("Relay: failed to create claim for '{}': {}", session->instance_id(),
                    utils::to_string(created.error()));
        reply_error(*session, "claim_failed", "Failed to create claim", ref);
        return;
    }

    const Claim &claim = created.content();
    LOGGER_INFO("Relay: claim created for instance {}: {}", session->instance_id(), claim.code);
    nlohmann::json resp = {
        {"code", claim.code},
        {"claim_id", claim.id},
        {"expires_at", format_tools::to_iso8601(claim.expires_at)},
    };
    if (!ref.empty())
        resp["ref"] = ref;
    reply(*session, SignalType::ClaimCreated, std::move(resp));
}

void RelayServiceImpl::handle_consume_claim(const SessionPtr &session, const nlohmann::json &body)
{
    const std::string ref = body.value("ref", "");
    if (!owns_registration(*session))
    {
        reply_error(*session, "not_registered", "Not registered", ref);
        return;
    }

    const int64_t claim_id = body.value("claim_id", int64_t{0});
    const std::string device_id = body.value("device_id", "");
    auto consumed = cfg.claims->consume_claim(session->instance_id(), claim_id, device_id);
    if (consumed.is_error())
    {
        reply(*session, SignalType::Error, make_claim_error_body(consumed.error(), ref));
        return;
    }

    nlohmann::json resp = {{"claim_id", claim_id}, {"device_id", device_id}};
    if (!ref.empty())
        resp["ref"] = ref;
    reply(*session, SignalType::ClaimConsumed, std::move(resp));
}

void RelayServiceImpl::handle_response(const SessionPtr &session, const nlohmann::json &body)
{
    const std::string id = body.value("id", "");
    if (id.empty())
    {
        LOGGER_WARN("Relay: response without id from {}", session->channel_id());
        return;
    }

    auto pending = ledger.lookup(id);
    if (pending.is_error())
    {
        LOGGER_DEBUG("Relay: late or unknown response '{}'", id);
        return;
    }
    if (session->role() != SessionRole::Instance ||
        pending.content().instance_id != session->instance_id())
    {
        LOGGER_WARN("Relay: {} answered request '{}' it does not own", session->channel_id(),
                    id);
        return;
    }
    static_cast<void>(ledger.resolve(id, body));
}

// ============================================================================
// Client-side handlers
// ============================================================================

void RelayServiceImpl::handle_resolve_claim(const SessionPtr &session, const nlohmann::json &body)
{
    const std::string ref = body.value("ref", "");
    const std::string code = normalize_code(body.value("code", ""));
    if (code.empty())
    {
        reply(*session, SignalType::Error,
              make_claim_error_body(utils::ClaimError::NotFound, ref));
        return;
    }

    auto resolved = cfg.claims->resolve_claim(code);
    if (resolved.is_error())
    {
        LOGGER_INFO("Relay: claim resolution failed ({})", utils::to_string(resolved.error()));
        reply(*session, SignalType::Error, make_claim_error_body(resolved.error(), ref));
        return;
    }
    ClaimResolution resolution = std::move(resolved).content();

    // Checked before locking so an offline instance does not burn the lock window.
    auto instance = registry.get_handle(resolution.instance_id);
    if (instance.is_error())
    {
        reply_error(*session, "instance_offline", "Instance is offline", ref);
        return;
    }

    auto locked = cfg.claims->lock_claim(code);
    if (locked.is_error())
    {
        LOGGER_INFO("Relay: claim lock failed ({})", utils::to_string(locked.error()));
        reply(*session, SignalType::Error, make_claim_error_body(locked.error(), ref));
        return;
    }

    session->set_role(SessionRole::Client);
    session->set_instance_id(resolution.instance_id);

    nlohmann::json resp = {
        {"namespace", resolution.namespace_id},
        {"code", code},
        {"claim_id", resolution.claim_id},
        {"instance_id", resolution.instance_id},
        {"expires_at", format_tools::to_iso8601(resolution.expires_at)},
        {"rendezvous_points", resolution.rendezvous_points},
        {"session_id", session->session_id()},
    };
    if (!ref.empty())
        resp["ref"] = ref;
    reply(*session, SignalType::ClaimResolved, std::move(resp));

    instance.content()->deliver(SignalMessage{SignalType::ClientConnected,
                                              {{"session_id", session->session_id()},
                                               {"namespace", resolution.namespace_id},
                                               {"code", code},
                                               {"claim_id", resolution.claim_id}}});
    LOGGER_INFO("Relay: claim resolved for instance {}, session {}", resolution.instance_id,
                session->session_id());
}

void RelayServiceImpl::handle_connect(const SessionPtr &session, const nlohmann::json &body)
{
    const std::string ref = body.value("ref", "");
    const std::string instance_id = body.value("instance_id", "");

    auto entry = registry.lookup(instance_id);
    if (entry.is_error())
    {
        reply_error(*session, "instance_not_found", "Instance not found", ref);
        return;
    }
    auto handle = entry.content().handle.lock();
    if (!handle)
    {
        reply_error(*session, "instance_offline", "Instance is offline", ref);
        return;
    }

    NegotiationOutcome negotiation;
    if (body.contains("protocol_versions"))
    {
        negotiation = negotiate(version_map_from_json(body["protocol_versions"]));
        if (!negotiation.compatible())
        {
            auto err = update_required_response(negotiation.incompatible_layers);
            if (!ref.empty())
                err["ref"] = ref;
            reply(*session, SignalType::Error, std::move(err));
            return;
        }
    }

    // Direct connects get a one-off rendezvous code that never touches the claim store.
    const std::string code = generate_code(cfg.claims->options().code_length);
    const std::string ns = cfg.claims->namespaces().derive_namespace(code);

    session->set_role(SessionRole::Client);
    session->set_instance_id(instance_id);

    const nlohmann::json &metadata = entry.content().metadata;
    nlohmann::json resp = {
        {"session_id", session->session_id()},
        {"instance_id", instance_id},
        {"public_key", metadata.value("public_key", "")},
        {"direct_urls", metadata.value("direct_urls", nlohmann::json::array())},
        {"ice_servers", cfg.claims->options().ice_servers},
        {"namespace", ns},
        {"code", code},
        {"relay_protocol", supported_versions().at("relay_protocol").back()},
        {"instance_versions", metadata.value("protocol_versions", nlohmann::json::object())},
        {"negotiated", negotiation.negotiated},
    };
    if (!ref.empty())
        resp["ref"] = ref;
    reply(*session, SignalType::Connected, std::move(resp));

    handle->deliver(SignalMessage{SignalType::ClientConnected,
                                  {{"session_id", session->session_id()},
                                   {"namespace", ns},
                                   {"code", code}}});
    LOGGER_INFO("Relay: client connecting to instance {}, session {}", instance_id,
                session->session_id());
}

void RelayServiceImpl::handle_relay_request(const SessionPtr &session, const nlohmann::json &body)
{
    const std::string ref = body.value("ref", "");
    const std::string instance_id = body.value("instance_id", session->instance_id());
    if (instance_id.empty())
    {
        reply_error(*session, "invalid_request", "Missing or empty 'instance_id'", ref);
        return;
    }

    auto handle = registry.get_handle(instance_id);
    if (handle.is_error())
    {
        reply(*session, SignalType::RelayResponse,
              {{"ref", ref}, {"status", 502}, {"error", "Instance is offline"}});
        return;
    }
    if (session->role() == SessionRole::Unidentified)
        session->set_role(SessionRole::Client);

    const std::string request_id = fmt::format("relay-{}", ++m_next_request_id);
    nlohmann::json forward = {
        {"id", request_id},
        {"method", body.value("method", "GET")},
        {"path", body.value("path", "/")},
        {"headers", body.value("headers", nlohmann::json::object())},
        {"body", body.value("body", nlohmann::json())},
    };

    reap_workers(false);
    const std::string owner = session->channel_id();
    const size_t from_session = static_cast<size_t>(
        std::count_if(m_workers.begin(), m_workers.end(), [&owner](const RequestWorker &w) {
            return w.owner == owner && !w.done->load(std::memory_order_acquire);
        }));
    if (m_workers.size() >= cfg.max_relay_requests ||
        from_session >= cfg.max_relay_requests_per_session)
    {
        LOGGER_WARN("Relay: relay_request from {} to '{}' refused, {} in flight ({} from it)",
                    owner, instance_id, m_workers.size(), from_session);
        reply(*session, SignalType::RelayResponse,
              {{"ref", ref}, {"status", 503}, {"error", "Too many requests"}});
        return;
    }

    auto done = std::make_shared<std::atomic<bool>>(false);
    std::shared_ptr<SignalChannel> channel = std::move(handle).content();
    std::thread worker(
        [this, session, channel, instance_id, request_id, ref, forward = std::move(forward),
         done]() {
            try
            {
                auto outcome = ledger.await_response(instance_id, request_id,
                                                     cfg.request_timeout, [&] {
                                                         return channel->deliver(SignalMessage{
                                                             SignalType::Request, forward});
                                                     });
                done->store(true, std::memory_order_release);
                session->deliver(
                    SignalMessage{SignalType::RelayResponse, relay_response_body(ref, outcome)});
            }
            catch (const std::exception &e)
            {
                LOGGER_ERROR("Relay: request worker for '{}' failed: {}", request_id, e.what());
            }
            done->store(true, std::memory_order_release);
        });
    m_workers.push_back(RequestWorker{std::move(worker), std::move(done), owner});
}

// ============================================================================
// Rendezvous
// ============================================================================

void RelayServiceImpl::handle_join(const SessionPtr &session, const nlohmann::json &body)
{
    const std::string ref = body.value("ref", "");
    const std::string ns = body.value("namespace", "");
    const std::string code = normalize_code(body.value("code", ""));
    if (ns.empty() || code.empty())
    {
        reply_error(*session, "invalid_request", "'namespace' and 'code' are required", ref);
        return;
    }
    if (!cfg.claims->namespaces().valid_namespace(code, ns))
    {
        LOGGER_WARN("Relay: {} presented a namespace that does not match its code",
                    session->channel_id());
        reply_error(*session, "invalid_namespace", "Namespace does not match the code", ref);
        return;
    }

    Rendezvous &room = m_rooms[ns];
    if (std::find(room.members.begin(), room.members.end(), session->identity()) ==
        room.members.end())
    {
        room.members.push_back(session->identity());
    }
    session->joined_namespaces().insert(ns);

    nlohmann::json resp = {
        {"namespace", ns},
        {"session_id", session->session_id()},
        {"peers", room.members.size() - 1},
    };
    if (!ref.empty())
        resp["ref"] = ref;
    reply(*session, SignalType::Joined, std::move(resp));

    const SignalMessage joined{SignalType::PeerJoined,
                               {{"namespace", ns},
                                {"session_id", session->session_id()},
                                {"role", to_string(session->role())}}};
    for (const auto &member : room.members)
    {
        if (member == session->identity())
            continue;
        if (auto peer = find_session(member))
            peer->deliver(joined);
    }

    // Hand over whatever the other side sent before this peer arrived.
    for (auto it = room.queued.begin(); it != room.queued.end();)
    {
        if (it->identity != session->identity())
        {
            session->deliver(it->message);
            it = room.queued.erase(it);
        }
        else
        {
            ++it;
        }
    }
}

void RelayServiceImpl::handle_webrtc_signal(const SessionPtr &session, SignalType type,
                                            const nlohmann::json &body)
{
    const std::string ns = body.value("namespace", "");
    auto room_it = m_rooms.find(ns);
    if (room_it == m_rooms.end() || session->joined_namespaces().count(ns) == 0)
    {
        reply_error(*session, "not_joined", "Join the namespace first", body.value("ref", ""));
        return;
    }

    SignalMessage forward{type, body};
    forward.body.erase("ref");
    forward.body["from"] = session->session_id();

    Rendezvous &room = room_it->second;
    bool delivered = false;
    for (const auto &member : room.members)
    {
        if (member == session->identity())
            continue;
        if (auto peer = find_session(member); peer && peer->deliver(forward))
            delivered = true;
    }
    if (delivered)
        return;

    if (room.queued.size() >= kMaxQueuedSignals)
    {
        LOGGER_WARN("Relay: namespace queue full; dropping oldest {}",
                    to_wire(room.queued.front().message.type));
        room.queued.pop_front();
    }
    room.queued.push_back(OutboundSignal{session->identity(), std::move(forward)});
}

void RelayServiceImpl::leave_namespace(SignalingSession &session, const std::string &ns)
{
    session.joined_namespaces().erase(ns);
    auto it = m_rooms.find(ns);
    if (it == m_rooms.end())
        return;

    auto &members = it->second.members;
    members.erase(std::remove(members.begin(), members.end(), session.identity()),
                  members.end());

    const SignalMessage left{SignalType::PeerLeft,
                             {{"namespace", ns}, {"session_id", session.session_id()}}};
    for (const auto &member : members)
    {
        if (auto peer = find_session(member))
            peer->deliver(left);
    }
    if (members.empty())
        m_rooms.erase(it);
}

// ============================================================================
// Sessions
// ============================================================================

SessionPtr RelayServiceImpl::session_for(const std::string &identity)
{
    auto it = m_sessions.find(identity);
    if (it != m_sessions.end())
        return it->second;
    auto session = std::make_shared<SignalingSession>(identity, outbox);
    m_sessions.emplace(identity, session);
    LOGGER_DEBUG("Relay: new session {}", session->channel_id());
    return session;
}

SessionPtr RelayServiceImpl::find_session(const std::string &identity) const
{
    auto it = m_sessions.find(identity);
    return it == m_sessions.end() ? nullptr : it->second;
}

bool RelayServiceImpl::owns_registration(const SignalingSession &session) const
{
    if (session.role() != SessionRole::Instance || session.instance_id().empty())
        return false;
    auto handle = registry.get_handle(session.instance_id());
    return handle.is_ok() && handle.content().get() == &session;
}

void RelayServiceImpl::cleanup_session(const SessionPtr &session, const char *reason)
{
    if (!session->close())
        return;

    LOGGER_INFO("Relay: closing {} session {} ({})", to_string(session->role()),
                session->channel_id(), reason);

    if (session->role() == SessionRole::Instance && !session->instance_id().empty())
    {
        // A newer session for the same instance keeps its entry and its requests.
        if (registry.unregister_if(session->instance_id(), session.get()))
        {
            const size_t failed = ledger.fail_all(session->instance_id());
            if (failed > 0)
            {
                LOGGER_INFO("Relay: failed {} pending request(s) for instance {}", failed,
                            session->instance_id());
            }
        }
    }

    const std::set<std::string> joined = session->joined_namespaces();
    for (const auto &ns : joined)
        leave_namespace(*session, ns);

    m_sessions.erase(session->identity());
}

void RelayServiceImpl::check_session_timeouts()
{
    const auto now = SignalingSession::Clock::now();
    std::vector<SessionPtr> expired;
    for (const auto &[identity, session] : m_sessions)
    {
        const auto limit = session->role() == SessionRole::Instance
                               ? std::chrono::duration_cast<std::chrono::milliseconds>(
                                     cfg.heartbeat_timeout)
                               : std::chrono::duration_cast<std::chrono::milliseconds>(
                                     cfg.session_timeout);
        if (now - session->last_seen() > limit)
            expired.push_back(session);
    }
    for (const auto &session : expired)
    {
        LOGGER_WARN("Relay: heartbeat timeout for {} '{}'", to_string(session->role()),
                    session->instance_id().empty() ? session->session_id()
                                                   : session->instance_id());
        cleanup_session(session, "heartbeat timeout");
    }
}

void RelayServiceImpl::reap_workers(bool wait_all)
{
    for (auto it = m_workers.begin(); it != m_workers.end();)
    {
        if (wait_all || it->done->load(std::memory_order_acquire))
        {
            if (it->thread.joinable())
                it->thread.join();
            it = m_workers.erase(it);
        }
        else
        {
            ++it;
        }
    }
}

void RelayServiceImpl::flush_outbox(zmq::socket_t &socket)
{
    for (auto &out : outbox->drain())
    {
        try
        {
            send_to_identity(socket, out.identity, to_wire(out.message.type), out.message.body);
        }
        catch (const zmq::error_t &e)
        {
            LOGGER_WARN("Relay: send of '{}' to {} failed: {}", to_wire(out.message.type),
                        crypto::to_hex(out.identity), e.what());
        }
    }
}

// ============================================================================
// Helpers
// ============================================================================

void RelayServiceImpl::reply(SignalingSession &session, SignalType type, nlohmann::json body)
{
    session.deliver(SignalMessage{type, std::move(body)});
}

// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
void RelayServiceImpl::reply_error(SignalingSession &session, std::string_view code,
                                   std::string_view message, const std::string &ref)
{
    session.deliver(SignalMessage{SignalType::Error, make_error_body(code, message, ref)});
}

void RelayServiceImpl::send_to_identity(zmq::socket_t &socket, const std::string &identity,
                                        const std::string &msg_type, const nlohmann::json &body)
{
    const std::string body_str = body.dump();
    socket.send(zmq::message_t(identity.data(), identity.size()), zmq::send_flags::sndmore);
    socket.send(zmq::message_t(&kFrameTypeControl, 1), zmq::send_flags::sndmore);
    socket.send(zmq::message_t(msg_type.data(), msg_type.size()), zmq::send_flags::sndmore);
    socket.send(zmq::message_t(body_str.data(), body_str.size()), zmq::send_flags::none);
}

// ============================================================================
// RelayService: Pimpl delegation
// ============================================================================

RelayService::Config RelayService::config_from(const RelayConfig &cfg,
                                               std::shared_ptr<ClaimStore> claims)
{
    Config out;
    out.endpoint = cfg.relay_endpoint();
    out.use_curve = cfg.use_curve();
    out.heartbeat_timeout = cfg.heartbeat_timeout();
    out.session_timeout = cfg.session_timeout();
    out.request_timeout = cfg.request_timeout();
    out.max_relay_requests = cfg.max_relay_requests();
    out.max_relay_requests_per_session = cfg.max_relay_requests_per_session();
    out.token_secret = cfg.token_secret();
    out.claims = std::move(claims);
    return out;
}

RelayService::RelayService(Config cfg) : pImpl(std::make_unique<RelayServiceImpl>(std::move(cfg)))
{
    if (pImpl->cfg.use_curve)
    {
        std::array<char, kZ85KeyBufSize> pub{};
        std::array<char, kZ85KeyBufSize> sec{};
        if (zmq_curve_keypair(pub.data(), sec.data()) != 0)
        {
            throw std::runtime_error("RelayService: zmq_curve_keypair failed");
        }
        pImpl->server_public_z85.assign(pub.data(), kZ85KeyLen);
        pImpl->server_secret_z85.assign(sec.data(), kZ85KeyLen);
    }
}

RelayService::~RelayService() = default;

const std::string &RelayService::server_public_key() const
{
    return pImpl->server_public_z85;
}

void RelayService::run()
{
    pImpl->run();
}

void RelayService::stop()
{
    pImpl->stop_requested.store(true, std::memory_order_release);
}

ConnectionRegistry &RelayService::registry()
{
    return pImpl->registry;
}

PendingRequestLedger &RelayService::ledger()
{
    return pImpl->ledger;
}

std::string RelayService::status_json_str() const
{
    nlohmann::json instances = nlohmann::json::array();
    for (const auto &entry : pImpl->registry.list_online())
        instances.push_back(entry.instance_id);
    return nlohmann::json{
        {"instances", std::move(instances)},
        {"sessions", pImpl->session_count.load(std::memory_order_relaxed)},
        {"pending_requests", pImpl->ledger.count()},
        {"namespaces", pImpl->namespace_count.load(std::memory_order_relaxed)},
    }
        .dump();
}

} // namespace mydiarelay::relay
