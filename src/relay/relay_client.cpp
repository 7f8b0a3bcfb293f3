#include "mdr_service.hpp"
#include "relay/claim.hpp"
#include "relay/claim_namespace.hpp"
#include "relay/pending_request_ledger.hpp"
#include "relay/protocol_version.hpp"
#include "relay/relay_client.hpp"
#include "relay/zmq_context.hpp"

#include <zmq.hpp>
#include <zmq_addon.hpp>

#include <array>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <optional>
#include <thread>
#include <variant>

namespace mydiarelay::relay
{

namespace
{
constexpr size_t kZ85KeyChars = 40;
constexpr size_t kZ85KeyBufSize = 41;
/// How often the worker wakes up (even if idle) to poll for pushed messages.
constexpr std::chrono::milliseconds kWorkerPollInterval{20};
constexpr char kFrameTypeControl = 'C';
/// Ledger key for requests waiting on the relay.
constexpr const char *kRelayLedgerKey = "relay";
} // namespace

utils::TunnelError tunnel_error_from_body(const nlohmann::json &body)
{
    const std::string code = body.value("code", "");
    if (code == "invalid_namespace")
        return utils::TunnelError::InvalidNamespace;
    if (code == "unauthorized" || code == "not_registered")
        return utils::TunnelError::Unauthorized;
    if (claim_error_from_wire(code))
        return utils::TunnelError::ClaimRejected;
    if (code == "instance_not_found" || code == "instance_offline")
        return utils::TunnelError::NotConnected;
    return utils::TunnelError::ProtocolError;
}

// ============================================================================
// Async Queue Commands
// ============================================================================

struct ConnectCmd
{
    std::string endpoint;
    std::string server_key;
    std::promise<bool> result;
};
struct DisconnectCmd
{
    std::promise<void> result;
};
struct SendCmd
{
    SignalMessage message;
};
struct StopCmd
{
};

using RelayCommand = std::variant<ConnectCmd, DisconnectCmd, SendCmd, StopCmd>;

// ============================================================================
// RelayClientImpl
// ============================================================================

class RelayClientImpl
{
  public:
    explicit RelayClientImpl(RelayClient::Options opts)
        : options(std::move(opts)), namespaces(options.namespace_secret)
    {
    }

    ~RelayClientImpl()
    {
        if (m_running.load(std::memory_order_acquire))
        {
            enqueue(StopCmd{});
            if (m_worker.joinable())
                m_worker.join();
        }
        {
            std::lock_guard<std::mutex> lock(m_event_mutex);
            m_dispatcher_stop = true;
        }
        m_event_cv.notify_one();
        if (m_dispatcher.joinable())
            m_dispatcher.join();
    }

    RelayClient::Options options;
    ClaimNamespace namespaces;
    PendingRequestLedger ledger;
    std::atomic<bool> is_connected{false};
    std::atomic<uint64_t> next_ref{0};

    mutable std::mutex error_mutex;
    nlohmann::json last_error = nlohmann::json::object();

    std::mutex handler_mutex;
    RelayClient::MessageHandler handler;

    void enqueue(RelayCommand cmd)
    {
        {
            std::lock_guard<std::mutex> lock(m_queue_mutex);
            m_queue.push_back(std::move(cmd));
        }
        m_queue_cv.notify_one();
    }

    void start_threads()
    {
        if (m_running.exchange(true, std::memory_order_acq_rel))
            return;
        m_worker = std::thread(&RelayClientImpl::worker_loop, this);
        m_dispatcher = std::thread(&RelayClientImpl::dispatcher_loop, this);
    }

  private:
    std::deque<RelayCommand> m_queue;
    std::mutex m_queue_mutex;
    std::condition_variable m_queue_cv;
    std::thread m_worker;
    std::atomic<bool> m_running{false};

    std::deque<SignalMessage> m_events;
    std::mutex m_event_mutex;
    std::condition_variable m_event_cv;
    std::thread m_dispatcher;
    bool m_dispatcher_stop{false};

    std::chrono::steady_clock::time_point m_next_ping{};

    // ── Worker loop ──────────────────────────────────────────────────────────

    void worker_loop()
    {
        std::optional<zmq::socket_t> socket;
        while (true)
        {
            std::deque<RelayCommand> batch;
            {
                std::unique_lock<std::mutex> lock(m_queue_mutex);
                if (is_connected.load(std::memory_order_acquire))
                {
                    m_queue_cv.wait_for(lock, kWorkerPollInterval,
                                        [this] { return !m_queue.empty(); });
                }
                else
                {
                    m_queue_cv.wait(lock, [this] { return !m_queue.empty(); });
                }
                std::swap(batch, m_queue);
            }

            for (auto &cmd : batch)
            {
                const bool stop = std::visit(
                    [&](auto &&variant_cmd) { return handle_command(variant_cmd, socket); },
                    cmd);
                if (stop)
                {
                    m_running.store(false, std::memory_order_release);
                    return;
                }
            }

            if (socket.has_value())
            {
                process_incoming(*socket);
                send_ping_if_due(*socket);
            }
        }
    }

    void dispatcher_loop()
    {
        while (true)
        {
            std::deque<SignalMessage> batch;
            {
                std::unique_lock<std::mutex> lock(m_event_mutex);
                m_event_cv.wait(lock, [this] { return m_dispatcher_stop || !m_events.empty(); });
                if (m_dispatcher_stop && m_events.empty())
                    return;
                std::swap(batch, m_events);
            }
            RelayClient::MessageHandler cb;
            {
                std::lock_guard<std::mutex> lock(handler_mutex);
                cb = handler;
            }
            for (const auto &msg : batch)
            {
                if (!cb)
                {
                    LOGGER_DEBUG("RelayClient: no handler for pushed '{}'", to_wire(msg.type));
                    continue;
                }
                try
                {
                    cb(msg);
                }
                catch (const std::exception &e)
                {
                    LOGGER_ERROR("RelayClient: message handler threw on '{}': {}",
                                 to_wire(msg.type), e.what());
                }
            }
        }
    }

    void post_event(SignalMessage msg)
    {
        {
            std::lock_guard<std::mutex> lock(m_event_mutex);
            m_events.push_back(std::move(msg));
        }
        m_event_cv.notify_one();
    }

    // ── Incoming ─────────────────────────────────────────────────────────────

    void process_incoming(zmq::socket_t &socket)
    {
        while (true)
        {
            std::vector<zmq::pollitem_t> items = {{socket.handle(), 0, ZMQ_POLLIN, 0}};
            zmq::poll(items, std::chrono::milliseconds{0}); // non-blocking
            if ((items[0].revents & ZMQ_POLLIN) == 0)
                break;

            std::vector<zmq::message_t> msgs;
            static_cast<void>(
                zmq::recv_multipart(socket, std::back_inserter(msgs), zmq::recv_flags::dontwait));
            // Layout: ['C', msg_type, json_body]
            if (msgs.size() < 3)
            {
                LOGGER_WARN("RelayClient: malformed message ({} frames)", msgs.size());
                continue;
            }
            const std::string msg_type = msgs[1].to_string();
            const auto type = signal_type_from_wire(msg_type);
            if (!type)
            {
                LOGGER_WARN("RelayClient: unknown msg_type '{}'", msg_type);
                continue;
            }
            try
            {
                nlohmann::json body = nlohmann::json::parse(msgs[2].to_string());
                dispatch(*type, std::move(body));
            }
            catch (const nlohmann::json::exception &e)
            {
                LOGGER_WARN("RelayClient: bad '{}' JSON: {}", msg_type, e.what());
            }
        }
    }

    void dispatch(SignalType type, nlohmann::json body)
    {
        const std::string ref = body.is_object() ? body.value("ref", "") : std::string{};
        if (!ref.empty())
        {
            nlohmann::json envelope = {{"type", to_wire(type)}, {"body", body}};
            if (ledger.resolve(ref, std::move(envelope)).is_ok())
                return;
            LOGGER_DEBUG("RelayClient: late reply '{}' for ref '{}'", to_wire(type), ref);
            return;
        }
        if (type == SignalType::Pong)
            return;
        post_event(SignalMessage{type, std::move(body)});
    }

    void send_ping_if_due(zmq::socket_t &socket)
    {
        if (options.ping_interval.count() <= 0)
            return;
        const auto now = std::chrono::steady_clock::now();
        if (now < m_next_ping)
            return;
        m_next_ping = now + options.ping_interval;
        send_message(socket, SignalMessage{SignalType::Ping, nlohmann::json::object()});
    }

    static bool send_message(zmq::socket_t &socket, const SignalMessage &msg)
    {
        try
        {
            const std::string msg_type = to_wire(msg.type);
            const std::string payload = msg.body.dump();
            std::vector<zmq::const_buffer> frames = {zmq::buffer(&kFrameTypeControl, 1),
                                                     zmq::buffer(msg_type),
                                                     zmq::buffer(payload)};
            if (!zmq::send_multipart(socket, frames))
            {
                LOGGER_ERROR("RelayClient: send of '{}' failed.", msg_type);
                return false;
            }
            return true;
        }
        catch (const zmq::error_t &e)
        {
            LOGGER_ERROR("RelayClient: ZMQ error sending '{}': {}", to_wire(msg.type), e.what());
            return false;
        }
    }

    // ── Command handlers ─────────────────────────────────────────────────────

    // Returns true if the worker should stop.
    bool handle_command(ConnectCmd &cmd, std::optional<zmq::socket_t> &socket)
    {
        if (is_connected.load(std::memory_order_acquire))
        {
            LOGGER_WARN("RelayClient: Already connected.");
            cmd.result.set_value(true);
            return false;
        }
        if (cmd.endpoint.empty())
        {
            LOGGER_ERROR("RelayClient: Relay endpoint cannot be empty.");
            cmd.result.set_value(false);
            return false;
        }
        if (!cmd.server_key.empty() && cmd.server_key.size() != kZ85KeyChars)
        {
            LOGGER_ERROR("RelayClient: Invalid relay public key format.");
            cmd.result.set_value(false);
            return false;
        }
        try
        {
            socket.emplace(get_zmq_context(), zmq::socket_type::dealer);
            socket->set(zmq::sockopt::linger, 0);
            if (!cmd.server_key.empty())
            {
                std::array<char, kZ85KeyBufSize> z85_public{};
                std::array<char, kZ85KeyBufSize> z85_secret{};
                if (zmq_curve_keypair(z85_public.data(), z85_secret.data()) != 0)
                {
                    LOGGER_ERROR("RelayClient: Failed to generate CurveZMQ key pair.");
                    socket.reset();
                    cmd.result.set_value(false);
                    return false;
                }
                socket->set(zmq::sockopt::curve_serverkey, cmd.server_key);
                socket->set(zmq::sockopt::curve_publickey, std::string(z85_public.data()));
                socket->set(zmq::sockopt::curve_secretkey, std::string(z85_secret.data()));
            }
            socket->connect(cmd.endpoint);
            is_connected.store(true, std::memory_order_release);
            m_next_ping = std::chrono::steady_clock::now() + options.ping_interval;
            LOGGER_INFO("RelayClient: Connected to relay at {}.", cmd.endpoint);
            cmd.result.set_value(true);
        }
        catch (const zmq::error_t &e)
        {
            LOGGER_ERROR("RelayClient: Failed to connect to relay at {}: {} ({})", cmd.endpoint,
                         e.what(), e.num());
            socket.reset();
            is_connected.store(false, std::memory_order_release);
            cmd.result.set_value(false);
        }
        return false;
    }

    bool handle_command(DisconnectCmd &cmd, std::optional<zmq::socket_t> &socket)
    {
        close_socket(socket, true);
        cmd.result.set_value();
        return false;
    }

    bool handle_command(SendCmd &cmd, std::optional<zmq::socket_t> &socket)
    {
        if (!socket.has_value())
        {
            LOGGER_WARN("RelayClient: '{}' dropped: not connected.", to_wire(cmd.message.type));
            return false;
        }
        static_cast<void>(send_message(*socket, cmd.message));
        return false;
    }

    bool handle_command(StopCmd & /*cmd*/, std::optional<zmq::socket_t> &socket)
    {
        close_socket(socket, true);
        return true;
    }

    void close_socket(std::optional<zmq::socket_t> &socket, bool say_goodbye)
    {
        if (socket.has_value())
        {
            if (say_goodbye)
                static_cast<void>(
                    send_message(*socket, SignalMessage{SignalType::Disconnect,
                                                        nlohmann::json::object()}));
            try
            {
                socket->close();
            }
            catch (const zmq::error_t &e)
            {
                LOGGER_ERROR("RelayClient: Error during disconnect: {}", e.what());
            }
            socket.reset();
            LOGGER_INFO("RelayClient: Disconnected from relay.");
        }
        is_connected.store(false, std::memory_order_release);
        ledger.fail_all(kRelayLedgerKey, utils::LedgerError::TunnelDisconnected);
    }
};

// ============================================================================
// RelayClient
// ============================================================================

RelayClient::RelayClient() : RelayClient(Options{}) {}

RelayClient::RelayClient(Options options)
    : pImpl(std::make_unique<RelayClientImpl>(std::move(options)))
{
}

RelayClient::~RelayClient() = default;

bool RelayClient::connect(const std::string &endpoint, const std::string &server_key)
{
    pImpl->start_threads();
    std::promise<bool> promise;
    auto future = promise.get_future();
    pImpl->enqueue(ConnectCmd{endpoint, server_key, std::move(promise)});
    return future.get();
}

void RelayClient::disconnect()
{
    if (!pImpl->is_connected.load(std::memory_order_acquire))
        return;
    std::promise<void> promise;
    auto future = promise.get_future();
    pImpl->enqueue(DisconnectCmd{std::move(promise)});
    future.get();
}

bool RelayClient::is_connected() const noexcept
{
    return pImpl->is_connected.load(std::memory_order_acquire);
}

void RelayClient::on_message(MessageHandler handler)
{
    std::lock_guard<std::mutex> lock(pImpl->handler_mutex);
    pImpl->handler = std::move(handler);
}

RelayClient::ReplyResult RelayClient::request(SignalType type, nlohmann::json body,
                                              SignalType expected)
{
    return request(type, std::move(body), expected, pImpl->options.reply_timeout);
}

RelayClient::ReplyResult RelayClient::request(SignalType type, nlohmann::json body,
                                              SignalType expected,
                                              std::chrono::milliseconds timeout)
{
    if (!is_connected())
        return ReplyResult::error(utils::TunnelError::NotConnected);

    const std::string ref = fmt::format("c{}", ++pImpl->next_ref);
    body["ref"] = ref;

    auto outcome = pImpl->ledger.await_response(kRelayLedgerKey, ref, timeout, [&] {
        if (!pImpl->is_connected.load(std::memory_order_acquire))
            return false;
        pImpl->enqueue(SendCmd{SignalMessage{type, std::move(body)}});
        return true;
    });

    if (outcome.is_error())
    {
        switch (outcome.error())
        {
        case utils::LedgerError::Timeout:
            LOGGER_WARN("RelayClient: no reply to '{}' within {} ms", to_wire(type),
                        timeout.count());
            return ReplyResult::error(utils::TunnelError::Timeout);
        case utils::LedgerError::TunnelDisconnected:
        case utils::LedgerError::Cancelled:
            return ReplyResult::error(utils::TunnelError::TunnelDisconnected);
        case utils::LedgerError::NotFound:
        case utils::LedgerError::DuplicateId:
            return ReplyResult::error(utils::TunnelError::ProtocolError);
        }
        return ReplyResult::error(utils::TunnelError::ProtocolError);
    }

    nlohmann::json &envelope = outcome.content();
    const auto reply_type = signal_type_from_wire(envelope.value("type", ""));
    nlohmann::json reply_body = std::move(envelope["body"]);
    if (reply_type == expected)
        return ReplyResult::ok(std::move(reply_body));

    if (reply_type == SignalType::Error)
    {
        const auto err = tunnel_error_from_body(reply_body);
        LOGGER_INFO("RelayClient: '{}' rejected: {} ({})", to_wire(type),
                    reply_body.value("message", ""), reply_body.value("code", ""));
        std::lock_guard<std::mutex> lock(pImpl->error_mutex);
        pImpl->last_error = std::move(reply_body);
        return ReplyResult::error(err);
    }

    LOGGER_WARN("RelayClient: expected '{}' in reply to '{}', got '{}'", to_wire(expected),
                to_wire(type), envelope.value("type", ""));
    return ReplyResult::error(utils::TunnelError::ProtocolError);
}

void RelayClient::send(SignalType type, nlohmann::json body)
{
    pImpl->enqueue(SendCmd{SignalMessage{type, std::move(body)}});
}

nlohmann::json RelayClient::last_error() const
{
    std::lock_guard<std::mutex> lock(pImpl->error_mutex);
    return pImpl->last_error;
}

// ---- instance role ----

RelayClient::ReplyResult RelayClient::register_instance(const std::string &instance_id,
                                                        nlohmann::json extra)
{
    nlohmann::json body = extra.is_object() ? std::move(extra) : nlohmann::json::object();
    body["instance_id"] = instance_id;
    if (!body.contains("protocol_versions"))
        body["protocol_versions"] = supported_versions();
    return request(SignalType::Register, std::move(body), SignalType::Registered);
}

RelayClient::ReplyResult RelayClient::create_claim(const std::string &requester_ref,
                                                   std::chrono::seconds ttl)
{
    nlohmann::json body = {{"requester_ref", requester_ref}};
    if (ttl.count() > 0)
        body["ttl_seconds"] = ttl.count();
    return request(SignalType::CreateClaim, std::move(body), SignalType::ClaimCreated);
}

RelayClient::ReplyResult RelayClient::consume_claim(int64_t claim_id, const std::string &device_id)
{
    return request(SignalType::ConsumeClaim, {{"claim_id", claim_id}, {"device_id", device_id}},
                   SignalType::ClaimConsumed);
}

void RelayClient::update_urls(const std::vector<std::string> &direct_urls)
{
    send(SignalType::UpdateUrls, {{"direct_urls", direct_urls}});
}

void RelayClient::send_response(const std::string &request_id, nlohmann::json response)
{
    if (!response.is_object())
        response = nlohmann::json{{"status", 200}, {"body", std::move(response)}};
    response["id"] = request_id;
    send(SignalType::Response, std::move(response));
}

// ---- client role ----

RelayClient::ReplyResult RelayClient::resolve_claim(const std::string &code)
{
    return request(SignalType::ResolveClaim, {{"code", normalize_code(code)}},
                   SignalType::ClaimResolved);
}

RelayClient::ReplyResult RelayClient::connect_instance(const std::string &instance_id)
{
    return request(SignalType::Connect,
                   {{"instance_id", instance_id}, {"protocol_versions", supported_versions()}},
                   SignalType::Connected);
}

RelayClient::ReplyResult RelayClient::relay_request(const std::string &instance_id,
                                                    const std::string &method,
                                                    const std::string &path,
                                                    nlohmann::json headers, nlohmann::json body,
                                                    std::chrono::milliseconds timeout)
{
    return request(SignalType::RelayRequest,
                   {{"instance_id", instance_id},
                    {"method", method},
                    {"path", path},
                    {"headers", std::move(headers)},
                    {"body", std::move(body)}},
                   SignalType::RelayResponse, timeout);
}

// ---- rendezvous ----

RelayClient::ReplyResult RelayClient::join(const std::string &ns, const std::string &code)
{
    auto joined = request(SignalType::Join, {{"namespace", ns}, {"code", code}}, SignalType::Joined);
    if (joined.is_ok() || joined.error() != utils::TunnelError::InvalidNamespace)
        return joined;

    const std::string previous =
        pImpl->namespaces.derive_namespace(normalize_code(code), current_epoch() - 1);
    if (previous == ns)
        return joined;
    LOGGER_INFO("RelayClient: namespace rejected, retrying with the previous epoch");
    return request(SignalType::Join, {{"namespace", previous}, {"code", code}},
                   SignalType::Joined);
}

void RelayClient::leave(const std::string &ns)
{
    send(SignalType::Leave, {{"namespace", ns}});
}

void RelayClient::send_signal(SignalType type, const std::string &ns, nlohmann::json payload)
{
    if (!is_webrtc_signal(type))
        throw std::invalid_argument(
            fmt::format("RelayClient::send_signal: '{}' is not a WebRTC signal", to_wire(type)));
    nlohmann::json body = payload.is_object() ? std::move(payload) : nlohmann::json::object();
    body["namespace"] = ns;
    send(type, std::move(body));
}

RelayClient::ReplyResult RelayClient::ping()
{
    return request(SignalType::Ping, nlohmann::json::object(), SignalType::Pong);
}

} // namespace mydiarelay::relay
