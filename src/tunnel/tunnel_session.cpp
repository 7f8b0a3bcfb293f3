#include "mdr_service.hpp"
#include "relay/claim.hpp"
#include "relay/pending_request_ledger.hpp"
#include "tunnel/file_range_reader.hpp"
#include "tunnel/media_frame.hpp"
#include "tunnel/tunnel_session.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>

namespace mydiarelay::tunnel
{

using utils::LedgerError;
using utils::TunnelError;

const char *to_string(TunnelState state) noexcept
{
    switch (state)
    {
    case TunnelState::Connecting:
        return "connecting";
    case TunnelState::SignalingEstablished:
        return "signaling_established";
    case TunnelState::WebrtcNegotiating:
        return "webrtc_negotiating";
    case TunnelState::DataChannelOpen:
        return "data_channel_open";
    case TunnelState::Serving:
        return "serving";
    case TunnelState::Closed:
        return "closed";
    }
    return "unknown";
}

namespace
{
// Ledger ids for the exchanges that carry no id of their own. Each kind is serialized per
// session, so one of each is in flight at a time.
constexpr const char *kAuthLedgerId = "auth";
constexpr const char *kPairingLedgerId = "pairing";

TunnelError from_ledger_error(LedgerError err) noexcept
{
    switch (err)
    {
    case LedgerError::Timeout:
        return TunnelError::Timeout;
    case LedgerError::TunnelDisconnected:
    case LedgerError::Cancelled:
        return TunnelError::TunnelDisconnected;
    case LedgerError::NotFound:
    case LedgerError::DuplicateId:
        return TunnelError::ProtocolError;
    }
    return TunnelError::ProtocolError;
}

struct Inbound
{
    bool media{false};
    TunnelMessage message;
};

/// One worker thread with its own queue. The API and media channels each get one.
struct InboundQueue
{
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<Inbound> items;
    bool stop{false};
    std::thread thread;

    void push(Inbound inbound)
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            items.push_back(std::move(inbound));
        }
        cv.notify_one();
    }

    void shutdown()
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            stop = true;
        }
        cv.notify_one();
    }

    void join()
    {
        if (!thread.joinable())
            return;
        if (thread.get_id() == std::this_thread::get_id())
            thread.detach();
        else
            thread.join();
    }
};

struct StreamState
{
    TunnelSession::ChunkSink sink;
    std::atomic<uint64_t> bytes{0};
    std::mutex mutex;
    int status{0};
    nlohmann::json headers = nlohmann::json::object();
};
} // namespace

// ============================================================================
// TunnelSessionImpl
// ============================================================================

class TunnelSessionImpl : public std::enable_shared_from_this<TunnelSessionImpl>
{
  public:
    TunnelSessionImpl(std::string id, std::shared_ptr<PeerConnection> pc,
                      TunnelSession::Handlers h, TunnelSession::Options o)
        : session_id(std::move(id)), peer(std::move(pc)), handlers(std::move(h)), options(o)
    {
    }

    ~TunnelSessionImpl()
    {
        m_api_queue.join();
        m_media_queue.join();
    }

    const std::string session_id;
    const std::shared_ptr<PeerConnection> peer;
    const TunnelSession::Handlers handlers;
    const TunnelSession::Options options;
    relay::PendingRequestLedger ledger;
    std::atomic<uint64_t> next_request{0};
    std::atomic<uint64_t> next_stream{0};
    std::mutex auth_exchange;
    std::mutex pairing_exchange;

    void start()
    {
        std::weak_ptr<TunnelSessionImpl> weak = weak_from_this();
        peer->on_data_channel([weak](std::shared_ptr<DataChannel> channel) {
            if (auto self = weak.lock())
                self->attach(std::move(channel));
        });
        peer->on_state_change([weak](PeerState state) {
            if (auto self = weak.lock())
                self->on_peer_state(state);
        });
        // The workers keep the session alive until close() stops them.
        m_api_queue.thread =
            std::thread([self = shared_from_this()] { self->worker_loop(self->m_api_queue); });
        m_media_queue.thread =
            std::thread([self = shared_from_this()] { self->worker_loop(self->m_media_queue); });
    }

    // ── State ────────────────────────────────────────────────────────────────

    TunnelState state() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_state;
    }

    void advance(TunnelState to)
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_state == TunnelState::Closed || to <= m_state)
                return;
            m_state = to;
        }
        LOGGER_DEBUG("TunnelSession[{}]: {}", session_id, to_string(to));
        m_state_cv.notify_all();
    }

    utils::Status<TunnelError> wait_until_serving()
    {
        using S = utils::Status<TunnelError>;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_state_cv.wait_for(lock, options.negotiation_timeout, [this] {
                return m_state == TunnelState::Serving || m_state == TunnelState::Closed;
            });
            if (m_state == TunnelState::Serving)
                return S::ok({});
            if (m_state == TunnelState::Closed)
                return S::error(TunnelError::TunnelDisconnected);
        }
        LOGGER_WARN("TunnelSession[{}]: data channels not open after {} ms, giving up",
                    session_id, options.negotiation_timeout.count());
        close();
        return S::error(TunnelError::NegotiationFailed);
    }

    void open_channels()
    {
        attach(peer->create_data_channel(kApiChannelLabel));
        attach(peer->create_data_channel(kMediaChannelLabel));
        advance(TunnelState::WebrtcNegotiating);
        peer->create_offer();
    }

    void set_close_handler(TunnelSession::CloseHandler handler)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_on_closed = std::move(handler);
    }

    void close()
    {
        if (m_closed.exchange(true, std::memory_order_acq_rel))
            return;
        auto keep_alive = shared_from_this();

        TunnelSession::CloseHandler on_closed;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_state = TunnelState::Closed;
            on_closed = m_on_closed;
        }
        m_state_cv.notify_all();
        m_api_queue.shutdown();
        m_media_queue.shutdown();

        const size_t failed = ledger.fail_all(session_id, LedgerError::TunnelDisconnected);
        m_streams.clear();
        peer->close();
        LOGGER_INFO("TunnelSession[{}]: closed, {} pending request(s) failed", session_id, failed);

        if (on_closed)
        {
            try
            {
                on_closed(session_id);
            }
            catch (const std::exception &e)
            {
                LOGGER_ERROR("TunnelSession[{}]: close handler threw: {}", session_id, e.what());
            }
        }
    }

    bool closed() const noexcept { return m_closed.load(std::memory_order_acquire); }

    // ── Session info ─────────────────────────────────────────────────────────

    bool authenticated() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_authenticated;
    }

    std::string device_id() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_device_id;
    }

    void set_device(const std::string &device_id)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_device_id = device_id;
        m_authenticated = true;
    }

    std::string last_error() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_last_error;
    }

    void set_last_error(std::string message)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_last_error = std::move(message);
    }

    // ── Sending ──────────────────────────────────────────────────────────────

    bool send_text(bool media, const TunnelMessage &msg)
    {
        auto channel = channel_for(media);
        if (!channel || !channel->is_open())
        {
            LOGGER_DEBUG("TunnelSession[{}]: '{}' dropped, channel not open", session_id,
                         to_wire(msg.type));
            return false;
        }
        return channel->send_text(encode_message(msg));
    }

    bool send_frame(const std::string &request_id, std::string_view payload)
    {
        auto frame = encode_media_frame(request_id, payload);
        if (frame.is_error())
        {
            LOGGER_ERROR("TunnelSession[{}]: cannot frame '{}': {}", session_id, request_id,
                         utils::to_string(frame.error()));
            return false;
        }
        auto channel = channel_for(true);
        return channel && channel->send_binary(frame.content());
    }

    // ── Outgoing calls ───────────────────────────────────────────────────────

    /// Sends @p msg and waits for the ledger entry @p id to be resolved.
    utils::Result<nlohmann::json, TunnelError> call(bool media, const std::string &id,
                                                    const TunnelMessage &msg,
                                                    std::chrono::milliseconds timeout)
    {
        using R = utils::Result<nlohmann::json, TunnelError>;
        if (state() != TunnelState::Serving)
            return R::error(TunnelError::NotConnected);

        auto outcome = ledger.await_response(session_id, id, timeout,
                                             [&] { return send_text(media, msg); });
        if (outcome.is_error())
        {
            if (outcome.error() == LedgerError::Timeout)
                LOGGER_WARN("TunnelSession[{}]: no reply to '{}' within {} ms", session_id, id,
                            timeout.count());
            return R::error(from_ledger_error(outcome.error()));
        }
        return R::ok(std::move(outcome).content());
    }

    utils::Result<MediaStreamResult, TunnelError>
    stream_media(const std::string &file_id, uint64_t range_start,
                 std::optional<uint64_t> range_end, TunnelSession::ChunkSink sink,
                 std::chrono::milliseconds timeout)
    {
        using R = utils::Result<MediaStreamResult, TunnelError>;
        const std::string id = fmt::format("media-{}", ++next_stream);
        auto stream = std::make_shared<StreamState>();
        stream->sink = std::move(sink);
        m_streams.insert_or_assign(id, stream);

        auto reply = call(true, id, make_stream_request({id, file_id, range_start, range_end}),
                          timeout);
        m_streams.erase(id);
        if (reply.is_error())
            return R::error(reply.error());

        const nlohmann::json &body = reply.content();
        MediaStreamResult result;
        result.status = int_field(body, "status", 0);
        result.headers = object_field(body, "headers");
        result.error_message = string_field(body, "message");
        result.bytes_received = stream->bytes.load(std::memory_order_acquire);
        return R::ok(std::move(result));
    }

  private:
    mutable std::mutex m_mutex;
    std::condition_variable m_state_cv;
    TunnelState m_state{TunnelState::Connecting};
    std::shared_ptr<DataChannel> m_api;
    std::shared_ptr<DataChannel> m_media;
    bool m_authenticated{false};
    std::string m_device_id;
    std::string m_last_error;
    TunnelSession::CloseHandler m_on_closed;
    std::atomic<bool> m_closed{false};

    InboundQueue m_api_queue;
    InboundQueue m_media_queue;

    utils::StripedMap<std::string, std::shared_ptr<StreamState>> m_streams;

    std::shared_ptr<DataChannel> channel_for(bool media) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return media ? m_media : m_api;
    }

    // ── Transport callbacks ──────────────────────────────────────────────────

    void attach(std::shared_ptr<DataChannel> channel)
    {
        const std::string label = channel->label();
        const bool media = label == kMediaChannelLabel;
        if (!media && label != kApiChannelLabel)
        {
            LOGGER_WARN("TunnelSession[{}]: ignoring unexpected channel '{}'", session_id, label);
            return;
        }
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            (media ? m_media : m_api) = channel;
        }

        std::weak_ptr<TunnelSessionImpl> weak = weak_from_this();
        channel->on_text([weak, media](std::string text) {
            if (auto self = weak.lock())
                self->on_text(media, text);
        });
        if (media)
        {
            channel->on_binary([weak](std::string data) {
                if (auto self = weak.lock())
                    self->on_frame(data);
            });
        }
        channel->on_open([weak] {
            if (auto self = weak.lock())
                self->channel_opened();
        });
        channel->on_closed([weak, label] {
            if (auto self = weak.lock())
            {
                LOGGER_INFO("TunnelSession[{}]: channel '{}' closed", self->session_id, label);
                self->close();
            }
        });
        if (channel->is_open())
            channel_opened();
    }

    void channel_opened()
    {
        auto api = channel_for(false);
        auto media = channel_for(true);
        const bool api_open = api && api->is_open();
        const bool media_open = media && media->is_open();
        if (api_open && media_open)
            advance(TunnelState::Serving);
        else if (api_open || media_open)
            advance(TunnelState::DataChannelOpen);
    }

    void on_peer_state(PeerState state)
    {
        switch (state)
        {
        case PeerState::New:
            break;
        case PeerState::Connecting:
            advance(TunnelState::WebrtcNegotiating);
            break;
        case PeerState::Connected:
            LOGGER_DEBUG("TunnelSession[{}]: peer connected", session_id);
            break;
        case PeerState::Disconnected:
        case PeerState::Failed:
        case PeerState::Closed:
            if (!closed())
            {
                LOGGER_INFO("TunnelSession[{}]: peer connection {}", session_id,
                            tunnel::to_string(state));
                close();
            }
            break;
        }
    }

    void on_text(bool media, const std::string &text)
    {
        try
        {
            dispatch(media, text);
        }
        catch (const nlohmann::json::exception &e)
        {
            LOGGER_WARN("TunnelSession[{}]: bad message on {}: {}", session_id,
                        media ? kMediaChannelLabel : kApiChannelLabel, e.what());
        }
    }

    void dispatch(bool media, const std::string &text)
    {
        auto decoded = decode_message(text);
        if (decoded.is_error())
        {
            LOGGER_WARN("TunnelSession[{}]: malformed message on {}: {}", session_id,
                        media ? kMediaChannelLabel : kApiChannelLabel,
                        utils::to_string(decoded.error()));
            send_text(media, TunnelMessage{TunnelMessageType::Error,
                                           {{"message", "invalid_message"}}});
            return;
        }
        TunnelMessage msg = std::move(decoded).content();

        switch (msg.type)
        {
        case TunnelMessageType::Response:
        {
            const std::string id = id_field(msg.body, "id");
            resolve(id, std::move(msg.body));
            return;
        }
        case TunnelMessageType::AuthResponse:
            resolve(kAuthLedgerId, std::move(msg.body));
            return;
        case TunnelMessageType::PairingComplete:
            resolve(kPairingLedgerId, std::move(msg.body));
            return;
        case TunnelMessageType::ResponseHeader:
            stream_header(msg.body);
            return;
        case TunnelMessageType::End:
            stream_finished(msg.body, false);
            return;
        case TunnelMessageType::Error:
            if (media)
            {
                stream_finished(msg.body, true);
            }
            else if (ledger.lookup(kPairingLedgerId).is_ok())
            {
                resolve(kPairingLedgerId,
                        {{"success", false}, {"error", string_field(msg.body, "message")}});
            }
            else
            {
                LOGGER_WARN("TunnelSession[{}]: peer reported '{}'", session_id,
                            string_field(msg.body, "message"));
            }
            return;
        case TunnelMessageType::Pong:
            return;
        case TunnelMessageType::Request:
        case TunnelMessageType::Auth:
        case TunnelMessageType::ClaimCode:
        case TunnelMessageType::Ping:
        case TunnelMessageType::StreamRequest:
            (media ? m_media_queue : m_api_queue).push(Inbound{media, std::move(msg)});
            return;
        }
    }

    void resolve(const std::string &id, nlohmann::json body)
    {
        if (ledger.resolve(id, std::move(body)).is_error())
            LOGGER_DEBUG("TunnelSession[{}]: late or unknown reply '{}'", session_id, id);
    }

    void stream_header(const nlohmann::json &body)
    {
        auto stream = m_streams.find(id_field(body, "request_id"));
        if (!stream)
            return;
        std::lock_guard<std::mutex> lock((*stream)->mutex);
        (*stream)->status = int_field(body, "status", 0);
        (*stream)->headers = object_field(body, "headers");
    }

    void on_frame(const std::string &data)
    {
        auto frame = decode_media_frame(data);
        if (frame.is_error())
        {
            LOGGER_WARN("TunnelSession[{}]: bad media frame: {}", session_id,
                        utils::to_string(frame.error()));
            return;
        }
        const MediaFrameView &view = frame.content();
        auto stream = m_streams.find(std::string(view.request_id));
        if (!stream)
            return;
        (*stream)->bytes.fetch_add(view.payload.size(), std::memory_order_acq_rel);
        if (!(*stream)->sink)
            return;
        try
        {
            (*stream)->sink(view.payload);
        }
        catch (const std::exception &e)
        {
            LOGGER_ERROR("TunnelSession[{}]: media sink threw: {}", session_id, e.what());
        }
    }

    void stream_finished(const nlohmann::json &body, bool failed)
    {
        const std::string id = id_field(body, "request_id");
        auto stream = m_streams.find(id);
        if (!stream)
        {
            LOGGER_DEBUG("TunnelSession[{}]: '{}' for unknown stream '{}'", session_id,
                         failed ? "error" : "end", id);
            return;
        }
        nlohmann::json result;
        {
            std::lock_guard<std::mutex> lock((*stream)->mutex);
            result = {{"status", failed ? int_field(body, "status", 500) : (*stream)->status},
                      {"headers", (*stream)->headers}};
        }
        if (failed)
            result["message"] = string_field(body, "message");
        resolve(id, std::move(result));
    }

    // ── Worker ───────────────────────────────────────────────────────────────

    void worker_loop(InboundQueue &queue)
    {
        while (true)
        {
            std::deque<Inbound> batch;
            {
                std::unique_lock<std::mutex> lock(queue.mutex);
                queue.cv.wait(lock, [&queue] { return queue.stop || !queue.items.empty(); });
                if (queue.stop)
                    return;
                std::swap(batch, queue.items);
            }
            for (auto &inbound : batch)
            {
                if (closed())
                    return;
                try
                {
                    process(inbound);
                }
                catch (const nlohmann::json::exception &e)
                {
                    LOGGER_WARN("TunnelSession[{}]: dropping malformed '{}': {}", session_id,
                                to_wire(inbound.message.type), e.what());
                }
            }
        }
    }

    void process(Inbound &inbound)
    {
        TunnelMessage &msg = inbound.message;
        switch (msg.type)
        {
        case TunnelMessageType::Request:
            serve_request(msg.body);
            return;
        case TunnelMessageType::Auth:
            serve_auth(msg.body);
            return;
        case TunnelMessageType::ClaimCode:
            serve_pairing(msg.body);
            return;
        case TunnelMessageType::Ping:
            send_text(inbound.media, TunnelMessage{TunnelMessageType::Pong, {}});
            return;
        case TunnelMessageType::StreamRequest:
            serve_stream(stream_request_from_body(msg.body));
            return;
        case TunnelMessageType::Response:
        case TunnelMessageType::AuthResponse:
        case TunnelMessageType::PairingComplete:
        case TunnelMessageType::Pong:
        case TunnelMessageType::ResponseHeader:
        case TunnelMessageType::End:
        case TunnelMessageType::Error:
            LOGGER_WARN("TunnelSession[{}]: unexpected '{}' on the worker", session_id,
                        to_wire(msg.type));
            return;
        }
    }

    void serve_request(const nlohmann::json &body)
    {
        ApiRequest req = request_from_body(body);
        if (req.id.empty())
        {
            LOGGER_WARN("TunnelSession[{}]: request without id dropped", session_id);
            return;
        }
        req.device_id = device_id();

        ApiResponse resp;
        if (!well_formed_request(body))
        {
            LOGGER_WARN("TunnelSession[{}]: malformed request '{}' ({})", session_id, req.id,
                        utils::to_string(TunnelError::ProtocolError));
            resp.status = 400;
            resp.body = {{"error", "invalid_request"}};
        }
        else if (handlers.require_auth && !authenticated())
        {
            LOGGER_WARN("TunnelSession[{}]: {} {} rejected, not authenticated", session_id,
                        req.method, req.path);
            resp.status = 401;
            resp.body = {{"error", "Authentication required"}};
        }
        else if (!handlers.api)
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
                LOGGER_ERROR("TunnelSession[{}]: {} {} failed: {}", session_id, req.method,
                             req.path, e.what());
                resp = ApiResponse{};
                resp.status = 500;
                resp.body = "Internal Error";
            }
        }
        resp.id = req.id;
        LOGGER_DEBUG("TunnelSession[{}]: {} {} -> {}", session_id, req.method, req.path,
                     resp.status);
        send_text(false, make_response(resp));
    }

    void serve_auth(const nlohmann::json &body)
    {
        const std::string token = string_field(body, "device_token");
        std::optional<std::string> device;
        if (handlers.verify_token && !token.empty())
        {
            try
            {
                device = handlers.verify_token(token);
            }
            catch (const std::exception &e)
            {
                LOGGER_ERROR("TunnelSession[{}]: token verification threw: {}", session_id,
                             e.what());
            }
        }
        if (!device)
        {
            LOGGER_WARN("TunnelSession[{}]: auth failed", session_id);
            send_text(false, TunnelMessage{TunnelMessageType::AuthResponse,
                                           {{"status", "error"}, {"message", "Invalid token"}}});
            return;
        }
        set_device(*device);
        LOGGER_INFO("TunnelSession[{}]: device '{}' authenticated", session_id, *device);
        send_text(false, TunnelMessage{TunnelMessageType::AuthResponse,
                                       {{"status", "ok"}, {"device_id", *device}}});
    }

    void serve_pairing(const nlohmann::json &body)
    {
        const auto code = body.find("code");
        const auto name = body.find("device_name");
        const auto platform = body.find("platform");
        if (code == body.end() || !code->is_string() || name == body.end() ||
            !name->is_string() || platform == body.end() || !platform->is_string())
        {
            LOGGER_WARN("TunnelSession[{}]: claim_code without code/device_name/platform",
                        session_id);
            send_text(false, make_pairing_failure("missing_required_keys"));
            return;
        }
        if (!handlers.complete_pairing)
        {
            send_text(false, make_pairing_failure("pairing_unavailable"));
            return;
        }

        const std::string normalized = relay::normalize_code(code->get<std::string>());
        const DeviceAttrs attrs{name->get<std::string>(), platform->get<std::string>()};
        PairingOutcome outcome;
        try
        {
            outcome = handlers.complete_pairing(normalized, attrs);
        }
        catch (const std::exception &e)
        {
            LOGGER_ERROR("TunnelSession[{}]: pairing threw: {}", session_id, e.what());
            outcome.reason = e.what();
        }

        if (!outcome.grant)
        {
            LOGGER_WARN("TunnelSession[{}]: pairing '{}' failed: {}", session_id, attrs.device_name,
                        outcome.reason);
            send_text(false, make_pairing_failure(outcome.reason));
            return;
        }
        set_device(outcome.grant->device_id);
        LOGGER_INFO("TunnelSession[{}]: paired device '{}' ({}, {})", session_id,
                    outcome.grant->device_id, attrs.device_name, attrs.platform);
        send_text(false, make_pairing_success(*outcome.grant));
    }

    void serve_stream(const StreamRequest &req)
    {
        if (req.request_id.empty())
        {
            LOGGER_WARN("TunnelSession[{}]: stream_request without request_id", session_id);
            return;
        }
        auto fail = [&](int status, std::string_view message) {
            LOGGER_WARN("TunnelSession[{}]: media '{}' ({}): {}", session_id, req.file_id,
                        req.request_id, message);
            send_text(true, make_stream_error(req.request_id, status, message));
        };

        std::optional<std::filesystem::path> path;
        if (handlers.resolve_media && handlers.files)
        {
            try
            {
                path = handlers.resolve_media(req.file_id);
            }
            catch (const std::exception &e)
            {
                LOGGER_ERROR("TunnelSession[{}]: media lookup threw: {}", session_id, e.what());
            }
        }
        if (!path)
            return fail(404, "File not found");

        auto size = handlers.files->file_size(*path);
        if (size.is_error())
        {
            if (size.error() == utils::MediaError::OutsideRoot)
                return fail(403, "Access denied");
            return fail(404, "File missing on disk");
        }
        const uint64_t file_size = size.content();
        if (file_size == 0 || req.range_start >= file_size)
            return fail(416, "Range not satisfiable");
        const uint64_t effective_end =
            std::min(req.range_end.value_or(file_size - 1), file_size - 1);
        if (effective_end < req.range_start)
            return fail(416, "Range not satisfiable");
        const uint64_t length = effective_end - req.range_start + 1;

        send_text(true, TunnelMessage{TunnelMessageType::ResponseHeader,
                                      {{"request_id", req.request_id},
                                       {"status", 206},
                                       {"headers",
                                        {{"Content-Type", FileRangeReader::content_type(*path)},
                                         {"Content-Length", std::to_string(length)},
                                         {"Content-Range",
                                          fmt::format("bytes {}-{}/{}", req.range_start,
                                                      effective_end, file_size)},
                                         {"Accept-Ranges", "bytes"}}}}});

        uint64_t offset = req.range_start;
        uint64_t remaining = length;
        while (remaining > 0)
        {
            if (closed())
                return;
            const size_t chunk = static_cast<size_t>(std::min<uint64_t>(remaining, kMediaChunkSize));
            auto data = handlers.files->read_file_range(*path, offset, chunk);
            if (data.is_error() || data.content().empty())
                return fail(500, "Read failed");
            if (!send_frame(req.request_id, data.content()))
            {
                LOGGER_WARN("TunnelSession[{}]: media channel refused a frame of '{}'",
                            session_id, req.request_id);
                return;
            }
            offset += data.content().size();
            remaining -= data.content().size();
        }
        send_text(true, TunnelMessage{TunnelMessageType::End, {{"request_id", req.request_id}}});
        LOGGER_DEBUG("TunnelSession[{}]: streamed {} bytes of '{}'", session_id, length,
                     req.file_id);
    }
};

// ============================================================================
// TunnelSession
// ============================================================================

TunnelSession::TunnelSession(std::unique_ptr<TunnelSessionImpl> impl) : pImpl(std::move(impl)) {}

std::shared_ptr<TunnelSession> TunnelSession::create(std::string session_id,
                                                     std::shared_ptr<PeerConnection> peer,
                                                     Handlers handlers, Options options)
{
    if (!peer)
        throw std::invalid_argument("TunnelSession: peer connection is null");
    std::shared_ptr<TunnelSession> session(new TunnelSession(std::make_unique<TunnelSessionImpl>(
        std::move(session_id), std::move(peer), std::move(handlers), options)));
    session->pImpl->start();
    return session;
}

std::shared_ptr<TunnelSession> TunnelSession::create(std::string session_id,
                                                     std::shared_ptr<PeerConnection> peer)
{
    return create(std::move(session_id), std::move(peer), Handlers{}, Options{});
}

TunnelSession::~TunnelSession()
{
    pImpl->close();
}

const std::string &TunnelSession::session_id() const noexcept
{
    return pImpl->session_id;
}

TunnelState TunnelSession::state() const
{
    return pImpl->state();
}

PeerConnection &TunnelSession::peer()
{
    return *pImpl->peer;
}

void TunnelSession::mark_signaling_established()
{
    pImpl->advance(TunnelState::SignalingEstablished);
}

void TunnelSession::open_channels()
{
    pImpl->open_channels();
}

utils::Status<utils::TunnelError> TunnelSession::wait_until_serving()
{
    return pImpl->wait_until_serving();
}

void TunnelSession::on_closed(CloseHandler handler)
{
    pImpl->set_close_handler(std::move(handler));
}

TunnelSession::TunnelResult<ApiResponse> TunnelSession::request(const std::string &method,
                                                                const std::string &path,
                                                                nlohmann::json headers,
                                                                nlohmann::json body)
{
    ApiRequest req;
    req.id = fmt::format("req-{}", ++pImpl->next_request);
    req.method = method;
    req.path = path;
    req.headers = headers.is_object() ? std::move(headers) : nlohmann::json::object();
    req.body = std::move(body);

    auto reply = pImpl->call(false, req.id, make_request(req), pImpl->options.request_timeout);
    if (reply.is_error())
        return TunnelResult<ApiResponse>::error(reply.error());
    return TunnelResult<ApiResponse>::ok(response_from_body(reply.content()));
}

TunnelSession::TunnelResult<std::string>
TunnelSession::authenticate(const std::string &device_token)
{
    std::lock_guard<std::mutex> exchange(pImpl->auth_exchange);
    auto reply = pImpl->call(false, kAuthLedgerId,
                             TunnelMessage{TunnelMessageType::Auth, {{"device_token", device_token}}},
                             pImpl->options.request_timeout);
    if (reply.is_error())
        return TunnelResult<std::string>::error(reply.error());

    const nlohmann::json &body = reply.content();
    if (string_field(body, "status") != "ok")
    {
        pImpl->set_last_error(string_field(body, "message", "Invalid token"));
        return TunnelResult<std::string>::error(TunnelError::Unauthorized);
    }
    std::string device = string_field(body, "device_id");
    pImpl->set_device(device);
    return TunnelResult<std::string>::ok(std::move(device));
}

TunnelSession::TunnelResult<PairingGrant> TunnelSession::pair(const std::string &code,
                                                              const DeviceAttrs &attrs)
{
    std::lock_guard<std::mutex> exchange(pImpl->pairing_exchange);
    auto reply = pImpl->call(false, kPairingLedgerId,
                             TunnelMessage{TunnelMessageType::ClaimCode,
                                           {{"code", relay::normalize_code(code)},
                                            {"device_name", attrs.device_name},
                                            {"platform", attrs.platform}}},
                             pImpl->options.request_timeout);
    if (reply.is_error())
        return TunnelResult<PairingGrant>::error(reply.error());

    const nlohmann::json &body = reply.content();
    if (!bool_field(body, "success", false))
    {
        pImpl->set_last_error(string_field(body, "error", "Pairing failed"));
        return TunnelResult<PairingGrant>::error(TunnelError::ClaimRejected);
    }
    PairingGrant grant{string_field(body, "device_id"), string_field(body, "media_token"),
                       string_field(body, "access_token"), string_field(body, "device_token")};
    pImpl->set_device(grant.device_id);
    return TunnelResult<PairingGrant>::ok(std::move(grant));
}

TunnelSession::TunnelResult<MediaStreamResult>
TunnelSession::stream_media(const std::string &file_id, uint64_t range_start,
                            std::optional<uint64_t> range_end, ChunkSink sink,
                            std::chrono::milliseconds timeout)
{
    return pImpl->stream_media(file_id, range_start, range_end, std::move(sink), timeout);
}

bool TunnelSession::authenticated() const
{
    return pImpl->authenticated();
}

std::string TunnelSession::device_id() const
{
    return pImpl->device_id();
}

std::string TunnelSession::last_error() const
{
    return pImpl->last_error();
}

size_t TunnelSession::pending_requests() const
{
    return pImpl->ledger.count();
}

void TunnelSession::close()
{
    pImpl->close();
}

} // namespace mydiarelay::tunnel
