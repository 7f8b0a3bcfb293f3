#pragma once
/**
 * @file tunnel_session.hpp
 * @brief One negotiated peer link and the API/media protocols on top of it.
 *
 * States advance `connecting -> signaling_established -> webrtc_negotiating ->
 * data_channel_open -> serving -> closed`. The offering side creates the `mydia-api` and
 * `mydia-media` channels; the session is serving once both are open on this end.
 *
 * Inbound requests, auth and pairing are handled on the session's API worker thread and
 * stream requests on its media worker thread, so neither a slow handler nor a long stream
 * blocks the transport or the other channel. Malformed bodies are logged and dropped, or
 * answered with 400 when they carry a request id. Replies to requests this
 * side sent (response, auth_response, pairing_complete, response_header, binary frames,
 * end, error) are correlated on the transport thread through a PendingRequestLedger.
 *
 * close() is idempotent: the first call fails every outstanding request with
 * tunnel_disconnected, closes the peer connection and runs the close handler.
 */
#include "mydiarelay_utils_export.h"
#include "tunnel/peer_transport.hpp"
#include "tunnel/tunnel_message.hpp"
#include "utils/result.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mydiarelay::tunnel
{

class FileRangeReader;
class TunnelSessionImpl;

enum class TunnelState
{
    Connecting,
    SignalingEstablished,
    WebrtcNegotiating,
    DataChannelOpen,
    Serving,
    Closed
};

MYDIARELAY_UTILS_EXPORT const char *to_string(TunnelState state) noexcept;

/// What the pairing collaborator reports.
struct PairingOutcome
{
    std::optional<PairingGrant> grant;
    /// Set when `grant` is empty.
    std::string reason;
};

struct MediaStreamResult
{
    int status{0};
    nlohmann::json headers = nlohmann::json::object();
    uint64_t bytes_received{0};
    /// Message of an `error` control message; empty on success.
    std::string error_message;
};

class MYDIARELAY_UTILS_EXPORT TunnelSession
{
  public:
    /// May throw; a throwing handler yields a 500 response.
    using ApiHandler = std::function<ApiResponse(const ApiRequest &)>;
    /// @return The device id for a valid token.
    using TokenVerifier = std::function<std::optional<std::string>(const std::string &token)>;
    using PairingCompleter =
        std::function<PairingOutcome(const std::string &code, const DeviceAttrs &attrs)>;
    /// @return The media file's path for @p file_id, or nullopt if unknown.
    using MediaResolver =
        std::function<std::optional<std::filesystem::path>(const std::string &file_id)>;
    using ChunkSink = std::function<void(std::string_view payload)>;
    using CloseHandler = std::function<void(const std::string &session_id)>;

    template <typename T> using TunnelResult = utils::Result<T, utils::TunnelError>;

    /// The serving side's collaborators. A missing one makes the matching request fail.
    struct Handlers
    {
        ApiHandler api;
        TokenVerifier verify_token;
        PairingCompleter complete_pairing;
        MediaResolver resolve_media;
        std::shared_ptr<FileRangeReader> files;
        /// Reject `request` with 401 until `auth` or pairing succeeded.
        bool require_auth{false};
    };

    struct Options
    {
        std::chrono::milliseconds negotiation_timeout{kDefaultNegotiationTimeout};
        std::chrono::milliseconds request_timeout{kDefaultRequestTimeout};
    };

    /// @throws std::invalid_argument if @p peer is null.
    static std::shared_ptr<TunnelSession> create(std::string session_id,
                                                 std::shared_ptr<PeerConnection> peer,
                                                 Handlers handlers, Options options);
    static std::shared_ptr<TunnelSession> create(std::string session_id,
                                                 std::shared_ptr<PeerConnection> peer);

    ~TunnelSession();

    TunnelSession(const TunnelSession &) = delete;
    TunnelSession &operator=(const TunnelSession &) = delete;

    [[nodiscard]] const std::string &session_id() const noexcept;
    [[nodiscard]] TunnelState state() const;
    PeerConnection &peer();

    void mark_signaling_established();

    /// @brief Offering side: creates both channels and the offer.
    void open_channels();

    /**
     * @brief Blocks until serving, closed, or the negotiation timeout.
     * @return NegotiationFailed on timeout (the session is then closed),
     *         TunnelDisconnected if it closed first.
     */
    utils::Status<utils::TunnelError> wait_until_serving();

    void on_closed(CloseHandler handler);

    // ---- calls to the peer (any thread except the transport's) ----

    /// @brief Sends a `request` with the next `req-N` id and waits for its `response`.
    TunnelResult<ApiResponse> request(const std::string &method, const std::string &path,
                                      nlohmann::json headers = nlohmann::json::object(),
                                      nlohmann::json body = nullptr);

    /// @return The device id; Unauthorized if the peer rejected the token. Concurrent calls
    ///         are sent one after another.
    TunnelResult<std::string> authenticate(const std::string &device_token);

    /// @return ClaimRejected if pairing failed; last_error() holds the peer's message.
    ///         Concurrent calls are sent one after another.
    TunnelResult<PairingGrant> pair(const std::string &code, const DeviceAttrs &attrs);

    /**
     * @brief Requests bytes [range_start, range_end] of @p file_id on the media channel.
     *
     * @p sink receives each chunk in order, on the transport thread. A media error
     * (unknown file, missing on disk) is not a TunnelError: it is reported in the result's
     * status and error_message.
     */
    TunnelResult<MediaStreamResult> stream_media(const std::string &file_id,
                                                 uint64_t range_start,
                                                 std::optional<uint64_t> range_end,
                                                 ChunkSink sink,
                                                 std::chrono::milliseconds timeout);

    [[nodiscard]] bool authenticated() const;
    [[nodiscard]] std::string device_id() const;
    [[nodiscard]] std::string last_error() const;
    [[nodiscard]] size_t pending_requests() const;

    void close();

  private:
    explicit TunnelSession(std::unique_ptr<TunnelSessionImpl> impl);

#if defined(_MSC_VER)
#pragma warning(suppress : 4251)
#endif
    std::shared_ptr<TunnelSessionImpl> pImpl;
};

} // namespace mydiarelay::tunnel
