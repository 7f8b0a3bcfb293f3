#include "mdr_service.hpp"
#include "tunnel/loopback_transport.hpp"

#include <charconv>
#include <optional>
#include <string_view>
#include <vector>

namespace mydiarelay::tunnel
{

namespace
{
constexpr std::string_view kSdpPrefix = "loopback:";

std::optional<uint64_t> id_from_sdp(std::string_view sdp)
{
    if (sdp.substr(0, kSdpPrefix.size()) != kSdpPrefix)
        return std::nullopt;
    const std::string_view digits = sdp.substr(kSdpPrefix.size());
    uint64_t id = 0;
    const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), id);
    if (ec != std::errc{} || ptr != digits.data() + digits.size())
        return std::nullopt;
    return id;
}
} // namespace

// ============================================================================
// LoopbackDataChannel
// ============================================================================

class LoopbackDataChannel final : public DataChannel
{
  public:
    explicit LoopbackDataChannel(std::string label) : m_label(std::move(label)) {}

    std::string label() const override { return m_label; }
    bool is_open() const override { return m_open.load(std::memory_order_acquire); }

    bool send_text(std::string_view text) override { return send(false, text); }
    bool send_binary(std::string_view bytes) override { return send(true, bytes); }

    void close() override
    {
        if (m_closed.exchange(true, std::memory_order_acq_rel))
            return;
        const bool was_open = m_open.exchange(false, std::memory_order_acq_rel);
        if (was_open)
            fire(m_on_closed);
        if (auto remote = m_remote.lock())
            remote->close();
    }

    void on_open(std::function<void()> cb) override { set(m_on_open, std::move(cb)); }
    void on_closed(std::function<void()> cb) override { set(m_on_closed, std::move(cb)); }
    void on_text(MessageHandler cb) override { set(m_on_text, std::move(cb)); }
    void on_binary(MessageHandler cb) override { set(m_on_binary, std::move(cb)); }

    void pair_with(const std::shared_ptr<LoopbackDataChannel> &remote) { m_remote = remote; }

    void open()
    {
        if (m_closed.load(std::memory_order_acquire))
            return;
        if (!m_open.exchange(true, std::memory_order_acq_rel))
            fire(m_on_open);
    }

  private:
    bool send(bool binary, std::string_view data)
    {
        if (!is_open())
            return false;
        auto remote = m_remote.lock();
        if (!remote)
            return false;
        remote->deliver(binary, std::string(data));
        return true;
    }

    void deliver(bool binary, std::string data)
    {
        MessageHandler cb;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            cb = binary ? m_on_binary : m_on_text;
        }
        if (cb)
            cb(std::move(data));
    }

    template <typename F> void set(F &slot, F cb)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        slot = std::move(cb);
    }

    void fire(const std::function<void()> &slot)
    {
        std::function<void()> cb;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            cb = slot;
        }
        if (cb)
            cb();
    }

    const std::string m_label;
    std::atomic<bool> m_open{false};
    std::atomic<bool> m_closed{false};
    std::weak_ptr<LoopbackDataChannel> m_remote;

    std::mutex m_mutex;
    std::function<void()> m_on_open;
    std::function<void()> m_on_closed;
    MessageHandler m_on_text;
    MessageHandler m_on_binary;
};

// ============================================================================
// LoopbackPeerConnection
// ============================================================================

class LoopbackPeerConnection final : public PeerConnection,
                                     public std::enable_shared_from_this<LoopbackPeerConnection>
{
  public:
    LoopbackPeerConnection(uint64_t id, std::weak_ptr<LoopbackNetwork> network)
        : m_id(id), m_network(std::move(network))
    {
    }

    ~LoopbackPeerConnection() override { close(); }

    std::string sdp() const { return fmt::format("{}{}", kSdpPrefix, m_id); }

    std::shared_ptr<DataChannel> create_data_channel(const std::string &label) override
    {
        auto channel = std::make_shared<LoopbackDataChannel>(label);
        std::lock_guard<std::mutex> lock(m_mutex);
        m_local_channels.push_back(channel);
        return channel;
    }

    void create_offer() override
    {
        change_state(PeerState::Connecting);
        announce("offer");
    }

    void set_remote_description(const SessionDescription &desc) override
    {
        auto network = m_network.lock();
        auto peer = network ? network->find(desc.sdp) : nullptr;
        if (!peer)
        {
            LOGGER_WARN("LoopbackPeerConnection[{}]: unknown remote description", m_id);
            change_state(PeerState::Failed);
            return;
        }
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_remote = peer;
        }
        if (desc.type == "offer")
        {
            change_state(PeerState::Connecting);
            announce("answer");
        }
        else if (desc.type == "answer")
        {
            connect_with(peer);
        }
        else
        {
            LOGGER_WARN("LoopbackPeerConnection[{}]: unexpected description type '{}'", m_id,
                        desc.type);
        }
    }

    void add_remote_candidate(const IceCandidate &candidate) override
    {
        LOGGER_TRACE("LoopbackPeerConnection[{}]: remote candidate '{}'", m_id,
                     candidate.candidate);
        m_remote_candidates.fetch_add(1, std::memory_order_relaxed);
    }

    void close() override
    {
        if (m_closed.exchange(true, std::memory_order_acq_rel))
            return;
        std::vector<std::shared_ptr<LoopbackDataChannel>> channels;
        std::shared_ptr<LoopbackPeerConnection> peer;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            channels = m_local_channels;
            channels.insert(channels.end(), m_remote_channels.begin(), m_remote_channels.end());
            peer = m_remote.lock();
        }
        for (auto &channel : channels)
            channel->close();
        change_state(PeerState::Closed);
        if (peer)
            peer->peer_went_away();
    }

    void on_local_description(std::function<void(const SessionDescription &)> cb) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_on_description = std::move(cb);
    }
    void on_local_candidate(std::function<void(const IceCandidate &)> cb) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_on_candidate = std::move(cb);
    }
    void on_data_channel(std::function<void(std::shared_ptr<DataChannel>)> cb) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_on_data_channel = std::move(cb);
    }
    void on_state_change(std::function<void(PeerState)> cb) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_on_state = std::move(cb);
    }

  private:
    void announce(const char *type)
    {
        auto network = m_network.lock();
        if (!network || !network->signaling_enabled())
            return;
        std::function<void(const SessionDescription &)> on_description;
        std::function<void(const IceCandidate &)> on_candidate;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            on_description = m_on_description;
            on_candidate = m_on_candidate;
        }
        if (on_description)
            on_description(SessionDescription{sdp(), type});
        if (on_candidate)
            on_candidate(IceCandidate{
                fmt::format("candidate:1 1 udp 2122260223 127.0.0.1 {} typ host", 40000 + m_id),
                "0", 0});
    }

    void connect_with(const std::shared_ptr<LoopbackPeerConnection> &peer)
    {
        std::vector<std::shared_ptr<LoopbackDataChannel>> local;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            local = m_local_channels;
        }
        std::vector<std::shared_ptr<LoopbackDataChannel>> remote;
        remote.reserve(local.size());
        for (auto &channel : local)
        {
            auto mirror = std::make_shared<LoopbackDataChannel>(channel->label());
            channel->pair_with(mirror);
            mirror->pair_with(channel);
            peer->adopt_channel(mirror);
            remote.push_back(std::move(mirror));
        }
        change_state(PeerState::Connected);
        peer->change_state(PeerState::Connected);
        for (size_t i = 0; i < local.size(); ++i)
        {
            remote[i]->open();
            local[i]->open();
        }
    }

    void adopt_channel(const std::shared_ptr<LoopbackDataChannel> &channel)
    {
        std::function<void(std::shared_ptr<DataChannel>)> cb;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_remote_channels.push_back(channel);
            cb = m_on_data_channel;
        }
        if (cb)
            cb(channel);
    }

    void peer_went_away()
    {
        if (!m_closed.load(std::memory_order_acquire))
            change_state(PeerState::Disconnected);
    }

    void change_state(PeerState state)
    {
        std::function<void(PeerState)> cb;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_state == state)
                return;
            m_state = state;
            cb = m_on_state;
        }
        if (cb)
            cb(state);
    }

    const uint64_t m_id;
    std::weak_ptr<LoopbackNetwork> m_network;
    std::atomic<bool> m_closed{false};
    std::atomic<size_t> m_remote_candidates{0};

    std::mutex m_mutex;
    PeerState m_state{PeerState::New};
    std::weak_ptr<LoopbackPeerConnection> m_remote;
    std::vector<std::shared_ptr<LoopbackDataChannel>> m_local_channels;
    std::vector<std::shared_ptr<LoopbackDataChannel>> m_remote_channels;
    std::function<void(const SessionDescription &)> m_on_description;
    std::function<void(const IceCandidate &)> m_on_candidate;
    std::function<void(std::shared_ptr<DataChannel>)> m_on_data_channel;
    std::function<void(PeerState)> m_on_state;
};

// ============================================================================
// LoopbackNetwork
// ============================================================================

std::shared_ptr<PeerConnection> LoopbackNetwork::create(const std::vector<std::string> &)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const uint64_t id = m_next_id++;
    auto connection = std::make_shared<LoopbackPeerConnection>(id, weak_from_this());
    m_connections[id] = connection;
    return connection;
}

void LoopbackNetwork::set_signaling_enabled(bool enabled) noexcept
{
    m_signaling_enabled.store(enabled, std::memory_order_release);
}

bool LoopbackNetwork::signaling_enabled() const noexcept
{
    return m_signaling_enabled.load(std::memory_order_acquire);
}

size_t LoopbackNetwork::connection_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t alive = 0;
    for (const auto &[id, weak] : m_connections)
        if (!weak.expired())
            ++alive;
    return alive;
}

std::shared_ptr<LoopbackPeerConnection> LoopbackNetwork::find(const std::string &sdp) const
{
    const auto id = id_from_sdp(sdp);
    if (!id)
        return nullptr;
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_connections.find(*id);
    return it == m_connections.end() ? nullptr : it->second.lock();
}

} // namespace mydiarelay::tunnel
