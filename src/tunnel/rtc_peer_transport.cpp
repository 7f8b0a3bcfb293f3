#include "mdr_service.hpp"
#include "tunnel/rtc_peer_transport.hpp"

#include <rtc/rtc.hpp>

#include <mutex>

namespace mydiarelay::tunnel
{

namespace
{

PeerState map_state(rtc::PeerConnection::State state) noexcept
{
    switch (state)
    {
    case rtc::PeerConnection::State::New:
        return PeerState::New;
    case rtc::PeerConnection::State::Connecting:
        return PeerState::Connecting;
    case rtc::PeerConnection::State::Connected:
        return PeerState::Connected;
    case rtc::PeerConnection::State::Disconnected:
        return PeerState::Disconnected;
    case rtc::PeerConnection::State::Failed:
        return PeerState::Failed;
    case rtc::PeerConnection::State::Closed:
        return PeerState::Closed;
    }
    return PeerState::Failed;
}

// Shared with the lambdas registered on the rtc object. Holds no reference back to it.
struct ChannelSlots
{
    std::mutex mutex;
    std::function<void()> on_open;
    std::function<void()> on_closed;
    DataChannel::MessageHandler on_text;
    DataChannel::MessageHandler on_binary;

    template <typename F> F get(const F &slot)
    {
        std::lock_guard<std::mutex> lock(mutex);
        return slot;
    }
};

class RtcDataChannel final : public DataChannel
{
  public:
    explicit RtcDataChannel(std::shared_ptr<rtc::DataChannel> channel)
        : m_channel(std::move(channel)), m_slots(std::make_shared<ChannelSlots>())
    {
        auto slots = m_slots;
        m_channel->onOpen([slots] {
            if (auto cb = slots->get(slots->on_open))
                cb();
        });
        m_channel->onClosed([slots] {
            if (auto cb = slots->get(slots->on_closed))
                cb();
        });
        m_channel->onMessage(
            [slots](rtc::binary data) {
                if (auto cb = slots->get(slots->on_binary))
                    cb(std::string(reinterpret_cast<const char *>(data.data()), data.size()));
            },
            [slots](rtc::string text) {
                if (auto cb = slots->get(slots->on_text))
                    cb(std::move(text));
            });
    }

    ~RtcDataChannel() override
    {
        m_channel->resetCallbacks();
    }

    std::string label() const override { return m_channel->label(); }
    bool is_open() const override { return m_channel->isOpen(); }

    bool send_text(std::string_view text) override
    {
        try
        {
            return m_channel->send(std::string(text));
        }
        catch (const std::exception &e)
        {
            LOGGER_WARN("RtcDataChannel[{}]: send failed: {}", m_channel->label(), e.what());
            return false;
        }
    }

    bool send_binary(std::string_view bytes) override
    {
        try
        {
            return m_channel->send(reinterpret_cast<const std::byte *>(bytes.data()),
                                   bytes.size());
        }
        catch (const std::exception &e)
        {
            LOGGER_WARN("RtcDataChannel[{}]: send failed: {}", m_channel->label(), e.what());
            return false;
        }
    }

    void close() override { m_channel->close(); }

    void on_open(std::function<void()> cb) override { set(m_slots->on_open, std::move(cb)); }
    void on_closed(std::function<void()> cb) override { set(m_slots->on_closed, std::move(cb)); }
    void on_text(MessageHandler cb) override { set(m_slots->on_text, std::move(cb)); }
    void on_binary(MessageHandler cb) override { set(m_slots->on_binary, std::move(cb)); }

  private:
    template <typename F> void set(F &slot, F cb)
    {
        std::lock_guard<std::mutex> lock(m_slots->mutex);
        slot = std::move(cb);
    }

    std::shared_ptr<rtc::DataChannel> m_channel;
    std::shared_ptr<ChannelSlots> m_slots;
};

struct PeerSlots
{
    std::mutex mutex;
    std::function<void(const SessionDescription &)> on_description;
    std::function<void(const IceCandidate &)> on_candidate;
    std::function<void(std::shared_ptr<DataChannel>)> on_data_channel;
    std::function<void(PeerState)> on_state;

    template <typename F> F get(const F &slot)
    {
        std::lock_guard<std::mutex> lock(mutex);
        return slot;
    }
};

class RtcPeerConnection final : public PeerConnection
{
  public:
    explicit RtcPeerConnection(const rtc::Configuration &config)
        : m_pc(std::make_shared<rtc::PeerConnection>(config)),
          m_slots(std::make_shared<PeerSlots>())
    {
        auto slots = m_slots;
        m_pc->onLocalDescription([slots](rtc::Description description) {
            if (auto cb = slots->get(slots->on_description))
                cb(SessionDescription{std::string(description), description.typeString()});
        });
        m_pc->onLocalCandidate([slots](rtc::Candidate candidate) {
            if (auto cb = slots->get(slots->on_candidate))
                cb(IceCandidate{std::string(candidate), candidate.mid(), 0});
        });
        m_pc->onDataChannel([slots](std::shared_ptr<rtc::DataChannel> channel) {
            if (auto cb = slots->get(slots->on_data_channel))
                cb(std::make_shared<RtcDataChannel>(std::move(channel)));
        });
        m_pc->onStateChange([slots](rtc::PeerConnection::State state) {
            if (auto cb = slots->get(slots->on_state))
                cb(map_state(state));
        });
    }

    ~RtcPeerConnection() override
    {
        m_pc->resetCallbacks();
        m_pc->close();
    }

    std::shared_ptr<DataChannel> create_data_channel(const std::string &label) override
    {
        return std::make_shared<RtcDataChannel>(m_pc->createDataChannel(label));
    }

    void create_offer() override
    {
        try
        {
            m_pc->setLocalDescription(rtc::Description::Type::Offer);
        }
        catch (const std::exception &e)
        {
            LOGGER_ERROR("RtcPeerConnection: creating the offer failed: {}", e.what());
            notify_failed();
        }
    }

    void set_remote_description(const SessionDescription &desc) override
    {
        try
        {
            m_pc->setRemoteDescription(rtc::Description(desc.sdp, desc.type));
            if (desc.type == "offer")
                m_pc->setLocalDescription(rtc::Description::Type::Answer);
        }
        catch (const std::exception &e)
        {
            LOGGER_WARN("RtcPeerConnection: remote {} rejected: {}", desc.type, e.what());
            notify_failed();
        }
    }

    void add_remote_candidate(const IceCandidate &candidate) override
    {
        try
        {
            m_pc->addRemoteCandidate(rtc::Candidate(candidate.candidate, candidate.sdp_mid));
        }
        catch (const std::exception &e)
        {
            LOGGER_DEBUG("RtcPeerConnection: candidate ignored: {}", e.what());
        }
    }

    void close() override { m_pc->close(); }

    void on_local_description(std::function<void(const SessionDescription &)> cb) override
    {
        std::lock_guard<std::mutex> lock(m_slots->mutex);
        m_slots->on_description = std::move(cb);
    }
    void on_local_candidate(std::function<void(const IceCandidate &)> cb) override
    {
        std::lock_guard<std::mutex> lock(m_slots->mutex);
        m_slots->on_candidate = std::move(cb);
    }
    void on_data_channel(std::function<void(std::shared_ptr<DataChannel>)> cb) override
    {
        std::lock_guard<std::mutex> lock(m_slots->mutex);
        m_slots->on_data_channel = std::move(cb);
    }
    void on_state_change(std::function<void(PeerState)> cb) override
    {
        std::lock_guard<std::mutex> lock(m_slots->mutex);
        m_slots->on_state = std::move(cb);
    }

  private:
    void notify_failed()
    {
        if (auto cb = m_slots->get(m_slots->on_state))
            cb(PeerState::Failed);
    }

    std::shared_ptr<rtc::PeerConnection> m_pc;
    std::shared_ptr<PeerSlots> m_slots;
};

} // namespace

RtcPeerConnectionFactory::RtcPeerConnectionFactory(RtcTransportOptions options)
    : m_options(options)
{
}

std::shared_ptr<PeerConnection>
RtcPeerConnectionFactory::create(const std::vector<std::string> &ice_servers)
{
    rtc::Configuration config;
    config.disableAutoNegotiation = true;
    config.maxMessageSize = m_options.max_message_size;
    if (m_options.port_range_begin != 0)
        config.portRangeBegin = m_options.port_range_begin;
    if (m_options.port_range_end != 0)
        config.portRangeEnd = m_options.port_range_end;
    for (const auto &url : ice_servers)
    {
        try
        {
            config.iceServers.emplace_back(url);
        }
        catch (const std::exception &e)
        {
            LOGGER_WARN("RtcPeerConnectionFactory: ignoring ICE server '{}': {}", url, e.what());
        }
    }
    return std::make_shared<RtcPeerConnection>(config);
}

} // namespace mydiarelay::tunnel
