#include "mdr_service.hpp"
#include "relay/signaling_session.hpp"

namespace mydiarelay::relay
{

namespace
{
constexpr size_t kSessionIdBytes = 16;
} // namespace

void SignalOutbox::push(std::string identity, SignalMessage message)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_queue.push_back(OutboundSignal{std::move(identity), std::move(message)});
}

std::vector<OutboundSignal> SignalOutbox::drain()
{
    std::vector<OutboundSignal> out;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        out.swap(m_queue);
    }
    return out;
}

size_t SignalOutbox::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

const char *to_string(SessionRole role) noexcept
{
    switch (role)
    {
    case SessionRole::Unidentified:
        return "unidentified";
    case SessionRole::Instance:
        return "instance";
    case SessionRole::Client:
        return "client";
    }
    return "unknown";
}

SignalingSession::SignalingSession(std::string identity, std::shared_ptr<SignalOutbox> outbox)
    : m_identity(std::move(identity)),
      m_session_id(crypto::to_base64(crypto::random_bytes(kSessionIdBytes),
                                     crypto::Base64Variant::UrlSafeNoPadding)),
      m_outbox(std::move(outbox))
{
    if (!m_outbox)
        throw std::invalid_argument("SignalingSession: outbox must not be null");
}

bool SignalingSession::deliver(const SignalMessage &message)
{
    if (closed())
        return false;
    m_outbox->push(m_identity, message);
    return true;
}

std::string SignalingSession::channel_id() const
{
    return fmt::format("{}/{}", crypto::to_hex(m_identity), m_session_id);
}

} // namespace mydiarelay::relay
