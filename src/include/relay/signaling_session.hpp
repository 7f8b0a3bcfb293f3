#pragma once
/**
 * @file signaling_session.hpp
 * @brief Per-peer state of the relay: one SignalingSession per ZeroMQ ROUTER identity.
 *
 * Sessions are created and mutated only on the relay's loop thread. deliver() is the one
 * exception: it may be called from any thread and only appends to the shared SignalOutbox,
 * which the loop thread drains onto the socket.
 */
#include "mydiarelay_utils_export.h"
#include "relay/connection_registry.hpp"
#include "relay/signal_message.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace mydiarelay::relay
{

struct OutboundSignal
{
    std::string identity; ///< raw ROUTER identity bytes
    SignalMessage message;
};

/**
 * @class SignalOutbox
 * @brief Thread-safe queue of messages waiting for the loop thread to put them on the wire.
 */
class MYDIARELAY_UTILS_EXPORT SignalOutbox
{
  public:
    void push(std::string identity, SignalMessage message);
    std::vector<OutboundSignal> drain();
    size_t size() const;

  private:
    mutable std::mutex m_mutex;
    std::vector<OutboundSignal> m_queue;
};

enum class SessionRole
{
    Unidentified,
    Instance,
    Client
};

MYDIARELAY_UTILS_EXPORT const char *to_string(SessionRole role) noexcept;

class MYDIARELAY_UTILS_EXPORT SignalingSession final : public SignalChannel
{
  public:
    using Clock = std::chrono::steady_clock;

    SignalingSession(std::string identity, std::shared_ptr<SignalOutbox> outbox);

    bool deliver(const SignalMessage &message) override;
    std::string channel_id() const override;

    const std::string &identity() const noexcept { return m_identity; }

    /// 16 random bytes, base64url without padding. Fixed for the session's lifetime.
    const std::string &session_id() const noexcept { return m_session_id; }

    SessionRole role() const noexcept { return m_role; }
    void set_role(SessionRole role) noexcept { m_role = role; }

    /// Registered instance (Instance role) or the instance being reached (Client role).
    const std::string &instance_id() const noexcept { return m_instance_id; }
    void set_instance_id(std::string id) { m_instance_id = std::move(id); }

    void touch(Clock::time_point now) noexcept { m_last_seen = now; }
    Clock::time_point last_seen() const noexcept { return m_last_seen; }

    std::set<std::string> &joined_namespaces() noexcept { return m_namespaces; }

    bool closed() const noexcept { return m_closed.load(std::memory_order_acquire); }

    /// @brief Marks the session closed. True only for the first call.
    bool close() noexcept { return !m_closed.exchange(true, std::memory_order_acq_rel); }

  private:
    std::string m_identity;
    std::string m_session_id;
    std::shared_ptr<SignalOutbox> m_outbox;
    SessionRole m_role{SessionRole::Unidentified};
    std::string m_instance_id;
    Clock::time_point m_last_seen{Clock::now()};
    std::set<std::string> m_namespaces;
    std::atomic<bool> m_closed{false};
};

} // namespace mydiarelay::relay
