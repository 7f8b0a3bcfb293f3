#pragma once
/**
 * @file connection_registry.hpp
 * @brief Directory of instances reachable through a live signaling channel.
 *
 * The registry does not own channels: it keeps a `weak_ptr` to each one, and the session
 * that owns the channel removes its entry when it terminates (see unregister_if()).
 */
#include "mydiarelay_utils_export.h"
#include "relay/signal_message.hpp"
#include "utils/result.hpp"
#include "utils/striped_map.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace mydiarelay::relay
{

/**
 * @class SignalChannel
 * @brief A live signaling connection messages can be pushed to.
 */
class MYDIARELAY_UTILS_EXPORT SignalChannel
{
  public:
    virtual ~SignalChannel() = default;

    /// @brief Queues @p message for delivery. False if the channel is closed.
    virtual bool deliver(const SignalMessage &message) = 0;

    /// @brief Stable printable id for logs.
    virtual std::string channel_id() const = 0;
};

struct RegistryEntry
{
    std::string instance_id;
    std::weak_ptr<SignalChannel> handle;
    nlohmann::json metadata;
    std::chrono::system_clock::time_point registered_at{};
};

/**
 * @class ConnectionRegistry
 * @brief Thread-safe. Per-key operations lock one stripe; list_online() and count() scan.
 */
class MYDIARELAY_UTILS_EXPORT ConnectionRegistry
{
  public:
    template <typename T> using RegistryResult = utils::Result<T, utils::RegistryError>;

    /// @brief Inserts or overwrites (last writer wins).
    void register_instance(const std::string &instance_id,
                           const std::shared_ptr<SignalChannel> &handle,
                           nlohmann::json metadata = nlohmann::json::object());

    RegistryResult<RegistryEntry> lookup(const std::string &instance_id) const;

    /// @brief Handle only. NotFound also when the channel is already gone.
    RegistryResult<std::shared_ptr<SignalChannel>> get_handle(const std::string &instance_id) const;

    /// @brief Registered and its channel still alive.
    bool online(const std::string &instance_id) const;

    /// @brief Idempotent.
    void unregister(const std::string &instance_id);

    /**
     * @brief Removes the entry only if it still refers to @p handle. A session that lost a
     *        reconnect race therefore cannot evict its successor.
     * @return true if an entry was removed.
     */
    bool unregister_if(const std::string &instance_id, const SignalChannel *handle);

    /// @brief Replaces one metadata key under the stripe lock. False if absent.
    bool update_metadata(const std::string &instance_id, const std::string &key,
                         nlohmann::json value);

    /// @brief Entries whose channel is still alive. count() includes the others.
    std::vector<RegistryEntry> list_online() const;
    size_t count() const;

  private:
    utils::StripedMap<std::string, RegistryEntry, 32> m_entries;
};

} // namespace mydiarelay::relay
