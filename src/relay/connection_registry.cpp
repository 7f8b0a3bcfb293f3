#include "mdr_service.hpp"
#include "relay/connection_registry.hpp"

namespace mydiarelay::relay
{

using utils::RegistryError;

void ConnectionRegistry::register_instance(const std::string &instance_id,
                                           const std::shared_ptr<SignalChannel> &handle,
                                           nlohmann::json metadata)
{
    RegistryEntry entry;
    entry.instance_id = instance_id;
    entry.handle = handle;
    entry.metadata = std::move(metadata);
    entry.registered_at = std::chrono::system_clock::now();

    const bool fresh = m_entries.insert_or_assign(instance_id, std::move(entry));
    LOGGER_DEBUG("ConnectionRegistry: {} instance '{}' via {}", fresh ? "registered" : "replaced",
                 instance_id, handle ? handle->channel_id() : std::string("<null>"));
}

ConnectionRegistry::RegistryResult<RegistryEntry>
ConnectionRegistry::lookup(const std::string &instance_id) const
{
    auto entry = m_entries.find(instance_id);
    if (!entry)
        return RegistryResult<RegistryEntry>::error(RegistryError::NotFound);
    return RegistryResult<RegistryEntry>::ok(std::move(*entry));
}

ConnectionRegistry::RegistryResult<std::shared_ptr<SignalChannel>>
ConnectionRegistry::get_handle(const std::string &instance_id) const
{
    auto entry = m_entries.find(instance_id);
    if (!entry)
        return RegistryResult<std::shared_ptr<SignalChannel>>::error(RegistryError::NotFound);
    auto handle = entry->handle.lock();
    if (!handle)
        return RegistryResult<std::shared_ptr<SignalChannel>>::error(RegistryError::NotFound);
    return RegistryResult<std::shared_ptr<SignalChannel>>::ok(std::move(handle));
}

bool ConnectionRegistry::online(const std::string &instance_id) const
{
    auto entry = m_entries.find(instance_id);
    return entry && !entry->handle.expired();
}

void ConnectionRegistry::unregister(const std::string &instance_id)
{
    if (m_entries.erase(instance_id))
        LOGGER_DEBUG("ConnectionRegistry: unregistered instance '{}'", instance_id);
}

bool ConnectionRegistry::unregister_if(const std::string &instance_id,
                                       const SignalChannel *handle)
{
    const bool removed = m_entries.erase_if(instance_id, [handle](const RegistryEntry &e) {
        // An entry whose channel is already gone is removed as well.
        auto live = e.handle.lock();
        return !live || live.get() == handle;
    });
    if (removed)
        LOGGER_DEBUG("ConnectionRegistry: unregistered instance '{}' (owner match)", instance_id);
    return removed;
}

bool ConnectionRegistry::update_metadata(const std::string &instance_id, const std::string &key,
                                         nlohmann::json value)
{
    return m_entries.update(instance_id, [&](RegistryEntry &e) {
        if (!e.metadata.is_object())
            e.metadata = nlohmann::json::object();
        e.metadata[key] = std::move(value);
    });
}

std::vector<RegistryEntry> ConnectionRegistry::list_online() const
{
    std::vector<RegistryEntry> out;
    m_entries.for_each([&out](const std::string &, const RegistryEntry &e) {
        if (!e.handle.expired())
            out.push_back(e);
    });
    return out;
}

size_t ConnectionRegistry::count() const
{
    return m_entries.size();
}

} // namespace mydiarelay::relay
