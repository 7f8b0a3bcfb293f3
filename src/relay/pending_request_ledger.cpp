#include "mdr_service.hpp"
#include "relay/pending_request_ledger.hpp"

#include <future>
#include <memory>

namespace mydiarelay::relay
{

using utils::LedgerError;

void PendingRequestLedger::notify(Entry &entry, LedgerOutcome outcome) noexcept
{
    if (!entry.waiter)
        return;
    try
    {
        entry.waiter(std::move(outcome));
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("PendingRequestLedger: waiter for '{}' threw: {}", entry.info.request_id,
                     e.what());
    }
}

PendingRequestLedger::LedgerStatus
PendingRequestLedger::register_request(const std::string &instance_id,
                                       const std::string &request_id, LedgerWaiter waiter)
{
    Entry entry;
    entry.info.request_id = request_id;
    entry.info.instance_id = instance_id;
    entry.info.registered_at = std::chrono::steady_clock::now();
    entry.waiter = std::move(waiter);

    if (!m_entries.try_emplace(request_id, std::move(entry)))
    {
        LOGGER_WARN("PendingRequestLedger: request id '{}' is already pending", request_id);
        return LedgerStatus::error(LedgerError::DuplicateId);
    }
    return LedgerStatus::ok({});
}

utils::Result<PendingRequestInfo, LedgerError>
PendingRequestLedger::lookup(const std::string &request_id) const
{
    auto entry = m_entries.find(request_id);
    if (!entry)
        return utils::Result<PendingRequestInfo, LedgerError>::error(LedgerError::NotFound);
    return utils::Result<PendingRequestInfo, LedgerError>::ok(std::move(entry->info));
}

PendingRequestLedger::LedgerStatus PendingRequestLedger::resolve(const std::string &request_id,
                                                                 nlohmann::json response)
{
    auto entry = m_entries.extract(request_id);
    if (!entry)
    {
        LOGGER_DEBUG("PendingRequestLedger: resolve('{}') found nothing (late or unknown)",
                     request_id);
        return LedgerStatus::error(LedgerError::NotFound);
    }
    notify(*entry, LedgerOutcome::ok(std::move(response)));
    return LedgerStatus::ok({});
}

PendingRequestLedger::LedgerStatus PendingRequestLedger::remove(const std::string &request_id)
{
    if (!m_entries.erase(request_id))
        return LedgerStatus::error(LedgerError::NotFound);
    return LedgerStatus::ok({});
}

size_t PendingRequestLedger::fail_all(const std::string &instance_id, LedgerError error)
{
    auto failed = m_entries.extract_all_if(
        [&instance_id](const std::string &, const Entry &e) {
            return e.info.instance_id == instance_id;
        });
    for (auto &[id, entry] : failed)
        notify(entry, LedgerOutcome::error(error));
    if (!failed.empty())
    {
        LOGGER_INFO("PendingRequestLedger: failed {} pending request(s) for instance '{}' ({})",
                    failed.size(), instance_id, utils::to_string(error));
    }
    return failed.size();
}

LedgerOutcome PendingRequestLedger::await_response(const std::string &instance_id,
                                                   const std::string &request_id,
                                                   std::chrono::milliseconds timeout,
                                                   const std::function<bool()> &dispatch)
{
    auto promise = std::make_shared<std::promise<LedgerOutcome>>();
    auto future = promise->get_future();

    auto registered = register_request(instance_id, request_id, [promise](LedgerOutcome o) {
        try
        {
            promise->set_value(std::move(o));
        }
        catch (const std::future_error &e)
        {
            LOGGER_WARN("PendingRequestLedger: promise already satisfied: {}", e.what());
        }
    });
    if (registered.is_error())
        return LedgerOutcome::error(registered.error());

    if (dispatch && !dispatch())
    {
        if (remove(request_id).is_ok())
            return LedgerOutcome::error(LedgerError::TunnelDisconnected);
        return future.get();
    }

    if (future.wait_for(timeout) == std::future_status::ready)
        return future.get();

    // Whoever removes the entry owns the outcome. Losing here means a resolve or fail_all
    // is already delivering, so its value is about to land in the future.
    if (remove(request_id).is_ok())
    {
        LOGGER_DEBUG("PendingRequestLedger: request '{}' timed out after {} ms", request_id,
                     timeout.count());
        return LedgerOutcome::error(LedgerError::Timeout);
    }
    return future.get();
}

size_t PendingRequestLedger::count() const
{
    return m_entries.size();
}

size_t PendingRequestLedger::count_for_instance(const std::string &instance_id) const
{
    size_t n = 0;
    m_entries.for_each([&](const std::string &, const Entry &e) {
        if (e.info.instance_id == instance_id)
            ++n;
    });
    return n;
}

std::vector<PendingRequestInfo>
PendingRequestLedger::list_for_instance(const std::string &instance_id) const
{
    std::vector<PendingRequestInfo> out;
    m_entries.for_each([&](const std::string &, const Entry &e) {
        if (e.info.instance_id == instance_id)
            out.push_back(e.info);
    });
    return out;
}

} // namespace mydiarelay::relay
