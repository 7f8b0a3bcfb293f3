#pragma once
/**
 * @file pending_request_ledger.hpp
 * @brief Correlates in-flight requests with the callers waiting for their responses.
 *
 * Each entry is removed exactly once, by whichever of resolve(), remove(), fail_all() or the
 * await_response() timeout gets to it first. The others then see LedgerError::NotFound,
 * which callers treat as benign.
 */
#include "mydiarelay_utils_export.h"
#include "utils/result.hpp"
#include "utils/striped_map.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace mydiarelay::relay
{

using LedgerOutcome = utils::Result<nlohmann::json, utils::LedgerError>;

/// Called once with the response or the failure. Never called under a ledger lock.
using LedgerWaiter = std::function<void(LedgerOutcome)>;

struct PendingRequestInfo
{
    std::string request_id;
    std::string instance_id;
    std::chrono::steady_clock::time_point registered_at{};
};

class MYDIARELAY_UTILS_EXPORT PendingRequestLedger
{
  public:
    using LedgerStatus = utils::Status<utils::LedgerError>;

    /// @return DuplicateId if @p request_id is already pending.
    LedgerStatus register_request(const std::string &instance_id, const std::string &request_id,
                                  LedgerWaiter waiter);

    utils::Result<PendingRequestInfo, utils::LedgerError>
    lookup(const std::string &request_id) const;

    /// @brief Removes the entry, then hands @p response to its waiter.
    LedgerStatus resolve(const std::string &request_id, nlohmann::json response);

    /// @brief Removes without notifying the waiter.
    LedgerStatus remove(const std::string &request_id);

    /**
     * @brief Fails every request of @p instance_id with @p error.
     * @return The number of requests failed.
     */
    size_t fail_all(const std::string &instance_id,
                    utils::LedgerError error = utils::LedgerError::TunnelDisconnected);

    /**
     * @brief Registers @p request_id and blocks the calling thread until it is resolved,
     *        failed, or @p timeout elapses. On timeout the entry is removed before returning.
     *
     * @p dispatch, when given, runs after registration and before the wait, so a reply can
     * never arrive ahead of its entry. Returning false from it reports TunnelDisconnected.
     */
    LedgerOutcome await_response(const std::string &instance_id, const std::string &request_id,
                                 std::chrono::milliseconds timeout,
                                 const std::function<bool()> &dispatch = {});

    size_t count() const;
    size_t count_for_instance(const std::string &instance_id) const;
    std::vector<PendingRequestInfo> list_for_instance(const std::string &instance_id) const;

  private:
    struct Entry
    {
        PendingRequestInfo info;
        LedgerWaiter waiter;
    };

    static void notify(Entry &entry, LedgerOutcome outcome) noexcept;

    utils::StripedMap<std::string, Entry, 32> m_entries;
};

} // namespace mydiarelay::relay
