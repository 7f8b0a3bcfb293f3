#pragma once
/**
 * @file claim_store.hpp
 * @brief Claim Store: creation, resolution, one-shot locking and consumption of claim codes.
 *
 * Storage is behind ClaimRepository. The lock and the consume transition are single
 * conditional updates at the storage layer, judged by affected-row count, so two relay
 * processes sharing a database cannot both win the same claim.
 */
#include "mydiarelay_utils_export.h"
#include "relay/claim.hpp"
#include "relay/claim_namespace.hpp"
#include "utils/result.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace mydiarelay::relay
{

/// @brief Thrown by a ClaimRepository when the backend itself fails.
class MYDIARELAY_UTILS_EXPORT ClaimStorageError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/**
 * @class ClaimRepository
 * @brief Storage seam for claims. Implementations throw ClaimStorageError on backend failure.
 */
class MYDIARELAY_UTILS_EXPORT ClaimRepository
{
  public:
    virtual ~ClaimRepository() = default;

    /// @brief Inserts and assigns `id`. Returns std::nullopt if the code is taken.
    virtual std::optional<Claim> insert(const Claim &claim) = 0;

    virtual std::optional<Claim> find_by_code(const std::string &code) = 0;
    virtual std::optional<Claim> find_by_id(int64_t id) = 0;

    /**
     * @brief `UPDATE ... SET locked_at = now, lock_expires_at = until WHERE code = ? AND
     *        consumed_at IS NULL AND expires_at > now AND (locked_at IS NULL OR
     *        lock_expires_at <= now)`.
     * @return Affected rows (0 or 1).
     */
    virtual int try_lock(const std::string &code, TimePoint now, TimePoint until) = 0;

    /**
     * @brief `UPDATE ... SET consumed_at = now, device_id = ? WHERE id = ? AND
     *        consumed_at IS NULL`.
     * @return Affected rows (0 or 1).
     */
    virtual int try_consume(int64_t id, const std::string &device_id, TimePoint now) = 0;

    /// @brief Deletes claims that expired, or were consumed, before @p cutoff.
    virtual size_t delete_stale(TimePoint cutoff) = 0;

    /// @brief Claims of @p instance_id, newest first.
    virtual std::vector<Claim> list_for_instance(const std::string &instance_id,
                                                 bool include_expired, bool include_consumed,
                                                 TimePoint now) = 0;
};

/**
 * @class InMemoryClaimRepository
 * @brief Process-local backend. One mutex stands in for the row lock of a database.
 */
class MYDIARELAY_UTILS_EXPORT InMemoryClaimRepository final : public ClaimRepository
{
  public:
    std::optional<Claim> insert(const Claim &claim) override;
    std::optional<Claim> find_by_code(const std::string &code) override;
    std::optional<Claim> find_by_id(int64_t id) override;
    int try_lock(const std::string &code, TimePoint now, TimePoint until) override;
    int try_consume(int64_t id, const std::string &device_id, TimePoint now) override;
    size_t delete_stale(TimePoint cutoff) override;
    std::vector<Claim> list_for_instance(const std::string &instance_id, bool include_expired,
                                         bool include_consumed, TimePoint now) override;

  private:
    std::mutex m_mutex;
    int64_t m_next_id{1};
    std::unordered_map<std::string, Claim> m_by_code;
    std::unordered_map<int64_t, std::string> m_code_by_id;
};

/// What a resolved code yields to the party that wants to redeem it.
struct ClaimResolution
{
    int64_t claim_id{0};
    std::string instance_id;
    std::string namespace_id;
    TimePoint expires_at{};
    std::vector<std::string> rendezvous_points; ///< ICE server URLs
};

struct ClaimStoreOptions
{
    std::chrono::seconds claim_ttl{300};
    std::chrono::seconds lock_ttl{15};
    size_t code_length{kDefaultCodeLength};
    std::vector<std::string> ice_servers{"stun:stun.l.google.com:19302"};
    std::string namespace_secret;
    /// Collision retries before create_claim reports StorageFailure.
    int max_create_attempts{8};
};

/**
 * @class ClaimStore
 * @brief Claim operations over a ClaimRepository. Thread-safe if the repository is.
 *
 * Every failure a caller can expect is a ClaimError value; only a broken backend is logged
 * and mapped to ClaimError::StorageFailure.
 */
class MYDIARELAY_UTILS_EXPORT ClaimStore
{
  public:
    using ClockFn = std::function<TimePoint()>;
    template <typename T> using ClaimResult = utils::Result<T, utils::ClaimError>;

    ClaimStore(std::shared_ptr<ClaimRepository> repository, ClaimStoreOptions options,
               ClockFn clock = {});

    ClaimResult<Claim> create_claim(const std::string &instance_id,
                                    const std::string &requester_ref);
    ClaimResult<Claim> create_claim(const std::string &instance_id,
                                    const std::string &requester_ref,
                                    std::chrono::seconds ttl);

    /// @brief Read-only. Checks in order: not_found, already_consumed, expired.
    ClaimResult<ClaimResolution> resolve_claim(const std::string &code);

    /// @brief Errors: not_found, already_consumed, expired, locked.
    ClaimResult<Claim> lock_claim(const std::string &code);

    /**
     * @brief Final transition. @p instance_id must own the claim (else unauthorized).
     *        A claim already spent reports already_consumed.
     */
    ClaimResult<Claim> consume_claim(const std::string &instance_id, int64_t claim_id,
                                     const std::string &device_id);

    /// @brief Deletes claims expired or consumed more than @p max_age ago.
    ClaimResult<size_t> cleanup_claims(std::chrono::seconds max_age = std::chrono::hours(24));

    ClaimResult<std::vector<Claim>> list_claims(const std::string &instance_id,
                                                bool include_expired = false,
                                                bool include_consumed = false);

    const ClaimNamespace &namespaces() const noexcept { return m_namespace; }
    const ClaimStoreOptions &options() const noexcept { return m_options; }
    TimePoint now() const { return m_clock(); }

  private:
    std::shared_ptr<ClaimRepository> m_repo;
    ClaimStoreOptions m_options;
    ClockFn m_clock;
    ClaimNamespace m_namespace;
};

/**
 * @brief Builds the repository named by `claims.backend`.
 * @throws std::runtime_error for "postgres" when built without PostgreSQL support, or if
 *         the database cannot be reached.
 */
MYDIARELAY_UTILS_EXPORT std::shared_ptr<ClaimRepository>
make_claim_repository(const std::string &backend, const std::string &database_url);

} // namespace mydiarelay::relay
