#pragma once
/**
 * @file postgres_claim_repository.hpp
 * @brief PostgreSQL claim backend (libpqxx). Built with MYDIARELAY_WITH_POSTGRES.
 */
#include "relay/claim_store.hpp"

#include <pqxx/pqxx>

#include <memory>
#include <mutex>
#include <string>

namespace mydiarelay::relay
{

/**
 * @class PostgresClaimRepository
 * @brief Claims in the `relay_claims` table. The table is created if missing.
 *
 * The lock and consume transitions are single `UPDATE ... WHERE` statements judged by
 * affected rows, so relay processes sharing the database agree on the winner.
 * Timestamps are stored as `timestamptz` and exchanged as epoch milliseconds.
 */
class MYDIARELAY_UTILS_EXPORT PostgresClaimRepository final : public ClaimRepository
{
  public:
    /// @throws std::runtime_error if the connection or the schema setup fails.
    explicit PostgresClaimRepository(const std::string &connection_string);
    ~PostgresClaimRepository() override;

    std::optional<Claim> insert(const Claim &claim) override;
    std::optional<Claim> find_by_code(const std::string &code) override;
    std::optional<Claim> find_by_id(int64_t id) override;
    int try_lock(const std::string &code, TimePoint now, TimePoint until) override;
    int try_consume(int64_t id, const std::string &device_id, TimePoint now) override;
    size_t delete_stale(TimePoint cutoff) override;
    std::vector<Claim> list_for_instance(const std::string &instance_id, bool include_expired,
                                         bool include_consumed, TimePoint now) override;

  private:
    void ensure_schema();

    std::mutex m_mutex; ///< pqxx::connection is not thread-safe.
    std::unique_ptr<pqxx::connection> m_conn;
};

} // namespace mydiarelay::relay
