#include "mdr_service.hpp"
#include "relay/postgres_claim_repository.hpp"

namespace mydiarelay::relay
{

namespace
{

constexpr const char *kSelectColumns = R"(
    id, code, instance_id, requester_ref,
    (EXTRACT(EPOCH FROM expires_at) * 1000)::bigint,
    (EXTRACT(EPOCH FROM locked_at) * 1000)::bigint,
    (EXTRACT(EPOCH FROM lock_expires_at) * 1000)::bigint,
    (EXTRACT(EPOCH FROM consumed_at) * 1000)::bigint,
    device_id,
    (EXTRACT(EPOCH FROM inserted_at) * 1000)::bigint)";

int64_t to_millis(TimePoint tp)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint from_millis(int64_t ms)
{
    return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

std::optional<TimePoint> opt_time(const pqxx::field &f)
{
    if (f.is_null())
        return std::nullopt;
    return from_millis(f.as<int64_t>());
}

Claim row_to_claim(const pqxx::row &row)
{
    Claim c;
    c.id = row[0].as<int64_t>();
    c.code = row[1].as<std::string>();
    c.instance_id = row[2].as<std::string>();
    c.requester_ref = row[3].is_null() ? std::string{} : row[3].as<std::string>();
    c.expires_at = from_millis(row[4].as<int64_t>());
    c.locked_at = opt_time(row[5]);
    c.lock_expires_at = opt_time(row[6]);
    c.consumed_at = opt_time(row[7]);
    if (!row[8].is_null())
        c.device_id = row[8].as<std::string>();
    c.inserted_at = from_millis(row[9].as<int64_t>());
    return c;
}

} // namespace

PostgresClaimRepository::PostgresClaimRepository(const std::string &connection_string)
{
    try
    {
        m_conn = std::make_unique<pqxx::connection>(connection_string);
        LOGGER_INFO("PostgresClaimRepository: connected to '{}'", m_conn->dbname());
        ensure_schema();
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("PostgresClaimRepository: connection failed: {}", e.what());
        throw std::runtime_error(fmt::format("PostgresClaimRepository: {}", e.what()));
    }
}

PostgresClaimRepository::~PostgresClaimRepository()
{
    if (m_conn && m_conn->is_open())
        m_conn->close();
}

void PostgresClaimRepository::ensure_schema()
{
    pqxx::work txn(*m_conn);
    txn.exec(R"(
        CREATE TABLE IF NOT EXISTS relay_claims (
            id               BIGSERIAL PRIMARY KEY,
            code             TEXT NOT NULL UNIQUE,
            instance_id      TEXT NOT NULL,
            requester_ref    TEXT,
            expires_at       TIMESTAMPTZ NOT NULL,
            locked_at        TIMESTAMPTZ,
            lock_expires_at  TIMESTAMPTZ,
            consumed_at      TIMESTAMPTZ,
            device_id        TEXT,
            inserted_at      TIMESTAMPTZ NOT NULL DEFAULT NOW()
        ))");
    txn.exec("CREATE INDEX IF NOT EXISTS relay_claims_instance_idx ON relay_claims (instance_id)");
    txn.commit();
}

std::optional<Claim> PostgresClaimRepository::insert(const Claim &claim)
{
    std::lock_guard lock(m_mutex);
    try
    {
        pqxx::work txn(*m_conn);
        auto result = txn.exec_params(
            fmt::format(R"(
                INSERT INTO relay_claims (code, instance_id, requester_ref, expires_at, inserted_at)
                VALUES ($1, $2, $3, to_timestamp($4 / 1000.0), to_timestamp($5 / 1000.0))
                ON CONFLICT (code) DO NOTHING
                RETURNING {})",
                        kSelectColumns),
            claim.code, claim.instance_id, claim.requester_ref, to_millis(claim.expires_at),
            to_millis(claim.inserted_at));
        txn.commit();
        if (result.empty())
            return std::nullopt;
        return row_to_claim(result[0]);
    }
    catch (const pqxx::failure &e)
    {
        throw ClaimStorageError(fmt::format("insert: {}", e.what()));
    }
}

std::optional<Claim> PostgresClaimRepository::find_by_code(const std::string &code)
{
    std::lock_guard lock(m_mutex);
    try
    {
        pqxx::work txn(*m_conn);
        auto result = txn.exec_params(
            fmt::format("SELECT {} FROM relay_claims WHERE code = $1", kSelectColumns), code);
        txn.commit();
        if (result.empty())
            return std::nullopt;
        return row_to_claim(result[0]);
    }
    catch (const pqxx::failure &e)
    {
        throw ClaimStorageError(fmt::format("find_by_code: {}", e.what()));
    }
}

std::optional<Claim> PostgresClaimRepository::find_by_id(int64_t id)
{
    std::lock_guard lock(m_mutex);
    try
    {
        pqxx::work txn(*m_conn);
        auto result = txn.exec_params(
            fmt::format("SELECT {} FROM relay_claims WHERE id = $1", kSelectColumns), id);
        txn.commit();
        if (result.empty())
            return std::nullopt;
        return row_to_claim(result[0]);
    }
    catch (const pqxx::failure &e)
    {
        throw ClaimStorageError(fmt::format("find_by_id: {}", e.what()));
    }
}

int PostgresClaimRepository::try_lock(const std::string &code, TimePoint now, TimePoint until)
{
    std::lock_guard lock(m_mutex);
    try
    {
        pqxx::work txn(*m_conn);
        auto result = txn.exec_params(R"(
            UPDATE relay_claims
               SET locked_at = to_timestamp($2 / 1000.0),
                   lock_expires_at = to_timestamp($3 / 1000.0)
             WHERE code = $1
               AND consumed_at IS NULL
               AND expires_at > to_timestamp($2 / 1000.0)
               AND (locked_at IS NULL OR lock_expires_at <= to_timestamp($2 / 1000.0)))",
                                      code, to_millis(now), to_millis(until));
        txn.commit();
        return static_cast<int>(result.affected_rows());
    }
    catch (const pqxx::failure &e)
    {
        throw ClaimStorageError(fmt::format("try_lock: {}", e.what()));
    }
}

int PostgresClaimRepository::try_consume(int64_t id, const std::string &device_id, TimePoint now)
{
    std::lock_guard lock(m_mutex);
    try
    {
        pqxx::work txn(*m_conn);
        auto result = txn.exec_params(R"(
            UPDATE relay_claims
               SET consumed_at = to_timestamp($2 / 1000.0), device_id = $3
             WHERE id = $1 AND consumed_at IS NULL)",
                                      id, to_millis(now), device_id);
        txn.commit();
        return static_cast<int>(result.affected_rows());
    }
    catch (const pqxx::failure &e)
    {
        throw ClaimStorageError(fmt::format("try_consume: {}", e.what()));
    }
}

size_t PostgresClaimRepository::delete_stale(TimePoint cutoff)
{
    std::lock_guard lock(m_mutex);
    try
    {
        pqxx::work txn(*m_conn);
        auto result = txn.exec_params(R"(
            DELETE FROM relay_claims
             WHERE expires_at < to_timestamp($1 / 1000.0)
                OR (consumed_at IS NOT NULL AND consumed_at < to_timestamp($1 / 1000.0)))",
                                      to_millis(cutoff));
        txn.commit();
        return static_cast<size_t>(result.affected_rows());
    }
    catch (const pqxx::failure &e)
    {
        throw ClaimStorageError(fmt::format("delete_stale: {}", e.what()));
    }
}

std::vector<Claim> PostgresClaimRepository::list_for_instance(const std::string &instance_id,
                                                              bool include_expired,
                                                              bool include_consumed,
                                                              TimePoint now)
{
    std::lock_guard lock(m_mutex);
    try
    {
        pqxx::work txn(*m_conn);
        auto result = txn.exec_params(
            fmt::format(R"(
                SELECT {} FROM relay_claims
                 WHERE instance_id = $1
                   AND ($2 OR expires_at > to_timestamp($4 / 1000.0))
                   AND ($3 OR consumed_at IS NULL)
                 ORDER BY inserted_at DESC, id DESC)",
                        kSelectColumns),
            instance_id, include_expired, include_consumed, to_millis(now));
        txn.commit();

        std::vector<Claim> claims;
        claims.reserve(result.size());
        for (const auto &row : result)
            claims.push_back(row_to_claim(row));
        return claims;
    }
    catch (const pqxx::failure &e)
    {
        throw ClaimStorageError(fmt::format("list_for_instance: {}", e.what()));
    }
}

} // namespace mydiarelay::relay
