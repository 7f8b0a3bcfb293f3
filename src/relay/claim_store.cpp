#include "mdr_service.hpp"
#include "relay/claim_store.hpp"

#if defined(MYDIARELAY_WITH_POSTGRES)
#include "relay/postgres_claim_repository.hpp"
#endif

#include <algorithm>

namespace mydiarelay::relay
{

using utils::ClaimError;

// ============================================================================
// InMemoryClaimRepository
// ============================================================================

std::optional<Claim> InMemoryClaimRepository::insert(const Claim &claim)
{
    std::lock_guard lock(m_mutex);
    if (m_by_code.count(claim.code) != 0)
        return std::nullopt;
    Claim stored = claim;
    stored.id = m_next_id++;
    m_code_by_id.emplace(stored.id, stored.code);
    m_by_code.emplace(stored.code, stored);
    return stored;
}

std::optional<Claim> InMemoryClaimRepository::find_by_code(const std::string &code)
{
    std::lock_guard lock(m_mutex);
    auto it = m_by_code.find(code);
    if (it == m_by_code.end())
        return std::nullopt;
    return it->second;
}

std::optional<Claim> InMemoryClaimRepository::find_by_id(int64_t id)
{
    std::lock_guard lock(m_mutex);
    auto idx = m_code_by_id.find(id);
    if (idx == m_code_by_id.end())
        return std::nullopt;
    return m_by_code.at(idx->second);
}

int InMemoryClaimRepository::try_lock(const std::string &code, TimePoint now, TimePoint until)
{
    std::lock_guard lock(m_mutex);
    auto it = m_by_code.find(code);
    if (it == m_by_code.end() || !is_lockable(it->second, now))
        return 0;
    it->second.locked_at = now;
    it->second.lock_expires_at = until;
    return 1;
}

int InMemoryClaimRepository::try_consume(int64_t id, const std::string &device_id, TimePoint now)
{
    std::lock_guard lock(m_mutex);
    auto idx = m_code_by_id.find(id);
    if (idx == m_code_by_id.end())
        return 0;
    Claim &claim = m_by_code.at(idx->second);
    if (is_consumed(claim))
        return 0;
    claim.consumed_at = now;
    claim.device_id = device_id;
    return 1;
}

size_t InMemoryClaimRepository::delete_stale(TimePoint cutoff)
{
    std::lock_guard lock(m_mutex);
    size_t removed = 0;
    for (auto it = m_by_code.begin(); it != m_by_code.end();)
    {
        const Claim &c = it->second;
        const bool stale = c.expires_at < cutoff || (c.consumed_at && *c.consumed_at < cutoff);
        if (stale)
        {
            m_code_by_id.erase(c.id);
            it = m_by_code.erase(it);
            ++removed;
        }
        else
        {
            ++it;
        }
    }
    return removed;
}

std::vector<Claim> InMemoryClaimRepository::list_for_instance(const std::string &instance_id,
                                                              bool include_expired,
                                                              bool include_consumed,
                                                              TimePoint now)
{
    std::vector<Claim> out;
    {
        std::lock_guard lock(m_mutex);
        for (const auto &[code, c] : m_by_code)
        {
            if (c.instance_id != instance_id)
                continue;
            if (!include_expired && is_expired(c, now))
                continue;
            if (!include_consumed && is_consumed(c))
                continue;
            out.push_back(c);
        }
    }
    std::sort(out.begin(), out.end(), [](const Claim &a, const Claim &b) {
        return a.inserted_at != b.inserted_at ? a.inserted_at > b.inserted_at : a.id > b.id;
    });
    return out;
}

// ============================================================================
// ClaimStore
// ============================================================================

ClaimStore::ClaimStore(std::shared_ptr<ClaimRepository> repository, ClaimStoreOptions options,
                       ClockFn clock)
    : m_repo(std::move(repository)), m_options(std::move(options)),
      m_clock(clock ? std::move(clock) : ClockFn([] { return Clock::now(); })),
      m_namespace(m_options.namespace_secret)
{
    if (!m_repo)
        throw std::invalid_argument("ClaimStore: repository must not be null");
}

ClaimStore::ClaimResult<Claim> ClaimStore::create_claim(const std::string &instance_id,
                                                        const std::string &requester_ref)
{
    return create_claim(instance_id, requester_ref, m_options.claim_ttl);
}

ClaimStore::ClaimResult<Claim> ClaimStore::create_claim(const std::string &instance_id,
                                                        const std::string &requester_ref,
                                                        std::chrono::seconds ttl)
{
    try
    {
        for (int attempt = 1; attempt <= m_options.max_create_attempts; ++attempt)
        {
            const TimePoint now = m_clock();
            Claim claim;
            claim.code = generate_code(m_options.code_length);
            claim.instance_id = instance_id;
            claim.requester_ref = requester_ref;
            claim.expires_at = now + ttl;
            claim.inserted_at = now;

            if (auto stored = m_repo->insert(claim))
            {
                LOGGER_INFO("ClaimStore: created claim {} for instance '{}' (ttl {}s)",
                            stored->id, instance_id, ttl.count());
                return ClaimResult<Claim>::ok(std::move(*stored));
            }
            LOGGER_DEBUG("ClaimStore: code collision on attempt {}, regenerating", attempt);
        }
        LOGGER_ERROR("ClaimStore: no unique code after {} attempts",
                     m_options.max_create_attempts);
    }
    catch (const ClaimStorageError &e)
    {
        LOGGER_ERROR("ClaimStore: create_claim failed: {}", e.what());
    }
    return ClaimResult<Claim>::error(ClaimError::StorageFailure);
}

ClaimStore::ClaimResult<ClaimResolution> ClaimStore::resolve_claim(const std::string &code)
{
    const std::string normalized = normalize_code(code);
    std::optional<Claim> claim;
    try
    {
        claim = m_repo->find_by_code(normalized);
    }
    catch (const ClaimStorageError &e)
    {
        LOGGER_ERROR("ClaimStore: resolve_claim failed: {}", e.what());
        return ClaimResult<ClaimResolution>::error(ClaimError::StorageFailure);
    }

    if (!claim)
        return ClaimResult<ClaimResolution>::error(ClaimError::NotFound);
    if (is_consumed(*claim))
        return ClaimResult<ClaimResolution>::error(ClaimError::AlreadyConsumed);
    if (is_expired(*claim, m_clock()))
        return ClaimResult<ClaimResolution>::error(ClaimError::Expired);

    ClaimResolution res;
    res.claim_id = claim->id;
    res.instance_id = claim->instance_id;
    res.namespace_id = m_namespace.derive_namespace(normalized, epoch_of(m_clock()));
    res.expires_at = claim->expires_at;
    res.rendezvous_points = m_options.ice_servers;
    return ClaimResult<ClaimResolution>::ok(std::move(res));
}

ClaimStore::ClaimResult<Claim> ClaimStore::lock_claim(const std::string &code)
{
    const std::string normalized = normalize_code(code);
    try
    {
        const TimePoint now = m_clock();
        if (m_repo->try_lock(normalized, now, now + m_options.lock_ttl) == 1)
        {
            auto locked = m_repo->find_by_code(normalized);
            if (!locked)
                return ClaimResult<Claim>::error(ClaimError::NotFound);
            LOGGER_DEBUG("ClaimStore: locked claim {}", locked->id);
            return ClaimResult<Claim>::ok(std::move(*locked));
        }

        // Zero rows: classify from the current row state.
        auto claim = m_repo->find_by_code(normalized);
        if (!claim)
            return ClaimResult<Claim>::error(ClaimError::NotFound);
        if (is_consumed(*claim))
            return ClaimResult<Claim>::error(ClaimError::AlreadyConsumed);
        if (is_expired(*claim, now))
            return ClaimResult<Claim>::error(ClaimError::Expired);
        return ClaimResult<Claim>::error(ClaimError::Locked);
    }
    catch (const ClaimStorageError &e)
    {
        LOGGER_ERROR("ClaimStore: lock_claim failed: {}", e.what());
        return ClaimResult<Claim>::error(ClaimError::StorageFailure);
    }
}

ClaimStore::ClaimResult<Claim> ClaimStore::consume_claim(const std::string &instance_id,
                                                         int64_t claim_id,
                                                         const std::string &device_id)
{
    try
    {
        auto claim = m_repo->find_by_id(claim_id);
        if (!claim)
            return ClaimResult<Claim>::error(ClaimError::NotFound);
        if (claim->instance_id != instance_id)
        {
            LOGGER_WARN("ClaimStore: instance '{}' tried to consume claim {} owned by '{}'",
                        instance_id, claim_id, claim->instance_id);
            return ClaimResult<Claim>::error(ClaimError::Unauthorized);
        }
        if (m_repo->try_consume(claim_id, device_id, m_clock()) == 0)
            return ClaimResult<Claim>::error(ClaimError::AlreadyConsumed);

        auto consumed = m_repo->find_by_id(claim_id);
        if (!consumed)
            return ClaimResult<Claim>::error(ClaimError::NotFound);
        LOGGER_INFO("ClaimStore: claim {} consumed by device '{}'", claim_id, device_id);
        return ClaimResult<Claim>::ok(std::move(*consumed));
    }
    catch (const ClaimStorageError &e)
    {
        LOGGER_ERROR("ClaimStore: consume_claim failed: {}", e.what());
        return ClaimResult<Claim>::error(ClaimError::StorageFailure);
    }
}

ClaimStore::ClaimResult<size_t> ClaimStore::cleanup_claims(std::chrono::seconds max_age)
{
    try
    {
        const size_t removed = m_repo->delete_stale(m_clock() - max_age);
        if (removed > 0)
            LOGGER_INFO("ClaimStore: cleaned up {} stale claim(s)", removed);
        return ClaimResult<size_t>::ok(removed);
    }
    catch (const ClaimStorageError &e)
    {
        LOGGER_ERROR("ClaimStore: cleanup_claims failed: {}", e.what());
        return ClaimResult<size_t>::error(ClaimError::StorageFailure);
    }
}

ClaimStore::ClaimResult<std::vector<Claim>>
ClaimStore::list_claims(const std::string &instance_id, bool include_expired,
                        bool include_consumed)
{
    try
    {
        return ClaimResult<std::vector<Claim>>::ok(
            m_repo->list_for_instance(instance_id, include_expired, include_consumed, m_clock()));
    }
    catch (const ClaimStorageError &e)
    {
        LOGGER_ERROR("ClaimStore: list_claims failed: {}", e.what());
        return ClaimResult<std::vector<Claim>>::error(ClaimError::StorageFailure);
    }
}

// ============================================================================
// Backend factory
// ============================================================================

std::shared_ptr<ClaimRepository> make_claim_repository(const std::string &backend,
                                                       const std::string &database_url)
{
    if (backend == "memory")
        return std::make_shared<InMemoryClaimRepository>();
    if (backend == "postgres")
    {
#if defined(MYDIARELAY_WITH_POSTGRES)
        return std::make_shared<PostgresClaimRepository>(database_url);
#else
        (void)database_url;
        throw std::runtime_error(
            "claims.backend is 'postgres' but this build has no PostgreSQL support "
            "(configure with -DMYDIARELAY_WITH_POSTGRES=ON)");
#endif
    }
    throw std::runtime_error(fmt::format("unknown claims backend '{}'", backend));
}

} // namespace mydiarelay::relay
