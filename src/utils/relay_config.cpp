/**
 * @file relay_config.cpp
 * @brief RelayConfig singleton lifecycle module implementation.
 */
#include "mdr_service.hpp"
#include "utils/relay_config.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

namespace mydiarelay
{

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Module-level state
// ---------------------------------------------------------------------------

static std::atomic<bool> g_relay_config_initialized{false};

static std::mutex g_config_path_mu;
static fs::path g_config_path_override; ///< Set by set_config_path() before startup.

// ---------------------------------------------------------------------------
// Helpers (anonymous namespace)
// ---------------------------------------------------------------------------

namespace
{

fs::path discover_config_dir() noexcept
{
    const std::string exe = platform::get_executable_name(/*include_path=*/true);
    if (exe.empty())
        return {};

    std::error_code ec;
    const fs::path bin = fs::path(exe).parent_path();

    // Staged layout: <root>/bin/ + <root>/config/
    fs::path candidate = bin / ".." / "config";
    if (fs::is_directory(candidate, ec))
        return fs::weakly_canonical(candidate, ec);

    // Flat layout: config/ next to the binary
    candidate = bin / "config";
    if (fs::is_directory(candidate, ec))
        return fs::weakly_canonical(candidate, ec);
    return {};
}

/// Recursively merges `overrides` into `base` (object keys override, arrays replace).
void json_merge(nlohmann::json &base, const nlohmann::json &overrides)
{
    if (!overrides.is_object())
        return;
    for (auto it = overrides.begin(); it != overrides.end(); ++it)
    {
        if (it.value().is_object() && base.contains(it.key()) && base.at(it.key()).is_object())
        {
            json_merge(base[it.key()], it.value());
        }
        else
        {
            base[it.key()] = it.value();
        }
    }
}

/// Returns a null JSON value if the file cannot be opened or parsed.
nlohmann::json read_json_file(const fs::path &path)
{
    std::ifstream f(path);
    if (!f.is_open())
        return nlohmann::json{};
    try
    {
        return nlohmann::json::parse(f);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        LOGGER_ERROR("RelayConfig: '{}' is not valid JSON: {}", path.string(), e.what());
        return nlohmann::json{};
    }
}

template <typename T> T get_checked(const nlohmann::json &section, const char *section_name,
                                    const char *key)
{
    try
    {
        return section.at(key).get<T>();
    }
    catch (const nlohmann::json::exception &e)
    {
        throw std::runtime_error(
            fmt::format("RelayConfig: invalid value for '{}.{}': {}", section_name, key, e.what()));
    }
}

std::chrono::seconds positive_seconds(const nlohmann::json &section, const char *section_name,
                                      const char *key)
{
    const auto v = get_checked<int64_t>(section, section_name, key);
    if (v <= 0)
    {
        throw std::runtime_error(
            fmt::format("RelayConfig: '{}.{}' must be positive (got {})", section_name, key, v));
    }
    return std::chrono::seconds(v);
}

size_t positive_count(const nlohmann::json &section, const char *key)
{
    const auto v = get_checked<int64_t>(section, "requests", key);
    if (v <= 0)
        throw std::runtime_error(fmt::format("RelayConfig: 'requests.{}' must be positive", key));
    return static_cast<size_t>(v);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// RelayConfig::Impl
// ---------------------------------------------------------------------------

struct RelayConfig::Impl
{
    std::string relay_endpoint{"tcp://0.0.0.0:5580"};
    bool use_curve{false};
    std::chrono::seconds heartbeat_timeout{60};
    std::chrono::seconds session_timeout{300};

    std::chrono::seconds claim_ttl{300};
    std::chrono::seconds lock_ttl{15};
    size_t code_length{8};
    std::string claims_backend{"memory"};
    std::string database_url;

    std::string namespace_secret{kDefaultNamespaceSecret};
    std::string token_secret;

    std::vector<std::string> ice_servers{"stun:stun.l.google.com:19302"};
    std::chrono::seconds negotiation_timeout{30};

    std::chrono::milliseconds request_timeout{30000};
    size_t max_relay_requests{256};
    size_t max_relay_requests_per_session{32};

    std::string log_file;
    std::string log_level{"info"};

    fs::path config_dir;
    nlohmann::json merged = nlohmann::json::object();

    void apply_json(const nlohmann::json &j)
    {
        if (!j.is_object())
            throw std::runtime_error("RelayConfig: top-level JSON must be an object");

        if (j.contains("relay"))
        {
            const auto &r = j.at("relay");
            if (r.contains("endpoint"))
                relay_endpoint = get_checked<std::string>(r, "relay", "endpoint");
            if (r.contains("use_curve"))
                use_curve = get_checked<bool>(r, "relay", "use_curve");
            if (r.contains("heartbeat_timeout_s"))
                heartbeat_timeout = positive_seconds(r, "relay", "heartbeat_timeout_s");
            if (r.contains("session_timeout_s"))
                session_timeout = positive_seconds(r, "relay", "session_timeout_s");
        }
        if (j.contains("claims"))
        {
            const auto &c = j.at("claims");
            if (c.contains("ttl_s"))
                claim_ttl = positive_seconds(c, "claims", "ttl_s");
            if (c.contains("lock_ttl_s"))
                lock_ttl = positive_seconds(c, "claims", "lock_ttl_s");
            if (c.contains("code_length"))
            {
                const auto len = get_checked<int64_t>(c, "claims", "code_length");
                if (len < 4 || len > 32)
                {
                    throw std::runtime_error(fmt::format(
                        "RelayConfig: 'claims.code_length' must be in [4, 32] (got {})", len));
                }
                code_length = static_cast<size_t>(len);
            }
            if (c.contains("backend"))
            {
                claims_backend = get_checked<std::string>(c, "claims", "backend");
                if (claims_backend != "memory" && claims_backend != "postgres")
                {
                    throw std::runtime_error(fmt::format(
                        "RelayConfig: unknown claims.backend '{}'", claims_backend));
                }
            }
            if (c.contains("database_url") && !c.at("database_url").is_null())
                database_url = get_checked<std::string>(c, "claims", "database_url");
        }
        if (j.contains("security"))
        {
            const auto &s = j.at("security");
            if (s.contains("namespace_secret") && !s.at("namespace_secret").is_null())
                namespace_secret = get_checked<std::string>(s, "security", "namespace_secret");
            if (s.contains("token_secret") && !s.at("token_secret").is_null())
                token_secret = get_checked<std::string>(s, "security", "token_secret");
        }
        if (j.contains("webrtc"))
        {
            const auto &w = j.at("webrtc");
            if (w.contains("ice_servers"))
                ice_servers = get_checked<std::vector<std::string>>(w, "webrtc", "ice_servers");
            if (w.contains("negotiation_timeout_s"))
                negotiation_timeout = positive_seconds(w, "webrtc", "negotiation_timeout_s");
        }
        if (j.contains("requests"))
        {
            const auto &q = j.at("requests");
            if (q.contains("timeout_ms"))
            {
                const auto ms = get_checked<int64_t>(q, "requests", "timeout_ms");
                if (ms <= 0)
                    throw std::runtime_error("RelayConfig: 'requests.timeout_ms' must be positive");
                request_timeout = std::chrono::milliseconds(ms);
            }
            if (q.contains("max_in_flight"))
                max_relay_requests = positive_count(q, "max_in_flight");
            if (q.contains("max_in_flight_per_session"))
                max_relay_requests_per_session = positive_count(q, "max_in_flight_per_session");
        }
        if (j.contains("logging"))
        {
            const auto &l = j.at("logging");
            if (l.contains("file") && !l.at("file").is_null())
                log_file = get_checked<std::string>(l, "logging", "file");
            if (l.contains("level"))
            {
                log_level = get_checked<std::string>(l, "logging", "level");
                if (!utils::parse_log_level(log_level))
                {
                    throw std::runtime_error(
                        fmt::format("RelayConfig: unknown logging.level '{}'", log_level));
                }
            }
        }
        json_merge(merged, j);
    }

    void apply_env()
    {
        if (const char *env = std::getenv("MYDIARELAY_ENDPOINT"))
            relay_endpoint = env;
        if (const char *env = std::getenv("MYDIARELAY_NAMESPACE_SECRET"))
            namespace_secret = env;
        if (const char *env = std::getenv("MYDIARELAY_TOKEN_SECRET"))
            token_secret = env;
        if (const char *env = std::getenv("MYDIARELAY_DATABASE_URL"))
            database_url = env;
        if (const char *env = std::getenv("MYDIARELAY_LOG_FILE"))
            log_file = env;
    }

    void load_single_file(const fs::path &file, const char *origin)
    {
        config_dir = file.parent_path();
        nlohmann::json j = read_json_file(file);
        if (!j.is_null())
        {
            LOGGER_INFO("RelayConfig: loading {} '{}'", origin, file.string());
            apply_json(j);
        }
        else
        {
            LOGGER_WARN("RelayConfig: {} '{}' not readable; using defaults", origin,
                        file.string());
        }
    }

    void load(const fs::path &override_path)
    {
        if (!override_path.empty())
        {
            load_single_file(override_path, "override file");
        }
        else if (const char *env = std::getenv("MYDIARELAY_CONFIG_FILE"))
        {
            load_single_file(fs::path(env), "MYDIARELAY_CONFIG_FILE");
        }
        else if (fs::path dir = discover_config_dir(); !dir.empty())
        {
            config_dir = dir;
            nlohmann::json layered = nlohmann::json::object();

            const fs::path def_file = dir / "relay.default.json";
            nlohmann::json jdef = read_json_file(def_file);
            if (!jdef.is_null())
            {
                LOGGER_INFO("RelayConfig: loading defaults from '{}'", def_file.string());
                json_merge(layered, jdef);
            }
            else
            {
                LOGGER_INFO("RelayConfig: relay.default.json not found; using built-in defaults");
            }

            const fs::path user_file = dir / "relay.user.json";
            nlohmann::json juser = read_json_file(user_file);
            if (!juser.is_null())
            {
                LOGGER_INFO("RelayConfig: merging user overrides from '{}'", user_file.string());
                json_merge(layered, juser);
            }

            apply_json(layered);
        }
        else
        {
            LOGGER_INFO("RelayConfig: no config directory found; using built-in defaults");
        }

        apply_env();

        LOGGER_INFO("RelayConfig: relay_endpoint    = {}", relay_endpoint);
        LOGGER_INFO("RelayConfig: use_curve         = {}", use_curve);
        LOGGER_INFO("RelayConfig: claims_backend    = {}", claims_backend);
        LOGGER_INFO("RelayConfig: claim_ttl         = {}s (lock {}s)", claim_ttl.count(),
                    lock_ttl.count());
        LOGGER_INFO("RelayConfig: token auth        = {}",
                    token_secret.empty() ? "disabled" : "enabled");
        if (namespace_secret == kDefaultNamespaceSecret)
        {
            LOGGER_WARN("RelayConfig: security.namespace_secret not set; using the public "
                        "default key");
        }
    }
};

// ---------------------------------------------------------------------------
// RelayConfig public interface
// ---------------------------------------------------------------------------

RelayConfig::RelayConfig() : pImpl(std::make_unique<Impl>()) {}
RelayConfig::~RelayConfig() = default;
RelayConfig::RelayConfig(RelayConfig &&) noexcept = default;
RelayConfig &RelayConfig::operator=(RelayConfig &&) noexcept = default;

// static
void RelayConfig::set_config_path(const fs::path &path)
{
    std::lock_guard lock(g_config_path_mu);
    g_config_path_override = path;
}

// static
RelayConfig &RelayConfig::get_instance()
{
    static RelayConfig instance;
    return instance;
}

// static
bool RelayConfig::lifecycle_initialized() noexcept
{
    return g_relay_config_initialized.load(std::memory_order_acquire);
}

void RelayConfig::apply_json(const nlohmann::json &j) { pImpl->apply_json(j); }
void RelayConfig::apply_env() { pImpl->apply_env(); }
void RelayConfig::load(const fs::path &override_path) { pImpl->load(override_path); }

const std::string &RelayConfig::relay_endpoint() const noexcept { return pImpl->relay_endpoint; }
bool RelayConfig::use_curve() const noexcept { return pImpl->use_curve; }
std::chrono::seconds RelayConfig::heartbeat_timeout() const noexcept { return pImpl->heartbeat_timeout; }
std::chrono::seconds RelayConfig::session_timeout() const noexcept { return pImpl->session_timeout; }

std::chrono::seconds RelayConfig::claim_ttl() const noexcept { return pImpl->claim_ttl; }
std::chrono::seconds RelayConfig::lock_ttl() const noexcept { return pImpl->lock_ttl; }
size_t RelayConfig::code_length() const noexcept { return pImpl->code_length; }
const std::string &RelayConfig::claims_backend() const noexcept { return pImpl->claims_backend; }
const std::string &RelayConfig::database_url() const noexcept { return pImpl->database_url; }

const std::string &RelayConfig::namespace_secret() const noexcept { return pImpl->namespace_secret; }
const std::string &RelayConfig::token_secret() const noexcept { return pImpl->token_secret; }

const std::vector<std::string> &RelayConfig::ice_servers() const noexcept { return pImpl->ice_servers; }
std::chrono::seconds RelayConfig::negotiation_timeout() const noexcept { return pImpl->negotiation_timeout; }

std::chrono::milliseconds RelayConfig::request_timeout() const noexcept { return pImpl->request_timeout; }
size_t RelayConfig::max_relay_requests() const noexcept { return pImpl->max_relay_requests; }
size_t RelayConfig::max_relay_requests_per_session() const noexcept
{
    return pImpl->max_relay_requests_per_session;
}

const std::string &RelayConfig::log_file() const noexcept { return pImpl->log_file; }
const std::string &RelayConfig::log_level() const noexcept { return pImpl->log_level; }

const fs::path &RelayConfig::config_dir() const noexcept { return pImpl->config_dir; }
const nlohmann::json &RelayConfig::merged_json() const noexcept { return pImpl->merged; }

// ---------------------------------------------------------------------------
// Lifecycle startup / shutdown
// ---------------------------------------------------------------------------

namespace
{
void do_relay_config_startup(const char * /*arg*/)
{
    fs::path override_path;
    {
        std::lock_guard lock(g_config_path_mu);
        override_path = g_config_path_override;
    }
    RelayConfig::get_instance().load(override_path);
    g_relay_config_initialized.store(true, std::memory_order_release);
}

void do_relay_config_shutdown(const char * /*arg*/)
{
    g_relay_config_initialized.store(false, std::memory_order_release);
}
} // namespace

// static
utils::ModuleDef RelayConfig::GetLifecycleModule()
{
    utils::ModuleDef module("mydiarelay::RelayConfig");
    module.add_dependency("mydiarelay::utils::Logger");
    module.add_dependency("CryptoUtils");
    module.set_startup(&do_relay_config_startup);
    module.set_shutdown(&do_relay_config_shutdown, std::chrono::milliseconds(500));
    return module;
}

} // namespace mydiarelay
