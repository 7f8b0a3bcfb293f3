#pragma once

/**
 * @file relay_config.hpp
 * @brief RelayConfig: relay configuration singleton lifecycle module.
 *
 * ## Lifecycle
 *
 * @code
 *   LifecycleGuard lifecycle(MakeModDefList(
 *       Logger::GetLifecycleModule(),
 *       mydiarelay::crypto::GetLifecycleModule(),
 *       RelayConfig::GetLifecycleModule()));
 * @endcode
 *
 * Startup order: `Logger → CryptoUtils → RelayConfig`
 *
 * ## Config loading (priority low → high)
 *
 *  1. Built-in C++ defaults
 *  2. `config/relay.default.json`, staged by the build system
 *  3. `config/relay.user.json`, deployment customisations merged on top
 *  4. `MYDIARELAY_CONFIG_FILE` (or set_config_path()): a single explicit file that
 *     replaces layers 2 and 3
 *  5. Environment overrides: `MYDIARELAY_ENDPOINT`, `MYDIARELAY_NAMESPACE_SECRET`,
 *     `MYDIARELAY_TOKEN_SECRET`, `MYDIARELAY_DATABASE_URL`, `MYDIARELAY_LOG_FILE`
 *
 * The config directory is `<binary_dir>/../config/` or `<binary_dir>/config/`.
 * Without one, the built-in defaults apply.
 */

#include "mydiarelay_utils_export.h"
#include "utils/module_def.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace mydiarelay
{

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

/**
 * @class RelayConfig
 * @brief Owns the relay's resolved configuration.
 *
 * The singleton is populated once by the lifecycle startup and is read-only afterwards.
 * Standalone instances (built-in defaults plus apply_json()) are used by components
 * constructed outside the lifecycle.
 */
class MYDIARELAY_UTILS_EXPORT RelayConfig
{
  public:
    /// Public fallback key for namespace derivation when no secret is configured.
    static constexpr const char *kDefaultNamespaceSecret = "mydia-claim-namespace-v1";

    /**
     * @brief Overrides the config file path. Must be called before the module starts.
     */
    static void set_config_path(const std::filesystem::path &path);

    /// @brief Module "mydiarelay::RelayConfig". Depends on Logger and CryptoUtils.
    static utils::ModuleDef GetLifecycleModule();

    /**
     * @brief Returns the global instance.
     * @pre The lifecycle module is started.
     */
    static RelayConfig &get_instance();

    static bool lifecycle_initialized() noexcept;

    /// @brief Built-in defaults only.
    RelayConfig();
    ~RelayConfig();
    RelayConfig(RelayConfig &&) noexcept;
    RelayConfig &operator=(RelayConfig &&) noexcept;
    RelayConfig(const RelayConfig &) = delete;
    RelayConfig &operator=(const RelayConfig &) = delete;

    /**
     * @brief Applies the known keys of @p j on top of the current values.
     * @throws std::runtime_error if a key has the wrong type or an out-of-range value.
     */
    void apply_json(const nlohmann::json &j);

    /// @brief Applies the `MYDIARELAY_*` environment overrides.
    void apply_env();

    /**
     * @brief Full layered load. An empty @p override_path means discovery from the binary
     *        location and `MYDIARELAY_CONFIG_FILE`.
     */
    void load(const std::filesystem::path &override_path);

    // ---- relay ----
    const std::string &relay_endpoint() const noexcept;
    bool use_curve() const noexcept;
    std::chrono::seconds heartbeat_timeout() const noexcept;
    std::chrono::seconds session_timeout() const noexcept;

    // ---- claims ----
    std::chrono::seconds claim_ttl() const noexcept;
    std::chrono::seconds lock_ttl() const noexcept;
    size_t code_length() const noexcept;
    /// "memory" or "postgres".
    const std::string &claims_backend() const noexcept;
    const std::string &database_url() const noexcept;

    // ---- security ----
    const std::string &namespace_secret() const noexcept;
    /// Empty means instance registration is not token-checked.
    const std::string &token_secret() const noexcept;

    // ---- webrtc ----
    const std::vector<std::string> &ice_servers() const noexcept;
    std::chrono::seconds negotiation_timeout() const noexcept;

    // ---- requests ----
    std::chrono::milliseconds request_timeout() const noexcept;
    /// Concurrent relay_requests overall and per requesting session.
    size_t max_relay_requests() const noexcept;
    size_t max_relay_requests_per_session() const noexcept;

    // ---- logging ----
    const std::string &log_file() const noexcept;
    const std::string &log_level() const noexcept;

    const std::filesystem::path &config_dir() const noexcept;

    /// @brief The merged JSON document the values were read from.
    const nlohmann::json &merged_json() const noexcept;

  private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

} // namespace mydiarelay
