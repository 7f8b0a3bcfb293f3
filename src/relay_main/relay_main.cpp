#include "mdr_service.hpp"
#include "relay/claim_store.hpp"
#include "relay/relay_service.hpp"
#include "relay/zmq_context.hpp"

#include <condition_variable>
#include <csignal>
#include <mutex>
#include <thread>

namespace
{
mydiarelay::relay::RelayService *g_relay = nullptr; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

constexpr std::chrono::minutes kCleanupInterval{10};

void signal_handler(int /*sig*/)
{
    if (g_relay != nullptr)
    {
        g_relay->stop();
    }
}

void apply_logging(const mydiarelay::RelayConfig &cfg)
{
    auto &logger = mydiarelay::utils::Logger::instance();
    if (auto lvl = mydiarelay::utils::parse_log_level(cfg.log_level()))
        logger.set_level(*lvl);
    if (!cfg.log_file().empty() && !logger.set_logfile(cfg.log_file()))
        LOGGER_WARN("mydiarelay-relay: cannot log to '{}'; staying on console", cfg.log_file());
}

// Periodically drops claims that expired or were consumed long ago.
class ClaimJanitor
{
  public:
    explicit ClaimJanitor(std::shared_ptr<mydiarelay::relay::ClaimStore> claims)
        : m_claims(std::move(claims)), m_thread([this] { run(); })
    {
    }

    ~ClaimJanitor()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_stop = true;
        }
        m_cv.notify_all();
        m_thread.join();
    }

    ClaimJanitor(const ClaimJanitor &) = delete;
    ClaimJanitor &operator=(const ClaimJanitor &) = delete;

  private:
    void run()
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        while (!m_cv.wait_for(lock, kCleanupInterval, [this] { return m_stop; }))
        {
            lock.unlock();
            auto removed = m_claims->cleanup_claims();
            if (removed.is_ok() && removed.content() > 0)
                LOGGER_INFO("mydiarelay-relay: removed {} stale claims", removed.content());
            else if (removed.is_error())
                LOGGER_WARN("mydiarelay-relay: claim cleanup failed: {}",
                            mydiarelay::utils::to_string(removed.error()));
            lock.lock();
        }
    }

    std::shared_ptr<mydiarelay::relay::ClaimStore> m_claims;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_stop{false};
    std::thread m_thread;
};

} // namespace

int main(int argc, char *argv[])
{
    if (argc >= 2) // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    {
        mydiarelay::RelayConfig::set_config_path(argv[1]); // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }

    mydiarelay::utils::LifecycleGuard lifecycle(mydiarelay::utils::MakeModDefList(
        mydiarelay::utils::Logger::GetLifecycleModule(), mydiarelay::crypto::GetLifecycleModule(),
        mydiarelay::relay::GetZMQContextModule(), mydiarelay::RelayConfig::GetLifecycleModule()));

    const auto &cfg = mydiarelay::RelayConfig::get_instance();
    apply_logging(cfg);

    std::shared_ptr<mydiarelay::relay::ClaimStore> claims;
    try
    {
        mydiarelay::relay::ClaimStoreOptions opts;
        opts.claim_ttl = cfg.claim_ttl();
        opts.lock_ttl = cfg.lock_ttl();
        opts.code_length = cfg.code_length();
        opts.ice_servers = cfg.ice_servers();
        opts.namespace_secret = cfg.namespace_secret();
        claims = std::make_shared<mydiarelay::relay::ClaimStore>(
            mydiarelay::relay::make_claim_repository(cfg.claims_backend(), cfg.database_url()),
            std::move(opts));
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR_SYNC("mydiarelay-relay: claim storage unavailable: {}", e.what());
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto relay_cfg = mydiarelay::relay::RelayService::config_from(cfg, claims);
    relay_cfg.on_ready = [](const std::string &endpoint, const std::string &pubkey) {
        if (pubkey.empty())
            LOGGER_INFO("mydiarelay-relay {} listening on {}",
                        mydiarelay::platform::get_version_string(), endpoint);
        else
            LOGGER_INFO("mydiarelay-relay {} listening on {} (curve key {})",
                        mydiarelay::platform::get_version_string(), endpoint, pubkey);
    };

    mydiarelay::relay::RelayService relay(std::move(relay_cfg));
    g_relay = &relay;
    ClaimJanitor janitor(claims);

    try
    {
        relay.run();
    }
    catch (const zmq::error_t &e)
    {
        g_relay = nullptr;
        LOGGER_ERROR_SYNC("mydiarelay-relay: cannot serve {}: {}", cfg.relay_endpoint(), e.what());
        return 1;
    }
    g_relay = nullptr;

    LOGGER_INFO("mydiarelay-relay stopped: {}", relay.status_json_str());
    return 0;
}
