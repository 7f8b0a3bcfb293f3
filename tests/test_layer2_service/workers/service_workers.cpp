// tests/test_layer2_service/workers/service_workers.cpp
#include "service_workers.h"
#include "shared_test_helpers.h"
#include "test_entrypoint.h"
#include "mdr_service.hpp"

#include <gtest/gtest.h>

#include <fstream>

using namespace mydiarelay::tests::helper;
using namespace mydiarelay::utils;

namespace mydiarelay::tests::worker
{
namespace logger
{

int basic_file_logging(const std::string &log_path)
{
    return run_gtest_worker(
        [&]()
        {
            ASSERT_TRUE(Logger::instance().set_logfile(log_path));
            LOGGER_INFO("relay listening on {}", "tcp://127.0.0.1:5580");
            Logger::instance().flush();

            std::string contents;
            ASSERT_TRUE(read_file_contents(log_path, contents));
            EXPECT_NE(contents.find("relay listening on tcp://127.0.0.1:5580"),
                      std::string::npos);
        },
        "logger::basic_file_logging", Logger::GetLifecycleModule());
}

int level_filtering(const std::string &log_path)
{
    return run_gtest_worker(
        [&]()
        {
            Logger &L = Logger::instance();
            L.set_log_sink_messages_enabled(false);
            ASSERT_TRUE(L.set_logfile(log_path));
            auto level = parse_log_level("warn");
            ASSERT_TRUE(level.has_value());
            L.set_level(*level);

            LOGGER_DEBUG("debug-should-not-appear");
            LOGGER_INFO("info-should-not-appear");
            LOGGER_WARN("warn-should-appear");
            L.flush();

            std::string contents;
            ASSERT_TRUE(read_file_contents(log_path, contents));
            EXPECT_EQ(contents.find("debug-should-not-appear"), std::string::npos);
            EXPECT_EQ(contents.find("info-should-not-appear"), std::string::npos);
            EXPECT_NE(contents.find("warn-should-appear"), std::string::npos);
        },
        "logger::level_filtering", Logger::GetLifecycleModule());
}

int unwritable_logfile(const std::string &log_path)
{
    return run_gtest_worker(
        [&]()
        {
            Logger &L = Logger::instance();
            {
                std::ofstream blocker(log_path);
                ASSERT_TRUE(blocker.good());
            }
            // A regular file where a directory is expected.
            const std::string nested = log_path + "/relay.log";
            EXPECT_FALSE(L.set_logfile(nested));
            LOGGER_INFO("still-on-console");
            L.flush();

            const std::string fallback = log_path + ".ok";
            ASSERT_TRUE(L.set_logfile(fallback));
            LOGGER_INFO("after-sink-error");
            L.flush();

            std::string contents;
            ASSERT_TRUE(read_file_contents(fallback, contents));
            EXPECT_NE(contents.find("after-sink-error"), std::string::npos);
            EXPECT_EQ(contents.find("still-on-console"), std::string::npos);
        },
        "logger::unwritable_logfile", Logger::GetLifecycleModule());
}

} // namespace logger

namespace config
{

int module_loads_file(const std::string &config_path)
{
    mydiarelay::RelayConfig::set_config_path(config_path);
    return run_gtest_worker(
        [&]()
        {
            ASSERT_TRUE(mydiarelay::RelayConfig::lifecycle_initialized());
            const auto &cfg = mydiarelay::RelayConfig::get_instance();
            EXPECT_EQ(cfg.relay_endpoint(), "tcp://127.0.0.1:6001");
            EXPECT_EQ(cfg.code_length(), 6u);
            EXPECT_EQ(cfg.namespace_secret(), "worker-namespace-secret");
            EXPECT_EQ(cfg.config_dir(), fs::path(config_path).parent_path());
        },
        "config::module_loads_file", Logger::GetLifecycleModule(),
        mydiarelay::crypto::GetLifecycleModule(), mydiarelay::RelayConfig::GetLifecycleModule());
}

} // namespace config
} // namespace mydiarelay::tests::worker

namespace
{
struct ServiceWorkerRegistrar
{
    ServiceWorkerRegistrar()
    {
        register_worker_dispatcher(
            [](int argc, char **argv) -> int
            {
                if (argc < 2)
                    return -1;
                std::string_view mode = argv[1];
                auto dot = mode.find('.');
                if (dot == std::string_view::npos)
                    return -1;
                std::string_view module = mode.substr(0, dot);
                if (module != "logger" && module != "config")
                    return -1;
                std::string scenario(mode.substr(dot + 1));
                if (argc < 3)
                {
                    fmt::print(stderr, "ERROR: {} scenario '{}' needs a path argument\n", module,
                               scenario);
                    return 1;
                }
                using namespace mydiarelay::tests::worker;
                if (module == "logger" && scenario == "basic_file_logging")
                    return logger::basic_file_logging(argv[2]);
                if (module == "logger" && scenario == "level_filtering")
                    return logger::level_filtering(argv[2]);
                if (module == "logger" && scenario == "unwritable_logfile")
                    return logger::unwritable_logfile(argv[2]);
                if (module == "config" && scenario == "module_loads_file")
                    return config::module_loads_file(argv[2]);
                fmt::print(stderr, "ERROR: Unknown {} scenario '{}'\n", module, scenario);
                return 1;
            });
    }
};
static ServiceWorkerRegistrar g_service_registrar;
} // namespace
