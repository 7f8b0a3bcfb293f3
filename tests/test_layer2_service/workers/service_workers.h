// tests/test_layer2_service/workers/service_workers.h
#pragma once
/**
 * @file service_workers.h
 * @brief Workers for the Logger file sink and the RelayConfig lifecycle module.
 */
#include <string>

namespace mydiarelay::tests::worker
{
namespace logger
{
int basic_file_logging(const std::string &log_path);
int level_filtering(const std::string &log_path);
int unwritable_logfile(const std::string &log_path);
} // namespace logger

namespace config
{
int module_loads_file(const std::string &config_path);
} // namespace config
} // namespace mydiarelay::tests::worker
