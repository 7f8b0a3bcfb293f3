// tests/test_framework/test_process_utils.h
#pragma once

#include "mdr_platform.hpp"

#include <filesystem>
#include <string>
#include <vector>

#if defined(MYDIARELAY_PLATFORM_WIN64)
#include <windows.h>
#else
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

/**
 * @file test_process_utils.h
 * @brief Spawns and reaps the worker subprocesses of isolated-process tests.
 */
namespace mydiarelay::tests::helper
{
namespace fs = std::filesystem;

#if defined(MYDIARELAY_PLATFORM_WIN64)
using ProcessHandle = HANDLE;
static constexpr HANDLE NULL_PROC_HANDLE = NULL;
#else
using ProcessHandle = pid_t;
static constexpr pid_t NULL_PROC_HANDLE = 0;
#endif

/**
 * @class WorkerProcess
 * @brief RAII handle of a worker process. Captures stdout and stderr to temporary files that
 *        are read back after the worker exits.
 */
class WorkerProcess
{
  public:
    /**
     * @brief Re-executes @p exe_path in worker mode @p mode (e.g. "relay.end_to_end_pairing").
     * @param redirect_stderr_to_console If true, the worker's stderr is not captured.
     */
    WorkerProcess(const std::string &exe_path, const std::string &mode,
                  const std::vector<std::string> &args, bool redirect_stderr_to_console = false);
    ~WorkerProcess();

    WorkerProcess(const WorkerProcess &) = delete;
    WorkerProcess &operator=(const WorkerProcess &) = delete;
    WorkerProcess(WorkerProcess &&) = delete;
    WorkerProcess &operator=(WorkerProcess &&) = delete;

    /// @brief Waits for the worker to exit and reads its captured output.
    int wait_for_exit();

    const std::string &get_stdout() const;
    const std::string &get_stderr() const;

    /// @return The exit code, or -1 if not yet waited for.
    int exit_code() const { return exit_code_; }

    bool spawned() const { return spawned_; }
    const std::string &mode() const { return mode_; }

  private:
    ProcessHandle handle_ = NULL_PROC_HANDLE;
    std::string mode_;
    int exit_code_ = -1;
    fs::path stdout_path_;
    fs::path stderr_path_;
    mutable std::string stdout_content_;
    mutable std::string stderr_content_;
    bool spawned_ = false;
    bool waited_ = false;
    bool redirect_stderr_to_console_ = false;
};

/**
 * @brief Asserts that a worker exited with 0 and printed no failure markers.
 *
 * @param expected_stderr_substrings Strings that must appear in the worker's stderr.
 * @param allow_expected_logger_errors If true, "[ERROR" lines are tolerated (for workers
 *        that deliberately drive error paths).
 */
void expect_worker_ok(const WorkerProcess &proc,
                      const std::vector<std::string> &expected_stderr_substrings = {},
                      bool allow_expected_logger_errors = false);

} // namespace mydiarelay::tests::helper
