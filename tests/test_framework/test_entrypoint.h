// tests/test_framework/test_entrypoint.h
#pragma once

#include "mdr_base.hpp"
#include <gtest/gtest.h>
/**
 * @file test_entrypoint.h
 * @brief Provides an API for registering worker scenario dispatchers.
 */

// Path of the running test executable, used by worker-spawning tests.
extern std::string g_self_exe_path;

/**
 * @brief Type definition for a worker scenario dispatcher function.
 *
 * A dispatcher takes the same arguments as `main()`, parses the "module.scenario" mode and
 * calls the matching worker function. Returns the worker's exit code, or -1 if the mode
 * belongs to another dispatcher.
 */
using WorkerDispatchFn = int (*)(int argc, char **argv);

/**
 * @brief Registers a worker scenario dispatcher with the test entry point.
 * @param fn A function pointer to the dispatcher function.
 */
void register_worker_dispatcher(WorkerDispatchFn fn);
