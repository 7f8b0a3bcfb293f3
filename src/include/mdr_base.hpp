#pragma once
/**
 * @file mdr_base.hpp
 * @brief Layer 1: Basic modules built on mdr_platform.
 *
 * Provides formatting helpers, debug/panic utilities and the ModuleDef used for lifecycle
 * registration. Include this when you need formatting or debug utilities.
 */
#include "mdr_platform.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "utils/format_tools.hpp"
#include "utils/debug_info.hpp"
#include "utils/module_def.hpp"
