#pragma once
/**
 * @file mdr_service.hpp
 * @brief Layer 2: Service modules built on mdr_base.
 *
 * Provides lifecycle management, logging, cryptographic utilities, result types,
 * relay configuration and the striped concurrent map.
 */
#include "mdr_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/logger.hpp"
#include "utils/crypto_utils.hpp"
#include "utils/result.hpp"
#include "utils/relay_config.hpp"
#include "utils/striped_map.hpp"
