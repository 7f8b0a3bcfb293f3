#pragma once
/**
 * @file zmq_context.hpp
 * @brief Shared ZeroMQ context as a named lifecycle module ("ZMQContext").
 *
 * Every relay socket (the service ROUTER and each RelayClient DEALER) is created from
 * this context.
 */
#include "mydiarelay_utils_export.h"

#include "utils/module_def.hpp"

#include <zmq.hpp>

namespace mydiarelay::relay
{

/**
 * @brief Returns the process ZeroMQ context.
 * @throws std::logic_error if the ZMQContext module has not been started.
 */
[[nodiscard]] MYDIARELAY_UTILS_EXPORT zmq::context_t &get_zmq_context();

/// @brief Creates the context. A second call is a no-op.
MYDIARELAY_UTILS_EXPORT void zmq_context_startup();

/// @brief Destroys the context. A second call is a no-op.
MYDIARELAY_UTILS_EXPORT void zmq_context_shutdown();

/// @brief ModuleDef "ZMQContext", depending on the Logger.
MYDIARELAY_UTILS_EXPORT mydiarelay::utils::ModuleDef GetZMQContextModule();

} // namespace mydiarelay::relay
