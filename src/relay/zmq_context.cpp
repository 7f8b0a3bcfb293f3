#include "relay/zmq_context.hpp"
#include "mdr_service.hpp"

#include <mutex>

namespace mydiarelay::relay
{

namespace
{
constexpr std::chrono::milliseconds kZMQContextShutdownTimeoutMs{2000};

std::mutex g_context_mu;
std::unique_ptr<zmq::context_t> g_context;

void do_zmq_context_startup(const char * /*arg*/)
{
    zmq_context_startup();
}

void do_zmq_context_shutdown(const char * /*arg*/)
{
    zmq_context_shutdown();
}
} // namespace

zmq::context_t &get_zmq_context()
{
    std::lock_guard lock(g_context_mu);
    if (!g_context)
        throw std::logic_error("ZMQ context not initialized; register GetZMQContextModule()");
    return *g_context;
}

void zmq_context_startup()
{
    std::lock_guard lock(g_context_mu);
    if (!g_context)
    {
        g_context = std::make_unique<zmq::context_t>(1);
        LOGGER_INFO("ZMQContext: ZeroMQ context created.");
    }
}

void zmq_context_shutdown()
{
    std::unique_ptr<zmq::context_t> ctx;
    {
        std::lock_guard lock(g_context_mu);
        ctx = std::move(g_context);
    }
    if (!ctx)
        return;
    // Blocks until every socket of the context is closed.
    ctx.reset();
    LOGGER_INFO("ZMQContext: ZeroMQ context destroyed.");
}

mydiarelay::utils::ModuleDef GetZMQContextModule()
{
    mydiarelay::utils::ModuleDef module("ZMQContext");
    module.add_dependency("mydiarelay::utils::Logger");
    module.set_startup(&do_zmq_context_startup);
    module.set_shutdown(&do_zmq_context_shutdown, kZMQContextShutdownTimeoutMs);
    return module;
}

} // namespace mydiarelay::relay
