/*******************************************************************************
 * @file lifecycle.cpp
 * @brief Implementation of the dependency-aware application lifecycle manager.
 *
 * `initialize()` builds a graph from the registered modules, sorts it with Kahn's
 * algorithm and runs each startup callback in order. `finalize()` walks the reverse
 * order and runs each shutdown callback on its own thread with a real deadline
 * (thread + flag + poll + detach).
 ******************************************************************************/
#include "mdr_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/module_def.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <fmt/ranges.h> // fmt::join
#include <functional>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <tuple>
#include <vector>

namespace
{
void validate_module_name(std::string_view name, const char *param_name)
{
    if (name.empty())
    {
        throw std::invalid_argument(std::string("Lifecycle: ") + param_name +
                                    " must not be empty.");
    }
    if (name.size() > mydiarelay::utils::ModuleDef::MAX_MODULE_NAME_LEN)
    {
        throw std::length_error(
            std::string("Lifecycle: ") + param_name + " exceeds maximum of " +
            std::to_string(mydiarelay::utils::ModuleDef::MAX_MODULE_NAME_LEN) + " characters.");
    }
}

struct ShutdownOutcome
{
    bool success;
    bool timed_out;
    std::string exception_msg;
};

/**
 * @brief Runs `func` on a thread with a real deadline. The thread is detached on
 *        timeout, so all state it touches is shared-owned.
 */
ShutdownOutcome timedShutdown(const std::function<void()> &func,
                              std::chrono::milliseconds timeout)
{
    if (!func)
    {
        return {true, false, {}};
    }

    struct SharedState
    {
        std::atomic<bool> completed{false};
        std::string error;
        bool failed = false;
    };
    auto state = std::make_shared<SharedState>();
    std::thread thread(
        [func, state]()
        {
            try
            {
                func();
            }
            catch (const std::exception &e)
            {
                state->failed = true;
                state->error = e.what();
            }
            state->completed.store(true, std::memory_order_release);
        });

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!state->completed.load(std::memory_order_acquire))
    {
        if (timeout.count() > 0 && std::chrono::steady_clock::now() >= deadline)
        {
            thread.detach();
            return {false, true, {}};
        }
        constexpr std::chrono::milliseconds kPollInterval(10);
        std::this_thread::sleep_for(kPollInterval);
    }
    thread.join();

    if (state->failed)
    {
        return {false, false, state->error};
    }
    return {true, false, {}};
}

constexpr size_t kDebugInfoReserveBytes = 4096;

} // namespace

namespace mydiarelay::utils
{

struct InternalModuleDef
{
    std::string name;
    std::vector<std::string> dependencies;
    std::function<void()> startup;
    std::function<void()> shutdown;
    std::chrono::milliseconds shutdown_timeout{0};
};

class ModuleDefImpl
{
  public:
    InternalModuleDef def;
};

ModuleDef::ModuleDef(std::string_view name) : pImpl(std::make_unique<ModuleDefImpl>())
{
    validate_module_name(name, "module name");
    pImpl->def.name = std::string(name);
}
ModuleDef::~ModuleDef() = default;
ModuleDef::ModuleDef(ModuleDef &&other) noexcept = default;
ModuleDef &ModuleDef::operator=(ModuleDef &&other) noexcept = default;

void ModuleDef::add_dependency(std::string_view dependency_name)
{
    if (pImpl != nullptr && !dependency_name.empty())
    {
        validate_module_name(dependency_name, "dependency name");
        pImpl->def.dependencies.emplace_back(dependency_name);
    }
}

void ModuleDef::set_startup(LifecycleCallback startup_func)
{
    if (pImpl != nullptr && startup_func != nullptr)
    {
        pImpl->def.startup = [startup_func]() { startup_func(nullptr); };
    }
}

void ModuleDef::set_startup(LifecycleCallback startup_func, std::string_view arg)
{
    if (pImpl != nullptr && startup_func != nullptr)
    {
        if (arg.size() > MAX_CALLBACK_PARAM_STRLEN)
        {
            throw std::length_error(
                "Lifecycle: startup argument length exceeds MAX_CALLBACK_PARAM_STRLEN.");
        }
        pImpl->def.startup = [startup_func, arg_copy = std::string(arg)]()
        { startup_func(arg_copy.c_str()); };
    }
}

void ModuleDef::set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout)
{
    if (pImpl != nullptr && shutdown_func != nullptr)
    {
        pImpl->def.shutdown = [shutdown_func]() { shutdown_func(nullptr); };
        pImpl->def.shutdown_timeout = timeout;
    }
}

void ModuleDef::set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout,
                             std::string_view arg)
{
    if (pImpl != nullptr && shutdown_func != nullptr)
    {
        if (arg.size() > MAX_CALLBACK_PARAM_STRLEN)
        {
            throw std::length_error(
                "Lifecycle: shutdown argument length exceeds MAX_CALLBACK_PARAM_STRLEN.");
        }
        pImpl->def.shutdown = [shutdown_func, arg_copy = std::string(arg)]()
        { shutdown_func(arg_copy.c_str()); };
        pImpl->def.shutdown_timeout = timeout;
    }
}

class LifecycleManagerImpl
{
  public:
    LifecycleManagerImpl()
        : m_pid(mydiarelay::platform::get_pid()),
          m_app_name(mydiarelay::platform::get_executable_name())
    {
    }

    enum class ModuleStatus : std::uint8_t
    {
        Registered,
        Initializing,
        Started,
        Failed,
        Shutdown,
        FailedShutdown,
        ShutdownTimeout
    };

    struct InternalGraphNode
    {
        explicit InternalGraphNode(InternalModuleDef def_in) : def(std::move(def_in)) {}

        InternalModuleDef def;
        std::vector<InternalGraphNode *> dependents;
        std::atomic<ModuleStatus> status = {ModuleStatus::Registered};
    };

    void registerModule(InternalModuleDef def);
    void initialize(std::source_location loc);
    void finalize(std::source_location loc);
    bool isModuleStarted(std::string_view name);

    [[nodiscard]] bool is_initialized() const
    {
        return m_is_initialized.load(std::memory_order_acquire);
    }
    [[nodiscard]] bool is_finalized() const
    {
        return m_is_finalized.load(std::memory_order_acquire);
    }

  private:
    void buildGraph();
    static std::vector<InternalGraphNode *>
    topologicalSort(const std::vector<InternalGraphNode *> &nodes);
    void shutdownModuleWithTimeout(InternalGraphNode &mod, std::string &debug_info);
    void printStatus(const std::string &msg, const std::string &mod = {});

    const uint64_t m_pid;
    const std::string m_app_name;

    std::mutex m_registry_mutex;
    std::vector<InternalModuleDef> m_registered_modules;
    std::map<std::string, InternalGraphNode, std::less<>> m_module_graph;
    std::vector<InternalGraphNode *> m_startup_order;
    std::vector<InternalGraphNode *> m_shutdown_order;

    std::atomic<bool> m_is_initialized{false};
    std::atomic<bool> m_is_finalized{false};
};

void LifecycleManagerImpl::registerModule(InternalModuleDef def)
{
    if (m_is_initialized.load(std::memory_order_acquire))
    {
        throw std::logic_error(
            fmt::format("Lifecycle: cannot register module '{}' after initialization.", def.name));
    }
    std::lock_guard<std::mutex> lock(m_registry_mutex);
    m_registered_modules.push_back(std::move(def));
}

void LifecycleManagerImpl::initialize(std::source_location loc)
{
    if (m_is_initialized.exchange(true, std::memory_order_acq_rel))
    {
        return;
    }
    std::string debug_info;
    debug_info.reserve(kDebugInfoReserveBytes);
    debug_info += fmt::format("[MDR_LifeCycle] [{}]:PID[{}]\n"
                              "     **** initialize() triggered from {} ({}:{})\n"
                              "     -> Initializing application...\n",
                              m_app_name, m_pid, loc.function_name(),
                              mydiarelay::format_tools::filename_only(loc.file_name()),
                              loc.line());
    try
    {
        buildGraph();
        std::vector<InternalGraphNode *> nodes;
        for (auto &entry : m_module_graph)
        {
            nodes.push_back(&entry.second);
        }
        m_startup_order = topologicalSort(nodes);
    }
    catch (const std::runtime_error &e)
    {
        printStatus(e.what());
        throw;
    }

    m_shutdown_order = m_startup_order;
    std::reverse(m_shutdown_order.begin(), m_shutdown_order.end());

    for (auto *mod : m_startup_order)
    {
        try
        {
            debug_info += fmt::format("     -> Starting module: '{}'...", mod->def.name);
            mod->status.store(ModuleStatus::Initializing, std::memory_order_release);
            if (mod->def.startup)
            {
                mod->def.startup();
            }
            mod->status.store(ModuleStatus::Started, std::memory_order_release);
            debug_info += "done.\n";
        }
        catch (const std::exception &e)
        {
            mod->status.store(ModuleStatus::Failed, std::memory_order_release);
            MDR_DEBUG("{}", debug_info);
            printStatus(fmt::format("Exception during startup: {}", e.what()), mod->def.name);
            // Unwind what was already started so the process can exit cleanly.
            finalize(loc);
            throw std::runtime_error(fmt::format("Lifecycle: module '{}' failed to start: {}",
                                                 mod->def.name, e.what()));
        }
    }
    debug_info += "     -> Application initialization complete.\n";
    MDR_DEBUG("{}", debug_info);
}

void LifecycleManagerImpl::finalize(std::source_location loc)
{
    if (!m_is_initialized.load(std::memory_order_acquire) ||
        m_is_finalized.exchange(true, std::memory_order_acq_rel))
    {
        return;
    }

    std::string debug_info;
    debug_info.reserve(kDebugInfoReserveBytes);
    debug_info += fmt::format("[MDR_LifeCycle] [{}]:PID[{}]\n"
                              "     **** finalize() called from {} ({}:{}):\n"
                              "     <- Finalizing application...\n",
                              m_app_name, m_pid, loc.function_name(),
                              mydiarelay::format_tools::filename_only(loc.file_name()),
                              loc.line());

    for (auto *mod : m_shutdown_order)
    {
        if (mod->status.load(std::memory_order_acquire) == ModuleStatus::Started)
        {
            shutdownModuleWithTimeout(*mod, debug_info);
        }
        else
        {
            mod->status.store(ModuleStatus::Shutdown, std::memory_order_release);
            debug_info +=
                fmt::format("     <- Shutting down module: '{}'...(no-op) done.\n", mod->def.name);
        }
    }
    debug_info += "     -> Application finalization complete.\n";
    MDR_DEBUG("{}", debug_info);
}

bool LifecycleManagerImpl::isModuleStarted(std::string_view name)
{
    auto iter = m_module_graph.find(name);
    return iter != m_module_graph.end() &&
           iter->second.status.load(std::memory_order_acquire) == ModuleStatus::Started;
}

void LifecycleManagerImpl::shutdownModuleWithTimeout(InternalGraphNode &mod,
                                                     std::string &debug_info)
{
    debug_info += fmt::format("     <- Shutting down module: '{}'...", mod.def.name);

    auto outcome = timedShutdown(mod.def.shutdown, mod.def.shutdown_timeout);
    if (outcome.success)
    {
        mod.status.store(ModuleStatus::Shutdown, std::memory_order_release);
        debug_info += "done.\n";
    }
    else if (outcome.timed_out)
    {
        mod.status.store(ModuleStatus::ShutdownTimeout, std::memory_order_release);
        debug_info +=
            fmt::format("TIMEOUT ({}ms)! Thread detached.\n", mod.def.shutdown_timeout.count());
    }
    else
    {
        mod.status.store(ModuleStatus::FailedShutdown, std::memory_order_release);
        debug_info += fmt::format("\n     **** ERROR: module '{}' threw on shutdown: {}\n",
                                  mod.def.name, outcome.exception_msg);
    }
}

void LifecycleManagerImpl::buildGraph()
{
    std::lock_guard<std::mutex> lock(m_registry_mutex);
    for (auto &def : m_registered_modules)
    {
        if (m_module_graph.contains(def.name))
        {
            throw std::runtime_error("Duplicate module name: " + def.name);
        }
        const std::string name = def.name;
        m_module_graph.emplace(std::piecewise_construct, std::forward_as_tuple(name),
                               std::forward_as_tuple(std::move(def)));
    }
    for (auto &entry : m_module_graph)
    {
        for (const auto &dep_name : entry.second.def.dependencies)
        {
            auto iter = m_module_graph.find(dep_name);
            if (iter == m_module_graph.end())
            {
                throw std::runtime_error("Undefined dependency: " + dep_name);
            }
            iter->second.dependents.push_back(&entry.second);
        }
    }
    m_registered_modules.clear();
}

/**
 * @brief Kahn's algorithm over the given nodes.
 * @throws std::runtime_error If a circular dependency is detected.
 */
std::vector<LifecycleManagerImpl::InternalGraphNode *>
LifecycleManagerImpl::topologicalSort(const std::vector<InternalGraphNode *> &nodes)
{
    std::vector<InternalGraphNode *> sorted_order;
    sorted_order.reserve(nodes.size());
    std::vector<InternalGraphNode *> zero_degree_queue;
    std::map<InternalGraphNode *, size_t> in_degrees;
    for (auto *node : nodes)
    {
        in_degrees[node] = 0;
    }
    for (auto *node : nodes)
    {
        for (auto *dep : node->dependents)
        {
            if (in_degrees.contains(dep))
            {
                in_degrees[dep]++;
            }
        }
    }
    for (auto *node : nodes)
    {
        if (in_degrees[node] == 0)
        {
            zero_degree_queue.push_back(node);
        }
    }
    size_t head = 0;
    while (head < zero_degree_queue.size())
    {
        InternalGraphNode *current = zero_degree_queue[head++];
        sorted_order.push_back(current);
        for (InternalGraphNode *dependent : current->dependents)
        {
            if (in_degrees.contains(dependent) && --in_degrees[dependent] == 0)
            {
                zero_degree_queue.push_back(dependent);
            }
        }
    }
    if (sorted_order.size() != nodes.size())
    {
        std::vector<std::string> cycle_nodes;
        for (auto const &[cycle_node, degree] : in_degrees)
        {
            if (degree > 0)
            {
                cycle_nodes.push_back(cycle_node->def.name);
            }
        }
        throw std::runtime_error("Circular dependency detected involving: " +
                                 fmt::format("{}", fmt::join(cycle_nodes, ", ")));
    }
    return sorted_order;
}

void LifecycleManagerImpl::printStatus(const std::string &msg, const std::string &mod)
{
    fmt::print(stderr, "\n[MDR_LifeCycle] FATAL: {}.\n", msg);
    if (!mod.empty())
    {
        fmt::print(stderr, "[MDR_LifeCycle] Module '{}' was point of failure.\n", mod);
    }
    fmt::print(stderr, "--- Module Status ---\n");
    for (auto const &[name, node] : m_module_graph)
    {
        fmt::print(stderr, "  - '{}' [{}]\n", name,
                   static_cast<int>(node.status.load(std::memory_order_acquire)));
    }
    fmt::print(stderr, "---------------------\n");
    std::fflush(stderr);
}

// ============================================================================
// LifecycleManager public API (thin delegation layer)
// ============================================================================

LifecycleManager::LifecycleManager() : pImpl(std::make_unique<LifecycleManagerImpl>()) {}
LifecycleManager::~LifecycleManager() = default;
LifecycleManager &LifecycleManager::instance()
{
    static LifecycleManager instance;
    return instance;
}
void LifecycleManager::register_module(ModuleDef &&def)
{
    if (def.pImpl != nullptr)
    {
        pImpl->registerModule(std::move(def.pImpl->def));
    }
}
void LifecycleManager::initialize(std::source_location loc)
{
    pImpl->initialize(loc);
}
void LifecycleManager::finalize(std::source_location loc)
{
    pImpl->finalize(loc);
}
bool LifecycleManager::is_initialized()
{
    return pImpl->is_initialized();
}
bool LifecycleManager::is_finalized()
{
    return pImpl->is_finalized();
}
bool LifecycleManager::is_module_started(std::string_view name)
{
    return pImpl->isModuleStarted(name);
}

} // namespace mydiarelay::utils
