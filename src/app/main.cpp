#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <xplorer/logger.hpp>

#include "../core/config.hpp"
#include "../core/event_loop.hpp"
#include "../ipc/message_bridge.hpp"
#include "../ops/operation_lifecycle.hpp"
#include "../state/state_coordinator.hpp"
#include "../ui/glfw_window_host.hpp"
#include "../view/directory_view.hpp"

namespace
{

std::atomic<bool> g_running{true};

void signal_handler(int /*sig*/)
{
    g_running.store(false, std::memory_order_relaxed);
}

// GLFW input and the backend sockets are serviced alternately; this bounds
// how long either side waits for the other.
constexpr auto FRAME_WAIT = std::chrono::milliseconds(16);

}   // namespace

int main(int argc, char* argv[])
{
    using namespace xplorer;

    auto cl = core::parse_command_line(argc, argv);
    if (!cl.error.empty())
    {
        std::cerr << "xplorer: " << cl.error << "\n" << core::usage();
        return 2;
    }
    if (cl.show_help)
    {
        std::cout << core::usage();
        return 0;
    }

    core::ShellConfig config;
    std::string       config_path = cl.config_path.empty() ? core::ShellConfig::default_path()
                                                           : cl.config_path;
    bool config_loaded = std::filesystem::exists(config_path) && config.load(config_path);
    if (!cl.config_path.empty() && !config_loaded)
    {
        std::cerr << "xplorer: cannot read config " << config_path << "\n";
        return 2;
    }

    std::string arg_error;
    if (!core::apply_args(config, argc, argv, arg_error))
    {
        std::cerr << "xplorer: " << arg_error << "\n" << core::usage();
        return 2;
    }
    config.resolve_defaults();

    auto& logger = Logger::instance();
    logger.set_level(config.log_level);
    logger.add_sink(sinks::console_sink());
    if (!config.log_file.empty())
        logger.add_sink(sinks::file_sink(config.log_file));

    if (config_loaded)
        XPLORER_LOG_INFO("app", "config loaded from {}", config_path);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    core::EventLoop    loop;
    ipc::MessageBridge bridge(loop);
    bridge.set_request_timeout(std::chrono::milliseconds(config.request_timeout_ms));
    if (!bridge.connect(config.request_socket, config.event_socket))
    {
        XPLORER_LOG_CRITICAL("app", "backend unreachable at {} / {}", config.request_socket,
                             config.event_socket);
        return 1;
    }

    state::StateCoordinator coordinator;
    ops::OperationLifecycle lifecycle(bridge, coordinator);

    std::map<WindowId, std::unique_ptr<view::DirectoryView>> views;

    ui::GlfwWindowHost host(coordinator, config);
    host.set_on_window_created(
        [&](WindowId id)
        {
            views[id] =
                std::make_unique<view::DirectoryView>(id, coordinator, lifecycle, bridge, bridge);
        });
    host.set_on_window_closing([&](WindowId id) { views.erase(id); });

    if (!host.init())
        return 1;

    WindowId first = host.create_window();
    if (first == INVALID_WINDOW || !coordinator.create_tab(std::nullopt, first))
    {
        XPLORER_LOG_CRITICAL("app", "could not open the first window");
        host.shutdown();
        return 1;
    }

    XPLORER_LOG_INFO("app", "xplorer running, backend {}", config.request_socket);

    while (g_running.load(std::memory_order_relaxed) && host.window_count() > 0)
    {
        loop.run_once();
        host.wait_events(FRAME_WAIT);
        host.process_pending_closes();
    }

    XPLORER_LOG_INFO("app", "shutting down");
    host.shutdown();
    views.clear();
    bridge.disconnect();
    return 0;
}
