#pragma once

#ifdef XPLORER_USE_GLFW

    #include <chrono>
    #include <functional>
    #include <map>
    #include <memory>
    #include <string>
    #include <xplorer/tab.hpp>

    #include "../core/config.hpp"
    #include "../state/state_coordinator.hpp"
    #include "tab_drag_controller.hpp"

struct GLFWwindow;

namespace xplorer::ui
{

// Owns every top-level GLFW window of the shell. Each window is registered
// with the coordinator as a WindowSurface and gets its own drag controller.
class GlfwWindowHost
{
   public:
    using WindowCallback = std::function<void(WindowId)>;

    // Fixed-width tab strip layout: tab i spans [i * TAB_WIDTH, (i+1) * TAB_WIDTH).
    static constexpr int TAB_WIDTH = 180;

    GlfwWindowHost(state::StateCoordinator& coordinator, const core::ShellConfig& config);
    ~GlfwWindowHost();

    GlfwWindowHost(const GlfwWindowHost&)            = delete;
    GlfwWindowHost& operator=(const GlfwWindowHost&) = delete;

    bool init();
    void shutdown();

    // Creates and registers a window. Negative coordinates let the window
    // manager place it. Returns INVALID_WINDOW on failure.
    WindowId create_window(int x = -1, int y = -1);

    // Fired after registration, and before the window is unregistered.
    void set_on_window_created(WindowCallback cb) { on_created_ = std::move(cb); }
    void set_on_window_closing(WindowCallback cb) { on_closing_ = std::move(cb); }

    void poll_events();
    void wait_events(std::chrono::milliseconds timeout);

    // Destroys every window whose close flag is set. Returns how many went.
    size_t process_pending_closes();

    size_t window_count() const { return windows_.size(); }

   private:
    class Surface;

    Surface* find(GLFWwindow* window) const;
    void     destroy(WindowId id);

    // Tab under a window-local point of the strip, INVALID_TAB if none.
    TabId tab_at(const Surface& s, double local_x, double local_y) const;

    static void cursor_pos_callback(GLFWwindow* window, double x, double y);
    static void mouse_button_callback(GLFWwindow* window, int button, int action, int mods);
    static void key_callback(GLFWwindow* window, int key, int scancode, int action, int mods);

    state::StateCoordinator&                      coordinator_;
    core::ShellConfig                             config_;
    std::map<WindowId, std::unique_ptr<Surface>> windows_;
    bool                                          initialized_ = false;

    WindowCallback on_created_;
    WindowCallback on_closing_;
};

}   // namespace xplorer::ui

#endif   // XPLORER_USE_GLFW
