#ifdef XPLORER_USE_GLFW

    #include "glfw_window_host.hpp"

    #include <vector>
    #include <xplorer/logger.hpp>

    #define GLFW_INCLUDE_NONE
    #include <GLFW/glfw3.h>

namespace xplorer::ui
{

// ─── Surface ─────────────────────────────────────────────────────────────────

class GlfwWindowHost::Surface : public state::WindowSurface
{
   public:
    Surface(WindowId                   id,
            GLFWwindow*                window,
            state::StateCoordinator&   coordinator,
            TabDragController::Options options)
        : id_(id), window_(window), drag_(id, coordinator, options)
    {
    }

    ~Surface() override
    {
        if (window_)
            glfwDestroyWindow(window_);
    }

    state::Rect bounds() const override
    {
        int x = 0, y = 0, w = 0, h = 0;
        glfwGetWindowPos(window_, &x, &y);
        glfwGetWindowSize(window_, &w, &h);
        return state::Rect{x, y, w, h};
    }

    void push_tab_state(const WindowTabState& state) override
    {
        state_ = state;

        std::string title = "Xplorer";
        for (const auto& t : state_.tabs)
        {
            if (t.id == state_.active_tab)
            {
                title = t.title + " - Xplorer";
                break;
            }
        }
        if (title != title_)
        {
            title_ = title;
            glfwSetWindowTitle(window_, title_.c_str());
        }
    }

    void set_drop_indicator(bool visible) override
    {
        if (visible != drop_indicator_)
            XPLORER_LOG_TRACE("host", "window {} drop indicator {}", id_, visible);
        drop_indicator_ = visible;
    }

    void focus() override { glfwFocusWindow(window_); }

    void close() override { glfwSetWindowShouldClose(window_, GLFW_TRUE); }

    bool should_close() const { return glfwWindowShouldClose(window_) == GLFW_TRUE; }

    // Window-local cursor position to screen space.
    void to_screen(double lx, double ly, double& sx, double& sy) const
    {
        int x = 0, y = 0;
        glfwGetWindowPos(window_, &x, &y);
        sx = lx + x;
        sy = ly + y;
    }

    WindowId              id() const { return id_; }
    GLFWwindow*           handle() const { return window_; }
    TabDragController&    drag() { return drag_; }
    const WindowTabState& tab_state() const { return state_; }
    bool                  drop_indicator() const { return drop_indicator_; }

   private:
    WindowId          id_;
    GLFWwindow*       window_;
    TabDragController drag_;
    WindowTabState    state_;
    std::string       title_;
    bool              drop_indicator_ = false;
};

// ─── Lifecycle ───────────────────────────────────────────────────────────────

GlfwWindowHost::GlfwWindowHost(state::StateCoordinator& coordinator,
                               const core::ShellConfig& config)
    : coordinator_(coordinator), config_(config)
{
}

GlfwWindowHost::~GlfwWindowHost()
{
    shutdown();
}

bool GlfwWindowHost::init()
{
    if (initialized_)
        return true;
    if (!glfwInit())
    {
        XPLORER_LOG_ERROR("host", "failed to initialize GLFW");
        return false;
    }
    initialized_ = true;
    return true;
}

void GlfwWindowHost::shutdown()
{
    if (!initialized_)
        return;

    std::vector<WindowId> ids;
    for (const auto& [id, s] : windows_)
        ids.push_back(id);
    for (WindowId id : ids)
        destroy(id);

    glfwTerminate();
    initialized_ = false;
}

WindowId GlfwWindowHost::create_window(int x, int y)
{
    if (!initialized_)
        return INVALID_WINDOW;

    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);

    GLFWwindow* window = glfwCreateWindow(config_.window_width, config_.window_height, "Xplorer",
                                          nullptr, nullptr);
    if (!window)
    {
        XPLORER_LOG_ERROR("host", "failed to create GLFW window");
        return INVALID_WINDOW;
    }
    if (x >= 0 && y >= 0)
        glfwSetWindowPos(window, x, y);

    glfwSetWindowUserPointer(window, this);
    glfwSetCursorPosCallback(window, cursor_pos_callback);
    glfwSetMouseButtonCallback(window, mouse_button_callback);
    glfwSetKeyCallback(window, key_callback);

    TabDragController::Options options;
    options.drag_threshold_px = config_.drag_threshold_px;
    options.strip_height_px   = config_.tab_bar_height_px;
    options.poll_interval     = std::chrono::milliseconds(config_.drag_poll_interval_ms);

    WindowId id      = coordinator_.allocate_window_id();
    auto     surface = std::make_unique<Surface>(id, window, coordinator_, options);
    surface->drag().set_spawn_handler(
        [this](const Tab&, double sx, double sy)
        {
            return create_window(static_cast<int>(sx) - TAB_WIDTH / 2,
                                 static_cast<int>(sy) - config_.tab_bar_height_px / 2);
        });

    if (!coordinator_.register_window(id, surface.get()))
    {
        XPLORER_LOG_ERROR("host", "window {} could not be registered", id);
        return INVALID_WINDOW;
    }
    windows_.emplace(id, std::move(surface));
    XPLORER_LOG_INFO("host", "window {} created", id);

    if (on_created_)
        on_created_(id);
    return id;
}

void GlfwWindowHost::destroy(WindowId id)
{
    auto it = windows_.find(id);
    if (it == windows_.end())
        return;

    if (on_closing_)
        on_closing_(id);
    it->second->drag().cancel();

    // No-op when the coordinator already closed the window for being empty
    coordinator_.unregister_window(id);
    windows_.erase(id);
    XPLORER_LOG_INFO("host", "window {} destroyed", id);
}

void GlfwWindowHost::poll_events()
{
    glfwPollEvents();
}

void GlfwWindowHost::wait_events(std::chrono::milliseconds timeout)
{
    glfwWaitEventsTimeout(static_cast<double>(timeout.count()) / 1000.0);
}

size_t GlfwWindowHost::process_pending_closes()
{
    std::vector<WindowId> closing;
    for (const auto& [id, s] : windows_)
    {
        if (s->should_close())
            closing.push_back(id);
    }
    for (WindowId id : closing)
        destroy(id);
    return closing.size();
}

// ─── Input routing ───────────────────────────────────────────────────────────

GlfwWindowHost::Surface* GlfwWindowHost::find(GLFWwindow* window) const
{
    for (const auto& [id, s] : windows_)
    {
        if (s->handle() == window)
            return s.get();
    }
    return nullptr;
}

TabId GlfwWindowHost::tab_at(const Surface& s, double local_x, double local_y) const
{
    if (local_x < 0.0 || local_y < 0.0 || local_y >= config_.tab_bar_height_px)
        return INVALID_TAB;
    auto        index = static_cast<size_t>(local_x / TAB_WIDTH);
    const auto& tabs  = s.tab_state().tabs;
    return index < tabs.size() ? tabs[index].id : INVALID_TAB;
}

void GlfwWindowHost::cursor_pos_callback(GLFWwindow* window, double x, double y)
{
    auto* host = static_cast<GlfwWindowHost*>(glfwGetWindowUserPointer(window));
    if (!host)
        return;
    Surface* s = host->find(window);
    if (!s || !s->drag().is_active())
        return;

    double sx = 0.0, sy = 0.0;
    s->to_screen(x, y, sx, sy);
    s->drag().on_mouse_move(sx, sy);
}

void GlfwWindowHost::mouse_button_callback(GLFWwindow* window, int button, int action, int /*mods*/)
{
    auto* host = static_cast<GlfwWindowHost*>(glfwGetWindowUserPointer(window));
    if (!host)
        return;
    Surface* s = host->find(window);
    if (!s)
        return;

    double lx = 0.0, ly = 0.0, sx = 0.0, sy = 0.0;
    glfwGetCursorPos(window, &lx, &ly);
    s->to_screen(lx, ly, sx, sy);

    if (action == GLFW_PRESS)
    {
        if (button == GLFW_MOUSE_BUTTON_RIGHT && s->drag().is_active())
        {
            s->drag().cancel();
            return;
        }

        TabId tab = host->tab_at(*s, lx, ly);
        if (tab == INVALID_TAB)
            return;
        if (button == GLFW_MOUSE_BUTTON_LEFT)
            s->drag().on_mouse_down(MouseButton::Left, tab, sx, sy);
        else if (button == GLFW_MOUSE_BUTTON_MIDDLE)
            s->drag().on_mouse_down(MouseButton::Middle, tab, sx, sy);
    }
    else if (action == GLFW_RELEASE && button == GLFW_MOUSE_BUTTON_LEFT)
    {
        s->drag().on_mouse_up(sx, sy);
    }
}

void GlfwWindowHost::key_callback(GLFWwindow* window, int key, int /*scancode*/, int action, int mods)
{
    if (action != GLFW_PRESS)
        return;
    auto* host = static_cast<GlfwWindowHost*>(glfwGetWindowUserPointer(window));
    if (!host)
        return;
    Surface* s = host->find(window);
    if (!s)
        return;

    auto& coordinator = host->coordinator_;
    TabId active      = coordinator.active_tab_for_window(s->id());

    if (key == GLFW_KEY_ESCAPE)
    {
        s->drag().cancel();
    }
    else if ((mods & GLFW_MOD_CONTROL) && key == GLFW_KEY_T)
    {
        coordinator.create_tab(std::nullopt, s->id());
    }
    else if ((mods & GLFW_MOD_CONTROL) && key == GLFW_KEY_W && active != INVALID_TAB)
    {
        // The last tab of a window goes home instead of closing
        if (!coordinator.close_tab(active))
            coordinator.reset_tab(active);
    }
    else if ((mods & GLFW_MOD_ALT) && key == GLFW_KEY_LEFT && active != INVALID_TAB)
    {
        coordinator.go_back_tab(active);
    }
    else if ((mods & GLFW_MOD_ALT) && key == GLFW_KEY_RIGHT && active != INVALID_TAB)
    {
        coordinator.go_forward_tab(active);
    }
}

}   // namespace xplorer::ui

#endif   // XPLORER_USE_GLFW
