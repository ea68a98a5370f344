#include "state_coordinator.hpp"

#include <algorithm>
#include <exception>
#include <unordered_set>
#include <xplorer/logger.hpp>

#include "../core/path_utils.hpp"

namespace xplorer::state
{

namespace
{

// Position of id among the tabs owned by window, in registry order.
size_t window_position(const std::vector<Tab>& tabs, WindowId window, TabId id)
{
    size_t pos = 0;
    for (const auto& t : tabs)
    {
        if (t.window_id != window)
            continue;
        if (t.id == id)
            return pos;
        ++pos;
    }
    return pos;
}

// Clears the re-entrancy flag on every exit from broadcast().
struct BroadcastScope
{
    explicit BroadcastScope(bool& flag) : flag_(flag) { flag_ = true; }
    ~BroadcastScope() { flag_ = false; }

    BroadcastScope(const BroadcastScope&)            = delete;
    BroadcastScope& operator=(const BroadcastScope&) = delete;

    bool& flag_;
};

size_t window_tab_count(const std::vector<Tab>& tabs, WindowId window)
{
    return static_cast<size_t>(
        std::count_if(tabs.begin(), tabs.end(), [window](const Tab& t) { return t.window_id == window; }));
}

}   // namespace

// ─── Windows ─────────────────────────────────────────────────────────────────

bool StateCoordinator::register_window(WindowId id, WindowSurface* surface)
{
    if (id == INVALID_WINDOW || !surface || has_window(id))
    {
        XPLORER_LOG_WARN("state", "register_window({}) rejected", id);
        return false;
    }
    surfaces_[id] = surface;
    window_order_.push_back(id);
    next_window_id_ = std::max(next_window_id_, id + 1);
    XPLORER_LOG_DEBUG("state", "window {} registered", id);
    return true;
}

void StateCoordinator::unregister_window(WindowId id)
{
    if (!has_window(id))
        return;

    std::erase_if(tabs_, [id](const Tab& t) { return t.window_id == id; });
    active_per_window_.erase(id);
    surfaces_.erase(id);
    std::erase(window_order_, id);
    std::erase(pending_close_, id);
    repair_global_active();
    XPLORER_LOG_DEBUG("state", "window {} unregistered", id);
    broadcast();
}

bool StateCoordinator::has_window(WindowId id) const
{
    return surfaces_.count(id) > 0;
}

WindowSurface* StateCoordinator::surface(WindowId id) const
{
    auto it = surfaces_.find(id);
    return it != surfaces_.end() ? it->second : nullptr;
}

// ─── Tab lifecycle ───────────────────────────────────────────────────────────

std::optional<Tab> StateCoordinator::create_tab(std::optional<std::string> path, WindowId window)
{
    if (window != INVALID_WINDOW && !has_window(window))
    {
        XPLORER_LOG_WARN("state", "create_tab for unknown window {}", window);
        return std::nullopt;
    }

    std::string start = (path && !path->empty()) ? *path : std::string(HOME_PATH);

    Tab t;
    t.id            = next_tab_id_++;
    t.path          = start;
    t.title         = core::path::title_for_path(start);
    t.history       = {start};
    t.history_index = 0;
    t.window_id     = window;
    tabs_.push_back(t);

    if (window != INVALID_WINDOW)
        active_per_window_[window] = t.id;
    active_tab_ = t.id;

    broadcast();
    return t;
}

bool StateCoordinator::close_tab(TabId id)
{
    Tab* t = find(id);
    if (!t)
        return false;

    WindowId window = t->window_id;
    if (window != INVALID_WINDOW && window_tab_count(tabs_, window) <= 1)
    {
        XPLORER_LOG_DEBUG("state", "close_tab({}) refused, last tab of window {}", id, window);
        return false;
    }

    size_t pos        = window_position(tabs_, window, id);
    bool   was_active = window != INVALID_WINDOW && active_tab_for_window(window) == id;
    erase_tab(id);

    if (was_active)
        pick_window_active(window, pos, true);
    repair_global_active();
    broadcast();
    return true;
}

bool StateCoordinator::reset_tab(TabId id)
{
    Tab* t = find(id);
    if (!t)
        return false;
    t->path          = HOME_PATH;
    t->title         = HOME_PATH;
    t->history       = {HOME_PATH};
    t->history_index = 0;
    broadcast();
    return true;
}

bool StateCoordinator::set_active_tab(TabId id)
{
    Tab* t = find(id);
    if (!t)
        return false;
    if (t->window_id != INVALID_WINDOW)
        active_per_window_[t->window_id] = id;
    active_tab_ = id;
    broadcast();
    return true;
}

// ─── History ─────────────────────────────────────────────────────────────────

bool StateCoordinator::navigate_tab(TabId id, const std::string& path)
{
    Tab* t = find(id);
    if (!t || path.empty())
        return false;

    // Anything forward of the current entry is discarded
    t->history.resize(t->history_index + 1);
    t->history.push_back(path);
    t->history_index = t->history.size() - 1;
    t->path          = path;
    t->title         = core::path::title_for_path(path);
    broadcast();
    return true;
}

bool StateCoordinator::go_back_tab(TabId id)
{
    Tab* t = find(id);
    if (!t || !t->can_go_back())
        return false;
    --t->history_index;
    t->path  = t->history[t->history_index];
    t->title = core::path::title_for_path(t->path);
    broadcast();
    return true;
}

bool StateCoordinator::go_forward_tab(TabId id)
{
    Tab* t = find(id);
    if (!t || !t->can_go_forward())
        return false;
    ++t->history_index;
    t->path  = t->history[t->history_index];
    t->title = core::path::title_for_path(t->path);
    broadcast();
    return true;
}

bool StateCoordinator::navigate_to(const std::string& path)
{
    return navigate_tab(active_tab_, path);
}

bool StateCoordinator::go_back()
{
    return go_back_tab(active_tab_);
}

bool StateCoordinator::go_forward()
{
    return go_forward_tab(active_tab_);
}

// ─── Transfer primitives ─────────────────────────────────────────────────────

std::optional<Tab> StateCoordinator::add_tab(Tab tab, WindowId window)
{
    if (window != INVALID_WINDOW && !has_window(window))
    {
        XPLORER_LOG_WARN("state", "add_tab into unknown window {}", window);
        return std::nullopt;
    }

    // Incoming data crossed a window boundary; restore the history invariants
    if (tab.history.empty())
        tab.history.push_back(tab.path.empty() ? std::string(HOME_PATH) : tab.path);
    if (tab.history_index >= tab.history.size())
        tab.history_index = tab.history.size() - 1;
    tab.path  = tab.history[tab.history_index];
    tab.title = core::path::title_for_path(tab.path);

    if (tab.id == INVALID_TAB || find(tab.id))
        tab.id = next_tab_id_++;
    else
        next_tab_id_ = std::max(next_tab_id_, tab.id + 1);

    tab.window_id = window;
    tabs_.push_back(tab);

    if (window != INVALID_WINDOW)
        active_per_window_[window] = tab.id;
    active_tab_ = tab.id;

    broadcast();
    return tab;
}

std::optional<Tab> StateCoordinator::remove_tab(TabId id)
{
    Tab* t = find(id);
    if (!t)
        return std::nullopt;

    Tab      removed    = *t;
    WindowId window     = removed.window_id;
    size_t   pos        = window_position(tabs_, window, id);
    bool     was_active = window != INVALID_WINDOW && active_tab_for_window(window) == id;
    erase_tab(id);

    if (window != INVALID_WINDOW)
    {
        if (was_active || window_tab_count(tabs_, window) == 0)
            pick_window_active(window, pos, true);
        if (close_empty_windows_ && window_tab_count(tabs_, window) == 0)
            pending_close_.push_back(window);
    }
    repair_global_active();
    broadcast();
    return removed;
}

bool StateCoordinator::transfer_tab(TabId id, WindowId target)
{
    Tab* t = find(id);
    if (!t || !has_window(target))
    {
        XPLORER_LOG_WARN("state", "invalid transfer of tab {} to window {}", id, target);
        return false;
    }

    WindowId source = t->window_id;
    if (source == target)
        return set_active_tab(id);

    size_t pos        = window_position(tabs_, source, id);
    bool   was_active = source != INVALID_WINDOW && active_tab_for_window(source) == id;

    // The transferred tab goes to the end of the target's tab order
    Tab moved       = *t;
    moved.window_id = target;
    erase_tab(id);
    tabs_.push_back(moved);

    if (source != INVALID_WINDOW)
    {
        if (was_active || window_tab_count(tabs_, source) == 0)
            pick_window_active(source, pos, false);
        if (close_empty_windows_ && window_tab_count(tabs_, source) == 0)
            pending_close_.push_back(source);
    }
    active_per_window_[target] = id;
    active_tab_                = id;

    XPLORER_LOG_DEBUG("state", "tab {} moved from window {} to {}", id, source, target);
    broadcast();
    return true;
}

void StateCoordinator::remove_tabs_for_window(WindowId window)
{
    std::erase_if(tabs_, [window](const Tab& t) { return t.window_id == window; });
    active_per_window_.erase(window);
    repair_global_active();
    broadcast();
}

// ─── Queries ─────────────────────────────────────────────────────────────────

std::vector<Tab> StateCoordinator::tabs_for_window(WindowId window) const
{
    std::vector<Tab> out;
    for (const auto& t : tabs_)
    {
        if (t.window_id == window)
            out.push_back(t);
    }
    return out;
}

TabId StateCoordinator::active_tab_for_window(WindowId window) const
{
    auto it = active_per_window_.find(window);
    return it != active_per_window_.end() ? it->second : INVALID_TAB;
}

const Tab* StateCoordinator::tab(TabId id) const
{
    size_t i = index_of(id);
    return i < tabs_.size() ? &tabs_[i] : nullptr;
}

WindowTabState StateCoordinator::view_for_window(WindowId window) const
{
    WindowTabState view;
    view.tabs = tabs_for_window(window);
    if (view.tabs.empty())
        return view;

    TabId preferred = active_tab_for_window(window);
    bool  owned     = std::any_of(view.tabs.begin(), view.tabs.end(),
                             [preferred](const Tab& t) { return t.id == preferred; });
    view.active_tab = owned ? preferred : view.tabs.front().id;
    return view;
}

StateCoordinator::ChangeListenerId StateCoordinator::add_change_listener(ChangeListener listener)
{
    ChangeListenerId id = next_listener_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

void StateCoordinator::remove_change_listener(ChangeListenerId id)
{
    std::erase_if(listeners_, [id](const auto& entry) { return entry.first == id; });
}

bool StateCoordinator::check_invariants(std::string* why) const
{
    auto fail = [why](std::string msg)
    {
        if (why)
            *why = std::move(msg);
        return false;
    };

    std::unordered_set<TabId> seen;
    for (const auto& t : tabs_)
    {
        std::string label = "tab " + std::to_string(t.id);
        if (!seen.insert(t.id).second)
            return fail(label + ": duplicate id");
        if (t.history.empty())
            return fail(label + ": empty history");
        if (t.history_index >= t.history.size())
            return fail(label + ": history index out of range");
        if (t.path != t.history[t.history_index])
            return fail(label + ": path does not match history");
        if (t.window_id != INVALID_WINDOW && !has_window(t.window_id))
            return fail(label + ": owned by unregistered window");
    }

    for (WindowId w : window_order_)
    {
        if (window_tab_count(tabs_, w) == 0)
            continue;
        const Tab* active = tab(active_tab_for_window(w));
        if (!active || active->window_id != w)
            return fail("window " + std::to_string(w) + ": active tab not owned");
    }
    return true;
}

// ─── Internals ───────────────────────────────────────────────────────────────

Tab* StateCoordinator::find(TabId id)
{
    size_t i = index_of(id);
    return i < tabs_.size() ? &tabs_[i] : nullptr;
}

size_t StateCoordinator::index_of(TabId id) const
{
    if (id == INVALID_TAB)
        return tabs_.size();
    for (size_t i = 0; i < tabs_.size(); ++i)
    {
        if (tabs_[i].id == id)
            return i;
    }
    return tabs_.size();
}

void StateCoordinator::erase_tab(TabId id)
{
    size_t i = index_of(id);
    if (i < tabs_.size())
        tabs_.erase(tabs_.begin() + static_cast<std::ptrdiff_t>(i));
}

void StateCoordinator::pick_window_active(WindowId window, size_t removed_position, bool prefer_preceding)
{
    std::vector<TabId> remaining;
    for (const auto& t : tabs_)
    {
        if (t.window_id == window)
            remaining.push_back(t.id);
    }
    if (remaining.empty())
    {
        active_per_window_.erase(window);
        return;
    }

    size_t pick = 0;
    if (prefer_preceding && removed_position > 0)
        pick = std::min(removed_position - 1, remaining.size() - 1);
    active_per_window_[window] = remaining[pick];
}

void StateCoordinator::repair_global_active()
{
    if (index_of(active_tab_) < tabs_.size())
        return;

    for (WindowId w : window_order_)
    {
        TabId candidate = active_tab_for_window(w);
        if (candidate != INVALID_TAB)
        {
            active_tab_ = candidate;
            return;
        }
    }
    active_tab_ = tabs_.empty() ? INVALID_TAB : tabs_.front().id;
}

void StateCoordinator::broadcast()
{
    if (in_broadcast_)
    {
        // A surface or listener mutated the registry; go round once more
        broadcast_again_ = true;
        return;
    }

    {
        BroadcastScope scope(in_broadcast_);
        do
        {
            broadcast_again_ = false;
            ++broadcasts_;

            auto windows = window_order_;
            for (WindowId w : windows)
            {
                if (WindowSurface* s = surface(w))
                    s->push_tab_state(view_for_window(w));
            }

            auto listeners = listeners_;
            for (const auto& [id, listener] : listeners)
            {
                // Skip listeners removed by an earlier one in this round
                bool still_registered = std::any_of(listeners_.begin(), listeners_.end(),
                                                    [id = id](const auto& e) { return e.first == id; });
                if (!still_registered)
                    continue;
                try
                {
                    listener();
                }
                catch (const std::exception& e)
                {
                    XPLORER_LOG_ERROR("state", "change listener {} threw: {}", id, e.what());
                }
                catch (...)
                {
                    XPLORER_LOG_ERROR("state", "change listener {} threw a non-standard exception", id);
                }
            }
        } while (broadcast_again_);
    }

    std::vector<WindowId> closing;
    closing.swap(pending_close_);
    for (WindowId w : closing)
        close_empty_window(w);
}

void StateCoordinator::close_empty_window(WindowId window)
{
    WindowSurface* s = surface(window);
    if (!s || window_tab_count(tabs_, window) > 0)
        return;

    // Unregister first so the host's own unregister_window becomes a no-op
    surfaces_.erase(window);
    std::erase(window_order_, window);
    active_per_window_.erase(window);
    XPLORER_LOG_INFO("state", "window {} has no tabs left, closing", window);

    s->close();
    broadcast();
}

}   // namespace xplorer::state
