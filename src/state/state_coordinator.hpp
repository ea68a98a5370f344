#pragma once

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <xplorer/tab.hpp>

#include "window_surface.hpp"

namespace xplorer::state
{

// Canonical tab/window registry. Every mutation recomputes the filtered view
// of each registered window and pushes it to that window's surface only.
// Single-threaded: all calls come from the dispatch loop.
class StateCoordinator
{
   public:
    using ChangeListener   = std::function<void()>;
    using ChangeListenerId = uint64_t;

    StateCoordinator() = default;

    StateCoordinator(const StateCoordinator&)            = delete;
    StateCoordinator& operator=(const StateCoordinator&) = delete;

    // --- Windows ---

    WindowId allocate_window_id() { return next_window_id_++; }

    // Surface is not owned and must outlive its registration.
    bool register_window(WindowId id, WindowSurface* surface);

    // Called when a surface is destroyed. Removes every tab it owns.
    void unregister_window(WindowId id);

    bool                  has_window(WindowId id) const;
    WindowSurface*        surface(WindowId id) const;
    std::vector<WindowId> window_ids() const { return window_order_; }
    size_t                window_count() const { return window_order_.size(); }

    // When enabled (default), a window left with zero tabs by remove_tab or
    // transfer_tab is unregistered and its surface closed.
    void set_close_empty_windows(bool enabled) { close_empty_windows_ = enabled; }

    // --- Tab lifecycle ---

    // Creates a tab at path (landing path when omitted), bound to window if
    // given, and makes it active. Fails if window is given but unknown.
    std::optional<Tab> create_tab(std::optional<std::string> path   = std::nullopt,
                                  WindowId                   window = INVALID_WINDOW);

    // Refused (returns false) when the tab is the last one its window owns.
    bool close_tab(TabId id);

    // Sends the tab back to the landing path with a fresh history. Used
    // instead of close_tab for a window's last tab.
    bool reset_tab(TabId id);

    bool set_active_tab(TabId id);

    // --- History ---

    bool navigate_tab(TabId id, const std::string& path);
    bool go_back_tab(TabId id);
    bool go_forward_tab(TabId id);

    // Same operations against the global active tab.
    bool navigate_to(const std::string& path);
    bool go_back();
    bool go_forward();

    // --- Transfer primitives ---

    // Inserts tab data into window and makes it active there. Assigns a fresh
    // id when tab.id is unset or already taken. Returns the stored tab.
    std::optional<Tab> add_tab(Tab tab, WindowId window = INVALID_WINDOW);

    // Always allowed, even for a window's last tab.
    std::optional<Tab> remove_tab(TabId id);

    // Moves ownership to target. Returns false if the tab or the target
    // window does not exist.
    bool transfer_tab(TabId id, WindowId target);

    void remove_tabs_for_window(WindowId window);

    // --- Queries ---

    std::vector<Tab> tabs_for_window(WindowId window) const;
    TabId            active_tab_for_window(WindowId window) const;
    const Tab*       tab(TabId id) const;
    TabId            active_tab() const { return active_tab_; }
    size_t           tab_count() const { return tabs_.size(); }
    WindowTabState   view_for_window(WindowId window) const;

    // Runs after every broadcast, once the surfaces have been updated.
    ChangeListenerId add_change_listener(ChangeListener listener);
    void             remove_change_listener(ChangeListenerId id);

    // Verifies the registry invariants. Fills why with the first violation.
    bool check_invariants(std::string* why = nullptr) const;

    uint64_t broadcast_count() const { return broadcasts_; }

   private:
    Tab*   find(TabId id);
    size_t index_of(TabId id) const;
    void   erase_tab(TabId id);
    void   pick_window_active(WindowId window, size_t removed_position, bool prefer_preceding);
    void   repair_global_active();
    void   broadcast();
    void   close_empty_window(WindowId window);

    std::vector<Tab>                          tabs_;
    std::unordered_map<WindowId, TabId>       active_per_window_;
    TabId                                     active_tab_ = INVALID_TAB;
    std::unordered_map<WindowId, WindowSurface*> surfaces_;
    std::vector<WindowId>                     window_order_;
    std::vector<WindowId>                     pending_close_;

    TabId    next_tab_id_    = 1;
    WindowId next_window_id_ = 1;

    bool     close_empty_windows_ = true;
    bool     in_broadcast_        = false;
    bool     broadcast_again_     = false;
    uint64_t broadcasts_          = 0;

    ChangeListenerId                                          next_listener_ = 1;
    std::vector<std::pair<ChangeListenerId, ChangeListener>> listeners_;
};

}   // namespace xplorer::state
