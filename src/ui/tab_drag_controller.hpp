#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <xplorer/tab.hpp>

namespace xplorer::state
{
class StateCoordinator;
}

namespace xplorer::ui
{

enum class MouseButton
{
    Left,
    Right,
    Middle,
};

enum class DragOutcome
{
    None,               // press consumed, nothing decided yet (or nothing to do)
    Activated,          // released below the threshold
    Closed,             // middle button
    Transferred,        // dropped on another window's tab strip
    NewWindowSpawned,   // dropped outside every window
    Cancelled,          // dropped somewhere else, or cancel()
    InvalidTransfer,    // drop target vanished before the transfer
};

const char* drag_outcome_name(DragOutcome outcome);

// ─── TabDragController ───────────────────────────────────────────────────────
// Drag state machine for moving a tab between windows. One instance per
// window; all coordinates are screen space.
//
//   Idle ──left down──► Candidate ──move > threshold──► Dragging
//     ▲                     │                              │
//     │                 mouse_up                        mouse_up
//     │                     │                              │
//     │                 Activated        Transferred / NewWindowSpawned /
//     │                     │                 Cancelled / InvalidTransfer
//     └─────────────────────┴──────────────────────────────┘
//
// While Dragging, the rectangles of the other registered windows are polled
// (at most once per poll interval) and the window whose tab strip is under
// the pointer shows its drop indicator. The indicator is always cleared when
// the drag ends.

class TabDragController
{
   public:
    enum class State
    {
        Idle,
        Candidate,
        Dragging,
    };

    using Clock      = std::chrono::steady_clock;
    using TimeSource = std::function<Clock::time_point()>;

    // Creates and registers a fresh window for a tab dropped outside every
    // window. Returns INVALID_WINDOW when no window could be created.
    using SpawnWindowHandler = std::function<WindowId(const Tab& tab, double sx, double sy)>;

    struct Options
    {
        int                       drag_threshold_px = 10;
        int                       strip_height_px   = 40;
        std::chrono::milliseconds poll_interval{16};
    };

    TabDragController(WindowId window, state::StateCoordinator& coordinator);
    TabDragController(WindowId window, state::StateCoordinator& coordinator, Options options);
    ~TabDragController();

    TabDragController(const TabDragController&)            = delete;
    TabDragController& operator=(const TabDragController&) = delete;

    void set_spawn_handler(SpawnWindowHandler handler) { spawn_ = std::move(handler); }
    void set_time_source(TimeSource source) { time_source_ = std::move(source); }

    // ── Input ───────────────────────────────────────────────────────────

    DragOutcome on_mouse_down(MouseButton button, TabId tab, double sx, double sy);
    void        on_mouse_move(double sx, double sy);
    DragOutcome on_mouse_up(double sx, double sy);

    // ESC or right button during a drag.
    void cancel();

    // ── Queries ─────────────────────────────────────────────────────────

    State    state() const { return state_; }
    bool     is_dragging() const { return state_ == State::Dragging; }
    bool     is_active() const { return state_ != State::Idle; }
    WindowId window() const { return window_; }
    TabId    dragged_tab() const { return tab_; }
    WindowId hovered_window() const { return hovered_; }

    // Number of rectangle polls performed, for rate-limit checks.
    uint64_t hit_tests() const { return hit_tests_; }

    const Options& options() const { return options_; }

   private:
    Clock::time_point now() const;

    bool     exceeds_threshold(double sx, double sy) const;
    WindowId find_strip_at(double sx, double sy);
    bool     is_outside_all_windows(double sx, double sy) const;
    void     set_hovered(WindowId target);

    DragOutcome drop_on_window(WindowId target);
    DragOutcome drop_outside(double sx, double sy);
    void        transition_to_idle();

    WindowId                 window_;
    state::StateCoordinator& coordinator_;
    Options                  options_;

    State             state_   = State::Idle;
    TabId             tab_     = INVALID_TAB;
    double            start_x_ = 0.0;
    double            start_y_ = 0.0;
    WindowId          hovered_ = INVALID_WINDOW;
    Clock::time_point last_poll_{};
    uint64_t          hit_tests_ = 0;

    SpawnWindowHandler spawn_;
    TimeSource         time_source_;
};

}   // namespace xplorer::ui
