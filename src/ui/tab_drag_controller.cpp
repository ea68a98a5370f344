#include "tab_drag_controller.hpp"

#include <cmath>
#include <xplorer/logger.hpp>

#include "../state/state_coordinator.hpp"

namespace xplorer::ui
{

const char* drag_outcome_name(DragOutcome outcome)
{
    switch (outcome)
    {
        case DragOutcome::None:
            return "none";
        case DragOutcome::Activated:
            return "activated";
        case DragOutcome::Closed:
            return "closed";
        case DragOutcome::Transferred:
            return "transferred";
        case DragOutcome::NewWindowSpawned:
            return "new-window";
        case DragOutcome::Cancelled:
            return "cancelled";
        case DragOutcome::InvalidTransfer:
            return "invalid-transfer";
    }
    return "unknown";
}

TabDragController::TabDragController(WindowId window, state::StateCoordinator& coordinator)
    : TabDragController(window, coordinator, Options{})
{
}

TabDragController::TabDragController(WindowId                 window,
                                     state::StateCoordinator& coordinator,
                                     Options                  options)
    : window_(window), coordinator_(coordinator), options_(options)
{
}

TabDragController::~TabDragController()
{
    // A controller torn down mid-drag must not leave an indicator behind.
    if (hovered_ != INVALID_WINDOW)
        set_hovered(INVALID_WINDOW);
}

TabDragController::Clock::time_point TabDragController::now() const
{
    return time_source_ ? time_source_() : Clock::now();
}

// ─── Input events ────────────────────────────────────────────────────────────

DragOutcome TabDragController::on_mouse_down(MouseButton button, TabId tab, double sx, double sy)
{
    if (state_ != State::Idle)
        return DragOutcome::None;

    const Tab* t = coordinator_.tab(tab);
    if (!t || t->window_id != window_)
        return DragOutcome::None;

    if (button == MouseButton::Middle)
    {
        // The coordinator refuses to close a window's last tab.
        if (coordinator_.close_tab(tab))
            return DragOutcome::Closed;
        return DragOutcome::None;
    }

    if (button != MouseButton::Left)
        return DragOutcome::None;

    state_   = State::Candidate;
    tab_     = tab;
    start_x_ = sx;
    start_y_ = sy;
    hovered_ = INVALID_WINDOW;
    return DragOutcome::None;
}

void TabDragController::on_mouse_move(double sx, double sy)
{
    switch (state_)
    {
        case State::Idle:
            break;

        case State::Candidate:
            if (!exceeds_threshold(sx, sy))
                break;
            state_ = State::Dragging;
            XPLORER_LOG_DEBUG("drag", "window {} dragging tab {}", window_, tab_);
            set_hovered(find_strip_at(sx, sy));
            last_poll_ = now();
            break;

        case State::Dragging:
        {
            auto t = now();
            if (t - last_poll_ < options_.poll_interval)
                break;
            last_poll_ = t;
            set_hovered(find_strip_at(sx, sy));
            break;
        }
    }
}

DragOutcome TabDragController::on_mouse_up(double sx, double sy)
{
    DragOutcome outcome = DragOutcome::None;

    switch (state_)
    {
        case State::Idle:
            return DragOutcome::None;

        case State::Candidate:
            outcome = coordinator_.set_active_tab(tab_) ? DragOutcome::Activated
                                                        : DragOutcome::Cancelled;
            break;

        case State::Dragging:
        {
            if (!coordinator_.tab(tab_))
            {
                outcome = DragOutcome::Cancelled;
                break;
            }

            // Fresh hit test: the last poll may be up to one interval old.
            WindowId target = find_strip_at(sx, sy);
            set_hovered(INVALID_WINDOW);

            if (target != INVALID_WINDOW)
                outcome = drop_on_window(target);
            else if (is_outside_all_windows(sx, sy)
                     && coordinator_.tabs_for_window(window_).size() > 1)
                outcome = drop_outside(sx, sy);
            else
                outcome = DragOutcome::Cancelled;
            break;
        }
    }

    XPLORER_LOG_DEBUG("drag", "window {} tab {} released: {}", window_, tab_,
                      drag_outcome_name(outcome));
    transition_to_idle();
    return outcome;
}

void TabDragController::cancel()
{
    if (state_ == State::Idle)
        return;
    XPLORER_LOG_DEBUG("drag", "window {} drag of tab {} cancelled", window_, tab_);
    transition_to_idle();
}

// ─── Drops ───────────────────────────────────────────────────────────────────

DragOutcome TabDragController::drop_on_window(WindowId target)
{
    if (!coordinator_.transfer_tab(tab_, target))
    {
        XPLORER_LOG_WARN("drag", "transfer of tab {} to window {} rejected", tab_, target);
        return DragOutcome::InvalidTransfer;
    }

    // The target may have been closed by a listener reacting to the transfer.
    if (auto* surface = coordinator_.surface(target))
        surface->focus();
    return DragOutcome::Transferred;
}

DragOutcome TabDragController::drop_outside(double sx, double sy)
{
    if (!spawn_)
        return DragOutcome::Cancelled;

    Tab seed = *coordinator_.tab(tab_);

    WindowId fresh = spawn_(seed, sx, sy);
    if (fresh == INVALID_WINDOW || !coordinator_.has_window(fresh))
    {
        XPLORER_LOG_WARN("drag", "could not open a window for tab {}", tab_);
        return DragOutcome::Cancelled;
    }

    if (!coordinator_.add_tab(seed, fresh))
    {
        XPLORER_LOG_WARN("drag", "window {} refused tab data for tab {}", fresh, tab_);
        return DragOutcome::Cancelled;
    }
    coordinator_.remove_tab(tab_);
    return DragOutcome::NewWindowSpawned;
}

// ─── Hit testing ─────────────────────────────────────────────────────────────

bool TabDragController::exceeds_threshold(double sx, double sy) const
{
    double limit = static_cast<double>(options_.drag_threshold_px);
    return std::abs(sx - start_x_) > limit || std::abs(sy - start_y_) > limit;
}

WindowId TabDragController::find_strip_at(double sx, double sy)
{
    ++hit_tests_;
    for (WindowId id : coordinator_.window_ids())
    {
        if (id == window_)
            continue;
        auto* surface = coordinator_.surface(id);
        if (!surface)
            continue;
        if (surface->bounds().top_strip(options_.strip_height_px).contains(sx, sy))
            return id;
    }
    return INVALID_WINDOW;
}

bool TabDragController::is_outside_all_windows(double sx, double sy) const
{
    for (WindowId id : coordinator_.window_ids())
    {
        auto* surface = coordinator_.surface(id);
        if (surface && surface->bounds().contains(sx, sy))
            return false;
    }
    return true;
}

void TabDragController::set_hovered(WindowId target)
{
    if (target == hovered_)
        return;

    if (hovered_ != INVALID_WINDOW)
    {
        if (auto* previous = coordinator_.surface(hovered_))
            previous->set_drop_indicator(false);
    }
    if (target != INVALID_WINDOW)
    {
        if (auto* next = coordinator_.surface(target))
            next->set_drop_indicator(true);
    }
    hovered_ = target;
}

void TabDragController::transition_to_idle()
{
    set_hovered(INVALID_WINDOW);
    state_   = State::Idle;
    tab_     = INVALID_TAB;
    start_x_ = 0.0;
    start_y_ = 0.0;
}

}   // namespace xplorer::ui
