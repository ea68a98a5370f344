#pragma once

#include <xplorer/tab.hpp>

namespace xplorer::state
{

// Screen-space rectangle in pixels.
struct Rect
{
    int x      = 0;
    int y      = 0;
    int width  = 0;
    int height = 0;

    bool contains(double px, double py) const
    {
        return px >= x && px < x + width && py >= y && py < y + height;
    }

    // Top strip of the given height, clamped to the rectangle.
    Rect top_strip(int strip_height) const
    {
        return Rect{x, y, width, strip_height < height ? strip_height : height};
    }
};

// Host-side handle of one top-level window. The coordinator never caches
// bounds() because windows move and resize continuously.
class WindowSurface
{
   public:
    virtual ~WindowSurface() = default;

    virtual Rect bounds() const = 0;

    // Receives this window's filtered slice after every registry mutation.
    virtual void push_tab_state(const WindowTabState& state) = 0;

    virtual void set_drop_indicator(bool visible) = 0;
    virtual void focus()                          = 0;

    // Requests the surface to go away. The host later calls
    // StateCoordinator::unregister_window (a no-op if already unregistered).
    virtual void close() = 0;
};

}   // namespace xplorer::state
