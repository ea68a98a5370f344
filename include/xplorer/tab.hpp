#pragma once

#include <string>
#include <vector>
#include <xplorer/fwd.hpp>

namespace xplorer
{

// Path shown by a tab that has not navigated anywhere yet.
inline constexpr const char* HOME_PATH = "Home";

// One browsing context. path always equals history[history_index].
struct Tab
{
    TabId                    id = INVALID_TAB;
    std::string              path;
    std::string              title;
    std::vector<std::string> history;
    size_t                   history_index = 0;
    WindowId                 window_id     = INVALID_WINDOW;

    bool can_go_back() const { return history_index > 0; }
    bool can_go_forward() const { return history_index + 1 < history.size(); }
};

// The slice of the registry one window is allowed to see.
struct WindowTabState
{
    std::vector<Tab> tabs;
    TabId            active_tab = INVALID_TAB;
};

}   // namespace xplorer
