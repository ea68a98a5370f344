#pragma once

#include <string>
#include <string_view>

namespace xplorer::core::path
{

bool is_separator(char c);

// Last non-empty component, the path itself for roots like "C:\".
std::string title_for_path(std::string_view path);

// Everything before the last separator. Roots return themselves.
std::string parent_path(std::string_view path);

// True when candidate is ancestor or lives below it. Drive letter paths
// compare case-insensitively.
bool is_same_or_descendant(std::string_view candidate, std::string_view ancestor);

bool same_path(std::string_view a, std::string_view b);

}   // namespace xplorer::core::path
