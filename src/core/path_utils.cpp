#include "path_utils.hpp"

#include <cctype>
#include <xplorer/tab.hpp>

namespace xplorer::core::path
{

namespace
{

bool is_windows_style(std::string_view p)
{
    return p.size() >= 2 && std::isalpha(static_cast<unsigned char>(p[0])) && p[1] == ':';
}

std::string_view strip_trailing(std::string_view p)
{
    // Keep "C:\" and "/" intact
    while (p.size() > 1 && is_separator(p.back()))
    {
        if (p.size() == 3 && is_windows_style(p))
            break;
        p.remove_suffix(1);
    }
    return p;
}

bool chars_equal(char a, char b, bool fold)
{
    if (is_separator(a) && is_separator(b))
        return true;
    if (fold)
        return std::tolower(static_cast<unsigned char>(a))
               == std::tolower(static_cast<unsigned char>(b));
    return a == b;
}

}   // namespace

bool is_separator(char c)
{
    return c == '\\' || c == '/';
}

std::string title_for_path(std::string_view path)
{
    if (path == HOME_PATH)
        return HOME_PATH;
    if (path.empty())
        return std::string();

    std::string_view trimmed = strip_trailing(path);
    size_t           cut     = trimmed.find_last_of("\\/");
    if (cut == std::string_view::npos)
        return std::string(trimmed);

    std::string_view last = trimmed.substr(cut + 1);
    if (last.empty())
        return std::string(path);
    return std::string(last);
}

std::string parent_path(std::string_view path)
{
    std::string_view trimmed = strip_trailing(path);
    size_t           cut     = trimmed.find_last_of("\\/");
    if (cut == std::string_view::npos)
        return std::string(trimmed);

    // "C:\Users" -> "C:\", "/home" -> "/"
    if (cut == 0 || (cut == 2 && is_windows_style(trimmed)))
        return std::string(trimmed.substr(0, cut + 1));
    return std::string(trimmed.substr(0, cut));
}

bool same_path(std::string_view a, std::string_view b)
{
    a = strip_trailing(a);
    b = strip_trailing(b);
    if (a.size() != b.size())
        return false;
    bool fold = is_windows_style(a) || is_windows_style(b);
    for (size_t i = 0; i < a.size(); ++i)
    {
        if (!chars_equal(a[i], b[i], fold))
            return false;
    }
    return true;
}

bool is_same_or_descendant(std::string_view candidate, std::string_view ancestor)
{
    candidate = strip_trailing(candidate);
    ancestor  = strip_trailing(ancestor);
    if (ancestor.empty() || candidate.size() < ancestor.size())
        return false;

    bool fold = is_windows_style(candidate) || is_windows_style(ancestor);
    for (size_t i = 0; i < ancestor.size(); ++i)
    {
        if (!chars_equal(candidate[i], ancestor[i], fold))
            return false;
    }
    if (candidate.size() == ancestor.size())
        return true;
    // Roots already end in a separator
    return is_separator(ancestor.back()) || is_separator(candidate[ancestor.size()]);
}

}   // namespace xplorer::core::path
