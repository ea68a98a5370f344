#include "file_entry.hpp"

#include <algorithm>
#include <cctype>

#include "../core/path_utils.hpp"

namespace xplorer::view
{

std::optional<FileEntry> FileEntry::from_value(const ipc::Value& v)
{
    if (!v.is_object())
        return std::nullopt;

    FileEntry e;
    e.path = v.get_string("path");
    if (e.path.empty())
        return std::nullopt;

    e.name = v.get_string("name");
    if (e.name.empty())
        e.name = core::path::title_for_path(e.path);
    e.is_directory = v.get_bool("isDirectory");
    e.is_hidden    = v.get_bool("isHidden");
    e.is_system    = v.get_bool("isSystem");
    e.is_read_only = v.get_bool("isReadOnly");
    e.size         = v.get_int("size");
    e.created_at   = v.get_int("createdAt");
    e.modified_at  = v.get_int("modifiedAt");
    e.accessed_at  = v.get_int("accessedAt");
    e.extension    = v.get_string("extension");
    e.mime_type    = v.get_string("mimeType");
    return e;
}

ipc::Value FileEntry::to_value() const
{
    ipc::Value v = ipc::Value::object();
    v.set("name", name);
    v.set("path", path);
    v.set("isDirectory", is_directory);
    v.set("isHidden", is_hidden);
    v.set("isSystem", is_system);
    v.set("isReadOnly", is_read_only);
    v.set("size", size);
    v.set("createdAt", created_at);
    v.set("modifiedAt", modified_at);
    v.set("accessedAt", accessed_at);
    v.set("extension", extension);
    if (!mime_type.empty())
        v.set("mimeType", mime_type);
    else
        v.set("mimeType", nullptr);
    return v;
}

std::vector<FileEntry> entries_from_value(const ipc::Value& v)
{
    std::vector<FileEntry> out;
    if (!v.is_array())
        return out;
    out.reserve(v.size());
    for (const auto& item : v.items())
    {
        if (auto e = FileEntry::from_value(item))
            out.push_back(std::move(*e));
    }
    return out;
}

void sort_entries(std::vector<FileEntry>& entries)
{
    auto lower = [](const std::string& s)
    {
        std::string out(s);
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    };

    std::stable_sort(entries.begin(), entries.end(),
                     [&](const FileEntry& a, const FileEntry& b)
                     {
                         if (a.is_directory != b.is_directory)
                             return a.is_directory;
                         std::string la = lower(a.name);
                         std::string lb = lower(b.name);
                         if (la != lb)
                             return la < lb;
                         return a.path < b.path;
                     });
}

}   // namespace xplorer::view
