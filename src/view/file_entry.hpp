#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "../ipc/value.hpp"

namespace xplorer::view
{

// One row of a directory listing as reported by fs.list / fs.info.
struct FileEntry
{
    std::string name;
    std::string path;
    bool        is_directory = false;
    bool        is_hidden    = false;
    bool        is_system    = false;
    bool        is_read_only = false;
    int64_t     size         = 0;
    int64_t     created_at   = 0;
    int64_t     modified_at  = 0;
    int64_t     accessed_at  = 0;
    std::string extension;
    std::string mime_type;

    // std::nullopt when v is not an object or has no path.
    static std::optional<FileEntry> from_value(const ipc::Value& v);
    ipc::Value                      to_value() const;
};

// Decodes an array of entries, skipping malformed items.
std::vector<FileEntry> entries_from_value(const ipc::Value& v);

// Folders first, then case-insensitive name, then path.
void sort_entries(std::vector<FileEntry>& entries);

}   // namespace xplorer::view
