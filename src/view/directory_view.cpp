#include "directory_view.hpp"

#include <algorithm>
#include <xplorer/logger.hpp>

#include "../core/path_utils.hpp"

namespace xplorer::view
{

namespace
{

bool is_browsable(const std::string& path)
{
    return !path.empty() && path != HOME_PATH;
}

}   // namespace

DirectoryView::DirectoryView(WindowId                 window,
                             state::StateCoordinator& coordinator,
                             ops::OperationLifecycle& lifecycle,
                             ipc::RequestChannel&     requests,
                             ipc::EventChannel&       events)
    : window_(window),
      coordinator_(coordinator),
      lifecycle_(lifecycle),
      requests_(requests),
      events_(events)
{
    change_listener_ = coordinator_.add_change_listener([this] { sync(); });
    event_listener_  = events_.add_event_listener([this](const ipc::Event& e) { on_event(e); });
    sync();
}

DirectoryView::~DirectoryView()
{
    close();
}

void DirectoryView::close()
{
    if (closed_)
        return;
    closed_ = true;

    lifecycle_.release_consumer(window_);
    watch_token_.reset();
    if (!topic_.empty())
    {
        events_.release_topic(topic_);
        topic_.clear();
    }
    coordinator_.remove_change_listener(change_listener_);
    events_.remove_event_listener(event_listener_);
    XPLORER_LOG_DEBUG("view", "view for window {} closed", window_);
}

// ─── Following the active tab ────────────────────────────────────────────────

void DirectoryView::sync()
{
    if (closed_)
        return;
    if (!coordinator_.has_window(window_))
    {
        close();
        return;
    }

    ops::ConsumerIdentity identity = lifecycle_.current_identity(window_);
    const Tab*            active   = coordinator_.tab(identity.tab);
    std::string           path     = active ? active->path : std::string();

    if (identity.tab == tab_ && path == path_)
        return;

    bool path_changed = path != path_;
    tab_              = identity.tab;
    path_             = path;

    if (search_active_ || searching_)
        cancel_search();

    if (path_changed)
        drop_folder_sizes();

    watch(path_);
    load();
}

void DirectoryView::watch(const std::string& path)
{
    // Handlers bound to the previous identity or path are now stale
    watch_token_ = lifecycle_.begin(window_, OP_WATCH, false);

    std::string topic = is_browsable(path) ? path : std::string();
    if (topic == topic_)
        return;
    if (!topic_.empty())
        events_.release_topic(topic_);
    topic_ = topic;
    if (!topic_.empty())
        events_.acquire_topic(topic_);
}

void DirectoryView::refresh()
{
    if (!closed_)
        load();
}

void DirectoryView::load()
{
    error_.clear();
    if (!is_browsable(path_))
    {
        lifecycle_.supersede(window_, OP_LIST);
        listing_.clear();
        loading_ = false;
        return;
    }

    loading_ = true;

    ipc::Value params = ipc::Value::object();
    params.set("path", path_);

    std::string requested = path_;
    lifecycle_.run(window_, OP_LIST, "fs.list", std::move(params), true,
                   [this, requested](const ipc::RequestResult& result)
                   {
                       loading_ = false;
                       if (!result.ok())
                       {
                           error_ = result.message.empty() ? "Failed to load directory"
                                                           : result.message;
                           XPLORER_LOG_DEBUG("view", "listing {} failed: {}", requested, error_);
                           return;
                       }
                       listing_ = entries_from_value(result.response.data);
                       sort_entries(listing_);
                   });
}

// ─── Search ──────────────────────────────────────────────────────────────────

bool DirectoryView::search(const std::string& query, bool recursive)
{
    if (closed_ || !is_browsable(path_))
        return false;
    if (query.empty())
    {
        cancel_search();
        return true;
    }

    search_active_ = true;
    searching_     = true;
    search_results_.clear();

    ipc::Value params = ipc::Value::object();
    params.set("path", path_);
    params.set("query", query);
    params.set("recursive", recursive);

    lifecycle_.run(window_, OP_SEARCH, "fs.search", std::move(params), true,
                   [this](const ipc::RequestResult& result)
                   {
                       searching_ = false;
                       if (!result.ok())
                       {
                           error_ = "Search failed: " + result.message;
                           return;
                       }
                       search_results_ = entries_from_value(result.response.data);
                       sort_entries(search_results_);
                   });
    return true;
}

void DirectoryView::cancel_search()
{
    lifecycle_.supersede(window_, OP_SEARCH);
    search_active_ = false;
    searching_     = false;
    search_results_.clear();
}

// ─── Folder sizes ────────────────────────────────────────────────────────────

void DirectoryView::request_folder_size(const std::string& path)
{
    if (closed_ || path.empty())
        return;

    // Each folder has its own token; asking again for the same folder
    // supersedes only that folder's request.
    std::string op_class = std::string(OP_FOLDER_SIZE) + ":" + path;
    size_classes_.insert(op_class);

    ipc::Value params = ipc::Value::object();
    params.set("path", path);

    std::string shown = path_;
    lifecycle_.run(window_, op_class, "fs.folderSize", std::move(params), true,
                   [this, path, shown, op_class](const ipc::RequestResult& result)
                   {
                       size_classes_.erase(op_class);
                       if (shown != path_)
                       {
                           XPLORER_LOG_TRACE("view", "size of {} arrived after leaving {}", path, shown);
                           return;
                       }
                       if (result.ok())
                           folder_sizes_[path] = result.response.data.get_int("size");
                   });
}

void DirectoryView::drop_folder_sizes()
{
    for (const auto& op_class : size_classes_)
        lifecycle_.supersede(window_, op_class);
    size_classes_.clear();
    folder_sizes_.clear();
}

std::optional<int64_t> DirectoryView::folder_size(const std::string& path) const
{
    auto it = folder_sizes_.find(path);
    if (it == folder_sizes_.end())
        return std::nullopt;
    return it->second;
}

// ─── Change events ───────────────────────────────────────────────────────────

bool DirectoryView::watch_valid(const ops::TokenPtr& token) const
{
    return token && token == watch_token_ && lifecycle_.still_valid(*token);
}

void DirectoryView::on_event(const ipc::Event& event)
{
    if (closed_ || event.type != "fs.changed" || !watch_token_)
        return;
    if (!watch_valid(watch_token_))
    {
        lifecycle_.note_discard(*watch_token_);
        return;
    }

    const std::string kind     = event.data.get_string("eventType");
    const std::string old_path = event.data.get_string("oldPath");

    bool in_view = core::path::same_path(core::path::parent_path(event.path), path_);
    if (kind == "overflow")
    {
        if (core::path::same_path(event.path, path_) || in_view)
        {
            XPLORER_LOG_DEBUG("view", "watch overflow on {}, reloading", path_);
            load();
        }
        return;
    }

    bool old_in_view = !old_path.empty()
                       && core::path::same_path(core::path::parent_path(old_path), path_);
    if (!in_view && !old_in_view)
        return;

    if (kind == "created" || kind == "modified")
    {
        fetch_info(event.path);
    }
    else if (kind == "deleted")
    {
        remove_entry(event.path);
    }
    else if (kind == "renamed")
    {
        if (!old_path.empty())
            remove_entry(old_path);
        if (in_view)
            fetch_info(event.path);
    }
    else
    {
        XPLORER_LOG_DEBUG("view", "ignoring change kind '{}'", kind);
    }
}

void DirectoryView::fetch_info(const std::string& path)
{
    ipc::Value params = ipc::Value::object();
    params.set("path", path);

    // Several lookups may be in flight; they share the watch token. close()
    // cancels it, so a cancelled token means this view may be gone.
    ops::TokenPtr token = watch_token_;
    requests_.send_request("fs.info", std::move(params),
                           [this, token, &lifecycle = lifecycle_](const ipc::RequestResult& result)
                           {
                               if (token->cancelled || !watch_valid(token))
                               {
                                   lifecycle.note_discard(*token);
                                   return;
                               }
                               if (!result.ok())
                                   return;
                               if (auto entry = FileEntry::from_value(result.response.data))
                                   upsert(std::move(*entry));
                           });
}

void DirectoryView::upsert(FileEntry entry)
{
    auto it = std::find_if(listing_.begin(), listing_.end(),
                           [&](const FileEntry& e) { return core::path::same_path(e.path, entry.path); });
    if (it != listing_.end())
        *it = std::move(entry);
    else
        listing_.push_back(std::move(entry));
    sort_entries(listing_);
}

void DirectoryView::remove_entry(const std::string& path)
{
    std::erase_if(listing_, [&](const FileEntry& e) { return core::path::same_path(e.path, path); });
}

std::vector<FileEntry> DirectoryView::entries() const
{
    const auto&            source = search_active_ ? search_results_ : listing_;
    std::vector<FileEntry> out;
    out.reserve(source.size());
    for (const auto& e : source)
    {
        if (show_hidden_ || !e.is_hidden)
            out.push_back(e);
    }
    return out;
}

}   // namespace xplorer::view
