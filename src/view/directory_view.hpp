#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <xplorer/fwd.hpp>

#include "../ipc/channel.hpp"
#include "../ops/operation_lifecycle.hpp"
#include "../state/state_coordinator.hpp"
#include "file_entry.hpp"

namespace xplorer::view
{

// Directory listing shown by one window: follows the window's active tab,
// keeps a topic subscription on the shown path and applies change events.
// Every asynchronous result goes through the check-before-apply discipline.
class DirectoryView
{
   public:
    // Operation classes, one live token each per window. Folder sizes use
    // OP_FOLDER_SIZE suffixed with the folder path, one token per folder.
    static constexpr const char* OP_LIST        = "list";
    static constexpr const char* OP_SEARCH      = "search";
    static constexpr const char* OP_FOLDER_SIZE = "folder-size";
    static constexpr const char* OP_WATCH       = "watch";

    DirectoryView(WindowId                 window,
                  state::StateCoordinator& coordinator,
                  ops::OperationLifecycle& lifecycle,
                  ipc::RequestChannel&     requests,
                  ipc::EventChannel&       events);
    ~DirectoryView();

    DirectoryView(const DirectoryView&)            = delete;
    DirectoryView& operator=(const DirectoryView&) = delete;

    // Re-derives the shown tab and path from the coordinator. Runs on every
    // registry change.
    void sync();

    // Reloads the current directory.
    void refresh();

    // Searches below the current directory. Results replace the listing
    // until cancel_search(). Returns false on the landing path.
    bool search(const std::string& query, bool recursive = true);
    void cancel_search();

    void                   request_folder_size(const std::string& path);
    std::optional<int64_t> folder_size(const std::string& path) const;

    void set_show_hidden(bool show) { show_hidden_ = show; }

    // Unmount: supersedes all outstanding work and drops the subscription.
    void close();

    WindowId           window() const { return window_; }
    TabId              tab() const { return tab_; }
    const std::string& path() const { return path_; }
    bool               loading() const { return loading_; }
    bool               searching() const { return searching_; }
    bool               search_active() const { return search_active_; }
    const std::string& error() const { return error_; }
    bool               closed() const { return closed_; }

    // Visible rows: search results while a search is active, otherwise the
    // directory listing. Hidden entries are dropped unless shown.
    std::vector<FileEntry> entries() const;

   private:
    void load();
    void watch(const std::string& path);
    void on_event(const ipc::Event& event);
    void fetch_info(const std::string& path);
    void upsert(FileEntry entry);
    void remove_entry(const std::string& path);
    bool watch_valid(const ops::TokenPtr& token) const;
    void drop_folder_sizes();

    WindowId                 window_;
    state::StateCoordinator& coordinator_;
    ops::OperationLifecycle& lifecycle_;
    ipc::RequestChannel&     requests_;
    ipc::EventChannel&       events_;

    TabId       tab_ = INVALID_TAB;
    std::string path_;
    std::string topic_;
    ops::TokenPtr watch_token_;

    std::vector<FileEntry>         listing_;
    std::vector<FileEntry>         search_results_;
    std::map<std::string, int64_t> folder_sizes_;
    std::set<std::string>          size_classes_;

    bool        loading_       = false;
    bool        searching_     = false;
    bool        search_active_ = false;
    bool        show_hidden_   = false;
    bool        closed_        = false;
    std::string error_;

    state::StateCoordinator::ChangeListenerId change_listener_ = 0;
    ipc::ListenerId                           event_listener_  = 0;
};

}   // namespace xplorer::view
