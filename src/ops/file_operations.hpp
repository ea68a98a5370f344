#pragma once

#include <functional>
#include <string>
#include <vector>

#include "../ipc/channel.hpp"

namespace xplorer::ops
{

// Result of a user-triggered file operation. message is ready to show.
struct FileOpOutcome
{
    ipc::ErrorKind kind = ipc::ErrorKind::None;
    std::string    message;
    ipc::Value     data;

    bool ok() const { return kind == ipc::ErrorKind::None; }
};

using FileOpCallback = std::function<void(const FileOpOutcome&)>;

// Thin layer over the fs.* mutation actions. Failures are reported as
// "<Action> failed: <reason>".
class FileOperations
{
   public:
    explicit FileOperations(ipc::RequestChannel& channel);

    // Rejects a destination that is one of the sources or lies below one.
    static FileOpOutcome validate_move(const std::vector<std::string>& sources,
                                       const std::string&              destination);

    // Invalid moves are reported through callback without any request.
    void move(const std::vector<std::string>& sources,
              const std::string&              destination,
              FileOpCallback                  callback);
    void copy(const std::vector<std::string>& sources,
              const std::string&              destination,
              FileOpCallback                  callback);
    void remove(const std::vector<std::string>& paths, bool recycle_bin, FileOpCallback callback);
    void rename(const std::string& path, const std::string& new_name, FileOpCallback callback);
    void make_directory(const std::string& path, FileOpCallback callback);

   private:
    void issue(const std::string& action,
               const std::string& label,
               ipc::Value         params,
               FileOpCallback     callback);

    ipc::RequestChannel& channel_;
};

}   // namespace xplorer::ops
