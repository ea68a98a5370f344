#include "file_operations.hpp"

#include <xplorer/logger.hpp>

#include "../core/path_utils.hpp"

namespace xplorer::ops
{

namespace
{

ipc::Value string_array(const std::vector<std::string>& items)
{
    ipc::Value arr = ipc::Value::array();
    for (const auto& s : items)
        arr.push_back(s);
    return arr;
}

}   // namespace

FileOperations::FileOperations(ipc::RequestChannel& channel) : channel_(channel) {}

FileOpOutcome FileOperations::validate_move(const std::vector<std::string>& sources,
                                            const std::string&              destination)
{
    FileOpOutcome outcome;
    if (sources.empty() || destination.empty())
    {
        outcome.kind    = ipc::ErrorKind::InvalidTransfer;
        outcome.message = "Move failed: nothing to move";
        return outcome;
    }
    for (const auto& src : sources)
    {
        if (core::path::is_same_or_descendant(destination, src))
        {
            outcome.kind    = ipc::ErrorKind::InvalidTransfer;
            outcome.message = "Move failed: cannot move " + src + " into itself";
            return outcome;
        }
    }
    return outcome;
}

void FileOperations::move(const std::vector<std::string>& sources,
                          const std::string&              destination,
                          FileOpCallback                  callback)
{
    FileOpOutcome check = validate_move(sources, destination);
    if (!check.ok())
    {
        XPLORER_LOG_DEBUG("ops", "{}", check.message);
        if (callback)
            callback(check);
        return;
    }

    ipc::Value params = ipc::Value::object();
    params.set("sources", string_array(sources));
    params.set("destination", destination);
    issue("fs.move", "Move", std::move(params), std::move(callback));
}

void FileOperations::copy(const std::vector<std::string>& sources,
                          const std::string&              destination,
                          FileOpCallback                  callback)
{
    ipc::Value params = ipc::Value::object();
    params.set("sources", string_array(sources));
    params.set("destination", destination);
    issue("fs.copy", "Copy", std::move(params), std::move(callback));
}

void FileOperations::remove(const std::vector<std::string>& paths,
                            bool                            recycle_bin,
                            FileOpCallback                  callback)
{
    ipc::Value params = ipc::Value::object();
    params.set("paths", string_array(paths));
    params.set("recycleBin", recycle_bin);
    issue("fs.delete", "Delete", std::move(params), std::move(callback));
}

void FileOperations::rename(const std::string& path,
                            const std::string& new_name,
                            FileOpCallback     callback)
{
    ipc::Value params = ipc::Value::object();
    params.set("path", path);
    params.set("newName", new_name);
    issue("fs.rename", "Rename", std::move(params), std::move(callback));
}

void FileOperations::make_directory(const std::string& path, FileOpCallback callback)
{
    ipc::Value params = ipc::Value::object();
    params.set("path", path);
    issue("fs.mkdir", "Create folder", std::move(params), std::move(callback));
}

void FileOperations::issue(const std::string& action,
                           const std::string& label,
                           ipc::Value         params,
                           FileOpCallback     callback)
{
    channel_.send_request(action,
                          std::move(params),
                          [label, callback = std::move(callback)](const ipc::RequestResult& result)
                          {
                              FileOpOutcome outcome;
                              outcome.kind = result.kind;
                              if (result.ok())
                                  outcome.data = result.response.data;
                              else
                                  outcome.message = label + " failed: " + result.message;
                              if (callback)
                                  callback(outcome);
                          });
}

}   // namespace xplorer::ops
