#pragma once

#include "message.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace xplorer::ipc
{

// ─── Connection ──────────────────────────────────────────────────────────────
// Wraps a connected socket fd. Provides send/recv of framed Messages.
// Not thread-safe. All users live on the dispatch loop.

class Connection
{
   public:
    enum class ReadStatus
    {
        Ok,              // zero or more complete frames appended
        Closed,          // peer closed; frames received before EOF are still appended
        ProtocolError,   // bad magic or oversized frame; connection is unusable
    };

    explicit Connection(int fd);
    ~Connection();

    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;
    Connection(Connection&& other) noexcept;
    Connection& operator=(Connection&& other) noexcept;

    // Connected pair of anonymous sockets, for in-process wiring and tests.
    static std::pair<std::unique_ptr<Connection>, std::unique_ptr<Connection>> make_pair();

    bool is_open() const { return fd_ >= 0; }

    // Send a complete message. Returns false on error (including a closed peer).
    bool send(const Message& msg);

    // Receive a complete message (blocking).
    // Returns std::nullopt on error or connection closed.
    std::optional<Message> recv();

    // Drain whatever the socket has buffered without blocking and append
    // every complete frame to out. Partial frames stay buffered.
    ReadStatus read_available(std::vector<Message>& out);

    void close();

    int fd() const { return fd_; }

   private:
    enum class FrameResult
    {
        Frame,
        Incomplete,
        Invalid,
    };

    int                  fd_ = -1;
    std::vector<uint8_t> rx_;
    uint64_t             tx_seq_ = 0;

    bool        write_exact(const uint8_t* buf, size_t len);
    FrameResult pop_frame(Message& out);
};

// ─── Server ──────────────────────────────────────────────────────────────────
// Listens on a Unix domain socket. Accepts connections.

class Server
{
   public:
    Server();
    ~Server();

    Server(const Server&)            = delete;
    Server& operator=(const Server&) = delete;

    // Bind and listen on the given socket path.
    // Returns true on success. Removes stale socket file if present.
    bool listen(const std::string& path);

    // Blocking accept. Returns nullptr if the server is closed or on error.
    std::unique_ptr<Connection> accept();

    // Non-blocking accept. Returns nullptr immediately if nothing is pending.
    std::unique_ptr<Connection> try_accept();

    // Close the listening socket and remove the socket file.
    void close();

    bool               is_listening() const { return listen_fd_ >= 0; }
    int                listen_fd() const { return listen_fd_; }
    const std::string& path() const { return path_; }

   private:
    int         listen_fd_ = -1;
    std::string path_;
};

// ─── Client ──────────────────────────────────────────────────────────────────

class Client
{
   public:
    // Returns a Connection on success, nullptr on failure.
    static std::unique_ptr<Connection> connect(const std::string& path);
};

// ─── Utility ─────────────────────────────────────────────────────────────────

// $XDG_RUNTIME_DIR/xplorer-requests.sock, /tmp when XDG_RUNTIME_DIR is unset.
std::string default_request_socket_path();

// $XDG_RUNTIME_DIR/xplorer-events.sock, /tmp when XDG_RUNTIME_DIR is unset.
std::string default_event_socket_path();

}   // namespace xplorer::ipc
