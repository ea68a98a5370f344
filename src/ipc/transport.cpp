#include "transport.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <span>
#include <string>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>
#include <xplorer/logger.hpp>

#include "codec.hpp"

namespace xplorer::ipc
{

namespace
{

bool fill_address(sockaddr_un& addr, const std::string& path)
{
    addr.sun_family = AF_UNIX;
    if (path.empty() || path.size() >= sizeof(addr.sun_path))
        return false;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    return true;
}

std::string runtime_dir()
{
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg && xdg[0] != '\0')
        return xdg;
    return "/tmp";
}

}   // namespace

// ─── Connection ──────────────────────────────────────────────────────────────

Connection::Connection(int fd) : fd_(fd) {}

Connection::~Connection()
{
    close();
}

Connection::Connection(Connection&& other) noexcept
    : fd_(other.fd_), rx_(std::move(other.rx_)), tx_seq_(other.tx_seq_)
{
    other.fd_ = -1;
}

Connection& Connection::operator=(Connection&& other) noexcept
{
    if (this != &other)
    {
        close();
        fd_       = other.fd_;
        rx_       = std::move(other.rx_);
        tx_seq_   = other.tx_seq_;
        other.fd_ = -1;
    }
    return *this;
}

std::pair<std::unique_ptr<Connection>, std::unique_ptr<Connection>> Connection::make_pair()
{
    int fds[2] = {-1, -1};
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) < 0)
    {
        XPLORER_LOG_ERROR("transport", "socketpair failed: {}", std::strerror(errno));
        return {nullptr, nullptr};
    }
    return {std::make_unique<Connection>(fds[0]), std::make_unique<Connection>(fds[1])};
}

bool Connection::write_exact(const uint8_t* buf, size_t len)
{
    size_t total = 0;
    while (total < len)
    {
        // MSG_NOSIGNAL: a vanished peer is reported as an error, not SIGPIPE
        auto n = ::send(fd_, buf + total, len - total, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
            return false;
        total += static_cast<size_t>(n);
    }
    return true;
}

bool Connection::send(const Message& msg)
{
    if (fd_ < 0)
        return false;
    Message framed    = msg;
    framed.header.seq = ++tx_seq_;
    auto wire         = encode_message(framed);
    return write_exact(wire.data(), wire.size());
}

std::optional<Message> Connection::recv()
{
    if (fd_ < 0)
        return std::nullopt;

    for (;;)
    {
        Message msg;
        switch (pop_frame(msg))
        {
            case FrameResult::Frame:
                return msg;
            case FrameResult::Invalid:
                return std::nullopt;
            case FrameResult::Incomplete:
                break;
        }

        uint8_t chunk[4096];
        auto    n = ::read(fd_, chunk, sizeof(chunk));
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
            return std::nullopt;   // EOF or error
        rx_.insert(rx_.end(), chunk, chunk + n);
    }
}

Connection::FrameResult Connection::pop_frame(Message& out)
{
    if (rx_.size() < HEADER_SIZE)
        return FrameResult::Incomplete;

    auto hdr = decode_header(rx_);
    if (!hdr || hdr->payload_len > MAX_PAYLOAD_SIZE)
        return FrameResult::Invalid;

    size_t frame_len = HEADER_SIZE + hdr->payload_len;
    if (rx_.size() < frame_len)
        return FrameResult::Incomplete;

    out.header = *hdr;
    out.payload.assign(rx_.begin() + HEADER_SIZE,
                       rx_.begin() + static_cast<std::ptrdiff_t>(frame_len));
    rx_.erase(rx_.begin(), rx_.begin() + static_cast<std::ptrdiff_t>(frame_len));
    return FrameResult::Frame;
}

Connection::ReadStatus Connection::read_available(std::vector<Message>& out)
{
    if (fd_ < 0)
        return ReadStatus::Closed;

    bool    eof = false;
    uint8_t chunk[64 * 1024];
    for (;;)
    {
        auto n = ::recv(fd_, chunk, sizeof(chunk), MSG_DONTWAIT);
        if (n > 0)
        {
            rx_.insert(rx_.end(), chunk, chunk + n);
            continue;
        }
        if (n == 0)
        {
            eof = true;
            break;
        }
        if (errno == EINTR)
            continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            break;
        XPLORER_LOG_WARN("transport", "recv on fd {} failed: {}", fd_, std::strerror(errno));
        eof = true;
        break;
    }

    for (;;)
    {
        Message msg;
        auto    result = pop_frame(msg);
        if (result == FrameResult::Invalid)
            return ReadStatus::ProtocolError;
        if (result == FrameResult::Incomplete)
            break;
        out.push_back(std::move(msg));
    }
    return eof ? ReadStatus::Closed : ReadStatus::Ok;
}

void Connection::close()
{
    if (fd_ >= 0)
    {
        ::close(fd_);
        fd_ = -1;
    }
    rx_.clear();
}

// ─── Server ──────────────────────────────────────────────────────────────────

Server::Server() = default;

Server::~Server()
{
    close();
}

bool Server::listen(const std::string& path)
{
    sockaddr_un addr{};
    if (!fill_address(addr, path))
        return false;

    // Remove stale socket file
    ::unlink(path.c_str());

    int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0)
        return false;

    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0)
    {
        ::close(fd);
        return false;
    }

    // Owner-only access
    if (::chmod(path.c_str(), 0700) < 0)
        XPLORER_LOG_WARN("transport", "chmod {} failed: {}", path, std::strerror(errno));

    if (::listen(fd, 8) < 0)
    {
        ::close(fd);
        ::unlink(path.c_str());
        return false;
    }

    listen_fd_ = fd;
    path_      = path;
    return true;
}

std::unique_ptr<Connection> Server::accept()
{
    if (listen_fd_ < 0)
        return nullptr;

    sockaddr_un client_addr{};
    socklen_t   client_len = sizeof(client_addr);
    int client_fd = ::accept(listen_fd_, reinterpret_cast<sockaddr*>(&client_addr), &client_len);
    if (client_fd < 0)
        return nullptr;

    return std::make_unique<Connection>(client_fd);
}

std::unique_ptr<Connection> Server::try_accept()
{
    if (listen_fd_ < 0)
        return nullptr;

    int listen_flags = ::fcntl(listen_fd_, F_GETFL, 0);
    if (listen_flags >= 0)
        ::fcntl(listen_fd_, F_SETFL, listen_flags | O_NONBLOCK);

    sockaddr_un client_addr{};
    socklen_t   client_len = sizeof(client_addr);
    int client_fd = ::accept(listen_fd_, reinterpret_cast<sockaddr*>(&client_addr), &client_len);

    if (listen_flags >= 0)
        ::fcntl(listen_fd_, F_SETFL, listen_flags);

    if (client_fd < 0)
        return nullptr;   // EAGAIN or error, no pending connection

    // Accepted sockets inherit nothing from the listener on Linux, but keep
    // them explicitly blocking so recv() stays blocking.
    int flags = ::fcntl(client_fd, F_GETFL, 0);
    if (flags >= 0)
        ::fcntl(client_fd, F_SETFL, flags & ~O_NONBLOCK);

    return std::make_unique<Connection>(client_fd);
}

void Server::close()
{
    if (listen_fd_ >= 0)
    {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
    if (!path_.empty())
    {
        ::unlink(path_.c_str());
        path_.clear();
    }
}

// ─── Client ──────────────────────────────────────────────────────────────────

std::unique_ptr<Connection> Client::connect(const std::string& path)
{
    sockaddr_un addr{};
    if (!fill_address(addr, path))
        return nullptr;

    int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0)
        return nullptr;

    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0)
    {
        ::close(fd);
        return nullptr;
    }

    return std::make_unique<Connection>(fd);
}

// ─── Utility ─────────────────────────────────────────────────────────────────

std::string default_request_socket_path()
{
    return runtime_dir() + "/xplorer-requests.sock";
}

std::string default_event_socket_path()
{
    return runtime_dir() + "/xplorer-events.sock";
}

}   // namespace xplorer::ipc
