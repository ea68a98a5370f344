#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <unordered_map>

#include "../core/event_loop.hpp"
#include "../ipc/message.hpp"
#include "../ipc/transport.hpp"

namespace xplorer::daemon
{

class BackendHost;

// Handle a request handler uses to answer. May be stored and invoked later
// so replies can go out in any order. Only the first answer is sent.
class Reply
{
   public:
    Reply() = default;

    void success(ipc::Value data = {});
    void failure(const std::string& code, const std::string& message, ipc::Value details = {});

    bool               sent() const { return !state_ || state_->sent; }
    const std::string& request_id() const;

   private:
    friend class BackendHost;

    struct State
    {
        BackendHost*          host = nullptr;
        std::shared_ptr<bool> host_alive;
        uint64_t              client_id = 0;
        std::string           request_id;
        bool                  sent = false;
    };

    explicit Reply(std::shared_ptr<State> state) : state_(std::move(state)) {}

    void send(ipc::Response response);

    std::shared_ptr<State> state_;
};

// Backend side of the request and event channels: routes requests to action
// handlers, tracks topic subscriptions per connection and publishes events.
// The filesystem work itself is supplied by registered handlers.
class BackendHost
{
   public:
    using Handler = std::function<void(const ipc::Request&, Reply)>;

    explicit BackendHost(core::EventLoop& loop);
    ~BackendHost();

    BackendHost(const BackendHost&)            = delete;
    BackendHost& operator=(const BackendHost&) = delete;

    // --- Endpoints ---

    bool listen(const std::string& request_path, const std::string& event_path);
    void adopt_request_connection(std::unique_ptr<ipc::Connection> conn);
    void adopt_event_connection(std::unique_ptr<ipc::Connection> conn);
    void close();

    // --- Actions ---

    // Replaces any previous handler for action. "cancel" is built in.
    void register_action(const std::string& action, Handler handler);
    bool has_action(const std::string& action) const;

    // Cooperative cancellation registry fed by the "cancel" action.
    bool is_cancelled(const std::string& operation_id) const;
    void clear_cancelled(const std::string& operation_id);
    const std::set<std::string>& cancelled_operations() const { return cancelled_; }

    size_t requests_handled() const { return requests_handled_; }

    // --- Events ---

    // Sends the event to every event connection subscribed to a matching
    // topic. Returns the number of connections it was delivered to.
    size_t publish(ipc::Event event);

    size_t subscriber_count(const std::string& topic) const;

    // A topic matches a path equal to it or below it.
    static bool topic_matches(const std::string& topic, const std::string& path);

    size_t request_client_count() const;
    size_t event_client_count() const;

   private:
    friend class Reply;

    enum class ClientKind
    {
        Requests,
        Events,
    };

    struct ClientSlot
    {
        std::unique_ptr<ipc::Connection> conn;
        ClientKind                       kind = ClientKind::Requests;
        std::set<std::string>            topics;
    };

    void accept_pending(ipc::Server& server, ClientKind kind);
    void add_client(std::unique_ptr<ipc::Connection> conn, ClientKind kind);
    void drop_client(uint64_t client_id);
    void on_client_readable(uint64_t client_id);
    void dispatch_request(uint64_t client_id, const ipc::Message& msg);
    void handle_topic(ClientSlot& slot, const ipc::Message& msg);
    bool send_response(uint64_t client_id, const ipc::Response& response);

    core::EventLoop&                         loop_;
    ipc::Server                              request_server_;
    ipc::Server                              event_server_;
    std::map<uint64_t, ClientSlot>           clients_;
    uint64_t                                 next_client_id_ = 1;
    std::unordered_map<std::string, Handler> handlers_;
    std::set<std::string>                    cancelled_;
    size_t                                   requests_handled_ = 0;

    // Outstanding replies point back at the host; this is cleared on
    // destruction so late replies become no-ops.
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

}   // namespace xplorer::daemon
