#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "../core/event_loop.hpp"
#include "channel.hpp"
#include "transport.hpp"

namespace xplorer::ipc
{

// Shell-side endpoint of the two backend channels. Correlates responses by
// request id, enforces the per-request deadline, and fans events out to
// listeners. Lives on the dispatch loop; not thread-safe.
class MessageBridge : public RequestChannel, public EventChannel
{
   public:
    enum class State
    {
        Disconnected,
        Connected,
    };

    static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{30000};

    explicit MessageBridge(core::EventLoop& loop);
    ~MessageBridge() override;

    MessageBridge(const MessageBridge&)            = delete;
    MessageBridge& operator=(const MessageBridge&) = delete;

    // Connects both channels. Returns false (and stays Disconnected) if
    // either endpoint is unreachable.
    bool connect(const std::string& request_path, const std::string& event_path);

    // Takes ownership of already-connected channels. A bridge connects at
    // most once: attach is refused after a connection has been severed.
    bool attach(std::unique_ptr<Connection> requests, std::unique_ptr<Connection> events);

    // Rejects every pending request with ConnectionClosed and drops both
    // connections. Safe to call more than once. Final once connected.
    void disconnect();

    State state() const { return state_; }
    bool  is_connected() const { return state_ == State::Connected; }
    bool  was_severed() const { return severed_; }

    void                      set_request_timeout(std::chrono::milliseconds t) { timeout_ = t; }
    std::chrono::milliseconds request_timeout() const { return timeout_; }

    // RequestChannel
    std::string send_request(const std::string& action,
                             Value              params,
                             RequestCallback    callback) override;
    void        cancel_operation(const std::string& operation_id) override;

    // EventChannel
    void       subscribe(const std::string& topic) override;
    void       unsubscribe(const std::string& topic) override;
    bool       is_subscribed(const std::string& topic) const override;
    ListenerId add_event_listener(EventListener listener) override;
    void       remove_event_listener(ListenerId id) override;

    size_t pending_count() const { return pending_.size(); }
    size_t listener_count() const { return listeners_.size(); }

   private:
    struct PendingRequest
    {
        std::string                action;
        RequestCallback            callback;
        core::EventLoop::TimerId   timer = 0;
    };

    void on_request_readable();
    void on_event_readable();
    void handle_response(const Message& msg);
    void handle_event(const Message& msg);
    void handle_timeout(const std::string& id);
    void complete(const std::string& id, RequestResult result);
    void fail_async(RequestCallback callback, ErrorKind kind, std::string message);

    core::EventLoop&            loop_;
    State                       state_   = State::Disconnected;
    bool                        severed_ = false;
    std::unique_ptr<Connection> req_conn_;
    std::unique_ptr<Connection> evt_conn_;
    std::chrono::milliseconds   timeout_ = DEFAULT_TIMEOUT;

    uint64_t                              next_request_ = 1;
    std::map<std::string, PendingRequest> pending_;

    std::set<std::string>                         subscriptions_;
    ListenerId                                    next_listener_ = 1;
    std::vector<std::pair<ListenerId, EventListener>> listeners_;
};

}   // namespace xplorer::ipc
