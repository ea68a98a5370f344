#include "message_bridge.hpp"

#include <algorithm>

#include <xplorer/logger.hpp>

#include "codec.hpp"

namespace xplorer::ipc
{

MessageBridge::MessageBridge(core::EventLoop& loop) : loop_(loop) {}

MessageBridge::~MessageBridge()
{
    // Pending callbacks may point at objects already torn down, so they are
    // dropped rather than rejected here.
    for (auto& [id, pending] : pending_)
        loop_.cancel_timer(pending.timer);
    pending_.clear();

    if (req_conn_)
        loop_.unwatch_fd(req_conn_->fd());
    if (evt_conn_)
        loop_.unwatch_fd(evt_conn_->fd());
}

// ─── Connection lifecycle ────────────────────────────────────────────────────

bool MessageBridge::connect(const std::string& request_path, const std::string& event_path)
{
    if (severed_ || state_ == State::Connected)
        return false;

    auto requests = Client::connect(request_path);
    if (!requests)
    {
        XPLORER_LOG_ERROR("bridge", "cannot reach request endpoint {}", request_path);
        return false;
    }
    auto events = Client::connect(event_path);
    if (!events)
    {
        XPLORER_LOG_ERROR("bridge", "cannot reach event endpoint {}", event_path);
        return false;
    }
    XPLORER_LOG_INFO("bridge", "connected to {} and {}", request_path, event_path);
    return attach(std::move(requests), std::move(events));
}

bool MessageBridge::attach(std::unique_ptr<Connection> requests, std::unique_ptr<Connection> events)
{
    if (state_ == State::Connected)
    {
        XPLORER_LOG_WARN("bridge", "attach ignored, already connected");
        return false;
    }
    if (severed_)
    {
        XPLORER_LOG_WARN("bridge", "attach refused, the backend connection was lost");
        return false;
    }
    if (!requests || !requests->is_open() || !events || !events->is_open())
        return false;

    req_conn_ = std::move(requests);
    evt_conn_ = std::move(events);
    state_    = State::Connected;

    loop_.watch_fd(req_conn_->fd(), [this](int) { on_request_readable(); });
    loop_.watch_fd(evt_conn_->fd(), [this](int) { on_event_readable(); });

    // Topics recorded while disconnected
    for (const auto& topic : subscriptions_)
        evt_conn_->send(make_message(MessageType::SUBSCRIBE, encode_topic(topic)));
    return true;
}

void MessageBridge::disconnect()
{
    if (state_ == State::Disconnected && pending_.empty())
        return;

    if (state_ == State::Connected)
        severed_ = true;
    state_ = State::Disconnected;
    if (req_conn_)
    {
        loop_.unwatch_fd(req_conn_->fd());
        req_conn_.reset();
    }
    if (evt_conn_)
    {
        loop_.unwatch_fd(evt_conn_->fd());
        evt_conn_.reset();
    }

    // Detach the map first so callbacks that issue new requests see a
    // consistent, empty table.
    std::map<std::string, PendingRequest> rejected;
    rejected.swap(pending_);
    if (!rejected.empty())
        XPLORER_LOG_WARN("bridge", "connection closed with {} request(s) in flight", rejected.size());

    for (auto& [id, pending] : rejected)
    {
        loop_.cancel_timer(pending.timer);
        RequestResult result;
        result.kind        = ErrorKind::ConnectionClosed;
        result.response.id = id;
        result.message     = "Connection closed";
        if (pending.callback)
            pending.callback(result);
    }
}

// ─── Requests ────────────────────────────────────────────────────────────────

std::string MessageBridge::send_request(const std::string& action,
                                        Value              params,
                                        RequestCallback    callback)
{
    std::string id = "r" + std::to_string(next_request_++);

    if (state_ != State::Connected)
    {
        fail_async(std::move(callback), ErrorKind::ConnectionClosed, "Not connected");
        return id;
    }

    Request req{id, action, std::move(params)};

    // Register before sending so an immediate reply always finds its entry
    PendingRequest pending;
    pending.action   = action;
    pending.callback = std::move(callback);
    pending.timer    = loop_.add_timer(timeout_, [this, id] { handle_timeout(id); });
    pending_.emplace(id, std::move(pending));

    XPLORER_LOG_TRACE("bridge", "-> {} {} {}", id, action, req.params.to_debug_string());

    if (!req_conn_->send(make_message(MessageType::REQUEST, encode_request(req))))
    {
        XPLORER_LOG_WARN("bridge", "send failed for {} ({})", id, action);
        loop_.post([this] { disconnect(); });
    }
    return id;
}

void MessageBridge::cancel_operation(const std::string& operation_id)
{
    if (operation_id.empty() || state_ != State::Connected)
        return;

    Value params = Value::object();
    params.set("operation_id", operation_id);
    send_request("cancel",
                 std::move(params),
                 [operation_id](const RequestResult& result)
                 {
                     if (!result.ok())
                         XPLORER_LOG_DEBUG("bridge",
                                           "cancel of {} not acknowledged: {}",
                                           operation_id,
                                           result.message);
                 });
}

void MessageBridge::fail_async(RequestCallback callback, ErrorKind kind, std::string message)
{
    if (!callback)
        return;
    loop_.post(
        [callback = std::move(callback), kind, message = std::move(message)]
        {
            RequestResult result;
            result.kind    = kind;
            result.message = message;
            callback(result);
        });
}

void MessageBridge::handle_timeout(const std::string& id)
{
    auto it = pending_.find(id);
    if (it == pending_.end())
        return;

    XPLORER_LOG_WARN("bridge", "request {} ({}) timed out", id, it->second.action);

    RequestResult result;
    result.kind        = ErrorKind::RequestTimeout;
    result.response.id = id;
    result.message     = "Request timeout: " + it->second.action;

    // Timer already fired; only the entry needs evicting
    it->second.timer = 0;
    RequestCallback callback = std::move(it->second.callback);
    pending_.erase(it);
    if (callback)
        callback(result);
}

void MessageBridge::complete(const std::string& id, RequestResult result)
{
    auto it = pending_.find(id);
    if (it == pending_.end())
    {
        // Late reply for a request that already timed out or was rejected
        XPLORER_LOG_DEBUG("bridge", "dropping response for unknown request {}", id);
        return;
    }

    loop_.cancel_timer(it->second.timer);
    RequestCallback callback = std::move(it->second.callback);
    pending_.erase(it);
    if (callback)
        callback(result);
}

void MessageBridge::handle_response(const Message& msg)
{
    if (msg.header.type != MessageType::RESPONSE)
    {
        XPLORER_LOG_WARN("bridge", "unexpected message type {} on request channel",
                         static_cast<uint16_t>(msg.header.type));
        return;
    }

    auto response = decode_response(msg.payload);
    if (!response)
    {
        XPLORER_LOG_WARN("bridge", "malformed response dropped");
        return;
    }

    RequestResult result;
    if (!response->success)
    {
        result.kind    = ErrorKind::BackendError;
        result.message = response->error.message.empty() ? response->error.code
                                                         : response->error.message;
        XPLORER_LOG_DEBUG("bridge", "<- {} failed: {} {}", response->id, response->error.code,
                          response->error.message);
    }
    std::string id  = response->id;
    result.response = std::move(*response);
    complete(id, std::move(result));
}

void MessageBridge::on_request_readable()
{
    if (!req_conn_)
        return;

    std::vector<Message> messages;
    auto                 status = req_conn_->read_available(messages);
    for (const auto& msg : messages)
        handle_response(msg);

    if (status == Connection::ReadStatus::ProtocolError)
        XPLORER_LOG_ERROR("bridge", "protocol error on request channel");
    if (status != Connection::ReadStatus::Ok)
        disconnect();
}

// ─── Events ──────────────────────────────────────────────────────────────────

void MessageBridge::subscribe(const std::string& topic)
{
    if (!subscriptions_.insert(topic).second)
        return;
    XPLORER_LOG_DEBUG("bridge", "subscribe {}", topic);
    if (evt_conn_ && !evt_conn_->send(make_message(MessageType::SUBSCRIBE, encode_topic(topic))))
        loop_.post([this] { disconnect(); });
}

void MessageBridge::unsubscribe(const std::string& topic)
{
    if (subscriptions_.erase(topic) == 0)
        return;
    XPLORER_LOG_DEBUG("bridge", "unsubscribe {}", topic);
    if (evt_conn_ && !evt_conn_->send(make_message(MessageType::UNSUBSCRIBE, encode_topic(topic))))
        loop_.post([this] { disconnect(); });
}

bool MessageBridge::is_subscribed(const std::string& topic) const
{
    return subscriptions_.count(topic) > 0;
}

ListenerId MessageBridge::add_event_listener(EventListener listener)
{
    ListenerId id = next_listener_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

void MessageBridge::remove_event_listener(ListenerId id)
{
    std::erase_if(listeners_, [id](const auto& entry) { return entry.first == id; });
}

void MessageBridge::handle_event(const Message& msg)
{
    if (msg.header.type != MessageType::EVENT)
        return;

    auto event = decode_event(msg.payload);
    if (!event)
    {
        XPLORER_LOG_WARN("bridge", "malformed event dropped");
        return;
    }

    // Listeners may add or remove listeners while being notified
    auto snapshot = listeners_;
    for (const auto& [id, listener] : snapshot)
    {
        bool still_registered = std::any_of(listeners_.begin(), listeners_.end(),
                                            [id = id](const auto& e) { return e.first == id; });
        if (!still_registered)
            continue;
        try
        {
            listener(*event);
        }
        catch (const std::exception& e)
        {
            XPLORER_LOG_ERROR("bridge", "event listener {} threw: {}", id, e.what());
        }
        catch (...)
        {
            XPLORER_LOG_ERROR("bridge", "event listener {} threw a non-standard exception", id);
        }
    }
}

void MessageBridge::on_event_readable()
{
    if (!evt_conn_)
        return;

    std::vector<Message> messages;
    auto                 status = evt_conn_->read_available(messages);
    for (const auto& msg : messages)
        handle_event(msg);

    if (status == Connection::ReadStatus::ProtocolError)
        XPLORER_LOG_ERROR("bridge", "protocol error on event channel");
    if (status != Connection::ReadStatus::Ok)
        disconnect();
}

}   // namespace xplorer::ipc
