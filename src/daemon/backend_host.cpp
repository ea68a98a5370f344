#include "backend_host.hpp"

#include <chrono>
#include <xplorer/logger.hpp>

#include "../core/path_utils.hpp"
#include "../ipc/codec.hpp"

namespace xplorer::daemon
{

// ─── Reply ───────────────────────────────────────────────────────────────────

const std::string& Reply::request_id() const
{
    static const std::string empty;
    return state_ ? state_->request_id : empty;
}

void Reply::success(ipc::Value data)
{
    ipc::Response r;
    r.success = true;
    r.data    = std::move(data);
    send(std::move(r));
}

void Reply::failure(const std::string& code, const std::string& message, ipc::Value details)
{
    ipc::Response r;
    r.success       = false;
    r.error.code    = code;
    r.error.message = message;
    r.error.details = std::move(details);
    send(std::move(r));
}

void Reply::send(ipc::Response response)
{
    if (!state_ || state_->sent)
        return;
    state_->sent = true;
    if (!state_->host_alive || !*state_->host_alive)
        return;
    response.id = state_->request_id;
    state_->host->send_response(state_->client_id, response);
}

// ─── BackendHost ─────────────────────────────────────────────────────────────

BackendHost::BackendHost(core::EventLoop& loop) : loop_(loop)
{
    register_action("cancel",
                    [this](const ipc::Request& req, Reply reply)
                    {
                        std::string op = req.params.get_string("operation_id");
                        if (op.empty())
                        {
                            reply.failure(ipc::error_code::INVALID_REQUEST,
                                          "operation_id is required");
                            return;
                        }
                        cancelled_.insert(op);
                        XPLORER_LOG_DEBUG("backend", "operation {} cancelled", op);

                        ipc::Value data = ipc::Value::object();
                        data.set("cancelled", true);
                        data.set("operation_id", op);
                        reply.success(std::move(data));
                    });
}

BackendHost::~BackendHost()
{
    *alive_ = false;
    close();
}

bool BackendHost::listen(const std::string& request_path, const std::string& event_path)
{
    if (!request_server_.listen(request_path))
    {
        XPLORER_LOG_ERROR("backend", "failed to listen on {}", request_path);
        return false;
    }
    if (!event_server_.listen(event_path))
    {
        XPLORER_LOG_ERROR("backend", "failed to listen on {}", event_path);
        request_server_.close();
        return false;
    }

    loop_.watch_fd(request_server_.listen_fd(),
                   [this](int) { accept_pending(request_server_, ClientKind::Requests); });
    loop_.watch_fd(event_server_.listen_fd(),
                   [this](int) { accept_pending(event_server_, ClientKind::Events); });
    XPLORER_LOG_INFO("backend", "listening on {} and {}", request_path, event_path);
    return true;
}

void BackendHost::adopt_request_connection(std::unique_ptr<ipc::Connection> conn)
{
    add_client(std::move(conn), ClientKind::Requests);
}

void BackendHost::adopt_event_connection(std::unique_ptr<ipc::Connection> conn)
{
    add_client(std::move(conn), ClientKind::Events);
}

void BackendHost::close()
{
    if (request_server_.is_listening())
    {
        loop_.unwatch_fd(request_server_.listen_fd());
        request_server_.close();
    }
    if (event_server_.is_listening())
    {
        loop_.unwatch_fd(event_server_.listen_fd());
        event_server_.close();
    }
    for (auto& [id, slot] : clients_)
        loop_.unwatch_fd(slot.conn->fd());
    clients_.clear();
}

void BackendHost::accept_pending(ipc::Server& server, ClientKind kind)
{
    while (auto conn = server.try_accept())
        add_client(std::move(conn), kind);
}

void BackendHost::add_client(std::unique_ptr<ipc::Connection> conn, ClientKind kind)
{
    if (!conn || !conn->is_open())
        return;

    uint64_t id = next_client_id_++;
    int      fd = conn->fd();

    ClientSlot slot;
    slot.conn = std::move(conn);
    slot.kind = kind;
    clients_.emplace(id, std::move(slot));

    loop_.watch_fd(fd, [this, id](int) { on_client_readable(id); });
    XPLORER_LOG_DEBUG("backend", "client {} connected ({})", id,
                      kind == ClientKind::Requests ? "requests" : "events");
}

void BackendHost::drop_client(uint64_t client_id)
{
    auto it = clients_.find(client_id);
    if (it == clients_.end())
        return;
    loop_.unwatch_fd(it->second.conn->fd());
    clients_.erase(it);
    XPLORER_LOG_DEBUG("backend", "client {} disconnected", client_id);
}

void BackendHost::on_client_readable(uint64_t client_id)
{
    auto it = clients_.find(client_id);
    if (it == clients_.end())
        return;

    std::vector<ipc::Message> messages;
    auto                      status = it->second.conn->read_available(messages);
    ClientKind                kind   = it->second.kind;

    for (const auto& msg : messages)
    {
        if (kind == ClientKind::Requests)
        {
            dispatch_request(client_id, msg);
        }
        else
        {
            // Handlers never run on the event side, so the slot is stable
            auto slot = clients_.find(client_id);
            if (slot != clients_.end())
                handle_topic(slot->second, msg);
        }
    }

    if (status != ipc::Connection::ReadStatus::Ok)
        drop_client(client_id);
}

void BackendHost::dispatch_request(uint64_t client_id, const ipc::Message& msg)
{
    if (msg.header.type != ipc::MessageType::REQUEST)
    {
        XPLORER_LOG_WARN("backend", "unexpected message type {} from client {}",
                         static_cast<uint16_t>(msg.header.type), client_id);
        return;
    }

    auto req = ipc::decode_request(msg.payload);
    if (!req)
    {
        XPLORER_LOG_WARN("backend", "malformed request from client {}", client_id);
        return;
    }

    ++requests_handled_;

    auto state        = std::make_shared<Reply::State>();
    state->host       = this;
    state->host_alive = alive_;
    state->client_id  = client_id;
    state->request_id = req->id;
    Reply reply(state);

    auto it = handlers_.find(req->action);
    if (it == handlers_.end())
    {
        reply.failure(ipc::error_code::INVALID_REQUEST, "Unknown action: " + req->action);
        return;
    }

    XPLORER_LOG_TRACE("backend", "{} {}", req->id, req->action);
    try
    {
        it->second(*req, reply);
    }
    catch (const std::exception& e)
    {
        XPLORER_LOG_ERROR("backend", "handler for {} threw: {}", req->action, e.what());
        reply.failure(ipc::error_code::OPERATION_FAILED, e.what());
    }
}

bool BackendHost::send_response(uint64_t client_id, const ipc::Response& response)
{
    auto it = clients_.find(client_id);
    if (it == clients_.end())
    {
        XPLORER_LOG_DEBUG("backend", "reply {} dropped, client gone", response.id);
        return false;
    }
    if (!it->second.conn->send(
            ipc::make_message(ipc::MessageType::RESPONSE, ipc::encode_response(response))))
    {
        loop_.post([this, client_id] { drop_client(client_id); });
        return false;
    }
    return true;
}

void BackendHost::register_action(const std::string& action, Handler handler)
{
    handlers_[action] = std::move(handler);
}

bool BackendHost::has_action(const std::string& action) const
{
    return handlers_.count(action) > 0;
}

bool BackendHost::is_cancelled(const std::string& operation_id) const
{
    return cancelled_.count(operation_id) > 0;
}

void BackendHost::clear_cancelled(const std::string& operation_id)
{
    cancelled_.erase(operation_id);
}

// ─── Events ──────────────────────────────────────────────────────────────────

void BackendHost::handle_topic(ClientSlot& slot, const ipc::Message& msg)
{
    auto topic = ipc::decode_topic(msg.payload);
    if (!topic)
        return;

    if (msg.header.type == ipc::MessageType::SUBSCRIBE)
        slot.topics.insert(*topic);
    else if (msg.header.type == ipc::MessageType::UNSUBSCRIBE)
        slot.topics.erase(*topic);
}

bool BackendHost::topic_matches(const std::string& topic, const std::string& path)
{
    return core::path::is_same_or_descendant(path, topic);
}

size_t BackendHost::publish(ipc::Event event)
{
    if (event.timestamp == 0)
    {
        event.timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::system_clock::now().time_since_epoch())
                              .count();
    }

    auto   wire      = ipc::make_message(ipc::MessageType::EVENT, ipc::encode_event(event));
    size_t delivered = 0;
    std::vector<uint64_t> broken;
    for (auto& [id, slot] : clients_)
    {
        if (slot.kind != ClientKind::Events)
            continue;

        bool wanted = false;
        for (const auto& topic : slot.topics)
        {
            if (topic_matches(topic, event.path))
            {
                wanted = true;
                break;
            }
        }
        if (!wanted)
            continue;

        if (slot.conn->send(wire))
            ++delivered;
        else
            broken.push_back(id);
    }
    for (uint64_t id : broken)
        drop_client(id);
    return delivered;
}

size_t BackendHost::subscriber_count(const std::string& topic) const
{
    size_t n = 0;
    for (const auto& [id, slot] : clients_)
    {
        if (slot.kind == ClientKind::Events && slot.topics.count(topic))
            ++n;
    }
    return n;
}

size_t BackendHost::request_client_count() const
{
    size_t n = 0;
    for (const auto& [id, slot] : clients_)
        n += slot.kind == ClientKind::Requests ? 1 : 0;
    return n;
}

size_t BackendHost::event_client_count() const
{
    return clients_.size() - request_client_count();
}

}   // namespace xplorer::daemon
