#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>

#include "message.hpp"

namespace xplorer::ipc
{

using RequestCallback = std::function<void(const RequestResult&)>;
using EventListener   = std::function<void(const Event&)>;
using ListenerId      = uint64_t;

// Request/response side of the backend connection.
class RequestChannel
{
   public:
    virtual ~RequestChannel() = default;

    // Issues action with params. callback runs exactly once, always from the
    // dispatch loop and never before send_request returns. Returns the
    // request id.
    virtual std::string send_request(const std::string& action,
                                     Value              params,
                                     RequestCallback    callback) = 0;

    // Fire-and-forget "cancel" for a cooperative backend operation.
    virtual void cancel_operation(const std::string& operation_id) = 0;
};

// Publish/subscribe side of the backend connection.
class EventChannel
{
   public:
    virtual ~EventChannel() = default;

    // Idempotent: subscribing twice does not duplicate delivery.
    virtual void subscribe(const std::string& topic)     = 0;
    virtual void unsubscribe(const std::string& topic)   = 0;
    virtual bool is_subscribed(const std::string& topic) const = 0;

    // Listeners run in registration order for every event.
    virtual ListenerId add_event_listener(EventListener listener) = 0;
    virtual void       remove_event_listener(ListenerId id)        = 0;

    // Reference-counted wrappers so several consumers can share a topic.
    // The first acquire subscribes and the last release unsubscribes.
    void acquire_topic(const std::string& topic)
    {
        if (topic_refs_[topic]++ == 0)
            subscribe(topic);
    }

    void release_topic(const std::string& topic)
    {
        auto it = topic_refs_.find(topic);
        if (it == topic_refs_.end())
            return;
        if (--it->second == 0)
        {
            topic_refs_.erase(it);
            unsubscribe(topic);
        }
    }

    size_t topic_refcount(const std::string& topic) const
    {
        auto it = topic_refs_.find(topic);
        return it == topic_refs_.end() ? 0 : it->second;
    }

   private:
    std::map<std::string, size_t> topic_refs_;
};

}   // namespace xplorer::ipc
