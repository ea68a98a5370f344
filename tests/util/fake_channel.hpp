#pragma once

// In-memory RequestChannel / EventChannel for tests. Requests stay pending
// until the test answers them, in any order it likes.

#include <algorithm>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "ipc/channel.hpp"

namespace xplorer::test
{

class FakeRequestChannel : public ipc::RequestChannel
{
   public:
    struct Sent
    {
        std::string          id;
        std::string          action;
        ipc::Value           params;
        ipc::RequestCallback callback;
        bool                 answered = false;
    };

    std::string send_request(const std::string&   action,
                             ipc::Value           params,
                             ipc::RequestCallback callback) override
    {
        Sent s;
        s.id       = "r" + std::to_string(++next_id_);
        s.action   = action;
        s.params   = std::move(params);
        s.callback = std::move(callback);
        sent_.push_back(std::move(s));
        return sent_.back().id;
    }

    void cancel_operation(const std::string& operation_id) override
    {
        cancelled_.push_back(operation_id);
    }

    // ── Answering ───────────────────────────────────────────────────────

    bool succeed(const std::string& id, ipc::Value data = {})
    {
        ipc::RequestResult r;
        r.response.id      = id;
        r.response.success = true;
        r.response.data    = std::move(data);
        return answer(id, std::move(r));
    }

    bool fail(const std::string& id, const std::string& code, const std::string& message)
    {
        ipc::RequestResult r;
        r.kind                   = ipc::ErrorKind::BackendError;
        r.message                = message;
        r.response.id            = id;
        r.response.success       = false;
        r.response.error.code    = code;
        r.response.error.message = message;
        return answer(id, std::move(r));
    }

    bool fail_with(const std::string& id, ipc::ErrorKind kind, const std::string& message)
    {
        ipc::RequestResult r;
        r.kind        = kind;
        r.message     = message;
        r.response.id = id;
        return answer(id, std::move(r));
    }

    // ── Inspection ──────────────────────────────────────────────────────

    const std::vector<Sent>&        sent() const { return sent_; }
    const std::vector<std::string>& cancelled() const { return cancelled_; }

    size_t count(const std::string& action) const
    {
        return static_cast<size_t>(std::count_if(sent_.begin(), sent_.end(),
                                                 [&](const Sent& s) { return s.action == action; }));
    }

    // Most recent request for action, nullptr if none.
    const Sent* last(const std::string& action) const
    {
        for (auto it = sent_.rbegin(); it != sent_.rend(); ++it)
        {
            if (it->action == action)
                return &*it;
        }
        return nullptr;
    }

    size_t unanswered() const
    {
        return static_cast<size_t>(
            std::count_if(sent_.begin(), sent_.end(), [](const Sent& s) { return !s.answered; }));
    }

   private:
    bool answer(const std::string& id, ipc::RequestResult result)
    {
        for (auto& s : sent_)
        {
            if (s.id != id || s.answered)
                continue;
            s.answered = true;
            // Callbacks may issue more requests, which can reallocate sent_
            auto cb = s.callback;
            if (cb)
                cb(result);
            return true;
        }
        return false;
    }

    std::vector<Sent>        sent_;
    std::vector<std::string> cancelled_;
    uint64_t                 next_id_ = 0;
};

class FakeEventChannel : public ipc::EventChannel
{
   public:
    void subscribe(const std::string& topic) override
    {
        if (topics_.insert(topic).second)
            ++subscribe_calls_;
    }

    void unsubscribe(const std::string& topic) override
    {
        if (topics_.erase(topic) > 0)
            ++unsubscribe_calls_;
    }

    bool is_subscribed(const std::string& topic) const override { return topics_.count(topic) > 0; }

    ipc::ListenerId add_event_listener(ipc::EventListener listener) override
    {
        ipc::ListenerId id = next_listener_++;
        listeners_.emplace_back(id, std::move(listener));
        return id;
    }

    void remove_event_listener(ipc::ListenerId id) override
    {
        std::erase_if(listeners_, [id](const auto& e) { return e.first == id; });
    }

    // Delivers to every listener, the way the bridge does after the backend
    // has applied its topic filter.
    void emit(const ipc::Event& event)
    {
        auto snapshot = listeners_;
        for (auto& [id, listener] : snapshot)
            listener(event);
    }

    void emit_change(const std::string& event_type,
                     const std::string& path,
                     const std::string& old_path = {})
    {
        ipc::Event e;
        e.type = "fs.changed";
        e.path = path;
        e.data = ipc::Value::object();
        e.data.set("eventType", event_type);
        if (!old_path.empty())
            e.data.set("oldPath", old_path);
        emit(e);
    }

    const std::set<std::string>& topics() const { return topics_; }
    size_t                       listener_count() const { return listeners_.size(); }
    size_t                       subscribe_calls() const { return subscribe_calls_; }
    size_t                       unsubscribe_calls() const { return unsubscribe_calls_; }

   private:
    std::set<std::string>                                    topics_;
    std::vector<std::pair<ipc::ListenerId, ipc::EventListener>> listeners_;
    ipc::ListenerId                                          next_listener_    = 1;
    size_t                                                   subscribe_calls_   = 0;
    size_t                                                   unsubscribe_calls_ = 0;
};

}   // namespace xplorer::test
