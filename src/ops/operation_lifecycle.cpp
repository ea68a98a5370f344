#include "operation_lifecycle.hpp"

#include <xplorer/logger.hpp>

#include "../state/state_coordinator.hpp"

namespace xplorer::ops
{

OperationLifecycle::OperationLifecycle(ipc::RequestChannel&           channel,
                                       const state::StateCoordinator& coordinator)
    : channel_(channel), coordinator_(coordinator)
{
}

ConsumerIdentity OperationLifecycle::current_identity(WindowId window) const
{
    return ConsumerIdentity{window, coordinator_.view_for_window(window).active_tab};
}

TokenPtr OperationLifecycle::begin(WindowId window, const std::string& op_class, bool cooperative)
{
    // The previous token is stale before the replacement exists
    supersede(window, op_class);

    auto token      = std::make_shared<OperationToken>();
    token->consumer = current_identity(window);
    token->op_class = op_class;
    token->serial   = next_serial_++;
    if (cooperative)
        token->backend_operation_id = "op-" + std::to_string(next_operation_++);

    live_[Key{window, op_class}] = token;
    return token;
}

void OperationLifecycle::supersede(WindowId window, const std::string& op_class)
{
    auto it = live_.find(Key{window, op_class});
    if (it == live_.end())
        return;
    TokenPtr prior = it->second;
    live_.erase(it);
    cancel_token(*prior);
}

void OperationLifecycle::release_consumer(WindowId window)
{
    for (auto it = live_.begin(); it != live_.end();)
    {
        if (it->first.first != window)
        {
            ++it;
            continue;
        }
        TokenPtr token = it->second;
        it             = live_.erase(it);
        cancel_token(*token);
    }
}

void OperationLifecycle::cancel_token(OperationToken& token)
{
    if (token.cancelled)
        return;
    token.cancelled = true;
    XPLORER_LOG_TRACE("ops", "superseded {} #{} for tab {}", token.op_class, token.serial,
                      token.consumer.tab);
    if (!token.backend_operation_id.empty())
    {
        ++cancels_sent_;
        channel_.cancel_operation(token.backend_operation_id);
    }
}

bool OperationLifecycle::still_valid(const OperationToken& token) const
{
    return !is_stale(token, current_identity(token.consumer.window));
}

void OperationLifecycle::finish(const TokenPtr& token)
{
    if (!token)
        return;
    auto it = live_.find(Key{token->consumer.window, token->op_class});
    if (it != live_.end() && it->second == token)
        live_.erase(it);
}

void OperationLifecycle::note_discard(const OperationToken& token)
{
    ++discarded_;
    XPLORER_LOG_TRACE("ops", "discarded stale {} #{} for tab {}", token.op_class, token.serial,
                      token.consumer.tab);
}

TokenPtr OperationLifecycle::run(WindowId           window,
                                 const std::string& op_class,
                                 const std::string& action,
                                 ipc::Value         params,
                                 bool               cooperative,
                                 ApplyFn            apply)
{
    TokenPtr token = begin(window, op_class, cooperative);
    if (cooperative)
        params.set("operation_id", token->backend_operation_id);

    channel_.send_request(action,
                          std::move(params),
                          [this, token, apply = std::move(apply)](const ipc::RequestResult& result)
                          {
                              if (!still_valid(*token))
                              {
                                  // Resolved, so there is nothing left to cancel
                                  finish(token);
                                  note_discard(*token);
                                  return;
                              }
                              finish(token);
                              if (apply)
                                  apply(result);
                          });
    return token;
}

TokenPtr OperationLifecycle::current(WindowId window, const std::string& op_class) const
{
    auto it = live_.find(Key{window, op_class});
    return it != live_.end() ? it->second : nullptr;
}

}   // namespace xplorer::ops
