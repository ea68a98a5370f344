#pragma once

#include <memory>
#include <string>
#include <xplorer/fwd.hpp>

namespace xplorer::ops
{

// Who an asynchronous result is meant for: the active tab of a window at the
// moment the work started.
struct ConsumerIdentity
{
    WindowId window = INVALID_WINDOW;
    TabId    tab    = INVALID_TAB;

    bool operator==(const ConsumerIdentity& other) const
    {
        return window == other.window && tab == other.tab;
    }
    bool operator!=(const ConsumerIdentity& other) const { return !(*this == other); }
};

// Cancellation handle for one in-flight unit of work.
struct OperationToken
{
    bool             cancelled = false;
    std::string      backend_operation_id;   // empty when the action is not cancellable
    ConsumerIdentity consumer;
    std::string      op_class;               // e.g. "list", "search", "info"
    uint64_t         serial = 0;
};

using TokenPtr = std::shared_ptr<OperationToken>;

// A result may be applied only if its token was never superseded and the
// consumer it was issued for is still the current one.
inline bool is_stale(const OperationToken& token, const ConsumerIdentity& current)
{
    return token.cancelled || token.consumer != current;
}

}   // namespace xplorer::ops
