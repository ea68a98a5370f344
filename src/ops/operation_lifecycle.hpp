#pragma once

#include <functional>
#include <map>
#include <string>
#include <utility>

#include "../ipc/channel.hpp"
#include "operation_token.hpp"

namespace xplorer::state
{
class StateCoordinator;
}

namespace xplorer::ops
{

// Check-before-apply discipline for work issued through a RequestChannel.
// At most one live token exists per (window, operation class); starting a
// new one supersedes the previous token before the new request is sent.
class OperationLifecycle
{
   public:
    using ApplyFn = std::function<void(const ipc::RequestResult&)>;

    OperationLifecycle(ipc::RequestChannel& channel, const state::StateCoordinator& coordinator);

    OperationLifecycle(const OperationLifecycle&)            = delete;
    OperationLifecycle& operator=(const OperationLifecycle&) = delete;

    // Active tab of window right now.
    ConsumerIdentity current_identity(WindowId window) const;

    // Supersedes the live token of (window, op_class) and returns a fresh one
    // bound to the current identity. cooperative reserves a backend
    // operation id.
    TokenPtr begin(WindowId window, const std::string& op_class, bool cooperative);

    // Marks the live token of (window, op_class) cancelled and sends a
    // best-effort cancel for its backend operation id.
    void supersede(WindowId window, const std::string& op_class);

    // Supersedes every live token owned by window.
    void release_consumer(WindowId window);

    bool still_valid(const OperationToken& token) const;

    // Drops the token from the live table if it is still the live one.
    void finish(const TokenPtr& token);

    // Full round trip. apply only runs when the result is still valid;
    // otherwise the result is discarded and counted. Returns the token.
    TokenPtr run(WindowId           window,
                 const std::string& op_class,
                 const std::string& action,
                 ipc::Value         params,
                 bool               cooperative,
                 ApplyFn            apply);

    // Live token of (window, op_class), nullptr when idle.
    TokenPtr current(WindowId window, const std::string& op_class) const;

    size_t   live_count() const { return live_.size(); }
    uint64_t discarded_count() const { return discarded_; }
    uint64_t cancels_sent() const { return cancels_sent_; }

    // Call when a check failed; kept public so event-driven consumers can
    // account for their own discards.
    void note_discard(const OperationToken& token);

   private:
    using Key = std::pair<WindowId, std::string>;

    void cancel_token(OperationToken& token);

    ipc::RequestChannel&           channel_;
    const state::StateCoordinator& coordinator_;
    std::map<Key, TokenPtr>        live_;
    uint64_t                       next_serial_    = 1;
    uint64_t                       next_operation_ = 1;
    uint64_t                       discarded_      = 0;
    uint64_t                       cancels_sent_   = 0;
};

}   // namespace xplorer::ops
