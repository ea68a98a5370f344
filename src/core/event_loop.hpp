#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <vector>

namespace xplorer::core
{

// Single-threaded dispatch loop. Every callback (posted task, timer, fd
// readiness) runs to completion before the next one starts.
class EventLoop
{
   public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Task      = std::function<void()>;
    using FdHandler = std::function<void(int fd)>;
    using TimerId   = uint64_t;

    EventLoop();

    EventLoop(const EventLoop&)            = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void post(Task task);

    TimerId add_timer(std::chrono::milliseconds delay, Task task);
    bool    cancel_timer(TimerId id);
    size_t  pending_timers() const { return timers_.size(); }

    // Readable-fd callbacks. The fd stays owned by the caller.
    void watch_fd(int fd, FdHandler handler);
    void unwatch_fd(int fd);
    bool is_watching(int fd) const;

    // Runs posted tasks, due timers, then waits at most max_wait for fd
    // readiness. Returns the number of callbacks dispatched.
    size_t run_once(std::chrono::milliseconds max_wait = std::chrono::milliseconds(0));

    // Dispatch posted tasks and due timers without touching fds.
    size_t drain();

    void run();
    void stop() { running_ = false; }
    bool running() const { return running_; }

    TimePoint now() const;

    // Replace the clock. Tests drive timers with a manual time source.
    void set_time_source(std::function<TimePoint()> source);

   private:
    struct Timer
    {
        TimerId   id;
        TimePoint deadline;
        Task      task;
    };

    size_t run_posted();
    size_t fire_due_timers();
    size_t poll_fds(std::chrono::milliseconds wait);

    std::chrono::milliseconds time_to_next_timer(std::chrono::milliseconds cap) const;

    std::deque<Task>           posted_;
    std::map<TimerId, Timer>   timers_;
    std::map<int, FdHandler>   watchers_;
    TimerId                    next_timer_id_ = 1;
    bool                       running_       = false;
    std::function<TimePoint()> time_source_;
};

}   // namespace xplorer::core
