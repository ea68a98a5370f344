#include "event_loop.hpp"

#include <algorithm>
#include <xplorer/logger.hpp>

#ifdef __linux__
    #include <cerrno>
    #include <poll.h>
#endif

namespace xplorer::core
{

EventLoop::EventLoop() : time_source_([] { return Clock::now(); }) {}

void EventLoop::post(Task task)
{
    posted_.push_back(std::move(task));
}

EventLoop::TimerId EventLoop::add_timer(std::chrono::milliseconds delay, Task task)
{
    TimerId id = next_timer_id_++;
    timers_.emplace(id, Timer{id, now() + delay, std::move(task)});
    return id;
}

bool EventLoop::cancel_timer(TimerId id)
{
    return timers_.erase(id) > 0;
}

void EventLoop::watch_fd(int fd, FdHandler handler)
{
    watchers_[fd] = std::move(handler);
}

void EventLoop::unwatch_fd(int fd)
{
    watchers_.erase(fd);
}

bool EventLoop::is_watching(int fd) const
{
    return watchers_.count(fd) > 0;
}

EventLoop::TimePoint EventLoop::now() const
{
    return time_source_();
}

void EventLoop::set_time_source(std::function<TimePoint()> source)
{
    time_source_ = source ? std::move(source) : [] { return Clock::now(); };
}

size_t EventLoop::run_posted()
{
    // Tasks posted while draining run on the next pass
    std::deque<Task> batch;
    batch.swap(posted_);
    for (auto& task : batch)
        task();
    return batch.size();
}

size_t EventLoop::fire_due_timers()
{
    size_t fired = 0;
    for (;;)
    {
        TimePoint current = now();
        auto      due     = timers_.end();
        for (auto it = timers_.begin(); it != timers_.end(); ++it)
        {
            if (it->second.deadline > current)
                continue;
            if (due == timers_.end() || it->second.deadline < due->second.deadline)
                due = it;
        }
        if (due == timers_.end())
            break;

        Task task = std::move(due->second.task);
        timers_.erase(due);
        task();
        ++fired;
    }
    return fired;
}

std::chrono::milliseconds EventLoop::time_to_next_timer(std::chrono::milliseconds cap) const
{
    if (!posted_.empty())
        return std::chrono::milliseconds(0);

    auto      wait    = cap;
    TimePoint current = now();
    for (const auto& [id, timer] : timers_)
    {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(timer.deadline - current);
        wait      = std::min(wait, std::max(left, std::chrono::milliseconds(0)));
    }
    return wait;
}

size_t EventLoop::poll_fds(std::chrono::milliseconds wait)
{
#ifdef __linux__
    if (watchers_.empty())
        return 0;

    std::vector<pollfd> pfds;
    pfds.reserve(watchers_.size());
    for (const auto& [fd, handler] : watchers_)
        pfds.push_back(pollfd{fd, POLLIN, 0});

    int ready = ::poll(pfds.data(), pfds.size(), static_cast<int>(wait.count()));
    if (ready < 0)
    {
        if (errno != EINTR)
            XPLORER_LOG_ERROR("loop", "poll failed: errno {}", errno);
        return 0;
    }

    size_t dispatched = 0;
    for (const auto& p : pfds)
    {
        if ((p.revents & (POLLIN | POLLHUP | POLLERR)) == 0)
            continue;
        // A previous handler may have unwatched this fd
        auto it = watchers_.find(p.fd);
        if (it == watchers_.end())
            continue;
        FdHandler handler = it->second;
        handler(p.fd);
        ++dispatched;
    }
    return dispatched;
#else
    (void)wait;
    return 0;
#endif
}

size_t EventLoop::drain()
{
    size_t total = 0;
    for (;;)
    {
        size_t n = run_posted() + fire_due_timers();
        if (n == 0)
            break;
        total += n;
    }
    return total;
}

size_t EventLoop::run_once(std::chrono::milliseconds max_wait)
{
    size_t dispatched = drain();
    dispatched += poll_fds(time_to_next_timer(max_wait));
    dispatched += drain();
    return dispatched;
}

void EventLoop::run()
{
    running_ = true;
    while (running_)
        run_once(std::chrono::milliseconds(100));
}

}   // namespace xplorer::core
