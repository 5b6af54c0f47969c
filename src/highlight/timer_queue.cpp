// src/highlight/timer_queue.cpp
// @brief Timer queue and debouncer implementation.
// @invariant A timer is removed from the queue before its callback runs, so
//            callbacks may schedule or cancel timers freely.
// @ownership Callbacks are moved out of the queue when fired.

#include "syndrql/highlight/timer_queue.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace syndrql::highlight
{

Clock steadyClock()
{
    return []
    {
        return std::chrono::duration_cast<Millis>(
            std::chrono::steady_clock::now().time_since_epoch());
    };
}

TimerQueue::TimerQueue(Clock clock) : clock_(std::move(clock)) {}

TimerId TimerQueue::schedule(Millis delay, Callback cb)
{
    const TimerId id = nextId_++;
    timers_.emplace(id, Timer{clock_() + delay, std::move(cb)});
    return id;
}

bool TimerQueue::cancel(TimerId id)
{
    return timers_.erase(id) != 0;
}

bool TimerQueue::isPending(TimerId id) const
{
    return timers_.find(id) != timers_.end();
}

std::optional<Millis> TimerQueue::nextDeadline() const
{
    std::optional<Millis> best;
    for (const auto &[id, timer] : timers_)
    {
        if (!best || timer.deadline < *best)
            best = timer.deadline;
    }
    return best;
}

std::size_t TimerQueue::runDue()
{
    const Millis current = clock_();

    std::vector<std::pair<Millis, TimerId>> due;
    for (const auto &[id, timer] : timers_)
    {
        if (timer.deadline <= current)
            due.emplace_back(timer.deadline, id);
    }
    std::sort(due.begin(), due.end());

    std::size_t fired = 0;
    for (const auto &[deadline, id] : due)
    {
        auto it = timers_.find(id);
        // An earlier callback may have cancelled this one.
        if (it == timers_.end())
            continue;
        Callback cb = std::move(it->second.callback);
        timers_.erase(it);
        if (cb)
            cb();
        ++fired;
    }
    return fired;
}

void Debouncer::trigger(const std::string &key, std::function<void()> cb)
{
    cancel(key);
    const TimerId id = queue_->schedule(delay_,
                                        [this, key, cb = std::move(cb)]
                                        {
                                            timers_.erase(key);
                                            if (cb)
                                                cb();
                                        });
    timers_[key] = id;
}

bool Debouncer::cancel(const std::string &key)
{
    auto it = timers_.find(key);
    if (it == timers_.end())
        return false;
    const bool cancelled = queue_->cancel(it->second);
    timers_.erase(it);
    return cancelled;
}

void Debouncer::cancelAll()
{
    for (const auto &[key, id] : timers_)
        queue_->cancel(id);
    timers_.clear();
}

bool Debouncer::isPending(const std::string &key) const
{
    auto it = timers_.find(key);
    return it != timers_.end() && queue_->isPending(it->second);
}

std::size_t Debouncer::pending() const
{
    return static_cast<std::size_t>(
        std::count_if(timers_.begin(),
                      timers_.end(),
                      [this](const auto &entry) { return queue_->isPending(entry.second); }));
}

} // namespace syndrql::highlight
