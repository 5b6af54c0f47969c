// include/syndrql/highlight/timer_queue.hpp
// @brief Cancellable delayed callbacks driven by the host event loop, and a
//        keyed trailing-edge debouncer built on them.
// @invariant Callbacks run only inside runDue(), in deadline order, ties
//            broken by scheduling order.
// @invariant A Debouncer holds at most one pending timer per key.
// @ownership TimerQueue owns its callbacks; Debouncer borrows its queue,
//            which must outlive it.
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>

namespace syndrql::highlight
{

using Millis = std::chrono::milliseconds;

/// @brief Monotonic millisecond clock source.
using Clock = std::function<Millis()>;

/// @brief Clock reading std::chrono::steady_clock.
[[nodiscard]] Clock steadyClock();

using TimerId = std::uint64_t;

class TimerQueue
{
  public:
    using Callback = std::function<void()>;

    explicit TimerQueue(Clock clock = steadyClock());

    /// @brief Run @p cb once @p delay has elapsed.
    /// @return Identifier accepted by cancel(); never 0.
    TimerId schedule(Millis delay, Callback cb);

    /// @brief Drop a pending timer.
    /// @return False if @p id already fired or was cancelled.
    bool cancel(TimerId id);

    /// @brief Fire every timer whose deadline has passed.
    /// @return Number of callbacks invoked.
    std::size_t runDue();

    [[nodiscard]] bool isPending(TimerId id) const;

    [[nodiscard]] std::size_t pending() const
    {
        return timers_.size();
    }

    /// @brief Earliest pending deadline, if any.
    [[nodiscard]] std::optional<Millis> nextDeadline() const;

    [[nodiscard]] Millis now() const
    {
        return clock_();
    }

  private:
    struct Timer
    {
        Millis deadline;
        Callback callback;
    };

    Clock clock_;
    TimerId nextId_ = 1;
    std::map<TimerId, Timer> timers_;
};

/// @brief Trailing-edge debouncer keyed by string.
class Debouncer
{
  public:
    Debouncer(TimerQueue &queue, Millis delay) : queue_(&queue), delay_(delay) {}

    /// @brief (Re)start the quiet period for @p key; @p cb runs once the
    ///        period elapses without another trigger for the same key.
    void trigger(const std::string &key, std::function<void()> cb);

    /// @brief Cancel the pending callback for @p key.
    bool cancel(const std::string &key);

    void cancelAll();

    [[nodiscard]] bool isPending(const std::string &key) const;

    /// @brief Number of keys with a pending callback.
    [[nodiscard]] std::size_t pending() const;

    [[nodiscard]] Millis delay() const
    {
        return delay_;
    }

    void setDelay(Millis delay)
    {
        delay_ = delay;
    }

  private:
    TimerQueue *queue_;
    Millis delay_;
    std::unordered_map<std::string, TimerId> timers_;
};

} // namespace syndrql::highlight
