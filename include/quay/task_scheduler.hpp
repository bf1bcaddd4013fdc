#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <utility>

namespace quay
{

/**
 * TaskScheduler: single-threaded timer queue for deferred UI work.
 *
 * Nothing runs by itself; the host calls poll() once per frame (or
 * run_until() with an explicit time in tests). Tasks due at the same
 * instant run in scheduling order. The time source is injectable so
 * debounce logic can be tested without sleeping.
 */
class TaskScheduler
{
   public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration  = Clock::duration;
    using TaskId    = uint64_t;
    using Task      = std::function<void()>;
    using NowFn     = std::function<TimePoint()>;

    explicit TaskScheduler(NowFn now = {});

    TaskScheduler(const TaskScheduler&)            = delete;
    TaskScheduler& operator=(const TaskScheduler&) = delete;

    TimePoint now() const;

    TaskId schedule_after(Duration delay, Task task);
    // Runs on the next poll().
    TaskId post(Task task) { return schedule_after(Duration::zero(), std::move(task)); }
    // False when the task already ran or was never scheduled.
    bool cancel(TaskId id);

    // Runs every task due at or before `t` that was scheduled before the
    // call. Returns the number of tasks run.
    size_t run_until(TimePoint t);
    size_t poll() { return run_until(now()); }

    size_t                   pending() const { return tasks_.size(); }
    bool                     is_pending(TaskId id) const;
    std::optional<TimePoint> next_due() const;

   private:
    using Key = std::pair<TimePoint, TaskId>;

    NowFn               now_;
    std::map<Key, Task> tasks_;
    TaskId              next_id_ = 1;
};

}   // namespace quay
