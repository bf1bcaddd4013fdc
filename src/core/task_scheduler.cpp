#include <algorithm>
#include <quay/logger.hpp>
#include <quay/task_scheduler.hpp>

namespace quay
{

TaskScheduler::TaskScheduler(NowFn now) : now_(std::move(now)) {}

TaskScheduler::TimePoint TaskScheduler::now() const
{
    return now_ ? now_() : Clock::now();
}

TaskScheduler::TaskId TaskScheduler::schedule_after(Duration delay, Task task)
{
    const TaskId id = next_id_++;
    tasks_.emplace(Key{now() + std::max(delay, Duration::zero()), id}, std::move(task));
    return id;
}

bool TaskScheduler::cancel(TaskId id)
{
    auto it = std::find_if(tasks_.begin(), tasks_.end(), [id](const auto& e) { return e.first.second == id; });
    if (it == tasks_.end())
        return false;
    tasks_.erase(it);
    return true;
}

bool TaskScheduler::is_pending(TaskId id) const
{
    return std::any_of(tasks_.begin(), tasks_.end(), [id](const auto& e) { return e.first.second == id; });
}

std::optional<TaskScheduler::TimePoint> TaskScheduler::next_due() const
{
    if (tasks_.empty())
        return std::nullopt;
    return tasks_.begin()->first.first;
}

size_t TaskScheduler::run_until(TimePoint t)
{
    // Tasks added while running wait for the next call, so a task that
    // reposts itself cannot spin this loop.
    const TaskId limit = next_id_;
    size_t       count = 0;

    auto it = tasks_.begin();
    while (it != tasks_.end() && it->first.first <= t)
    {
        if (it->first.second >= limit)
        {
            ++it;
            continue;
        }
        Task task = std::move(it->second);
        tasks_.erase(it);
        if (task)
            task();
        ++count;
        // The task may have scheduled or cancelled others.
        it = tasks_.begin();
    }

    if (count > 0)
        QUAY_LOG_TRACE("dock.persist", "ran {} scheduled tasks", count);
    return count;
}

}   // namespace quay
