#include "engine/SchedulerService.hpp"

#include <utility>

namespace tf::engine
{

auto SchedulerService::schedule(std::chrono::milliseconds interval,
                                Callback callback, Clock::time_point now)
    -> TaskId
{
    TaskId id = next_id_++;
    tasks_.push({id, interval, now + interval, std::move(callback)});
    active_.insert(id);
    return id;
}

bool SchedulerService::cancel(TaskId id)
{
    // The heap entry stays until it reaches the top; tick() discards it then.
    return active_.erase(id) != 0;
}

void SchedulerService::drop_cancelled_head()
{
    while (!tasks_.empty() && active_.count(tasks_.top().id) == 0)
    {
        tasks_.pop();
    }
}

void SchedulerService::requeue(Task task, Clock::time_point next_run)
{
    if (active_.count(task.id) != 0)
    {
        task.next_run = next_run;
        tasks_.push(std::move(task));
    }
}

std::size_t SchedulerService::tick(Clock::time_point now)
{
    std::size_t executed = 0;
    std::vector<Task> due;

    drop_cancelled_head();
    while (!tasks_.empty() && tasks_.top().next_run <= now)
    {
        due.push_back(tasks_.top());
        tasks_.pop();
        drop_cancelled_head();
    }

    // Reschedule after collecting so a zero interval cannot spin this loop.
    for (std::size_t index = 0; index < due.size(); ++index)
    {
        auto &task = due[index];
        if (active_.count(task.id) == 0)
        {
            continue;
        }
        auto const next_run = now + task.interval;
        try
        {
            if (task.callback)
            {
                task.callback();
                ++executed;
            }
        }
        catch (...)
        {
            // Tasks collected but not run yet stay due for the next tick.
            requeue(std::move(task), next_run);
            for (std::size_t rest = index + 1; rest < due.size(); ++rest)
            {
                auto const still_due = due[rest].next_run;
                requeue(std::move(due[rest]), still_due);
            }
            throw;
        }
        // The callback may have cancelled its own task.
        requeue(std::move(task), next_run);
    }
    return executed;
}

std::chrono::milliseconds
SchedulerService::time_until_next_task(Clock::time_point now) const
{
    if (active_.empty() || tasks_.empty())
    {
        return std::chrono::hours(24); // Infinite sleep essentially
    }
    auto next = tasks_.top().next_run;
    if (now >= next)
        return std::chrono::milliseconds(0);
    return std::chrono::duration_cast<std::chrono::milliseconds>(next - now);
}

} // namespace tf::engine
