#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <queue>
#include <unordered_set>
#include <vector>

namespace tf::engine
{

// Fixed-interval task scheduler driven by the caller's loop. Not thread-safe;
// tick() and schedule() belong to the thread that owns the loop.
class SchedulerService
{
  public:
    using Clock = std::chrono::steady_clock;
    using TaskId = std::size_t;
    using Callback = std::function<void()>;

    // First run is one interval after now.
    TaskId schedule(std::chrono::milliseconds interval, Callback callback,
                    Clock::time_point now = Clock::now());

    // Returns false for unknown or already cancelled ids.
    bool cancel(TaskId id);

    // Run pending tasks. Returns how many were executed.
    std::size_t tick(Clock::time_point now);

    // How long the loop can sleep before work is due.
    std::chrono::milliseconds time_until_next_task(Clock::time_point now) const;

    std::size_t task_count() const noexcept { return active_.size(); }

  private:
    struct Task
    {
        TaskId id;
        std::chrono::milliseconds interval;
        Clock::time_point next_run;
        Callback callback;

        // Min-heap priority queue needs > operator for smallest-first
        bool operator>(Task const &other) const
        {
            return next_run > other.next_run;
        }
    };

    void drop_cancelled_head();
    void requeue(Task task, Clock::time_point next_run);

    std::priority_queue<Task, std::vector<Task>, std::greater<Task>> tasks_;
    std::unordered_set<TaskId> active_;
    TaskId next_id_ = 1;
};

} // namespace tf::engine
