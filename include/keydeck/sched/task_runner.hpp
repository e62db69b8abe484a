// include/keydeck/sched/task_runner.hpp
// @brief Single-worker cooperative event loop with immediate and delayed tasks.
// @invariant At most one task executes at a time; tasks run in due-time order,
//            ties broken by submission order.
// @ownership The runner owns its worker thread and queued tasks; the clock is borrowed.
#pragma once

#include "keydeck/sched/clock.hpp"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace keydeck::sched
{

using Task = std::function<void()>;

class TaskRunner
{
  public:
    explicit TaskRunner(const Clock &clock = systemClock());
    ~TaskRunner();

    TaskRunner(const TaskRunner &) = delete;
    TaskRunner &operator=(const TaskRunner &) = delete;

    /// @brief Enqueue @p task for the next loop iteration. Callable from any thread.
    void now(Task task);

    /// @brief Run @p task no earlier than @p delay from now.
    void after(Duration delay, Task task);

    /// @brief Run @p task no earlier than @p when (a reading of clock()).
    void at(TimePoint when, Task task);

    /// @brief Launch the worker thread; no-op when already running.
    void start();

    /// @brief Ask the worker to exit after its current task. Callable from any thread.
    void requestStop();

    /// @brief Block until the worker exits; returns immediately when not running.
    /// @details Safe to call from several threads; only one of them joins.
    void wait();

    /// @brief requestStop() + wait(), then discard pending tasks so the runner
    ///        can be started again. Returns only after the worker has exited.
    void stop();

    [[nodiscard]] bool running() const;

    /// @brief Run every task that is due on the calling thread.
    /// @return Number of tasks executed.
    std::size_t poll();

    /// @brief Number of queued tasks, due or not.
    [[nodiscard]] std::size_t pending() const;

    [[nodiscard]] const Clock &clock() const
    {
        return clock_;
    }

  private:
    struct Entry
    {
        TimePoint due;
        std::uint64_t seq;
        Task task;
    };

    struct Later
    {
        bool operator()(const Entry &a, const Entry &b) const
        {
            if (a.due != b.due)
                return a.due > b.due;
            return a.seq > b.seq;
        }
    };

    void push(TimePoint due, Task task);
    void loop();
    static void execute(const Task &task);

    const Clock &clock_;
    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::priority_queue<Entry, std::vector<Entry>, Later> queue_;
    std::uint64_t nextSeq_{0};
    bool stopRequested_{false};
    bool active_{false};
    bool joining_{false};
    std::condition_variable joined_;
    std::thread worker_;
    std::thread::id workerId_;
};

} // namespace keydeck::sched
