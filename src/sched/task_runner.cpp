//===----------------------------------------------------------------------===//
//
// Part of the KeyDeck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/sched/task_runner.cpp
// Purpose: Timer-ordered task queue drained by one worker thread or by poll().
// Key invariants:
//   - Tasks never run concurrently; the queue lock is released while a task runs.
//   - A task that throws is logged and the loop continues.
//   - stop() abandons pending tasks; the runner is reusable afterwards.
//   - Exactly one caller joins the worker; concurrent wait()/stop() callers
//     block until that join completes.
// Ownership/Lifetime: The worker is joined by stop()/wait() or the destructor.
//
//===----------------------------------------------------------------------===//

#include "keydeck/sched/task_runner.hpp"

#include "keydeck/log/log.hpp"

#include <exception>
#include <stdexcept>
#include <string>

namespace keydeck::sched
{

Clock &systemClock()
{
    static SteadyClock clock;
    return clock;
}

TaskRunner::TaskRunner(const Clock &clock) : clock_(clock) {}

TaskRunner::~TaskRunner()
{
    requestStop();
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (active_ && workerId_ == std::this_thread::get_id())
        {
            worker_.detach();
            return;
        }
    }
    wait();
}

void TaskRunner::push(TimePoint due, Task task)
{
    {
        std::lock_guard<std::mutex> lock(mu_);
        queue_.push(Entry{due, nextSeq_++, std::move(task)});
    }
    cv_.notify_one();
}

void TaskRunner::now(Task task)
{
    push(clock_.now(), std::move(task));
}

void TaskRunner::after(Duration delay, Task task)
{
    if (delay < Duration::zero())
        delay = Duration::zero();
    push(clock_.now() + delay, std::move(task));
}

void TaskRunner::at(TimePoint when, Task task)
{
    after(when - clock_.now(), std::move(task));
}

void TaskRunner::start()
{
    std::lock_guard<std::mutex> lock(mu_);
    if (joining_ || worker_.joinable())
        return;
    stopRequested_ = false;
    active_ = true;
    worker_ = std::thread([this] { loop(); });
    workerId_ = worker_.get_id();
}

void TaskRunner::requestStop()
{
    {
        std::lock_guard<std::mutex> lock(mu_);
        stopRequested_ = true;
    }
    cv_.notify_all();
}

void TaskRunner::wait()
{
    std::unique_lock<std::mutex> lock(mu_);
    if (active_ && workerId_ == std::this_thread::get_id())
        throw std::logic_error("TaskRunner::wait called from its own worker");
    if (joining_)
    {
        // Another caller owns the join; worker_ must not be touched until it finishes.
        joined_.wait(lock, [this] { return !joining_; });
        return;
    }
    if (!worker_.joinable())
        return;
    joining_ = true;
    lock.unlock();
    worker_.join();
    lock.lock();
    joining_ = false;
    joined_.notify_all();
}

void TaskRunner::stop()
{
    requestStop();
    wait();
    std::lock_guard<std::mutex> lock(mu_);
    queue_ = {};
    stopRequested_ = false;
}

bool TaskRunner::running() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return active_ && !stopRequested_;
}

std::size_t TaskRunner::pending() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return queue_.size();
}

void TaskRunner::execute(const Task &task)
{
    try
    {
        task();
    }
    catch (const std::exception &e)
    {
        log::error(std::string("task failed: ") + e.what());
    }
    catch (...)
    {
        log::error("task failed: unknown exception");
    }
}

std::size_t TaskRunner::poll()
{
    std::size_t ran = 0;
    while (true)
    {
        Task task;
        {
            std::lock_guard<std::mutex> lock(mu_);
            if (queue_.empty() || queue_.top().due > clock_.now())
                break;
            task = queue_.top().task;
            queue_.pop();
        }
        execute(task);
        ++ran;
    }
    return ran;
}

void TaskRunner::loop()
{
    std::unique_lock<std::mutex> lock(mu_);
    while (!stopRequested_)
    {
        if (queue_.empty())
        {
            cv_.wait(lock);
            continue;
        }
        const TimePoint due = queue_.top().due;
        const TimePoint current = clock_.now();
        if (due > current)
        {
            cv_.wait_for(lock, due - current);
            continue;
        }
        Task task = queue_.top().task;
        queue_.pop();
        lock.unlock();
        execute(task);
        lock.lock();
    }
    active_ = false;
}

} // namespace keydeck::sched
