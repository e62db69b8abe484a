// File: tests/test_task_runner.cpp
// Purpose: Check ordering, timing and failure isolation of the task runner,
//          both polled on a manual clock and driven by its worker thread.
// Key invariants: Tasks run in due order, FIFO among equal due times; a
//                 throwing task is logged and never stops later tasks.
// Ownership/Lifetime: Runners and clocks are per-test locals; worker tests
//                     stop their runner before returning.

#include "keydeck/log/log.hpp"
#include "keydeck/sched/clock.hpp"
#include "keydeck/sched/task_runner.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace keydeck::sched
{
namespace
{

using namespace std::chrono_literals;

TEST(TaskRunnerPoll, RunsOnlyDueTasksInOrder)
{
    ManualClock clock;
    TaskRunner runner(clock);
    std::vector<std::string> ran;
    runner.after(2s, [&] { ran.push_back("b"); });
    runner.after(1s, [&] { ran.push_back("a"); });
    runner.now([&] { ran.push_back("n"); });

    EXPECT_EQ(runner.poll(), 1u);
    EXPECT_EQ(ran, (std::vector<std::string>{"n"}));
    EXPECT_EQ(runner.pending(), 2u);

    clock.advance(1s);
    EXPECT_EQ(runner.poll(), 1u);
    clock.advance(1s);
    EXPECT_EQ(runner.poll(), 1u);
    EXPECT_EQ(ran, (std::vector<std::string>{"n", "a", "b"}));
    EXPECT_EQ(runner.pending(), 0u);
}

TEST(TaskRunnerPoll, EqualDueTimesRunFirstInFirstOut)
{
    ManualClock clock;
    TaskRunner runner(clock);
    std::vector<int> ran;
    for (int i = 0; i < 5; ++i)
    {
        runner.after(500ms, [&ran, i] { ran.push_back(i); });
    }
    clock.advance(500ms);
    runner.poll();
    EXPECT_EQ(ran, (std::vector<int>{0, 1, 2, 3, 4}));
}

TEST(TaskRunnerPoll, AbsoluteScheduling)
{
    ManualClock clock;
    TaskRunner runner(clock);
    bool fired = false;
    runner.at(clock.now() + 3s, [&] { fired = true; });
    clock.advance(2999ms);
    runner.poll();
    EXPECT_FALSE(fired);
    clock.advance(1ms);
    runner.poll();
    EXPECT_TRUE(fired);
}

TEST(TaskRunnerPoll, NegativeDelayRunsImmediately)
{
    ManualClock clock;
    TaskRunner runner(clock);
    bool fired = false;
    runner.after(-5s, [&] { fired = true; });
    runner.poll();
    EXPECT_TRUE(fired);

    fired = false;
    clock.advance(10s);
    runner.at(clock.now() - 1s, [&] { fired = true; });
    runner.poll();
    EXPECT_TRUE(fired);
}

TEST(TaskRunnerPoll, ContinuationsScheduledNowRunInSamePoll)
{
    ManualClock clock;
    TaskRunner runner(clock);
    int depth = 0;
    runner.now([&] {
        ++depth;
        runner.now([&] { ++depth; });
    });
    EXPECT_EQ(runner.poll(), 2u);
    EXPECT_EQ(depth, 2);
}

TEST(TaskRunnerPoll, ThrowingTaskIsLoggedAndIsolated)
{
    std::ostringstream logs;
    log::setSink(&logs);
    ManualClock clock;
    TaskRunner runner(clock);
    bool later = false;
    runner.now([] { throw std::runtime_error("kaboom"); });
    runner.now([&] { later = true; });

    EXPECT_NO_THROW(runner.poll());
    EXPECT_TRUE(later);
    EXPECT_NE(logs.str().find("task failed: kaboom"), std::string::npos);
    log::setSink(nullptr);
}

TEST(TaskRunnerWorker, RunsTasksOnOneWorkerThread)
{
    TaskRunner runner;
    std::set<std::thread::id> threads;
    std::promise<void> done;
    for (int i = 0; i < 20; ++i)
    {
        runner.now([&] { threads.insert(std::this_thread::get_id()); });
    }
    runner.now([&] { done.set_value(); });
    runner.start();
    ASSERT_EQ(done.get_future().wait_for(5s), std::future_status::ready);
    runner.stop();

    ASSERT_EQ(threads.size(), 1u);
    EXPECT_NE(*threads.begin(), std::this_thread::get_id());
}

TEST(TaskRunnerWorker, HonoursDelays)
{
    TaskRunner runner;
    runner.start();
    const auto started = std::chrono::steady_clock::now();
    std::promise<std::chrono::steady_clock::time_point> fired;
    runner.after(50ms, [&] { fired.set_value(std::chrono::steady_clock::now()); });
    auto future = fired.get_future();
    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    EXPECT_GE(future.get() - started, 50ms);
    runner.stop();
}

TEST(TaskRunnerWorker, StopDiscardsPendingAndAllowsRestart)
{
    TaskRunner runner;
    runner.after(1h, [] {});
    runner.start();
    EXPECT_TRUE(runner.running());
    runner.stop();
    EXPECT_FALSE(runner.running());
    EXPECT_EQ(runner.pending(), 0u);

    std::promise<void> again;
    runner.now([&] { again.set_value(); });
    runner.start();
    EXPECT_EQ(again.get_future().wait_for(5s), std::future_status::ready);
    runner.stop();
}

TEST(TaskRunnerWorker, RequestStopFromTaskReleasesWait)
{
    TaskRunner runner;
    runner.now([&] { runner.requestStop(); });
    runner.start();
    runner.wait();
    EXPECT_FALSE(runner.running());
}

TEST(TaskRunnerWorker, WaitFromWorkerIsRejected)
{
    TaskRunner runner;
    std::promise<bool> rejected;
    runner.now(
        [&]
        {
            try
            {
                runner.wait();
                rejected.set_value(false);
            }
            catch (const std::logic_error &)
            {
                rejected.set_value(true);
            }
        });
    runner.start();
    auto future = rejected.get_future();
    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    EXPECT_TRUE(future.get());
    runner.stop();
}

TEST(TaskRunnerWorker, StopJoinsWorkerWhileAnotherThreadWaits)
{
    TaskRunner runner;
    std::promise<void> busy;
    runner.now(
        [&]
        {
            busy.set_value();
            std::this_thread::sleep_for(200ms);
        });
    runner.start();
    ASSERT_EQ(busy.get_future().wait_for(5s), std::future_status::ready);

    auto waiter = std::async(std::launch::async, [&] { runner.wait(); });
    std::this_thread::sleep_for(50ms);

    runner.stop();
    EXPECT_FALSE(runner.running());
    ASSERT_EQ(waiter.wait_for(5s), std::future_status::ready);

    // A restarted runner still has exactly one worker.
    std::promise<std::thread::id> ran;
    runner.now([&] { ran.set_value(std::this_thread::get_id()); });
    runner.start();
    auto id = ran.get_future();
    ASSERT_EQ(id.wait_for(5s), std::future_status::ready);
    EXPECT_NE(id.get(), std::this_thread::get_id());
    runner.stop();
}

TEST(TaskRunnerWorker, AcceptsTasksFromOtherThreads)
{
    TaskRunner runner;
    runner.start();
    std::atomic<int> count{0};
    std::promise<void> done;
    constexpr int kPerThread = 50;
    std::vector<std::thread> producers;
    for (int t = 0; t < 4; ++t)
    {
        producers.emplace_back(
            [&]
            {
                for (int i = 0; i < kPerThread; ++i)
                {
                    runner.now(
                        [&]
                        {
                            if (++count == 4 * kPerThread)
                                done.set_value();
                        });
                }
            });
    }
    for (auto &p : producers)
    {
        p.join();
    }
    EXPECT_EQ(done.get_future().wait_for(5s), std::future_status::ready);
    runner.stop();
}

} // namespace
} // namespace keydeck::sched
