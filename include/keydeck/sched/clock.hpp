// include/keydeck/sched/clock.hpp
// @brief Time sources for the task runner and time-aware widgets.
// @invariant now() is monotonic; wallTime() follows the calendar clock.
// @ownership Clocks are owned by their creator and borrowed by runners.
#pragma once

#include <chrono>
#include <mutex>

namespace keydeck::sched
{

using Duration = std::chrono::steady_clock::duration;
using TimePoint = std::chrono::steady_clock::time_point;
using WallTime = std::chrono::system_clock::time_point;

/// @brief Converts fractional seconds into a runner duration.
[[nodiscard]] inline Duration seconds(double s)
{
    return std::chrono::duration_cast<Duration>(std::chrono::duration<double>(s));
}

class Clock
{
  public:
    virtual ~Clock() = default;

    /// @brief Monotonic reading used for scheduling and elapsed time.
    [[nodiscard]] virtual TimePoint now() const = 0;

    /// @brief Calendar reading used for display.
    [[nodiscard]] virtual WallTime wallTime() const = 0;
};

/// @brief std::chrono::steady_clock and system_clock.
class SteadyClock final : public Clock
{
  public:
    [[nodiscard]] TimePoint now() const override
    {
        return std::chrono::steady_clock::now();
    }

    [[nodiscard]] WallTime wallTime() const override
    {
        return std::chrono::system_clock::now();
    }
};

/// @brief Process-wide real clock.
[[nodiscard]] Clock &systemClock();

/// @brief Clock that only moves when advanced; both readings move together.
class ManualClock final : public Clock
{
  public:
    explicit ManualClock(WallTime wallStart = WallTime{}) : wallStart_(wallStart) {}

    [[nodiscard]] TimePoint now() const override
    {
        std::lock_guard<std::mutex> lock(mu_);
        return TimePoint{} + elapsed_;
    }

    [[nodiscard]] WallTime wallTime() const override
    {
        std::lock_guard<std::mutex> lock(mu_);
        return wallStart_ + std::chrono::duration_cast<WallTime::duration>(elapsed_);
    }

    void advance(Duration d)
    {
        std::lock_guard<std::mutex> lock(mu_);
        elapsed_ += d;
    }

  private:
    mutable std::mutex mu_;
    WallTime wallStart_;
    Duration elapsed_{0};
};

} // namespace keydeck::sched
