// include/keydeck/widgets/stopwatch_key.hpp
// @brief Start/stop stopwatch showing elapsed H:MM:SS.
// @invariant State shared with draw() is guarded by one mutex.
// @ownership Borrows the context.
#pragma once

#include "keydeck/app/application.hpp"
#include "keydeck/app/context.hpp"
#include "keydeck/app/liveness.hpp"

#include <mutex>
#include <optional>
#include <string>

namespace keydeck::widgets
{

class StopWatchKey : public app::Application
{
  public:
    StopWatchKey(app::Context &ctx, KeySet keys);

    void onDisplay() override;

    /// @brief Stops the watch.
    void onHide() override;

    /// @brief Toggle between running and stopped.
    void onPress(KeyId key) override;

    [[nodiscard]] app::Outcome onRelease(KeyId key) override;

    [[nodiscard]] bool running() const;

    /// @brief Elapsed time as H:MM:SS; "0:00:00" before the first start.
    [[nodiscard]] std::string elapsedText() const;

  private:
    std::string elapsedTextLocked() const;
    void draw();
    void tick(const app::LivenessToken &token);

    app::Context &ctx_;
    mutable std::mutex mu_;
    bool running_{false};
    bool pressed_{false};
    std::optional<sched::TimePoint> startAt_;
    std::optional<sched::TimePoint> stopAt_;
    app::Liveness liveness_;
};

} // namespace keydeck::widgets
