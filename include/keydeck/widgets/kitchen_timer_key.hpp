// include/keydeck/widgets/kitchen_timer_key.hpp
// @brief Countdown timer on three keys: minutes, seconds and start/stop.
// @invariant While running the minute and second keys show the remaining time;
//            past the deadline they blink red and count up.
// @ownership Owns its three sub-keys; borrows the context.
#pragma once

#include "keydeck/app/application.hpp"
#include "keydeck/app/context.hpp"
#include "keydeck/app/liveness.hpp"
#include "keydeck/widgets/counter_key.hpp"
#include "keydeck/widgets/toggle_key.hpp"

namespace keydeck::widgets
{

class KitchenTimerKey : public app::Application
{
  public:
    KitchenTimerKey(app::Context &ctx,
                    KeyId minuteKey,
                    KeyId secondKey,
                    KeyId startStopKey,
                    sched::Duration longPressDelay = kDefaultLongPressDelay);

    void onDisplay() override;
    void onHide() override;
    void onPress(KeyId key) override;
    [[nodiscard]] app::Outcome onRelease(KeyId key) override;

    [[nodiscard]] bool running() const
    {
        return running_;
    }

    [[nodiscard]] CounterKey &minutes()
    {
        return minute_;
    }

    [[nodiscard]] CounterKey &seconds()
    {
        return second_;
    }

  private:
    void onStartStop(int state);
    void tick(const app::LivenessToken &token);

    app::Context &ctx_;
    CounterKey minute_;
    CounterKey second_;
    ToggleKey startStop_;
    bool running_{false};
    sched::TimePoint endAt_{};
    app::Liveness liveness_;
};

} // namespace keydeck::widgets
