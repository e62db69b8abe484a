//===----------------------------------------------------------------------===//
//
// Part of the KeyDeck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/widgets/kitchen_timer_key.cpp
// Purpose: Kitchen timer composed of two counters and a start/stop toggle.
// Key invariants:
//   - Sixty seconds roll over into one minute.
//   - Counter keys ignore input while the timer runs.
//   - The countdown loop only runs while shown and running.
//
//===----------------------------------------------------------------------===//

#include "keydeck/widgets/kitchen_timer_key.hpp"

#include <chrono>
#include <string>

namespace keydeck::widgets
{

namespace
{
const render::Rgb kOverdueBright{128, 0, 0};
const render::Rgb kOverdueDim{64, 0, 0};
const render::Rgb kStopRed{255, 0, 0};
constexpr int kDigitSize = 24;

std::vector<render::Icon> startStopIcons()
{
    return {render::TextIcon{.text = "Start", .size = 12},
            render::TextIcon{.bg = kStopRed, .text = "Stop", .size = 12}};
}
} // namespace

KitchenTimerKey::KitchenTimerKey(
    app::Context &ctx, KeyId minuteKey, KeyId secondKey, KeyId startStopKey, sched::Duration longPressDelay)
    : Application(KeySet{minuteKey, secondKey, startStopKey}),
      ctx_(ctx),
      minute_(ctx, KeySet{minuteKey}, render::kBlack, render::kWhite, kDigitSize, longPressDelay),
      second_(ctx, KeySet{secondKey}, render::kBlack, render::kWhite, kDigitSize, longPressDelay),
      startStop_(ctx, KeySet{startStopKey}, startStopIcons())
{
    startStop_.setSwitchHandler([this](KeyId, int state) { onStartStop(state); });
}

void KitchenTimerKey::onDisplay()
{
    startStop_.onDisplay();
    if (running_)
    {
        tick(liveness_.renew());
        return;
    }
    minute_.onDisplay();
    second_.onDisplay();
}

void KitchenTimerKey::onHide()
{
    liveness_.revoke();
    minute_.onHide();
    second_.onHide();
    startStop_.onHide();
}

void KitchenTimerKey::onPress(KeyId key)
{
    if (startStop_.owns(key))
    {
        startStop_.onPress(key);
        return;
    }
    if (running_)
        return;
    if (minute_.owns(key))
    {
        minute_.onPress(key);
    }
    else if (second_.owns(key))
    {
        second_.onPress(key);
        if (second_.count() >= 60)
        {
            minute_.setCount(minute_.count() + 1);
            second_.setCount(0);
            minute_.onDisplay();
            second_.onDisplay();
        }
    }
}

app::Outcome KitchenTimerKey::onRelease(KeyId key)
{
    if (startStop_.owns(key))
        return startStop_.onRelease(key);
    if (running_)
        return app::Outcome::handled();
    if (minute_.owns(key))
        return minute_.onRelease(key);
    if (second_.owns(key))
        return second_.onRelease(key);
    return app::Outcome::handled();
}

void KitchenTimerKey::onStartStop(int state)
{
    if (state == 0)
    {
        running_ = false;
        liveness_.revoke();
        minute_.onDisplay();
        second_.onDisplay();
        return;
    }
    minute_.onHide();
    second_.onHide();
    endAt_ = ctx_.clock().now() + std::chrono::minutes(minute_.count()) + std::chrono::seconds(second_.count());
    running_ = true;
    tick(liveness_.renew());
}

void KitchenTimerKey::tick(const app::LivenessToken &token)
{
    if (!app::isAlive(token) || !running_)
        return;
    using std::chrono::duration_cast;
    const sched::TimePoint now = ctx_.clock().now();
    render::TextIcon minuteIcon{.size = kDigitSize};
    render::TextIcon secondIcon{.size = kDigitSize};
    long total = 0;
    if (now >= endAt_)
    {
        total = static_cast<long>(duration_cast<std::chrono::seconds>(now - endAt_).count());
        const render::Rgb bg = total % 2 == 0 ? kOverdueBright : kOverdueDim;
        minuteIcon.bg = bg;
        secondIcon.bg = bg;
    }
    else
    {
        total = static_cast<long>(duration_cast<std::chrono::seconds>(endAt_ - now).count());
    }
    minuteIcon.text = std::to_string(total / 60);
    secondIcon.text = std::to_string(total % 60);
    ctx_.setImage(minute_.keys(), minuteIcon);
    ctx_.setImage(second_.keys(), secondIcon);
    ctx_.after(std::chrono::seconds(1), [this, token] { tick(token); });
}

} // namespace keydeck::widgets
