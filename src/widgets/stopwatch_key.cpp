//===----------------------------------------------------------------------===//
//
// Part of the KeyDeck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/widgets/stopwatch_key.cpp
// Purpose: Stopwatch widget.
// Key invariants:
//   - Grey while pressed, inverted while running, white on black otherwise.
//   - The elapsed time freezes when the watch stops.
//
//===----------------------------------------------------------------------===//

#include "keydeck/widgets/stopwatch_key.hpp"

#include <chrono>
#include <cstdio>
#include <utility>

namespace keydeck::widgets
{

StopWatchKey::StopWatchKey(app::Context &ctx, KeySet keys) : Application(std::move(keys)), ctx_(ctx) {}

bool StopWatchKey::running() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return running_;
}

std::string StopWatchKey::elapsedTextLocked() const
{
    if (!startAt_)
        return "0:00:00";
    const sched::TimePoint end = running_ || !stopAt_ ? ctx_.clock().now() : *stopAt_;
    const long total = static_cast<long>(std::chrono::duration_cast<std::chrono::seconds>(end - *startAt_).count());
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%ld:%02ld:%02ld", total / 3600, (total / 60) % 60, total % 60);
    return buf;
}

std::string StopWatchKey::elapsedText() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return elapsedTextLocked();
}

void StopWatchKey::draw()
{
    render::TextIcon icon{.size = 12};
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (pressed_)
            icon.bg = render::kGrey;
        else if (running_)
            std::swap(icon.bg, icon.fg);
        icon.text = elapsedTextLocked();
    }
    ctx_.setImage(keys(), icon);
}

void StopWatchKey::tick(const app::LivenessToken &token)
{
    if (!app::isAlive(token))
        return;
    draw();
    ctx_.after(std::chrono::seconds(1), [this, token] { tick(token); });
}

void StopWatchKey::onDisplay()
{
    draw();
}

void StopWatchKey::onHide()
{
    std::lock_guard<std::mutex> lock(mu_);
    if (running_)
    {
        running_ = false;
        stopAt_ = ctx_.clock().now();
    }
    liveness_.revoke();
}

void StopWatchKey::onPress(KeyId key)
{
    (void)key;
    {
        std::lock_guard<std::mutex> lock(mu_);
        const sched::TimePoint at = ctx_.clock().now();
        pressed_ = true;
        if (running_)
        {
            running_ = false;
            stopAt_ = at;
            liveness_.revoke();
        }
        else
        {
            running_ = true;
            startAt_ = at;
            stopAt_.reset();
            const app::LivenessToken token = liveness_.renew();
            ctx_.now([this, token] { tick(token); });
        }
    }
    draw();
}

app::Outcome StopWatchKey::onRelease(KeyId key)
{
    (void)key;
    {
        std::lock_guard<std::mutex> lock(mu_);
        pressed_ = false;
    }
    draw();
    return app::Outcome::handled();
}

} // namespace keydeck::widgets
