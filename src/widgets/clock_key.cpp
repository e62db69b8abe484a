//===----------------------------------------------------------------------===//
//
// Part of the KeyDeck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/widgets/clock_key.cpp
// Purpose: Wall clock widget.
// Key invariants:
//   - The loop checks its token on every wake and exits once revoked.
//   - Outside of onDisplay the image is pushed only when the text changed.
//
//===----------------------------------------------------------------------===//

#include "keydeck/widgets/clock_key.hpp"

#include <chrono>
#include <ctime>

namespace keydeck::widgets
{

ClockKey::ClockKey(app::Context &ctx, KeySet keys, std::string format, int size)
    : Application(std::move(keys)), ctx_(ctx), format_(std::move(format)), size_(size)
{
}

std::string ClockKey::currentText() const
{
    const std::time_t t = std::chrono::system_clock::to_time_t(ctx_.clock().wallTime());
    std::tm local{};
    localtime_r(&t, &local);
    char buf[64];
    const std::size_t n = std::strftime(buf, sizeof(buf), format_.c_str(), &local);
    return std::string(buf, n);
}

void ClockKey::draw(bool force)
{
    std::string text = currentText();
    if (text == lastText_ && !force)
        return;
    ctx_.setImage(keys(), render::TextIcon{.text = text, .size = size_});
    lastText_ = std::move(text);
}

void ClockKey::tick(const app::LivenessToken &token)
{
    if (!app::isAlive(token))
        return;
    draw(false);
    ctx_.after(std::chrono::seconds(1), [this, token] { tick(token); });
}

void ClockKey::onDisplay()
{
    draw(true);
    const app::LivenessToken token = liveness_.renew();
    ctx_.after(std::chrono::seconds(1), [this, token] { tick(token); });
}

void ClockKey::onHide()
{
    liveness_.revoke();
}

} // namespace keydeck::widgets
