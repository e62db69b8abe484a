//===----------------------------------------------------------------------===//
//
// Part of the KeyDeck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/widgets/counter_key.cpp
// Purpose: Counter widget built on the long-press primitive.
// Key invariants: The key is grey from press to release.
//
//===----------------------------------------------------------------------===//

#include "keydeck/widgets/counter_key.hpp"

#include <string>

namespace keydeck::widgets
{

CounterKey::CounterKey(
    app::Context &ctx, KeySet keys, render::Rgb bg, render::Rgb fg, int size, sched::Duration delay)
    : LongPressKey(ctx, std::move(keys), delay), bg_(bg), fg_(fg), size_(size)
{
}

int CounterKey::count() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return count_;
}

void CounterKey::setCount(int value)
{
    std::lock_guard<std::mutex> lock(mu_);
    count_ = value;
}

void CounterKey::draw()
{
    render::TextIcon icon{.bg = bg_, .fg = fg_, .size = size_};
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (pressing_)
            icon.bg = render::kGrey;
        icon.text = std::to_string(count_);
    }
    ctx_.setImage(keys(), icon);
}

void CounterKey::onDisplay()
{
    draw();
}

app::Outcome CounterKey::onRelease(KeyId key)
{
    app::Outcome outcome = LongPressKey::onRelease(key);
    {
        std::lock_guard<std::mutex> lock(mu_);
        pressing_ = false;
    }
    draw();
    return outcome;
}

void CounterKey::onShortPress(KeyId key)
{
    (void)key;
    {
        std::lock_guard<std::mutex> lock(mu_);
        pressing_ = true;
        ++count_;
    }
    draw();
}

void CounterKey::onLongPress(KeyId key)
{
    (void)key;
    setCount(0);
    draw();
}

} // namespace keydeck::widgets
