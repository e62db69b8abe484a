//===----------------------------------------------------------------------===//
//
// Part of the KeyDeck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/widgets/long_press_key.cpp
// Purpose: Short/long press classification driven by the runner clock.
// Key invariants:
//   - Each press gets a serial; the delayed check only fires for the serial it
//     was scheduled with and only while a press is recorded.
//   - Release clears the recorded press.
//
//===----------------------------------------------------------------------===//

#include "keydeck/widgets/long_press_key.hpp"

#include <cstdint>

namespace keydeck::widgets
{

LongPressKey::LongPressKey(app::Context &ctx, KeySet keys, sched::Duration delay)
    : Application(std::move(keys)), ctx_(ctx), delay_(delay)
{
}

void LongPressKey::onPress(KeyId key)
{
    pressedAt_ = ctx_.clock().now();
    const std::uint64_t serial = ++pressSerial_;

    onShortPress(key);

    ctx_.after(delay_,
               [this, key, serial]
               {
                   if (pressedAt_ && serial == pressSerial_)
                       onLongPress(key);
               });
}

app::Outcome LongPressKey::onRelease(KeyId key)
{
    const auto pressedAt = pressedAt_;
    pressedAt_.reset();

    if (pressedAt && ctx_.clock().now() - *pressedAt >= delay_)
        return onLongRelease(key);
    return onShortRelease(key);
}

void LongPressKey::onShortPress(KeyId key)
{
    (void)key;
}

void LongPressKey::onLongPress(KeyId key)
{
    (void)key;
}

app::Outcome LongPressKey::onShortRelease(KeyId key)
{
    (void)key;
    return app::Outcome::handled();
}

app::Outcome LongPressKey::onLongRelease(KeyId key)
{
    (void)key;
    return app::Outcome::handled();
}

} // namespace keydeck::widgets
