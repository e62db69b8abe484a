// include/keydeck/widgets/long_press_key.hpp
// @brief Key behaviour that tells short presses from long presses.
// @invariant A long-press hook fires only for the most recent press, and only
//            while that press is still held.
// @ownership Borrows the context.
#pragma once

#include "keydeck/app/application.hpp"
#include "keydeck/app/context.hpp"

#include <chrono>
#include <cstdint>
#include <optional>

namespace keydeck::widgets
{

inline constexpr std::chrono::milliseconds kDefaultLongPressDelay{500};

class LongPressKey : public app::Application
{
  public:
    LongPressKey(app::Context &ctx, KeySet keys, sched::Duration delay = kDefaultLongPressDelay);

    /// @brief Runs onShortPress now and schedules the long-press check.
    void onPress(KeyId key) override;

    /// @brief Runs onLongRelease when held for at least the delay, else onShortRelease.
    [[nodiscard]] app::Outcome onRelease(KeyId key) override;

    [[nodiscard]] sched::Duration longPressDelay() const
    {
        return delay_;
    }

  protected:
    virtual void onShortPress(KeyId key);
    virtual void onLongPress(KeyId key);
    [[nodiscard]] virtual app::Outcome onShortRelease(KeyId key);
    [[nodiscard]] virtual app::Outcome onLongRelease(KeyId key);

    app::Context &ctx_;

  private:
    sched::Duration delay_;
    std::optional<sched::TimePoint> pressedAt_;
    std::uint64_t pressSerial_{0};
};

} // namespace keydeck::widgets
