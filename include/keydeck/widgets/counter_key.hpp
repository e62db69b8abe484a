// include/keydeck/widgets/counter_key.hpp
// @brief Press counter: short press increments, long press resets.
// @invariant count() and the pressing flag are guarded by one mutex.
// @ownership Borrows the context.
#pragma once

#include "keydeck/widgets/long_press_key.hpp"

#include <mutex>

namespace keydeck::widgets
{

class CounterKey : public LongPressKey
{
  public:
    CounterKey(app::Context &ctx,
               KeySet keys,
               render::Rgb bg = render::kBlack,
               render::Rgb fg = render::kWhite,
               int size = 24,
               sched::Duration delay = kDefaultLongPressDelay);

    /// @brief Current count; safe from any thread.
    [[nodiscard]] int count() const;

    /// @brief Overwrite the count without redrawing; safe from any thread.
    void setCount(int value);

    void onDisplay() override;

    /// @brief Restores the normal background after the base classification.
    [[nodiscard]] app::Outcome onRelease(KeyId key) override;

  protected:
    void onShortPress(KeyId key) override;
    void onLongPress(KeyId key) override;

  private:
    void draw();

    const render::Rgb bg_;
    const render::Rgb fg_;
    const int size_;
    mutable std::mutex mu_;
    int count_{0};
    bool pressing_{false};
};

} // namespace keydeck::widgets
