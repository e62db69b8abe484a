// include/keydeck/widgets/clock_key.hpp
// @brief Key showing the formatted wall-clock time, refreshed every second.
// @ownership Borrows the context.
#pragma once

#include "keydeck/app/application.hpp"
#include "keydeck/app/context.hpp"
#include "keydeck/app/liveness.hpp"

#include <string>

namespace keydeck::widgets
{

class ClockKey : public app::Application
{
  public:
    /// @param format strftime(3) format applied to local time.
    ClockKey(app::Context &ctx, KeySet keys, std::string format = "%H:%M:%S", int size = 16);

    /// @brief Draw now and start the once-per-second refresh loop.
    void onDisplay() override;

    /// @brief Stop the refresh loop; no redraw happens afterwards.
    void onHide() override;

    /// @brief Text for the clock's current wall time.
    [[nodiscard]] std::string currentText() const;

  private:
    void draw(bool force);
    void tick(const app::LivenessToken &token);

    app::Context &ctx_;
    const std::string format_;
    const int size_;
    std::string lastText_;
    app::Liveness liveness_;
};

} // namespace keydeck::widgets
