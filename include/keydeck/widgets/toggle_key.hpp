// include/keydeck/widgets/toggle_key.hpp
// @brief Key cycling through a fixed list of icons on every press.
// @invariant 0 <= state() < number of icons.
// @ownership Borrows the context; owns its icons.
#pragma once

#include "keydeck/app/application.hpp"
#include "keydeck/app/context.hpp"

#include <functional>
#include <vector>

namespace keydeck::widgets
{

class ToggleKey : public app::Application
{
  public:
    /// @brief Called after a press with the pressed key and the new state.
    using SwitchHandler = std::function<void(KeyId, int)>;

    /// @throws std::invalid_argument when @p icons is empty.
    ToggleKey(app::Context &ctx, KeySet keys, std::vector<render::Icon> icons);

    void setSwitchHandler(SwitchHandler handler)
    {
        handler_ = std::move(handler);
    }

    [[nodiscard]] int state() const
    {
        return state_;
    }

    void onDisplay() override;

    /// @brief Advance the state, redraw, then notify the switch handler.
    void onPress(KeyId key) override;

  private:
    void draw();

    app::Context &ctx_;
    std::vector<render::Icon> icons_;
    int state_{0};
    SwitchHandler handler_;
};

} // namespace keydeck::widgets
