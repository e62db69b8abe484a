//===----------------------------------------------------------------------===//
//
// Part of the KeyDeck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/widgets/toggle_key.cpp
// Purpose: Multi-state toggle key.
//
//===----------------------------------------------------------------------===//

#include "keydeck/widgets/toggle_key.hpp"

#include <stdexcept>

namespace keydeck::widgets
{

ToggleKey::ToggleKey(app::Context &ctx, KeySet keys, std::vector<render::Icon> icons)
    : Application(std::move(keys)), ctx_(ctx), icons_(std::move(icons))
{
    if (icons_.empty())
        throw std::invalid_argument("toggle key needs at least one icon");
}

void ToggleKey::draw()
{
    ctx_.setImage(keys(), icons_[static_cast<std::size_t>(state_)]);
}

void ToggleKey::onDisplay()
{
    draw();
}

void ToggleKey::onPress(KeyId key)
{
    state_ = (state_ + 1) % static_cast<int>(icons_.size());
    draw();
    if (handler_)
        handler_(key, state_);
}

} // namespace keydeck::widgets
