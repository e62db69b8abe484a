//===----------------------------------------------------------------------===//
//
// Part of the KeyDeck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/app/static_key.cpp
// Purpose: Fixed-icon keys and page navigation keys.
//
//===----------------------------------------------------------------------===//

#include "keydeck/app/static_key.hpp"

namespace keydeck::app
{

StaticKey::StaticKey(Context &ctx, KeySet keys, render::Icon icon)
    : Application(std::move(keys)), ctx_(ctx), icon_(std::move(icon))
{
}

StaticKey::StaticKey(Context &ctx, KeyId key, render::Icon icon)
    : StaticKey(ctx, KeySet{key}, std::move(icon))
{
}

void StaticKey::onDisplay()
{
    ctx_.setImage(keys(), icon_);
}

NavigationKey::NavigationKey(Context &ctx, KeyId key, render::Icon icon, std::string target)
    : StaticKey(ctx, key, std::move(icon)), target_(std::move(target))
{
}

Outcome NavigationKey::onRelease(KeyId key)
{
    (void)key;
    return Outcome::switchTo(target_);
}

} // namespace keydeck::app
