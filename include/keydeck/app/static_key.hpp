// include/keydeck/app/static_key.hpp
// @brief Leaf applications that draw a fixed icon.
// @invariant The icon never changes after construction.
// @ownership Borrows the context.
#pragma once

#include "keydeck/app/application.hpp"
#include "keydeck/app/context.hpp"

#include <string>

namespace keydeck::app
{

/// @brief Draws one icon on every owned key and ignores input.
class StaticKey : public Application
{
  public:
    StaticKey(Context &ctx, KeySet keys, render::Icon icon);
    StaticKey(Context &ctx, KeyId key, render::Icon icon);

    void onDisplay() override;

    [[nodiscard]] const render::Icon &icon() const
    {
        return icon_;
    }

  protected:
    Context &ctx_;

  private:
    render::Icon icon_;
};

/// @brief Static key whose release asks the enclosing pager for @c target.
class NavigationKey final : public StaticKey
{
  public:
    NavigationKey(Context &ctx, KeyId key, render::Icon icon, std::string target);

    [[nodiscard]] Outcome onRelease(KeyId key) override;

    [[nodiscard]] const std::string &target() const
    {
        return target_;
    }

  private:
    std::string target_;
};

} // namespace keydeck::app
