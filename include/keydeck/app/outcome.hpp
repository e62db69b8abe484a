// include/keydeck/app/outcome.hpp
// @brief Result of a key release: handled, or a request to switch pages.
// @invariant A switch outcome always names a non-empty target.
// @ownership Value type.
#pragma once

#include <optional>
#include <string>

namespace keydeck::app
{

class Outcome
{
  public:
    [[nodiscard]] static Outcome handled()
    {
        return Outcome{};
    }

    [[nodiscard]] static Outcome switchTo(std::string page)
    {
        Outcome o;
        o.target_ = std::move(page);
        return o;
    }

    [[nodiscard]] bool isSwitch() const
    {
        return target_.has_value();
    }

    /// @brief Requested page; empty for handled outcomes.
    [[nodiscard]] const std::string &target() const
    {
        static const std::string none;
        return target_ ? *target_ : none;
    }

    bool operator==(const Outcome &) const = default;

  private:
    Outcome() = default;

    std::optional<std::string> target_;
};

} // namespace keydeck::app
