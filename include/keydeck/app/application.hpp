// include/keydeck/app/application.hpp
// @brief Base class for everything bound to a set of keys.
// @invariant keys() only grows; composites own the union of their children's keys.
// @ownership Applications are owned by their parent composite or by the caller.
#pragma once

#include "keydeck/app/outcome.hpp"
#include "keydeck/types.hpp"

namespace keydeck::app
{

/// @brief Behaviour attached to keys: draws on display, reacts to press and release.
/// @details All capabilities are invoked on the runner's worker thread.
class Application
{
  public:
    explicit Application(KeySet keys = {}) : keys_(std::move(keys)) {}

    virtual ~Application() = default;

    Application(const Application &) = delete;
    Application &operator=(const Application &) = delete;

    [[nodiscard]] const KeySet &keys() const
    {
        return keys_;
    }

    [[nodiscard]] bool owns(KeyId key) const
    {
        return keys_.count(key) != 0;
    }

    /// @brief Draw every owned key.
    virtual void onDisplay() = 0;

    /// @brief Stop periodic work; must be safe to call twice.
    virtual void onHide() {}

    virtual void onPress(KeyId key)
    {
        (void)key;
    }

    /// @return A switch outcome to ask the enclosing pager for another page.
    [[nodiscard]] virtual Outcome onRelease(KeyId key)
    {
        (void)key;
        return Outcome::handled();
    }

  protected:
    void addKeys(const KeySet &keys)
    {
        keys_.insert(keys.begin(), keys.end());
    }

  private:
    KeySet keys_;
};

} // namespace keydeck::app
