// include/keydeck/device/deck.hpp
// @brief Owner of one opened device: brightness, image push and the key callback slot.
// @invariant Images for keys outside [0, keyCount) are dropped.
// @ownership Deck owns its driver and closes it on destruction.
#pragma once

#include "keydeck/device/device_manager.hpp"
#include "keydeck/device/driver.hpp"
#include "keydeck/render/icon.hpp"

#include <cstddef>
#include <memory>
#include <mutex>

namespace keydeck::device
{

class Deck
{
  public:
    /// @brief Take ownership of @p driver, open and reset it, install the callback bridge.
    explicit Deck(std::unique_ptr<DeckDriver> driver);
    ~Deck();

    Deck(const Deck &) = delete;
    Deck &operator=(const Deck &) = delete;

    /// @brief Open the device at @p index among those @p manager enumerates.
    /// @throws DeviceNotFoundError when @p index is out of range.
    static std::unique_ptr<Deck> open(const DeviceManager &manager, std::size_t index = 0);

    /// @brief Set the backlight; values are clamped into 0..100.
    void setBrightness(int percent);

    void setImage(KeyId key, const render::Bitmap &image);
    void setImage(KeyId key, const render::Icon &icon);
    void setImage(const KeySet &keys, const render::Bitmap &image);
    void setImage(const KeySet &keys, const render::Icon &icon);

    [[nodiscard]] int keyCount() const;
    [[nodiscard]] KeyLayout keyLayout() const;

    /// @brief Replace the key callback; invoked on the driver's thread.
    /// @details Blocks while the previous callback is running; the callback
    ///          must not call back into setKeyCallback.
    void setKeyCallback(KeyCallback callback);

    [[nodiscard]] DeckDriver &driver()
    {
        return *driver_;
    }

  private:
    void dispatch(KeyId key, bool pressed);

    std::unique_ptr<DeckDriver> driver_;
    std::mutex callbackMu_;
    KeyCallback callback_;
};

} // namespace keydeck::device
