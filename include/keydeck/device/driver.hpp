// include/keydeck/device/driver.hpp
// @brief Contract every physical or simulated key deck driver implements.
// @invariant The key callback is invoked on a driver-owned thread.
// @ownership Drivers are owned by a Deck once opened.
#pragma once

#include "keydeck/render/bitmap.hpp"
#include "keydeck/types.hpp"

#include <functional>
#include <stdexcept>
#include <string>

namespace keydeck::device
{

/// @brief Receives (key, pressed) on every press and release edge.
using KeyCallback = std::function<void(KeyId key, bool pressed)>;

/// @brief Raised when no device exists at the requested index.
class DeviceNotFoundError : public std::runtime_error
{
  public:
    explicit DeviceNotFoundError(std::size_t index)
        : std::runtime_error("no key deck at index " + std::to_string(index)), index_(index)
    {
    }

    [[nodiscard]] std::size_t index() const
    {
        return index_;
    }

  private:
    std::size_t index_;
};

class DeckDriver
{
  public:
    virtual ~DeckDriver() = default;

    /// @brief Human readable identity used in log lines.
    [[nodiscard]] virtual std::string name() const = 0;

    virtual void open() = 0;
    virtual void reset() = 0;
    virtual void close() = 0;

    /// @brief Backlight level in percent, already clamped to 0..100.
    virtual void setBrightness(int percent) = 0;

    /// @brief Push one key image; the driver converts it to its native format.
    virtual void setKeyImage(KeyId key, const render::Bitmap &image) = 0;

    [[nodiscard]] virtual int keyCount() const = 0;
    [[nodiscard]] virtual KeyLayout keyLayout() const = 0;

    /// @brief Install the single callback slot; an empty function disables delivery.
    virtual void setKeyCallback(KeyCallback callback) = 0;
};

} // namespace keydeck::device
