// include/keydeck/device/virtual_deck.hpp
// @brief In-memory key deck that records pushed images and lets callers inject key edges.
// @invariant press()/release() invoke the installed callback on the calling thread.
// @ownership VirtualDeck owns the recorded images.
#pragma once

#include "keydeck/device/device_manager.hpp"
#include "keydeck/device/driver.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace keydeck::device
{

class VirtualDeck final : public DeckDriver
{
  public:
    /// @brief Layout of the reference 15-key deck.
    static constexpr KeyLayout kDefaultLayout{3, 5};

    explicit VirtualDeck(KeyLayout layout = kDefaultLayout, std::string name = "virtual deck");

    [[nodiscard]] std::string name() const override;
    void open() override;
    void reset() override;
    void close() override;
    void setBrightness(int percent) override;
    void setKeyImage(KeyId key, const render::Bitmap &image) override;
    [[nodiscard]] int keyCount() const override;
    [[nodiscard]] KeyLayout keyLayout() const override;
    void setKeyCallback(KeyCallback callback) override;

    /// @brief Simulate the driver reporting a press edge.
    void press(KeyId key);

    /// @brief Simulate the driver reporting a release edge.
    void release(KeyId key);

    /// @brief Last image pushed to @p key, if any.
    [[nodiscard]] std::optional<render::Bitmap> image(KeyId key) const;

    /// @brief Number of images pushed to @p key since the last clearWrites().
    [[nodiscard]] int writes(KeyId key) const;

    [[nodiscard]] int totalWrites() const;
    void clearWrites();

    [[nodiscard]] int brightness() const;
    [[nodiscard]] bool isOpen() const;
    [[nodiscard]] int resetCount() const;

    /// @brief Provider yielding @p count virtual decks with @p layout.
    static DeviceManager::Provider provider(KeyLayout layout = kDefaultLayout, int count = 1);

  private:
    void deliver(KeyId key, bool pressed);

    const KeyLayout layout_;
    const std::string name_;
    mutable std::mutex mu_;
    std::map<KeyId, render::Bitmap> images_;
    std::map<KeyId, int> writes_;
    KeyCallback callback_;
    int brightness_{100};
    bool open_{false};
    int resets_{0};
};

} // namespace keydeck::device
