//===----------------------------------------------------------------------===//
//
// Part of the KeyDeck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/device/deck.cpp
// Purpose: Deck ownership, device enumeration and the driver-thread callback bridge.
// Key invariants:
//   - The callback runs under the slot mutex, so replacing the slot waits
//     for an in-flight call to finish.
//   - Nothing thrown by the callback escapes onto the driver thread.
// Ownership/Lifetime: Deck closes its driver in the destructor after detaching
//                     the callback.
//
//===----------------------------------------------------------------------===//

#include "keydeck/device/deck.hpp"

#include "keydeck/log/log.hpp"

#include <algorithm>
#include <exception>
#include <string>

namespace keydeck::device
{

void DeviceManager::addProvider(Provider provider)
{
    providers_.push_back(std::move(provider));
}

std::vector<std::unique_ptr<DeckDriver>> DeviceManager::enumerate() const
{
    std::vector<std::unique_ptr<DeckDriver>> out;
    for (const auto &provider : providers_)
    {
        for (auto &driver : provider())
        {
            out.push_back(std::move(driver));
        }
    }
    return out;
}

Deck::Deck(std::unique_ptr<DeckDriver> driver) : driver_(std::move(driver))
{
    driver_->open();
    driver_->reset();
    driver_->setKeyCallback([this](KeyId key, bool pressed) { dispatch(key, pressed); });
    log::info("opened " + driver_->name() + " (" + std::to_string(driver_->keyCount()) + " keys)");
}

Deck::~Deck()
{
    driver_->setKeyCallback({});
    driver_->close();
}

std::unique_ptr<Deck> Deck::open(const DeviceManager &manager, std::size_t index)
{
    auto devices = manager.enumerate();
    if (index >= devices.size())
        throw DeviceNotFoundError(index);
    return std::make_unique<Deck>(std::move(devices[index]));
}

void Deck::setBrightness(int percent)
{
    driver_->setBrightness(std::clamp(percent, 0, 100));
}

void Deck::setImage(KeyId key, const render::Bitmap &image)
{
    if (key < 0 || key >= driver_->keyCount())
        return;
    driver_->setKeyImage(key, image);
}

void Deck::setImage(KeyId key, const render::Icon &icon)
{
    if (key < 0 || key >= driver_->keyCount())
        return;
    driver_->setKeyImage(key, *icon.render());
}

void Deck::setImage(const KeySet &keys, const render::Bitmap &image)
{
    for (KeyId key : keys)
    {
        setImage(key, image);
    }
}

void Deck::setImage(const KeySet &keys, const render::Icon &icon)
{
    auto image = icon.render();
    for (KeyId key : keys)
    {
        setImage(key, *image);
    }
}

int Deck::keyCount() const
{
    return driver_->keyCount();
}

KeyLayout Deck::keyLayout() const
{
    return driver_->keyLayout();
}

void Deck::setKeyCallback(KeyCallback callback)
{
    std::lock_guard<std::mutex> lock(callbackMu_);
    callback_ = std::move(callback);
}

void Deck::dispatch(KeyId key, bool pressed)
{
    std::lock_guard<std::mutex> lock(callbackMu_);
    if (!callback_)
        return;
    try
    {
        callback_(key, pressed);
    }
    catch (const std::exception &e)
    {
        log::error("key callback failed: " + std::string(e.what()));
    }
}

} // namespace keydeck::device
