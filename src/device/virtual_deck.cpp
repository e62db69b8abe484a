//===----------------------------------------------------------------------===//
//
// Part of the KeyDeck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/device/virtual_deck.cpp
// Purpose: Headless key deck used by tests and by the demo when no terminal
//          is attached.
// Key invariants: All recorded state is guarded by one mutex; the callback is
//                 invoked without holding it.
//
//===----------------------------------------------------------------------===//

#include "keydeck/device/virtual_deck.hpp"

#include <memory>
#include <vector>

namespace keydeck::device
{

VirtualDeck::VirtualDeck(KeyLayout layout, std::string name) : layout_(layout), name_(std::move(name)) {}

std::string VirtualDeck::name() const
{
    return name_;
}

void VirtualDeck::open()
{
    std::lock_guard<std::mutex> lock(mu_);
    open_ = true;
}

void VirtualDeck::reset()
{
    std::lock_guard<std::mutex> lock(mu_);
    images_.clear();
    ++resets_;
}

void VirtualDeck::close()
{
    std::lock_guard<std::mutex> lock(mu_);
    open_ = false;
}

void VirtualDeck::setBrightness(int percent)
{
    std::lock_guard<std::mutex> lock(mu_);
    brightness_ = percent;
}

void VirtualDeck::setKeyImage(KeyId key, const render::Bitmap &image)
{
    std::lock_guard<std::mutex> lock(mu_);
    images_.insert_or_assign(key, image);
    ++writes_[key];
}

int VirtualDeck::keyCount() const
{
    return layout_.rows * layout_.cols;
}

KeyLayout VirtualDeck::keyLayout() const
{
    return layout_;
}

void VirtualDeck::setKeyCallback(KeyCallback callback)
{
    std::lock_guard<std::mutex> lock(mu_);
    callback_ = std::move(callback);
}

void VirtualDeck::deliver(KeyId key, bool pressed)
{
    KeyCallback callback;
    {
        std::lock_guard<std::mutex> lock(mu_);
        callback = callback_;
    }
    if (callback)
        callback(key, pressed);
}

void VirtualDeck::press(KeyId key)
{
    deliver(key, true);
}

void VirtualDeck::release(KeyId key)
{
    deliver(key, false);
}

std::optional<render::Bitmap> VirtualDeck::image(KeyId key) const
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = images_.find(key);
    if (it == images_.end())
        return std::nullopt;
    return it->second;
}

int VirtualDeck::writes(KeyId key) const
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = writes_.find(key);
    return it == writes_.end() ? 0 : it->second;
}

int VirtualDeck::totalWrites() const
{
    std::lock_guard<std::mutex> lock(mu_);
    int total = 0;
    for (const auto &[key, n] : writes_)
    {
        total += n;
    }
    return total;
}

void VirtualDeck::clearWrites()
{
    std::lock_guard<std::mutex> lock(mu_);
    writes_.clear();
}

int VirtualDeck::brightness() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return brightness_;
}

bool VirtualDeck::isOpen() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return open_;
}

int VirtualDeck::resetCount() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return resets_;
}

DeviceManager::Provider VirtualDeck::provider(KeyLayout layout, int count)
{
    return [layout, count]
    {
        std::vector<std::unique_ptr<DeckDriver>> out;
        for (int i = 0; i < count; ++i)
        {
            out.push_back(std::make_unique<VirtualDeck>(layout, "virtual deck #" + std::to_string(i)));
        }
        return out;
    };
}

} // namespace keydeck::device
