// File: tests/test_deck.cpp
// Purpose: Validate device enumeration, Deck opening and the image and
//          callback plumbing against the virtual driver.
// Key invariants: Opening resets the device; brightness is clamped to
//                 [0, 100]; images for unknown keys never reach the driver.
// Ownership/Lifetime: Each Deck owns its VirtualDeck; tests reach the
//                     driver through Deck::driver().

#include "keydeck/device/deck.hpp"
#include "keydeck/device/device_manager.hpp"
#include "keydeck/device/virtual_deck.hpp"
#include "keydeck/log/log.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace keydeck::device
{
namespace
{

VirtualDeck &virtualOf(Deck &deck)
{
    return dynamic_cast<VirtualDeck &>(deck.driver());
}

class DeckTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        log::setSink(&logs_);
        manager_.addProvider(VirtualDeck::provider());
        deck_ = Deck::open(manager_);
    }

    void TearDown() override
    {
        deck_.reset();
        log::setSink(nullptr);
    }

    std::ostringstream logs_;
    DeviceManager manager_;
    std::unique_ptr<Deck> deck_;
};

TEST(DeviceManager, EnumeratesProvidersInOrder)
{
    DeviceManager manager;
    manager.addProvider(VirtualDeck::provider({2, 3}, 2));
    manager.addProvider(VirtualDeck::provider());
    auto devices = manager.enumerate();
    ASSERT_EQ(devices.size(), 3u);
    EXPECT_EQ(devices[0]->name(), "virtual deck #0");
    EXPECT_EQ(devices[1]->name(), "virtual deck #1");
    EXPECT_EQ(devices[0]->keyCount(), 6);
    EXPECT_EQ(devices[2]->keyCount(), 15);
}

TEST(DeviceManager, OpenOutOfRangeThrows)
{
    DeviceManager empty;
    EXPECT_THROW((void)Deck::open(empty), DeviceNotFoundError);

    DeviceManager one;
    one.addProvider(VirtualDeck::provider());
    try
    {
        (void)Deck::open(one, 3);
        FAIL() << "expected DeviceNotFoundError";
    }
    catch (const DeviceNotFoundError &e)
    {
        EXPECT_EQ(e.index(), 3u);
        EXPECT_STREQ(e.what(), "no key deck at index 3");
    }
}

TEST_F(DeckTest, OpeningResetsDevice)
{
    VirtualDeck &v = virtualOf(*deck_);
    EXPECT_TRUE(v.isOpen());
    EXPECT_EQ(v.resetCount(), 1);
    EXPECT_EQ(deck_->keyCount(), 15);
    EXPECT_EQ(deck_->keyLayout().rows, 3);
    EXPECT_EQ(deck_->keyLayout().cols, 5);
    EXPECT_NE(logs_.str().find("opened virtual deck #0"), std::string::npos);
}

TEST_F(DeckTest, BrightnessIsClamped)
{
    VirtualDeck &v = virtualOf(*deck_);
    deck_->setBrightness(150);
    EXPECT_EQ(v.brightness(), 100);
    deck_->setBrightness(-5);
    EXPECT_EQ(v.brightness(), 0);
    deck_->setBrightness(42);
    EXPECT_EQ(v.brightness(), 42);
}

TEST_F(DeckTest, ImagesForUnknownKeysAreDropped)
{
    VirtualDeck &v = virtualOf(*deck_);
    deck_->setImage(15, render::Icon{});
    deck_->setImage(-1, render::Bitmap{});
    EXPECT_EQ(v.totalWrites(), 0);
}

TEST_F(DeckTest, KeySetReceivesOneWriteEach)
{
    VirtualDeck &v = virtualOf(*deck_);
    const render::Rgb green{0, 255, 0};
    deck_->setImage(KeySet{0, 1, 2, 20}, render::Icon(render::ColorIcon{green}));
    EXPECT_EQ(v.totalWrites(), 3);
    for (KeyId k : {0, 1, 2})
    {
        EXPECT_EQ(v.writes(k), 1);
        ASSERT_TRUE(v.image(k).has_value());
        EXPECT_EQ(v.image(k)->at(10, 10), green);
    }
    EXPECT_FALSE(v.image(3).has_value());
}

TEST_F(DeckTest, CallbackReceivesKeyEvents)
{
    VirtualDeck &v = virtualOf(*deck_);
    std::vector<std::pair<KeyId, bool>> events;
    deck_->setKeyCallback([&](KeyId key, bool pressed) { events.emplace_back(key, pressed); });
    v.press(3);
    v.release(3);
    EXPECT_EQ(events, (std::vector<std::pair<KeyId, bool>>{{3, true}, {3, false}}));

    deck_->setKeyCallback(nullptr);
    v.press(4);
    EXPECT_EQ(events.size(), 2u);
}

TEST_F(DeckTest, ThrowingCallbackIsContained)
{
    VirtualDeck &v = virtualOf(*deck_);
    deck_->setKeyCallback([](KeyId, bool) { throw std::runtime_error("bad handler"); });
    EXPECT_NO_THROW(v.press(0));
    EXPECT_NE(logs_.str().find("key callback failed: bad handler"), std::string::npos);
}

} // namespace
} // namespace keydeck::device
