// File: tests/test_group_pager.cpp
// Purpose: Cover key routing through Group and page navigation through
//          Pager, including the blanking of keys a new page does not own.
// Key invariants: A key reaches only its first owning child; a page switch
//                 blanks each stale key exactly once; a switch to a name the
//                 pager does not know travels upward unchanged.
// Ownership/Lifetime: Groups and pagers own their children; journals are
//                     test locals shared with RecordingApp instances.

#include "deck_test_support.hpp"

#include "keydeck/app/errors.hpp"
#include "keydeck/app/group.hpp"
#include "keydeck/app/pager.hpp"
#include "keydeck/app/static_key.hpp"

#include <stdexcept>

namespace keydeck::app
{
namespace
{

using keydeck::testing::DeckTest;
using keydeck::testing::RecordingApp;
using Journal = std::vector<std::string>;

const render::Rgb kRed{255, 0, 0};
const render::Rgb kGreen{0, 255, 0};

using GroupTest = DeckTest;
using PagerTest = DeckTest;

TEST_F(GroupTest, KeysAreUnionOfChildren)
{
    Journal journal;
    Group group;
    group.emplace<RecordingApp>("a", KeySet{0, 1}, journal);
    group.emplace<RecordingApp>("b", KeySet{5}, journal);
    EXPECT_EQ(group.keys(), (KeySet{0, 1, 5}));
    EXPECT_EQ(group.size(), 2u);
}

TEST_F(GroupTest, PressGoesToOwningChildOnly)
{
    Journal journal;
    Group group;
    group.emplace<RecordingApp>("a", KeySet{0, 1}, journal);
    group.emplace<RecordingApp>("b", KeySet{2, 3}, journal);

    group.onPress(2);
    (void)group.onRelease(2);
    group.onPress(9);
    EXPECT_EQ(group.onRelease(9), Outcome::handled());
    EXPECT_EQ(journal, (Journal{"b:press:2", "b:release:2"}));
}

TEST_F(GroupTest, OverlappingKeyGoesToFirstChildAndWarns)
{
    Journal journal;
    Group group;
    group.emplace<RecordingApp>("a", KeySet{0, 1}, journal);
    group.emplace<RecordingApp>("b", KeySet{1, 2}, journal);
    EXPECT_NE(logText().find("group: key 1 already owned"), std::string::npos);

    group.onPress(1);
    EXPECT_EQ(journal, (Journal{"a:press:1"}));
}

TEST_F(GroupTest, DisplayAndHideFanOutInOrder)
{
    Journal journal;
    Group group;
    group.emplace<RecordingApp>("a", KeySet{0}, journal);
    group.emplace<RecordingApp>("b", KeySet{1}, journal);
    group.onDisplay();
    group.onHide();
    EXPECT_EQ(journal, (Journal{"a:display", "b:display", "a:hide", "b:hide"}));
}

TEST_F(GroupTest, FailingChildDoesNotStarveSiblings)
{
    Journal journal;
    Group group;
    group.emplace<RecordingApp>("a", KeySet{0}, journal).failDisplay = true;
    group.emplace<RecordingApp>("b", KeySet{1}, journal);

    EXPECT_THROW(group.onDisplay(), std::runtime_error);
    EXPECT_EQ(journal, (Journal{"a:display", "b:display"}));
}

TEST_F(GroupTest, ReleasePassesSwitchOutcomeThrough)
{
    Group group;
    group.emplace<NavigationKey>(*ctx_, 3, render::Icon{}, "AC");
    const Outcome outcome = group.onRelease(3);
    ASSERT_TRUE(outcome.isSwitch());
    EXPECT_EQ(outcome.target(), "AC");
}

TEST_F(GroupTest, ConstructedFromChildren)
{
    Journal journal;
    std::vector<std::unique_ptr<Application>> children;
    children.push_back(std::make_unique<RecordingApp>("a", KeySet{0}, journal));
    children.push_back(std::make_unique<RecordingApp>("b", KeySet{4}, journal));
    Group group(std::move(children));
    EXPECT_EQ(group.keys(), (KeySet{0, 4}));
    group.onPress(4);
    EXPECT_EQ(journal, (Journal{"b:press:4"}));
}

std::vector<Pager::Page> twoPages(Journal &journal)
{
    std::vector<Pager::Page> pages;
    pages.push_back({"A", std::make_unique<RecordingApp>("A", KeySet{0, 1}, journal)});
    pages.push_back({"B", std::make_unique<RecordingApp>("B", KeySet{1, 2}, journal)});
    return pages;
}

TEST_F(PagerTest, StartsOnDefaultPage)
{
    Journal journal;
    Pager pager(*ctx_, "B", twoPages(journal));
    EXPECT_EQ(pager.currentName(), "B");
    EXPECT_EQ(pager.defaultName(), "B");
    EXPECT_EQ(&pager.current(), &pager.page("B"));
    EXPECT_EQ(pager.pageNames(), (std::vector<std::string>{"A", "B"}));
    EXPECT_EQ(pager.keys(), (KeySet{0, 1, 2}));

    pager.onDisplay();
    pager.onPress(1);
    EXPECT_EQ(journal, (Journal{"B:display", "B:press:1"}));
}

TEST_F(PagerTest, UnknownDefaultIsRejected)
{
    Journal journal;
    try
    {
        Pager pager(*ctx_, "MISSING", twoPages(journal));
        FAIL() << "expected UnknownPageError";
    }
    catch (const UnknownPageError &e)
    {
        EXPECT_EQ(e.name(), "MISSING");
        EXPECT_STREQ(e.what(), "no such page: MISSING");
    }
}

TEST_F(PagerTest, DuplicateNamesAreRejected)
{
    Journal journal;
    auto pages = twoPages(journal);
    pages.push_back({"A", std::make_unique<RecordingApp>("A2", KeySet{3}, journal)});
    EXPECT_THROW(Pager(*ctx_, "A", std::move(pages)), DuplicatePageError);

    Pager pager(*ctx_, "A", twoPages(journal));
    EXPECT_THROW(pager.addPage("B", std::make_unique<RecordingApp>("B2", KeySet{}, journal)),
                 DuplicatePageError);
    pager.addPage("C", std::make_unique<RecordingApp>("C", KeySet{7}, journal));
    EXPECT_TRUE(pager.owns(7));
}

TEST_F(PagerTest, SwitchToUnknownPageThrows)
{
    Journal journal;
    Pager pager(*ctx_, "A", twoPages(journal));
    EXPECT_THROW(pager.switchTo("Z"), UnknownPageError);
    EXPECT_EQ(pager.currentName(), "A");
    EXPECT_THROW((void)pager.page("Z"), UnknownPageError);
}

TEST_F(PagerTest, SwitchHidesThenDisplays)
{
    Journal journal;
    Pager pager(*ctx_, "A", twoPages(journal));
    pager.switchTo("B");
    EXPECT_EQ(journal, (Journal{"A:hide", "B:display"}));
    EXPECT_EQ(pager.currentName(), "B");
}

TEST_F(PagerTest, StaleKeysBlankedExactlyOnce)
{
    std::vector<Pager::Page> pages;
    pages.push_back({"A", std::make_unique<StaticKey>(*ctx_, KeySet{0, 1, 2}, render::ColorIcon{kRed})});
    pages.push_back({"B", std::make_unique<StaticKey>(*ctx_, KeySet{1}, render::ColorIcon{kGreen})});
    Pager pager(*ctx_, "A", std::move(pages));
    pager.onDisplay();
    virt_->clearWrites();

    pager.switchTo("B");
    EXPECT_EQ(virt_->writes(0), 1);
    EXPECT_EQ(virt_->writes(1), 1);
    EXPECT_EQ(virt_->writes(2), 1);
    EXPECT_EQ(virt_->totalWrites(), 3);
    EXPECT_EQ(cornerOf(0), render::kBlack);
    EXPECT_EQ(cornerOf(1), kGreen);
    EXPECT_EQ(cornerOf(2), render::kBlack);
}

TEST_F(PagerTest, FailingDisplayStillCompletesSwitch)
{
    Journal journal;
    auto pages = twoPages(journal);
    static_cast<RecordingApp &>(*pages[1].app).failDisplay = true;
    Pager pager(*ctx_, "A", std::move(pages));
    virt_->clearWrites();

    EXPECT_THROW(pager.switchTo("B"), std::runtime_error);
    EXPECT_EQ(pager.currentName(), "B");
    EXPECT_EQ(virt_->writes(0), 1);
}

TEST_F(PagerTest, ReentrantSwitchIsIgnored)
{
    Journal journal;
    auto pages = twoPages(journal);
    pages.push_back({"C", std::make_unique<RecordingApp>("C", KeySet{3}, journal)});
    auto &first = static_cast<RecordingApp &>(*pages[0].app);
    Pager pager(*ctx_, "A", std::move(pages));
    first.onHideHook = [&] { pager.switchTo("C"); };

    pager.switchTo("B");
    EXPECT_EQ(pager.currentName(), "B");
    EXPECT_EQ(journal, (Journal{"A:hide", "B:display"}));
    EXPECT_NE(logText().find("page switch to C ignored"), std::string::npos);
}

TEST_F(PagerTest, ConsumesSwitchToKnownPage)
{
    Journal journal;
    auto pages = twoPages(journal);
    static_cast<RecordingApp &>(*pages[0].app).releaseOutcome = Outcome::switchTo("B");
    Pager pager(*ctx_, "A", std::move(pages));

    EXPECT_EQ(pager.onRelease(0), Outcome::handled());
    EXPECT_EQ(pager.currentName(), "B");
}

TEST_F(PagerTest, UnknownSwitchTravelsUpward)
{
    Journal journal;
    auto pages = twoPages(journal);
    static_cast<RecordingApp &>(*pages[0].app).releaseOutcome = Outcome::switchTo("ELSEWHERE");
    Pager pager(*ctx_, "A", std::move(pages));

    EXPECT_EQ(pager.onRelease(0), Outcome::switchTo("ELSEWHERE"));
    EXPECT_EQ(pager.currentName(), "A");
}

TEST_F(PagerTest, OuterPagerHandlesSwitchInnerCannot)
{
    std::vector<Pager::Page> innerPages;
    innerPages.push_back({"X", std::make_unique<NavigationKey>(*ctx_, 0, render::Icon{}, "OTHER")});
    std::vector<Pager::Page> outerPages;
    outerPages.push_back({"MAIN", std::make_unique<Pager>(*ctx_, "X", std::move(innerPages))});
    outerPages.push_back({"OTHER", std::make_unique<StaticKey>(*ctx_, KeyId{5}, render::Icon{})});
    Pager outer(*ctx_, "MAIN", std::move(outerPages));

    ctx_->attachApplication(outer);
    tap(0);
    EXPECT_EQ(outer.currentName(), "OTHER");
    EXPECT_EQ(logText().find("no such page"), std::string::npos);
}

TEST_F(PagerTest, StandbyAndAcRoundTrip)
{
    Group *standby = nullptr;
    std::vector<Pager::Page> pages;
    {
        auto page = std::make_unique<Group>();
        page->emplace<NavigationKey>(*ctx_, 0, render::ColorIcon{kRed}, "AC");
        page->emplace<StaticKey>(*ctx_, KeySet{1, 2}, render::ColorIcon{kRed});
        page->emplace<StaticKey>(*ctx_, 14, render::ColorIcon{kRed});
        standby = page.get();
        pages.push_back({"STBY", std::move(page)});
    }
    {
        auto page = std::make_unique<Group>();
        page->emplace<StaticKey>(*ctx_, KeySet{0, 3}, render::ColorIcon{kGreen});
        page->emplace<NavigationKey>(*ctx_, 14, render::ColorIcon{kGreen}, "STBY");
        pages.push_back({"AC", std::move(page)});
    }
    Pager pager(*ctx_, "STBY", std::move(pages));
    ctx_->attachApplication(pager);
    EXPECT_EQ(&pager.current(), standby);
    EXPECT_EQ(cornerOf(1), kRed);

    press(0);
    EXPECT_EQ(pager.currentName(), "STBY");
    release(0);
    EXPECT_EQ(pager.currentName(), "AC");
    EXPECT_EQ(cornerOf(0), kGreen);
    EXPECT_EQ(cornerOf(1), render::kBlack);
    EXPECT_EQ(cornerOf(2), render::kBlack);
    EXPECT_EQ(cornerOf(3), kGreen);
    EXPECT_EQ(cornerOf(14), kGreen);

    tap(14);
    EXPECT_EQ(pager.currentName(), "STBY");
    EXPECT_EQ(cornerOf(1), kRed);
    EXPECT_EQ(cornerOf(3), render::kBlack);
}

} // namespace
} // namespace keydeck::app
