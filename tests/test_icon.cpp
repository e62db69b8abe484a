// File: tests/test_icon.cpp
// Purpose: Exercise every icon variant renderer and the render cache.
// Key invariants: Gauge fill is zero at value 0, full at value 1 and never
//                 shrinks as value grows; only gauges bypass the cache.
// Ownership/Lifetime: Icons and bitmaps are local values.

#include "keydeck/render/icon.hpp"

#include <gtest/gtest.h>

namespace keydeck::render
{
namespace
{

const Rgb kRed{255, 0, 0};
const Rgb kBlue{0, 0, 255};

TEST(ColorIcon, FillsWholeKey)
{
    const Bitmap b = renderIcon(ColorIcon{kBlue});
    EXPECT_EQ(b.width(), KEY_SIZE);
    EXPECT_EQ(b.height(), KEY_SIZE);
    EXPECT_EQ(b.count(kBlue), KEY_SIZE * KEY_SIZE);
}

TEST(ColorIcon, DefaultIconIsBlank)
{
    const Icon blank;
    EXPECT_EQ(blank.render()->count(kBlack), KEY_SIZE * KEY_SIZE);
}

TEST(TextIcon, DrawsForegroundOverBackground)
{
    const Bitmap b = renderIcon(TextIcon{.bg = kBlue, .fg = kRed, .text = "42"});
    EXPECT_GT(b.count(kRed), 0);
    EXPECT_EQ(b.at(0, 0), kBlue);
    EXPECT_EQ(b.count(kRed) + b.count(kBlue), KEY_SIZE * KEY_SIZE);
}

TEST(TextIcon, HonoursCustomAnchor)
{
    const Bitmap centred = renderIcon(TextIcon{.text = "A"});
    const Bitmap shifted = renderIcon(TextIcon{.text = "A", .x = 20, .y = 20});
    EXPECT_NE(centred, shifted);
    EXPECT_EQ(centred.count(kWhite), shifted.count(kWhite));
}

TEST(MarkerIcon, SquareBottomBand)
{
    const Bitmap b = renderIcon(MarkerIcon{.markerColor = kRed, .position = Edge::Bottom, .width = 4});
    EXPECT_EQ(b.at(36, 71), kRed);
    EXPECT_EQ(b.at(0, 68), kRed);
    EXPECT_EQ(b.at(36, 67), kBlack);
    EXPECT_EQ(b.count(kRed), 4 * KEY_SIZE);
}

TEST(MarkerIcon, SquareLeftBand)
{
    const Bitmap b = renderIcon(MarkerIcon{.markerColor = kRed, .position = Edge::Left, .width = 4});
    for (int y = 0; y < KEY_SIZE; ++y)
    {
        EXPECT_EQ(b.at(0, y), kRed);
        EXPECT_EQ(b.at(4, y), kRed);
        EXPECT_EQ(b.at(5, y), kBlack);
    }
}

TEST(MarkerIcon, TriangleRightPointsInward)
{
    const Bitmap b = renderIcon(
        MarkerIcon{.markerColor = kRed, .position = Edge::Right, .kind = MarkerKind::Triangle, .width = 4});
    EXPECT_EQ(b.at(71, 36), kRed);
    EXPECT_EQ(b.at(65, 36), kRed);
    EXPECT_EQ(b.at(60, 36), kBlack);
    EXPECT_EQ(b.at(65, 2), kBlack);
}

TEST(MarkerIcon, MarkerDrawnOverText)
{
    const Bitmap plain = renderIcon(TextIcon{.text = "TAB"});
    const Bitmap marked = renderIcon(MarkerIcon{.text = "TAB", .markerColor = kRed, .position = Edge::Top});
    EXPECT_EQ(marked.count(kWhite), plain.count(kWhite));
    EXPECT_EQ(marked.at(10, 0), kRed);
}

GaugeIcon gauge(double value, int nKeys = 1, int offset = 0)
{
    return GaugeIcon{.gauge = kRed, .fg = kWhite, .nKeys = nKeys, .keyOffset = offset, .value = value};
}

TEST(GaugeIcon, EmptyAtZero)
{
    const Bitmap b = renderIcon(gauge(0.0));
    EXPECT_EQ(b.count(kRed), 0);
    EXPECT_EQ(b.count(kWhite), 0);
}

TEST(GaugeIcon, FullBarsAtOne)
{
    const Bitmap b = renderIcon(gauge(1.0));
    EXPECT_EQ(b.count(kRed), 2 * 13 * KEY_SIZE);
    EXPECT_EQ(b.at(0, 0), kRed);
    EXPECT_EQ(b.at(71, 71), kRed);
    EXPECT_EQ(b.at(36, 36), kBlack);
}

TEST(GaugeIcon, PartialFillRisesFromBottom)
{
    const GaugeIcon half = gauge(0.5);
    EXPECT_EQ(half.fillLength(), 36);
    const Bitmap b = renderIcon(half);
    EXPECT_EQ(b.at(0, 71), kRed);
    EXPECT_EQ(b.at(0, 10), kBlack);
    EXPECT_EQ(b.at(36, 71 - 36), kWhite);
}

TEST(GaugeIcon, HorizontalFillGrowsFromLeft)
{
    GaugeIcon icon = gauge(0.5);
    icon.horizontal = true;
    const Bitmap b = renderIcon(icon);
    EXPECT_EQ(b.at(0, 0), kRed);
    EXPECT_EQ(b.at(60, 0), kBlack);
    EXPECT_EQ(b.at(36, 36), kWhite);
}

TEST(GaugeIcon, FillLengthSpansKeysAndMargins)
{
    EXPECT_EQ(gauge(1.0, 3, 0).fillLength(), 3 * KEY_SIZE + 2 * GaugeIcon::kMargin);
    EXPECT_EQ(gauge(0.5, 3, 0).fillLength(), 121);
    EXPECT_EQ(gauge(0.5, 3, 1).fillLength(), 36);
    EXPECT_EQ(gauge(0.5, 3, 2).fillLength(), 0);
    EXPECT_GE(gauge(1.0, 3, 2).fillLength(), KEY_SIZE);
}

TEST(GaugeIcon, ValueIsClamped)
{
    EXPECT_EQ(renderIcon(gauge(2.5)), renderIcon(gauge(1.0)));
    EXPECT_EQ(renderIcon(gauge(-1.0)), renderIcon(gauge(0.0)));
}

TEST(GaugeIcon, FillIsMonotonicInValue)
{
    for (int offset = 0; offset < 3; ++offset)
    {
        int previous = -1;
        for (int step = 0; step <= 40; ++step)
        {
            const int len = gauge(step / 40.0, 3, offset).fillLength();
            EXPECT_GE(len, previous) << "offset " << offset << " step " << step;
            previous = len;

            const int below = offset > 0 ? gauge(step / 40.0, 3, offset - 1).fillLength() : len;
            EXPECT_GE(below, len);
        }
    }
}

TEST(GaugeIcon, LabelStrokedInBackground)
{
    GaugeIcon icon = gauge(0.0);
    icon.bg = kBlue;
    icon.text = "50%";
    const Bitmap b = renderIcon(icon);
    EXPECT_GT(b.count(kWhite), 0);
    EXPECT_EQ(b.count(kRed), 0);
}

TEST(IconCache, StaticVariantsRenderOnce)
{
    const Icon icon(TextIcon{.text = "A"});
    const auto first = icon.render();
    EXPECT_EQ(first.get(), icon.render().get());

    const Icon copy = icon;
    EXPECT_EQ(first.get(), copy.render().get());
}

TEST(IconCache, GaugesRenderFresh)
{
    const Icon icon(gauge(0.3));
    const auto a = icon.render();
    const auto b = icon.render();
    EXPECT_NE(a.get(), b.get());
    EXPECT_EQ(*a, *b);
}

TEST(IconCache, VariantIsExposed)
{
    const Icon icon(MarkerIcon{.text = "M"});
    ASSERT_TRUE(std::holds_alternative<MarkerIcon>(icon.variant()));
    EXPECT_EQ(std::get<MarkerIcon>(icon.variant()).text, "M");
}

} // namespace
} // namespace keydeck::render
