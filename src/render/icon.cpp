//===----------------------------------------------------------------------===//
//
// Part of the KeyDeck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/render/icon.cpp
// Purpose: Render icon descriptors into key bitmaps as a stack of layers
//          (background, text, marker, gauge).
// Key invariants:
//   - A gauge whose slice is fully covered draws both side bars full length.
//   - A gauge slice that is not reached draws no fill at all.
// Ownership/Lifetime: Cached bitmaps are shared by every copy of an Icon.
//
//===----------------------------------------------------------------------===//

#include "keydeck/render/icon.hpp"

#include "keydeck/render/font.hpp"

#include <algorithm>

namespace keydeck::render
{

namespace
{
constexpr int kLast = KEY_SIZE - 1;

void textLayer(Bitmap &bitmap, const std::string &text, const std::string &font, int size, Point anchor, Rgb fg)
{
    TextStyle style{};
    style.fg = fg;
    style.size = size;
    drawText(bitmap, findFace(font), text, anchor, style);
}

void markerLayer(Bitmap &bitmap, const MarkerIcon &icon)
{
    const Rgb c = icon.markerColor;
    const int w = icon.width;
    if (icon.kind == MarkerKind::Square)
    {
        switch (icon.position)
        {
            case Edge::Top:
                bitmap.fillRect(0, 0, KEY_SIZE, w, c);
                break;
            case Edge::Bottom:
                bitmap.fillRect(0, KEY_SIZE - w, KEY_SIZE, KEY_SIZE, c);
                break;
            case Edge::Left:
                bitmap.fillRect(0, 0, w, KEY_SIZE, c);
                break;
            case Edge::Right:
                bitmap.fillRect(KEY_SIZE - w, 0, KEY_SIZE, KEY_SIZE, c);
                break;
        }
        return;
    }

    const int half = KEY_SIZE / 2;
    switch (icon.position)
    {
        case Edge::Top:
            bitmap.fillTriangle({0, 0}, {KEY_SIZE, 0}, {half, w * 2}, c);
            break;
        case Edge::Bottom:
            bitmap.fillTriangle({0, KEY_SIZE}, {KEY_SIZE, KEY_SIZE}, {half, KEY_SIZE - w * 2}, c);
            break;
        case Edge::Left:
            bitmap.fillTriangle({0, 0}, {w * 2, half}, {0, KEY_SIZE}, c);
            break;
        case Edge::Right:
            bitmap.fillTriangle({KEY_SIZE, 0}, {KEY_SIZE - w * 2, half}, {KEY_SIZE, KEY_SIZE}, c);
            break;
    }
}
} // namespace

int GaugeIcon::fillLength() const
{
    const double v = std::clamp(value, 0.0, 1.0);
    const int n = std::max(nKeys, 1);
    const int total = KEY_SIZE * n + kMargin * (n - 1);
    const int virtualLength = static_cast<int>(total * v);
    return std::max(0, virtualLength - keyOffset * (KEY_SIZE + kMargin));
}

Bitmap renderIcon(const ColorIcon &icon)
{
    return Bitmap(KEY_SIZE, KEY_SIZE, icon.bg);
}

Bitmap renderIcon(const TextIcon &icon)
{
    Bitmap bitmap(KEY_SIZE, KEY_SIZE, icon.bg);
    textLayer(bitmap, icon.text, icon.font, icon.size, {icon.x, icon.y}, icon.fg);
    return bitmap;
}

Bitmap renderIcon(const MarkerIcon &icon)
{
    Bitmap bitmap(KEY_SIZE, KEY_SIZE, icon.bg);
    textLayer(bitmap, icon.text, icon.font, icon.size, {icon.x, icon.y}, icon.fg);
    markerLayer(bitmap, icon);
    return bitmap;
}

Bitmap renderIcon(const GaugeIcon &icon)
{
    Bitmap bitmap(KEY_SIZE, KEY_SIZE, icon.bg);
    const int len = icon.fillLength();
    const int w = icon.width;

    if (len >= KEY_SIZE)
    {
        bitmap.fillRect(0, 0, w, kLast, icon.gauge);
        bitmap.fillRect(kLast - w, 0, kLast, kLast, icon.gauge);
    }
    else if (len > 0)
    {
        if (icon.horizontal)
        {
            bitmap.fillRect(0, 0, len, w, icon.gauge);
            bitmap.fillRect(0, kLast - w, len, kLast, icon.gauge);
            bitmap.drawLine({len, 0}, {len, kLast}, icon.fg);
        }
        else
        {
            bitmap.fillRect(0, kLast - len, w, kLast, icon.gauge);
            bitmap.fillRect(kLast - w, kLast - len, kLast, kLast, icon.gauge);
            bitmap.drawLine({0, kLast - len}, {kLast, kLast - len}, icon.fg);
        }
    }

    TextStyle style{};
    style.fg = icon.fg;
    style.size = icon.size;
    style.stroke = 2;
    style.strokeColor = icon.bg;
    drawText(bitmap, findFace(icon.font), icon.text, {KEY_SIZE / 2, KEY_SIZE / 2}, style);
    return bitmap;
}

Icon::Icon() : Icon(ColorIcon{}) {}

Icon::Icon(ColorIcon icon) : state_(std::make_shared<const State>(Variant(std::move(icon)))) {}

Icon::Icon(TextIcon icon) : state_(std::make_shared<const State>(Variant(std::move(icon)))) {}

Icon::Icon(MarkerIcon icon) : state_(std::make_shared<const State>(Variant(std::move(icon)))) {}

Icon::Icon(GaugeIcon icon) : state_(std::make_shared<const State>(Variant(std::move(icon)))) {}

std::shared_ptr<const Bitmap> Icon::render() const
{
    if (const auto *gauge = std::get_if<GaugeIcon>(&state_->value))
        return std::make_shared<const Bitmap>(renderIcon(*gauge));

    std::call_once(state_->once,
                   [this]
                   {
                       state_->cached = std::visit(
                           [](const auto &alt) { return std::make_shared<const Bitmap>(renderIcon(alt)); },
                           state_->value);
                   });
    return state_->cached;
}

} // namespace keydeck::render
