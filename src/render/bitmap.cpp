//===----------------------------------------------------------------------===//
//
// Part of the KeyDeck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/render/bitmap.cpp
// Purpose: Rasterisation primitives for key images.
// Key invariants: Every primitive clips against the buffer bounds.
//
//===----------------------------------------------------------------------===//

#include "keydeck/render/bitmap.hpp"

#include <algorithm>
#include <cstdlib>

namespace keydeck::render
{

Bitmap::Bitmap(int width, int height, Rgb fill)
    : width_(width), height_(height), pixels_(static_cast<std::size_t>(width) * height, fill)
{
}

void Bitmap::set(int x, int y, Rgb color)
{
    if (x < 0 || y < 0 || x >= width_ || y >= height_)
        return;
    pixels_[static_cast<std::size_t>(y) * width_ + x] = color;
}

void Bitmap::fill(Rgb color)
{
    std::fill(pixels_.begin(), pixels_.end(), color);
}

void Bitmap::fillRect(int x0, int y0, int x1, int y1, Rgb color)
{
    if (x0 > x1)
        std::swap(x0, x1);
    if (y0 > y1)
        std::swap(y0, y1);
    x0 = std::max(x0, 0);
    y0 = std::max(y0, 0);
    x1 = std::min(x1, width_ - 1);
    y1 = std::min(y1, height_ - 1);
    for (int y = y0; y <= y1; ++y)
    {
        for (int x = x0; x <= x1; ++x)
        {
            pixels_[static_cast<std::size_t>(y) * width_ + x] = color;
        }
    }
}

namespace
{
/// Twice the signed area of triangle (a, b, p); sign gives the side of p.
long edge(Point a, Point b, Point p)
{
    return static_cast<long>(b.x - a.x) * (p.y - a.y) - static_cast<long>(b.y - a.y) * (p.x - a.x);
}
} // namespace

void Bitmap::fillTriangle(Point a, Point b, Point c, Rgb color)
{
    const int minX = std::max(std::min({a.x, b.x, c.x}), 0);
    const int maxX = std::min(std::max({a.x, b.x, c.x}), width_ - 1);
    const int minY = std::max(std::min({a.y, b.y, c.y}), 0);
    const int maxY = std::min(std::max({a.y, b.y, c.y}), height_ - 1);
    const long area = edge(a, b, c);
    if (area == 0)
    {
        drawLine(a, b, color);
        drawLine(b, c, color);
        return;
    }
    for (int y = minY; y <= maxY; ++y)
    {
        for (int x = minX; x <= maxX; ++x)
        {
            Point p{x, y};
            long w0 = edge(b, c, p);
            long w1 = edge(c, a, p);
            long w2 = edge(a, b, p);
            bool inside = area > 0 ? (w0 >= 0 && w1 >= 0 && w2 >= 0)
                                   : (w0 <= 0 && w1 <= 0 && w2 <= 0);
            if (inside)
                pixels_[static_cast<std::size_t>(y) * width_ + x] = color;
        }
    }
}

void Bitmap::drawLine(Point from, Point to, Rgb color)
{
    int dx = std::abs(to.x - from.x);
    int dy = -std::abs(to.y - from.y);
    int sx = from.x < to.x ? 1 : -1;
    int sy = from.y < to.y ? 1 : -1;
    int err = dx + dy;
    int x = from.x;
    int y = from.y;
    while (true)
    {
        set(x, y, color);
        if (x == to.x && y == to.y)
            break;
        int e2 = 2 * err;
        if (e2 >= dy)
        {
            err += dy;
            x += sx;
        }
        if (e2 <= dx)
        {
            err += dx;
            y += sy;
        }
    }
}

int Bitmap::count(Rgb color) const
{
    return static_cast<int>(std::count(pixels_.begin(), pixels_.end(), color));
}

} // namespace keydeck::render
