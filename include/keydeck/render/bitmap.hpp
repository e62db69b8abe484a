// include/keydeck/render/bitmap.hpp
// @brief Fixed-size RGB pixel buffer and the drawing primitives icons use.
// @invariant Rectangles are inclusive on both corners; writes outside the buffer are clipped.
// @ownership Bitmap owns its pixel storage.
#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace keydeck::render
{

/// @brief Edge length in pixels of one key image.
inline constexpr int KEY_SIZE = 72;

/// @brief 24-bit color.
struct Rgb
{
    std::uint8_t r{0};
    std::uint8_t g{0};
    std::uint8_t b{0};

    bool operator==(const Rgb &) const = default;
};

inline constexpr Rgb kBlack{0, 0, 0};
inline constexpr Rgb kWhite{255, 255, 255};
inline constexpr Rgb kGrey{64, 64, 64};

/// @brief Point used by polygon fills.
struct Point
{
    int x{0};
    int y{0};
};

class Bitmap
{
  public:
    Bitmap(int width = KEY_SIZE, int height = KEY_SIZE, Rgb fill = kBlack);

    [[nodiscard]] int width() const
    {
        return width_;
    }

    [[nodiscard]] int height() const
    {
        return height_;
    }

    /// @brief Pixel at (x, y); precondition: inside the buffer.
    [[nodiscard]] Rgb at(int x, int y) const
    {
        return pixels_[static_cast<std::size_t>(y) * width_ + x];
    }

    /// @brief Set one pixel; ignored outside the buffer.
    void set(int x, int y, Rgb color);

    void fill(Rgb color);

    /// @brief Fill the rectangle spanning (x0, y0) to (x1, y1) inclusive.
    void fillRect(int x0, int y0, int x1, int y1, Rgb color);

    /// @brief Fill a triangle given by three vertices.
    void fillTriangle(Point a, Point b, Point c, Rgb color);

    /// @brief One-pixel line between two points (Bresenham).
    void drawLine(Point from, Point to, Rgb color);

    /// @brief Number of pixels equal to @p color.
    [[nodiscard]] int count(Rgb color) const;

    [[nodiscard]] const std::vector<Rgb> &pixels() const
    {
        return pixels_;
    }

    bool operator==(const Bitmap &) const = default;

  private:
    int width_;
    int height_;
    std::vector<Rgb> pixels_;
};

} // namespace keydeck::render
