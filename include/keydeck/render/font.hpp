// include/keydeck/render/font.hpp
// @brief Bitmap font faces, the face registry and centred text drawing.
// @invariant Glyph rows are one byte each with bit 0 as the leftmost pixel.
// @ownership The registry owns registered faces for the process lifetime.
#pragma once

#include "keydeck/render/bitmap.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace keydeck::render
{

/// @brief Fixed-cell bitmap font.
struct FontFace
{
    /// Cell width in pixels (at most 8).
    int cellWidth{8};
    /// Cell height in pixels; each glyph has this many rows.
    int cellHeight{8};
    /// Glyph rows for a code point, or nullptr when the face lacks it.
    std::function<const std::uint8_t *(char32_t)> glyph;
};

/// @brief The embedded 8x8 face covering printable ASCII plus a few symbols.
[[nodiscard]] const FontFace &builtinFace();

/// @brief Register @p face under @p name, replacing any previous face of that name.
void registerFace(const std::string &name, FontFace face);

/// @brief Face registered as @p name; empty or unknown names yield the default face.
[[nodiscard]] const FontFace &findFace(std::string_view name);

/// @brief Decode UTF-8 into code points; invalid bytes become U+FFFD.
/// @details "℃" (U+2103) is expanded to a degree sign followed by 'C'.
[[nodiscard]] std::u32string decodeText(std::string_view utf8);

/// @brief Integer pixel scale used for a nominal text size.
[[nodiscard]] int scaleForSize(int size);

/// @brief Pixel width of @p text in @p face at the scale for @p size.
[[nodiscard]] int measureText(const FontFace &face, std::string_view text, int size);

/// @brief Text placement and colors for drawText.
struct TextStyle
{
    Rgb fg{kWhite};
    int size{16};
    /// Outline thickness in pixels; 0 draws no outline.
    int stroke{0};
    Rgb strokeColor{kBlack};
};

/// @brief Draw @p text centred on @p anchor ("middle-middle" anchoring).
void drawText(Bitmap &bitmap,
              const FontFace &face,
              std::string_view text,
              Point anchor,
              const TextStyle &style);

} // namespace keydeck::render
