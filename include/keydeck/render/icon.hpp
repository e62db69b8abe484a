// include/keydeck/render/icon.hpp
// @brief Immutable key icon descriptors and their renderers.
// @invariant Rendering is a pure function of the descriptor fields.
// @ownership Icon shares its descriptor and cached bitmap between copies.
#pragma once

#include "keydeck/render/bitmap.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <variant>

namespace keydeck::render
{

/// @brief Edge of the key a marker is attached to.
enum class Edge
{
    Top,
    Bottom,
    Left,
    Right,
};

/// @brief Marker shape: a band along the edge or a wedge pointing inward.
enum class MarkerKind
{
    Square,
    Triangle,
};

/// @brief Solid background.
struct ColorIcon
{
    Rgb bg{kBlack};
};

/// @brief Text centred on (x, y) over a solid background.
struct TextIcon
{
    Rgb bg{kBlack};
    Rgb fg{kWhite};
    std::string text{};
    /// Registered face name; empty selects the default face.
    std::string font{};
    int size{16};
    int x{KEY_SIZE / 2};
    int y{KEY_SIZE / 2};
};

/// @brief TextIcon with an edge marker drawn over the text layer.
struct MarkerIcon
{
    Rgb bg{kBlack};
    Rgb fg{kWhite};
    std::string text{};
    std::string font{};
    int size{16};
    int x{KEY_SIZE / 2};
    int y{KEY_SIZE / 2};
    Rgb markerColor{kWhite};
    Edge position{Edge::Bottom};
    MarkerKind kind{MarkerKind::Square};
    int width{4};
};

/// @brief One key's slice of a progress gauge spanning @c nKeys keys.
struct GaugeIcon
{
    Rgb bg{kBlack};
    Rgb gauge{kWhite};
    Rgb fg{kWhite};
    std::string text{};
    std::string font{};
    int size{16};
    /// Thickness of the side bars.
    int width{12};
    int nKeys{1};
    /// Position of this key in the strip; 0 is where filling starts.
    int keyOffset{0};
    bool horizontal{false};
    /// Fill ratio; clamped to [0, 1].
    double value{0.0};

    /// @brief Gap in pixels between adjacent keys of the physical strip.
    static constexpr int kMargin = 13;

    /// @brief Length of the fill that falls on this key, 0 when not reached.
    [[nodiscard]] int fillLength() const;
};

[[nodiscard]] Bitmap renderIcon(const ColorIcon &icon);
[[nodiscard]] Bitmap renderIcon(const TextIcon &icon);
[[nodiscard]] Bitmap renderIcon(const MarkerIcon &icon);
[[nodiscard]] Bitmap renderIcon(const GaugeIcon &icon);

/// @brief Value handle over one icon variant.
/// @details Color, text and marker icons render once and reuse the bitmap;
///          gauges render on every call.
class Icon
{
  public:
    using Variant = std::variant<ColorIcon, TextIcon, MarkerIcon, GaugeIcon>;

    /// @brief Black key.
    Icon();

    Icon(ColorIcon icon);
    Icon(TextIcon icon);
    Icon(MarkerIcon icon);
    Icon(GaugeIcon icon);

    [[nodiscard]] const Variant &variant() const
    {
        return state_->value;
    }

    /// @brief Rendered image, shared with other copies of this icon when cached.
    [[nodiscard]] std::shared_ptr<const Bitmap> render() const;

  private:
    struct State
    {
        explicit State(Variant v) : value(std::move(v)) {}

        Variant value;
        mutable std::once_flag once;
        mutable std::shared_ptr<const Bitmap> cached;
    };

    std::shared_ptr<const State> state_;
};

} // namespace keydeck::render
