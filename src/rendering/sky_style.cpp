/// @file sky_style.cpp
/// @brief Palette selection and per-star appearance.

#include "rendering/sky_style.hpp"

#include "rendering/star_sprite.hpp"

#include <algorithm>

namespace skydome::rendering
{

const SkyPalette& sky_palette(bool light_mode)
{
    return light_mode ? kLightPalette : kDarkPalette;
}

// -----------------------------------------------------------------
// Star appearance
//
// dark:  rgb = color × (0.7 + 0.3·b + glow), glow = 0.3·b for discs, 0 for pixels
// light: rgb = color × 0.4, size × 1.1
// -----------------------------------------------------------------

StarAppearance star_appearance(const catalog::Color& color,
                               f64 magnitude,
                               const Viewport& viewport,
                               f64 magnitude_scale,
                               const core::OverlayConfig& display)
{
    const StarSprite sprite = star_sprite(magnitude, viewport, magnitude_scale);
    const f32 b = sprite.brightness;

    f32 factor = 0.0f;
    f32 size = sprite.size_px;
    if (display.light_mode)
    {
        factor = kLightModeColorFactor;
        size = std::min(size * kLightModeSizeFactor, kMaxSizePx);
    }
    else
    {
        const f32 glow = display.pixel_stars ? 0.0f : 0.3f * b;
        factor = 0.7f + 0.3f * b + glow;
    }

    StarAppearance appearance{
        .color = Rgba{
            std::min(color.r * factor, 1.0f),
            std::min(color.g * factor, 1.0f),
            std::min(color.b * factor, 1.0f),
            b,
        },
        .size_px = size,
        .shape = StarShape::Disc,
        .additive = !display.light_mode,
    };

    if (display.pixel_stars)
    {
        appearance.shape = StarShape::Square;
        appearance.size_px = std::max(kMinSizePx, size * kPixelSquareFraction);
    }

    return appearance;
}

} // namespace skydome::rendering
