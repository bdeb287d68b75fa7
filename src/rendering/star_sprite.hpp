#pragma once

/// @file star_sprite.hpp
/// @brief Magnitude → on-screen point size and brightness.

#include "core/types.hpp"
#include "rendering/projection.hpp"

namespace skydome::rendering
{
    /// @brief How a star is drawn.
    struct StarSprite
    {
        f32 size_px;        ///< Point diameter, [kMinSizePx, kMaxSizePx]
        f32 brightness;     ///< Alpha multiplier, [0.3, 1.0]
    };

    /// Default size multiplier for star points.
    inline constexpr f64 kDefaultMagnitudeScale = 10.0;

    inline constexpr f32 kMinSizePx = 1.0f;
    inline constexpr f32 kMaxSizePx = 15.0f;

    /// @brief Sprite for a star of the given magnitude.
    ///
    /// magNorm = clamp((6 - mag) / 7, 0, 1), so mag 6 → 0 and mag -1 → 1.
    /// size = scale × (0.3 + 1.2 × magNorm) × min(width, height) / 800,
    /// clamped to [1, 15] px. Brighter stars are never smaller.
    [[nodiscard]] StarSprite star_sprite(f64 magnitude, const Viewport& viewport,
                                         f64 magnitude_scale = kDefaultMagnitudeScale);

} // namespace skydome::rendering
