/// @file star_sprite.cpp
/// @brief Star point sizing.

#include "rendering/star_sprite.hpp"

#include <algorithm>
#include <cmath>

namespace skydome::rendering
{

StarSprite star_sprite(f64 magnitude, const Viewport& viewport, f64 magnitude_scale)
{
    const f64 mag_norm = std::isfinite(magnitude) ? std::clamp((6.0 - magnitude) / 7.0, 0.0, 1.0) : 0.0;
    const f64 point_scale = std::max(0.0, std::min(viewport.width, viewport.height)) / 800.0;
    const f64 size = magnitude_scale * (0.3 + mag_norm * 1.2) * point_scale;

    return StarSprite{
        .size_px    = std::clamp(static_cast<f32>(size), kMinSizePx, kMaxSizePx),
        .brightness = static_cast<f32>(0.3 + mag_norm * 0.7),
    };
}

} // namespace skydome::rendering
