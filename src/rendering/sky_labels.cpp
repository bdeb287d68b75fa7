/// @file sky_labels.cpp
/// @brief Constellation label placement.

#include "rendering/sky_labels.hpp"

#include <algorithm>
#include <cmath>

namespace skydome::rendering
{

std::vector<PlacedLabel> SkyLabels::select(const std::vector<catalog::ConstellationCenter>& centers,
                                           const FrameTransform& frame)
{
    const Viewport& viewport = frame.viewport();
    if (!(viewport.width > 0.0) || !(viewport.height > 0.0))
    {
        return {};
    }

    const f64 half_w = viewport.width * 0.5;
    const f64 half_h = viewport.height * 0.5;

    std::vector<PlacedLabel> placed;
    for (const auto& center : centers)
    {
        const Vec4d clip = frame.clip(center.position);
        if (!(clip.w > 0.01))
        {
            continue;
        }

        const Vec2d pixel = frame.ndc_to_pixel(Vec2d(clip.x, clip.y) / clip.w);
        if (!std::isfinite(pixel.x) || !std::isfinite(pixel.y))
        {
            continue;
        }

        const f64 dx = (pixel.x - half_w) / half_w;
        const f64 dy = (pixel.y - half_h) / half_h;
        const f64 distance = std::sqrt(dx * dx + dy * dy);

        const f64 x = pixel.x + kOffsetX;
        const f64 y = pixel.y + kOffsetY;

        const bool in_margin = x >= -kMarginPx && x <= viewport.width + kMarginPx
                            && y >= -kMarginPx && y <= viewport.height + kMarginPx;
        if (!in_margin || !(distance < kMaxDistance))
        {
            continue;
        }

        placed.push_back(PlacedLabel{
            .center   = &center,
            .x        = x,
            .y        = y,
            .distance = distance,
            .opacity  = opacity(distance),
        });
    }

    std::stable_sort(placed.begin(), placed.end(),
        [](const PlacedLabel& a, const PlacedLabel& b) { return a.distance < b.distance; });

    if (placed.size() > kMaxLabels)
    {
        placed.resize(kMaxLabels);
    }
    return placed;
}

f32 SkyLabels::opacity(f64 distance)
{
    if (!std::isfinite(distance) || distance >= kFadeEnd)
    {
        return 0.0f;
    }
    if (distance <= kFadeStart)
    {
        return 1.0f;
    }
    return static_cast<f32>((kFadeEnd - distance) / (kFadeEnd - kFadeStart));
}

} // namespace skydome::rendering
