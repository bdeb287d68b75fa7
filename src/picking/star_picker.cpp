/// @file star_picker.cpp
/// @brief Inverse-ray and forward-projection star picking.

#include "picking/star_picker.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace skydome::picking
{

// -----------------------------------------------------------------
// Direction search
//
// Linear scan over the bright prefix of the catalog. Each star carries its
// own chord threshold. The comparisons are strict, so on an exact tie the
// earlier (brighter) star is kept.
// -----------------------------------------------------------------

namespace
{
    template <typename ThresholdFn>
    const catalog::Star* nearest_in_prefix(const catalog::StarCatalog& catalog,
                                           const Vec3d& direction,
                                           f64 max_magnitude,
                                           const rendering::FrameTransform* horizon_frame,
                                           ThresholdFn&& threshold_for)
    {
        const std::size_t count = catalog.count_brighter_than(max_magnitude);
        const catalog::Star* best = nullptr;
        f64 best_dist_sq = std::numeric_limits<f64>::infinity();

        for (std::size_t i = 0; i < count; ++i)
        {
            const catalog::Star& star = catalog[i];
            const Vec3d d = star.position - direction;
            const f64 dist_sq = glm::dot(d, d);

            if (!(dist_sq < best_dist_sq))
            {
                continue;
            }

            const f64 threshold = threshold_for(star);
            if (!(dist_sq < threshold * threshold))
            {
                continue;
            }

            if (horizon_frame && horizon_frame->to_observer(star.position).y < 0.0)
            {
                continue;
            }
            best_dist_sq = dist_sq;
            best = &star;
        }

        return best;
    }

    /// Chord between the rays through a pixel and its neighbours, averaged
    /// over x and y. Zero when no neighbour lies in the viewport.
    f64 chord_per_pixel(const rendering::FrameTransform& frame, f64 px, f64 py, const Vec3d& ray)
    {
        const rendering::Viewport& viewport = frame.viewport();
        const f64 nx = px + 1.0 <= viewport.width ? px + 1.0 : px - 1.0;
        const f64 ny = py + 1.0 <= viewport.height ? py + 1.0 : py - 1.0;

        const auto ray_x = frame.cursor_ray(nx, py);
        const auto ray_y = frame.cursor_ray(px, ny);
        if (!ray_x || !ray_y)
        {
            return 0.0;
        }
        return 0.5 * (glm::length(*ray_x - ray) + glm::length(*ray_y - ray));
    }
}

const catalog::Star* StarPicker::nearest_to_direction(
    const catalog::StarCatalog& catalog,
    const Vec3d& direction,
    f64 threshold,
    f64 max_magnitude)
{
    if (catalog.empty() || !(threshold > 0.0))
    {
        return nullptr;
    }

    return nearest_in_prefix(catalog, direction, max_magnitude, nullptr,
                             [threshold](const catalog::Star&) { return threshold; });
}

// -----------------------------------------------------------------
// Inverse-ray
//
// A star's hit radius in pixels becomes an angle through the local
// pixel scale at the pointer, so the ray test covers the same disc the
// projection test does. ray_threshold caps it.
// -----------------------------------------------------------------

const catalog::Star* StarPicker::pick_by_ray(
    const catalog::StarCatalog& catalog,
    const rendering::FrameTransform& frame,
    f64 px, f64 py,
    const PickOptions& options)
{
    if (catalog.empty() || !(options.ray_threshold > 0.0))
    {
        return nullptr;
    }

    const auto ray = frame.cursor_ray(px, py);
    if (!ray)
    {
        return nullptr;
    }

    const f64 scale = chord_per_pixel(frame, px, py, *ray);
    const rendering::Viewport& viewport = frame.viewport();

    return nearest_in_prefix(catalog, *ray, options.max_magnitude, &frame,
                             [&](const catalog::Star& star) {
                                 if (!(scale > 0.0))
                                 {
                                     return options.ray_threshold;
                                 }
                                 const f64 angle = hit_radius_px(star.magnitude, viewport, options) * scale;
                                 return std::min(options.ray_threshold, 2.0 * std::sin(0.5 * angle));
                             });
}

// -----------------------------------------------------------------
// Forward projection
// -----------------------------------------------------------------

const catalog::Star* StarPicker::pick_by_projection(
    const catalog::StarCatalog& catalog,
    const rendering::FrameTransform& frame,
    f64 px, f64 py,
    const PickOptions& options)
{
    if (catalog.empty() || !frame.viewport().contains(px, py))
    {
        return nullptr;
    }

    const std::size_t count = catalog.count_brighter_than(options.max_magnitude);
    const catalog::Star* best = nullptr;
    f64 best_dist = std::numeric_limits<f64>::infinity();

    for (std::size_t i = 0; i < count; ++i)
    {
        const catalog::Star& star = catalog[i];

        // project() rejects stars below the horizon, behind the camera and off-screen
        const auto screen = frame.project(star.position);
        if (!screen)
        {
            continue;
        }

        const f64 dist = std::hypot(screen->x - px, screen->y - py);
        if (dist < best_dist && dist < hit_radius_px(star.magnitude, frame.viewport(), options))
        {
            best_dist = dist;
            best = &star;
        }
    }

    return best;
}

f64 StarPicker::hit_radius_px(f64 magnitude, const rendering::Viewport& viewport, const PickOptions& options)
{
    const auto sprite = rendering::star_sprite(magnitude, viewport, options.magnitude_scale);
    return std::max(options.min_hit_radius_px, 0.5 * sprite.size_px + options.hit_slop_px);
}

} // namespace skydome::picking
