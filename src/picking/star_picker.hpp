#pragma once

/// @file star_picker.hpp
/// @brief Finding the star under the pointer.

#include "catalog/star_catalog.hpp"
#include "core/types.hpp"
#include "rendering/projection.hpp"
#include "rendering/star_sprite.hpp"

#include <limits>

namespace skydome::picking
{
    /// @brief Tunables for both picking strategies.
    struct PickOptions
    {
        /// Upper bound on the chord distance for inverse-ray hits
        /// (0.02 ≈ 1.15°). Below it, each star's hit radius converted to
        /// an angle at the pointer decides.
        f64 ray_threshold = 0.02;

        /// Stars fainter than this are not drawn, so not pickable.
        f64 max_magnitude = std::numeric_limits<f64>::infinity();

        /// Must match the renderer so hit radii follow drawn point sizes.
        f64 magnitude_scale = rendering::kDefaultMagnitudeScale;

        /// Extra pixels around a star's drawn radius.
        f64 hit_slop_px = 2.0;

        /// Floor so faint one-pixel stars stay clickable.
        f64 min_hit_radius_px = 4.0;
    };

    /// @brief Static star picking functions.
    ///
    /// Two strategies, equivalent for the same frame:
    /// - pick_by_ray: un-project the pointer into a catalog-frame direction
    ///   and take the nearest star within its chord threshold, the star's
    ///   hit radius seen through the pixel scale at the pointer. This is the
    ///   production path: one dot product per star, no projection.
    /// - pick_by_projection: project every candidate and take the nearest in
    ///   screen space within its magnitude-dependent hit radius.
    ///
    /// Both skip stars below the horizon. Ties go to the first star in
    /// catalog order, which is the brightest. An empty catalog or a pointer
    /// outside the viewport yields nullptr.
    class StarPicker
    {
    public:
        StarPicker() = delete;

        /// @brief Nearest star to a catalog-frame direction, within threshold.
        [[nodiscard]] static const catalog::Star* nearest_to_direction(
            const catalog::StarCatalog& catalog,
            const Vec3d& direction,
            f64 threshold,
            f64 max_magnitude = std::numeric_limits<f64>::infinity());

        /// @brief Inverse-ray pick at a pixel.
        [[nodiscard]] static const catalog::Star* pick_by_ray(
            const catalog::StarCatalog& catalog,
            const rendering::FrameTransform& frame,
            f64 px, f64 py,
            const PickOptions& options = {});

        /// @brief Forward-projection pick at a pixel.
        [[nodiscard]] static const catalog::Star* pick_by_projection(
            const catalog::StarCatalog& catalog,
            const rendering::FrameTransform& frame,
            f64 px, f64 py,
            const PickOptions& options = {});

        /// @brief Screen-space hit radius for a star; larger for brighter stars.
        [[nodiscard]] static f64 hit_radius_px(f64 magnitude,
                                               const rendering::Viewport& viewport,
                                               const PickOptions& options = {});
    };

} // namespace skydome::picking
