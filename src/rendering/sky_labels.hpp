#pragma once

/// @file sky_labels.hpp
/// @brief Screen placement of constellation labels.

#include "catalog/constellations.hpp"
#include "core/types.hpp"
#include "rendering/projection.hpp"

#include <string_view>
#include <vector>

namespace skydome::rendering
{
    /// @brief A constellation label placed on screen for one frame.
    struct PlacedLabel
    {
        const catalog::ConstellationCenter* center;  ///< Points into the ConstellationSet
        f64 x;          ///< Anchor, pixels from the left edge
        f64 y;          ///< Anchor, pixels from the top edge
        f64 distance;   ///< Center distance from screen center, normalized by half-extent
        f32 opacity;    ///< [0, 1], fades out toward the edges
    };

    /// @brief Label selection and fading.
    class SkyLabels
    {
    public:
        SkyLabels() = delete;

        static constexpr std::size_t kMaxLabels = 10;

        /// Anchor offset from the projected center, pixels.
        static constexpr f64 kOffsetX = 15.0;
        static constexpr f64 kOffsetY = 20.0;

        /// Anchors may sit this far outside the viewport.
        static constexpr f64 kMarginPx = 50.0;

        /// Normalized distance beyond which a label is never placed.
        static constexpr f64 kMaxDistance = 1.8;

        /// Labels are fully opaque inside kFadeStart and invisible past kFadeEnd.
        static constexpr f64 kFadeStart = 0.35;
        static constexpr f64 kFadeEnd = 0.9;

        /// @brief Project every center and keep the closest to the screen center.
        ///
        /// Centers behind the camera (clip w ≤ 0.01) are skipped. The result
        /// is sorted by distance, nearest first, and holds at most
        /// kMaxLabels entries. Zero-opacity entries are kept so the caller
        /// can decide whether to fade them.
        [[nodiscard]] static std::vector<PlacedLabel> select(const std::vector<catalog::ConstellationCenter>& centers,
                                                             const FrameTransform& frame);

        /// @brief Opacity for a normalized screen distance.
        [[nodiscard]] static f32 opacity(f64 distance);
    };

} // namespace skydome::rendering
