#pragma once

/// @file sky_grid.hpp
/// @brief Reference-line geometry: alt/az grid, horizon, equatorial grid, compass points.

#include "core/types.hpp"

#include <array>
#include <string_view>
#include <vector>

namespace skydome::rendering
{
    /// @brief A connected line strip of unit vectors.
    using Polyline = std::vector<Vec3d>;

    /// @brief A compass marker on the horizon.
    struct CardinalPoint
    {
        std::string_view label;     ///< "N", "NE", ...
        Vec3d position;             ///< Observer-frame unit vector at altitude 0
    };

    /// @brief Static grid geometry, built once.
    ///
    /// Observer-frame lines (altitude circles, azimuth arcs, horizon) are
    /// drawn with the view-projection only. Catalog-frame lines (declination
    /// circles, hour circles) go through the celestial rotation like stars.
    struct GridGeometry
    {
        std::vector<Polyline> altitude_circles;     ///< Observer frame
        std::vector<Polyline> azimuth_arcs;         ///< Observer frame
        Polyline horizon;                           ///< Observer frame
        std::vector<Polyline> declination_circles;  ///< Catalog frame
        std::vector<Polyline> hour_circles;         ///< Catalog frame
        std::array<CardinalPoint, 8> cardinals;     ///< Observer frame
    };

    /// @brief Generators for the individual grid lines.
    ///
    /// Every closed circle repeats its first point at the end, so a strip
    /// with `segments` segments has `segments + 1` points.
    class SkyGrid
    {
    public:
        SkyGrid() = delete;

        static constexpr std::array<f64, 6> kAltitudesDeg = {0.0, 15.0, 30.0, 45.0, 60.0, 75.0};
        static constexpr std::array<f64, 8> kAzimuthsDeg = {0.0, 45.0, 90.0, 135.0, 180.0, 225.0, 270.0, 315.0};
        static constexpr std::array<f64, 5> kDeclinationsDeg = {-60.0, -30.0, 0.0, 30.0, 60.0};
        static constexpr std::array<f64, 8> kHourCirclesHours = {0.0, 3.0, 6.0, 9.0, 12.0, 15.0, 18.0, 21.0};

        static constexpr u32 kCircleSegments = 72;
        static constexpr u32 kArcSegments = 36;
        static constexpr u32 kHorizonSegments = 144;

        /// @brief Circle of constant altitude, azimuth 0 → 360.
        [[nodiscard]] static Polyline altitude_circle(f64 alt_deg, u32 segments = kCircleSegments);

        /// @brief Arc of constant azimuth from the horizon to the zenith.
        [[nodiscard]] static Polyline azimuth_arc(f64 az_deg, u32 segments = kArcSegments);

        /// @brief Circle of constant declination, RA 0h → 24h.
        [[nodiscard]] static Polyline declination_circle(f64 dec_deg, u32 segments = kCircleSegments);

        /// @brief Hour circle of constant RA from Dec -90° to +90°.
        [[nodiscard]] static Polyline hour_circle(f64 ra_hours, u32 segments = kCircleSegments);

        /// @brief The eight compass points, N first, clockwise.
        [[nodiscard]] static std::array<CardinalPoint, 8> cardinal_points();

        /// @brief All grid lines at their default resolution.
        [[nodiscard]] static GridGeometry build();
    };

} // namespace skydome::rendering
