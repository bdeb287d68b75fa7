/// @file sky_grid.cpp
/// @brief Grid line generation.

#include "rendering/sky_grid.hpp"

#include "astro/coordinates.hpp"

#include <algorithm>

namespace skydome::rendering
{

namespace
{
    /// Segments clamped to at least one so every strip has two points.
    u32 at_least_one(u32 segments)
    {
        return std::max<u32>(segments, 1);
    }
}

Polyline SkyGrid::altitude_circle(f64 alt_deg, u32 segments)
{
    segments = at_least_one(segments);

    Polyline line;
    line.reserve(segments + 1);
    for (u32 i = 0; i <= segments; ++i)
    {
        const f64 az = 360.0 * static_cast<f64>(i) / static_cast<f64>(segments);
        line.push_back(astro::Coordinates::horizontal_to_cartesian({.alt = alt_deg, .az = az}));
    }
    return line;
}

Polyline SkyGrid::azimuth_arc(f64 az_deg, u32 segments)
{
    segments = at_least_one(segments);

    Polyline line;
    line.reserve(segments + 1);
    for (u32 i = 0; i <= segments; ++i)
    {
        const f64 alt = 90.0 * static_cast<f64>(i) / static_cast<f64>(segments);
        line.push_back(astro::Coordinates::horizontal_to_cartesian({.alt = alt, .az = az_deg}));
    }
    return line;
}

Polyline SkyGrid::declination_circle(f64 dec_deg, u32 segments)
{
    segments = at_least_one(segments);

    Polyline line;
    line.reserve(segments + 1);
    for (u32 i = 0; i <= segments; ++i)
    {
        const f64 ra = 24.0 * static_cast<f64>(i) / static_cast<f64>(segments);
        line.push_back(astro::Coordinates::equatorial_to_cartesian(ra, dec_deg));
    }
    return line;
}

Polyline SkyGrid::hour_circle(f64 ra_hours, u32 segments)
{
    segments = at_least_one(segments);

    Polyline line;
    line.reserve(segments + 1);
    for (u32 i = 0; i <= segments; ++i)
    {
        const f64 dec = -90.0 + 180.0 * static_cast<f64>(i) / static_cast<f64>(segments);
        line.push_back(astro::Coordinates::equatorial_to_cartesian(ra_hours, dec));
    }
    return line;
}

std::array<CardinalPoint, 8> SkyGrid::cardinal_points()
{
    std::array<CardinalPoint, 8> points{};
    for (std::size_t i = 0; i < points.size(); ++i)
    {
        const f64 az = kAzimuthsDeg[i];
        points[i] = CardinalPoint{
            .label    = astro::Coordinates::azimuth_to_cardinal(az),
            .position = astro::Coordinates::horizontal_to_cartesian({.alt = 0.0, .az = az}),
        };
    }
    return points;
}

GridGeometry SkyGrid::build()
{
    GridGeometry grid;

    for (const f64 alt : kAltitudesDeg)
    {
        grid.altitude_circles.push_back(altitude_circle(alt));
    }
    for (const f64 az : kAzimuthsDeg)
    {
        grid.azimuth_arcs.push_back(azimuth_arc(az));
    }
    grid.horizon = altitude_circle(0.0, kHorizonSegments);

    for (const f64 dec : kDeclinationsDeg)
    {
        grid.declination_circles.push_back(declination_circle(dec));
    }
    for (const f64 ra : kHourCirclesHours)
    {
        grid.hour_circles.push_back(hour_circle(ra));
    }

    grid.cardinals = cardinal_points();
    return grid;
}

} // namespace skydome::rendering
