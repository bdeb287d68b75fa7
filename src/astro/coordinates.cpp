/// @file coordinates.cpp
/// @brief Implementation of astronomical coordinate transformations.

#include "astro/coordinates.hpp"

#include <glm/gtc/matrix_transform.hpp>

#include <algorithm>
#include <array>
#include <cmath>

namespace skydome::astro
{

namespace
{
    f64 clamp_latitude(f64 lat_deg)
    {
        return std::clamp(lat_deg, -90.0, 90.0);
    }
}

// -----------------------------------------------------------------
// Equatorial (RA/Dec) → Horizontal (Alt/Az)
//
// Hour angle: H = LST - RA
//
// sin(alt) = sin(dec) × sin(lat) + cos(dec) × cos(lat) × cos(H)
//
// Azimuth (north-based):
//   sin(az) × cos(alt) = -cos(dec) × sin(H)
//   cos(az) × cos(alt) =  sin(dec) × cos(lat) - cos(dec) × sin(lat) × cos(H)
//
// cos(alt) ≥ 0 scales both terms equally, so atan2 of the numerators gives
// the azimuth without dividing by it.
// -----------------------------------------------------------------

HorizontalCoord Coordinates::equatorial_to_horizontal(
    const EquatorialCoord& eq,
    const GeoLocation& location,
    f64 lst_hours)
{
    using namespace astro_constants;

    const f64 hour_angle = (lst_hours - eq.ra) * kHourToRad;
    const f64 dec = eq.dec * kDegToRad;
    const f64 lat = clamp_latitude(location.lat) * kDegToRad;

    const f64 sin_dec = std::sin(dec);
    const f64 cos_dec = std::cos(dec);
    const f64 sin_lat = std::sin(lat);
    const f64 cos_lat = std::cos(lat);
    const f64 cos_ha  = std::cos(hour_angle);
    const f64 sin_ha  = std::sin(hour_angle);

    const f64 sin_alt = sin_dec * sin_lat + cos_dec * cos_lat * cos_ha;
    const f64 alt = std::asin(std::clamp(sin_alt, -1.0, 1.0));

    const f64 az_y = -cos_dec * sin_ha;
    const f64 az_x = sin_dec * cos_lat - cos_dec * sin_lat * cos_ha;
    const f64 az = std::atan2(az_y, az_x);

    return HorizontalCoord{
        .alt = alt * kRadToDeg,
        .az  = normalize_degrees(az * kRadToDeg),
    };
}

HorizontalCoord Coordinates::equatorial_to_horizontal(
    const EquatorialCoord& eq,
    const GeoLocation& location,
    const DateTime& instant)
{
    return equatorial_to_horizontal(eq, location, TimeSystem::local_sidereal_time(instant, location.lon));
}

// -----------------------------------------------------------------
// Horizontal (Alt/Az) → Equatorial (RA/Dec)
//
//   sin(dec) = sin(alt) × sin(lat) + cos(alt) × cos(lat) × cos(az)
//   H = atan2(-cos(alt)×sin(az), sin(alt)×cos(lat) - cos(alt)×sin(lat)×cos(az))
//   RA = LST - H
// -----------------------------------------------------------------

EquatorialCoord Coordinates::horizontal_to_equatorial(
    const HorizontalCoord& hz,
    const GeoLocation& location,
    f64 lst_hours)
{
    using namespace astro_constants;

    const f64 alt = hz.alt * kDegToRad;
    const f64 az = hz.az * kDegToRad;
    const f64 lat = clamp_latitude(location.lat) * kDegToRad;

    const f64 sin_alt = std::sin(alt);
    const f64 cos_alt = std::cos(alt);
    const f64 sin_az  = std::sin(az);
    const f64 cos_az  = std::cos(az);
    const f64 sin_lat = std::sin(lat);
    const f64 cos_lat = std::cos(lat);

    const f64 sin_dec = sin_alt * sin_lat + cos_alt * cos_lat * cos_az;
    const f64 dec = std::asin(std::clamp(sin_dec, -1.0, 1.0));

    const f64 ha_y = -cos_alt * sin_az;
    const f64 ha_x = sin_alt * cos_lat - cos_alt * sin_lat * cos_az;
    const f64 hour_angle = std::atan2(ha_y, ha_x);

    return EquatorialCoord{
        .ra  = TimeSystem::normalize_hours(lst_hours - hour_angle * kRadToHour),
        .dec = dec * kRadToDeg,
    };
}

// -----------------------------------------------------------------
// Unit-sphere Cartesian conversions
// -----------------------------------------------------------------

Vec3d Coordinates::equatorial_to_cartesian(f64 ra_hours, f64 dec_deg)
{
    const f64 ra = ra_hours * astro_constants::kHourToRad;
    const f64 dec = dec_deg * astro_constants::kDegToRad;
    const f64 cos_dec = std::cos(dec);

    return Vec3d{
        cos_dec * std::cos(ra),
        std::sin(dec),
        cos_dec * std::sin(ra),
    };
}

Vec3d Coordinates::horizontal_to_cartesian(const HorizontalCoord& hz)
{
    const f64 alt = hz.alt * astro_constants::kDegToRad;
    const f64 az = hz.az * astro_constants::kDegToRad;
    const f64 cos_alt = std::cos(alt);

    return Vec3d{
        cos_alt * std::sin(az),
        std::sin(alt),
        cos_alt * std::cos(az),
    };
}

EquatorialCoord Coordinates::cartesian_to_equatorial(const Vec3d& v)
{
    const Vec3d n = glm::normalize(v);
    return EquatorialCoord{
        .ra  = TimeSystem::normalize_hours(std::atan2(n.z, n.x) * astro_constants::kRadToHour),
        .dec = std::asin(std::clamp(n.y, -1.0, 1.0)) * astro_constants::kRadToDeg,
    };
}

HorizontalCoord Coordinates::cartesian_to_horizontal(const Vec3d& v)
{
    const Vec3d n = glm::normalize(v);
    return HorizontalCoord{
        .alt = std::asin(std::clamp(n.y, -1.0, 1.0)) * astro_constants::kRadToDeg,
        .az  = normalize_degrees(std::atan2(n.x, n.z) * astro_constants::kRadToDeg),
    };
}

// -----------------------------------------------------------------
// Celestial rotation: catalog frame → observer frame
//
// M = Rx(90° − lat) · Ry(LST + 90°)
//
// Ry spins the sky about the polar axis until the local meridian lies in
// the y-z plane; Rx then tips the pole down from the zenith to
// altitude = latitude above the northern horizon. Rows of the result:
//   East  = (-sin L,          0,       cos L)
//   Up    = ( cos φ cos L,    sin φ,   cos φ sin L)
//   North = (-sin φ cos L,    cos φ,  -sin φ sin L)
// -----------------------------------------------------------------

Mat4d Coordinates::celestial_rotation_matrix(const GeoLocation& location, f64 lst_hours)
{
    using namespace astro_constants;

    const f64 tilt = (90.0 - clamp_latitude(location.lat)) * kDegToRad;
    const f64 spin = lst_hours * kHourToRad + kHalfPi;

    const Mat4d tilted = glm::rotate(Mat4d(1.0), tilt, Vec3d(1.0, 0.0, 0.0));
    return glm::rotate(tilted, spin, Vec3d(0.0, 1.0, 0.0));
}

Mat4d Coordinates::celestial_rotation_matrix(const GeoLocation& location, const DateTime& instant)
{
    return celestial_rotation_matrix(location, TimeSystem::local_sidereal_time(instant, location.lon));
}

std::string_view Coordinates::azimuth_to_cardinal(f64 az_deg)
{
    static constexpr std::array<std::string_view, 8> kDirections = {
        "N", "NE", "E", "SE", "S", "SW", "W", "NW",
    };

    if (!std::isfinite(az_deg))
    {
        return kDirections[0];
    }

    const auto index = static_cast<std::size_t>(std::lround(normalize_degrees(az_deg) / 45.0)) % kDirections.size();
    return kDirections[index];
}

f64 Coordinates::normalize_degrees(f64 angle)
{
    angle = std::fmod(angle, 360.0);
    if (angle < 0.0)
    {
        angle += 360.0;
    }
    if (angle >= 360.0)
    {
        angle = 0.0;
    }
    return angle;
}

} // namespace skydome::astro
