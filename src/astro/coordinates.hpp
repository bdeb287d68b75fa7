#pragma once

/// @file coordinates.hpp
/// @brief Astronomical coordinate transforms: Equatorial, Horizontal, unit-sphere Cartesian,
///        and the celestial rotation matrix.

#include "astro/time_system.hpp"
#include "core/types.hpp"

#include <string_view>

namespace skydome::astro
{
    /// @brief Equatorial coordinate (J2000 epoch).
    struct EquatorialCoord
    {
        f64 ra;     ///< Right ascension (hours, 0..24)
        f64 dec;    ///< Declination (degrees, -90..+90)
    };

    /// @brief Horizontal (topocentric) coordinate.
    struct HorizontalCoord
    {
        f64 alt;    ///< Altitude (degrees, -90..+90, negative = below horizon)
        f64 az;     ///< Azimuth (degrees, 0..360, 0=North, 90=East)
    };

    /// @brief Observer geographic location.
    struct GeoLocation
    {
        f64 lat;    ///< Geographic latitude (degrees, north positive)
        f64 lon;    ///< Geographic longitude (degrees, east positive)
    };

    /// @brief Static utility class for astronomical coordinate transformations.
    ///
    /// Two Cartesian frames are used, both on the unit sphere:
    /// - **catalog frame**: x toward RA 0h, y toward the north celestial pole,
    ///   z toward RA 6h.
    /// - **observer frame**: x = East, y = Up (zenith), z = North.
    ///
    /// Out-of-range latitudes are clamped to [-90, 90]. NaN inputs propagate
    /// to NaN outputs; nothing here throws.
    class Coordinates
    {
    public:
        Coordinates() = delete;

        /// @brief Equatorial (RA/Dec) → Horizontal (Alt/Az).
        /// @param eq Equatorial coordinates of the object.
        /// @param location Observer geographic location.
        /// @param lst_hours Local sidereal time (hours).
        /// @return Horizontal coordinates. At the zenith/nadir the azimuth is
        ///         ill-defined; it is still returned within [0, 360).
        [[nodiscard]] static HorizontalCoord equatorial_to_horizontal(
            const EquatorialCoord& eq,
            const GeoLocation& location,
            f64 lst_hours
        );

        /// @brief Equatorial → Horizontal for a civil instant.
        [[nodiscard]] static HorizontalCoord equatorial_to_horizontal(
            const EquatorialCoord& eq,
            const GeoLocation& location,
            const DateTime& instant
        );

        /// @brief Horizontal (Alt/Az) → Equatorial (RA/Dec).
        [[nodiscard]] static EquatorialCoord horizontal_to_equatorial(
            const HorizontalCoord& hz,
            const GeoLocation& location,
            f64 lst_hours
        );

        /// @brief Equatorial → catalog-frame unit vector.
        /// x = cos δ cos α, y = sin δ, z = cos δ sin α.
        [[nodiscard]] static Vec3d equatorial_to_cartesian(f64 ra_hours, f64 dec_deg);

        /// @brief Horizontal → observer-frame unit vector (x=East, y=Up, z=North).
        [[nodiscard]] static Vec3d horizontal_to_cartesian(const HorizontalCoord& hz);

        /// @brief Catalog-frame vector → Equatorial. The vector need not be normalized.
        [[nodiscard]] static EquatorialCoord cartesian_to_equatorial(const Vec3d& v);

        /// @brief Observer-frame vector → Horizontal. The vector need not be normalized.
        [[nodiscard]] static HorizontalCoord cartesian_to_horizontal(const Vec3d& v);

        /// @brief Rotation from the catalog frame to the observer frame.
        ///
        /// Rotates about the polar axis by the local sidereal time, then about
        /// the east-west axis by (90° − latitude). The result is orthogonal,
        /// so its transpose is its inverse.
        ///
        /// @param location Observer location.
        /// @param lst_hours Local sidereal time (hours).
        [[nodiscard]] static Mat4d celestial_rotation_matrix(const GeoLocation& location, f64 lst_hours);

        /// @brief Rotation matrix for a civil instant (LST derived from location.lon).
        [[nodiscard]] static Mat4d celestial_rotation_matrix(const GeoLocation& location, const DateTime& instant);

        /// @brief 8-point compass label for an azimuth in degrees ("N", "NE", ... "NW").
        [[nodiscard]] static std::string_view azimuth_to_cardinal(f64 az_deg);

        /// @brief Normalize an angle in degrees to [0, 360).
        [[nodiscard]] static f64 normalize_degrees(f64 angle);
    };

} // namespace skydome::astro
