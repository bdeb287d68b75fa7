#pragma once

/// @file time_system.hpp
/// @brief Astronomical time utilities: Julian Date, sidereal time.

#include "core/types.hpp"

namespace skydome::astro
{
    /// @brief Civil date/time representation (UTC).
    struct DateTime
    {
        i32 year;
        i32 month;
        i32 day;
        i32 hour;
        i32 minute;
        f64 second;
    };

    /// @brief Static utility class for astronomical time computations.
    ///
    /// Provides Julian Date conversion (Meeus algorithm, Astronomical Algorithms Ch. 7),
    /// Greenwich/Local Mean Sidereal Time (IAU 1982), and system clock access.
    /// Sidereal times are returned in hours, normalized to [0, 24).
    /// Every function except now_as_jd() is pure.
    class TimeSystem
    {
    public:
        TimeSystem() = delete;

        /// @brief Convert civil date/time (UTC) to Julian Date.
        /// @param dt Civil date/time. Month in [1,12], day in [1,31].
        /// @return Julian Date. Invalid dates are not rejected; the result is
        ///         whatever the algorithm yields for them.
        [[nodiscard]] static f64 to_julian_date(const DateTime& dt);

        /// @brief Convert Julian Date back to civil date/time (UTC).
        /// @param jd Julian Date (must be positive).
        [[nodiscard]] static DateTime from_julian_date(f64 jd);

        /// @brief Julian centuries elapsed since J2000.0.
        /// @return T = (JD - 2451545.0) / 36525.0
        [[nodiscard]] static f64 julian_centuries(f64 jd);

        /// @brief Greenwich Mean Sidereal Time in hours, [0, 24).
        /// Uses the IAU 1982 formula (accurate to ~0.1 second of time).
        [[nodiscard]] static f64 gmst_hours(f64 jd);

        /// @brief Local Mean Sidereal Time in hours, [0, 24).
        /// @param jd Julian Date (UTC).
        /// @param longitude_deg Observer longitude in degrees (east positive).
        [[nodiscard]] static f64 local_sidereal_time(f64 jd, f64 longitude_deg);

        /// @brief Local Mean Sidereal Time in hours for a civil instant.
        [[nodiscard]] static f64 local_sidereal_time(const DateTime& dt, f64 longitude_deg);

        /// @brief Shift a Julian Date by a number of SI seconds.
        [[nodiscard]] static f64 add_seconds(f64 jd, f64 seconds);

        /// @brief Get current system time as a Julian Date.
        [[nodiscard]] static f64 now_as_jd();

        /// @brief Normalize an hour value to the range [0, 24).
        [[nodiscard]] static f64 normalize_hours(f64 hours);
    };

} // namespace skydome::astro
