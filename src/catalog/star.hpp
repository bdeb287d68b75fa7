#pragma once

/// @file star.hpp
/// @brief Star records as read from a catalog file, and the derived runtime star.

#include "astro/coordinates.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>

namespace skydome::catalog
{
    /// @brief Linear RGB color in [0, 1].
    struct Color
    {
        f32 r;
        f32 g;
        f32 b;
    };

    /// @brief One parsed catalog row, before any derivation.
    struct StarRecord
    {
        u32 id;
        f64 ra;                                 ///< Right ascension (hours)
        f64 dec;                                ///< Declination (degrees)
        f64 mag;                                ///< Apparent visual magnitude
        f64 color_index;                        ///< B-V color index
        std::optional<std::string> proper_name; ///< e.g. "Sirius"
        std::optional<std::string> designation; ///< Bayer designation, e.g. "Alp CMa"
        std::optional<std::string> constellation; ///< IAU abbreviation, e.g. "CMa"
    };

    /// @brief Runtime star. Immutable once the catalog is built.
    ///
    /// Position and color are derived once at build time.
    /// Invariant: length(position) == 1.
    struct Star
    {
        u32 id;
        astro::EquatorialCoord equatorial;
        f64 magnitude;
        f64 color_index;
        Vec3d position;     ///< Unit vector in the catalog frame
        Color color;
        std::optional<std::string> proper_name;
        std::optional<std::string> designation;
        std::optional<std::string> constellation;

        /// @brief Proper name, else designation, else "HYG <id>".
        [[nodiscard]] std::string display_name() const
        {
            if (proper_name)
            {
                return *proper_name;
            }
            if (designation)
            {
                return constellation ? *designation + " " + *constellation : *designation;
            }
            return "HYG " + std::to_string(id);
        }
    };

} // namespace skydome::catalog
