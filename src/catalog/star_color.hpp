#pragma once

/// @file star_color.hpp
/// @brief B-V color index to approximate black-body RGB.

#include "catalog/star.hpp"
#include "core/types.hpp"

namespace skydome::catalog
{
    /// @brief Map a B-V color index to a display color.
    ///
    /// The index is clamped to [-0.4, 2.0], converted to an approximate
    /// effective temperature, and bucketed into six bands:
    /// blue-white (≥10000 K), white, yellow-white, yellow, orange, red (<3500 K).
    [[nodiscard]] Color color_index_to_rgb(f64 color_index);

    /// @brief Approximate effective temperature (K) for a B-V index.
    [[nodiscard]] f64 color_index_to_temperature(f64 color_index);

} // namespace skydome::catalog
