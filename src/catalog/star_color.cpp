/// @file star_color.cpp
/// @brief Piecewise B-V → RGB mapping.

#include "catalog/star_color.hpp"

#include <algorithm>
#include <cmath>

namespace skydome::catalog
{

namespace
{
    constexpr f64 kMinColorIndex = -0.4;
    constexpr f64 kMaxColorIndex = 2.0;
}

// -----------------------------------------------------------------
// Temperature estimate
//
// B-V ≥ 0: T = 10000 / (B-V + 1)
// B-V < 0: T = 10000 − 40000 × (B-V), so -0.4 reaches 26000 K
// -----------------------------------------------------------------

f64 color_index_to_temperature(f64 color_index)
{
    const f64 bv = std::isfinite(color_index)
                 ? std::clamp(color_index, kMinColorIndex, kMaxColorIndex)
                 : 0.0;

    if (bv < 0.0)
    {
        return 10000.0 - bv * 40000.0;
    }
    return 10000.0 / (bv + 1.0);
}

Color color_index_to_rgb(f64 color_index)
{
    const f64 t = color_index_to_temperature(color_index);

    if (t >= 10000.0)
    {
        // Hot blue-white: red and green fall off as temperature rises
        const auto k = static_cast<f32>(std::min(1.0, (t - 10000.0) / 20000.0));
        const f32 rg = 0.8f - 0.2f * k;
        return Color{.r = rg, .g = rg, .b = 1.0f};
    }
    if (t >= 7500.0)
    {
        return Color{.r = 1.0f, .g = 1.0f, .b = 1.0f};
    }
    if (t >= 6000.0)
    {
        return Color{.r = 1.0f, .g = 0.95f, .b = 0.85f};
    }
    if (t >= 5000.0)
    {
        return Color{.r = 1.0f, .g = 0.9f, .b = 0.7f};
    }
    if (t >= 3500.0)
    {
        return Color{.r = 1.0f, .g = 0.7f, .b = 0.4f};
    }
    return Color{.r = 1.0f, .g = 0.5f, .b = 0.3f};
}

} // namespace skydome::catalog
