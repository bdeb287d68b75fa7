#pragma once

/// @file sky_style.hpp
/// @brief Display modes: light/dark overlay palettes and star appearance.
///
/// Kept free of SDL so the color and shape choices can be tested without a
/// window. SkyRenderer only translates the results into draw calls.

#include "catalog/star.hpp"
#include "core/config.hpp"
#include "core/types.hpp"
#include "rendering/projection.hpp"

namespace skydome::rendering
{
    /// @brief RGBA color, components in [0, 1].
    struct Rgba
    {
        f32 r;
        f32 g;
        f32 b;
        f32 a;
    };

    /// @brief Overlay colors for one display mode.
    struct SkyPalette
    {
        Rgba background;
        Rgba alt_az_grid;
        Rgba alt_az_grid_dim;
        Rgba horizon;
        Rgba equatorial;
        Rgba equatorial_dim;
        Rgba constellation;
        Rgba label_marker;
        Rgba cardinal;
        Rgba hover;
    };

    /// Night sky: deep blue background, pale overlays.
    inline constexpr SkyPalette kDarkPalette{
        .background      = {0.02f, 0.02f, 0.08f, 1.0f},
        .alt_az_grid     = {0.3f, 0.5f, 0.8f, 0.4f},
        .alt_az_grid_dim = {0.3f, 0.5f, 0.8f, 0.3f},
        .horizon         = {0.8f, 0.4f, 0.2f, 0.7f},
        .equatorial      = {0.6f, 0.3f, 0.6f, 0.3f},
        .equatorial_dim  = {0.6f, 0.3f, 0.6f, 0.25f},
        .constellation   = {0.4f, 0.6f, 0.8f, 0.5f},
        .label_marker    = {0.6f, 0.75f, 0.95f, 0.9f},
        .cardinal        = {0.8f, 0.4f, 0.2f, 0.9f},
        .hover           = {1.0f, 0.85f, 0.4f, 0.9f},
    };

    /// Printed-chart look: off-white background, darker and denser overlays.
    inline constexpr SkyPalette kLightPalette{
        .background      = {0.95f, 0.95f, 0.92f, 1.0f},
        .alt_az_grid     = {0.2f, 0.4f, 0.7f, 0.5f},
        .alt_az_grid_dim = {0.2f, 0.4f, 0.7f, 0.35f},
        .horizon         = {0.6f, 0.3f, 0.1f, 0.8f},
        .equatorial      = {0.5f, 0.2f, 0.5f, 0.4f},
        .equatorial_dim  = {0.5f, 0.2f, 0.5f, 0.3f},
        .constellation   = {0.3f, 0.3f, 0.5f, 0.6f},
        .label_marker    = {0.25f, 0.3f, 0.5f, 0.9f},
        .cardinal        = {0.6f, 0.3f, 0.1f, 0.9f},
        .hover           = {0.75f, 0.4f, 0.0f, 0.9f},
    };

    [[nodiscard]] const SkyPalette& sky_palette(bool light_mode);

    enum class StarShape
    {
        Disc,       ///< Round point, diameter = size_px
        Square,     ///< Hard-edged square, side = size_px
    };

    /// @brief Final color, shape and footprint of one star.
    struct StarAppearance
    {
        Rgba color;
        f32 size_px;
        StarShape shape;
        bool additive;      ///< Blend by adding light (dark sky) or by alpha (light sky)
    };

    /// Light mode enlarges stars so they hold up against the bright background.
    inline constexpr f32 kLightModeSizeFactor = 1.1f;

    /// Light mode darkens star colors so they read as ink.
    inline constexpr f32 kLightModeColorFactor = 0.4f;

    /// Pixel squares cover the inner 80% of the point footprint.
    inline constexpr f32 kPixelSquareFraction = 0.8f;

    /// @brief How a star of the given magnitude and color is drawn.
    ///
    /// Starts from star_sprite(). Dark mode brightens the color with a glow
    /// term (dropped for pixel stars) and blends additively. Light mode
    /// darkens the color, grows the point by 10% and alpha-blends. Alpha is
    /// the sprite brightness in both modes.
    [[nodiscard]] StarAppearance star_appearance(const catalog::Color& color,
                                                 f64 magnitude,
                                                 const Viewport& viewport,
                                                 f64 magnitude_scale,
                                                 const core::OverlayConfig& display);

} // namespace skydome::rendering
