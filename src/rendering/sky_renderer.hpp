#pragma once

/// @file sky_renderer.hpp
/// @brief 2D sky drawing on an SDL_Renderer: stars, grids, figures, markers.

#include "catalog/constellations.hpp"
#include "catalog/star_catalog.hpp"
#include "core/config.hpp"
#include "core/types.hpp"
#include "picking/star_picker.hpp"
#include "rendering/projection.hpp"
#include "rendering/sky_grid.hpp"
#include "rendering/sky_style.hpp"

#include <SDL2/SDL.h>

#include <vector>

namespace skydome::rendering
{
    /// @brief Everything one frame draws. References must outlive draw().
    struct SkyScene
    {
        const FrameTransform& frame;
        const catalog::StarCatalog& catalog;
        const catalog::ConstellationSet* constellations;   ///< nullptr = none loaded
        const GridGeometry& grid;
        core::OverlayConfig overlays;                      ///< Also selects light mode and pixel stars
        f64 magnitude_limit;                                ///< Fainter stars are not drawn
        const catalog::Star* hovered;                       ///< nullptr = no hover ring
        picking::PickOptions pick_options;
    };

    /// @brief Draws a SkyScene with SDL_Renderer primitives.
    ///
    /// Does not own the SDL_Renderer. Observer-frame overlays are projected
    /// without horizon culling; catalog-frame lines are cut at the horizon
    /// like the stars they connect.
    class SkyRenderer
    {
    public:
        explicit SkyRenderer(SDL_Renderer* renderer);

        SkyRenderer(const SkyRenderer&) = delete;
        SkyRenderer& operator=(const SkyRenderer&) = delete;

        /// @brief Clear, draw the scene, present.
        void draw(const SkyScene& scene);

        /// @brief Stars drawn by the last draw() call.
        [[nodiscard]] std::size_t stars_drawn() const { return m_stars_drawn; }

    private:
        void draw_observer_strip(const FrameTransform& frame, const Polyline& line, const Rgba& color);
        void draw_catalog_strip(const FrameTransform& frame, const std::vector<Vec3d>& line, const Rgba& color);
        void draw_segment(const ScreenPoint& a, const ScreenPoint& b);
        void draw_stars(const SkyScene& scene, const SkyPalette& palette);
        void draw_disc(f32 cx, f32 cy, f32 radius);
        void draw_square(f32 cx, f32 cy, f32 side);
        void draw_ring(f32 cx, f32 cy, f32 radius);
        void draw_cardinals(const SkyScene& scene, const SkyPalette& palette);
        void draw_label_markers(const SkyScene& scene, const SkyPalette& palette);

        void set_color(const Rgba& color);
        void set_blend(SDL_BlendMode mode);
        void check_sdl(int result, const char* operation);

        SDL_Renderer* m_renderer;
        std::size_t m_stars_drawn = 0;
        bool m_reported_error = false;
    };

} // namespace skydome::rendering
