/// @file sky_renderer.cpp
/// @brief SDL_Renderer sky drawing.

#include "rendering/sky_renderer.hpp"

#include "core/logger.hpp"
#include "rendering/sky_labels.hpp"

#include <algorithm>
#include <array>
#include <cmath>

namespace skydome::rendering
{

namespace
{
    /// Segments longer than this are projection wrap-arounds, not lines.
    constexpr f64 kMaxSegmentPx = 4000.0;

    constexpr f32 kTickLengthPx = 12.0f;
    constexpr f32 kNorthTickLengthPx = 22.0f;
    constexpr f32 kLabelMarkerPx = 4.0f;
    constexpr int kRingSegments = 24;

    Uint8 to_byte(f32 value)
    {
        return static_cast<Uint8>(std::lround(std::clamp(value, 0.0f, 1.0f) * 255.0f));
    }
}

SkyRenderer::SkyRenderer(SDL_Renderer* renderer)
    : m_renderer(renderer)
{
}

// -----------------------------------------------------------------
// Frame
// -----------------------------------------------------------------

void SkyRenderer::draw(const SkyScene& scene)
{
    m_stars_drawn = 0;
    if (m_renderer == nullptr)
    {
        return;
    }

    const SkyPalette& palette = sky_palette(scene.overlays.light_mode);

    set_blend(SDL_BLENDMODE_BLEND);
    set_color(palette.background);
    check_sdl(SDL_RenderClear(m_renderer), "SDL_RenderClear");

    const FrameTransform& frame = scene.frame;
    const GridGeometry& grid = scene.grid;

    if (scene.overlays.equatorial_grid)
    {
        for (const auto& line : grid.declination_circles)
        {
            draw_catalog_strip(frame, line, palette.equatorial);
        }
        for (const auto& line : grid.hour_circles)
        {
            draw_catalog_strip(frame, line, palette.equatorial_dim);
        }
    }

    if (scene.overlays.alt_az_grid)
    {
        for (const auto& line : grid.altitude_circles)
        {
            draw_observer_strip(frame, line, palette.alt_az_grid);
        }
        for (const auto& line : grid.azimuth_arcs)
        {
            draw_observer_strip(frame, line, palette.alt_az_grid_dim);
        }
    }

    if (scene.overlays.constellation_lines && scene.constellations != nullptr)
    {
        for (const auto& line : scene.constellations->lines)
        {
            draw_catalog_strip(frame, line.points, palette.constellation);
        }
    }

    draw_stars(scene, palette);

    if (scene.overlays.constellation_lines && scene.constellations != nullptr)
    {
        draw_label_markers(scene, palette);
    }

    if (scene.overlays.horizon)
    {
        draw_observer_strip(frame, grid.horizon, palette.horizon);
    }

    if (scene.overlays.cardinals)
    {
        draw_cardinals(scene, palette);
    }

    SDL_RenderPresent(m_renderer);
}

// -----------------------------------------------------------------
// Lines
// -----------------------------------------------------------------

void SkyRenderer::draw_observer_strip(const FrameTransform& frame, const Polyline& line, const Rgba& color)
{
    set_color(color);

    std::optional<ScreenPoint> previous;
    for (const auto& point : line)
    {
        const auto current = frame.project_observer(point, false);
        if (previous && current)
        {
            draw_segment(*previous, *current);
        }
        previous = current;
    }
}

void SkyRenderer::draw_catalog_strip(const FrameTransform& frame, const std::vector<Vec3d>& line, const Rgba& color)
{
    set_color(color);

    std::optional<ScreenPoint> previous;
    for (const auto& point : line)
    {
        const Vec3d observer = frame.to_observer(point);

        // Cut at the horizon
        std::optional<ScreenPoint> current;
        if (observer.y >= 0.0)
        {
            current = frame.project_observer(observer, false);
        }

        if (previous && current)
        {
            draw_segment(*previous, *current);
        }
        previous = current;
    }
}

void SkyRenderer::draw_segment(const ScreenPoint& a, const ScreenPoint& b)
{
    if (std::abs(a.x - b.x) > kMaxSegmentPx || std::abs(a.y - b.y) > kMaxSegmentPx)
    {
        return;
    }

    check_sdl(SDL_RenderDrawLineF(m_renderer,
                                  static_cast<float>(a.x), static_cast<float>(a.y),
                                  static_cast<float>(b.x), static_cast<float>(b.y)),
              "SDL_RenderDrawLineF");
}

// -----------------------------------------------------------------
// Stars
//
// The catalog is sorted brightest first, so the drawable stars are a
// prefix of it. Faint stars are drawn first so bright ones end on top.
// -----------------------------------------------------------------

void SkyRenderer::draw_stars(const SkyScene& scene, const SkyPalette& palette)
{
    const auto stars = scene.catalog.stars();
    const std::size_t count = scene.catalog.count_brighter_than(scene.magnitude_limit);
    const Viewport& viewport = scene.frame.viewport();

    // Dark sky adds starlight; light sky paints over the background
    set_blend(scene.overlays.light_mode ? SDL_BLENDMODE_BLEND : SDL_BLENDMODE_ADD);

    for (std::size_t i = count; i-- > 0;)
    {
        const catalog::Star& star = stars[i];
        const auto point = scene.frame.project(star.position);
        if (!point)
        {
            continue;
        }

        const StarAppearance look = star_appearance(star.color, star.magnitude, viewport,
                                                    scene.pick_options.magnitude_scale, scene.overlays);
        set_color(look.color);

        const f32 x = static_cast<f32>(point->x);
        const f32 y = static_cast<f32>(point->y);
        if (look.shape == StarShape::Square)
        {
            draw_square(x, y, look.size_px);
        }
        else
        {
            draw_disc(x, y, look.size_px * 0.5f);
        }
        ++m_stars_drawn;
    }

    set_blend(SDL_BLENDMODE_BLEND);

    if (scene.hovered != nullptr)
    {
        const auto point = scene.frame.project(scene.hovered->position);
        if (point)
        {
            const f64 radius = picking::StarPicker::hit_radius_px(scene.hovered->magnitude, viewport, scene.pick_options);
            set_color(palette.hover);
            draw_ring(static_cast<f32>(point->x), static_cast<f32>(point->y), static_cast<f32>(radius + 3.0));
        }
    }
}

void SkyRenderer::draw_disc(f32 cx, f32 cy, f32 radius)
{
    if (radius <= 1.0f)
    {
        const SDL_FRect rect{cx - radius, cy - radius, 2.0f * radius, 2.0f * radius};
        check_sdl(SDL_RenderFillRectF(m_renderer, &rect), "SDL_RenderFillRectF");
        return;
    }

    // One horizontal span per pixel row
    for (f32 dy = -radius; dy <= radius; dy += 1.0f)
    {
        const f32 half = std::sqrt(std::max(0.0f, radius * radius - dy * dy));
        check_sdl(SDL_RenderDrawLineF(m_renderer, cx - half, cy + dy, cx + half, cy + dy), "SDL_RenderDrawLineF");
    }
}

void SkyRenderer::draw_square(f32 cx, f32 cy, f32 side)
{
    const SDL_FRect rect{cx - 0.5f * side, cy - 0.5f * side, side, side};
    check_sdl(SDL_RenderFillRectF(m_renderer, &rect), "SDL_RenderFillRectF");
}

void SkyRenderer::draw_ring(f32 cx, f32 cy, f32 radius)
{
    std::array<SDL_FPoint, kRingSegments + 1> points{};
    for (int i = 0; i <= kRingSegments; ++i)
    {
        const f32 angle = static_cast<f32>(astro_constants::kTwoPi) * static_cast<f32>(i) / static_cast<f32>(kRingSegments);
        points[static_cast<std::size_t>(i)] = SDL_FPoint{cx + radius * std::cos(angle), cy + radius * std::sin(angle)};
    }
    check_sdl(SDL_RenderDrawLinesF(m_renderer, points.data(), static_cast<int>(points.size())), "SDL_RenderDrawLinesF");
}

// -----------------------------------------------------------------
// Markers
// -----------------------------------------------------------------

void SkyRenderer::draw_cardinals(const SkyScene& scene, const SkyPalette& palette)
{
    set_color(palette.cardinal);

    for (const auto& cardinal : scene.grid.cardinals)
    {
        const auto point = scene.frame.project_observer(cardinal.position);
        if (!point)
        {
            continue;
        }

        const f32 length = cardinal.label == "N" ? kNorthTickLengthPx : kTickLengthPx;
        const f32 x = static_cast<f32>(point->x);
        const f32 y = static_cast<f32>(point->y);
        check_sdl(SDL_RenderDrawLineF(m_renderer, x, y, x, y - length), "SDL_RenderDrawLineF");
    }
}

void SkyRenderer::draw_label_markers(const SkyScene& scene, const SkyPalette& palette)
{
    for (const auto& label : SkyLabels::select(scene.constellations->centers, scene.frame))
    {
        if (label.opacity <= 0.0f)
        {
            continue;
        }

        Rgba color = palette.label_marker;
        color.a *= label.opacity;
        set_color(color);

        // Small diamond at the label anchor
        const f32 x = static_cast<f32>(label.x);
        const f32 y = static_cast<f32>(label.y);
        const std::array<SDL_FPoint, 5> diamond = {{
            {x, y - kLabelMarkerPx},
            {x + kLabelMarkerPx, y},
            {x, y + kLabelMarkerPx},
            {x - kLabelMarkerPx, y},
            {x, y - kLabelMarkerPx},
        }};
        check_sdl(SDL_RenderDrawLinesF(m_renderer, diamond.data(), static_cast<int>(diamond.size())),
                  "SDL_RenderDrawLinesF");
    }
}

// -----------------------------------------------------------------
// SDL helpers
// -----------------------------------------------------------------

void SkyRenderer::set_color(const Rgba& color)
{
    check_sdl(SDL_SetRenderDrawColor(m_renderer, to_byte(color.r), to_byte(color.g), to_byte(color.b), to_byte(color.a)),
              "SDL_SetRenderDrawColor");
}

void SkyRenderer::set_blend(SDL_BlendMode mode)
{
    check_sdl(SDL_SetRenderDrawBlendMode(m_renderer, mode), "SDL_SetRenderDrawBlendMode");
}

void SkyRenderer::check_sdl(int result, const char* operation)
{
    // Report the first failure only; draw calls repeat every frame
    if (result != 0 && !m_reported_error)
    {
        SKY_CORE_ERROR("{} failed: {}", operation, SDL_GetError());
        m_reported_error = true;
    }
}

} // namespace skydome::rendering
