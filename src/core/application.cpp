/// @file application.cpp
/// @brief Application implementation: init, main loop, input, hover picking, shutdown.

#include "core/application.hpp"

#include "astro/coordinates.hpp"
#include "astro/time_system.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace skydome::core
{

namespace
{
    /// Title refresh interval; the title bar does not need every frame.
    constexpr f64 kTitleRefreshSec = 0.25;

    /// FOV change per scroll notch.
    constexpr f64 kZoomStep = 0.1;

    /// Names listed by the identify key.
    constexpr std::size_t kMaxIdentified = 8;
}

Application::Application(AppConfig config,
                         catalog::StarCatalog catalog,
                         std::optional<catalog::ConstellationSet> constellations)
    : m_config(std::move(config))
    , m_catalog(std::move(catalog))
    , m_constellations(std::move(constellations))
    , m_grid(rendering::SkyGrid::build())
{
    init();
}

Application::~Application()
{
    shutdown();
}

void Application::run()
{
    SKY_CORE_INFO("Entering main loop...");
    main_loop();
    SKY_CORE_INFO("Main loop exited");
}

// =================================================================
// Initialization
// =================================================================

void Application::init()
{
    // 1. Window + renderer
    m_window = std::make_unique<Window>(m_config.window);

    // 2. Input (must exist before setting the event callback)
    m_input = std::make_unique<Input>();

    // Wire SDL events → Input system
    m_window->set_event_callback([this](const SDL_Event& event) {
        m_input->process_event(event);
    });

    // 3. Sky renderer on the window's SDL_Renderer
    m_renderer = std::make_unique<rendering::SkyRenderer>(m_window->get_renderer());

    // 4. Simulation time: fixed start instant or the wall clock
    if (m_config.start_time)
    {
        m_clock.set_time(*m_config.start_time);
    }

    // 5. Camera (a named star needs the clock to find it on the sky)
    m_camera.set_fov(m_config.fov_deg);
    if (m_config.look_at)
    {
        m_camera.look_at(*m_config.look_at);
    }
    if (m_config.look_at_star)
    {
        look_at_star(*m_config.look_at_star);
    }

    // 6. Overlays start as configured, then follow the keyboard
    m_overlays = m_config.overlays;

    {
        const auto dt = m_clock.instant();
        SKY_CORE_INFO("Simulation start: JD {:.6f} ({:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:04.1f} UTC){}",
                      m_clock.jd(), dt.year, dt.month, dt.day, dt.hour, dt.minute, dt.second,
                      m_clock.is_realtime() ? " [live]" : "");
        SKY_CORE_INFO("Observer: {:.4f}, {:.4f}", m_config.location.lat, m_config.location.lon);
        SKY_CORE_INFO("Catalog: {} stars, {} constellation figures",
                      m_catalog.size(),
                      m_constellations ? m_constellations->centers.size() : 0);
    }

    // 7. Initialize frame time
    m_last_frame_time = std::chrono::steady_clock::now();

    SKY_CORE_INFO("Application initialized, all subsystems ready");
}

// =================================================================
// Shutdown
// =================================================================

void Application::shutdown()
{
    m_hovered = nullptr;
    m_renderer.reset();

    // Clear the event callback before destroying the window
    // (callback captures `this`, which references m_input)
    if (m_window)
    {
        m_window->set_event_callback(nullptr);
    }
    m_input.reset();
    m_window.reset();
}

// =================================================================
// Main loop
// =================================================================

void Application::main_loop()
{
    while (!m_window->should_close())
    {
        // -----------------------------------------------------------------
        // 1. Reset per-frame input state
        // -----------------------------------------------------------------
        m_input->new_frame();

        // -----------------------------------------------------------------
        // 2. Poll SDL events (Window handles SDL_QUIT/resize; callback → Input)
        // -----------------------------------------------------------------
        m_window->poll_events();

        if (m_window->was_resized())
        {
            SKY_CORE_DEBUG("Viewport now {}x{}", m_window->get_width(), m_window->get_height());
        }

        // -----------------------------------------------------------------
        // 3. Compute delta time
        // -----------------------------------------------------------------
        const auto now = std::chrono::steady_clock::now();
        const f64 delta_time_sec = std::chrono::duration<f64>(now - m_last_frame_time).count();
        m_last_frame_time = now;

        // Clamp delta to avoid huge jumps (e.g., after a breakpoint)
        const f64 clamped_dt = std::min(delta_time_sec, 0.1);

        // -----------------------------------------------------------------
        // 4. Process input → Camera/clock
        // -----------------------------------------------------------------
        process_input();

        // -----------------------------------------------------------------
        // 5. Advance the clock
        // -----------------------------------------------------------------
        update_simulation(clamped_dt);

        // Skip drawing when minimized (zero extent)
        if (m_window->get_width() == 0 || m_window->get_height() == 0)
        {
            SDL_Delay(16);
            continue;
        }

        // -----------------------------------------------------------------
        // 6. One transform per frame, shared by picking and drawing
        // -----------------------------------------------------------------
        const rendering::FrameTransform frame = make_frame_transform();
        update_hover(frame);
        draw_frame(frame);

        update_title(delta_time_sec);
    }
}

// =================================================================
// Input processing: translates Input state to Camera/clock actions
// =================================================================

void Application::process_input()
{
    // -----------------------------------------------------------------
    // Mouse drag → Camera (1:1 with pointer motion, no inertia)
    // -----------------------------------------------------------------
    if (m_input->is_mouse_dragging())
    {
        const auto drag = m_input->get_mouse_drag_delta();
        m_camera.apply_drag(static_cast<f64>(drag.x), static_cast<f64>(drag.y));
    }

    // -----------------------------------------------------------------
    // Scroll wheel → Camera zoom
    //
    // scroll > 0 → zoom in (decrease FOV) → factor < 1.0
    // scroll < 0 → zoom out (increase FOV) → factor > 1.0
    // -----------------------------------------------------------------
    const f32 scroll = m_input->get_scroll_delta();
    if (scroll != 0.0f)
    {
        const f64 zoom_factor = std::max(0.1, 1.0 - static_cast<f64>(scroll) * kZoomStep);
        m_camera.zoom(zoom_factor);
        SKY_DEBUG("FOV {:.1f}°, limiting magnitude {:.2f}", m_camera.get_fov_deg(), m_camera.get_magnitude_limit());
    }

    // -----------------------------------------------------------------
    // Playback
    // -----------------------------------------------------------------
    if (m_input->is_key_pressed(SDL_SCANCODE_SPACE))
    {
        if (m_clock.is_paused())
        {
            m_clock.forward();
        }
        else
        {
            m_clock.pause();
        }
        SKY_INFO("Time {}", m_clock.is_paused() ? "paused" : "resumed");
    }

    if (m_input->is_key_pressed(SDL_SCANCODE_RIGHT))
    {
        m_clock.forward();
        SKY_INFO("Playback {}", m_clock.speed_label());
    }

    if (m_input->is_key_pressed(SDL_SCANCODE_LEFT))
    {
        m_clock.reverse();
        SKY_INFO("Playback {}", m_clock.speed_label());
    }

    if (m_input->is_key_pressed(SDL_SCANCODE_UP) || m_input->is_key_pressed(SDL_SCANCODE_DOWN))
    {
        m_clock.shift_hours(m_input->is_key_pressed(SDL_SCANCODE_UP) ? 1.0 : -1.0);
        const auto dt = m_clock.instant();
        SKY_INFO("Time set to {:04d}-{:02d}-{:02d} {:02d}:{:02d} UTC", dt.year, dt.month, dt.day, dt.hour, dt.minute);
    }

    if (m_input->is_key_pressed(SDL_SCANCODE_N))
    {
        m_clock.go_live();
        SKY_INFO("Following the wall clock");
    }

    // -----------------------------------------------------------------
    // R → reset camera to defaults
    // -----------------------------------------------------------------
    if (m_input->is_key_pressed(SDL_SCANCODE_R))
    {
        m_camera.reset();
        SKY_INFO("Camera reset to defaults");
    }

    // -----------------------------------------------------------------
    // Overlay toggles
    // -----------------------------------------------------------------
    if (m_input->is_key_pressed(SDL_SCANCODE_G))
    {
        toggle_overlay(m_overlays.alt_az_grid, "Alt/az grid");
    }
    if (m_input->is_key_pressed(SDL_SCANCODE_E))
    {
        toggle_overlay(m_overlays.equatorial_grid, "Equatorial grid");
    }
    if (m_input->is_key_pressed(SDL_SCANCODE_C))
    {
        if (m_constellations)
        {
            toggle_overlay(m_overlays.constellation_lines, "Constellation lines");
        }
        else
        {
            SKY_WARN("No constellation figures loaded");
        }
    }
    if (m_input->is_key_pressed(SDL_SCANCODE_H))
    {
        toggle_overlay(m_overlays.horizon, "Horizon");
    }
    if (m_input->is_key_pressed(SDL_SCANCODE_K))
    {
        toggle_overlay(m_overlays.cardinals, "Compass points");
    }
    if (m_input->is_key_pressed(SDL_SCANCODE_L))
    {
        toggle_overlay(m_overlays.light_mode, "Light mode");
    }
    if (m_input->is_key_pressed(SDL_SCANCODE_P))
    {
        toggle_overlay(m_overlays.pixel_stars, "Pixel stars");
    }

    // -----------------------------------------------------------------
    // I → list the stars around the view center
    // -----------------------------------------------------------------
    if (m_input->is_key_pressed(SDL_SCANCODE_I))
    {
        identify_view_center();
    }

    // -----------------------------------------------------------------
    // Escape → quit
    // -----------------------------------------------------------------
    if (m_input->is_key_pressed(SDL_SCANCODE_ESCAPE))
    {
        m_window->request_close();
    }
}

// =================================================================
// Star lookup
// =================================================================

void Application::look_at_star(const std::string& query)
{
    const catalog::Star* star = m_catalog.resolve(query);
    if (star == nullptr)
    {
        SKY_WARN("No star matches '{}'; keeping the current view", query);
        return;
    }

    const auto hz = astro::Coordinates::equatorial_to_horizontal(star->equatorial, m_config.location, current_lst());
    m_camera.look_at(hz);

    SKY_INFO("Centered on {} (alt {:.1f}°, az {:.1f}°)", star->display_name(), hz.alt, hz.az);
    if (hz.alt < 0.0)
    {
        SKY_WARN("{} is below the horizon (alt {:.1f}°) and hidden until it rises",
                 star->display_name(), hz.alt);
    }
}

void Application::identify_view_center() const
{
    const Vec3d forward = rendering::Projection::forward(m_camera.state());
    const Vec3d direction = make_frame_transform().to_catalog(forward);
    const f64 max_magnitude = pick_options().max_magnitude;

    std::string names;
    std::size_t shown = 0;
    for (const catalog::Star* star : m_catalog.find_near(direction))
    {
        if (star->magnitude > max_magnitude)
        {
            break;
        }
        if (shown == kMaxIdentified)
        {
            names += ", ...";
            break;
        }
        names += shown == 0 ? "" : ", ";
        names += fmt::format("{} ({:.2f})", star->display_name(), star->magnitude);
        ++shown;
    }

    if (shown == 0)
    {
        SKY_INFO("No stars near the view center");
        return;
    }
    SKY_INFO("Near the view center: {}", names);
}

void Application::toggle_overlay(bool& flag, const char* name)
{
    flag = !flag;
    SKY_INFO("{} {}", name, flag ? "on" : "off");
}

// =================================================================
// Simulation update
// =================================================================

void Application::update_simulation(f64 delta_time_sec)
{
    m_clock.advance(delta_time_sec);
}

f64 Application::current_lst() const
{
    return astro::TimeSystem::local_sidereal_time(m_clock.jd(), m_config.location.lon);
}

rendering::FrameTransform Application::make_frame_transform() const
{
    // Rotation is recomputed from the clock every frame, never cached
    const Mat4d rotation = astro::Coordinates::celestial_rotation_matrix(m_config.location, current_lst());

    const rendering::Viewport viewport{
        .width  = static_cast<f64>(m_window->get_width()),
        .height = static_cast<f64>(m_window->get_height()),
    };

    return rendering::FrameTransform(m_camera.state(), rotation, m_camera.get_fov_deg(), viewport);
}

picking::PickOptions Application::pick_options() const
{
    picking::PickOptions options;
    options.ray_threshold = m_config.pick_threshold;
    options.max_magnitude = std::min(m_config.max_magnitude, static_cast<f64>(m_camera.get_magnitude_limit()));
    return options;
}

// =================================================================
// Hover picking
//
// The sky keeps turning under a still pointer, so the pick runs every
// frame, not only on pointer motion.
// =================================================================

void Application::update_hover(const rendering::FrameTransform& frame)
{
    const catalog::Star* hovered = nullptr;

    const auto pointer = m_input->get_pointer();
    if (pointer && !m_input->is_mouse_dragging())
    {
        hovered = picking::StarPicker::pick_by_ray(m_catalog, frame,
                                                   static_cast<f64>(pointer->x),
                                                   static_cast<f64>(pointer->y),
                                                   pick_options());
    }

    if (hovered == m_hovered)
    {
        return;
    }
    m_hovered = hovered;

    if (m_hovered != nullptr)
    {
        const Vec3d observer = frame.to_observer(m_hovered->position);
        const auto hz = astro::Coordinates::cartesian_to_horizontal(observer);
        SKY_INFO("Hover: {} (mag {:.2f}, RA {:.3f}h, Dec {:+.2f}°, alt {:.1f}°, az {:.1f}° {})",
                 m_hovered->display_name(), m_hovered->magnitude,
                 m_hovered->equatorial.ra, m_hovered->equatorial.dec,
                 hz.alt, hz.az, astro::Coordinates::azimuth_to_cardinal(hz.az));
    }
    else
    {
        SKY_TRACE("Hover cleared");
    }
}

// =================================================================
// Frame rendering
// =================================================================

void Application::draw_frame(const rendering::FrameTransform& frame)
{
    const picking::PickOptions options = pick_options();

    m_renderer->draw(rendering::SkyScene{
        .frame           = frame,
        .catalog         = m_catalog,
        .constellations  = m_constellations ? &*m_constellations : nullptr,
        .grid            = m_grid,
        .overlays        = m_overlays,
        .magnitude_limit = options.max_magnitude,
        .hovered         = m_hovered,
        .pick_options    = options,
    });
}

// =================================================================
// Status readout (window title)
// =================================================================

void Application::update_title(f64 delta_time_sec)
{
    m_title_age_sec += delta_time_sec;
    if (m_title_age_sec < kTitleRefreshSec)
    {
        return;
    }
    m_title_age_sec = 0.0;
    m_window->set_title(status_line());
}

std::string Application::status_line() const
{
    const auto dt = m_clock.instant();
    const auto pointing = m_camera.get_pointing();
    const auto& location = m_config.location;
    const auto center = astro::Coordinates::horizontal_to_equatorial(pointing, location, current_lst());

    std::string line = fmt::format(
        "{} | {:.2f}°{} {:.2f}°{} | {:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d} UTC | {}{} | "
        "{} az {:.0f}° alt {:.0f}° (RA {:.2f}h Dec {:+.1f}°) | FOV {:.0f}° | {} stars",
        m_config.window.title,
        std::abs(location.lat), location.lat >= 0.0 ? "N" : "S",
        std::abs(location.lon), location.lon >= 0.0 ? "E" : "W",
        dt.year, dt.month, dt.day, dt.hour, dt.minute, static_cast<int>(dt.second),
        m_clock.is_realtime() ? "LIVE " : "", m_clock.speed_label(),
        astro::Coordinates::azimuth_to_cardinal(pointing.az), pointing.az, pointing.alt,
        center.ra, center.dec,
        m_camera.get_fov_deg(),
        m_renderer ? m_renderer->stars_drawn() : 0);

    if (m_hovered != nullptr)
    {
        line += fmt::format(" | {} (mag {:.2f})", m_hovered->display_name(), m_hovered->magnitude);
    }
    return line;
}

} // namespace skydome::core
