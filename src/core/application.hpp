#pragma once

/// @file application.hpp
/// @brief Main application class: lifecycle, main loop, frame rendering.

#include "astro/sim_clock.hpp"
#include "catalog/constellations.hpp"
#include "catalog/star_catalog.hpp"
#include "core/config.hpp"
#include "core/input.hpp"
#include "core/types.hpp"
#include "core/window.hpp"
#include "picking/star_picker.hpp"
#include "rendering/camera.hpp"
#include "rendering/projection.hpp"
#include "rendering/sky_grid.hpp"
#include "rendering/sky_renderer.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace skydome::core
{
    /// @brief Top-level application class that owns all subsystems and drives the main loop.
    ///
    /// Lifecycle: init() in constructor → run() drives main_loop() → shutdown() in destructor.
    /// The catalog is loaded by the caller and moved in; the application never
    /// starts without one.
    class Application
    {
    public:
        /// @brief Create the window and renderer and set up camera and clock from the config.
        Application(AppConfig config,
                    catalog::StarCatalog catalog,
                    std::optional<catalog::ConstellationSet> constellations);

        /// @brief Shut down all subsystems in reverse creation order.
        ~Application();

        Application(const Application&) = delete;
        Application& operator=(const Application&) = delete;
        Application(Application&&) = delete;
        Application& operator=(Application&&) = delete;

        /// @brief Enter the main loop. Returns when the window is closed.
        void run();

    private:
        void init();
        void main_loop();
        void shutdown();

        void process_input();
        void update_simulation(f64 delta_time_sec);
        void update_hover(const rendering::FrameTransform& frame);
        void draw_frame(const rendering::FrameTransform& frame);
        void update_title(f64 delta_time_sec);

        void toggle_overlay(bool& flag, const char* name);
        void look_at_star(const std::string& query);
        void identify_view_center() const;

        [[nodiscard]] f64 current_lst() const;

        [[nodiscard]] rendering::FrameTransform make_frame_transform() const;
        [[nodiscard]] picking::PickOptions pick_options() const;
        [[nodiscard]] std::string status_line() const;

        // -----------------------------------------------------------------
        // Configuration and immutable data
        // -----------------------------------------------------------------
        AppConfig m_config;
        catalog::StarCatalog m_catalog;
        std::optional<catalog::ConstellationSet> m_constellations;
        rendering::GridGeometry m_grid;

        // -----------------------------------------------------------------
        // Subsystems (created in init order, destroyed in reverse)
        // -----------------------------------------------------------------
        std::unique_ptr<Window> m_window;
        std::unique_ptr<Input> m_input;
        std::unique_ptr<rendering::SkyRenderer> m_renderer;

        // -----------------------------------------------------------------
        // Simulation state
        // -----------------------------------------------------------------
        rendering::Camera m_camera;
        astro::SimulationClock m_clock;
        OverlayConfig m_overlays;
        const catalog::Star* m_hovered = nullptr;

        /// @brief Wall-clock time tracking for delta_time computation.
        std::chrono::steady_clock::time_point m_last_frame_time;

        /// Seconds since the window title was last refreshed.
        f64 m_title_age_sec = 0.0;
    };

} // namespace skydome::core
