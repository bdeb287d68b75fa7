#pragma once

/// @file camera.hpp
/// @brief Orbital observer camera: yaw/pitch orientation, field of view, drag and zoom.

#include "astro/coordinates.hpp"
#include "core/types.hpp"

#include <glm/trigonometric.hpp>

namespace skydome::rendering
{
    /// @brief Camera orientation in the observer frame.
    ///
    /// yaw is the azimuth of the view direction (0 = North, π/2 = East),
    /// pitch its altitude (positive looks up).
    struct CameraState
    {
        f64 yaw;    ///< radians
        f64 pitch;  ///< radians, within (-π/2, π/2)
    };

    /// @brief Observer camera that defines where the user is looking and the field of view.
    ///
    /// The only writer of CameraState. Projection and picking read it by
    /// const reference each frame. Drag motion is 1:1 with pointer delta,
    /// with no inertia; pitch is clamped just short of the poles.
    class Camera
    {
    public:
        /// Radians of rotation per pixel of drag.
        static constexpr f64 kDragSensitivity = 0.005;

        /// Margin keeping pitch away from ±π/2.
        static constexpr f64 kPitchMargin = 0.01;
        static constexpr f64 kMaxPitch = astro_constants::kHalfPi - kPitchMargin;

        static constexpr f64 kMinFovDeg = 10.0;
        static constexpr f64 kMaxFovDeg = 120.0;

        /// @brief Construct camera with default pointing: 45° up, due north, 60° FOV.
        Camera();

        /// @brief Apply a pointer drag in pixels.
        ///
        /// yaw -= dx × sensitivity, pitch += dy × sensitivity (screen y grows
        /// downward, so dragging down looks up: the sky follows the pointer).
        void apply_drag(f64 dx_px, f64 dy_px);

        /// @brief Set orientation directly. Pitch is clamped, yaw normalized.
        void set_orientation(f64 yaw_rad, f64 pitch_rad);

        /// @brief Point the camera at a horizontal coordinate.
        void look_at(const astro::HorizontalCoord& target);

        /// @brief Set field of view in degrees, clamped to [kMinFovDeg, kMaxFovDeg].
        void set_fov(f64 fov_deg);

        /// @brief Zoom in or out by multiplying the FOV.
        /// @param factor Zoom factor. <1.0 zooms in, >1.0 zooms out.
        void zoom(f64 factor);

        /// @brief Reset camera to default: 45° up, due north, 60° FOV.
        void reset();

        [[nodiscard]] const CameraState& state() const { return m_state; }
        [[nodiscard]] f64 get_fov_deg() const { return m_fov_deg; }

        /// @brief View direction as Alt/Az in degrees (for the compass readout).
        [[nodiscard]] astro::HorizontalCoord get_pointing() const;

        /// @brief Get the limiting magnitude for the current FOV.
        ///
        /// Uses the heuristic: mag_limit = 6.5 + 5 × log10(60.0 / fov_degrees).
        /// At 60° FOV (naked eye): 6.5
        /// At 10° FOV: ~10.4
        [[nodiscard]] f32 get_magnitude_limit() const;

    private:
        CameraState m_state;
        f64 m_fov_deg;

        static constexpr f64 kDefaultYaw      = 0.0;                   ///< Due north
        static constexpr f64 kDefaultPitch    = glm::radians(45.0);    ///< 45° up
        static constexpr f64 kDefaultFovDeg   = 60.0;

        static constexpr f64 kBaseMagLimit    = 6.5;    ///< Naked-eye limit at 60° FOV
        static constexpr f64 kReferenceFovDeg = 60.0;
    };

} // namespace skydome::rendering
