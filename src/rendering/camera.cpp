/// @file camera.cpp
/// @brief Implementation of the observer camera.

#include "rendering/camera.hpp"

#include <algorithm>
#include <cmath>

namespace skydome::rendering
{

namespace
{
    f64 normalize_yaw(f64 yaw)
    {
        yaw = std::fmod(yaw, astro_constants::kTwoPi);
        if (yaw < 0.0)
        {
            yaw += astro_constants::kTwoPi;
        }
        return yaw;
    }
}

Camera::Camera()
    : m_state{.yaw = kDefaultYaw, .pitch = kDefaultPitch}
    , m_fov_deg(kDefaultFovDeg)
{
}

// -----------------------------------------------------------------
// Orientation
// -----------------------------------------------------------------

void Camera::apply_drag(f64 dx_px, f64 dy_px)
{
    set_orientation(m_state.yaw - dx_px * kDragSensitivity,
                    m_state.pitch + dy_px * kDragSensitivity);
}

void Camera::set_orientation(f64 yaw_rad, f64 pitch_rad)
{
    // Non-finite input leaves the orientation untouched
    if (!std::isfinite(yaw_rad) || !std::isfinite(pitch_rad))
    {
        return;
    }

    m_state.yaw = normalize_yaw(yaw_rad);
    m_state.pitch = std::clamp(pitch_rad, -kMaxPitch, kMaxPitch);
}

void Camera::look_at(const astro::HorizontalCoord& target)
{
    set_orientation(glm::radians(target.az), glm::radians(target.alt));
}

// -----------------------------------------------------------------
// Field of view
// -----------------------------------------------------------------

void Camera::set_fov(f64 fov_deg)
{
    if (!std::isfinite(fov_deg))
    {
        return;
    }
    m_fov_deg = std::clamp(fov_deg, kMinFovDeg, kMaxFovDeg);
}

void Camera::zoom(f64 factor)
{
    if (factor > 0.0)
    {
        set_fov(m_fov_deg * factor);
    }
}

void Camera::reset()
{
    m_state = CameraState{.yaw = kDefaultYaw, .pitch = kDefaultPitch};
    m_fov_deg = kDefaultFovDeg;
}

// -----------------------------------------------------------------
// Getters
// -----------------------------------------------------------------

astro::HorizontalCoord Camera::get_pointing() const
{
    return astro::HorizontalCoord{
        .alt = glm::degrees(m_state.pitch),
        .az  = glm::degrees(m_state.yaw),
    };
}

// -----------------------------------------------------------------
// Magnitude limit heuristic
//
// mag_limit = 6.5 + 5 × log10(60.0 / fov_degrees)
// -----------------------------------------------------------------

f32 Camera::get_magnitude_limit() const
{
    return static_cast<f32>(kBaseMagLimit + 5.0 * std::log10(kReferenceFovDeg / m_fov_deg));
}

} // namespace skydome::rendering
