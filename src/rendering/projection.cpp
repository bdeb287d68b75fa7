/// @file projection.cpp
/// @brief Camera matrices and per-frame projection.

#include "rendering/projection.hpp"

#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/type_ptr.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace skydome::rendering
{

// -----------------------------------------------------------------
// Projection helpers
// -----------------------------------------------------------------

Mat4d Projection::perspective(f64 fov_deg, f64 aspect, f64 near_plane, f64 far_plane)
{
    const bool valid = fov_deg > 0.0 && fov_deg < 180.0 && aspect > 0.0
                    && near_plane > 0.0 && far_plane > near_plane;
    if (!valid)
    {
        Mat4d degenerate(0.0);
        for (int c = 0; c < 4; ++c)
        {
            for (int r = 0; r < 4; ++r)
            {
                degenerate[c][r] = std::numeric_limits<f64>::quiet_NaN();
            }
        }
        return degenerate;
    }

    return glm::perspective(glm::radians(fov_deg), aspect, near_plane, far_plane);
}

Vec3d Projection::forward(const CameraState& camera)
{
    const f64 cp = std::cos(camera.pitch);
    return Vec3d{
        std::sin(camera.yaw) * cp,
        std::sin(camera.pitch),
        std::cos(camera.yaw) * cp,
    };
}

// -----------------------------------------------------------------
// View matrix
//
// Observer frame: x = East, y = Up, z = North.
//   forward f = ( sin(yaw) cos(pitch),   sin(pitch),  cos(yaw) cos(pitch))
//   right   r = ( cos(yaw),              0,          -sin(yaw))
//   up      u = (-sin(yaw) sin(pitch),   cos(pitch), -cos(yaw) sin(pitch))
//
// Rows (r, u, -f) map the observer frame into view space; looking north
// puts east on the right of the screen.
// -----------------------------------------------------------------

Mat4d Projection::view(const CameraState& camera)
{
    const f64 sy = std::sin(camera.yaw);
    const f64 cy = std::cos(camera.yaw);
    const f64 sp = std::sin(camera.pitch);
    const f64 cp = std::cos(camera.pitch);

    const Vec3d right{cy, 0.0, -sy};
    const Vec3d up{-sy * sp, cp, -cy * sp};
    const Vec3d forward{sy * cp, sp, cy * cp};

    Mat4d m(1.0);
    for (int c = 0; c < 3; ++c)
    {
        m[c][0] = right[c];
        m[c][1] = up[c];
        m[c][2] = -forward[c];
    }
    return m;
}

std::array<f32, 16> Projection::to_column_major(const Mat4d& m)
{
    std::array<f32, 16> out{};
    const f64* src = glm::value_ptr(m);
    std::transform(src, src + 16, out.begin(), [](f64 v) { return static_cast<f32>(v); });
    return out;
}

// -----------------------------------------------------------------
// FrameTransform
// -----------------------------------------------------------------

FrameTransform::FrameTransform(const CameraState& camera, const Mat4d& rotation, f64 fov_deg, const Viewport& viewport)
    : m_camera(camera)
    , m_viewport(viewport)
    , m_fov_deg(fov_deg)
    , m_rotation(rotation)
    , m_view(Projection::view(camera))
    , m_projection(Projection::perspective(fov_deg, viewport.aspect()))
    , m_mvp(m_projection * m_view * m_rotation)
{
}

Vec3d FrameTransform::to_observer(const Vec3d& catalog_point) const
{
    return Vec3d(m_rotation * Vec4d(catalog_point, 0.0));
}

Vec3d FrameTransform::to_catalog(const Vec3d& observer_point) const
{
    return Vec3d(glm::transpose(m_rotation) * Vec4d(observer_point, 0.0));
}

Vec4d FrameTransform::clip(const Vec3d& catalog_point) const
{
    return m_mvp * Vec4d(catalog_point, 1.0);
}

Vec2d FrameTransform::ndc_to_pixel(const Vec2d& ndc) const
{
    return Vec2d{
        (ndc.x + 1.0) * 0.5 * m_viewport.width,
        (1.0 - ndc.y) * 0.5 * m_viewport.height,
    };
}

std::optional<ScreenPoint> FrameTransform::project(const Vec3d& catalog_point) const
{
    const Vec3d observer = to_observer(catalog_point);

    // Below the horizon (NaN fails this test too)
    if (!(observer.y >= 0.0))
    {
        return std::nullopt;
    }

    return finish(observer, true);
}

std::optional<ScreenPoint> FrameTransform::project_observer(const Vec3d& observer_point, bool clip_to_viewport) const
{
    return finish(observer_point, clip_to_viewport);
}

std::optional<ScreenPoint> FrameTransform::finish(const Vec3d& observer_point, bool clip_to_viewport) const
{
    const Vec4d eye = m_view * Vec4d(observer_point, 1.0);
    const f64 depth = -eye.z;

    // Behind the viewer, or NaN
    if (!(depth > 0.0))
    {
        return std::nullopt;
    }

    const Vec4d clip_pos = m_projection * eye;
    if (!(clip_pos.w > 0.0))
    {
        return std::nullopt;
    }

    const Vec2d pixel = ndc_to_pixel(Vec2d(clip_pos.x, clip_pos.y) / clip_pos.w);
    if (!std::isfinite(pixel.x) || !std::isfinite(pixel.y))
    {
        return std::nullopt;
    }

    if (clip_to_viewport && !m_viewport.contains(pixel.x, pixel.y))
    {
        return std::nullopt;
    }

    return ScreenPoint{.x = pixel.x, .y = pixel.y, .depth = depth};
}

// -----------------------------------------------------------------
// Inverse ray
//
// pixel → NDC → view-space direction (ndcX·tan(fov/2)·aspect, ndcY·tan(fov/2), -1)
//       → observer frame via viewᵀ → catalog frame via rotationᵀ
// -----------------------------------------------------------------

std::optional<Vec3d> FrameTransform::cursor_ray(f64 px, f64 py) const
{
    const f64 aspect = m_viewport.aspect();
    if (!m_viewport.contains(px, py) || !(aspect > 0.0) || !(m_fov_deg > 0.0 && m_fov_deg < 180.0))
    {
        return std::nullopt;
    }

    const f64 ndc_x = 2.0 * px / m_viewport.width - 1.0;
    const f64 ndc_y = 1.0 - 2.0 * py / m_viewport.height;
    const f64 tan_half = std::tan(glm::radians(m_fov_deg) * 0.5);

    const Vec3d eye_dir{ndc_x * tan_half * aspect, ndc_y * tan_half, -1.0};
    const Vec3d observer = Vec3d(glm::transpose(m_view) * Vec4d(eye_dir, 0.0));

    return glm::normalize(to_catalog(observer));
}

} // namespace skydome::rendering
