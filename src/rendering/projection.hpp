#pragma once

/// @file projection.hpp
/// @brief View/projection matrices and the per-frame catalog → screen transform.

#include "core/types.hpp"
#include "rendering/camera.hpp"

#include <array>
#include <optional>

namespace skydome::rendering
{
    /// @brief Drawable area in pixels, origin top-left, y down.
    struct Viewport
    {
        f64 width;
        f64 height;

        [[nodiscard]] f64 aspect() const { return height > 0.0 ? width / height : 0.0; }

        [[nodiscard]] bool contains(f64 x, f64 y) const
        {
            return x >= 0.0 && x <= width && y >= 0.0 && y <= height;
        }
    };

    /// @brief A projected point.
    struct ScreenPoint
    {
        f64 x;      ///< Pixels from the left edge
        f64 y;      ///< Pixels from the top edge
        f64 depth;  ///< Distance along the view direction (> 0 in front)
    };

    /// @brief Static helpers for the camera matrices.
    ///
    /// Conventions: right-handed view space looking down -z, OpenGL clip
    /// space (z in [-1, 1]).
    class Projection
    {
    public:
        Projection() = delete;

        static constexpr f64 kNearPlane = 0.1;
        static constexpr f64 kFarPlane = 10.0;

        /// @brief Perspective matrix from a vertical FOV in degrees.
        ///
        /// Defined for fov ∈ (0, 180) and aspect > 0. Outside that domain
        /// every element is NaN, so anything projected with it comes out
        /// "not visible" instead of producing a bogus position.
        [[nodiscard]] static Mat4d perspective(f64 fov_deg, f64 aspect,
                                               f64 near_plane = kNearPlane, f64 far_plane = kFarPlane);

        /// @brief View matrix for a camera orientation.
        ///
        /// Rows are the camera right, up and backward vectors expressed in
        /// the observer frame. Orthogonal: its transpose is its inverse.
        [[nodiscard]] static Mat4d view(const CameraState& camera);

        /// @brief Unit view direction in the observer frame.
        [[nodiscard]] static Vec3d forward(const CameraState& camera);

        /// @brief Flatten to 16 floats in column-major order.
        [[nodiscard]] static std::array<f32, 16> to_column_major(const Mat4d& m);
    };

    /// @brief Snapshot of everything needed to map catalog points to pixels
    ///        for one frame.
    ///
    /// Composition is fixed: clip = projection · view · rotation · point.
    /// The inverse path (cursor_ray) undoes view and rotation by transpose,
    /// which is only valid while both stay pure rotations.
    class FrameTransform
    {
    public:
        FrameTransform(const CameraState& camera, const Mat4d& rotation, f64 fov_deg, const Viewport& viewport);

        /// @brief Project a catalog-frame unit vector.
        /// @return nullopt if below the horizon, behind the camera, outside
        ///         the viewport, or not finite.
        [[nodiscard]] std::optional<ScreenPoint> project(const Vec3d& catalog_point) const;

        /// @brief Project an observer-frame point. No horizon test.
        /// @param clip_to_viewport Reject points outside the viewport.
        /// @return nullopt if behind the camera or not finite.
        [[nodiscard]] std::optional<ScreenPoint> project_observer(const Vec3d& observer_point,
                                                                  bool clip_to_viewport = true) const;

        /// @brief Homogeneous clip coordinates of a catalog-frame point.
        [[nodiscard]] Vec4d clip(const Vec3d& catalog_point) const;

        /// @brief NDC (x, y) → pixel coordinates.
        [[nodiscard]] Vec2d ndc_to_pixel(const Vec2d& ndc) const;

        /// @brief Catalog-frame unit direction under a pixel.
        /// @return nullopt when the pixel is outside the viewport or the
        ///         projection is degenerate.
        [[nodiscard]] std::optional<Vec3d> cursor_ray(f64 px, f64 py) const;

        /// @brief Catalog frame → observer frame.
        [[nodiscard]] Vec3d to_observer(const Vec3d& catalog_point) const;

        /// @brief Observer frame → catalog frame (transpose of the rotation).
        [[nodiscard]] Vec3d to_catalog(const Vec3d& observer_point) const;

        [[nodiscard]] const CameraState& camera() const { return m_camera; }
        [[nodiscard]] const Viewport& viewport() const { return m_viewport; }
        [[nodiscard]] f64 fov_deg() const { return m_fov_deg; }
        [[nodiscard]] const Mat4d& rotation() const { return m_rotation; }
        [[nodiscard]] const Mat4d& view() const { return m_view; }
        [[nodiscard]] const Mat4d& projection() const { return m_projection; }

        /// @brief projection · view · rotation (catalog-frame geometry).
        [[nodiscard]] const Mat4d& mvp() const { return m_mvp; }

    private:
        [[nodiscard]] std::optional<ScreenPoint> finish(const Vec3d& observer_point, bool clip_to_viewport) const;

        CameraState m_camera;
        Viewport m_viewport;
        f64 m_fov_deg;
        Mat4d m_rotation;
        Mat4d m_view;
        Mat4d m_projection;
        Mat4d m_mvp;
    };

} // namespace skydome::rendering
