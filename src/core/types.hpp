#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include <cstdint>

namespace skydome
{
    // Precision aliases
    using f32 = float;
    using f64 = double;
    using u32 = uint32_t;
    using i32 = int32_t;

    // Vector types (double precision for astronomy)
    using Vec2d = glm::dvec2;
    using Vec3d = glm::dvec3;
    using Vec4d = glm::dvec4;
    using Mat3d = glm::dmat3;
    using Mat4d = glm::dmat4;

    // Vector types (float for rendering)
    using Vec2f = glm::vec2;

    // Astronomical constants
    namespace astro_constants
    {
        constexpr f64 kPi          = glm::pi<f64>();
        constexpr f64 kTwoPi       = 2.0 * kPi;
        constexpr f64 kHalfPi      = kPi / 2.0;
        constexpr f64 kDegToRad    = kPi / 180.0;
        constexpr f64 kRadToDeg    = 180.0 / kPi;
        constexpr f64 kHourToRad   = kPi / 12.0;
        constexpr f64 kRadToHour   = 12.0 / kPi;
        constexpr f64 kHourToDeg   = 15.0;
        constexpr f64 kJ2000       = 2451545.0;  // Julian Date of J2000.0 epoch
        constexpr f64 kSecondsPerDay = 86400.0;
        constexpr f64 kSiderealDaySeconds = 86164.0905; // 23h 56m 4.0905s
    }
}
