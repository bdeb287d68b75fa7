/// @file test_sky_overlays.cpp
/// @brief Unit tests for grid line geometry and constellation label placement.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "astro/coordinates.hpp"
#include "catalog/constellations.hpp"
#include "core/types.hpp"
#include "rendering/camera.hpp"
#include "rendering/projection.hpp"
#include "rendering/sky_grid.hpp"
#include "rendering/sky_labels.hpp"

#include <glm/geometric.hpp>

#include <cmath>
#include <limits>
#include <string>
#include <vector>

using namespace skydome;
using namespace skydome::astro;
using namespace skydome::catalog;
using namespace skydome::rendering;

static constexpr f64 kVecTol = 1e-9;
static constexpr Viewport kViewport{.width = 1280.0, .height = 720.0};

static bool approx_equal(const Vec3d& a, const Vec3d& b, f64 tol = kVecTol)
{
    return std::abs(a.x - b.x) < tol && std::abs(a.y - b.y) < tol && std::abs(a.z - b.z) < tol;
}

static void check_unit(const Polyline& line)
{
    for (const auto& point : line)
    {
        CHECK(glm::length(point) == doctest::Approx(1.0).epsilon(1e-12));
    }
}

// =================================================================
// Grid lines
// =================================================================

TEST_CASE("Altitude circle: closed strip at constant altitude")
{
    const Polyline line = SkyGrid::altitude_circle(30.0);

    REQUIRE(line.size() == SkyGrid::kCircleSegments + 1);
    CHECK(approx_equal(line.front(), line.back()));
    check_unit(line);

    for (const auto& point : line)
    {
        CHECK(Coordinates::cartesian_to_horizontal(point).alt == doctest::Approx(30.0).epsilon(1e-9));
    }
}

TEST_CASE("Azimuth arc runs from the horizon to the zenith")
{
    const Polyline line = SkyGrid::azimuth_arc(90.0);

    REQUIRE(line.size() == SkyGrid::kArcSegments + 1);
    check_unit(line);

    // Due east on the horizon, then straight up
    CHECK(approx_equal(line.front(), Vec3d{1.0, 0.0, 0.0}));
    CHECK(approx_equal(line.back(), Vec3d{0.0, 1.0, 0.0}));
}

TEST_CASE("Declination circle keeps its declination")
{
    const Polyline line = SkyGrid::declination_circle(-30.0);

    REQUIRE(line.size() == SkyGrid::kCircleSegments + 1);
    CHECK(approx_equal(line.front(), line.back()));
    check_unit(line);

    for (const auto& point : line)
    {
        CHECK(Coordinates::cartesian_to_equatorial(point).dec == doctest::Approx(-30.0).epsilon(1e-9));
    }
}

TEST_CASE("Hour circle joins the celestial poles")
{
    const Polyline line = SkyGrid::hour_circle(6.0);

    REQUIRE(line.size() == SkyGrid::kCircleSegments + 1);
    check_unit(line);
    CHECK(approx_equal(line.front(), Vec3d{0.0, -1.0, 0.0}));
    CHECK(approx_equal(line.back(), Vec3d{0.0, 1.0, 0.0}));

    // Equator crossing sits at RA 6h (+z in the catalog frame)
    CHECK(approx_equal(line[SkyGrid::kCircleSegments / 2], Vec3d{0.0, 0.0, 1.0}));
}

TEST_CASE("Zero segments still produce a drawable strip")
{
    CHECK(SkyGrid::altitude_circle(0.0, 0).size() == 2);
    CHECK(SkyGrid::hour_circle(0.0, 0).size() == 2);
}

TEST_CASE("Full grid")
{
    const GridGeometry grid = SkyGrid::build();

    CHECK(grid.altitude_circles.size() == SkyGrid::kAltitudesDeg.size());
    CHECK(grid.azimuth_arcs.size() == SkyGrid::kAzimuthsDeg.size());
    CHECK(grid.declination_circles.size() == SkyGrid::kDeclinationsDeg.size());
    CHECK(grid.hour_circles.size() == SkyGrid::kHourCirclesHours.size());

    SUBCASE("Horizon is a finer circle in the horizontal plane")
    {
        REQUIRE(grid.horizon.size() == SkyGrid::kHorizonSegments + 1);
        for (const auto& point : grid.horizon)
        {
            CHECK(std::abs(point.y) < kVecTol);
        }
    }

    SUBCASE("Cardinal points: N first, clockwise")
    {
        CHECK(grid.cardinals[0].label == "N");
        CHECK(approx_equal(grid.cardinals[0].position, Vec3d{0.0, 0.0, 1.0}));
        CHECK(grid.cardinals[2].label == "E");
        CHECK(approx_equal(grid.cardinals[2].position, Vec3d{1.0, 0.0, 0.0}));
        CHECK(grid.cardinals[4].label == "S");
        CHECK(grid.cardinals[6].label == "W");
        CHECK(grid.cardinals[7].label == "NW");
    }
}

// =================================================================
// Label placement
//
// Identity rotation: the catalog frame coincides with the observer
// frame, so centers can be placed by altitude and azimuth.
// =================================================================

static const HorizontalCoord kAim{.alt = 30.0, .az = 0.0};

static FrameTransform make_frame()
{
    Camera camera;
    camera.look_at(kAim);
    return FrameTransform(camera.state(), Mat4d(1.0), camera.get_fov_deg(), kViewport);
}

static ConstellationCenter make_center(const std::string& id, f64 alt, f64 az)
{
    return ConstellationCenter{
        .id = id,
        .name = id,
        .equatorial = EquatorialCoord{.ra = 0.0, .dec = 0.0},
        .position = Coordinates::horizontal_to_cartesian({.alt = alt, .az = az}),
    };
}

TEST_CASE("Center at the view direction gets a fully opaque label")
{
    const std::vector<ConstellationCenter> centers = {make_center("Mid", kAim.alt, kAim.az)};
    const auto labels = SkyLabels::select(centers, make_frame());

    REQUIRE(labels.size() == 1);
    CHECK(labels[0].center == &centers[0]);
    CHECK(labels[0].x == doctest::Approx(kViewport.width * 0.5 + SkyLabels::kOffsetX));
    CHECK(labels[0].y == doctest::Approx(kViewport.height * 0.5 + SkyLabels::kOffsetY));
    CHECK(labels[0].distance == doctest::Approx(0.0).epsilon(1e-9));
    CHECK(labels[0].opacity == doctest::Approx(1.0f));
}

TEST_CASE("Centers behind the camera or far off screen are skipped")
{
    const std::vector<ConstellationCenter> centers = {
        make_center("Behind", -30.0, 180.0),
        make_center("Edge", 30.0, 80.0),
    };
    CHECK(SkyLabels::select(centers, make_frame()).empty());
}

TEST_CASE("At most ten labels, nearest to the screen center first")
{
    // Listed farthest first to exercise the sort
    std::vector<ConstellationCenter> centers;
    for (int offset = 12; offset >= 1; --offset)
    {
        centers.push_back(make_center("C" + std::to_string(offset), kAim.alt, static_cast<f64>(offset)));
    }

    const auto labels = SkyLabels::select(centers, make_frame());

    REQUIRE(labels.size() == SkyLabels::kMaxLabels);
    CHECK(labels.front().center->id == "C1");
    CHECK(labels.back().center->id == "C10");
    for (std::size_t i = 1; i < labels.size(); ++i)
    {
        CHECK(labels[i - 1].distance <= labels[i].distance);
    }
}

TEST_CASE("Degenerate viewport places nothing")
{
    Camera camera;
    const FrameTransform frame(camera.state(), Mat4d(1.0), camera.get_fov_deg(), Viewport{.width = 0.0, .height = 0.0});
    const std::vector<ConstellationCenter> centers = {make_center("Mid", 45.0, 0.0)};
    CHECK(SkyLabels::select(centers, frame).empty());
}

TEST_CASE("Label opacity fades between 0.35 and 0.9")
{
    CHECK(SkyLabels::opacity(0.0) == doctest::Approx(1.0f));
    CHECK(SkyLabels::opacity(0.35) == doctest::Approx(1.0f));
    CHECK(SkyLabels::opacity(0.625) == doctest::Approx(0.5f));
    CHECK(SkyLabels::opacity(0.9) == doctest::Approx(0.0f));
    CHECK(SkyLabels::opacity(1.5) == doctest::Approx(0.0f));
    CHECK(SkyLabels::opacity(std::numeric_limits<f64>::quiet_NaN()) == doctest::Approx(0.0f));
}
