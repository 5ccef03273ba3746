/**
 * @file test_group_properties.cpp
 * @brief Tests for element groups, weld parameters and centroid/inertia
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "connex/element_group.hpp"
#include "connex/group_properties.hpp"
#include "connex/errors.hpp"

#include <Eigen/Dense>
#include <limits>
#include <vector>

using namespace connex;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {

ElementGroup square_pattern() {
    return ElementGroup::fasteners({
        Eigen::Vector2d(-50.0, -50.0), Eigen::Vector2d(50.0, -50.0),
        Eigen::Vector2d(50.0, 50.0), Eigen::Vector2d(-50.0, 50.0)
    }, 20.0);
}

/// Straight weld along z from z0 to z1 at y, split into n segments
std::vector<WeldSegment> line_weld(double y, double z0, double z1, int n) {
    std::vector<WeldSegment> segments;
    const double ds = (z1 - z0) / n;
    for (int i = 0; i < n; ++i) {
        segments.push_back({Eigen::Vector2d(y, z0 + (i + 0.5) * ds), ds,
                            Eigen::Vector2d(0.0, 1.0)});
    }
    return segments;
}

} // namespace

TEST_CASE("ElementGroup: fastener construction", "[ElementGroup]") {
    ElementGroup group = square_pattern();

    CHECK(group.is_fastener());
    CHECK(group.size() == 4);
    CHECK(group.weight(0) == 1.0);
    CHECK(group.fastener_diameter() == 20.0);
    CHECK(group.characteristic_size() == 20.0);
}

TEST_CASE("ElementGroup: empty group is degenerate", "[ElementGroup][errors]") {
    CHECK_THROWS_AS(ElementGroup::fasteners({}), DegenerateGeometryError);
    CHECK_THROWS_AS(ElementGroup::weld({}, WeldParameters::fillet(6.0)), DegenerateGeometryError);
}

TEST_CASE("ElementGroup: invalid input is a usage error", "[ElementGroup][errors]") {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    CHECK_THROWS_AS(ElementGroup::fasteners({Eigen::Vector2d(nan, 0.0)}), InvalidModeError);
    CHECK_THROWS_AS(ElementGroup::fasteners({Eigen::Vector2d(0.0, 0.0)}, -1.0), InvalidModeError);

    // No leg and no throat
    WeldParameters params;
    CHECK_THROWS_AS(ElementGroup::weld(line_weld(0.0, 0.0, 100.0, 10), params), InvalidModeError);

    // Zero-length segment
    std::vector<WeldSegment> bad = {{Eigen::Vector2d(0.0, 0.0), 0.0, Eigen::Vector2d(0.0, 1.0)}};
    CHECK_THROWS_AS(ElementGroup::weld(bad, WeldParameters::fillet(6.0)), InvalidModeError);
}

TEST_CASE("WeldParameters: fillet throat derived from leg", "[ElementGroup][weld]") {
    WeldParameters params = WeldParameters::fillet(8.0);
    CHECK_THAT(params.throat, WithinAbs(8.0 * 0.707, 1e-12));

    WeldParameters from_throat;
    from_throat.throat = 7.07;
    from_throat = from_throat.resolved();
    CHECK_THAT(from_throat.leg, WithinAbs(10.0, 1e-9));
}

TEST_CASE("WeldParameters: electrode label sets F_EXX", "[ElementGroup][weld]") {
    CHECK(parse_electrode_strength("E70") == 70.0);
    CHECK(parse_electrode_strength("E80XX") == 80.0);
    CHECK(parse_electrode_strength("none") == 0.0);

    WeldParameters params = WeldParameters::fillet(6.0);
    params.electrode = "E49";
    params.F_EXX = 0.0;
    CHECK(params.resolved().F_EXX == 49.0);
}

TEST_CASE("ElementGroup: weld tangents are normalized", "[ElementGroup][weld]") {
    std::vector<WeldSegment> segments = {
        {Eigen::Vector2d(0.0, 0.0), 10.0, Eigen::Vector2d(0.0, 5.0)}
    };
    ElementGroup weld = ElementGroup::weld(segments, WeldParameters::fillet(10.0));

    CHECK_THAT(weld.element(0).tangent.norm(), WithinAbs(1.0, 1e-12));
    CHECK_THAT(weld.weight(0), WithinAbs(7.07 * 10.0, 1e-9));
    CHECK(weld.characteristic_size() == 10.0);
}

TEST_CASE("GroupProperties: square fastener pattern", "[GroupProperties]") {
    GroupProperties props = compute_group_properties(square_pattern());

    CHECK(props.n == 4);
    CHECK_THAT(props.total_weight, WithinAbs(4.0, 1e-12));
    CHECK_THAT(props.Cy(), WithinAbs(0.0, 1e-12));
    CHECK_THAT(props.Cz(), WithinAbs(0.0, 1e-12));
    CHECK_THAT(props.Iy, WithinAbs(10000.0, 1e-9));
    CHECK_THAT(props.Iz, WithinAbs(10000.0, 1e-9));
    CHECK_THAT(props.Ip, WithinAbs(20000.0, 1e-9));
}

TEST_CASE("GroupProperties: asymmetric pattern centroid", "[GroupProperties]") {
    ElementGroup group = ElementGroup::fasteners({
        Eigen::Vector2d(0.0, 0.0), Eigen::Vector2d(90.0, 0.0), Eigen::Vector2d(0.0, 60.0)
    });
    GroupProperties props = compute_group_properties(group);

    CHECK_THAT(props.Cy(), WithinAbs(30.0, 1e-12));
    CHECK_THAT(props.Cz(), WithinAbs(20.0, 1e-12));

    // Iz = Σ dy² = 30² + 60² + 30², Iy = Σ dz² = 20² + 20² + 40²
    CHECK_THAT(props.Iz, WithinAbs(5400.0, 1e-9));
    CHECK_THAT(props.Iy, WithinAbs(2400.0, 1e-9));
}

TEST_CASE("GroupProperties: centroid invariance under translation", "[GroupProperties]") {
    ElementGroup group = ElementGroup::fasteners({
        Eigen::Vector2d(0.0, 0.0), Eigen::Vector2d(90.0, 0.0),
        Eigen::Vector2d(0.0, 60.0), Eigen::Vector2d(75.0, 80.0)
    });
    const Eigen::Vector2d offset(123.4, -56.7);

    GroupProperties a = compute_group_properties(group);
    GroupProperties b = compute_group_properties(group.translated(offset));

    CHECK_THAT(b.Cy(), WithinAbs(a.Cy() + offset(0), 1e-9));
    CHECK_THAT(b.Cz(), WithinAbs(a.Cz() + offset(1), 1e-9));
    CHECK_THAT(b.Iy, WithinRel(a.Iy, 1e-9));
    CHECK_THAT(b.Iz, WithinRel(a.Iz, 1e-9));
    CHECK_THAT(b.Ip, WithinRel(a.Ip, 1e-9));
}

TEST_CASE("GroupProperties: weld line includes segment own inertia", "[GroupProperties][weld]") {
    // Single line of length L = 200 along z; Iy = a·L³/12 for any segment count
    const double leg = 10.0;
    const double a = leg * 0.707;
    ElementGroup weld = ElementGroup::weld(line_weld(0.0, -100.0, 100.0, 8),
                                           WeldParameters::fillet(leg));
    GroupProperties props = compute_group_properties(weld);

    CHECK_THAT(props.total_length, WithinAbs(200.0, 1e-9));
    CHECK_THAT(props.total_weight, WithinAbs(a * 200.0, 1e-9));
    CHECK_THAT(props.Cz(), WithinAbs(0.0, 1e-9));
    CHECK_THAT(props.Iy, WithinRel(a * 200.0 * 200.0 * 200.0 / 12.0, 1e-9));
    CHECK_THAT(props.Iz, WithinAbs(0.0, 1e-9));
}

TEST_CASE("GroupProperties: single fastener has zero polar moment", "[GroupProperties]") {
    GroupProperties props = compute_group_properties(
        ElementGroup::fasteners({Eigen::Vector2d(0.0, 0.0)}));
    CHECK(props.Ip == 0.0);
}
