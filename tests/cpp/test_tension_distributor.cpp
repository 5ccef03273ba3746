/**
 * @file test_tension_distributor.cpp
 * @brief Tests for the bearing plate and the neutral-axis tension method
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "connex/tension_distributor.hpp"
#include "connex/errors.hpp"

#include <Eigen/Dense>
#include <string>
#include <vector>

using namespace connex;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {

/// Rows of two fasteners (y = ±50) at the given z coordinates
ElementGroup rows_at(const std::vector<double>& z_rows) {
    std::vector<Eigen::Vector2d> positions;
    for (double z : z_rows) {
        positions.emplace_back(-50.0, z);
        positions.emplace_back(50.0, z);
    }
    return ElementGroup::fasteners(positions, 20.0);
}

Load moments(double My, double Mz, double Fx = 0.0) {
    return Load(Eigen::Vector3d(Fx, 0.0, 0.0), Eigen::Vector3d(0.0, My, Mz));
}

TensionDistribution distribute(const ElementGroup& group, const BearingPlate& plate,
                               const Load& load,
                               const TensionDistributorSettings& settings = TensionDistributorSettings()) {
    NeutralAxisTensionDistributor distributor(group, compute_group_properties(group),
                                              plate, settings);
    return distributor.distribute(load);
}

} // namespace

// =============================================================================
// BearingPlate
// =============================================================================

TEST_CASE("BearingPlate: corners in any order", "[BearingPlate]") {
    BearingPlate plate(Eigen::Vector2d(100.0, -20.0), Eigen::Vector2d(-100.0, 180.0), 12.0);

    CHECK(plate.y_min() == -100.0);
    CHECK(plate.y_max() == 100.0);
    CHECK(plate.z_min() == -20.0);
    CHECK(plate.z_max() == 180.0);
    CHECK(plate.depth_y() == 200.0);
    CHECK(plate.depth_z() == 200.0);
    CHECK(plate.thickness() == 12.0);
}

TEST_CASE("BearingPlate: from_dimensions maps width to y", "[BearingPlate]") {
    BearingPlate plate = BearingPlate::from_dimensions(300.0, 200.0, Eigen::Vector2d(10.0, 0.0));

    CHECK_THAT(plate.y_min(), WithinAbs(-140.0, 1e-12));
    CHECK_THAT(plate.y_max(), WithinAbs(160.0, 1e-12));
    CHECK_THAT(plate.depth_z(), WithinAbs(200.0, 1e-12));
    CHECK(plate.contains(Eigen::Vector2d(160.0, 100.0)));
    CHECK_FALSE(plate.contains(Eigen::Vector2d(161.0, 0.0)));
}

TEST_CASE("BearingPlate: zero depth is degenerate", "[BearingPlate][errors]") {
    try {
        BearingPlate plate(Eigen::Vector2d(0.0, 0.0), Eigen::Vector2d(100.0, 0.0));
        FAIL("Expected DegenerateGeometryError");
    } catch (const DegenerateGeometryError& e) {
        CHECK(e.code() == ErrorCode::DEGENERATE_PLATE);
    }
    CHECK_THROWS_AS(BearingPlate::from_dimensions(100.0, 100.0, Eigen::Vector2d::Zero(), -1.0),
                    InvalidModeError);
}

// =============================================================================
// Neutral-axis method
// =============================================================================

TEST_CASE("NeutralAxis: mode strings", "[TensionDistributor][modes]") {
    CHECK(parse_neutral_axis_mode("conservative") == NeutralAxisMode::Conservative);
    CHECK(parse_neutral_axis_mode("Accurate") == NeutralAxisMode::Accurate);
    CHECK(neutral_axis_mode_to_string(NeutralAxisMode::Accurate) == "accurate");

    try {
        parse_neutral_axis_mode("plastic");
        FAIL("Expected InvalidModeError");
    } catch (const InvalidModeError& e) {
        CHECK(e.code() == ErrorCode::UNKNOWN_MODE);
    }
}

TEST_CASE("NeutralAxis: two rows, conservative, uniaxial My", "[TensionDistributor][conservative]") {
    ElementGroup group = rows_at({-100.0, 100.0});
    BearingPlate plate = BearingPlate::from_dimensions(200.0, 200.0);

    TensionDistribution result = distribute(group, plate, moments(5.0e6, 0.0));

    const auto& diag = result.about_y;
    CHECK(diag.active);
    CHECK_THAT(diag.neutral_axis, WithinAbs(0.0, 1e-12));
    CHECK_THAT(diag.compression_edge, WithinAbs(-100.0, 1e-12));
    CHECK_THAT(diag.y_1, WithinAbs(100.0, 1e-12));
    CHECK_THAT(diag.y_c, WithinAbs(-100.0, 1e-12));

    // T_1 = M / Σ y_i (y_i/y_1 − y_c/y_1) = 5e6 / (100 · 2)
    CHECK_THAT(diag.T_1, WithinRel(25000.0, 1e-12));
    CHECK(diag.tension_rows == 1);
    CHECK(diag.compression_rows == 1);

    // Tension row at z = +100 shares T_1; compression row clamps to zero
    CHECK_THAT(result.tensions[2], WithinRel(12500.0, 1e-12));
    CHECK_THAT(result.tensions[3], WithinRel(12500.0, 1e-12));
    CHECK(result.tensions[0] == 0.0);
    CHECK(result.tensions[1] == 0.0);

    // Signed contribution before clamping
    CHECK_THAT(diag.contributions[0], WithinRel(-12500.0, 1e-12));

    CHECK_FALSE(result.about_z.active);
    CHECK_FALSE(result.warnings.has_warnings());
}

TEST_CASE("NeutralAxis: negative moment flips the tension side", "[TensionDistributor][conservative]") {
    ElementGroup group = rows_at({-100.0, 100.0});
    BearingPlate plate = BearingPlate::from_dimensions(200.0, 200.0);

    TensionDistribution result = distribute(group, plate, moments(-5.0e6, 0.0));

    CHECK_THAT(result.about_y.compression_edge, WithinAbs(100.0, 1e-12));
    CHECK_THAT(result.tensions[0], WithinRel(12500.0, 1e-12));
    CHECK_THAT(result.tensions[1], WithinRel(12500.0, 1e-12));
    CHECK(result.tensions[2] == 0.0);
    CHECK(result.tensions[3] == 0.0);
}

TEST_CASE("NeutralAxis: three rows, accurate mode", "[TensionDistributor][accurate]") {
    ElementGroup group = rows_at({-100.0, 0.0, 100.0});
    BearingPlate plate = BearingPlate::from_dimensions(200.0, 200.0);

    TensionDistributorSettings settings;
    settings.mode = NeutralAxisMode::Accurate;
    TensionDistribution result = distribute(group, plate, moments(4.8e6, 0.0), settings);

    const auto& diag = result.about_y;
    // NA at depth/6 above the compression edge
    CHECK_THAT(diag.neutral_axis, WithinAbs(-100.0 + 200.0 / 6.0, 1e-9));
    CHECK_THAT(diag.y_c, WithinAbs(-200.0 / 6.0, 1e-9));
    CHECK_THAT(diag.y_1, WithinAbs(100.0 + 200.0 / 3.0, 1e-9));
    CHECK(diag.tension_rows == 2);
    CHECK(diag.compression_rows == 1);

    // Σ y_i (y_i/y_1 − y_c/y_1) = 200 + 40
    CHECK_THAT(diag.T_1, WithinRel(20000.0, 1e-9));

    // Top row T_1, middle row 0.4·T_1, split over two fasteners
    CHECK_THAT(result.tensions[4], WithinRel(10000.0, 1e-9));
    CHECK_THAT(result.tensions[5], WithinRel(10000.0, 1e-9));
    CHECK_THAT(result.tensions[2], WithinRel(4000.0, 1e-9));
    CHECK_THAT(result.tensions[3], WithinRel(4000.0, 1e-9));
    CHECK(result.tensions[0] == 0.0);
    CHECK(result.tensions[1] == 0.0);
    CHECK_THAT(diag.contributions[0], WithinRel(-2000.0, 1e-9));
}

TEST_CASE("NeutralAxis: three rows, conservative mode, row on the neutral axis", "[TensionDistributor][conservative]") {
    ElementGroup group = rows_at({-100.0, 0.0, 100.0});
    BearingPlate plate = BearingPlate::from_dimensions(200.0, 200.0);

    TensionDistribution result = distribute(group, plate, moments(4.8e6, 0.0));

    CHECK(result.about_y.tension_rows == 1);
    CHECK(result.about_y.compression_rows == 1);
    CHECK_THAT(result.about_y.T_1, WithinRel(24000.0, 1e-12));
    CHECK_THAT(result.tensions[4], WithinRel(12000.0, 1e-12));
    CHECK(result.tensions[2] == 0.0);
    CHECK(result.tensions[3] == 0.0);
}

TEST_CASE("NeutralAxis: Mz puts tension on the +y side", "[TensionDistributor]") {
    ElementGroup group = rows_at({-50.0, 50.0});
    BearingPlate plate = BearingPlate::from_dimensions(200.0, 200.0);

    TensionDistribution result = distribute(group, plate, moments(0.0, 3.0e6));

    CHECK(result.about_z.active);
    CHECK_FALSE(result.about_y.active);
    CHECK_THAT(result.about_z.compression_edge, WithinAbs(-100.0, 1e-12));

    // y = +50 fasteners are indices 1 and 3
    CHECK(result.tensions[1] > 0.0);
    CHECK(result.tensions[3] > 0.0);
    CHECK(result.tensions[0] == 0.0);
    CHECK(result.tensions[2] == 0.0);
    CHECK_THAT(result.tensions[1], WithinRel(result.tensions[3], 1e-12));
}

TEST_CASE("NeutralAxis: biaxial cancellation before clamping", "[TensionDistributor][biaxial]") {
    // 2×2 grid: index 0 (−50, −50), 1 (50, −50), 2 (−50, 50), 3 (50, 50)
    ElementGroup group = rows_at({-50.0, 50.0});
    BearingPlate plate = BearingPlate::from_dimensions(200.0, 200.0);
    const double M = 3.0e6;

    SECTION("My alone loads the +z row") {
        TensionDistribution result = distribute(group, plate, moments(M, 0.0));
        CHECK(result.tensions[2] > 0.0);
        CHECK(result.tensions[3] > 0.0);
        CHECK(result.tensions[0] == 0.0);
        CHECK(result.tensions[1] == 0.0);
    }

    SECTION("Opposite Mz cancels tension on the +y fasteners") {
        TensionDistribution alone = distribute(group, plate, moments(M, 0.0));
        TensionDistribution result = distribute(group, plate, moments(M, -M));

        // (50, 50): +t from My, −t from Mz
        CHECK_THAT(result.tensions[3], WithinAbs(0.0, 1e-9));
        CHECK_THAT(result.about_y.contributions[3] + result.about_z.contributions[3],
                   WithinAbs(0.0, 1e-9));

        // (−50, −50): −t from My, +t from Mz, cancelled rather than clamped
        CHECK_THAT(result.about_y.contributions[0] + result.about_z.contributions[0],
                   WithinAbs(0.0, 1e-9));

        // (−50, 50): tension from both axes
        CHECK_THAT(result.tensions[2], WithinRel(2.0 * alone.tensions[2], 1e-12));

        // (50, −50): compression from both axes, clamped
        CHECK(result.tensions[1] == 0.0);
    }
}

TEST_CASE("NeutralAxis: biaxial cancellation on a four-row grid", "[TensionDistributor][biaxial]") {
    // 4×4 grid at ±50, ±150 in both directions; index = 4·row(z) + column(y)
    const std::vector<double> coords = {-150.0, -50.0, 50.0, 150.0};
    std::vector<Eigen::Vector2d> positions;
    for (double z : coords) {
        for (double y : coords) {
            positions.emplace_back(y, z);
        }
    }
    ElementGroup group = ElementGroup::fasteners(positions, 20.0);
    BearingPlate plate = BearingPlate::from_dimensions(400.0, 400.0);
    const double M = 4.0e6;

    TensionDistribution result = distribute(group, plate, moments(M, -M));

    // Σ y_i (y_i/y_1 − y_c/y_1) with y_1 = 150, y_c = −200
    const double T_1 = M / (150.0 * 350.0 / 150.0 + 50.0 * 250.0 / 150.0);
    CHECK_THAT(result.about_y.T_1, WithinRel(T_1, 1e-12));
    CHECK_THAT(result.about_z.T_1, WithinRel(T_1, 1e-12));
    CHECK(result.about_y.tension_rows == 2);
    CHECK(result.about_y.compression_rows == 2);

    auto at = [](size_t row, size_t column) { return 4 * row + column; };

    // Diagonal y = z: equal and opposite shares, inner rows included
    for (size_t k = 0; k < 4; ++k) {
        const size_t i = at(k, k);
        CHECK_THAT(result.about_y.contributions[i] + result.about_z.contributions[i],
                   WithinAbs(0.0, 1e-9));
        CHECK_THAT(result.tensions[i], WithinAbs(0.0, 1e-9));
    }

    // (y, z) = (−150, 150): outer tension from both axes
    CHECK_THAT(result.tensions[at(3, 0)], WithinRel(T_1 / 2.0, 1e-12));
    // (50, 150): outer tension less inner compression
    CHECK_THAT(result.tensions[at(3, 2)], WithinRel(T_1 / 4.0 - T_1 / 12.0, 1e-12));
    // (−50, 50): inner tension from both axes
    CHECK_THAT(result.tensions[at(2, 1)], WithinRel(T_1 / 6.0, 1e-12));
    // (150, −150): compression from both axes, clamped
    CHECK(result.tensions[at(0, 3)] == 0.0);
}

TEST_CASE("NeutralAxis: no negative demand for any load", "[TensionDistributor]") {
    ElementGroup group = rows_at({-100.0, -30.0, 40.0, 100.0});
    BearingPlate plate = BearingPlate::from_dimensions(220.0, 260.0);

    for (double My : {-4.0e6, 0.0, 2.5e6}) {
        for (double Mz : {-1.0e6, 0.0, 3.0e6}) {
            for (double Fx : {-5000.0, 0.0, 8000.0}) {
                TensionDistribution result = distribute(group, plate, moments(My, Mz, Fx));
                for (double t : result.tensions) {
                    CHECK(t >= 0.0);
                }
            }
        }
    }
}

TEST_CASE("NeutralAxis: direct tension only", "[TensionDistributor]") {
    ElementGroup group = rows_at({-50.0, 50.0});
    BearingPlate plate = BearingPlate::from_dimensions(200.0, 200.0);

    TensionDistribution tension = distribute(group, plate, moments(0.0, 0.0, 4000.0));
    CHECK_THAT(tension.direct, WithinAbs(1000.0, 1e-12));
    for (double t : tension.tensions) {
        CHECK_THAT(t, WithinAbs(1000.0, 1e-12));
    }
    CHECK_FALSE(tension.about_y.active);
    CHECK_FALSE(tension.about_z.active);

    // Compression is carried by bearing
    TensionDistribution compression = distribute(group, plate, moments(0.0, 0.0, -4000.0));
    CHECK(compression.direct == 0.0);
    for (double t : compression.tensions) {
        CHECK(t == 0.0);
    }
}

TEST_CASE("NeutralAxis: eccentric axial force is transferred to the centroid", "[TensionDistributor]") {
    ElementGroup group = rows_at({-100.0, 100.0});
    BearingPlate plate = BearingPlate::from_dimensions(200.0, 200.0);

    // Fx = 4000 at z = +50 gives My = 200000 about the centroid
    Load load(Eigen::Vector3d(4000.0, 0.0, 0.0), Eigen::Vector3d::Zero(),
              Eigen::Vector3d(0.0, 0.0, 50.0));
    TensionDistribution result = distribute(group, plate, load);

    CHECK_THAT(result.about_y.moment, WithinRel(200000.0, 1e-12));
    // Direct 1000 ± 200000/200/2
    CHECK_THAT(result.tensions[2], WithinRel(1500.0, 1e-12));
    CHECK_THAT(result.tensions[0], WithinRel(500.0, 1e-12));
}

TEST_CASE("NeutralAxis: empty tension side is degenerate", "[TensionDistributor][errors]") {
    // Single row near the compression edge, inside the compression zone
    ElementGroup group = rows_at({-90.0});
    BearingPlate plate = BearingPlate::from_dimensions(200.0, 200.0);

    TensionDistributorSettings settings;
    settings.mode = NeutralAxisMode::Accurate;

    try {
        distribute(group, plate, moments(1.0e6, 0.0), settings);
        FAIL("Expected DegenerateGeometryError");
    } catch (const DegenerateGeometryError& e) {
        CHECK(e.code() == ErrorCode::EMPTY_TENSION_ROWS);
        CHECK(e.error().details.at("axis") == "y");
    }

    // A zero moment never reaches the row search
    Load concentric(Eigen::Vector3d(10.0, 0.0, 0.0), Eigen::Vector3d::Zero(),
                    Eigen::Vector3d(0.0, 0.0, -90.0));
    TensionDistribution result = distribute(group, plate, concentric, settings);
    CHECK_THAT(result.tensions[0], WithinAbs(5.0, 1e-12));
}

TEST_CASE("NeutralAxis: tolerance grouping merges near-equal rows", "[TensionDistributor][rows]") {
    std::vector<Eigen::Vector2d> positions = {
        Eigen::Vector2d(-50.0, -100.0), Eigen::Vector2d(50.0, -100.0),
        Eigen::Vector2d(-50.0, 100.0), Eigen::Vector2d(50.0, 100.0 + 1e-6)
    };
    ElementGroup group = ElementGroup::fasteners(positions);
    BearingPlate plate = BearingPlate::from_dimensions(200.0, 210.0);

    TensionDistribution result = distribute(group, plate, moments(5.0e6, 0.0));

    CHECK(result.about_y.tension_rows == 1);
    CHECK_THAT(result.tensions[2], WithinRel(result.tensions[3], 1e-9));
    CHECK(result.warnings.contains(WarningCode::ROWS_MERGED));
}

TEST_CASE("NeutralAxis: closely spaced run is not chained into one row", "[TensionDistributor][rows]") {
    // Eleven fasteners 1.5e-4 apart; tolerance 1e-6 × 201 = 2.01e-4
    std::vector<Eigen::Vector2d> positions;
    for (int k = 0; k < 11; ++k) {
        positions.emplace_back(0.0, 100.0 + 1.5e-4 * k);
    }
    positions.emplace_back(0.0, -100.0);
    ElementGroup group = ElementGroup::fasteners(positions);
    BearingPlate plate = BearingPlate::from_dimensions(200.0, 201.0);

    TensionDistribution result = distribute(group, plate, moments(1.0e6, 0.0));

    // Pairs {0,1} {2,3} {4,5} {6,7} {8,9} and {10}
    CHECK(result.about_y.tension_rows == 6);
    CHECK(result.about_y.compression_rows == 1);
    CHECK_THAT(result.tensions[0], WithinRel(result.tensions[1], 1e-12));
    CHECK(result.tensions[1] != result.tensions[2]);

    REQUIRE(result.warnings.contains(WarningCode::ROWS_MERGED));
    CHECK(std::stod(result.warnings.warnings[0].details.at("max_spread")) <= 2.01e-4);
}

TEST_CASE("NeutralAxis: explicit row membership", "[TensionDistributor][rows]") {
    // Staggered pattern treated as two rows by the caller
    std::vector<Eigen::Vector2d> positions = {
        Eigen::Vector2d(-50.0, -100.0), Eigen::Vector2d(50.0, -95.0),
        Eigen::Vector2d(-50.0, 95.0), Eigen::Vector2d(50.0, 105.0)
    };
    ElementGroup group = ElementGroup::fasteners(positions);
    BearingPlate plate = BearingPlate::from_dimensions(200.0, 220.0);

    TensionDistributorSettings settings;
    settings.rows_about_y = {0, 0, 1, 1};
    TensionDistribution result = distribute(group, plate, moments(5.0e6, 0.0), settings);

    CHECK(result.about_y.tension_rows == 1);
    CHECK(result.about_y.compression_rows == 1);
    CHECK_THAT(result.tensions[2], WithinRel(result.tensions[3], 1e-12));
    CHECK_FALSE(result.warnings.contains(WarningCode::ROWS_MERGED));

    settings.rows_about_y = {0, 1};
    try {
        NeutralAxisTensionDistributor bad(group, compute_group_properties(group), plate, settings);
        FAIL("Expected InvalidModeError");
    } catch (const InvalidModeError& e) {
        CHECK(e.code() == ErrorCode::INVALID_ROW_MEMBERSHIP);
    }
}

TEST_CASE("NeutralAxis: fastener outside the plate is flagged", "[TensionDistributor][warnings]") {
    ElementGroup group = rows_at({-100.0, 100.0});
    BearingPlate plate = BearingPlate::from_dimensions(80.0, 250.0);

    TensionDistribution result = distribute(group, plate, moments(1.0e6, 0.0));

    REQUIRE(result.warnings.contains(WarningCode::FASTENER_OUTSIDE_PLATE));
    CHECK(result.warnings.warnings[0].involved_elements.size() == 4);
}

TEST_CASE("NeutralAxis: weld groups are rejected", "[TensionDistributor][errors]") {
    std::vector<WeldSegment> segments = {
        {Eigen::Vector2d(0.0, 0.0), 10.0, Eigen::Vector2d(1.0, 0.0)}
    };
    ElementGroup weld = ElementGroup::weld(segments, WeldParameters::fillet(6.0));
    BearingPlate plate = BearingPlate::from_dimensions(100.0, 100.0);

    CHECK_THROWS_AS(NeutralAxisTensionDistributor(weld, compute_group_properties(weld), plate),
                    InvalidModeError);
}
