#pragma once

#include "connex/bearing_plate.hpp"
#include "connex/element_group.hpp"
#include "connex/group_properties.hpp"
#include "connex/load.hpp"
#include "connex/warnings.hpp"
#include <string>
#include <vector>

namespace connex {

/**
 * @brief Neutral-axis placement for the plate tension method
 */
enum class NeutralAxisMode {
    Conservative,   ///< Neutral axis at the fastener-group centroid
    Accurate        ///< Neutral axis at depth/6 from the compression edge
};

std::string neutral_axis_mode_to_string(NeutralAxisMode mode);

/**
 * @brief Parse "conservative" or "accurate" (case-insensitive)
 *
 * @throws InvalidModeError for any other string
 */
NeutralAxisMode parse_neutral_axis_mode(const std::string& mode);

/**
 * @brief Bending axis of a moment component
 *
 * Bending about y (My) varies with fastener z and uses the plate z-extent.
 * Bending about z (Mz) varies with fastener y and uses the plate y-extent.
 */
enum class BendingAxis {
    Y,
    Z
};

std::string bending_axis_to_string(BendingAxis axis);

/**
 * @brief Settings for the neutral-axis tension distributor
 */
struct TensionDistributorSettings {
    NeutralAxisMode mode = NeutralAxisMode::Conservative;

    /// Fasteners whose coordinates differ by at most row_tolerance × plate
    /// depth belong to the same row
    double row_tolerance = 1e-6;

    /// Moments and direct tension at or below this magnitude are skipped
    double zero_tolerance = 1e-12;

    /// Optional explicit row id per fastener for bending about y.
    /// Empty = group by coordinate.
    std::vector<int> rows_about_y;

    /// Optional explicit row id per fastener for bending about z.
    /// Empty = group by coordinate.
    std::vector<int> rows_about_z;
};

/**
 * @brief Intermediate quantities of one bending axis
 */
struct AxisTensionDiagnostics {
    BendingAxis axis = BendingAxis::Y;
    double moment = 0.0;            ///< Moment about the centroid
    bool active = false;            ///< False if the moment was zero and skipped
    double neutral_axis = 0.0;      ///< u_NA
    double compression_edge = 0.0;  ///< u_comp
    double y_1 = 0.0;               ///< Farthest tension-row distance
    double y_c = 0.0;               ///< Signed compression lever arm (≤ 0)
    double T_1 = 0.0;               ///< Peak tension-row force
    int tension_rows = 0;
    int compression_rows = 0;

    /// Signed contribution per fastener before clamping
    std::vector<double> contributions;
};

/**
 * @brief Result of the neutral-axis tension pass
 */
struct TensionDistribution {
    /// Per-fastener axial demand, tension positive, never negative
    std::vector<double> tensions;

    /// Uniform share of positive Fx per fastener
    double direct = 0.0;

    AxisTensionDiagnostics about_y;
    AxisTensionDiagnostics about_z;

    WarningList warnings;
};

/**
 * @brief Plate-based neutral-axis method for fastener tension
 *
 * For each bending moment M about one axis, with u the fastener
 * coordinate that varies under that bending:
 *
 *   compression edge  u_comp = u_min if M > 0, else u_max
 *   neutral axis      u_NA = centroid (conservative) or u_comp ± depth/6
 *   lever arm         y_c = −|u_comp − u_NA|
 *   peak row force    T_1 = |M| / Σ y_i (y_i/y_1 − y_c/y_1)   (tension rows)
 *
 * Every row then carries T_1·y_i/y_1, negative on the compression side,
 * shared equally among its fasteners. Positive Fx is added uniformly, both
 * axes are summed, and the total is clamped to zero once so that tension
 * from one axis can be cancelled by compression from the other.
 *
 * Moments are taken about the fastener-group centroid.
 */
class NeutralAxisTensionDistributor {
public:
    /**
     * @throws InvalidModeError if group is not a fastener group, or explicit
     *         row membership does not match the fastener count
     */
    NeutralAxisTensionDistributor(const ElementGroup& group,
                                  const GroupProperties& properties,
                                  const BearingPlate& plate,
                                  const TensionDistributorSettings& settings = TensionDistributorSettings());

    /**
     * @brief Distribute Fx, My and Mz of the load
     *
     * @throws DegenerateGeometryError if a nonzero moment finds no fastener
     *         row on the tension side of the neutral axis
     */
    TensionDistribution distribute(const Load& load) const;

    const TensionDistributorSettings& settings() const { return settings_; }

private:
    struct Row {
        double coordinate = 0.0;
        std::vector<int> members;
    };

    std::vector<Row> group_rows(BendingAxis axis, WarningList& warnings) const;

    AxisTensionDiagnostics distribute_axis(BendingAxis axis, double moment,
                                           WarningList& warnings) const;

    ElementGroup group_;
    GroupProperties properties_;
    BearingPlate plate_;
    TensionDistributorSettings settings_;
};

} // namespace connex
