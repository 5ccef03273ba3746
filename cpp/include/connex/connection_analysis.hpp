#pragma once

#include "connex/bearing_plate.hpp"
#include "connex/demand.hpp"
#include "connex/element_group.hpp"
#include "connex/force_deformation.hpp"
#include "connex/group_properties.hpp"
#include "connex/icr_solver.hpp"
#include "connex/load.hpp"
#include "connex/tension_distributor.hpp"
#include "connex/warnings.hpp"
#include <Eigen/Dense>
#include <optional>
#include <string>
#include <vector>

namespace connex {

/**
 * @brief In-plane distribution method
 */
enum class ShearMethod {
    Elastic,
    Icr
};

/**
 * @brief Method that actually produced the in-plane demands
 */
enum class MethodUsed {
    Elastic,
    Icr,
    ElasticFallback     ///< ICR requested, load concentric or pure torsion
};

std::string shear_method_to_string(ShearMethod method);
std::string method_used_to_string(MethodUsed method);

/**
 * @brief Parse "elastic" or "icr" (case-insensitive)
 *
 * @throws InvalidModeError for any other string
 */
ShearMethod parse_shear_method(const std::string& method);

/**
 * @brief Options for a single connection analysis
 */
struct AnalysisOptions {
    ShearMethod shear_method = ShearMethod::Elastic;

    /// Bearing plate for the fastener tension pass. Required when a
    /// fastener group carries out-of-plane load.
    std::optional<BearingPlate> plate;

    /// Neutral-axis mode and row grouping for fastener tension
    TensionDistributorSettings tension;

    IcrSolverSettings icr;
    CrawfordKulakParameters bolt_law;
    AiscWeldParameters weld_law;

    /// Weld groups with fewer segments raise COARSE_DISCRETIZATION
    int min_weld_segments = 20;
};

/**
 * @brief Complete demand distribution of one connection
 *
 * Holds one ElementDemand per element, in group order. Fastener demands
 * are forces; weld demands are stresses on the effective throat.
 */
struct ConnectionResult {
    std::vector<ElementDemand> demands;

    MethodUsed method_used = MethodUsed::Elastic;

    /// Instantaneous center (ICR results only)
    std::optional<Eigen::Vector2d> icr_center;
    double icr_distance = 0.0;
    int icr_iterations = 0;

    GroupProperties properties;

    /// Applied load transferred to the group centroid
    Load load_at_centroid;

    /// Neutral-axis diagnostics (fastener groups with a bearing plate)
    std::optional<TensionDistribution> tension;

    WarningList warnings;

    /// Largest in-plane demand
    double max_shear() const;

    /// Largest axial demand (tension positive)
    double max_axial() const;

    double max_resultant() const;
    double min_resultant() const;
    double mean_resultant() const;

    /// Element with the largest resultant demand
    const ElementDemand& critical_element() const;

    /// Element closest to point (y, z)
    const ElementDemand& nearest(double y, double z) const;

    /// AISC directional strength factor per element (1.0 for fasteners)
    std::vector<double> directional_factors() const;
};

/**
 * @brief Run the full distribution pipeline for one connection
 *
 * 1. Group properties and load transfer to the centroid
 * 2. In-plane demand by the elastic method or ICR
 * 3. Out-of-plane demand: elastic for welds, neutral-axis method for
 *    fasteners (requires a bearing plate)
 * 4. Weld directional factors from the in-plane demand direction
 *
 * The group and load are not modified.
 *
 * @throws DegenerateGeometryError on degenerate geometry
 * @throws InvalidModeError on invalid method combinations: ICR with
 *         out-of-plane weld load, ICR on non-fillet welds, fastener
 *         out-of-plane load without a plate, non-finite load
 * @throws ConvergenceError if the ICR search fails
 */
ConnectionResult analyze_connection(const ElementGroup& group,
                                    const Load& load,
                                    const AnalysisOptions& options = AnalysisOptions());

} // namespace connex
