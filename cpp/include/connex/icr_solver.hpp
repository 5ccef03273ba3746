#pragma once

#include "connex/element_group.hpp"
#include "connex/group_properties.hpp"
#include "connex/demand.hpp"
#include "connex/force_deformation.hpp"
#include "connex/load.hpp"
#include <Eigen/Dense>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace connex {

/**
 * @brief Settings for the instantaneous center of rotation search
 */
struct IcrSolverSettings {
    /// Maximum bisection steps after a bracket is found, and maximum
    /// Newton steps of the off-line correction
    int max_iterations = 100;

    /// Relative moment-ratio tolerance: converged when
    /// |ratio − e| ≤ tolerance·max(1, e)
    double tolerance = 1e-6;

    /// Number of geometrically spaced distances in the bracketing scan
    int scan_candidates = 60;

    /// Shear and torsion at or below this magnitude trigger elastic fallback
    double zero_tolerance = 1e-12;

    /// Floor on element-to-IC distance and on the search start [length]
    double position_tolerance = 1e-9;

    /// Angle [rad] allowed between the element force resultant and the
    /// applied shear. Results outside it are never returned.
    double direction_tolerance = 1e-8;

    /// Optional callback for iteration progress monitoring
    /// Parameters: (iteration, distance, residual)
    std::function<void(int, double, double)> progress_callback = nullptr;
};

/**
 * @brief Converged ICR solution
 *
 * Demands carry the whole distribution in the torsional components with
 * zero direct part.
 */
struct IcrSolution {
    std::vector<ElementDemand> demands;
    Eigen::Vector2d center = Eigen::Vector2d::Zero();   ///< IC (y, z)
    double distance = 0.0;          ///< IC distance from the centroid [length]
    double offset = 0.0;            ///< IC offset from the search line, along the shear [length]
    int iterations = 0;             ///< Counted trial evaluations
    double residual = 0.0;          ///< Final |ratio − e|
    double force_direction_residual = 0.0;  ///< |ΣF − F|/|F| after rescaling
};

/**
 * @brief Elastic distribution returned when ICR does not apply
 *
 * Produced for concentric shear (no torsion) and pure torsion (no shear).
 */
struct ElasticFallback {
    std::vector<ElementDemand> demands;
    std::string reason;
};

using IcrResult = std::variant<IcrSolution, ElasticFallback>;

/**
 * @brief Instantaneous center of rotation solver for eccentric shear
 *
 * For a trial IC every element rotates about it with a force perpendicular
 * to its radius and a magnitude given by the force-deformation law. The
 * rotation sense is that of Mx: the applied moment about any IC on the Mx
 * side of the line through the centroid perpendicular to the shear has the
 * sign of Mx. The IC is in equilibrium when
 *
 * - the ratio of moment about the centroid to the force resultant equals
 *   the load eccentricity e = |Mx|/P, and
 * - the force resultant is parallel to the applied shear.
 *
 * Search:
 * 1. Geometric scan over [d_min, d_max] along the perpendicular line to
 *    bracket a sign change of the moment residual
 * 2. Bisection inside the bracket until the ratio tolerance is met
 * 3. If the resultant is not parallel to the shear (asymmetric groups,
 *    inclined shear), damped Newton on the IC position with a
 *    finite-difference Jacobian, seeded from step 2, until both residuals
 *    meet their tolerances
 *
 * The converged element forces are rescaled so their resultant equals the
 * applied shear.
 *
 * Usage:
 *   IcrSolver solver(group, compute_group_properties(group));
 *   IcrResult result = solver.solve(load);
 *   if (auto* sol = std::get_if<IcrSolution>(&result)) { ... }
 */
class IcrSolver {
public:
    /**
     * @brief Construct with the law selected from the group kind
     *
     * @throws InvalidModeError for non-fillet weld groups
     */
    IcrSolver(const ElementGroup& group,
              const GroupProperties& properties,
              const IcrSolverSettings& settings = IcrSolverSettings(),
              const CrawfordKulakParameters& bolt_params = CrawfordKulakParameters(),
              const AiscWeldParameters& weld_params = AiscWeldParameters());

    /**
     * @brief Construct with an explicit law
     *
     * @throws InvalidModeError if law is null
     */
    IcrSolver(const ElementGroup& group,
              const GroupProperties& properties,
              std::unique_ptr<ForceDeformationLaw> law,
              const IcrSolverSettings& settings = IcrSolverSettings());

    /**
     * @brief Solve for the in-plane distribution of Fy, Fz and Mx
     *
     * The load is transferred to the centroid first.
     *
     * @return IcrSolution, or ElasticFallback for concentric or pure
     *         torsion loads
     *
     * @throws ConvergenceError if no bracket is found, the iteration cap
     *         is exhausted, or the off-line correction stalls
     * @throws DegenerateGeometryError from the elastic fallback (pure
     *         torsion on a group with Ip = 0)
     */
    IcrResult solve(const Load& load) const;

    const ForceDeformationLaw& law() const { return *law_; }
    const IcrSolverSettings& settings() const { return settings_; }

    /**
     * @brief Search interval (d_min, d_max) for eccentricity e
     */
    Eigen::Vector2d search_bounds(double eccentricity) const;

private:
    struct Trial {
        double ratio_error = 0.0;       ///< sign(Mx)·M/|P_base| − e
        double direction_error = 0.0;   ///< Angle from P_base to the shear [rad]
        Eigen::Vector2d center;
        Eigen::VectorXd intensities;
        Eigen::MatrixX2d directions;
        Eigen::Vector2d resultant;      ///< P_base
    };

    /// Evaluate a trial IC; nullopt if the law or the resultant degenerates
    std::optional<Trial> evaluate(const Eigen::Vector2d& center,
                                  const Eigen::Vector2d& shear,
                                  double moment_sign,
                                  double eccentricity) const;

    /// Newton correction of the IC position off the search line
    Trial correct_off_line(Trial trial,
                           const Eigen::Vector2d& shear,
                           double moment_sign,
                           double eccentricity,
                           int& iterations) const;

    IcrSolution build_solution(const Trial& trial,
                               int iterations,
                               const Eigen::Vector2d& shear) const;

    void report(int iteration, double distance, double residual) const;

    ElementGroup group_;
    GroupProperties properties_;
    std::unique_ptr<ForceDeformationLaw> law_;
    IcrSolverSettings settings_;
};

} // namespace connex
