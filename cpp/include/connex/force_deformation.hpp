#pragma once

#include "connex/element_group.hpp"
#include <Eigen/Dense>
#include <memory>
#include <optional>
#include <string>

namespace connex {

/**
 * @brief Geometry of one trial instantaneous center of rotation
 *
 * Row i of directions is the unit in-plane direction of element i,
 * perpendicular to the radius from the center (counter-clockwise sense).
 */
struct IcrTrialGeometry {
    Eigen::Vector2d center = Eigen::Vector2d::Zero();  ///< Trial IC (y, z)
    Eigen::VectorXd distances;                         ///< c_i, floored at position tolerance
    Eigen::MatrixX2d directions;                       ///< (dir_y, dir_z) per element
};

/**
 * @brief Strategy interface for element force-deformation relations
 *
 * An implementation maps a trial rotation about the IC to an intensity per
 * element: force for fasteners, stress for welds. Element force is
 * intensity × ElementGroup::weight(i).
 */
class ForceDeformationLaw {
public:
    virtual ~ForceDeformationLaw() = default;

    /**
     * @brief Element intensities for a trial center
     *
     * @return One value per element, or std::nullopt if the trial center
     *         produces no usable deformation field
     */
    virtual std::optional<Eigen::VectorXd> evaluate(const ElementGroup& group,
                                                    const IcrTrialGeometry& trial) const = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Crawford-Kulak bolt load-deformation curve parameters
 *
 * R = R_ult·(1 − exp(−μ·ρ))^λ with ρ = Δ/Δ_max.
 */
struct CrawfordKulakParameters {
    double mu = 10.0;           ///< Curve shape parameter
    double lambda = 0.55;       ///< Curve shape exponent
    double delta_max = 8.64;    ///< Ultimate deformation [length] (0.34 in)
    double R_ult = 1.0;         ///< Ultimate fastener strength [force]
};

/**
 * @brief Crawford-Kulak fastener law
 *
 * The fastener farthest from the IC reaches Δ_max; others deform in
 * proportion to their distance.
 */
class CrawfordKulakLaw : public ForceDeformationLaw {
public:
    explicit CrawfordKulakLaw(const CrawfordKulakParameters& params = CrawfordKulakParameters());

    std::optional<Eigen::VectorXd> evaluate(const ElementGroup& group,
                                            const IcrTrialGeometry& trial) const override;

    std::string name() const override { return "Crawford-Kulak"; }

    /// Fastener force for deformation delta
    double force(double delta) const;

    const CrawfordKulakParameters& parameters() const { return params_; }

private:
    CrawfordKulakParameters params_;
};

/**
 * @brief AISC fillet weld load-deformation parameters
 */
struct AiscWeldParameters {
    /// Electrode strength used when the weld does not specify one [stress]
    double default_F_EXX = 483.0;

    /// Lower bound on the critical deformation scale λ
    double position_tolerance = 1e-9;
};

/**
 * @brief AISC fillet weld law (AISC 360 J2.4 instantaneous center method)
 *
 * For an element loaded at angle θ to its axis:
 *
 *   Δ_u = min(0.17w, 1.087(θ+6)^−0.65·w)
 *   Δ_m = 0.209(θ+2)^−0.32·w
 *   f_w = 0.60·F_EXX·k_ds·[p(1.9 − 0.9p)]^0.3,   p = Δ/Δ_m
 *
 * with k_ds = 1 + 0.5 sin^1.5 θ. Deformations are scaled so the critical
 * element (smallest Δ_u/c) reaches its ultimate deformation.
 */
class AiscFilletWeldLaw : public ForceDeformationLaw {
public:
    explicit AiscFilletWeldLaw(const AiscWeldParameters& params = AiscWeldParameters());

    std::optional<Eigen::VectorXd> evaluate(const ElementGroup& group,
                                            const IcrTrialGeometry& trial) const override;

    std::string name() const override { return "AISC fillet weld"; }

    /**
     * @brief Deformation limits (Δ_u, Δ_m) for load angle theta [degrees]
     */
    static Eigen::Vector2d deformation_limits(double theta, double leg);

    /**
     * @brief Directional strength factor 1 + 0.5 sin^1.5 θ, θ in degrees
     */
    static double directional_factor(double theta);

    /**
     * @brief Weld stress at deformation delta for load angle theta
     *
     * @param include_directional Apply k_ds (false for HSS end connections)
     */
    static double stress(double delta, double theta, double leg, double F_EXX,
                         bool include_directional = true);

    const AiscWeldParameters& parameters() const { return params_; }

private:
    AiscWeldParameters params_;
};

/**
 * @brief Angle between an in-plane force and a weld tangent [degrees, 0-90]
 */
double load_angle(const Eigen::Vector2d& force, const Eigen::Vector2d& tangent);

/**
 * @brief Select the law for a group kind
 *
 * @throws InvalidModeError if the group is a non-fillet weld
 */
std::unique_ptr<ForceDeformationLaw> make_force_deformation_law(
    const ElementGroup& group,
    const CrawfordKulakParameters& bolt_params = CrawfordKulakParameters(),
    const AiscWeldParameters& weld_params = AiscWeldParameters());

} // namespace connex
