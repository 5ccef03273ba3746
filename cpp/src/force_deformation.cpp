#include "connex/force_deformation.hpp"
#include "connex/errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace connex {

namespace {

constexpr double MIN_RATIO = 1e-6;
constexpr double MAX_WELD_RATIO = 2.1;

} // namespace

// =============================================================================
// Crawford-Kulak
// =============================================================================

CrawfordKulakLaw::CrawfordKulakLaw(const CrawfordKulakParameters& params)
    : params_(params) {}

double CrawfordKulakLaw::force(double delta) const {
    const double rho = std::clamp(delta / params_.delta_max, MIN_RATIO, 1.0);
    return params_.R_ult * std::pow(1.0 - std::exp(-params_.mu * rho), params_.lambda);
}

std::optional<Eigen::VectorXd> CrawfordKulakLaw::evaluate(const ElementGroup& group,
                                                          const IcrTrialGeometry& trial) const {
    const Eigen::Index n = trial.distances.size();
    if (n == 0 || static_cast<size_t>(n) != group.size()) {
        return std::nullopt;
    }

    const double c_max = trial.distances.maxCoeff();
    if (!(c_max > 0.0) || !std::isfinite(c_max)) {
        return std::nullopt;
    }

    Eigen::VectorXd R(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        const double delta = params_.delta_max * trial.distances(i) / c_max;
        R(i) = force(delta);
    }
    return R;
}

// =============================================================================
// AISC fillet weld
// =============================================================================

AiscFilletWeldLaw::AiscFilletWeldLaw(const AiscWeldParameters& params)
    : params_(params) {}

Eigen::Vector2d AiscFilletWeldLaw::deformation_limits(double theta, double leg) {
    const double delta_u = std::min(0.17 * leg, 1.087 * std::pow(theta + 6.0, -0.65) * leg);
    const double delta_m = 0.209 * std::pow(theta + 2.0, -0.32) * leg;
    return Eigen::Vector2d(delta_u, delta_m);
}

double AiscFilletWeldLaw::directional_factor(double theta) {
    return 1.0 + 0.5 * std::pow(std::sin(theta * M_PI / 180.0), 1.5);
}

double AiscFilletWeldLaw::stress(double delta, double theta, double leg, double F_EXX,
                                 bool include_directional) {
    const Eigen::Vector2d limits = deformation_limits(theta, leg);
    const double delta_clamped = std::min(delta, limits(0));
    const double p = std::clamp(delta_clamped / limits(1), MIN_RATIO, MAX_WELD_RATIO);

    const double k_ds = include_directional ? directional_factor(theta) : 1.0;
    const double term = std::max(p * (1.9 - 0.9 * p), MIN_RATIO);

    return 0.60 * F_EXX * k_ds * std::pow(term, 0.3);
}

std::optional<Eigen::VectorXd> AiscFilletWeldLaw::evaluate(const ElementGroup& group,
                                                           const IcrTrialGeometry& trial) const {
    const Eigen::Index n = trial.distances.size();
    if (n == 0 || static_cast<size_t>(n) != group.size()) {
        return std::nullopt;
    }

    const WeldParameters& weld = group.weld_parameters();
    const double F_EXX = weld.F_EXX > 0.0 ? weld.F_EXX : params_.default_F_EXX;

    Eigen::VectorXd theta(n);
    Eigen::VectorXd delta_u(n);
    Eigen::VectorXd delta_m(n);

    // Critical element: smallest ratio of ultimate deformation to radius
    double lambda = std::numeric_limits<double>::infinity();
    for (Eigen::Index i = 0; i < n; ++i) {
        const Eigen::Vector2d dir = trial.directions.row(i).transpose();
        theta(i) = load_angle(dir, group.element(i).tangent);

        const Eigen::Vector2d limits = deformation_limits(theta(i), weld.leg);
        delta_u(i) = limits(0);
        delta_m(i) = limits(1);
        lambda = std::min(lambda, delta_u(i) / trial.distances(i));
    }

    if (!std::isfinite(lambda) || lambda <= params_.position_tolerance) {
        return std::nullopt;
    }

    Eigen::VectorXd f(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        const double delta = std::min(lambda * trial.distances(i), delta_u(i));
        f(i) = stress(delta, theta(i), weld.leg, F_EXX, weld.include_directional_factor);
    }
    return f;
}

// =============================================================================
// Helpers
// =============================================================================

double load_angle(const Eigen::Vector2d& force, const Eigen::Vector2d& tangent) {
    const double norm = force.norm() * tangent.norm();
    if (norm <= 0.0) {
        return 0.0;
    }
    const double cos_theta = std::clamp(std::abs(force.dot(tangent)) / norm, 0.0, 1.0);
    return std::acos(cos_theta) * 180.0 / M_PI;
}

std::unique_ptr<ForceDeformationLaw> make_force_deformation_law(
    const ElementGroup& group,
    const CrawfordKulakParameters& bolt_params,
    const AiscWeldParameters& weld_params)
{
    if (group.is_fastener()) {
        return std::make_unique<CrawfordKulakLaw>(bolt_params);
    }

    const WeldType type = group.weld_parameters().type;
    if (type != WeldType::Fillet) {
        ConnexError err(ErrorCode::ICR_WELD_TYPE,
            "ICR method is only available for fillet welds, got " + weld_type_to_string(type));
        err.suggestion = "Use the elastic method for groove, plug and slot welds.";
        throw InvalidModeError(err);
    }
    return std::make_unique<AiscFilletWeldLaw>(weld_params);
}

} // namespace connex
