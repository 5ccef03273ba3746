#include "connex/icr_solver.hpp"
#include "connex/elastic_distributor.hpp"
#include "connex/errors.hpp"
#include <algorithm>
#include <cmath>

namespace connex {

IcrSolver::IcrSolver(const ElementGroup& group,
                     const GroupProperties& properties,
                     const IcrSolverSettings& settings,
                     const CrawfordKulakParameters& bolt_params,
                     const AiscWeldParameters& weld_params)
    : group_(group),
      properties_(properties),
      law_(make_force_deformation_law(group, bolt_params, weld_params)),
      settings_(settings) {}

IcrSolver::IcrSolver(const ElementGroup& group,
                     const GroupProperties& properties,
                     std::unique_ptr<ForceDeformationLaw> law,
                     const IcrSolverSettings& settings)
    : group_(group),
      properties_(properties),
      law_(std::move(law)),
      settings_(settings)
{
    if (!law_) {
        throw InvalidModeError(ConnexError::invalid_property(
            "ICR solver requires a force-deformation law"));
    }
}

Eigen::Vector2d IcrSolver::search_bounds(double eccentricity) const {
    double y_min = group_.element(0).position(0), y_max = y_min;
    double z_min = group_.element(0).position(1), z_max = z_min;
    for (const auto& e : group_.elements()) {
        y_min = std::min(y_min, e.position(0));
        y_max = std::max(y_max, e.position(0));
        z_min = std::min(z_min, e.position(1));
        z_max = std::max(z_max, e.position(1));
    }

    const double size = group_.characteristic_size();
    const double char_length = std::max({y_max - y_min, z_max - z_min, 2.0 * size, 1.0});

    double d_min = std::max({settings_.position_tolerance, 0.02 * char_length, 0.1 * size});
    double d_max = std::max({50.0 * d_min, 10.0 * char_length, 5.0 * eccentricity});

    // Elastic estimate of the IC distance, r²/e. Keeps small and large
    // eccentricities inside the scan.
    if (eccentricity > settings_.zero_tolerance) {
        const double d_est = (properties_.Ip / properties_.total_weight) / eccentricity;
        if (std::isfinite(d_est) && d_est > 0.0) {
            d_max = std::max(d_max, 10.0 * d_est);
            d_min = std::max(settings_.position_tolerance, std::min(d_min, 0.5 * d_est));
        }
    }

    if (d_max <= d_min) {
        d_max = 10.0 * d_min;
    }
    return Eigen::Vector2d(d_min, d_max);
}

namespace {

/// Unit normal of the search line on the Mx side: shear rotated 90°
/// counter-clockwise, times sign(Mx)
Eigen::Vector2d search_direction(const Eigen::Vector2d& shear, double moment_sign) {
    const double P = shear.norm();
    return moment_sign * Eigen::Vector2d(-shear(1) / P, shear(0) / P);
}

} // namespace

std::optional<IcrSolver::Trial> IcrSolver::evaluate(const Eigen::Vector2d& center,
                                                    const Eigen::Vector2d& shear,
                                                    double moment_sign,
                                                    double eccentricity) const {
    const size_t n = group_.size();

    Trial trial;
    trial.center = center;

    IcrTrialGeometry geometry;
    geometry.center = center;
    geometry.distances.resize(n);
    geometry.directions.resize(n, 2);

    // Rotation sense fixed by Mx
    for (size_t i = 0; i < n; ++i) {
        const Eigen::Vector2d r = group_.element(i).position - center;
        const double c = std::max(r.norm(), settings_.position_tolerance);
        geometry.distances(i) = c;
        geometry.directions(i, 0) = -moment_sign * r(1) / c;
        geometry.directions(i, 1) = moment_sign * r(0) / c;
    }

    std::optional<Eigen::VectorXd> intensities = law_->evaluate(group_, geometry);
    if (!intensities) {
        return std::nullopt;
    }

    Eigen::Vector2d resultant = Eigen::Vector2d::Zero();
    double moment = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double force = group_.weight(i) * (*intensities)(i);
        const Eigen::Vector2d d = group_.element(i).position - properties_.centroid;
        resultant += force * geometry.directions.row(i).transpose();
        moment += force * (d(0) * geometry.directions(i, 1) - d(1) * geometry.directions(i, 0));
    }

    const double P_base = resultant.norm();
    if (!std::isfinite(P_base) || P_base < settings_.position_tolerance) {
        return std::nullopt;
    }

    trial.ratio_error = moment_sign * moment / P_base - eccentricity;
    trial.direction_error = std::atan2(resultant(0) * shear(1) - resultant(1) * shear(0),
                                       resultant.dot(shear));
    trial.intensities = std::move(*intensities);
    trial.directions = std::move(geometry.directions);
    trial.resultant = resultant;
    return trial;
}

IcrSolver::Trial IcrSolver::correct_off_line(Trial trial,
                                             const Eigen::Vector2d& shear,
                                             double moment_sign,
                                             double eccentricity,
                                             int& iterations) const {
    const Eigen::Vector2d side = search_direction(shear, moment_sign);
    const double moment_tolerance = settings_.tolerance * std::max(1.0, eccentricity);

    // Length scale making the moment residual commensurate with the angle
    const double radius = std::sqrt(properties_.Ip / properties_.total_weight);
    const double length = std::max({eccentricity, radius, settings_.position_tolerance});
    const double h = 1e-6 * length;

    auto converged = [&](const Trial& t) {
        return std::abs(t.ratio_error) <= moment_tolerance &&
               std::abs(t.direction_error) <= settings_.direction_tolerance;
    };
    auto merit = [length](const Trial& t) {
        const double m = t.ratio_error / length;
        return m * m + t.direction_error * t.direction_error;
    };
    auto stalled = [&]() {
        ConnexError err = ConnexError::not_converged(iterations, std::abs(trial.ratio_error));
        err.details["direction_residual"] = std::to_string(trial.direction_error);
        return ConvergenceError(err);
    };

    for (int k = 0; k < settings_.max_iterations && !converged(trial); ++k) {
        Eigen::Matrix2d jacobian;
        for (int j = 0; j < 2; ++j) {
            Eigen::Vector2d step = Eigen::Vector2d::Zero();
            step(j) = h;
            std::optional<Trial> plus = evaluate(trial.center + step, shear, moment_sign, eccentricity);
            std::optional<Trial> minus = evaluate(trial.center - step, shear, moment_sign, eccentricity);
            if (!plus || !minus) {
                throw stalled();
            }
            jacobian(0, j) = (plus->ratio_error - minus->ratio_error) / (2.0 * h);
            jacobian(1, j) = (plus->direction_error - minus->direction_error) / (2.0 * h);
        }

        Eigen::FullPivLU<Eigen::Matrix2d> lu(jacobian);
        if (!lu.isInvertible()) {
            throw stalled();
        }
        const Eigen::Vector2d step =
            -lu.solve(Eigen::Vector2d(trial.ratio_error, trial.direction_error));

        // Backtrack until the combined residual drops, keeping the IC on
        // the Mx side of the centroid
        const double current = merit(trial);
        bool accepted = false;
        double alpha = 1.0;
        for (int halving = 0; halving < 40 && !accepted; ++halving, alpha *= 0.5) {
            const Eigen::Vector2d center = trial.center + alpha * step;
            if ((center - properties_.centroid).dot(side) <= settings_.position_tolerance) {
                continue;
            }
            std::optional<Trial> candidate = evaluate(center, shear, moment_sign, eccentricity);
            ++iterations;
            if (!candidate) {
                continue;
            }
            report(iterations, (center - properties_.centroid).norm(), candidate->ratio_error);
            if (merit(*candidate) < current) {
                trial = std::move(*candidate);
                accepted = true;
            }
        }
        if (!accepted) {
            throw stalled();
        }
    }

    if (!converged(trial)) {
        throw stalled();
    }
    return trial;
}

IcrSolution IcrSolver::build_solution(const Trial& trial,
                                      int iterations,
                                      const Eigen::Vector2d& shear) const {
    const double P = shear.norm();
    const double scale = P / trial.resultant.norm();
    const Eigen::Vector2d offset = trial.center - properties_.centroid;

    IcrSolution solution;
    solution.center = trial.center;
    solution.distance = offset.norm();
    solution.offset = offset.dot(shear) / P;
    solution.iterations = iterations;
    solution.residual = std::abs(trial.ratio_error);
    solution.force_direction_residual = (scale * trial.resultant - shear).norm() / P;

    if (!(solution.force_direction_residual <= settings_.direction_tolerance)) {
        ConnexError err = ConnexError::not_converged(iterations, solution.residual);
        err.details["direction_residual"] = std::to_string(solution.force_direction_residual);
        throw ConvergenceError(err);
    }

    solution.demands.reserve(group_.size());
    for (size_t i = 0; i < group_.size(); ++i) {
        ElementDemand d;
        d.index = static_cast<int>(i);
        d.position = group_.element(i).position;
        d.torsion_y = scale * trial.intensities(i) * trial.directions(i, 0);
        d.torsion_z = scale * trial.intensities(i) * trial.directions(i, 1);
        solution.demands.push_back(d);
    }
    return solution;
}

void IcrSolver::report(int iteration, double distance, double residual) const {
    if (settings_.progress_callback) {
        settings_.progress_callback(iteration, distance, residual);
    }
}

IcrResult IcrSolver::solve(const Load& load) const {
    const Load at_centroid = load.transferred_to(properties_.centroid_3d());
    const Eigen::Vector2d shear(at_centroid.Fy(), at_centroid.Fz());
    const double Mx = at_centroid.Mx();
    const double P = shear.norm();

    // Pre-check: ICR only applies to eccentric shear
    if (P <= settings_.zero_tolerance || std::abs(Mx) <= settings_.zero_tolerance) {
        ElasticDistributor elastic(group_, properties_, settings_.zero_tolerance);
        ElasticFallback fallback;
        fallback.demands = elastic.distribute_in_plane(load);
        fallback.reason = P <= settings_.zero_tolerance ? "pure torsion" : "concentric shear";
        return fallback;
    }

    const double e = std::abs(Mx) / P;
    const double moment_sign = Mx > 0.0 ? 1.0 : -1.0;
    const double tolerance = settings_.tolerance * std::max(1.0, e);
    const Eigen::Vector2d side = search_direction(shear, moment_sign);

    const Eigen::Vector2d bounds = search_bounds(e);
    const double d_min = bounds(0);
    const double d_max = bounds(1);

    // Phase 1: geometric scan along the perpendicular line
    const int n_scan = std::max(settings_.scan_candidates, 2);
    std::vector<double> candidates;
    candidates.reserve(n_scan + 2);
    const double ratio = std::pow(d_max / d_min, 1.0 / (n_scan - 1));
    double d = d_min;
    for (int i = 0; i < n_scan; ++i) {
        candidates.push_back(d);
        d *= ratio;
    }
    if (e > d_min && e < d_max) {
        candidates.push_back(e);
    }
    std::sort(candidates.begin(), candidates.end());

    int iterations = 0;
    std::optional<Trial> seed;
    std::optional<Trial> prev;
    double prev_distance = 0.0;
    std::optional<Trial> lo;
    double d_lo = 0.0;
    double d_hi = 0.0;

    for (double candidate : candidates) {
        std::optional<Trial> trial = evaluate(properties_.centroid + candidate * side,
                                              shear, moment_sign, e);
        ++iterations;
        if (!trial) {
            continue;
        }
        report(iterations, candidate, trial->ratio_error);

        if (std::abs(trial->ratio_error) <= tolerance) {
            seed = std::move(trial);
            break;
        }

        if (prev && prev->ratio_error * trial->ratio_error < 0.0) {
            lo = prev;
            d_lo = prev_distance;
            d_hi = candidate;
            break;
        }
        prev = std::move(trial);
        prev_distance = candidate;
    }

    if (!seed && !lo) {
        ConnexError err(ErrorCode::SOLVER_NO_BRACKET,
            "ICR search found no equilibrium position on the search line");
        err.details["eccentricity"] = std::to_string(e);
        err.details["d_min"] = std::to_string(d_min);
        err.details["d_max"] = std::to_string(d_max);
        err.suggestion = "Retry with the elastic method.";
        throw ConvergenceError(err);
    }

    // Phase 2: bisection
    if (!seed) {
        double g_lo = lo->ratio_error;
        double last_residual = std::abs(g_lo);
        for (int k = 0; k < settings_.max_iterations && !seed; ++k) {
            const double d_mid = 0.5 * (d_lo + d_hi);
            std::optional<Trial> mid = evaluate(properties_.centroid + d_mid * side,
                                                shear, moment_sign, e);
            ++iterations;
            if (!mid) {
                throw ConvergenceError(ConnexError::not_converged(iterations, last_residual));
            }
            report(iterations, d_mid, mid->ratio_error);

            last_residual = std::abs(mid->ratio_error);
            if (last_residual <= tolerance) {
                seed = std::move(mid);
            } else if (mid->ratio_error * g_lo > 0.0) {
                d_lo = d_mid;
                g_lo = mid->ratio_error;
            } else {
                d_hi = d_mid;
            }
        }
        if (!seed) {
            throw ConvergenceError(ConnexError::not_converged(iterations, last_residual));
        }
    }

    // Phase 3: off-line correction when the resultant is not along the shear
    Trial solution = std::move(*seed);
    if (std::abs(solution.direction_error) > settings_.direction_tolerance) {
        solution = correct_off_line(std::move(solution), shear, moment_sign, e, iterations);
    }

    return build_solution(solution, iterations, shear);
}

} // namespace connex
