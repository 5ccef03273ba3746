#include "connex/connection_analysis.hpp"
#include "connex/elastic_distributor.hpp"
#include "connex/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace connex {

std::string shear_method_to_string(ShearMethod method) {
    switch (method) {
        case ShearMethod::Elastic: return "elastic";
        case ShearMethod::Icr: return "icr";
        default: return "unknown";
    }
}

std::string method_used_to_string(MethodUsed method) {
    switch (method) {
        case MethodUsed::Elastic: return "elastic";
        case MethodUsed::Icr: return "icr";
        case MethodUsed::ElasticFallback: return "elastic_fallback";
        default: return "unknown";
    }
}

ShearMethod parse_shear_method(const std::string& method) {
    std::string lower = method;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "elastic") return ShearMethod::Elastic;
    if (lower == "icr") return ShearMethod::Icr;

    ConnexError err(ErrorCode::UNKNOWN_MODE, "Unknown shear method '" + method + "'");
    err.suggestion = "Use \"elastic\" or \"icr\".";
    throw InvalidModeError(err);
}

// =============================================================================
// ConnectionResult
// =============================================================================

double ConnectionResult::max_shear() const {
    double value = 0.0;
    for (const auto& d : demands) value = std::max(value, d.shear());
    return value;
}

double ConnectionResult::max_axial() const {
    double value = demands.empty() ? 0.0 : demands.front().axial;
    for (const auto& d : demands) value = std::max(value, d.axial);
    return value;
}

double ConnectionResult::max_resultant() const {
    double value = 0.0;
    for (const auto& d : demands) value = std::max(value, d.resultant());
    return value;
}

double ConnectionResult::min_resultant() const {
    if (demands.empty()) return 0.0;
    double value = std::numeric_limits<double>::infinity();
    for (const auto& d : demands) value = std::min(value, d.resultant());
    return value;
}

double ConnectionResult::mean_resultant() const {
    if (demands.empty()) return 0.0;
    double sum = 0.0;
    for (const auto& d : demands) sum += d.resultant();
    return sum / static_cast<double>(demands.size());
}

const ElementDemand& ConnectionResult::critical_element() const {
    if (demands.empty()) {
        throw std::out_of_range("ConnectionResult has no element demands");
    }
    return *std::max_element(demands.begin(), demands.end(),
        [](const ElementDemand& a, const ElementDemand& b) {
            return a.resultant() < b.resultant();
        });
}

const ElementDemand& ConnectionResult::nearest(double y, double z) const {
    if (demands.empty()) {
        throw std::out_of_range("ConnectionResult has no element demands");
    }
    const Eigen::Vector2d point(y, z);
    return *std::min_element(demands.begin(), demands.end(),
        [&point](const ElementDemand& a, const ElementDemand& b) {
            return (a.position - point).squaredNorm() < (b.position - point).squaredNorm();
        });
}

std::vector<double> ConnectionResult::directional_factors() const {
    std::vector<double> factors;
    factors.reserve(demands.size());
    for (const auto& d : demands) factors.push_back(d.directional_factor);
    return factors;
}

// =============================================================================
// Pipeline
// =============================================================================

namespace {

constexpr double DIRECTION_TOLERANCE = 1e-12;

void validate_usage(const ElementGroup& group,
                    const GroupProperties& props,
                    const Load& load,
                    const AnalysisOptions& options) {
    const bool out_of_plane = load.has_out_of_plane(props.centroid_3d(),
                                                    options.icr.zero_tolerance);

    if (group.is_weld() && options.shear_method == ShearMethod::Icr) {
        const WeldType type = group.weld_parameters().type;
        if (type != WeldType::Fillet) {
            ConnexError err(ErrorCode::ICR_WELD_TYPE,
                "ICR method is only available for fillet welds, got " + weld_type_to_string(type));
            err.suggestion = "Use the elastic method for groove, plug and slot welds.";
            throw InvalidModeError(err);
        }
        if (out_of_plane) {
            ConnexError err(ErrorCode::ICR_OUT_OF_PLANE,
                "ICR method does not support out-of-plane weld loads (Fx, My, Mz)");
            err.details["Fx"] = std::to_string(load.Fx());
            err.suggestion = "Use the elastic method, or apply the load in the weld plane "
                             "without eccentricity along x.";
            throw InvalidModeError(err);
        }
    }

    if (group.is_fastener() && out_of_plane && !options.plate) {
        ConnexError err(ErrorCode::MISSING_PLATE,
            "Fastener out-of-plane load requires a bearing plate");
        err.suggestion = "Set AnalysisOptions::plate to the bearing plate extent.";
        throw InvalidModeError(err);
    }
}

void apply_directional_factors(const ElementGroup& group, std::vector<ElementDemand>& demands) {
    if (!group.is_weld() || !group.weld_parameters().include_directional_factor) {
        return;
    }
    for (auto& d : demands) {
        const Eigen::Vector2d f = d.in_plane();
        if (f.norm() < DIRECTION_TOLERANCE) {
            d.directional_factor = 1.0;
            continue;
        }
        const double theta = load_angle(f, group.element(d.index).tangent);
        d.directional_factor = AiscFilletWeldLaw::directional_factor(theta);
    }
}

} // namespace

ConnectionResult analyze_connection(const ElementGroup& group,
                                    const Load& load,
                                    const AnalysisOptions& options) {
    if (!load.is_finite()) {
        throw InvalidModeError(ConnexError(ErrorCode::NON_FINITE_INPUT,
            "Load components and application point must be finite"));
    }

    ConnectionResult result;
    result.properties = compute_group_properties(group);
    result.load_at_centroid = load.transferred_to(result.properties.centroid_3d());

    if (group.size() == 1) {
        result.warnings.add(ConnexWarning::single_element_group());
    }
    if (group.is_weld() && static_cast<int>(group.size()) < options.min_weld_segments) {
        result.warnings.add(ConnexWarning::coarse_discretization(static_cast<int>(group.size())));
    }

    validate_usage(group, result.properties, load, options);

    // In-plane demand
    if (options.shear_method == ShearMethod::Icr) {
        IcrSolver solver(group, result.properties, options.icr,
                         options.bolt_law, options.weld_law);
        IcrResult icr = solver.solve(load);

        if (auto* solution = std::get_if<IcrSolution>(&icr)) {
            result.demands = std::move(solution->demands);
            result.method_used = MethodUsed::Icr;
            result.icr_center = solution->center;
            result.icr_distance = solution->distance;
            result.icr_iterations = solution->iterations;
        } else {
            auto& fallback = std::get<ElasticFallback>(icr);
            result.demands = std::move(fallback.demands);
            result.method_used = MethodUsed::ElasticFallback;
            result.warnings.add(ConnexWarning::icr_elastic_fallback(fallback.reason));
        }
    } else {
        ElasticDistributor elastic(group, result.properties, options.icr.zero_tolerance);
        result.demands = elastic.distribute_in_plane(load);
        result.method_used = MethodUsed::Elastic;
    }

    // Out-of-plane demand
    if (group.is_weld()) {
        ElasticDistributor elastic(group, result.properties, options.icr.zero_tolerance);
        elastic.add_out_of_plane(load, result.demands);
    } else if (options.plate) {
        NeutralAxisTensionDistributor distributor(group, result.properties,
                                                  *options.plate, options.tension);
        TensionDistribution tension = distributor.distribute(load);
        for (auto& d : result.demands) {
            d.axial = tension.tensions[d.index];
        }
        result.warnings.merge(tension.warnings);
        result.tension = std::move(tension);
    }

    apply_directional_factors(group, result.demands);

    return result;
}

} // namespace connex
