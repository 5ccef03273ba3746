#include "connex/tension_distributor.hpp"
#include "connex/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <numeric>

namespace connex {

std::string neutral_axis_mode_to_string(NeutralAxisMode mode) {
    switch (mode) {
        case NeutralAxisMode::Conservative: return "conservative";
        case NeutralAxisMode::Accurate: return "accurate";
        default: return "unknown";
    }
}

NeutralAxisMode parse_neutral_axis_mode(const std::string& mode) {
    std::string lower = mode;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "conservative") return NeutralAxisMode::Conservative;
    if (lower == "accurate") return NeutralAxisMode::Accurate;

    ConnexError err(ErrorCode::UNKNOWN_MODE, "Unknown neutral-axis mode '" + mode + "'");
    err.suggestion = "Use \"conservative\" or \"accurate\".";
    throw InvalidModeError(err);
}

std::string bending_axis_to_string(BendingAxis axis) {
    return axis == BendingAxis::Y ? "y" : "z";
}

namespace {

/// Fastener coordinate that varies under bending about axis
double varying_coordinate(const GroupElement& e, BendingAxis axis) {
    return axis == BendingAxis::Y ? e.position(1) : e.position(0);
}

void check_row_membership(const std::vector<int>& rows, size_t n, BendingAxis axis) {
    if (!rows.empty() && rows.size() != n) {
        ConnexError err(ErrorCode::INVALID_ROW_MEMBERSHIP,
            "Explicit row membership must list one row id per fastener");
        err.details["axis"] = bending_axis_to_string(axis);
        err.details["row_ids"] = std::to_string(rows.size());
        err.details["fasteners"] = std::to_string(n);
        throw InvalidModeError(err);
    }
}

} // namespace

NeutralAxisTensionDistributor::NeutralAxisTensionDistributor(
    const ElementGroup& group,
    const GroupProperties& properties,
    const BearingPlate& plate,
    const TensionDistributorSettings& settings)
    : group_(group), properties_(properties), plate_(plate), settings_(settings)
{
    if (!group_.is_fastener()) {
        throw InvalidModeError(ConnexError::invalid_property(
            "neutral-axis tension method requires a fastener group"));
    }
    check_row_membership(settings_.rows_about_y, group_.size(), BendingAxis::Y);
    check_row_membership(settings_.rows_about_z, group_.size(), BendingAxis::Z);
}

std::vector<NeutralAxisTensionDistributor::Row>
NeutralAxisTensionDistributor::group_rows(BendingAxis axis, WarningList& warnings) const {
    const size_t n = group_.size();
    const std::vector<int>& explicit_rows =
        axis == BendingAxis::Y ? settings_.rows_about_y : settings_.rows_about_z;

    std::vector<Row> rows;

    if (!explicit_rows.empty()) {
        std::map<int, std::vector<int>> by_id;
        for (size_t i = 0; i < n; ++i) {
            by_id[explicit_rows[i]].push_back(static_cast<int>(i));
        }
        for (auto& [id, members] : by_id) {
            Row row;
            double sum = 0.0;
            for (int idx : members) {
                sum += varying_coordinate(group_.element(idx), axis);
            }
            row.coordinate = sum / static_cast<double>(members.size());
            row.members = std::move(members);
            rows.push_back(std::move(row));
        }
        return rows;
    }

    // Group by tolerance: sort by coordinate; a row holds every coordinate
    // within the tolerance of its first member
    const double depth = axis == BendingAxis::Y ? plate_.depth_z() : plate_.depth_y();
    const double tolerance = settings_.row_tolerance * depth;

    std::vector<int> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(), [&](int a, int b) {
        return varying_coordinate(group_.element(a), axis) <
               varying_coordinate(group_.element(b), axis);
    });

    double max_spread = 0.0;
    size_t start = 0;
    while (start < n) {
        size_t end = start + 1;
        const double first = varying_coordinate(group_.element(order[start]), axis);
        while (end < n &&
               varying_coordinate(group_.element(order[end]), axis) - first <= tolerance) {
            ++end;
        }

        Row row;
        double sum = 0.0;
        for (size_t k = start; k < end; ++k) {
            row.members.push_back(order[k]);
            sum += varying_coordinate(group_.element(order[k]), axis);
        }
        row.coordinate = sum / static_cast<double>(end - start);

        const double spread = varying_coordinate(group_.element(order[end - 1]), axis) -
                              varying_coordinate(group_.element(order[start]), axis);
        max_spread = std::max(max_spread, spread);

        rows.push_back(std::move(row));
        start = end;
    }

    if (max_spread > 0.0) {
        warnings.add(ConnexWarning::rows_merged(bending_axis_to_string(axis), max_spread));
    }
    return rows;
}

AxisTensionDiagnostics NeutralAxisTensionDistributor::distribute_axis(
    BendingAxis axis, double moment, WarningList& warnings) const
{
    AxisTensionDiagnostics diag;
    diag.axis = axis;
    diag.moment = moment;
    diag.contributions.assign(group_.size(), 0.0);

    if (std::abs(moment) <= settings_.zero_tolerance) {
        return diag;
    }
    diag.active = true;

    const double u_min = axis == BendingAxis::Y ? plate_.z_min() : plate_.y_min();
    const double u_max = axis == BendingAxis::Y ? plate_.z_max() : plate_.y_max();
    const double depth = u_max - u_min;

    // Positive moment puts tension on the positive-coordinate side
    const double tension_sign = moment > 0.0 ? 1.0 : -1.0;
    diag.compression_edge = moment > 0.0 ? u_min : u_max;

    if (settings_.mode == NeutralAxisMode::Conservative) {
        diag.neutral_axis = axis == BendingAxis::Y ? properties_.Cz() : properties_.Cy();
    } else {
        diag.neutral_axis = diag.compression_edge + tension_sign * depth / 6.0;
    }

    diag.y_c = -std::abs(diag.compression_edge - diag.neutral_axis);

    const std::vector<Row> rows = group_rows(axis, warnings);

    diag.y_1 = 0.0;
    for (const auto& row : rows) {
        const double rel = row.coordinate - diag.neutral_axis;
        if (tension_sign * rel > 0.0) {
            ++diag.tension_rows;
            diag.y_1 = std::max(diag.y_1, std::abs(rel));
        } else if (tension_sign * rel < 0.0) {
            ++diag.compression_rows;
        }
    }

    if (diag.tension_rows == 0 || diag.y_1 <= 0.0) {
        throw DegenerateGeometryError(
            ConnexError::empty_tension_rows(bending_axis_to_string(axis), moment));
    }

    double denominator = 0.0;
    for (const auto& row : rows) {
        const double rel = row.coordinate - diag.neutral_axis;
        if (tension_sign * rel > 0.0) {
            const double y_i = std::abs(rel);
            denominator += y_i * (y_i / diag.y_1 - diag.y_c / diag.y_1);
        }
    }
    diag.T_1 = std::abs(moment) / denominator;

    // Linear row forces, negative on the compression side
    for (const auto& row : rows) {
        const double rel = row.coordinate - diag.neutral_axis;
        const double side = tension_sign * rel > 0.0 ? 1.0 : -1.0;
        const double T_row = side * diag.T_1 * std::abs(rel) / diag.y_1;
        const double per_fastener = T_row / static_cast<double>(row.members.size());
        for (int idx : row.members) {
            diag.contributions[idx] += per_fastener;
        }
    }

    return diag;
}

TensionDistribution NeutralAxisTensionDistributor::distribute(const Load& load) const {
    const Load at_centroid = load.transferred_to(properties_.centroid_3d());
    const size_t n = group_.size();

    TensionDistribution result;

    std::vector<int> outside;
    for (size_t i = 0; i < n; ++i) {
        if (!plate_.contains(group_.element(i).position)) {
            outside.push_back(static_cast<int>(i));
        }
    }
    if (!outside.empty()) {
        result.warnings.add(ConnexWarning::fastener_outside_plate(outside));
    }

    // Compression Fx is carried by bearing, not by the fasteners
    const double Fx = at_centroid.Fx();
    result.direct = Fx > settings_.zero_tolerance ? Fx / static_cast<double>(n) : 0.0;

    result.about_y = distribute_axis(BendingAxis::Y, at_centroid.My(), result.warnings);
    result.about_z = distribute_axis(BendingAxis::Z, at_centroid.Mz(), result.warnings);

    result.tensions.resize(n);
    for (size_t i = 0; i < n; ++i) {
        const double total = result.direct + result.about_y.contributions[i] +
                             result.about_z.contributions[i];
        result.tensions[i] = std::max(0.0, total);
    }

    return result;
}

} // namespace connex
