#include "connex/bearing_plate.hpp"
#include "connex/errors.hpp"
#include <algorithm>
#include <cmath>

namespace connex {

BearingPlate::BearingPlate(const Eigen::Vector2d& corner_a,
                           const Eigen::Vector2d& corner_b,
                           double thickness)
    : corner_a_(corner_a), corner_b_(corner_b), thickness_(thickness)
{
    if (!corner_a_.allFinite() || !corner_b_.allFinite()) {
        throw InvalidModeError(ConnexError(ErrorCode::NON_FINITE_INPUT,
            "Bearing plate corner coordinates must be finite"));
    }
    if (!(thickness_ >= 0.0)) {
        throw InvalidModeError(ConnexError::invalid_property(
            "plate thickness must be non-negative"));
    }
    if (depth_y() <= 0.0 || depth_z() <= 0.0) {
        ConnexError err(ErrorCode::DEGENERATE_PLATE,
            "Bearing plate must have positive depth along y and z");
        err.details["depth_y"] = std::to_string(depth_y());
        err.details["depth_z"] = std::to_string(depth_z());
        err.suggestion = "Check the corner coordinates.";
        throw DegenerateGeometryError(err);
    }
}

BearingPlate BearingPlate::from_dimensions(double width, double height,
                                           const Eigen::Vector2d& center,
                                           double thickness) {
    const Eigen::Vector2d half(0.5 * width, 0.5 * height);
    return BearingPlate(center - half, center + half, thickness);
}

bool BearingPlate::contains(const Eigen::Vector2d& point, double tolerance) const {
    return point(0) >= y_min() - tolerance && point(0) <= y_max() + tolerance &&
           point(1) >= z_min() - tolerance && point(1) <= z_max() + tolerance;
}

} // namespace connex
