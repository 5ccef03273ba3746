#pragma once

#include "connex/element_group.hpp"
#include <Eigen/Dense>

namespace connex {

/**
 * @brief Centroid and second moments of an element group
 *
 * All second moments are about the group centroid:
 * - Iy: Σ dz²·w  (resists My, varies with z)
 * - Iz: Σ dy²·w  (resists Mz, varies with y)
 * - Ip: Iy + Iz  (polar, resists Mx)
 *
 * For fasteners w = 1 and the quantities have units [length²].
 * For welds w = throat·ds and they have units [length⁴]; each segment
 * also adds its own contribution throat·ds³/12 projected on its tangent.
 *
 * Derived, read-only data: recompute when the group changes.
 */
struct GroupProperties {
    Eigen::Vector2d centroid = Eigen::Vector2d::Zero();  ///< (Cy, Cz)
    int n = 0;                  ///< Number of elements
    double total_weight = 0.0;  ///< Element count, or total weld area
    double total_length = 0.0;  ///< Total weld length (0 for fasteners)
    double Iy = 0.0;
    double Iz = 0.0;
    double Ip = 0.0;

    double Cy() const { return centroid(0); }
    double Cz() const { return centroid(1); }

    /// Centroid as a 3-D point on the connection plane (x = 0)
    Eigen::Vector3d centroid_3d() const {
        return Eigen::Vector3d(0.0, centroid(0), centroid(1));
    }
};

/**
 * @brief Compute centroid and second moments of a group
 *
 * @throws DegenerateGeometryError if total weight is zero
 */
GroupProperties compute_group_properties(const ElementGroup& group);

} // namespace connex
