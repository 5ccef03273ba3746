#pragma once

#include "connex/element_group.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <vector>

namespace connex {

/**
 * @brief Demand on a single connector element
 *
 * Fastener groups report forces [force]; weld groups report stresses
 * [force/length²] (force per unit effective throat area). Element force is
 * demand × ElementGroup::weight(i) in both cases.
 *
 * In-plane demand is split into a direct part (uniform share of Fy, Fz)
 * and a torsional part (from Mx). ICR results carry the whole
 * nonlinear distribution in the torsional part and zero direct part.
 *
 * Created fresh per analysis; never shared between analyses.
 */
struct ElementDemand {
    int index = 0;                              ///< Element index in the group
    Eigen::Vector2d position = Eigen::Vector2d::Zero();  ///< (y, z)

    double direct_y = 0.0;      ///< Direct in-plane demand, y
    double direct_z = 0.0;      ///< Direct in-plane demand, z
    double torsion_y = 0.0;     ///< Torsional in-plane demand, y
    double torsion_z = 0.0;     ///< Torsional in-plane demand, z

    double axial = 0.0;         ///< Out-of-plane demand, tension positive

    /// AISC directional strength factor (welds; 1.0 for fasteners)
    double directional_factor = 1.0;

    double total_y() const { return direct_y + torsion_y; }
    double total_z() const { return direct_z + torsion_z; }

    Eigen::Vector2d in_plane() const { return Eigen::Vector2d(total_y(), total_z()); }

    /// In-plane resultant sqrt(total_y² + total_z²)
    double shear() const { return std::hypot(total_y(), total_z()); }

    /// Full resultant including axial demand
    double resultant() const {
        return std::sqrt(total_y() * total_y() + total_z() * total_z() + axial * axial);
    }

    /// In-plane direction angle atan2(total_y, total_z) [degrees]
    double angle() const;
};

/**
 * @brief Vector sum of element in-plane forces (demand × weight)
 */
Eigen::Vector2d sum_in_plane_forces(const ElementGroup& group,
                                    const std::vector<ElementDemand>& demands);

/**
 * @brief Moment of element in-plane forces about a point
 *
 * Σ (dy·Fz − dz·Fy), positive in the sense of +Mx.
 */
double sum_in_plane_moment(const ElementGroup& group,
                           const std::vector<ElementDemand>& demands,
                           const Eigen::Vector2d& point);

/**
 * @brief Sum of element axial forces (demand × weight)
 */
double sum_axial_forces(const ElementGroup& group,
                        const std::vector<ElementDemand>& demands);

} // namespace connex
