#include "connex/demand.hpp"

namespace connex {

double ElementDemand::angle() const {
    return std::atan2(total_y(), total_z()) * 180.0 / M_PI;
}

Eigen::Vector2d sum_in_plane_forces(const ElementGroup& group,
                                    const std::vector<ElementDemand>& demands) {
    Eigen::Vector2d sum = Eigen::Vector2d::Zero();
    for (const auto& d : demands) {
        sum += group.weight(d.index) * d.in_plane();
    }
    return sum;
}

double sum_in_plane_moment(const ElementGroup& group,
                           const std::vector<ElementDemand>& demands,
                           const Eigen::Vector2d& point) {
    double moment = 0.0;
    for (const auto& d : demands) {
        const double w = group.weight(d.index);
        const double dy = d.position(0) - point(0);
        const double dz = d.position(1) - point(1);
        moment += w * (dy * d.total_z() - dz * d.total_y());
    }
    return moment;
}

double sum_axial_forces(const ElementGroup& group,
                        const std::vector<ElementDemand>& demands) {
    double sum = 0.0;
    for (const auto& d : demands) {
        sum += group.weight(d.index) * d.axial;
    }
    return sum;
}

} // namespace connex
