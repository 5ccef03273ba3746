#include "connex/load.hpp"
#include <cmath>

namespace connex {

Load::Load(const Eigen::Vector3d& force,
           const Eigen::Vector3d& moment,
           const Eigen::Vector3d& point)
    : force_(force), moment_(moment), point_(point) {}

Load Load::from_components(double axial, double shear_y, double shear_z,
                           double torsion, double moment_y, double moment_z,
                           const Eigen::Vector3d& at) {
    return Load(Eigen::Vector3d(axial, shear_y, shear_z),
                Eigen::Vector3d(torsion, moment_y, moment_z),
                at);
}

Eigen::Vector3d Load::moments_about(const Eigen::Vector3d& target) const {
    // Lever arm from the target to the line of action
    Eigen::Vector3d r = point_ - target;
    return moment_ + r.cross(force_);
}

Load Load::transferred_to(const Eigen::Vector3d& target) const {
    return Load(force_, moments_about(target), target);
}

double Load::shear_magnitude() const {
    return std::hypot(force_(1), force_(2));
}

double Load::total_force_magnitude() const {
    return force_.norm();
}

bool Load::has_out_of_plane(const Eigen::Vector3d& target, double tolerance) const {
    if (std::abs(force_(0)) > tolerance) {
        return true;
    }
    Eigen::Vector3d m = moments_about(target);
    return std::abs(m(1)) > tolerance || std::abs(m(2)) > tolerance;
}

bool Load::is_finite() const {
    return force_.allFinite() && moment_.allFinite() && point_.allFinite();
}

} // namespace connex
