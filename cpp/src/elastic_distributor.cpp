#include "connex/elastic_distributor.hpp"
#include "connex/errors.hpp"
#include <cmath>

namespace connex {

ElasticDistributor::ElasticDistributor(const ElementGroup& group,
                                       const GroupProperties& properties,
                                       double zero_tolerance)
    : group_(group), properties_(properties), zero_tolerance_(zero_tolerance) {}

std::vector<ElementDemand> ElasticDistributor::distribute_in_plane(const Load& load) const {
    const Load at_centroid = load.transferred_to(properties_.centroid_3d());
    const double Fy = at_centroid.Fy();
    const double Fz = at_centroid.Fz();
    const double Mx = at_centroid.Mx();
    const double W = properties_.total_weight;
    const double Ip = properties_.Ip;

    const bool has_torsion = std::abs(Mx) > zero_tolerance_;
    if (has_torsion && Ip <= zero_tolerance_) {
        throw DegenerateGeometryError(ConnexError::zero_inertia("Ip", Mx));
    }

    std::vector<ElementDemand> demands;
    demands.reserve(group_.size());

    for (size_t i = 0; i < group_.size(); ++i) {
        const GroupElement& e = group_.element(i);
        const double dy = e.position(0) - properties_.Cy();
        const double dz = e.position(1) - properties_.Cz();

        ElementDemand d;
        d.index = static_cast<int>(i);
        d.position = e.position;

        // Direct shear: uniform share per unit weight
        d.direct_y = Fy / W;
        d.direct_z = Fz / W;

        // Torsion: perpendicular to the radius, proportional to its length
        if (has_torsion) {
            d.torsion_y = -Mx * dz / Ip;
            d.torsion_z = Mx * dy / Ip;
        }

        demands.push_back(d);
    }

    return demands;
}

void ElasticDistributor::add_out_of_plane(const Load& load,
                                          std::vector<ElementDemand>& demands) const {
    const Load at_centroid = load.transferred_to(properties_.centroid_3d());
    const double Fx = at_centroid.Fx();
    const double My = at_centroid.My();
    const double Mz = at_centroid.Mz();

    const bool has_my = std::abs(My) > zero_tolerance_;
    const bool has_mz = std::abs(Mz) > zero_tolerance_;

    if (has_my && properties_.Iy <= zero_tolerance_) {
        throw DegenerateGeometryError(ConnexError::zero_inertia("Iy", My));
    }
    if (has_mz && properties_.Iz <= zero_tolerance_) {
        throw DegenerateGeometryError(ConnexError::zero_inertia("Iz", Mz));
    }

    for (auto& d : demands) {
        const double dy = d.position(0) - properties_.Cy();
        const double dz = d.position(1) - properties_.Cz();

        double f = Fx / properties_.total_weight;
        if (has_my) f += My * dz / properties_.Iy;
        if (has_mz) f += Mz * dy / properties_.Iz;

        d.axial += f;
    }
}

} // namespace connex
