#pragma once

#include "connex/element_group.hpp"
#include "connex/group_properties.hpp"
#include "connex/demand.hpp"
#include "connex/load.hpp"
#include <vector>

namespace connex {

/**
 * @brief Linear-elastic (rigid plate, linear spring) demand distribution
 *
 * Demand is the superposition of a uniform direct share and a part
 * proportional to distance from the centroid:
 *
 *   in-plane:     f = F/W + Mx·(−dz, dy)/Ip
 *   out-of-plane: f = Fx/W + My·dz/Iy + Mz·dy/Iz     (welds only)
 *
 * where W is the total group weight (fastener count or weld area) and
 * (dy, dz) is the element offset from the centroid. Loads are transferred
 * to the centroid before distribution.
 *
 * Usage:
 *   GroupProperties props = compute_group_properties(group);
 *   ElasticDistributor elastic(group, props);
 *   auto demands = elastic.distribute_in_plane(load);
 *   elastic.add_out_of_plane(load, demands);   // welds
 */
class ElasticDistributor {
public:
    /**
     * @param group Element group (copied)
     * @param properties Properties computed for group
     * @param zero_tolerance Moments at or below this magnitude are ignored
     */
    ElasticDistributor(const ElementGroup& group,
                       const GroupProperties& properties,
                       double zero_tolerance = 1e-12);

    /**
     * @brief In-plane demand from Fy, Fz and Mx
     *
     * @param load Applied load (any application point)
     * @return One record per element, axial = 0
     *
     * @throws DegenerateGeometryError if Mx ≠ 0 and Ip = 0
     */
    std::vector<ElementDemand> distribute_in_plane(const Load& load) const;

    /**
     * @brief Add out-of-plane demand from Fx, My and Mz (signed)
     *
     * Intended for weld groups; fastener tension uses the neutral-axis
     * distributor instead.
     *
     * @throws DegenerateGeometryError if a bending moment acts about an
     *         axis with zero second moment
     */
    void add_out_of_plane(const Load& load, std::vector<ElementDemand>& demands) const;

    const GroupProperties& properties() const { return properties_; }

private:
    ElementGroup group_;
    GroupProperties properties_;
    double zero_tolerance_;
};

} // namespace connex
