#include "connex/group_properties.hpp"
#include "connex/errors.hpp"
#include <cmath>

namespace connex {

namespace {

constexpr double ZERO_WEIGHT_TOLERANCE = 1e-12;

} // namespace

GroupProperties compute_group_properties(const ElementGroup& group) {
    GroupProperties props;
    props.n = static_cast<int>(group.size());

    if (group.size() == 0) {
        throw DegenerateGeometryError(ConnexError::empty_group());
    }

    // First moments
    Eigen::Vector2d first_moment = Eigen::Vector2d::Zero();
    for (size_t i = 0; i < group.size(); ++i) {
        const double w = group.weight(i);
        props.total_weight += w;
        props.total_length += group.element(i).length;
        first_moment += w * group.element(i).position;
    }

    if (!(props.total_weight > ZERO_WEIGHT_TOLERANCE)) {
        throw DegenerateGeometryError(ConnexError::zero_total_weight(props.total_weight));
    }

    props.centroid = first_moment / props.total_weight;

    // Second moments about the centroid
    for (size_t i = 0; i < group.size(); ++i) {
        const GroupElement& e = group.element(i);
        const double w = group.weight(i);
        const double dy = e.position(0) - props.centroid(0);
        const double dz = e.position(1) - props.centroid(1);

        props.Iy += w * dz * dz;
        props.Iz += w * dy * dy;

        if (group.is_weld()) {
            // Own inertia of a line segment: w·ds²/12 about its midpoint,
            // resolved onto each axis by the tangent direction
            const double own = w * e.length * e.length / 12.0;
            props.Iy += own * e.tangent(1) * e.tangent(1);
            props.Iz += own * e.tangent(0) * e.tangent(0);
        }
    }
    props.Ip = props.Iy + props.Iz;

    return props;
}

} // namespace connex
