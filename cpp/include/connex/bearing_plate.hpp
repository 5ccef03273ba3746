#pragma once

#include <Eigen/Dense>
#include <algorithm>

namespace connex {

/**
 * @brief Axis-aligned bearing plate in the group (y, z) plane
 *
 * Defined by two opposing corners in any order. The plate extent bounds the
 * compression zone of the neutral-axis tension method.
 */
class BearingPlate {
public:
    /**
     * @param corner_a First corner (y, z)
     * @param corner_b Opposite corner (y, z)
     * @param thickness Plate thickness [length] (0 = not given)
     *
     * @throws DegenerateGeometryError if the plate has zero depth along y or z
     * @throws InvalidModeError on non-finite corners or negative thickness
     */
    BearingPlate(const Eigen::Vector2d& corner_a,
                 const Eigen::Vector2d& corner_b,
                 double thickness = 0.0);

    /**
     * @brief Plate of given width (along y) and height (along z)
     */
    static BearingPlate from_dimensions(double width, double height,
                                        const Eigen::Vector2d& center = Eigen::Vector2d::Zero(),
                                        double thickness = 0.0);

    const Eigen::Vector2d& corner_a() const { return corner_a_; }
    const Eigen::Vector2d& corner_b() const { return corner_b_; }
    double thickness() const { return thickness_; }

    double y_min() const { return std::min(corner_a_(0), corner_b_(0)); }
    double y_max() const { return std::max(corner_a_(0), corner_b_(0)); }
    double z_min() const { return std::min(corner_a_(1), corner_b_(1)); }
    double z_max() const { return std::max(corner_a_(1), corner_b_(1)); }

    double depth_y() const { return y_max() - y_min(); }
    double depth_z() const { return z_max() - z_min(); }

    Eigen::Vector2d center() const { return 0.5 * (corner_a_ + corner_b_); }

    /// True if point (y, z) lies on or inside the plate
    bool contains(const Eigen::Vector2d& point, double tolerance = 1e-9) const;

private:
    Eigen::Vector2d corner_a_;
    Eigen::Vector2d corner_b_;
    double thickness_;
};

} // namespace connex
