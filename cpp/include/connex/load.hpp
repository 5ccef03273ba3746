#pragma once

#include <Eigen/Dense>

namespace connex {

/**
 * @brief Applied force and moment at a point
 *
 * Components are expressed in the connection's local coordinate system:
 * - x: normal to the connection plane (along the member), tension positive
 * - y, z: in the connection plane
 *
 * Components:
 * - Fx: Axial force [force]
 * - Fy, Fz: In-plane shear forces [force]
 * - Mx: Torsion (in-plane moment) [force·length]
 * - My, Mz: Out-of-plane bending moments [force·length]
 *
 * Moments are relative to the application point. A Load is immutable;
 * transferred_to() returns a new, statically equivalent Load.
 */
class Load {
public:
    /**
     * @brief Construct a load
     *
     * @param force Force vector (Fx, Fy, Fz)
     * @param moment Moment vector (Mx, My, Mz) about the application point
     * @param point Application point (x, y, z)
     */
    Load(const Eigen::Vector3d& force = Eigen::Vector3d::Zero(),
         const Eigen::Vector3d& moment = Eigen::Vector3d::Zero(),
         const Eigen::Vector3d& point = Eigen::Vector3d::Zero());

    /**
     * @brief Construct a load from named components
     *
     * @param axial Axial force Fx (tension positive)
     * @param shear_y Shear force Fy
     * @param shear_z Shear force Fz
     * @param torsion Torsion Mx
     * @param moment_y Bending moment My
     * @param moment_z Bending moment Mz
     * @param at Application point (x, y, z)
     */
    static Load from_components(double axial, double shear_y, double shear_z,
                                double torsion, double moment_y, double moment_z,
                                const Eigen::Vector3d& at = Eigen::Vector3d::Zero());

    double Fx() const { return force_(0); }
    double Fy() const { return force_(1); }
    double Fz() const { return force_(2); }
    double Mx() const { return moment_(0); }
    double My() const { return moment_(1); }
    double Mz() const { return moment_(2); }

    const Eigen::Vector3d& force() const { return force_; }
    const Eigen::Vector3d& moment() const { return moment_; }
    const Eigen::Vector3d& point() const { return point_; }

    /**
     * @brief Total moments about a point
     *
     * M_target = M + (p_application - p_target) × F
     *
     * @param target Point to take moments about
     * @return Moment vector (Mx, My, Mz) about target
     */
    Eigen::Vector3d moments_about(const Eigen::Vector3d& target) const;

    /**
     * @brief Equivalent load acting at another point
     *
     * Force is unchanged; moments are transferred with moments_about().
     */
    Load transferred_to(const Eigen::Vector3d& target) const;

    /// Magnitude of the in-plane shear resultant sqrt(Fy² + Fz²)
    double shear_magnitude() const;

    /// Magnitude of the total force vector
    double total_force_magnitude() const;

    /**
     * @brief Check for out-of-plane action about a point
     *
     * True if Fx is nonzero, or if My or Mz (after transfer to target,
     * which captures eccentricity along x) is nonzero.
     */
    bool has_out_of_plane(const Eigen::Vector3d& target, double tolerance = 1e-12) const;

    /// True if every component and coordinate is finite
    bool is_finite() const;

private:
    Eigen::Vector3d force_;
    Eigen::Vector3d moment_;
    Eigen::Vector3d point_;
};

} // namespace connex
