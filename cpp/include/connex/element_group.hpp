#pragma once

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace connex {

/**
 * @brief Kind of connector elements in a group
 */
enum class GroupKind {
    Fastener,   ///< Discrete point fasteners (bolts)
    Weld        ///< Continuous weld path discretized into segments
};

/**
 * @brief Weld classification
 */
enum class WeldType {
    Fillet,
    Pjp,    ///< Partial joint penetration groove weld
    Cjp,    ///< Complete joint penetration groove weld
    Plug,
    Slot
};

std::string weld_type_to_string(WeldType type);

/**
 * @brief Weld configuration
 *
 * Geometry is unit-agnostic:
 * - leg: Fillet leg size w [length]
 * - throat: Effective throat a [length]
 * - F_EXX: Electrode strength [stress]
 *
 * For fillet welds, resolved() fills a missing throat from the leg
 * (a = 0.707·w) or a missing leg from the throat.
 */
struct WeldParameters {
    WeldType type = WeldType::Fillet;
    double leg = 0.0;           ///< Leg size [length] (0 = not given)
    double throat = 0.0;        ///< Effective throat [length] (0 = not given)
    double F_EXX = 0.0;         ///< Electrode strength [stress] (0 = not given)
    std::string electrode;      ///< Electrode label, e.g. "E70"

    /// Apply (1 + 0.5 sin^1.5 θ) directional strength increase.
    /// Disabled for rectangular HSS end connections.
    bool include_directional_factor = true;

    /**
     * @brief Equal-leg fillet weld
     */
    static WeldParameters fillet(double leg, double F_EXX = 0.0);

    /**
     * @brief Copy with throat/leg/F_EXX derived where possible
     */
    WeldParameters resolved() const;
};

/**
 * @brief Parse electrode strength from a label
 *
 * Takes the first number in the label ("E70" -> 70.0, "E80XX" -> 80.0).
 * No unit conversion is performed.
 *
 * @return Parsed strength, or 0.0 if the label contains no number
 */
double parse_electrode_strength(const std::string& label);

/**
 * @brief Discretized weld segment supplied by a geometry collaborator
 */
struct WeldSegment {
    Eigen::Vector2d midpoint;   ///< Segment midpoint (y, z)
    double length;              ///< Arc length ds
    Eigen::Vector2d tangent;    ///< Local unit tangent along the weld path
};

/**
 * @brief One element of a group in local (y, z) coordinates
 *
 * For fasteners, length is zero and tangent is unused.
 */
struct GroupElement {
    Eigen::Vector2d position = Eigen::Vector2d::Zero();
    double length = 0.0;
    Eigen::Vector2d tangent = Eigen::Vector2d(1.0, 0.0);
};

/**
 * @brief Ordered, non-empty collection of connector elements
 *
 * Built once through fasteners() or weld() and never mutated afterwards,
 * so one group may be shared by concurrent analyses.
 */
class ElementGroup {
public:
    /**
     * @brief Build a fastener group
     *
     * @param positions Fastener positions (y, z)
     * @param diameter Fastener diameter [length], used to size the ICR search
     *
     * @throws DegenerateGeometryError if positions is empty
     * @throws InvalidModeError if a coordinate is not finite or diameter < 0
     */
    static ElementGroup fasteners(const std::vector<Eigen::Vector2d>& positions,
                                  double diameter = 0.0);

    /**
     * @brief Build a weld group from discretized segments
     *
     * Tangents are normalized; zero-length segments are rejected.
     *
     * @throws DegenerateGeometryError if segments is empty
     * @throws InvalidModeError on non-positive lengths, zero tangents or
     *         a weld without an effective throat
     */
    static ElementGroup weld(const std::vector<WeldSegment>& segments,
                             const WeldParameters& parameters);

    GroupKind kind() const { return kind_; }
    bool is_fastener() const { return kind_ == GroupKind::Fastener; }
    bool is_weld() const { return kind_ == GroupKind::Weld; }

    size_t size() const { return elements_.size(); }
    const std::vector<GroupElement>& elements() const { return elements_; }
    const GroupElement& element(size_t i) const { return elements_.at(i); }

    /**
     * @brief Weight of element i
     *
     * 1 for fasteners, throat·ds (effective area) for welds.
     */
    double weight(size_t i) const;

    /// Fastener diameter (0 if not given or for welds)
    double fastener_diameter() const { return diameter_; }

    /// Resolved weld parameters (meaningful for weld groups only)
    const WeldParameters& weld_parameters() const { return weld_; }

    /// Fastener diameter or weld leg, used to scale ICR search bounds
    double characteristic_size() const;

    /**
     * @brief Copy of this group with every position shifted by offset
     */
    ElementGroup translated(const Eigen::Vector2d& offset) const;

private:
    ElementGroup(GroupKind kind, std::vector<GroupElement> elements,
                 double diameter, WeldParameters weld);

    GroupKind kind_;
    std::vector<GroupElement> elements_;
    double diameter_ = 0.0;
    WeldParameters weld_;
};

} // namespace connex
