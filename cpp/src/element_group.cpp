#include "connex/element_group.hpp"
#include "connex/errors.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <utility>

namespace connex {

namespace {

constexpr double FILLET_THROAT_RATIO = 0.707;

} // namespace

std::string weld_type_to_string(WeldType type) {
    switch (type) {
        case WeldType::Fillet: return "fillet";
        case WeldType::Pjp: return "pjp";
        case WeldType::Cjp: return "cjp";
        case WeldType::Plug: return "plug";
        case WeldType::Slot: return "slot";
        default: return "unknown";
    }
}

WeldParameters WeldParameters::fillet(double leg, double F_EXX) {
    WeldParameters params;
    params.type = WeldType::Fillet;
    params.leg = leg;
    params.F_EXX = F_EXX;
    return params.resolved();
}

WeldParameters WeldParameters::resolved() const {
    WeldParameters out = *this;
    if (out.type == WeldType::Fillet) {
        if (out.throat <= 0.0 && out.leg > 0.0) {
            out.throat = out.leg * FILLET_THROAT_RATIO;
        } else if (out.leg <= 0.0 && out.throat > 0.0) {
            out.leg = out.throat / FILLET_THROAT_RATIO;
        }
    }
    if (out.F_EXX <= 0.0 && !out.electrode.empty()) {
        out.F_EXX = parse_electrode_strength(out.electrode);
    }
    return out;
}

double parse_electrode_strength(const std::string& label) {
    size_t i = 0;
    while (i < label.size() && !std::isdigit(static_cast<unsigned char>(label[i]))) {
        ++i;
    }
    if (i == label.size()) {
        return 0.0;
    }
    return std::strtod(label.c_str() + i, nullptr);
}

ElementGroup::ElementGroup(GroupKind kind, std::vector<GroupElement> elements,
                           double diameter, WeldParameters weld)
    : kind_(kind), elements_(std::move(elements)), diameter_(diameter), weld_(std::move(weld)) {}

ElementGroup ElementGroup::fasteners(const std::vector<Eigen::Vector2d>& positions,
                                     double diameter) {
    if (positions.empty()) {
        throw DegenerateGeometryError(ConnexError::empty_group());
    }
    if (!(diameter >= 0.0) || !std::isfinite(diameter)) {
        throw InvalidModeError(ConnexError::invalid_property(
            "fastener diameter must be a finite non-negative value"));
    }

    std::vector<GroupElement> elements;
    elements.reserve(positions.size());
    for (size_t i = 0; i < positions.size(); ++i) {
        if (!positions[i].allFinite()) {
            ConnexError err(ErrorCode::NON_FINITE_INPUT, "Fastener position is not finite");
            err.involved_elements.push_back(static_cast<int>(i));
            throw InvalidModeError(err);
        }
        GroupElement e;
        e.position = positions[i];
        elements.push_back(e);
    }
    return ElementGroup(GroupKind::Fastener, std::move(elements), diameter, WeldParameters{});
}

ElementGroup ElementGroup::weld(const std::vector<WeldSegment>& segments,
                                const WeldParameters& parameters) {
    if (segments.empty()) {
        throw DegenerateGeometryError(ConnexError::empty_group());
    }

    WeldParameters params = parameters.resolved();
    if (!(params.throat > 0.0) || !std::isfinite(params.throat)) {
        throw InvalidModeError(ConnexError::invalid_property(
            "weld throat must be positive (give leg or throat)"));
    }

    std::vector<GroupElement> elements;
    elements.reserve(segments.size());
    for (size_t i = 0; i < segments.size(); ++i) {
        const WeldSegment& s = segments[i];
        if (!s.midpoint.allFinite() || !s.tangent.allFinite() || !std::isfinite(s.length)) {
            ConnexError err(ErrorCode::NON_FINITE_INPUT, "Weld segment data is not finite");
            err.involved_elements.push_back(static_cast<int>(i));
            throw InvalidModeError(err);
        }
        if (s.length <= 0.0) {
            ConnexError err = ConnexError::invalid_property("weld segment length must be positive");
            err.involved_elements.push_back(static_cast<int>(i));
            throw InvalidModeError(err);
        }
        double t_norm = s.tangent.norm();
        if (t_norm < 1e-12) {
            ConnexError err = ConnexError::invalid_property("weld segment tangent is zero");
            err.involved_elements.push_back(static_cast<int>(i));
            throw InvalidModeError(err);
        }

        GroupElement e;
        e.position = s.midpoint;
        e.length = s.length;
        e.tangent = s.tangent / t_norm;
        elements.push_back(e);
    }
    return ElementGroup(GroupKind::Weld, std::move(elements), 0.0, params);
}

double ElementGroup::weight(size_t i) const {
    if (kind_ == GroupKind::Fastener) {
        return 1.0;
    }
    return weld_.throat * elements_.at(i).length;
}

double ElementGroup::characteristic_size() const {
    return kind_ == GroupKind::Fastener ? diameter_ : weld_.leg;
}

ElementGroup ElementGroup::translated(const Eigen::Vector2d& offset) const {
    ElementGroup copy = *this;
    for (auto& e : copy.elements_) {
        e.position += offset;
    }
    return copy;
}

} // namespace connex
