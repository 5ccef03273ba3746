#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/eigen.h>
#include <pybind11/functional.h>

#include "connex/errors.hpp"
#include "connex/warnings.hpp"
#include "connex/load.hpp"
#include "connex/element_group.hpp"
#include "connex/group_properties.hpp"
#include "connex/demand.hpp"
#include "connex/elastic_distributor.hpp"
#include "connex/force_deformation.hpp"
#include "connex/icr_solver.hpp"
#include "connex/bearing_plate.hpp"
#include "connex/tension_distributor.hpp"
#include "connex/connection_analysis.hpp"

namespace py = pybind11;

/**
 * connex C++ Python bindings module.
 * This module exposes the distribution engine to Python via pybind11.
 */
PYBIND11_MODULE(_connex_cpp, m) {
    m.doc() = "connex C++ core module - Connection force and stress distribution";

    m.attr("__version__") = "0.1.0";

    // ========================================================================
    // Errors and warnings
    // ========================================================================

    py::enum_<connex::ErrorCode>(m, "ErrorCode",
        "Machine-readable error codes for analysis failures")
        .value("OK", connex::ErrorCode::OK)
        .value("EMPTY_GROUP", connex::ErrorCode::EMPTY_GROUP,
               "Element group has no elements")
        .value("ZERO_TOTAL_WEIGHT", connex::ErrorCode::ZERO_TOTAL_WEIGHT,
               "Total element weight is zero")
        .value("ZERO_INERTIA", connex::ErrorCode::ZERO_INERTIA,
               "Second moment is zero where a moment must be resisted")
        .value("EMPTY_TENSION_ROWS", connex::ErrorCode::EMPTY_TENSION_ROWS,
               "No fastener row on the tension side of the neutral axis")
        .value("DEGENERATE_PLATE", connex::ErrorCode::DEGENERATE_PLATE,
               "Bearing plate has zero depth")
        .value("INVALID_PROPERTY", connex::ErrorCode::INVALID_PROPERTY)
        .value("NON_FINITE_INPUT", connex::ErrorCode::NON_FINITE_INPUT)
        .value("UNKNOWN_MODE", connex::ErrorCode::UNKNOWN_MODE)
        .value("ICR_OUT_OF_PLANE", connex::ErrorCode::ICR_OUT_OF_PLANE)
        .value("ICR_WELD_TYPE", connex::ErrorCode::ICR_WELD_TYPE)
        .value("MISSING_PLATE", connex::ErrorCode::MISSING_PLATE)
        .value("INVALID_ROW_MEMBERSHIP", connex::ErrorCode::INVALID_ROW_MEMBERSHIP)
        .value("SOLVER_CONVERGENCE_FAILED", connex::ErrorCode::SOLVER_CONVERGENCE_FAILED)
        .value("SOLVER_NO_BRACKET", connex::ErrorCode::SOLVER_NO_BRACKET)
        .value("UNKNOWN_ERROR", connex::ErrorCode::UNKNOWN_ERROR)
        .export_values();

    py::class_<connex::ConnexError>(m, "ConnexError",
        "Structured error information with machine-readable code and diagnostics")
        .def(py::init<>(), "Create OK (no error) status")
        .def(py::init<connex::ErrorCode, const std::string&>(),
             py::arg("code"), py::arg("message"))
        .def_readwrite("code", &connex::ConnexError::code, "Error code")
        .def_readwrite("message", &connex::ConnexError::message, "Error message")
        .def_readwrite("involved_elements", &connex::ConnexError::involved_elements,
                      "Element indices involved in the error")
        .def_readwrite("details", &connex::ConnexError::details,
                      "Additional diagnostic details (key-value pairs)")
        .def_readwrite("suggestion", &connex::ConnexError::suggestion,
                      "Suggested fix for the error")
        .def("is_ok", &connex::ConnexError::is_ok)
        .def("is_error", &connex::ConnexError::is_error)
        .def("code_string", &connex::ConnexError::code_string)
        .def("to_string", &connex::ConnexError::to_string)
        .def("__repr__", [](const connex::ConnexError &e) {
            if (e.is_ok()) return std::string("<ConnexError OK>");
            return "<ConnexError " + e.code_string() + ": " + e.message + ">";
        });

    // Exception types keep their category so Python callers can retry
    // elastically after a convergence failure
    auto analysis_error = py::register_exception<connex::AnalysisError>(
        m, "AnalysisError", PyExc_RuntimeError);
    py::register_exception<connex::DegenerateGeometryError>(
        m, "DegenerateGeometryError", analysis_error.ptr());
    py::register_exception<connex::ConvergenceError>(
        m, "ConvergenceError", analysis_error.ptr());
    py::register_exception<connex::InvalidModeError>(
        m, "InvalidModeError", analysis_error.ptr());

    py::enum_<connex::WarningCode>(m, "WarningCode")
        .value("SINGLE_ELEMENT_GROUP", connex::WarningCode::SINGLE_ELEMENT_GROUP)
        .value("COARSE_DISCRETIZATION", connex::WarningCode::COARSE_DISCRETIZATION)
        .value("FASTENER_OUTSIDE_PLATE", connex::WarningCode::FASTENER_OUTSIDE_PLATE)
        .value("ROWS_MERGED", connex::WarningCode::ROWS_MERGED)
        .value("ICR_ELASTIC_FALLBACK", connex::WarningCode::ICR_ELASTIC_FALLBACK)
        .export_values();

    py::enum_<connex::WarningSeverity>(m, "WarningSeverity")
        .value("Low", connex::WarningSeverity::Low)
        .value("Medium", connex::WarningSeverity::Medium)
        .value("High", connex::WarningSeverity::High)
        .export_values();

    py::class_<connex::ConnexWarning>(m, "ConnexWarning",
        "Structured warning for questionable but valid configurations")
        .def_readonly("code", &connex::ConnexWarning::code)
        .def_readonly("severity", &connex::ConnexWarning::severity)
        .def_readonly("message", &connex::ConnexWarning::message)
        .def_readonly("involved_elements", &connex::ConnexWarning::involved_elements)
        .def_readonly("details", &connex::ConnexWarning::details)
        .def_readonly("suggestion", &connex::ConnexWarning::suggestion)
        .def("code_string", &connex::ConnexWarning::code_string)
        .def("to_string", &connex::ConnexWarning::to_string)
        .def("__repr__", [](const connex::ConnexWarning &w) {
            return "<ConnexWarning " + w.code_string() + ">";
        });

    py::class_<connex::WarningList>(m, "WarningList")
        .def_readonly("warnings", &connex::WarningList::warnings)
        .def("has_warnings", &connex::WarningList::has_warnings)
        .def("count", &connex::WarningList::count)
        .def("contains", &connex::WarningList::contains, py::arg("code"))
        .def("summary", &connex::WarningList::summary)
        .def("__len__", &connex::WarningList::count);

    // ========================================================================
    // Load and geometry
    // ========================================================================

    py::class_<connex::Load>(m, "Load",
        "Force and moment vectors acting at a point in connection coordinates")
        .def(py::init<const Eigen::Vector3d&, const Eigen::Vector3d&, const Eigen::Vector3d&>(),
             py::arg("force") = Eigen::Vector3d::Zero(),
             py::arg("moment") = Eigen::Vector3d::Zero(),
             py::arg("point") = Eigen::Vector3d::Zero())
        .def_static("from_components", &connex::Load::from_components,
                    py::arg("axial") = 0.0, py::arg("shear_y") = 0.0,
                    py::arg("shear_z") = 0.0, py::arg("torsion") = 0.0,
                    py::arg("moment_y") = 0.0, py::arg("moment_z") = 0.0,
                    py::arg("at") = Eigen::Vector3d::Zero(),
                    "Create a load from named components")
        .def_property_readonly("Fx", &connex::Load::Fx)
        .def_property_readonly("Fy", &connex::Load::Fy)
        .def_property_readonly("Fz", &connex::Load::Fz)
        .def_property_readonly("Mx", &connex::Load::Mx)
        .def_property_readonly("My", &connex::Load::My)
        .def_property_readonly("Mz", &connex::Load::Mz)
        .def_property_readonly("force", &connex::Load::force)
        .def_property_readonly("moment", &connex::Load::moment)
        .def_property_readonly("point", &connex::Load::point)
        .def("moments_about", &connex::Load::moments_about, py::arg("target"))
        .def("transferred_to", &connex::Load::transferred_to, py::arg("target"))
        .def("shear_magnitude", &connex::Load::shear_magnitude)
        .def("total_force_magnitude", &connex::Load::total_force_magnitude);

    py::enum_<connex::GroupKind>(m, "GroupKind")
        .value("Fastener", connex::GroupKind::Fastener)
        .value("Weld", connex::GroupKind::Weld)
        .export_values();

    py::enum_<connex::WeldType>(m, "WeldType")
        .value("Fillet", connex::WeldType::Fillet)
        .value("Pjp", connex::WeldType::Pjp)
        .value("Cjp", connex::WeldType::Cjp)
        .value("Plug", connex::WeldType::Plug)
        .value("Slot", connex::WeldType::Slot)
        .export_values();

    py::class_<connex::WeldParameters>(m, "WeldParameters")
        .def(py::init<>())
        .def_readwrite("type", &connex::WeldParameters::type)
        .def_readwrite("leg", &connex::WeldParameters::leg, "Leg size [length]")
        .def_readwrite("throat", &connex::WeldParameters::throat, "Effective throat [length]")
        .def_readwrite("F_EXX", &connex::WeldParameters::F_EXX, "Electrode strength [stress]")
        .def_readwrite("electrode", &connex::WeldParameters::electrode)
        .def_readwrite("include_directional_factor",
                       &connex::WeldParameters::include_directional_factor)
        .def_static("fillet", &connex::WeldParameters::fillet,
                    py::arg("leg"), py::arg("F_EXX") = 0.0)
        .def("resolved", &connex::WeldParameters::resolved);

    py::class_<connex::WeldSegment>(m, "WeldSegment")
        .def(py::init([](const Eigen::Vector2d& midpoint, double length,
                         const Eigen::Vector2d& tangent) {
                 return connex::WeldSegment{midpoint, length, tangent};
             }),
             py::arg("midpoint"), py::arg("length"), py::arg("tangent"))
        .def_readwrite("midpoint", &connex::WeldSegment::midpoint)
        .def_readwrite("length", &connex::WeldSegment::length)
        .def_readwrite("tangent", &connex::WeldSegment::tangent);

    py::class_<connex::ElementGroup>(m, "ElementGroup",
        "Immutable collection of fasteners or weld segments")
        .def_static("fasteners", &connex::ElementGroup::fasteners,
                    py::arg("positions"), py::arg("diameter") = 0.0)
        .def_static("weld", &connex::ElementGroup::weld,
                    py::arg("segments"), py::arg("parameters"))
        .def_property_readonly("kind", &connex::ElementGroup::kind)
        .def("is_fastener", &connex::ElementGroup::is_fastener)
        .def("is_weld", &connex::ElementGroup::is_weld)
        .def("weight", &connex::ElementGroup::weight, py::arg("i"))
        .def("positions", [](const connex::ElementGroup& g) {
            std::vector<Eigen::Vector2d> out;
            for (const auto& e : g.elements()) out.push_back(e.position);
            return out;
        })
        .def_property_readonly("weld_parameters", &connex::ElementGroup::weld_parameters)
        .def("translated", &connex::ElementGroup::translated, py::arg("offset"))
        .def("__len__", &connex::ElementGroup::size);

    py::class_<connex::GroupProperties>(m, "GroupProperties")
        .def_readonly("centroid", &connex::GroupProperties::centroid)
        .def_readonly("n", &connex::GroupProperties::n)
        .def_readonly("total_weight", &connex::GroupProperties::total_weight)
        .def_readonly("total_length", &connex::GroupProperties::total_length)
        .def_readonly("Iy", &connex::GroupProperties::Iy)
        .def_readonly("Iz", &connex::GroupProperties::Iz)
        .def_readonly("Ip", &connex::GroupProperties::Ip)
        .def_property_readonly("Cy", &connex::GroupProperties::Cy)
        .def_property_readonly("Cz", &connex::GroupProperties::Cz);

    m.def("compute_group_properties", &connex::compute_group_properties,
          py::arg("group"), "Centroid and second moments of an element group");

    py::class_<connex::BearingPlate>(m, "BearingPlate")
        .def(py::init<const Eigen::Vector2d&, const Eigen::Vector2d&, double>(),
             py::arg("corner_a"), py::arg("corner_b"), py::arg("thickness") = 0.0)
        .def_static("from_dimensions", &connex::BearingPlate::from_dimensions,
                    py::arg("width"), py::arg("height"),
                    py::arg("center") = Eigen::Vector2d::Zero(),
                    py::arg("thickness") = 0.0)
        .def_property_readonly("y_min", &connex::BearingPlate::y_min)
        .def_property_readonly("y_max", &connex::BearingPlate::y_max)
        .def_property_readonly("z_min", &connex::BearingPlate::z_min)
        .def_property_readonly("z_max", &connex::BearingPlate::z_max)
        .def_property_readonly("depth_y", &connex::BearingPlate::depth_y)
        .def_property_readonly("depth_z", &connex::BearingPlate::depth_z)
        .def("contains", &connex::BearingPlate::contains,
             py::arg("point"), py::arg("tolerance") = 1e-9);

    // ========================================================================
    // Settings
    // ========================================================================

    py::class_<connex::IcrSolverSettings>(m, "IcrSolverSettings")
        .def(py::init<>())
        .def_readwrite("max_iterations", &connex::IcrSolverSettings::max_iterations)
        .def_readwrite("tolerance", &connex::IcrSolverSettings::tolerance)
        .def_readwrite("scan_candidates", &connex::IcrSolverSettings::scan_candidates)
        .def_readwrite("zero_tolerance", &connex::IcrSolverSettings::zero_tolerance)
        .def_readwrite("position_tolerance", &connex::IcrSolverSettings::position_tolerance)
        .def_readwrite("direction_tolerance", &connex::IcrSolverSettings::direction_tolerance)
        .def_readwrite("progress_callback", &connex::IcrSolverSettings::progress_callback);

    py::class_<connex::CrawfordKulakParameters>(m, "CrawfordKulakParameters")
        .def(py::init<>())
        .def_readwrite("mu", &connex::CrawfordKulakParameters::mu)
        .def_readwrite("lambda_", &connex::CrawfordKulakParameters::lambda)
        .def_readwrite("delta_max", &connex::CrawfordKulakParameters::delta_max)
        .def_readwrite("R_ult", &connex::CrawfordKulakParameters::R_ult);

    py::class_<connex::AiscWeldParameters>(m, "AiscWeldParameters")
        .def(py::init<>())
        .def_readwrite("default_F_EXX", &connex::AiscWeldParameters::default_F_EXX)
        .def_readwrite("position_tolerance", &connex::AiscWeldParameters::position_tolerance);

    py::enum_<connex::NeutralAxisMode>(m, "NeutralAxisMode")
        .value("Conservative", connex::NeutralAxisMode::Conservative)
        .value("Accurate", connex::NeutralAxisMode::Accurate)
        .export_values();

    m.def("parse_neutral_axis_mode", &connex::parse_neutral_axis_mode, py::arg("mode"));

    py::class_<connex::TensionDistributorSettings>(m, "TensionDistributorSettings")
        .def(py::init<>())
        .def_readwrite("mode", &connex::TensionDistributorSettings::mode)
        .def_readwrite("row_tolerance", &connex::TensionDistributorSettings::row_tolerance)
        .def_readwrite("zero_tolerance", &connex::TensionDistributorSettings::zero_tolerance)
        .def_readwrite("rows_about_y", &connex::TensionDistributorSettings::rows_about_y)
        .def_readwrite("rows_about_z", &connex::TensionDistributorSettings::rows_about_z);

    py::enum_<connex::ShearMethod>(m, "ShearMethod")
        .value("Elastic", connex::ShearMethod::Elastic)
        .value("Icr", connex::ShearMethod::Icr)
        .export_values();

    py::enum_<connex::MethodUsed>(m, "MethodUsed")
        .value("Elastic", connex::MethodUsed::Elastic)
        .value("Icr", connex::MethodUsed::Icr)
        .value("ElasticFallback", connex::MethodUsed::ElasticFallback)
        .export_values();

    m.def("parse_shear_method", &connex::parse_shear_method, py::arg("method"));

    py::class_<connex::AnalysisOptions>(m, "AnalysisOptions")
        .def(py::init<>())
        .def_readwrite("shear_method", &connex::AnalysisOptions::shear_method)
        .def_readwrite("plate", &connex::AnalysisOptions::plate)
        .def_readwrite("tension", &connex::AnalysisOptions::tension)
        .def_readwrite("icr", &connex::AnalysisOptions::icr)
        .def_readwrite("bolt_law", &connex::AnalysisOptions::bolt_law)
        .def_readwrite("weld_law", &connex::AnalysisOptions::weld_law)
        .def_readwrite("min_weld_segments", &connex::AnalysisOptions::min_weld_segments);

    // ========================================================================
    // Results
    // ========================================================================

    py::class_<connex::ElementDemand>(m, "ElementDemand",
        "Demand on one element: force for fasteners, stress for welds")
        .def_readonly("index", &connex::ElementDemand::index)
        .def_readonly("position", &connex::ElementDemand::position)
        .def_readonly("direct_y", &connex::ElementDemand::direct_y)
        .def_readonly("direct_z", &connex::ElementDemand::direct_z)
        .def_readonly("torsion_y", &connex::ElementDemand::torsion_y)
        .def_readonly("torsion_z", &connex::ElementDemand::torsion_z)
        .def_readonly("axial", &connex::ElementDemand::axial)
        .def_readonly("directional_factor", &connex::ElementDemand::directional_factor)
        .def_property_readonly("total_y", &connex::ElementDemand::total_y)
        .def_property_readonly("total_z", &connex::ElementDemand::total_z)
        .def_property_readonly("shear", &connex::ElementDemand::shear)
        .def_property_readonly("resultant", &connex::ElementDemand::resultant)
        .def_property_readonly("angle", &connex::ElementDemand::angle);

    py::class_<connex::AxisTensionDiagnostics>(m, "AxisTensionDiagnostics")
        .def_readonly("moment", &connex::AxisTensionDiagnostics::moment)
        .def_readonly("active", &connex::AxisTensionDiagnostics::active)
        .def_readonly("neutral_axis", &connex::AxisTensionDiagnostics::neutral_axis)
        .def_readonly("compression_edge", &connex::AxisTensionDiagnostics::compression_edge)
        .def_readonly("y_1", &connex::AxisTensionDiagnostics::y_1)
        .def_readonly("y_c", &connex::AxisTensionDiagnostics::y_c)
        .def_readonly("T_1", &connex::AxisTensionDiagnostics::T_1)
        .def_readonly("tension_rows", &connex::AxisTensionDiagnostics::tension_rows)
        .def_readonly("compression_rows", &connex::AxisTensionDiagnostics::compression_rows)
        .def_readonly("contributions", &connex::AxisTensionDiagnostics::contributions);

    py::class_<connex::TensionDistribution>(m, "TensionDistribution")
        .def_readonly("tensions", &connex::TensionDistribution::tensions)
        .def_readonly("direct", &connex::TensionDistribution::direct)
        .def_readonly("about_y", &connex::TensionDistribution::about_y)
        .def_readonly("about_z", &connex::TensionDistribution::about_z)
        .def_readonly("warnings", &connex::TensionDistribution::warnings);

    py::class_<connex::ConnectionResult>(m, "ConnectionResult")
        .def_readonly("demands", &connex::ConnectionResult::demands)
        .def_readonly("method_used", &connex::ConnectionResult::method_used)
        .def_readonly("icr_center", &connex::ConnectionResult::icr_center)
        .def_readonly("icr_distance", &connex::ConnectionResult::icr_distance)
        .def_readonly("icr_iterations", &connex::ConnectionResult::icr_iterations)
        .def_readonly("properties", &connex::ConnectionResult::properties)
        .def_readonly("load_at_centroid", &connex::ConnectionResult::load_at_centroid)
        .def_readonly("tension", &connex::ConnectionResult::tension)
        .def_readonly("warnings", &connex::ConnectionResult::warnings)
        .def_property_readonly("max_shear", &connex::ConnectionResult::max_shear)
        .def_property_readonly("max_axial", &connex::ConnectionResult::max_axial)
        .def_property_readonly("max_resultant", &connex::ConnectionResult::max_resultant)
        .def_property_readonly("min_resultant", &connex::ConnectionResult::min_resultant)
        .def_property_readonly("mean_resultant", &connex::ConnectionResult::mean_resultant)
        .def("critical_element", &connex::ConnectionResult::critical_element,
             py::return_value_policy::reference_internal)
        .def("nearest", &connex::ConnectionResult::nearest,
             py::arg("y"), py::arg("z"), py::return_value_policy::reference_internal)
        .def("directional_factors", &connex::ConnectionResult::directional_factors);

    m.def("analyze_connection", &connex::analyze_connection,
          py::arg("group"), py::arg("load"),
          py::arg("options") = connex::AnalysisOptions(),
          "Distribute a load over a fastener or weld group");

    m.def("analyze", [](const connex::ElementGroup& group, const connex::Load& load,
                        const std::string& method, const std::string& tension_method,
                        std::optional<connex::BearingPlate> plate) {
              connex::AnalysisOptions options;
              options.shear_method = connex::parse_shear_method(method);
              options.tension.mode = connex::parse_neutral_axis_mode(tension_method);
              options.plate = std::move(plate);
              return connex::analyze_connection(group, load, options);
          },
          py::arg("group"), py::arg("load"),
          py::arg("method") = "elastic",
          py::arg("tension_method") = "conservative",
          py::arg("plate") = py::none(),
          "Analyze with string mode selections");
}
