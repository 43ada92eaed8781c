#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/eigen.h>

#include "beamlab/errors.hpp"
#include "beamlab/warnings.hpp"
#include "beamlab/section.hpp"
#include "beamlab/material.hpp"
#include "beamlab/loads.hpp"
#include "beamlab/beam_config.hpp"
#include "beamlab/reaction_solver.hpp"
#include "beamlab/internal_actions.hpp"
#include "beamlab/beam_field_solver.hpp"
#include "beamlab/diagram_integrator.hpp"
#include "beamlab/piecewise_polynomial.hpp"
#include "beamlab/bearing.hpp"
#include "beamlab/design_checks.hpp"
#include "beamlab/analysis.hpp"

namespace py = pybind11;

/**
 * BeamLab C++ Python bindings module.
 * This module exposes the analysis engine to Python via pybind11.
 */
PYBIND11_MODULE(_beamlab_cpp, m) {
    m.doc() = "BeamLab C++ core module - Beam and bearing mechanics engine";

    m.attr("__version__") = "1.0.0";

    // ========================================================================
    // Diagnostics
    // ========================================================================

    py::enum_<beamlab::ErrorCode>(m, "ErrorCode",
        "Error codes for internal invariant violations")
        .value("OK", beamlab::ErrorCode::OK, "No error")
        .value("SEGMENT_COVERAGE", beamlab::ErrorCode::SEGMENT_COVERAGE,
               "Piecewise segments do not cover the beam")
        .value("SEGMENT_ORDER", beamlab::ErrorCode::SEGMENT_ORDER,
               "Piecewise segment is empty or reversed")
        .value("NON_FINITE_RESULT", beamlab::ErrorCode::NON_FINITE_RESULT,
               "NaN or infinite result")
        .value("EQUILIBRIUM_VIOLATED", beamlab::ErrorCode::EQUILIBRIUM_VIOLATED,
               "Reactions do not balance the loads")
        .value("UNKNOWN_ERROR", beamlab::ErrorCode::UNKNOWN_ERROR, "Unknown error")
        .export_values();

    py::class_<beamlab::BeamlabError>(m, "BeamlabError",
        "Structured error information with machine-readable code and diagnostics")
        .def(py::init<>(), "Create OK (no error) status")
        .def(py::init<beamlab::ErrorCode, const std::string&>(),
             py::arg("code"), py::arg("message"))
        .def_readwrite("code", &beamlab::BeamlabError::code, "Error code")
        .def_readwrite("message", &beamlab::BeamlabError::message, "Error message")
        .def_readwrite("details", &beamlab::BeamlabError::details,
                      "Additional diagnostic details (key-value pairs)")
        .def("is_ok", &beamlab::BeamlabError::is_ok, "Check if no error")
        .def("is_error", &beamlab::BeamlabError::is_error, "Check if error occurred")
        .def("code_string", &beamlab::BeamlabError::code_string)
        .def("to_string", &beamlab::BeamlabError::to_string)
        .def("__repr__", [](const beamlab::BeamlabError &e) {
            if (e.is_ok()) return std::string("<BeamlabError OK>");
            return "<BeamlabError " + e.code_string() + ": " + e.message + ">";
        })
        .def("__str__", &beamlab::BeamlabError::to_string)
        .def("__bool__", [](const beamlab::BeamlabError &e) {
            return e.is_error();
        });

    // InvariantError surfaces as RuntimeError carrying the formatted error
    py::register_exception<beamlab::InvariantError>(m, "InvariantError", PyExc_RuntimeError);

    py::enum_<beamlab::WarningCode>(m, "WarningCode",
        "Warning codes for fallbacks and failed checks")
        .value("SECTION_SOLID_FALLBACK", beamlab::WarningCode::SECTION_SOLID_FALLBACK,
               "I-beam treated as a solid box")
        .value("DEGENERATE_SUPPORT_SPAN", beamlab::WarningCode::DEGENERATE_SUPPORT_SPAN,
               "Supports coincide")
        .value("UNSUPPORTED_FIELD_BOUNDARY", beamlab::WarningCode::UNSUPPORTED_FIELD_BOUNDARY,
               "No closed-form field for this boundary condition")
        .value("POSITION_CLAMPED", beamlab::WarningCode::POSITION_CLAMPED,
               "Position clamped into [0, L]")
        .value("INVALID_LOAD_RANGE", beamlab::WarningCode::INVALID_LOAD_RANGE,
               "Range load dropped")
        .value("HIGH_STRESS", beamlab::WarningCode::HIGH_STRESS,
               "Stress exceeds yield")
        .value("EXCESSIVE_DEFLECTION", beamlab::WarningCode::EXCESSIVE_DEFLECTION,
               "Deflection exceeds span/360")
        .value("NON_POSITIVE_YIELD", beamlab::WarningCode::NON_POSITIVE_YIELD,
               "Yield strength is not positive")
        .export_values();

    py::enum_<beamlab::WarningSeverity>(m, "WarningSeverity", "Warning severity levels")
        .value("Low", beamlab::WarningSeverity::Low, "Informational correction")
        .value("Medium", beamlab::WarningSeverity::Medium, "Review recommended")
        .value("High", beamlab::WarningSeverity::High, "Result is not physical")
        .export_values();

    py::class_<beamlab::BeamlabWarning>(m, "BeamlabWarning",
        "Structured warning information")
        .def(py::init<beamlab::WarningCode, beamlab::WarningSeverity, const std::string&>(),
             py::arg("code"), py::arg("severity"), py::arg("message"))
        .def_readwrite("code", &beamlab::BeamlabWarning::code, "Warning code")
        .def_readwrite("severity", &beamlab::BeamlabWarning::severity, "Severity level")
        .def_readwrite("message", &beamlab::BeamlabWarning::message, "Warning message")
        .def_readwrite("details", &beamlab::BeamlabWarning::details,
                      "Additional details (key-value pairs)")
        .def_readwrite("suggestion", &beamlab::BeamlabWarning::suggestion, "Suggested fix")
        .def("code_string", &beamlab::BeamlabWarning::code_string)
        .def("severity_string", &beamlab::BeamlabWarning::severity_string)
        .def("to_string", &beamlab::BeamlabWarning::to_string)
        .def("__repr__", [](const beamlab::BeamlabWarning &w) {
            return "<BeamlabWarning [" + w.severity_string() + "] " +
                   w.code_string() + ": " + w.message + ">";
        })
        .def("__str__", &beamlab::BeamlabWarning::to_string);

    py::class_<beamlab::WarningList>(m, "WarningList",
        "Collection of warnings produced by one analysis")
        .def(py::init<>())
        .def_readwrite("warnings", &beamlab::WarningList::warnings)
        .def("add", py::overload_cast<const beamlab::BeamlabWarning&>(
                 &beamlab::WarningList::add),
             py::arg("warning"))
        .def("has_warnings", &beamlab::WarningList::has_warnings)
        .def("count", &beamlab::WarningList::count)
        .def("contains", &beamlab::WarningList::contains, py::arg("code"))
        .def("count_by_severity", &beamlab::WarningList::count_by_severity,
             py::arg("severity"))
        .def("clear", &beamlab::WarningList::clear)
        .def("summary", &beamlab::WarningList::summary)
        .def("__len__", &beamlab::WarningList::count)
        .def("__bool__", &beamlab::WarningList::has_warnings)
        .def("__iter__", [](const beamlab::WarningList &wl) {
            return py::make_iterator(wl.warnings.begin(), wl.warnings.end());
        }, py::keep_alive<0, 1>())
        .def("__repr__", [](const beamlab::WarningList &wl) {
            return "<WarningList: " + wl.summary() + ">";
        });

    // ========================================================================
    // Section & Material
    // ========================================================================

    py::enum_<beamlab::SectionShape>(m, "SectionShape", "Cross-section shape")
        .value("Rectangular", beamlab::SectionShape::Rectangular)
        .value("Circular", beamlab::SectionShape::Circular)
        .value("IBeam", beamlab::SectionShape::IBeam)
        .export_values();

    py::class_<beamlab::SectionDescriptor>(m, "SectionDescriptor",
        "Cross-section shape descriptor (dimensions in m)")
        .def(py::init<>())
        .def_readwrite("shape", &beamlab::SectionDescriptor::shape)
        .def_readwrite("height", &beamlab::SectionDescriptor::height,
                       "Overall depth, or diameter for circular [m]")
        .def_readwrite("width", &beamlab::SectionDescriptor::width, "Rectangle width [m]")
        .def_readwrite("flange_width", &beamlab::SectionDescriptor::flange_width)
        .def_readwrite("flange_thickness", &beamlab::SectionDescriptor::flange_thickness)
        .def_readwrite("web_thickness", &beamlab::SectionDescriptor::web_thickness)
        .def_static("rectangular", &beamlab::SectionDescriptor::rectangular,
                    py::arg("width"), py::arg("height"))
        .def_static("circular", &beamlab::SectionDescriptor::circular, py::arg("diameter"))
        .def_static("i_beam", &beamlab::SectionDescriptor::i_beam,
                    py::arg("height"), py::arg("flange_width"),
                    py::arg("flange_thickness"), py::arg("web_thickness"))
        .def("__repr__", [](const beamlab::SectionDescriptor &s) {
            return "<SectionDescriptor " + beamlab::section_shape_to_string(s.shape) +
                   " h=" + std::to_string(s.height) + ">";
        });

    py::class_<beamlab::SectionProperties>(m, "SectionProperties",
        "Geometric properties of a cross-section")
        .def(py::init<>())
        .def_readwrite("I", &beamlab::SectionProperties::I, "Second moment of area [m^4]")
        .def_readwrite("A", &beamlab::SectionProperties::A, "Area [m^2]")
        .def_readwrite("depth", &beamlab::SectionProperties::depth, "Overall depth [m]")
        .def_readwrite("solid_fallback", &beamlab::SectionProperties::solid_fallback)
        .def("fibre_distance", &beamlab::SectionProperties::fibre_distance)
        .def("section_modulus", &beamlab::SectionProperties::section_modulus)
        .def("__repr__", [](const beamlab::SectionProperties &p) {
            return "<SectionProperties I=" + std::to_string(p.I) +
                   " A=" + std::to_string(p.A) + ">";
        });

    m.def("compute_section_properties",
          [](const beamlab::SectionDescriptor &section) {
              beamlab::WarningList warnings;
              auto props = beamlab::compute_section_properties(section, &warnings);
              return py::make_tuple(props, warnings);
          },
          py::arg("section"),
          "Compute I and area. Returns (SectionProperties, WarningList).");

    py::class_<beamlab::Material>(m, "Material", "Linear elastic material")
        .def(py::init<std::string, double, double>(),
             py::arg("name"), py::arg("E"), py::arg("fy"))
        .def_readwrite("name", &beamlab::Material::name)
        .def_readwrite("E", &beamlab::Material::E, "Young's modulus [Pa]")
        .def_readwrite("fy", &beamlab::Material::fy, "Yield strength [Pa]")
        .def_static("steel", &beamlab::Material::steel)
        .def_static("aluminum", &beamlab::Material::aluminum)
        .def_static("wood", &beamlab::Material::wood)
        .def("__repr__", [](const beamlab::Material &mat) {
            return "<Material '" + mat.name + "' E=" + std::to_string(mat.E) +
                   " fy=" + std::to_string(mat.fy) + ">";
        });

    // ========================================================================
    // Loads & Configuration
    // ========================================================================

    py::enum_<beamlab::PeakSide>(m, "PeakSide", "End of a triangular load with the peak")
        .value("Left", beamlab::PeakSide::Left)
        .value("Right", beamlab::PeakSide::Right)
        .export_values();

    py::enum_<beamlab::LoadType>(m, "LoadType", "Load primitive type")
        .value("Point", beamlab::LoadType::Point)
        .value("Uniform", beamlab::LoadType::Uniform)
        .value("Triangular", beamlab::LoadType::Triangular)
        .value("Moment", beamlab::LoadType::Moment)
        .export_values();

    py::class_<beamlab::PointLoad>(m, "PointLoad")
        .def(py::init<>())
        .def_readwrite("x", &beamlab::PointLoad::x)
        .def_readwrite("magnitude", &beamlab::PointLoad::magnitude);

    py::class_<beamlab::UniformLoad>(m, "UniformLoad")
        .def(py::init<>())
        .def_readwrite("x1", &beamlab::UniformLoad::x1)
        .def_readwrite("x2", &beamlab::UniformLoad::x2)
        .def_readwrite("magnitude", &beamlab::UniformLoad::magnitude);

    py::class_<beamlab::TriangularLoad>(m, "TriangularLoad")
        .def(py::init<>())
        .def_readwrite("x1", &beamlab::TriangularLoad::x1)
        .def_readwrite("x2", &beamlab::TriangularLoad::x2)
        .def_readwrite("peak", &beamlab::TriangularLoad::peak)
        .def_readwrite("peak_side", &beamlab::TriangularLoad::peak_side);

    py::class_<beamlab::AppliedMoment>(m, "AppliedMoment")
        .def(py::init<>())
        .def_readwrite("x", &beamlab::AppliedMoment::x)
        .def_readwrite("magnitude", &beamlab::AppliedMoment::magnitude);

    py::class_<beamlab::LoadDefinition>(m, "LoadDefinition",
        "Labelled load primitive (upward forces and counter-clockwise moments positive)")
        .def_readwrite("label", &beamlab::LoadDefinition::label)
        .def_readwrite("load", &beamlab::LoadDefinition::load)
        .def_static("point", &beamlab::LoadDefinition::point,
                    py::arg("x"), py::arg("magnitude"), py::arg("label") = "")
        .def_static("uniform", &beamlab::LoadDefinition::uniform,
                    py::arg("x1"), py::arg("x2"), py::arg("magnitude"), py::arg("label") = "")
        .def_static("triangular", &beamlab::LoadDefinition::triangular,
                    py::arg("x1"), py::arg("x2"), py::arg("peak"), py::arg("side"),
                    py::arg("label") = "")
        .def_static("moment", &beamlab::LoadDefinition::moment,
                    py::arg("x"), py::arg("magnitude"), py::arg("label") = "")
        .def("type", &beamlab::LoadDefinition::type)
        .def("resultant_force", &beamlab::LoadDefinition::resultant_force)
        .def("moment_about", &beamlab::LoadDefinition::moment_about, py::arg("pivot"))
        .def("intensity_at", &beamlab::LoadDefinition::intensity_at, py::arg("x"))
        .def("__repr__", [](const beamlab::LoadDefinition &l) {
            return "<LoadDefinition " + beamlab::load_type_to_string(l.type()) +
                   " '" + l.label + "'>";
        });

    py::enum_<beamlab::BoundaryCondition>(m, "BoundaryCondition", "Beam support arrangement")
        .value("Cantilever", beamlab::BoundaryCondition::Cantilever)
        .value("SimplySupported", beamlab::BoundaryCondition::SimplySupported)
        .value("Overhanging", beamlab::BoundaryCondition::Overhanging)
        .export_values();

    py::class_<beamlab::BeamConfig>(m, "BeamConfig", "Complete input for a beam analysis")
        .def(py::init<>())
        .def_readwrite("length", &beamlab::BeamConfig::length, "Beam length [m]")
        .def_readwrite("boundary", &beamlab::BeamConfig::boundary)
        .def_readwrite("support_a", &beamlab::BeamConfig::support_a)
        .def_readwrite("support_b", &beamlab::BeamConfig::support_b)
        .def_readwrite("material", &beamlab::BeamConfig::material)
        .def_readwrite("section", &beamlab::BeamConfig::section)
        .def_readwrite("force", &beamlab::BeamConfig::force, "Base point load [N]")
        .def_readwrite("load_position", &beamlab::BeamConfig::load_position)
        .def_readwrite("custom_loads", &beamlab::BeamConfig::custom_loads)
        .def("validate", &beamlab::BeamConfig::validate);

    // ========================================================================
    // Results
    // ========================================================================

    py::class_<beamlab::ReactionSet>(m, "ReactionSet", "Support reactions")
        .def(py::init<>())
        .def_readonly("Ra", &beamlab::ReactionSet::Ra)
        .def_readonly("Rb", &beamlab::ReactionSet::Rb)
        .def_readonly("Ma", &beamlab::ReactionSet::Ma)
        .def_readonly("support_a", &beamlab::ReactionSet::support_a)
        .def_readonly("support_b", &beamlab::ReactionSet::support_b)
        .def_readonly("degenerate", &beamlab::ReactionSet::degenerate)
        .def("force_residual", &beamlab::ReactionSet::force_residual, py::arg("loads"))
        .def("moment_residual", &beamlab::ReactionSet::moment_residual,
             py::arg("loads"), py::arg("pivot"))
        .def("__repr__", [](const beamlab::ReactionSet &r) {
            return "<ReactionSet Ra=" + std::to_string(r.Ra) + " Rb=" + std::to_string(r.Rb) +
                   " Ma=" + std::to_string(r.Ma) + ">";
        });

    py::class_<beamlab::FieldSample>(m, "FieldSample", "Closed-form response at one point")
        .def_readonly("x", &beamlab::FieldSample::x)
        .def_readonly("y", &beamlab::FieldSample::y)
        .def_readonly("deflection", &beamlab::FieldSample::deflection)
        .def_readonly("slope", &beamlab::FieldSample::slope)
        .def_readonly("moment", &beamlab::FieldSample::moment)
        .def_readonly("stress", &beamlab::FieldSample::stress)
        .def_readonly("displaced", &beamlab::FieldSample::displaced);

    py::class_<beamlab::MeshCell>(m, "MeshCell")
        .def_readonly("node_ids", &beamlab::MeshCell::node_ids)
        .def_readonly("avg_stress", &beamlab::MeshCell::avg_stress);

    py::class_<beamlab::FieldMesh>(m, "FieldMesh", "Deformed, stress-colored grid")
        .def_readonly("density_x", &beamlab::FieldMesh::density_x)
        .def_readonly("density_y", &beamlab::FieldMesh::density_y)
        .def_readonly("nodes", &beamlab::FieldMesh::nodes)
        .def_readonly("cells", &beamlab::FieldMesh::cells)
        .def("node", &beamlab::FieldMesh::node, py::arg("i"), py::arg("j"),
             py::return_value_policy::reference_internal);

    py::class_<beamlab::MeshOptions>(m, "MeshOptions")
        .def(py::init<>())
        .def_readwrite("density_x", &beamlab::MeshOptions::density_x)
        .def_readwrite("density_y", &beamlab::MeshOptions::density_y)
        .def_readwrite("deformation_scale", &beamlab::MeshOptions::deformation_scale);

    py::class_<beamlab::FieldStatistics>(m, "FieldStatistics")
        .def_readonly("max_stress", &beamlab::FieldStatistics::max_stress)
        .def_readonly("max_deflection", &beamlab::FieldStatistics::max_deflection);

    py::class_<beamlab::ActionExtreme>(m, "ActionExtreme")
        .def_readonly("x", &beamlab::ActionExtreme::x)
        .def_readonly("value", &beamlab::ActionExtreme::value);

    py::class_<beamlab::InternalActions>(m, "InternalActions", "V and M at a position")
        .def(py::init<>())
        .def(py::init<double, double, double>(), py::arg("x"), py::arg("V"), py::arg("M"))
        .def_readwrite("x", &beamlab::InternalActions::x)
        .def_readwrite("V", &beamlab::InternalActions::V)
        .def_readwrite("M", &beamlab::InternalActions::M)
        .def("__repr__", [](const beamlab::InternalActions &a) {
            return "<InternalActions x=" + std::to_string(a.x) + " V=" + std::to_string(a.V) +
                   " M=" + std::to_string(a.M) + ">";
        });

    py::class_<beamlab::DiagramData>(m, "DiagramData", "Sampled shear and moment diagrams")
        .def_readonly("xs", &beamlab::DiagramData::xs)
        .def_readonly("shear", &beamlab::DiagramData::shear)
        .def_readonly("moment", &beamlab::DiagramData::moment)
        .def("max_shear", &beamlab::DiagramData::max_shear)
        .def("max_moment", &beamlab::DiagramData::max_moment)
        .def("at", &beamlab::DiagramData::at, py::arg("i"))
        .def("__len__", &beamlab::DiagramData::size);

    py::class_<beamlab::SegmentPolynomial>(m, "SegmentPolynomial",
        "V(x) and M(x) coefficients in ascending powers")
        .def_property_readonly("shear_coefficients",
                               &beamlab::SegmentPolynomial::shear_coefficients)
        .def_property_readonly("moment_coefficients",
                               &beamlab::SegmentPolynomial::moment_coefficients)
        .def("shear_at", &beamlab::SegmentPolynomial::shear_at, py::arg("x"))
        .def("moment_at", &beamlab::SegmentPolynomial::moment_at, py::arg("x"))
        .def("at", &beamlab::SegmentPolynomial::at, py::arg("x"));

    py::class_<beamlab::PiecewiseSegment>(m, "PiecewiseSegment",
        "Sub-interval with exact V(x) and M(x) polynomials")
        .def_readonly("x_start", &beamlab::PiecewiseSegment::x_start)
        .def_readonly("x_end", &beamlab::PiecewiseSegment::x_end)
        .def_readonly("polynomial", &beamlab::PiecewiseSegment::polynomial)
        .def_readonly("shear_expression", &beamlab::PiecewiseSegment::shear_expression)
        .def_readonly("moment_expression", &beamlab::PiecewiseSegment::moment_expression)
        .def("shear_at", [](const beamlab::PiecewiseSegment &s, double x) {
            return s.polynomial.shear_at(x);
        }, py::arg("x"))
        .def("moment_at", [](const beamlab::PiecewiseSegment &s, double x) {
            return s.polynomial.moment_at(x);
        }, py::arg("x"))
        .def("__repr__", [](const beamlab::PiecewiseSegment &s) {
            return "<PiecewiseSegment [" + std::to_string(s.x_start) + ", " +
                   std::to_string(s.x_end) + ") V=" + s.shear_expression +
                   " M=" + s.moment_expression + ">";
        });

    py::enum_<beamlab::SafetyRating>(m, "SafetyRating")
        .value("Unsafe", beamlab::SafetyRating::Unsafe)
        .value("Marginal", beamlab::SafetyRating::Marginal)
        .value("Adequate", beamlab::SafetyRating::Adequate)
        .export_values();

    py::class_<beamlab::DesignCheck>(m, "DesignCheck", "Strength and serviceability check")
        .def_readonly("max_stress", &beamlab::DesignCheck::max_stress)
        .def_readonly("max_deflection", &beamlab::DesignCheck::max_deflection)
        .def_readonly("safety_factor", &beamlab::DesignCheck::safety_factor)
        .def_readonly("rating", &beamlab::DesignCheck::rating)
        .def_readonly("allowable_deflection", &beamlab::DesignCheck::allowable_deflection)
        .def_readonly("deflection_ratio", &beamlab::DesignCheck::deflection_ratio)
        .def_readonly("deflection_ok", &beamlab::DesignCheck::deflection_ok)
        .def("passes", &beamlab::DesignCheck::passes);

    py::class_<beamlab::FibreStress>(m, "FibreStress")
        .def_readonly("top", &beamlab::FibreStress::top)
        .def_readonly("bottom", &beamlab::FibreStress::bottom);

    m.def("extreme_fibre_stresses", &beamlab::extreme_fibre_stresses,
          py::arg("moment"), py::arg("section"),
          "Top and bottom fibre stresses for a bending moment (tension positive)");

    // ========================================================================
    // Analysis stages
    // ========================================================================

    m.def("resolve_loads",
          [](const beamlab::BeamConfig &config) {
              beamlab::WarningList warnings;
              auto loads = beamlab::resolve_loads(config.load_spec(), config.length, &warnings);
              return py::make_tuple(loads, warnings);
          },
          py::arg("config"),
          "Resolve the load specification of a beam. Returns (loads, WarningList).");

    m.def("solve_reactions",
          [](const beamlab::BeamConfig &config,
             const std::vector<beamlab::LoadDefinition> &loads) {
              beamlab::WarningList warnings;
              auto reactions = beamlab::solve_reactions(config, loads, &warnings);
              return py::make_tuple(reactions, warnings);
          },
          py::arg("config"), py::arg("loads"),
          "Static equilibrium reactions. Returns (ReactionSet, WarningList).");

    m.def("verify_equilibrium", &beamlab::verify_equilibrium,
          py::arg("reactions"), py::arg("loads"), py::arg("length"),
          "Raise InvariantError if the reactions do not balance the loads");

    py::class_<beamlab::BeamFieldSolver>(m, "BeamFieldSolver",
        "Closed-form response of a beam under its base point load")
        .def(py::init([](const beamlab::BeamConfig &config,
                         const beamlab::SectionProperties &section) {
                 return beamlab::BeamFieldSolver(config, section);
             }),
             py::arg("config"), py::arg("section"))
        .def("evaluate", &beamlab::BeamFieldSolver::evaluate,
             py::arg("x"), py::arg("y"), py::arg("scale") = 1.0)
        .def("deflection", &beamlab::BeamFieldSolver::deflection, py::arg("x"))
        .def("slope", &beamlab::BeamFieldSolver::slope, py::arg("x"))
        .def("moment", &beamlab::BeamFieldSolver::moment, py::arg("x"))
        .def("build_mesh", &beamlab::BeamFieldSolver::build_mesh,
             py::arg("options") = beamlab::MeshOptions{})
        .def("load_position", &beamlab::BeamFieldSolver::load_position)
        .def("has_closed_form", &beamlab::BeamFieldSolver::has_closed_form);

    m.def("compute_field_statistics", &beamlab::compute_field_statistics, py::arg("mesh"));

    m.def("integrate_diagrams", &beamlab::integrate_diagrams,
          py::arg("config"), py::arg("loads"), py::arg("reactions"), py::arg("n") = 400,
          "Numeric shear/moment sweep over n + 1 stations");

    m.def("segment_boundaries", &beamlab::segment_boundaries,
          py::arg("config"), py::arg("loads"), py::arg("reactions"));

    m.def("build_piecewise_segments", &beamlab::build_piecewise_segments,
          py::arg("config"), py::arg("loads"), py::arg("reactions"),
          "Exact per-segment V(x) and M(x) covering [0, L]");

    m.def("find_segment",
          [](const std::vector<beamlab::PiecewiseSegment> &segments, double x) -> py::object {
              const auto* seg = beamlab::find_segment(segments, x);
              if (!seg) return py::none();
              return py::cast(*seg);
          },
          py::arg("segments"), py::arg("x"),
          "Segment containing x, or None outside [0, L]");

    m.def("format_polynomial", &beamlab::format_polynomial, py::arg("coefficients"));

    m.def("rate_safety_factor", &beamlab::rate_safety_factor, py::arg("safety_factor"));

    m.def("evaluate_design",
          [](const beamlab::BeamConfig &config, const beamlab::FieldStatistics &stats) {
              beamlab::WarningList warnings;
              auto check = beamlab::evaluate_design(config, stats, &warnings);
              return py::make_tuple(check, warnings);
          },
          py::arg("config"), py::arg("stats"),
          "Safety factor and deflection check. Returns (DesignCheck, WarningList).");

    m.def("format_summary", &beamlab::format_summary,
          py::arg("case_name"), py::arg("config"), py::arg("check"));

    // ========================================================================
    // Bearing
    // ========================================================================

    py::class_<beamlab::BearingConfig>(m, "BearingConfig", "Radial ball bearing")
        .def(py::init<>())
        .def_readwrite("outer_radius", &beamlab::BearingConfig::outer_radius)
        .def_readwrite("inner_radius", &beamlab::BearingConfig::inner_radius)
        .def_readwrite("ball_count", &beamlab::BearingConfig::ball_count)
        .def_readwrite("radial_load", &beamlab::BearingConfig::radial_load)
        .def("pitch_radius", &beamlab::BearingConfig::pitch_radius)
        .def("ball_radius", &beamlab::BearingConfig::ball_radius);

    py::class_<beamlab::BearingElement>(m, "BearingElement", "Rolling element with its load")
        .def_readonly("angle", &beamlab::BearingElement::angle)
        .def_readonly("load", &beamlab::BearingElement::load)
        .def_readonly("max_stress", &beamlab::BearingElement::max_stress)
        .def_readonly("deformation", &beamlab::BearingElement::deformation)
        .def_readonly("center", &beamlab::BearingElement::center)
        .def_readonly("radius", &beamlab::BearingElement::radius);

    py::class_<beamlab::StressPoint>(m, "StressPoint")
        .def_readonly("position", &beamlab::StressPoint::position)
        .def_readonly("stress", &beamlab::StressPoint::stress);

    m.def("max_ball_load", &beamlab::max_ball_load, py::arg("config"));
    m.def("load_zone_angle", &beamlab::load_zone_angle, py::arg("theta"));

    m.def("distribute_bearing_load", &beamlab::distribute_bearing_load, py::arg("config"),
          "Stribeck load distribution over the balls");

    m.def("generate_ball_stress_field", &beamlab::generate_ball_stress_field,
          py::arg("element"), py::arg("resolution") = 8,
          "Interior stress points of one ball");

    // ========================================================================
    // Analysis
    // ========================================================================

    py::class_<beamlab::AnalysisOptions>(m, "AnalysisOptions")
        .def(py::init<>())
        .def_readwrite("case_name", &beamlab::AnalysisOptions::case_name)
        .def_readwrite("mesh", &beamlab::AnalysisOptions::mesh)
        .def_readwrite("diagram_samples", &beamlab::AnalysisOptions::diagram_samples);

    py::class_<beamlab::BeamAnalysisResult>(m, "BeamAnalysisResult")
        .def_readonly("section", &beamlab::BeamAnalysisResult::section)
        .def_readonly("loads", &beamlab::BeamAnalysisResult::loads)
        .def_readonly("reactions", &beamlab::BeamAnalysisResult::reactions)
        .def_readonly("mesh", &beamlab::BeamAnalysisResult::mesh)
        .def_readonly("statistics", &beamlab::BeamAnalysisResult::statistics)
        .def_readonly("diagrams", &beamlab::BeamAnalysisResult::diagrams)
        .def_readonly("segments", &beamlab::BeamAnalysisResult::segments)
        .def_readonly("check", &beamlab::BeamAnalysisResult::check)
        .def_readonly("summary", &beamlab::BeamAnalysisResult::summary)
        .def_readonly("warnings", &beamlab::BeamAnalysisResult::warnings);

    py::class_<beamlab::BearingAnalysisResult>(m, "BearingAnalysisResult")
        .def_readonly("elements", &beamlab::BearingAnalysisResult::elements)
        .def_readonly("stress_fields", &beamlab::BearingAnalysisResult::stress_fields)
        .def_readonly("max_ball_load", &beamlab::BearingAnalysisResult::max_ball_load);

    m.def("analyze_beam", &beamlab::analyze_beam,
          py::arg("config"), py::arg("options") = beamlab::AnalysisOptions{},
          "Run the complete beam pipeline");

    m.def("analyze_bearing", &beamlab::analyze_bearing,
          py::arg("config"), py::arg("resolution") = 8,
          "Distribute the bearing load and generate every ball stress field");

    py::class_<beamlab::Analyzer>(m, "Analyzer", "Memoizing front end for repeated analyses")
        .def(py::init<>())
        // Python receives its own copy of the memoized snapshot
        .def("beam",
             [](beamlab::Analyzer& self, const beamlab::BeamConfig& config,
                const beamlab::AnalysisOptions& options) {
                 return beamlab::BeamAnalysisResult(*self.beam(config, options));
             },
             py::arg("config"), py::arg("options") = beamlab::AnalysisOptions{})
        .def("bearing",
             [](beamlab::Analyzer& self, const beamlab::BearingConfig& config, int resolution) {
                 return beamlab::BearingAnalysisResult(*self.bearing(config, resolution));
             },
             py::arg("config"), py::arg("resolution") = 8)
        .def("evaluation_count", &beamlab::Analyzer::evaluation_count)
        .def("clear", &beamlab::Analyzer::clear);
}
