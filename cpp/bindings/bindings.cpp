#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/eigen.h>

#include "steelcheck/errors.hpp"
#include "steelcheck/warnings.hpp"
#include "steelcheck/design_config.hpp"
#include "steelcheck/material.hpp"
#include "steelcheck/section.hpp"
#include "steelcheck/section_catalog.hpp"
#include "steelcheck/verification_result.hpp"
#include "steelcheck/load_combinations.hpp"
#include "steelcheck/flexure.hpp"
#include "steelcheck/shear.hpp"
#include "steelcheck/compression.hpp"
#include "steelcheck/interaction.hpp"
#include "steelcheck/deflection.hpp"
#include "steelcheck/member_checks.hpp"
#include "steelcheck/bolts.hpp"
#include "steelcheck/demand.hpp"
#include "steelcheck/recommendation.hpp"
#include "steelcheck/frame_verification.hpp"

#include <sstream>

namespace py = pybind11;
namespace sc = steelcheck;

/**
 * SteelCheck C++ Python bindings module.
 * Exposes catalogs, checks and result types to the request/report layer.
 */
PYBIND11_MODULE(_steelcheck_cpp, m) {
    m.doc() = "SteelCheck C++ core module - AISC 360 member and connection checks";

    m.attr("__version__") = "1.0.0";

    // ========================================================================
    // Errors and warnings
    // ========================================================================

    py::enum_<sc::ErrorCode>(m, "ErrorCode", "Machine-readable error codes")
        .value("OK", sc::ErrorCode::OK)
        .value("SECTION_NOT_FOUND", sc::ErrorCode::SECTION_NOT_FOUND)
        .value("MATERIAL_NOT_FOUND", sc::ErrorCode::MATERIAL_NOT_FOUND)
        .value("BOLT_GRADE_NOT_FOUND", sc::ErrorCode::BOLT_GRADE_NOT_FOUND)
        .value("BOLT_DIAMETER_NOT_FOUND", sc::ErrorCode::BOLT_DIAMETER_NOT_FOUND)
        .value("NODE_NOT_FOUND", sc::ErrorCode::NODE_NOT_FOUND)
        .value("INVALID_PROPERTY", sc::ErrorCode::INVALID_PROPERTY)
        .value("INVALID_DEMAND", sc::ErrorCode::INVALID_DEMAND)
        .value("INVALID_GEOMETRY", sc::ErrorCode::INVALID_GEOMETRY)
        .value("INVALID_LOAD_TYPE", sc::ErrorCode::INVALID_LOAD_TYPE)
        .value("UNSUPPORTED_CONFIGURATION", sc::ErrorCode::UNSUPPORTED_CONFIGURATION)
        .export_values();

    py::class_<sc::CheckError>(m, "CheckError",
        "Structured error information with machine-readable code and offending field")
        .def(py::init<>(), "Create OK (no error) status")
        .def(py::init<sc::ErrorCode, const std::string&>(),
             py::arg("code"), py::arg("message"))
        .def_readwrite("code", &sc::CheckError::code, "Error code")
        .def_readwrite("message", &sc::CheckError::message, "Error message")
        .def_readwrite("field", &sc::CheckError::field, "Offending input field")
        .def_readwrite("value", &sc::CheckError::value, "Offending value")
        .def_readwrite("details", &sc::CheckError::details, "Additional details")
        .def_readwrite("suggestion", &sc::CheckError::suggestion, "Suggested fix")
        .def("is_ok", &sc::CheckError::is_ok)
        .def("is_not_found", &sc::CheckError::is_not_found)
        .def("is_validation", &sc::CheckError::is_validation)
        .def("code_string", &sc::CheckError::code_string)
        .def("to_string", &sc::CheckError::to_string)
        .def("__repr__", [](const sc::CheckError& e) {
            return "<CheckError " + e.code_string() + ": " + e.message + ">";
        });

    py::register_exception<sc::CheckException>(m, "CheckException", PyExc_ValueError);

    py::enum_<sc::WarningCode>(m, "WarningCode", "Machine-readable warning codes")
        .value("INCONSISTENT_SECTION", sc::WarningCode::INCONSISTENT_SECTION)
        .value("NONCOMPACT_FLANGE", sc::WarningCode::NONCOMPACT_FLANGE)
        .value("SLENDER_FLANGE", sc::WarningCode::SLENDER_FLANGE)
        .value("WEB_SHEAR_BUCKLING", sc::WarningCode::WEB_SHEAR_BUCKLING)
        .value("SLENDERNESS_LIMIT", sc::WarningCode::SLENDERNESS_LIMIT)
        .value("LARGE_UNBRACED_LENGTH", sc::WarningCode::LARGE_UNBRACED_LENGTH)
        .value("ZERO_DEMAND", sc::WarningCode::ZERO_DEMAND)
        .export_values();

    py::enum_<sc::WarningSeverity>(m, "WarningSeverity")
        .value("Low", sc::WarningSeverity::Low)
        .value("Medium", sc::WarningSeverity::Medium)
        .value("High", sc::WarningSeverity::High)
        .export_values();

    py::class_<sc::CheckWarning>(m, "CheckWarning", "Non-fatal observation made by a check")
        .def_readonly("code", &sc::CheckWarning::code)
        .def_readonly("severity", &sc::CheckWarning::severity)
        .def_readonly("message", &sc::CheckWarning::message)
        .def_readonly("details", &sc::CheckWarning::details)
        .def_readonly("suggestion", &sc::CheckWarning::suggestion)
        .def("code_string", &sc::CheckWarning::code_string)
        .def("to_string", &sc::CheckWarning::to_string)
        .def("__repr__", [](const sc::CheckWarning& w) {
            return "<CheckWarning " + w.code_string() + ": " + w.message + ">";
        });

    py::class_<sc::WarningList>(m, "WarningList")
        .def(py::init<>())
        .def_readonly("warnings", &sc::WarningList::warnings)
        .def("has_warnings", &sc::WarningList::has_warnings)
        .def("count", &sc::WarningList::count)
        .def("contains", &sc::WarningList::contains, py::arg("code"))
        .def("summary", &sc::WarningList::summary)
        .def("__len__", &sc::WarningList::count);

    // ========================================================================
    // Configuration
    // ========================================================================

    py::enum_<sc::DesignMethod>(m, "DesignMethod")
        .value("LRFD", sc::DesignMethod::LRFD, "capacity = phi * Rn")
        .value("ASD", sc::DesignMethod::ASD, "capacity = Rn / Omega")
        .export_values();

    py::enum_<sc::KFactorFallback>(m, "KFactorFallback")
        .value("Reject", sc::KFactorFallback::Reject)
        .value("Conservative", sc::KFactorFallback::Conservative)
        .export_values();

    py::class_<sc::DesignConfig>(m, "DesignConfig", "Options shared by all checks")
        .def(py::init<>())
        .def_readwrite("method", &sc::DesignConfig::method)
        .def_readwrite("tolerance", &sc::DesignConfig::tolerance)
        .def_readwrite("k_factor_fallback", &sc::DesignConfig::k_factor_fallback)
        .def("__repr__", [](const sc::DesignConfig& c) {
            return "<DesignConfig method=" + sc::design_method_to_string(c.method) + ">";
        });

    m.def("parse_design_method", &sc::parse_design_method, py::arg("method"));

    // ========================================================================
    // Materials and sections
    // ========================================================================

    py::class_<sc::SteelMaterial>(m, "SteelMaterial", "Steel grade properties [MPa]")
        .def(py::init<std::string, std::string, double, double, double, double, double, double>(),
             py::arg("id"), py::arg("name"), py::arg("Fy"), py::arg("Fu"),
             py::arg("E") = 200000.0, py::arg("G") = 77000.0,
             py::arg("nu") = 0.3, py::arg("rho") = 7850.0)
        .def_readwrite("id", &sc::SteelMaterial::id)
        .def_readwrite("name", &sc::SteelMaterial::name)
        .def_readwrite("description", &sc::SteelMaterial::description)
        .def_readwrite("Fy", &sc::SteelMaterial::Fy, "Yield stress [MPa]")
        .def_readwrite("Fu", &sc::SteelMaterial::Fu, "Tensile strength [MPa]")
        .def_readwrite("E", &sc::SteelMaterial::E, "Young's modulus [MPa]")
        .def_readwrite("G", &sc::SteelMaterial::G, "Shear modulus [MPa]")
        .def_readwrite("nu", &sc::SteelMaterial::nu)
        .def_readwrite("rho", &sc::SteelMaterial::rho, "Density [kg/m³]")
        .def("validate", &sc::SteelMaterial::validate)
        .def("__repr__", [](const sc::SteelMaterial& mat) {
            std::ostringstream oss;
            oss << "<SteelMaterial " << mat.id << " Fy=" << mat.Fy << " Fu=" << mat.Fu << ">";
            return oss.str();
        });

    py::class_<sc::MaterialCatalog>(m, "MaterialCatalog")
        .def(py::init<>())
        .def("add", &sc::MaterialCatalog::add, py::arg("material"))
        .def("get", &sc::MaterialCatalog::get, py::arg("id"),
             py::return_value_policy::reference_internal)
        .def("contains", &sc::MaterialCatalog::contains, py::arg("id"))
        .def("ids", &sc::MaterialCatalog::ids)
        .def("__len__", &sc::MaterialCatalog::size);

    m.def("default_materials", &sc::default_materials, py::return_value_policy::reference);

    py::enum_<sc::SectionType>(m, "SectionType")
        .value("WideFlange", sc::SectionType::WideFlange)
        .value("RectangularHollow", sc::SectionType::RectangularHollow)
        .value("RoundHollow", sc::SectionType::RoundHollow)
        .value("Channel", sc::SectionType::Channel)
        .value("Angle", sc::SectionType::Angle)
        .export_values();

    py::enum_<sc::CatalogOrigin>(m, "CatalogOrigin")
        .value("AISC", sc::CatalogOrigin::AISC)
        .value("Chilean", sc::CatalogOrigin::Chilean)
        .export_values();

    m.def("parse_section_type", &sc::parse_section_type, py::arg("tag"));

    py::class_<sc::SteelSection>(m, "SteelSection", "Cross-section properties [mm]")
        .def(py::init<std::string, sc::SectionType, sc::CatalogOrigin, double, double, double>(),
             py::arg("id"), py::arg("type"), py::arg("origin"),
             py::arg("A"), py::arg("Ix"), py::arg("Iy"))
        .def_readwrite("id", &sc::SteelSection::id)
        .def_readwrite("type", &sc::SteelSection::type)
        .def_readwrite("origin", &sc::SteelSection::origin)
        .def_readwrite("d", &sc::SteelSection::d)
        .def_readwrite("bf", &sc::SteelSection::bf)
        .def_readwrite("tf", &sc::SteelSection::tf)
        .def_readwrite("tw", &sc::SteelSection::tw)
        .def_readwrite("t", &sc::SteelSection::t)
        .def_readwrite("A", &sc::SteelSection::A)
        .def_readwrite("Ix", &sc::SteelSection::Ix)
        .def_readwrite("Iy", &sc::SteelSection::Iy)
        .def_readwrite("Sx", &sc::SteelSection::Sx)
        .def_readwrite("Sy", &sc::SteelSection::Sy)
        .def_readwrite("Zx", &sc::SteelSection::Zx)
        .def_readwrite("Zy", &sc::SteelSection::Zy)
        .def_readwrite("J", &sc::SteelSection::J)
        .def_readwrite("Cw", &sc::SteelSection::Cw)
        .def_readwrite("weight", &sc::SteelSection::weight)
        .def_readwrite("catalog_rx", &sc::SteelSection::catalog_rx)
        .def_readwrite("catalog_ry", &sc::SteelSection::catalog_ry)
        .def("set_plate_dimensions", &sc::SteelSection::set_plate_dimensions,
             py::arg("d"), py::arg("bf"), py::arg("tf"), py::arg("tw"))
        .def("set_moduli", &sc::SteelSection::set_moduli,
             py::arg("Sx"), py::arg("Sy"), py::arg("Zx"), py::arg("Zy"))
        .def("set_torsion", &sc::SteelSection::set_torsion, py::arg("J"), py::arg("Cw"))
        .def("rx", &sc::SteelSection::rx)
        .def("ry", &sc::SteelSection::ry)
        .def("validate", &sc::SteelSection::validate)
        .def_static("welded_i", &sc::SteelSection::welded_i,
                    py::arg("id"), py::arg("origin"), py::arg("d"), py::arg("bf"),
                    py::arg("tf"), py::arg("tw"))
        .def_static("channel", &sc::SteelSection::channel,
                    py::arg("id"), py::arg("origin"), py::arg("d"), py::arg("bf"),
                    py::arg("tf"), py::arg("tw"))
        .def_static("rectangular_hollow", &sc::SteelSection::rectangular_hollow,
                    py::arg("id"), py::arg("origin"), py::arg("H"), py::arg("B"), py::arg("t"))
        .def_static("round_hollow", &sc::SteelSection::round_hollow,
                    py::arg("id"), py::arg("origin"), py::arg("OD"), py::arg("t"))
        .def_static("equal_angle", &sc::SteelSection::equal_angle,
                    py::arg("id"), py::arg("origin"), py::arg("b"), py::arg("t"))
        .def("__repr__", [](const sc::SteelSection& s) {
            std::ostringstream oss;
            oss << "<SteelSection " << s.id << " " << sc::section_type_to_string(s.type)
                << " A=" << s.A << " mm²>";
            return oss.str();
        });

    py::class_<sc::SectionFilter>(m, "SectionFilter", "Optional bounds for catalog search")
        .def(py::init<>())
        .def_readwrite("type", &sc::SectionFilter::type)
        .def_readwrite("origin", &sc::SectionFilter::origin)
        .def_readwrite("d_min", &sc::SectionFilter::d_min)
        .def_readwrite("d_max", &sc::SectionFilter::d_max)
        .def_readwrite("weight_min", &sc::SectionFilter::weight_min)
        .def_readwrite("weight_max", &sc::SectionFilter::weight_max)
        .def_readwrite("Ix_min", &sc::SectionFilter::Ix_min)
        .def_readwrite("Iy_min", &sc::SectionFilter::Iy_min)
        .def_readwrite("Zx_min", &sc::SectionFilter::Zx_min)
        .def_readwrite("rx_min", &sc::SectionFilter::rx_min)
        .def_readwrite("ry_min", &sc::SectionFilter::ry_min)
        .def_readwrite("limit", &sc::SectionFilter::limit);

    py::class_<sc::SectionCatalog>(m, "SectionCatalog")
        .def(py::init<>())
        .def("add", &sc::SectionCatalog::add, py::arg("section"))
        .def("get", &sc::SectionCatalog::get, py::arg("id"),
             py::return_value_policy::reference_internal)
        .def("contains", &sc::SectionCatalog::contains, py::arg("id"))
        .def("ids", &sc::SectionCatalog::ids)
        .def("filter", [](const sc::SectionCatalog& cat, const sc::SectionFilter& f) {
            std::vector<sc::SteelSection> out;
            for (const sc::SteelSection* s : cat.filter(f)) out.push_back(*s);
            return out;
        }, py::arg("filter"), "Sections matching the filter (copies)")
        .def("warnings", &sc::SectionCatalog::warnings,
             py::return_value_policy::reference_internal)
        .def("__len__", &sc::SectionCatalog::size);

    m.def("default_sections", &sc::default_sections, py::return_value_policy::reference);

    // ========================================================================
    // Load combinations
    // ========================================================================

    py::enum_<sc::LoadType>(m, "LoadType")
        .value("D", sc::LoadType::D)
        .value("L", sc::LoadType::L)
        .value("Lr", sc::LoadType::Lr)
        .value("S", sc::LoadType::S)
        .value("W", sc::LoadType::W)
        .value("E", sc::LoadType::E)
        .value("R", sc::LoadType::R)
        .value("H", sc::LoadType::H)
        .value("F", sc::LoadType::F)
        .value("T", sc::LoadType::T)
        .export_values();

    m.def("parse_load_type", &sc::parse_load_type, py::arg("tag"));
    m.def("load_type_label", &sc::load_type_label, py::arg("type"));

    py::class_<sc::LoadCombination>(m, "LoadCombination")
        .def_readonly("name", &sc::LoadCombination::name)
        .def_readonly("description", &sc::LoadCombination::description)
        .def_readonly("factors", &sc::LoadCombination::factors)
        .def("__repr__", [](const sc::LoadCombination& c) {
            return "<LoadCombination " + c.name + ">";
        });

    py::class_<sc::CombinationResult>(m, "CombinationResult")
        .def_readonly("name", &sc::CombinationResult::name)
        .def_readonly("description", &sc::CombinationResult::description)
        .def_readonly("value", &sc::CombinationResult::value)
        .def_readonly("factors_used", &sc::CombinationResult::factors_used)
        .def_readonly("catalog_index", &sc::CombinationResult::catalog_index)
        .def("__repr__", [](const sc::CombinationResult& r) {
            std::ostringstream oss;
            oss << "<CombinationResult " << r.name << " = " << r.value << ">";
            return oss.str();
        });

    py::class_<sc::CombinationSelection>(m, "CombinationSelection")
        .def_readonly("method", &sc::CombinationSelection::method)
        .def_readonly("loads", &sc::CombinationSelection::loads)
        .def_readonly("governing", &sc::CombinationSelection::governing)
        .def_readonly("all", &sc::CombinationSelection::all)
        .def("top", &sc::CombinationSelection::top, py::arg("n"));

    m.def("lrfd_combinations", &sc::lrfd_combinations, py::return_value_policy::reference);
    m.def("asd_combinations", &sc::asd_combinations, py::return_value_policy::reference);
    m.def("apply_combination", &sc::apply_combination, py::arg("loads"), py::arg("combination"));
    m.def("select_governing_combination",
          py::overload_cast<const std::map<std::string, double>&, sc::DesignMethod>(
              &sc::select_governing_combination),
          py::arg("loads"), py::arg("method") = sc::DesignMethod::LRFD,
          "Governing combination for loads keyed by tag (\"D\", \"L\", ...)");

    // ========================================================================
    // Member checks
    // ========================================================================

    py::class_<sc::VerificationResult>(m, "VerificationResult", "Outcome of one limit-state check")
        .def_readonly("check", &sc::VerificationResult::check)
        .def_readonly("method", &sc::VerificationResult::method)
        .def_readonly("demand", &sc::VerificationResult::demand)
        .def_readonly("nominal", &sc::VerificationResult::nominal)
        .def_readonly("capacity", &sc::VerificationResult::capacity)
        .def_readonly("phi", &sc::VerificationResult::phi)
        .def_readonly("omega", &sc::VerificationResult::omega)
        .def_readonly("ratio", &sc::VerificationResult::ratio)
        .def_readonly("utilization", &sc::VerificationResult::utilization)
        .def_readonly("ok", &sc::VerificationResult::ok)
        .def_readonly("details", &sc::VerificationResult::details)
        .def_readonly("warnings", &sc::VerificationResult::warnings)
        .def("display_utilization", &sc::VerificationResult::display_utilization)
        .def("to_string", &sc::VerificationResult::to_string)
        .def("__repr__", [](const sc::VerificationResult& r) {
            std::ostringstream oss;
            oss << "<" << r.check << " ratio=" << r.ratio << (r.ok ? " OK" : " NOT OK") << ">";
            return oss.str();
        });

    py::enum_<sc::FlexureZone>(m, "FlexureZone")
        .value("NotApplicable", sc::FlexureZone::NotApplicable)
        .value("Plastic", sc::FlexureZone::Plastic)
        .value("InelasticLTB", sc::FlexureZone::InelasticLTB)
        .value("ElasticLTB", sc::FlexureZone::ElasticLTB)
        .export_values();

    py::enum_<sc::FlexureLimitState>(m, "FlexureLimitState")
        .value("Yielding", sc::FlexureLimitState::Yielding)
        .value("LateralTorsionalBuckling", sc::FlexureLimitState::LateralTorsionalBuckling)
        .value("FlangeLocalBuckling", sc::FlexureLimitState::FlangeLocalBuckling)
        .export_values();

    py::class_<sc::FlexureResult, sc::VerificationResult>(m, "FlexureResult")
        .def_readonly("zone", &sc::FlexureResult::zone)
        .def_readonly("governing", &sc::FlexureResult::governing)
        .def_readonly("Mp", &sc::FlexureResult::Mp)
        .def_readonly("Mn_ltb", &sc::FlexureResult::Mn_ltb)
        .def_readonly("Mn_flb", &sc::FlexureResult::Mn_flb)
        .def_readonly("Mn", &sc::FlexureResult::Mn)
        .def_readonly("Lb", &sc::FlexureResult::Lb)
        .def_readonly("Lp", &sc::FlexureResult::Lp)
        .def_readonly("Lr", &sc::FlexureResult::Lr)
        .def_readonly("Cb", &sc::FlexureResult::Cb);

    py::class_<sc::ShearResult, sc::VerificationResult>(m, "ShearResult")
        .def_readonly("Aw", &sc::ShearResult::Aw)
        .def_readonly("Cv", &sc::ShearResult::Cv)
        .def_readonly("kv", &sc::ShearResult::kv)
        .def_readonly("h_tw", &sc::ShearResult::h_tw);

    py::enum_<sc::EndCondition>(m, "EndCondition")
        .value("Fixed", sc::EndCondition::Fixed)
        .value("Pinned", sc::EndCondition::Pinned)
        .value("Free", sc::EndCondition::Free)
        .value("Roller", sc::EndCondition::Roller)
        .export_values();

    py::enum_<sc::BucklingMode>(m, "BucklingMode")
        .value("Inelastic", sc::BucklingMode::Inelastic)
        .value("Elastic", sc::BucklingMode::Elastic)
        .export_values();

    py::enum_<sc::BucklingAxis>(m, "BucklingAxis")
        .value("Major", sc::BucklingAxis::Major)
        .value("Minor", sc::BucklingAxis::Minor)
        .export_values();

    py::class_<sc::CompressionResult, sc::VerificationResult>(m, "CompressionResult")
        .def_readonly("K", &sc::CompressionResult::K)
        .def_readonly("Lx", &sc::CompressionResult::Lx)
        .def_readonly("Ly", &sc::CompressionResult::Ly)
        .def_readonly("slenderness", &sc::CompressionResult::slenderness)
        .def_readonly("axis", &sc::CompressionResult::axis)
        .def_readonly("Fe", &sc::CompressionResult::Fe)
        .def_readonly("Fcr", &sc::CompressionResult::Fcr)
        .def_readonly("mode", &sc::CompressionResult::mode)
        .def_readonly("Pn", &sc::CompressionResult::Pn);

    py::enum_<sc::InteractionEquation>(m, "InteractionEquation")
        .value("H1_1a", sc::InteractionEquation::H1_1a)
        .value("H1_1b", sc::InteractionEquation::H1_1b)
        .export_values();

    py::class_<sc::InteractionResult, sc::VerificationResult>(m, "InteractionResult")
        .def_readonly("equation", &sc::InteractionResult::equation)
        .def_readonly("Pr_Pc", &sc::InteractionResult::Pr_Pc)
        .def_readonly("Mrx_Mcx", &sc::InteractionResult::Mrx_Mcx)
        .def_readonly("Mry_Mcy", &sc::InteractionResult::Mry_Mcy)
        .def_readonly("value", &sc::InteractionResult::value);

    py::class_<sc::DeflectionCheck>(m, "DeflectionCheck")
        .def_readonly("denominator", &sc::DeflectionCheck::denominator)
        .def_readonly("limit", &sc::DeflectionCheck::limit)
        .def_readonly("actual", &sc::DeflectionCheck::actual)
        .def_readonly("ratio", &sc::DeflectionCheck::ratio)
        .def_readonly("ok", &sc::DeflectionCheck::ok);

    m.def("verify_flexure", &sc::verify_flexure,
          py::arg("section"), py::arg("material"), py::arg("Mu"), py::arg("Lb"),
          py::arg("Cb") = 1.0, py::arg("config") = sc::DesignConfig(),
          "Major-axis flexure check (AISC Chapter F)");
    m.def("verify_flexure_minor", &sc::verify_flexure_minor,
          py::arg("section"), py::arg("material"), py::arg("Muy"),
          py::arg("config") = sc::DesignConfig());
    m.def("verify_shear", &sc::verify_shear,
          py::arg("section"), py::arg("material"), py::arg("Vu"),
          py::arg("config") = sc::DesignConfig(), "Shear check (AISC Chapter G)");
    m.def("verify_compression",
          py::overload_cast<const sc::SteelSection&, const sc::SteelMaterial&, double, double,
                            double, double, const sc::DesignConfig&>(&sc::verify_compression),
          py::arg("section"), py::arg("material"), py::arg("Pu"), py::arg("K"),
          py::arg("Lx"), py::arg("Ly"), py::arg("config") = sc::DesignConfig(),
          "Compression check (AISC Chapter E)");
    m.def("verify_compression",
          py::overload_cast<const sc::SteelSection&, const sc::SteelMaterial&, double,
                            sc::EndCondition, sc::EndCondition, double, double,
                            const sc::DesignConfig&>(&sc::verify_compression),
          py::arg("section"), py::arg("material"), py::arg("Pu"), py::arg("end_i"),
          py::arg("end_j"), py::arg("Lx"), py::arg("Ly"), py::arg("config") = sc::DesignConfig(),
          "Compression check with K from the end-condition table");
    m.def("effective_length_factor", &sc::effective_length_factor,
          py::arg("end_i"), py::arg("end_j"),
          py::arg("fallback") = sc::KFactorFallback::Reject);
    m.def("verify_interaction",
          py::overload_cast<const sc::CompressionResult&, const sc::FlexureResult&,
                            const sc::DesignConfig&>(&sc::verify_interaction),
          py::arg("compression"), py::arg("flexure"), py::arg("config") = sc::DesignConfig());
    m.def("verify_interaction",
          py::overload_cast<const sc::CompressionResult&, const sc::FlexureResult&,
                            const sc::FlexureResult&, const sc::DesignConfig&>(
              &sc::verify_interaction),
          py::arg("compression"), py::arg("flexure"), py::arg("minor_flexure"),
          py::arg("config") = sc::DesignConfig());
    m.def("verify_deflection", &sc::verify_deflection,
          py::arg("actual_mm"), py::arg("span_m"),
          py::arg("denominators") = sc::default_deflection_denominators(),
          py::arg("config") = sc::DesignConfig());

    py::class_<sc::BeamDemand>(m, "BeamDemand")
        .def(py::init<>())
        .def_readwrite("Mu", &sc::BeamDemand::Mu)
        .def_readwrite("Vu", &sc::BeamDemand::Vu)
        .def_readwrite("L", &sc::BeamDemand::L)
        .def_readwrite("Lb", &sc::BeamDemand::Lb)
        .def_readwrite("Cb", &sc::BeamDemand::Cb)
        .def_readwrite("deflection", &sc::BeamDemand::deflection)
        .def_readwrite("deflection_denominators", &sc::BeamDemand::deflection_denominators);

    py::class_<sc::BeamCheckResult>(m, "BeamCheckResult")
        .def_readonly("flexure", &sc::BeamCheckResult::flexure)
        .def_readonly("shear", &sc::BeamCheckResult::shear)
        .def_readonly("deflection", &sc::BeamCheckResult::deflection)
        .def_readonly("overall_ok", &sc::BeamCheckResult::overall_ok)
        .def_readonly("governing", &sc::BeamCheckResult::governing)
        .def_readonly("max_ratio", &sc::BeamCheckResult::max_ratio)
        .def("to_string", &sc::BeamCheckResult::to_string);

    py::class_<sc::ColumnDemand>(m, "ColumnDemand")
        .def(py::init<>())
        .def_readwrite("Pu", &sc::ColumnDemand::Pu)
        .def_readwrite("Mu_top", &sc::ColumnDemand::Mu_top)
        .def_readwrite("Mu_base", &sc::ColumnDemand::Mu_base)
        .def_readwrite("Muy", &sc::ColumnDemand::Muy)
        .def_readwrite("L", &sc::ColumnDemand::L)
        .def_readwrite("K", &sc::ColumnDemand::K)
        .def_readwrite("Ly", &sc::ColumnDemand::Ly)
        .def_readwrite("Lb", &sc::ColumnDemand::Lb)
        .def_readwrite("Cb", &sc::ColumnDemand::Cb);

    py::class_<sc::ColumnCheckResult>(m, "ColumnCheckResult")
        .def_readonly("compression", &sc::ColumnCheckResult::compression)
        .def_readonly("flexure", &sc::ColumnCheckResult::flexure)
        .def_readonly("flexure_minor", &sc::ColumnCheckResult::flexure_minor)
        .def_readonly("interaction", &sc::ColumnCheckResult::interaction)
        .def_readonly("overall_ok", &sc::ColumnCheckResult::overall_ok)
        .def_readonly("governing", &sc::ColumnCheckResult::governing)
        .def_readonly("max_ratio", &sc::ColumnCheckResult::max_ratio)
        .def("to_string", &sc::ColumnCheckResult::to_string);

    m.def("verify_beam", &sc::verify_beam,
          py::arg("section"), py::arg("material"), py::arg("demand"),
          py::arg("config") = sc::DesignConfig());
    m.def("verify_column", &sc::verify_column,
          py::arg("section"), py::arg("material"), py::arg("demand"),
          py::arg("config") = sc::DesignConfig());

    // ========================================================================
    // Bolted connections
    // ========================================================================

    py::class_<sc::BoltGrade>(m, "BoltGrade")
        .def_readonly("id", &sc::BoltGrade::id)
        .def_readonly("Fnt", &sc::BoltGrade::Fnt)
        .def_readonly("Fnv", &sc::BoltGrade::Fnv);

    py::class_<sc::BoltSize>(m, "BoltSize")
        .def_readonly("id", &sc::BoltSize::id)
        .def_readonly("d", &sc::BoltSize::d)
        .def_readonly("Ab", &sc::BoltSize::Ab)
        .def_readonly("hole_standard", &sc::BoltSize::hole_standard)
        .def_readonly("hole_oversized", &sc::BoltSize::hole_oversized)
        .def_readonly("short_slot_length", &sc::BoltSize::short_slot_length);

    py::enum_<sc::HoleType>(m, "HoleType")
        .value("Standard", sc::HoleType::Standard)
        .value("Oversized", sc::HoleType::Oversized)
        .value("ShortSlotted", sc::HoleType::ShortSlotted)
        .value("LongSlottedTransverse", sc::HoleType::LongSlottedTransverse)
        .export_values();

    py::class_<sc::BoltCheckResult, sc::VerificationResult>(m, "BoltCheckResult")
        .def_readonly("grade", &sc::BoltCheckResult::grade)
        .def_readonly("diameter", &sc::BoltCheckResult::diameter)
        .def_readonly("num_bolts", &sc::BoltCheckResult::num_bolts)
        .def_readonly("shear_planes", &sc::BoltCheckResult::shear_planes)
        .def_readonly("Rn_per_bolt", &sc::BoltCheckResult::Rn_per_bolt);

    py::class_<sc::BoltCombinedResult, sc::VerificationResult>(m, "BoltCombinedResult")
        .def_readonly("shear_check", &sc::BoltCombinedResult::shear_check)
        .def_readonly("tension_check", &sc::BoltCombinedResult::tension_check)
        .def_readonly("frv", &sc::BoltCombinedResult::frv)
        .def_readonly("frt", &sc::BoltCombinedResult::frt)
        .def_readonly("Fnt_prime", &sc::BoltCombinedResult::Fnt_prime)
        .def_readonly("interaction", &sc::BoltCombinedResult::interaction);

    py::class_<sc::BearingResult, sc::VerificationResult>(m, "BearingResult")
        .def_readonly("hole_type", &sc::BearingResult::hole_type)
        .def_readonly("dh", &sc::BearingResult::dh)
        .def_readonly("lc_edge", &sc::BearingResult::lc_edge)
        .def_readonly("lc_interior", &sc::BearingResult::lc_interior)
        .def_readonly("Rn_edge", &sc::BearingResult::Rn_edge)
        .def_readonly("Rn_interior", &sc::BearingResult::Rn_interior);

    py::class_<sc::BlockShearGeometry>(m, "BlockShearGeometry")
        .def(py::init([](double Agv, double Anv, double Ant, double Ubs) {
                 return sc::BlockShearGeometry{Agv, Anv, Ant, Ubs};
             }),
             py::arg("Agv"), py::arg("Anv"), py::arg("Ant"), py::arg("Ubs") = 1.0)
        .def_readwrite("Agv", &sc::BlockShearGeometry::Agv)
        .def_readwrite("Anv", &sc::BlockShearGeometry::Anv)
        .def_readwrite("Ant", &sc::BlockShearGeometry::Ant)
        .def_readwrite("Ubs", &sc::BlockShearGeometry::Ubs);

    m.def("bolt_grades", &sc::bolt_grades, py::return_value_policy::reference);
    m.def("bolt_diameters", &sc::bolt_diameters, py::return_value_policy::reference);
    m.def("verify_bolt_shear", &sc::verify_bolt_shear,
          py::arg("grade"), py::arg("diameter"), py::arg("num_bolts"), py::arg("Vu"),
          py::arg("shear_planes") = 1, py::arg("config") = sc::DesignConfig());
    m.def("verify_bolt_tension", &sc::verify_bolt_tension,
          py::arg("grade"), py::arg("diameter"), py::arg("num_bolts"), py::arg("Tu"),
          py::arg("config") = sc::DesignConfig());
    m.def("verify_bolt_combined", &sc::verify_bolt_combined,
          py::arg("grade"), py::arg("diameter"), py::arg("num_bolts"), py::arg("Vu"),
          py::arg("Tu"), py::arg("shear_planes") = 1, py::arg("config") = sc::DesignConfig());
    m.def("verify_bolt_bearing", &sc::verify_bolt_bearing,
          py::arg("t_plate"), py::arg("Fu_plate"), py::arg("diameter"), py::arg("num_bolts"),
          py::arg("Vu"), py::arg("edge_distance"), py::arg("spacing"),
          py::arg("hole_type") = sc::HoleType::Standard, py::arg("config") = sc::DesignConfig());
    m.def("verify_block_shear", &sc::verify_block_shear,
          py::arg("geometry"), py::arg("Fy"), py::arg("Fu"), py::arg("Ru") = 0.0,
          py::arg("config") = sc::DesignConfig());

    // ========================================================================
    // Recommendation
    // ========================================================================

    py::class_<sc::UtilizationBand>(m, "UtilizationBand")
        .def(py::init<>())
        .def_readwrite("min", &sc::UtilizationBand::min)
        .def_readwrite("max", &sc::UtilizationBand::max)
        .def("midpoint", &sc::UtilizationBand::midpoint);

    py::class_<sc::RecommendationRequest>(m, "RecommendationRequest")
        .def(py::init<>())
        .def_readwrite("Mu", &sc::RecommendationRequest::Mu)
        .def_readwrite("Vu", &sc::RecommendationRequest::Vu)
        .def_readwrite("L", &sc::RecommendationRequest::L)
        .def_readwrite("Lb", &sc::RecommendationRequest::Lb)
        .def_readwrite("Cb", &sc::RecommendationRequest::Cb)
        .def_readwrite("material_id", &sc::RecommendationRequest::material_id)
        .def_readwrite("type", &sc::RecommendationRequest::type)
        .def_readwrite("origin", &sc::RecommendationRequest::origin)
        .def_readwrite("count", &sc::RecommendationRequest::count)
        .def_readwrite("band", &sc::RecommendationRequest::band)
        .def_readwrite("config", &sc::RecommendationRequest::config);

    py::class_<sc::SectionCandidate>(m, "SectionCandidate")
        .def_readonly("section_id", &sc::SectionCandidate::section_id)
        .def_readonly("type", &sc::SectionCandidate::type)
        .def_readonly("origin", &sc::SectionCandidate::origin)
        .def_readonly("weight", &sc::SectionCandidate::weight)
        .def_readonly("flexural_capacity", &sc::SectionCandidate::flexural_capacity)
        .def_readonly("shear_capacity", &sc::SectionCandidate::shear_capacity)
        .def_readonly("utilization", &sc::SectionCandidate::utilization)
        .def_readonly("shear_utilization", &sc::SectionCandidate::shear_utilization)
        .def_readonly("zone", &sc::SectionCandidate::zone)
        .def_readonly("meets_target", &sc::SectionCandidate::meets_target)
        .def("__repr__", [](const sc::SectionCandidate& c) {
            std::ostringstream oss;
            oss << "<SectionCandidate " << c.section_id << " " << c.weight
                << " kg/m util=" << c.utilization << ">";
            return oss.str();
        });

    py::class_<sc::SectionComparison>(m, "SectionComparison")
        .def_readonly("section_id", &sc::SectionComparison::section_id)
        .def_readonly("weight", &sc::SectionComparison::weight)
        .def_readonly("d", &sc::SectionComparison::d)
        .def_readonly("verification", &sc::SectionComparison::verification);

    m.def("recommend_sections",
          [](const sc::RecommendationRequest& req) { return sc::recommend_sections(req); },
          py::arg("request"), "Rank built-in catalog sections for a demand");
    m.def("compare_sections",
          [](const std::vector<std::string>& ids, double Mu, double Vu, double L,
             const std::string& material_id, const sc::DesignConfig& config) {
              return sc::compare_sections(ids, Mu, Vu, L, material_id, config);
          },
          py::arg("section_ids"), py::arg("Mu"), py::arg("Vu"), py::arg("L"),
          py::arg("material_id") = "A572_GR50", py::arg("config") = sc::DesignConfig());

    // ========================================================================
    // Frame verification
    // ========================================================================

    py::class_<sc::ElementEndForces>(m, "ElementEndForces")
        .def(py::init<>())
        .def(py::init<double, double, double, double, double, double>(),
             py::arg("N_i"), py::arg("V_i"), py::arg("M_i"),
             py::arg("N_j"), py::arg("V_j"), py::arg("M_j"))
        .def_static("from_local_vector", &sc::ElementEndForces::from_local_vector,
                    py::arg("f"))
        .def_readwrite("N_i", &sc::ElementEndForces::N_i)
        .def_readwrite("V_i", &sc::ElementEndForces::V_i)
        .def_readwrite("M_i", &sc::ElementEndForces::M_i)
        .def_readwrite("N_j", &sc::ElementEndForces::N_j)
        .def_readwrite("V_j", &sc::ElementEndForces::V_j)
        .def_readwrite("M_j", &sc::ElementEndForces::M_j)
        .def("to_vector", &sc::ElementEndForces::to_vector);

    py::class_<sc::ForceStations>(m, "ForceStations")
        .def(py::init<>())
        .def_readwrite("x", &sc::ForceStations::x)
        .def_readwrite("N", &sc::ForceStations::N)
        .def_readwrite("V", &sc::ForceStations::V)
        .def_readwrite("M", &sc::ForceStations::M);

    py::class_<sc::ActionExtreme>(m, "ActionExtreme")
        .def_readonly("x", &sc::ActionExtreme::x)
        .def_readonly("value", &sc::ActionExtreme::value);

    py::class_<sc::Demand>(m, "Demand")
        .def(py::init<>())
        .def(py::init<double, double, double>(), py::arg("Pu"), py::arg("Vu"), py::arg("Mux"))
        .def_readwrite("Pu", &sc::Demand::Pu)
        .def_readwrite("Vu", &sc::Demand::Vu)
        .def_readwrite("Mux", &sc::Demand::Mux)
        .def_readwrite("Muy", &sc::Demand::Muy)
        .def_readwrite("Lb", &sc::Demand::Lb)
        .def_readwrite("Cb", &sc::Demand::Cb);

    py::class_<sc::DemandEnvelope>(m, "DemandEnvelope")
        .def_readonly("axial", &sc::DemandEnvelope::axial)
        .def_readonly("shear", &sc::DemandEnvelope::shear)
        .def_readonly("moment", &sc::DemandEnvelope::moment)
        .def_readonly("max_compression", &sc::DemandEnvelope::max_compression)
        .def("to_demand", &sc::DemandEnvelope::to_demand);

    m.def("envelope", &sc::envelope, py::arg("stations"));

    py::enum_<sc::MemberRole>(m, "MemberRole")
        .value("Beam", sc::MemberRole::Beam)
        .value("Column", sc::MemberRole::Column)
        .value("Brace", sc::MemberRole::Brace)
        .export_values();

    py::class_<sc::FrameNode>(m, "FrameNode")
        .def(py::init<int, double, double, std::optional<sc::EndCondition>>(),
             py::arg("id"), py::arg("x"), py::arg("y"), py::arg("support") = py::none())
        .def_readwrite("id", &sc::FrameNode::id)
        .def_readwrite("x", &sc::FrameNode::x)
        .def_readwrite("y", &sc::FrameNode::y)
        .def_readwrite("support", &sc::FrameNode::support)
        .def("position", &sc::FrameNode::position);

    py::class_<sc::FrameElement>(m, "FrameElement")
        .def(py::init<int, int, int, std::string, sc::MemberRole>(),
             py::arg("id"), py::arg("node_i"), py::arg("node_j"),
             py::arg("section_id"), py::arg("role"))
        .def_readwrite("id", &sc::FrameElement::id)
        .def_readwrite("node_i", &sc::FrameElement::node_i)
        .def_readwrite("node_j", &sc::FrameElement::node_j)
        .def_readwrite("section_id", &sc::FrameElement::section_id)
        .def_readwrite("role", &sc::FrameElement::role)
        .def_readwrite("unbraced_length", &sc::FrameElement::unbraced_length);

    py::class_<sc::FrameModel>(m, "FrameModel")
        .def(py::init<>())
        .def("add_node", &sc::FrameModel::add_node, py::arg("node"))
        .def("add_element", &sc::FrameModel::add_element, py::arg("element"))
        .def("nodes", &sc::FrameModel::nodes, py::return_value_policy::reference_internal)
        .def("elements", &sc::FrameModel::elements, py::return_value_policy::reference_internal)
        .def("element_length", &sc::FrameModel::element_length, py::arg("element"));

    py::class_<sc::ElementVerification>(m, "ElementVerification")
        .def_readonly("element_id", &sc::ElementVerification::element_id)
        .def_readonly("role", &sc::ElementVerification::role)
        .def_readonly("section_id", &sc::ElementVerification::section_id)
        .def_readonly("length", &sc::ElementVerification::length)
        .def_readonly("K", &sc::ElementVerification::K)
        .def_readonly("N", &sc::ElementVerification::N)
        .def_readonly("V", &sc::ElementVerification::V)
        .def_readonly("M", &sc::ElementVerification::M)
        .def_readonly("beam", &sc::ElementVerification::beam)
        .def_readonly("column", &sc::ElementVerification::column)
        .def_readonly("warnings", &sc::ElementVerification::warnings)
        .def_readonly("overall_ok", &sc::ElementVerification::overall_ok)
        .def_readonly("max_ratio", &sc::ElementVerification::max_ratio)
        .def_readonly("governing", &sc::ElementVerification::governing);

    m.def("verify_frame",
          [](const sc::FrameModel& model, const std::map<int, sc::ElementEndForces>& forces,
             const sc::SteelMaterial& material, const sc::DesignConfig& config) {
              return sc::verify_frame(model, forces, material, config);
          },
          py::arg("model"), py::arg("end_forces"), py::arg("material"),
          py::arg("config") = sc::DesignConfig());
}
