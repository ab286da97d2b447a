/**
 * @file test_member_checks.cpp
 * @brief C++ tests for the beam and column aggregate checks
 *
 * Tests include:
 * - Beam flexure, shear and optional deflection with the governing check
 * - Column compression, flexure and interaction
 * - Biaxial columns and unbraced length defaults
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "steelcheck/member_checks.hpp"
#include "steelcheck/section_catalog.hpp"
#include "steelcheck/errors.hpp"

#include <algorithm>
#include <cmath>

using namespace steelcheck;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

// =============================================================================
// Beams
// =============================================================================

TEST_CASE("Braced W310X39 beam is governed by flexure", "[MemberChecks][beam]") {
    const SteelSection& w = default_sections().get("W310X39");
    const SteelMaterial& mat = default_materials().get("A572_GR50");

    BeamDemand demand;
    demand.Mu = 150.0;
    demand.Vu = 100.0;
    demand.L = 6.0;
    demand.Lb = 1.5;

    BeamCheckResult r = verify_beam(w, mat, demand);

    CHECK(r.flexure.zone == FlexureZone::Plastic);
    CHECK(r.governing == "flexure");
    CHECK_THAT(r.max_ratio, WithinRel(r.flexure.ratio, 1e-15));
    CHECK(r.max_ratio >= r.shear.ratio);
    CHECK(r.overall_ok);
    CHECK(r.deflection.empty());
    CHECK_FALSE(r.to_string().empty());
}

TEST_CASE("Beam unbraced length defaults to the span", "[MemberChecks][beam]") {
    const SteelSection& w = default_sections().get("W310X39");
    const SteelMaterial& mat = default_materials().get("A572_GR50");

    BeamDemand demand;
    demand.Mu = 80.0;
    demand.Vu = 40.0;
    demand.L = 6.0;

    BeamCheckResult r = verify_beam(w, mat, demand);
    CHECK_THAT(r.flexure.Lb, WithinAbs(6.0, 1e-15));
    CHECK(r.flexure.zone == FlexureZone::ElasticLTB);
}

TEST_CASE("Hogging moment is checked by magnitude", "[MemberChecks][beam]") {
    const SteelSection& w = default_sections().get("W310X39");
    const SteelMaterial& mat = default_materials().get("A572_GR50");

    BeamDemand sagging;
    sagging.Mu = 120.0;
    sagging.Vu = 60.0;
    sagging.L = 5.0;
    sagging.Lb = 1.0;
    BeamDemand hogging = sagging;
    hogging.Mu = -120.0;

    CHECK_THAT(verify_beam(w, mat, hogging).flexure.ratio,
               WithinRel(verify_beam(w, mat, sagging).flexure.ratio, 1e-15));
}

TEST_CASE("Beam with deflection reports each serviceability limit", "[MemberChecks][beam]") {
    const SteelSection& w = default_sections().get("W310X39");
    const SteelMaterial& mat = default_materials().get("A572_GR50");

    BeamDemand demand;
    demand.Mu = 100.0;
    demand.Vu = 50.0;
    demand.L = 6.0;
    demand.Lb = 1.5;
    demand.deflection = 20.0;

    BeamCheckResult r = verify_beam(w, mat, demand);
    REQUIRE(r.deflection.size() == 3);
    CHECK_FALSE(r.deflection.at("L/360").ok);
    // Serviceability does not affect the strength verdict
    CHECK(r.overall_ok);
}

TEST_CASE("Short heavily loaded beam is governed by shear", "[MemberChecks][beam]") {
    const SteelSection& w = default_sections().get("W310X39");
    const SteelMaterial& mat = default_materials().get("A572_GR50");

    BeamDemand demand;
    demand.Mu = 20.0;
    demand.Vu = 400.0;
    demand.L = 1.0;

    BeamCheckResult r = verify_beam(w, mat, demand);
    CHECK(r.governing == "shear");
    CHECK_FALSE(r.shear.ok);
    CHECK_FALSE(r.overall_ok);
}

TEST_CASE("Beam span must be positive", "[MemberChecks][beam]") {
    BeamDemand demand;
    demand.Mu = 10.0;
    demand.L = 0.0;
    CHECK_THROWS_AS(verify_beam(default_sections().get("W310X39"),
                                default_materials().get("A572_GR50"), demand),
                    CheckException);
}

// =============================================================================
// Columns
// =============================================================================

TEST_CASE("Column combines compression, flexure and interaction", "[MemberChecks][column]") {
    const SteelSection& w = default_sections().get("W200X46");
    const SteelMaterial& mat = default_materials().get("A572_GR50");

    ColumnDemand demand;
    demand.Pu = 500.0;
    demand.Mu_top = 30.0;
    demand.Mu_base = -20.0;
    demand.L = 3.5;

    ColumnCheckResult r = verify_column(w, mat, demand);

    CHECK_THAT(r.flexure.demand, WithinAbs(30.0, 1e-12));
    CHECK_THAT(r.compression.K, WithinAbs(1.0, 1e-15));
    CHECK_FALSE(r.flexure_minor.has_value());
    CHECK(r.interaction.equation == select_interaction_equation(r.compression.ratio));
    CHECK_THAT(r.max_ratio, WithinRel(std::max(r.compression.ratio, r.interaction.ratio), 1e-15));
    CHECK(r.overall_ok == (r.compression.ok && r.interaction.ok));
    CHECK_FALSE(r.to_string().empty());
}

TEST_CASE("Column with minor-axis moment adds a minor flexure check", "[MemberChecks][column]") {
    const SteelSection& w = default_sections().get("W200X46");
    const SteelMaterial& mat = default_materials().get("A572_GR50");

    ColumnDemand demand;
    demand.Pu = 300.0;
    demand.Mu_top = 20.0;
    demand.Muy = -8.0;
    demand.L = 3.0;

    ColumnCheckResult r = verify_column(w, mat, demand);
    REQUIRE(r.flexure_minor.has_value());
    CHECK_THAT(r.flexure_minor->demand, WithinAbs(8.0, 1e-12));
    CHECK_THAT(r.interaction.Mry_Mcy, WithinRel(r.flexure_minor->ratio, 1e-15));
}

TEST_CASE("Column minor-axis length and effective length factor", "[MemberChecks][column]") {
    const SteelSection& w = default_sections().get("W200X46");
    const SteelMaterial& mat = default_materials().get("A572_GR50");

    ColumnDemand demand;
    demand.Pu = 400.0;
    demand.L = 6.0;
    demand.K = 0.8;
    demand.Ly = 3.0;

    ColumnCheckResult r = verify_column(w, mat, demand);
    CHECK_THAT(r.compression.slenderness_x, WithinRel(0.8 * 6000.0 / w.rx(), 1e-12));
    CHECK_THAT(r.compression.slenderness_y, WithinRel(0.8 * 3000.0 / w.ry(), 1e-12));
    CHECK(r.flexure.zone == FlexureZone::NotApplicable);
}

TEST_CASE("Overloaded column fails", "[MemberChecks][column]") {
    ColumnDemand demand;
    demand.Pu = 3000.0;
    demand.Mu_top = 50.0;
    demand.L = 4.0;

    ColumnCheckResult r = verify_column(default_sections().get("W200X46"),
                                        default_materials().get("A572_GR50"), demand);
    CHECK_FALSE(r.compression.ok);
    CHECK_FALSE(r.overall_ok);
    CHECK(r.max_ratio > 1.0);
}
