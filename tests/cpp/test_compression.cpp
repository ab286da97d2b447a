/**
 * @file test_compression.cpp
 * @brief C++ tests for the AISC Chapter E compression check
 *
 * Tests include:
 * - Euler and critical stresses at KL/r = 200
 * - Inelastic/elastic branch selection and continuity at 4.71 sqrt(E/Fy)
 * - Effective length factors from end conditions
 * - Governing buckling axis, slenderness warning and zero demand
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "steelcheck/compression.hpp"
#include "steelcheck/section_catalog.hpp"
#include "steelcheck/errors.hpp"

#include <cmath>

using namespace steelcheck;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {

constexpr double kPi = 3.14159265358979323846;

} // namespace

// =============================================================================
// Critical stress
// =============================================================================

TEST_CASE("Slender member at KL/r = 200 buckles elastically", "[Compression][stress]") {
    double Fe = euler_stress(200000.0, 200.0);
    CHECK_THAT(Fe, WithinRel(kPi * kPi * 200000.0 / 40000.0, 1e-12));
    CHECK_THAT(Fe, WithinAbs(49.35, 0.01));

    // Fe < 0.44 Fy for Fy = 250
    CHECK(Fe < 0.44 * 250.0);
    CHECK(200.0 > inelastic_slenderness_limit(200000.0, 250.0));
    CHECK_THAT(elastic_critical_stress(Fe), WithinAbs(43.28, 0.01));
}

TEST_CASE("Critical stress branches meet at 4.71 sqrt(E/Fy)", "[Compression][stress]") {
    for (double Fy : {250.0, 345.0, 450.0}) {
        double lambda = inelastic_slenderness_limit(200000.0, Fy);
        double Fe = euler_stress(200000.0, lambda);
        CHECK_THAT(inelastic_critical_stress(Fy, Fe),
                   WithinRel(elastic_critical_stress(Fe), 0.005));
    }
}

TEST_CASE("Member check reproduces the elastic branch", "[Compression][stress]") {
    const SteelSection& w = default_sections().get("W150X22");
    const SteelMaterial& a36 = default_materials().get("A36");

    // Length giving KL/ry = 200 about the weak axis
    double L = 200.0 * w.ry() / 1000.0;
    CompressionResult r = verify_compression(w, a36, 50.0, 1.0, L, L);

    CHECK(r.check == "compression");
    CHECK(r.axis == BucklingAxis::Minor);
    CHECK_THAT(r.slenderness, WithinRel(200.0, 1e-9));
    CHECK(r.mode == BucklingMode::Elastic);
    CHECK_THAT(r.Fe, WithinAbs(49.35, 0.01));
    CHECK_THAT(r.Fcr, WithinAbs(43.28, 0.01));
    CHECK_THAT(r.Pn, WithinRel(r.Fcr * w.A / 1000.0, 1e-12));
    CHECK_THAT(r.capacity, WithinRel(0.9 * r.Pn, 1e-12));
}

TEST_CASE("Stocky column buckles inelastically", "[Compression][stress]") {
    const SteelSection& w = default_sections().get("W200X46");
    const SteelMaterial& mat = default_materials().get("A572_GR50");
    CompressionResult r = verify_compression(w, mat, 800.0, 1.0, 3.0, 3.0);

    CHECK(r.mode == BucklingMode::Inelastic);
    CHECK_THAT(r.slenderness, WithinRel(3000.0 / w.ry(), 1e-12));
    CHECK_THAT(r.Fcr, WithinRel(inelastic_critical_stress(345.0, r.Fe), 1e-12));
    CHECK(r.Fcr < 345.0);
    CHECK_FALSE(r.warnings.contains(WarningCode::SLENDERNESS_LIMIT));
}

TEST_CASE("Major axis governs when the weak axis is braced", "[Compression][axis]") {
    const SteelSection& w = default_sections().get("W310X39");
    const SteelMaterial& mat = default_materials().get("A572_GR50");
    CompressionResult r = verify_compression(w, mat, 300.0, 1.0, 6.0, 1.0);

    CHECK(r.axis == BucklingAxis::Major);
    CHECK_THAT(r.slenderness, WithinRel(r.slenderness_x, 1e-15));
    CHECK_THAT(r.slenderness_x, WithinRel(6000.0 / w.rx(), 1e-12));
}

TEST_CASE("KL/r above 200 raises a warning", "[Compression][axis]") {
    const SteelSection& w = default_sections().get("W150X22");
    CompressionResult r = verify_compression(w, default_materials().get("A36"), 10.0, 1.0, 10.0, 10.0);

    CHECK(r.slenderness > kSlendernessLimit);
    CHECK(r.warnings.contains(WarningCode::SLENDERNESS_LIMIT));
}

// =============================================================================
// Effective length factors
// =============================================================================

TEST_CASE("Tabulated K factors are symmetric", "[Compression][kfactor]") {
    using EC = EndCondition;
    CHECK_THAT(effective_length_factor(EC::Fixed, EC::Fixed), WithinAbs(0.65, 1e-15));
    CHECK_THAT(effective_length_factor(EC::Fixed, EC::Pinned), WithinAbs(0.80, 1e-15));
    CHECK_THAT(effective_length_factor(EC::Pinned, EC::Fixed), WithinAbs(0.80, 1e-15));
    CHECK_THAT(effective_length_factor(EC::Fixed, EC::Free), WithinAbs(2.10, 1e-15));
    CHECK_THAT(effective_length_factor(EC::Pinned, EC::Pinned), WithinAbs(1.00, 1e-15));
    CHECK_THAT(effective_length_factor(EC::Free, EC::Pinned), WithinAbs(2.10, 1e-15));
}

TEST_CASE("Untabulated end conditions are rejected by default", "[Compression][kfactor]") {
    using EC = EndCondition;
    CHECK_FALSE(lookup_effective_length_factor(EC::Roller, EC::Roller).has_value());

    try {
        effective_length_factor(EC::Roller, EC::Roller);
        FAIL("expected CheckException");
    } catch (const CheckException& e) {
        CHECK(e.code() == ErrorCode::UNSUPPORTED_CONFIGURATION);
        CHECK(e.error().value == "roller-roller");
    }

    CHECK_THAT(effective_length_factor(EC::Roller, EC::Roller, KFactorFallback::Conservative),
               WithinAbs(kMaxTabulatedK, 1e-15));
}

TEST_CASE("End-condition overload applies the table", "[Compression][kfactor]") {
    const SteelSection& w = default_sections().get("W200X46");
    const SteelMaterial& mat = default_materials().get("A572_GR50");

    CompressionResult by_end = verify_compression(w, mat, 500.0, EndCondition::Fixed,
                                                  EndCondition::Fixed, 4.0, 4.0);
    CompressionResult by_k = verify_compression(w, mat, 500.0, 0.65, 4.0, 4.0);
    CHECK_THAT(by_end.K, WithinAbs(0.65, 1e-15));
    CHECK_THAT(by_end.ratio, WithinRel(by_k.ratio, 1e-15));

    DesignConfig lenient;
    lenient.k_factor_fallback = KFactorFallback::Conservative;
    CompressionResult roller = verify_compression(w, mat, 500.0, EndCondition::Roller,
                                                  EndCondition::Free, 4.0, 4.0, lenient);
    CHECK_THAT(roller.K, WithinAbs(2.10, 1e-15));
}

TEST_CASE("End condition names parse case-insensitively", "[Compression][kfactor]") {
    CHECK(parse_end_condition("Fixed") == EndCondition::Fixed);
    CHECK(parse_end_condition("PINNED") == EndCondition::Pinned);
    CHECK(end_condition_to_string(EndCondition::Roller) == "roller");
    CHECK_THROWS_AS(parse_end_condition("hinged"), CheckException);
}

// =============================================================================
// Demand handling and validation
// =============================================================================

TEST_CASE("Tension or zero axial force is zero compression demand", "[Compression][demand]") {
    const SteelSection& w = default_sections().get("W200X46");
    const SteelMaterial& mat = default_materials().get("A572_GR50");
    CompressionResult r = verify_compression(w, mat, -100.0, 1.0, 3.0, 3.0);

    CHECK_THAT(r.ratio, WithinAbs(0.0, 1e-15));
    CHECK(r.ok);
    CHECK(r.Pn > 0.0);
    CHECK(r.warnings.contains(WarningCode::ZERO_DEMAND));
}

TEST_CASE("Invalid compression input is rejected", "[Compression][validation]") {
    const SteelSection& w = default_sections().get("W200X46");
    const SteelMaterial& mat = default_materials().get("A572_GR50");

    try {
        verify_compression(w, mat, 100.0, 1.0, 0.0, 3.0);
        FAIL("expected CheckException");
    } catch (const CheckException& e) {
        CHECK(e.code() == ErrorCode::INVALID_GEOMETRY);
        CHECK(e.error().field == "Lx");
    }

    try {
        verify_compression(w, mat, 100.0, 0.0, 3.0, 3.0);
        FAIL("expected CheckException");
    } catch (const CheckException& e) {
        CHECK(e.code() == ErrorCode::INVALID_PROPERTY);
        CHECK(e.error().field == "K");
    }
}
