/**
 * @file test_flexure.cpp
 * @brief C++ tests for the AISC Chapter F flexure check
 *
 * Tests include:
 * - Plastic, inelastic and elastic LTB zones of a rolled W-shape
 * - Continuity of the nominal moment at Lp and Lr
 * - Flange local buckling of a non-compact flange
 * - Closed sections and angles
 * - LRFD/ASD available strength and tolerance at ratio = 1
 * - Zero demand and invalid input
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "steelcheck/flexure.hpp"
#include "steelcheck/section_catalog.hpp"
#include "steelcheck/errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

using namespace steelcheck;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {

const SteelSection& w310() { return default_sections().get("W310X39"); }
const SteelMaterial& gr50() { return default_materials().get("A572_GR50"); }

} // namespace

// =============================================================================
// Lateral-torsional buckling zones
// =============================================================================

TEST_CASE("W310X39 braced within Lp reaches the plastic moment", "[Flexure][zones]") {
    // Lp = 1.76 ry sqrt(E/Fy) = 1.62 m
    FlexureResult r = verify_flexure(w310(), gr50(), 150.0, 1.5);

    double Mp = 345.0 * 610e3 / 1e6;
    CHECK(r.check == "flexure");
    CHECK(r.zone == FlexureZone::Plastic);
    CHECK(r.governing == FlexureLimitState::Yielding);
    CHECK_THAT(r.Lp, WithinAbs(1.618, 0.005));
    CHECK_THAT(r.Mp, WithinRel(Mp, 1e-12));
    CHECK_THAT(r.Mn, WithinRel(Mp, 1e-12));
    CHECK_THAT(r.capacity, WithinRel(0.9 * Mp, 1e-12));
    CHECK_THAT(r.ratio, WithinRel(150.0 / (0.9 * Mp), 1e-12));
    CHECK(r.ok);
}

TEST_CASE("Unbraced length between Lp and Lr is inelastic LTB", "[Flexure][zones]") {
    FlexureResult r = verify_flexure(w310(), gr50(), 100.0, 3.0);

    CHECK(r.zone == FlexureZone::InelasticLTB);
    CHECK(r.governing == FlexureLimitState::LateralTorsionalBuckling);
    CHECK(r.Lp < 3.0);
    CHECK(r.Lr > 3.0);
    CHECK(r.Mn < r.Mp);
    CHECK(r.Mn > 0.7 * 345.0 * 547e3 / 1e6);
}

TEST_CASE("Unbraced length beyond Lr is elastic LTB with a warning", "[Flexure][zones]") {
    FlexureResult r = verify_flexure(w310(), gr50(), 50.0, 7.0);

    CHECK(r.zone == FlexureZone::ElasticLTB);
    CHECK(r.Lr < 7.0);
    CHECK(r.Mn < 0.7 * 345.0 * 547e3 / 1e6);
    CHECK(r.warnings.contains(WarningCode::LARGE_UNBRACED_LENGTH));
}

TEST_CASE("Nominal moment never increases with unbraced length", "[Flexure][zones]") {
    std::vector<double> lengths = {0.0, 1.0, 1.6, 2.0, 3.0, 4.0, 5.0, 5.5, 7.0, 10.0};
    double previous = std::numeric_limits<double>::infinity();
    for (double Lb : lengths) {
        FlexureResult r = verify_flexure(w310(), gr50(), 10.0, Lb);
        CHECK(r.Mn <= previous + 1e-9);
        previous = r.Mn;
    }
}

TEST_CASE("Cb raises the inelastic moment but not above Mp", "[Flexure][zones]") {
    FlexureResult base = verify_flexure(w310(), gr50(), 100.0, 3.0, 1.0);
    FlexureResult raised = verify_flexure(w310(), gr50(), 100.0, 3.0, 1.14);
    FlexureResult capped = verify_flexure(w310(), gr50(), 100.0, 3.0, 3.0);

    CHECK(raised.Mn > base.Mn);
    CHECK_THAT(capped.Mn, WithinRel(capped.Mp, 1e-12));
}

// =============================================================================
// Catalog W-shapes against published limiting lengths
// =============================================================================

TEST_CASE("Rolled W-shape warping constants equal Iy ho^2 / 4", "[Flexure][catalog]") {
    SectionFilter filter;
    filter.type = SectionType::WideFlange;
    filter.origin = CatalogOrigin::AISC;
    auto shapes = default_sections().filter(filter);

    REQUIRE(shapes.size() == 8);
    for (const SteelSection* s : shapes) {
        INFO(s->id);
        double ho = s->d - s->tf;
        CHECK_THAT(s->Cw, WithinRel(s->Iy * ho * ho / 4.0, 0.01));
    }
}

TEST_CASE("Catalog Lr matches AISC Table 3-2 for Fy = 345 MPa", "[Flexure][catalog]") {
    // W12x26: Lr = 14.9 ft, W8x31: 24.8 ft, W21x44: 13.0 ft
    CHECK_THAT(compute_ltb_limits(w310(), gr50()).Lr / 1000.0, WithinRel(4.54, 0.01));
    CHECK_THAT(compute_ltb_limits(default_sections().get("W200X46"), gr50()).Lr / 1000.0,
               WithinRel(7.56, 0.01));
    CHECK_THAT(compute_ltb_limits(default_sections().get("W530X66"), gr50()).Lr / 1000.0,
               WithinRel(3.96, 0.01));
}

TEST_CASE("W310X39 unbraced over 6 m has the elastic LTB capacity", "[Flexure][catalog]") {
    FlexureResult r = verify_flexure(w310(), gr50(), 50.0, 6.0);

    CHECK(r.zone == FlexureZone::ElasticLTB);
    CHECK_THAT(r.capacity, WithinRel(76.9, 0.005));
}

// =============================================================================
// Continuity at the zone boundaries
// =============================================================================

TEST_CASE("Inelastic LTB equation meets Mp at Lp and Mr at Lr", "[Flexure][continuity]") {
    double Mp = 210.45;
    double Mr = 132.0;
    CHECK_THAT(inelastic_ltb_moment(Mp, Mr, 1.6, 1.6, 5.0, 1.0), WithinRel(Mp, 1e-12));
    CHECK_THAT(inelastic_ltb_moment(Mp, Mr, 5.0, 1.6, 5.0, 1.0), WithinRel(Mr, 1e-12));
}

TEST_CASE("Elastic LTB stress at Lr equals 0.7 Fy", "[Flexure][continuity]") {
    LtbLimits limits = compute_ltb_limits(w310(), gr50());
    double Fcr = elastic_ltb_stress(w310(), gr50(), limits, limits.Lr, 1.0);

    CHECK_THAT(Fcr, WithinRel(0.7 * 345.0, 1e-9));
    CHECK_THAT(limits.c, WithinAbs(1.0, 1e-15));
}

TEST_CASE("Nominal moment is continuous across Lp and Lr", "[Flexure][continuity]") {
    LtbLimits limits = compute_ltb_limits(w310(), gr50());
    double Lp = limits.Lp / 1000.0;
    double Lr = limits.Lr / 1000.0;
    double eps = 1e-7;

    FlexureResult below_p = verify_flexure(w310(), gr50(), 10.0, Lp - eps);
    FlexureResult above_p = verify_flexure(w310(), gr50(), 10.0, Lp + eps);
    CHECK_THAT(above_p.Mn, WithinRel(below_p.Mn, 1e-6));

    FlexureResult below_r = verify_flexure(w310(), gr50(), 10.0, Lr - eps);
    FlexureResult above_r = verify_flexure(w310(), gr50(), 10.0, Lr + eps);
    CHECK(below_r.zone == FlexureZone::InelasticLTB);
    CHECK(above_r.zone == FlexureZone::ElasticLTB);
    CHECK_THAT(above_r.Mn, WithinRel(below_r.Mn, 1e-6));
}

// =============================================================================
// Flange local buckling
// =============================================================================

TEST_CASE("Non-compact flange governs a short W150X22", "[Flexure][flb]") {
    // bf/2tf = 11.5 lies between 0.38 and 1.0 sqrt(E/Fy) at Fy = 345
    const SteelSection& w150 = default_sections().get("W150X22");
    FlexureResult r = verify_flexure(w150, gr50(), 20.0, 0.5);

    CHECK(r.zone == FlexureZone::Plastic);
    CHECK(r.governing == FlexureLimitState::FlangeLocalBuckling);
    CHECK(r.Mn_flb < r.Mp);
    CHECK_THAT(r.Mn, WithinRel(r.Mn_flb, 1e-12));
    CHECK(r.warnings.contains(WarningCode::NONCOMPACT_FLANGE));

    double lambda = 152.0 / (2.0 * 6.6);
    double root = std::sqrt(200000.0 / 345.0);
    double lp = 0.38 * root;
    double lr = 1.0 * root;
    double Mp = 345.0 * w150.Zx;
    double Mr = 0.7 * 345.0 * w150.Sx;
    double expected = (Mp - (Mp - Mr) * (lambda - lp) / (lr - lp)) / 1e6;
    CHECK_THAT(r.Mn_flb, WithinRel(expected, 1e-9));
}

TEST_CASE("Compact flange leaves FLB at Mp", "[Flexure][flb]") {
    FlexureResult r = verify_flexure(w310(), gr50(), 100.0, 1.0);
    CHECK_THAT(r.Mn_flb, WithinRel(r.Mp, 1e-12));
    CHECK_FALSE(r.warnings.contains(WarningCode::NONCOMPACT_FLANGE));
}

// =============================================================================
// Other shapes
// =============================================================================

TEST_CASE("Rectangular HSS bends plastically at any unbraced length", "[Flexure][shapes]") {
    const SteelSection& hss = default_sections().get("HSS152X152X6.4");
    FlexureResult r = verify_flexure(hss, gr50(), 20.0, 8.0);

    CHECK(r.zone == FlexureZone::Plastic);
    CHECK_THAT(r.Mn, WithinRel(345.0 * hss.Zx / 1e6, 1e-12));
    CHECK_THROWS_AS(compute_ltb_limits(hss, gr50()), CheckException);
}

TEST_CASE("Angle flexure is limited to 1.5 My", "[Flexure][shapes]") {
    const SteelSection& angle = default_sections().get("L102X102X9.5");
    FlexureResult braced = verify_flexure(angle, gr50(), 1.0, 0.0);
    FlexureResult long_span = verify_flexure(angle, gr50(), 1.0, 6.0);

    double My = 0.8 * 345.0 * angle.Sx;
    CHECK_THAT(braced.Mn, WithinRel(1.5 * My / 1e6, 1e-12));
    CHECK(long_span.Mn < braced.Mn);
}

TEST_CASE("Minor-axis flexure of an I-shape", "[Flexure][minor]") {
    FlexureResult r = verify_flexure_minor(w310(), gr50(), 10.0);

    double Mn = std::min(345.0 * 134e3, 1.6 * 345.0 * 87.5e3) / 1e6;
    CHECK(r.check == "flexure_minor");
    CHECK_THAT(r.Mn, WithinRel(Mn, 1e-12));
    CHECK_THAT(r.ratio, WithinRel(10.0 / (0.9 * Mn), 1e-12));
}

// =============================================================================
// Design method, tolerance and demand handling
// =============================================================================

TEST_CASE("ASD divides the nominal moment by Omega", "[Flexure][method]") {
    DesignConfig asd;
    asd.method = DesignMethod::ASD;
    FlexureResult r = verify_flexure(w310(), gr50(), 150.0, 1.5, 1.0, asd);

    double Mp = 345.0 * 610e3 / 1e6;
    CHECK(r.method == DesignMethod::ASD);
    CHECK_THAT(r.capacity, WithinRel(Mp / 1.67, 1e-12));
    CHECK_FALSE(r.ok);
}

TEST_CASE("Demand equal to capacity passes", "[Flexure][method]") {
    FlexureResult probe = verify_flexure(w310(), gr50(), 1.0, 1.5);
    FlexureResult exact = verify_flexure(w310(), gr50(), probe.capacity, 1.5);
    CHECK(exact.ok);
    CHECK_THAT(exact.ratio, WithinAbs(1.0, 1e-12));

    FlexureResult over = verify_flexure(w310(), gr50(), probe.capacity * 1.001, 1.5);
    CHECK_FALSE(over.ok);
}

TEST_CASE("Zero moment reports capacity with zone N/A", "[Flexure][demand]") {
    FlexureResult r = verify_flexure(w310(), gr50(), 0.0, 1.5);

    CHECK(r.zone == FlexureZone::NotApplicable);
    CHECK(flexure_zone_to_string(r.zone) == "N/A");
    CHECK_THAT(r.ratio, WithinAbs(0.0, 1e-15));
    CHECK(r.ok);
    CHECK(r.capacity > 0.0);
    CHECK(r.warnings.contains(WarningCode::ZERO_DEMAND));
}

TEST_CASE("Repeated checks give identical results", "[Flexure][demand]") {
    FlexureResult a = verify_flexure(w310(), gr50(), 120.0, 3.3, 1.1);
    FlexureResult b = verify_flexure(w310(), gr50(), 120.0, 3.3, 1.1);
    CHECK(a.ratio == b.ratio);
    CHECK(a.zone == b.zone);
    CHECK(a.details == b.details);
}

TEST_CASE("Invalid flexure input is rejected", "[Flexure][validation]") {
    try {
        verify_flexure(w310(), gr50(), 100.0, -1.0);
        FAIL("expected CheckException");
    } catch (const CheckException& e) {
        CHECK(e.code() == ErrorCode::INVALID_GEOMETRY);
        CHECK(e.error().field == "Lb");
    }

    CHECK_THROWS_AS(verify_flexure(w310(), gr50(), std::nan(""), 1.0), CheckException);
    CHECK_THROWS_AS(verify_flexure(w310(), gr50(), 100.0, 1.0, 0.0), CheckException);

    SteelMaterial bad("BAD", "Bad", -1.0, 400.0);
    CHECK_THROWS_AS(verify_flexure(w310(), bad, 100.0, 1.0), CheckException);
}
