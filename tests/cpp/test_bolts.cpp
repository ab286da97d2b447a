/**
 * @file test_bolts.cpp
 * @brief C++ tests for bolted connections (AISC J3) and block shear (J4.3)
 *
 * Tests include:
 * - Bolt shear and tension for ASTM and ISO grades
 * - Combined tension and shear with the reduced stress F'nt
 * - Bearing and tear-out for standard, oversized and slotted holes
 * - Block shear rupture with uniform and non-uniform tension
 * - Catalog lookups and invalid input
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "steelcheck/bolts.hpp"
#include "steelcheck/errors.hpp"

#include <algorithm>

using namespace steelcheck;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

// =============================================================================
// Catalog
// =============================================================================

TEST_CASE("Bolt grades and sizes are looked up case-insensitively", "[Bolts][catalog]") {
    const BoltGrade& a325 = get_bolt_grade("a325");
    CHECK(a325.id == "A325");
    CHECK_THAT(a325.Fnv, WithinAbs(372.0, 1e-12));

    const BoltSize& m20 = get_bolt_size("m20");
    CHECK_THAT(m20.Ab, WithinAbs(314.0, 1e-12));
    CHECK_THAT(m20.hole_standard, WithinAbs(22.0, 1e-12));

    CHECK(bolt_grades().size() == 5);
    CHECK(bolt_diameters().size() == 12);
}

TEST_CASE("Unknown grade or size raises a not-found error", "[Bolts][catalog]") {
    try {
        verify_bolt_shear("A999", "M20", 4, 100.0);
        FAIL("expected CheckException");
    } catch (const CheckException& e) {
        CHECK(e.code() == ErrorCode::BOLT_GRADE_NOT_FOUND);
    }

    try {
        verify_bolt_shear("A325", "M21", 4, 100.0);
        FAIL("expected CheckException");
    } catch (const CheckException& e) {
        CHECK(e.code() == ErrorCode::BOLT_DIAMETER_NOT_FOUND);
    }
}

TEST_CASE("Hole dimensions by hole type", "[Bolts][catalog]") {
    const BoltSize& m20 = get_bolt_size("M20");
    CHECK_THAT(hole_dimension(m20, HoleType::Standard), WithinAbs(22.0, 1e-12));
    CHECK_THAT(hole_dimension(m20, HoleType::Oversized), WithinAbs(24.0, 1e-12));
    CHECK_THAT(hole_dimension(m20, HoleType::ShortSlotted), WithinAbs(26.0, 1e-12));
    CHECK_THAT(hole_dimension(m20, HoleType::LongSlottedTransverse), WithinAbs(22.0, 1e-12));

    CHECK(parse_hole_type("ovs") == HoleType::Oversized);
    CHECK(hole_type_to_string(HoleType::LongSlottedTransverse) == "LSL_T");
    CHECK_THROWS_AS(parse_hole_type("LSL"), CheckException);
}

// =============================================================================
// Shear and tension
// =============================================================================

TEST_CASE("Four A325 M20 bolts in single shear", "[Bolts][shear]") {
    BoltCheckResult r = verify_bolt_shear("A325", "M20", 4, 100.0);

    double Rn = 372.0 * 314.0 * 4.0 / 1000.0;
    CHECK(r.check == "bolt_shear");
    CHECK_THAT(r.nominal, WithinRel(Rn, 1e-12));
    CHECK_THAT(r.nominal, WithinAbs(467.232, 1e-9));
    CHECK_THAT(r.capacity, WithinAbs(350.424, 1e-9));
    CHECK_THAT(r.ratio, WithinAbs(0.28537, 1e-5));
    CHECK(r.ok);
}

TEST_CASE("Double shear doubles the strength", "[Bolts][shear]") {
    BoltCheckResult single = verify_bolt_shear("A325", "M20", 4, 100.0, 1);
    BoltCheckResult dbl = verify_bolt_shear("A325", "M20", 4, 100.0, 2);
    CHECK_THAT(dbl.nominal, WithinRel(2.0 * single.nominal, 1e-12));
    CHECK_THAT(dbl.ratio, WithinRel(single.ratio / 2.0, 1e-12));
}

TEST_CASE("ASD bolt shear uses Omega = 2.0", "[Bolts][shear]") {
    DesignConfig asd;
    asd.method = DesignMethod::ASD;
    BoltCheckResult r = verify_bolt_shear("8.8", "M16", 2, 50.0, 1, asd);

    double Rn = 372.0 * 201.0 * 2.0 / 1000.0;
    CHECK_THAT(r.capacity, WithinRel(Rn / 2.0, 1e-12));
}

TEST_CASE("Bolt tension uses Fnt", "[Bolts][tension]") {
    BoltCheckResult r = verify_bolt_tension("A325", "M20", 4, 200.0);

    double Rn = 620.0 * 314.0 * 4.0 / 1000.0;
    CHECK(r.check == "bolt_tension");
    CHECK_THAT(r.nominal, WithinRel(Rn, 1e-12));
    CHECK_THAT(r.ratio, WithinRel(200.0 / (0.75 * Rn), 1e-12));
}

TEST_CASE("Invalid bolt counts are rejected", "[Bolts][validation]") {
    CHECK_THROWS_AS(verify_bolt_shear("A325", "M20", 0, 100.0), CheckException);
    CHECK_THROWS_AS(verify_bolt_shear("A325", "M20", 4, 100.0, 0), CheckException);
}

// =============================================================================
// Combined tension and shear
// =============================================================================

TEST_CASE("Reduced tensile stress is limited to [0, Fnt]", "[Bolts][combined]") {
    const BoltGrade& a325 = get_bolt_grade("A325");
    CHECK_THAT(reduced_tensile_stress(a325, 0.0, DesignMethod::LRFD), WithinAbs(620.0, 1e-12));
    CHECK_THAT(reduced_tensile_stress(a325, 1000.0, DesignMethod::LRFD), WithinAbs(0.0, 1e-12));

    double frv = 200.0;
    double lrfd = 1.3 * 620.0 - 620.0 / (0.75 * 372.0) * frv;
    double asd = 1.3 * 620.0 - 2.0 * 620.0 / 372.0 * frv;
    CHECK_THAT(reduced_tensile_stress(a325, frv, DesignMethod::LRFD), WithinRel(lrfd, 1e-12));
    CHECK_THAT(reduced_tensile_stress(a325, frv, DesignMethod::ASD), WithinRel(asd, 1e-12));
}

TEST_CASE("Combined check with significant shear", "[Bolts][combined]") {
    BoltCombinedResult r = verify_bolt_combined("A325", "M20", 4, 300.0, 200.0);

    double frv = 300.0e3 / (314.0 * 4.0);
    double Fnt_prime = 1.3 * 620.0 - 620.0 / (0.75 * 372.0) * frv;
    double Rn = Fnt_prime * 314.0 * 4.0 / 1000.0;

    CHECK(r.check == "bolt_combined");
    CHECK_THAT(r.frv, WithinRel(frv, 1e-12));
    CHECK_THAT(r.Fnt_prime, WithinRel(Fnt_prime, 1e-12));
    CHECK_THAT(r.nominal, WithinRel(Rn, 1e-12));
    CHECK_THAT(r.interaction, WithinRel(200.0 / (0.75 * Rn), 1e-12));
    CHECK(r.shear_check.ok);
    CHECK(r.tension_check.ok);
    CHECK(r.ok);
}

TEST_CASE("Combined check fails when shear alone fails", "[Bolts][combined]") {
    BoltCombinedResult r = verify_bolt_combined("A325", "M20", 1, 200.0, 1.0);
    CHECK_FALSE(r.shear_check.ok);
    CHECK_FALSE(r.ok);
}

// =============================================================================
// Bearing and tear-out
// =============================================================================

TEST_CASE("Bearing of three bolts in a line", "[Bolts][bearing]") {
    // t = 10 mm, Fu = 400 MPa, M20 in standard holes, Le = 40 mm, s = 70 mm
    BearingResult r = verify_bolt_bearing(10.0, 400.0, "M20", 3, 300.0, 40.0, 70.0);

    CHECK(r.check == "bolt_bearing");
    CHECK_THAT(r.dh, WithinAbs(22.0, 1e-12));
    CHECK_THAT(r.lc_edge, WithinAbs(29.0, 1e-12));
    CHECK_THAT(r.lc_interior, WithinAbs(48.0, 1e-12));

    // Edge bolt tears out, interior bolts reach the bearing limit
    CHECK_THAT(r.Rn_edge, WithinRel(1.2 * 29.0 * 10.0 * 400.0 / 1000.0, 1e-12));
    CHECK_THAT(r.Rn_interior, WithinRel(2.4 * 20.0 * 10.0 * 400.0 / 1000.0, 1e-12));
    CHECK_THAT(r.nominal, WithinRel(139.2 + 2.0 * 192.0, 1e-12));
    CHECK_THAT(r.capacity, WithinRel(0.75 * 523.2, 1e-12));
    CHECK(r.ok);
}

TEST_CASE("Oversized holes reduce the clear distance", "[Bolts][bearing]") {
    BearingResult std_hole = verify_bolt_bearing(10.0, 400.0, "M20", 1, 50.0, 40.0, 0.0);
    BearingResult ovs = verify_bolt_bearing(10.0, 400.0, "M20", 1, 50.0, 40.0, 0.0,
                                            HoleType::Oversized);
    CHECK_THAT(ovs.lc_edge, WithinAbs(28.0, 1e-12));
    CHECK(ovs.nominal < std_hole.nominal);
}

TEST_CASE("Long slots transverse to the load use reduced coefficients", "[Bolts][bearing]") {
    BearingResult r = verify_bolt_bearing(10.0, 400.0, "M20", 1, 50.0, 40.0, 0.0,
                                          HoleType::LongSlottedTransverse);
    double expected = std::min(1.0 * 29.0 * 10.0 * 400.0, 2.0 * 20.0 * 10.0 * 400.0) / 1000.0;
    CHECK_THAT(r.Rn_edge, WithinRel(expected, 1e-12));
}

TEST_CASE("Edge distance inside the hole is rejected", "[Bolts][bearing]") {
    try {
        verify_bolt_bearing(10.0, 400.0, "M20", 2, 50.0, 10.0, 70.0);
        FAIL("expected CheckException");
    } catch (const CheckException& e) {
        CHECK(e.code() == ErrorCode::INVALID_GEOMETRY);
        CHECK(e.error().field == "edge_distance");
    }

    CHECK_THROWS_AS(verify_bolt_bearing(10.0, 400.0, "M20", 2, 50.0, 40.0, 20.0), CheckException);
}

// =============================================================================
// Block shear
// =============================================================================

TEST_CASE("Block shear governed by shear yielding", "[Bolts][block_shear]") {
    BlockShearGeometry g{2000.0, 1500.0, 500.0};
    VerificationResult r = verify_block_shear(g, 250.0, 400.0, 300.0);

    // rupture path 560 kN, yield path 500 kN
    CHECK(r.check == "block_shear");
    CHECK_THAT(r.nominal, WithinRel(500.0, 1e-12));
    CHECK_THAT(r.capacity, WithinRel(375.0, 1e-12));
    CHECK_THAT(r.details.at("Rn_shear_rupture"), WithinRel(560.0, 1e-12));
    CHECK_THAT(r.details.at("shear_rupture"), WithinAbs(0.0, 1e-15));
    CHECK_THAT(r.ratio, WithinRel(0.8, 1e-12));
}

TEST_CASE("Block shear with non-uniform tension", "[Bolts][block_shear]") {
    BlockShearGeometry g{2000.0, 1500.0, 500.0, 0.5};
    VerificationResult r = verify_block_shear(g, 250.0, 400.0);

    CHECK_THAT(r.nominal, WithinRel(400.0, 1e-12));
    CHECK_THAT(r.ratio, WithinAbs(0.0, 1e-15));
}

TEST_CASE("Inconsistent block shear areas are rejected", "[Bolts][block_shear]") {
    BlockShearGeometry g{1000.0, 1500.0, 500.0};
    CHECK_THROWS_AS(verify_block_shear(g, 250.0, 400.0), CheckException);

    BlockShearGeometry bad_ubs{2000.0, 1500.0, 500.0, 0.3};
    CHECK_THROWS_AS(verify_block_shear(bad_ubs, 250.0, 400.0), CheckException);
}
