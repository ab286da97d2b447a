/**
 * @file test_recommendation.cpp
 * @brief C++ tests for section recommendation and comparison
 *
 * Tests include:
 * - Candidates carry the demand and are ordered by weight
 * - Type and origin filters
 * - Request validation
 * - Comparison ordering by closeness to the target ratio
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "steelcheck/recommendation.hpp"
#include "steelcheck/errors.hpp"

#include <cmath>

using namespace steelcheck;
using Catch::Matchers::WithinAbs;

// =============================================================================
// recommend_sections
// =============================================================================

TEST_CASE("Recommended sections carry the moment and are lightest first", "[Recommendation]") {
    RecommendationRequest request;
    request.Mu = 150.0;
    request.Lb = 1.0;
    request.count = 4;

    auto candidates = recommend_sections(request);

    REQUIRE_FALSE(candidates.empty());
    CHECK(candidates.size() <= 4);
    for (size_t i = 0; i < candidates.size(); ++i) {
        CHECK(candidates[i].utilization <= 1.0 + 1e-9);
        CHECK(candidates[i].flexural_capacity >= 150.0);
        CHECK_THAT(candidates[i].utilization,
                   WithinAbs(150.0 / candidates[i].flexural_capacity, 1e-12));
        if (i > 0) {
            CHECK(candidates[i].weight >= candidates[i - 1].weight);
        }
    }
}

TEST_CASE("Type filter keeps only wide-flange shapes", "[Recommendation]") {
    RecommendationRequest request;
    request.Mu = 100.0;
    request.Vu = 80.0;
    request.Lb = 1.0;
    request.type = SectionType::WideFlange;
    request.origin = CatalogOrigin::AISC;
    request.count = 10;

    auto candidates = recommend_sections(request);

    REQUIRE_FALSE(candidates.empty());
    for (const auto& c : candidates) {
        CHECK(c.type == SectionType::WideFlange);
        CHECK(c.origin == CatalogOrigin::AISC);
        CHECK(c.shear_utilization > 0.0);
        CHECK(c.shear_utilization <= 1.0 + 1e-9);
        CHECK(c.meets_target == request.band.contains(c.utilization));
    }
}

TEST_CASE("Request without span or unbraced length assumes a 6 m unbraced span", "[Recommendation]") {
    RecommendationRequest request;
    request.Mu = 120.0;
    request.type = SectionType::WideFlange;
    request.count = 10;

    CHECK_THAT(request.effective_unbraced_length(),
               WithinAbs(kDefaultRecommendationSpan, 1e-15));

    auto candidates = recommend_sections(request);
    REQUIRE_FALSE(candidates.empty());
    const SteelMaterial& mat = default_materials().get(request.material_id);
    for (const auto& c : candidates) {
        INFO(c.section_id);
        // W310X39 carries 120 kN·m only when fully braced
        CHECK(c.section_id != "W310X39");
        CHECK(c.zone != FlexureZone::Plastic);
        FlexureResult check = verify_flexure(default_sections().get(c.section_id), mat,
                                             120.0, 6.0);
        CHECK(check.ok);
        CHECK_THAT(c.utilization, WithinAbs(check.ratio, 1e-12));
    }
}

TEST_CASE("Span is used as unbraced length when Lb is not given", "[Recommendation]") {
    RecommendationRequest request;
    request.Mu = 50.0;
    request.L = 3.0;
    CHECK_THAT(request.effective_unbraced_length(), WithinAbs(3.0, 1e-15));

    request.Lb = 1.0;
    CHECK_THAT(request.effective_unbraced_length(), WithinAbs(1.0, 1e-15));
}

TEST_CASE("Count limits the number of candidates", "[Recommendation]") {
    RecommendationRequest request;
    request.Mu = 20.0;
    request.Lb = 0.5;
    request.count = 2;

    CHECK(recommend_sections(request).size() == 2);
}

TEST_CASE("Demand beyond every section gives no candidates", "[Recommendation]") {
    RecommendationRequest request;
    request.Mu = 1.0e5;
    request.Lb = 1.0;

    CHECK(recommend_sections(request).empty());
}

TEST_CASE("Invalid recommendation requests are rejected", "[Recommendation][validation]") {
    RecommendationRequest request;
    request.Mu = 0.0;
    try {
        recommend_sections(request);
        FAIL("expected CheckException");
    } catch (const CheckException& e) {
        CHECK(e.code() == ErrorCode::INVALID_DEMAND);
        CHECK(e.error().field == "Mu");
    }

    request.Mu = 100.0;
    request.count = 0;
    CHECK_THROWS_AS(recommend_sections(request), CheckException);

    request.count = 5;
    request.band.min = 0.9;
    request.band.max = 0.8;
    CHECK_THROWS_AS(recommend_sections(request), CheckException);
}

TEST_CASE("Unknown material is reported", "[Recommendation][validation]") {
    RecommendationRequest request;
    request.Mu = 100.0;
    request.material_id = "S355";
    try {
        recommend_sections(request);
        FAIL("expected CheckException");
    } catch (const CheckException& e) {
        CHECK(e.code() == ErrorCode::MATERIAL_NOT_FOUND);
    }
}

// =============================================================================
// compare_sections
// =============================================================================

TEST_CASE("Comparison is ordered by closeness to 0.85", "[Recommendation][compare]") {
    auto result = compare_sections({"W310X39", "W530X66", "W410X46"}, 150.0, 100.0, 6.0);

    REQUIRE(result.size() == 3);
    for (size_t i = 1; i < result.size(); ++i) {
        double prev = std::abs(result[i - 1].verification.flexure.ratio - kComparisonTargetRatio);
        double curr = std::abs(result[i].verification.flexure.ratio - kComparisonTargetRatio);
        CHECK(prev <= curr);
    }
    for (const auto& entry : result) {
        CHECK(entry.d > 0.0);
        CHECK(entry.weight > 0.0);
        CHECK_THAT(entry.verification.flexure.Lb, WithinAbs(6.0, 1e-15));
    }
}

TEST_CASE("Comparison rejects unknown sections", "[Recommendation][compare]") {
    try {
        compare_sections({"W310X39", "W999X1"}, 100.0, 50.0, 6.0);
        FAIL("expected CheckException");
    } catch (const CheckException& e) {
        CHECK(e.code() == ErrorCode::SECTION_NOT_FOUND);
    }
}
