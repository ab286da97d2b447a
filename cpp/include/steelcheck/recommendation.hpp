#pragma once

#include "steelcheck/design_config.hpp"
#include "steelcheck/flexure.hpp"
#include "steelcheck/material.hpp"
#include "steelcheck/member_checks.hpp"
#include "steelcheck/section_catalog.hpp"

#include <optional>
#include <string>
#include <vector>

namespace steelcheck {

/**
 * @brief Target utilisation range of a recommendation
 */
struct UtilizationBand {
    double min = 0.70;
    double max = 0.95;

    double midpoint() const { return 0.5 * (min + max); }

    bool contains(double utilization) const {
        return utilization >= min && utilization <= max;
    }
};

/// Span assumed for the flexural check when neither L nor Lb is given [m]
constexpr double kDefaultRecommendationSpan = 6.0;

/**
 * @brief Inputs of a section recommendation
 *
 * The flexural check uses Lb when given, otherwise L, otherwise
 * kDefaultRecommendationSpan unbraced.
 */
struct RecommendationRequest {
    double Mu = 0.0;                        ///< Required moment [kN·m], > 0
    std::optional<double> Vu;               ///< Required shear [kN]
    std::optional<double> L;                ///< Span [m]
    std::optional<double> Lb;               ///< Unbraced length [m]
    double Cb = 1.0;                        ///< Moment gradient factor
    std::string material_id = "A572_GR50";  ///< Material identifier
    std::optional<SectionType> type;        ///< Shape family filter
    std::optional<CatalogOrigin> origin;    ///< Catalog filter
    size_t count = 5;                       ///< Number of candidates to return
    UtilizationBand band;                   ///< Target utilisation band
    DesignConfig config;                    ///< Design method and tolerance

    /// Unbraced length used for the flexure check [m]
    double effective_unbraced_length() const;

    /**
     * @brief Single validation pass over the request
     *
     * @throws CheckException (INVALID_DEMAND, INVALID_GEOMETRY, INVALID_PROPERTY)
     */
    void validate() const;
};

/**
 * @brief A section that satisfies the demand
 */
struct SectionCandidate {
    std::string section_id;
    SectionType type = SectionType::WideFlange;
    CatalogOrigin origin = CatalogOrigin::AISC;
    double weight = 0.0;                ///< [kg/m]
    double flexural_capacity = 0.0;     ///< φMn or Mn/Ω [kN·m]
    double shear_capacity = 0.0;        ///< φVn or Vn/Ω [kN]
    double utilization = 0.0;           ///< Mu / flexural capacity
    double shear_utilization = 0.0;     ///< Vu / shear capacity (0 without Vu)
    FlexureZone zone = FlexureZone::Plastic;
    bool meets_target = false;          ///< utilization inside the band
};

/**
 * @brief Rank catalog sections able to carry the demand
 *
 * Keeps sections whose flexural capacity is at least Mu and, when Vu is
 * given, whose shear capacity is at least Vu. Candidates are ordered by
 * weight, then by distance of the utilisation to the band midpoint, then
 * by catalog order.
 *
 * @return Up to request.count candidates
 * @throws CheckException on an invalid request or unknown material
 */
std::vector<SectionCandidate> recommend_sections(
    const RecommendationRequest& request,
    const SectionCatalog& catalog = default_sections(),
    const MaterialCatalog& materials = default_materials());

/**
 * @brief One entry of a section comparison
 */
struct SectionComparison {
    std::string section_id;
    SectionType type = SectionType::WideFlange;
    CatalogOrigin origin = CatalogOrigin::AISC;
    double weight = 0.0;
    double d = 0.0;
    BeamCheckResult verification;
};

/// Flexural ratio that compare_sections treats as the ideal
constexpr double kComparisonTargetRatio = 0.85;

/**
 * @brief Verify several sections as beams under the same demand
 *
 * @return Comparisons ordered by |flexure ratio − 0.85|
 * @throws CheckException (SECTION_NOT_FOUND, MATERIAL_NOT_FOUND) for unknown ids
 */
std::vector<SectionComparison> compare_sections(
    const std::vector<std::string>& section_ids, double Mu, double Vu, double L,
    const std::string& material_id = "A572_GR50",
    const DesignConfig& config = DesignConfig(),
    const SectionCatalog& catalog = default_sections(),
    const MaterialCatalog& materials = default_materials());

} // namespace steelcheck
