#pragma once

#include "steelcheck/design_config.hpp"

#include <map>
#include <string>
#include <vector>

namespace steelcheck {

/**
 * @brief Load type tags of ASCE 7
 */
enum class LoadType {
    D,      ///< Dead
    L,      ///< Live
    Lr,     ///< Roof live
    S,      ///< Snow
    W,      ///< Wind
    E,      ///< Earthquake
    R,      ///< Rain
    H,      ///< Lateral soil pressure
    F,      ///< Fluid pressure
    T       ///< Self-straining (temperature)
};

/// Tag as written in the combination names ("D", "Lr", ...)
std::string load_type_to_string(LoadType type);

/// Parse a tag; throws CheckException (INVALID_LOAD_TYPE) for unknown tags
LoadType parse_load_type(const std::string& tag);

/// Descriptive label, e.g. "Dead" for D
std::string load_type_label(LoadType type);

/// All recognised load types in declaration order
const std::vector<LoadType>& all_load_types();

/**
 * @brief Unfactored load magnitudes of one analysis, by load type
 *
 * Consistent units (kN, kN/m or kN·m) are the caller's responsibility.
 */
using LoadCaseSet = std::map<LoadType, double>;

/**
 * @brief A load combination rule: factor per load type
 *
 * Alternatives written "(Lr or S or R)" are stored as one factor per tag;
 * their contributions add.
 */
struct LoadCombination {
    std::string name;                       ///< e.g. "1.2D + 1.6L + 0.5(Lr or S or R)"
    std::string description;                ///< Short description
    std::map<LoadType, double> factors;     ///< Factor per load type
};

/// ASCE 7-16 §2.3.1 strength combinations (7 rules)
const std::vector<LoadCombination>& lrfd_combinations();

/// ASCE 7-16 §2.4.1 allowable stress combinations (10 rules)
const std::vector<LoadCombination>& asd_combinations();

/// Catalog of the given design method
const std::vector<LoadCombination>& combinations_for(DesignMethod method);

/**
 * @brief Factored value of one combination
 */
struct CombinationResult {
    std::string name;
    std::string description;
    double value = 0.0;                      ///< Σ factor × load
    std::map<LoadType, double> factors_used; ///< Factors of the non-zero loads only
    size_t catalog_index = 0;                ///< Position in the catalog
};

/**
 * @brief Result of a governing-combination search
 */
struct CombinationSelection {
    DesignMethod method = DesignMethod::LRFD;
    LoadCaseSet loads;                       ///< Unfactored loads as supplied
    CombinationResult governing;             ///< Largest |value|, first in catalog on ties
    std::vector<CombinationResult> all;      ///< Ranked by |value| descending, stable

    /**
     * @brief First n entries of the ranking
     */
    std::vector<CombinationResult> top(size_t n) const;
};

/**
 * @brief Check load magnitudes are admissible
 *
 * Magnitudes must be finite. Gravity and other non-reversible loads must be
 * non-negative; wind (W) and earthquake (E) may be negative to express
 * direction.
 *
 * @throws CheckException (INVALID_LOAD_TYPE)
 */
void validate_loads(const LoadCaseSet& loads);

/**
 * @brief Σ factor × load over the tags of the combination (missing tag = 0)
 */
double apply_combination(const LoadCaseSet& loads, const LoadCombination& combination);

/**
 * @brief Factored value of each supplied load under the combination
 *
 * Loads whose type is absent from the combination get 0.
 */
std::map<LoadType, double> factored_loads(const LoadCaseSet& loads,
                                          const LoadCombination& combination);

/**
 * @brief Evaluate every combination of the method's catalog
 *
 * @return Results ranked by |value| descending; equal magnitudes keep
 *         catalog order
 */
std::vector<CombinationResult> evaluate_combinations(const LoadCaseSet& loads,
                                                     DesignMethod method);

/**
 * @brief Select the governing combination
 *
 * The governing combination produces the largest |factored value|. Ties go
 * to the combination listed first in the catalog, so an empty or all-zero
 * load set selects the first rule ("1.4D" or "D") with value 0.
 *
 * @throws CheckException (INVALID_LOAD_TYPE) if validate_loads fails
 */
CombinationSelection select_governing_combination(const LoadCaseSet& loads,
                                                  DesignMethod method);

/**
 * @brief Convenience overload taking string tags ("D", "L", ...)
 */
CombinationSelection select_governing_combination(const std::map<std::string, double>& loads,
                                                  DesignMethod method);

/**
 * @brief Convert string-keyed loads to a LoadCaseSet
 *
 * @throws CheckException (INVALID_LOAD_TYPE) for unknown tags
 */
LoadCaseSet to_load_case_set(const std::map<std::string, double>& loads);

} // namespace steelcheck
