#pragma once

#include "steelcheck/design_config.hpp"

#include <map>
#include <string>
#include <vector>

namespace steelcheck {

/**
 * @brief One serviceability limit span/n
 */
struct DeflectionCheck {
    double denominator = 0.0;   ///< n in L/n
    double limit = 0.0;         ///< span/n [mm]
    double actual = 0.0;        ///< |deflection| [mm]
    double ratio = 0.0;         ///< actual / limit
    bool ok = true;             ///< actual <= limit (within tolerance)
};

/// Denominators checked when none are given
const std::vector<double>& default_deflection_denominators();

/// Key of a limit in the result map, e.g. "L/360"
std::string deflection_limit_name(double denominator);

/**
 * @brief Check a deflection against span/n limits
 *
 * Each limit is independent; no governing limit is selected.
 *
 * @param actual_mm Computed deflection [mm], taken by magnitude
 * @param span_m Span [m], > 0
 * @param denominators Limit denominators, each > 0
 * @return Checks keyed by "L/n"
 * @throws CheckException (INVALID_GEOMETRY, INVALID_DEMAND) on invalid input
 */
std::map<std::string, DeflectionCheck> verify_deflection(
    double actual_mm, double span_m,
    const std::vector<double>& denominators = default_deflection_denominators(),
    const DesignConfig& config = DesignConfig());

} // namespace steelcheck
