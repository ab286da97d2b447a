#pragma once

#include "steelcheck/design_config.hpp"
#include "steelcheck/warnings.hpp"

#include <map>
#include <string>

namespace steelcheck {

/**
 * @brief Outcome of one limit-state check
 *
 * Created fresh by every check and never mutated afterwards by the library.
 * Specialised results (flexure, compression, bolts, ...) derive from it and
 * add the branch they took and its inputs.
 */
struct VerificationResult {
    std::string check;          ///< Limit state name ("flexure", "shear", ...)
    DesignMethod method = DesignMethod::LRFD;
    double demand = 0.0;        ///< Demand magnitude [kN, kN·m or dimensionless]
    double nominal = 0.0;       ///< Nominal strength Rn
    double capacity = 0.0;      ///< Available strength φRn or Rn/Ω
    double phi = 0.0;           ///< Resistance factor used (LRFD)
    double omega = 0.0;         ///< Safety factor used (ASD)
    double ratio = 0.0;         ///< demand / capacity
    double utilization = 0.0;   ///< ratio × 100, unclamped
    bool ok = true;             ///< ratio <= 1 within tolerance

    /// Formula-specific intermediate values for reporting
    std::map<std::string, double> details;

    /// Non-fatal observations made during the check
    WarningList warnings;

    /**
     * @brief Utilisation clamped to [0, 999.9] for display
     */
    double display_utilization() const;

    /**
     * @brief Get formatted result for display
     */
    std::string to_string() const;
};

/**
 * @brief |demand| / capacity
 *
 * Returns 0 for zero demand and +infinity for a positive demand against a
 * non-positive capacity.
 */
double demand_ratio(double demand, double capacity);

/**
 * @brief ratio <= 1 + tolerance
 */
bool within_capacity(double ratio, double tolerance);

/**
 * @brief Fill the common fields of a result from demand and nominal strength
 *
 * @param result Result to fill (check name and details are left untouched)
 * @param demand Demand magnitude
 * @param Rn Nominal strength
 * @param factor Resistance/safety factor of the limit state
 * @param config Design method and tolerance
 */
void apply_strength(VerificationResult& result, double demand, double Rn,
                    const ResistanceFactor& factor, const DesignConfig& config);

/**
 * @brief Fill ratio, utilization and ok from an already computed ratio
 */
void apply_ratio(VerificationResult& result, double ratio, const DesignConfig& config);

// === Input checks shared by the limit states ===

/// Throws CheckException (INVALID_DEMAND) if value is NaN or infinite
void require_finite_demand(const std::string& field, double value);

/// Throws CheckException (INVALID_GEOMETRY) unless value > 0 and finite
void require_positive_length(const std::string& field, double value);

/// Throws CheckException (INVALID_GEOMETRY) unless value >= 0 and finite
void require_non_negative_length(const std::string& field, double value);

} // namespace steelcheck
