#pragma once

#include "steelcheck/design_config.hpp"
#include "steelcheck/material.hpp"
#include "steelcheck/section.hpp"
#include "steelcheck/verification_result.hpp"

#include <optional>
#include <string>

namespace steelcheck {

/**
 * @brief Support condition at one end of a member
 */
enum class EndCondition {
    Fixed,
    Pinned,
    Free,
    Roller
};

std::string end_condition_to_string(EndCondition condition);

/// Parse "fixed", "pinned", "free" or "roller" (case-insensitive)
EndCondition parse_end_condition(const std::string& name);

/**
 * @brief Buckling branch of AISC E3
 */
enum class BucklingMode {
    Inelastic,  ///< Fcr = 0.658^(Fy/Fe)·Fy
    Elastic     ///< Fcr = 0.877·Fe
};

std::string buckling_mode_to_string(BucklingMode mode);

/**
 * @brief Axis with the larger slenderness
 */
enum class BucklingAxis {
    Major,  ///< x
    Minor   ///< y
};

/// Largest tabulated effective length factor
constexpr double kMaxTabulatedK = 2.10;

/// Slenderness above which a SLENDERNESS_LIMIT warning is issued
constexpr double kSlendernessLimit = 200.0;

/**
 * @brief Effective length factor from the end-condition table
 *
 * The table is symmetric in its arguments: fixed-fixed 0.65,
 * fixed-pinned 0.80, fixed-free 2.10, pinned-pinned 1.00, pinned-free 2.10.
 *
 * @return K, or std::nullopt for pairs not in the table
 */
std::optional<double> lookup_effective_length_factor(EndCondition end_i, EndCondition end_j);

/**
 * @brief Effective length factor with a fallback policy for unlisted pairs
 *
 * @throws CheckException (UNSUPPORTED_CONFIGURATION) for an unlisted pair
 *         when fallback is KFactorFallback::Reject
 */
double effective_length_factor(EndCondition end_i, EndCondition end_j,
                               KFactorFallback fallback = KFactorFallback::Reject);

/// Euler buckling stress π²E/λ² [MPa]
double euler_stress(double E, double slenderness);

/// Inelastic critical stress E3-2: 0.658^(Fy/Fe)·Fy [MPa]
double inelastic_critical_stress(double Fy, double Fe);

/// Elastic critical stress E3-3: 0.877·Fe [MPa]
double elastic_critical_stress(double Fe);

/// Slenderness at the inelastic/elastic boundary, 4.71·sqrt(E/Fy)
double inelastic_slenderness_limit(double E, double Fy);

/**
 * @brief Result of a compression check (AISC E3)
 */
struct CompressionResult : public VerificationResult {
    double K = 1.0;                     ///< Effective length factor
    double Lx = 0.0;                    ///< Major-axis unbraced length [m]
    double Ly = 0.0;                    ///< Minor-axis unbraced length [m]
    double slenderness_x = 0.0;         ///< K·Lx/rx
    double slenderness_y = 0.0;         ///< K·Ly/ry
    double slenderness = 0.0;           ///< Governing K·L/r
    BucklingAxis axis = BucklingAxis::Minor;
    double Fe = 0.0;                    ///< Euler stress [MPa]
    double Fcr = 0.0;                   ///< Critical stress [MPa]
    BucklingMode mode = BucklingMode::Inelastic;
    double Pn = 0.0;                    ///< Nominal strength [kN]
};

/**
 * @brief Flexural buckling check of a compression member
 *
 * Pu is positive in compression. Pu <= 0 is treated as no compression
 * demand (ratio 0); the capacity is still reported.
 *
 * @param Pu Required axial strength [kN]
 * @param K Effective length factor, > 0
 * @param Lx Major-axis unbraced length [m], > 0
 * @param Ly Minor-axis unbraced length [m], > 0
 * @throws CheckException on invalid section, material, demand or geometry
 */
CompressionResult verify_compression(const SteelSection& section, const SteelMaterial& material,
                                     double Pu, double K, double Lx, double Ly,
                                     const DesignConfig& config = DesignConfig());

/**
 * @brief Compression check with K taken from the end conditions
 *
 * Unlisted end-condition pairs follow config.k_factor_fallback.
 */
CompressionResult verify_compression(const SteelSection& section, const SteelMaterial& material,
                                     double Pu, EndCondition end_i, EndCondition end_j,
                                     double Lx, double Ly,
                                     const DesignConfig& config = DesignConfig());

} // namespace steelcheck
