#pragma once

#include <string>

namespace steelcheck {

/**
 * @brief Design method for available strength
 */
enum class DesignMethod {
    LRFD,   ///< Load and Resistance Factor Design: capacity = φ·Rn
    ASD     ///< Allowable Strength Design: capacity = Rn/Ω
};

std::string design_method_to_string(DesignMethod method);

/// Parse "LRFD" / "ASD"; throws CheckException (UNSUPPORTED_CONFIGURATION) otherwise
DesignMethod parse_design_method(const std::string& method);

/**
 * @brief Resistance factor φ and safety factor Ω of one limit state
 */
struct ResistanceFactor {
    double phi;     ///< LRFD resistance factor
    double omega;   ///< ASD safety factor

    /**
     * @brief Available strength from nominal strength Rn
     */
    double available(double Rn, DesignMethod method) const {
        return method == DesignMethod::LRFD ? phi * Rn : Rn / omega;
    }
};

/**
 * @brief AISC 360-16 resistance and safety factors
 */
namespace resistance {

constexpr ResistanceFactor kFlexure{0.90, 1.67};      ///< F1
constexpr ResistanceFactor kShear{0.90, 1.67};        ///< G1 (single φ for all shapes)
constexpr ResistanceFactor kCompression{0.90, 1.67};  ///< E1
constexpr ResistanceFactor kBolt{0.75, 2.00};         ///< J3.6, J3.7
constexpr ResistanceFactor kBearing{0.75, 2.00};      ///< J3.10
constexpr ResistanceFactor kBlockShear{0.75, 2.00};   ///< J4.3

} // namespace resistance

/**
 * @brief Behaviour for end-condition pairs missing from the K-factor table
 */
enum class KFactorFallback {
    Reject,         ///< Throw UNSUPPORTED_CONFIGURATION
    Conservative    ///< Use the largest tabulated K (2.10)
};

/**
 * @brief Options shared by all checks
 */
struct DesignConfig {
    DesignMethod method = DesignMethod::LRFD;          ///< Design method
    double tolerance = 1e-9;                           ///< ok when ratio <= 1 + tolerance
    KFactorFallback k_factor_fallback = KFactorFallback::Reject;
};

} // namespace steelcheck
