#pragma once

#include "steelcheck/compression.hpp"
#include "steelcheck/flexure.hpp"
#include "steelcheck/verification_result.hpp"

#include <string>

namespace steelcheck {

/**
 * @brief Interaction equation of AISC H1.1
 */
enum class InteractionEquation {
    H1_1a,  ///< Pr/Pc >= 0.2
    H1_1b   ///< Pr/Pc < 0.2
};

/// "H1-1a" or "H1-1b"
std::string interaction_equation_to_string(InteractionEquation equation);

/// Axial ratio at which H1-1a takes over
constexpr double kInteractionAxialThreshold = 0.2;

/**
 * @brief Equation selected by the axial ratio (H1-1a applies at exactly 0.2)
 */
InteractionEquation select_interaction_equation(double Pr_Pc);

/**
 * @brief Value of one interaction equation
 *
 * @param Mr_Mc Sum of the flexural ratios Mrx/Mcx + Mry/Mcy
 */
double interaction_value(InteractionEquation equation, double Pr_Pc, double Mr_Mc);

/**
 * @brief Result of an axial-flexure interaction check
 *
 * ratio equals the interaction value; demand and capacity are the value
 * and 1.0.
 */
struct InteractionResult : public VerificationResult {
    InteractionEquation equation = InteractionEquation::H1_1b;
    double Pr_Pc = 0.0;     ///< Axial ratio
    double Mrx_Mcx = 0.0;   ///< Major-axis flexural ratio
    double Mry_Mcy = 0.0;   ///< Minor-axis flexural ratio (0 if not checked)
    double value = 0.0;     ///< Interaction value
};

/**
 * @brief Combined compression and major-axis flexure (AISC H1-1)
 *
 * Pr/Pc and Mr/Mc are the ratios of the component checks, which must use
 * the same design method.
 *
 * @throws CheckException (UNSUPPORTED_CONFIGURATION) if the design methods differ
 */
InteractionResult verify_interaction(const CompressionResult& compression,
                                     const FlexureResult& flexure,
                                     const DesignConfig& config = DesignConfig());

/**
 * @brief Combined compression and biaxial flexure (AISC H1-1)
 */
InteractionResult verify_interaction(const CompressionResult& compression,
                                     const FlexureResult& flexure,
                                     const FlexureResult& minor_flexure,
                                     const DesignConfig& config = DesignConfig());

} // namespace steelcheck
