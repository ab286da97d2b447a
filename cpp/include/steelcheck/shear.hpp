#pragma once

#include "steelcheck/design_config.hpp"
#include "steelcheck/material.hpp"
#include "steelcheck/section.hpp"
#include "steelcheck/verification_result.hpp"

namespace steelcheck {

/**
 * @brief Result of a shear check (AISC Chapter G)
 */
struct ShearResult : public VerificationResult {
    double Aw = 0.0;        ///< Shear area [mm²]
    double Cv = 1.0;        ///< Web shear strength coefficient (Cv1 or Cv2)
    double kv = 0.0;        ///< Plate buckling coefficient (0 for round HSS)
    double h_tw = 0.0;      ///< Web slenderness h/tw or h/t
};

/**
 * @brief Web shear buckling coefficient Cv1 (AISC G2-3, G2-4)
 *
 * @param h_tw Web slenderness
 * @param kv Plate buckling coefficient
 */
double shear_coefficient_cv1(double h_tw, double kv, double E, double Fy);

/**
 * @brief Web shear buckling coefficient Cv2 (AISC G2-9 to G2-11)
 */
double shear_coefficient_cv2(double h_tw, double kv, double E, double Fy);

/**
 * @brief Shear check Vn = 0.6·Fy·Aw·Cv
 *
 * - I-shapes and channels: Aw = d·tw, h = d − 2tf, Cv1 with kv = 5.34
 * - Rectangular HSS: Aw = 2·h·t, h = d − 3t, Cv2 with kv = 5
 * - Round HSS: Aw = A/2, shear yielding (Cv = 1)
 * - Angles: Aw = b·t, Cv2 with kv = 1.2
 *
 * φ = 0.90 and Ω = 1.67 for every shape.
 *
 * @param Vu Required shear [kN], taken by magnitude
 * @throws CheckException on invalid section, material or demand
 */
ShearResult verify_shear(const SteelSection& section, const SteelMaterial& material,
                         double Vu, const DesignConfig& config = DesignConfig());

} // namespace steelcheck
