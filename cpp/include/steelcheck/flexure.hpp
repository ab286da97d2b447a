#pragma once

#include "steelcheck/design_config.hpp"
#include "steelcheck/material.hpp"
#include "steelcheck/section.hpp"
#include "steelcheck/verification_result.hpp"

#include <string>

namespace steelcheck {

/**
 * @brief Lateral-torsional buckling zone of a flexure check
 */
enum class FlexureZone {
    NotApplicable,  ///< No moment demand
    Plastic,        ///< Lb <= Lp (or LTB does not apply): Mn = Mp
    InelasticLTB,   ///< Lp < Lb <= Lr
    ElasticLTB      ///< Lb > Lr
};

/**
 * @brief Limit state giving the lowest nominal moment
 */
enum class FlexureLimitState {
    Yielding,
    LateralTorsionalBuckling,
    FlangeLocalBuckling
};

/// "N/A", "plastic", "inelastic_ltb", "elastic_ltb"
std::string flexure_zone_to_string(FlexureZone zone);

std::string flexure_limit_state_to_string(FlexureLimitState state);

/**
 * @brief Limiting unbraced lengths of F2 and the constants they use
 *
 * Lengths in mm. For closed sections Lp and Lr are reported as 0 since
 * lateral-torsional buckling does not apply.
 */
struct LtbLimits {
    double Lp = 0.0;    ///< Plastic limit [mm]
    double Lr = 0.0;    ///< Inelastic limit [mm]
    double rts = 0.0;   ///< Effective radius of gyration [mm]
    double c = 1.0;     ///< 1 for I-shapes, ho/2·sqrt(Iy/Cw) for channels
};

/**
 * @brief Result of a major-axis flexure check
 *
 * Moments in kN·m, lengths in m.
 */
struct FlexureResult : public VerificationResult {
    FlexureZone zone = FlexureZone::NotApplicable;
    FlexureLimitState governing = FlexureLimitState::Yielding;
    double Mp = 0.0;        ///< Plastic moment Fy·Zx
    double Mn_ltb = 0.0;    ///< Nominal moment from yielding/LTB
    double Mn_flb = 0.0;    ///< Nominal moment from flange local buckling (Mp if not applicable)
    double Mn = 0.0;        ///< min(Mn_ltb, Mn_flb)
    double Lb = 0.0;        ///< Unbraced length
    double Lp = 0.0;        ///< Plastic limit length
    double Lr = 0.0;        ///< Inelastic limit length
    double Cb = 1.0;        ///< Moment gradient factor
};

/**
 * @brief Compute Lp, Lr, rts and c of an I-shape or channel (AISC F2)
 *
 * @throws CheckException (UNSUPPORTED_CONFIGURATION) for closed sections and angles
 */
LtbLimits compute_ltb_limits(const SteelSection& section, const SteelMaterial& material);

/**
 * @brief Inelastic LTB moment F2-2 before capping at Mp
 *
 * Cb·[Mp − (Mp − Mr)(Lb − Lp)/(Lr − Lp)] with Mr = 0.7·Fy·Sx. Any consistent
 * units.
 */
double inelastic_ltb_moment(double Mp, double Mr, double Lb, double Lp, double Lr, double Cb);

/**
 * @brief Elastic LTB critical stress F2-4 [MPa]
 *
 * @param Lb Unbraced length [mm] (must be > 0)
 */
double elastic_ltb_stress(const SteelSection& section, const SteelMaterial& material,
                          const LtbLimits& limits, double Lb, double Cb);

/**
 * @brief Major-axis flexure check (AISC Chapter F)
 *
 * I-shapes and channels: yielding and lateral-torsional buckling (F2)
 * plus flange local buckling (F3). Rectangular and round HSS: plastic
 * moment (F7/F8, LTB does not apply). Equal-leg angles: F10 yielding and
 * LTB about the geometric axis with the toe in compression.
 *
 * Mu is a demand magnitude. Mu <= 0 gives zone NotApplicable with ratio 0;
 * the capacity is still reported.
 *
 * @param section Cross-section
 * @param material Steel grade
 * @param Mu Required moment [kN·m]
 * @param Lb Unbraced length [m], >= 0
 * @param Cb Moment gradient factor, > 0
 * @param config Design method and tolerance
 * @throws CheckException on invalid section, material, demand or geometry
 */
FlexureResult verify_flexure(const SteelSection& section, const SteelMaterial& material,
                             double Mu, double Lb, double Cb = 1.0,
                             const DesignConfig& config = DesignConfig());

/**
 * @brief Minor-axis flexure check (AISC F6, F7, F8, F10)
 *
 * I-shapes and channels: Mn = min(Fy·Zy, 1.6·Fy·Sy). HSS: Fy·Zy.
 * Angles: 1.5·Fy·Sy.
 *
 * @param Muy Required minor-axis moment [kN·m]
 */
FlexureResult verify_flexure_minor(const SteelSection& section, const SteelMaterial& material,
                                   double Muy, const DesignConfig& config = DesignConfig());

} // namespace steelcheck
