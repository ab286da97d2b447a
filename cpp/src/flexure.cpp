#include "steelcheck/flexure.hpp"
#include "steelcheck/errors.hpp"
#include "steelcheck/units.hpp"

#include <algorithm>
#include <cmath>

namespace steelcheck {

namespace {

constexpr double kPi = 3.14159265358979323846;

struct FlangeBuckling {
    double Mn;          // [N·mm]
    double lambda;
    double lambda_p;
    double lambda_r;
};

void check_lengths(double Lb, double Cb) {
    require_non_negative_length("Lb", Lb);
    if (!std::isfinite(Cb) || Cb <= 0.0) {
        throw CheckException(CheckError::invalid_property("Cb", Cb, "Cb must be positive"));
    }
}

/// F3 flange local buckling for I-shapes (bf/2tf) and channels (bf/tf)
FlangeBuckling flange_local_buckling(const SteelSection& s, const SteelMaterial& m,
                                     double Mp, WarningList& warnings) {
    FlangeBuckling flb;
    double root = std::sqrt(m.E / m.Fy);
    flb.lambda = s.type == SectionType::Channel ? s.bf / s.tf : s.bf / (2.0 * s.tf);
    flb.lambda_p = 0.38 * root;
    flb.lambda_r = 1.0 * root;
    flb.Mn = Mp;

    if (flb.lambda <= flb.lambda_p) {
        return flb;
    }

    if (flb.lambda <= flb.lambda_r) {
        double Mr = 0.7 * m.Fy * s.Sx;
        flb.Mn = Mp - (Mp - Mr) * (flb.lambda - flb.lambda_p) / (flb.lambda_r - flb.lambda_p);
        warnings.add(CheckWarning::noncompact_flange(flb.lambda, flb.lambda_p, flb.lambda_r));
    } else {
        double h = s.d - 2.0 * s.tf;
        double kc = std::clamp(4.0 / std::sqrt(h / s.tw), 0.35, 0.76);
        flb.Mn = 0.9 * m.E * kc * s.Sx / (flb.lambda * flb.lambda);
        warnings.add(CheckWarning::slender_flange(flb.lambda, flb.lambda_r));
    }
    flb.Mn = std::min(flb.Mn, Mp);
    return flb;
}

/// Lp, Lr zone logic of F2 [N·mm]
double i_shape_ltb(const SteelSection& s, const SteelMaterial& m, const LtbLimits& limits,
                   double Mp, double Lb_mm, double Cb, FlexureResult& result) {
    if (Lb_mm <= limits.Lp) {
        result.zone = FlexureZone::Plastic;
        return Mp;
    }

    if (Lb_mm <= limits.Lr) {
        result.zone = FlexureZone::InelasticLTB;
        double Mr = 0.7 * m.Fy * s.Sx;
        return std::min(inelastic_ltb_moment(Mp, Mr, Lb_mm, limits.Lp, limits.Lr, Cb), Mp);
    }

    result.zone = FlexureZone::ElasticLTB;
    double Fcr = elastic_ltb_stress(s, m, limits, Lb_mm, Cb);
    result.details["Fcr"] = Fcr;
    result.warnings.add(CheckWarning::large_unbraced_length(units::to_m(Lb_mm),
                                                           units::to_m(limits.Lr)));
    return std::min(Fcr * s.Sx, Mp);
}

/**
 * F10 equal-leg angle about a geometric axis, no lateral-torsional
 * restraint, maximum compression at the toe. My is 0.8 of the geometric
 * yield moment for both yielding and LTB.
 */
double angle_ltb(const SteelSection& s, const SteelMaterial& m, double Lb_mm, double Cb,
                 FlexureResult& result) {
    double My = 0.8 * m.Fy * s.Sx;
    double Mn_yield = 1.5 * My;
    result.details["My"] = units::to_kNm(My);

    if (Lb_mm <= 0.0) {
        result.zone = FlexureZone::Plastic;
        return Mn_yield;
    }

    double b = s.d;
    double t = s.t;
    double slender = Lb_mm * t / (b * b);
    double Mcr = 0.58 * m.E * std::pow(b, 4) * t * Cb / (Lb_mm * Lb_mm)
               * (std::sqrt(1.0 + 0.88 * slender * slender) - 1.0);
    result.details["Mcr"] = units::to_kNm(Mcr);

    double Mn;
    if (My / Mcr <= 1.0) {
        Mn = (1.92 - 1.17 * std::sqrt(My / Mcr)) * My;
        result.zone = FlexureZone::InelasticLTB;
    } else {
        Mn = (0.92 - 0.17 * Mcr / My) * Mcr;
        result.zone = FlexureZone::ElasticLTB;
    }

    if (Mn >= Mn_yield) {
        result.zone = FlexureZone::Plastic;
        return Mn_yield;
    }
    return Mn;
}

void finish(FlexureResult& result, double demand, double Mn_Nmm, const DesignConfig& config) {
    result.Mn = units::to_kNm(Mn_Nmm);
    result.details["Mn"] = result.Mn;
    if (demand <= 0.0) {
        apply_strength(result, 0.0, result.Mn, resistance::kFlexure, config);
        result.zone = FlexureZone::NotApplicable;
        result.warnings.add(CheckWarning::zero_demand(result.check));
    } else {
        apply_strength(result, demand, result.Mn, resistance::kFlexure, config);
    }
}

} // namespace

std::string flexure_zone_to_string(FlexureZone zone) {
    switch (zone) {
        case FlexureZone::NotApplicable: return "N/A";
        case FlexureZone::Plastic: return "plastic";
        case FlexureZone::InelasticLTB: return "inelastic_ltb";
        case FlexureZone::ElasticLTB: return "elastic_ltb";
        default: return "unknown";
    }
}

std::string flexure_limit_state_to_string(FlexureLimitState state) {
    switch (state) {
        case FlexureLimitState::Yielding: return "yielding";
        case FlexureLimitState::LateralTorsionalBuckling: return "lateral_torsional_buckling";
        case FlexureLimitState::FlangeLocalBuckling: return "flange_local_buckling";
        default: return "unknown";
    }
}

LtbLimits compute_ltb_limits(const SteelSection& s, const SteelMaterial& m) {
    if (s.type != SectionType::WideFlange && s.type != SectionType::Channel) {
        throw CheckException(CheckError::unsupported("section_type",
            section_type_to_string(s.type),
            "Lp/Lr are defined for I-shapes and channels only"));
    }
    if (s.J <= 0.0) {
        throw CheckException(CheckError::invalid_property("J", s.J,
            "torsional constant required for lateral-torsional buckling"));
    }
    if (s.Cw <= 0.0) {
        throw CheckException(CheckError::invalid_property("Cw", s.Cw,
            "warping constant required for lateral-torsional buckling"));
    }

    LtbLimits limits;
    double ho = s.ho();
    limits.rts = std::sqrt(std::sqrt(s.Iy * s.Cw) / s.Sx);
    limits.c = s.type == SectionType::Channel ? ho / 2.0 * std::sqrt(s.Iy / s.Cw) : 1.0;
    limits.Lp = 1.76 * s.ry() * std::sqrt(m.E / m.Fy);

    double jc = s.J * limits.c / (s.Sx * ho);
    double stress = 0.7 * m.Fy / m.E;
    limits.Lr = 1.95 * limits.rts * (m.E / (0.7 * m.Fy))
              * std::sqrt(jc + std::sqrt(jc * jc + 6.76 * stress * stress));
    return limits;
}

double inelastic_ltb_moment(double Mp, double Mr, double Lb, double Lp, double Lr, double Cb) {
    return Cb * (Mp - (Mp - Mr) * (Lb - Lp) / (Lr - Lp));
}

double elastic_ltb_stress(const SteelSection& s, const SteelMaterial& m,
                          const LtbLimits& limits, double Lb, double Cb) {
    double ratio = Lb / limits.rts;
    double jc = s.J * limits.c / (s.Sx * s.ho());
    return Cb * kPi * kPi * m.E / (ratio * ratio)
         * std::sqrt(1.0 + 0.078 * jc * ratio * ratio);
}

FlexureResult verify_flexure(const SteelSection& section, const SteelMaterial& material,
                             double Mu, double Lb, double Cb, const DesignConfig& config) {
    material.validate();
    FlexureResult result;
    result.check = "flexure";
    result.warnings = section.validate();
    require_finite_demand("Mu", Mu);
    check_lengths(Lb, Cb);

    result.Lb = Lb;
    result.Cb = Cb;
    double Lb_mm = units::to_mm(Lb);
    double Mp = material.Fy * section.Zx;
    result.Mp = units::to_kNm(Mp);
    result.details["Mp"] = result.Mp;
    result.details["Lb"] = Lb;
    result.details["Cb"] = Cb;

    double Mn_ltb = Mp;
    double Mn_flb = Mp;

    switch (section.type) {
        case SectionType::WideFlange:
        case SectionType::Channel: {
            LtbLimits limits = compute_ltb_limits(section, material);
            result.Lp = units::to_m(limits.Lp);
            result.Lr = units::to_m(limits.Lr);
            result.details["Lp"] = result.Lp;
            result.details["Lr"] = result.Lr;
            result.details["rts"] = limits.rts;
            result.details["c"] = limits.c;

            Mn_ltb = i_shape_ltb(section, material, limits, Mp, Lb_mm, Cb, result);

            FlangeBuckling flb = flange_local_buckling(section, material, Mp, result.warnings);
            Mn_flb = flb.Mn;
            result.details["lambda_f"] = flb.lambda;
            result.details["lambda_pf"] = flb.lambda_p;
            result.details["lambda_rf"] = flb.lambda_r;
            break;
        }
        case SectionType::RectangularHollow:
        case SectionType::RoundHollow:
            // Closed sections do not buckle laterally
            result.zone = FlexureZone::Plastic;
            break;
        case SectionType::Angle:
            Mn_ltb = angle_ltb(section, material, Lb_mm, Cb, result);
            break;
    }

    result.Mn_ltb = units::to_kNm(Mn_ltb);
    result.Mn_flb = units::to_kNm(Mn_flb);
    result.details["Mn_ltb"] = result.Mn_ltb;
    result.details["Mn_flb"] = result.Mn_flb;

    if (Mn_flb < Mn_ltb) {
        result.governing = FlexureLimitState::FlangeLocalBuckling;
    } else if (result.zone == FlexureZone::Plastic) {
        result.governing = FlexureLimitState::Yielding;
    } else {
        result.governing = FlexureLimitState::LateralTorsionalBuckling;
    }

    finish(result, Mu, std::min(Mn_ltb, Mn_flb), config);
    return result;
}

FlexureResult verify_flexure_minor(const SteelSection& section, const SteelMaterial& material,
                                   double Muy, const DesignConfig& config) {
    material.validate();
    FlexureResult result;
    result.check = "flexure_minor";
    result.warnings = section.validate();
    require_finite_demand("Muy", Muy);

    if (section.Zy <= 0.0 || section.Sy <= 0.0) {
        throw CheckException(CheckError::invalid_property("Zy", section.Zy,
            "minor-axis moduli required for minor-axis flexure"));
    }

    double Mp = material.Fy * section.Zy;
    double Mn = Mp;
    switch (section.type) {
        case SectionType::WideFlange:
        case SectionType::Channel:
            Mn = std::min(Mp, 1.6 * material.Fy * section.Sy);
            break;
        case SectionType::RectangularHollow:
        case SectionType::RoundHollow:
            break;
        case SectionType::Angle:
            Mn = 1.5 * material.Fy * section.Sy;
            break;
    }

    result.zone = FlexureZone::Plastic;
    result.governing = FlexureLimitState::Yielding;
    result.Mp = units::to_kNm(Mp);
    result.Mn_ltb = units::to_kNm(Mn);
    result.Mn_flb = units::to_kNm(Mn);
    result.details["Mp"] = result.Mp;

    finish(result, Muy, Mn, config);
    return result;
}

} // namespace steelcheck
