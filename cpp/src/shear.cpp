#include "steelcheck/shear.hpp"
#include "steelcheck/errors.hpp"
#include "steelcheck/units.hpp"

#include <cmath>

namespace steelcheck {

double shear_coefficient_cv1(double h_tw, double kv, double E, double Fy) {
    double limit = 1.10 * std::sqrt(kv * E / Fy);
    if (h_tw <= limit) {
        return 1.0;
    }
    return limit / h_tw;
}

double shear_coefficient_cv2(double h_tw, double kv, double E, double Fy) {
    double root = std::sqrt(kv * E / Fy);
    if (h_tw <= 1.10 * root) {
        return 1.0;
    }
    if (h_tw <= 1.37 * root) {
        return 1.10 * root / h_tw;
    }
    return 1.51 * kv * E / (h_tw * h_tw * Fy);
}

ShearResult verify_shear(const SteelSection& section, const SteelMaterial& material,
                         double Vu, const DesignConfig& config) {
    material.validate();
    ShearResult result;
    result.check = "shear";
    result.warnings = section.validate();
    require_finite_demand("Vu", Vu);

    const double E = material.E;
    const double Fy = material.Fy;

    switch (section.type) {
        case SectionType::WideFlange:
        case SectionType::Channel: {
            double h = section.d - 2.0 * section.tf;
            result.Aw = section.d * section.tw;
            result.kv = 5.34;
            result.h_tw = h / section.tw;
            result.Cv = shear_coefficient_cv1(result.h_tw, result.kv, E, Fy);
            break;
        }
        case SectionType::RectangularHollow: {
            double h = section.d - 3.0 * section.t;
            if (h <= 0.0) {
                throw CheckException(CheckError::invalid_geometry("t", section.t,
                    "wall too thick for a shear depth d - 3t"));
            }
            result.Aw = 2.0 * h * section.t;
            result.kv = 5.0;
            result.h_tw = h / section.t;
            result.Cv = shear_coefficient_cv2(result.h_tw, result.kv, E, Fy);
            break;
        }
        case SectionType::RoundHollow:
            result.Aw = section.A / 2.0;
            result.Cv = 1.0;
            break;
        case SectionType::Angle:
            result.Aw = section.d * section.t;
            result.kv = 1.2;
            result.h_tw = section.d / section.t;
            result.Cv = shear_coefficient_cv2(result.h_tw, result.kv, E, Fy);
            break;
    }

    if (result.Cv < 1.0) {
        result.warnings.add(CheckWarning::web_shear_buckling(result.h_tw, result.Cv));
    }

    double Vn = units::to_kN(0.6 * Fy * result.Aw * result.Cv);
    result.details["Aw"] = result.Aw;
    result.details["Cv"] = result.Cv;
    result.details["kv"] = result.kv;
    result.details["h/tw"] = result.h_tw;
    result.details["Vn"] = Vn;

    if (Vu == 0.0) {
        result.warnings.add(CheckWarning::zero_demand(result.check));
    }
    apply_strength(result, Vu, Vn, resistance::kShear, config);
    return result;
}

} // namespace steelcheck
