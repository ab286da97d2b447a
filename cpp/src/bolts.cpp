#include "steelcheck/bolts.hpp"
#include "steelcheck/errors.hpp"
#include "steelcheck/units.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace steelcheck {

namespace {

std::string upper(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    return out;
}

void check_bolt_count(int num_bolts, int shear_planes) {
    if (num_bolts < 1) {
        throw CheckException(CheckError::invalid_geometry("num_bolts", num_bolts,
            "at least one bolt is required"));
    }
    if (shear_planes < 1) {
        throw CheckException(CheckError::invalid_geometry("shear_planes", shear_planes,
            "at least one shear plane is required"));
    }
}

BoltCheckResult bolt_check(const std::string& check, const BoltGrade& grade,
                           const BoltSize& size, double Fn, int num_bolts,
                           int shear_planes, double demand, const DesignConfig& config) {
    BoltCheckResult result;
    result.check = check;
    result.grade = grade.id;
    result.diameter = size.id;
    result.num_bolts = num_bolts;
    result.shear_planes = shear_planes;
    result.Ab = size.Ab;
    result.Fn = Fn;
    result.Rn_per_bolt = units::to_kN(Fn * size.Ab);

    double Rn = result.Rn_per_bolt * num_bolts * shear_planes;
    result.details["Fn"] = Fn;
    result.details["Ab"] = size.Ab;
    result.details["Rn_per_bolt"] = result.Rn_per_bolt;
    result.details["num_bolts"] = num_bolts;
    result.details["shear_planes"] = shear_planes;

    apply_strength(result, demand, Rn, resistance::kBolt, config);
    return result;
}

} // namespace

std::string hole_type_to_string(HoleType type) {
    switch (type) {
        case HoleType::Standard: return "STD";
        case HoleType::Oversized: return "OVS";
        case HoleType::ShortSlotted: return "SSL";
        case HoleType::LongSlottedTransverse: return "LSL_T";
        default: return "?";
    }
}

HoleType parse_hole_type(const std::string& tag) {
    std::string key = upper(tag);
    if (key == "STD") return HoleType::Standard;
    if (key == "OVS") return HoleType::Oversized;
    if (key == "SSL") return HoleType::ShortSlotted;
    if (key == "LSL_T") return HoleType::LongSlottedTransverse;
    throw CheckException(CheckError::unsupported("hole_type", tag,
        "hole type must be STD, OVS, SSL or LSL_T"));
}

const std::vector<BoltGrade>& bolt_grades() {
    static const std::vector<BoltGrade> grades = {
        {"A325", 620.0, 372.0},
        {"A490", 780.0, 457.0},
        {"4.6", 240.0, 150.0},
        {"8.8", 640.0, 372.0},
        {"10.9", 830.0, 500.0},
    };
    return grades;
}

const std::vector<BoltSize>& bolt_diameters() {
    // Table J3.3M (metric) and J3.3 (inch sizes converted to mm)
    static const std::vector<BoltSize> sizes = {
        {"M12", 12.0, 113.0, 14.0, 16.0, 18.0},
        {"M16", 16.0, 201.0, 18.0, 20.0, 22.0},
        {"M20", 20.0, 314.0, 22.0, 24.0, 26.0},
        {"M22", 22.0, 380.0, 24.0, 28.0, 30.0},
        {"M24", 24.0, 452.0, 27.0, 30.0, 32.0},
        {"M27", 27.0, 573.0, 30.0, 35.0, 37.0},
        {"M30", 30.0, 707.0, 33.0, 38.0, 40.0},
        {"3/4\"", 19.05, 285.0, 20.64, 23.81, 25.40},
        {"7/8\"", 22.23, 388.0, 23.81, 26.99, 28.58},
        {"1\"", 25.4, 507.0, 26.99, 31.75, 33.34},
        {"1-1/8\"", 28.58, 641.0, 31.75, 36.51, 38.10},
        {"1-1/4\"", 31.75, 792.0, 34.93, 39.69, 41.28},
    };
    return sizes;
}

const BoltGrade& get_bolt_grade(const std::string& id) {
    std::string key = upper(id);
    for (const auto& grade : bolt_grades()) {
        if (grade.id == key) return grade;
    }
    throw CheckException(CheckError::bolt_grade_not_found(id));
}

const BoltSize& get_bolt_size(const std::string& id) {
    std::string key = upper(id);
    for (const auto& size : bolt_diameters()) {
        if (size.id == key) return size;
    }
    throw CheckException(CheckError::bolt_diameter_not_found(id));
}

double hole_dimension(const BoltSize& size, HoleType type) {
    switch (type) {
        case HoleType::Oversized: return size.hole_oversized;
        case HoleType::ShortSlotted: return size.short_slot_length;
        case HoleType::Standard:
        case HoleType::LongSlottedTransverse:
        default:
            return size.hole_standard;
    }
}

BoltCheckResult verify_bolt_shear(const std::string& grade, const std::string& diameter,
                                  int num_bolts, double Vu, int shear_planes,
                                  const DesignConfig& config) {
    const BoltGrade& g = get_bolt_grade(grade);
    const BoltSize& s = get_bolt_size(diameter);
    check_bolt_count(num_bolts, shear_planes);
    require_finite_demand("Vu", Vu);
    return bolt_check("bolt_shear", g, s, g.Fnv, num_bolts, shear_planes, Vu, config);
}

BoltCheckResult verify_bolt_tension(const std::string& grade, const std::string& diameter,
                                    int num_bolts, double Tu, const DesignConfig& config) {
    const BoltGrade& g = get_bolt_grade(grade);
    const BoltSize& s = get_bolt_size(diameter);
    check_bolt_count(num_bolts, 1);
    require_finite_demand("Tu", Tu);
    return bolt_check("bolt_tension", g, s, g.Fnt, num_bolts, 1, Tu, config);
}

double reduced_tensile_stress(const BoltGrade& grade, double frv, DesignMethod method) {
    const ResistanceFactor& f = resistance::kBolt;
    double Fnt_prime = method == DesignMethod::LRFD
        ? 1.3 * grade.Fnt - grade.Fnt / (f.phi * grade.Fnv) * frv
        : 1.3 * grade.Fnt - f.omega * grade.Fnt / grade.Fnv * frv;
    return std::clamp(Fnt_prime, 0.0, grade.Fnt);
}

BoltCombinedResult verify_bolt_combined(const std::string& grade, const std::string& diameter,
                                        int num_bolts, double Vu, double Tu,
                                        int shear_planes, const DesignConfig& config) {
    BoltCombinedResult result;
    result.check = "bolt_combined";
    result.shear_check = verify_bolt_shear(grade, diameter, num_bolts, Vu, shear_planes, config);
    result.tension_check = verify_bolt_tension(grade, diameter, num_bolts, Tu, config);

    const BoltGrade& g = get_bolt_grade(grade);
    const BoltSize& s = get_bolt_size(diameter);

    result.frv = units::kNPerKN * std::abs(Vu) / (s.Ab * num_bolts * shear_planes);
    result.frt = units::kNPerKN * std::abs(Tu) / (s.Ab * num_bolts);
    result.Fnt_prime = reduced_tensile_stress(g, result.frv, config.method);

    result.details["frv"] = result.frv;
    result.details["frt"] = result.frt;
    result.details["Fnt_prime"] = result.Fnt_prime;

    double Rn = units::to_kN(result.Fnt_prime * s.Ab) * num_bolts;
    apply_strength(result, Tu, Rn, resistance::kBolt, config);
    result.interaction = result.ratio;
    result.details["interaction"] = result.interaction;

    result.ok = result.ok && result.shear_check.ok && result.tension_check.ok;
    result.warnings.merge(result.shear_check.warnings);
    result.warnings.merge(result.tension_check.warnings);
    return result;
}

BearingResult verify_bolt_bearing(double t_plate, double Fu_plate, const std::string& diameter,
                                  int num_bolts, double Vu, double edge_distance,
                                  double spacing, HoleType hole_type,
                                  const DesignConfig& config) {
    const BoltSize& size = get_bolt_size(diameter);
    check_bolt_count(num_bolts, 1);
    require_positive_length("t_plate", t_plate);
    require_finite_demand("Vu", Vu);
    if (!std::isfinite(Fu_plate) || Fu_plate <= 0.0) {
        throw CheckException(CheckError::invalid_property("Fu_plate", Fu_plate,
            "plate tensile strength must be positive"));
    }

    BearingResult result;
    result.check = "bolt_bearing";
    result.hole_type = hole_type;
    result.dh = hole_dimension(size, hole_type);

    bool transverse = hole_type == HoleType::LongSlottedTransverse;
    double c_tearout = transverse ? 1.0 : 1.2;
    double c_bearing = transverse ? 2.0 : 2.4;
    double bearing = c_bearing * size.d * t_plate * Fu_plate;

    result.lc_edge = edge_distance - result.dh / 2.0;
    if (!(result.lc_edge > 0.0)) {
        throw CheckException(CheckError::invalid_geometry("edge_distance", edge_distance,
            "edge distance leaves no clear distance to the hole"));
    }
    result.Rn_edge = units::to_kN(std::min(c_tearout * result.lc_edge * t_plate * Fu_plate, bearing));

    if (num_bolts > 1) {
        result.lc_interior = spacing - result.dh;
        if (!(result.lc_interior > 0.0)) {
            throw CheckException(CheckError::invalid_geometry("spacing", spacing,
                "bolt spacing leaves no clear distance between holes"));
        }
        result.Rn_interior = units::to_kN(
            std::min(c_tearout * result.lc_interior * t_plate * Fu_plate, bearing));
    }

    double Rn = result.Rn_edge + result.Rn_interior * (num_bolts - 1);
    result.details["dh"] = result.dh;
    result.details["lc_edge"] = result.lc_edge;
    result.details["lc_interior"] = result.lc_interior;
    result.details["Rn_edge"] = result.Rn_edge;
    result.details["Rn_interior"] = result.Rn_interior;
    result.details["Rn_bearing_limit"] = units::to_kN(bearing);

    apply_strength(result, Vu, Rn, resistance::kBearing, config);
    return result;
}

VerificationResult verify_block_shear(const BlockShearGeometry& geometry, double Fy, double Fu,
                                      double Ru, const DesignConfig& config) {
    require_positive_length("Agv", geometry.Agv);
    require_positive_length("Anv", geometry.Anv);
    require_non_negative_length("Ant", geometry.Ant);
    require_finite_demand("Ru", Ru);
    if (geometry.Anv > geometry.Agv) {
        throw CheckException(CheckError::invalid_geometry("Anv", geometry.Anv,
            "net shear area cannot exceed the gross shear area"));
    }
    if (geometry.Ubs < 0.5 || geometry.Ubs > 1.0) {
        throw CheckException(CheckError::invalid_property("Ubs", geometry.Ubs,
            "Ubs must be 0.5 or 1.0"));
    }
    if (!std::isfinite(Fy) || Fy <= 0.0 || !std::isfinite(Fu) || Fu < Fy) {
        throw CheckException(CheckError::invalid_property("Fu", Fu,
            "plate strengths must be positive with Fu >= Fy"));
    }

    VerificationResult result;
    result.check = "block_shear";

    double tension = geometry.Ubs * Fu * geometry.Ant;
    double rupture = 0.6 * Fu * geometry.Anv + tension;
    double yield = 0.6 * Fy * geometry.Agv + tension;
    double Rn = units::to_kN(std::min(rupture, yield));

    result.details["Rn_shear_rupture"] = units::to_kN(rupture);
    result.details["Rn_shear_yield"] = units::to_kN(yield);
    result.details["shear_rupture"] = rupture < yield ? 1.0 : 0.0;

    apply_strength(result, Ru, Rn, resistance::kBlockShear, config);
    return result;
}

} // namespace steelcheck
