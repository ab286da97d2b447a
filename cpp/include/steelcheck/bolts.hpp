#pragma once

#include "steelcheck/design_config.hpp"
#include "steelcheck/verification_result.hpp"

#include <string>
#include <vector>

namespace steelcheck {

/**
 * @brief Nominal stresses of a bolt grade (AISC Table J3.2)
 */
struct BoltGrade {
    std::string id;     ///< "A325", "A490", "4.6", "8.8", "10.9"
    double Fnt;         ///< Nominal tensile stress [MPa]
    double Fnv;         ///< Nominal shear stress [MPa]
};

/**
 * @brief Nominal bolt size with hole dimensions (AISC Table J3.3M / J3.3)
 *
 * All dimensions in mm.
 */
struct BoltSize {
    std::string id;             ///< "M20", "3/4\"", ...
    double d;                   ///< Nominal diameter
    double Ab;                  ///< Nominal body area [mm²]
    double hole_standard;       ///< Standard hole diameter
    double hole_oversized;      ///< Oversized hole diameter
    double short_slot_length;   ///< Short-slot length (width = standard hole)
};

/**
 * @brief Hole type of the connected plate (AISC J3.2, J3.10)
 */
enum class HoleType {
    Standard,               ///< Standard round hole
    Oversized,              ///< Oversized round hole
    ShortSlotted,           ///< Short slot, long dimension parallel to the load
    LongSlottedTransverse   ///< Long slot perpendicular to the load
};

std::string hole_type_to_string(HoleType type);

/// Parse "STD", "OVS", "SSL" or "LSL_T"; throws CheckException (UNSUPPORTED_CONFIGURATION)
HoleType parse_hole_type(const std::string& tag);

/// All bolt grades in catalog order
const std::vector<BoltGrade>& bolt_grades();

/// All bolt sizes in catalog order (metric first)
const std::vector<BoltSize>& bolt_diameters();

/**
 * @brief Look up a bolt grade (case-insensitive)
 *
 * @throws CheckException (BOLT_GRADE_NOT_FOUND)
 */
const BoltGrade& get_bolt_grade(const std::string& id);

/**
 * @brief Look up a bolt size (case-insensitive)
 *
 * @throws CheckException (BOLT_DIAMETER_NOT_FOUND)
 */
const BoltSize& get_bolt_size(const std::string& id);

/**
 * @brief Hole dimension measured along the load [mm]
 */
double hole_dimension(const BoltSize& size, HoleType type);

/**
 * @brief Result of a bolt shear or tension check
 */
struct BoltCheckResult : public VerificationResult {
    std::string grade;          ///< Bolt grade id
    std::string diameter;       ///< Bolt size id
    int num_bolts = 0;
    int shear_planes = 1;
    double Ab = 0.0;            ///< Area per bolt [mm²]
    double Fn = 0.0;            ///< Nominal stress used (Fnv or Fnt) [MPa]
    double Rn_per_bolt = 0.0;   ///< Per bolt and per plane [kN]
};

/**
 * @brief Result of a combined tension and shear check (AISC J3.7)
 *
 * ratio is the tension demand over the available tensile strength using
 * the reduced stress F'nt. ok requires the shear check, the tension check
 * and the reduced-stress check to pass.
 */
struct BoltCombinedResult : public VerificationResult {
    BoltCheckResult shear_check;
    BoltCheckResult tension_check;
    double frv = 0.0;           ///< Required shear stress [MPa]
    double frt = 0.0;           ///< Required tensile stress [MPa]
    double Fnt_prime = 0.0;     ///< Reduced nominal tensile stress F'nt [MPa]
    double interaction = 0.0;   ///< frt / available F'nt
};

/**
 * @brief Result of a bearing/tear-out check (AISC J3.10)
 */
struct BearingResult : public VerificationResult {
    HoleType hole_type = HoleType::Standard;
    double dh = 0.0;            ///< Hole dimension along the load [mm]
    double lc_edge = 0.0;       ///< Clear distance of the edge bolt [mm]
    double lc_interior = 0.0;   ///< Clear distance of interior bolts [mm] (0 for one bolt)
    double Rn_edge = 0.0;       ///< Edge bolt strength [kN]
    double Rn_interior = 0.0;   ///< Strength of one interior bolt [kN]
};

/**
 * @brief Gross and net areas of a block shear failure path [mm²]
 */
struct BlockShearGeometry {
    double Agv;                 ///< Gross area in shear
    double Anv;                 ///< Net area in shear
    double Ant;                 ///< Net area in tension
    double Ubs = 1.0;           ///< 1.0 for uniform tension stress, 0.5 otherwise
};

/**
 * @brief Bolt shear Rn = Fnv·Ab·ns·n (AISC J3-1)
 *
 * @param Vu Required shear [kN], taken by magnitude
 * @param shear_planes Number of shear planes ns >= 1
 * @throws CheckException for unknown grade or size, or n, ns < 1
 */
BoltCheckResult verify_bolt_shear(const std::string& grade, const std::string& diameter,
                                  int num_bolts, double Vu, int shear_planes = 1,
                                  const DesignConfig& config = DesignConfig());

/**
 * @brief Bolt tension Rn = Fnt·Ab·n (AISC J3-1)
 *
 * @param Tu Required tension [kN], taken by magnitude
 */
BoltCheckResult verify_bolt_tension(const std::string& grade, const std::string& diameter,
                                    int num_bolts, double Tu,
                                    const DesignConfig& config = DesignConfig());

/**
 * @brief Reduced nominal tensile stress F'nt (AISC J3-3a, J3-3b)
 *
 * LRFD: 1.3·Fnt − Fnt/(φ·Fnv)·frv. ASD: 1.3·Fnt − Ω·Fnt/Fnv·frv.
 * Result is limited to [0, Fnt].
 */
double reduced_tensile_stress(const BoltGrade& grade, double frv, DesignMethod method);

/**
 * @brief Combined tension and shear (AISC J3.7)
 */
BoltCombinedResult verify_bolt_combined(const std::string& grade, const std::string& diameter,
                                        int num_bolts, double Vu, double Tu,
                                        int shear_planes = 1,
                                        const DesignConfig& config = DesignConfig());

/**
 * @brief Bearing and tear-out at bolt holes (AISC J3-6)
 *
 * The bolts form one line parallel to the load: one edge bolt with
 * lc = Le − dh/2 and n − 1 interior bolts with lc = s − dh. Per bolt
 * Rn = min(c_t·lc·t·Fu, c_b·d·t·Fu) with (c_t, c_b) = (1.2, 2.4), or
 * (1.0, 2.0) for long slots perpendicular to the load.
 *
 * @param t_plate Plate thickness [mm]
 * @param Fu_plate Plate tensile strength [MPa]
 * @param diameter Bolt size id
 * @param Vu Required shear [kN], taken by magnitude
 * @param edge_distance Le, hole centre to edge along the load [mm]
 * @param spacing s, centre-to-centre along the load [mm] (ignored for one bolt)
 * @throws CheckException (INVALID_GEOMETRY) if a clear distance is not positive
 */
BearingResult verify_bolt_bearing(double t_plate, double Fu_plate, const std::string& diameter,
                                  int num_bolts, double Vu, double edge_distance,
                                  double spacing, HoleType hole_type = HoleType::Standard,
                                  const DesignConfig& config = DesignConfig());

/**
 * @brief Block shear rupture (AISC J4-5)
 *
 * Rn = min(0.6·Fu·Anv, 0.6·Fy·Agv) + Ubs·Fu·Ant. The governing path is
 * reported in details as "shear_rupture" (1) or "shear_yield" (0).
 *
 * @param Ru Required strength [kN]; 0 reports the capacity only
 * @param Fy, Fu Plate strengths [MPa]
 */
VerificationResult verify_block_shear(const BlockShearGeometry& geometry, double Fy, double Fu,
                                      double Ru = 0.0,
                                      const DesignConfig& config = DesignConfig());

} // namespace steelcheck
