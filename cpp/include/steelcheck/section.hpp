#pragma once

#include "steelcheck/warnings.hpp"

#include <string>

namespace steelcheck {

/**
 * @brief Cross-section shape family
 */
enum class SectionType {
    WideFlange,         ///< Rolled or welded I-shape (W, IN, HN)
    RectangularHollow,  ///< Rectangular/square HSS
    RoundHollow,        ///< Round HSS / pipe
    Channel,            ///< C-shape
    Angle               ///< Equal-leg angle
};

/**
 * @brief Catalog the section record comes from
 */
enum class CatalogOrigin {
    AISC,
    Chilean
};

/// Short tag used by the catalogs: "W", "HSS_RECT", "HSS_ROUND", "C", "L"
std::string section_type_to_string(SectionType type);

/// Parse a short tag; throws CheckException (UNSUPPORTED_CONFIGURATION) if unknown
SectionType parse_section_type(const std::string& tag);

std::string catalog_origin_to_string(CatalogOrigin origin);

/**
 * @brief Steel cross-section properties for design checks
 *
 * Stores geometric properties in millimetre units:
 * - d, bf, tf, tw: depth, flange width, flange and web thickness [mm]
 * - t: wall thickness of hollow sections / leg thickness of angles [mm]
 * - A: Cross-sectional area [mm²]
 * - Ix, Iy: Second moments of area about the major (x) and minor (y) axes [mm⁴]
 * - Sx, Sy: Elastic section moduli [mm³]
 * - Zx, Zy: Plastic section moduli [mm³]
 * - J: Torsional constant [mm⁴]
 * - Cw: Warping constant [mm⁶]
 * - weight: Unit weight [kg/m]
 *
 * Radii of gyration are not stored: rx() and ry() always derive them from
 * I and A. Catalog radii, when supplied, are only compared against the
 * derived values by validate().
 *
 * For hollow sections d is the outer depth (or outside diameter) and bf the
 * outer width. For angles d = bf = leg length.
 */
class SteelSection {
public:
    std::string id;                 ///< Unique section identifier (e.g. "W310X39")
    SectionType type;               ///< Shape family
    CatalogOrigin origin;           ///< Source catalog

    // Plate dimensions
    double d = 0.0;                 ///< Depth / outside diameter / leg [mm]
    double bf = 0.0;                ///< Flange width / outer width [mm]
    double tf = 0.0;                ///< Flange thickness [mm]
    double tw = 0.0;                ///< Web thickness [mm]
    double t = 0.0;                 ///< Wall or leg thickness [mm]

    // Section properties
    double A;                       ///< Area [mm²]
    double Ix;                      ///< Major-axis second moment of area [mm⁴]
    double Iy;                      ///< Minor-axis second moment of area [mm⁴]
    double Sx = 0.0;                ///< Major-axis elastic modulus [mm³]
    double Sy = 0.0;                ///< Minor-axis elastic modulus [mm³]
    double Zx = 0.0;                ///< Major-axis plastic modulus [mm³]
    double Zy = 0.0;                ///< Minor-axis plastic modulus [mm³]
    double J = 0.0;                 ///< Torsional constant [mm⁴]
    double Cw = 0.0;                ///< Warping constant [mm⁶]
    double weight = 0.0;            ///< Unit weight [kg/m]

    // Radii as printed in the source catalog (0 = not supplied)
    double catalog_rx = 0.0;        ///< Tabulated rx [mm]
    double catalog_ry = 0.0;        ///< Tabulated ry [mm]

    /**
     * @brief Construct a section from its basic properties
     *
     * Remaining properties default to 0 and are filled with the setters.
     *
     * @param id Unique section identifier
     * @param type Shape family
     * @param origin Source catalog
     * @param A Area [mm²]
     * @param Ix Major-axis second moment of area [mm⁴]
     * @param Iy Minor-axis second moment of area [mm⁴]
     */
    SteelSection(std::string id, SectionType type, CatalogOrigin origin,
                 double A, double Ix, double Iy);

    /**
     * @brief Set the plate dimensions of an I-shape or channel [mm]
     */
    void set_plate_dimensions(double d, double bf, double tf, double tw);

    /**
     * @brief Set elastic and plastic section moduli [mm³]
     */
    void set_moduli(double Sx, double Sy, double Zx, double Zy);

    /**
     * @brief Set torsional and warping constants
     *
     * @param J Torsional constant [mm⁴]
     * @param Cw Warping constant [mm⁶]
     */
    void set_torsion(double J, double Cw);

    /// Major-axis radius of gyration sqrt(Ix/A) [mm]
    double rx() const;

    /// Minor-axis radius of gyration sqrt(Iy/A) [mm]
    double ry() const;

    /// Distance between flange centroids d - tf [mm] (I-shapes and channels)
    double ho() const { return d - tf; }

    /// True for RectangularHollow and RoundHollow
    bool is_closed() const;

    /**
     * @brief Check the record is usable by the design checks
     *
     * @return Warnings for catalog radii inconsistent with sqrt(I/A)
     * @throws CheckException (INVALID_PROPERTY) if A, Ix, Iy, Sx or Zx are
     *         not strictly positive, or if plate dimensions required by the
     *         shape family are missing
     */
    WarningList validate() const;

    // === Builders from plate geometry ===

    /**
     * @brief Doubly symmetric welded I-section (flanges and web as rectangles)
     *
     * Used for the Chilean welded IN/HN series. Fillets are neglected.
     */
    static SteelSection welded_i(const std::string& id, CatalogOrigin origin,
                                 double d, double bf, double tf, double tw);

    /**
     * @brief Channel with uniform flange thickness (toes pointing in +x)
     */
    static SteelSection channel(const std::string& id, CatalogOrigin origin,
                                double d, double bf, double tf, double tw);

    /**
     * @brief Rectangular hollow section, square corners
     *
     * @param H Outer depth [mm]
     * @param B Outer width [mm]
     * @param t Wall thickness [mm]
     */
    static SteelSection rectangular_hollow(const std::string& id, CatalogOrigin origin,
                                           double H, double B, double t);

    /**
     * @brief Round hollow section
     *
     * @param OD Outside diameter [mm]
     * @param t Wall thickness [mm]
     */
    static SteelSection round_hollow(const std::string& id, CatalogOrigin origin,
                                     double OD, double t);

    /**
     * @brief Equal-leg angle, properties about the geometric axes
     *
     * @param b Leg length [mm]
     * @param t Leg thickness [mm]
     */
    static SteelSection equal_angle(const std::string& id, CatalogOrigin origin,
                                    double b, double t);

    /// Steel density used by the builders to compute unit weight [kg/m³]
    static constexpr double kSteelDensity = 7850.0;
};

} // namespace steelcheck
