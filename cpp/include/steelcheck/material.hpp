#pragma once

#include <map>
#include <string>
#include <vector>

namespace steelcheck {

/**
 * @brief Structural steel grade
 *
 * Stores material properties in the units used by the design checks:
 * - Fy, Fu: Yield and ultimate tensile strength [MPa]
 * - E: Young's modulus [MPa]
 * - G: Shear modulus [MPa]
 * - nu: Poisson's ratio (dimensionless)
 * - rho: Density [kg/m³]
 *
 * Materials are reference data: created once when the catalog is built
 * and never mutated afterwards.
 */
class SteelMaterial {
public:
    std::string id;           ///< Unique material identifier (e.g. "A572_GR50")
    std::string name;         ///< Display name (e.g. "ASTM A572 Grade 50")
    std::string description;  ///< Short description of the grade
    double Fy;                ///< Yield stress [MPa]
    double Fu;                ///< Ultimate tensile strength [MPa]
    double E;                 ///< Young's modulus [MPa]
    double G;                 ///< Shear modulus [MPa]
    double nu;                ///< Poisson's ratio
    double rho;               ///< Density [kg/m³]

    /**
     * @brief Construct a new steel material
     *
     * @param id Unique identifier
     * @param name Display name
     * @param Fy Yield stress [MPa]
     * @param Fu Ultimate tensile strength [MPa]
     * @param E Young's modulus [MPa] (default 200000)
     * @param G Shear modulus [MPa] (default 77000)
     * @param nu Poisson's ratio (default 0.3)
     * @param rho Density [kg/m³] (default 7850)
     */
    SteelMaterial(std::string id, std::string name, double Fy, double Fu,
                  double E = 200000.0, double G = 77000.0,
                  double nu = 0.3, double rho = 7850.0);

    /**
     * @brief Check the material is usable by the design checks
     *
     * @throws CheckException (INVALID_PROPERTY) if Fy, Fu, E or G are not
     *         strictly positive, or Fu < Fy
     */
    void validate() const;

    /**
     * @brief Compute shear modulus from Young's modulus and Poisson's ratio
     *
     * Formula: G = E / (2 * (1 + nu))
     */
    static double compute_G(double E, double nu);
};

/**
 * @brief Read-only catalog of steel grades keyed by identifier
 *
 * Lookup is case-insensitive on the identifier.
 */
class MaterialCatalog {
public:
    MaterialCatalog() = default;

    /**
     * @brief Add a material; the identifier must be unique
     *
     * @throws CheckException (INVALID_PROPERTY) on invalid or duplicate material
     */
    void add(const SteelMaterial& material);

    /**
     * @brief Find a material by identifier
     *
     * @throws CheckException (MATERIAL_NOT_FOUND) for unknown identifiers
     */
    const SteelMaterial& get(const std::string& id) const;

    /**
     * @brief Find a material, returning nullptr when it doesn't exist
     */
    const SteelMaterial* find(const std::string& id) const;

    bool contains(const std::string& id) const { return find(id) != nullptr; }

    std::vector<std::string> ids() const;

    size_t size() const { return materials_.size(); }

private:
    std::map<std::string, SteelMaterial> materials_;  ///< Keyed by upper-case id
};

/**
 * @brief Built-in ASTM and Chilean (NCh 203) steel grades
 *
 * Built on first use and shared read-only afterwards.
 */
const MaterialCatalog& default_materials();

} // namespace steelcheck
