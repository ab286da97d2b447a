#pragma once

#include "steelcheck/compression.hpp"
#include "steelcheck/deflection.hpp"
#include "steelcheck/flexure.hpp"
#include "steelcheck/interaction.hpp"
#include "steelcheck/shear.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace steelcheck {

/**
 * @brief Demands on a beam
 */
struct BeamDemand {
    double Mu = 0.0;                    ///< Required moment [kN·m]
    double Vu = 0.0;                    ///< Required shear [kN]
    double L = 0.0;                     ///< Span [m]
    std::optional<double> Lb;           ///< Unbraced length [m]; span if not set
    double Cb = 1.0;                    ///< Moment gradient factor
    std::optional<double> deflection;   ///< Computed deflection [mm]; no deflection check if not set
    std::vector<double> deflection_denominators = default_deflection_denominators();
};

/**
 * @brief Flexure, shear and deflection of a beam
 */
struct BeamCheckResult {
    FlexureResult flexure;
    ShearResult shear;
    std::map<std::string, DeflectionCheck> deflection;
    bool overall_ok = true;             ///< flexure.ok && shear.ok
    std::string governing;              ///< "flexure" or "shear"
    double max_ratio = 0.0;

    std::string to_string() const;
};

/**
 * @brief Verify a beam (AISC Chapters F and G, span/n deflection limits)
 *
 * Deflection limits are reported but do not affect overall_ok.
 *
 * @throws CheckException on invalid input
 */
BeamCheckResult verify_beam(const SteelSection& section, const SteelMaterial& material,
                            const BeamDemand& demand,
                            const DesignConfig& config = DesignConfig());

/**
 * @brief Demands on a column
 */
struct ColumnDemand {
    double Pu = 0.0;                    ///< Required axial strength [kN] (positive = compression)
    double Mu_top = 0.0;                ///< Major-axis moment at the top [kN·m]
    double Mu_base = 0.0;               ///< Major-axis moment at the base [kN·m]
    std::optional<double> Muy;          ///< Minor-axis moment [kN·m]
    double L = 0.0;                     ///< Height [m]
    double K = 1.0;                     ///< Effective length factor
    std::optional<double> Ly;           ///< Minor-axis unbraced length [m]; L if not set
    std::optional<double> Lb;           ///< Flexural unbraced length [m]; L if not set
    double Cb = 1.0;                    ///< Moment gradient factor
};

/**
 * @brief Compression, flexure and interaction of a column
 */
struct ColumnCheckResult {
    CompressionResult compression;
    FlexureResult flexure;
    std::optional<FlexureResult> flexure_minor;
    InteractionResult interaction;
    bool overall_ok = true;             ///< compression.ok && interaction.ok
    std::string governing;              ///< Check with the largest ratio
    double max_ratio = 0.0;

    std::string to_string() const;
};

/**
 * @brief Verify a beam-column (AISC Chapters E, F and H)
 *
 * The major-axis moment demand is max(|Mu_top|, |Mu_base|).
 *
 * @throws CheckException on invalid input
 */
ColumnCheckResult verify_column(const SteelSection& section, const SteelMaterial& material,
                                const ColumnDemand& demand,
                                const DesignConfig& config = DesignConfig());

} // namespace steelcheck
