#include "steelcheck/member_checks.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace steelcheck {

BeamCheckResult verify_beam(const SteelSection& section, const SteelMaterial& material,
                            const BeamDemand& demand, const DesignConfig& config) {
    require_positive_length("L", demand.L);
    double Lb = demand.Lb.value_or(demand.L);

    BeamCheckResult result;
    result.flexure = verify_flexure(section, material, std::abs(demand.Mu), Lb, demand.Cb, config);
    result.shear = verify_shear(section, material, demand.Vu, config);
    if (demand.deflection) {
        result.deflection = verify_deflection(*demand.deflection, demand.L,
                                              demand.deflection_denominators, config);
    }

    result.overall_ok = result.flexure.ok && result.shear.ok;
    if (result.flexure.ratio > result.shear.ratio) {
        result.governing = "flexure";
        result.max_ratio = result.flexure.ratio;
    } else {
        result.governing = "shear";
        result.max_ratio = result.shear.ratio;
    }
    return result;
}

std::string BeamCheckResult::to_string() const {
    std::ostringstream oss;
    oss << "Beam " << (overall_ok ? "OK" : "NOT OK")
        << " (governing: " << governing << ", ratio " << max_ratio << ")\n";
    oss << flexure.to_string() << "\n" << shear.to_string();
    for (const auto& kv : deflection) {
        oss << "\n" << kv.first << ": " << kv.second.actual << " / " << kv.second.limit
            << " mm " << (kv.second.ok ? "OK" : "NOT OK");
    }
    return oss.str();
}

ColumnCheckResult verify_column(const SteelSection& section, const SteelMaterial& material,
                                const ColumnDemand& demand, const DesignConfig& config) {
    require_positive_length("L", demand.L);

    ColumnCheckResult result;
    result.compression = verify_compression(section, material, demand.Pu, demand.K,
                                            demand.L, demand.Ly.value_or(demand.L), config);

    double Mu = std::max(std::abs(demand.Mu_top), std::abs(demand.Mu_base));
    result.flexure = verify_flexure(section, material, Mu, demand.Lb.value_or(demand.L),
                                    demand.Cb, config);

    if (demand.Muy) {
        result.flexure_minor = verify_flexure_minor(section, material, std::abs(*demand.Muy), config);
        result.interaction = verify_interaction(result.compression, result.flexure,
                                                *result.flexure_minor, config);
    } else {
        result.interaction = verify_interaction(result.compression, result.flexure, config);
    }

    result.overall_ok = result.compression.ok && result.interaction.ok;

    result.governing = "interaction";
    result.max_ratio = result.interaction.ratio;
    if (result.compression.ratio > result.max_ratio) {
        result.governing = "compression";
        result.max_ratio = result.compression.ratio;
    }
    return result;
}

std::string ColumnCheckResult::to_string() const {
    std::ostringstream oss;
    oss << "Column " << (overall_ok ? "OK" : "NOT OK")
        << " (governing: " << governing << ", ratio " << max_ratio << ")\n";
    oss << compression.to_string() << "\n" << flexure.to_string();
    if (flexure_minor) {
        oss << "\n" << flexure_minor->to_string();
    }
    oss << "\n" << interaction.to_string()
        << " [" << interaction_equation_to_string(interaction.equation) << "]";
    return oss.str();
}

} // namespace steelcheck
