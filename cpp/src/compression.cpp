#include "steelcheck/compression.hpp"
#include "steelcheck/errors.hpp"
#include "steelcheck/units.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>
#include <vector>

namespace steelcheck {

namespace {

constexpr double kPi = 3.14159265358979323846;

struct KFactorEntry {
    EndCondition a;
    EndCondition b;
    double K;
};

const std::vector<KFactorEntry>& k_factor_table() {
    static const std::vector<KFactorEntry> table = {
        {EndCondition::Fixed, EndCondition::Fixed, 0.65},
        {EndCondition::Fixed, EndCondition::Pinned, 0.80},
        {EndCondition::Fixed, EndCondition::Free, 2.10},
        {EndCondition::Pinned, EndCondition::Pinned, 1.00},
        {EndCondition::Pinned, EndCondition::Free, 2.10},
    };
    return table;
}

} // namespace

std::string end_condition_to_string(EndCondition condition) {
    switch (condition) {
        case EndCondition::Fixed: return "fixed";
        case EndCondition::Pinned: return "pinned";
        case EndCondition::Free: return "free";
        case EndCondition::Roller: return "roller";
        default: return "unknown";
    }
}

EndCondition parse_end_condition(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (lower == "fixed") return EndCondition::Fixed;
    if (lower == "pinned") return EndCondition::Pinned;
    if (lower == "free") return EndCondition::Free;
    if (lower == "roller") return EndCondition::Roller;
    throw CheckException(CheckError::unsupported("end_condition", name,
        "end condition must be fixed, pinned, free or roller"));
}

std::string buckling_mode_to_string(BucklingMode mode) {
    return mode == BucklingMode::Inelastic ? "inelastic" : "elastic";
}

std::optional<double> lookup_effective_length_factor(EndCondition end_i, EndCondition end_j) {
    for (const auto& entry : k_factor_table()) {
        if ((entry.a == end_i && entry.b == end_j) || (entry.a == end_j && entry.b == end_i)) {
            return entry.K;
        }
    }
    return std::nullopt;
}

double effective_length_factor(EndCondition end_i, EndCondition end_j, KFactorFallback fallback) {
    if (auto K = lookup_effective_length_factor(end_i, end_j)) {
        return *K;
    }
    if (fallback == KFactorFallback::Conservative) {
        return kMaxTabulatedK;
    }
    CheckError err = CheckError::unsupported("end_conditions",
        end_condition_to_string(end_i) + "-" + end_condition_to_string(end_j),
        "no effective length factor tabulated for this end-condition pair");
    err.suggestion = "Supply K directly or enable the conservative K-factor fallback";
    throw CheckException(err);
}

double euler_stress(double E, double slenderness) {
    return kPi * kPi * E / (slenderness * slenderness);
}

double inelastic_critical_stress(double Fy, double Fe) {
    return std::pow(0.658, Fy / Fe) * Fy;
}

double elastic_critical_stress(double Fe) {
    return 0.877 * Fe;
}

double inelastic_slenderness_limit(double E, double Fy) {
    return 4.71 * std::sqrt(E / Fy);
}

CompressionResult verify_compression(const SteelSection& section, const SteelMaterial& material,
                                     double Pu, double K, double Lx, double Ly,
                                     const DesignConfig& config) {
    material.validate();
    CompressionResult result;
    result.check = "compression";
    result.warnings = section.validate();
    require_finite_demand("Pu", Pu);
    require_positive_length("Lx", Lx);
    require_positive_length("Ly", Ly);
    if (!std::isfinite(K) || K <= 0.0) {
        throw CheckException(CheckError::invalid_property("K", K,
            "effective length factor must be positive"));
    }

    result.K = K;
    result.Lx = Lx;
    result.Ly = Ly;
    result.slenderness_x = K * units::to_mm(Lx) / section.rx();
    result.slenderness_y = K * units::to_mm(Ly) / section.ry();
    if (result.slenderness_x > result.slenderness_y) {
        result.axis = BucklingAxis::Major;
        result.slenderness = result.slenderness_x;
    } else {
        result.axis = BucklingAxis::Minor;
        result.slenderness = result.slenderness_y;
    }

    if (result.slenderness > kSlendernessLimit) {
        result.warnings.add(CheckWarning::slenderness_limit(result.slenderness));
    }

    result.Fe = euler_stress(material.E, result.slenderness);
    if (result.slenderness <= inelastic_slenderness_limit(material.E, material.Fy)) {
        result.mode = BucklingMode::Inelastic;
        result.Fcr = inelastic_critical_stress(material.Fy, result.Fe);
    } else {
        result.mode = BucklingMode::Elastic;
        result.Fcr = elastic_critical_stress(result.Fe);
    }
    result.Pn = units::to_kN(result.Fcr * section.A);

    result.details["KLx/rx"] = result.slenderness_x;
    result.details["KLy/ry"] = result.slenderness_y;
    result.details["Fe"] = result.Fe;
    result.details["Fcr"] = result.Fcr;
    result.details["Pn"] = result.Pn;

    double demand = std::max(Pu, 0.0);
    if (demand == 0.0) {
        result.warnings.add(CheckWarning::zero_demand(result.check));
    }
    apply_strength(result, demand, result.Pn, resistance::kCompression, config);
    return result;
}

CompressionResult verify_compression(const SteelSection& section, const SteelMaterial& material,
                                     double Pu, EndCondition end_i, EndCondition end_j,
                                     double Lx, double Ly, const DesignConfig& config) {
    double K = effective_length_factor(end_i, end_j, config.k_factor_fallback);
    return verify_compression(section, material, Pu, K, Lx, Ly, config);
}

} // namespace steelcheck
