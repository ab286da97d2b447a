#include "steelcheck/load_combinations.hpp"
#include "steelcheck/errors.hpp"

#include <algorithm>
#include <cmath>

namespace steelcheck {

using LT = LoadType;

std::string load_type_to_string(LoadType type) {
    switch (type) {
        case LT::D: return "D";
        case LT::L: return "L";
        case LT::Lr: return "Lr";
        case LT::S: return "S";
        case LT::W: return "W";
        case LT::E: return "E";
        case LT::R: return "R";
        case LT::H: return "H";
        case LT::F: return "F";
        case LT::T: return "T";
        default: return "?";
    }
}

LoadType parse_load_type(const std::string& tag) {
    for (LoadType type : all_load_types()) {
        if (load_type_to_string(type) == tag) return type;
    }
    throw CheckException(CheckError::invalid_load_type(tag, "load type '" + tag + "' not recognised"));
}

std::string load_type_label(LoadType type) {
    switch (type) {
        case LT::D: return "Dead";
        case LT::L: return "Live";
        case LT::Lr: return "Roof live";
        case LT::S: return "Snow";
        case LT::W: return "Wind";
        case LT::E: return "Earthquake";
        case LT::R: return "Rain";
        case LT::H: return "Soil";
        case LT::F: return "Fluid";
        case LT::T: return "Temperature";
        default: return "Unknown";
    }
}

const std::vector<LoadType>& all_load_types() {
    static const std::vector<LoadType> types = {
        LT::D, LT::L, LT::Lr, LT::S, LT::W, LT::E, LT::R, LT::H, LT::F, LT::T
    };
    return types;
}

const std::vector<LoadCombination>& lrfd_combinations() {
    static const std::vector<LoadCombination> combos = {
        {"1.4D", "Dead load only",
         {{LT::D, 1.4}}},
        {"1.2D + 1.6L + 0.5(Lr or S or R)", "Dead + live + roof/snow/rain",
         {{LT::D, 1.2}, {LT::L, 1.6}, {LT::Lr, 0.5}, {LT::S, 0.5}, {LT::R, 0.5}}},
        {"1.2D + 1.6(Lr or S or R) + (L or 0.5W)", "Dead + roof/snow/rain + live/wind",
         {{LT::D, 1.2}, {LT::Lr, 1.6}, {LT::S, 1.6}, {LT::R, 1.6}, {LT::L, 1.0}, {LT::W, 0.5}}},
        {"1.2D + 1.0W + L + 0.5(Lr or S or R)", "Dead + wind + live + roof/snow/rain",
         {{LT::D, 1.2}, {LT::W, 1.0}, {LT::L, 1.0}, {LT::Lr, 0.5}, {LT::S, 0.5}, {LT::R, 0.5}}},
        {"1.2D + 1.0E + L + 0.2S", "Dead + earthquake + live + snow",
         {{LT::D, 1.2}, {LT::E, 1.0}, {LT::L, 1.0}, {LT::S, 0.2}}},
        {"0.9D + 1.0W", "Minimum dead + wind (uplift)",
         {{LT::D, 0.9}, {LT::W, 1.0}}},
        {"0.9D + 1.0E", "Minimum dead + earthquake (uplift)",
         {{LT::D, 0.9}, {LT::E, 1.0}}},
    };
    return combos;
}

const std::vector<LoadCombination>& asd_combinations() {
    static const std::vector<LoadCombination> combos = {
        {"D", "Dead load only",
         {{LT::D, 1.0}}},
        {"D + L", "Dead + live",
         {{LT::D, 1.0}, {LT::L, 1.0}}},
        {"D + (Lr or S or R)", "Dead + roof/snow/rain",
         {{LT::D, 1.0}, {LT::Lr, 1.0}, {LT::S, 1.0}, {LT::R, 1.0}}},
        {"D + 0.75L + 0.75(Lr or S or R)", "Dead + live + roof/snow/rain",
         {{LT::D, 1.0}, {LT::L, 0.75}, {LT::Lr, 0.75}, {LT::S, 0.75}, {LT::R, 0.75}}},
        {"D + 0.6W", "Dead + wind",
         {{LT::D, 1.0}, {LT::W, 0.6}}},
        {"D + 0.7E", "Dead + earthquake",
         {{LT::D, 1.0}, {LT::E, 0.7}}},
        {"D + 0.75L + 0.75(0.6W) + 0.75(Lr or S or R)", "Dead + live + wind + roof/snow/rain",
         {{LT::D, 1.0}, {LT::L, 0.75}, {LT::W, 0.45}, {LT::Lr, 0.75}, {LT::S, 0.75}, {LT::R, 0.75}}},
        {"D + 0.75L + 0.75(0.7E) + 0.75S", "Dead + live + earthquake + snow",
         {{LT::D, 1.0}, {LT::L, 0.75}, {LT::E, 0.525}, {LT::S, 0.75}}},
        {"0.6D + 0.6W", "Minimum dead + wind (uplift)",
         {{LT::D, 0.6}, {LT::W, 0.6}}},
        {"0.6D + 0.7E", "Minimum dead + earthquake (uplift)",
         {{LT::D, 0.6}, {LT::E, 0.7}}},
    };
    return combos;
}

const std::vector<LoadCombination>& combinations_for(DesignMethod method) {
    return method == DesignMethod::LRFD ? lrfd_combinations() : asd_combinations();
}

std::vector<CombinationResult> CombinationSelection::top(size_t n) const {
    size_t count = std::min(n, all.size());
    return std::vector<CombinationResult>(all.begin(), all.begin() + static_cast<std::ptrdiff_t>(count));
}

void validate_loads(const LoadCaseSet& loads) {
    for (const auto& kv : loads) {
        const std::string tag = load_type_to_string(kv.first);
        if (!std::isfinite(kv.second)) {
            throw CheckException(CheckError::invalid_load_type(tag,
                "load '" + tag + "' is not a finite number"));
        }
        bool reversible = kv.first == LT::W || kv.first == LT::E;
        if (kv.second < 0.0 && !reversible) {
            CheckError err = CheckError::invalid_load_type(tag,
                "load '" + tag + "' cannot be negative");
            err.details["magnitude"] = CheckError::format_value(kv.second);
            err.suggestion = "Only wind (W) and earthquake (E) may be negative";
            throw CheckException(err);
        }
    }
}

double apply_combination(const LoadCaseSet& loads, const LoadCombination& combination) {
    double total = 0.0;
    for (const auto& kv : combination.factors) {
        auto it = loads.find(kv.first);
        if (it != loads.end()) {
            total += kv.second * it->second;
        }
    }
    return total;
}

std::map<LoadType, double> factored_loads(const LoadCaseSet& loads,
                                          const LoadCombination& combination) {
    std::map<LoadType, double> factored;
    for (const auto& kv : loads) {
        auto it = combination.factors.find(kv.first);
        double factor = it == combination.factors.end() ? 0.0 : it->second;
        factored[kv.first] = factor * kv.second;
    }
    return factored;
}

std::vector<CombinationResult> evaluate_combinations(const LoadCaseSet& loads,
                                                     DesignMethod method) {
    const auto& catalog = combinations_for(method);
    std::vector<CombinationResult> results;
    results.reserve(catalog.size());

    for (size_t i = 0; i < catalog.size(); ++i) {
        const auto& combo = catalog[i];
        CombinationResult r;
        r.name = combo.name;
        r.description = combo.description;
        r.value = apply_combination(loads, combo);
        r.catalog_index = i;
        for (const auto& kv : combo.factors) {
            auto it = loads.find(kv.first);
            if (it != loads.end() && it->second != 0.0) {
                r.factors_used[kv.first] = kv.second;
            }
        }
        results.push_back(std::move(r));
    }

    std::stable_sort(results.begin(), results.end(),
        [](const CombinationResult& a, const CombinationResult& b) {
            return std::abs(a.value) > std::abs(b.value);
        });
    return results;
}

CombinationSelection select_governing_combination(const LoadCaseSet& loads,
                                                  DesignMethod method) {
    validate_loads(loads);

    CombinationSelection selection;
    selection.method = method;
    selection.loads = loads;
    selection.all = evaluate_combinations(loads, method);
    selection.governing = selection.all.front();
    return selection;
}

LoadCaseSet to_load_case_set(const std::map<std::string, double>& loads) {
    LoadCaseSet result;
    for (const auto& kv : loads) {
        result[parse_load_type(kv.first)] = kv.second;
    }
    return result;
}

CombinationSelection select_governing_combination(const std::map<std::string, double>& loads,
                                                  DesignMethod method) {
    return select_governing_combination(to_load_case_set(loads), method);
}

} // namespace steelcheck
