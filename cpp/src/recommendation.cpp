#include "steelcheck/recommendation.hpp"
#include "steelcheck/errors.hpp"
#include "steelcheck/shear.hpp"

#include <algorithm>
#include <cmath>

namespace steelcheck {

double RecommendationRequest::effective_unbraced_length() const {
    if (Lb) return *Lb;
    if (L) return *L;
    return kDefaultRecommendationSpan;
}

void RecommendationRequest::validate() const {
    if (!std::isfinite(Mu) || Mu <= 0.0) {
        throw CheckException(CheckError::invalid_demand("Mu", Mu,
            "required moment must be positive"));
    }
    if (Vu) {
        require_finite_demand("Vu", *Vu);
        if (*Vu < 0.0) {
            throw CheckException(CheckError::invalid_demand("Vu", *Vu,
                "required shear cannot be negative"));
        }
    }
    if (L) require_positive_length("L", *L);
    if (Lb) require_non_negative_length("Lb", *Lb);
    if (!std::isfinite(Cb) || Cb <= 0.0) {
        throw CheckException(CheckError::invalid_property("Cb", Cb, "Cb must be positive"));
    }
    if (count == 0) {
        throw CheckException(CheckError::invalid_property("count", 0.0,
            "at least one candidate must be requested"));
    }
    if (!(band.min > 0.0) || band.max < band.min) {
        throw CheckException(CheckError::invalid_property("band", band.min,
            "utilization band needs 0 < min <= max"));
    }
}

std::vector<SectionCandidate> recommend_sections(const RecommendationRequest& request,
                                                 const SectionCatalog& catalog,
                                                 const MaterialCatalog& materials) {
    request.validate();
    const SteelMaterial& material = materials.get(request.material_id);
    const double Lb = request.effective_unbraced_length();

    SectionFilter filter;
    filter.type = request.type;
    filter.origin = request.origin;
    filter.limit = catalog.size();

    std::vector<SectionCandidate> candidates;
    for (const SteelSection* section : catalog.filter(filter)) {
        FlexureResult flexure = verify_flexure(*section, material, request.Mu, Lb,
                                               request.Cb, request.config);
        if (!flexure.ok) continue;

        SectionCandidate candidate;
        if (request.Vu) {
            ShearResult shear = verify_shear(*section, material, *request.Vu, request.config);
            if (!shear.ok) continue;
            candidate.shear_capacity = shear.capacity;
            candidate.shear_utilization = shear.ratio;
        }

        candidate.section_id = section->id;
        candidate.type = section->type;
        candidate.origin = section->origin;
        candidate.weight = section->weight;
        candidate.flexural_capacity = flexure.capacity;
        candidate.utilization = flexure.ratio;
        candidate.zone = flexure.zone;
        candidate.meets_target = request.band.contains(flexure.ratio);
        candidates.push_back(std::move(candidate));
    }

    const double mid = request.band.midpoint();
    std::stable_sort(candidates.begin(), candidates.end(),
        [mid](const SectionCandidate& a, const SectionCandidate& b) {
            if (a.weight != b.weight) return a.weight < b.weight;
            return std::abs(a.utilization - mid) < std::abs(b.utilization - mid);
        });

    if (candidates.size() > request.count) {
        candidates.resize(request.count);
    }
    return candidates;
}

std::vector<SectionComparison> compare_sections(const std::vector<std::string>& section_ids,
                                                double Mu, double Vu, double L,
                                                const std::string& material_id,
                                                const DesignConfig& config,
                                                const SectionCatalog& catalog,
                                                const MaterialCatalog& materials) {
    const SteelMaterial& material = materials.get(material_id);

    BeamDemand demand;
    demand.Mu = Mu;
    demand.Vu = Vu;
    demand.L = L;

    std::vector<SectionComparison> comparisons;
    comparisons.reserve(section_ids.size());
    for (const auto& id : section_ids) {
        const SteelSection& section = catalog.get(id);
        SectionComparison entry;
        entry.section_id = section.id;
        entry.type = section.type;
        entry.origin = section.origin;
        entry.weight = section.weight;
        entry.d = section.d;
        entry.verification = verify_beam(section, material, demand, config);
        comparisons.push_back(std::move(entry));
    }

    std::stable_sort(comparisons.begin(), comparisons.end(),
        [](const SectionComparison& a, const SectionComparison& b) {
            return std::abs(a.verification.flexure.ratio - kComparisonTargetRatio)
                 < std::abs(b.verification.flexure.ratio - kComparisonTargetRatio);
        });
    return comparisons;
}

} // namespace steelcheck
