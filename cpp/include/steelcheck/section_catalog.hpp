#pragma once

#include "steelcheck/section.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace steelcheck {

/**
 * @brief Optional bounds for searching the section catalog
 *
 * Unset fields don't filter. Bounds are inclusive and use the catalog
 * units (mm, kg/m, mm⁴, mm³).
 */
struct SectionFilter {
    std::optional<SectionType> type;
    std::optional<CatalogOrigin> origin;
    std::optional<double> d_min;
    std::optional<double> d_max;
    std::optional<double> weight_min;
    std::optional<double> weight_max;
    std::optional<double> Ix_min;
    std::optional<double> Iy_min;
    std::optional<double> Zx_min;
    std::optional<double> rx_min;
    std::optional<double> ry_min;
    size_t limit = 50;   ///< Maximum number of results

    bool matches(const SteelSection& section) const;
};

/**
 * @brief Read-only catalog of steel sections keyed by identifier
 *
 * Sections keep their insertion order, which is the order used by
 * all() and filter().
 */
class SectionCatalog {
public:
    SectionCatalog() = default;

    /**
     * @brief Add a section after validating it
     *
     * Warnings produced by validation are accumulated in warnings().
     *
     * @throws CheckException (INVALID_PROPERTY) on invalid or duplicate section
     */
    void add(const SteelSection& section);

    /**
     * @brief Find a section by identifier (case-insensitive)
     *
     * @throws CheckException (SECTION_NOT_FOUND) for unknown identifiers
     */
    const SteelSection& get(const std::string& id) const;

    /**
     * @brief Find a section, returning nullptr when it doesn't exist
     */
    const SteelSection* find(const std::string& id) const;

    bool contains(const std::string& id) const { return find(id) != nullptr; }

    const std::vector<SteelSection>& all() const { return sections_; }

    std::vector<std::string> ids() const;

    /**
     * @brief Sections matching every bound of the filter, up to filter.limit
     */
    std::vector<const SteelSection*> filter(const SectionFilter& filter) const;

    size_t size() const { return sections_.size(); }

    /// Validation warnings collected while the catalog was built
    const WarningList& warnings() const { return warnings_; }

private:
    std::vector<SteelSection> sections_;
    std::map<std::string, size_t> index_;  ///< Upper-case id -> position
    WarningList warnings_;
};

/**
 * @brief Built-in sections: AISC rolled W shapes (tabulated), AISC HSS,
 *        channels and angles (built from plate geometry) and Chilean
 *        welded IN/HN shapes
 *
 * Built on first use and shared read-only afterwards.
 */
const SectionCatalog& default_sections();

} // namespace steelcheck
