#include "steelcheck/section_catalog.hpp"
#include "steelcheck/errors.hpp"

#include <algorithm>
#include <cctype>

namespace steelcheck {

namespace {

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

/**
 * @brief Tabulated rolled W-shape record (AISC Shapes Database, metric)
 */
struct RolledShape {
    const char* id;
    double d, bf, tf, tw;
    double A, Ix, Sx, Zx, Iy, Sy, Zy;
    double J, Cw;
    double weight;
    double rx, ry;
};

const RolledShape kRolledShapes[] = {
    // id          d      bf     tf     tw    A       Ix       Sx       Zx       Iy       Sy       Zy       J        Cw        kg/m   rx     ry
    {"W150X22",  152.0, 152.0,  6.6,  5.8, 2860.0, 12.1e6,  159e3,  177e3,  3.88e6,  51.0e3,  77.8e3,  42.0e3, 2.05e10, 22.5,  65.0, 36.8},
    {"W200X46",  203.0, 203.0, 11.0,  7.2, 5880.0, 45.8e6,  451e3,  498e3, 15.4e6,  152e3,   231e3,   223e3,  1.42e11, 46.1,  88.3, 51.2},
    {"W250X49",  247.0, 202.0, 11.0,  7.4, 6260.0, 71.2e6,  574e3,  636e3, 15.2e6,  151e3,   229e3,   243e3,  2.12e11, 49.1, 106.6, 49.3},
    {"W310X39",  310.0, 165.0,  9.7,  5.8, 4940.0, 84.9e6,  547e3,  610e3,  7.20e6,  87.5e3,  134e3,   125e3,  1.62e11, 38.7, 131.0, 38.4},
    {"W360X44",  351.0, 171.0,  9.8,  6.9, 5710.0, 121e6,   688e3,  775e3,  8.16e6,  95.4e3,  147e3,   158e3,  2.37e11, 44.0, 146.0, 37.8},
    {"W410X46",  404.0, 140.0, 11.2,  7.0, 5890.0, 156e6,   773e3,  885e3,  5.16e6,  73.6e3,  115e3,   192e3,  1.99e11, 46.1, 163.0, 29.6},
    {"W460X52",  450.0, 152.0, 10.8,  7.6, 6650.0, 212e6,   944e3, 1090e3,  6.37e6,  83.9e3,  132e3,   211e3,  3.07e11, 52.0, 179.0, 30.9},
    {"W530X66",  526.0, 165.0, 11.4,  8.9, 8390.0, 351e6,  1340e3, 1560e3,  8.62e6,  104e3,   167e3,   320e3,  5.71e11, 65.5, 205.0, 32.0},
};

SteelSection rolled_section(const RolledShape& s) {
    SteelSection sec(s.id, SectionType::WideFlange, CatalogOrigin::AISC, s.A, s.Ix, s.Iy);
    sec.set_plate_dimensions(s.d, s.bf, s.tf, s.tw);
    sec.set_moduli(s.Sx, s.Sy, s.Zx, s.Zy);
    sec.set_torsion(s.J, s.Cw);
    sec.weight = s.weight;
    sec.catalog_rx = s.rx;
    sec.catalog_ry = s.ry;
    return sec;
}

} // namespace

bool SectionFilter::matches(const SteelSection& section) const {
    if (type && section.type != *type) return false;
    if (origin && section.origin != *origin) return false;
    if (d_min && section.d < *d_min) return false;
    if (d_max && section.d > *d_max) return false;
    if (weight_min && section.weight < *weight_min) return false;
    if (weight_max && section.weight > *weight_max) return false;
    if (Ix_min && section.Ix < *Ix_min) return false;
    if (Iy_min && section.Iy < *Iy_min) return false;
    if (Zx_min && section.Zx < *Zx_min) return false;
    if (rx_min && section.rx() < *rx_min) return false;
    if (ry_min && section.ry() < *ry_min) return false;
    return true;
}

void SectionCatalog::add(const SteelSection& section) {
    WarningList section_warnings = section.validate();
    std::string key = to_upper(section.id);
    if (index_.count(key) > 0) {
        CheckError err(ErrorCode::INVALID_PROPERTY, "Duplicate section identifier");
        err.field = "id";
        err.value = section.id;
        throw CheckException(err);
    }
    index_.emplace(key, sections_.size());
    sections_.push_back(section);
    warnings_.merge(section_warnings);
}

const SteelSection* SectionCatalog::find(const std::string& id) const {
    auto it = index_.find(to_upper(id));
    return it == index_.end() ? nullptr : &sections_[it->second];
}

const SteelSection& SectionCatalog::get(const std::string& id) const {
    const SteelSection* section = find(id);
    if (!section) {
        throw CheckException(CheckError::section_not_found(id));
    }
    return *section;
}

std::vector<std::string> SectionCatalog::ids() const {
    std::vector<std::string> result;
    result.reserve(sections_.size());
    for (const auto& s : sections_) {
        result.push_back(s.id);
    }
    return result;
}

std::vector<const SteelSection*> SectionCatalog::filter(const SectionFilter& filter) const {
    std::vector<const SteelSection*> result;
    for (const auto& s : sections_) {
        if (result.size() >= filter.limit) break;
        if (filter.matches(s)) {
            result.push_back(&s);
        }
    }
    return result;
}

const SectionCatalog& default_sections() {
    static const SectionCatalog catalog = [] {
        SectionCatalog c;
        const CatalogOrigin aisc = CatalogOrigin::AISC;
        const CatalogOrigin chile = CatalogOrigin::Chilean;

        for (const auto& shape : kRolledShapes) {
            c.add(rolled_section(shape));
        }

        // Square and rectangular HSS
        c.add(SteelSection::rectangular_hollow("HSS102X102X4.8", aisc, 102.0, 102.0, 4.8));
        c.add(SteelSection::rectangular_hollow("HSS152X152X6.4", aisc, 152.0, 152.0, 6.4));
        c.add(SteelSection::rectangular_hollow("HSS203X102X6.4", aisc, 203.0, 102.0, 6.4));
        c.add(SteelSection::rectangular_hollow("HSS254X152X9.5", aisc, 254.0, 152.0, 9.5));

        // Round HSS and pipe
        c.add(SteelSection::round_hollow("HSS114.3X6.0", aisc, 114.3, 6.0));
        c.add(SteelSection::round_hollow("HSS168.3X6.4", aisc, 168.3, 6.4));
        c.add(SteelSection::round_hollow("HSS219.1X8.2", aisc, 219.1, 8.2));

        // Channels (uniform flange thickness)
        c.add(SteelSection::channel("C200X17.1", aisc, 203.0, 57.0, 9.9, 5.6));
        c.add(SteelSection::channel("C250X22.8", aisc, 254.0, 66.0, 11.1, 6.1));
        c.add(SteelSection::channel("C310X30.8", aisc, 305.0, 74.0, 12.7, 7.2));

        // Equal-leg angles
        c.add(SteelSection::equal_angle("L76X76X6.4", aisc, 76.0, 6.4));
        c.add(SteelSection::equal_angle("L102X102X9.5", aisc, 102.0, 9.5));
        c.add(SteelSection::equal_angle("L152X152X12.7", aisc, 152.0, 12.7));

        // Chilean welded shapes (NCh): IN = beam series, HN = column series
        c.add(SteelSection::welded_i("IN30X36.7", chile, 300.0, 150.0, 10.0, 6.0));
        c.add(SteelSection::welded_i("IN40X61.3", chile, 400.0, 200.0, 12.0, 8.0));
        c.add(SteelSection::welded_i("IN50X92.2", chile, 500.0, 250.0, 16.0, 8.0));
        c.add(SteelSection::welded_i("HN25X61.3", chile, 250.0, 250.0, 12.0, 8.0));

        return c;
    }();
    return catalog;
}

} // namespace steelcheck
