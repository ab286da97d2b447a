#include "steelcheck/material.hpp"
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

} // namespace

SteelMaterial::SteelMaterial(std::string id, std::string name, double Fy, double Fu,
                             double E, double G, double nu, double rho)
    : id(std::move(id)), name(std::move(name)), Fy(Fy), Fu(Fu),
      E(E), G(G), nu(nu), rho(rho) {
}

void SteelMaterial::validate() const {
    if (!(Fy > 0.0)) {
        throw CheckException(CheckError::invalid_property("Fy", Fy, "yield stress must be positive"));
    }
    if (!(Fu > 0.0)) {
        throw CheckException(CheckError::invalid_property("Fu", Fu, "ultimate strength must be positive"));
    }
    if (Fu < Fy) {
        throw CheckException(CheckError::invalid_property("Fu", Fu, "ultimate strength below yield stress"));
    }
    if (!(E > 0.0)) {
        throw CheckException(CheckError::invalid_property("E", E, "elastic modulus must be positive"));
    }
    if (!(G > 0.0)) {
        throw CheckException(CheckError::invalid_property("G", G, "shear modulus must be positive"));
    }
}

double SteelMaterial::compute_G(double E, double nu) {
    return E / (2.0 * (1.0 + nu));
}

void MaterialCatalog::add(const SteelMaterial& material) {
    material.validate();
    std::string key = to_upper(material.id);
    if (materials_.count(key) > 0) {
        CheckError err(ErrorCode::INVALID_PROPERTY, "Duplicate material identifier");
        err.field = "id";
        err.value = material.id;
        throw CheckException(err);
    }
    materials_.emplace(key, material);
}

const SteelMaterial* MaterialCatalog::find(const std::string& id) const {
    auto it = materials_.find(to_upper(id));
    return it == materials_.end() ? nullptr : &it->second;
}

const SteelMaterial& MaterialCatalog::get(const std::string& id) const {
    const SteelMaterial* material = find(id);
    if (!material) {
        throw CheckException(CheckError::material_not_found(id));
    }
    return *material;
}

std::vector<std::string> MaterialCatalog::ids() const {
    std::vector<std::string> result;
    result.reserve(materials_.size());
    for (const auto& kv : materials_) {
        result.push_back(kv.second.id);
    }
    return result;
}

const MaterialCatalog& default_materials() {
    static const MaterialCatalog catalog = [] {
        MaterialCatalog c;

        SteelMaterial a36("A36", "ASTM A36", 250.0, 400.0);
        a36.description = "Carbon structural steel";
        c.add(a36);

        SteelMaterial a572("A572_GR50", "ASTM A572 Grade 50", 345.0, 450.0);
        a572.description = "High-strength low-alloy steel";
        c.add(a572);

        SteelMaterial a992("A992", "ASTM A992", 345.0, 450.0);
        a992.description = "Steel for wide-flange shapes";
        c.add(a992);

        SteelMaterial a500b("A500_GR_B", "ASTM A500 Grade B", 290.0, 400.0);
        a500b.description = "Structural tubing";
        c.add(a500b);

        SteelMaterial a500c("A500_GR_C", "ASTM A500 Grade C", 317.0, 427.0);
        a500c.description = "High-strength structural tubing";
        c.add(a500c);

        SteelMaterial a42("A42_27ES", "A42-27ES (NCh 203)", 270.0, 420.0);
        a42.description = "Chilean structural steel (A36 equivalent)";
        c.add(a42);

        SteelMaterial a52("A52_34ES", "A52-34ES (NCh 203)", 340.0, 520.0);
        a52.description = "Chilean high-strength structural steel";
        c.add(a52);

        return c;
    }();
    return catalog;
}

} // namespace steelcheck
