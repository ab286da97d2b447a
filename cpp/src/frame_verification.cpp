#include "steelcheck/frame_verification.hpp"
#include "steelcheck/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace steelcheck {

std::string member_role_to_string(MemberRole role) {
    switch (role) {
        case MemberRole::Beam: return "beam";
        case MemberRole::Column: return "column";
        case MemberRole::Brace: return "brace";
        default: return "unknown";
    }
}

MemberRole parse_member_role(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (lower == "beam") return MemberRole::Beam;
    if (lower == "column") return MemberRole::Column;
    if (lower == "brace") return MemberRole::Brace;
    throw CheckException(CheckError::unsupported("element_type", name,
        "element type must be beam, column or brace"));
}

void FrameModel::add_node(const FrameNode& node) {
    if (!std::isfinite(node.x) || !std::isfinite(node.y)) {
        throw CheckException(CheckError::invalid_geometry("node", node.id,
            "node coordinates must be finite"));
    }
    if (node_index_.count(node.id) > 0) {
        throw CheckException(CheckError::invalid_geometry("node", node.id,
            "duplicate node id"));
    }
    node_index_[node.id] = nodes_.size();
    nodes_.push_back(node);
}

void FrameModel::add_element(const FrameElement& element) {
    for (const auto& e : elements_) {
        if (e.id == element.id) {
            throw CheckException(CheckError::invalid_geometry("element", element.id,
                "duplicate element id"));
        }
    }
    elements_.push_back(element);
}

const FrameNode* FrameModel::find_node(int id) const {
    auto it = node_index_.find(id);
    if (it == node_index_.end()) return nullptr;
    return &nodes_[it->second];
}

const FrameNode& FrameModel::get_node(int id, int element_id) const {
    const FrameNode* node = find_node(id);
    if (!node) {
        throw CheckException(CheckError::node_not_found(id, element_id));
    }
    return *node;
}

double FrameModel::element_length(const FrameElement& element) const {
    Eigen::Vector2d diff = get_node(element.node_j, element.id).position()
                         - get_node(element.node_i, element.id).position();
    return diff.norm();
}

double FrameModel::effective_length_factor(const FrameElement& element) const {
    const FrameNode& ni = get_node(element.node_i, element.id);
    const FrameNode& nj = get_node(element.node_j, element.id);
    if (ni.support && nj.support) {
        if (auto K = lookup_effective_length_factor(*ni.support, *nj.support)) {
            return *K;
        }
    }
    return 1.0;
}

std::vector<ElementVerification> verify_frame(const FrameModel& model,
                                              const std::map<int, ElementEndForces>& end_forces,
                                              const SteelMaterial& material,
                                              const DesignConfig& config,
                                              const SectionCatalog& catalog) {
    std::vector<ElementVerification> results;
    results.reserve(model.elements().size());

    for (const auto& element : model.elements()) {
        const SteelSection& section = catalog.get(element.section_id);

        ElementVerification v;
        v.element_id = element.id;
        v.role = element.role;
        v.section_id = section.id;
        v.length = model.element_length(element);
        if (!(v.length > 0.0)) {
            throw CheckException(CheckError::invalid_geometry("element", element.id,
                "element has zero length"));
        }

        ElementEndForces forces;
        auto it = end_forces.find(element.id);
        if (it != end_forces.end()) {
            forces = it->second;
        } else {
            v.warnings.add(CheckWarning::zero_demand("element " + std::to_string(element.id)));
        }
        v.N = forces.max_axial();
        v.V = forces.max_shear();
        v.M = forces.max_moment();

        if (element.role == MemberRole::Beam) {
            BeamDemand demand;
            demand.Mu = v.M;
            demand.Vu = v.V;
            demand.L = v.length;
            demand.Lb = element.unbraced_length;
            BeamCheckResult beam = verify_beam(section, material, demand, config);
            v.overall_ok = beam.overall_ok;
            v.max_ratio = beam.max_ratio;
            v.governing = beam.governing;
            v.beam = std::move(beam);
        } else {
            v.K = model.effective_length_factor(element);
            ColumnDemand demand;
            demand.Pu = v.N;
            demand.Mu_base = forces.M_i;
            demand.Mu_top = forces.M_j;
            demand.L = v.length;
            demand.K = v.K;
            demand.Lb = element.unbraced_length;
            ColumnCheckResult column = verify_column(section, material, demand, config);
            v.overall_ok = column.overall_ok;
            v.max_ratio = column.max_ratio;
            v.governing = column.governing;
            v.column = std::move(column);
        }
        results.push_back(std::move(v));
    }
    return results;
}

} // namespace steelcheck
