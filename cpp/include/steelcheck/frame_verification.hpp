#pragma once

#include "steelcheck/compression.hpp"
#include "steelcheck/demand.hpp"
#include "steelcheck/member_checks.hpp"
#include "steelcheck/section_catalog.hpp"

#include <Eigen/Dense>

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace steelcheck {

/**
 * @brief Role of a frame element, selecting the checks it receives
 */
enum class MemberRole {
    Beam,       ///< Flexure and shear
    Column,     ///< Compression, flexure and interaction
    Brace       ///< Checked like a column
};

std::string member_role_to_string(MemberRole role);

/// Parse "beam", "column" or "brace" (case-insensitive)
MemberRole parse_member_role(const std::string& name);

/**
 * @brief Node of a 2D frame
 *
 * Coordinates are in meters [m]. A node without support is a joint of the
 * frame.
 */
struct FrameNode {
    int id = 0;
    double x = 0.0;
    double y = 0.0;
    std::optional<EndCondition> support;

    FrameNode() = default;
    FrameNode(int id, double x, double y, std::optional<EndCondition> support = std::nullopt)
        : id(id), x(x), y(y), support(support) {}

    Eigen::Vector2d position() const { return Eigen::Vector2d(x, y); }
};

/**
 * @brief Element of a 2D frame between two nodes
 */
struct FrameElement {
    int id = 0;
    int node_i = 0;
    int node_j = 0;
    std::string section_id;
    MemberRole role = MemberRole::Beam;
    std::optional<double> unbraced_length;  ///< [m]; element length if not set

    FrameElement() = default;
    FrameElement(int id, int node_i, int node_j, std::string section_id, MemberRole role)
        : id(id), node_i(node_i), node_j(node_j), section_id(std::move(section_id)), role(role) {}
};

/**
 * @brief Geometry of a 2D frame
 */
class FrameModel {
public:
    FrameModel() = default;

    /**
     * @brief Add a node
     *
     * @throws CheckException (INVALID_GEOMETRY) for duplicate ids or
     *         non-finite coordinates
     */
    void add_node(const FrameNode& node);

    /**
     * @brief Add an element
     *
     * @throws CheckException (INVALID_GEOMETRY) for duplicate ids
     */
    void add_element(const FrameElement& element);

    /// Node by id, nullptr if not present
    const FrameNode* find_node(int id) const;

    /**
     * @brief Node by id
     *
     * @param element_id Element referencing the node, for the error message
     * @throws CheckException (NODE_NOT_FOUND)
     */
    const FrameNode& get_node(int id, int element_id) const;

    const std::vector<FrameNode>& nodes() const { return nodes_; }
    const std::vector<FrameElement>& elements() const { return elements_; }

    /**
     * @brief Distance between the element's nodes [m]
     *
     * @throws CheckException (NODE_NOT_FOUND)
     */
    double element_length(const FrameElement& element) const;

    /**
     * @brief Effective length factor of a column or brace
     *
     * Taken from the end-condition table when both end nodes are supports
     * forming a tabulated pair; 1.0 otherwise (ends braced by the frame).
     */
    double effective_length_factor(const FrameElement& element) const;

private:
    std::vector<FrameNode> nodes_;
    std::vector<FrameElement> elements_;
    std::map<int, size_t> node_index_;
};

/**
 * @brief Verification of one frame element
 */
struct ElementVerification {
    int element_id = 0;
    MemberRole role = MemberRole::Beam;
    std::string section_id;
    double length = 0.0;                    ///< [m]
    double K = 1.0;                         ///< Effective length factor (columns and braces)
    double N = 0.0;                         ///< max |N| [kN]
    double V = 0.0;                         ///< max |V| [kN]
    double M = 0.0;                         ///< max |M| [kN·m]
    std::optional<BeamCheckResult> beam;
    std::optional<ColumnCheckResult> column;
    WarningList warnings;
    bool overall_ok = true;
    double max_ratio = 0.0;
    std::string governing;
};

/**
 * @brief Verify every element of a frame from solver end forces
 *
 * Beams get flexure (Lb = unbraced length or element length) and shear.
 * Columns and braces get compression with the axial magnitude as demand,
 * flexure and interaction. Elements without end forces are verified with
 * zero demand and carry a ZERO_DEMAND warning.
 *
 * @param end_forces End forces keyed by element id
 * @return One verification per element, in element order
 * @throws CheckException (NODE_NOT_FOUND, SECTION_NOT_FOUND) for unknown references
 */
std::vector<ElementVerification> verify_frame(
    const FrameModel& model,
    const std::map<int, ElementEndForces>& end_forces,
    const SteelMaterial& material,
    const DesignConfig& config = DesignConfig(),
    const SectionCatalog& catalog = default_sections());

} // namespace steelcheck
