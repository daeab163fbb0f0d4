#pragma once

#include <flow_model/types.hpp>
#include <string>
#include <utility>
#include <vector>

namespace flow_groups {

struct ValidationResult {
    bool valid = true;
    std::string error;

    explicit operator bool() const { return valid; }

    static ValidationResult ok() { return {}; }
    static ValidationResult fail(std::string message) { return { false, std::move(message) }; }
};

// Pre-condition for grouping candidate_ids together. Sub-grouping (shared parent)
// and grouping group nodes are both allowed.
ValidationResult validate_membership(const std::vector<std::string>& candidate_ids,
    const std::vector<flow_model::Node>& nodes);

// Pre-condition for making node_id a direct member of group_id.
ValidationResult validate_attachment(const std::string& node_id, const std::string& group_id,
    const std::vector<flow_model::Node>& nodes);

struct HierarchyIssue {
    std::string code;    // dangling_parent, parent_not_group, parent_cycle, duplicate_id
    std::string node_id;
    std::string message;
};

struct HierarchyReport {
    std::vector<HierarchyIssue> issues;

    bool ok() const { return issues.empty(); }
};

// Read-side audit of stored data. Never throws; the engine still renders flows with issues.
HierarchyReport validate_hierarchy(const std::vector<flow_model::Node>& nodes);

} // namespace flow_groups
