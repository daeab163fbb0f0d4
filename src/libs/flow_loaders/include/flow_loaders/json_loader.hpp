#pragma once

#include <flow_groups/halos.hpp>
#include <flow_model/types.hpp>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace flow_loaders {

// Editor wire format: {"nodes": [...], "edges": [...]}. Malformed input gives nullopt.
std::optional<flow_model::Flow> load_flow_from_json(std::istream& in);
std::optional<flow_model::Flow> load_flow_from_json_file(const std::string& path);

std::string flow_to_json_string(const flow_model::Flow& flow, int indent = 2);
std::string halos_to_json_string(const std::vector<flow_groups::Halo>& halos, int indent = 2);

} // namespace flow_loaders
