#include <flow_loaders/json_loader.hpp>
#include <flow_model/log.hpp>
#include <nlohmann/json.hpp>
#include <fstream>

namespace flow_loaders {

namespace {

using nlohmann::json;

std::string string_or(const json& j, const char* key, const std::string& fallback) {
    return j.contains(key) && j[key].is_string() ? j[key].get<std::string>() : fallback;
}

bool bool_or(const json& j, const char* key, bool fallback) {
    return j.contains(key) && j[key].is_boolean() ? j[key].get<bool>() : fallback;
}

double number_or(const json& j, const char* key, double fallback) {
    return j.contains(key) && j[key].is_number() ? j[key].get<double>() : fallback;
}

std::optional<flow_model::Node> parse_node(const json& n) {
    if (!n.is_object() || !n.contains("id") || !n["id"].is_string()) return std::nullopt;

    flow_model::Node node;
    node.id = n["id"].get<std::string>();
    node.kind = string_or(n, "type", "default") == "group" ? flow_model::NodeKind::Group : flow_model::NodeKind::Regular;
    if (n.contains("position") && n["position"].is_object()) {
        node.position.x = number_or(n["position"], "x", 0);
        node.position.y = number_or(n["position"], "y", 0);
    }
    if (n.contains("data") && n["data"].is_object()) {
        const auto& data = n["data"];
        node.label = string_or(data, "label", "");
        node.subtree_collapsed = bool_or(data, "collapsed", false);
    }
    // null or missing parentGroupId -> top level
    if (n.contains("parentGroupId") && n["parentGroupId"].is_string())
        node.parent_group_id = n["parentGroupId"].get<std::string>();
    node.display_state = bool_or(n, "isCollapsed", false)
        ? flow_model::GroupDisplayState::Collapsed : flow_model::GroupDisplayState::Expanded;
    node.hidden = bool_or(n, "hidden", false);
    node.group_hidden = bool_or(n, "groupHidden", false);
    node.subtree_hidden = bool_or(n, "subtreeHidden", false);
    return node;
}

std::optional<flow_model::Edge> parse_edge(const json& e) {
    if (!e.is_object()) return std::nullopt;
    if (!e.contains("source") || !e["source"].is_string()) return std::nullopt;
    if (!e.contains("target") || !e["target"].is_string()) return std::nullopt;

    flow_model::Edge edge;
    edge.source = e["source"].get<std::string>();
    edge.target = e["target"].get<std::string>();
    edge.id = string_or(e, "id", edge.source + "-" + edge.target);
    if (e.contains("data") && e["data"].is_object()) {
        edge.label = string_or(e["data"], "label", "");
        edge.is_synthetic = bool_or(e["data"], "isSyntheticGroupEdge", false);
    }
    edge.hidden = bool_or(e, "hidden", false);
    edge.group_hidden = bool_or(e, "groupHidden", false);
    return edge;
}

std::optional<flow_model::Flow> parse_flow_json(const json& j) {
    if (!j.is_object() || !j.contains("nodes") || !j["nodes"].is_array()) return std::nullopt;

    flow_model::Flow out;
    for (const auto& n : j["nodes"]) {
        auto node = parse_node(n);
        if (!node) return std::nullopt;
        out.nodes.push_back(std::move(*node));
    }
    if (j.contains("edges")) {
        if (!j["edges"].is_array()) return std::nullopt;
        for (const auto& e : j["edges"]) {
            auto edge = parse_edge(e);
            if (!edge) return std::nullopt;
            out.edges.push_back(std::move(*edge));
        }
    }
    return out;
}

json node_to_json(const flow_model::Node& n) {
    json j;
    j["id"] = n.id;
    j["type"] = n.is_group() ? "group" : "default";
    j["position"] = { { "x", n.position.x }, { "y", n.position.y } };
    j["data"] = { { "label", n.label } };
    if (n.subtree_collapsed) j["data"]["collapsed"] = true;
    j["parentGroupId"] = n.parent_group_id ? json(*n.parent_group_id) : json(nullptr);
    if (n.is_group()) j["isCollapsed"] = n.is_collapsed();
    j["hidden"] = n.hidden;
    j["groupHidden"] = n.group_hidden;
    if (n.subtree_hidden) j["subtreeHidden"] = true;
    return j;
}

json edge_to_json(const flow_model::Edge& e) {
    json j;
    j["id"] = e.id;
    j["source"] = e.source;
    j["target"] = e.target;
    j["data"] = json::object();
    if (!e.label.empty()) j["data"]["label"] = e.label;
    if (e.is_synthetic) j["data"]["isSyntheticGroupEdge"] = true;
    j["hidden"] = e.hidden;
    j["groupHidden"] = e.group_hidden;
    return j;
}

} // namespace

std::optional<flow_model::Flow> load_flow_from_json(std::istream& in) {
    try {
        const json j = json::parse(in);
        auto flow = parse_flow_json(j);
        if (!flow) flow_model::engine_logger()->warn("Flow JSON does not match the expected shape");
        return flow;
    } catch (const json::exception& ex) {
        flow_model::engine_logger()->warn("Failed to parse flow JSON: {}", ex.what());
        return std::nullopt;
    }
}

std::optional<flow_model::Flow> load_flow_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        flow_model::engine_logger()->warn("Cannot open flow file {}", path);
        return std::nullopt;
    }
    return load_flow_from_json(f);
}

std::string flow_to_json_string(const flow_model::Flow& flow, int indent) {
    json j;
    j["nodes"] = json::array();
    j["edges"] = json::array();
    for (const auto& n : flow.nodes) j["nodes"].push_back(node_to_json(n));
    for (const auto& e : flow.edges) j["edges"].push_back(edge_to_json(e));
    return j.dump(indent);
}

std::string halos_to_json_string(const std::vector<flow_groups::Halo>& halos, int indent) {
    json j = json::array();
    for (const auto& h : halos) {
        j.push_back({
            { "groupId", h.group_id },
            { "label", h.label },
            { "bounds", { { "x", h.bounds.x }, { "y", h.bounds.y },
                { "width", h.bounds.width }, { "height", h.bounds.height } } },
        });
    }
    return j.dump(indent);
}

} // namespace flow_loaders
