#include <flow_loaders/settings.hpp>
#include <flow_model/log.hpp>
#include <nlohmann/json.hpp>
#include <cmath>
#include <fstream>

namespace flow_loaders {

namespace {

using nlohmann::json;

// Overwrites target when key holds a finite number >= min_value.
void merge_number(const json& j, const char* key, double& target, double min_value = 0.0) {
    if (!j.contains(key)) return;
    const auto& v = j[key];
    if (!v.is_number() || !std::isfinite(v.get<double>()) || v.get<double>() < min_value) {
        flow_model::engine_logger()->warn("Ignoring setting {}: expected a number >= {}", key, min_value);
        return;
    }
    target = v.get<double>();
}

void merge_axis(const json& j, const char* key, flow_groups::HaloAxisPadding& axis) {
    if (!j.contains(key) || !j[key].is_object()) return;
    const auto& a = j[key];
    merge_number(a, "base", axis.base);
    merge_number(a, "increment", axis.increment);
    merge_number(a, "decay", axis.decay);
    merge_number(a, "minStep", axis.min_step);
}

void merge_size(const json& j, flow_model::Size& size) {
    merge_number(j, "width", size.width);
    merge_number(j, "height", size.height);
}

EngineSettings parse_settings_json(const json& j) {
    EngineSettings out;

    if (j.contains("halo") && j["halo"].is_object() && j["halo"].contains("padding")
        && j["halo"]["padding"].is_object())
    {
        const auto& padding = j["halo"]["padding"];
        merge_axis(padding, "x", out.halo_padding.x);
        merge_axis(padding, "y", out.halo_padding.y);
    }

    if (j.contains("layout") && j["layout"].is_object()) {
        const auto& layout = j["layout"];
        if (layout.contains("direction")) {
            const std::string dir = layout["direction"].is_string() ? layout["direction"].get<std::string>() : "";
            if (dir == "LR") {
                out.direction = flow_placement::LayoutDirection::LeftToRight;
            } else if (dir == "TB") {
                out.direction = flow_placement::LayoutDirection::TopToBottom;
            } else {
                flow_model::engine_logger()->warn("Ignoring layout.direction: expected \"LR\" or \"TB\"");
            }
        }
        merge_number(layout, "rankSep", out.spacing.rank_sep);
        merge_number(layout, "nodeSep", out.spacing.node_sep);
        merge_number(layout, "memberGap", out.spacing.member_gap);
        merge_number(layout, "componentGap", out.spacing.component_gap);
    }

    if (j.contains("nodeDimensions") && j["nodeDimensions"].is_object()) {
        const auto& dims = j["nodeDimensions"];
        merge_size(dims, out.dimensions.default_size);
        if (dims.contains("overrides") && dims["overrides"].is_object()) {
            for (const auto& [id, value] : dims["overrides"].items()) {
                if (!value.is_object()) continue;
                flow_model::Size size = out.dimensions.default_size;
                merge_size(value, size);
                out.dimensions.overrides[id] = size;
            }
        }
    }
    return out;
}

} // namespace

flow_placement::LayoutOptions EngineSettings::layout_options() const {
    flow_placement::LayoutOptions options;
    options.direction = direction;
    options.spacing = spacing;
    options.dimensions = dimensions;
    return options;
}

std::optional<EngineSettings> load_engine_settings_from_json(std::istream& in) {
    try {
        const json j = json::parse(in);
        if (!j.is_object()) return std::nullopt;
        return parse_settings_json(j);
    } catch (const json::exception& ex) {
        flow_model::engine_logger()->warn("Failed to parse settings JSON: {}", ex.what());
        return std::nullopt;
    }
}

std::optional<EngineSettings> load_engine_settings_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        flow_model::engine_logger()->warn("Cannot open settings file {}", path);
        return std::nullopt;
    }
    return load_engine_settings_from_json(f);
}

} // namespace flow_loaders
