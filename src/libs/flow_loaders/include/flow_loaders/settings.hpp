#pragma once

#include <flow_groups/halos.hpp>
#include <flow_model/geometry.hpp>
#include <flow_placement/layered_layout.hpp>
#include <istream>
#include <optional>
#include <string>

namespace flow_loaders {

struct EngineSettings {
    flow_groups::HaloPaddingConfig halo_padding;
    flow_placement::LayoutSpacing spacing;
    flow_placement::LayoutDirection direction = flow_placement::LayoutDirection::LeftToRight;
    flow_model::NodeDimensions dimensions;

    flow_placement::LayoutOptions layout_options() const;
};

// Keys present in the document override the defaults one by one; keys with the
// wrong type or an out-of-range value keep the default. nullopt only when the
// document is not a JSON object.
std::optional<EngineSettings> load_engine_settings_from_json(std::istream& in);
std::optional<EngineSettings> load_engine_settings_from_json_file(const std::string& path);

} // namespace flow_loaders
