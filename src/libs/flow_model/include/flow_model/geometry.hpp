#pragma once

#include <flow_model/types.hpp>
#include <functional>
#include <string>
#include <unordered_map>

namespace flow_model {

struct Size {
    double width = 0;
    double height = 0;

    bool operator==(const Size&) const = default;
};

struct Rect {
    double x = 0;
    double y = 0;
    double width = 0;
    double height = 0;

    double right() const { return x + width; }
    double bottom() const { return y + height; }
    double area() const { return width * height; }

    bool operator==(const Rect&) const = default;
};

// Supplied by the rendering layer; the engine has no opinion on units.
using DimensionsFn = std::function<Size(const Node&)>;

// Default node size plus per-node overrides, matching the editor's visual settings.
struct NodeDimensions {
    Size default_size{ 172, 36 };
    std::unordered_map<std::string, Size> overrides;

    Size operator()(const Node& node) const {
        auto it = overrides.find(node.id);
        if (it != overrides.end()) return it->second;
        return default_size;
    }
};

inline DimensionsFn uniform_dimensions(Size size) {
    return [size](const Node&) { return size; };
}

} // namespace flow_model
