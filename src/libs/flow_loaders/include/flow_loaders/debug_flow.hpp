#pragma once

#include <flow_model/types.hpp>

namespace flow_loaders {

// Family-tree sample with an expanded group, a nested collapsed group and a
// cross-group chain. Derived flags are not computed yet.
flow_model::Flow generate_debug_flow();

} // namespace flow_loaders
