#pragma once

#include <string>
#include <vector>

#include "rig/rig_types.hpp"
#include "timeline/timeline_types.hpp"

namespace flatrig::timeline {

// Distinct names of `frame` in first-visit order.
std::vector<std::string> first_visit_order(const rig::FlatFrame& frame);

// Bottom-to-top stacking for `layers`. Layers seen in `frame_zero` come first in
// their visit order; the rest follow in the order `layers` lists them.
// Names in `frame_zero` that are not layers are ignored.
std::vector<std::string> resolve_draw_order(const rig::FlatFrame& frame_zero,
                                            const std::vector<std::string>& layers);

// Returns `bottom_to_top` as is, or reversed for top-first layer enumeration.
std::vector<std::string> stacked(const std::vector<std::string>& bottom_to_top, LayerStacking stacking);

}
