#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "catalog/piece_catalog.hpp"
#include "rig/rig_types.hpp"
#include "timeline/instance_compositor.hpp"
#include "timeline/timeline_types.hpp"

namespace flatrig::timeline {

// Catalog names that get a track, in catalog order.
//  - non-empty `allow_list`: catalog names whose normalized form is listed;
//  - `include_unused`: every catalog name;
//  - otherwise: catalog names with at least one occurrence.
std::vector<std::string> select_layers(const catalog::PieceCatalog& catalog,
                                       const std::map<std::string, std::size_t>& occurrences,
                                       const std::vector<std::string>& allow_list,
                                       bool include_unused);

// One track per entry of `layers`, in the same order, each `frames.size()` slots
// long. When a piece occurs several times in one frame the last instance is kept.
std::vector<KeyframeTrack> build_keyframe_tracks(const std::vector<rig::FlatFrame>& frames,
                                                 const std::vector<std::string>& layers,
                                                 const InstanceCompositor& compositor);

}
