#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "timeline/timeline_baker.hpp"

namespace flatrig::io {

// "#RRGGBB" swatch for the layer at `layer_index` in output order.
std::string layer_color(std::size_t layer_index);

nlohmann::json matrix_to_json(const rig::Affine2D& m);

// Layers are emitted in the timeline's stacking order; absent frames carry only
// their index and `present: false`.
nlohmann::json to_json(const timeline::BakedTimeline& baked);

// Throws std::runtime_error when the file cannot be written.
void write_baked_timeline(const std::filesystem::path& path, const timeline::BakedTimeline& baked, int indent = 2);

}
