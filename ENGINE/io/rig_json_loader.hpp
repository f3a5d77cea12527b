#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "catalog/piece_catalog.hpp"
#include "rig/rig_types.hpp"
#include "timeline/timeline_types.hpp"

namespace flatrig::io {

constexpr double kDefaultStageSize = 390.0;

struct RigDocument {
    rig::Timeline frames;
    rig::SharedAnimationTable shared;
    catalog::PieceCatalog catalog;
    timeline::LabelTable labels;
    double width  = kDefaultStageSize;
    double height = kDefaultStageSize;
    // Where the frame list was found, e.g. "frames" or "$.clips[0].frames".
    std::string frames_path;
};

// Missing or malformed fields take their defaults; this never throws.
rig::Node parse_node(const nlohmann::json& node);
rig::Frame parse_frame(const nlohmann::json& frame);
catalog::PieceCatalog parse_catalog(const nlohmann::json& plist);
timeline::LabelTable parse_labels(const nlohmann::json& labels);

RigDocument parse_rig_document(const nlohmann::json& doc);

// Replaces the stage size. When only one side is given the other follows the
// document's aspect ratio.
void override_stage_size(RigDocument& doc, std::optional<double> width, std::optional<double> height);

// Throws std::runtime_error when the file cannot be opened or is not valid JSON.
RigDocument load_rig_document(const std::filesystem::path& path);

}
