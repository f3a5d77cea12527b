#include "io/baked_timeline_writer.hpp"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "utils/log.hpp"

namespace flatrig::io {
namespace {

const char* stacking_name(timeline::LayerStacking stacking) {
    return stacking == timeline::LayerStacking::TopToBottom ? "top_first" : "bottom_first";
}

nlohmann::json diagnostics_to_json(const timeline::BakeDiagnostics& diagnostics) {
    nlohmann::json usage = nlohmann::json::array();
    for (const auto& row : diagnostics.usage) {
        usage.push_back({
            {"name", row.name},
            {"occurrences", row.occurrences},
            {"layered", row.layered}
        });
    }
    nlohmann::json out = nlohmann::json::object();
    out["usage"] = std::move(usage);
    out["unmatched"] = diagnostics.unmatched;
    out["truncated_branches"] = diagnostics.truncated_branches;
    return out;
}

}

std::string layer_color(std::size_t layer_index) {
    const unsigned long value = 0x444444UL + (static_cast<unsigned long>(layer_index) * 123457UL) % 0xBBBBBBUL;
    char buffer[8];
    std::snprintf(buffer, sizeof(buffer), "#%06lX", value & 0xFFFFFFUL);
    return std::string(buffer);
}

nlohmann::json matrix_to_json(const rig::Affine2D& m) {
    return nlohmann::json{
        {"a", m.a}, {"b", m.b}, {"c", m.c}, {"d", m.d}, {"tx", m.tx}, {"ty", m.ty}
    };
}

nlohmann::json to_json(const timeline::BakedTimeline& baked) {
    nlohmann::json out = nlohmann::json::object();
    out["frame_count"] = baked.frame_count;
    out["frame_rate"] = baked.frame_rate;
    out["primary_label"] = baked.primary_label;
    out["layer_order"] = stacking_name(baked.stacking);
    out["stage"] = {{"width", baked.stage_width}, {"height", baked.stage_height}};

    nlohmann::json layers = nlohmann::json::array();
    std::size_t layer_index = 0;
    for (const auto& name : baked.stacked_layers()) {
        const timeline::KeyframeTrack* track = baked.track(name);
        if (!track) {
            continue;
        }
        nlohmann::json frames = nlohmann::json::array();
        for (std::size_t fi = 0; fi < track->slots.size(); ++fi) {
            const auto& slot = track->slots[fi];
            nlohmann::json frame = {{"index", fi}, {"present", slot.present}};
            if (slot.present) {
                frame["matrix"] = matrix_to_json(slot.matrix);
                frame["alpha"] = slot.alpha;
            }
            frames.push_back(std::move(frame));
        }
        layers.push_back({
            {"name", name},
            {"color", layer_color(layer_index++)},
            {"frames", std::move(frames)}
        });
    }
    out["layers"] = std::move(layers);

    nlohmann::json labels = nlohmann::json::array();
    for (const auto& span : baked.labels) {
        nlohmann::json entry = {{"index", span.start_frame}, {"duration", span.duration_frames}};
        if (span.name) {
            entry["name"] = *span.name;
        }
        labels.push_back(std::move(entry));
    }
    out["labels"] = std::move(labels);
    out["diagnostics"] = diagnostics_to_json(baked.diagnostics);
    return out;
}

void write_baked_timeline(const std::filesystem::path& path, const timeline::BakedTimeline& baked, int indent) {
    const auto parent = path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec && !std::filesystem::exists(parent)) {
            std::ostringstream oss;
            oss << "Failed to create output directory '" << parent.string() << "': " << ec.message();
            throw std::runtime_error(oss.str());
        }
    }

    std::ofstream out(path);
    if (!out.is_open()) {
        std::ostringstream oss;
        oss << "Unable to open timeline file at '" << path.string() << "' for writing.";
        throw std::runtime_error(oss.str());
    }
    out << to_json(baked).dump(indent);
    if (!out.good()) {
        std::ostringstream oss;
        oss << "Failed while writing timeline file at '" << path.string() << "'.";
        throw std::runtime_error(oss.str());
    }
    flatrig::log::info("[TimelineWriter] Wrote " + std::to_string(baked.tracks.size()) + " layer(s) to '" +
                       path.string() + "'");
}

}
