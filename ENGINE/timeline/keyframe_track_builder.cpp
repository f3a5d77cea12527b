#include "timeline/keyframe_track_builder.hpp"

#include <unordered_map>
#include <unordered_set>

namespace flatrig::timeline {

std::vector<std::string> select_layers(const catalog::PieceCatalog& catalog,
                                       const std::map<std::string, std::size_t>& occurrences,
                                       const std::vector<std::string>& allow_list,
                                       bool include_unused) {
    std::vector<std::string> layers;
    if (!allow_list.empty()) {
        std::unordered_set<std::string> allowed;
        for (const auto& raw : allow_list) {
            allowed.insert(catalog::normalize_piece_name(raw));
        }
        for (const auto& entry : catalog.entries()) {
            if (allowed.count(entry.name) != 0) {
                layers.push_back(entry.name);
            }
        }
        return layers;
    }

    for (const auto& entry : catalog.entries()) {
        if (include_unused) {
            layers.push_back(entry.name);
            continue;
        }
        auto it = occurrences.find(entry.name);
        if (it != occurrences.end() && it->second > 0) {
            layers.push_back(entry.name);
        }
    }
    return layers;
}

std::vector<KeyframeTrack> build_keyframe_tracks(const std::vector<rig::FlatFrame>& frames,
                                                 const std::vector<std::string>& layers,
                                                 const InstanceCompositor& compositor) {
    std::vector<KeyframeTrack> tracks(layers.size());
    std::unordered_map<std::string, std::size_t> track_index;
    track_index.reserve(layers.size());
    for (std::size_t i = 0; i < layers.size(); ++i) {
        tracks[i].piece = layers[i];
        tracks[i].slots.resize(frames.size());
        track_index.emplace(layers[i], i);
    }

    for (std::size_t fi = 0; fi < frames.size(); ++fi) {
        for (const auto& instance : frames[fi]) {
            auto it = track_index.find(instance.piece_name);
            if (it == track_index.end()) {
                continue;
            }
            KeyframeSlot& slot = tracks[it->second].slots[fi];
            slot.present = true;
            slot.matrix  = compositor.compose(instance.piece_name, instance.world_matrix);
            slot.alpha   = instance.world_alpha;
        }
    }
    return tracks;
}

}
