#include "timeline/draw_order.hpp"

#include <unordered_set>

namespace flatrig::timeline {

std::vector<std::string> first_visit_order(const rig::FlatFrame& frame) {
    std::vector<std::string> order;
    std::unordered_set<std::string> seen;
    for (const auto& instance : frame) {
        if (instance.piece_name.empty()) continue;
        if (seen.insert(instance.piece_name).second) {
            order.push_back(instance.piece_name);
        }
    }
    return order;
}

std::vector<std::string> resolve_draw_order(const rig::FlatFrame& frame_zero,
                                            const std::vector<std::string>& layers) {
    const std::unordered_set<std::string> layer_set(layers.begin(), layers.end());
    std::unordered_set<std::string> placed;
    std::vector<std::string> order;
    order.reserve(layer_set.size());

    for (const auto& name : first_visit_order(frame_zero)) {
        if (layer_set.count(name) != 0) {
            placed.insert(name);
            order.push_back(name);
        }
    }
    for (const auto& name : layers) {
        if (placed.insert(name).second) {
            order.push_back(name);
        }
    }
    return order;
}

std::vector<std::string> stacked(const std::vector<std::string>& bottom_to_top, LayerStacking stacking) {
    if (stacking == LayerStacking::BottomToTop) {
        return bottom_to_top;
    }
    return std::vector<std::string>(bottom_to_top.rbegin(), bottom_to_top.rend());
}

}
