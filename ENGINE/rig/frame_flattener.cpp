#include "rig/frame_flattener.hpp"

#include <algorithm>

namespace flatrig::rig {

FrameFlattener::FrameFlattener(const SharedAnimationTable& shared)
    : resolver_(shared) {
    depth_states_.reserve(32);
}

FlatFrame FrameFlattener::flatten(const Frame& frame, std::size_t frame_index) {
    FlatFrame out;
    flatten_into(frame, frame_index, out);
    return out;
}

void FrameFlattener::flatten_into(const Frame& frame, std::size_t frame_index, FlatFrame& out) {
    if (depth_states_.empty()) {
        depth_states_.resize(1);
    }
    depth_states_[0] = WorldState{};
    active_shared_.clear();
    for (const Node& root : frame.children) {
        visit(root, 0, frame_index, out);
    }
}

void FrameFlattener::visit(const Node& node, std::size_t depth, std::size_t frame_index, FlatFrame& out) {
    if (depth >= kMaxDepth) {
        ++truncated_;
        return;
    }
    if (depth_states_.size() < depth + 2) {
        depth_states_.resize(depth + 2);
    }

    const WorldState& parent = depth_states_[depth];
    WorldState& world = depth_states_[depth + 1];
    world.matrix = compose(parent.matrix, node.local_matrix);
    world.alpha  = compose_alpha(parent.alpha, node.color.alpha);

    if (!node.name.empty()) {
        out.push_back(FlatInstance{node.name, world.matrix, world.alpha});
    }

    const std::vector<Node>& children = resolver_.effective_children(node, frame_index);
    const bool substituted = &children != &node.children;
    if (substituted) {
        if (std::find(active_shared_.begin(), active_shared_.end(), &children) != active_shared_.end()) {
            ++truncated_;
            return;
        }
        active_shared_.push_back(&children);
    }
    for (const Node& child : children) {
        visit(child, depth + 1, frame_index, out);
    }
    if (substituted) {
        active_shared_.pop_back();
    }
}

std::vector<FlatFrame> flatten_timeline(const Timeline& timeline,
                                        const SharedAnimationTable& shared,
                                        std::size_t* truncated_branches) {
    FrameFlattener flattener(shared);
    std::vector<FlatFrame> frames(timeline.size());
    for (std::size_t fi = 0; fi < timeline.size(); ++fi) {
        flattener.flatten_into(timeline[fi], fi, frames[fi]);
    }
    if (truncated_branches) {
        *truncated_branches = flattener.truncated_branches();
    }
    return frames;
}

}
