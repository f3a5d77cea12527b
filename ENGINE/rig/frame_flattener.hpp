#pragma once

#include <cstddef>
#include <vector>

#include "rig/rig_types.hpp"
#include "rig/shared_animation_resolver.hpp"

namespace flatrig::rig {

// Walks one outer frame of the rig and emits every named node with its world
// transform and world alpha, in depth-first visitation order.
class FrameFlattener {
public:
    static constexpr std::size_t kMaxDepth = 512;

    explicit FrameFlattener(const SharedAnimationTable& shared);

    FlatFrame flatten(const Frame& frame, std::size_t frame_index);
    void flatten_into(const Frame& frame, std::size_t frame_index, FlatFrame& out);

    // Subtrees skipped because they were nested deeper than kMaxDepth or would
    // re-enter a shared frame already being walked.
    std::size_t truncated_branches() const { return truncated_; }

private:
    struct WorldState {
        Affine2D matrix;
        double alpha = 1.0;
    };

    void visit(const Node& node, std::size_t depth, std::size_t frame_index, FlatFrame& out);

    SharedAnimationResolver resolver_;
    // One accumulator per depth; slot 0 is the frame root.
    std::vector<WorldState> depth_states_;
    // Shared child lists substituted on the current path, outermost first.
    std::vector<const std::vector<Node>*> active_shared_;
    std::size_t truncated_ = 0;
};

std::vector<FlatFrame> flatten_timeline(const Timeline& timeline,
                                        const SharedAnimationTable& shared,
                                        std::size_t* truncated_branches = nullptr);

}
