#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "rig/rig_types.hpp"

namespace flatrig::rig {

class SharedAnimationResolver {
public:
    explicit SharedAnimationResolver(const SharedAnimationTable& table);

    // Returns the loop for `ref`, or nullptr when it is missing or has no frames.
    const std::vector<Frame>* find(const std::string& ref) const;

    // Loop frame selected at `outer_frame`, or nullopt when `ref` cannot be used.
    std::optional<std::size_t> loop_index(const std::string& ref, std::size_t outer_frame) const;

    // Children to walk beneath `node` at `outer_frame`. The node's own transform is
    // not affected; only its children are substituted. A loop frame without a
    // children list keeps the node's own children.
    const std::vector<Node>& effective_children(const Node& node, std::size_t outer_frame) const;

private:
    const SharedAnimationTable* table_ = nullptr;
};

}
