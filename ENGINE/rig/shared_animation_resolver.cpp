#include "rig/shared_animation_resolver.hpp"

namespace flatrig::rig {

SharedAnimationResolver::SharedAnimationResolver(const SharedAnimationTable& table)
    : table_(&table) {}

const std::vector<Frame>* SharedAnimationResolver::find(const std::string& ref) const {
    auto it = table_->find(ref);
    if (it == table_->end() || it->second.empty()) {
        return nullptr;
    }
    return &it->second;
}

std::optional<std::size_t> SharedAnimationResolver::loop_index(const std::string& ref,
                                                               std::size_t outer_frame) const {
    const std::vector<Frame>* loop = find(ref);
    if (!loop) {
        return std::nullopt;
    }
    return outer_frame % loop->size();
}

const std::vector<Node>& SharedAnimationResolver::effective_children(const Node& node,
                                                                    std::size_t outer_frame) const {
    if (!node.shared_animation_ref) {
        return node.children;
    }
    const std::vector<Frame>* loop = find(*node.shared_animation_ref);
    if (!loop) {
        return node.children;
    }
    const Frame& shared_frame = (*loop)[outer_frame % loop->size()];
    return shared_frame.has_children ? shared_frame.children : node.children;
}

}
