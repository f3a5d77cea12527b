#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "rig/affine.hpp"

namespace flatrig::rig {

// Tint multipliers as authored. Only `alpha` takes part in flattening.
struct ColorMultipliers {
    double red   = 1.0;
    double green = 1.0;
    double blue  = 1.0;
    double alpha = 1.0;
};

struct Node {
    std::string name;
    Affine2D local_matrix;
    ColorMultipliers color;
    std::vector<Node> children;
    std::optional<std::string> shared_animation_ref;

    bool has_shared_reference() const { return shared_animation_ref.has_value(); }
};

struct Frame {
    std::vector<Node> children;
    // False when the source frame had no children list. A shared frame like
    // that leaves the referencing node's own children in place.
    bool has_children = true;
};

using Timeline = std::vector<Frame>;

// Shared loops keyed by identifier. Each loop has its own frame count.
using SharedAnimationTable = std::unordered_map<std::string, std::vector<Frame>>;

struct FlatInstance {
    std::string piece_name;
    Affine2D world_matrix;
    double world_alpha = 1.0;
};

using FlatFrame = std::vector<FlatInstance>;

}
