#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "rig/affine.hpp"

namespace flatrig::timeline {

// Label name -> 1-based frame number, as authored.
using LabelTable = std::map<std::string, int>;

struct KeyframeSlot {
    bool present = false;
    rig::Affine2D matrix;
    double alpha = 1.0;
};

struct KeyframeTrack {
    std::string piece;
    std::vector<KeyframeSlot> slots;

    bool present_at(std::size_t frame) const {
        return frame < slots.size() && slots[frame].present;
    }

    std::size_t present_count() const {
        std::size_t count = 0;
        for (const auto& slot : slots) {
            if (slot.present) ++count;
        }
        return count;
    }
};

struct LabelSpan {
    std::size_t start_frame = 0;
    std::size_t duration_frames = 1;
    std::optional<std::string> name;
};

enum class LayerStacking {
    BottomToTop,
    TopToBottom,
};

}
