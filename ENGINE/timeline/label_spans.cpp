#include "timeline/label_spans.hpp"

#include <algorithm>
#include <set>
#include <utility>

#include "utils/log.hpp"

namespace flatrig::timeline {

std::size_t label_start_frame(int one_based_frame) {
    return one_based_frame > 1 ? static_cast<std::size_t>(one_based_frame - 1) : 0;
}

std::vector<LabelSpan> build_label_spans(const LabelTable& labels, std::size_t frame_count) {
    std::vector<LabelSpan> spans;
    if (frame_count == 0) {
        return spans;
    }

    std::set<std::size_t> starts{0};
    for (const auto& [name, frame] : labels) {
        const std::size_t start = label_start_frame(frame);
        if (start >= frame_count) {
            flatrig::log::warn("[Labels] Dropping label '" + name + "' at frame " + std::to_string(frame) +
                               "; timeline has " + std::to_string(frame_count) + " frames.");
            continue;
        }
        starts.insert(start);
    }

    std::vector<std::size_t> bounds(starts.begin(), starts.end());
    bounds.push_back(frame_count);
    spans.reserve(bounds.size() - 1);

    for (std::size_t i = 0; i + 1 < bounds.size(); ++i) {
        LabelSpan span;
        span.start_frame = bounds[i];
        span.duration_frames = std::max<std::size_t>(1, bounds[i + 1] - bounds[i]);
        for (const auto& [name, frame] : labels) {
            if (label_start_frame(frame) == span.start_frame) {
                span.name = name;
                break;
            }
        }
        spans.push_back(std::move(span));
    }
    return spans;
}

std::string primary_label(const LabelTable& labels, const std::string& fallback) {
    const std::string* best = nullptr;
    int best_frame = 0;
    for (const auto& [name, frame] : labels) {
        if (!best || frame < best_frame) {
            best = &name;
            best_frame = frame;
        }
    }
    return best ? *best : fallback;
}

}
