#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "timeline/timeline_types.hpp"

namespace flatrig::timeline {

// Converts 1-based label frames to contiguous spans covering [0, frame_count).
// Frame 0 always starts a span; a span is named when a label starts exactly there.
// Labels that start at or past frame_count are dropped.
std::vector<LabelSpan> build_label_spans(const LabelTable& labels, std::size_t frame_count);

// Label with the smallest frame number, or `fallback` when there are none.
std::string primary_label(const LabelTable& labels, const std::string& fallback = "idle");

// 0-based start frame of a 1-based label frame.
std::size_t label_start_frame(int one_based_frame);

}
