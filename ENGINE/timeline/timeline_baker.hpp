#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "catalog/piece_catalog.hpp"
#include "rig/rig_types.hpp"
#include "timeline/timeline_types.hpp"

namespace flatrig::timeline {

struct BakeOptions {
    bool include_unused = false;
    // Normalized piece names; when non-empty only these become layers.
    std::vector<std::string> only;
    catalog::AliasMap aliases;
    // Any finite non-zero value; a negative scale mirrors the output.
    double global_scale = 1.0;
    int frame_rate = 30;
    LayerStacking stacking = LayerStacking::TopToBottom;
    bool report_missing = false;
    bool trace_names = false;
    // One frame, every catalog piece at its registration point.
    bool identity_preview = false;
    // 0 picks the hardware concurrency.
    std::size_t worker_threads = 1;
};

struct PieceUsage {
    std::string name;
    std::size_t occurrences = 0;
    bool layered = false;
};

struct BakeDiagnostics {
    std::vector<PieceUsage> usage;
    std::vector<std::string> unmatched;
    std::size_t truncated_branches = 0;
};

struct BakedTimeline {
    std::size_t frame_count = 0;
    // Bottom-to-top; `tracks` follows the same order.
    std::vector<std::string> layer_order;
    std::vector<KeyframeTrack> tracks;
    std::vector<LabelSpan> labels;
    std::string primary_label = "idle";
    int frame_rate = 30;
    // Stage the layers are placed on, already multiplied by the global scale.
    double stage_width  = 390.0;
    double stage_height = 390.0;
    LayerStacking stacking = LayerStacking::TopToBottom;
    BakeDiagnostics diagnostics;

    const KeyframeTrack* track(const std::string& piece) const;
    std::vector<std::string> stacked_layers() const;
};

enum class BakeStatus {
    Ok,
    NoFrames,
};

struct BakeResult {
    BakeStatus status = BakeStatus::Ok;
    BakedTimeline timeline;

    bool ok() const { return status == BakeStatus::Ok; }
};

class TimelineBaker {
public:
    explicit TimelineBaker(BakeOptions options = {});

    BakeResult bake(const rig::Timeline& timeline,
                    const rig::SharedAnimationTable& shared,
                    const catalog::PieceCatalog& catalog,
                    const LabelTable& labels) const;

    BakedTimeline bake_identity(const catalog::PieceCatalog& catalog) const;

    const BakeOptions& options() const { return options_; }

private:
    std::vector<rig::FlatFrame> flatten_frames(const rig::Timeline& timeline,
                                               const rig::SharedAnimationTable& shared,
                                               std::size_t& truncated) const;

    void report(const BakedTimeline& baked) const;

    BakeOptions options_;
};

const char* to_string(BakeStatus status);

}
