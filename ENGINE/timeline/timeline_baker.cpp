#include "timeline/timeline_baker.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <iomanip>
#include <set>
#include <sstream>
#include <thread>
#include <unordered_set>
#include <utility>

#include "rig/frame_flattener.hpp"
#include "timeline/draw_order.hpp"
#include "timeline/instance_compositor.hpp"
#include "timeline/keyframe_track_builder.hpp"
#include "timeline/label_spans.hpp"
#include "utils/log.hpp"

namespace flatrig::timeline {
namespace {

constexpr std::size_t kMaxReportedMissing = 20;

std::vector<PieceUsage> collect_usage(const catalog::PieceCatalog& catalog,
                                      const std::map<std::string, std::size_t>& occurrences,
                                      const std::vector<std::string>& layers) {
    const std::unordered_set<std::string> layered(layers.begin(), layers.end());
    std::set<std::string> names;
    for (const auto& entry : catalog.entries()) names.insert(entry.name);
    for (const auto& [name, count] : occurrences) names.insert(name);

    std::vector<PieceUsage> usage;
    usage.reserve(names.size());
    for (const auto& name : names) {
        PieceUsage row;
        row.name = name;
        auto it = occurrences.find(name);
        row.occurrences = (it != occurrences.end()) ? it->second : 0;
        row.layered = layered.count(name) != 0;
        usage.push_back(std::move(row));
    }
    return usage;
}

}

const KeyframeTrack* BakedTimeline::track(const std::string& piece) const {
    for (const auto& t : tracks) {
        if (t.piece == piece) return &t;
    }
    return nullptr;
}

std::vector<std::string> BakedTimeline::stacked_layers() const {
    return stacked(layer_order, stacking);
}

const char* to_string(BakeStatus status) {
    switch (status) {
        case BakeStatus::Ok:       return "ok";
        case BakeStatus::NoFrames: return "no frames";
        default:                   return "unknown";
    }
}

TimelineBaker::TimelineBaker(BakeOptions options)
    : options_(std::move(options)) {}

std::vector<rig::FlatFrame> TimelineBaker::flatten_frames(const rig::Timeline& timeline,
                                                          const rig::SharedAnimationTable& shared,
                                                          std::size_t& truncated) const {
    truncated = 0;
    std::size_t workers = options_.worker_threads;
    if (workers == 0) {
        workers = std::max(1u, std::thread::hardware_concurrency());
    }
    workers = std::min(workers, timeline.size());
    if (workers <= 1) {
        return rig::flatten_timeline(timeline, shared, &truncated);
    }

    // Each worker owns its flattener and writes only its own slice of `frames`.
    std::vector<rig::FlatFrame> frames(timeline.size());
    const std::size_t slice_size = (timeline.size() + workers - 1) / workers;
    std::vector<std::future<std::size_t>> futures;
    futures.reserve(workers);

    for (std::size_t worker_index = 0; worker_index < workers; ++worker_index) {
        const std::size_t start_index = worker_index * slice_size;
        if (start_index >= timeline.size()) {
            break;
        }
        const std::size_t end_index = std::min(timeline.size(), start_index + slice_size);
        futures.push_back(std::async(std::launch::async,
                                     [start_index, end_index, &timeline, &shared, &frames]() -> std::size_t {
                                         rig::FrameFlattener flattener(shared);
                                         for (std::size_t fi = start_index; fi < end_index; ++fi) {
                                             flattener.flatten_into(timeline[fi], fi, frames[fi]);
                                         }
                                         return flattener.truncated_branches();
                                     }));
    }
    for (auto& future : futures) {
        truncated += future.get();
    }
    return frames;
}

BakeResult TimelineBaker::bake(const rig::Timeline& timeline,
                               const rig::SharedAnimationTable& shared,
                               const catalog::PieceCatalog& catalog,
                               const LabelTable& labels) const {
    BakeResult result;
    if (options_.identity_preview) {
        result.timeline = bake_identity(catalog);
        return result;
    }
    if (timeline.empty()) {
        flatrig::log::warn("[Baker] Animation has no frames; nothing to bake.");
        result.status = BakeStatus::NoFrames;
        return result;
    }

    const auto start = std::chrono::steady_clock::now();
    BakedTimeline& baked = result.timeline;
    baked.frame_count = timeline.size();
    baked.stacking = options_.stacking;
    baked.frame_rate = options_.frame_rate;

    std::vector<rig::FlatFrame> frames = flatten_frames(timeline, shared, baked.diagnostics.truncated_branches);
    if (baked.diagnostics.truncated_branches > 0) {
        flatrig::log::warn("[Baker] Skipped " + std::to_string(baked.diagnostics.truncated_branches) +
                           " subtree(s) that re-enter a shared animation or nest deeper than " +
                           std::to_string(rig::FrameFlattener::kMaxDepth) + " levels.");
    }
    for (auto& frame : frames) {
        catalog::resolve_instance_names(frame, options_.aliases);
    }

    const auto occurrences = catalog::count_occurrences(frames);
    baked.diagnostics.unmatched = catalog::unmatched_names(occurrences, catalog);

    const std::vector<std::string> layers =
        select_layers(catalog, occurrences, options_.only, options_.include_unused);
    baked.layer_order = resolve_draw_order(frames.front(), layers);

    const InstanceCompositor compositor(catalog, options_.global_scale);
    baked.tracks = build_keyframe_tracks(frames, baked.layer_order, compositor);
    baked.labels = build_label_spans(labels, baked.frame_count);
    baked.primary_label = primary_label(labels);
    baked.diagnostics.usage = collect_usage(catalog, occurrences, layers);

    report(baked);

    const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    flatrig::log::info("[Baker] Baked " + std::to_string(baked.frame_count) + " frame(s) into " +
                       std::to_string(baked.tracks.size()) + " layer(s) and " +
                       std::to_string(baked.labels.size()) + " label span(s) in " +
                       std::to_string(elapsed_ms) + "ms");
    return result;
}

BakedTimeline TimelineBaker::bake_identity(const catalog::PieceCatalog& catalog) const {
    BakedTimeline baked;
    baked.frame_count = 1;
    baked.stacking = options_.stacking;
    baked.frame_rate = options_.frame_rate;
    baked.layer_order = catalog.names();

    const InstanceCompositor compositor(catalog, options_.global_scale);
    baked.tracks.reserve(baked.layer_order.size());
    for (const auto& name : baked.layer_order) {
        KeyframeTrack track;
        track.piece = name;
        KeyframeSlot slot;
        slot.present = true;
        slot.matrix = compositor.compose(name, rig::Affine2D::identity());
        track.slots.push_back(slot);
        baked.tracks.push_back(std::move(track));

        PieceUsage row;
        row.name = name;
        row.layered = true;
        baked.diagnostics.usage.push_back(std::move(row));
    }
    std::sort(baked.diagnostics.usage.begin(), baked.diagnostics.usage.end(),
              [](const PieceUsage& lhs, const PieceUsage& rhs) { return lhs.name < rhs.name; });
    baked.labels = build_label_spans(LabelTable{}, baked.frame_count);

    flatrig::log::info("[Baker] Built identity preview with " + std::to_string(baked.tracks.size()) + " piece(s).");
    return baked;
}

void TimelineBaker::report(const BakedTimeline& baked) const {
    const auto& missing = baked.diagnostics.unmatched;
    if (options_.report_missing && !missing.empty()) {
        std::ostringstream oss;
        oss << "[Baker] Names in frames but not in catalog (after normalization/alias): ";
        const std::size_t shown = std::min(missing.size(), kMaxReportedMissing);
        for (std::size_t i = 0; i < shown; ++i) {
            if (i) oss << ", ";
            oss << missing[i];
        }
        if (missing.size() > shown) oss << " ...";
        flatrig::log::warn(oss.str());
    }

    if (options_.trace_names && flatrig::log::enabled(flatrig::log::Level::Info)) {
        flatrig::log::info("[Baker] Piece usage (occurrences) -> layered?");
        for (const auto& row : baked.diagnostics.usage) {
            std::ostringstream oss;
            oss << "  " << std::left << std::setw(35) << row.name << ' '
                << std::right << std::setw(5) << row.occurrences << "  " << (row.layered ? "YES" : "no");
            flatrig::log::info(oss.str());
        }
    }
}

}
