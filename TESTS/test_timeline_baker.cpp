#include "doctest/doctest.h"

#include <algorithm>
#include <string>
#include <vector>

#include "timeline/timeline_baker.hpp"
#include "utils/log.hpp"

using namespace flatrig::timeline;
using flatrig::catalog::PieceCatalog;
using flatrig::catalog::PieceCatalogEntry;
using flatrig::rig::Affine2D;
using flatrig::rig::Frame;
using flatrig::rig::Node;
using flatrig::rig::SharedAnimationTable;
using flatrig::rig::Timeline;
using Names = std::vector<std::string>;

namespace {
Node make_node(const std::string& name, double tx = 0.0, double ty = 0.0) {
    Node node;
    node.name = name;
    node.local_matrix.tx = tx;
    node.local_matrix.ty = ty;
    return node;
}

Timeline head_and_eye() {
    Node head = make_node("head");
    head.children.push_back(make_node("eye", 5, 10));
    Frame frame;
    frame.children.push_back(head);
    return Timeline{frame};
}

PieceCatalog head_eye_catalog() {
    return PieceCatalog(std::vector<PieceCatalogEntry>{{"eye", 0, 0, 1, 1}, {"head", 0, 0, 1, 1}});
}

Affine2D make(double a, double b, double c, double d, double tx, double ty) {
    Affine2D m;
    m.a = a;
    m.b = b;
    m.c = c;
    m.d = d;
    m.tx = tx;
    m.ty = ty;
    return m;
}
}

TEST_CASE("head and eye bake to the eye's local offset") {
    flatrig::log::set_level(flatrig::log::Level::Warn);
    const TimelineBaker baker;
    const BakeResult result = baker.bake(head_and_eye(), {}, head_eye_catalog(), {});

    REQUIRE(result.ok());
    const KeyframeTrack* eye = result.timeline.track("eye");
    REQUIRE(eye != nullptr);
    REQUIRE(eye->present_at(0));
    CHECK(eye->slots[0].matrix == make(1, 0, 0, 1, 5, 10));
    CHECK(eye->slots[0].alpha == 1.0);
}

TEST_CASE("global scale halves every component of the final matrix") {
    flatrig::log::set_level(flatrig::log::Level::Warn);
    BakeOptions options;
    options.global_scale = 0.5;
    const BakeResult result = TimelineBaker(options).bake(head_and_eye(), {}, head_eye_catalog(), {});

    REQUIRE(result.ok());
    const KeyframeTrack* eye = result.timeline.track("eye");
    REQUIRE(eye != nullptr);
    CHECK(eye->slots[0].matrix == make(0.5, 0, 0, 0.5, 2.5, 5));
}

TEST_CASE("empty timelines report no frames instead of fabricating one") {
    flatrig::log::set_level(flatrig::log::Level::Error);
    const BakeResult result = TimelineBaker().bake(Timeline{}, {}, head_eye_catalog(), {});
    CHECK_FALSE(result.ok());
    CHECK(result.status == BakeStatus::NoFrames);
    CHECK(result.timeline.tracks.empty());
    CHECK(std::string(to_string(result.status)) == "no frames");
}

TEST_CASE("draw order follows frame zero and appends pieces first seen later") {
    flatrig::log::set_level(flatrig::log::Level::Warn);
    Frame first;
    first.children.push_back(make_node("body"));
    first.children.push_back(make_node("head"));
    Frame second;
    second.children.push_back(make_node("arm"));
    second.children.push_back(make_node("body"));

    const PieceCatalog catalog(std::vector<PieceCatalogEntry>{
        {"arm", 0, 0, 1, 1}, {"body", 0, 0, 1, 1}, {"head", 0, 0, 1, 1}, {"tail", 0, 0, 1, 1}});
    const BakeResult result = TimelineBaker().bake(Timeline{first, second}, {}, catalog, {});

    REQUIRE(result.ok());
    CHECK(result.timeline.layer_order == Names{"body", "head", "arm"});
    CHECK(result.timeline.stacked_layers() == Names{"arm", "head", "body"});
    REQUIRE(result.timeline.tracks.size() == 3);
    CHECK(result.timeline.tracks[2].piece == "arm");
    CHECK_FALSE(result.timeline.tracks[2].present_at(0));
    CHECK(result.timeline.tracks[2].present_at(1));
}

TEST_CASE("aliases and unmatched names feed the diagnostics") {
    flatrig::log::set_level(flatrig::log::Level::Error);
    Frame frame;
    frame.children.push_back(make_node("art/eye_v2.png"));
    frame.children.push_back(make_node("mystery"));
    frame.children.push_back(make_node("mystery"));

    BakeOptions options;
    options.aliases["eye_v2"] = "eye";
    options.report_missing = true;
    options.trace_names = true;
    const BakeResult result = TimelineBaker(options).bake(Timeline{frame}, {}, head_eye_catalog(), {});

    REQUIRE(result.ok());
    CHECK(result.timeline.layer_order == Names{"eye"});
    CHECK(result.timeline.diagnostics.unmatched == Names{"mystery"});

    const auto& usage = result.timeline.diagnostics.usage;
    REQUIRE(usage.size() == 3);
    CHECK(usage[0].name == "eye");
    CHECK(usage[0].occurrences == 1);
    CHECK(usage[0].layered);
    CHECK(usage[1].name == "head");
    CHECK(usage[1].occurrences == 0);
    CHECK_FALSE(usage[1].layered);
    CHECK(usage[2].name == "mystery");
    CHECK(usage[2].occurrences == 2);
    CHECK_FALSE(usage[2].layered);
}

TEST_CASE("include-unused and allow-list options control the layer set") {
    flatrig::log::set_level(flatrig::log::Level::Warn);
    BakeOptions unused;
    unused.include_unused = true;
    unused.stacking = LayerStacking::BottomToTop;
    const BakeResult all = TimelineBaker(unused).bake(head_and_eye(), {}, head_eye_catalog(), {});
    REQUIRE(all.ok());
    CHECK(all.timeline.stacked_layers() == Names{"head", "eye"});

    BakeOptions only;
    only.only = {"eye"};
    const BakeResult filtered = TimelineBaker(only).bake(head_and_eye(), {}, head_eye_catalog(), {});
    REQUIRE(filtered.ok());
    CHECK(filtered.timeline.layer_order == Names{"eye"});
}

TEST_CASE("shared loops and labels bake across the whole timeline") {
    flatrig::log::set_level(flatrig::log::Level::Warn);
    SharedAnimationTable shared;
    Frame open;
    open.children.push_back(make_node("lid_open"));
    Frame closed;
    closed.children.push_back(make_node("lid_closed"));
    shared["blink"] = {open, closed};

    Node face = make_node("face");
    face.shared_animation_ref = "blink";
    Frame frame;
    frame.children.push_back(face);
    const Timeline timeline(5, frame);

    const PieceCatalog catalog(std::vector<PieceCatalogEntry>{
        {"face", 0, 0, 1, 1}, {"lid_closed", 0, 0, 1, 1}, {"lid_open", 0, 0, 1, 1}});
    const LabelTable labels{{"blink", 1}, {"hold", 4}};
    const BakeResult result = TimelineBaker().bake(timeline, shared, catalog, labels);

    REQUIRE(result.ok());
    CHECK(result.timeline.layer_order == Names{"face", "lid_open", "lid_closed"});
    const KeyframeTrack* open_track = result.timeline.track("lid_open");
    const KeyframeTrack* closed_track = result.timeline.track("lid_closed");
    REQUIRE(open_track != nullptr);
    REQUIRE(closed_track != nullptr);
    for (std::size_t fi = 0; fi < 5; ++fi) {
        CHECK(open_track->present_at(fi) == (fi % 2 == 0));
        CHECK(closed_track->present_at(fi) == (fi % 2 == 1));
    }

    REQUIRE(result.timeline.labels.size() == 2);
    CHECK(result.timeline.labels[0].duration_frames == 3);
    CHECK(result.timeline.labels[1].start_frame == 3);
    CHECK(result.timeline.primary_label == "blink");
}

TEST_CASE("parallel flattening matches the sequential result") {
    flatrig::log::set_level(flatrig::log::Level::Warn);
    Timeline timeline;
    for (int i = 0; i < 23; ++i) {
        Node root = make_node("root", i, 0);
        root.children.push_back(make_node(i % 3 == 0 ? "tip" : "knob", 1, i));
        Frame frame;
        frame.children.push_back(root);
        timeline.push_back(frame);
    }
    const PieceCatalog catalog(std::vector<PieceCatalogEntry>{
        {"knob", 1, 1, 1, 1}, {"root", 0, 0, 1, 1}, {"tip", 2, 0, 2, 2}});

    BakeOptions sequential;
    BakeOptions parallel;
    parallel.worker_threads = 4;
    const BakeResult a = TimelineBaker(sequential).bake(timeline, {}, catalog, {});
    const BakeResult b = TimelineBaker(parallel).bake(timeline, {}, catalog, {});

    REQUIRE(a.ok());
    REQUIRE(b.ok());
    CHECK(a.timeline.layer_order == b.timeline.layer_order);
    REQUIRE(a.timeline.tracks.size() == b.timeline.tracks.size());
    for (std::size_t t = 0; t < a.timeline.tracks.size(); ++t) {
        const auto& lhs = a.timeline.tracks[t].slots;
        const auto& rhs = b.timeline.tracks[t].slots;
        REQUIRE(lhs.size() == rhs.size());
        for (std::size_t fi = 0; fi < lhs.size(); ++fi) {
            CHECK(lhs[fi].present == rhs[fi].present);
            if (lhs[fi].present) {
                CHECK(lhs[fi].matrix == rhs[fi].matrix);
            }
        }
    }
}

TEST_CASE("identity preview places every catalog piece on one frame") {
    flatrig::log::set_level(flatrig::log::Level::Warn);
    BakeOptions options;
    options.identity_preview = true;
    const PieceCatalog catalog(std::vector<PieceCatalogEntry>{{"eye", 3, 4, 1, 1}, {"head", 0, 0, 1, 1}});

    const BakeResult result = TimelineBaker(options).bake(Timeline{}, {}, catalog, {});

    REQUIRE(result.ok());
    CHECK(result.timeline.frame_count == 1);
    CHECK(result.timeline.layer_order == Names{"eye", "head"});
    const KeyframeTrack* eye = result.timeline.track("eye");
    REQUIRE(eye != nullptr);
    CHECK(eye->present_at(0));
    CHECK(eye->slots[0].matrix == Affine2D::translation(3, 4));
    REQUIRE(result.timeline.labels.size() == 1);
    CHECK(result.timeline.labels[0].duration_frames == 1);
}
