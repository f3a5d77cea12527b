#include "doctest/doctest.h"

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include <nlohmann/json.hpp>

#include "io/baked_timeline_writer.hpp"
#include "utils/log.hpp"

namespace fs = std::filesystem;
using namespace flatrig::timeline;

static fs::path test_root() {
#ifdef PROJECT_ROOT
    return fs::path(PROJECT_ROOT);
#else
    return fs::current_path() / "TEST_TMP";
#endif
}

namespace {
BakedTimeline make_baked() {
    BakedTimeline baked;
    baked.frame_count = 2;
    baked.layer_order = {"body", "head"};
    baked.stacking = LayerStacking::TopToBottom;
    baked.primary_label = "walk";
    baked.stage_width = 195.0;
    baked.frame_rate = 24;

    KeyframeTrack body;
    body.piece = "body";
    body.slots.resize(2);
    body.slots[0].present = true;
    body.slots[0].matrix = flatrig::rig::Affine2D::translation(1, 2);
    body.slots[0].alpha = 0.5;

    KeyframeTrack head;
    head.piece = "head";
    head.slots.resize(2);
    head.slots[1].present = true;

    baked.tracks = {body, head};

    LabelSpan span;
    span.start_frame = 0;
    span.duration_frames = 2;
    span.name = "walk";
    baked.labels = {span};
    baked.diagnostics.unmatched = {"ghost"};
    baked.diagnostics.usage.push_back(PieceUsage{"body", 1, true});
    return baked;
}
}

TEST_CASE("layer colors follow the stepped palette") {
    CHECK(flatrig::io::layer_color(0) == "#444444");
    CHECK(flatrig::io::layer_color(1) == "#462685");
}

TEST_CASE("to_json emits layers in stacking order with sparse frames") {
    const nlohmann::json out = flatrig::io::to_json(make_baked());

    CHECK(out["frame_count"] == 2);
    CHECK(out["primary_label"] == "walk");
    CHECK(out["layer_order"] == "top_first");
    CHECK(out["stage"]["width"] == 195.0);
    CHECK(out["stage"]["height"] == 390.0);
    CHECK(out["frame_rate"] == 24);

    const auto& layers = out["layers"];
    REQUIRE(layers.size() == 2);
    CHECK(layers[0]["name"] == "head");
    CHECK(layers[1]["name"] == "body");

    const auto& body_frames = layers[1]["frames"];
    REQUIRE(body_frames.size() == 2);
    CHECK(body_frames[0]["present"] == true);
    CHECK(body_frames[0]["matrix"]["tx"] == 1.0);
    CHECK(body_frames[0]["alpha"] == 0.5);
    CHECK(body_frames[1]["present"] == false);
    CHECK_FALSE(body_frames[1].contains("matrix"));

    REQUIRE(out["labels"].size() == 1);
    CHECK(out["labels"][0]["name"] == "walk");
    CHECK(out["labels"][0]["duration"] == 2);
    CHECK(out["diagnostics"]["unmatched"][0] == "ghost");
    CHECK(out["diagnostics"]["usage"][0]["layered"] == true);
}

TEST_CASE("write_baked_timeline creates the output file") {
    flatrig::log::set_level(flatrig::log::Level::Warn);
    const fs::path root = test_root() / "timeline_writer" / "nested";
    std::error_code ec;
    fs::remove_all(root, ec);

    const fs::path path = root / "out.timeline.json";
    flatrig::io::write_baked_timeline(path, make_baked());

    std::ifstream in(path);
    REQUIRE(in.is_open());
    nlohmann::json written;
    in >> written;
    CHECK(written["layers"].size() == 2);
}
