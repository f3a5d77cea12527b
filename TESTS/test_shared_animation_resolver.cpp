#include "doctest/doctest.h"

#include <string>

#include "rig/shared_animation_resolver.hpp"

using namespace flatrig::rig;

namespace {
Frame frame_with(const std::string& child_name) {
    Frame frame;
    Node child;
    child.name = child_name;
    frame.children.push_back(child);
    return frame;
}

Node referencing(const std::string& ref) {
    Node node;
    node.name = "face";
    node.shared_animation_ref = ref;
    Node own;
    own.name = "own_child";
    node.children.push_back(own);
    return node;
}
}

TEST_CASE("shared loop frames are selected by modulo of the outer frame") {
    SharedAnimationTable table;
    table["blink"] = {frame_with("A"), frame_with("B")};
    const SharedAnimationResolver resolver(table);
    const Node node = referencing("blink");

    for (std::size_t fi : {0u, 2u, 4u}) {
        const auto& kids = resolver.effective_children(node, fi);
        REQUIRE(kids.size() == 1);
        CHECK(kids[0].name == "A");
    }
    for (std::size_t fi : {1u, 3u}) {
        const auto& kids = resolver.effective_children(node, fi);
        REQUIRE(kids.size() == 1);
        CHECK(kids[0].name == "B");
    }
}

TEST_CASE("substitution is periodic in the loop length") {
    SharedAnimationTable table;
    table["walk"] = {frame_with("w0"), frame_with("w1"), frame_with("w2")};
    const SharedAnimationResolver resolver(table);
    const Node node = referencing("walk");

    for (std::size_t k = 0; k < 9; ++k) {
        CHECK(&resolver.effective_children(node, k) == &resolver.effective_children(node, k + 3));
        CHECK(resolver.loop_index("walk", k) == k % 3);
    }
}

TEST_CASE("missing or empty loops fall back to the node's own children") {
    SharedAnimationTable table;
    table["empty"] = {};
    const SharedAnimationResolver resolver(table);

    const Node missing = referencing("nope");
    CHECK(&resolver.effective_children(missing, 5) == &missing.children);
    CHECK_FALSE(resolver.loop_index("nope", 5).has_value());

    const Node empty = referencing("empty");
    CHECK(&resolver.effective_children(empty, 0) == &empty.children);
    CHECK(resolver.find("empty") == nullptr);
}

TEST_CASE("nodes without a reference keep their own children") {
    SharedAnimationTable table;
    table["blink"] = {frame_with("A")};
    const SharedAnimationResolver resolver(table);

    Node plain;
    plain.children.push_back(Node{});
    CHECK_FALSE(plain.has_shared_reference());
    CHECK(&resolver.effective_children(plain, 0) == &plain.children);
}

TEST_CASE("loop frames without a children list keep the node's own children") {
    SharedAnimationTable table;
    Frame bare;
    bare.has_children = false;
    table["blink"] = {bare, frame_with("lid")};
    const SharedAnimationResolver resolver(table);
    const Node node = referencing("blink");

    const auto& at_zero = resolver.effective_children(node, 0);
    REQUIRE(at_zero.size() == 1);
    CHECK(at_zero[0].name == "own_child");

    const auto& at_one = resolver.effective_children(node, 1);
    REQUIRE(at_one.size() == 1);
    CHECK(at_one[0].name == "lid");

    Frame emptied;
    table["blink"] = {emptied};
    CHECK(SharedAnimationResolver(table).effective_children(node, 0).empty());
}
