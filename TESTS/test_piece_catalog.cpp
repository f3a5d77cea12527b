#include "doctest/doctest.h"

#include <string>
#include <vector>

#include "catalog/piece_catalog.hpp"

using namespace flatrig::catalog;

TEST_CASE("normalize_piece_name strips directories, extensions and whitespace") {
    CHECK(normalize_piece_name("eye") == "eye");
    CHECK(normalize_piece_name("  eye  ") == "eye");
    CHECK(normalize_piece_name("parts/face/eye.png") == "eye");
    CHECK(normalize_piece_name("C:\\art\\face\\eye.PNG") == "eye");
    CHECK(normalize_piece_name("mixed/dir\\eye.Png") == "eye");
    CHECK(normalize_piece_name("eye.jpeg") == "eye");
    CHECK(normalize_piece_name("arm.left") == "arm.left");
    CHECK(normalize_piece_name("folder/") == "");
    CHECK(normalize_piece_name("   ") == "");
}

TEST_CASE("resolve_piece_name applies aliases after normalization") {
    AliasMap aliases{{"eye_old", "eye"}};
    CHECK(resolve_piece_name("art/eye_old.png", aliases) == "eye");
    CHECK(resolve_piece_name("mouth", aliases) == "mouth");
    CHECK(resolve_piece_name("", aliases) == "");
}

TEST_CASE("parse_alias_pair normalizes both sides and rejects malformed pairs") {
    auto pair = parse_alias_pair(" dir/Eye01.png = eye ");
    REQUIRE(pair.has_value());
    CHECK(pair->first == "Eye01");
    CHECK(pair->second == "eye");

    CHECK_FALSE(parse_alias_pair("eye").has_value());
    CHECK_FALSE(parse_alias_pair("=eye").has_value());
    CHECK_FALSE(parse_alias_pair("eye=").has_value());
}

TEST_CASE("PieceCatalog keeps insertion order and ignores duplicates") {
    PieceCatalog catalog;
    CHECK(catalog.add({"head", 1, 2, 1, 1}));
    CHECK(catalog.add({" eye ", 3, 4, 2, 2}));
    CHECK_FALSE(catalog.add({"head", 9, 9, 9, 9}));
    CHECK_FALSE(catalog.add({"", 0, 0, 1, 1}));

    CHECK(catalog.size() == 2);
    CHECK(catalog.names() == std::vector<std::string>{"head", "eye"});

    const PieceCatalogEntry* head = catalog.find("head");
    REQUIRE(head != nullptr);
    CHECK(head->origin_x == 1.0);
    CHECK(catalog.contains("eye"));
    CHECK_FALSE(catalog.contains("tail"));
}

TEST_CASE("resolve_instance_names rewrites names and drops unnamed instances") {
    flatrig::rig::FlatFrame frame;
    frame.push_back({"img/eye_old.png", {}, 0.5});
    frame.push_back({" / ", {}, 1.0});
    frame.push_back({"mouth.png", {}, 1.0});

    resolve_instance_names(frame, AliasMap{{"eye_old", "eye"}});

    REQUIRE(frame.size() == 2);
    CHECK(frame[0].piece_name == "eye");
    CHECK(frame[0].world_alpha == doctest::Approx(0.5));
    CHECK(frame[1].piece_name == "mouth");
}

TEST_CASE("unmatched names are reported sorted without affecting counts") {
    std::vector<flatrig::rig::FlatFrame> frames(2);
    frames[0].push_back({"zeta", {}, 1.0});
    frames[0].push_back({"eye", {}, 1.0});
    frames[1].push_back({"alpha", {}, 1.0});
    frames[1].push_back({"zeta", {}, 1.0});

    const auto counts = count_occurrences(frames);
    CHECK(counts.at("zeta") == 2);
    CHECK(counts.at("eye") == 1);

    PieceCatalog catalog(std::vector<PieceCatalogEntry>{{"eye", 0, 0, 1, 1}});
    CHECK(unmatched_names(counts, catalog) == std::vector<std::string>{"alpha", "zeta"});
}
