#include "io/rig_json_loader.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "utils/log.hpp"
#include "utils/string_utils.hpp"

namespace flatrig::io {
namespace {

double read_double(const nlohmann::json& value, double fallback) {
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        const std::string text = strings::trim_copy(value.get<std::string>());
        if (text.empty()) {
            return fallback;
        }
        std::istringstream iss(text);
        double parsed = 0.0;
        if (iss >> parsed) {
            return parsed;
        }
    }
    return fallback;
}

int clamp_to_int(double value) {
    if (value <= static_cast<double>(std::numeric_limits<int>::min())) return std::numeric_limits<int>::min();
    if (value >= static_cast<double>(std::numeric_limits<int>::max())) return std::numeric_limits<int>::max();
    return static_cast<int>(value);
}

int read_int(const nlohmann::json& value, int fallback) {
    if (value.is_number_unsigned()) {
        const auto raw = value.get<std::uint64_t>();
        return raw > static_cast<std::uint64_t>(std::numeric_limits<int>::max())
                   ? std::numeric_limits<int>::max()
                   : static_cast<int>(raw);
    }
    if (value.is_number_integer()) {
        const auto raw = value.get<std::int64_t>();
        if (raw < std::numeric_limits<int>::min()) return std::numeric_limits<int>::min();
        if (raw > std::numeric_limits<int>::max()) return std::numeric_limits<int>::max();
        return static_cast<int>(raw);
    }
    if (value.is_number()) {
        return clamp_to_int(value.get<double>());
    }
    if (value.is_string()) {
        std::istringstream iss(strings::trim_copy(value.get<std::string>()));
        int parsed = 0;
        if (iss >> parsed) {
            return parsed;
        }
    }
    return fallback;
}

double field_double(const nlohmann::json& obj, const char* key, double fallback) {
    if (!obj.is_object()) {
        return fallback;
    }
    auto it = obj.find(key);
    if (it == obj.end()) {
        return fallback;
    }
    return read_double(*it, fallback);
}

std::string field_string(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object()) {
        return {};
    }
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

const nlohmann::json* field_array(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object()) {
        return nullptr;
    }
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_array()) {
        return nullptr;
    }
    return &*it;
}

std::optional<std::string> parse_shared_ref(const nlohmann::json& node) {
    auto it = node.find("references_shared_animation");
    if (it == node.end()) {
        return std::nullopt;
    }
    if (it->is_string()) {
        std::string ref = it->get<std::string>();
        if (ref.empty()) return std::nullopt;
        return ref;
    }
    if (it->is_number_integer()) {
        return std::to_string(it->get<long long>());
    }
    return std::nullopt;
}

rig::Affine2D parse_matrix(const nlohmann::json& m) {
    rig::Affine2D out;
    out.a  = field_double(m, "a",  1.0);
    out.b  = field_double(m, "b",  0.0);
    out.c  = field_double(m, "c",  0.0);
    out.d  = field_double(m, "d",  1.0);
    out.tx = field_double(m, "tx", 0.0);
    out.ty = field_double(m, "ty", 0.0);
    return out;
}

rig::ColorMultipliers parse_color(const nlohmann::json& c) {
    rig::ColorMultipliers out;
    out.red   = field_double(c, "redMultiplier",   1.0);
    out.green = field_double(c, "greenMultiplier", 1.0);
    out.blue  = field_double(c, "blueMultiplier",  1.0);
    out.alpha = field_double(c, "alphaMultiplier", 1.0);
    return out;
}

std::vector<rig::Node> parse_children(const nlohmann::json& owner) {
    std::vector<rig::Node> children;
    if (const nlohmann::json* list = field_array(owner, "children")) {
        children.reserve(list->size());
        for (const auto& child : *list) {
            if (child.is_object()) {
                children.push_back(parse_node(child));
            }
        }
    }
    return children;
}

bool looks_like_frame_list(const nlohmann::json& value) {
    if (!value.is_array() || value.empty() || !value.front().is_object()) {
        return false;
    }
    const auto& first = value.front();
    return first.contains("children") || first.contains("matrix");
}

bool is_frame_list(const nlohmann::json* value) {
    return value && value->is_array() && !value->empty() && value->front().is_object();
}

const nlohmann::json* first_entry_frames(const nlohmann::json& doc, const char* key) {
    const nlohmann::json* list = field_array(doc, key);
    if (!list || list->empty()) {
        return nullptr;
    }
    return field_array(list->front(), "frames");
}

const nlohmann::json* scan_for_frames(const nlohmann::json& node, const std::string& trail, std::string& found) {
    if (node.is_array()) {
        if (looks_like_frame_list(node)) {
            found = trail;
            return &node;
        }
        for (std::size_t i = 0; i < node.size(); ++i) {
            if (auto* hit = scan_for_frames(node[i], trail + "[" + std::to_string(i) + "]", found)) {
                return hit;
            }
        }
    } else if (node.is_object()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            if (auto* hit = scan_for_frames(it.value(), trail + "." + it.key(), found)) {
                return hit;
            }
        }
    }
    return nullptr;
}

// Known locations first, then a depth-first scan of the whole document.
const nlohmann::json* discover_frames(const nlohmann::json& anim, const nlohmann::json& doc, std::string& path) {
    const nlohmann::json* direct = field_array(anim, "frames");
    if (direct && !direct->empty()) {
        path = "frames";
        return direct;
    }

    const std::pair<const char*, const nlohmann::json*> candidates[] = {
        {"anims[0].frames", first_entry_frames(doc, "anims")},
        {"animations[0].frames", first_entry_frames(doc, "animations")},
        {"timeline.frames", doc.is_object() && doc.contains("timeline") ? field_array(doc["timeline"], "frames") : nullptr},
    };
    for (const auto& [name, list] : candidates) {
        if (is_frame_list(list)) {
            path = name;
            return list;
        }
    }
    return scan_for_frames(doc, "$", path);
}

const nlohmann::json& pick_section(const nlohmann::json& primary, const nlohmann::json& secondary, const char* key) {
    static const nlohmann::json kNull;
    if (primary.is_object() && primary.contains(key)) return primary[key];
    if (secondary.is_object() && secondary.contains(key)) return secondary[key];
    return kNull;
}

}

rig::Node parse_node(const nlohmann::json& node) {
    rig::Node out;
    if (!node.is_object()) {
        return out;
    }
    out.name = field_string(node, "name");
    if (auto it = node.find("matrix"); it != node.end()) {
        out.local_matrix = parse_matrix(*it);
    }
    if (auto it = node.find("color"); it != node.end()) {
        out.color = parse_color(*it);
    }
    out.children = parse_children(node);
    out.shared_animation_ref = parse_shared_ref(node);
    return out;
}

rig::Frame parse_frame(const nlohmann::json& frame) {
    rig::Frame out;
    out.children = parse_children(frame);
    out.has_children = field_array(frame, "children") != nullptr;
    return out;
}

catalog::PieceCatalog parse_catalog(const nlohmann::json& plist) {
    catalog::PieceCatalog out;
    if (!plist.is_array()) {
        return out;
    }
    for (const auto& item : plist) {
        catalog::PieceCatalogEntry entry;
        entry.name     = field_string(item, "name");
        entry.origin_x = field_double(item, "origin_x", 0.0);
        entry.origin_y = field_double(item, "origin_y", 0.0);
        entry.scale_x  = field_double(item, "scale_x",  1.0);
        entry.scale_y  = field_double(item, "scale_y",  1.0);
        if (!out.add(std::move(entry))) {
            flatrig::log::debug("[RigJson] Skipping unnamed or duplicate plist entry.");
        }
    }
    return out;
}

timeline::LabelTable parse_labels(const nlohmann::json& labels) {
    timeline::LabelTable out;
    if (labels.is_object()) {
        for (auto it = labels.begin(); it != labels.end(); ++it) {
            out[it.key()] = read_int(it.value(), 1);
        }
    } else if (labels.is_array()) {
        for (const auto& item : labels) {
            if (!item.is_object() || !item.contains("name") || !item.contains("frame")) {
                continue;
            }
            const std::string name = field_string(item, "name");
            if (name.empty()) continue;
            out[name] = read_int(item["frame"], 1);
        }
    }
    return out;
}

RigDocument parse_rig_document(const nlohmann::json& doc) {
    RigDocument out;
    const nlohmann::json& anim = (doc.is_object() && doc.contains("animation") && doc["animation"].is_object())
                                     ? doc["animation"]
                                     : doc;

    if (const nlohmann::json* frames = discover_frames(anim, doc, out.frames_path)) {
        out.frames.reserve(frames->size());
        for (const auto& frame : *frames) {
            out.frames.push_back(parse_frame(frame));
        }
        if (out.frames_path != "frames") {
            flatrig::log::info("[RigJson] Discovered frames at: " + out.frames_path +
                               " (count=" + std::to_string(out.frames.size()) + ")");
        }
    }

    const nlohmann::json& shared = pick_section(anim, doc, "shared_animations");
    if (shared.is_object()) {
        for (auto it = shared.begin(); it != shared.end(); ++it) {
            if (!it.value().is_array()) {
                flatrig::log::debug("[RigJson] Shared animation '" + it.key() + "' is not a list; ignored.");
                continue;
            }
            std::vector<rig::Frame> loop;
            loop.reserve(it.value().size());
            for (const auto& frame : it.value()) {
                loop.push_back(parse_frame(frame));
            }
            out.shared.emplace(it.key(), std::move(loop));
        }
    }

    out.catalog = parse_catalog(pick_section(doc, anim, "plist"));
    out.labels  = parse_labels(pick_section(doc, anim, "labels"));
    out.width   = field_double(anim, "width",  field_double(doc, "width",  kDefaultStageSize));
    out.height  = field_double(anim, "height", field_double(doc, "height", kDefaultStageSize));
    return out;
}

void override_stage_size(RigDocument& doc, std::optional<double> width, std::optional<double> height) {
    const double base_w = doc.width;
    const double base_h = doc.height;
    if (width && height) {
        doc.width = *width;
        doc.height = *height;
    } else if (width) {
        doc.width = *width;
        doc.height = base_w != 0.0 ? *width * (base_h / base_w) : *width;
    } else if (height) {
        doc.height = *height;
        doc.width = base_h != 0.0 ? *height * (base_w / base_h) : *height;
    }
}

RigDocument load_rig_document(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        std::ostringstream oss;
        oss << "Unable to open animation file at '" << path.string() << "'.";
        throw std::runtime_error(oss.str());
    }

    nlohmann::json doc;
    try {
        in >> doc;
    } catch (const nlohmann::json::parse_error& e) {
        std::ostringstream oss;
        oss << "Failed to parse animation file '" << path.string() << "': " << e.what();
        throw std::runtime_error(oss.str());
    }

    RigDocument out = parse_rig_document(doc);
    flatrig::log::info("[RigJson] Loaded '" + path.string() + "': frames=" + std::to_string(out.frames.size()) +
                       " shared=" + std::to_string(out.shared.size()) +
                       " labels=" + std::to_string(out.labels.size()) +
                       " plist=" + std::to_string(out.catalog.size()));
    return out;
}

}
