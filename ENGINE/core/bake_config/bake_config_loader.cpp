#include "core/bake_config/bake_config_loader.hpp"

#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

#include "catalog/piece_catalog.hpp"
#include "utils/log.hpp"
#include "utils/string_utils.hpp"

namespace flatrig::bake_config {
namespace {

using flatrig::timeline::BakeOptions;
using flatrig::timeline::LayerStacking;

void warn_type(const char* key, const char* expected) {
    flatrig::log::warn(std::string("[BakeConfig] '") + key + "' should be " + expected + "; using default.");
}

void read_bool(const nlohmann::json& cfg, const char* key, bool& target) {
    auto it = cfg.find(key);
    if (it == cfg.end()) return;
    if (it->is_boolean()) {
        target = it->get<bool>();
    } else if (it->is_number_integer()) {
        target = it->get<int>() != 0;
    } else {
        warn_type(key, "a boolean");
    }
}

std::vector<std::string> read_name_list(const nlohmann::json& value) {
    std::vector<std::string> names;
    if (value.is_string()) {
        for (const auto& piece : flatrig::strings::split_trimmed(value.get<std::string>(), ',')) {
            names.push_back(flatrig::catalog::normalize_piece_name(piece));
        }
        return names;
    }
    for (const auto& item : value) {
        if (!item.is_string()) continue;
        std::string name = flatrig::catalog::normalize_piece_name(item.get<std::string>());
        if (!name.empty()) names.push_back(std::move(name));
    }
    return names;
}

}

BakeOptions apply_bake_config(const nlohmann::json& cfg, BakeOptions base) {
    BakeOptions options = std::move(base);
    if (!cfg.is_object()) {
        if (!cfg.is_null()) {
            flatrig::log::warn("[BakeConfig] Config root is not a JSON object; ignoring it.");
        }
        return options;
    }

    read_bool(cfg, "include_unused", options.include_unused);
    read_bool(cfg, "report_missing", options.report_missing);
    read_bool(cfg, "trace_names", options.trace_names);
    read_bool(cfg, "identity_preview", options.identity_preview);

    if (auto it = cfg.find("only"); it != cfg.end()) {
        if (it->is_string() || it->is_array()) {
            options.only = read_name_list(*it);
        } else {
            warn_type("only", "a list of names or a comma-separated string");
        }
    }

    if (auto it = cfg.find("aliases"); it != cfg.end()) {
        if (it->is_object()) {
            for (auto alias = it->begin(); alias != it->end(); ++alias) {
                if (!alias.value().is_string()) {
                    flatrig::log::warn("[BakeConfig] Alias for '" + alias.key() + "' is not a string; skipped.");
                    continue;
                }
                const std::string from = flatrig::catalog::normalize_piece_name(alias.key());
                const std::string to = flatrig::catalog::normalize_piece_name(alias.value().get<std::string>());
                if (!from.empty() && !to.empty()) {
                    options.aliases[from] = to;
                }
            }
        } else {
            warn_type("aliases", "an object of name pairs");
        }
    }

    if (auto it = cfg.find("global_scale"); it != cfg.end()) {
        if (it->is_number() && std::isfinite(it->get<double>()) && it->get<double>() != 0.0) {
            options.global_scale = it->get<double>();
        } else {
            warn_type("global_scale", "a non-zero number");
        }
    }

    if (auto it = cfg.find("frame_rate"); it != cfg.end()) {
        if (it->is_number_integer() && it->get<long long>() > 0 && it->get<long long>() <= 1000) {
            options.frame_rate = static_cast<int>(it->get<long long>());
        } else {
            warn_type("frame_rate", "an integer between 1 and 1000");
        }
    }

    if (auto it = cfg.find("layer_order"); it != cfg.end()) {
        const std::string order = it->is_string() ? flatrig::strings::to_lower_copy(it->get<std::string>()) : std::string();
        if (order == "top_first") {
            options.stacking = LayerStacking::TopToBottom;
        } else if (order == "bottom_first") {
            options.stacking = LayerStacking::BottomToTop;
        } else {
            warn_type("layer_order", "\"top_first\" or \"bottom_first\"");
        }
    }

    if (auto it = cfg.find("worker_threads"); it != cfg.end()) {
        if (it->is_number_integer() && it->get<long long>() >= 0) {
            options.worker_threads = static_cast<std::size_t>(it->get<long long>());
        } else {
            warn_type("worker_threads", "a non-negative integer");
        }
    }

    return options;
}

BakeOptions load_bake_config(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        flatrig::log::debug("[BakeConfig] No config at '" + path.string() + "'; using defaults.");
        return BakeOptions{};
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        std::ostringstream oss;
        oss << "Unable to open bake config at '" << path.string() << "'.";
        throw std::runtime_error(oss.str());
    }

    nlohmann::json cfg;
    try {
        in >> cfg;
    } catch (const nlohmann::json::parse_error& e) {
        std::ostringstream oss;
        oss << "Failed to parse bake config '" << path.string() << "': " << e.what();
        throw std::runtime_error(oss.str());
    }
    return apply_bake_config(cfg);
}

nlohmann::json to_json(const BakeOptions& options) {
    nlohmann::json out = nlohmann::json::object();
    out["include_unused"] = options.include_unused;
    out["only"] = options.only;
    out["aliases"] = nlohmann::json::object();
    for (const auto& [from, to] : options.aliases) {
        out["aliases"][from] = to;
    }
    out["global_scale"] = options.global_scale;
    out["frame_rate"] = options.frame_rate;
    out["layer_order"] = options.stacking == LayerStacking::TopToBottom ? "top_first" : "bottom_first";
    out["report_missing"] = options.report_missing;
    out["trace_names"] = options.trace_names;
    out["identity_preview"] = options.identity_preview;
    out["worker_threads"] = options.worker_threads;
    return out;
}

}
