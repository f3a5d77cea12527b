#include <cmath>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "catalog/piece_catalog.hpp"
#include "core/bake_config/bake_config_loader.hpp"
#include "io/baked_timeline_writer.hpp"
#include "io/rig_json_loader.hpp"
#include "timeline/timeline_baker.hpp"
#include "utils/log.hpp"
#include "utils/string_utils.hpp"

namespace fs = std::filesystem;

namespace {

constexpr int kExitOk       = 0;
constexpr int kExitFailure  = 1;
constexpr int kExitNoFrames = 3;

struct CliArgs {
    fs::path input;
    std::optional<fs::path> output;
    std::optional<fs::path> config;
    std::optional<double> scale;
    std::optional<std::size_t> jobs;
    std::optional<int> fps;
    std::optional<double> width;
    std::optional<double> height;
    std::optional<std::string> log_file;
    std::vector<std::string> only;
    std::vector<std::string> aliases;
    bool include_unused = false;
    bool report_missing = false;
    bool trace_names = false;
    bool identity_sprite = false;
    bool list_pieces = false;
    bool bottom_first = false;
    bool verbose = false;
    bool help = false;
};

void print_usage(std::ostream& os) {
    os << "Usage: flatrig <animation.json> [options]\n"
          "  -o, --out PATH         output timeline (default: <input>.timeline.json)\n"
          "  -c, --config PATH      bake config JSON; flags below override it\n"
          "      --scale G          global scale applied to a,b,c,d,tx,ty (non-zero)\n"
          "      --fps N            timeline frame rate (default 30)\n"
          "      --w W, --h H       stage size; one side alone keeps the aspect ratio\n"
          "      --include-unused   also create layers for pieces that never appear\n"
          "      --only A,B         build layers only for these pieces\n"
          "      --alias FROM=TO    map a frame name to a catalog name (repeatable)\n"
          "      --report-missing   warn about names with no catalog entry\n"
          "      --trace-names      print per-piece usage and layering decisions\n"
          "      --identity-sprite  one frame with every piece at its registration point\n"
          "      --list-pieces      print catalog piece names and exit\n"
          "      --bottom-first     enumerate layers bottom-to-top\n"
          "  -j, --jobs N           flatten frames on N threads (0 = all cores)\n"
          "      --log-file PATH    also write log lines to PATH\n"
          "  -v, --verbose          debug logging\n";
}

bool parse_positive(const std::string& flag, const std::string& value, double& out, std::string& error) {
    std::istringstream iss(value);
    double parsed = 0.0;
    if (!(iss >> parsed) || !std::isfinite(parsed) || parsed <= 0.0) {
        error = flag + " expects a positive number, got '" + value + "'";
        return false;
    }
    out = parsed;
    return true;
}

bool parse_args(int argc, char* argv[], CliArgs& args, std::string& error) {
    auto need_value = [&](int& i, const std::string& flag, std::string& out) -> bool {
        if (i + 1 >= argc || !argv[i + 1]) {
            error = "missing value for " + flag;
            return false;
        }
        out = argv[++i];
        return true;
    };

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i] ? argv[i] : "";
        std::string value;
        if (arg == "-h" || arg == "--help") {
            args.help = true;
        } else if (arg == "-o" || arg == "--out") {
            if (!need_value(i, arg, value)) return false;
            args.output = fs::path(value);
        } else if (arg == "-c" || arg == "--config") {
            if (!need_value(i, arg, value)) return false;
            args.config = fs::path(value);
        } else if (arg == "--scale") {
            if (!need_value(i, arg, value)) return false;
            std::istringstream iss(value);
            double scale = 0.0;
            if (!(iss >> scale) || !std::isfinite(scale) || scale == 0.0) {
                error = "--scale expects a non-zero number, got '" + value + "'";
                return false;
            }
            args.scale = scale;
        } else if (arg == "--fps") {
            if (!need_value(i, arg, value)) return false;
            std::istringstream iss(value);
            int fps = 0;
            if (!(iss >> fps) || fps <= 0 || fps > 1000) {
                error = "--fps expects an integer between 1 and 1000, got '" + value + "'";
                return false;
            }
            args.fps = fps;
        } else if (arg == "--w" || arg == "--h") {
            if (!need_value(i, arg, value)) return false;
            double size = 0.0;
            if (!parse_positive(arg, value, size, error)) return false;
            (arg == "--w" ? args.width : args.height) = size;
        } else if (arg == "-j" || arg == "--jobs") {
            if (!need_value(i, arg, value)) return false;
            std::istringstream iss(value);
            long long jobs = 0;
            if (!(iss >> jobs) || jobs < 0) {
                error = arg + " expects a non-negative integer, got '" + value + "'";
                return false;
            }
            args.jobs = static_cast<std::size_t>(jobs);
        } else if (arg == "--only") {
            if (!need_value(i, arg, value)) return false;
            for (const auto& name : flatrig::strings::split_trimmed(value, ',')) {
                args.only.push_back(name);
            }
        } else if (arg == "--alias") {
            if (!need_value(i, arg, value)) return false;
            args.aliases.push_back(value);
        } else if (arg == "--include-unused") {
            args.include_unused = true;
        } else if (arg == "--report-missing") {
            args.report_missing = true;
        } else if (arg == "--trace-names") {
            args.trace_names = true;
        } else if (arg == "--identity-sprite") {
            args.identity_sprite = true;
        } else if (arg == "--list-pieces") {
            args.list_pieces = true;
        } else if (arg == "--bottom-first") {
            args.bottom_first = true;
        } else if (arg == "--log-file") {
            if (!need_value(i, arg, value)) return false;
            args.log_file = value;
        } else if (arg == "-v" || arg == "--verbose") {
            args.verbose = true;
        } else if (!arg.empty() && arg[0] == '-') {
            error = "unknown option " + arg;
            return false;
        } else if (args.input.empty()) {
            args.input = arg;
        } else {
            error = "unexpected argument " + arg;
            return false;
        }
    }

    if (!args.help && args.input.empty()) {
        error = "no animation file given";
        return false;
    }
    return true;
}

flatrig::timeline::BakeOptions merge_options(flatrig::timeline::BakeOptions options, const CliArgs& args) {
    if (args.include_unused)  options.include_unused = true;
    if (args.report_missing)  options.report_missing = true;
    if (args.trace_names)     options.trace_names = true;
    if (args.identity_sprite) options.identity_preview = true;
    if (args.bottom_first)    options.stacking = flatrig::timeline::LayerStacking::BottomToTop;
    if (args.scale)           options.global_scale = *args.scale;
    if (args.jobs)            options.worker_threads = *args.jobs;
    if (args.fps)             options.frame_rate = *args.fps;
    if (!args.only.empty()) {
        options.only.clear();
        for (const auto& name : args.only) {
            options.only.push_back(flatrig::catalog::normalize_piece_name(name));
        }
    }
    for (const auto& pair : args.aliases) {
        if (auto alias = flatrig::catalog::parse_alias_pair(pair)) {
            options.aliases[alias->first] = alias->second;
        } else {
            flatrig::log::warn("[Main] Ignoring malformed alias '" + pair + "'; expected FROM=TO.");
        }
    }
    return options;
}

fs::path default_output_path(const fs::path& input) {
    fs::path out = input;
    out.replace_extension(".timeline.json");
    return out;
}

}

int main(int argc, char* argv[]) {
    CliArgs args;
    std::string error;
    if (!parse_args(argc, argv, args, error)) {
        std::cerr << "flatrig: " << error << "\n";
        print_usage(std::cerr);
        return kExitFailure;
    }
    if (args.help) {
        print_usage(std::cout);
        return kExitOk;
    }
    if (args.verbose) {
        flatrig::log::set_level(flatrig::log::Level::Debug);
    }
    if (args.log_file && !flatrig::log::open_file(*args.log_file, false)) {
        flatrig::log::warn("[Main] Could not open log file '" + *args.log_file + "'.");
    }

    try {
        flatrig::timeline::BakeOptions options;
        if (args.config) {
            options = flatrig::bake_config::load_bake_config(*args.config);
        }
        options = merge_options(std::move(options), args);
        flatrig::log::debug("[Main] Bake options: " + flatrig::bake_config::to_json(options).dump());

        flatrig::io::RigDocument doc = flatrig::io::load_rig_document(args.input);
        flatrig::io::override_stage_size(doc, args.width, args.height);

        if (args.list_pieces) {
            for (const auto& name : doc.catalog.names()) {
                std::cout << name << "\n";
            }
            return kExitOk;
        }

        const flatrig::timeline::TimelineBaker baker(options);
        flatrig::timeline::BakeResult result = baker.bake(doc.frames, doc.shared, doc.catalog, doc.labels);
        if (!result.ok()) {
            flatrig::log::error(std::string("[Main] Bake failed: ") + flatrig::timeline::to_string(result.status) +
                                " in '" + args.input.string() + "'. Use --identity-sprite to preview pieces.");
            return kExitNoFrames;
        }

        result.timeline.stage_width  = doc.width * std::abs(options.global_scale);
        result.timeline.stage_height = doc.height * std::abs(options.global_scale);

        const fs::path output = args.output ? *args.output : default_output_path(args.input);
        flatrig::io::write_baked_timeline(output, result.timeline);
        std::cout << "Timeline written to: " << output.string() << "\n";
    } catch (const std::exception& e) {
        flatrig::log::error(std::string("[Main] ") + e.what());
        return kExitFailure;
    }
    return kExitOk;
}
