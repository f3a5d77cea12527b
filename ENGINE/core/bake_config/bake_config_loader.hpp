#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "timeline/timeline_baker.hpp"

namespace flatrig::bake_config {

// Applies recognised keys of `config_json` on top of `base`. Keys with the wrong
// type are logged and leave the corresponding option untouched.
flatrig::timeline::BakeOptions apply_bake_config(const nlohmann::json& config_json,
                                                 flatrig::timeline::BakeOptions base = {});

// A missing file yields defaults. Throws std::runtime_error when the file exists
// but cannot be read or parsed.
flatrig::timeline::BakeOptions load_bake_config(const std::filesystem::path& path);

nlohmann::json to_json(const flatrig::timeline::BakeOptions& options);

}
