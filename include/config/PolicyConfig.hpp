#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include "nlohmann/json.hpp"
#include "flags/Pipeline.hpp"

namespace config {

struct Settings {
    flags::ScanPolicy policy;

    // boundary limits, enforced by the caller of run_scan
    size_t max_input_bytes = 1024 * 1024;
    size_t summary_budget = 1500;
};

// DFFlag/FFlag/DFInt/FInt/DFString/FString/DFLog/FLog/DFBool/FBool prefixes,
// banned substrings debounce/decomp/humanoid.
Settings default_settings();

// Fields missing from `j` keep their defaults. Throws std::runtime_error with
// a path-qualified message on malformed input.
Settings settings_from_json(const nlohmann::json& j);

Settings load_settings(const std::filesystem::path& path);

nlohmann::json settings_to_json(const Settings& s);

}  // namespace config
