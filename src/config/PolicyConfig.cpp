#include "config/PolicyConfig.hpp"

#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

using json = nlohmann::json;

namespace config {

static const char* kDefaultKeyPattern = "^[A-Za-z0-9_]+$";

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static const json& require_array(const json& j, const char* key, const std::string& where) {
    const json& arr = j.at(key);
    if (!arr.is_array()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be an array");
    }
    return arr;
}

static std::string require_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

static std::vector<std::string> require_string_array(const json& j, const char* key, const std::string& where) {
    const json& arr = require_array(j, key, where);
    std::vector<std::string> out;
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        if (!arr.at(i).is_string()) {
            std::ostringstream oss;
            oss << where << "." << key << "[" << i << "] must be a string";
            throw std::runtime_error(oss.str());
        }
        out.push_back(arr.at(i).get<std::string>());
    }
    return out;
}

static size_t require_positive(const json& j, const char* key, const std::string& where) {
    const json& v = j.at(key);
    if (!v.is_number_integer() || v.get<long long>() <= 0) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a positive integer");
    }
    return v.get<size_t>();
}

static flags::PrefixRule parse_prefix_rule(const json& j, const std::string& where) {
    require_object(j, where);

    flags::PrefixRule r;
    r.prefix = require_string(j, "prefix", where);
    if (r.prefix.empty()) throw std::runtime_error(where + ".prefix must not be empty");

    const std::string kind = require_string(j, "kind", where);
    const auto k = flags::parse_kind(kind);
    if (!k) throw std::runtime_error(where + ".kind unknown: " + kind + " (expected bool|int|string)");
    r.kind = *k;
    return r;
}

Settings default_settings() {
    Settings s;

    const std::pair<const char*, flags::ValueKind> prefixes[] = {
        {"DFFlag", flags::ValueKind::Bool},     {"FFlag", flags::ValueKind::Bool},
        {"DFInt", flags::ValueKind::Int},       {"FInt", flags::ValueKind::Int},
        {"DFString", flags::ValueKind::String}, {"FString", flags::ValueKind::String},
        {"DFLog", flags::ValueKind::Int},       {"FLog", flags::ValueKind::Int},
        {"DFBool", flags::ValueKind::Bool},     {"FBool", flags::ValueKind::Bool},
    };
    for (const auto& p : prefixes) s.policy.schema.rules.push_back(flags::PrefixRule{p.first, p.second});
    flags::set_key_pattern(s.policy.schema, kDefaultKeyPattern);

    s.policy.names.substrings = {"debounce", "decomp", "humanoid"};
    return s;
}

Settings settings_from_json(const json& j) {
    require_object(j, "policy");

    Settings s = default_settings();

    if (j.contains("prefixes")) {
        const json& arr = require_array(j, "prefixes", "policy");
        s.policy.schema.rules.clear();
        for (size_t i = 0; i < arr.size(); ++i) {
            std::ostringstream oss;
            oss << "policy.prefixes[" << i << "]";
            s.policy.schema.rules.push_back(parse_prefix_rule(arr.at(i), oss.str()));
        }
    }

    if (j.contains("key_pattern")) {
        flags::set_key_pattern(s.policy.schema, require_string(j, "key_pattern", "policy"));
    }

    if (j.contains("banned")) {
        const json& b = j.at("banned");
        require_object(b, "policy.banned");

        if (b.contains("exact")) {
            const auto names = require_string_array(b, "exact", "policy.banned");
            s.policy.names.exact = std::set<std::string>(names.begin(), names.end());
        }
        if (b.contains("substrings")) {
            s.policy.names.substrings = require_string_array(b, "substrings", "policy.banned");
        }
        if (b.contains("patterns")) {
            const auto pats = require_string_array(b, "patterns", "policy.banned");
            s.policy.names.patterns.clear();
            for (size_t i = 0; i < pats.size(); ++i) {
                try {
                    s.policy.names.patterns.push_back(flags::make_ban_pattern(pats[i]));
                } catch (const std::exception& e) {
                    std::ostringstream oss;
                    oss << "policy.banned.patterns[" << i << "]: " << e.what();
                    throw std::runtime_error(oss.str());
                }
            }
        }
    }

    if (j.contains("max_input_bytes")) s.max_input_bytes = require_positive(j, "max_input_bytes", "policy");
    if (j.contains("summary_budget")) s.summary_budget = require_positive(j, "summary_budget", "policy");
    if (j.contains("fingerprint_length")) {
        s.policy.fingerprint_length = require_positive(j, "fingerprint_length", "policy");
        if (s.policy.fingerprint_length > 64) throw std::runtime_error("policy.fingerprint_length must be at most 64");
    }

    return s;
}

Settings load_settings(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open policy file: " + path.string());
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("failed to parse policy JSON: ") + e.what());
    }

    return settings_from_json(j);
}

json settings_to_json(const Settings& s) {
    json j;

    json prefixes = json::array();
    for (const auto& r : s.policy.schema.rules) {
        prefixes.push_back({{"prefix", r.prefix}, {"kind", flags::kind_name(r.kind)}});
    }
    j["prefixes"] = prefixes;
    j["key_pattern"] = s.policy.schema.key_pattern_source;

    json patterns = json::array();
    for (const auto& p : s.policy.names.patterns) patterns.push_back(p.source);

    j["banned"] = {
        {"exact", s.policy.names.exact},
        {"substrings", s.policy.names.substrings},
        {"patterns", patterns}
    };

    j["max_input_bytes"] = s.max_input_bytes;
    j["summary_budget"] = s.summary_budget;
    j["fingerprint_length"] = s.policy.fingerprint_length;
    return j;
}

}  // namespace config
