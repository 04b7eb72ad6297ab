#pragma once
#include <cstdint>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "flags/Models.hpp"

namespace flags {

constexpr int64_t kIntMin = -2147483648LL;
constexpr int64_t kIntMax = 2147483647LL;

struct PrefixRule {
    std::string prefix;
    ValueKind kind = ValueKind::String;
};

struct PrefixSchema {
    // evaluated in order, first match wins
    std::vector<PrefixRule> rules;

    // every classified key must also match this
    std::string key_pattern_source;
    std::regex key_pattern;
};

// Throws std::runtime_error on an invalid pattern.
void set_key_pattern(PrefixSchema& schema, const std::string& source);

// "bool" | "int" | "string" (alias "str")
std::optional<ValueKind> parse_kind(const std::string& name);

std::optional<ValueKind> expected_kind(const std::string& key, const PrefixSchema& schema);

struct CoercionResult {
    std::optional<nlohmann::json> value;  // set when accepted
    std::string note;                     // fix note when accepted (may be empty), reason when rejected

    bool accepted() const { return value.has_value(); }
};

// int_literal, when non-empty, is the source text of an integer too wide for
// 64 bits that the parser stored in v as a double.
CoercionResult coerce_value(ValueKind expected, const RawFlags& v, const std::string& int_literal = "");

struct SchemaSplit {
    nlohmann::json cleaned = nlohmann::json::object();
    std::vector<std::string> kept;        // input order
    std::vector<DroppedFlag> dropped;
    std::vector<CoercionNote> notes;
};

// Keys longer than kMaxKeyLength are dropped as invalid_name before the key
// pattern runs.
SchemaSplit classify_flags(const RawFlags& flags, const PrefixSchema& schema, const WideIntegers& wide = {});

}  // namespace flags
