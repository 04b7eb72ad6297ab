#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace flags {

// Parsed payload before classification. Keeps input order; duplicate keys
// collapse last-write-wins at the first key's position.
using RawFlags = nlohmann::ordered_json;

// Top-level key -> literal text of an integer too wide for 64 bits. The JSON
// library stores such literals as doubles, so the digits travel beside them.
using WideIntegers = std::map<std::string, std::string>;

// Longer keys never reach a regex; they are dropped as invalid_name.
constexpr std::size_t kMaxKeyLength = 256;

enum class ValueKind {
    Bool,
    Int,
    String
};

enum class ScanStatus {
    Ok,
    NoInput,            // blank text
    NoCandidateFound,   // no {...} span anywhere
    NoFlagsParsed,      // candidate found, zero key/value pairs recovered
    TopLevelNotObject   // parsed, but not a single object
};

enum class ParseMode {
    Strict,    // full JSON parse succeeded
    Fallback   // best-effort key/value scan; nested/escaped content may be lost
};

struct RemovedFlag {
    std::string key;
    std::string rule;   // "exact:<name>" | "substring:<s>" | "pattern:<re>"
};

struct DroppedFlag {
    std::string key;
    std::string reason; // unknown_type | invalid_name | bad_type_* | int_out_of_range
};

struct CoercionNote {
    std::string key;
    std::string note;   // string_bool_fixed | string_int_fixed | primitive_to_string
};

const char* status_name(ScanStatus s);
const char* parse_mode_name(ParseMode m);
const char* kind_name(ValueKind k);

}  // namespace flags
