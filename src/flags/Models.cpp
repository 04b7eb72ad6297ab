#include "flags/Models.hpp"

namespace flags {

const char* status_name(ScanStatus s) {
    switch (s) {
        case ScanStatus::Ok: return "ok";
        case ScanStatus::NoInput: return "no_input";
        case ScanStatus::NoCandidateFound: return "no_candidate_found";
        case ScanStatus::NoFlagsParsed: return "no_flags_parsed";
        case ScanStatus::TopLevelNotObject: return "top_level_not_object";
        default: return "unknown";
    }
}

const char* parse_mode_name(ParseMode m) {
    switch (m) {
        case ParseMode::Strict: return "strict";
        case ParseMode::Fallback: return "fallback";
        default: return "unknown";
    }
}

const char* kind_name(ValueKind k) {
    switch (k) {
        case ValueKind::Bool: return "bool";
        case ValueKind::Int: return "int";
        case ValueKind::String: return "string";
        default: return "unknown";
    }
}

}  // namespace flags
