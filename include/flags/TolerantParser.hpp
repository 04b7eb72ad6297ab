#pragma once
#include <string>

#include "flags/Models.hpp"

namespace flags {

struct ParseResult {
    ScanStatus status = ScanStatus::Ok;   // Ok | NoFlagsParsed | TopLevelNotObject
    ParseMode mode = ParseMode::Strict;
    RawFlags flags = RawFlags::object();

    // top-level integer literals that did not fit in 64 bits
    WideIntegers wide_integers;

    // strict-parse complaint when mode == Fallback, or the top-level complaint
    std::string detail;
};

// Strict JSON first; on syntax error, a linear scan for "key": value pairs.
// Never throws.
ParseResult parse_flags(const std::string& candidate);

// The best-effort scan on its own. Quoted values become strings, unquoted
// JSON literals keep their kind, anything else is kept as raw text. Works in
// a single pass over the text, so value length does not matter.
RawFlags scan_key_values(const std::string& text, WideIntegers* wide = nullptr);

}  // namespace flags
