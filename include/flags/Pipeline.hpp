#pragma once

#include <cstddef>
#include <string>

#include "flags/NamePolicy.hpp"
#include "flags/PrefixSchema.hpp"
#include "flags/ReportBuilder.hpp"

namespace flags {

struct ScanPolicy {
    NamePolicy names;
    PrefixSchema schema;
    size_t fingerprint_length = 8;
};

// normalize -> parse -> name policy -> schema/coercion -> report.
// Pure: no I/O, no shared mutable state. The caller decodes the text and
// enforces any size limit beforehand.
ClassificationResult run_scan(const std::string& text, const ScanPolicy& policy);

}  // namespace flags
