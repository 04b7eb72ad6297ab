#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "flags/InputNormalizer.hpp"
#include "flags/Models.hpp"
#include "flags/NamePolicy.hpp"
#include "flags/PrefixSchema.hpp"
#include "flags/TolerantParser.hpp"

namespace flags {

constexpr size_t kDefaultSummaryBudget = 1500;

struct ClassificationResult {
    ScanStatus status = ScanStatus::Ok;
    CandidateSource source = CandidateSource::Whole;
    ParseMode parse_mode = ParseMode::Strict;
    std::string detail;

    size_t input_keys = 0;

    // Disjoint buckets; together they hold every parsed key exactly once.
    std::vector<std::string> kept;
    std::vector<RemovedFlag> removed_illegal;
    std::vector<DroppedFlag> dropped_invalid;
    std::vector<CoercionNote> notes;

    nlohmann::json cleaned = nlohmann::json::object();
    std::string canonical;     // empty unless status == Ok
    std::string fingerprint;   // empty unless status == Ok

    bool ok() const { return status == ScanStatus::Ok; }

    nlohmann::json to_json() const;
};

// Sorted keys, 2-space indent, non-ASCII kept as UTF-8.
std::string canonical_dump(const nlohmann::json& cleaned);

ClassificationResult build_result(const ParseResult& parsed,
                                  const PolicySplit& policy,
                                  const SchemaSplit& schema,
                                  size_t fingerprint_length);

// A result with no buckets and no output, for the empty/parse-failure signals.
ClassificationResult empty_result(ScanStatus status, const std::string& detail = "");

// Short human summary. The item preview stays within `budget` characters and
// is cut only between items, with an explicit "... (+N more)" marker.
std::string render_summary(const ClassificationResult& r, size_t budget = kDefaultSummaryBudget);

// Full listing of removed keys, dropped keys and coercions (scan_report.txt).
std::string render_report(const ClassificationResult& r);

// fflags_cleaned_<fingerprint>.json
std::string cleaned_file_name(const ClassificationResult& r);

}  // namespace flags
