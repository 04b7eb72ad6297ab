#include "flags/Pipeline.hpp"

#include "flags/InputNormalizer.hpp"
#include "flags/TolerantParser.hpp"
#include "text/TextUtil.hpp"

namespace flags {

ClassificationResult run_scan(const std::string& text, const ScanPolicy& policy) {
    if (textutil::trim(textutil::strip_bom(text)).empty()) {
        return empty_result(ScanStatus::NoInput, "no input provided");
    }

    const auto candidate = extract_candidate(text);
    if (!candidate) {
        return empty_result(ScanStatus::NoCandidateFound, "no {...} object found in input");
    }

    const ParseResult parsed = parse_flags(candidate->text);
    if (parsed.status == ScanStatus::TopLevelNotObject) {
        return empty_result(parsed.status, parsed.detail);
    }
    if (parsed.status == ScanStatus::NoFlagsParsed) {
        ClassificationResult r = empty_result(parsed.status, "could not parse any key");
        r.parse_mode = parsed.mode;
        return r;
    }

    const PolicySplit split = apply_name_policy(parsed.flags, policy.names);
    const SchemaSplit schema = classify_flags(split.kept, policy.schema, parsed.wide_integers);

    ClassificationResult r = build_result(parsed, split, schema, policy.fingerprint_length);
    r.source = candidate->source;
    return r;
}

}  // namespace flags
