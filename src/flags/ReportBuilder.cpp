#include "flags/ReportBuilder.hpp"

#include "flags/Fingerprint.hpp"

#include <sstream>

namespace flags {

std::string canonical_dump(const nlohmann::json& cleaned) {
    // nlohmann::json objects are std::map backed, so keys come out sorted
    return cleaned.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

ClassificationResult build_result(const ParseResult& parsed,
                                  const PolicySplit& policy,
                                  const SchemaSplit& schema,
                                  size_t fingerprint_length) {
    ClassificationResult r;
    r.status = ScanStatus::Ok;
    r.parse_mode = parsed.mode;
    r.detail = parsed.detail;
    r.input_keys = parsed.flags.size();

    r.kept = schema.kept;
    r.removed_illegal = policy.removed;
    r.dropped_invalid = schema.dropped;
    r.notes = schema.notes;

    r.cleaned = schema.cleaned;
    r.canonical = canonical_dump(r.cleaned);
    r.fingerprint = fingerprint(r.canonical, fingerprint_length);
    return r;
}

ClassificationResult empty_result(ScanStatus status, const std::string& detail) {
    ClassificationResult r;
    r.status = status;
    r.detail = detail;
    return r;
}

nlohmann::json ClassificationResult::to_json() const {
    nlohmann::json j;

    j["status"] = status_name(status);
    if (status == ScanStatus::Ok) j["source"] = candidate_source_name(source);
    j["parse_mode"] = parse_mode_name(parse_mode);
    if (!detail.empty()) j["detail"] = detail;

    j["counts"] = {
        {"input_keys", input_keys},
        {"kept", kept.size()},
        {"removed_illegal", removed_illegal.size()},
        {"dropped_invalid", dropped_invalid.size()},
        {"coercions", notes.size()}
    };

    j["kept"] = kept;

    nlohmann::json removed = nlohmann::json::array();
    for (const auto& f : removed_illegal) removed.push_back({{"key", f.key}, {"rule", f.rule}});
    j["removed_illegal"] = removed;

    nlohmann::json dropped = nlohmann::json::array();
    for (const auto& f : dropped_invalid) dropped.push_back({{"key", f.key}, {"reason", f.reason}});
    j["dropped_invalid"] = dropped;

    nlohmann::json coercions = nlohmann::json::array();
    for (const auto& n : notes) coercions.push_back({{"key", n.key}, {"note", n.note}});
    j["coercions"] = coercions;

    j["cleaned"] = cleaned;
    if (!fingerprint.empty()) j["fingerprint"] = fingerprint;

    return j;
}

// Each preview piece carries its own separator or section label.
static void add_section(std::vector<std::string>& out, const std::string& label,
                        const std::vector<std::string>& items) {
    for (size_t i = 0; i < items.size(); ++i) {
        const std::string sep = (i == 0) ? ("\n- " + label + ": ") : ", ";
        out.push_back(sep + items[i]);
    }
}

static std::string truncation_marker(size_t omitted) {
    return "\n- ... (+" + std::to_string(omitted) + " more)";
}

std::string render_summary(const ClassificationResult& r, size_t budget) {
    std::ostringstream head;
    head << "Scan result: " << status_name(r.status);
    if (!r.ok()) {
        if (!r.detail.empty()) head << "\n- Detail: " << r.detail;
        return head.str();
    }

    head << "\n- Parse mode: " << parse_mode_name(r.parse_mode);
    head << "\n- Input keys: " << r.input_keys;
    head << "\n- Removed (illegal): " << r.removed_illegal.size();
    head << "\n- Dropped (invalid/unfixable): " << r.dropped_invalid.size();
    head << "\n- Kept: " << r.kept.size();
    head << "\n- Coercions: " << r.notes.size();
    head << "\n- Fingerprint: " << r.fingerprint;

    std::vector<std::string> illegal, dropped, coerced;
    for (const auto& f : r.removed_illegal) illegal.push_back(f.key);
    for (const auto& f : r.dropped_invalid) dropped.push_back(f.key + " (" + f.reason + ")");
    for (const auto& n : r.notes) coerced.push_back(n.key + ": " + n.note);

    std::vector<std::string> pieces;
    add_section(pieces, "Illegal", illegal);
    add_section(pieces, "Dropped", dropped);
    add_section(pieces, "Fixed", coerced);

    std::string out = head.str();

    size_t full = out.size();
    for (const auto& p : pieces) full += p.size();
    if (full <= budget) {
        for (const auto& p : pieces) out += p;
        return out;
    }

    // leave room for the widest marker we could need
    const size_t reserve = truncation_marker(pieces.size()).size();
    size_t i = 0;
    for (; i < pieces.size(); ++i) {
        if (out.size() + pieces[i].size() + reserve > budget) break;
        out += pieces[i];
    }
    out += truncation_marker(pieces.size() - i);
    return out;
}

std::string render_report(const ClassificationResult& r) {
    std::ostringstream out;

    if (!r.removed_illegal.empty()) {
        out << "=== Illegal removed ===\n";
        for (const auto& f : r.removed_illegal) out << f.key << " [" << f.rule << "]\n";
        out << "\n";
    }
    if (!r.dropped_invalid.empty()) {
        out << "=== Invalid/unfixable dropped ===\n";
        for (const auto& f : r.dropped_invalid) out << f.key << ": " << f.reason << "\n";
        out << "\n";
    }
    if (!r.notes.empty()) {
        out << "=== Coercions applied ===\n";
        for (const auto& n : r.notes) out << n.key << ": " << n.note << "\n";
    }

    return out.str();
}

std::string cleaned_file_name(const ClassificationResult& r) {
    return "fflags_cleaned_" + r.fingerprint + ".json";
}

}  // namespace flags
