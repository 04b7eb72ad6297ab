#include "flags/InputNormalizer.hpp"

#include "flags/Models.hpp"
#include "text/TextUtil.hpp"

#include <cctype>

namespace flags {

static const std::string kFence = "```";

static bool is_language_tag(const std::string& line) {
    const std::string t = textutil::trim(line);
    if (t.empty()) return true;
    for (unsigned char c : t) {
        if (!(std::isalnum(c) || c == '_' || c == '-' || c == '+' || c == '.')) return false;
    }
    return true;
}

std::string strip_enclosing_fence(const std::string& text) {
    const std::string t = textutil::trim(text);
    if (t.size() < 2 * kFence.size()) return text;
    if (!textutil::starts_with(t, kFence)) return text;
    if (t.compare(t.size() - kFence.size(), kFence.size(), kFence) != 0) return text;

    std::string inner = t.substr(kFence.size(), t.size() - 2 * kFence.size());

    // ```json\n{...}\n``` : the first line is a language tag
    const auto nl = inner.find('\n');
    if (nl != std::string::npos && is_language_tag(inner.substr(0, nl))) {
        inner = inner.substr(nl + 1);
    }
    return textutil::trim(inner);
}

static std::optional<std::string> find_fenced_object(const std::string& text) {
    size_t pos = 0;
    while (true) {
        const size_t open = text.find(kFence, pos);
        if (open == std::string::npos) return std::nullopt;

        size_t i = open + kFence.size();
        if (textutil::to_lower(text.substr(i, 4)) == "json") i += 4;
        while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;

        if (i >= text.size() || text[i] != '{') {
            pos = open + kFence.size();
            continue;
        }

        const size_t close = text.find(kFence, i);
        if (close == std::string::npos) return std::nullopt;

        const std::string body = textutil::trim(text.substr(i, close - i));
        if (!body.empty() && body.back() == '}') return body;

        pos = close;
    }
}

std::optional<Candidate> extract_candidate(const std::string& text) {
    const std::string unbommed = textutil::strip_bom(text);
    const std::string stripped = textutil::trim(textutil::strip_bom(strip_enclosing_fence(unbommed)));

    if (!stripped.empty() && RawFlags::accept(stripped)) {
        return Candidate{stripped, CandidateSource::Whole};
    }

    if (auto fenced = find_fenced_object(unbommed)) {
        return Candidate{*fenced, CandidateSource::FencedBlock};
    }

    const auto a = unbommed.find('{');
    const auto b = unbommed.rfind('}');
    if (a != std::string::npos && b != std::string::npos && b > a) {
        return Candidate{unbommed.substr(a, b - a + 1), CandidateSource::BraceSpan};
    }

    return std::nullopt;
}

const char* candidate_source_name(CandidateSource s) {
    switch (s) {
        case CandidateSource::Whole: return "whole";
        case CandidateSource::FencedBlock: return "fenced_block";
        case CandidateSource::BraceSpan: return "brace_span";
        default: return "unknown";
    }
}

}  // namespace flags
