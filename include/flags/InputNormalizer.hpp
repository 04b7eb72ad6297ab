#pragma once
#include <optional>
#include <string>

namespace flags {

enum class CandidateSource {
    Whole,        // the (fence/BOM-stripped) text itself parses as JSON
    FencedBlock,  // body of a ```json fenced block inside the text
    BraceSpan     // first '{' to last '}' of the text
};

struct Candidate {
    std::string text;
    CandidateSource source = CandidateSource::Whole;
};

// If the whole text is a ``` fenced block, return its body without the
// optional language tag line. Otherwise return the text unchanged.
std::string strip_enclosing_fence(const std::string& text);

// Picks the JSON-looking substring of free-form text. A whole text that
// parses as JSON but is not an object is still returned (as Whole) so the
// parser can report it. nullopt when no {...} span exists.
std::optional<Candidate> extract_candidate(const std::string& text);

const char* candidate_source_name(CandidateSource s);

}  // namespace flags
