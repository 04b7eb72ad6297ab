#include "flags/InputNormalizer.hpp"
#include "flags/TolerantParser.hpp"
#include "text/TextUtil.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace flags;

static void test_repair_utf8() {
    assert(textutil::repair_utf8("plain") == "plain");
    assert(textutil::repair_utf8("caf\xC3\xA9") == "caf\xC3\xA9");
    assert(textutil::repair_utf8("a\xFF" "b") == "a\xEF\xBF\xBD" "b");
    // truncated 3-byte sequence collapses into one replacement
    assert(textutil::repair_utf8("\xE2\x82") == "\xEF\xBF\xBD");
    // encoded surrogate is not valid UTF-8
    assert(textutil::repair_utf8("\xED\xA0\x80").find("\xEF\xBF\xBD") != std::string::npos);
}

static void test_strip_enclosing_fence() {
    assert(strip_enclosing_fence("```json\n{\"DFFlagA\": true}\n```") == "{\"DFFlagA\": true}");
    assert(strip_enclosing_fence("```\n{\"a\": 1}\n```") == "{\"a\": 1}");
    assert(strip_enclosing_fence("```{\"a\": 1}```") == "{\"a\": 1}");
    // not fully wrapped: unchanged
    const std::string prose = "see ```json\n{}\n```";
    assert(strip_enclosing_fence(prose) == prose);
}

static void test_candidate_whole_and_bom() {
    auto c = extract_candidate("\xEF\xBB\xBF{\"a\":1}");
    assert(c && c->source == CandidateSource::Whole);
    assert(c->text == "{\"a\":1}");

    c = extract_candidate("```json\n{\"DFFlagA\": true}\n```");
    assert(c && c->source == CandidateSource::Whole);
    assert(c->text == "{\"DFFlagA\": true}");
}

static void test_candidate_from_prose() {
    auto c = extract_candidate("here you go:\n```json\n{\"DFFlagA\": true}\n```\nthanks");
    assert(c && c->source == CandidateSource::FencedBlock);
    assert(c->text == "{\"DFFlagA\": true}");

    // a fenced block wins over an earlier bare brace span
    c = extract_candidate("see {x} then ```JSON\n{\"a\":1}\n```");
    assert(c && c->source == CandidateSource::FencedBlock);
    assert(c->text == "{\"a\":1}");

    c = extract_candidate("flags: {\"a\": 1} ok");
    assert(c && c->source == CandidateSource::BraceSpan);
    assert(c->text == "{\"a\": 1}");

    // first '{' to last '}'
    c = extract_candidate("x {\"a\": {\"b\": 1}} y }");
    assert(c && c->text == "{\"a\": {\"b\": 1}} y }");
}

static void test_candidate_missing() {
    assert(!extract_candidate("hello world"));
    assert(!extract_candidate("} backwards {"));

    // valid JSON that is not an object is handed through for the parser to reject
    auto c = extract_candidate("[1, 2]");
    assert(c && c->source == CandidateSource::Whole && c->text == "[1, 2]");
}

static void test_strict_parse_keeps_kinds() {
    const ParseResult r = parse_flags("{\"DFFlagA\": true, \"FIntB\": 5, \"FStringC\": \"x\", \"FIntD\": \"6\"}");
    assert(r.status == ScanStatus::Ok);
    assert(r.mode == ParseMode::Strict);
    assert(r.flags.size() == 4);
    assert(r.flags.at("DFFlagA").is_boolean());
    assert(r.flags.at("FIntB").is_number_integer());
    assert(r.flags.at("FStringC").is_string());
    assert(r.flags.at("FIntD").is_string());

    // input order is kept
    auto it = r.flags.begin();
    assert(it.key() == "DFFlagA");
    ++it;
    assert(it.key() == "FIntB");
}

static void test_duplicate_keys_last_write_wins() {
    const ParseResult r = parse_flags("{\"FIntA\": 1, \"FIntB\": 2, \"FIntA\": 3}");
    assert(r.status == ScanStatus::Ok);
    assert(r.flags.size() == 2);
    assert(r.flags.at("FIntA").get<int>() == 3);
}

static void test_top_level_not_object() {
    ParseResult r = parse_flags("[1, 2]");
    assert(r.status == ScanStatus::TopLevelNotObject);
    assert(r.detail.find("array") != std::string::npos);
    assert(r.flags.empty());

    r = parse_flags("42");
    assert(r.status == ScanStatus::TopLevelNotObject);
}

static void test_fallback_missing_comma() {
    const ParseResult r = parse_flags("{\"DFFlagX\": true \"DFFlagY\": false}");
    assert(r.status == ScanStatus::Ok);
    assert(r.mode == ParseMode::Fallback);
    assert(!r.detail.empty());
    assert(r.flags.at("DFFlagX").is_boolean() && r.flags.at("DFFlagX").get<bool>());
    assert(r.flags.at("DFFlagY").is_boolean() && !r.flags.at("DFFlagY").get<bool>());
}

static void test_fallback_value_shapes() {
    const RawFlags f = scan_key_values(
        "\"FStringA\": 'hi',\n"
        "\"FIntB\": \"7\",,\n"
        "\"FIntC\": 12,\n"
        "\"DFFlagD\": yes please\n"
        "\"FStringE\": \"a \\\"quoted\\\" word\"\n");

    assert(f.size() == 5);
    assert(f.at("FStringA") == "hi");
    assert(f.at("FIntB") == "7");
    assert(f.at("FIntC").is_number_integer() && f.at("FIntC").get<int>() == 12);
    assert(f.at("DFFlagD") == "yes please");
    assert(f.at("FStringE") == "a \"quoted\" word");
}

static void test_fallback_long_values() {
    // missing comma forces the fallback scan over a 200 KB quoted value
    const std::string quoted(200000, 'a');
    ParseResult r = parse_flags("{\"FStringA\": \"" + quoted + "\" \"DFFlagB\": true}");
    assert(r.status == ScanStatus::Ok);
    assert(r.mode == ParseMode::Fallback);
    assert(r.flags.size() == 2);
    assert(r.flags.at("FStringA").get<std::string>() == quoted);
    assert(r.flags.at("DFFlagB") == true);

    const std::string bare(300000, 'b');
    r = parse_flags("{\"FStringA\": " + bare + ", \"DFFlagB\": true");
    assert(r.status == ScanStatus::Ok);
    assert(r.mode == ParseMode::Fallback);
    assert(r.flags.size() == 2);
    assert(r.flags.at("FStringA").get<std::string>() == bare);

    // unterminated quote runs to the end of the text without a match
    r = parse_flags("{\"FStringA\": \"" + quoted);
    assert(r.status == ScanStatus::NoFlagsParsed);
}

static void test_fallback_long_key() {
    const std::string key = "DFFlag" + std::string(300000, 'k');
    const RawFlags f = scan_key_values("\"" + key + "\": true \"FIntB\": 2");
    assert(f.size() == 2);
    assert(f.at(key) == true);
    assert(f.at("FIntB") == 2);
}

static void test_wide_integer_literals() {
    ParseResult r = parse_flags(
        R"({"FIntHuge": 99999999999999999999999, "FIntBig": 9999999999, "FIntSci": 1e23,)"
        R"( "FIntNeg": -99999999999999999999999, "FStringNest": {"x": 99999999999999999999999}})");
    assert(r.status == ScanStatus::Ok);
    assert(r.mode == ParseMode::Strict);
    assert(r.flags.at("FIntHuge").is_number_float());
    assert(r.flags.at("FIntBig").is_number_integer());
    assert(r.wide_integers.size() == 2);
    assert(r.wide_integers.at("FIntHuge") == "99999999999999999999999");
    assert(r.wide_integers.at("FIntNeg") == "-99999999999999999999999");

    // a later duplicate with an ordinary value clears the record
    r = parse_flags(R"({"FIntHuge": 99999999999999999999999, "FIntHuge": 3})");
    assert(r.wide_integers.empty());
    assert(r.flags.at("FIntHuge") == 3);

    r = parse_flags("{\"FIntHuge\": 99999999999999999999999 \"FIntSci\": 1e23}");
    assert(r.mode == ParseMode::Fallback);
    assert(r.wide_integers.size() == 1);
    assert(r.wide_integers.at("FIntHuge") == "99999999999999999999999");
}

static void test_nothing_parsed() {
    ParseResult r = parse_flags("{ nothing here }");
    assert(r.status == ScanStatus::NoFlagsParsed);
    assert(r.mode == ParseMode::Fallback);

    r = parse_flags("{}");
    assert(r.status == ScanStatus::NoFlagsParsed);
    assert(r.mode == ParseMode::Strict);
}

int main() {
    auto run = [](const char* name, void (*fn)()) {
        try {
            fn();
            std::cout << "PASS: " << name << "\n";
        } catch (const std::exception& e) {
            std::cerr << "FAIL: " << name << ": " << e.what() << "\n";
            throw;
        }
    };

    try {
        run("repair_utf8", test_repair_utf8);
        run("strip_enclosing_fence", test_strip_enclosing_fence);
        run("candidate_whole_and_bom", test_candidate_whole_and_bom);
        run("candidate_from_prose", test_candidate_from_prose);
        run("candidate_missing", test_candidate_missing);
        run("strict_parse_keeps_kinds", test_strict_parse_keeps_kinds);
        run("duplicate_keys_last_write_wins", test_duplicate_keys_last_write_wins);
        run("top_level_not_object", test_top_level_not_object);
        run("fallback_missing_comma", test_fallback_missing_comma);
        run("fallback_value_shapes", test_fallback_value_shapes);
        run("fallback_long_values", test_fallback_long_values);
        run("fallback_long_key", test_fallback_long_key);
        run("wide_integer_literals", test_wide_integer_literals);
        run("nothing_parsed", test_nothing_parsed);
        std::cout << "OK\n";
        return 0;
    } catch (...) {
        return 1;
    }
}
