#include "flags/TolerantParser.hpp"

#include "text/TextUtil.hpp"

#include <cctype>
#include <utility>
#include <vector>

namespace flags {

// -?[0-9]+
static bool is_integer_literal(const std::string& s) {
    size_t i = (!s.empty() && s[0] == '-') ? 1 : 0;
    if (i == s.size()) return false;
    for (; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

// Builds the DOM like the library's own parser, but sees the lexeme of every
// float so integer literals wider than 64 bits can be told apart from 1e23.
class FlagSax : public nlohmann::json_sax<RawFlags> {
public:
    RawFlags root;
    WideIntegers wide;
    std::string error;

    bool null() override { return put(nullptr) != nullptr; }
    bool boolean(bool val) override { return put(val) != nullptr; }
    bool number_integer(number_integer_t val) override { return put(val) != nullptr; }
    bool number_unsigned(number_unsigned_t val) override { return put(val) != nullptr; }

    bool number_float(number_float_t val, const string_t& s) override {
        put(val);
        if (stack_.size() == 1 && is_integer_literal(s)) wide[key_] = s;
        return true;
    }

    bool string(string_t& val) override { return put(std::move(val)) != nullptr; }
    bool binary(binary_t& val) override { return put(RawFlags::binary(std::move(val))) != nullptr; }

    bool start_object(std::size_t) override {
        stack_.push_back(put(RawFlags::object()));
        return true;
    }

    bool key(string_t& val) override {
        key_ = val;
        return true;
    }

    bool end_object() override {
        stack_.pop_back();
        return true;
    }

    bool start_array(std::size_t) override {
        stack_.push_back(put(RawFlags::array()));
        return true;
    }

    bool end_array() override {
        stack_.pop_back();
        return true;
    }

    bool parse_error(std::size_t, const std::string&, const RawFlags::exception& ex) override {
        error = ex.what();
        return false;
    }

private:
    // Containers on the stack are only ever written through their innermost
    // pointer, so earlier pointers stay valid until popped.
    RawFlags* put(RawFlags v) {
        if (stack_.empty()) {
            root = std::move(v);
            return &root;
        }
        RawFlags& top = *stack_.back();
        if (top.is_object()) {
            if (stack_.size() == 1) wide.erase(key_);
            top[key_] = std::move(v);
            return &top[key_];
        }
        top.push_back(std::move(v));
        return &top.back();
    }

    std::vector<RawFlags*> stack_;
    std::string key_;
};

static std::string decode_json_string(const std::string& quoted) {
    const RawFlags j = RawFlags::parse(quoted, nullptr, false);
    if (j.is_string()) return j.get<std::string>();
    return quoted.substr(1, quoted.size() - 2);
}

// Sets int_literal when the value is a bare integer too wide for 64 bits.
static RawFlags typed_value(std::string raw, std::string& int_literal) {
    int_literal.clear();
    raw = textutil::trim(raw);
    if (!raw.empty() && raw.back() == ',') raw = textutil::trim(raw.substr(0, raw.size() - 1));

    if (raw.size() >= 2 && raw.front() == '"' && raw.back() == '"') {
        return decode_json_string(raw);
    }
    if (raw.size() >= 2 && raw.front() == '\'' && raw.back() == '\'') {
        return raw.substr(1, raw.size() - 2);
    }

    // bare literal: true / false / null / number
    const RawFlags j = RawFlags::parse(raw, nullptr, false);
    if (!j.is_discarded() && j.is_primitive() && !j.is_string()) {
        if (j.is_number_float() && is_integer_literal(raw)) int_literal = raw;
        return j;
    }

    return raw;
}

// text[open] == '"'. Finds the closing quote on the same line, honouring
// backslash escapes.
static bool find_closing_quote(const std::string& text, size_t open, size_t& close) {
    for (size_t i = open + 1; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '\n') return false;
        if (c == '\\') {
            if (i + 1 >= text.size() || text[i + 1] == '\n') return false;
            ++i;
            continue;
        }
        if (c == '"') {
            close = i;
            return true;
        }
    }
    return false;
}

static size_t skip_space(const std::string& text, size_t i) {
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
    return i;
}

static bool ends_bare_value(char c) {
    return c == ',' || c == '\n' || c == '\r' || c == '}' || c == '"';
}

// Value span starting at i: "double quoted", 'single quoted' on one line, or a
// bare run up to , newline } or ". Returns the end offset, npos if none.
static size_t value_end(const std::string& text, size_t i) {
    if (i >= text.size()) return std::string::npos;

    if (text[i] == '"') {
        size_t close = 0;
        return find_closing_quote(text, i, close) ? close + 1 : std::string::npos;
    }
    if (text[i] == '\'') {
        const size_t close = text.find_first_of("'\n", i + 1);
        if (close != std::string::npos && text[close] == '\'') return close + 1;
    }

    size_t j = i;
    while (j < text.size() && !ends_bare_value(text[j])) ++j;
    return j > i ? j : std::string::npos;
}

RawFlags scan_key_values(const std::string& text, WideIntegers* wide) {
    RawFlags out = RawFlags::object();

    size_t pos = 0;
    while ((pos = text.find('"', pos)) != std::string::npos) {
        size_t key_close = 0;
        if (!find_closing_quote(text, pos, key_close)) {
            ++pos;
            continue;
        }

        size_t i = skip_space(text, key_close + 1);
        if (i >= text.size() || text[i] != ':') {
            ++pos;
            continue;
        }
        i = skip_space(text, i + 1);

        const size_t end = value_end(text, i);
        if (end == std::string::npos) {
            ++pos;
            continue;
        }

        const std::string key = decode_json_string(text.substr(pos, key_close - pos + 1));
        if (!key.empty()) {
            std::string int_literal;
            out[key] = typed_value(text.substr(i, end - i), int_literal);
            if (wide) {
                if (int_literal.empty()) wide->erase(key);
                else (*wide)[key] = int_literal;
            }
        }
        pos = end;
    }
    return out;
}

ParseResult parse_flags(const std::string& candidate) {
    ParseResult res;

    FlagSax sax;
    const bool strict_ok = RawFlags::sax_parse(candidate, &sax);

    if (strict_ok) {
        if (!sax.root.is_object()) {
            res.status = ScanStatus::TopLevelNotObject;
            res.detail = std::string("top-level value must be an object, got ") + sax.root.type_name();
            return res;
        }
        res.mode = ParseMode::Strict;
        res.flags = std::move(sax.root);
        res.wide_integers = std::move(sax.wide);
    } else {
        res.detail = sax.error;
        res.mode = ParseMode::Fallback;
        res.flags = scan_key_values(candidate, &res.wide_integers);
    }

    if (res.flags.empty()) res.status = ScanStatus::NoFlagsParsed;
    return res;
}

}  // namespace flags
