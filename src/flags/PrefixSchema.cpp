#include "flags/PrefixSchema.hpp"

#include "text/TextUtil.hpp"

#include <cctype>
#include <stdexcept>

namespace flags {

void set_key_pattern(PrefixSchema& schema, const std::string& source) {
    try {
        schema.key_pattern = std::regex(source, std::regex::ECMAScript);
        schema.key_pattern_source = source;
    } catch (const std::regex_error& e) {
        throw std::runtime_error("invalid key pattern '" + source + "': " + e.what());
    }
}

std::optional<ValueKind> parse_kind(const std::string& name) {
    const std::string n = textutil::to_lower(textutil::trim(name));
    if (n == "bool") return ValueKind::Bool;
    if (n == "int") return ValueKind::Int;
    if (n == "string" || n == "str") return ValueKind::String;
    return std::nullopt;
}

std::optional<ValueKind> expected_kind(const std::string& key, const PrefixSchema& schema) {
    for (const auto& r : schema.rules) {
        if (textutil::starts_with(key, r.prefix)) return r.kind;
    }
    return std::nullopt;
}

// -?[0-9]+ ; sets out_of_range instead of overflowing
static bool parse_int_literal(const std::string& s, int64_t& out, bool& out_of_range) {
    out_of_range = false;
    size_t i = 0;
    bool neg = false;
    if (i < s.size() && s[i] == '-') {
        neg = true;
        ++i;
    }
    if (i == s.size()) return false;

    int64_t mag = 0;
    for (; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
        if (!out_of_range) {
            mag = mag * 10 + (s[i] - '0');
            if (mag > kIntMax + 1) out_of_range = true;
        }
    }

    if (out_of_range) return true;
    out = neg ? -mag : mag;
    if (out < kIntMin || out > kIntMax) out_of_range = true;
    return true;
}

static CoercionResult accept(nlohmann::json v, std::string note = "") {
    return CoercionResult{std::move(v), std::move(note)};
}

static CoercionResult reject(std::string reason) {
    return CoercionResult{std::nullopt, std::move(reason)};
}

CoercionResult coerce_value(ValueKind expected, const RawFlags& v, const std::string& int_literal) {
    switch (expected) {
        case ValueKind::Bool: {
            if (v.is_boolean()) return accept(v.get<bool>());
            if (v.is_string()) {
                const std::string s = textutil::to_lower(textutil::trim(v.get<std::string>()));
                if (s == "true" || s == "false") return accept(s == "true", "string_bool_fixed");
            }
            return reject("bad_type_bool");
        }

        case ValueKind::Int: {
            if (!int_literal.empty()) return reject("int_out_of_range");
            if (v.is_number_integer()) {
                // unsigned values above int64 range are out of range too
                if (v.is_number_unsigned()) {
                    const uint64_t u = v.get<uint64_t>();
                    if (u > static_cast<uint64_t>(kIntMax)) return reject("int_out_of_range");
                    return accept(static_cast<int64_t>(u));
                }
                const int64_t n = v.get<int64_t>();
                if (n < kIntMin || n > kIntMax) return reject("int_out_of_range");
                return accept(n);
            }
            if (v.is_string()) {
                int64_t n = 0;
                bool out_of_range = false;
                if (parse_int_literal(textutil::trim(v.get<std::string>()), n, out_of_range)) {
                    if (out_of_range) return reject("int_out_of_range");
                    return accept(n, "string_int_fixed");
                }
            }
            return reject("bad_type_int");
        }

        case ValueKind::String: {
            if (v.is_string()) return accept(v.get<std::string>());
            if (!int_literal.empty()) return accept(int_literal, "primitive_to_string");
            if (v.is_boolean() || v.is_number()) return accept(v.dump(), "primitive_to_string");
            return reject("bad_type_str");
        }
    }

    return reject("unknown_type");
}

SchemaSplit classify_flags(const RawFlags& flags, const PrefixSchema& schema, const WideIntegers& wide) {
    SchemaSplit out;

    for (auto it = flags.begin(); it != flags.end(); ++it) {
        const std::string& key = it.key();

        const auto kind = expected_kind(key, schema);
        if (!kind) {
            out.dropped.push_back(DroppedFlag{key, "unknown_type"});
            continue;
        }

        if (key.size() > kMaxKeyLength ||
            (!schema.key_pattern_source.empty() && !std::regex_match(key, schema.key_pattern))) {
            out.dropped.push_back(DroppedFlag{key, "invalid_name"});
            continue;
        }

        const auto lit = wide.find(key);
        CoercionResult c = coerce_value(*kind, it.value(), lit == wide.end() ? std::string() : lit->second);
        if (!c.accepted()) {
            out.dropped.push_back(DroppedFlag{key, c.note});
            continue;
        }

        if (!c.note.empty()) out.notes.push_back(CoercionNote{key, c.note});
        out.cleaned[key] = std::move(*c.value);
        out.kept.push_back(key);
    }

    return out;
}

}  // namespace flags
