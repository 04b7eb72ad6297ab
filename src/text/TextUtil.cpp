#include "text/TextUtil.hpp"
#include <cctype>

namespace textutil {

std::string trim(const std::string& s) {
    size_t a = 0;
    while (a < s.size() && std::isspace(static_cast<unsigned char>(s[a]))) ++a;

    size_t b = s.size();
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;

    return s.substr(a, b - a);
}

std::string to_lower(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

std::string strip_bom(const std::string& s) {
    static const std::string bom = "\xEF\xBB\xBF";
    if (starts_with(s, bom)) return s.substr(bom.size());
    return s;
}

std::string repair_utf8(const std::string& bytes) {
    static const std::string replacement = "\xEF\xBF\xBD";

    std::string out;
    out.reserve(bytes.size());

    size_t i = 0;
    while (i < bytes.size()) {
        const unsigned char c = static_cast<unsigned char>(bytes[i]);

        size_t len = 0;
        unsigned char lo = 0x80, hi = 0xBF; // allowed range for the first continuation byte
        if (c < 0x80) len = 1;
        else if (c >= 0xC2 && c <= 0xDF) len = 2;
        else if (c == 0xE0) { len = 3; lo = 0xA0; }
        else if (c >= 0xE1 && c <= 0xEC) len = 3;
        else if (c == 0xED) { len = 3; hi = 0x9F; }   // no surrogates
        else if (c >= 0xEE && c <= 0xEF) len = 3;
        else if (c == 0xF0) { len = 4; lo = 0x90; }
        else if (c >= 0xF1 && c <= 0xF3) len = 4;
        else if (c == 0xF4) { len = 4; hi = 0x8F; }

        if (len == 0) {
            out += replacement;
            ++i;
            continue;
        }

        // length of the valid prefix of this sequence
        size_t ok = 1;
        while (ok < len && i + ok < bytes.size()) {
            const unsigned char cc = static_cast<unsigned char>(bytes[i + ok]);
            const unsigned char min = (ok == 1) ? lo : 0x80;
            const unsigned char max = (ok == 1) ? hi : 0xBF;
            if (cc < min || cc > max) break;
            ++ok;
        }

        if (ok == len) {
            out.append(bytes, i, len);
            i += len;
        } else {
            out += replacement;
            i += ok;
        }
    }

    return out;
}

}
