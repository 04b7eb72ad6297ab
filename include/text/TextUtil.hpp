#pragma once
#include <string>

namespace textutil {

std::string trim(const std::string& s);

std::string to_lower(std::string s);

bool starts_with(const std::string& s, const std::string& prefix);

// drop a leading UTF-8 byte-order mark
std::string strip_bom(const std::string& s);

// replace every invalid UTF-8 sequence with U+FFFD
std::string repair_utf8(const std::string& bytes);

}
