#pragma once
#include <optional>
#include <regex>
#include <set>
#include <string>
#include <vector>

#include "flags/Models.hpp"

namespace flags {

struct BanPattern {
    std::string source;
    std::regex re;
};

// Key-name ban rules, OR-combined. Built once from configuration and then
// only read, so one instance can serve concurrent scans.
struct NamePolicy {
    std::set<std::string> exact;           // case-sensitive
    std::vector<std::string> substrings;   // case-insensitive
    std::vector<BanPattern> patterns;      // searched against keys up to kMaxKeyLength
};

// Throws std::runtime_error if the pattern does not compile.
BanPattern make_ban_pattern(const std::string& source);

// The first rule that bans the key, formatted "<family>:<rule>", or nullopt.
std::optional<std::string> match_ban_rule(const std::string& key, const NamePolicy& policy);

struct PolicySplit {
    RawFlags kept = RawFlags::object();
    std::vector<RemovedFlag> removed;
};

// Partitions by key name only; values are not looked at.
PolicySplit apply_name_policy(const RawFlags& flags, const NamePolicy& policy);

}  // namespace flags
