#include "flags/NamePolicy.hpp"

#include "text/TextUtil.hpp"

#include <stdexcept>

namespace flags {

BanPattern make_ban_pattern(const std::string& source) {
    try {
        return BanPattern{source, std::regex(source, std::regex::ECMAScript)};
    } catch (const std::regex_error& e) {
        throw std::runtime_error("invalid ban pattern '" + source + "': " + e.what());
    }
}

std::optional<std::string> match_ban_rule(const std::string& key, const NamePolicy& policy) {
    if (policy.exact.count(key)) return "exact:" + key;

    if (!policy.substrings.empty()) {
        const std::string low = textutil::to_lower(key);
        for (const auto& s : policy.substrings) {
            if (low.find(textutil::to_lower(s)) != std::string::npos) return "substring:" + s;
        }
    }

    // over-long keys are dropped as invalid_name later; patterns skip them
    if (key.size() > kMaxKeyLength) return std::nullopt;

    for (const auto& p : policy.patterns) {
        if (std::regex_search(key, p.re)) return "pattern:" + p.source;
    }

    return std::nullopt;
}

PolicySplit apply_name_policy(const RawFlags& flags, const NamePolicy& policy) {
    PolicySplit out;

    for (auto it = flags.begin(); it != flags.end(); ++it) {
        if (auto rule = match_ban_rule(it.key(), policy)) {
            out.removed.push_back(RemovedFlag{it.key(), *rule});
        } else {
            out.kept[it.key()] = it.value();
        }
    }

    return out;
}

}  // namespace flags
