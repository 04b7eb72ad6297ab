#include "commands/policy.hpp"

#include "config/PolicyConfig.hpp"

#include <iostream>
#include <string>

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static int policy_usage() {
    std::cerr
        << "usage:\n"
        << "  flagscrub policy dump [--policy <path>]\n";
    return 1;
}

int cmd_policy(int argc, char** argv) {
    if (argc < 2 || std::string(argv[1]) != "dump") return policy_usage();

    try {
        const std::string policy_path = get_arg(argc, argv, "--policy", "");
        const config::Settings s = policy_path.empty() ? config::default_settings()
                                                       : config::load_settings(policy_path);
        std::cout << config::settings_to_json(s).dump(2) << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "policy failed: " << e.what() << "\n";
        return 1;
    }
}
