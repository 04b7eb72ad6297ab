#include "commands/scan.hpp"

#include "config/PolicyConfig.hpp"
#include "flags/Pipeline.hpp"
#include "io/ScanArtifacts.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

static bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static size_t get_arg_size(int argc, char** argv, const std::string& key, size_t def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;
    long long v = 0;
    try { v = std::stoll(s); } catch (const std::exception&) {
        throw std::runtime_error(key + " expects a positive integer, got: " + s);
    }
    if (v <= 0) throw std::runtime_error(key + " expects a positive integer, got: " + s);
    return static_cast<size_t>(v);
}

static int exit_code_for(flags::ScanStatus s) {
    switch (s) {
        case flags::ScanStatus::Ok: return 0;
        case flags::ScanStatus::TopLevelNotObject: return 3;
        default: return 2;
    }
}

int cmd_scan(int argc, char** argv) {
    try {
        const std::string in_path = get_arg(argc, argv, "--in", "-");
        const std::string policy_path = get_arg(argc, argv, "--policy", "");
        const fs::path outdir = get_arg(argc, argv, "--outdir", "out");
        const bool as_json = has_flag(argc, argv, "--json");
        const bool no_write = has_flag(argc, argv, "--no_write");

        config::Settings settings = policy_path.empty() ? config::default_settings()
                                                        : config::load_settings(policy_path);
        settings.max_input_bytes = get_arg_size(argc, argv, "--max_bytes", settings.max_input_bytes);
        settings.summary_budget = get_arg_size(argc, argv, "--summary_budget", settings.summary_budget);
        settings.policy.fingerprint_length =
            get_arg_size(argc, argv, "--fingerprint_len", settings.policy.fingerprint_length);

        const std::string text = artifacts::read_input_file(in_path, settings.max_input_bytes);
        const flags::ClassificationResult result = flags::run_scan(text, settings.policy);

        if (as_json) {
            std::cout << result.to_json().dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
        } else {
            std::cout << flags::render_summary(result, settings.summary_budget) << "\n";
        }

        if (!result.ok()) {
            if (result.status == flags::ScanStatus::TopLevelNotObject) {
                std::cerr << "scan failed: " << result.detail << "\n";
            } else if (!as_json) {
                std::cerr << "Attach/paste your flags JSON. Example: { \"DFFlagFoo\": true }\n";
            }
            return exit_code_for(result.status);
        }

        if (!no_write) {
            const artifacts::ScanArtifacts out = artifacts::write_scan_artifacts(outdir, result);
            // keep stdout machine-readable in --json mode
            std::ostream& log = as_json ? std::cerr : std::cout;
            log << "OUT_CLEANED: " << out.cleaned_path.string() << "\n";
            log << "OUT_REPORT: " << out.report_path.string() << "\n";
        }

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "scan failed: " << e.what() << "\n";
        return 1;
    }
}
