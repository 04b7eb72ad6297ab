#include "commands/policy.hpp"
#include "commands/scan.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  flagscrub scan [args]\n"
        << "  flagscrub policy dump [--policy <path>]\n"
        << "  flagscrub help\n";
    return 1;
}

static int print_scan_help() {
    std::cerr
        << "usage:\n"
        << "  flagscrub scan [options]\n"
        << "\n"
        << "input:\n"
        << "  --in <path>                  default: - (stdin); .json/.txt, raw or ```json fenced```\n"
        << "  --max_bytes <n>              default: 1048576 (larger input is rejected unparsed)\n"
        << "\n"
        << "policy:\n"
        << "  --policy <path>              JSON policy file (see `flagscrub policy dump`)\n"
        << "  --fingerprint_len <n>        default: 8\n"
        << "\n"
        << "output:\n"
        << "  --outdir <dir>               default: out\n"
        << "  --summary_budget <n>         default: 1500 (preview characters)\n"
        << "  --json                       print the full result as JSON\n"
        << "  --no_write                   do not write fflags_cleaned_*.json / scan_report.txt\n"
        << "\n"
        << "exit codes: 0 ok, 1 error, 2 nothing to scan, 3 top-level value not an object\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help") {
        return print_usage();
    }

    if (cmd == "scan" && (argc >= 3 && std::string(argv[2]) == "--help")) return print_scan_help();

    if (cmd == "scan")   return cmd_scan(argc - 1, argv + 1);
    if (cmd == "policy") return cmd_policy(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
