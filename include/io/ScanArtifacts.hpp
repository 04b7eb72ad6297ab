#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <string>

#include "flags/ReportBuilder.hpp"

namespace artifacts {

// Reads at most max_bytes from the stream and repairs invalid UTF-8.
// Throws std::runtime_error if the stream holds more than max_bytes.
std::string read_input(std::istream& in, size_t max_bytes);

// Empty path or "-" reads standard input.
std::string read_input_file(const std::string& path, size_t max_bytes);

struct ScanArtifacts {
    std::filesystem::path cleaned_path;   // fflags_cleaned_<fingerprint>.json
    std::filesystem::path report_path;    // scan_report.txt
};

// Only for ok() results. Throws std::runtime_error on I/O failure.
ScanArtifacts write_scan_artifacts(const std::filesystem::path& outdir, const flags::ClassificationResult& r);

}  // namespace artifacts
