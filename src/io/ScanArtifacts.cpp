#include "io/ScanArtifacts.hpp"

#include "text/TextUtil.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace artifacts {

std::string read_input(std::istream& in, size_t max_bytes) {
    std::string buf;
    char chunk[4096];

    while (in) {
        in.read(chunk, sizeof(chunk));
        const std::streamsize n = in.gcount();
        if (n <= 0) break;
        buf.append(chunk, static_cast<size_t>(n));
        if (buf.size() > max_bytes) {
            throw std::runtime_error("input exceeds " + std::to_string(max_bytes) + " bytes");
        }
    }

    return textutil::repair_utf8(buf);
}

std::string read_input_file(const std::string& path, size_t max_bytes) {
    if (path.empty() || path == "-") return read_input(std::cin, max_bytes);

    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) throw std::runtime_error("failed to open input file: " + path);
    return read_input(in, max_bytes);
}

static void write_text(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!out) throw std::runtime_error("Failed to open output file: " + path.string());
    out << content;
    if (!out) throw std::runtime_error("Failed to write output file: " + path.string());
}

ScanArtifacts write_scan_artifacts(const fs::path& outdir, const flags::ClassificationResult& r) {
    if (!r.ok()) throw std::runtime_error(std::string("no output for scan status ") + flags::status_name(r.status));

    if (!outdir.empty()) fs::create_directories(outdir);

    ScanArtifacts a;
    a.cleaned_path = outdir / flags::cleaned_file_name(r);
    a.report_path = outdir / "scan_report.txt";

    // file bytes are exactly the fingerprinted bytes
    write_text(a.cleaned_path, r.canonical);
    write_text(a.report_path, flags::render_report(r));
    return a;
}

}  // namespace artifacts
