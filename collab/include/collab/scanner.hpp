#pragma once
// Scanner: the per-file pipeline
//
//   extract comments → parse directives → detect scopes → resolve regions
//
// A scan holds no state between calls. Every recoverable problem comes
// back as a Diagnostic next to a best-effort result.

#include "directive_parser.hpp"
#include "precedence_resolver.hpp"
#include "types.hpp"
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace collab {

struct ScanResult {
    std::string file_path;
    std::string language;  // profile actually used; "generic" on fallback
    std::vector<Directive> directives;
    std::vector<ResolvedRegion> regions;
    Diagnostics diagnostics;
};

ScanResult scan(const std::string& file_path, const std::string& language,
                std::string_view content);

// A file handed over by the content provider
struct SourceFile {
    std::string path;
    std::string language;
    std::string content;
};

// Scan files on up to `workers` threads (0 = hardware concurrency).
// Each file runs the full pipeline independently; results are keyed by path.
std::map<std::string, ScanResult> scan_files(const std::vector<SourceFile>& files,
                                             size_t workers = 0);

} // namespace collab
