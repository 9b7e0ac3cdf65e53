#include <collab/scanner.hpp>
#include <collab/comment_extractor.hpp>
#include <collab/language.hpp>
#include <collab/log.hpp>
#include <collab/scope_detector.hpp>
#include <collab/source_text.hpp>
#include <algorithm>
#include <atomic>
#include <thread>
#include <unordered_map>

namespace collab {

ScanResult scan(const std::string& file_path, const std::string& language,
                std::string_view content) {
    ScanResult result;
    result.file_path = file_path;

    const LanguageProfile* profile = find_language(language);
    if (!profile) {
        profile = &generic_profile();
        // Only worth reporting when there is something to misread
        if (content.find("@collab") != std::string_view::npos) {
            Diagnostic diag;
            diag.kind = DiagnosticKind::UnsupportedLanguage;
            diag.message = "unsupported language '" + language + "', using generic comment scanner";
            diag.position = {1, 1};
            diag.text = language;
            result.diagnostics.push_back(std::move(diag));
        }
    }
    result.language = profile->tag;

    SourceText source(content);
    CommentCursor comments(source, *profile);
    DirectiveParser parser(source);
    result.directives = parser.parse(comments, result.diagnostics);

    ScopeDetector detector(source, *profile);
    std::unordered_map<size_t, const Directive*> by_ordinal;
    for (const auto& d : result.directives) by_ordinal[d.ordinal] = &d;

    std::vector<ScopedDirective> scoped;
    scoped.reserve(result.directives.size());
    for (const auto& d : result.directives) {
        if (d.form == DirectiveForm::BlockEnd) continue;

        if (d.form == DirectiveForm::BlockBegin) {
            if (!d.partner) continue;
            auto it = by_ordinal.find(*d.partner);
            if (it == by_ordinal.end()) continue;
            scoped.push_back({d, detector.block(d, *it->second), ScopeKind::Block});
            continue;
        }

        if (d.trailing) {
            scoped.push_back({d, detector.trailing_line(d), ScopeKind::OwnLine});
            continue;
        }

        ScopeOutcome outcome = detector.detect(d.anchor);
        switch (outcome.status) {
            case ScopeStatus::Found:
                scoped.push_back({d, outcome.scope, ScopeKind::Declaration});
                break;
            case ScopeStatus::NoDeclaration:
                scoped.push_back({d, detector.own_line(d), ScopeKind::OwnLine});
                break;
            case ScopeStatus::Failed: {
                Diagnostic diag;
                diag.kind = DiagnosticKind::ScopeDetection;
                diag.message = outcome.error + "; falling back to the directive's own line";
                diag.position = d.source.start;
                diag.text = std::string(source.line(d.source.start.line));
                result.diagnostics.push_back(std::move(diag));
                scoped.push_back({d, detector.own_line(d), ScopeKind::OwnLine});
                break;
            }
        }
    }

    result.regions = resolve(std::move(scoped), result.diagnostics);

    std::stable_sort(result.diagnostics.begin(), result.diagnostics.end(),
                     [](const Diagnostic& a, const Diagnostic& b) { return a.position < b.position; });

    log_debug("scan", "%s [%s]: %zu directives, %zu regions, %zu diagnostics",
              file_path.c_str(), result.language.c_str(), result.directives.size(),
              result.regions.size(), result.diagnostics.size());
    return result;
}

std::map<std::string, ScanResult> scan_files(const std::vector<SourceFile>& files,
                                             size_t workers) {
    if (workers == 0) workers = std::max(1u, std::thread::hardware_concurrency());
    workers = std::min(workers, std::max<size_t>(files.size(), 1));

    std::vector<ScanResult> results(files.size());
    std::atomic<size_t> next{0};

    auto work = [&]() {
        for (size_t i = next.fetch_add(1); i < files.size(); i = next.fetch_add(1)) {
            const auto& f = files[i];
            results[i] = scan(f.path, f.language, f.content);
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (size_t w = 1; w < workers; ++w) threads.emplace_back(work);
    work();
    for (auto& t : threads) t.join();

    std::map<std::string, ScanResult> out;
    for (auto& r : results) {
        std::string key = r.file_path;
        out[key] = std::move(r);
    }
    return out;
}

} // namespace collab
