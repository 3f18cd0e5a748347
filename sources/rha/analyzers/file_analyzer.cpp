#include "rha/analyzers/file_analyzer.hpp"

#include "rha/config.hpp"
#include "rha/metrics/lexical_metrics.hpp"
#include "rha/utils/file_utils.hpp"

#include <utility>

namespace rha::analyzers {

    FileAnalysis skipped_analysis(const std::string& path, const std::size_t size_bytes, std::string reason) {
        FileAnalysis analysis;
        analysis.path = path;
        analysis.size_bytes = size_bytes;
        analysis.metrics.language = metrics::detect_language(path);
        analysis.structure.language = analysis.metrics.language;
        analysis.skip_reason = std::move(reason);
        return analysis;
    }

    FileAnalysis analyze_text(const std::string& path, const std::string_view text) {
        FileAnalysis analysis;
        analysis.path = path;
        analysis.size_bytes = text.size();

        const auto language = metrics::detect_language(path);
        analysis.metrics.language = language;
        analysis.structure.language = language;

        if (file_utils::looks_binary(text, thresholds::binary_probe_bytes)) {
            return skipped_analysis(path, text.size(), "binary content");
        }

        const auto& syntax = metrics::syntax_for(language);
        const auto lexed = metrics::lex(text, syntax);

        analysis.metrics = metrics::compute_metrics(lexed, syntax);
        analysis.structure = extract_structure(text, lexed, syntax);

        analysis.metrics.class_count = analysis.structure.class_count;
        analysis.metrics.abstract_class_count = analysis.structure.abstract_class_count;
        analysis.metrics.interface_count = analysis.structure.interface_count;
        analysis.metrics.method_count = analysis.structure.method_count;
        analysis.metrics.attribute_count = analysis.structure.attribute_count;
        return analysis;
    }

    Result<FileAnalysis> analyze_file(const fs::path& root, const std::string& path, const std::size_t max_size_bytes) {
        const fs::path full_path = root / fs::path(path);

        if (const auto size = file_utils::file_size_or_zero(full_path); size > max_size_bytes) {
            return Result<FileAnalysis>::success(
                skipped_analysis(path, size, "exceeds size limit (" + std::to_string(max_size_bytes / 1024) + " KiB)"));
        }

        auto content = file_utils::read_file(full_path);
        if (content.is_err()) {
            return Result<FileAnalysis>::failure(content.error());
        }
        return Result<FileAnalysis>::success(analyze_text(path, content.value()));
    }

}  // namespace rha::analyzers
