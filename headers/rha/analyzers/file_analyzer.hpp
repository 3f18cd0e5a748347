#ifndef RHA_ANALYZERS_FILE_ANALYZER_HPP
#define RHA_ANALYZERS_FILE_ANALYZER_HPP

/**
 * @file file_analyzer.hpp
 * @brief Per-file analysis task run by the worker pool.
 *
 * One call reads a working-tree file, computes its CodeMetrics and extracts
 * its structure from a single lexing pass. Reading is the only step that
 * can fail; binary and oversized files succeed with a skip reason and an
 * invalid CodeMetrics.
 */

#include "rha/analyzers/structure_extractor.hpp"
#include "rha/error.hpp"
#include "rha/result.hpp"
#include "rha/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace rha::analyzers {

    struct FileAnalysis {
        std::string path;
        CodeMetrics metrics;
        FileStructure structure;
        std::size_t size_bytes = 0;
        std::optional<std::string> skip_reason;
    };

    /**
     * Zero-metrics entry (valid == false) for a file that was listed but
     * not analysed.
     */
    [[nodiscard]] FileAnalysis skipped_analysis(const std::string& path, std::size_t size_bytes, std::string reason);

    /**
     * Analyzes text that is already in memory.
     *
     * @param path Repository-relative path; selects the language.
     * @param text File contents.
     */
    [[nodiscard]] FileAnalysis analyze_text(const std::string& path, std::string_view text);

    /**
     * Reads and analyzes root/path.
     *
     * @param root           Repository root.
     * @param path           Repository-relative path.
     * @param max_size_bytes Files larger than this are skipped unread.
     * @return The analysis, or NotFound / FileReadError.
     */
    [[nodiscard]] Result<FileAnalysis> analyze_file(
        const fs::path& root,
        const std::string& path,
        std::size_t max_size_bytes
    );

}  // namespace rha::analyzers

#endif // RHA_ANALYZERS_FILE_ANALYZER_HPP
