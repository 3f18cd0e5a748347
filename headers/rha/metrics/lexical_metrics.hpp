#ifndef RHA_METRICS_LEXICAL_METRICS_HPP
#define RHA_METRICS_LEXICAL_METRICS_HPP

/**
 * @file lexical_metrics.hpp
 * @brief Lines of code, Halstead and McCabe metrics from a token stream.
 *
 * compute_metrics() is a pure function of the file text: same text and
 * language, same CodeMetrics. Binary text (a NUL byte near the start)
 * yields a zero-valued result with valid == false.
 */

#include "rha/metrics/language.hpp"
#include "rha/metrics/tokenizer.hpp"
#include "rha/types.hpp"

#include <string_view>

namespace rha::metrics {

    struct LineCounts {
        std::size_t physical = 0;
        std::size_t program = 0;
        std::size_t comment = 0;
        std::size_t blank = 0;
        double comment_ratio = 0.0;  // comment / max(1, program)
    };

    struct HalsteadMetrics {
        std::size_t distinct_operators = 0;
        std::size_t distinct_operands = 0;
        std::size_t total_operators = 0;
        std::size_t total_operands = 0;
        double volume = 0.0;
        double difficulty = 0.0;
        double effort = 0.0;
        double bugs = 0.0;
    };

    struct McCabeMetrics {
        std::size_t cyclomatic_complexity = 1;
        std::size_t binary_decisions = 0;
        ComplexityLevel level = ComplexityLevel::Simple;
    };

    [[nodiscard]] LineCounts count_lines(const LexResult& lexed);

    /**
     * Operators: keywords and operator symbols. Operands: identifiers,
     * numbers and string literals.
     */
    [[nodiscard]] HalsteadMetrics compute_halstead(const LexResult& lexed);

    /**
     * 1 + decision keywords + "&&"/"||" + ternary "?". Multi-way keywords
     * (case, match, select, when) add to the complexity but not to the
     * binary decision count.
     */
    [[nodiscard]] McCabeMetrics compute_mccabe(const LexResult& lexed, const LanguageSyntax& syntax);

    [[nodiscard]] ComplexityLevel classify_complexity(std::size_t cyclomatic_complexity) noexcept;

    /**
     * Full per-file metrics: LOC, Halstead, McCabe and maintainability.
     * Structure counts (classes, methods) are left at zero; the coupling
     * analyzer fills them.
     */
    [[nodiscard]] CodeMetrics compute_metrics(std::string_view text, Language language);

    /**
     * Same as above for text that has already been lexed.
     */
    [[nodiscard]] CodeMetrics compute_metrics(const LexResult& lexed, const LanguageSyntax& syntax);

}  // namespace rha::metrics

#endif // RHA_METRICS_LEXICAL_METRICS_HPP
