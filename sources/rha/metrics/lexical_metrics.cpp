#include "rha/metrics/lexical_metrics.hpp"

#include "rha/config.hpp"
#include "rha/metrics/maintainability.hpp"
#include "rha/utils/file_utils.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace rha::metrics {

    namespace {

        bool is_operator_token(const TokenKind kind) noexcept {
            return kind == TokenKind::Keyword || kind == TokenKind::Operator;
        }

    }  // namespace

    LineCounts count_lines(const LexResult& lexed) {
        LineCounts counts;
        counts.physical = lexed.lines.size();
        for (const auto kind : lexed.lines) {
            switch (kind) {
                case LineKind::Blank:   ++counts.blank;   break;
                case LineKind::Comment: ++counts.comment; break;
                case LineKind::Program: ++counts.program; break;
            }
        }
        counts.comment_ratio = static_cast<double>(counts.comment) /
                               static_cast<double>(std::max<std::size_t>(1, counts.program));
        return counts;
    }

    HalsteadMetrics compute_halstead(const LexResult& lexed) {
        std::unordered_map<std::string_view, std::size_t> operators;
        std::unordered_map<std::string_view, std::size_t> operands;

        HalsteadMetrics h;
        for (const auto& token : lexed.tokens) {
            if (is_operator_token(token.kind)) {
                ++operators[token.text];
                ++h.total_operators;
            } else {
                ++operands[token.text];
                ++h.total_operands;
            }
        }
        h.distinct_operators = operators.size();
        h.distinct_operands = operands.size();

        const std::size_t vocabulary = h.distinct_operators + h.distinct_operands;
        const std::size_t length = h.total_operators + h.total_operands;
        if (vocabulary > 1) {
            h.volume = static_cast<double>(length) * std::log2(static_cast<double>(vocabulary));
        }
        h.difficulty = (static_cast<double>(h.distinct_operators) / 2.0) *
                       (static_cast<double>(h.total_operands) /
                        static_cast<double>(std::max<std::size_t>(1, h.distinct_operands)));
        h.effort = h.volume * h.difficulty;
        h.bugs = h.volume / 3000.0;
        return h;
    }

    McCabeMetrics compute_mccabe(const LexResult& lexed, const LanguageSyntax& syntax) {
        std::size_t decisions = 0;
        std::size_t multiway = 0;

        for (const auto& token : lexed.tokens) {
            if (token.kind == TokenKind::Keyword) {
                if (syntax.decision_keywords.contains(token.text)) {
                    ++decisions;
                    if (syntax.multiway_keywords.contains(token.text)) {
                        ++multiway;
                    }
                }
            } else if (token.kind == TokenKind::Operator) {
                if (token.text == "&&" || token.text == "||") {
                    ++decisions;
                } else if (syntax.ternary_decision && token.text == "?") {
                    ++decisions;
                }
            }
        }

        McCabeMetrics m;
        m.cyclomatic_complexity = 1 + decisions;
        m.binary_decisions = decisions - multiway;
        m.level = classify_complexity(m.cyclomatic_complexity);
        return m;
    }

    ComplexityLevel classify_complexity(const std::size_t cyclomatic_complexity) noexcept {
        if (cyclomatic_complexity <= thresholds::simple_complexity) {
            return ComplexityLevel::Simple;
        }
        if (cyclomatic_complexity <= thresholds::moderate_complexity) {
            return ComplexityLevel::Moderate;
        }
        if (cyclomatic_complexity <= thresholds::complex_complexity) {
            return ComplexityLevel::Complex;
        }
        return ComplexityLevel::VeryComplex;
    }

    CodeMetrics compute_metrics(const LexResult& lexed, const LanguageSyntax& syntax) {
        CodeMetrics metrics;
        metrics.valid = true;
        metrics.language = syntax.language;

        const auto lines = count_lines(lexed);
        metrics.loc_physical = lines.physical;
        metrics.loc_program = lines.program;
        metrics.loc_comment = lines.comment;
        metrics.loc_blank = lines.blank;
        metrics.comment_ratio = lines.comment_ratio;

        const auto h = compute_halstead(lexed);
        metrics.distinct_operators = h.distinct_operators;
        metrics.distinct_operands = h.distinct_operands;
        metrics.total_operators = h.total_operators;
        metrics.total_operands = h.total_operands;
        metrics.volume = h.volume;
        metrics.difficulty = h.difficulty;
        metrics.effort = h.effort;
        metrics.bugs = h.bugs;

        const auto m = compute_mccabe(lexed, syntax);
        metrics.cyclomatic_complexity = m.cyclomatic_complexity;
        metrics.binary_decisions = m.binary_decisions;
        metrics.complexity_level = m.level;

        const auto mi = score_maintainability(metrics);
        metrics.maintainability_index = mi.normalized;
        metrics.maintainability_index_raw = mi.raw;
        metrics.maintainability_status = mi.status;
        return metrics;
    }

    CodeMetrics compute_metrics(const std::string_view text, const Language language) {
        if (file_utils::looks_binary(text, thresholds::binary_probe_bytes)) {
            CodeMetrics metrics;
            metrics.language = language;
            return metrics;
        }
        const auto& syntax = syntax_for(language);
        return compute_metrics(lex(text, syntax), syntax);
    }

}  // namespace rha::metrics
