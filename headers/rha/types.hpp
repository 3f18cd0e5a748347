#ifndef RHA_TYPES_HPP
#define RHA_TYPES_HPP

/**
 * @file types.hpp
 * @brief Core value types shared by every stage of the analysis pipeline.
 *
 * - Basic Types: Duration, Timestamp, Language
 * - History facts: FileChange, CommitRecord
 * - Per-file results: CodeMetrics and its categorical buckets
 *
 * CommitRecord and CodeMetrics are immutable once produced and are freely
 * shared by reference between worker threads.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace rha {

    namespace fs = std::filesystem;

    // ============================================================================
    // Basic Types
    // ============================================================================

    using Duration = std::chrono::nanoseconds;

    /**
     * Absolute point in time. Commit timestamps have second resolution.
     */
    using Timestamp = std::chrono::system_clock::time_point;

    /**
     * Language families recognised by the lexical and coupling analyzers.
     *
     * The set is closed: each value maps to exactly one syntax descriptor
     * in metrics/language.hpp.
     */
    enum class Language {
        C,
        Cpp,
        ObjectiveC,
        Swift,
        Java,
        Kotlin,
        Scala,
        Go,
        Rust,
        Python,
        JavaScript,
        TypeScript,
        Lua,
        R,
        InterfaceDefinition,  ///< .proto / .thrift
        Assembly,
        Other
    };

    inline const char* to_string(Language language) noexcept {
        switch (language) {
            case Language::C:                   return "C";
            case Language::Cpp:                 return "C++";
            case Language::ObjectiveC:          return "Objective-C";
            case Language::Swift:               return "Swift";
            case Language::Java:                return "Java";
            case Language::Kotlin:              return "Kotlin";
            case Language::Scala:               return "Scala";
            case Language::Go:                  return "Go";
            case Language::Rust:                return "Rust";
            case Language::Python:              return "Python";
            case Language::JavaScript:          return "JavaScript";
            case Language::TypeScript:          return "TypeScript";
            case Language::Lua:                 return "Lua";
            case Language::R:                   return "R";
            case Language::InterfaceDefinition: return "IDL";
            case Language::Assembly:            return "Assembly";
            case Language::Other:               return "Other";
        }
        return "Other";
    }

    // ============================================================================
    // History Facts
    // ============================================================================

    /**
     * One numstat entry of a commit.
     */
    struct FileChange {
        std::string path;
        std::size_t lines_added = 0;
        std::size_t lines_removed = 0;
        bool binary = false;  // numstat reported "-" for both columns
    };

    /**
     * A single parsed log entry.
     */
    struct CommitRecord {
        std::string hash;
        std::string author;
        std::string author_email;
        Timestamp timestamp;
        int timezone_offset_minutes = 0;  // author-local offset from UTC
        std::string message;              // subject line
        std::vector<FileChange> files_changed;

        [[nodiscard]] std::size_t lines_added() const noexcept {
            std::size_t total = 0;
            for (const auto& change : files_changed) {
                total += change.lines_added;
            }
            return total;
        }

        [[nodiscard]] std::size_t lines_removed() const noexcept {
            std::size_t total = 0;
            for (const auto& change : files_changed) {
                total += change.lines_removed;
            }
            return total;
        }
    };

    // ============================================================================
    // Per-file Code Metrics
    // ============================================================================

    enum class ComplexityLevel {
        Simple,       ///< CC <= 10
        Moderate,     ///< 11..20
        Complex,      ///< 21..50
        VeryComplex   ///< > 50
    };

    inline const char* to_string(ComplexityLevel level) noexcept {
        switch (level) {
            case ComplexityLevel::Simple:      return "simple";
            case ComplexityLevel::Moderate:    return "moderate";
            case ComplexityLevel::Complex:     return "complex";
            case ComplexityLevel::VeryComplex: return "very_complex";
        }
        return "simple";
    }

    enum class MaintainabilityStatus {
        Good,       ///< raw MI >= 85
        Moderate,   ///< 65 <= raw MI < 85
        Difficult,  ///< 0 <= raw MI < 65
        Critical    ///< raw MI < 0
    };

    inline const char* to_string(MaintainabilityStatus status) noexcept {
        switch (status) {
            case MaintainabilityStatus::Good:      return "Good";
            case MaintainabilityStatus::Moderate:  return "Moderate";
            case MaintainabilityStatus::Difficult: return "Difficult";
            case MaintainabilityStatus::Critical:  return "Critical";
        }
        return "Critical";
    }

    /**
     * Position of a module relative to the main sequence (A + I = 1).
     */
    enum class DesignZone {
        MainSequence,         ///< D < 0.2
        Moderate,             ///< 0.2 <= D <= 0.4, reported but not zoned
        ZoneOfPain,           ///< A < 0.3 and I < 0.3, concrete and stable
        ZoneOfUselessness,    ///< A > 0.7 and I > 0.7, abstract and unstable
        FarFromMainSequence,  ///< D > 0.4 outside both corners
        NotApplicable         ///< language without a class/module concept
    };

    inline const char* to_string(DesignZone zone) noexcept {
        switch (zone) {
            case DesignZone::MainSequence:        return "Main Sequence";
            case DesignZone::Moderate:            return "Moderate";
            case DesignZone::ZoneOfPain:          return "Zone of Pain";
            case DesignZone::ZoneOfUselessness:   return "Zone of Uselessness";
            case DesignZone::FarFromMainSequence: return "Far from Main Sequence";
            case DesignZone::NotApplicable:       return "N/A";
        }
        return "N/A";
    }

    /**
     * Hotspot risk band; bounds are inclusive lower limits of the score.
     */
    enum class RiskLevel {
        Low,       ///< < 20
        Medium,    ///< >= 20
        High,      ///< >= 40
        Critical   ///< >= 60
    };

    inline const char* to_string(RiskLevel level) noexcept {
        switch (level) {
            case RiskLevel::Low:      return "low";
            case RiskLevel::Medium:   return "medium";
            case RiskLevel::High:     return "high";
            case RiskLevel::Critical: return "critical";
        }
        return "low";
    }

    /**
     * Result of analysing one file's text.
     *
     * Invariants: loc_physical == loc_program + loc_comment + loc_blank,
     * total_operators >= distinct_operators and
     * total_operands >= distinct_operands.
     *
     * A file that could not be read, or looked binary, yields a zero-valued
     * instance with valid == false; aggregate averages skip such entries.
     */
    struct CodeMetrics {
        bool valid = false;
        Language language = Language::Other;

        // Lines of code
        std::size_t loc_physical = 0;
        std::size_t loc_program = 0;
        std::size_t loc_comment = 0;
        std::size_t loc_blank = 0;
        double comment_ratio = 0.0;

        // Halstead
        std::size_t distinct_operators = 0;  // n1
        std::size_t distinct_operands = 0;   // n2
        std::size_t total_operators = 0;     // N1
        std::size_t total_operands = 0;      // N2
        double volume = 0.0;
        double difficulty = 0.0;
        double effort = 0.0;
        double bugs = 0.0;

        // McCabe
        std::size_t cyclomatic_complexity = 0;
        std::size_t binary_decisions = 0;
        ComplexityLevel complexity_level = ComplexityLevel::Simple;

        // Maintainability
        double maintainability_index = 0.0;
        double maintainability_index_raw = 0.0;
        MaintainabilityStatus maintainability_status = MaintainabilityStatus::Difficult;

        // Object-oriented structure
        std::size_t class_count = 0;
        std::size_t abstract_class_count = 0;
        std::size_t interface_count = 0;
        std::size_t method_count = 0;
        std::size_t attribute_count = 0;

        bool operator==(const CodeMetrics&) const = default;
    };

}  // namespace rha

#endif // RHA_TYPES_HPP
