#include "rha/analyzers/coupling_analyzer.hpp"

#include "rha/analyzers/import_resolver.hpp"
#include "rha/config.hpp"
#include "rha/graph/graph.hpp"
#include "rha/metrics/language.hpp"
#include "rha/utils/string_utils.hpp"

#include <algorithm>
#include <cmath>
#include <ranges>

namespace rha::analyzers {

    namespace {

        bool is_eligible(const Language language) {
            return metrics::syntax_for(language).has_type_concept;
        }

        Language dominant_language(const std::map<Language, std::size_t>& counts) {
            Language best = Language::Other;
            std::size_t best_count = 0;
            for (const auto& [language, count] : counts) {
                if (count > best_count) {
                    best = language;
                    best_count = count;
                }
            }
            return best;
        }

    }  // namespace

    DesignZone classify_zone(const double abstractness, const double instability, const double distance) noexcept {
        if (distance < thresholds::main_sequence_distance) {
            return DesignZone::MainSequence;
        }
        if (abstractness < thresholds::pain_corner && instability < thresholds::pain_corner) {
            return DesignZone::ZoneOfPain;
        }
        if (abstractness > thresholds::uselessness_corner && instability > thresholds::uselessness_corner) {
            return DesignZone::ZoneOfUselessness;
        }
        return distance <= thresholds::moderate_distance ? DesignZone::Moderate : DesignZone::FarFromMainSequence;
    }

    void derive_coupling(CouplingMetrics& metrics, const bool eligible) noexcept {
        const auto total = metrics.efferent + metrics.afferent;
        metrics.instability = total == 0
            ? 0.0
            : static_cast<double>(metrics.efferent) / static_cast<double>(total);
        metrics.abstractness = static_cast<double>(metrics.abstract_class_count) /
                               static_cast<double>(std::max<std::size_t>(1, metrics.class_count));
        metrics.distance = std::abs(metrics.abstractness + metrics.instability - 1.0);
        metrics.zone = eligible
            ? classify_zone(metrics.abstractness, metrics.instability, metrics.distance)
            : DesignZone::NotApplicable;
    }

    std::string package_of(const std::string& path) {
        const auto directory = string_utils::dirname(path);
        return directory.empty() ? std::string(".") : std::string(directory);
    }

    CouplingReport analyze_coupling(const std::map<std::string, FileStructure>& structures) {
        std::vector<std::string> paths;
        paths.reserve(structures.size());
        for (const auto& path : structures | std::views::keys) {
            paths.push_back(path);
        }

        const ImportResolver resolver(paths);
        graph::DependencyGraph dependencies;
        for (const auto& [path, structure] : structures) {
            dependencies.add_module(path);
            for (const auto& target : resolver.resolve(path, structure.language, structure.imports)) {
                dependencies.add_dependency(path, target);
            }
        }

        CouplingReport report;
        for (const auto& [path, structure] : structures) {
            CouplingMetrics metrics;
            metrics.language = structure.language;
            metrics.class_count = structure.class_count;
            metrics.abstract_class_count = structure.abstract_class_count;
            metrics.interface_count = structure.interface_count;

            const auto& outgoing = dependencies.dependencies(path);
            const auto& incoming = dependencies.dependents(path);
            metrics.dependencies = outgoing;
            metrics.dependents = incoming;
            metrics.efferent = outgoing.size();
            metrics.afferent = incoming.size();

            derive_coupling(metrics, is_eligible(structure.language));
            report.files.emplace(path, std::move(metrics));
        }

        std::map<std::string, std::map<Language, std::size_t>> package_languages;
        for (const auto& [path, file] : report.files) {
            if (file.zone == DesignZone::NotApplicable) {
                continue;
            }
            const auto package = package_of(path);
            auto& metrics = report.packages[package];
            metrics.class_count += file.class_count;
            metrics.abstract_class_count += file.abstract_class_count;
            metrics.interface_count += file.interface_count;
            metrics.efferent += file.efferent;
            metrics.afferent += file.afferent;
            ++package_languages[package][file.language];

            for (const auto& target : file.dependencies) {
                if (const auto other = package_of(target); other != package) {
                    metrics.dependencies.insert(other);
                }
            }
            for (const auto& source : file.dependents) {
                if (const auto other = package_of(source); other != package) {
                    metrics.dependents.insert(other);
                }
            }
        }
        for (auto& [package, metrics] : report.packages) {
            metrics.language = dominant_language(package_languages[package]);
            derive_coupling(metrics, true);
        }

        report.cycles = graph::find_cycles(dependencies, max_reported_cycles);
        return report;
    }

}  // namespace rha::analyzers
