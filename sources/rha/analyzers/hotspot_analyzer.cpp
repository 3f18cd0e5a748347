#include "rha/analyzers/hotspot_analyzer.hpp"
#include "rha/config.hpp"

#include <algorithm>
#include <iterator>
#include <ranges>

namespace rha::analyzers {

    namespace {

        constexpr double mi_scale = 171.0;

        bool riskier(const Hotspot& a, const Hotspot& b) {
            if (a.risk_score != b.risk_score) {
                return a.risk_score > b.risk_score;
            }
            return a.path < b.path;
        }

    }  // namespace

    std::vector<Hotspot> HotspotAnalyzer::identify_hotspots(
        const RepositoryData& data,
        const Options& options
    ) {
        auto hotspots = rank_all(data);
        if (options.top_n > 0 && hotspots.size() > options.top_n) {
            hotspots.resize(options.top_n);
        }
        return hotspots;
    }

    std::vector<Hotspot> HotspotAnalyzer::rank_all(const RepositoryData& data) {
        std::size_t max_revisions = 0;
        std::size_t total_revisions = 0;
        for (const auto& path : data.code_metrics | std::views::keys) {
            if (const auto it = data.files.find(path); it != data.files.end()) {
                max_revisions = std::max(max_revisions, it->second.revision_count);
                total_revisions += it->second.revision_count;
            }
        }

        const auto coupling = detect_change_coupling(data.recent_change_sets);

        std::vector<Hotspot> hotspots;
        hotspots.reserve(data.code_metrics.size());
        for (const auto& [path, metrics] : data.code_metrics) {
            Hotspot hotspot;
            hotspot.path = path;

            if (const auto it = data.files.find(path); it != data.files.end()) {
                hotspot.revisions = it->second.revision_count;
            }
            if (max_revisions > 0) {
                hotspot.churn_score = static_cast<double>(hotspot.revisions) * 100.0
                                      / static_cast<double>(max_revisions);
                hotspot.relative_churn = static_cast<double>(hotspot.revisions) * 100.0
                                         / static_cast<double>(total_revisions);
            }

            if (metrics.valid) {
                hotspot.complexity_score = complexity_score(metrics);
                hotspot.maintainability_index = metrics.maintainability_index_raw;
                hotspot.cyclomatic_complexity = metrics.cyclomatic_complexity;
            }

            if (const auto it = coupling.find(path); it != coupling.end()) {
                hotspot.coupled_files = it->second;
            }

            const double coupling_penalty = std::min(
                static_cast<double>(hotspot.coupled_files.size()) * thresholds::coupling_penalty_per_file,
                thresholds::coupling_penalty_cap);
            hotspot.risk_score = hotspot.churn_score * hotspot.complexity_score / 100.0 + coupling_penalty;
            hotspot.risk_level = classify_risk(hotspot.risk_score);

            hotspots.push_back(std::move(hotspot));
        }

        std::ranges::sort(hotspots, riskier);
        return hotspots;
    }

    HotspotSummary HotspotAnalyzer::summarize(const std::vector<Hotspot>& hotspots) {
        HotspotSummary summary;
        summary.files_analyzed = hotspots.size();
        for (const auto& hotspot : hotspots) {
            switch (hotspot.risk_level) {
                case RiskLevel::Critical: ++summary.critical; break;
                case RiskLevel::High:     ++summary.high; break;
                case RiskLevel::Medium:   ++summary.medium; break;
                case RiskLevel::Low:      ++summary.low; break;
            }
            if (!hotspot.coupled_files.empty()) {
                ++summary.files_with_coupling;
            }
        }
        return summary;
    }

    std::vector<Hotspot> HotspotAnalyzer::filter_by_level(
        const std::vector<Hotspot>& hotspots,
        const RiskLevel level
    ) {
        std::vector<Hotspot> matching;
        std::ranges::copy_if(hotspots, std::back_inserter(matching), [level](const Hotspot& hotspot) {
            return hotspot.risk_level == level;
        });
        return matching;
    }

    std::map<std::string, std::vector<ChangeCoupling>> HotspotAnalyzer::detect_change_coupling(
        const std::vector<std::vector<std::string>>& change_sets
    ) {
        std::map<std::string, std::size_t> commits_per_file;
        std::map<std::string, std::map<std::string, std::size_t>> shared;

        for (const auto& files : change_sets) {
            if (files.size() > thresholds::max_change_set_files) {
                continue;
            }
            for (std::size_t i = 0; i < files.size(); ++i) {
                ++commits_per_file[files[i]];
                for (std::size_t j = i + 1; j < files.size(); ++j) {
                    ++shared[files[i]][files[j]];
                    ++shared[files[j]][files[i]];
                }
            }
        }

        std::map<std::string, std::vector<ChangeCoupling>> coupling;
        for (const auto& [path, partners] : shared) {
            const auto own = commits_per_file.at(path);
            std::vector<ChangeCoupling> strong;
            for (const auto& [other, together] : partners) {
                const auto fewer = std::min(own, commits_per_file.at(other));
                const double strength = static_cast<double>(together) / static_cast<double>(fewer);
                if (strength > thresholds::min_change_coupling) {
                    strong.push_back({other, strength});
                }
            }
            if (strong.empty()) {
                continue;
            }

            std::ranges::sort(strong, [](const ChangeCoupling& a, const ChangeCoupling& b) {
                if (a.strength != b.strength) {
                    return a.strength > b.strength;
                }
                return a.path < b.path;
            });
            if (strong.size() > thresholds::max_coupled_files) {
                strong.resize(thresholds::max_coupled_files);
            }
            coupling.emplace(path, std::move(strong));
        }
        return coupling;
    }

    double HotspotAnalyzer::complexity_score(const CodeMetrics& metrics) noexcept {
        const double mi = std::clamp(metrics.maintainability_index_raw, 0.0, mi_scale);
        const double inverted_mi = 100.0 - mi / mi_scale * 100.0;
        const double cyclomatic = std::min(static_cast<double>(metrics.cyclomatic_complexity) * 2.0, 100.0);
        return inverted_mi * 0.6 + cyclomatic * 0.4;
    }

    RiskLevel HotspotAnalyzer::classify_risk(const double risk_score) noexcept {
        if (risk_score >= thresholds::critical_risk) {
            return RiskLevel::Critical;
        }
        if (risk_score >= thresholds::high_risk) {
            return RiskLevel::High;
        }
        if (risk_score >= thresholds::medium_risk) {
            return RiskLevel::Medium;
        }
        return RiskLevel::Low;
    }

}  // namespace rha::analyzers
