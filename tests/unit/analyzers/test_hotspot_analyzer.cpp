#include "rha/analyzers/hotspot_analyzer.hpp"

#include <gtest/gtest.h>

namespace rha::analyzers
{
    namespace {
        using ChangeSets = std::vector<std::vector<std::string>>;

        CodeMetrics analysed(const double mi_raw, const std::size_t cc) {
            CodeMetrics m;
            m.valid = true;
            m.maintainability_index_raw = mi_raw;
            m.cyclomatic_complexity = cc;
            return m;
        }

        std::vector<std::string> paths_of(const std::vector<Hotspot>& hotspots) {
            std::vector<std::string> paths;
            for (const auto& hotspot : hotspots) {
                paths.push_back(hotspot.path);
            }
            return paths;
        }
    }

    TEST(HotspotScoreTest, ComplexityBlendsMaintainabilityAndCyclomatic) {
        EXPECT_DOUBLE_EQ(HotspotAnalyzer::complexity_score(analysed(171.0, 0)), 0.0);
        EXPECT_DOUBLE_EQ(HotspotAnalyzer::complexity_score(analysed(0.0, 50)), 100.0);
        EXPECT_NEAR(HotspotAnalyzer::complexity_score(analysed(85.5, 10)), 38.0, 1e-9);
        // cyclomatic part saturates at 50
        EXPECT_DOUBLE_EQ(HotspotAnalyzer::complexity_score(analysed(171.0, 400)), 40.0);
    }

    TEST(HotspotScoreTest, MaintainabilityOutsideScaleIsClamped) {
        EXPECT_NEAR(HotspotAnalyzer::complexity_score(analysed(-20.0, 0)), 60.0, 1e-9);
        EXPECT_DOUBLE_EQ(HotspotAnalyzer::complexity_score(analysed(240.0, 0)), 0.0);
    }

    TEST(HotspotScoreTest, RiskBands) {
        EXPECT_EQ(HotspotAnalyzer::classify_risk(0.0), RiskLevel::Low);
        EXPECT_EQ(HotspotAnalyzer::classify_risk(19.99), RiskLevel::Low);
        EXPECT_EQ(HotspotAnalyzer::classify_risk(20.0), RiskLevel::Medium);
        EXPECT_EQ(HotspotAnalyzer::classify_risk(39.99), RiskLevel::Medium);
        EXPECT_EQ(HotspotAnalyzer::classify_risk(40.0), RiskLevel::High);
        EXPECT_EQ(HotspotAnalyzer::classify_risk(59.99), RiskLevel::High);
        EXPECT_EQ(HotspotAnalyzer::classify_risk(60.0), RiskLevel::Critical);
        EXPECT_EQ(HotspotAnalyzer::classify_risk(125.0), RiskLevel::Critical);
    }

    TEST(ChangeCouplingTest, StrengthUsesRarerFile) {
        const auto coupling = HotspotAnalyzer::detect_change_coupling(ChangeSets{
            {"a.cpp", "b.cpp"},
            {"a.cpp", "b.cpp"},
            {"a.cpp", "c.cpp"},
            {"a.cpp"},
            {"b.cpp", "d.cpp"}});

        ASSERT_TRUE(coupling.contains("a.cpp"));
        const auto& a = coupling.at("a.cpp");
        ASSERT_EQ(a.size(), 2u);
        EXPECT_EQ(a[0].path, "c.cpp");
        EXPECT_DOUBLE_EQ(a[0].strength, 1.0);
        EXPECT_EQ(a[1].path, "b.cpp");
        EXPECT_DOUBLE_EQ(a[1].strength, 2.0 / 3.0);

        const auto& b = coupling.at("b.cpp");
        ASSERT_EQ(b.size(), 2u);
        EXPECT_EQ(b[0].path, "d.cpp");
        EXPECT_EQ(b[1].path, "a.cpp");
    }

    TEST(ChangeCouplingTest, WeakPairsAreDropped) {
        const auto coupling = HotspotAnalyzer::detect_change_coupling(ChangeSets{
            {"x.go", "y.go"},
            {"x.go"}, {"x.go"}, {"x.go"},
            {"y.go"}, {"y.go"}, {"y.go"}});

        // 1 shared of 4 each
        EXPECT_TRUE(coupling.empty());
    }

    TEST(ChangeCouplingTest, KeepsFiveStrongestPartners) {
        ChangeSets sets;
        for (const char* partner : {"f6.rs", "f2.rs", "f4.rs", "f1.rs", "f7.rs", "f3.rs", "f5.rs"}) {
            sets.push_back({"hub.rs", partner});
        }

        const auto coupling = HotspotAnalyzer::detect_change_coupling(sets);
        const auto& hub = coupling.at("hub.rs");
        ASSERT_EQ(hub.size(), 5u);
        EXPECT_EQ(hub.front().path, "f1.rs");
        EXPECT_EQ(hub.back().path, "f5.rs");
        EXPECT_EQ(coupling.at("f7.rs").size(), 1u);
    }

    TEST(ChangeCouplingTest, BulkCommitsAreIgnored) {
        std::vector<std::string> bulk;
        for (int i = 0; i < 150; ++i) {
            bulk.push_back("gen/file" + std::to_string(1000 + i) + ".c");
        }

        const auto coupling = HotspotAnalyzer::detect_change_coupling(ChangeSets{bulk, bulk});
        EXPECT_TRUE(coupling.empty());
    }

    class RankHotspotsTest : public ::testing::Test {
    protected:
        void SetUp() override {
            data_.code_metrics["src/core.cpp"] = analysed(0.0, 50);
            data_.code_metrics["src/util.cpp"] = analysed(85.5, 10);
            data_.code_metrics["src/gen.cpp"] = CodeMetrics{};

            data_.files["src/core.cpp"].revision_count = 10;
            data_.files["src/util.cpp"].revision_count = 5;
            data_.files["src/gen.cpp"].revision_count = 10;
            // deleted since, not a candidate
            data_.files["old/legacy.cpp"].revision_count = 40;

            data_.recent_change_sets = {
                {"src/core.cpp", "src/gen.cpp"},
                {"src/core.cpp", "src/gen.cpp"}};
        }

        RepositoryData data_;
    };

    TEST_F(RankHotspotsTest, RanksByChurnTimesComplexityPlusCoupling) {
        const auto hotspots = HotspotAnalyzer::rank_all(data_);
        ASSERT_EQ(paths_of(hotspots), (std::vector<std::string>{"src/core.cpp", "src/util.cpp", "src/gen.cpp"}));

        const auto& core = hotspots[0];
        EXPECT_DOUBLE_EQ(core.churn_score, 100.0);
        EXPECT_DOUBLE_EQ(core.relative_churn, 40.0);
        EXPECT_DOUBLE_EQ(core.complexity_score, 100.0);
        EXPECT_DOUBLE_EQ(core.risk_score, 105.0);
        EXPECT_EQ(core.risk_level, RiskLevel::Critical);
        EXPECT_EQ(core.revisions, 10u);
        EXPECT_EQ(core.cyclomatic_complexity, 50u);
        ASSERT_EQ(core.coupled_files.size(), 1u);
        EXPECT_EQ(core.coupled_files[0].path, "src/gen.cpp");

        const auto& util = hotspots[1];
        EXPECT_DOUBLE_EQ(util.churn_score, 50.0);
        EXPECT_NEAR(util.risk_score, 19.0, 1e-9);
        EXPECT_EQ(util.risk_level, RiskLevel::Low);
        EXPECT_TRUE(util.coupled_files.empty());
    }

    TEST_F(RankHotspotsTest, UnanalysedFileScoresOnlyChurnAndCoupling) {
        const auto hotspots = HotspotAnalyzer::rank_all(data_);
        const auto& gen = hotspots.back();

        EXPECT_EQ(gen.path, "src/gen.cpp");
        EXPECT_DOUBLE_EQ(gen.churn_score, 100.0);
        EXPECT_DOUBLE_EQ(gen.complexity_score, 0.0);
        EXPECT_FALSE(gen.maintainability_index.has_value());
        EXPECT_DOUBLE_EQ(gen.risk_score, 5.0);
    }

    TEST_F(RankHotspotsTest, TopNAndLevels) {
        const auto top = HotspotAnalyzer::identify_hotspots(data_, {.top_n = 2});
        EXPECT_EQ(paths_of(top), (std::vector<std::string>{"src/core.cpp", "src/util.cpp"}));

        const auto all = HotspotAnalyzer::identify_hotspots(data_, {.top_n = 0});
        EXPECT_EQ(all.size(), 3u);

        EXPECT_EQ(paths_of(HotspotAnalyzer::filter_by_level(all, RiskLevel::Low)),
                  (std::vector<std::string>{"src/util.cpp", "src/gen.cpp"}));
        EXPECT_TRUE(HotspotAnalyzer::filter_by_level(all, RiskLevel::High).empty());
    }

    TEST_F(RankHotspotsTest, Summary) {
        const auto summary = HotspotAnalyzer::summarize(HotspotAnalyzer::rank_all(data_));

        EXPECT_EQ(summary.files_analyzed, 3u);
        EXPECT_EQ(summary.critical, 1u);
        EXPECT_EQ(summary.high, 0u);
        EXPECT_EQ(summary.medium, 0u);
        EXPECT_EQ(summary.low, 2u);
        EXPECT_EQ(summary.files_with_coupling, 2u);
    }

    TEST(HotspotAnalyzerTest, RepositoryWithoutHistory) {
        RepositoryData data;
        data.code_metrics["main.py"] = analysed(10.0, 30);

        const auto hotspots = HotspotAnalyzer::rank_all(data);
        ASSERT_EQ(hotspots.size(), 1u);
        EXPECT_DOUBLE_EQ(hotspots[0].churn_score, 0.0);
        EXPECT_DOUBLE_EQ(hotspots[0].risk_score, 0.0);
        EXPECT_EQ(hotspots[0].risk_level, RiskLevel::Low);
    }
}
