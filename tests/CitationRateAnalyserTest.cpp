#include "model/CitationRateAnalyser.hpp"
#include "state_space/LocalLevelFilter.hpp"
#include "state_space/RtsSmoother.hpp"
#include "exceptions/Exceptions.hpp"

#include <gtest/gtest.h>
#include <cmath>

namespace {

using citerate::AnalysisReport;
using citerate::CaptureTimestamp;
using citerate::CitationDocument;
using citerate::CitationRateAnalyser;
using citerate::ConstantVariance;
using citerate::FilterOutput;
using citerate::InvalidParameterException;
using citerate::LocalLevelFilter;
using citerate::PaperAnalysis;
using citerate::PaperRecord;
using citerate::RtsSmoother;
using citerate::RunConfiguration;
using citerate::SeriesPreparer;
using citerate::SmoothOutput;
using citerate::TimeVaryingVariance;

constexpr double kTol = 1e-12;

PaperRecord makePaper(const std::string& title, std::map<int, long> citations) {
    PaperRecord paper;
    paper.title = title;
    paper.citations_by_year = std::move(citations);
    return paper;
}

CitationDocument makeDocument(std::vector<PaperRecord> papers) {
    const std::string scraped_at = "2022-06-15T12:00:00Z";
    return CitationDocument(std::string("user-1"), scraped_at, CaptureTimestamp::parse(scraped_at),
                            std::move(papers));
}

class CitationRateAnalyserTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.process_var = 0.25;
        config_.obs_var = 0.3;
        config_.seed = 42;
        config_.threads = 2;
    }

    RunConfiguration config_;
};

TEST_F(CitationRateAnalyserTest, ThreeYearScenarioMatchesFilterAndSmoother) {
    const CitationRateAnalyser analyser(config_);
    const AnalysisReport report = analyser.analyse(makeDocument({makePaper("A", {{2019, 0}, {2020, 3}, {2021, 5}})}));

    ASSERT_EQ(report.papers.size(), 1u);
    const PaperAnalysis& paper = report.papers[0];
    ASSERT_FALSE(paper.error.has_value());
    EXPECT_EQ(paper.years, (std::vector<int>{2019, 2020, 2021}));
    EXPECT_TRUE((paper.exposure_fraction.array() == 1.0).all());
    EXPECT_NEAR(paper.empirical_rate(1), 3.0, kTol);

    Eigen::VectorXd z(3);
    z << std::log(0.5), std::log(3.5), std::log(5.5);
    const FilterOutput filtered = LocalLevelFilter(0.25).runFromFirstObservation(z, Eigen::VectorXd::Constant(3, 0.3));
    const SmoothOutput smoothed = RtsSmoother().smooth(filtered);

    EXPECT_NEAR(paper.log_likelihood, filtered.log_likelihood, kTol);
    for (Eigen::Index t = 0; t < 3; ++t) {
        EXPECT_NEAR(paper.smoothed_log_rate(t), smoothed.mean(t), kTol);
        EXPECT_NEAR(paper.smoothed_rate(t), std::exp(smoothed.mean(t)), kTol);
        EXPECT_NEAR(paper.smoothed_rate_std(t), std::exp(smoothed.mean(t)) * std::sqrt(smoothed.var(t)), kTol);
    }
    EXPECT_FALSE(paper.forecast.has_value());
    EXPECT_FALSE(report.forecast_assumptions.has_value());
}

TEST_F(CitationRateAnalyserTest, EmptyPaperHasEmptyRecordAndNoForecast) {
    config_.forecast_years = 3;
    const CitationRateAnalyser analyser(config_);
    const AnalysisReport report = analyser.analyse(makeDocument({makePaper("Empty", {})}));

    ASSERT_EQ(report.papers.size(), 1u);
    const PaperAnalysis& paper = report.papers[0];
    EXPECT_EQ(paper.title, "Empty");
    EXPECT_TRUE(paper.years.empty());
    EXPECT_EQ(paper.observed_citations.size(), 0);
    EXPECT_EQ(paper.smoothed_rate.size(), 0);
    EXPECT_EQ(paper.smoothed_rate_std.size(), 0);
    EXPECT_FALSE(paper.forecast.has_value());
    EXPECT_FALSE(paper.error.has_value());
    EXPECT_TRUE(report.forecast_assumptions.has_value());
}

TEST_F(CitationRateAnalyserTest, ForecastCoversTheFollowingYears) {
    config_.forecast_years = 4;
    const CitationRateAnalyser analyser(config_);
    const AnalysisReport report = analyser.analyse(makeDocument({makePaper("A", {{2020, 3}, {2021, 5}, {2022, 2}})}));

    const PaperAnalysis& paper = report.papers[0];
    ASSERT_TRUE(paper.forecast.has_value());
    EXPECT_EQ(paper.forecast->years, (std::vector<int>{2023, 2024, 2025, 2026}));
    ASSERT_EQ(paper.forecast->output.size(), 4);
    EXPECT_NEAR(paper.forecast->output.rate_median(0), paper.smoothed_rate(2), 1e-10);
    EXPECT_EQ(paper.forecast->output.sampled_rate.size(), 4);

    ASSERT_TRUE(report.forecast_assumptions.has_value());
    EXPECT_EQ(report.forecast_assumptions->model, "local_level_random_walk");
    EXPECT_DOUBLE_EQ(report.forecast_assumptions->process_var, 0.25);
    EXPECT_DOUBLE_EQ(report.forecast_assumptions->overdispersion, 0.56);
    EXPECT_DOUBLE_EQ(report.forecast_assumptions->sigma_min_sq, 0.05);
    ASSERT_TRUE(report.forecast_assumptions->seed.has_value());
    EXPECT_EQ(*report.forecast_assumptions->seed, 42u);
}

TEST_F(CitationRateAnalyserTest, SeededRunsAreReproducibleAcrossThreadCounts) {
    config_.forecast_years = 3;
    std::vector<PaperRecord> papers;
    for (int i = 0; i < 12; ++i) {
        papers.push_back(makePaper("P" + std::to_string(i), {{2018, i}, {2019, 2 * i + 1}, {2020, i + 3}}));
    }
    const CitationDocument doc = makeDocument(papers);

    const AnalysisReport parallel = CitationRateAnalyser(config_).analyse(doc);
    config_.threads = 1;
    const AnalysisReport serial = CitationRateAnalyser(config_).analyse(doc);

    ASSERT_EQ(parallel.papers.size(), serial.papers.size());
    for (size_t i = 0; i < papers.size(); ++i) {
        EXPECT_EQ(parallel.papers[i].title, papers[i].title);
        EXPECT_EQ(parallel.papers[i].forecast->output.sampled_rate,
                  serial.papers[i].forecast->output.sampled_rate) << "paper " << i;
    }
    // Papers draw from distinct streams.
    EXPECT_NE(parallel.papers[0].forecast->output.sampled_log_rate(0) - parallel.papers[0].smoothed_log_rate(2),
              parallel.papers[1].forecast->output.sampled_log_rate(0) - parallel.papers[1].smoothed_log_rate(2));
}

TEST_F(CitationRateAnalyserTest, ModelMetadataRecordsTheNoiseMode) {
    const CitationRateAnalyser constant(config_);
    EXPECT_TRUE(std::holds_alternative<ConstantVariance>(constant.modelMetadata().obs_variance));
    EXPECT_EQ(constant.modelMetadata().type, "kalman");

    config_.obs_var.reset();
    config_.obs_overdispersion = 1.2;
    const CitationRateAnalyser varying(config_);
    const auto meta = varying.modelMetadata();
    ASSERT_TRUE(std::holds_alternative<TimeVaryingVariance>(meta.obs_variance));
    EXPECT_DOUBLE_EQ(std::get<TimeVaryingVariance>(meta.obs_variance).overdispersion, 1.2);
    EXPECT_DOUBLE_EQ(meta.process_var, 0.25);
}

TEST_F(CitationRateAnalyserTest, SingleYearPaperIsAnalysed) {
    config_.obs_var.reset();
    const CitationRateAnalyser analyser(config_);
    const AnalysisReport report = analyser.analyse(makeDocument({makePaper("One", {{2022, 4}})}));

    const PaperAnalysis& paper = report.papers[0];
    ASSERT_EQ(paper.years.size(), 1u);
    EXPECT_LT(paper.exposure_fraction(0), 1.0);
    EXPECT_TRUE(std::isfinite(paper.smoothed_rate(0)));
}

TEST_F(CitationRateAnalyserTest, MixedCorpusKeepsInputOrder) {
    config_.obs_var.reset();
    const CitationRateAnalyser analyser(config_);
    const AnalysisReport report = analyser.analyse(makeDocument({
        makePaper("Fine", {{2020, 3}, {2021, 5}}),
        makePaper("Empty", {}),
        makePaper("Late", {{2021, 0}, {2022, 1}})
    }));

    ASSERT_EQ(report.papers.size(), 3u);
    EXPECT_EQ(report.papers[0].title, "Fine");
    EXPECT_EQ(report.papers[1].title, "Empty");
    EXPECT_EQ(report.papers[2].title, "Late");
    EXPECT_EQ(report.failedCount(), 0u);
    EXPECT_EQ(report.papers[0].years.size(), 2u);
    EXPECT_TRUE(report.papers[1].years.empty());
    ASSERT_TRUE(report.user_id.has_value());
    EXPECT_EQ(*report.user_id, "user-1");
    EXPECT_EQ(report.scraped_at, "2022-06-15T12:00:00Z");
}

TEST_F(CitationRateAnalyserTest, NoiseWithoutOverdispersionOrFloorIsRejected) {
    config_.obs_var.reset();
    config_.obs_overdispersion = 0.0;
    config_.sigma_min_sq = 0.0;
    EXPECT_THROW(CitationRateAnalyser{config_}, InvalidParameterException);
}

TEST_F(CitationRateAnalyserTest, RejectsInvalidConfiguration) {
    config_.process_var = -1.0;
    EXPECT_THROW(CitationRateAnalyser{config_}, InvalidParameterException);
}

}  // namespace
