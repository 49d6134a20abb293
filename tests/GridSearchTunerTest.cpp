#include "model/objectives/CorpusLikelihoodObjective.hpp"
#include "model/optimizers/GridSearchTuner.hpp"
#include "model/SeriesPreparer.hpp"
#include "state_space/LocalLevelFilter.hpp"
#include "state_space/NoiseModel.hpp"
#include "exceptions/Exceptions.hpp"

#include <gtest/gtest.h>
#include <cmath>
#include <limits>

namespace {

using citerate::CaptureTimestamp;
using citerate::CorpusLikelihoodObjective;
using citerate::GridSearchTuner;
using citerate::HyperparameterGridResult;
using citerate::IObjectiveFunction;
using citerate::InvalidParameterException;
using citerate::LocalLevelFilter;
using citerate::NoiseModel;
using citerate::PreparedSeries;
using citerate::SeriesPreparer;

std::vector<PreparedSeries> sampleCorpus() {
    const SeriesPreparer preparer(CaptureTimestamp::parse("2022-06-15T12:00:00Z"), 0.5);
    return {
        preparer.prepare({{2015, 1}, {2016, 4}, {2017, 9}, {2018, 12}, {2019, 10}, {2020, 14}, {2021, 11}}),
        preparer.prepare({{2019, 0}, {2020, 3}, {2021, 5}, {2022, 2}}),
        preparer.prepare({{2021, 6}}),
        preparer.prepare({{2010, 20}, {2011, 25}, {2012, 18}, {2013, 30}, {2014, 22}})
    };
}

std::vector<std::string> labelsFor(size_t n) {
    std::vector<std::string> labels;
    for (size_t i = 0; i < n; ++i) labels.push_back("paper " + std::to_string(i));
    return labels;
}

CorpusLikelihoodObjective sampleObjective() {
    auto corpus = sampleCorpus();
    const size_t n = corpus.size();
    return CorpusLikelihoodObjective(std::move(corpus), labelsFor(n), 0.5);
}

// Scores every cell with the same value.
class FlatObjective : public IObjectiveFunction {
public:
    double calculate(const Eigen::VectorXd&) const override { return -3.0; }
    const std::vector<std::string>& getParameterNames() const override { return names_; }

private:
    std::vector<std::string> names_{"process_var", "overdispersion"};
};

// Fails for large process variances.
class PartiallyFailingObjective : public IObjectiveFunction {
public:
    double calculate(const Eigen::VectorXd& p) const override {
        if (p(0) > 1.0) {
            THROW_INVALID_PARAM("PartiallyFailingObjective", "unsupported q");
        }
        return -std::abs(std::log(p(0))) - std::abs(std::log(p(1)));
    }
    const std::vector<std::string>& getParameterNames() const override { return names_; }

private:
    std::vector<std::string> names_{"process_var", "overdispersion"};
};

TEST(CorpusLikelihoodObjectiveTest, SumsPerSeriesLikelihoodsAndSkipsShortSeries) {
    const auto corpus = sampleCorpus();
    const CorpusLikelihoodObjective objective = sampleObjective();
    const double q = 0.2;
    const double phi = 1.5;

    const LocalLevelFilter filter(q);
    const NoiseModel noise(phi, 0.5, 0.01);
    double expected = 0.0;
    for (const auto& series : corpus) {
        if (series.size() < 2) continue;
        expected += filter.runFromFirstObservation(series.observations,
                                                   noise.variances(series.empirical_rate)).log_likelihood;
    }

    const auto eval = objective.evaluate(q, phi);
    EXPECT_NEAR(eval.total, expected, 1e-10);
    EXPECT_EQ(eval.series_used, 3u);
    EXPECT_TRUE(eval.failed_series.empty());
    EXPECT_EQ(objective.usableSeriesCount(), 3u);

    Eigen::VectorXd params(2);
    params << q, phi;
    EXPECT_NEAR(objective.calculate(params), expected, 1e-10);
}

TEST(CorpusLikelihoodObjectiveTest, MinimumLengthIsConfigurable) {
    auto corpus = sampleCorpus();
    const size_t n = corpus.size();
    const CorpusLikelihoodObjective objective(std::move(corpus), labelsFor(n), 0.5, 0.01, 1.0, 1);
    EXPECT_EQ(objective.usableSeriesCount(), 4u);
    EXPECT_EQ(objective.evaluate(0.2, 1.5).series_used, 4u);
}

TEST(CorpusLikelihoodObjectiveTest, RejectsBadArguments) {
    const CorpusLikelihoodObjective objective = sampleObjective();
    EXPECT_THROW(objective.calculate(Eigen::VectorXd::Constant(3, 0.1)), InvalidParameterException);
    EXPECT_THROW(objective.evaluate(-0.1, 1.0), InvalidParameterException);
    EXPECT_THROW(CorpusLikelihoodObjective(sampleCorpus(), labelsFor(1), 0.5), InvalidParameterException);
    EXPECT_THROW(CorpusLikelihoodObjective(sampleCorpus(), labelsFor(4), 0.0), InvalidParameterException);
}

TEST(CorpusLikelihoodObjectiveTest, FailingSeriesIsReportedAndVoidsTheTotal) {
    auto corpus = sampleCorpus();
    // phi = 0 with a zero floor makes R_t = 0 for every series.
    const CorpusLikelihoodObjective objective(std::move(corpus), labelsFor(4), 0.5, 0.0);
    const auto eval = objective.evaluate(0.2, 0.0);
    EXPECT_EQ(eval.series_used, 0u);
    EXPECT_EQ(eval.failed_series, (std::vector<size_t>{0, 1, 3}));
    EXPECT_EQ(eval.total, -std::numeric_limits<double>::infinity());
}

TEST(CorpusLikelihoodObjectiveTest, CellWithAFailedSeriesCannotBeatACompleteCell) {
    // Without a floor, phi = 0 gives R_t = 0 and every series fails in that cell.
    auto corpus = sampleCorpus();
    const CorpusLikelihoodObjective objective(std::move(corpus), labelsFor(4), 0.5, 0.0);

    const auto partial = objective.evaluate(0.2, 0.0);
    const auto complete = objective.evaluate(0.2, 1.5);
    ASSERT_TRUE(complete.failed_series.empty());
    EXPECT_EQ(complete.series_used, 3u);
    EXPECT_TRUE(std::isfinite(complete.total));
    EXPECT_GT(complete.total, partial.total);
}

TEST(GridSearchTunerTest, LogUniformGridSpansBounds) {
    const Eigen::VectorXd grid = GridSearchTuner::logUniformGrid(-3.0, 1.0, 5);
    ASSERT_EQ(grid.size(), 5);
    EXPECT_NEAR(grid(0), std::exp(-3.0), 1e-12);
    EXPECT_NEAR(grid(4), std::exp(1.0), 1e-12);
    for (Eigen::Index i = 1; i < grid.size(); ++i) {
        EXPECT_NEAR(grid(i) / grid(i - 1), std::exp(1.0), 1e-12);
    }

    const Eigen::VectorXd single = GridSearchTuner::logUniformGrid(-1.0, 2.0, 1);
    ASSERT_EQ(single.size(), 1);
    EXPECT_NEAR(single(0), std::exp(-1.0), 1e-12);

    EXPECT_THROW(GridSearchTuner::logUniformGrid(0.0, 1.0, 0), InvalidParameterException);
}

TEST(GridSearchTunerTest, SinglePointGridReturnsThatPoint) {
    GridSearchTuner tuner;
    tuner.configure({{"n_grid", 1}});
    const CorpusLikelihoodObjective objective = sampleObjective();

    const HyperparameterGridResult result = tuner.tune(objective);
    ASSERT_EQ(result.log_likelihood.rows(), 1);
    ASSERT_EQ(result.log_likelihood.cols(), 1);
    EXPECT_NEAR(result.best_process_var, std::exp(-3.0), 1e-12);
    EXPECT_NEAR(result.best_overdispersion, std::exp(-1.0), 1e-12);
    EXPECT_NEAR(result.best_log_likelihood,
                objective.evaluate(std::exp(-3.0), std::exp(-1.0)).total, 1e-10);
}

TEST(GridSearchTunerTest, BestCellIsTheMaximumOfTheGrid) {
    GridSearchTuner tuner;
    tuner.configure({{"n_grid", 6}});
    const HyperparameterGridResult result = tuner.tune(sampleObjective());

    EXPECT_EQ(result.log_likelihood.maxCoeff(), result.best_log_likelihood);
    EXPECT_EQ(result.log_likelihood(result.best_row, result.best_col), result.best_log_likelihood);
    EXPECT_EQ(result.best_process_var, result.process_var_candidates(result.best_row));
    EXPECT_EQ(result.best_overdispersion, result.overdispersion_candidates(result.best_col));
    EXPECT_TRUE(std::isfinite(result.best_log_likelihood));
}

TEST(GridSearchTunerTest, RepeatedRunsAreIdentical) {
    GridSearchTuner tuner;
    tuner.configure({{"n_grid", 8}});
    const CorpusLikelihoodObjective objective = sampleObjective();

    const HyperparameterGridResult first = tuner.tune(objective);
    const HyperparameterGridResult second = tuner.tune(objective);
    EXPECT_EQ(first.best_process_var, second.best_process_var);
    EXPECT_EQ(first.best_overdispersion, second.best_overdispersion);
    EXPECT_EQ(first.best_log_likelihood, second.best_log_likelihood);
    EXPECT_EQ(first.log_likelihood, second.log_likelihood);
}

TEST(GridSearchTunerTest, TiesResolveToTheFirstCell) {
    GridSearchTuner tuner;
    tuner.configure({{"n_grid", 4}});
    const HyperparameterGridResult result = tuner.tune(FlatObjective());
    EXPECT_EQ(result.best_row, 0);
    EXPECT_EQ(result.best_col, 0);
    EXPECT_DOUBLE_EQ(result.best_log_likelihood, -3.0);
}

TEST(GridSearchTunerTest, FailedCellsScoreNegativeInfinity) {
    GridSearchTuner tuner;
    tuner.configure({{"n_grid", 5}, {"q_log_min", -1.0}, {"q_log_max", 1.0},
                     {"phi_log_min", -1.0}, {"phi_log_max", 1.0}});
    const HyperparameterGridResult result = tuner.tune(PartiallyFailingObjective());

    // q candidates are exp(-1), exp(-0.5), 1, exp(0.5), exp(1); the last two fail.
    for (Eigen::Index j = 0; j < 5; ++j) {
        EXPECT_EQ(result.log_likelihood(3, j), -std::numeric_limits<double>::infinity());
        EXPECT_EQ(result.log_likelihood(4, j), -std::numeric_limits<double>::infinity());
    }
    EXPECT_EQ(result.best_row, 2);
    EXPECT_EQ(result.best_col, 2);
}

TEST(GridSearchTunerTest, ConfigureRejectsInvalidSettings) {
    GridSearchTuner tuner;
    EXPECT_THROW(tuner.configure({{"n_grid", 0}}), InvalidParameterException);
    EXPECT_THROW(tuner.configure({{"q_log_min", 2.0}, {"q_log_max", 1.0}}), InvalidParameterException);
    EXPECT_THROW(tuner.configure({{"phi_log_max", std::numeric_limits<double>::quiet_NaN()}}),
                 InvalidParameterException);
}

}  // namespace
