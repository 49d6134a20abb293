#include "state_space/LocalLevelFilter.hpp"
#include "exceptions/Exceptions.hpp"

#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <numbers>

namespace {

using citerate::FilterOutput;
using citerate::InvalidParameterException;
using citerate::LocalLevelFilter;
using citerate::NumericalException;

constexpr double kTol = 1e-12;

Eigen::VectorXd scenarioObservations() {
    Eigen::VectorXd z(3);
    z << std::log(0.5), std::log(3.5), std::log(5.5);
    return z;
}

TEST(LocalLevelFilterTest, EmptySeriesGivesEmptyOutput) {
    const LocalLevelFilter filter(0.25);
    const FilterOutput out = filter.run(Eigen::VectorXd(), Eigen::VectorXd(), 0.0, 1.0);

    EXPECT_EQ(out.size(), 0);
    EXPECT_EQ(out.predicted_mean.size(), 0);
    EXPECT_EQ(out.predicted_var.size(), 0);
    EXPECT_EQ(out.filtered_var.size(), 0);
    EXPECT_DOUBLE_EQ(out.log_likelihood, 0.0);

    const FilterOutput seeded = filter.runFromFirstObservation(Eigen::VectorXd(), Eigen::VectorXd());
    EXPECT_EQ(seeded.size(), 0);
    EXPECT_DOUBLE_EQ(seeded.log_likelihood, 0.0);
}

TEST(LocalLevelFilterTest, SingleStepMatchesHandComputation) {
    const LocalLevelFilter filter(0.25);
    Eigen::VectorXd z(1);
    z << 2.0;

    const FilterOutput out = filter.run(z, 0.5, 1.0, 1.0);
    // S = 1 + 0.5, K = 1 / 1.5, v = 1
    const double s = 1.5;
    const double k = 1.0 / s;
    EXPECT_NEAR(out.predicted_mean(0), 1.0, kTol);
    EXPECT_NEAR(out.predicted_var(0), 1.0, kTol);
    EXPECT_NEAR(out.filtered_mean(0), 1.0 + k, kTol);
    EXPECT_NEAR(out.filtered_var(0), (1.0 - k) * 1.0, kTol);
    EXPECT_NEAR(out.log_likelihood,
                -0.5 * (std::log(2.0 * std::numbers::pi) + std::log(s) + 1.0 / s), kTol);
}

TEST(LocalLevelFilterTest, PredictStepAddsProcessVariance) {
    const LocalLevelFilter filter(0.25);
    Eigen::VectorXd z(3);
    z << 1.0, 1.2, 0.9;

    const FilterOutput out = filter.run(z, 0.3, z(0), 1.0);
    for (Eigen::Index t = 1; t < z.size(); ++t) {
        EXPECT_NEAR(out.predicted_mean(t), out.filtered_mean(t - 1), kTol);
        EXPECT_NEAR(out.predicted_var(t), out.filtered_var(t - 1) + 0.25, kTol);
    }
}

TEST(LocalLevelFilterTest, UpdateNeverIncreasesVariance) {
    const LocalLevelFilter filter(0.4);
    Eigen::VectorXd z(6);
    z << 0.1, 2.3, 1.7, 3.1, 2.9, 0.4;
    Eigen::VectorXd r(6);
    r << 0.2, 1.5, 0.05, 0.8, 3.0, 0.3;

    const FilterOutput out = filter.runFromFirstObservation(z, r);
    for (Eigen::Index t = 0; t < z.size(); ++t) {
        EXPECT_LE(out.filtered_var(t), out.predicted_var(t)) << "step " << t;
        EXPECT_GT(out.filtered_var(t), 0.0) << "step " << t;
    }
}

TEST(LocalLevelFilterTest, ThreeYearScenarioShrinksVarianceFromPrior) {
    const LocalLevelFilter filter(0.25);
    const Eigen::VectorXd z = scenarioObservations();

    const FilterOutput out = filter.runFromFirstObservation(z, Eigen::VectorXd::Constant(3, 0.3));
    ASSERT_EQ(out.size(), 3);
    EXPECT_TRUE(std::isfinite(out.log_likelihood));
    EXPECT_DOUBLE_EQ(out.predicted_mean(0), z(0));
    EXPECT_LT(out.filtered_var(0), LocalLevelFilter::DEFAULT_PRIOR_VARIANCE);
    EXPECT_LT(out.filtered_var(1), out.filtered_var(0));
    EXPECT_LT(out.filtered_var(2), out.filtered_var(1));
}

TEST(LocalLevelFilterTest, ConstantObservationsConvergeToTheConstant) {
    const LocalLevelFilter filter(0.0);
    const Eigen::VectorXd z = Eigen::VectorXd::Constant(200, 1.75);

    const FilterOutput out = filter.run(z, 0.3, 0.0, 1.0);
    EXPECT_NEAR(out.filtered_mean(z.size() - 1), 1.75, 1e-2);
    EXPECT_LT(out.filtered_var(z.size() - 1), 1e-2);
}

TEST(LocalLevelFilterTest, RejectsNegativeProcessVariance) {
    EXPECT_THROW(LocalLevelFilter(-0.1), InvalidParameterException);
    EXPECT_THROW(LocalLevelFilter{std::numeric_limits<double>::quiet_NaN()}, InvalidParameterException);
    EXPECT_NO_THROW(LocalLevelFilter(0.0));
}

TEST(LocalLevelFilterTest, RejectsNonPositiveObservationVariance) {
    const LocalLevelFilter filter(0.25);
    Eigen::VectorXd z(2);
    z << 1.0, 2.0;
    Eigen::VectorXd r(2);
    r << 0.3, 0.0;

    EXPECT_THROW(filter.run(z, r, 1.0, 1.0), InvalidParameterException);
    EXPECT_THROW(filter.run(z, -0.3, 1.0, 1.0), InvalidParameterException);
}

TEST(LocalLevelFilterTest, RejectsMismatchedLengthsAndBadPrior) {
    const LocalLevelFilter filter(0.25);
    Eigen::VectorXd z(2);
    z << 1.0, 2.0;

    EXPECT_THROW(filter.run(z, Eigen::VectorXd::Constant(3, 0.3), 1.0, 1.0), InvalidParameterException);
    EXPECT_THROW(filter.run(z, 0.3, 1.0, 0.0), InvalidParameterException);
}

TEST(LocalLevelFilterTest, NonFiniteObservationIsANumericalFailure) {
    const LocalLevelFilter filter(0.25);
    Eigen::VectorXd z(2);
    z << 1.0, std::numeric_limits<double>::infinity();

    EXPECT_THROW(filter.run(z, 0.3, 1.0, 1.0), NumericalException);
}

}  // namespace
