#include "model/CitationRateAnalyser.hpp"
#include "state_space/NoiseModel.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include "utils/ParallelTasks.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace citerate {

namespace {

const std::string LOG_SOURCE = "CitationRateAnalyser";

const RunConfiguration& validated(const RunConfiguration& config) {
    config.validate();
    return config;
}

std::uint64_t drawRunSeed() {
    std::random_device rd;
    return (static_cast<std::uint64_t>(rd()) << 32) | static_cast<std::uint64_t>(rd());
}

} // namespace

CitationRateAnalyser::CitationRateAnalyser(const RunConfiguration& config)
    : config_(validated(config)),
      obs_mode_(config_.observationVarianceMode()),
      filter_(config_.process_var),
      smoother_(),
      forecaster_(config_.process_var,
                  NoiseModel(config_.obs_overdispersion, config_.min_count, config_.forecast_sigma_min_sq)) {}

ModelMetadata CitationRateAnalyser::modelMetadata() const {
    ModelMetadata meta;
    meta.process_var = config_.process_var;
    meta.min_count = config_.min_count;
    meta.obs_variance = obs_mode_;
    return meta;
}

ForecastAssumptions CitationRateAnalyser::forecastAssumptions(std::uint64_t seed) const {
    ForecastAssumptions assumptions;
    assumptions.process_var = config_.process_var;
    assumptions.overdispersion = config_.obs_overdispersion;
    assumptions.min_count = config_.min_count;
    assumptions.sigma_min_sq = config_.forecast_sigma_min_sq;
    assumptions.seed = seed;
    return assumptions;
}

PaperAnalysis CitationRateAnalyser::analysePaper(
    const PaperRecord& paper,
    const SeriesPreparer& preparer,
    std::mt19937& rng) const {

    PaperAnalysis result;
    result.title = paper.title;
    if (paper.citations_by_year.empty()) {
        return result;
    }

    const PreparedSeries series = preparer.prepare(paper.citations_by_year);
    result.total_mismatch = preparer.checkCitationTotal(paper, series);

    const Eigen::VectorXd obs_var = resolveObservationVariance(obs_mode_, series.empirical_rate, config_.min_count);
    const FilterOutput filtered = filter_.runFromFirstObservation(series.observations, obs_var, config_.prior_var);
    const SmoothOutput smoothed = smoother_.smooth(filtered);

    result.years = series.years;
    result.observed_citations = series.counts;
    result.exposure_fraction = series.exposure;
    result.empirical_rate = series.empirical_rate;
    result.smoothed_log_rate = smoothed.mean;
    result.smoothed_rate = smoothed.mean.array().exp().matrix();
    result.smoothed_rate_std = (result.smoothed_rate.array() * smoothed.var.array().sqrt()).matrix();
    result.log_likelihood = filtered.log_likelihood;

    if (config_.forecast_years > 0) {
        const Eigen::Index last = smoothed.size() - 1;
        PaperForecast forecast;
        forecast.years.reserve(config_.forecast_years);
        for (int h = 1; h <= config_.forecast_years; ++h) {
            forecast.years.push_back(series.years.back() + h);
        }
        forecast.output = forecaster_.forecast(smoothed.mean(last), smoothed.var(last),
                                               config_.forecast_years, rng);
        result.forecast = std::move(forecast);
    }

    return result;
}

AnalysisReport CitationRateAnalyser::analyse(const CitationDocument& document) const {
    Logger& logger = Logger::getInstance();

    const SeriesPreparer preparer(document.captured_at, config_.min_count);
    {
        std::ostringstream msg;
        msg << "Data captured at " << document.captured_at.toIsoString()
            << "; exposure fraction for " << document.captured_at.year() << ": "
            << std::fixed << std::setprecision(3) << document.captured_at.exposureFraction();
        logger.info(LOG_SOURCE, msg.str());
    }

    const std::uint64_t seed = config_.seed ? *config_.seed : drawRunSeed();
    if (config_.forecast_years > 0) {
        logger.info(LOG_SOURCE, "Forecasting " + std::to_string(config_.forecast_years) +
                                " years ahead with seed " + std::to_string(seed));
    }

    AnalysisReport report;
    report.user_id = document.user_id;
    report.scraped_at = document.scraped_at;
    report.model = modelMetadata();
    if (config_.forecast_years > 0) {
        report.forecast_assumptions = forecastAssumptions(seed);
    }

    const int num_papers = static_cast<int>(document.papers.size());
    report.papers.resize(num_papers);

    logger.info(LOG_SOURCE, "Analyzing " + std::to_string(num_papers) + " papers...");

    int available_threads = 1;
    #ifdef _OPENMP
    available_threads = config_.threads > 0 ? config_.threads : omp_get_max_threads();
    if (available_threads < 1) available_threads = 1;
    #endif

    const auto errors = runIndependentTasks(num_papers, available_threads, [&](int i) {
        std::seed_seq seq{static_cast<std::uint32_t>(seed),
                          static_cast<std::uint32_t>(seed >> 32),
                          static_cast<std::uint32_t>(i)};
        std::mt19937 rng(seq);
        report.papers[i] = analysePaper(document.papers[i], preparer, rng);
    });

    size_t mismatches = 0;
    for (int i = 0; i < num_papers; ++i) {
        if (errors[i]) {
            logger.error(LOG_SOURCE, "Paper " + std::to_string(i) + " '" + document.papers[i].title +
                                     "' failed: " + *errors[i]);
            PaperAnalysis failed;
            failed.title = document.papers[i].title;
            failed.error = *errors[i];
            report.papers[i] = std::move(failed);
        }
        if (report.papers[i].total_mismatch) ++mismatches;
    }

    logger.info(LOG_SOURCE, "Analyzed " + std::to_string(num_papers) + " papers: " +
                            std::to_string(report.failedCount()) + " failed, " +
                            std::to_string(mismatches) + " with citation total mismatches");
    return report;
}

} // namespace citerate
