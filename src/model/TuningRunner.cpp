#include "model/TuningRunner.hpp"
#include "model/SeriesPreparer.hpp"
#include "model/optimizers/GridSearchTuner.hpp"
#include "utils/Logger.hpp"

#ifdef _OPENMP
#include <omp.h>
#endif

namespace citerate {

namespace {
    const std::string LOG_SOURCE = "TuningRunner";
}

TuningRunner::TuningRunner(const RunConfiguration& config)
    : config_(config) {
    config_.validate();
}

CorpusLikelihoodObjective TuningRunner::buildObjective(const CitationDocument& document) const {
    const SeriesPreparer preparer(document.captured_at, config_.min_count);

    std::vector<PreparedSeries> corpus;
    std::vector<std::string> labels;
    for (const auto& paper : document.papers) {
        if (paper.citations_by_year.empty()) {
            continue;
        }
        PreparedSeries series = preparer.prepare(paper.citations_by_year);
        preparer.checkCitationTotal(paper, series);
        corpus.push_back(std::move(series));
        labels.push_back(paper.title);
    }

    return CorpusLikelihoodObjective(std::move(corpus), std::move(labels), config_.min_count,
                                     config_.sigma_min_sq, config_.prior_var,
                                     config_.min_series_length_for_tuning);
}

TuningReport TuningRunner::run(const CitationDocument& document, const std::string& input_reference) const {
    Logger& logger = Logger::getInstance();

    #ifdef _OPENMP
    if (config_.threads > 0) {
        omp_set_num_threads(config_.threads);
    }
    #endif

    logger.info(LOG_SOURCE, "Preparing data for " + std::to_string(document.papers.size()) + " papers...");
    const CorpusLikelihoodObjective objective = buildObjective(document);

    TuningReport report;
    report.input_file = input_reference;
    report.n_papers = objective.getCorpus().size();
    report.n_papers_with_min_length = objective.usableSeriesCount();
    report.min_series_length = config_.min_series_length_for_tuning;
    report.min_count = config_.min_count;
    report.n_grid = config_.n_grid;

    logger.info(LOG_SOURCE, "  " + std::to_string(report.n_papers) + " papers have citation data");
    logger.info(LOG_SOURCE, "  " + std::to_string(report.n_papers_with_min_length) + " papers have >= " +
                            std::to_string(config_.min_series_length_for_tuning) + " years of data");

    GridSearchTuner tuner;
    tuner.configure(config_.tunerSettings());
    report.grid = tuner.tune(objective);

    // Failures do not stop the search; report the series excluded at the optimum.
    const auto at_best = objective.evaluate(report.grid.best_process_var, report.grid.best_overdispersion);
    for (size_t index : at_best.failed_series) {
        const std::string& label = objective.getLabels()[index];
        logger.warning(LOG_SOURCE, "Series '" + label + "' could not be scored and was excluded");
        report.failed_series.push_back(label);
    }

    return report;
}

} // namespace citerate
