#include "model/objectives/CorpusLikelihoodObjective.hpp"
#include "state_space/LocalLevelFilter.hpp"
#include "state_space/NoiseModel.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"

#include <cmath>
#include <limits>

namespace citerate {

namespace {
    const std::string LOG_SOURCE = "CORPUS_LIKELIHOOD";
    const std::vector<std::string> PARAMETER_NAMES = {"process_var", "overdispersion"};
}

CorpusLikelihoodObjective::CorpusLikelihoodObjective(
    std::vector<PreparedSeries> corpus,
    std::vector<std::string> labels,
    double min_count,
    double sigma_min_sq,
    double prior_var,
    int min_series_length)
    : corpus_(std::move(corpus)),
      labels_(std::move(labels)),
      min_count_(min_count),
      sigma_min_sq_(sigma_min_sq),
      prior_var_(prior_var),
      min_series_length_(min_series_length) {
    if (labels_.size() != corpus_.size()) {
        THROW_INVALID_PARAM("CorpusLikelihoodObjective::CorpusLikelihoodObjective",
                            "Got " + std::to_string(labels_.size()) + " labels for " +
                            std::to_string(corpus_.size()) + " series");
    }
    if (!(min_count_ > 0.0)) {
        THROW_INVALID_PARAM("CorpusLikelihoodObjective::CorpusLikelihoodObjective", "min_count must be positive");
    }
    if (!(sigma_min_sq_ >= 0.0)) {
        THROW_INVALID_PARAM("CorpusLikelihoodObjective::CorpusLikelihoodObjective", "sigma_min_sq must be non-negative");
    }
    if (min_series_length_ < 1) {
        THROW_INVALID_PARAM("CorpusLikelihoodObjective::CorpusLikelihoodObjective", "min_series_length must be at least 1");
    }
}

const std::vector<std::string>& CorpusLikelihoodObjective::getParameterNames() const {
    return PARAMETER_NAMES;
}

double CorpusLikelihoodObjective::calculate(const Eigen::VectorXd& parameters) const {
    if (parameters.size() != 2) {
        THROW_INVALID_PARAM("CorpusLikelihoodObjective::calculate",
                            "Expected (process_var, overdispersion), got " +
                            std::to_string(parameters.size()) + " parameters");
    }
    return evaluate(parameters(0), parameters(1)).total;
}

CorpusLikelihoodObjective::Evaluation CorpusLikelihoodObjective::evaluate(
    double process_var, double overdispersion) const {

    // Rejects a negative q for the whole evaluation; not a per-series failure.
    const LocalLevelFilter filter(process_var);
    const NoiseModel noise(overdispersion, min_count_, sigma_min_sq_);

    Evaluation result;
    for (size_t i = 0; i < corpus_.size(); ++i) {
        const PreparedSeries& series = corpus_[i];
        if (series.size() < min_series_length_) {
            continue;
        }

        try {
            const Eigen::VectorXd obs_var = noise.variances(series.empirical_rate);
            const FilterOutput out = filter.runFromFirstObservation(series.observations, obs_var, prior_var_);
            result.total += out.log_likelihood;
            ++result.series_used;
        } catch (const ModelException& e) {
            Logger::getInstance().debug(LOG_SOURCE, "Series '" + labels_[i] + "' (index " +
                                        std::to_string(i) + ") skipped: " + e.what());
            result.failed_series.push_back(i);
        }
    }
    // Totals over different subsets of the corpus are not comparable across cells.
    if (!result.failed_series.empty()) {
        result.total = -std::numeric_limits<double>::infinity();
    }
    return result;
}

size_t CorpusLikelihoodObjective::usableSeriesCount() const {
    size_t count = 0;
    for (const auto& series : corpus_) {
        if (series.size() >= min_series_length_) ++count;
    }
    return count;
}

} // namespace citerate
