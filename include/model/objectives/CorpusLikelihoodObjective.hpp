#ifndef CORPUS_LIKELIHOOD_OBJECTIVE_HPP
#define CORPUS_LIKELIHOOD_OBJECTIVE_HPP

#include "state_space/interfaces/IObjectiveFunction.hpp"
#include "model/AnalysisTypes.hpp"
#include <Eigen/Dense>
#include <string>
#include <vector>

namespace citerate {

/**
 * @brief Summed marginal log-likelihood of a corpus of independent series.
 *
 * Parameters are (process variance q, overdispersion phi). Each series is
 * filtered with time-varying noise phi / (rate + min_count) + sigma_min_sq,
 * seeded from its first observation, and the per-series log-likelihoods are
 * added. Series shorter than min_series_length carry no information about
 * the dynamics and are left out.
 */
class CorpusLikelihoodObjective : public IObjectiveFunction {
public:
    /**
     * @brief Result of one evaluation, with the series that could not be scored.
     */
    struct Evaluation {
        double total = 0.0;
        size_t series_used = 0;
        std::vector<size_t> failed_series;   // indices into the corpus
    };

    /**
     * @param corpus Prepared series; labels[i] names corpus[i] in diagnostics.
     * @throws InvalidParameterException on bad min_count / floor / length
     *         settings, or if labels and corpus differ in size.
     */
    CorpusLikelihoodObjective(
        std::vector<PreparedSeries> corpus,
        std::vector<std::string> labels,
        double min_count,
        double sigma_min_sq = 0.01,
        double prior_var = 1.0,
        int min_series_length = 2);

    /** @brief Total log-likelihood at parameters = (q, phi). */
    double calculate(const Eigen::VectorXd& parameters) const override;

    const std::vector<std::string>& getParameterNames() const override;

    /**
     * @brief Evaluate and report failing series instead of only the total.
     *
     * A series whose filter rejects its inputs is logged with its label at
     * debug level and listed in failed_series; the remaining corpus is still
     * filtered. Any failure makes the total -infinity, so a grid cell is never
     * preferred for having scored fewer series.
     */
    Evaluation evaluate(double process_var, double overdispersion) const;

    /** @brief Number of series long enough to enter the likelihood. */
    size_t usableSeriesCount() const;

    const std::vector<PreparedSeries>& getCorpus() const { return corpus_; }
    const std::vector<std::string>& getLabels() const { return labels_; }
    int getMinSeriesLength() const { return min_series_length_; }

private:
    std::vector<PreparedSeries> corpus_;
    std::vector<std::string> labels_;
    double min_count_;
    double sigma_min_sq_;
    double prior_var_;
    int min_series_length_;
};

} // namespace citerate

#endif // CORPUS_LIKELIHOOD_OBJECTIVE_HPP
