#ifndef CITATION_RATE_ANALYSER_HPP
#define CITATION_RATE_ANALYSER_HPP

#include "model/AnalysisTypes.hpp"
#include "model/RunConfiguration.hpp"
#include "model/SeriesPreparer.hpp"
#include "state_space/Forecaster.hpp"
#include "state_space/LocalLevelFilter.hpp"
#include "state_space/RtsSmoother.hpp"
#include <cstdint>
#include <random>

namespace citerate {

/**
 * @brief Smooths and optionally forecasts the citation rate of every paper.
 *
 * Per paper: prepare the year grid -> resolve observation noise -> filter
 * (seeded from the first observation) -> RTS smoother -> back-transform to
 * rate space -> forecast from the final smoothed state.
 *
 * Papers are independent and processed in parallel; results keep the
 * input order. A paper whose analysis fails is reported with its error and
 * empty sequences, and the rest of the corpus is still analysed.
 */
class CitationRateAnalyser {
public:
    /**
     * @throws InvalidParameterException if the configuration is invalid.
     */
    explicit CitationRateAnalyser(const RunConfiguration& config);

    /**
     * @brief Analyse every paper of a snapshot.
     *
     * Forecast draws for paper i use a generator seeded from (seed, i), where
     * seed is the configured seed or, if none, one drawn from
     * std::random_device and logged. Results therefore do not depend on
     * the thread count.
     */
    AnalysisReport analyse(const CitationDocument& document) const;

    /**
     * @brief Analyse one paper.
     *
     * @param rng Random source for the forecast realizations.
     * @throws ModelException subclasses on numerical failure; analyse()
     *         catches any std::exception per paper.
     */
    PaperAnalysis analysePaper(const PaperRecord& paper,
                               const SeriesPreparer& preparer,
                               std::mt19937& rng) const;

    ModelMetadata modelMetadata() const;
    ForecastAssumptions forecastAssumptions(std::uint64_t seed) const;

private:
    RunConfiguration config_;
    ObservationVarianceMode obs_mode_;
    LocalLevelFilter filter_;
    RtsSmoother smoother_;
    Forecaster forecaster_;
};

} // namespace citerate

#endif // CITATION_RATE_ANALYSER_HPP
