#ifndef TUNING_RUNNER_HPP
#define TUNING_RUNNER_HPP

#include "model/AnalysisTypes.hpp"
#include "model/RunConfiguration.hpp"
#include "model/objectives/CorpusLikelihoodObjective.hpp"
#include <string>

namespace citerate {

/**
 * @brief Selects (process variance, overdispersion) for a citation snapshot
 * by maximising the corpus marginal likelihood over a grid.
 */
class TuningRunner {
public:
    /**
     * @throws InvalidParameterException if the configuration is invalid.
     */
    explicit TuningRunner(const RunConfiguration& config);

    /**
     * @brief Build the likelihood objective for a snapshot.
     *
     * Papers without citation data are dropped; the remaining ones are
     * prepared and labelled by title.
     */
    CorpusLikelihoodObjective buildObjective(const CitationDocument& document) const;

    /**
     * @param input_reference Name of the input recorded in the report.
     */
    TuningReport run(const CitationDocument& document, const std::string& input_reference) const;

private:
    RunConfiguration config_;
};

} // namespace citerate

#endif // TUNING_RUNNER_HPP
