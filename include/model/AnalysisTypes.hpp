#ifndef ANALYSIS_TYPES_HPP
#define ANALYSIS_TYPES_HPP

#include "state_space/StateSpaceTypes.hpp"
#include "utils/Timestamp.hpp"
#include <Eigen/Dense>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace citerate {

/**
 * @brief One paper as delivered by the citation source.
 */
struct PaperRecord {
    std::string title;
    std::optional<long> total_citations;      // only used for the consistency check
    std::map<int, long> citations_by_year;    // year -> count
};

/**
 * @brief A citation snapshot: every paper of one profile, captured at one instant.
 */
struct CitationDocument {
    CitationDocument(std::optional<std::string> user_id_,
                     std::string scraped_at_,
                     CaptureTimestamp captured_at_,
                     std::vector<PaperRecord> papers_)
        : user_id(std::move(user_id_)),
          scraped_at(std::move(scraped_at_)),
          captured_at(captured_at_),
          papers(std::move(papers_)) {}

    std::optional<std::string> user_id;
    std::string scraped_at;        // verbatim, echoed in the output
    CaptureTimestamp captured_at;
    std::vector<PaperRecord> papers;
};

/**
 * @brief Dense per-year arrays for one paper, ready for the filter.
 *
 * All vectors have the same length as years. Years are strictly increasing
 * but gaps are not filled.
 */
struct PreparedSeries {
    std::vector<int> years;
    Eigen::VectorXd counts;
    Eigen::VectorXd exposure;
    Eigen::VectorXd empirical_rate;
    Eigen::VectorXd observations;   // log(empirical_rate + min_count)

    Eigen::Index size() const { return observations.size(); }
    bool empty() const { return years.empty(); }
};

/**
 * @brief Forecast of one paper, aligned with its forecast years.
 */
struct PaperForecast {
    std::vector<int> years;
    ForecastOutput output;
};

/**
 * @brief Analysis result of one paper. Sequences are empty for a paper
 * without citation data or when the analysis failed (see error).
 */
struct PaperAnalysis {
    std::string title;
    std::vector<int> years;
    Eigen::VectorXd observed_citations;
    Eigen::VectorXd exposure_fraction;
    Eigen::VectorXd empirical_rate;
    Eigen::VectorXd smoothed_rate;
    Eigen::VectorXd smoothed_log_rate;
    Eigen::VectorXd smoothed_rate_std;
    double log_likelihood = 0.0;

    std::optional<PaperForecast> forecast;
    std::optional<std::string> error;
    bool total_mismatch = false;
};

/**
 * @brief Model block of the analysis output.
 */
struct ModelMetadata {
    std::string type = "kalman";
    double process_var = 0.0;
    double min_count = 0.0;
    ObservationVarianceMode obs_variance;
};

/**
 * @brief Assumptions under which forecasts were produced.
 */
struct ForecastAssumptions {
    std::string model = "local_level_random_walk";
    double process_var = 0.0;
    double overdispersion = 0.0;
    double min_count = 0.0;
    double sigma_min_sq = 0.0;
    std::optional<std::uint64_t> seed;
};

struct AnalysisReport {
    std::optional<std::string> user_id;
    std::string scraped_at;
    ModelMetadata model;
    std::optional<ForecastAssumptions> forecast_assumptions;
    std::vector<PaperAnalysis> papers;

    size_t failedCount() const {
        size_t failed = 0;
        for (const auto& paper : papers) {
            if (paper.error) ++failed;
        }
        return failed;
    }
};

/**
 * @brief Scores of a (process variance x overdispersion) grid search.
 *
 * log_likelihood(i, j) is the corpus score of process_var_candidates(i)
 * and overdispersion_candidates(j).
 */
struct HyperparameterGridResult {
    Eigen::VectorXd process_var_candidates;
    Eigen::VectorXd overdispersion_candidates;
    Eigen::MatrixXd log_likelihood;

    Eigen::Index best_row = 0;
    Eigen::Index best_col = 0;
    double best_process_var = 0.0;
    double best_overdispersion = 0.0;
    double best_log_likelihood = 0.0;
};

struct TuningReport {
    std::string input_file;
    size_t n_papers = 0;                   // papers with citation data
    size_t n_papers_with_min_length = 0;   // papers entering the likelihood
    int min_series_length = 2;
    double min_count = 0.0;
    int n_grid = 0;
    HyperparameterGridResult grid;
    std::vector<std::string> failed_series;
};

} // namespace citerate

#endif // ANALYSIS_TYPES_HPP
