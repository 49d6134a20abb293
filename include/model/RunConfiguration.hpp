#ifndef RUN_CONFIGURATION_HPP
#define RUN_CONFIGURATION_HPP

#include "state_space/StateSpaceTypes.hpp"
#include "utils/Logger.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace citerate {

/**
 * @brief Every tunable of an analysis or tuning run.
 *
 * Defaults match the reference settings. Supplying obs_var switches the
 * run to constant observation noise and disables the time-varying model.
 */
struct RunConfiguration {
    // [model]
    double process_var = 0.25;
    std::optional<double> obs_var;
    double obs_overdispersion = 0.56;
    double min_count = 0.5;
    double sigma_min_sq = 0.01;
    double prior_var = 1.0;

    // [forecast]
    int forecast_years = 0;
    double forecast_sigma_min_sq = 0.05;
    std::optional<std::uint64_t> seed;

    // [tuning]
    int n_grid = 40;
    double q_log_min = -3.0;
    double q_log_max = 1.0;
    double phi_log_min = -1.0;
    double phi_log_max = 2.0;
    int min_series_length_for_tuning = 2;

    // [runtime]
    int threads = 0;
    LogLevel log_level = LogLevel::INFO;
    std::string log_file;   // empty: log to stderr only

    /** @brief Constant or time-varying observation noise, as configured. */
    ObservationVarianceMode observationVarianceMode() const;

    /** @brief Settings map understood by GridSearchTuner::configure. */
    std::map<std::string, double> tunerSettings() const;

    /**
     * @brief Reject values outside their domain.
     * @throws InvalidParameterException naming the first offending key.
     */
    void validate() const;
};

} // namespace citerate

#endif // RUN_CONFIGURATION_HPP
