#include "model/RunConfiguration.hpp"
#include "exceptions/Exceptions.hpp"

#include <cmath>

namespace citerate {

namespace {

void requireFinite(const std::string& key, double value) {
    if (!std::isfinite(value)) {
        THROW_INVALID_PARAM("RunConfiguration::validate", key + " must be finite");
    }
}

} // namespace

ObservationVarianceMode RunConfiguration::observationVarianceMode() const {
    if (obs_var) {
        return ConstantVariance{*obs_var};
    }
    return TimeVaryingVariance{obs_overdispersion, sigma_min_sq};
}

std::map<std::string, double> RunConfiguration::tunerSettings() const {
    return {
        {"n_grid", static_cast<double>(n_grid)},
        {"q_log_min", q_log_min},
        {"q_log_max", q_log_max},
        {"phi_log_min", phi_log_min},
        {"phi_log_max", phi_log_max}
    };
}

void RunConfiguration::validate() const {
    requireFinite("process_var", process_var);
    requireFinite("obs_overdispersion", obs_overdispersion);
    requireFinite("min_count", min_count);
    requireFinite("sigma_min_sq", sigma_min_sq);
    requireFinite("prior_var", prior_var);
    requireFinite("forecast_sigma_min_sq", forecast_sigma_min_sq);

    if (process_var < 0.0) {
        THROW_INVALID_PARAM("RunConfiguration::validate", "process_var must be non-negative");
    }
    if (obs_var && (!std::isfinite(*obs_var) || *obs_var <= 0.0)) {
        THROW_INVALID_PARAM("RunConfiguration::validate", "obs_var must be positive");
    }
    if (obs_overdispersion < 0.0) {
        THROW_INVALID_PARAM("RunConfiguration::validate", "obs_overdispersion must be non-negative");
    }
    if (min_count <= 0.0) {
        THROW_INVALID_PARAM("RunConfiguration::validate", "min_count must be positive");
    }
    if (sigma_min_sq < 0.0 || forecast_sigma_min_sq < 0.0) {
        THROW_INVALID_PARAM("RunConfiguration::validate", "noise floors must be non-negative");
    }
    // Time-varying noise with phi = 0 and no floor would give R_t = 0.
    if (!obs_var && obs_overdispersion == 0.0 && sigma_min_sq == 0.0) {
        THROW_INVALID_PARAM("RunConfiguration::validate",
                            "obs_overdispersion and sigma_min_sq cannot both be zero");
    }
    if (prior_var <= 0.0) {
        THROW_INVALID_PARAM("RunConfiguration::validate", "prior_var must be positive");
    }
    if (forecast_years < 0) {
        THROW_INVALID_PARAM("RunConfiguration::validate", "forecast_years must be non-negative");
    }
    if (n_grid < 1) {
        THROW_INVALID_PARAM("RunConfiguration::validate", "n_grid must be at least 1");
    }
    if (q_log_min > q_log_max || phi_log_min > phi_log_max) {
        THROW_INVALID_PARAM("RunConfiguration::validate", "grid lower bounds must not exceed upper bounds");
    }
    if (min_series_length_for_tuning < 1) {
        THROW_INVALID_PARAM("RunConfiguration::validate", "min_series_length_for_tuning must be at least 1");
    }
    if (threads < 0) {
        THROW_INVALID_PARAM("RunConfiguration::validate", "threads must be non-negative");
    }
}

} // namespace citerate
