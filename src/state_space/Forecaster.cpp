#include "state_space/Forecaster.hpp"
#include "exceptions/Exceptions.hpp"

#include <cmath>
#include <string>

namespace citerate {

Forecaster::Forecaster(double process_var, const NoiseModel& sampling_noise)
    : process_var_(process_var),
      sampling_noise_(sampling_noise) {
    if (!std::isfinite(process_var_) || process_var_ < 0.0) {
        THROW_INVALID_PARAM("Forecaster::Forecaster",
                            "Process variance must be finite and non-negative, got " +
                            std::to_string(process_var_));
    }
}

void Forecaster::validate(double final_var, int horizon) const {
    if (!std::isfinite(final_var) || final_var < 0.0) {
        THROW_INVALID_PARAM("Forecaster::forecast",
                            "Final state variance must be non-negative, got " + std::to_string(final_var));
    }
    if (horizon < 0) {
        THROW_INVALID_PARAM("Forecaster::forecast",
                            "Horizon must be non-negative, got " + std::to_string(horizon));
    }
}

ForecastOutput Forecaster::predictiveDistribution(double final_mean, double final_var, int horizon) const {
    validate(final_var, horizon);

    ForecastOutput out;
    out.log_rate_var.resize(horizon);
    out.rate_median.resize(horizon);
    out.rate_std.resize(horizon);

    const double median = std::exp(final_mean);
    for (int i = 0; i < horizon; ++i) {
        const double h = static_cast<double>(i + 1);
        const double var_h = final_var + h * process_var_;
        const double rate_var = std::expm1(var_h) * std::exp(2.0 * final_mean + var_h);

        out.log_rate_var(i) = var_h;
        out.rate_median(i) = median;
        out.rate_std(i) = std::sqrt(rate_var);
    }
    return out;
}

ForecastOutput Forecaster::forecast(double final_mean, double final_var, int horizon, std::mt19937& rng) const {
    ForecastOutput out = predictiveDistribution(final_mean, final_var, horizon);
    out.sampled_log_rate.resize(horizon);
    out.sampled_rate.resize(horizon);

    std::normal_distribution<double> standard_normal(0.0, 1.0);
    for (int i = 0; i < horizon; ++i) {
        const double latent_log_rate = final_mean + std::sqrt(out.log_rate_var(i)) * standard_normal(rng);
        const double latent_rate = std::exp(latent_log_rate);

        const double obs_var = sampling_noise_.variance(latent_rate);
        const double observed_log_rate = latent_log_rate + std::sqrt(obs_var) * standard_normal(rng);

        out.sampled_log_rate(i) = latent_log_rate;
        out.sampled_rate(i) = std::exp(observed_log_rate);
    }
    return out;
}

} // namespace citerate
