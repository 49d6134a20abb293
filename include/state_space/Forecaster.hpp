#ifndef FORECASTER_HPP
#define FORECASTER_HPP

#include "state_space/StateSpaceTypes.hpp"
#include "state_space/NoiseModel.hpp"
#include <random>

namespace citerate {

/**
 * @brief Multi-step forecast of a driftless log-rate random walk.
 *
 * Starting from the final smoothed state (x_T, P_T), the predictive
 * log-rate at horizon h is N(x_T, P_T + h*Q). The closed-form rate-space
 * summary uses the lognormal identities:
 *
 *     median = exp(x_T)
 *     var    = (exp(v_h) - 1) * exp(2*x_T + v_h)
 *
 * Each horizon step additionally draws one realization: a latent log-rate
 * from the predictive distribution, then an observed log-rate around it
 * with the Poisson-approximation noise of the sampled rate. Draws are
 * independent across steps. The random source is supplied by the caller,
 * so a seeded generator reproduces the same samples.
 */
class Forecaster {
public:
    /** @brief Observation noise floor used when sampling forecast observations. */
    static constexpr double DEFAULT_SAMPLING_SIGMA_MIN_SQ = 0.05;

    /**
     * @param process_var Q (>= 0).
     * @param sampling_noise Noise model used for the sampled observed rate.
     * @throws InvalidParameterException if Q is negative.
     */
    Forecaster(double process_var, const NoiseModel& sampling_noise);

    /**
     * @param final_mean Smoothed log-rate at the last observed step.
     * @param final_var Smoothed variance at the last observed step (>= 0).
     * @param horizon Number of steps ahead (0 yields empty output).
     * @param rng Random source for the sampled realizations.
     * @throws InvalidParameterException on a negative variance or horizon.
     */
    ForecastOutput forecast(double final_mean, double final_var, int horizon, std::mt19937& rng) const;

    /**
     * @brief Closed-form part only; sampled fields are left empty.
     */
    ForecastOutput predictiveDistribution(double final_mean, double final_var, int horizon) const;

    double getProcessVariance() const { return process_var_; }
    const NoiseModel& getSamplingNoise() const { return sampling_noise_; }

private:
    void validate(double final_var, int horizon) const;

    double process_var_;
    NoiseModel sampling_noise_;
};

} // namespace citerate

#endif // FORECASTER_HPP
