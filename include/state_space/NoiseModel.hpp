#ifndef NOISE_MODEL_HPP
#define NOISE_MODEL_HPP

#include "state_space/StateSpaceTypes.hpp"
#include <Eigen/Dense>

namespace citerate {

/**
 * @brief Poisson-approximation observation variance for log-rates.
 *
 * For a count rate r the delta method gives Var[log(r + c)] ~ 1 / (r + c);
 * the overdispersion factor phi inflates this and sigma_min_sq bounds it
 * from below:
 *
 *     R = phi / (r + c) + sigma_min_sq
 *
 * phi = 0 degenerates to the floor only; for large r, R tends to the floor.
 */
class NoiseModel {
public:
    NoiseModel(double overdispersion, double min_count, double sigma_min_sq);

    double variance(double rate) const;

    /**
     * @brief Element-wise variance over a rate sequence (same length as input).
     */
    Eigen::VectorXd variances(const Eigen::VectorXd& rates) const;

    double getOverdispersion() const { return overdispersion_; }
    double getMinCount() const { return min_count_; }
    double getSigmaMinSq() const { return sigma_min_sq_; }

private:
    double overdispersion_;
    double min_count_;
    double sigma_min_sq_;
};

/**
 * @brief Expand an observation variance mode into one variance per step.
 *
 * @param mode Constant or time-varying noise.
 * @param empirical_rates Annualized rates of the series.
 * @param min_count Pseudocount used for the log transform.
 */
Eigen::VectorXd resolveObservationVariance(
    const ObservationVarianceMode& mode,
    const Eigen::VectorXd& empirical_rates,
    double min_count);

} // namespace citerate

#endif // NOISE_MODEL_HPP
