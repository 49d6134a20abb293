#ifndef LOCAL_LEVEL_FILTER_HPP
#define LOCAL_LEVEL_FILTER_HPP

#include "state_space/StateSpaceTypes.hpp"
#include <Eigen/Dense>

namespace citerate {

/**
 * @brief Scalar Kalman filter for the local-level (random walk) model.
 *
 *     x_t = x_{t-1} + eps_t,   eps_t ~ N(0, Q)
 *     z_t = x_t + eta_t,       eta_t ~ N(0, R_t)
 *
 * The initial state is supplied explicitly and is used as the prediction
 * at t = 0 (no transition is applied to it). The filter accumulates the
 * Gaussian log-likelihood of the innovations, which is the marginal
 * likelihood of the observations under the model.
 *
 * Instances are immutable and may be shared between threads.
 */
class LocalLevelFilter {
public:
    /** @brief Prior variance used when the caller does not supply one. */
    static constexpr double DEFAULT_PRIOR_VARIANCE = 1.0;

    /**
     * @param process_var Random-walk variance Q.
     * @throws InvalidParameterException if Q is negative or not finite.
     */
    explicit LocalLevelFilter(double process_var);

    /**
     * @brief Run the forward recursion with per-step observation variances.
     *
     * @param observations z_0..z_{T-1}.
     * @param obs_var R_0..R_{T-1}, same length as observations, all > 0.
     * @param x0_mean Initial state mean.
     * @param x0_var Initial state variance (> 0).
     * @throws InvalidParameterException on a length mismatch, a
     *         non-positive R_t or a non-positive prior variance.
     */
    FilterOutput run(
        const Eigen::VectorXd& observations,
        const Eigen::VectorXd& obs_var,
        double x0_mean,
        double x0_var) const;

    /** @brief Constant observation variance overload. */
    FilterOutput run(
        const Eigen::VectorXd& observations,
        double obs_var,
        double x0_mean,
        double x0_var) const;

    /**
     * @brief Seed from the first observation (x0 = z_0) with the given prior
     * variance. Empty input yields empty output and log-likelihood 0.
     */
    FilterOutput runFromFirstObservation(
        const Eigen::VectorXd& observations,
        const Eigen::VectorXd& obs_var,
        double x0_var = DEFAULT_PRIOR_VARIANCE) const;

    double getProcessVariance() const { return process_var_; }

private:
    double process_var_;
};

} // namespace citerate

#endif // LOCAL_LEVEL_FILTER_HPP
