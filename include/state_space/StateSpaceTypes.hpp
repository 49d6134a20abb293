#ifndef STATE_SPACE_TYPES_HPP
#define STATE_SPACE_TYPES_HPP

#include <Eigen/Dense>
#include <variant>

namespace citerate {

/**
 * @brief Observation noise held fixed over every time step.
 */
struct ConstantVariance {
    double value = 0.3;
};

/**
 * @brief Observation noise derived per step from the empirical rate:
 * R_t = overdispersion / (rate_t + min_count) + sigma_min_sq.
 */
struct TimeVaryingVariance {
    double overdispersion = 0.56;
    double sigma_min_sq = 0.01;
};

/**
 * @brief Which observation noise model a run uses. Resolved once per run.
 */
using ObservationVarianceMode = std::variant<ConstantVariance, TimeVaryingVariance>;

/**
 * @brief Output of one forward pass of the local-level filter.
 *
 * All vectors are indexed by time step and have the same length.
 */
struct FilterOutput {
    Eigen::VectorXd predicted_mean;
    Eigen::VectorXd predicted_var;
    Eigen::VectorXd filtered_mean;
    Eigen::VectorXd filtered_var;
    double log_likelihood = 0.0;

    Eigen::Index size() const { return filtered_mean.size(); }
};

/**
 * @brief Output of the Rauch-Tung-Striebel backward pass.
 */
struct SmoothOutput {
    Eigen::VectorXd mean;
    Eigen::VectorXd var;

    Eigen::Index size() const { return mean.size(); }
};

/**
 * @brief Multi-step forecast of a log-rate random walk, one entry per horizon step.
 */
struct ForecastOutput {
    Eigen::VectorXd log_rate_var;      // P_T + h*Q
    Eigen::VectorXd rate_median;       // exp(x_T)
    Eigen::VectorXd rate_std;          // lognormal standard deviation
    Eigen::VectorXd sampled_log_rate;  // draw of the latent log-rate
    Eigen::VectorXd sampled_rate;      // draw of the observed rate

    Eigen::Index size() const { return log_rate_var.size(); }
};

} // namespace citerate

#endif // STATE_SPACE_TYPES_HPP
