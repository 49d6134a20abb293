#include "state_space/LocalLevelFilter.hpp"
#include "exceptions/Exceptions.hpp"

#include <cmath>
#include <numbers>
#include <string>

namespace citerate {

namespace {
    const double LOG_2PI = std::log(2.0 * std::numbers::pi);
}

LocalLevelFilter::LocalLevelFilter(double process_var)
    : process_var_(process_var) {
    if (!std::isfinite(process_var_) || process_var_ < 0.0) {
        THROW_INVALID_PARAM("LocalLevelFilter::LocalLevelFilter",
                            "Process variance must be finite and non-negative, got " +
                            std::to_string(process_var_));
    }
}

FilterOutput LocalLevelFilter::run(
    const Eigen::VectorXd& observations,
    const Eigen::VectorXd& obs_var,
    double x0_mean,
    double x0_var) const {

    const Eigen::Index T = observations.size();
    if (obs_var.size() != T) {
        THROW_INVALID_PARAM("LocalLevelFilter::run",
                            "Observation variance length " + std::to_string(obs_var.size()) +
                            " does not match observation length " + std::to_string(T));
    }
    if (!std::isfinite(x0_var) || x0_var <= 0.0) {
        THROW_INVALID_PARAM("LocalLevelFilter::run",
                            "Prior variance must be positive, got " + std::to_string(x0_var));
    }
    for (Eigen::Index t = 0; t < T; ++t) {
        if (!std::isfinite(obs_var(t)) || obs_var(t) <= 0.0) {
            THROW_INVALID_PARAM("LocalLevelFilter::run",
                                "Observation variance must be positive at step " + std::to_string(t) +
                                ", got " + std::to_string(obs_var(t)));
        }
    }

    FilterOutput out;
    out.predicted_mean.resize(T);
    out.predicted_var.resize(T);
    out.filtered_mean.resize(T);
    out.filtered_var.resize(T);
    out.log_likelihood = 0.0;

    for (Eigen::Index t = 0; t < T; ++t) {
        // Predict
        if (t == 0) {
            out.predicted_mean(t) = x0_mean;
            out.predicted_var(t) = x0_var;
        } else {
            out.predicted_mean(t) = out.filtered_mean(t - 1);
            out.predicted_var(t) = out.filtered_var(t - 1) + process_var_;
        }

        // Update
        const double innovation = observations(t) - out.predicted_mean(t);
        const double innovation_var = out.predicted_var(t) + obs_var(t);
        const double gain = out.predicted_var(t) / innovation_var;

        out.filtered_mean(t) = out.predicted_mean(t) + gain * innovation;
        out.filtered_var(t) = (1.0 - gain) * out.predicted_var(t);

        out.log_likelihood += -0.5 * (LOG_2PI + std::log(innovation_var) +
                                      innovation * innovation / innovation_var);
    }

    if (!std::isfinite(out.log_likelihood)) {
        THROW_NUMERICAL("LocalLevelFilter::run",
                        "Log-likelihood is not finite; check observations for NaN or Inf");
    }

    return out;
}

FilterOutput LocalLevelFilter::run(
    const Eigen::VectorXd& observations,
    double obs_var,
    double x0_mean,
    double x0_var) const {
    return run(observations, Eigen::VectorXd::Constant(observations.size(), obs_var), x0_mean, x0_var);
}

FilterOutput LocalLevelFilter::runFromFirstObservation(
    const Eigen::VectorXd& observations,
    const Eigen::VectorXd& obs_var,
    double x0_var) const {
    const double x0_mean = observations.size() > 0 ? observations(0) : 0.0;
    return run(observations, obs_var, x0_mean, x0_var);
}

} // namespace citerate
