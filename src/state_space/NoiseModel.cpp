#include "state_space/NoiseModel.hpp"

#include <type_traits>

namespace citerate {

NoiseModel::NoiseModel(double overdispersion, double min_count, double sigma_min_sq)
    : overdispersion_(overdispersion),
      min_count_(min_count),
      sigma_min_sq_(sigma_min_sq) {}

double NoiseModel::variance(double rate) const {
    return overdispersion_ / (rate + min_count_) + sigma_min_sq_;
}

Eigen::VectorXd NoiseModel::variances(const Eigen::VectorXd& rates) const {
    return (overdispersion_ / (rates.array() + min_count_) + sigma_min_sq_).matrix();
}

Eigen::VectorXd resolveObservationVariance(
    const ObservationVarianceMode& mode,
    const Eigen::VectorXd& empirical_rates,
    double min_count) {

    return std::visit([&](const auto& m) -> Eigen::VectorXd {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ConstantVariance>) {
            return Eigen::VectorXd::Constant(empirical_rates.size(), m.value);
        } else {
            return NoiseModel(m.overdispersion, min_count, m.sigma_min_sq).variances(empirical_rates);
        }
    }, mode);
}

} // namespace citerate
