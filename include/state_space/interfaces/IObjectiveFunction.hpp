#ifndef I_OBJECTIVE_FUNCTION_HPP
#define I_OBJECTIVE_FUNCTION_HPP

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace citerate {

/**
 * @brief Interface for objective functions maximised by the hyperparameter search.
 *
 * Implementations must be safe to call concurrently from several threads:
 * calculate() is const and may not mutate shared state.
 */
class IObjectiveFunction {
public:
    virtual ~IObjectiveFunction() = default;

    /**
     * @brief Evaluate the objective (higher is better).
     * @param parameters Parameter vector, ordered as getParameterNames().
     */
    virtual double calculate(const Eigen::VectorXd& parameters) const = 0;

    virtual const std::vector<std::string>& getParameterNames() const = 0;
};

} // namespace citerate

#endif // I_OBJECTIVE_FUNCTION_HPP
