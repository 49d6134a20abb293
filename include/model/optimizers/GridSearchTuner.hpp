#ifndef GRID_SEARCH_TUNER_HPP
#define GRID_SEARCH_TUNER_HPP

#include "state_space/interfaces/IObjectiveFunction.hpp"
#include "model/AnalysisTypes.hpp"
#include <Eigen/Dense>
#include <map>
#include <string>

namespace citerate {

/**
 * @brief Exhaustive log-uniform grid search over (process variance, overdispersion).
 *
 * Strategy:
 * 1. Candidate sets q_i = exp(linspace(q_log_min, q_log_max, N)) and
 *    phi_j = exp(linspace(phi_log_min, phi_log_max, N)).
 * 2. Every cell of the N x N grid is scored independently (rows in order,
 *    OpenMP over the cells of a row); scores land in a matrix indexed by
 *    (i, j), so the result does not depend on thread scheduling.
 * 3. The best cell is chosen by a sequential row-major scan (q outer, phi
 *    inner) with strict improvement, so ties go to the first cell scanned.
 *
 * Cost is N^2 objective evaluations.
 */
class GridSearchTuner {
public:
    GridSearchTuner() = default;

    /**
     * @brief Configure the grid.
     * Keys:
     * - "n_grid": Points per axis (default: 40).
     * - "q_log_min", "q_log_max": log-bounds of process variance (default: -3, 1).
     * - "phi_log_min", "phi_log_max": log-bounds of overdispersion (default: -1, 2).
     * - "report_interval": Rows between progress messages (default: 10).
     * @throws InvalidParameterException on an out-of-range value.
     */
    void configure(const std::map<std::string, double>& settings);

    /**
     * @brief Score every grid cell with objective.calculate((q, phi)).
     *
     * A cell whose evaluation throws is scored -infinity and logged.
     */
    HyperparameterGridResult tune(const IObjectiveFunction& objective) const;

    /**
     * @brief n points exp(linspace(log_min, log_max, n)); n == 1 gives exp(log_min).
     */
    static Eigen::VectorXd logUniformGrid(double log_min, double log_max, int n);

    int getGridSize() const { return n_grid_; }

private:
    int n_grid_ = 40;
    double q_log_min_ = -3.0;
    double q_log_max_ = 1.0;
    double phi_log_min_ = -1.0;
    double phi_log_max_ = 2.0;
    int report_interval_ = 10;
};

} // namespace citerate

#endif // GRID_SEARCH_TUNER_HPP
