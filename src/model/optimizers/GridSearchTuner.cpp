#include "model/optimizers/GridSearchTuner.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include "utils/ParallelTasks.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <sstream>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace citerate {

    static const std::string LOG_SOURCE = "GRID_SEARCH";

    void GridSearchTuner::configure(const std::map<std::string, double>& settings) {
        Logger& logger = Logger::getInstance();

        for (const auto& [key, value] : settings) {
            if (!std::isfinite(value)) {
                THROW_INVALID_PARAM("GridSearchTuner::configure", "Setting '" + key + "' is not finite");
            }
            if (key == "n_grid") {
                if (value < 1.0) {
                    THROW_INVALID_PARAM("GridSearchTuner::configure", "n_grid must be at least 1");
                }
                n_grid_ = static_cast<int>(value);
            } else if (key == "q_log_min") {
                q_log_min_ = value;
            } else if (key == "q_log_max") {
                q_log_max_ = value;
            } else if (key == "phi_log_min") {
                phi_log_min_ = value;
            } else if (key == "phi_log_max") {
                phi_log_max_ = value;
            } else if (key == "report_interval") {
                report_interval_ = std::max(1, static_cast<int>(value));
            } else {
                logger.warning(LOG_SOURCE, "Ignoring unknown setting '" + key + "'");
            }
        }

        if (q_log_min_ > q_log_max_ || phi_log_min_ > phi_log_max_) {
            THROW_INVALID_PARAM("GridSearchTuner::configure", "Grid lower bound exceeds upper bound");
        }

        std::ostringstream summary;
        summary << "Configured grid search: N=" << n_grid_
                << ", q in exp[" << q_log_min_ << ", " << q_log_max_ << "]"
                << ", phi in exp[" << phi_log_min_ << ", " << phi_log_max_ << "]";
        logger.info(LOG_SOURCE, summary.str());
    }

    Eigen::VectorXd GridSearchTuner::logUniformGrid(double log_min, double log_max, int n) {
        if (n < 1) {
            THROW_INVALID_PARAM("GridSearchTuner::logUniformGrid", "Grid needs at least one point");
        }
        if (n == 1) {
            return Eigen::VectorXd::Constant(1, std::exp(log_min));
        }
        return Eigen::VectorXd::LinSpaced(n, log_min, log_max).array().exp().matrix();
    }

    HyperparameterGridResult GridSearchTuner::tune(const IObjectiveFunction& objective) const {
        Logger& logger = Logger::getInstance();

        HyperparameterGridResult result;
        result.process_var_candidates = logUniformGrid(q_log_min_, q_log_max_, n_grid_);
        result.overdispersion_candidates = logUniformGrid(phi_log_min_, phi_log_max_, n_grid_);
        result.log_likelihood.resize(n_grid_, n_grid_);

        const int num_cells = n_grid_ * n_grid_;
        logger.info(LOG_SOURCE, "Running grid search over " + std::to_string(n_grid_) + "x" +
                                std::to_string(n_grid_) + " = " + std::to_string(num_cells) +
                                " parameter combinations...");

        int available_threads = 1;
        #ifdef _OPENMP
        available_threads = omp_get_max_threads();
        if (available_threads < 1) available_threads = 1;
        #endif

        // Evaluate row by row so progress can be reported; cells of a row run in parallel.
        std::vector<std::optional<std::string>> cell_errors;
        cell_errors.reserve(num_cells);
        for (int i = 0; i < n_grid_; ++i) {
            const auto row_errors = runIndependentTasks(n_grid_, available_threads, [&](int j) {
                Eigen::VectorXd params(2);
                params << result.process_var_candidates(i), result.overdispersion_candidates(j);
                result.log_likelihood(i, j) = objective.calculate(params);
            });
            for (int j = 0; j < n_grid_; ++j) {
                if (row_errors[j]) {
                    result.log_likelihood(i, j) = -std::numeric_limits<double>::infinity();
                }
                cell_errors.push_back(row_errors[j]);
            }

            if ((i + 1) % report_interval_ == 0) {
                logger.info(LOG_SOURCE, "  Completed " + std::to_string(i + 1) + "/" +
                                        std::to_string(n_grid_) + " rows...");
            }
        }

        for (int k = 0; k < num_cells; ++k) {
            if (cell_errors[k]) {
                logger.error(LOG_SOURCE, "Grid cell (" + std::to_string(k / n_grid_) + ", " +
                                         std::to_string(k % n_grid_) + ") failed: " + *cell_errors[k]);
            }
        }

        // Winner selection: row-major, strict improvement keeps the first maximum.
        result.best_row = 0;
        result.best_col = 0;
        result.best_log_likelihood = result.log_likelihood(0, 0);
        for (Eigen::Index i = 0; i < n_grid_; ++i) {
            for (Eigen::Index j = 0; j < n_grid_; ++j) {
                if (result.log_likelihood(i, j) > result.best_log_likelihood) {
                    result.best_log_likelihood = result.log_likelihood(i, j);
                    result.best_row = i;
                    result.best_col = j;
                }
            }
        }
        result.best_process_var = result.process_var_candidates(result.best_row);
        result.best_overdispersion = result.overdispersion_candidates(result.best_col);

        std::ostringstream summary;
        summary << "Optimal hyperparameters: process_var=" << result.best_process_var
                << ", overdispersion=" << result.best_overdispersion
                << ", log-likelihood=" << result.best_log_likelihood;
        logger.info(LOG_SOURCE, summary.str());

        return result;
    }

} // namespace citerate
