#ifndef READ_RUN_CONFIGURATION_HPP
#define READ_RUN_CONFIGURATION_HPP

#include "model/RunConfiguration.hpp"
#include <istream>
#include <string>

namespace citerate {

/**
 * @brief Overlay settings from an INI file onto an existing configuration.
 *
 * Recognised sections and keys:
 *
 *     [model]    process_var obs_var obs_overdispersion min_count sigma_min_sq prior_var
 *     [forecast] years sigma_min_sq seed
 *     [tuning]   n_grid q_log_min q_log_max phi_log_min phi_log_max min_series_length
 *     [runtime]  threads log_level log_file
 *
 * Keys that are absent keep their current value. Unknown keys are logged
 * and ignored.
 *
 * @throws FileIOException if the file cannot be opened.
 * @throws DataFormatException on INI syntax errors or values that do not
 *         convert completely, such as "4x" or a negative seed.
 */
void readRunConfiguration(const std::string& filepath, RunConfiguration& config);

/** @brief Stream overload used by readRunConfiguration(filepath, ...). */
void readRunConfiguration(std::istream& input, const std::string& source_name, RunConfiguration& config);

} // namespace citerate

#endif // READ_RUN_CONFIGURATION_HPP
