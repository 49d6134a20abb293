#include "utils/ReadRunConfiguration.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <fstream>
#include <set>

namespace citerate {

namespace ptree = boost::property_tree;

namespace {

const std::string LOG_SOURCE = "RunConfiguration";

const std::set<std::string> KNOWN_KEYS = {
    "model.process_var", "model.obs_var", "model.obs_overdispersion", "model.min_count",
    "model.sigma_min_sq", "model.prior_var",
    "forecast.years", "forecast.sigma_min_sq", "forecast.seed",
    "tuning.n_grid", "tuning.q_log_min", "tuning.q_log_max", "tuning.phi_log_min",
    "tuning.phi_log_max", "tuning.min_series_length",
    "runtime.threads", "runtime.log_level", "runtime.log_file"
};

template <typename T>
void processSetting(const ptree::ptree& tree, const std::string& path, T& value) {
    if (auto setting = tree.get_optional<std::string>(path)) {
        if (!StringUtils::stringToType(*setting, value)) {
            THROW_DATA_FORMAT("readRunConfiguration",
                              "Invalid value '" + *setting + "' for " + path);
        }
    }
}

} // namespace

void readRunConfiguration(std::istream& input, const std::string& source_name, RunConfiguration& config) {
    ptree::ptree tree;
    try {
        ptree::ini_parser::read_ini(input, tree);
    } catch (const ptree::ptree_error& e) {
        THROW_DATA_FORMAT("readRunConfiguration",
                          "Error reading config " + source_name + ": " + e.what());
    }

    for (const auto& section : tree) {
        for (const auto& entry : section.second) {
            const std::string key = section.first + "." + entry.first;
            if (KNOWN_KEYS.count(key) == 0) {
                Logger::getInstance().warning(LOG_SOURCE, "Ignoring unknown setting " + key +
                                                          " in " + source_name);
            }
        }
    }

    processSetting(tree, "model.process_var", config.process_var);
    processSetting(tree, "model.obs_overdispersion", config.obs_overdispersion);
    processSetting(tree, "model.min_count", config.min_count);
    processSetting(tree, "model.sigma_min_sq", config.sigma_min_sq);
    processSetting(tree, "model.prior_var", config.prior_var);
    if (tree.get_optional<std::string>("model.obs_var")) {
        double obs_var = 0.0;
        processSetting(tree, "model.obs_var", obs_var);
        config.obs_var = obs_var;
    }

    processSetting(tree, "forecast.years", config.forecast_years);
    processSetting(tree, "forecast.sigma_min_sq", config.forecast_sigma_min_sq);
    if (tree.get_optional<std::string>("forecast.seed")) {
        std::uint64_t seed = 0;
        processSetting(tree, "forecast.seed", seed);
        config.seed = seed;
    }

    processSetting(tree, "tuning.n_grid", config.n_grid);
    processSetting(tree, "tuning.q_log_min", config.q_log_min);
    processSetting(tree, "tuning.q_log_max", config.q_log_max);
    processSetting(tree, "tuning.phi_log_min", config.phi_log_min);
    processSetting(tree, "tuning.phi_log_max", config.phi_log_max);
    processSetting(tree, "tuning.min_series_length", config.min_series_length_for_tuning);

    processSetting(tree, "runtime.threads", config.threads);
    if (auto level = tree.get_optional<std::string>("runtime.log_level")) {
        config.log_level = Logger::parseLevel(*level);
    }
    if (auto log_file = tree.get_optional<std::string>("runtime.log_file")) {
        config.log_file = *log_file;
    }

    Logger::getInstance().info(LOG_SOURCE, "Loaded settings from " + source_name);
}

void readRunConfiguration(const std::string& filepath, RunConfiguration& config) {
    std::ifstream input(filepath);
    if (!input.is_open()) {
        throw FileIOException("readRunConfiguration", "Cannot open config file " + filepath);
    }
    readRunConfiguration(input, filepath, config);
}

} // namespace citerate
