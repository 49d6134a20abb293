#include "model/AnalysisWriter.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/FileUtils.hpp"
#include "utils/Logger.hpp"

#include <boost/json.hpp>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <variant>
#include <vector>

namespace citerate {

namespace json = boost::json;

namespace {

// Non-finite values have no JSON spelling and are written as null.
json::value finiteOrNull(double value) {
    if (!std::isfinite(value)) {
        return nullptr;
    }
    return value;
}

json::array doubleArray(const Eigen::VectorXd& values) {
    json::array array;
    array.reserve(static_cast<size_t>(values.size()));
    for (Eigen::Index i = 0; i < values.size(); ++i) {
        array.push_back(finiteOrNull(values(i)));
    }
    return array;
}

json::array countArray(const Eigen::VectorXd& values) {
    json::array array;
    array.reserve(static_cast<size_t>(values.size()));
    for (Eigen::Index i = 0; i < values.size(); ++i) {
        array.push_back(static_cast<std::int64_t>(std::llround(values(i))));
    }
    return array;
}

json::array yearArray(const std::vector<int>& years) {
    json::array array;
    array.reserve(years.size());
    for (int year : years) {
        array.push_back(year);
    }
    return array;
}

bool isScalarArray(const json::array& array) {
    for (const auto& item : array) {
        if (item.is_structured()) {
            return false;
        }
    }
    return true;
}

/**
 * Two-space indented rendering of a document. Arrays of scalars stay on one
 * line; scalars and keys are spelled by json::serialize.
 */
void prettyPrint(std::ostream& out, const json::value& value, std::string& indent) {
    switch (value.kind()) {
    case json::kind::object: {
        const json::object& object = value.get_object();
        if (object.empty()) {
            out << "{}";
            return;
        }
        out << "{\n";
        indent.append(2, ' ');
        bool first = true;
        for (const auto& member : object) {
            if (!first) out << ",\n";
            first = false;
            out << indent << json::serialize(json::value(member.key())) << ": ";
            prettyPrint(out, member.value(), indent);
        }
        indent.resize(indent.size() - 2);
        out << '\n' << indent << '}';
        return;
    }
    case json::kind::array: {
        const json::array& array = value.get_array();
        if (isScalarArray(array)) {
            out << '[';
            for (size_t i = 0; i < array.size(); ++i) {
                if (i > 0) out << ", ";
                out << json::serialize(array[i]);
            }
            out << ']';
            return;
        }
        out << "[\n";
        indent.append(2, ' ');
        for (size_t i = 0; i < array.size(); ++i) {
            if (i > 0) out << ",\n";
            out << indent;
            prettyPrint(out, array[i], indent);
        }
        indent.resize(indent.size() - 2);
        out << '\n' << indent << ']';
        return;
    }
    default:
        out << json::serialize(value);
        return;
    }
}

std::string toText(const json::value& document) {
    std::ostringstream out;
    std::string indent;
    prettyPrint(out, document, indent);
    out << '\n';
    return out.str();
}

json::object modelBlock(const ModelMetadata& model) {
    json::object block;
    block["type"] = model.type;
    block["process_var"] = finiteOrNull(model.process_var);
    block["min_count"] = finiteOrNull(model.min_count);
    if (const auto* constant = std::get_if<ConstantVariance>(&model.obs_variance)) {
        block["obs_var"] = finiteOrNull(constant->value);
    } else {
        const auto& varying = std::get<TimeVaryingVariance>(model.obs_variance);
        block["obs_overdispersion"] = finiteOrNull(varying.overdispersion);
        block["sigma_min_sq"] = finiteOrNull(varying.sigma_min_sq);
    }
    return block;
}

json::object paperObject(const PaperAnalysis& paper) {
    json::object obj;
    obj["title"] = paper.title;
    obj["years"] = yearArray(paper.years);
    obj["observed_citations"] = countArray(paper.observed_citations);
    obj["exposure_fraction"] = doubleArray(paper.exposure_fraction);
    obj["empirical_rate"] = doubleArray(paper.empirical_rate);
    obj["smoothed_rate"] = doubleArray(paper.smoothed_rate);
    obj["smoothed_log_rate"] = doubleArray(paper.smoothed_log_rate);
    obj["smoothed_rate_std"] = doubleArray(paper.smoothed_rate_std);

    if (paper.forecast) {
        const ForecastOutput& f = paper.forecast->output;
        obj["forecast_years"] = yearArray(paper.forecast->years);
        obj["forecast_log_rate_var"] = doubleArray(f.log_rate_var);
        obj["forecast_rate_median"] = doubleArray(f.rate_median);
        obj["forecast_rate_std"] = doubleArray(f.rate_std);
        obj["forecast_sampled_log_rate"] = doubleArray(f.sampled_log_rate);
        obj["forecast_sampled_rate"] = doubleArray(f.sampled_rate);
    }
    if (paper.error) {
        obj["error"] = *paper.error;
    }
    return obj;
}

} // namespace

AnalysisWriter::AnalysisWriter() {
    worker_thread_ = std::thread(&AnalysisWriter::workerLoop, this);
    Logger::getInstance().debug("AnalysisWriter", "Async writer initialized with worker thread");
}

AnalysisWriter::~AnalysisWriter() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_flag_ = true;
    }
    queue_cv_.notify_all();

    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
}

void AnalysisWriter::workerLoop() {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] {
                return stop_flag_ || !task_queue_.empty();
            });

            if (stop_flag_ && task_queue_.empty()) {
                break;
            }

            task = std::move(task_queue_.front());
            task_queue_.pop();
            task_running_ = true;
        }

        // Execute outside the lock; the first failure is kept for waitForCompletion().
        std::exception_ptr error;
        try {
            task();
        } catch (const std::exception& e) {
            Logger::getInstance().error("AnalysisWriter", std::string("Error in async task: ") + e.what());
            error = std::current_exception();
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            task_running_ = false;
            if (error && !first_error_) {
                first_error_ = error;
            }
        }
        queue_cv_.notify_all();
    }
}

void AnalysisWriter::enqueueTask(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        task_queue_.push(std::move(task));
    }
    queue_cv_.notify_all();
}

void AnalysisWriter::waitForCompletion() {
    std::exception_ptr error;
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        queue_cv_.wait(lock, [this] {
            return task_queue_.empty() && !task_running_;
        });
        error = first_error_;
        first_error_ = nullptr;
    }

    if (error) {
        try {
            std::rethrow_exception(error);
        } catch (const FileIOException&) {
            throw;
        } catch (const std::exception& e) {
            throw FileIOException("AnalysisWriter::waitForCompletion", e.what());
        }
    }
    Logger::getInstance().debug("AnalysisWriter", "All async I/O tasks completed");
}

size_t AnalysisWriter::getPendingTaskCount() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return task_queue_.size() + (task_running_ ? 1 : 0);
}

void AnalysisWriter::saveAnalysis(const std::string& filepath, const AnalysisReport& report) {
    // Deep copy for thread safety
    enqueueTask([this, filepath, report]() {
        writeTextFile(filepath, formatAnalysis(report));
    });
}

void AnalysisWriter::saveTuningReport(const std::string& filepath, const TuningReport& report) {
    enqueueTask([this, filepath, report]() {
        writeTextFile(filepath, formatTuningReport(report));
    });
}

void AnalysisWriter::writeTextFile(const std::string& filepath, const std::string& contents) {
    FileUtils::ensureParentDirectoryExists(filepath);

    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw FileIOException("AnalysisWriter::writeTextFile", "Failed to open file: " + filepath);
    }
    file << contents;
    file.close();
    if (file.fail()) {
        throw FileIOException("AnalysisWriter::writeTextFile", "Failed to write file: " + filepath);
    }
    Logger::getInstance().info("AnalysisWriter", "Wrote " + filepath);
}

std::string AnalysisWriter::formatAnalysis(const AnalysisReport& report) {
    json::object root;
    if (report.user_id) {
        root["user_id"] = *report.user_id;
    } else {
        root["user_id"] = nullptr;
    }
    root["scraped_at"] = report.scraped_at;
    root["model"] = modelBlock(report.model);

    if (report.forecast_assumptions) {
        const ForecastAssumptions& a = *report.forecast_assumptions;
        json::object assumptions;
        assumptions["model"] = a.model;
        assumptions["process_var"] = finiteOrNull(a.process_var);
        assumptions["overdispersion"] = finiteOrNull(a.overdispersion);
        assumptions["min_count"] = finiteOrNull(a.min_count);
        assumptions["sigma_min_sq"] = finiteOrNull(a.sigma_min_sq);
        if (a.seed) {
            // Seeds above 2^53 are not exact as JSON numbers in most readers.
            assumptions["seed"] = std::to_string(*a.seed);
        }
        root["forecast_assumptions"] = std::move(assumptions);
    }

    json::array papers;
    papers.reserve(report.papers.size());
    for (const auto& paper : report.papers) {
        papers.push_back(paperObject(paper));
    }
    root["papers"] = std::move(papers);

    return toText(root);
}

std::string AnalysisWriter::formatTuningReport(const TuningReport& report) {
    json::object root;
    root["input_file"] = report.input_file;
    root["n_papers"] = static_cast<std::uint64_t>(report.n_papers);
    root["n_papers_with_" + std::to_string(report.min_series_length) + "plus_years"] =
        static_cast<std::uint64_t>(report.n_papers_with_min_length);
    root["min_count"] = finiteOrNull(report.min_count);
    root["n_grid"] = report.n_grid;

    json::object optimal;
    optimal["process_var"] = finiteOrNull(report.grid.best_process_var);
    optimal["overdispersion"] = finiteOrNull(report.grid.best_overdispersion);
    optimal["log_likelihood"] = finiteOrNull(report.grid.best_log_likelihood);
    root["optimal"] = std::move(optimal);

    if (!report.failed_series.empty()) {
        json::array failed;
        for (const auto& title : report.failed_series) {
            failed.push_back(json::value(title));
        }
        root["failed_series"] = std::move(failed);
    }

    return toText(root);
}

} // namespace citerate
