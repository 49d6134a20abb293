#ifndef ANALYSIS_WRITER_HPP
#define ANALYSIS_WRITER_HPP

#include "model/interfaces/IAnalysisWriter.hpp"
#include <atomic>
#include <condition_variable>
#include <exception>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>

namespace citerate {

/**
 * @brief Asynchronous JSON writer
 *
 * A worker thread performs the file I/O. Reports are deep-copied when
 * queued, so callers may discard them immediately.
 */
class AnalysisWriter : public IAnalysisWriter {
public:
    /**
     * @brief Construct and start the worker thread
     */
    AnalysisWriter();

    /**
     * @brief Destructor - drains the queue and joins the worker thread
     */
    ~AnalysisWriter();

    AnalysisWriter(const AnalysisWriter&) = delete;
    AnalysisWriter& operator=(const AnalysisWriter&) = delete;
    AnalysisWriter(AnalysisWriter&&) = delete;
    AnalysisWriter& operator=(AnalysisWriter&&) = delete;

    void saveAnalysis(const std::string& filepath, const AnalysisReport& report) override;

    void saveTuningReport(const std::string& filepath, const TuningReport& report) override;

    void waitForCompletion() override;

    size_t getPendingTaskCount() const override;

    /** @brief JSON text of an analysis report (two-space indentation). */
    static std::string formatAnalysis(const AnalysisReport& report);

    /** @brief JSON text of a tuning report (two-space indentation). */
    static std::string formatTuningReport(const TuningReport& report);

private:
    std::thread worker_thread_;
    std::queue<std::function<void()>> task_queue_;

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;

    std::atomic<bool> stop_flag_{false};
    bool task_running_ = false;
    std::exception_ptr first_error_;

    void workerLoop();
    void enqueueTask(std::function<void()> task);

    void writeTextFile(const std::string& filepath, const std::string& contents);
};

} // namespace citerate

#endif // ANALYSIS_WRITER_HPP
