#ifndef I_ANALYSIS_WRITER_HPP
#define I_ANALYSIS_WRITER_HPP

#include "model/AnalysisTypes.hpp"
#include <cstddef>
#include <string>

namespace citerate {

/**
 * @brief Interface for asynchronous result output
 *
 * All save operations are asynchronous and return immediately.
 * Use waitForCompletion() to block until all pending I/O is finished.
 */
class IAnalysisWriter {
public:
    virtual ~IAnalysisWriter() = default;

    /**
     * @brief Save the smoothed (and forecast) rates of a snapshot as JSON (async)
     * @param filepath Output file path; missing directories are created
     * @param report Analysis results
     */
    virtual void saveAnalysis(const std::string& filepath, const AnalysisReport& report) = 0;

    /**
     * @brief Save the result of a hyperparameter search as JSON (async)
     * @param filepath Output file path; missing directories are created
     * @param report Tuning results
     */
    virtual void saveTuningReport(const std::string& filepath, const TuningReport& report) = 0;

    /**
     * @brief Block until every queued write has finished
     * @throws FileIOException carrying the first write failure, if any
     */
    virtual void waitForCompletion() = 0;

    virtual size_t getPendingTaskCount() const = 0;
};

} // namespace citerate

#endif // I_ANALYSIS_WRITER_HPP
