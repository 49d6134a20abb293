#ifndef SERIES_PREPARER_HPP
#define SERIES_PREPARER_HPP

#include "model/AnalysisTypes.hpp"
#include "utils/Timestamp.hpp"
#include <map>

namespace citerate {

/**
 * @brief Turns a raw year -> count mapping into filter-ready arrays.
 *
 * The last year is only partially observed when it is the capture year;
 * its count is annualized by the elapsed fraction of that year.
 */
class SeriesPreparer {
public:
    /** @brief Lower bound on exposure used when annualizing counts. */
    static constexpr double MIN_EXPOSURE = 1e-6;

    /**
     * @param captured_at Capture instant shared by every series of a run.
     * @param min_count Pseudocount added before the log transform (> 0).
     * @throws InvalidParameterException if min_count is not positive.
     */
    SeriesPreparer(const CaptureTimestamp& captured_at, double min_count);

    /**
     * @brief Build the year grid, exposures, empirical rates and observations.
     *
     * An empty mapping yields an empty series.
     */
    PreparedSeries prepare(const std::map<int, long>& citations_by_year) const;

    /**
     * @brief Compare the per-year breakdown with the paper's reported total.
     *
     * @return true if a total was reported and differs from the sum of the
     *         per-year counts by more than 0.5. A warning is logged; the
     *         per-year breakdown stays authoritative.
     */
    bool checkCitationTotal(const PaperRecord& paper, const PreparedSeries& series) const;

    double getMinCount() const { return min_count_; }
    const CaptureTimestamp& getCapturedAt() const { return captured_at_; }

private:
    CaptureTimestamp captured_at_;
    double min_count_;
    int capture_year_;
    double capture_exposure_;
};

} // namespace citerate

#endif // SERIES_PREPARER_HPP
