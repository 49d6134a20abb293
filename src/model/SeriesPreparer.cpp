#include "model/SeriesPreparer.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace citerate {

SeriesPreparer::SeriesPreparer(const CaptureTimestamp& captured_at, double min_count)
    : captured_at_(captured_at),
      min_count_(min_count),
      capture_year_(captured_at.year()),
      capture_exposure_(captured_at.exposureFraction()) {
    if (!std::isfinite(min_count_) || min_count_ <= 0.0) {
        THROW_INVALID_PARAM("SeriesPreparer::SeriesPreparer",
                            "min_count must be positive, got " + std::to_string(min_count_));
    }
}

PreparedSeries SeriesPreparer::prepare(const std::map<int, long>& citations_by_year) const {
    PreparedSeries series;
    const Eigen::Index T = static_cast<Eigen::Index>(citations_by_year.size());

    series.years.reserve(citations_by_year.size());
    series.counts.resize(T);
    series.exposure = Eigen::VectorXd::Ones(T);

    // std::map iterates in ascending year order.
    Eigen::Index t = 0;
    for (const auto& [year, count] : citations_by_year) {
        series.years.push_back(year);
        series.counts(t++) = static_cast<double>(count);
    }

    if (T > 0 && series.years.back() == capture_year_) {
        series.exposure(T - 1) = capture_exposure_;
    }

    series.empirical_rate = (series.counts.array() / series.exposure.array().max(MIN_EXPOSURE)).matrix();
    series.observations = (series.empirical_rate.array() + min_count_).log().matrix();
    return series;
}

bool SeriesPreparer::checkCitationTotal(const PaperRecord& paper, const PreparedSeries& series) const {
    if (!paper.total_citations) {
        return false;
    }

    const double total_from_years = series.counts.sum();
    const double expected_total = static_cast<double>(*paper.total_citations);
    if (std::abs(total_from_years - expected_total) <= 0.5) {
        return false;
    }

    std::ostringstream msg;
    msg << "'" << paper.title.substr(0, 50) << (paper.title.size() > 50 ? "...'" : "'")
        << " per-year sum=" << total_from_years
        << ", total_citations=" << *paper.total_citations;
    Logger::getInstance().warning("SeriesPreparer", msg.str());
    return true;
}

} // namespace citerate
