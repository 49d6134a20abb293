#ifndef TIMESTAMP_HPP
#define TIMESTAMP_HPP

#include <boost/date_time/posix_time/posix_time.hpp>
#include <string>

namespace citerate {

/**
 * @brief The instant at which a citation snapshot was captured.
 *
 * Stores the local wall-clock time together with its UTC offset, so that
 * "fraction of the current year observed" is evaluated in the capture's
 * own calendar.
 */
class CaptureTimestamp {
public:
    /**
     * @brief Parse an ISO-8601 timestamp.
     *
     * Accepts YYYY-MM-DD, optionally followed by [T| ]HH:MM[:SS[.fff...]]
     * and an offset of Z, +HH:MM, -HH:MM or +HHMM. A trailing Z is the
     * same as +00:00; no offset means UTC.
     *
     * @throws DataFormatException if the string cannot be parsed.
     */
    static CaptureTimestamp parse(const std::string& iso_string);

    CaptureTimestamp(const boost::posix_time::ptime& local_time, int utc_offset_minutes);

    int year() const;

    /**
     * @brief Elapsed fraction of the capture's calendar year, in (0, 1].
     *
     * A capture exactly at the start of the year would give 0; 1.0 is
     * returned instead.
     */
    double exposureFraction() const;

    /** @brief Normalized form, e.g. 2022-06-15T12:00:00+00:00. */
    std::string toIsoString() const;

    const boost::posix_time::ptime& localTime() const { return local_time_; }
    int utcOffsetMinutes() const { return utc_offset_minutes_; }
    boost::posix_time::ptime utcTime() const;

private:
    boost::posix_time::ptime local_time_;
    int utc_offset_minutes_;
};

} // namespace citerate

#endif // TIMESTAMP_HPP
