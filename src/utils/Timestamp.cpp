#include "utils/Timestamp.hpp"
#include "exceptions/Exceptions.hpp"

#include <boost/date_time/gregorian/gregorian.hpp>
#include <cstdlib>
#include <iomanip>
#include <regex>
#include <sstream>

namespace citerate {

namespace pt = boost::posix_time;
namespace gr = boost::gregorian;

namespace {

// date [sep time [.fraction] [offset]]
const std::regex ISO_PATTERN(
    R"(^(\d{4})-(\d{2})-(\d{2}))"
    R"((?:[T ](\d{2}):(\d{2})(?::(\d{2})(?:\.(\d{1,9}))?)?)"
    R"((Z|z|[+-]\d{2}(?::?\d{2})?)?)?$)");

int toInt(const std::string& digits) {
    return std::atoi(digits.c_str());
}

} // namespace

CaptureTimestamp::CaptureTimestamp(const pt::ptime& local_time, int utc_offset_minutes)
    : local_time_(local_time),
      utc_offset_minutes_(utc_offset_minutes) {}

CaptureTimestamp CaptureTimestamp::parse(const std::string& iso_string) {
    std::smatch m;
    if (!std::regex_match(iso_string, m, ISO_PATTERN)) {
        THROW_DATA_FORMAT("CaptureTimestamp::parse", "Unparsable timestamp '" + iso_string + "'");
    }

    const int hour = m[4].matched ? toInt(m[4]) : 0;
    const int minute = m[5].matched ? toInt(m[5]) : 0;
    const int second = m[6].matched ? toInt(m[6]) : 0;
    if (hour > 23 || minute > 59 || second > 59) {
        THROW_DATA_FORMAT("CaptureTimestamp::parse", "Time of day out of range in '" + iso_string + "'");
    }

    long microseconds = 0;
    if (m[7].matched) {
        std::string fraction = m[7].str();
        fraction.resize(6, '0');
        microseconds = std::atol(fraction.c_str());
    }

    int offset_minutes = 0;
    if (m[8].matched) {
        const std::string offset = m[8].str();
        if (offset != "Z" && offset != "z") {
            const int sign = (offset[0] == '-') ? -1 : 1;
            std::string digits;
            for (char c : offset.substr(1)) {
                if (c != ':') digits.push_back(c);
            }
            const int off_hours = toInt(digits.substr(0, 2));
            const int off_minutes = digits.size() > 2 ? toInt(digits.substr(2, 2)) : 0;
            if (off_hours > 23 || off_minutes > 59) {
                THROW_DATA_FORMAT("CaptureTimestamp::parse", "UTC offset out of range in '" + iso_string + "'");
            }
            offset_minutes = sign * (off_hours * 60 + off_minutes);
        }
    }

    try {
        const gr::date day(toInt(m[1]), toInt(m[2]), toInt(m[3]));
        const pt::ptime local = pt::ptime(day, pt::hours(hour) + pt::minutes(minute) +
                                               pt::seconds(second) + pt::microseconds(microseconds));
        return CaptureTimestamp(local, offset_minutes);
    } catch (const std::out_of_range& e) {
        // gregorian::date reports invalid year/month/day via out_of_range subclasses
        THROW_DATA_FORMAT("CaptureTimestamp::parse",
                          "Invalid calendar date in '" + iso_string + "': " + e.what());
    }
}

int CaptureTimestamp::year() const {
    return static_cast<int>(local_time_.date().year());
}

double CaptureTimestamp::exposureFraction() const {
    const int y = year();
    const pt::ptime year_start(gr::date(y, 1, 1));
    const pt::ptime next_year_start(gr::date(y + 1, 1, 1));

    const double total = static_cast<double>((next_year_start - year_start).total_microseconds());
    const double elapsed = static_cast<double>((local_time_ - year_start).total_microseconds());
    const double fraction = elapsed / total;

    if (!(fraction > 0.0 && fraction <= 1.0)) {
        return 1.0;
    }
    return fraction;
}

pt::ptime CaptureTimestamp::utcTime() const {
    return local_time_ - pt::minutes(utc_offset_minutes_);
}

std::string CaptureTimestamp::toIsoString() const {
    std::ostringstream oss;
    oss << pt::to_iso_extended_string(local_time_);

    const int abs_offset = std::abs(utc_offset_minutes_);
    oss << (utc_offset_minutes_ < 0 ? '-' : '+')
        << std::setw(2) << std::setfill('0') << abs_offset / 60 << ':'
        << std::setw(2) << std::setfill('0') << abs_offset % 60;
    return oss.str();
}

} // namespace citerate
