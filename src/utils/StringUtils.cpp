#include "utils/StringUtils.hpp"

#include <cctype>
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>

namespace citerate {

std::string StringUtils::trimWhitespace(const std::string& str) {
    size_t begin = 0;
    size_t end = str.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(str[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(str[end - 1]))) --end;
    return str.substr(begin, end - begin);
}

bool StringUtils::stringToType(const std::string& str, double& ret) {
    const std::string text = trimWhitespace(str);
    if (text.empty()) {
        return false;
    }

    char* end_ptr = nullptr;
    errno = 0;
    const double value = std::strtod(text.c_str(), &end_ptr);
    if (*end_ptr != '\0' || errno == ERANGE || !std::isfinite(value)) {
        return false;
    }
    ret = value;
    return true;
}

bool StringUtils::stringToType(const std::string& str, int& ret) {
    const std::string text = trimWhitespace(str);
    if (text.empty()) {
        return false;
    }

    char* end_ptr = nullptr;
    errno = 0;
    const long value = std::strtol(text.c_str(), &end_ptr, 10);
    if (*end_ptr != '\0' || errno == ERANGE || value < INT_MIN || value > INT_MAX) {
        return false;
    }
    ret = static_cast<int>(value);
    return true;
}

bool StringUtils::stringToType(const std::string& str, std::uint64_t& ret) {
    const std::string text = trimWhitespace(str);
    // strtoull negates a leading minus instead of failing.
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text[0]))) {
        return false;
    }

    char* end_ptr = nullptr;
    errno = 0;
    const unsigned long long value = std::strtoull(text.c_str(), &end_ptr, 10);
    if (*end_ptr != '\0' || errno == ERANGE) {
        return false;
    }
    ret = static_cast<std::uint64_t>(value);
    return true;
}

} // namespace citerate
