#ifndef STRING_UTILS_HPP
#define STRING_UTILS_HPP

#include <cstdint>
#include <string>

namespace citerate {

/**
 * @brief Strict text to number conversion for settings and flags.
 *
 * The whole string must be consumed, apart from surrounding whitespace.
 * Out-of-range values fail. Unsigned targets reject a leading minus sign
 * instead of wrapping. Each overload returns false and leaves ret untouched
 * on failure.
 */
class StringUtils {
public:
    static bool stringToType(const std::string& str, double& ret);
    static bool stringToType(const std::string& str, int& ret);
    static bool stringToType(const std::string& str, std::uint64_t& ret);

    static std::string trimWhitespace(const std::string& str);
};

} // namespace citerate

#endif // STRING_UTILS_HPP
