#pragma once

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <string_view>

/**
 * @file string_utils.hpp
 * @brief Lightweight string helpers shared by configuration and report code.
 *
 * Provides case normalization, trimming, boolean parsing and JSON escaping.
 */

namespace wbgt
{
namespace strutil
{

/**
 * @brief Returns a lowercase copy of the input string.
 */
inline std::string lower_copy(std::string_view value)
{
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c)
    {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

/**
 * @brief Returns a copy without leading and trailing whitespace.
 */
inline std::string trim_copy(std::string_view value)
{
    std::size_t begin = 0;
    std::size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin])))
    {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1])))
    {
        --end;
    }
    return std::string(value.substr(begin, end - begin));
}

/**
 * @brief Removes one pair of matching single or double quotes.
 */
inline std::string strip_wrapping_quotes(std::string value)
{
    if (value.size() >= 2)
    {
        const char first = value.front();
        const char last = value.back();
        if ((first == '"' && last == '"') || (first == '\'' && last == '\''))
        {
            return value.substr(1, value.size() - 2);
        }
    }
    return value;
}

/**
 * @brief Parses common truthy boolean spellings.
 * @return True for 1/true/yes/on (case-insensitive), false otherwise.
 */
inline bool parse_bool(std::string_view value)
{
    const std::string normalized = lower_copy(trim_copy(value));
    return normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on";
}

/**
 * @brief Reports whether the text is a recognised boolean spelling.
 */
inline bool is_bool_literal(std::string_view value)
{
    const std::string n = lower_copy(trim_copy(value));
    return n == "1" || n == "true" || n == "yes" || n == "on" ||
           n == "0" || n == "false" || n == "no" || n == "off";
}

/**
 * @brief Escapes control characters for safe JSON string emission.
 */
inline std::string json_escape(std::string_view value)
{
    std::ostringstream oss;
    for (char c : value)
    {
        switch (c)
        {
            case '\\': oss << "\\\\"; break;
            case '"': oss << "\\\""; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default: oss << c; break;
        }
    }
    return oss.str();
}

} // namespace strutil
} // namespace wbgt
