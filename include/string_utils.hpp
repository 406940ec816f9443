#pragma once

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

/**
 * @file string_utils.hpp
 * @brief String helpers for configuration parsing, scheme lookup and export.
 *
 * Case folding and trimming for keys and scheme names, the bracketed
 * list syntax used by mode and time arrays, YAML comment stripping,
 * boolean spellings, and JSON string escaping for summary.json.
 */

namespace solarosc
{
namespace strutil
{

inline std::string lower_copy(std::string_view value)
{
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c)
    {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

inline std::string trim_copy(std::string_view value)
{
    const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
    std::size_t begin = 0;
    std::size_t end = value.size();
    while (begin < end && is_space(static_cast<unsigned char>(value[begin]))) ++begin;
    while (end > begin && is_space(static_cast<unsigned char>(value[end - 1]))) --end;
    return std::string(value.substr(begin, end - begin));
}

/**
 * @brief Drops a trailing '#' comment from one config line.
 *
 * A '#' inside single or double quotes is kept.
 */
inline std::string strip_comment(std::string_view line)
{
    char quote = '\0';
    for (std::size_t i = 0; i < line.size(); ++i)
    {
        const char c = line[i];
        if (quote != '\0')
        {
            if (c == quote) quote = '\0';
        }
        else if (c == '"' || c == '\'')
        {
            quote = c;
        }
        else if (c == '#')
        {
            return std::string(line.substr(0, i));
        }
    }
    return std::string(line);
}

/**
 * @brief Splits "[a, b, c]" or "a, b, c" into trimmed, non-empty items.
 *
 * Brackets and quote characters are discarded, so "['x', 'y']" gives {x, y}.
 */
inline std::vector<std::string> split_list(std::string_view value)
{
    std::vector<std::string> items;
    std::string current;
    const auto flush = [&]()
    {
        std::string item = trim_copy(current);
        if (!item.empty())
        {
            items.push_back(std::move(item));
        }
        current.clear();
    };

    for (const char c : value)
    {
        switch (c)
        {
            case '[': case ']': case '"': case '\'':
                break;
            case ',':
                flush();
                break;
            default:
                current.push_back(c);
                break;
        }
    }
    flush();
    return items;
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
 * @brief Escapes quotes, backslashes and every control character for JSON.
 */
inline std::string json_escape(std::string_view value)
{
    std::string out;
    out.reserve(value.size());
    for (const char c : value)
    {
        switch (c)
        {
            case '\\': out += "\\\\"; break;
            case '"': out += "\\\""; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20)
                {
                    char code[7];
                    std::snprintf(code, sizeof(code), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += code;
                }
                else
                {
                    out.push_back(c);
                }
                break;
        }
    }
    return out;
}

} // namespace strutil
} // namespace solarosc
