#pragma once

#include "export.hpp"

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

namespace docintel
{

inline bool is_ascii_space(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

inline std::string trim_copy(const std::string &s)
{
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && is_ascii_space(s[begin]))
        ++begin;
    while (end > begin && is_ascii_space(s[end - 1]))
        --end;
    return s.substr(begin, end - begin);
}

inline bool starts_with(const std::string &s, const std::string &prefix)
{
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

inline bool ends_with(const std::string &s, const std::string &suffix)
{
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Whole-string base-10 integer, surrounding whitespace allowed
inline std::optional<int64_t> parse_integer(const std::string &s)
{
    std::string t = trim_copy(s);
    if (t.empty())
        return std::nullopt;

    errno = 0;
    char *end = nullptr;
    long long value = std::strtoll(t.c_str(), &end, 10);
    if (errno != 0 || end != t.c_str() + t.size())
        return std::nullopt;
    return static_cast<int64_t>(value);
}

namespace utf8
{

// Length in bytes of the sequence introduced by lead byte `c`; invalid leads count as 1
inline size_t sequence_length(unsigned char c)
{
    if (c < 0x80)
        return 1;
    if ((c & 0xE0) == 0xC0)
        return 2;
    if ((c & 0xF0) == 0xE0)
        return 3;
    if ((c & 0xF8) == 0xF0)
        return 4;
    return 1;
}

/**
 * @brief Decodes the code point starting at byte `pos` and advances `pos`
 *
 * Malformed or truncated sequences decode to U+FFFD and consume one byte, so
 * every byte of the input belongs to exactly one code point.
 */
inline char32_t decode(const std::string &s, size_t &pos)
{
    const unsigned char lead = static_cast<unsigned char>(s[pos]);
    const size_t len = sequence_length(lead);
    if (len == 1 || pos + len > s.size())
    {
        ++pos;
        return lead < 0x80 ? static_cast<char32_t>(lead) : static_cast<char32_t>(0xFFFD);
    }

    char32_t cp = lead & (0xFF >> (len + 1));
    for (size_t i = 1; i < len; ++i)
    {
        const unsigned char cont = static_cast<unsigned char>(s[pos + i]);
        if ((cont & 0xC0) != 0x80)
        {
            ++pos;
            return 0xFFFD;
        }
        cp = (cp << 6) | (cont & 0x3F);
    }
    pos += len;
    return cp;
}

// Number of code points in `s`
inline size_t length(const std::string &s)
{
    size_t count = 0;
    size_t pos = 0;
    while (pos < s.size())
    {
        decode(s, pos);
        ++count;
    }
    return count;
}

} // namespace utf8

} // namespace docintel
