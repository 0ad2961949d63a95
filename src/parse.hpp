#pragma once

#include "plane.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

// Parse the whole of s as a T. Leading whitespace, trailing characters,
// overflow, hexadecimal notation and (for unsigned T) a minus sign are all
// failures. Floating-point underflow is not: "1e-310" parses as a subnormal.
template<typename T>
std::optional<T> parse_number(std::string_view s)
{
    static_assert(std::is_arithmetic_v<T>, "parse_number needs an arithmetic type");

    if (s.empty() || std::isspace(static_cast<unsigned char>(s.front())))
        return std::nullopt;

    const std::string text(s);
    const char* begin = text.c_str();
    char*       end   = nullptr;
    errno = 0;

    if constexpr (std::is_floating_point_v<T>) {
        const size_t sign = (text.front() == '-' || text.front() == '+') ? 1 : 0;
        if (text.size() > sign + 1 && text[sign] == '0'
            && (text[sign + 1] == 'x' || text[sign + 1] == 'X'))
            return std::nullopt;

        const double v = std::strtod(begin, &end);
        if (end != begin + text.size())
            return std::nullopt;
        // ERANGE with a finite result is underflow, which is kept.
        if (errno == ERANGE && std::isinf(v))
            return std::nullopt;
        if (std::isfinite(v) && std::fabs(v) > std::numeric_limits<T>::max())
            return std::nullopt;
        return static_cast<T>(v);
    } else if constexpr (std::is_unsigned_v<T>) {
        if (text.front() == '-')
            return std::nullopt;
        const unsigned long long v = std::strtoull(begin, &end, 10);
        if (end != begin + text.size() || errno == ERANGE
            || v > static_cast<unsigned long long>(std::numeric_limits<T>::max()))
            return std::nullopt;
        return static_cast<T>(v);
    } else {
        const long long v = std::strtoll(begin, &end, 10);
        if (end != begin + text.size() || errno == ERANGE
            || v < static_cast<long long>(std::numeric_limits<T>::min())
            || v > static_cast<long long>(std::numeric_limits<T>::max()))
            return std::nullopt;
        return static_cast<T>(v);
    }
}

// Parse "<a><separator><b>", e.g. "400x600" or "1.0,0.5". Splits at the
// first separator; both halves must parse.
template<typename T>
std::optional<std::pair<T, T>> parse_pair(std::string_view s, char separator)
{
    const size_t index = s.find(separator);
    if (index == std::string_view::npos)
        return std::nullopt;

    const std::optional<T> l = parse_number<T>(s.substr(0, index));
    const std::optional<T> r = parse_number<T>(s.substr(index + 1));
    if (!l || !r)
        return std::nullopt;
    return std::make_pair(*l, *r);
}

// Parse "RE,IM".
inline std::optional<Complex> parse_complex(std::string_view s)
{
    const auto pair = parse_pair<double>(s, ',');
    if (!pair)
        return std::nullopt;
    return Complex{pair->first, pair->second};
}
