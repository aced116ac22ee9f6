#pragma once

#include <string>

/// Parse a whole decimal integer within [min, max].
/// Rejects signs the range does not allow, trailing text and overflow.
bool parse_long(const std::string& text, long long min, long long max, long long& out);

/// Parse a decimal number within [min, max]
bool parse_real(const std::string& text, double min, double max, double& out);

/// parse_long into a narrower type; [min, max] must fit in T
template <typename T>
bool parse_integer(const std::string& text, long long min, long long max, T& out) {
    long long value;
    if (!parse_long(text, min, max, value)) return false;
    out = static_cast<T>(value);
    return true;
}

template <typename T>
bool parse_decimal(const std::string& text, double min, double max, T& out) {
    double value;
    if (!parse_real(text, min, max, value)) return false;
    out = static_cast<T>(value);
    return true;
}
