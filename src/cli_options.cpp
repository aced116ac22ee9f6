#include "cli_options.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>

bool parse_long(const std::string& text, long long min, long long max, long long& out) {
    if (text.empty() || std::isspace(static_cast<unsigned char>(text[0]))) return false;

    const char* begin = text.c_str();
    char* end = nullptr;
    errno = 0;
    long long value = std::strtoll(begin, &end, 10);
    if (end == begin || *end != '\0' || errno == ERANGE) return false;
    if (value < min || value > max) return false;

    out = value;
    return true;
}

bool parse_real(const std::string& text, double min, double max, double& out) {
    if (text.empty() || std::isspace(static_cast<unsigned char>(text[0]))) return false;

    const char* begin = text.c_str();
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(begin, &end);
    if (end == begin || *end != '\0' || errno == ERANGE) return false;
    if (!std::isfinite(value) || value < min || value > max) return false;

    out = value;
    return true;
}
