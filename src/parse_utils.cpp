#include "parse_utils.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace {

bool all_digits(const std::string& s) {
    return !s.empty() &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

} // namespace

std::size_t parse_size_t(const std::string& value, std::size_t min, std::size_t max, bool& ok) {
    ok = false;
    if (!all_digits(value))
        return 0;
    unsigned long long v = 0;
    try {
        v = std::stoull(value);
    } catch (const std::out_of_range&) {
        return 0;
    }
    if (v < min || v > max)
        return 0;
    ok = true;
    return static_cast<std::size_t>(v);
}

std::size_t parse_size_t(const ArgParser& parser, const std::string& flag, std::size_t min,
                         std::size_t max, bool& ok) {
    if (!parser.has_flag(flag)) {
        ok = false;
        return 0;
    }
    return parse_size_t(parser.get_option(flag), min, max, ok);
}

std::chrono::seconds parse_duration(const std::string& value, bool& ok) {
    ok = false;
    if (value.empty())
        return std::chrono::seconds(0);
    std::string num = value;
    char unit = 's';
    if (!std::isdigit(static_cast<unsigned char>(num.back()))) {
        unit = num.back();
        num.pop_back();
        if (unit != 's' && unit != 'm' && unit != 'h')
            return std::chrono::seconds(0);
    }
    if (!all_digits(num))
        return std::chrono::seconds(0);
    long long n = 0;
    try {
        n = std::stoll(num);
    } catch (const std::out_of_range&) {
        return std::chrono::seconds(0);
    }
    ok = true;
    switch (unit) {
    case 'm':
        return std::chrono::minutes(n);
    case 'h':
        return std::chrono::hours(n);
    default:
        return std::chrono::seconds(n);
    }
}

std::chrono::seconds parse_duration(const ArgParser& parser, const std::string& flag, bool& ok) {
    if (!parser.has_flag(flag)) {
        ok = false;
        return std::chrono::seconds(0);
    }
    return parse_duration(parser.get_option(flag), ok);
}

bool parse_bool(const std::string& value, bool& ok) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    ok = true;
    if (v.empty() || v == "1" || v == "true" || v == "yes" || v == "on")
        return true;
    if (v == "0" || v == "false" || v == "no" || v == "off")
        return false;
    ok = false;
    return false;
}
