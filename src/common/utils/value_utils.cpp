// common/utils/value_utils.cpp
#include "common/utils/value_utils.h"
#include <cctype>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace actflow {

std::string trim(std::string_view s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return std::string(s.substr(begin, end - begin));
}

std::string strip_quotes(std::string_view s) {
    if (s.size() >= 2) {
        char first = s.front();
        char last = s.back();
        if ((first == '"' && last == '"') || (first == '\'' && last == '\'')) {
            return std::string(s.substr(1, s.size() - 2));
        }
    }
    return std::string(s);
}

std::string strip_surrounding_quotes(std::string_view s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && (s[begin] == '"' || s[begin] == '\'')) ++begin;
    while (end > begin && (s[end - 1] == '"' || s[end - 1] == '\'')) --end;
    return std::string(s.substr(begin, end - begin));
}

bool is_integer(const std::string& s) {
    if (s.empty()) return false;
    size_t start = (s[0] == '-' || s[0] == '+') ? 1 : 0;
    if (start >= s.size()) return false;
    for (size_t i = start; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

bool is_numeric(const std::string& s) {
    if (s.empty()) return false;
    // istream accepts leading whitespace, the language does not
    if (std::isspace(static_cast<unsigned char>(s.front()))) return false;

    std::istringstream iss(s);
    double d;
    iss >> d;
    return !iss.fail() && iss.eof() && std::isfinite(d);
}

std::optional<Value> parse_number(const std::string& s) {
    if (!is_numeric(s)) return std::nullopt;
    try {
        if (is_integer(s)) {
            return Value(std::stoll(s));
        }
        return Value(std::stod(s));
    } catch (const std::out_of_range&) {
        // fall through: too large for int64, keep as double
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
    try {
        return Value(std::stod(s));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string format_number(double d) {
    if (std::isfinite(d) && std::floor(d) == d &&
        std::fabs(d) < static_cast<double>(std::numeric_limits<int64_t>::max())) {
        return std::to_string(static_cast<int64_t>(d));
    }
    return Value(d).dump();
}

std::string scalar_to_string(const Value& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_null()) return "";
    if (v.is_number_float()) return format_number(v.get<double>());
    return v.dump();
}

} // namespace actflow
