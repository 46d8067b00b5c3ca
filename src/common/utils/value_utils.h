#ifndef ACTFLOW_COMMON_UTILS_VALUE_UTILS_H
#define ACTFLOW_COMMON_UTILS_VALUE_UTILS_H

#include "actflow/core/types.h"
#include <optional>
#include <string>
#include <string_view>

namespace actflow {

std::string trim(std::string_view s);

// "abc" / 'abc' -> abc (one matching pair only)
std::string strip_quotes(std::string_view s);

// Removes any run of quote characters at both ends
std::string strip_surrounding_quotes(std::string_view s);

bool is_integer(const std::string& s);
bool is_numeric(const std::string& s);

// Integer literals become int64, everything else numeric becomes double
std::optional<Value> parse_number(const std::string& s);

// Renders a scalar the way it appears after "key = " (strings unquoted)
std::string scalar_to_string(const Value& v);

// Whole-valued doubles print without a fraction ("100" rather than "100.0")
std::string format_number(double d);

} // namespace actflow

#endif // ACTFLOW_COMMON_UTILS_VALUE_UTILS_H
