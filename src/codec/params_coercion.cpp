// src/codec/params_coercion.cpp
#include "actflow/codec/params_coercion.h"
#include "common/utils/value_utils.h"
#include <iostream>

namespace actflow {

namespace {

std::string unescape_json_quotes(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\\' && i + 1 < s.size() && (s[i + 1] == '"' || s[i + 1] == '\\')) {
            out.push_back(s[i + 1]);
            ++i;
        } else {
            out.push_back(s[i]);
        }
    }
    return out;
}

} // namespace

std::optional<Value> coerce_json_object(const std::string& text) {
    std::string candidate = trim(text);
    if (candidate.empty() || candidate.front() != '{') return std::nullopt;

    Value parsed = Value::parse(candidate, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded() || !parsed.is_object()) return std::nullopt;
    return parsed;
}

std::optional<Value> coerce_escaped_json(const std::string& text) {
    std::string candidate = trim(text);
    bool quoted = candidate.size() >= 2 && candidate.front() == '"' && candidate.back() == '"';
    if (!quoted && candidate.find("\\\"") == std::string::npos) return std::nullopt;

    if (quoted) {
        candidate = candidate.substr(1, candidate.size() - 2);
    }
    candidate = trim(unescape_json_quotes(candidate));
    if (candidate.empty() || candidate.front() != '{') return std::nullopt;

    Value parsed = Value::parse(candidate, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) return std::nullopt;
    return parsed;
}

std::optional<Value> coerce_key_value_pairs(const std::string& text) {
    if (text.find(':') == std::string::npos || text.find('{') != std::string::npos) {
        return std::nullopt;
    }

    Value result = Value::object();
    size_t start = 0;
    while (start <= text.size()) {
        size_t comma = text.find(',', start);
        std::string token = text.substr(start, comma == std::string::npos ? std::string::npos : comma - start);

        size_t colon = token.find(':');
        if (colon != std::string::npos) {
            std::string key = strip_surrounding_quotes(trim(token.substr(0, colon)));
            std::string val = strip_surrounding_quotes(trim(token.substr(colon + 1)));
            if (!key.empty() && !val.empty()) {
                result[key] = val;
            }
        }

        if (comma == std::string::npos) break;
        start = comma + 1;
    }

    if (result.empty()) return std::nullopt;
    return result;
}

const std::vector<NamedStrategy>& params_coercion_strategies() {
    static const std::vector<NamedStrategy> strategies = {
        {"json_object", coerce_json_object},
        {"escaped_json", coerce_escaped_json},
        {"key_value_pairs", coerce_key_value_pairs},
    };
    return strategies;
}

std::optional<std::string> matching_strategy(const std::string& text) {
    for (const auto& strategy : params_coercion_strategies()) {
        if (strategy.apply(text).has_value()) {
            return strategy.name;
        }
    }
    return std::nullopt;
}

Value coerce_to_mapping(const Value& value) {
    if (value.is_object()) return value;

    if (value.is_string()) {
        const auto& text = value.get_ref<const std::string&>();
        for (const auto& strategy : params_coercion_strategies()) {
            if (auto mapped = strategy.apply(text)) {
                return *mapped;
            }
        }
        if (!trim(text).empty()) {
            std::cerr << "[WARNING] Could not convert params to an object, using {}: " << text << std::endl;
        }
    }
    return Value::object();
}

} // namespace actflow
