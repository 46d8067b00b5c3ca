// actflow/codec/params_coercion.h
#ifndef ACTFLOW_CODEC_PARAMS_COERCION_H
#define ACTFLOW_CODEC_PARAMS_COERCION_H

#include "actflow/core/types.h"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace actflow {

// A strategy either produces a mapping from the raw text or declines
using CoercionStrategy = std::function<std::optional<Value>(const std::string&)>;

struct NamedStrategy {
    std::string name;
    CoercionStrategy apply;
};

// {"a": 1}
std::optional<Value> coerce_json_object(const std::string& text);

// "{\"a\": 1}" -> {"a": 1}  (doubly-quoted / escaped JSON)
std::optional<Value> coerce_escaped_json(const std::string& text);

// a:1, b:two -> {"a": "1", "b": "two"}
std::optional<Value> coerce_key_value_pairs(const std::string& text);

// Strategies tried in order on string input; the empty mapping is the implicit last step
const std::vector<NamedStrategy>& params_coercion_strategies();

// Name of the strategy that accepts the text, or nullopt if only the fallback applies
std::optional<std::string> matching_strategy(const std::string& text);

// Normalizes any value to a JSON object. Objects pass through, strings go through the
// strategy list, everything else (null, numbers, arrays, booleans) becomes {}.
Value coerce_to_mapping(const Value& value);

} // namespace actflow

#endif // ACTFLOW_CODEC_PARAMS_COERCION_H
