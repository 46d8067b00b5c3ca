#ifndef ACTFLOW_COMMON_UTILS_YAML_JSON_H
#define ACTFLOW_COMMON_UTILS_YAML_JSON_H

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace actflow {

// Scalars become bool/number/null where they read as such, strings otherwise
nlohmann::json yaml_to_json(const YAML::Node& node);

} // namespace actflow

#endif // ACTFLOW_COMMON_UTILS_YAML_JSON_H
