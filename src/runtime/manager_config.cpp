// src/runtime/manager_config.cpp
#include "actflow/runtime/manager_config.h"
#include "common/utils/yaml_json.h"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <yaml-cpp/yaml.h>

namespace actflow {

namespace {

void read_string(const nlohmann::json& j, const char* key, std::string& out) {
    if (j.contains(key) && j[key].is_string() && !j[key].get<std::string>().empty()) {
        out = j[key].get<std::string>();
    }
}

void read_millis(const nlohmann::json& j, const char* key, std::chrono::milliseconds& out) {
    if (j.contains(key) && j[key].is_number_integer() && j[key].get<long long>() > 0) {
        out = std::chrono::milliseconds(j[key].get<long long>());
    }
}

} // namespace

ManagerConfig manager_config_from_json(const nlohmann::json& j, ManagerConfig config) {
    if (!j.is_object()) {
        return config;
    }

    read_string(j, "service_url", config.service_url);
    read_string(j, "container_host", config.container_host);
    read_millis(j, "health_poll_interval_ms", config.health_poll_interval);
    read_millis(j, "execution_poll_interval_ms", config.execution_poll_interval);
    read_millis(j, "probe_timeout_ms", config.probe_timeout);
    read_millis(j, "status_timeout_ms", config.status_timeout);
    read_millis(j, "request_timeout_ms", config.request_timeout);

    if (j.contains("max_status_failures") && j["max_status_failures"].is_number_integer() &&
        j["max_status_failures"].get<int>() > 0) {
        config.max_status_failures = j["max_status_failures"].get<int>();
    }

    while (!config.service_url.empty() && config.service_url.back() == '/') {
        config.service_url.pop_back();
    }
    return config;
}

ManagerConfig load_manager_config(const std::string& path) {
    namespace fs = std::filesystem;

    ManagerConfig defaults;
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cout << "[INFO] No config at " << path << ", using defaults" << std::endl;
        return defaults;
    }

    try {
        nlohmann::json j;
        std::string ext = fs::path(path).extension().string();
        if (ext == ".yaml" || ext == ".yml") {
            j = yaml_to_json(YAML::Load(file));
        } else {
            file >> j;
        }
        return manager_config_from_json(j, defaults);
    } catch (const std::exception& e) {
        std::cerr << "[WARNING] Failed to read config " << path << ": " << e.what()
                  << ", using defaults" << std::endl;
        return defaults;
    }
}

} // namespace actflow
