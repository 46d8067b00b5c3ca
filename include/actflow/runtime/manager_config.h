// actflow/runtime/manager_config.h
#ifndef ACTFLOW_RUNTIME_MANAGER_CONFIG_H
#define ACTFLOW_RUNTIME_MANAGER_CONFIG_H

#include <chrono>
#include <nlohmann/json.hpp>
#include <string>

namespace actflow {

struct ManagerConfig {
    std::string service_url = "http://localhost:5001"; // managing service
    std::string container_host = "localhost";         // host for direct container calls
    std::chrono::milliseconds health_poll_interval{10000};
    std::chrono::milliseconds execution_poll_interval{1000};
    std::chrono::milliseconds probe_timeout{2000};
    std::chrono::milliseconds status_timeout{5000};
    std::chrono::milliseconds request_timeout{30000};
    int max_status_failures = 3; // consecutive failed status polls before an execution fails
};

// Overlays recognised keys of `j` onto `base`; wrongly typed fields are skipped
ManagerConfig manager_config_from_json(const nlohmann::json& j, ManagerConfig base = {});

// JSON or YAML (.yaml/.yml) file. A missing or unreadable file yields the defaults.
ManagerConfig load_manager_config(const std::string& path);

} // namespace actflow

#endif // ACTFLOW_RUNTIME_MANAGER_CONFIG_H
