// actflow/runtime/container_types.h
#ifndef ACTFLOW_RUNTIME_CONTAINER_TYPES_H
#define ACTFLOW_RUNTIME_CONTAINER_TYPES_H

#include "actflow/core/types.h"
#include <chrono>
#include <optional>
#include <string>

namespace actflow {

enum class ContainerStatus { Stopped, Pending, Running, Error };

enum class ExecutionState { Queued, Running, Completed, Failed };

std::string to_string(ContainerStatus status);
std::string to_string(ExecutionState state);

// Unknown strings map to Running: the peer only reports terminal states explicitly
ExecutionState execution_state_from_string(const std::string& s);

bool is_terminal(ExecutionState state);

struct ContainerInfo {
    ContainerStatus status = ContainerStatus::Stopped;
    std::optional<std::string> container_id;
    std::optional<int> port;
    std::optional<std::string> last_error;
    std::optional<std::chrono::system_clock::time_point> start_time;
    std::optional<std::string> execution_id;
};

struct ExecutionStatus {
    ExecutionState status = ExecutionState::Queued;
    std::string execution_id;
    std::optional<Value> result;
    std::optional<std::string> error;
};

struct OperationResult {
    bool success = false;
    std::string message;
};

struct HealthReport {
    bool healthy = false;
    std::string status;                 // as reported by the peer
    std::optional<std::string> error;
    bool used_fallback = false;         // answered by the managing service
};

// Host-facing JSON views
Value to_json(const ContainerInfo& info);
Value to_json(const ExecutionStatus& status);

} // namespace actflow

#endif // ACTFLOW_RUNTIME_CONTAINER_TYPES_H
