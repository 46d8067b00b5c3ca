// src/runtime/container_types.cpp
#include "actflow/runtime/container_types.h"

namespace actflow {

std::string to_string(ContainerStatus status) {
    switch (status) {
        case ContainerStatus::Stopped: return "stopped";
        case ContainerStatus::Pending: return "pending";
        case ContainerStatus::Running: return "running";
        case ContainerStatus::Error: return "error";
    }
    return "stopped";
}

std::string to_string(ExecutionState state) {
    switch (state) {
        case ExecutionState::Queued: return "queued";
        case ExecutionState::Running: return "running";
        case ExecutionState::Completed: return "completed";
        case ExecutionState::Failed: return "failed";
    }
    return "queued";
}

ExecutionState execution_state_from_string(const std::string& s) {
    if (s == "queued" || s == "accepted") return ExecutionState::Queued;
    if (s == "completed") return ExecutionState::Completed;
    if (s == "failed" || s == "error") return ExecutionState::Failed;
    return ExecutionState::Running;
}

bool is_terminal(ExecutionState state) {
    return state == ExecutionState::Completed || state == ExecutionState::Failed;
}

Value to_json(const ContainerInfo& info) {
    Value j;
    j["status"] = to_string(info.status);
    if (info.container_id) j["containerId"] = *info.container_id;
    if (info.port) j["port"] = *info.port;
    if (info.last_error) j["lastError"] = *info.last_error;
    if (info.start_time) {
        j["startTime"] = std::chrono::duration_cast<std::chrono::milliseconds>(
                             info.start_time->time_since_epoch()).count();
    }
    if (info.execution_id) j["executionId"] = *info.execution_id;
    return j;
}

Value to_json(const ExecutionStatus& status) {
    Value j;
    j["status"] = to_string(status.status);
    j["executionId"] = status.execution_id;
    if (status.result) j["result"] = *status.result;
    if (status.error) j["error"] = *status.error;
    return j;
}

} // namespace actflow
