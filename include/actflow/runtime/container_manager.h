// actflow/runtime/container_manager.h
#ifndef ACTFLOW_RUNTIME_CONTAINER_MANAGER_H
#define ACTFLOW_RUNTIME_CONTAINER_MANAGER_H

#include "actflow/runtime/container_types.h"
#include "actflow/runtime/http_client.h"
#include "actflow/runtime/manager_config.h"
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace actflow {

// Per-artifact container lifecycle: stopped -> pending -> running -> {stopped | error}.
// Owned by the host and shared by reference; all methods are thread-safe.
//
// Start/stop/execute for one artifact are serialized by that artifact's operation
// lock. Background polls never take it: they probe without any lock held and commit
// under a short state lock, dropping results that belong to an earlier container.
//
// Expected failures (service down, container unreachable) are reported through the
// return values and ContainerInfo::last_error. Only an empty artifact id throws
// (std::invalid_argument).
class ContainerManager {
public:
    explicit ContainerManager(std::shared_ptr<HttpClient> http, ManagerConfig config = {});
    ~ContainerManager();

    ContainerManager(const ContainerManager&) = delete;
    ContainerManager& operator=(const ContainerManager&) = delete;

    OperationResult start_container(const std::string& artifact_id);
    // Cancels both polls and fails an in-flight execution. A successful stop drops the
    // artifact's record, unless it holds such a cancelled execution for the host to read.
    OperationResult stop_container(const std::string& artifact_id);

    // Managing service availability
    bool check_health();

    // Direct probe of the container port, then the managing service as fallback
    HealthReport check_container_health(const std::string& artifact_id);

    // Submits workflow text. Returns Queued and polls in the background, or the final
    // status when the container has no published port (synchronous service path).
    ExecutionStatus execute_workflow(const std::string& artifact_id, const std::string& content);

    ContainerInfo get_container_status(const std::string& artifact_id) const;
    std::optional<ExecutionStatus> get_execution_status(const std::string& artifact_id) const;

    // Plain-text logs from the container, nullopt when not running or unreachable
    std::optional<std::string> fetch_container_logs(const std::string& artifact_id);

    // Cancels every poll and fails in-flight executions. Records are kept.
    void shutdown();

    const ManagerConfig& config() const { return config_; }

private:
    struct Slot;

    std::shared_ptr<Slot> get_or_create_slot(const std::string& artifact_id);
    std::shared_ptr<Slot> find_slot(const std::string& artifact_id) const;
    // Drops a stopped slot from the table unless another caller still holds it
    void release_slot(const std::string& artifact_id, const std::shared_ptr<Slot>& slot);

    std::string service_endpoint(const std::string& path) const;
    std::string container_endpoint(int port, const std::string& path) const;

    HealthReport probe_container(const std::string& artifact_id, std::optional<int> port);
    void commit_health(Slot& slot, std::uint64_t generation, const HealthReport& report);
    ExecutionStatus execute_via_service(Slot& slot, const std::string& artifact_id,
                                        const std::string& content);

    // Callers hold slot.op_mutex
    void start_health_poll(Slot& slot, const std::string& artifact_id, std::uint64_t generation);
    void start_execution_poll(Slot& slot, const std::string& artifact_id, std::uint64_t generation,
                              const std::string& execution_id, int port);

    bool poll_execution_once(Slot& slot, std::uint64_t generation,
                             const std::string& execution_id, int port);

    std::shared_ptr<HttpClient> http_;
    ManagerConfig config_;

    mutable std::mutex table_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;
};

} // namespace actflow

#endif // ACTFLOW_RUNTIME_CONTAINER_MANAGER_H
