// src/runtime/container_manager.cpp
#include "actflow/runtime/container_manager.h"
#include "actflow/runtime/periodic_task.h"
#include <iostream>
#include <stdexcept>
#include <vector>

namespace actflow {

struct ContainerManager::Slot {
    std::mutex op_mutex;    // start/stop/execute
    std::mutex state_mutex; // everything below except the polls
    ContainerInfo info;
    std::optional<ExecutionStatus> execution;
    std::uint64_t generation = 0; // bumped whenever the container is replaced or stopped
    int status_failures = 0;

    // guarded by op_mutex; destroyed (cancelled and joined) before the fields above
    std::unique_ptr<PeriodicTask> health_poll;
    std::unique_ptr<PeriodicTask> execution_poll;
};

namespace {

void require_artifact_id(const std::string& artifact_id) {
    if (artifact_id.empty()) {
        throw std::invalid_argument("Missing artifact ID");
    }
}

std::string error_from_body(const Value& body, const std::string& fallback) {
    if (body.is_object() && body.contains("error") && body["error"].is_string()) {
        return body["error"].get<std::string>();
    }
    return fallback;
}

std::string status_from_body(const Value& body, const std::string& fallback = "") {
    if (body.is_object() && body.contains("status") && body["status"].is_string()) {
        return body["status"].get<std::string>();
    }
    return fallback;
}

std::optional<int> valid_port(long long port) {
    if (port < 1 || port > 65535) return std::nullopt;
    return static_cast<int>(port);
}

std::optional<int> port_from_body(const Value& body) {
    if (!body.contains("port")) return std::nullopt;
    const auto& p = body["port"];
    if (p.is_number_unsigned()) {
        auto v = p.get<unsigned long long>();
        return v > 65535 ? std::nullopt : valid_port(static_cast<long long>(v));
    }
    if (p.is_number_integer()) return valid_port(p.get<long long>());
    if (p.is_string()) {
        try {
            return valid_port(std::stoll(p.get<std::string>()));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::string execution_id_from_body(const Value& body) {
    for (const char* key : {"executionId", "execution_id"}) {
        if (body.contains(key) && body[key].is_string()) {
            return body[key].get<std::string>();
        }
    }
    return "";
}

ExecutionStatus failed_execution(std::string error, std::string execution_id = "") {
    ExecutionStatus status;
    status.status = ExecutionState::Failed;
    status.execution_id = std::move(execution_id);
    status.error = std::move(error);
    return status;
}

// Callers hold slot.state_mutex. The execution poll has already been cancelled,
// so nothing else would ever move an in-flight execution to a terminal state.
bool abandon_execution(std::optional<ExecutionStatus>& execution, std::optional<std::string>& execution_id,
                       const std::string& reason) {
    execution_id.reset();
    if (!execution || is_terminal(execution->status)) return false;
    *execution = failed_execution(reason, execution->execution_id);
    return true;
}

} // namespace

ContainerManager::ContainerManager(std::shared_ptr<HttpClient> http, ManagerConfig config)
    : http_(std::move(http)), config_(std::move(config)) {
    if (!http_) {
        throw std::invalid_argument("ContainerManager requires an HTTP client");
    }
}

ContainerManager::~ContainerManager() {
    shutdown();
}

std::shared_ptr<ContainerManager::Slot> ContainerManager::get_or_create_slot(const std::string& artifact_id) {
    std::lock_guard<std::mutex> lock(table_mutex_);
    auto& slot = slots_[artifact_id];
    if (!slot) {
        slot = std::make_shared<Slot>();
    }
    return slot;
}

std::shared_ptr<ContainerManager::Slot> ContainerManager::find_slot(const std::string& artifact_id) const {
    std::lock_guard<std::mutex> lock(table_mutex_);
    auto it = slots_.find(artifact_id);
    return (it != slots_.end()) ? it->second : nullptr;
}

void ContainerManager::release_slot(const std::string& artifact_id, const std::shared_ptr<Slot>& slot) {
    std::lock_guard<std::mutex> lock(table_mutex_);
    auto it = slots_.find(artifact_id);
    // only the table and the caller hold it: no other operation is waiting on this slot
    if (it != slots_.end() && it->second == slot && slot.use_count() == 2) {
        slots_.erase(it);
    }
}

std::string ContainerManager::service_endpoint(const std::string& path) const {
    return config_.service_url + path;
}

std::string ContainerManager::container_endpoint(int port, const std::string& path) const {
    return "http://" + config_.container_host + ":" + std::to_string(port) + path;
}

OperationResult ContainerManager::start_container(const std::string& artifact_id) {
    require_artifact_id(artifact_id);
    auto slot = get_or_create_slot(artifact_id);
    std::lock_guard<std::mutex> op(slot->op_mutex);

    {
        std::lock_guard<std::mutex> lock(slot->state_mutex);
        if (slot->info.status == ContainerStatus::Running && slot->info.container_id) {
            return OperationResult{true, "Container already running"};
        }
    }

    if (!check_health()) {
        std::lock_guard<std::mutex> lock(slot->state_mutex);
        slot->info.status = ContainerStatus::Error;
        slot->info.last_error = "Execution service is not available";
        return OperationResult{false, *slot->info.last_error};
    }

    // a container in error state may still have polls attached
    slot->health_poll.reset();
    slot->execution_poll.reset();
    {
        std::lock_guard<std::mutex> lock(slot->state_mutex);
        ++slot->generation;
        abandon_execution(slot->execution, slot->info.execution_id, "Execution cancelled: container restarted");
        slot->info.status = ContainerStatus::Pending;
        slot->info.last_error.reset();
    }

    std::string container_id;
    std::optional<int> port;
    try {
        HttpResponse response = http_->post_json(service_endpoint("/container/start"),
                                                 Value{{"artifactId", artifact_id}},
                                                 config_.request_timeout);
        Value body = response.json();
        if (!response.ok() || status_from_body(body) != "success") {
            throw HttpError(error_from_body(body, "Start request failed with HTTP " +
                                                      std::to_string(response.status_code)),
                            response.status_code);
        }
        if (body.contains("containerId") && body["containerId"].is_string()) {
            container_id = body["containerId"].get<std::string>();
        }
        if (container_id.empty()) {
            throw HttpError("Start response did not include a container ID", response.status_code);
        }
        port = port_from_body(body);
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Failed to start container for " << artifact_id << ": " << e.what() << std::endl;
        std::lock_guard<std::mutex> lock(slot->state_mutex);
        slot->info.status = ContainerStatus::Error;
        slot->info.last_error = e.what();
        return OperationResult{false, e.what()};
    }

    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(slot->state_mutex);
        generation = ++slot->generation;
        slot->info = ContainerInfo{};
        slot->info.status = ContainerStatus::Running;
        slot->info.container_id = container_id;
        slot->info.port = port;
        slot->info.start_time = std::chrono::system_clock::now();
        slot->status_failures = 0;
    }

    start_health_poll(*slot, artifact_id, generation);
    std::cout << "[INFO] Container " << container_id << " started for " << artifact_id << std::endl;
    return OperationResult{true, "Container started"};
}

OperationResult ContainerManager::stop_container(const std::string& artifact_id) {
    require_artifact_id(artifact_id);
    auto slot = find_slot(artifact_id);
    if (!slot) {
        return OperationResult{true, "No container running"};
    }
    std::lock_guard<std::mutex> op(slot->op_mutex);

    bool has_container = false;
    {
        std::lock_guard<std::mutex> lock(slot->state_mutex);
        ++slot->generation;
        has_container = slot->info.container_id.has_value();
    }
    slot->health_poll.reset();
    slot->execution_poll.reset();

    bool abandoned = false;
    {
        std::lock_guard<std::mutex> lock(slot->state_mutex);
        abandoned = abandon_execution(slot->execution, slot->info.execution_id,
                                      "Execution cancelled: container stopped");
    }

    if (!has_container) {
        {
            std::lock_guard<std::mutex> lock(slot->state_mutex);
            slot->info = ContainerInfo{};
        }
        if (!abandoned) release_slot(artifact_id, slot);
        return OperationResult{true, "No container running"};
    }

    try {
        HttpResponse response = http_->post_json(service_endpoint("/container/stop"),
                                                 Value{{"artifactId", artifact_id}},
                                                 config_.request_timeout);
        Value body = response.json();
        if (!response.ok() || status_from_body(body) != "success") {
            throw HttpError(error_from_body(body, "Stop request failed with HTTP " +
                                                      std::to_string(response.status_code)),
                            response.status_code);
        }
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Failed to stop container for " << artifact_id << ": " << e.what() << std::endl;
        std::lock_guard<std::mutex> lock(slot->state_mutex);
        slot->info.status = ContainerStatus::Error;
        slot->info.last_error = e.what();
        return OperationResult{false, e.what()};
    }

    {
        std::lock_guard<std::mutex> lock(slot->state_mutex);
        slot->info = ContainerInfo{};
        slot->status_failures = 0;
    }
    // a cancelled execution stays readable until the next stop or start
    if (!abandoned) release_slot(artifact_id, slot);
    std::cout << "[INFO] Container stopped for " << artifact_id << std::endl;
    return OperationResult{true, "Container stopped"};
}

bool ContainerManager::check_health() {
    try {
        HttpResponse response = http_->get(service_endpoint("/health"), config_.probe_timeout);
        if (!response.ok()) {
            std::cerr << "[WARNING] Health check failed with HTTP " << response.status_code << std::endl;
            return false;
        }
        return status_from_body(response.json()) == "healthy";
    } catch (const std::exception& e) {
        std::cerr << "[WARNING] Health check failed: " << e.what() << std::endl;
        return false;
    }
}

HealthReport ContainerManager::probe_container(const std::string& artifact_id, std::optional<int> port) {
    HealthReport report;

    if (port) {
        try {
            HttpResponse response = http_->get(container_endpoint(*port, "/health"), config_.probe_timeout);
            if (response.ok()) {
                Value body = Value::parse(response.body, nullptr, false);
                std::string status = body.is_discarded() ? "healthy" : status_from_body(body, "healthy");
                if (status == "healthy" || status == "running" || status == "ok") {
                    report.healthy = true;
                    report.status = status;
                    return report;
                }
            }
        } catch (const std::exception& e) {
            std::cerr << "[WARNING] Direct health probe for " << artifact_id << " failed: " << e.what() << std::endl;
        }
    }

    report.used_fallback = true;
    try {
        HttpResponse response = http_->post_json(service_endpoint("/container/health"),
                                                 Value{{"artifactId", artifact_id}},
                                                 config_.probe_timeout);
        Value body = response.json();
        report.status = status_from_body(body, "error");
        report.healthy = response.ok() && (report.status == "running" || report.status == "healthy");
        if (!report.healthy) {
            report.error = error_from_body(body, "Container status: " + report.status);
        }
    } catch (const std::exception& e) {
        report.healthy = false;
        report.status = "error";
        report.error = e.what();
    }
    return report;
}

void ContainerManager::commit_health(Slot& slot, std::uint64_t generation, const HealthReport& report) {
    std::lock_guard<std::mutex> lock(slot.state_mutex);
    if (slot.generation != generation || !slot.info.container_id ||
        slot.info.status == ContainerStatus::Pending) {
        return;
    }
    if (report.healthy) {
        slot.info.status = ContainerStatus::Running;
        slot.info.last_error.reset();
    } else {
        slot.info.status = ContainerStatus::Error;
        slot.info.last_error = report.error.value_or("Container is unhealthy");
    }
}

HealthReport ContainerManager::check_container_health(const std::string& artifact_id) {
    require_artifact_id(artifact_id);
    auto slot = find_slot(artifact_id);

    std::optional<int> port;
    std::uint64_t generation = 0;
    if (slot) {
        std::lock_guard<std::mutex> lock(slot->state_mutex);
        port = slot->info.port;
        generation = slot->generation;
    }

    HealthReport report = probe_container(artifact_id, port);
    if (slot) {
        commit_health(*slot, generation, report);
    }
    return report;
}

void ContainerManager::start_health_poll(Slot& slot, const std::string& artifact_id, std::uint64_t generation) {
    Slot* target = &slot;
    slot.health_poll = std::make_unique<PeriodicTask>(
        "health:" + artifact_id, config_.health_poll_interval,
        [this, target, artifact_id, generation]() {
            std::optional<int> port;
            {
                std::lock_guard<std::mutex> lock(target->state_mutex);
                if (target->generation != generation || !target->info.container_id) {
                    return false;
                }
                port = target->info.port;
            }
            commit_health(*target, generation, probe_container(artifact_id, port));
            return true;
        });
}

ExecutionStatus ContainerManager::execute_workflow(const std::string& artifact_id, const std::string& content) {
    require_artifact_id(artifact_id);
    auto slot = find_slot(artifact_id);
    if (!slot) {
        std::cerr << "[WARNING] Cannot execute workflow for " << artifact_id << ": container not running" << std::endl;
        return failed_execution("Cannot execute workflow: container not running");
    }
    std::lock_guard<std::mutex> op(slot->op_mutex);

    std::optional<int> port;
    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(slot->state_mutex);
        if (slot->info.status != ContainerStatus::Running || !slot->info.container_id) {
            std::cerr << "[WARNING] Cannot execute workflow for " << artifact_id << ": container not running" << std::endl;
            return failed_execution("Cannot execute workflow: container not running");
        }
        port = slot->info.port;
        generation = slot->generation;
    }

    // one execution in flight per container
    slot->execution_poll.reset();
    {
        std::lock_guard<std::mutex> lock(slot->state_mutex);
        slot->info.execution_id.reset();
    }

    if (!port) {
        return execute_via_service(*slot, artifact_id, content);
    }

    std::string execution_id;
    try {
        HttpResponse response = http_->post_json(container_endpoint(*port, "/execute"),
                                                 Value{{"content", content}},
                                                 config_.request_timeout);
        Value body = response.json();
        if (!response.ok() || status_from_body(body) != "accepted") {
            std::string error = error_from_body(body, "Execution was not accepted (HTTP " +
                                                          std::to_string(response.status_code) + ")");
            std::cerr << "[WARNING] " << error << std::endl;
            ExecutionStatus rejected = failed_execution(error);
            std::lock_guard<std::mutex> lock(slot->state_mutex);
            slot->execution = rejected;
            return rejected;
        }
        execution_id = execution_id_from_body(body);
        if (execution_id.empty()) {
            throw HttpError("Execute response did not include an execution ID", response.status_code);
        }
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Failed to submit workflow for " << artifact_id << ": " << e.what() << std::endl;
        std::lock_guard<std::mutex> lock(slot->state_mutex);
        slot->info.status = ContainerStatus::Error;
        slot->info.last_error = e.what();
        slot->execution = failed_execution(e.what());
        return *slot->execution;
    }

    ExecutionStatus queued;
    queued.status = ExecutionState::Queued;
    queued.execution_id = execution_id;
    {
        std::lock_guard<std::mutex> lock(slot->state_mutex);
        slot->info.execution_id = execution_id;
        slot->execution = queued;
        slot->status_failures = 0;
    }

    start_execution_poll(*slot, artifact_id, generation, execution_id, *port);
    std::cout << "[INFO] Execution " << execution_id << " queued for " << artifact_id << std::endl;
    return queued;
}

ExecutionStatus ContainerManager::execute_via_service(Slot& slot, const std::string& artifact_id,
                                                      const std::string& content) {
    ExecutionStatus status;
    try {
        HttpResponse response = http_->post_json(service_endpoint("/container/execute"),
                                                 Value{{"artifactId", artifact_id}, {"content", content}},
                                                 config_.request_timeout);
        Value body = response.json();
        if (response.ok() && status_from_body(body) == "success") {
            status.status = ExecutionState::Completed;
            if (body.contains("result")) status.result = body["result"];
        } else {
            status = failed_execution(error_from_body(body, "Execution failed with HTTP " +
                                                                std::to_string(response.status_code)));
        }
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Failed to execute workflow for " << artifact_id << ": " << e.what() << std::endl;
        std::lock_guard<std::mutex> lock(slot.state_mutex);
        slot.info.status = ContainerStatus::Error;
        slot.info.last_error = e.what();
        slot.execution = failed_execution(e.what());
        return *slot.execution;
    }

    std::lock_guard<std::mutex> lock(slot.state_mutex);
    slot.execution = status;
    return status;
}

void ContainerManager::start_execution_poll(Slot& slot, const std::string& artifact_id, std::uint64_t generation,
                                            const std::string& execution_id, int port) {
    Slot* target = &slot;
    slot.execution_poll = std::make_unique<PeriodicTask>(
        "execution:" + artifact_id, config_.execution_poll_interval,
        [this, target, generation, execution_id, port]() {
            return poll_execution_once(*target, generation, execution_id, port);
        });
}

bool ContainerManager::poll_execution_once(Slot& slot, std::uint64_t generation,
                                           const std::string& execution_id, int port) {
    {
        std::lock_guard<std::mutex> lock(slot.state_mutex);
        if (slot.generation != generation || slot.info.execution_id != execution_id) {
            return false;
        }
    }

    ExecutionStatus observed;
    observed.execution_id = execution_id;
    try {
        HttpResponse response = http_->get(container_endpoint(port, "/status/" + execution_id),
                                           config_.status_timeout);
        Value body = response.json();
        if (!response.ok()) {
            throw HttpError(error_from_body(body, "Status request failed with HTTP " +
                                                      std::to_string(response.status_code)),
                            response.status_code);
        }
        observed.status = execution_state_from_string(status_from_body(body, "running"));
        if (body.contains("result") && !body["result"].is_null()) {
            observed.result = body["result"];
        }
        if (body.contains("error") && body["error"].is_string()) {
            observed.error = body["error"].get<std::string>();
        }
    } catch (const std::exception& e) {
        std::lock_guard<std::mutex> lock(slot.state_mutex);
        if (slot.generation != generation || slot.info.execution_id != execution_id) {
            return false;
        }
        if (++slot.status_failures < config_.max_status_failures) {
            std::cerr << "[WARNING] Status poll for " << execution_id << " failed ("
                      << slot.status_failures << "/" << config_.max_status_failures << "): " << e.what() << std::endl;
            return true;
        }
        std::cerr << "[ERROR] Giving up on execution " << execution_id << ": " << e.what() << std::endl;
        slot.execution = failed_execution(e.what(), execution_id);
        slot.info.execution_id.reset();
        slot.info.status = ContainerStatus::Error;
        slot.info.last_error = e.what();
        return false;
    }

    std::lock_guard<std::mutex> lock(slot.state_mutex);
    if (slot.generation != generation || slot.info.execution_id != execution_id) {
        return false;
    }
    slot.status_failures = 0;
    slot.execution = observed;
    if (is_terminal(observed.status)) {
        slot.info.execution_id.reset();
        std::cout << "[INFO] Execution " << execution_id << " " << to_string(observed.status) << std::endl;
        return false;
    }
    return true;
}

ContainerInfo ContainerManager::get_container_status(const std::string& artifact_id) const {
    ContainerInfo info;
    if (artifact_id.empty()) {
        info.last_error = "Missing artifact ID";
        return info;
    }
    auto slot = find_slot(artifact_id);
    if (!slot) {
        return info;
    }
    std::lock_guard<std::mutex> lock(slot->state_mutex);
    return slot->info;
}

std::optional<ExecutionStatus> ContainerManager::get_execution_status(const std::string& artifact_id) const {
    require_artifact_id(artifact_id);
    auto slot = find_slot(artifact_id);
    if (!slot) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(slot->state_mutex);
    return slot->execution;
}

std::optional<std::string> ContainerManager::fetch_container_logs(const std::string& artifact_id) {
    require_artifact_id(artifact_id);
    auto slot = find_slot(artifact_id);
    if (!slot) {
        return std::nullopt;
    }

    std::optional<int> port;
    {
        std::lock_guard<std::mutex> lock(slot->state_mutex);
        if (slot->info.status != ContainerStatus::Running) {
            return std::nullopt;
        }
        port = slot->info.port;
    }
    if (!port) {
        return std::nullopt;
    }

    try {
        HttpResponse response = http_->get(container_endpoint(*port, "/logs"), config_.request_timeout);
        if (!response.ok()) {
            std::cerr << "[WARNING] Log request for " << artifact_id << " failed with HTTP "
                      << response.status_code << std::endl;
            return std::nullopt;
        }
        return response.body;
    } catch (const std::exception& e) {
        std::cerr << "[WARNING] Log request for " << artifact_id << " failed: " << e.what() << std::endl;
        return std::nullopt;
    }
}

void ContainerManager::shutdown() {
    std::vector<std::shared_ptr<Slot>> slots;
    {
        std::lock_guard<std::mutex> lock(table_mutex_);
        slots.reserve(slots_.size());
        for (auto& [id, slot] : slots_) {
            slots.push_back(slot);
        }
    }
    for (auto& slot : slots) {
        std::lock_guard<std::mutex> op(slot->op_mutex);
        slot->health_poll.reset();
        slot->execution_poll.reset();
        std::lock_guard<std::mutex> lock(slot->state_mutex);
        abandon_execution(slot->execution, slot->info.execution_id, "Execution cancelled: manager shut down");
    }
}

} // namespace actflow
