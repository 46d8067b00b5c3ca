// main.cpp
#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>
#include "actflow/codec/workflow_parser.h"
#include "actflow/codec/workflow_serializer.h"
#include "actflow/codec/workflow_templates.h"
#include "actflow/codec/workflow_validator.h"
#include "actflow/graph/flow_graph.h"
#include "actflow/runtime/container_manager.h"

namespace {

void print_usage(const char* prog) {
    std::cerr << "Usage:\n"
              << "  " << prog << " validate <file> [--strict]\n"
              << "  " << prog << " format <file>\n"
              << "  " << prog << " graph <file>\n"
              << "  " << prog << " new <title>\n"
              << "  " << prog << " health [--config <file>]\n"
              << "  " << prog << " run <artifact-id> <file> [--config <file>]\n";
}

std::string read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::string option_value(int argc, char* argv[], const std::string& name, const std::string& fallback) {
    for (int i = 1; i + 1 < argc; ++i) {
        if (argv[i] == name) return argv[i + 1];
    }
    return fallback;
}

bool has_flag(int argc, char* argv[], const std::string& name) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] == name) return true;
    }
    return false;
}

nlohmann::json graph_to_json(const actflow::FlowGraph& graph) {
    nlohmann::json out;
    out["nodes"] = nlohmann::json::array();
    for (const auto& n : graph.nodes) {
        out["nodes"].push_back({
            {"id", n.id},
            {"type", n.type},
            {"position", {{"x", n.position.x}, {"y", n.position.y}}},
            {"data", nlohmann::json::parse(n.data.dump())},
        });
    }
    out["edges"] = nlohmann::json::array();
    for (const auto& e : graph.edges) {
        out["edges"].push_back({
            {"id", e.id},
            {"source", e.source},
            {"target", e.target},
            {"sourceHandle", e.source_handle},
            {"targetHandle", e.target_handle},
        });
    }
    return out;
}

int cmd_validate(const std::string& path, bool strict) {
    std::string text = read_file(path);
    if (strict) {
        try {
            auto wf = actflow::parse_strict(text);
            std::cout << "[OK] " << wf.nodes.size() << " nodes, " << wf.edges.size() << " edges\n";
            return 0;
        } catch (const actflow::WorkflowValidationError& e) {
            for (const auto& reason : e.reasons()) {
                std::cerr << "[INVALID] " << reason << "\n";
            }
            return 2;
        }
    }

    auto result = actflow::parse_lenient(text);
    if (!result.is_valid) {
        for (const auto& err : result.errors) std::cerr << "[INVALID] " << err << "\n";
        return 2;
    }
    std::cout << "[OK] " << result.workflow.nodes.size() << " nodes, " << result.warnings.size()
              << " warnings\n";
    return 0;
}

int cmd_run(const std::string& artifact_id, const std::string& path, const std::string& config_path) {
    std::string text = actflow::serialize_workflow(actflow::parse_strict(read_file(path)));

    auto config = actflow::load_manager_config(config_path);
    actflow::ContainerManager manager(std::make_shared<actflow::CurlHttpClient>(), config);

    auto started = manager.start_container(artifact_id);
    if (!started.success) {
        std::cerr << "[ERROR] " << started.message << "\n";
        return 1;
    }

    auto status = manager.execute_workflow(artifact_id, text);
    while (!actflow::is_terminal(status.status)) {
        std::this_thread::sleep_for(config.execution_poll_interval);
        auto latest = manager.get_execution_status(artifact_id);
        if (latest) status = *latest;
    }

    std::cout << actflow::to_json(status).dump(2) << "\n";
    auto stopped = manager.stop_container(artifact_id);
    if (!stopped.success) {
        std::cerr << "[WARNING] " << stopped.message << "\n";
    }
    return status.status == actflow::ExecutionState::Completed ? 0 : 1;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string command = argv[1];
    const std::string config_path = option_value(argc, argv, "--config", "actflow.json");

    try {
        if (command == "validate" && argc >= 3) {
            return cmd_validate(argv[2], has_flag(argc, argv, "--strict"));
        }
        if (command == "format" && argc >= 3) {
            auto result = actflow::parse_lenient(read_file(argv[2]));
            if (!result.is_valid) return 2;
            std::cout << actflow::serialize_workflow(result.workflow);
            return 0;
        }
        if (command == "graph" && argc >= 3) {
            auto result = actflow::parse_lenient(read_file(argv[2]));
            if (!result.is_valid) return 2;
            std::cout << graph_to_json(actflow::to_graph(result.workflow)).dump(2) << "\n";
            return 0;
        }
        if (command == "new" && argc >= 3) {
            std::cout << actflow::render_base_template(argv[2]);
            return 0;
        }
        if (command == "health") {
            actflow::ContainerManager manager(std::make_shared<actflow::CurlHttpClient>(),
                                              actflow::load_manager_config(config_path));
            bool healthy = manager.check_health();
            std::cout << (healthy ? "healthy" : "unavailable") << "\n";
            return healthy ? 0 : 1;
        }
        if (command == "run" && argc >= 4) {
            return cmd_run(argv[2], argv[3], config_path);
        }
    } catch (const actflow::WorkflowValidationError& e) {
        for (const auto& reason : e.reasons()) {
            std::cerr << "[INVALID] " << reason << "\n";
        }
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return 1;
    }

    print_usage(argv[0]);
    return 1;
}
