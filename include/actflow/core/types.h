// actflow/core/types.h
#ifndef ACTFLOW_CORE_TYPES_H
#define ACTFLOW_CORE_TYPES_H

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace actflow {

// Ordered JSON keeps params/extras in declaration order for stable serialization
using Value = nlohmann::ordered_json;

using NodeId = std::string; // e.g. "fetch_issues"

// Defaults applied when a node or workflow field is missing
namespace defaults {
inline constexpr const char* kWorkflowName = "Untitled Workflow";
inline constexpr const char* kWorkflowDescription = "No description provided";
inline constexpr const char* kNodeType = "process";
inline constexpr const char* kGraphNodeType = "default";
inline constexpr const char* kOperation = "process";
inline constexpr const char* kOperationName = "process";
inline constexpr const char* kAppName = "System";
inline constexpr const char* kMode = "UC";
} // namespace defaults

struct Position {
    double x = 0.0;
    double y = 0.0;

    bool operator==(const Position&) const = default;
};

struct WorkflowNode {
    NodeId id;
    std::string type = defaults::kNodeType;
    std::string label;
    Position position;
    std::string operation = defaults::kOperation;
    std::string operation_name = defaults::kOperationName;
    std::string app_name = defaults::kAppName;
    std::string mode = defaults::kMode;
    Value params = Value::object(); // always a mapping after parsing

    std::optional<std::string> api_key;
    std::optional<std::string> token;   // text key: slack_token
    std::optional<std::string> method;
    std::optional<Value> form_data;     // text key: formData

    Value extra = Value::object();      // any other key of the node block

    WorkflowNode() = default;
    explicit WorkflowNode(NodeId node_id) : id(node_id), label(std::move(node_id)) {}

    bool operator==(const WorkflowNode&) const = default;
};

struct Edge {
    NodeId source;
    NodeId target;

    bool operator==(const Edge&) const = default;
};

struct Workflow {
    std::optional<std::string> workflow_id; // never regenerated
    std::string name = defaults::kWorkflowName;
    std::string description = defaults::kWorkflowDescription;
    std::string start_node;
    std::vector<WorkflowNode> nodes; // declaration order
    std::vector<Edge> edges;
    Value env = Value::object();     // name -> string value
    Value extra = Value::object();   // unknown [workflow] keys

    const WorkflowNode* find_node(const NodeId& id) const;
    WorkflowNode* find_node(const NodeId& id);
    bool has_node(const NodeId& id) const { return find_node(id) != nullptr; }

    // Returns the existing node, or appends a defaulted one
    WorkflowNode& upsert_node(const NodeId& id);
    bool remove_node(const NodeId& id);

    // Edges whose endpoints both exist, in declaration order
    std::vector<Edge> valid_edges() const;

    bool operator==(const Workflow&) const = default;
};

} // namespace actflow

#endif // ACTFLOW_CORE_TYPES_H
