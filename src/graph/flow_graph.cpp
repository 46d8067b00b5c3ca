// src/graph/flow_graph.cpp
#include "actflow/graph/flow_graph.h"
#include "actflow/codec/params_coercion.h"
#include "actflow/codec/workflow_serializer.h"
#include "common/utils/value_utils.h"
#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace actflow {

namespace {

// UI-only or derived keys that never go back into the text
const std::unordered_set<std::string> kExcludedDataKeys = {
    "role", "nodeKind", "onNodeDataChange", "onNodeDelete", "allNodes", "allEdges",
};

// Keys written from typed fields rather than copied through
const std::unordered_set<std::string> kTypedDataKeys = {
    "id", "type", "label", "position_x", "position_y", "operation", "operation_name",
    "app_name", "mode", "params", "api_key", "slack_token", "method", "formData",
};

std::string data_string(const Value& data, const char* key, const std::string& fallback) {
    auto it = data.find(key);
    if (it == data.end() || it->is_null()) return fallback;
    std::string s = scalar_to_string(*it);
    return s.empty() ? fallback : s;
}

std::optional<std::string> data_optional_string(const Value& data, const char* key) {
    auto it = data.find(key);
    if (it == data.end() || it->is_null()) return std::nullopt;
    return scalar_to_string(*it);
}

bool contains_edge(const std::vector<Edge>& edges, const NodeId& source, const NodeId& target) {
    return std::any_of(edges.begin(), edges.end(), [&](const Edge& e) {
        return e.source == source && e.target == target;
    });
}

} // namespace

std::string to_string(NodeRole role) {
    switch (role) {
        case NodeRole::Input: return "Input";
        case NodeRole::Core: return "Core";
        case NodeRole::Output: return "Output";
        case NodeRole::Default: return "Default";
    }
    return "Default";
}

const GraphNode* FlowGraph::find_node(const NodeId& id) const {
    auto it = std::find_if(nodes.begin(), nodes.end(), [&id](const GraphNode& n) { return n.id == id; });
    return (it != nodes.end()) ? &*it : nullptr;
}

GraphNode* FlowGraph::find_node(const NodeId& id) {
    auto it = std::find_if(nodes.begin(), nodes.end(), [&id](const GraphNode& n) { return n.id == id; });
    return (it != nodes.end()) ? &*it : nullptr;
}

std::string edge_id(const NodeId& source, const NodeId& target) {
    return "e-" + source + "-" + target;
}

NodeRole determine_role(const NodeId& id, const std::vector<Edge>& edges, const std::string& start_node) {
    bool is_target = false;
    bool is_source = false;
    for (const auto& e : edges) {
        if (e.target == id) is_target = true;
        if (e.source == id) is_source = true;
    }

    if (id == start_node || (!is_target && is_source)) return NodeRole::Input;
    if (is_target && !is_source) return NodeRole::Output;
    if (is_target && is_source) return NodeRole::Core;
    return NodeRole::Default;
}

FlowGraph to_graph(const Workflow& wf) {
    FlowGraph graph;
    auto edges = wf.valid_edges();

    graph.nodes.reserve(wf.nodes.size());
    for (const auto& node : wf.nodes) {
        GraphNode gn;
        gn.id = node.id;
        gn.type = node.type.empty() ? defaults::kGraphNodeType : node.type;
        gn.position = node.position;

        Value& data = gn.data;
        data["label"] = node.label.empty() ? node.id : node.label;
        data["operation"] = node.operation;
        data["operation_name"] = node.operation_name;
        data["app_name"] = node.app_name;
        data["mode"] = node.mode;
        data["params"] = node.params.is_object() ? node.params : Value::object();
        if (node.api_key) data["api_key"] = *node.api_key;
        if (node.token) data["slack_token"] = *node.token;
        if (node.method) data["method"] = *node.method;
        if (node.form_data) data["formData"] = *node.form_data;
        for (auto it = node.extra.begin(); it != node.extra.end(); ++it) {
            if (!data.contains(it.key())) data[it.key()] = it.value();
        }
        data["role"] = to_string(determine_role(node.id, edges, wf.start_node));

        graph.nodes.push_back(std::move(gn));
    }

    graph.edges.reserve(edges.size());
    for (const auto& e : edges) {
        GraphEdge ge;
        ge.id = edge_id(e.source, e.target);
        ge.source = e.source;
        ge.target = e.target;
        graph.edges.push_back(std::move(ge));
    }
    return graph;
}

Workflow graph_to_workflow(const FlowGraph& graph,
                           const Workflow& header,
                           const std::vector<Edge>& raw_edges,
                           const std::vector<Edge>& removed_edges) {
    Workflow wf;
    wf.workflow_id = header.workflow_id;
    wf.name = header.name;
    wf.description = header.description;
    wf.start_node = header.start_node;
    wf.env = header.env;
    wf.extra = header.extra;

    wf.nodes.reserve(graph.nodes.size());
    for (const auto& gn : graph.nodes) {
        const Value& data = gn.data.is_object() ? gn.data : Value::object();
        WorkflowNode node(gn.id);

        node.type = gn.type.empty() ? defaults::kNodeType : gn.type;
        node.label = data_string(data, "label", gn.id);
        node.position = Position{std::round(gn.position.x), std::round(gn.position.y)};
        node.operation = data_string(data, "operation", defaults::kOperation);
        node.operation_name = data_string(data, "operation_name", defaults::kOperationName);
        node.app_name = data_string(data, "app_name", defaults::kAppName);
        node.mode = data_string(data, "mode", defaults::kMode);
        node.params = coerce_to_mapping(data.value("params", Value::object()));
        node.api_key = data_optional_string(data, "api_key");
        node.token = data_optional_string(data, "slack_token");
        node.method = data_optional_string(data, "method");
        if (auto it = data.find("formData"); it != data.end() && !it->is_null()) {
            node.form_data = *it;
        }

        for (auto it = data.begin(); it != data.end(); ++it) {
            if (kTypedDataKeys.count(it.key()) || kExcludedDataKeys.count(it.key())) continue;
            if (it.value().is_null()) continue;
            node.extra[it.key()] = it.value();
        }

        wf.nodes.push_back(std::move(node));
    }

    for (const auto& ge : graph.edges) {
        if (contains_edge(removed_edges, ge.source, ge.target)) continue;
        wf.edges.push_back(Edge{ge.source, ge.target});
    }
    for (const auto& e : raw_edges) {
        if (contains_edge(removed_edges, e.source, e.target)) continue;
        if (contains_edge(wf.edges, e.source, e.target)) continue;
        wf.edges.push_back(e);
    }
    return wf;
}

std::string to_document(const FlowGraph& graph,
                        const Workflow& header,
                        const std::vector<Edge>& raw_edges,
                        const std::vector<Edge>& removed_edges) {
    return serialize_workflow(graph_to_workflow(graph, header, raw_edges, removed_edges));
}

} // namespace actflow
