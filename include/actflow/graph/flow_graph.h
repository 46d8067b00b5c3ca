// actflow/graph/flow_graph.h
#ifndef ACTFLOW_GRAPH_FLOW_GRAPH_H
#define ACTFLOW_GRAPH_FLOW_GRAPH_H

#include "actflow/core/types.h"
#include <string>
#include <vector>

namespace actflow {

// Derived from connectivity on every conversion, never stored in text
enum class NodeRole {
    Input,   // start node, or outgoing edges only
    Core,    // incoming and outgoing
    Output,  // incoming only
    Default  // unconnected
};

std::string to_string(NodeRole role);

struct GraphNode {
    NodeId id;
    std::string type = defaults::kGraphNodeType;
    Position position;
    Value data = Value::object(); // label, operation, params, extras, role, ...

    bool operator==(const GraphNode&) const = default;
};

struct GraphEdge {
    std::string id; // "e-<source>-<target>"
    NodeId source;
    NodeId target;
    std::string source_handle = "right";
    std::string target_handle = "left";

    bool operator==(const GraphEdge&) const = default;
};

struct FlowGraph {
    std::vector<GraphNode> nodes;
    std::vector<GraphEdge> edges;

    const GraphNode* find_node(const NodeId& id) const;
    GraphNode* find_node(const NodeId& id);

    bool operator==(const FlowGraph&) const = default;
};

std::string edge_id(const NodeId& source, const NodeId& target);

NodeRole determine_role(const NodeId& id, const std::vector<Edge>& edges, const std::string& start_node);

FlowGraph to_graph(const Workflow& wf);

// Rebuilds the document from graph state. Workflow-level fields and env come from
// `header`. Edges are the graph's edges plus `raw_edges` not yet in the graph, minus
// every pair in `removed_edges`.
Workflow graph_to_workflow(const FlowGraph& graph,
                           const Workflow& header,
                           const std::vector<Edge>& raw_edges = {},
                           const std::vector<Edge>& removed_edges = {});

// graph_to_workflow() followed by serialization
std::string to_document(const FlowGraph& graph,
                        const Workflow& header,
                        const std::vector<Edge>& raw_edges = {},
                        const std::vector<Edge>& removed_edges = {});

} // namespace actflow

#endif // ACTFLOW_GRAPH_FLOW_GRAPH_H
