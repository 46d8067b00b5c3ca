// src/graph/flow_sync.cpp
#include "actflow/graph/flow_sync.h"
#include "actflow/codec/workflow_parser.h"
#include "actflow/codec/workflow_serializer.h"
#include "actflow/codec/workflow_validator.h"
#include <algorithm>
#include <iostream>

namespace actflow {

namespace {

bool same_edge(const Edge& e, const NodeId& source, const NodeId& target) {
    return e.source == source && e.target == target;
}

bool contains_edge(const std::vector<Edge>& edges, const Edge& edge) {
    return std::any_of(edges.begin(), edges.end(),
                       [&](const Edge& e) { return same_edge(e, edge.source, edge.target); });
}

void erase_edge(std::vector<Edge>& edges, const NodeId& source, const NodeId& target) {
    edges.erase(std::remove_if(edges.begin(), edges.end(),
                               [&](const Edge& e) { return same_edge(e, source, target); }),
                edges.end());
}

void append_unique(std::vector<Edge>& edges, const Edge& edge) {
    if (!contains_edge(edges, edge)) edges.push_back(edge);
}

void log_notes(const std::vector<std::string>& notes) {
    for (const auto& note : notes) {
        std::cerr << "[WARNING] " << note << std::endl;
    }
}

} // namespace

SyncResult FlowSynchronizer::fail(const std::string& error) {
    std::cerr << "[WARNING] Sync failed, keeping previous state: " << error << std::endl;
    content_valid_ = false;
    return SyncResult{false, error};
}

SyncResult FlowSynchronizer::apply_text(const std::string& text, TextUpdate mode) {
    if (!is_workflow_content(text)) {
        return fail("Content is not in workflow format");
    }

    try {
        const bool partial = (mode == TextUpdate::Partial);
        WorkflowParser parser;
        ParseResult parsed = parser.parse_from_string(text, partial ? &document_ : nullptr);
        if (!parsed.is_valid) {
            return fail(parsed.errors.empty() ? "Failed to parse workflow" : parsed.errors.front());
        }

        Workflow wf = std::move(parsed.workflow);
        std::vector<Edge> removed = removed_edges_;
        std::vector<Edge> raw;

        if (partial) {
            // A fragment never resurrects a deleted edge
            raw = raw_edges_;
            for (const auto& e : wf.edges) {
                if (!contains_edge(removed, e)) append_unique(raw, e);
            }
            wf.edges.clear();
            for (const auto& e : raw) {
                if (!contains_edge(removed, e)) wf.edges.push_back(e);
            }
        } else {
            // A whole document restates its edges, including previously deleted ones
            raw = wf.edges;
            for (const auto& e : wf.edges) {
                erase_edge(removed, e.source, e.target);
            }
        }

        WorkflowValidator validator;
        log_notes(validator.normalize(wf));

        FlowGraph graph = to_graph(wf);
        std::string new_text = partial ? serialize_workflow(wf) : text;

        document_ = std::move(wf);
        graph_ = std::move(graph);
        text_ = std::move(new_text);
        raw_edges_ = std::move(raw);
        removed_edges_ = std::move(removed);
        content_valid_ = true;
        return SyncResult{};
    } catch (const std::exception& e) {
        return fail(e.what());
    }
}

SyncResult FlowSynchronizer::apply_graph(const FlowGraph& graph) {
    return commit_graph(graph, removed_edges_);
}

SyncResult FlowSynchronizer::commit_graph(const FlowGraph& graph, std::vector<Edge> removed) {
    try {
        std::vector<Edge> raw;
        for (const auto& ge : graph.edges) {
            append_unique(raw, Edge{ge.source, ge.target});
        }
        for (const auto& e : raw_edges_) {
            append_unique(raw, e);
        }
        for (const auto& e : removed) {
            erase_edge(raw, e.source, e.target);
        }

        Workflow wf = graph_to_workflow(graph, document_, raw_edges_, removed);
        WorkflowValidator validator;
        log_notes(validator.normalize(wf));

        std::string new_text = serialize_workflow(wf);
        WorkflowParser parser;
        ParseResult reparsed = parser.parse_from_string(new_text);
        if (!reparsed.is_valid) {
            return fail("Generated text could not be parsed back");
        }
        if (!(reparsed.workflow == wf)) {
            return fail("Generated text does not describe the edited graph");
        }

        FlowGraph new_graph = to_graph(wf);

        document_ = std::move(wf);
        graph_ = std::move(new_graph);
        text_ = std::move(new_text);
        raw_edges_ = std::move(raw);
        removed_edges_ = std::move(removed);
        content_valid_ = true;
        return SyncResult{};
    } catch (const std::exception& e) {
        return fail(e.what());
    }
}

SyncResult FlowSynchronizer::move_node(const NodeId& id, Position position) {
    FlowGraph graph = graph_;
    GraphNode* node = graph.find_node(id);
    if (!node) {
        return SyncResult{false, "Unknown node: " + id};
    }
    node->position = position;
    return commit_graph(graph, removed_edges_);
}

SyncResult FlowSynchronizer::add_edge(const NodeId& source, const NodeId& target) {
    FlowGraph graph = graph_;
    if (!graph.find_node(source) || !graph.find_node(target)) {
        return SyncResult{false, "Edge " + source + " -> " + target + " references an unknown node"};
    }

    bool present = std::any_of(graph.edges.begin(), graph.edges.end(), [&](const GraphEdge& e) {
        return e.source == source && e.target == target;
    });
    if (!present) {
        GraphEdge edge;
        edge.id = edge_id(source, target);
        edge.source = source;
        edge.target = target;
        graph.edges.push_back(std::move(edge));
    }

    std::vector<Edge> removed = removed_edges_;
    erase_edge(removed, source, target);
    return commit_graph(graph, std::move(removed));
}

SyncResult FlowSynchronizer::remove_edge(const NodeId& source, const NodeId& target) {
    FlowGraph graph = graph_;
    graph.edges.erase(std::remove_if(graph.edges.begin(), graph.edges.end(),
                                     [&](const GraphEdge& e) { return e.source == source && e.target == target; }),
                      graph.edges.end());

    std::vector<Edge> removed = removed_edges_;
    append_unique(removed, Edge{source, target});
    return commit_graph(graph, std::move(removed));
}

SyncResult FlowSynchronizer::update_node_data(const NodeId& id, const Value& patch) {
    if (!patch.is_object()) {
        return SyncResult{false, "Node data patch must be an object"};
    }

    FlowGraph graph = graph_;
    GraphNode* node = graph.find_node(id);
    if (!node) {
        return SyncResult{false, "Unknown node: " + id};
    }

    for (auto it = patch.begin(); it != patch.end(); ++it) {
        if (it.key() == "type" && it.value().is_string()) {
            node->type = it.value().get<std::string>();
        } else if (it.value().is_null()) {
            node->data.erase(it.key());
        } else {
            node->data[it.key()] = it.value();
        }
    }
    return commit_graph(graph, removed_edges_);
}

SyncResult FlowSynchronizer::remove_node(const NodeId& id) {
    FlowGraph graph = graph_;
    auto it = std::find_if(graph.nodes.begin(), graph.nodes.end(),
                           [&id](const GraphNode& n) { return n.id == id; });
    if (it == graph.nodes.end()) {
        return SyncResult{false, "Unknown node: " + id};
    }
    graph.nodes.erase(it);

    // incident edges count as explicit deletions so a node re-added later starts unconnected
    std::vector<Edge> removed = removed_edges_;
    for (const auto& e : graph.edges) {
        if (e.source == id || e.target == id) append_unique(removed, Edge{e.source, e.target});
    }
    for (const auto& e : raw_edges_) {
        if (e.source == id || e.target == id) append_unique(removed, e);
    }
    graph.edges.erase(std::remove_if(graph.edges.begin(), graph.edges.end(),
                                     [&id](const GraphEdge& e) { return e.source == id || e.target == id; }),
                      graph.edges.end());

    return commit_graph(graph, std::move(removed));
}

} // namespace actflow
