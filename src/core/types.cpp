// src/core/types.cpp
#include "actflow/core/types.h"
#include <algorithm>
#include <unordered_set>

namespace actflow {

const WorkflowNode* Workflow::find_node(const NodeId& id) const {
    auto it = std::find_if(nodes.begin(), nodes.end(),
                           [&id](const WorkflowNode& n) { return n.id == id; });
    return (it != nodes.end()) ? &*it : nullptr;
}

WorkflowNode* Workflow::find_node(const NodeId& id) {
    auto it = std::find_if(nodes.begin(), nodes.end(),
                           [&id](const WorkflowNode& n) { return n.id == id; });
    return (it != nodes.end()) ? &*it : nullptr;
}

WorkflowNode& Workflow::upsert_node(const NodeId& id) {
    if (WorkflowNode* existing = find_node(id)) {
        return *existing;
    }
    nodes.emplace_back(id);
    return nodes.back();
}

bool Workflow::remove_node(const NodeId& id) {
    auto it = std::find_if(nodes.begin(), nodes.end(),
                           [&id](const WorkflowNode& n) { return n.id == id; });
    if (it == nodes.end()) return false;
    nodes.erase(it);
    return true;
}

std::vector<Edge> Workflow::valid_edges() const {
    std::unordered_set<NodeId> ids;
    for (const auto& n : nodes) {
        ids.insert(n.id);
    }
    std::vector<Edge> result;
    result.reserve(edges.size());
    for (const auto& e : edges) {
        if (ids.count(e.source) > 0 && ids.count(e.target) > 0) {
            result.push_back(e);
        }
    }
    return result;
}

} // namespace actflow
