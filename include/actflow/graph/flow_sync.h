// actflow/graph/flow_sync.h
#ifndef ACTFLOW_GRAPH_FLOW_SYNC_H
#define ACTFLOW_GRAPH_FLOW_SYNC_H

#include "actflow/core/types.h"
#include "actflow/graph/flow_graph.h"
#include <string>
#include <vector>

namespace actflow {

enum class TextUpdate {
    Partial,  // fragment (e.g. streamed): unmentioned nodes keep their records
    Complete  // whole document: nodes absent from the text are dropped
};

struct SyncResult {
    bool ok = true;
    std::string error;
};

// Keeps one document's text, model and graph consistent under edits from either side.
// A failed update leaves all three untouched and clears content_valid().
class FlowSynchronizer {
public:
    FlowSynchronizer() = default;

    SyncResult apply_text(const std::string& text, TextUpdate mode = TextUpdate::Complete);
    SyncResult apply_graph(const FlowGraph& graph);

    SyncResult move_node(const NodeId& id, Position position);
    SyncResult add_edge(const NodeId& source, const NodeId& target);
    // Deletions are remembered so the raw-edge union cannot bring the edge back
    SyncResult remove_edge(const NodeId& source, const NodeId& target);
    // Merges `patch` into the node's data; null values erase keys
    SyncResult update_node_data(const NodeId& id, const Value& patch);
    SyncResult remove_node(const NodeId& id);

    const Workflow& document() const { return document_; }
    const FlowGraph& graph() const { return graph_; }
    const std::string& text() const { return text_; }
    bool content_valid() const { return content_valid_; }

    const std::vector<Edge>& raw_edges() const { return raw_edges_; }
    const std::vector<Edge>& removed_edges() const { return removed_edges_; }

private:
    SyncResult commit_graph(const FlowGraph& graph, std::vector<Edge> removed);
    SyncResult fail(const std::string& error);

    Workflow document_;
    FlowGraph graph_;
    std::string text_;
    std::vector<Edge> raw_edges_;     // every edge seen in text or graph, valid or not
    std::vector<Edge> removed_edges_; // explicit graph-side deletions
    bool content_valid_ = true;
};

} // namespace actflow

#endif // ACTFLOW_GRAPH_FLOW_SYNC_H
