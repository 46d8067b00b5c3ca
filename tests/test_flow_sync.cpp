// tests/test_flow_sync.cpp
#include <catch2/catch.hpp>
#include "actflow/codec/workflow_parser.h"
#include "actflow/graph/flow_sync.h"
#include <algorithm>

using namespace actflow;

namespace {

const char* kPipeline = R"([workflow]
workflow_id = "wf-sync"
name = "Sync test"
start_node = a

[node:a]
position_x = 100
position_y = 100

[node:b]
position_x = 300
position_y = 100
color = "blue"

[node:c]
position_x = 500
position_y = 100

[edges]
a = b
b = c
)";

bool has_edge(const std::vector<Edge>& edges, const NodeId& s, const NodeId& t) {
    return std::any_of(edges.begin(), edges.end(),
                       [&](const Edge& e) { return e.source == s && e.target == t; });
}

} // namespace

TEST_CASE("Complete text update builds the graph", "[sync]") {
    FlowSynchronizer sync;
    auto result = sync.apply_text(kPipeline);

    REQUIRE(result.ok);
    REQUIRE(sync.content_valid());
    REQUIRE(sync.text() == kPipeline);
    REQUIRE(sync.graph().nodes.size() == 3);
    REQUIRE(sync.graph().edges.size() == 2);
    REQUIRE(sync.document().workflow_id == "wf-sync");
}

TEST_CASE("Partial text update keeps positions of untouched nodes", "[sync][merge]") {
    FlowSynchronizer sync;
    REQUIRE(sync.apply_text(kPipeline).ok);
    REQUIRE(sync.move_node("c", Position{640, 220}).ok);

    // streamed fragment mentions only b
    auto result = sync.apply_text("[node:b]\nlabel = \"Renamed\"\n", TextUpdate::Partial);
    REQUIRE(result.ok);

    const Workflow& doc = sync.document();
    REQUIRE(doc.nodes.size() == 3);
    REQUIRE(doc.find_node("b")->label == "Renamed");
    REQUIRE(doc.find_node("b")->position == Position{300, 100});
    REQUIRE(doc.find_node("b")->extra["color"] == "blue");
    REQUIRE(doc.find_node("c")->position == Position{640, 220});
    REQUIRE(doc.edges.size() == 2);
    REQUIRE(doc.workflow_id == "wf-sync");
}

TEST_CASE("Complete text update drops nodes missing from the text", "[sync][merge]") {
    FlowSynchronizer sync;
    REQUIRE(sync.apply_text(kPipeline).ok);

    REQUIRE(sync.apply_text("[workflow]\nname = \"Smaller\"\n[node:a]\n[node:b]\n[edges]\na = b\n").ok);
    REQUIRE(sync.document().nodes.size() == 2);
    REQUIRE_FALSE(sync.document().has_node("c"));
    REQUIRE(sync.graph().edges.size() == 1);
}

TEST_CASE("Failed updates keep the previous state", "[sync][errors]") {
    FlowSynchronizer sync;
    REQUIRE(sync.apply_text(kPipeline).ok);
    const std::string before = sync.text();
    const FlowGraph graph_before = sync.graph();

    auto result = sync.apply_text("this is not a workflow at all");
    REQUIRE_FALSE(result.ok);
    REQUIRE_FALSE(result.error.empty());
    REQUIRE_FALSE(sync.content_valid());
    REQUIRE(sync.text() == before);
    REQUIRE(sync.graph() == graph_before);

    // the next good update clears the flag
    REQUIRE(sync.apply_text(kPipeline).ok);
    REQUIRE(sync.content_valid());
}

TEST_CASE("Graph edits regenerate the text", "[sync][graph]") {
    FlowSynchronizer sync;
    REQUIRE(sync.apply_text(kPipeline).ok);

    REQUIRE(sync.move_node("a", Position{12.6, 40.2}).ok);
    REQUIRE(sync.text().find("position_x = 13") != std::string::npos);

    REQUIRE(sync.update_node_data("b", Value{{"label", "Bee"}, {"color", nullptr}, {"owner", "ops"}}).ok);
    WorkflowParser parser;
    auto reparsed = parser.parse_from_string(sync.text()).workflow;
    const WorkflowNode* b = reparsed.find_node("b");
    REQUIRE(b->label == "Bee");
    REQUIRE_FALSE(b->extra.contains("color"));
    REQUIRE(b->extra["owner"] == "ops");

    REQUIRE_FALSE(sync.move_node("ghost", Position{0, 0}).ok);
    REQUIRE(sync.content_valid());
}

TEST_CASE("Graph roles are recomputed after edits", "[sync][graph]") {
    FlowSynchronizer sync;
    REQUIRE(sync.apply_text(kPipeline).ok);
    REQUIRE(sync.graph().find_node("c")->data["role"] == "Output");

    REQUIRE(sync.add_edge("c", "a").ok);
    REQUIRE(sync.graph().find_node("c")->data["role"] == "Core");
}

TEST_CASE("Explicit edge deletion is not resurrected by raw edges", "[sync][edges]") {
    FlowSynchronizer sync;
    REQUIRE(sync.apply_text(kPipeline).ok);

    REQUIRE(sync.remove_edge("a", "b").ok);
    REQUIRE_FALSE(has_edge(sync.document().edges, "a", "b"));
    REQUIRE_FALSE(has_edge(sync.raw_edges(), "a", "b"));
    REQUIRE(has_edge(sync.removed_edges(), "a", "b"));

    // a later graph save still leaves it out
    REQUIRE(sync.move_node("c", Position{1, 1}).ok);
    REQUIRE(sync.text().find("a = b") == std::string::npos);

    // so does a stale streamed fragment that still carries the edge
    REQUIRE(sync.apply_text("[node:a]\n[edges]\na = b\n", TextUpdate::Partial).ok);
    REQUIRE_FALSE(has_edge(sync.document().edges, "a", "b"));

    // re-adding it explicitly restores it
    REQUIRE(sync.add_edge("a", "b").ok);
    REQUIRE(has_edge(sync.document().edges, "a", "b"));
    REQUIRE(sync.removed_edges().empty());
}

TEST_CASE("Edges to nodes not loaded yet survive partial updates", "[sync][edges]") {
    FlowSynchronizer sync;
    REQUIRE(sync.apply_text("[workflow]\nname = \"Streaming\"\n[node:a]\n[edges]\na = late\n").ok);
    REQUIRE(sync.document().edges.empty());
    REQUIRE(has_edge(sync.raw_edges(), "a", "late"));

    REQUIRE(sync.apply_text("[node:late]\n", TextUpdate::Partial).ok);
    REQUIRE(has_edge(sync.document().edges, "a", "late"));
    REQUIRE(sync.graph().edges.size() == 1);
}

TEST_CASE("Removing a node removes its edges", "[sync][graph]") {
    FlowSynchronizer sync;
    REQUIRE(sync.apply_text(kPipeline).ok);

    REQUIRE(sync.remove_node("b").ok);
    REQUIRE(sync.document().nodes.size() == 2);
    REQUIRE(sync.document().edges.empty());
    REQUIRE(sync.text().find("[node:b]") == std::string::npos);

    REQUIRE(sync.remove_node("a").ok);
    REQUIRE(sync.document().start_node == "c");
}

TEST_CASE("Multi-line node data survives graph edits", "[sync][graph]") {
    FlowSynchronizer sync;
    REQUIRE(sync.apply_text(kPipeline).ok);

    REQUIRE(sync.update_node_data("a", Value{{"label", "Multi\nline"}, {"note", "k\nstart_node = c"}}).ok);
    REQUIRE(sync.content_valid());

    WorkflowParser parser;
    auto reparsed = parser.parse_from_string(sync.text()).workflow;
    REQUIRE(reparsed == sync.document());
    REQUIRE(reparsed.find_node("a")->label == "Multi\nline");
    REQUIRE(reparsed.start_node == "a");
}

TEST_CASE("Graph edits that cannot be written as text are refused", "[sync][errors]") {
    FlowSynchronizer sync;
    REQUIRE(sync.apply_text(kPipeline).ok);
    const std::string before = sync.text();

    // an assignment key cannot contain '='
    auto result = sync.update_node_data("a", Value{{"left = right", "v"}});
    REQUIRE_FALSE(result.ok);
    REQUIRE_FALSE(sync.content_valid());
    REQUIRE(sync.text() == before);
}
