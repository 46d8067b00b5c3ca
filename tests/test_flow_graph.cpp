// tests/test_flow_graph.cpp
#include <catch2/catch.hpp>
#include "actflow/codec/workflow_parser.h"
#include "actflow/codec/workflow_validator.h"
#include "actflow/graph/flow_graph.h"

using namespace actflow;

namespace {

Workflow diamond() {
    return parse_lenient(R"(
[workflow]
name = "Diamond"
start_node = src
[node:src]
type = "start"
position_x = 10.4
position_y = 20.6
params = {"q": 1}
[node:left]
[node:right]
api_key = "k"
color = "red"
[node:sink]
type = "end"
[node:lonely]
type = ""
[edges]
src = left
src = right
left = sink
right = sink
)").workflow;
}

} // namespace

TEST_CASE("Roles follow connectivity", "[graph][roles]") {
    std::vector<Edge> edges = {{"a", "b"}, {"b", "c"}};

    REQUIRE(determine_role("a", edges, "") == NodeRole::Input);
    REQUIRE(determine_role("b", edges, "") == NodeRole::Core);
    REQUIRE(determine_role("c", edges, "") == NodeRole::Output);
    REQUIRE(determine_role("d", edges, "") == NodeRole::Default);

    // the start node is always an input
    REQUIRE(determine_role("c", edges, "c") == NodeRole::Input);
}

TEST_CASE("to_graph builds one graph node per document node", "[graph]") {
    FlowGraph graph = to_graph(diamond());

    REQUIRE(graph.nodes.size() == 5);
    REQUIRE(graph.edges.size() == 4);

    const GraphNode* src = graph.find_node("src");
    REQUIRE(src->type == "start");
    REQUIRE(src->position == Position{10.4, 20.6});
    REQUIRE(src->data["role"] == "Input");
    REQUIRE(src->data["params"]["q"] == 1);
    REQUIRE(src->data["label"] == "src");

    REQUIRE(graph.find_node("left")->data["role"] == "Core");
    REQUIRE(graph.find_node("sink")->data["role"] == "Output");
    REQUIRE(graph.find_node("right")->data["api_key"] == "k");
    REQUIRE(graph.find_node("right")->data["color"] == "red");

    // lenient parse restored the type, so nothing falls back here
    REQUIRE(graph.find_node("lonely")->type == "process");
    REQUIRE(graph.find_node("lonely")->data["role"] == "Default");

    const GraphEdge& first = graph.edges.front();
    REQUIRE(first.id == "e-src-left");
    REQUIRE(first.source_handle == "right");
    REQUIRE(first.target_handle == "left");
}

TEST_CASE("Empty node types fall back to the default graph type", "[graph]") {
    Workflow wf;
    wf.nodes.emplace_back("raw");
    wf.nodes.back().type = "";

    REQUIRE(to_graph(wf).nodes[0].type == "default");
}

TEST_CASE("Role assignment is deterministic", "[graph][roles]") {
    Workflow wf = diamond();
    REQUIRE(to_graph(wf) == to_graph(wf));
}

TEST_CASE("to_document writes graph state back as text", "[graph]") {
    Workflow wf = diamond();
    FlowGraph graph = to_graph(wf);
    graph.find_node("left")->data["onNodeDataChange"] = "handler";
    graph.find_node("left")->data["nodeKind"] = "Core";
    graph.find_node("left")->data["allNodes"] = Value::array();

    std::string text = to_document(graph, wf);
    REQUIRE(text.find("role") == std::string::npos);
    REQUIRE(text.find("nodeKind") == std::string::npos);
    REQUIRE(text.find("onNodeDataChange") == std::string::npos);
    REQUIRE(text.find("allNodes") == std::string::npos);
    REQUIRE(text.find("color = \"red\"") != std::string::npos);

    auto back = parse_lenient(text).workflow;
    REQUIRE(back.nodes.size() == 5);
    REQUIRE(back.edges.size() == 4);
    REQUIRE(back.find_node("src")->position == Position{10, 21});
    REQUIRE(back.find_node("right")->api_key == "k");
    REQUIRE(back.find_node("right")->extra["color"] == "red");
    REQUIRE(back.name == "Diamond");
}

TEST_CASE("to_document coerces params and fills required fields", "[graph]") {
    FlowGraph graph;
    GraphNode node;
    node.id = "n";
    node.type = "process";
    node.data = Value{{"params", "x:1"}};
    graph.nodes.push_back(node);

    Workflow wf = graph_to_workflow(graph, Workflow{});
    REQUIRE(wf.nodes[0].params["x"] == "1");
    REQUIRE(wf.nodes[0].label == "n");
    REQUIRE(wf.nodes[0].app_name == "System");
    REQUIRE(wf.nodes[0].mode == "UC");
}

TEST_CASE("Raw edges are merged unless explicitly removed", "[graph][edges]") {
    Workflow wf = diamond();
    FlowGraph graph = to_graph(wf);
    graph.edges.clear(); // e.g. a stale view that never loaded the edges

    std::vector<Edge> raw = wf.edges;
    std::vector<Edge> removed = {Edge{"right", "sink"}};

    Workflow merged = graph_to_workflow(graph, wf, raw, removed);
    REQUIRE(merged.edges.size() == 3);
    for (const auto& e : merged.edges) {
        REQUIRE_FALSE((e.source == "right" && e.target == "sink"));
    }
}
