// tests/test_serializer.cpp
#include <catch2/catch.hpp>
#include "actflow/codec/workflow_parser.h"
#include "actflow/codec/workflow_serializer.h"
#include "actflow/codec/workflow_validator.h"

using namespace actflow;

namespace {

Workflow sample_workflow() {
    Workflow wf;
    wf.workflow_id = "wf-7";
    wf.name = "Release notes";
    wf.description = "Collect merged PRs and post a summary";
    wf.start_node = "collect";
    wf.extra["version"] = 2;

    WorkflowNode collect("collect");
    collect.type = "start";
    collect.label = "Collect PRs";
    collect.position = Position{100, 50.25};
    collect.operation = "list_pulls";
    collect.operation_name = "listPulls";
    collect.app_name = "GitHub";
    collect.params = Value{{"state", "closed"}, {"limit", 50}, {"labels", Value::array({"release"})}};
    collect.api_key = "{{GITHUB_TOKEN}}";
    collect.extra["retries"] = 3;
    collect.extra["dry_run"] = false;

    WorkflowNode post("post");
    post.type = "end";
    post.label = "Post \"summary\"";
    post.position = Position{400, 300};
    post.app_name = "Slack";
    post.token = "xoxb-secret";
    post.method = "POST";
    post.form_data = Value{{"channel", "#releases"}};
    post.extra["note"] = "ends with = sign =";

    wf.nodes.push_back(collect);
    wf.nodes.push_back(post);
    wf.edges.push_back(Edge{"collect", "post"});
    wf.env["SLACK_CHANNEL"] = "#releases";
    wf.env["GITHUB_TOKEN"] = "${GITHUB_TOKEN}";
    return wf;
}

} // namespace

TEST_CASE("Serialized documents parse back to the same model", "[serializer][roundtrip]") {
    Workflow original = sample_workflow();
    std::string text = serialize_workflow(original);

    WorkflowParser parser;
    auto reparsed = parser.parse_from_string(text);
    REQUIRE(reparsed.is_valid);
    REQUIRE(reparsed.warnings.empty());
    REQUIRE(reparsed.workflow == original);

    // and the text itself is a fixed point
    REQUIRE(serialize_workflow(reparsed.workflow) == text);
}

TEST_CASE("Lenient parse output round-trips", "[serializer][roundtrip]") {
    auto first = parse_lenient(R"(
[workflow]
name = "Messy"
[node:a]
params = "k:v"
position_x = "12"
[node:b]
type = decision
[edges]
a = b
b = ghost
)");
    REQUIRE(first.is_valid);

    std::string text = serialize_workflow(first.workflow);
    auto second = parse_lenient(text);
    REQUIRE(second.workflow == first.workflow);
}

TEST_CASE("Node blocks use a fixed key order", "[serializer]") {
    Workflow wf;
    WorkflowNode n("step");
    n.extra["zeta"] = "last";
    wf.nodes.push_back(n);
    wf.start_node = "step";

    const std::string expected =
        "[workflow]\n"
        "name = \"Untitled Workflow\"\n"
        "description = \"No description provided\"\n"
        "start_node = \"step\"\n"
        "\n"
        "[node:step]\n"
        "type = \"process\"\n"
        "label = \"step\"\n"
        "position_x = 0\n"
        "position_y = 0\n"
        "operation = \"process\"\n"
        "operation_name = \"process\"\n"
        "app_name = \"System\"\n"
        "mode = \"UC\"\n"
        "params = {}\n"
        "zeta = \"last\"\n"
        "\n"
        "[edges]\n";

    REQUIRE(serialize_workflow(wf) == expected);
}

TEST_CASE("Edges to unknown nodes are not serialized", "[serializer]") {
    Workflow wf;
    wf.nodes.emplace_back("a");
    wf.nodes.emplace_back("b");
    wf.edges = {Edge{"a", "b"}, Edge{"a", "z"}, Edge{"q", "b"}};

    std::string text = serialize_workflow(wf);
    REQUIRE(text.find("a = b\n") != std::string::npos);
    REQUIRE(text.find("a = z") == std::string::npos);
    REQUIRE(text.find("q = b") == std::string::npos);
    REQUIRE(text.find("[env]") == std::string::npos);
}

TEST_CASE("Null extras are skipped", "[serializer]") {
    Workflow wf;
    wf.nodes.emplace_back("a");
    wf.nodes.back().extra["gone"] = nullptr;

    REQUIRE(serialize_workflow(wf).find("gone") == std::string::npos);
}

TEST_CASE("Assignment values are formatted by type", "[serializer]") {
    REQUIRE(format_assignment_value(Value("text")) == "\"text\"");
    REQUIRE(format_assignment_value(Value("a\nb")) == R"("a\nb")");
    REQUIRE(format_assignment_value(Value(3)) == "3");
    REQUIRE(format_assignment_value(Value(100.0)) == "100");
    REQUIRE(format_assignment_value(Value(2.5)) == "2.5");
    REQUIRE(format_assignment_value(Value(true)) == "true");
    REQUIRE(format_assignment_value(Value{{"a", 1}}) == R"({"a":1})");
}

TEST_CASE("Strings with line breaks, quotes and backslashes round-trip", "[serializer][roundtrip]") {
    Workflow wf;
    wf.name = "Nightly\nbuild";
    wf.env["WINDOWS_PATH"] = "C:\\tools\\bin";

    WorkflowNode a("a");
    a.label = "Line one\nLine two";
    a.extra["note"] = "x\ny = 5";
    a.extra["quote"] = "say \"hi\"";
    wf.nodes.push_back(a);
    wf.start_node = "a";

    std::string text = serialize_workflow(wf);
    REQUIRE(text.find("label = \"Line one\\nLine two\"\n") != std::string::npos);

    WorkflowParser parser;
    auto reparsed = parser.parse_from_string(text);
    REQUIRE(reparsed.warnings.empty());
    REQUIRE(reparsed.workflow == wf);

    const WorkflowNode* back = reparsed.workflow.find_node("a");
    REQUIRE(back->label == "Line one\nLine two");
    REQUIRE_FALSE(back->extra.contains("y"));
    REQUIRE(back->extra["quote"] == "say \"hi\"");
    REQUIRE(reparsed.workflow.env["WINDOWS_PATH"] == "C:\\tools\\bin");
}
