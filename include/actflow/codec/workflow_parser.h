// actflow/codec/workflow_parser.h
#ifndef ACTFLOW_CODEC_WORKFLOW_PARSER_H
#define ACTFLOW_CODEC_WORKFLOW_PARSER_H

#include "actflow/core/types.h"
#include <string>
#include <vector>

namespace actflow {

struct ParseResult {
    Workflow workflow;
    bool is_valid = true;              // false only when parsing itself failed
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    std::vector<NodeId> declared_nodes; // [node:ID] sections seen in this text, in order
};

class WorkflowParser {
public:
    // Structural parse only: no defaults repair, no edge filtering.
    // When `base` is given, the text is overlaid onto a copy of it: node sections merge
    // into the existing records and nodes the text does not mention are kept.
    ParseResult parse_from_string(const std::string& content, const Workflow* base = nullptr);
    ParseResult parse_from_file(const std::string& file_path);

    // Line-level fixes for malformed params and quoted positions. Idempotent.
    static std::string repair(const std::string& content);

private:
    enum class Section { None, Workflow, Node, Edges, Env, Unknown };

    void apply_workflow_key(Workflow& wf, const std::string& key, const Value& value);
    void apply_node_key(WorkflowNode& node, const std::string& key, const Value& value);
};

// Value grammar of the right-hand side of `key = value`:
// JSON object/array, quoted string, true/false, number, raw string.
Value parse_scalar_value(const std::string& raw);

// Cheap check for workflow-language text
bool is_workflow_content(const std::string& text);

} // namespace actflow

#endif // ACTFLOW_CODEC_WORKFLOW_PARSER_H
