// src/codec/workflow_validator.cpp
#include "actflow/codec/workflow_validator.h"
#include "actflow/codec/params_coercion.h"
#include <iostream>

namespace actflow {

namespace {

std::string join_reasons(const std::vector<std::string>& reasons) {
    std::string out;
    for (size_t i = 0; i < reasons.size(); ++i) {
        if (i > 0) out += "; ";
        out += reasons[i];
    }
    return out;
}

void fill_default(std::string& field, const std::string& fallback) {
    if (field.empty()) field = fallback;
}

} // namespace

WorkflowValidationError::WorkflowValidationError(std::vector<std::string> reasons)
    : std::runtime_error("Workflow validation failed: " + join_reasons(reasons)),
      reasons_(std::move(reasons)) {}

std::vector<std::string> WorkflowValidator::check(const Workflow& wf) const {
    std::vector<std::string> reasons;

    if (wf.name.empty()) {
        reasons.push_back("Workflow is missing 'name'");
    }
    if (wf.description.empty()) {
        reasons.push_back("Workflow is missing 'description'");
    }
    if (wf.nodes.empty()) {
        reasons.push_back("Workflow has no nodes");
    }
    for (const auto& node : wf.nodes) {
        if (node.type.empty()) {
            reasons.push_back("Node '" + node.id + "' is missing 'type'");
        }
        if (node.app_name.empty()) {
            reasons.push_back("Node '" + node.id + "' is missing 'app_name'");
        }
    }
    if (!wf.start_node.empty() && !wf.has_node(wf.start_node)) {
        reasons.push_back("start_node '" + wf.start_node + "' does not reference an existing node");
    }
    return reasons;
}

std::vector<std::string> WorkflowValidator::normalize(Workflow& wf) const {
    std::vector<std::string> notes;

    fill_default(wf.name, defaults::kWorkflowName);
    fill_default(wf.description, defaults::kWorkflowDescription);
    for (auto& node : wf.nodes) {
        fill_default(node.type, defaults::kNodeType);
        fill_default(node.app_name, defaults::kAppName);
        fill_default(node.label, node.id);
        fill_default(node.operation, defaults::kOperation);
        fill_default(node.operation_name, defaults::kOperationName);
        fill_default(node.mode, defaults::kMode);
        if (!node.params.is_object()) {
            node.params = coerce_to_mapping(node.params);
            notes.push_back("Node '" + node.id + "' params coerced to an object");
        }
    }

    auto valid = wf.valid_edges();
    if (valid.size() != wf.edges.size()) {
        for (const auto& e : wf.edges) {
            if (!wf.has_node(e.source) || !wf.has_node(e.target)) {
                notes.push_back("Dropped edge " + e.source + " -> " + e.target + " (unknown node)");
            }
        }
        wf.edges = std::move(valid);
    }

    if (wf.nodes.empty()) {
        notes.push_back("Workflow has no nodes");
    } else if (wf.start_node.empty() || !wf.has_node(wf.start_node)) {
        if (!wf.start_node.empty()) {
            notes.push_back("start_node '" + wf.start_node + "' not found, using '" + wf.nodes.front().id + "'");
        }
        wf.start_node = wf.nodes.front().id;
    }

    return notes;
}

void WorkflowValidator::validate(Workflow& wf) const {
    auto reasons = check(wf);
    if (!reasons.empty()) {
        throw WorkflowValidationError(std::move(reasons));
    }
    normalize(wf);
}

ParseResult parse_lenient(const std::string& text) {
    WorkflowParser parser;
    ParseResult result = parser.parse_from_string(text);
    if (!result.is_valid) {
        return result;
    }

    WorkflowValidator validator;
    for (auto& note : validator.normalize(result.workflow)) {
        std::cerr << "[WARNING] " << note << std::endl;
        result.warnings.push_back(std::move(note));
    }
    return result;
}

Workflow parse_strict(const std::string& text) {
    WorkflowParser parser;
    ParseResult result = parser.parse_from_string(text);
    if (!result.is_valid) {
        throw WorkflowValidationError(result.errors);
    }

    WorkflowValidator validator;
    validator.validate(result.workflow);
    return std::move(result.workflow);
}

} // namespace actflow
