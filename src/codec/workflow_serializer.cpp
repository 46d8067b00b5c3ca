// src/codec/workflow_serializer.cpp
#include "actflow/codec/workflow_serializer.h"
#include "common/utils/value_utils.h"
#include <sstream>

namespace actflow {

namespace {

void emit(std::ostringstream& out, const std::string& key, const Value& value) {
    if (value.is_null()) return;
    out << key << " = " << format_assignment_value(value) << "\n";
}

void emit_extras(std::ostringstream& out, const Value& extra) {
    if (!extra.is_object()) return;
    for (auto it = extra.begin(); it != extra.end(); ++it) {
        emit(out, it.key(), it.value());
    }
}

void emit_node(std::ostringstream& out, const WorkflowNode& node) {
    out << "\n[node:" << node.id << "]\n";
    emit(out, "type", node.type);
    emit(out, "label", node.label);
    out << "position_x = " << format_number(node.position.x) << "\n";
    out << "position_y = " << format_number(node.position.y) << "\n";
    emit(out, "operation", node.operation);
    emit(out, "operation_name", node.operation_name);
    emit(out, "app_name", node.app_name);
    emit(out, "mode", node.mode);
    emit(out, "params", node.params.is_object() ? node.params : Value::object());
    if (node.api_key) emit(out, "api_key", *node.api_key);
    if (node.token) emit(out, "slack_token", *node.token);
    if (node.method) emit(out, "method", *node.method);
    if (node.form_data) emit(out, "formData", *node.form_data);
    emit_extras(out, node.extra);
}

} // namespace

std::string format_assignment_value(const Value& value) {
    if (value.is_string()) {
        // escaped so a value never spans lines
        return value.dump(-1, ' ', false, Value::error_handler_t::replace);
    }
    if (value.is_number_float()) {
        return format_number(value.get<double>());
    }
    return value.dump();
}

std::string serialize_workflow(const Workflow& wf) {
    std::ostringstream out;

    out << "[workflow]\n";
    if (wf.workflow_id) emit(out, "workflow_id", *wf.workflow_id);
    emit(out, "name", wf.name);
    emit(out, "description", wf.description);
    if (!wf.start_node.empty()) emit(out, "start_node", wf.start_node);
    emit_extras(out, wf.extra);

    for (const auto& node : wf.nodes) {
        emit_node(out, node);
    }

    out << "\n[edges]\n";
    for (const auto& edge : wf.valid_edges()) {
        out << edge.source << " = " << edge.target << "\n";
    }

    if (wf.env.is_object() && !wf.env.empty()) {
        out << "\n[env]\n";
        for (auto it = wf.env.begin(); it != wf.env.end(); ++it) {
            out << it.key() << " = " << format_assignment_value(it.value()) << "\n";
        }
    }

    return out.str();
}

} // namespace actflow
