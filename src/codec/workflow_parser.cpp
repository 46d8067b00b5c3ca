// src/codec/workflow_parser.cpp
#include "actflow/codec/workflow_parser.h"
#include "actflow/codec/params_coercion.h"
#include "common/utils/value_utils.h"
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace actflow {

namespace {

void add_warning(ParseResult& result, const std::string& message) {
    std::cerr << "[WARNING] " << message << std::endl;
    result.warnings.push_back(message);
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.rfind(prefix, 0) == 0;
}

// A params value is kept only if it already yields a mapping
bool params_value_maps(const std::string& raw) {
    Value parsed = parse_scalar_value(raw);
    if (parsed.is_object()) return true;
    if (parsed.is_string()) {
        return matching_strategy(parsed.get<std::string>()).has_value();
    }
    return false;
}

double coerce_position(const Value& value) {
    if (value.is_number()) return value.get<double>();
    if (value.is_string()) {
        if (auto n = parse_number(trim(value.get<std::string>()))) {
            return n->get<double>();
        }
    }
    return 0.0;
}

} // namespace

Value parse_scalar_value(const std::string& raw) {
    std::string v = trim(raw);

    if (!v.empty() && (v.front() == '{' || v.front() == '[')) {
        Value parsed = Value::parse(v, nullptr, /*allow_exceptions=*/false);
        if (!parsed.is_discarded()) return parsed;
    }

    if (v.size() >= 2 && v.front() == '"' && v.back() == '"') {
        // JSON string escapes (\n, \", \\) as written by the serializer
        Value decoded = Value::parse(v, nullptr, /*allow_exceptions=*/false);
        if (decoded.is_string()) return decoded;
        return strip_quotes(v);
    }
    if (v.size() >= 2 && v.front() == '\'' && v.back() == '\'') {
        return strip_quotes(v);
    }

    if (v == "true") return true;
    if (v == "false") return false;

    if (auto number = parse_number(v)) {
        return *number;
    }

    return strip_surrounding_quotes(v);
}

bool is_workflow_content(const std::string& text) {
    if (text.empty()) return false;
    return text.find("[workflow]") != std::string::npos ||
           text.find("[node:") != std::string::npos ||
           (text.find("start_node") != std::string::npos && text.find("operation") != std::string::npos);
}

std::string WorkflowParser::repair(const std::string& content) {
    std::istringstream input(content);
    std::ostringstream output;
    std::string line;
    bool first = true;

    while (std::getline(input, line)) {
        if (!first) output << '\n';
        first = false;

        std::string trimmed = trim(line);
        size_t eq = trimmed.find('=');
        if (eq == std::string::npos || starts_with(trimmed, "#") || starts_with(trimmed, "[")) {
            output << line;
            continue;
        }

        std::string key = trim(trimmed.substr(0, eq));
        std::string value = trim(trimmed.substr(eq + 1));
        std::string indent = line.substr(0, line.find_first_not_of(" \t"));

        if (key == "params") {
            if (value == "\"\"" || value == "''" || !params_value_maps(value)) {
                output << indent << "params = {}";
                continue;
            }
        } else if (key == "position_x" || key == "position_y") {
            if (value.size() >= 2 &&
                ((value.front() == '"' && value.back() == '"') ||
                 (value.front() == '\'' && value.back() == '\''))) {
                std::string inner = trim(value.substr(1, value.size() - 2));
                if (is_numeric(inner)) {
                    output << indent << key << " = " << inner;
                    continue;
                }
            }
        }
        output << line;
    }
    // getline drops a trailing newline; keep it so repair(text) == text for clean input
    if (!content.empty() && content.back() == '\n') output << '\n';
    return output.str();
}

void WorkflowParser::apply_workflow_key(Workflow& wf, const std::string& key, const Value& value) {
    if (key == "workflow_id") {
        std::string id = scalar_to_string(value);
        wf.workflow_id = id.empty() ? std::nullopt : std::optional<std::string>(id);
    } else if (key == "name") {
        wf.name = scalar_to_string(value);
    } else if (key == "description") {
        wf.description = scalar_to_string(value);
    } else if (key == "start_node") {
        wf.start_node = scalar_to_string(value);
    } else {
        wf.extra[key] = value;
    }
}

void WorkflowParser::apply_node_key(WorkflowNode& node, const std::string& key, const Value& value) {
    if (key == "id") {
        return; // the section header is authoritative
    } else if (key == "type") {
        node.type = scalar_to_string(value);
    } else if (key == "label") {
        node.label = scalar_to_string(value);
    } else if (key == "position_x") {
        node.position.x = coerce_position(value);
    } else if (key == "position_y") {
        node.position.y = coerce_position(value);
    } else if (key == "operation") {
        node.operation = scalar_to_string(value);
    } else if (key == "operation_name") {
        node.operation_name = scalar_to_string(value);
    } else if (key == "app_name") {
        node.app_name = scalar_to_string(value);
    } else if (key == "mode") {
        node.mode = scalar_to_string(value);
    } else if (key == "params") {
        node.params = coerce_to_mapping(value);
    } else if (key == "api_key") {
        node.api_key = scalar_to_string(value);
    } else if (key == "slack_token") {
        node.token = scalar_to_string(value);
    } else if (key == "method") {
        node.method = scalar_to_string(value);
    } else if (key == "formData") {
        node.form_data = value;
    } else {
        node.extra[key] = value;
    }
}

ParseResult WorkflowParser::parse_from_string(const std::string& content, const Workflow* base) {
    ParseResult result;
    if (base) {
        result.workflow = *base;
    }

    try {
        std::string repaired = repair(content);
        std::istringstream input(repaired);
        std::string raw_line;
        size_t line_no = 0;

        Section section = Section::None;
        NodeId current_node;
        bool edges_seen = false;
        bool env_seen = false;
        Workflow& wf = result.workflow;

        while (std::getline(input, raw_line)) {
            ++line_no;
            std::string line = trim(raw_line);
            if (line.empty() || line.front() == '#') continue;

            if (line.front() == '[' && line.back() == ']') {
                std::string name = trim(line.substr(1, line.size() - 2));
                if (name == "workflow") {
                    section = Section::Workflow;
                } else if (name == "edges") {
                    section = Section::Edges;
                    // an [edges] section replaces the edge list of the base document
                    if (!edges_seen) wf.edges.clear();
                    edges_seen = true;
                } else if (name == "env") {
                    section = Section::Env;
                    if (!env_seen) wf.env = Value::object();
                    env_seen = true;
                } else if (starts_with(name, "node:")) {
                    current_node = trim(name.substr(5));
                    if (current_node.empty()) {
                        add_warning(result, "Line " + std::to_string(line_no) + ": node section without an id");
                        section = Section::Unknown;
                        continue;
                    }
                    section = Section::Node;
                    wf.upsert_node(current_node);
                    bool already_declared = false;
                    for (const auto& id : result.declared_nodes) {
                        if (id == current_node) { already_declared = true; break; }
                    }
                    if (!already_declared) result.declared_nodes.push_back(current_node);
                } else {
                    add_warning(result, "Line " + std::to_string(line_no) + ": unknown section [" + name + "]");
                    section = Section::Unknown;
                }
                continue;
            }

            size_t eq = line.find('=');
            if (eq == std::string::npos) {
                add_warning(result, "Line " + std::to_string(line_no) + ": ignoring line without assignment: " + line);
                continue;
            }

            std::string key = trim(line.substr(0, eq));
            std::string raw_value = trim(line.substr(eq + 1));
            if (key.empty()) {
                add_warning(result, "Line " + std::to_string(line_no) + ": assignment with an empty key");
                continue;
            }
            if (section == Section::None) {
                add_warning(result, "Line " + std::to_string(line_no) + ": assignment outside any section: " + key);
                continue;
            }
            if (section == Section::Unknown) continue;

            try {
                Value value = parse_scalar_value(raw_value);
                if (!raw_value.empty() && (raw_value.front() == '{' || raw_value.front() == '[') &&
                    value.is_string()) {
                    add_warning(result, "Line " + std::to_string(line_no) + ": malformed JSON for '" + key + "'");
                }

                switch (section) {
                    case Section::Workflow:
                        apply_workflow_key(wf, key, value);
                        break;
                    case Section::Node: {
                        WorkflowNode* node = wf.find_node(current_node);
                        if (!node) {
                            throw std::runtime_error("node '" + current_node + "' vanished during parsing");
                        }
                        apply_node_key(*node, key, value);
                        break;
                    }
                    case Section::Edges: {
                        std::string target = value.is_string() ? value.get<std::string>()
                                                               : strip_surrounding_quotes(raw_value);
                        if (target.empty()) {
                            add_warning(result, "Line " + std::to_string(line_no) + ": edge from '" + key + "' has no target");
                            break;
                        }
                        wf.edges.push_back(Edge{key, target});
                        break;
                    }
                    case Section::Env:
                        wf.env[key] = value.is_string() ? value.get<std::string>()
                                                        : strip_surrounding_quotes(raw_value);
                        break;
                    default:
                        break;
                }
            } catch (const std::exception& e) {
                add_warning(result, "Line " + std::to_string(line_no) + ": skipped '" + key + "': " + e.what());
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Failed to parse workflow: " << e.what() << std::endl;
        result.workflow = Workflow{};
        result.declared_nodes.clear();
        result.is_valid = false;
        result.errors.push_back(std::string("Parse failure: ") + e.what());
    }

    return result;
}

ParseResult WorkflowParser::parse_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + file_path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_from_string(buffer.str());
}

} // namespace actflow
