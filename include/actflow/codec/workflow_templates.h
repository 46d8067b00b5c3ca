// actflow/codec/workflow_templates.h
#ifndef ACTFLOW_CODEC_WORKFLOW_TEMPLATES_H
#define ACTFLOW_CODEC_WORKFLOW_TEMPLATES_H

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace actflow {

// Starter document for a new workflow: start, end and error_handler nodes
std::string render_base_template(const std::string& title);

// Renders an arbitrary workflow-language template (inja syntax, includes disabled)
std::string render_workflow_template(std::string_view template_str, const nlohmann::json& context);

} // namespace actflow

#endif // ACTFLOW_CODEC_WORKFLOW_TEMPLATES_H
