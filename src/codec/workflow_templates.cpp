// src/codec/workflow_templates.cpp
#include "actflow/codec/workflow_templates.h"
#include "common/utils/template_renderer.h"

namespace actflow {

namespace {

constexpr std::string_view kBaseTemplate = R"([workflow]
name = "{{ title }}"
description = "Workflow for {{ title }}"
start_node = "start"

[node:start]
type = "start"
label = "Start Process"
position_x = 100
position_y = 100
operation = "start"
app_name = "System"
operation_name = "startWorkflow"
params = {"initialized": true}
mode = "UC"

[node:end]
type = "end"
label = "End Process"
position_x = 1200
position_y = 600
operation = "end"
app_name = "System"
operation_name = "endWorkflow"
params = {"cleanup": true}
mode = "UC"

[node:error_handler]
type = "error"
label = "Error Handler"
position_x = 800
position_y = 400
operation = "error"
app_name = "System"
operation_name = "handleError"
params = {"retryCount": 3, "logLevel": "error"}
mode = "UC"

[edges]
start = end
start = error_handler
error_handler = end

[env]
{% for key, value in env %}{{ key }} = "{{ value }}"
{% endfor %})";

} // namespace

std::string render_base_template(const std::string& title) {
    nlohmann::json context;
    context["title"] = title;
    context["env"] = {
        {"ENVIRONMENT", "development"},
        {"ERROR_NOTIFICATION_CHANNEL", "errors"},
    };
    return InjaTemplateRenderer::render(kBaseTemplate, context);
}

std::string render_workflow_template(std::string_view template_str, const nlohmann::json& context) {
    return InjaTemplateRenderer::render(template_str, context);
}

} // namespace actflow
