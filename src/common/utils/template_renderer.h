#ifndef ACTFLOW_COMMON_UTILS_TEMPLATE_RENDERER_H
#define ACTFLOW_COMMON_UTILS_TEMPLATE_RENDERER_H

#include <inja/inja.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <filesystem> // Required by Inja for set_include_callback

namespace actflow {

// Renders workflow-language templates. Includes are disabled so a template
// can never pull files from disk.
class InjaTemplateRenderer {
public:
    InjaTemplateRenderer();

    // Shared default environment
    static std::string render(std::string_view template_str, const nlohmann::json& context);

    std::string render_with_env(std::string_view template_str, const nlohmann::json& context);

private:
    inja::Environment env_;
    void configure_security();
};

} // namespace actflow

#endif // ACTFLOW_COMMON_UTILS_TEMPLATE_RENDERER_H
