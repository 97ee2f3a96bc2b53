#include "execbox/tools/tool.hpp"

namespace execbox::tools {

auto ToolDefinition::input_schema() const -> json {
    json schema;
    schema["type"] = "object";

    json properties = json::object();
    json required_params = json::array();

    for (const auto& param : parameters) {
        json prop;
        prop["type"] = param.type;
        prop["description"] = param.description;

        if (param.default_value.has_value()) {
            prop["default"] = *param.default_value;
        }

        properties[param.name] = prop;

        if (param.required) {
            required_params.push_back(param.name);
        }
    }

    schema["properties"] = properties;
    if (!required_params.empty()) {
        schema["required"] = required_params;
    }
    return schema;
}

auto ToolDefinition::to_json() const -> json {
    return json{
        {"name", name},
        {"description", description},
        {"inputSchema", input_schema()},
    };
}

} // namespace execbox::tools
