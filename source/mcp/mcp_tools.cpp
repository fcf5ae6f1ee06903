#include "mcp/mcp_tools.hpp"

#include <utility>

namespace mcp_tools {

ToolOutcome tool_success(std::string text) {
    ToolOutcome outcome;
    outcome.success = true;
    outcome.text = std::move(text);
    return outcome;
}

ToolOutcome tool_failure(std::string error_detail) {
    ToolOutcome outcome;
    outcome.success = false;
    outcome.error_detail = std::move(error_detail);
    return outcome;
}

json build_input_schema(const std::vector<SchemaProperty> &properties) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();

    for (const auto &property : properties) {
        json property_entry;
        property_entry["type"] = property.type;
        property_entry["description"] = property.description;
        if (!property.enum_values.empty()) {
            property_entry["enum"] = property.enum_values;
        }
        property_entry["default"] = property.default_value;
        input_schema["properties"][property.name] = property_entry;
    }

    return input_schema;
}

void ToolRegistry::register_tool(std::unique_ptr<Tool> tool) {
    if (!tool) {
        return;
    }
    std::string tool_name = tool->name();
    tools_[tool_name] = std::move(tool);
}

Tool *ToolRegistry::lookup(const std::string &tool_name) const {
    auto iterator = tools_.find(tool_name);
    if (iterator == tools_.end()) {
        return nullptr;
    }
    return iterator->second.get();
}

std::vector<ToolDescriptor> ToolRegistry::list() const {
    std::vector<ToolDescriptor> descriptors;
    descriptors.reserve(tools_.size());
    for (const auto &entry : tools_) {
        descriptors.push_back({entry.second->name(), entry.second->description(), entry.second->input_schema()});
    }
    return descriptors;
}

json build_tools_list_result(const ToolRegistry &registry) {
    json tools_array = json::array();
    for (const auto &descriptor : registry.list()) {
        json tool_entry;
        tool_entry["name"] = descriptor.name;
        tool_entry["description"] = descriptor.description;
        tool_entry["inputSchema"] = descriptor.input_schema;
        tools_array.push_back(tool_entry);
    }

    json result;
    result["tools"] = tools_array;
    return result;
}

} // namespace mcp_tools
