#ifndef SYSMCPS_MCP_TOOLS_HPP
#define SYSMCPS_MCP_TOOLS_HPP

// MCP tool contract and registry: registration, lookup and listing of tools.

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace mcp_tools {

using json = nlohmann::json;

// Outcome of a tool execution. On failure, error_detail explains why and text is ignored.
struct ToolOutcome {
    bool success = false;
    std::string text;
    std::string error_detail;
};

ToolOutcome tool_success(std::string text);
ToolOutcome tool_failure(std::string error_detail);

// One property of a tool's input schema. All properties are strings on the wire;
// enum_values and default_value are documentation for the client only.
struct SchemaProperty {
    std::string name;
    std::string description;
    std::vector<std::string> enum_values;
    std::string default_value;
    std::string type = "string";
};

// Build {"type":"object","properties":{...}} from a property table.
json build_input_schema(const std::vector<SchemaProperty> &properties);

// A named, independently invokable unit of functionality.
class Tool {
public:
    virtual ~Tool() = default;

    virtual std::string name() const = 0;
    virtual std::string description() const = 0;
    virtual json input_schema() const = 0;

    // arguments is always a JSON object. Blocking.
    virtual ToolOutcome execute(const json &arguments) = 0;
};

// Descriptor projected from a tool for tools/list.
struct ToolDescriptor {
    std::string name;
    std::string description;
    json input_schema;
};

// Name -> tool mapping. Populated during startup, read-only afterwards; not synchronized.
class ToolRegistry {
public:
    // Insert or replace by tool->name().
    void register_tool(std::unique_ptr<Tool> tool);

    // Returns nullptr when no tool has that name.
    Tool *lookup(const std::string &tool_name) const;

    std::vector<ToolDescriptor> list() const;

    std::size_t size() const { return tools_.size(); }

private:
    std::map<std::string, std::unique_ptr<Tool>> tools_;
};

// Payload for tools/list.
json build_tools_list_result(const ToolRegistry &registry);

} // namespace mcp_tools

#endif // SYSMCPS_MCP_TOOLS_HPP
