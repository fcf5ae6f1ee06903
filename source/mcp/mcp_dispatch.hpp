#ifndef SYSMCPS_MCP_DISPATCH_HPP
#define SYSMCPS_MCP_DISPATCH_HPP

// MCP JSON-RPC method dispatch.
// Routes a parsed envelope to the protocol operation named by its method.

#include "mcp/mcp_tools.hpp"
#include "protocol/json_rpc.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace mcp_dispatch {

using json = nlohmann::json;

// Protocol version advertised in the initialize result.
constexpr const char *PROTOCOL_VERSION = "2024-11-05";

// Prefix of the text content returned when a tool fails.
constexpr const char *TOOL_FAILURE_PREFIX = "Error: ";

struct ServerInfo {
    std::string name;
    std::string version;
};

class Dispatcher {
public:
    Dispatcher(ServerInfo server_info, const mcp_tools::ToolRegistry &registry);

    // Returns the response for envelope, or a null json when the method never
    // answers (initialized notification). The caller suppresses responses to
    // notifications regardless of what is returned here.
    json dispatch(const json_rpc::Envelope &envelope) const;

private:
    json handle_initialize(const json &request_id) const;
    json handle_tools_list(const json &request_id) const;
    json handle_tools_call(const json &request_id, const json &params) const;
    json handle_prompts_list(const json &request_id) const;
    json handle_resources_list(const json &request_id) const;
    json handle_resources_read(const json &request_id) const;

    ServerInfo server_info_;
    const mcp_tools::ToolRegistry &registry_;
};

// Build the tools/call result payload for a finished tool execution.
json build_tool_call_result(const mcp_tools::ToolOutcome &outcome);

} // namespace mcp_dispatch

#endif // SYSMCPS_MCP_DISPATCH_HPP
