#ifndef SYSMCPS_TOOL_HANDLERS_HPP
#define SYSMCPS_TOOL_HANDLERS_HPP

// Tool handler registration.
// Each tool_*.cpp file provides a register function that is called during startup.

#include "mcp/mcp_tools.hpp"
#include "tool_handlers/tool_common.hpp"

namespace tool_handlers {

// Register every metric tool with the registry. environment must outlive it.
void register_all_tools(mcp_tools::ToolRegistry &registry, tool_common::ToolEnvironment &environment);

} // namespace tool_handlers

#endif // SYSMCPS_TOOL_HANDLERS_HPP
