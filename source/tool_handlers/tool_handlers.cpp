#include "tool_handlers/tool_handlers.hpp"

// Forward declarations of individual tool registration functions.
// Each tool_*.cpp defines its own namespace with a register_tool() function.

namespace tool_cpu_info { void register_tool(mcp_tools::ToolRegistry &, tool_common::ToolEnvironment &); }
namespace tool_memory_info { void register_tool(mcp_tools::ToolRegistry &, tool_common::ToolEnvironment &); }
namespace tool_top_processes { void register_tool(mcp_tools::ToolRegistry &, tool_common::ToolEnvironment &); }
namespace tool_network_stats { void register_tool(mcp_tools::ToolRegistry &, tool_common::ToolEnvironment &); }
namespace tool_disk_info { void register_tool(mcp_tools::ToolRegistry &, tool_common::ToolEnvironment &); }
namespace tool_system_overview { void register_tool(mcp_tools::ToolRegistry &, tool_common::ToolEnvironment &); }

namespace tool_handlers {

void register_all_tools(mcp_tools::ToolRegistry &registry, tool_common::ToolEnvironment &environment) {
    tool_cpu_info::register_tool(registry, environment);
    tool_memory_info::register_tool(registry, environment);
    tool_top_processes::register_tool(registry, environment);
    tool_network_stats::register_tool(registry, environment);
    tool_disk_info::register_tool(registry, environment);
    tool_system_overview::register_tool(registry, environment);
}

} // namespace tool_handlers
