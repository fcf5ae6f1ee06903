#ifndef SYSMCPS_MCP_STDIO_HPP
#define SYSMCPS_MCP_STDIO_HPP

// MCP stdio transport: one JSON-RPC message per input line, one response per output line.
// Diagnostics go to stderr, never to the output stream.

#include "mcp/mcp_dispatch.hpp"

#include <atomic>
#include <cstddef>
#include <iosfwd>
#include <string>

namespace mcp_stdio {

struct LoopResult {
    bool success = false;
    bool stopped_by_request = false;
    std::size_t lines_read = 0;
    std::size_t responses_written = 0;
    std::string error_detail;
};

// Handle one input line. Returns true and fills response_line when a response
// must be written; false for empty lines, notifications and unanswerable input.
bool process_line(const std::string &line, const mcp_dispatch::Dispatcher &dispatcher,
                  std::string &response_line);

// Read, dispatch and answer lines until input is exhausted, stop_requested is
// set, or either stream fails. Blocks on each read.
LoopResult run_message_loop(std::istream &input, std::ostream &output,
                            const mcp_dispatch::Dispatcher &dispatcher,
                            const std::atomic<bool> &stop_requested);

// Write one response line followed by '\n' and flush. Returns false if the stream failed.
bool write_message(std::ostream &output, const std::string &json_line);

// Write an operator-facing message to stderr.
void log_message(const std::string &message);

} // namespace mcp_stdio

#endif // SYSMCPS_MCP_STDIO_HPP
