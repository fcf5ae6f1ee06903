#include "mcp/mcp_stdio.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <string>

namespace mcp_stdio {

using json = nlohmann::json;

bool process_line(const std::string &line, const mcp_dispatch::Dispatcher &dispatcher,
                  std::string &response_line) {
    if (line.empty()) {
        return false;
    }

    // Generic parse first so an id can be recovered from a malformed envelope.
    json message = json::parse(line, nullptr, false);
    if (message.is_discarded()) {
        debug_log::log("Dropping line that is not JSON");
        return false;
    }

    json_rpc::EnvelopeParseResult parsed = json_rpc::parse_envelope(message);
    if (!parsed.success) {
        json request_id;
        if (!json_rpc::recover_id(message, request_id)) {
            debug_log::log("Dropping malformed message without id: " + parsed.error_detail);
            return false;
        }
        response_line = json_rpc::serialize(json_rpc::build_error_response(
            request_id, json_rpc::PARSE_ERROR, "Parse error: " + parsed.error_detail));
        return true;
    }

    bool notification = json_rpc::is_notification(parsed.envelope);
    json response = dispatcher.dispatch(parsed.envelope);

    // Notifications are never answered, whatever the handler built.
    if (response.is_null() || notification) {
        return false;
    }

    response_line = json_rpc::serialize(response);
    return true;
}

LoopResult run_message_loop(std::istream &input, std::ostream &output,
                            const mcp_dispatch::Dispatcher &dispatcher,
                            const std::atomic<bool> &stop_requested) {
    LoopResult result;
    std::string line;

    while (!stop_requested.load()) {
        if (!std::getline(input, line)) {
            if (stop_requested.load()) {
                break;
            }
            if (input.bad() || !input.eof()) {
                result.error_detail = "error reading input stream";
                return result;
            }
            debug_log::log("EOF on input. Leaving message loop.");
            result.success = true;
            return result;
        }
        result.lines_read++;

        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        std::string response_line;
        if (!process_line(line, dispatcher, response_line)) {
            continue;
        }
        // A failed output stream stays failed; the client is gone.
        if (!write_message(output, response_line)) {
            result.error_detail = "error writing output stream";
            return result;
        }
        result.responses_written++;
    }

    result.success = true;
    result.stopped_by_request = true;
    return result;
}

bool write_message(std::ostream &output, const std::string &json_line) {
    output << json_line << '\n';
    output.flush();
    return static_cast<bool>(output);
}

void log_message(const std::string &message) {
    std::cerr << "[sysmcps] " << message << std::endl;
}

} // namespace mcp_stdio
