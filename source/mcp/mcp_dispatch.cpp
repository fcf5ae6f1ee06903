#include "mcp/mcp_dispatch.hpp"
#include "utils/debug_log.hpp"
#include "utils/utf8_sanitize.hpp"

#include <exception>
#include <utility>

namespace mcp_dispatch {

static const std::string METHOD_INITIALIZE = "initialize";
static const std::string METHOD_INITIALIZED = "notifications/initialized";
static const std::string METHOD_INITIALIZED_LEGACY = "initialized";
static const std::string METHOD_TOOLS_LIST = "tools/list";
static const std::string METHOD_TOOLS_CALL = "tools/call";
static const std::string METHOD_PROMPTS_LIST = "prompts/list";
static const std::string METHOD_RESOURCES_LIST = "resources/list";
static const std::string METHOD_RESOURCES_READ = "resources/read";

Dispatcher::Dispatcher(ServerInfo server_info, const mcp_tools::ToolRegistry &registry)
    : server_info_(std::move(server_info)), registry_(registry) {}

json Dispatcher::dispatch(const json_rpc::Envelope &envelope) const {
    const std::string &method = envelope.method;
    const json &request_id = envelope.id;

    if (method == METHOD_INITIALIZE) {
        return handle_initialize(request_id);
    }
    if (method == METHOD_INITIALIZED || method == METHOD_INITIALIZED_LEGACY) {
        debug_log::log("Client reported initialized");
        return nullptr;
    }
    if (method == METHOD_TOOLS_LIST) {
        return handle_tools_list(request_id);
    }
    if (method == METHOD_TOOLS_CALL) {
        return handle_tools_call(request_id, envelope.params);
    }
    if (method == METHOD_PROMPTS_LIST) {
        return handle_prompts_list(request_id);
    }
    if (method == METHOD_RESOURCES_LIST) {
        return handle_resources_list(request_id);
    }
    if (method == METHOD_RESOURCES_READ) {
        return handle_resources_read(request_id);
    }

    return json_rpc::build_error_response(request_id, json_rpc::METHOD_NOT_FOUND,
                                           "Method not found: " + method);
}

json Dispatcher::handle_initialize(const json &request_id) const {
    json capabilities;
    capabilities["tools"]["listChanged"] = true;
    capabilities["resources"]["subscribe"] = false;
    capabilities["resources"]["listChanged"] = false;
    capabilities["prompts"]["listChanged"] = false;

    json server_info;
    server_info["name"] = server_info_.name;
    server_info["version"] = server_info_.version;

    json result;
    result["protocolVersion"] = PROTOCOL_VERSION;
    result["capabilities"] = capabilities;
    result["serverInfo"] = server_info;

    return json_rpc::build_response(request_id, result);
}

json Dispatcher::handle_tools_list(const json &request_id) const {
    return json_rpc::build_response(request_id, mcp_tools::build_tools_list_result(registry_));
}

json Dispatcher::handle_tools_call(const json &request_id, const json &params) const {
    if (!params.is_object()) {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS,
                                               "Invalid params: tools/call expects an object");
    }

    auto name_iterator = params.find("name");
    if (name_iterator == params.end() || !name_iterator->is_string()) {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS,
                                               "Invalid params: missing or invalid 'name'");
    }
    std::string tool_name = name_iterator->get<std::string>();

    json arguments = json::object();
    auto arguments_iterator = params.find("arguments");
    if (arguments_iterator != params.end() && !arguments_iterator->is_null()) {
        if (!arguments_iterator->is_object()) {
            return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS,
                                                   "Invalid params: 'arguments' must be an object");
        }
        arguments = *arguments_iterator;
    }

    mcp_tools::Tool *tool = registry_.lookup(tool_name);
    if (tool == nullptr) {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS,
                                               "Unknown tool: " + tool_name);
    }

    debug_log::log(tool_name + " invoked");
    mcp_tools::ToolOutcome outcome;
    try {
        outcome = tool->execute(arguments);
    } catch (const std::exception &error) {
        outcome = mcp_tools::tool_failure(error.what());
    }
    if (!outcome.success) {
        debug_log::log(tool_name + " failed: " + outcome.error_detail);
    }

    return json_rpc::build_response(request_id, build_tool_call_result(outcome));
}

json Dispatcher::handle_prompts_list(const json &request_id) const {
    json result;
    result["prompts"] = json::array();
    return json_rpc::build_response(request_id, result);
}

json Dispatcher::handle_resources_list(const json &request_id) const {
    json result;
    result["resources"] = json::array();
    return json_rpc::build_response(request_id, result);
}

json Dispatcher::handle_resources_read(const json &request_id) const {
    return json_rpc::build_error_response(request_id, json_rpc::METHOD_NOT_FOUND,
                                           "Resource reading not implemented");
}

json build_tool_call_result(const mcp_tools::ToolOutcome &outcome) {
    json text_content;
    text_content["type"] = "text";

    json result;
    if (outcome.success) {
        text_content["text"] = utf8_sanitize::sanitize(outcome.text);
    } else {
        text_content["text"] = TOOL_FAILURE_PREFIX + utf8_sanitize::sanitize(outcome.error_detail);
        result["isError"] = true;
    }
    result["content"] = json::array({text_content});
    return result;
}

} // namespace mcp_dispatch
