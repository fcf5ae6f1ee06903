// Tests for MCP method dispatch against a registry of fake tools.

#include "fake_tools.hpp"
#include "mcp/mcp_dispatch.hpp"
#include "protocol/json_rpc.hpp"
#include "test_support.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

using json = nlohmann::json;
using test_support::expect;

namespace test_dispatch {

static json_rpc::Envelope make_request(const json &request_id, const std::string &method,
                                       const json &params = nullptr) {
    json_rpc::Envelope envelope;
    envelope.has_id = true;
    envelope.id = request_id;
    envelope.method = method;
    envelope.params = params;
    return envelope;
}

static void register_fake_tools(mcp_tools::ToolRegistry &registry) {
    registry.register_tool(std::make_unique<fake_tools::EchoTool>());
    registry.register_tool(std::make_unique<fake_tools::FailingTool>());
    registry.register_tool(std::make_unique<fake_tools::ThrowingTool>());
}

static bool test_initialize() {
    mcp_tools::ToolRegistry registry;
    mcp_dispatch::Dispatcher dispatcher({"sysmcps-test", "9.9.9"}, registry);

    json response = dispatcher.dispatch(make_request(1, "initialize", json::object()));
    const json &result = response["result"];

    bool success = expect(response["id"] == 1 && !response.contains("error"), "initialize succeeds");
    success &= expect(result["protocolVersion"] == "2024-11-05", "protocol version is advertised");
    success &= expect(result["serverInfo"]["name"] == "sysmcps-test" && result["serverInfo"]["version"] == "9.9.9",
                      "server info reflects configuration");
    success &= expect(result["capabilities"]["tools"]["listChanged"] == true &&
                          result["capabilities"]["resources"]["subscribe"] == false &&
                          result["capabilities"]["prompts"]["listChanged"] == false,
                      "capabilities are advertised");
    return success;
}

static bool test_initialized_notification_has_no_response() {
    mcp_tools::ToolRegistry registry;
    mcp_dispatch::Dispatcher dispatcher({"s", "1"}, registry);

    json_rpc::Envelope notification;
    notification.method = "notifications/initialized";
    bool success = expect(dispatcher.dispatch(notification).is_null(), "initialized notification yields nothing");

    notification.method = "initialized";
    success &= expect(dispatcher.dispatch(notification).is_null(), "legacy initialized alias yields nothing");
    return success;
}

static bool test_tools_list() {
    mcp_tools::ToolRegistry registry;
    register_fake_tools(registry);
    mcp_dispatch::Dispatcher dispatcher({"s", "1"}, registry);

    json response = dispatcher.dispatch(make_request("list", "tools/list"));
    return expect(response["id"] == "list" && response["result"]["tools"].size() == registry.size(),
                  "tools/list returns one descriptor per registered tool");
}

static bool test_tools_call_success() {
    mcp_tools::ToolRegistry registry;
    register_fake_tools(registry);
    mcp_dispatch::Dispatcher dispatcher({"s", "1"}, registry);

    json params = {{"name", "echo"}, {"arguments", {{"message", "hello"}}}};
    json response = dispatcher.dispatch(make_request(5, "tools/call", params));
    const json &result = response["result"];

    bool success = expect(response["id"] == 5 && !response.contains("error"), "successful call has a result");
    success &= expect(result["content"].size() == 1 && result["content"][0]["type"] == "text" &&
                          result["content"][0]["text"] == "echo: hello",
                      "tool text is returned as a single text content item");
    success &= expect(!result.contains("isError"), "isError is omitted on success");
    return success;
}

static bool test_tools_call_without_arguments() {
    mcp_tools::ToolRegistry registry;
    auto echo = std::make_unique<fake_tools::EchoTool>();
    fake_tools::EchoTool *echo_tool = echo.get();
    registry.register_tool(std::move(echo));
    mcp_dispatch::Dispatcher dispatcher({"s", "1"}, registry);

    json response = dispatcher.dispatch(make_request(6, "tools/call", {{"name", "echo"}}));
    bool success = expect(!response.contains("error"), "call without arguments succeeds");
    success &= expect(echo_tool->last_arguments.is_object() && echo_tool->last_arguments.empty(),
                      "tool receives an empty argument object");

    response = dispatcher.dispatch(make_request(7, "tools/call", {{"name", "echo"}, {"arguments", nullptr}}));
    success &= expect(!response.contains("error"), "null arguments are treated as empty");
    return success;
}

static bool test_tool_failures_are_results() {
    mcp_tools::ToolRegistry registry;
    register_fake_tools(registry);
    mcp_dispatch::Dispatcher dispatcher({"s", "1"}, registry);

    json failed = dispatcher.dispatch(make_request(8, "tools/call", {{"name", "failing"}}));
    bool success = expect(!failed.contains("error") && failed["result"]["isError"] == true,
                          "failing tool is reported in the result");
    success &= expect(failed["result"]["content"][0]["text"] == "Error: sensor unavailable",
                      "failure text carries the error prefix and detail");

    json thrown = dispatcher.dispatch(make_request(9, "tools/call", {{"name", "throwing"}}));
    success &= expect(!thrown.contains("error") && thrown["result"]["isError"] == true &&
                          thrown["result"]["content"][0]["text"] == "Error: collector exploded",
                      "throwing tool is reported in the result");
    return success;
}

static bool test_tools_call_invalid_params() {
    mcp_tools::ToolRegistry registry;
    register_fake_tools(registry);
    mcp_dispatch::Dispatcher dispatcher({"s", "1"}, registry);

    json unknown = dispatcher.dispatch(make_request("u-1", "tools/call", {{"name", "does_not_exist"}}));
    bool success = expect(unknown["id"] == "u-1" && unknown["error"]["code"] == -32602 &&
                              unknown["error"]["message"] == "Unknown tool: does_not_exist",
                          "unknown tool is an invalid params error with the same id");

    json no_params = dispatcher.dispatch(make_request(10, "tools/call"));
    success &= expect(no_params["error"]["code"] == -32602, "missing params are rejected");

    json bad_name = dispatcher.dispatch(make_request(11, "tools/call", {{"name", 42}}));
    success &= expect(bad_name["error"]["code"] == -32602, "non-string name is rejected");

    json bad_arguments = dispatcher.dispatch(make_request(12, "tools/call", {{"name", "echo"}, {"arguments", "x"}}));
    success &= expect(bad_arguments["error"]["code"] == -32602, "non-object arguments are rejected");

    json array_params = dispatcher.dispatch(make_request(13, "tools/call", json::array({"echo"})));
    success &= expect(array_params["error"]["code"] == -32602, "array params are rejected");
    return success;
}

static bool test_prompts_and_resources() {
    mcp_tools::ToolRegistry registry;
    mcp_dispatch::Dispatcher dispatcher({"s", "1"}, registry);

    json prompts = dispatcher.dispatch(make_request(20, "prompts/list"));
    bool success = expect(prompts["result"]["prompts"].is_array() && prompts["result"]["prompts"].empty(),
                          "prompts/list is empty");

    json resources = dispatcher.dispatch(make_request(21, "resources/list"));
    success &= expect(resources["result"]["resources"].is_array() && resources["result"]["resources"].empty(),
                      "resources/list is empty");

    json read = dispatcher.dispatch(make_request(22, "resources/read", {{"uri", "file:///x"}}));
    success &= expect(read["error"]["code"] == -32601 &&
                          read["error"]["message"] == "Resource reading not implemented",
                      "resources/read is not implemented");
    return success;
}

static bool test_unknown_method() {
    mcp_tools::ToolRegistry registry;
    mcp_dispatch::Dispatcher dispatcher({"s", "1"}, registry);

    json response = dispatcher.dispatch(make_request(30, "sampling/createMessage"));
    return expect(response["id"] == 30 && response["error"]["code"] == -32601 &&
                      response["error"]["message"] == "Method not found: sampling/createMessage",
                  "unknown method is reported with its name");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_initialize();
    all_passed &= test_initialized_notification_has_no_response();
    all_passed &= test_tools_list();
    all_passed &= test_tools_call_success();
    all_passed &= test_tools_call_without_arguments();
    all_passed &= test_tool_failures_are_results();
    all_passed &= test_tools_call_invalid_params();
    all_passed &= test_prompts_and_resources();
    all_passed &= test_unknown_method();
    return all_passed;
}

} // namespace test_dispatch
