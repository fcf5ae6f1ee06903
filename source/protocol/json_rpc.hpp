#ifndef SYSMCPS_JSON_RPC_HPP
#define SYSMCPS_JSON_RPC_HPP

// JSON-RPC 2.0 envelope helpers for the MCP stdio protocol.
// Uses nlohmann/json for parsing and serialization.

#include <nlohmann/json.hpp>
#include <string>

namespace json_rpc {

using json = nlohmann::json;

constexpr const char *JSONRPC_VERSION = "2.0";

// Standard JSON-RPC error codes.
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

// A request or notification as read from the wire.
// has_id is false when "id" is absent; an explicit null id is kept as a null json.
struct Envelope {
    bool has_id = false;
    json id;
    std::string method;
    json params; // null when absent
};

// Result of the typed envelope parse.
struct EnvelopeParseResult {
    bool success = false;
    Envelope envelope;
    std::string error_detail;
};

// Validate a generic JSON value against the envelope shape:
// an object with a string "method", a scalar or null "id" and an optional
// object/array "params".
EnvelopeParseResult parse_envelope(const json &message);

// Inspect a generic JSON value for a usable request id.
// Returns true and fills request_id only when "id" is present and not null.
bool recover_id(const json &message, json &request_id);

// A message is a notification when its id is absent or explicitly null.
bool is_notification(const Envelope &envelope);

// Build a JSON-RPC 2.0 success response.
json build_response(const json &request_id, const json &result_payload);

// Build a JSON-RPC 2.0 error response.
json build_error_response(const json &request_id, int error_code, const std::string &error_message);

// Build a JSON-RPC 2.0 error response with additional data.
json build_error_response(const json &request_id, int error_code, const std::string &error_message, const json &error_data);

// Serialize a response as a single line (no embedded newlines, invalid UTF-8 replaced).
std::string serialize(const json &response);

} // namespace json_rpc

#endif // SYSMCPS_JSON_RPC_HPP
