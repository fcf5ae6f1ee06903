#include "protocol/json_rpc.hpp"

namespace json_rpc {

EnvelopeParseResult parse_envelope(const json &message) {
    EnvelopeParseResult result;

    if (!message.is_object()) {
        result.error_detail = "message is not a JSON object";
        return result;
    }

    auto id_iterator = message.find("id");
    if (id_iterator != message.end()) {
        if (id_iterator->is_object() || id_iterator->is_array() || id_iterator->is_binary()) {
            result.error_detail = "'id' must be a string, number or null";
            return result;
        }
        result.envelope.has_id = true;
        result.envelope.id = *id_iterator;
    }

    auto method_iterator = message.find("method");
    if (method_iterator == message.end() || !method_iterator->is_string()) {
        result.error_detail = "missing or invalid 'method'";
        return result;
    }
    result.envelope.method = method_iterator->get<std::string>();

    auto params_iterator = message.find("params");
    if (params_iterator != message.end() && !params_iterator->is_null()) {
        if (!params_iterator->is_object() && !params_iterator->is_array()) {
            result.error_detail = "'params' must be an object or array";
            return result;
        }
        result.envelope.params = *params_iterator;
    }

    result.success = true;
    return result;
}

bool recover_id(const json &message, json &request_id) {
    if (!message.is_object()) {
        return false;
    }
    auto id_iterator = message.find("id");
    if (id_iterator == message.end() || id_iterator->is_null()) {
        return false;
    }
    request_id = *id_iterator;
    return true;
}

bool is_notification(const Envelope &envelope) {
    return !envelope.has_id || envelope.id.is_null();
}

json build_response(const json &request_id, const json &result_payload) {
    json response;
    response["jsonrpc"] = JSONRPC_VERSION;
    response["id"] = request_id;
    response["result"] = result_payload;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message) {
    json response;
    response["jsonrpc"] = JSONRPC_VERSION;
    response["id"] = request_id;
    response["error"]["code"] = error_code;
    response["error"]["message"] = error_message;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message, const json &error_data) {
    json response = build_error_response(request_id, error_code, error_message);
    response["error"]["data"] = error_data;
    return response;
}

std::string serialize(const json &response) {
    // dump() without indentation escapes control characters, so the line never
    // contains a raw newline.
    return response.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace json_rpc
