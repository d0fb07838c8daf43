#pragma once
// MCP Protocol: JSON-RPC 2.0 envelopes and error codes
//
// Requests arrive one per line. A request without an "id" is a
// notification and gets no response.

#include "../error.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace arbor::mcp {

using json = nlohmann::json;

// JSON-RPC 2.0 error codes
namespace error {
    constexpr int PARSE_ERROR = -32700;
    constexpr int INVALID_REQUEST = -32600;
    constexpr int METHOD_NOT_FOUND = -32601;
    constexpr int INVALID_PARAMS = -32602;
    constexpr int INTERNAL_ERROR = -32603;
    // MCP-specific errors
    constexpr int TOOL_NOT_FOUND = -32001;
    constexpr int TOOL_EXECUTION_ERROR = -32002;
}

inline json make_result(const json& id, const json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

inline json make_error(const json& id, int code, const std::string& message,
                       const json& data = json()) {
    json err = {
        {"code", code},
        {"message", message}
    };
    if (!data.is_null()) {
        err["data"] = data;
    }
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", err}
    };
}

// Machine-checkable error payload shared by tool errors and RPC errors
inline json error_payload(ErrorKind kind, const std::string& message) {
    return {
        {"error", {
            {"kind", error_kind_to_string(kind)},
            {"message", message}
        }}
    };
}

// Tool call result in MCP content format
inline json make_tool_response(const std::string& text, bool is_error,
                               const json& structured) {
    json content = json::array();
    content.push_back({
        {"type", "text"},
        {"text", text}
    });

    json response = {
        {"content", content},
        {"isError", is_error}
    };
    if (!structured.is_null()) {
        response["structuredContent"] = structured;
    }
    return response;
}

inline bool validate_request(const json& request, std::string& error_msg) {
    if (!request.is_object()) {
        error_msg = "Request must be a JSON object";
        return false;
    }
    if (!request.contains("jsonrpc") || request["jsonrpc"] != "2.0") {
        error_msg = "Missing or invalid jsonrpc version";
        return false;
    }
    if (!request.contains("method") || !request["method"].is_string()) {
        error_msg = "Missing or invalid method";
        return false;
    }
    if (request.contains("params") && !request["params"].is_object() &&
        !request["params"].is_null()) {
        error_msg = "params must be an object";
        return false;
    }
    return true;
}

struct RequestInfo {
    std::string method;
    json params;
    json id;
    bool notification = false;
};

inline RequestInfo parse_request(const json& request) {
    RequestInfo info;
    info.method = request["method"].get<std::string>();
    info.params = request.value("params", json::object());
    if (info.params.is_null()) info.params = json::object();
    info.notification = !request.contains("id");
    info.id = request.value("id", json());
    return info;
}

} // namespace arbor::mcp
