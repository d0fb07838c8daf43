#pragma once
// MCP Handler: JSON-RPC dispatch for all arbor tools
//
// User-facing failures (bad path, unknown model, bad pattern...) come back
// as tool results with isError set so the caller can correct the request.
// InternalError means the engine itself is wrong and is surfaced as a
// JSON-RPC error instead.

#include "protocol.hpp"
#include "types.hpp"
#include "tools/analysis.hpp"
#include "tools/model.hpp"
#include "tools/navigation.hpp"
#include "tools/search.hpp"
#include "../log.hpp"
#include "../model_cache.hpp"
#include "../version.hpp"
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace arbor::mcp {

using json = nlohmann::json;

class Handler {
public:
    explicit Handler(ModelCache* cache, std::string server_name = "arbor")
        : cache_(cache)
        , server_name_(std::move(server_name)) {
        register_all_tools();
    }

    // Process one request line. Returns "" for notifications.
    std::string handle(const std::string& request_str) {
        json response;
        try {
            auto request = json::parse(request_str);
            response = handle_request(request);
        } catch (const json::parse_error& e) {
            response = make_error(json(), error::PARSE_ERROR,
                                  std::string("JSON parse error: ") + e.what());
        } catch (const std::exception& e) {
            logging::error("mcp", std::string("Unhandled: ") + e.what());
            response = make_error(json(), error::INTERNAL_ERROR,
                                  std::string("Internal error: ") + e.what());
        }
        if (response.is_null()) return "";
        return response.dump(-1, ' ', false, json::error_handler_t::replace);
    }

    // Returns null for notifications
    json handle_request(const json& request) {
        std::string error_msg;
        if (!validate_request(request, error_msg)) {
            json id = request.is_object() ? request.value("id", json()) : json();
            return make_error(id, error::INVALID_REQUEST, error_msg);
        }

        auto info = parse_request(request);

        if (info.notification) {
            logging::debug("mcp", "Notification: " + info.method);
            return json();
        }

        if (info.method == "initialize") {
            return handle_initialize(info.id);
        } else if (info.method == "tools/list") {
            return handle_tools_list(info.id);
        } else if (info.method == "tools/call") {
            return handle_tools_call(info.params, info.id);
        } else if (info.method == "shutdown") {
            return handle_shutdown(info.id);
        } else if (info.method == "ping") {
            return make_result(info.id, json::object());
        } else {
            return make_error(info.id, error::METHOD_NOT_FOUND,
                              "Unknown method: " + info.method);
        }
    }

    const std::vector<ToolSchema>& tools() const { return tools_; }

    bool shutdown_requested() const { return shutdown_requested_; }

private:
    ModelCache* cache_;
    std::string server_name_;
    std::vector<ToolSchema> tools_;
    std::unordered_map<std::string, ToolHandler> handlers_;
    bool shutdown_requested_ = false;

    void register_all_tools() {
        // Model lifecycle (load_model, list_models, remove_model, clear_cache)
        tools::model::register_schemas(tools_);
        tools::model::register_handlers(cache_, handlers_);

        // Overview and element lookup
        tools::navigation::register_schemas(tools_);
        tools::navigation::register_handlers(cache_, handlers_);

        tools::search::register_schemas(tools_);
        tools::search::register_handlers(cache_, handlers_);

        // Subtree and chain analysis
        tools::analysis::register_schemas(tools_);
        tools::analysis::register_handlers(cache_, handlers_);
    }

    json handle_initialize(const json& id) {
        return make_result(id, {
            {"protocolVersion", ARBOR_PROTOCOL_VERSION},
            {"serverInfo", {
                {"name", server_name_},
                {"version", ARBOR_VERSION}
            }},
            {"capabilities", {
                {"tools", json::object()}
            }}
        });
    }

    json handle_tools_list(const json& id) {
        json tools_array = json::array();
        for (const auto& tool : tools_) {
            tools_array.push_back({
                {"name", tool.name},
                {"description", tool.description},
                {"inputSchema", tool.input_schema}
            });
        }
        return make_result(id, {{"tools", tools_array}});
    }

    json handle_tools_call(const json& params, const json& id) {
        if (!params.contains("name") || !params["name"].is_string()) {
            return make_error(id, error::INVALID_PARAMS, "Missing tool name");
        }

        std::string name = params["name"];
        json arguments = params.value("arguments", json::object());
        if (arguments.is_null()) arguments = json::object();
        if (!arguments.is_object()) {
            return make_error(id, error::INVALID_PARAMS, "Tool arguments must be an object");
        }

        auto it = handlers_.find(name);
        if (it == handlers_.end()) {
            return make_error(id, error::TOOL_NOT_FOUND, "Unknown tool: " + name);
        }

        ToolResult result;
        try {
            result = it->second(arguments);
        } catch (const Error& e) {
            if (!e.is_user_error()) {
                logging::error("mcp", name + ": " + e.what());
                return make_error(id, error::INTERNAL_ERROR, e.what(),
                                  error_payload(e.kind(), e.what()));
            }
            logging::debug("mcp", name + " -> " + error_kind_to_string(e.kind()) + ": " + e.what());
            result = ToolResult::error(e.kind(), e.what());
        } catch (const json::exception& e) {
            result = ToolResult::error(ErrorKind::InvalidArgument, e.what());
        } catch (const std::exception& e) {
            logging::error("mcp", name + " failed: " + e.what());
            return make_error(id, error::TOOL_EXECUTION_ERROR,
                              std::string("Tool execution failed: ") + e.what());
        }

        return make_result(id, make_tool_response(result.content, result.is_error, result.structured));
    }

    json handle_shutdown(const json& id) {
        shutdown_requested_ = true;
        logging::info("mcp", "Shutdown requested");
        return make_result(id, {{"status", "ok"}});
    }
};

} // namespace arbor::mcp
