#pragma once
// MCP Types: tool schemas, results, and argument access
//
// Argument helpers throw Error(InvalidArgument) so a tool body can read
// its parameters straight-line and the handler reports one shape of error.

#include "../error.hpp"
#include "../types.hpp"
#include "protocol.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace arbor::mcp {

using json = nlohmann::json;

struct ToolSchema {
    std::string name;
    std::string description;
    json input_schema;
};

struct ToolResult {
    bool is_error = false;
    std::string content;      // Human-readable text
    json structured;          // Machine-readable payload

    static ToolResult ok(const std::string& text, const json& data = json()) {
        return {false, text, data};
    }

    static ToolResult error(ErrorKind kind, const std::string& message) {
        return {true, message, error_payload(kind, message)};
    }
};

using ToolHandler = std::function<ToolResult(const json&)>;

namespace args {

inline std::string required_string(const json& params, const char* key) {
    auto it = params.find(key);
    if (it == params.end() || it->is_null()) {
        throw Error(ErrorKind::InvalidArgument, std::string("Missing required parameter: ") + key);
    }
    if (!it->is_string()) {
        throw Error(ErrorKind::InvalidArgument, std::string("Parameter '") + key + "' must be a string");
    }
    return it->get<std::string>();
}

inline std::optional<std::string> optional_string(const json& params, const char* key) {
    auto it = params.find(key);
    if (it == params.end() || it->is_null()) return std::nullopt;
    if (!it->is_string()) {
        throw Error(ErrorKind::InvalidArgument, std::string("Parameter '") + key + "' must be a string");
    }
    return it->get<std::string>();
}

inline std::optional<int> optional_int(const json& params, const char* key) {
    auto it = params.find(key);
    if (it == params.end() || it->is_null()) return std::nullopt;
    if (!it->is_number_integer()) {
        throw Error(ErrorKind::InvalidArgument, std::string("Parameter '") + key + "' must be an integer");
    }
    bool in_range = it->is_number_unsigned()
        ? it->get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max())
        : it->get<int64_t>() >= std::numeric_limits<int>::min() &&
          it->get<int64_t>() <= std::numeric_limits<int>::max();
    if (!in_range) {
        throw Error(ErrorKind::InvalidArgument, std::string("Parameter '") + key + "' out of range");
    }
    return static_cast<int>(it->get<int64_t>());
}

inline bool bool_or(const json& params, const char* key, bool fallback) {
    auto it = params.find(key);
    if (it == params.end() || it->is_null()) return fallback;
    if (!it->is_boolean()) {
        throw Error(ErrorKind::InvalidArgument, std::string("Parameter '") + key + "' must be a boolean");
    }
    return it->get<bool>();
}

inline size_t limit_or(const json& params, const char* key, size_t fallback) {
    auto v = optional_int(params, key);
    if (!v) return fallback;
    if (*v < 0) {
        throw Error(ErrorKind::InvalidArgument, std::string("Parameter '") + key + "' must be >= 0");
    }
    return static_cast<size_t>(*v);
}

inline std::vector<std::string> string_list(const json& params, const char* key) {
    auto it = params.find(key);
    if (it == params.end() || !it->is_array()) {
        throw Error(ErrorKind::InvalidArgument,
                    std::string("Parameter '") + key + "' must be an array of strings");
    }
    std::vector<std::string> out;
    out.reserve(it->size());
    for (const auto& v : *it) {
        if (!v.is_string()) {
            throw Error(ErrorKind::InvalidArgument,
                        std::string("Parameter '") + key + "' must contain only strings");
        }
        out.push_back(v.get<std::string>());
    }
    return out;
}

// Validates the shape before any cache lookup
inline std::string model_id(const json& params) {
    std::string id = required_string(params, "model_id");
    if (!is_valid_model_id(id)) {
        throw Error(ErrorKind::InvalidArgument, "Malformed model_id: " + id);
    }
    return id;
}

} // namespace args
} // namespace arbor::mcp
