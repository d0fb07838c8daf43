#pragma once
// MCP Model Tools: load_model, list_models, remove_model, clear_cache
//
// Lifecycle of cached graphs. Loading may take seconds on large models;
// every other tool here is a constant-time map operation.

#include "../types.hpp"
#include "../../model_cache.hpp"
#include "../../views.hpp"
#include <sstream>
#include <unordered_map>

namespace arbor::mcp::tools::model {

using json = nlohmann::json;

inline void register_schemas(std::vector<ToolSchema>& tools) {
    tools.push_back({
        "load_model",
        "Load a dependency-graph model from a JSON file and cache it. "
        "Returns the model_id used by every other tool.",
        {
            {"type", "object"},
            {"properties", {
                {"path", {{"type", "string"}, {"description", "Path to the model file"}}}
            }},
            {"required", {"path"}}
        }
    });

    tools.push_back({
        "list_models",
        "List cached models in load order with element and association counts.",
        {
            {"type", "object"},
            {"properties", json::object()},
            {"required", json::array()}
        }
    });

    tools.push_back({
        "remove_model",
        "Evict a model from the cache. Removing an unknown model is not an error.",
        {
            {"type", "object"},
            {"properties", {
                {"model_id", {{"type", "string"}, {"description", "Identifier returned by load_model"}}}
            }},
            {"required", {"model_id"}}
        }
    });

    tools.push_back({
        "clear_cache",
        "Evict every cached model.",
        {
            {"type", "object"},
            {"properties", json::object()},
            {"required", json::array()}
        }
    });
}

inline ToolResult load_model(ModelCache* cache, const json& params) {
    std::string path = args::required_string(params, "path");
    std::string id = cache->load(path);
    ModelInfo info = cache->info(id);

    std::ostringstream ss;
    ss << "Loaded " << info.root_name << " as " << id
       << " (" << info.element_count << " elements, "
       << info.association_count << " associations)";

    json result = model_info_view(info);
    return ToolResult::ok(ss.str(), result);
}

inline ToolResult list_models(ModelCache* cache, const json&) {
    auto models = cache->list();

    json entries = json::array();
    std::ostringstream ss;
    ss << models.size() << " model(s) loaded";
    for (const auto& info : models) {
        entries.push_back(model_info_view(info));
        ss << "\n  " << info.id << "  " << info.root_name
           << "  [" << info.element_count << " elements]  " << info.source;
    }

    return ToolResult::ok(ss.str(), {{"models", entries}, {"count", models.size()}});
}

inline ToolResult remove_model(ModelCache* cache, const json& params) {
    std::string id = args::model_id(params);
    bool removed = cache->evict(id);

    std::string text = removed ? "Removed model " + id : "Model " + id + " was not loaded";
    return ToolResult::ok(text, {{"model_id", id}, {"removed", removed}});
}

inline ToolResult clear_cache(ModelCache* cache, const json&) {
    size_t n = cache->clear();
    return ToolResult::ok("Cleared " + std::to_string(n) + " model(s)", {{"cleared", n}});
}

inline void register_handlers(ModelCache* cache,
                              std::unordered_map<std::string, ToolHandler>& handlers) {
    handlers["load_model"] = [cache](const json& p) { return load_model(cache, p); };
    handlers["list_models"] = [cache](const json& p) { return list_models(cache, p); };
    handlers["remove_model"] = [cache](const json& p) { return remove_model(cache, p); };
    handlers["clear_cache"] = [cache](const json& p) { return clear_cache(cache, p); };
}

} // namespace arbor::mcp::tools::model
