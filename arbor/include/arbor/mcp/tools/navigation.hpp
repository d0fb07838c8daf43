#pragma once
// MCP Navigation Tools: overview, single and batch element lookup,
// per-element associations

#include "../types.hpp"
#include "../../model_cache.hpp"
#include "../../navigation.hpp"
#include "../../overview.hpp"
#include "../../views.hpp"
#include <sstream>
#include <unordered_map>

namespace arbor::mcp::tools::navigation {

using json = nlohmann::json;

inline json element_path_schema(const char* description) {
    return {
        {"type", "object"},
        {"properties", {
            {"model_id", {{"type", "string"}}},
            {"element_path", {{"type", "string"}, {"description", description}}}
        }},
        {"required", {"model_id", "element_path"}}
    };
}

inline void register_schemas(std::vector<ToolSchema>& tools) {
    tools.push_back({
        "get_model_overview",
        "Hierarchical overview of a model down to max_depth, with per-node "
        "child/association counts and descendant type counts.",
        {
            {"type", "object"},
            {"properties", {
                {"model_id", {{"type", "string"}}},
                {"max_depth", {{"type", "integer"}, {"minimum", 0}, {"default", DEFAULT_OVERVIEW_DEPTH}}},
                {"include_counts", {{"type", "boolean"}, {"default", true}}},
                {"scope_path", {{"type", "string"}, {"description", "Start below this path (default: root)"}}}
            }},
            {"required", {"model_id"}}
        }
    });

    tools.push_back({
        "get_root_element",
        "Return the root element of a model.",
        {
            {"type", "object"},
            {"properties", {
                {"model_id", {{"type", "string"}}}
            }},
            {"required", {"model_id"}}
        }
    });

    tools.push_back({
        "get_element",
        "Return one element by its full path.",
        element_path_schema("Full element path, e.g. /Project/src/main.py")
    });

    tools.push_back({
        "get_element_incoming_associations",
        "Associations whose target is the given element.",
        element_path_schema("Target element path")
    });

    tools.push_back({
        "get_element_outgoing_associations",
        "Associations whose source is the given element.",
        element_path_schema("Source element path")
    });

    tools.push_back({
        "get_multiple_elements",
        "Fetch several elements at once. Unknown paths are reported per entry "
        "and do not fail the batch.",
        {
            {"type", "object"},
            {"properties", {
                {"model_id", {{"type", "string"}}},
                {"element_paths", {{"type", "array"}, {"items", {{"type", "string"}}}}}
            }},
            {"required", {"model_id", "element_paths"}}
        }
    });
}

inline ToolResult get_model_overview(ModelCache* cache, const json& params) {
    std::string id = args::model_id(params);
    int max_depth = args::optional_int(params, "max_depth").value_or(DEFAULT_OVERVIEW_DEPTH);
    bool include_counts = args::bool_or(params, "include_counts", true);
    auto scope = args::optional_string(params, "scope_path");

    GraphPtr graph = cache->get(id);
    Overview overview = build_overview(*graph, scope, max_depth, include_counts);

    json result = overview_view(overview);
    result["model_id"] = id;

    std::ostringstream ss;
    ss << "Overview of " << overview.root->path << ": "
       << overview.total_elements() << " element(s) within depth " << overview.max_depth;
    return ToolResult::ok(ss.str(), result);
}

inline ToolResult get_root_element(ModelCache* cache, const json& params) {
    std::string id = args::model_id(params);
    GraphPtr graph = cache->get(id);
    const Element& root = graph->root();
    return ToolResult::ok(root.path, element_view(*graph, root));
}

inline ToolResult get_element(ModelCache* cache, const json& params) {
    std::string id = args::model_id(params);
    std::string path = args::required_string(params, "element_path");
    GraphPtr graph = cache->get(id);
    const Element& e = graph->resolve(path);

    std::ostringstream ss;
    ss << e.path << " (" << (e.type.empty() ? "unknown" : e.type) << ")";
    return ToolResult::ok(ss.str(), element_view(*graph, e));
}

inline ToolResult association_list(const Graph& graph, const std::string& path,
                                   const std::vector<const Association*>& list,
                                   const char* label) {
    json items = json::array();
    for (const Association* a : list) {
        items.push_back(association_view(graph, *a));
    }

    std::ostringstream ss;
    ss << list.size() << " " << label << " association(s) for " << path;
    return ToolResult::ok(ss.str(), {
        {"element_path", path},
        {"associations", items},
        {"count", list.size()}
    });
}

inline ToolResult get_incoming(ModelCache* cache, const json& params) {
    std::string id = args::model_id(params);
    std::string path = args::required_string(params, "element_path");
    GraphPtr graph = cache->get(id);
    return association_list(*graph, path, incoming_associations(*graph, path), "incoming");
}

inline ToolResult get_outgoing(ModelCache* cache, const json& params) {
    std::string id = args::model_id(params);
    std::string path = args::required_string(params, "element_path");
    GraphPtr graph = cache->get(id);
    return association_list(*graph, path, outgoing_associations(*graph, path), "outgoing");
}

inline ToolResult get_multiple(ModelCache* cache, const json& params) {
    std::string id = args::model_id(params);
    auto paths = args::string_list(params, "element_paths");
    GraphPtr graph = cache->get(id);

    auto lookups = get_multiple_elements(*graph, paths);
    json result = multiple_elements_view(*graph, lookups);

    std::ostringstream ss;
    ss << result["found_count"].get<size_t>() << " of " << lookups.size() << " element(s) found";
    return ToolResult::ok(ss.str(), result);
}

inline void register_handlers(ModelCache* cache,
                              std::unordered_map<std::string, ToolHandler>& handlers) {
    handlers["get_model_overview"] = [cache](const json& p) { return get_model_overview(cache, p); };
    handlers["get_root_element"] = [cache](const json& p) { return get_root_element(cache, p); };
    handlers["get_element"] = [cache](const json& p) { return get_element(cache, p); };
    handlers["get_element_incoming_associations"] = [cache](const json& p) { return get_incoming(cache, p); };
    handlers["get_element_outgoing_associations"] = [cache](const json& p) { return get_outgoing(cache, p); };
    handlers["get_multiple_elements"] = [cache](const json& p) { return get_multiple(cache, p); };
}

} // namespace arbor::mcp::tools::navigation
