#pragma once
// MCP Analysis Tools: subtree dependencies and transitive dependency chains

#include "../types.hpp"
#include "../../dependency.hpp"
#include "../../model_cache.hpp"
#include "../../views.hpp"
#include <sstream>
#include <unordered_map>

namespace arbor::mcp::tools::analysis {

using json = nlohmann::json;

inline void register_schemas(std::vector<ToolSchema>& tools) {
    tools.push_back({
        "get_subtree_dependencies",
        "Classify every association touching a subtree as internal, incoming or "
        "outgoing. Elements under an External segment can be left out.",
        {
            {"type", "object"},
            {"properties", {
                {"model_id", {{"type", "string"}}},
                {"root_path", {{"type", "string"}, {"description", "Subtree root"}}},
                {"include_external", {{"type", "boolean"}, {"default", true}}},
                {"max_depth", {{"type", "integer"}, {"minimum", 0},
                               {"description", "Depth below root_path to analyze (default: all)"}}}
            }},
            {"required", {"model_id", "root_path"}}
        }
    });

    tools.push_back({
        "get_dependency_chain",
        "Breadth-first walk of associations from an element, level by level. "
        "Each element is reported once even when associations form cycles.",
        {
            {"type", "object"},
            {"properties", {
                {"model_id", {{"type", "string"}}},
                {"element_path", {{"type", "string"}, {"description", "Start element"}}},
                {"direction", {{"type", "string"}, {"enum", {"outgoing", "incoming"}},
                               {"default", "outgoing"}}},
                {"max_depth", {{"type", "integer"}, {"minimum", 0},
                               {"description", "Levels to follow (default: unbounded)"}}}
            }},
            {"required", {"model_id", "element_path"}}
        }
    });
}

inline ToolResult subtree_dependencies(ModelCache* cache, const json& params) {
    std::string id = args::model_id(params);
    std::string root_path = args::required_string(params, "root_path");
    bool include_external = args::bool_or(params, "include_external", true);
    auto max_depth = args::optional_int(params, "max_depth");

    GraphPtr graph = cache->get(id);
    SubtreeDependencies deps = analyze_subtree(*graph, root_path, include_external, max_depth);

    std::ostringstream ss;
    ss << root_path << ": " << deps.analyzed.size() << " element(s), "
       << deps.internal.size() << " internal, "
       << deps.incoming.size() << " incoming, "
       << deps.outgoing.size() << " outgoing";
    if (deps.suppressed_external > 0) {
        ss << " (" << deps.suppressed_external << " external omitted)";
    }
    return ToolResult::ok(ss.str(), subtree_view(*graph, deps));
}

inline ToolResult dependency_chain(ModelCache* cache, const json& params) {
    std::string id = args::model_id(params);
    std::string path = args::required_string(params, "element_path");
    std::string direction = args::optional_string(params, "direction").value_or("outgoing");
    auto max_depth = args::optional_int(params, "max_depth");

    GraphPtr graph = cache->get(id);
    DependencyChain chain = arbor::dependency_chain(*graph, path, direction, max_depth);

    std::ostringstream ss;
    ss << direction << " chain from " << path << ": "
       << chain.visited << " element(s) over " << chain.levels.size() << " level(s)";
    if (chain.depth_limited) ss << " (depth limit reached)";
    return ToolResult::ok(ss.str(), chain_view(*graph, chain));
}

inline void register_handlers(ModelCache* cache,
                              std::unordered_map<std::string, ToolHandler>& handlers) {
    handlers["get_subtree_dependencies"] = [cache](const json& p) { return subtree_dependencies(cache, p); };
    handlers["get_dependency_chain"] = [cache](const json& p) { return dependency_chain(cache, p); };
}

} // namespace arbor::mcp::tools::analysis
