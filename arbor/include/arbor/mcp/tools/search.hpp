#pragma once
// MCP Search Tools: by name pattern, by type, by attribute equality
//
// All three accept an optional scope_path and a limit (0 = unlimited).

#include "../types.hpp"
#include "../../loader.hpp"
#include "../../model_cache.hpp"
#include "../../search.hpp"
#include "../../views.hpp"
#include <sstream>
#include <unordered_map>

namespace arbor::mcp::tools::search {

using json = nlohmann::json;

inline json scope_and_limit(json properties) {
    properties["scope_path"] = {{"type", "string"}, {"description", "Restrict to this subtree"}};
    properties["limit"] = {{"type", "integer"}, {"minimum", 0}, {"default", 0},
                           {"description", "Maximum results (0 = unlimited)"}};
    return properties;
}

inline void register_schemas(std::vector<ToolSchema>& tools) {
    tools.push_back({
        "search_elements_by_name",
        "Find elements whose name matches a pattern. Regex patterns match anywhere "
        "in the name; glob patterns (*, ?, [set]) must match the whole name.",
        {
            {"type", "object"},
            {"properties", scope_and_limit({
                {"model_id", {{"type", "string"}}},
                {"pattern", {{"type", "string"}, {"description", "Name pattern"}}},
                {"pattern_kind", {{"type", "string"}, {"enum", {"regex", "glob"}}, {"default", "regex"}}},
                {"element_type", {{"type", "string"}, {"description", "Only elements of this type"}}}
            })},
            {"required", {"model_id", "pattern"}}
        }
    });

    tools.push_back({
        "get_elements_by_type",
        "List elements of an exact type, in hierarchy order.",
        {
            {"type", "object"},
            {"properties", scope_and_limit({
                {"model_id", {{"type", "string"}}},
                {"element_type", {{"type", "string"}, {"description", "e.g. file, class, function"}}}
            })},
            {"required", {"model_id", "element_type"}}
        }
    });

    tools.push_back({
        "search_elements_by_attributes",
        "Find elements whose attributes equal every given filter value. "
        "Values are compared with their type: \"1\" does not match 1.",
        {
            {"type", "object"},
            {"properties", scope_and_limit({
                {"model_id", {{"type", "string"}}},
                {"attribute_filters", {{"type", "object"},
                                       {"description", "Attribute name -> string, number or boolean"}}}
            })},
            {"required", {"model_id", "attribute_filters"}}
        }
    });
}

inline ToolResult found(const Graph& graph, const SearchResult& result, const std::string& what) {
    std::ostringstream ss;
    ss << result.elements.size() << " element(s) " << what;
    if (result.truncated) ss << " (truncated)";
    for (const Element* e : result.elements) {
        ss << "\n  " << e->path;
    }
    return ToolResult::ok(ss.str(), search_view(graph, result));
}

inline ToolResult by_name(ModelCache* cache, const json& params) {
    std::string id = args::model_id(params);

    NameQuery query;
    query.pattern = args::required_string(params, "pattern");
    query.kind = pattern_kind_from_string(
        args::optional_string(params, "pattern_kind").value_or("regex"));
    query.element_type = args::optional_string(params, "element_type");
    query.scope_path = args::optional_string(params, "scope_path");
    query.limit = args::limit_or(params, "limit", 0);

    GraphPtr graph = cache->get(id);
    SearchResult result = arbor::search::by_name(*graph, query);
    return found(*graph, result, "matching '" + query.pattern + "'");
}

inline ToolResult by_type(ModelCache* cache, const json& params) {
    std::string id = args::model_id(params);
    std::string type = args::required_string(params, "element_type");
    auto scope = args::optional_string(params, "scope_path");
    size_t limit = args::limit_or(params, "limit", 0);

    GraphPtr graph = cache->get(id);
    SearchResult result = arbor::search::by_type(*graph, type, scope, limit);
    return found(*graph, result, "of type '" + type + "'");
}

inline ToolResult by_attributes(ModelCache* cache, const json& params) {
    std::string id = args::model_id(params);
    auto it = params.find("attribute_filters");
    if (it == params.end() || !it->is_object()) {
        throw Error(ErrorKind::InvalidArgument, "Parameter 'attribute_filters' must be an object");
    }

    Attributes filters;
    try {
        filters = attributes_from_json(*it, "attribute_filters");
    } catch (const Error& e) {
        // Conversion reports LoadError; here it is a bad argument
        throw Error(ErrorKind::InvalidArgument, e.what());
    }
    auto scope = args::optional_string(params, "scope_path");
    size_t limit = args::limit_or(params, "limit", 0);

    GraphPtr graph = cache->get(id);
    SearchResult result = arbor::search::by_attributes(*graph, filters, scope, limit);
    return found(*graph, result, "matching " + std::to_string(filters.size()) + " attribute filter(s)");
}

inline void register_handlers(ModelCache* cache,
                              std::unordered_map<std::string, ToolHandler>& handlers) {
    handlers["search_elements_by_name"] = [cache](const json& p) { return by_name(cache, p); };
    handlers["get_elements_by_type"] = [cache](const json& p) { return by_type(cache, p); };
    handlers["search_elements_by_attributes"] = [cache](const json& p) { return by_attributes(cache, p); };
}

} // namespace arbor::mcp::tools::search
