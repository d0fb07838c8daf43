#pragma once
// Views: JSON shapes handed across the tool boundary
//
// Field names here are a compatibility contract with callers:
//   element:     path, name, type, attributes, parent_path, child_paths, external
//   association: from, to, type, attributes

#include "dependency.hpp"
#include "graph.hpp"
#include "model_cache.hpp"
#include "navigation.hpp"
#include "overview.hpp"
#include "search.hpp"
#include <nlohmann/json.hpp>

namespace arbor {

using json = nlohmann::json;

json attribute_to_json(const AttributeValue& value);
json attributes_to_json(const Attributes& attributes);

json element_view(const Graph& graph, const Element& e);
json association_view(const Graph& graph, const Association& a);

json search_view(const Graph& graph, const SearchResult& result);
json subtree_view(const Graph& graph, const SubtreeDependencies& deps);
json chain_view(const Graph& graph, const DependencyChain& chain);
json overview_view(const Overview& overview);
json multiple_elements_view(const Graph& graph, const std::vector<ElementLookup>& lookups);
json model_info_view(const ModelInfo& info);

} // namespace arbor
