#pragma once
// Loader: JSON graph model -> Graph
//
// Format:
//   {
//     "root": {"name": "P", "type": "repository", "attributes": {...},
//              "children": [{"name": "a", "type": "file", "children": [...]}]},
//     "associations": [{"from": "/P/a", "to": "/P/b", "type": "import",
//                       "attributes": {...}}]
//   }
//
// The model cache only sees the GraphLoader signature, so any other
// format can be plugged in without touching the engine.

#include "graph.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <string>

namespace arbor {

using json = nlohmann::json;

// load(sourceRef) -> Graph, throwing Error(LoadError) on failure
using GraphLoader = std::function<GraphPtr(const std::string& source)>;

// Rejects empty paths, ".." segments and missing files
void validate_source_path(const std::string& path);

// Reads and parses a JSON model file
GraphPtr load_graph_file(const std::string& path);

// Parses an already-decoded document
GraphPtr parse_graph_json(const json& doc);

// Attribute conversion shared with the tool layer
AttributeValue attribute_from_json(const json& value, const std::string& where);
Attributes attributes_from_json(const json& object, const std::string& where);

} // namespace arbor
