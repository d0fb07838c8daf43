#include <arbor/views.hpp>
#include <cmath>
#include <cstdint>

namespace arbor {

namespace {
// Largest magnitude below which every integer is exact in a double
constexpr double MAX_EXACT_INTEGER = 9007199254740992.0;
}

json attribute_to_json(const AttributeValue& value) {
    if (auto s = std::get_if<std::string>(&value)) return *s;
    if (auto b = std::get_if<bool>(&value)) return *b;
    double d = std::get<double>(value);
    // Whole numbers go back out as integers so 120 stays 120, not 120.0
    if (std::isfinite(d) && std::trunc(d) == d && std::fabs(d) <= MAX_EXACT_INTEGER) {
        return static_cast<int64_t>(d);
    }
    return d;
}

json attributes_to_json(const Attributes& attributes) {
    json out = json::object();
    for (const auto& [name, value] : attributes) {
        out[name] = attribute_to_json(value);
    }
    return out;
}

json element_view(const Graph& graph, const Element& e) {
    json child_paths = json::array();
    for (ElementIdx c : e.children) {
        child_paths.push_back(graph.element(c).path);
    }

    const Element* parent = graph.parent(e);
    return {
        {"path", e.path},
        {"name", e.name},
        {"type", e.type},
        {"attributes", attributes_to_json(e.attributes)},
        {"parent_path", parent ? json(parent->path) : json()},
        {"child_paths", child_paths},
        {"external", e.external}
    };
}

json association_view(const Graph& graph, const Association& a) {
    return {
        {"from", graph.from_of(a).path},
        {"to", graph.to_of(a).path},
        {"type", a.type},
        {"attributes", attributes_to_json(a.attributes)}
    };
}

json search_view(const Graph& graph, const SearchResult& result) {
    json elements = json::array();
    for (const Element* e : result.elements) {
        elements.push_back(element_view(graph, *e));
    }
    return {
        {"elements", elements},
        {"count", result.elements.size()},
        {"truncated", result.truncated}
    };
}

namespace {

json scoped_view(const Graph& graph, const ScopedAssociation& sa) {
    json v = association_view(graph, *sa.association);
    v["from_anchor"] = sa.from_anchor ? json(sa.from_anchor->path) : json();
    v["to_anchor"] = sa.to_anchor ? json(sa.to_anchor->path) : json();
    return v;
}

json scoped_list(const Graph& graph, const std::vector<ScopedAssociation>& list) {
    json out = json::array();
    for (const auto& sa : list) {
        out.push_back(scoped_view(graph, sa));
    }
    return out;
}

json optional_int(const std::optional<int>& v) {
    return v ? json(*v) : json();
}

} // namespace

json subtree_view(const Graph& graph, const SubtreeDependencies& deps) {
    json elements = json::array();
    for (const Element* e : deps.analyzed) {
        elements.push_back(element_view(graph, *e));
    }

    return {
        {"root_path", deps.scope->path},
        {"include_external", deps.include_external},
        {"max_depth", optional_int(deps.max_depth)},
        {"subtree_elements", elements},
        {"internal_dependencies", scoped_list(graph, deps.internal)},
        {"incoming_dependencies", scoped_list(graph, deps.incoming)},
        {"outgoing_dependencies", scoped_list(graph, deps.outgoing)},
        {"suppressed_external", deps.suppressed_external},
        {"counts", {
            {"elements", deps.analyzed.size()},
            {"internal", deps.internal.size()},
            {"incoming", deps.incoming.size()},
            {"outgoing", deps.outgoing.size()}
        }}
    };
}

json chain_view(const Graph& graph, const DependencyChain& chain) {
    json levels = json::array();
    json all_dependencies = json::array();

    for (const auto& level : chain.levels) {
        json steps = json::array();
        for (const auto& step : level.steps) {
            json item = {
                {"element", element_view(graph, *step.element)},
                {"via", step.via ? association_view(graph, *step.via) : json()},
                {"reached_from", step.reached_from ? json(step.reached_from->path) : json()}
            };
            steps.push_back(std::move(item));

            if (step.via) {
                json dep = association_view(graph, *step.via);
                dep["depth"] = level.depth;
                all_dependencies.push_back(std::move(dep));
            }
        }
        levels.push_back({{"depth", level.depth}, {"elements", steps}});
    }

    return {
        {"root_element", chain.start->path},
        {"direction", direction_to_string(chain.direction)},
        {"max_depth", optional_int(chain.max_depth)},
        {"levels", levels},
        {"all_dependencies", all_dependencies},
        {"visited_count", chain.visited},
        {"depth_limited", chain.depth_limited}
    };
}

json overview_view(const Overview& overview) {
    // Children always sit after their parent in pre-order, so walking the
    // nodes backwards finishes every child before its parent needs it
    std::vector<json> built(overview.nodes.size());
    for (size_t i = overview.nodes.size(); i-- > 0;) {
        const OverviewNode& node = overview.nodes[i];
        const Element& e = *node.element;

        json v = {
            {"name", e.name},
            {"path", e.path},
            {"type", e.type.empty() ? "unknown" : e.type},
            {"depth", node.depth}
        };

        if (overview.include_counts) {
            v["child_count"] = e.children.size();
            v["incoming_count"] = e.incoming.size();
            v["outgoing_count"] = e.outgoing.size();
            json counts = json::object();
            for (const auto& [type, n] : node.descendant_types) {
                counts[type.empty() ? "unknown" : type] = n;
            }
            v["descendant_counts"] = counts;
        }

        if (node.expanded) {
            json children = json::array();
            for (size_t c : node.children) {
                children.push_back(std::move(built[c]));
            }
            v["children"] = std::move(children);
        } else if (!e.children.empty()) {
            v["has_more_children"] = e.children.size();
        }

        built[i] = std::move(v);
    }

    json depth_counts = json::object();
    for (const auto& [depth, n] : overview.depth_counts) {
        depth_counts[std::to_string(depth)] = n;
    }

    return {
        {"root_path", overview.root->path},
        {"max_depth", overview.max_depth},
        {"include_counts", overview.include_counts},
        {"tree_structure", built.empty() ? json::object() : std::move(built.front())},
        {"summary", {
            {"total_elements", overview.total_elements()},
            {"depth_counts", depth_counts},
            {"type_distribution", overview.type_distribution}
        }}
    };
}

json multiple_elements_view(const Graph& graph, const std::vector<ElementLookup>& lookups) {
    json entries = json::array();
    json not_found = json::array();
    size_t found = 0;

    for (const auto& l : lookups) {
        if (l.found()) {
            entries.push_back({
                {"path", l.path},
                {"found", true},
                {"element", element_view(graph, *l.element)}
            });
            found++;
        } else {
            entries.push_back({
                {"path", l.path},
                {"found", false},
                {"error", {
                    {"kind", error_kind_to_string(ErrorKind::NotFound)},
                    {"message", "Element not found: " + l.path}
                }}
            });
            not_found.push_back(l.path);
        }
    }

    return {
        {"requested_count", lookups.size()},
        {"found_count", found},
        {"elements", entries},
        {"not_found", not_found}
    };
}

json model_info_view(const ModelInfo& info) {
    return {
        {"model_id", info.id},
        {"source", info.source},
        {"loaded_at", info.loaded_at},
        {"load_seconds", info.load_seconds},
        {"element_count", info.element_count},
        {"association_count", info.association_count},
        {"root_name", info.root_name},
        {"children_count", info.root_children}
    };
}

} // namespace arbor
