#include <arbor/overview.hpp>
#include <arbor/log.hpp>

namespace arbor {

Overview build_overview(const Graph& graph, const std::optional<std::string>& scope_path,
                        int max_depth, bool include_counts) {
    const Element* start = &graph.root();
    if (scope_path) {
        start = graph.find(*scope_path);
        if (!start) {
            throw Error(ErrorKind::NotFound, "Scope path not found: " + *scope_path);
        }
    }

    Overview overview;
    overview.root = start;
    overview.max_depth = max_depth > 0 ? max_depth : 0;
    overview.include_counts = include_counts;

    struct Pending {
        ElementIdx element;
        size_t parent_node;
        int depth;
    };
    std::vector<Pending> stack;
    stack.push_back({start->index, SIZE_MAX, 0});

    while (!stack.empty()) {
        Pending p = stack.back();
        stack.pop_back();

        const Element& e = graph.element(p.element);
        size_t node_idx = overview.nodes.size();

        OverviewNode node;
        node.element = &e;
        node.depth = p.depth;
        node.expanded = p.depth < overview.max_depth;
        if (include_counts) {
            node.descendant_types = graph.index().type_counts(e.index + 1, e.subtree_end);
        }
        overview.nodes.push_back(std::move(node));

        if (p.parent_node != SIZE_MAX) {
            overview.nodes[p.parent_node].children.push_back(node_idx);
        }

        overview.depth_counts[p.depth]++;
        overview.type_distribution[e.type.empty() ? "unknown" : e.type]++;

        if (overview.nodes[node_idx].expanded) {
            for (auto it = e.children.rbegin(); it != e.children.rend(); ++it) {
                stack.push_back({*it, node_idx, p.depth + 1});
            }
        }
    }

    logging::debug("overview", "Overview of " + start->path + " to depth " +
                   std::to_string(overview.max_depth) + ": " +
                   std::to_string(overview.nodes.size()) + " elements across " +
                   std::to_string(overview.depth_counts.size()) + " levels");
    return overview;
}

} // namespace arbor
