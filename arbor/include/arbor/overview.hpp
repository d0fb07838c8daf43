#pragma once
// Overview: depth-bounded summary of the hierarchy
//
// Visits at most max_depth levels below the starting element. Counts for
// anything deeper come from the path index census, so elements past the
// bound are never touched.

#include "graph.hpp"
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace arbor {

constexpr int DEFAULT_OVERVIEW_DEPTH = 3;

struct OverviewNode {
    const Element* element = nullptr;
    int depth = 0;                      // Relative to the overview root
    bool expanded = false;              // Children listed below
    std::vector<size_t> children;       // Indices into Overview::nodes
    // Descendants by type (excluding the element itself); only with counts
    std::vector<std::pair<std::string, size_t>> descendant_types;
};

struct Overview {
    const Element* root = nullptr;
    int max_depth = DEFAULT_OVERVIEW_DEPTH;
    bool include_counts = true;

    std::vector<OverviewNode> nodes;    // Pre-order, nodes[0] is the root
    std::map<int, size_t> depth_counts;
    std::map<std::string, size_t> type_distribution;

    size_t total_elements() const { return nodes.size(); }
};

// Throws NotFound for an unknown scope. Negative depth is treated as 0.
Overview build_overview(const Graph& graph,
                        const std::optional<std::string>& scope_path = std::nullopt,
                        int max_depth = DEFAULT_OVERVIEW_DEPTH,
                        bool include_counts = true);

} // namespace arbor
