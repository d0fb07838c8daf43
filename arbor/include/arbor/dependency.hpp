#pragma once
// Dependency analysis: subtree partitioning and transitive chains
//
// Subtree analysis sorts every association touching a scope into exactly
// one of internal / incoming / outgoing. Chains are breadth-first over
// associations with a visited set, so cyclic dependency graphs terminate
// and no element is reported twice.

#include "graph.hpp"
#include <optional>
#include <string>
#include <vector>

namespace arbor {

enum class Direction {
    Outgoing,  // follow from -> to
    Incoming   // follow to -> from
};

// Throws Error(InvalidDirection)
Direction direction_from_string(const std::string& s);
const char* direction_to_string(Direction d);

// Non-positive bounds collapse to 0; absent means unbounded
int effective_depth(const std::optional<int>& max_depth, int unbounded);

// ═══════════════════════════════════════════════════════════════════
// Subtree dependencies
// ═══════════════════════════════════════════════════════════════════

struct ScopedAssociation {
    const Association* association = nullptr;
    // Nearest analyzed element for each endpoint inside the scope
    // (the endpoint itself when within max_depth); nullptr when outside
    const Element* from_anchor = nullptr;
    const Element* to_anchor = nullptr;
};

struct SubtreeDependencies {
    const Element* scope = nullptr;
    bool include_external = true;
    std::optional<int> max_depth;

    std::vector<const Element*> analyzed;  // Pre-order, within max_depth
    std::vector<ScopedAssociation> internal;
    std::vector<ScopedAssociation> incoming;
    std::vector<ScopedAssociation> outgoing;
    size_t suppressed_external = 0;
};

// Throws ElementNotFound for an unknown scope
SubtreeDependencies analyze_subtree(const Graph& graph, const std::string& scope_path,
                                    bool include_external = true,
                                    const std::optional<int>& max_depth = std::nullopt);

// ═══════════════════════════════════════════════════════════════════
// Dependency chain
// ═══════════════════════════════════════════════════════════════════

struct ChainStep {
    const Element* element = nullptr;
    const Association* via = nullptr;    // nullptr for the start element
    const Element* reached_from = nullptr;
};

struct ChainLevel {
    int depth = 0;
    std::vector<ChainStep> steps;  // Ordered by element path
};

struct DependencyChain {
    const Element* start = nullptr;
    Direction direction = Direction::Outgoing;
    std::optional<int> max_depth;

    std::vector<ChainLevel> levels;  // levels[0] holds only the start
    size_t visited = 0;
    bool depth_limited = false;      // Unvisited neighbours remained at the bound

    size_t association_count() const { return visited > 0 ? visited - 1 : 0; }
};

// Throws ElementNotFound
DependencyChain dependency_chain(const Graph& graph, const std::string& element_path,
                                 Direction direction,
                                 const std::optional<int>& max_depth = std::nullopt);

// Validates the direction string before resolving anything
DependencyChain dependency_chain(const Graph& graph, const std::string& element_path,
                                 const std::string& direction,
                                 const std::optional<int>& max_depth = std::nullopt);

} // namespace arbor
