#include <arbor/dependency.hpp>
#include <arbor/log.hpp>
#include <algorithm>

namespace arbor {

Direction direction_from_string(const std::string& s) {
    if (s == "outgoing") return Direction::Outgoing;
    if (s == "incoming") return Direction::Incoming;
    throw Error(ErrorKind::InvalidDirection,
                "Invalid direction '" + s + "'. Must be one of: incoming, outgoing");
}

const char* direction_to_string(Direction d) {
    return d == Direction::Incoming ? "incoming" : "outgoing";
}

int effective_depth(const std::optional<int>& max_depth, int unbounded) {
    if (!max_depth) return unbounded;
    return *max_depth > 0 ? *max_depth : 0;
}

SubtreeDependencies analyze_subtree(const Graph& graph, const std::string& scope_path,
                                    bool include_external,
                                    const std::optional<int>& max_depth) {
    const Element& scope = graph.resolve(scope_path);

    SubtreeDependencies result;
    result.scope = &scope;
    result.include_external = include_external;
    result.max_depth = max_depth;

    const uint32_t limit = static_cast<uint32_t>(
        effective_depth(max_depth, static_cast<int>(graph.size())));

    // Climb to the deepest ancestor still inside the analyzed band
    auto anchor = [&](const Element& e) -> const Element* {
        const Element* cur = &e;
        while (cur->depth - scope.depth > limit) {
            cur = graph.parent(*cur);
            if (!cur || !scope.contains(*cur)) {
                throw Error(ErrorKind::InternalError,
                            "Broken parent chain below " + scope.path + " at " + e.path);
            }
        }
        return cur;
    };

    ElementRange range = graph.scope(scope.path);
    for (const auto& e : range) {
        if (e.depth - scope.depth <= limit) {
            result.analyzed.push_back(&e);
        }

        // Each association is classified once: internal and outgoing ones
        // from their source, incoming ones from their target
        for (AssocIdx ai : e.outgoing) {
            const Association& a = graph.association(ai);
            if (a.from != e.index) {
                throw Error(ErrorKind::InternalError,
                            "Association index mismatch on outgoing list of " + e.path);
            }
            const Element& target = graph.to_of(a);
            if (scope.contains(target)) {
                result.internal.push_back({&a, anchor(e), anchor(target)});
            } else if (!include_external && target.external) {
                result.suppressed_external++;
            } else {
                result.outgoing.push_back({&a, anchor(e), nullptr});
            }
        }

        for (AssocIdx ai : e.incoming) {
            const Association& a = graph.association(ai);
            if (a.to != e.index) {
                throw Error(ErrorKind::InternalError,
                            "Association index mismatch on incoming list of " + e.path);
            }
            const Element& source = graph.from_of(a);
            if (scope.contains(source)) continue;
            if (!include_external && source.external) {
                result.suppressed_external++;
            } else {
                result.incoming.push_back({&a, nullptr, anchor(e)});
            }
        }
    }

    logging::debug("dependency", "Subtree " + scope.path + ": " +
                   std::to_string(range.size()) + " elements, " +
                   std::to_string(result.internal.size()) + " internal, " +
                   std::to_string(result.incoming.size()) + " incoming, " +
                   std::to_string(result.outgoing.size()) + " outgoing, " +
                   std::to_string(result.suppressed_external) + " external suppressed");
    return result;
}

DependencyChain dependency_chain(const Graph& graph, const std::string& element_path,
                                 Direction direction, const std::optional<int>& max_depth) {
    const Element& start = graph.resolve(element_path);

    DependencyChain chain;
    chain.start = &start;
    chain.direction = direction;
    chain.max_depth = max_depth;

    // A path can be newly reached at most once per element, so the graph
    // size bounds any useful depth
    const int limit = effective_depth(max_depth, static_cast<int>(graph.size()));

    std::vector<bool> visited(graph.size(), false);
    visited[start.index] = true;
    chain.visited = 1;
    ChainLevel origin;
    origin.steps.push_back({&start, nullptr, nullptr});
    chain.levels.push_back(std::move(origin));

    auto neighbours = [&](const Element& e) -> const std::vector<AssocIdx>& {
        return direction == Direction::Outgoing ? e.outgoing : e.incoming;
    };
    auto far_end = [&](const Association& a) -> const Element& {
        return direction == Direction::Outgoing ? graph.to_of(a) : graph.from_of(a);
    };

    std::vector<const Element*> frontier{&start};
    for (int depth = 1; depth <= limit && !frontier.empty(); ++depth) {
        ChainLevel level;
        level.depth = depth;

        for (const Element* f : frontier) {
            for (AssocIdx ai : neighbours(*f)) {
                const Association& a = graph.association(ai);
                const Element& next = far_end(a);
                if (visited[next.index]) continue;
                visited[next.index] = true;
                level.steps.push_back({&next, &a, f});
            }
        }

        if (level.steps.empty()) {
            frontier.clear();
            break;
        }

        std::sort(level.steps.begin(), level.steps.end(),
                  [](const ChainStep& x, const ChainStep& y) {
                      return x.element->path < y.element->path;
                  });

        frontier.clear();
        for (const auto& step : level.steps) {
            frontier.push_back(step.element);
        }
        chain.visited += level.steps.size();
        chain.levels.push_back(std::move(level));
    }

    // Stopped by the bound with somewhere left to go
    for (const Element* f : frontier) {
        for (AssocIdx ai : neighbours(*f)) {
            if (!visited[far_end(graph.association(ai)).index]) {
                chain.depth_limited = true;
                break;
            }
        }
        if (chain.depth_limited) break;
    }

    logging::debug("dependency", "Chain from " + start.path + " (" +
                   direction_to_string(direction) + "): " +
                   std::to_string(chain.levels.size() - 1) + " levels, " +
                   std::to_string(chain.visited) + " elements");
    return chain;
}

DependencyChain dependency_chain(const Graph& graph, const std::string& element_path,
                                 const std::string& direction,
                                 const std::optional<int>& max_depth) {
    return dependency_chain(graph, element_path, direction_from_string(direction), max_depth);
}

} // namespace arbor
