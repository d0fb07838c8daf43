#pragma once
// Navigation: single and batch element lookup, per-element associations

#include "graph.hpp"
#include <string>
#include <vector>

namespace arbor {

// One requested path; element is nullptr when it did not resolve
struct ElementLookup {
    std::string path;
    const Element* element = nullptr;

    bool found() const { return element != nullptr; }
};

// Resolves each path independently, in request order. Never throws for
// an unknown path; that entry simply carries no element.
inline std::vector<ElementLookup> get_multiple_elements(const Graph& graph,
                                                        const std::vector<std::string>& paths) {
    std::vector<ElementLookup> result;
    result.reserve(paths.size());
    for (const auto& p : paths) {
        result.push_back({p, graph.find(p)});
    }
    return result;
}

// The element's own associations only, not its children's. Throws ElementNotFound.
inline std::vector<const Association*> incoming_associations(const Graph& graph,
                                                             const std::string& path) {
    const Element& e = graph.resolve(path);
    std::vector<const Association*> result;
    result.reserve(e.incoming.size());
    for (AssocIdx ai : e.incoming) {
        result.push_back(&graph.association(ai));
    }
    return result;
}

inline std::vector<const Association*> outgoing_associations(const Graph& graph,
                                                             const std::string& path) {
    const Element& e = graph.resolve(path);
    std::vector<const Association*> result;
    result.reserve(e.outgoing.size());
    for (AssocIdx ai : e.outgoing) {
        result.push_back(&graph.association(ai));
    }
    return result;
}

} // namespace arbor
