#include <arbor/graph.hpp>
#include <algorithm>
#include <map>

namespace arbor {

// ═══════════════════════════════════════════════════════════════════
// PathIndex
// ═══════════════════════════════════════════════════════════════════

void PathIndex::build(const std::vector<Element>& elements) {
    by_path_.clear();
    by_path_.reserve(elements.size());

    std::map<std::string, std::vector<ElementIdx>> by_type;
    for (const auto& e : elements) {
        by_path_.emplace(e.path, e.index);
        // Visited in pre-order, so every position list comes out sorted
        by_type[e.type].push_back(e.index);
    }

    type_names_.clear();
    positions_by_type_.clear();
    type_names_.reserve(by_type.size());
    positions_by_type_.reserve(by_type.size());
    for (auto& [type, positions] : by_type) {
        type_names_.push_back(type);
        positions_by_type_.push_back(std::move(positions));
    }
}

size_t PathIndex::count_in_range(const std::vector<ElementIdx>& positions,
                                 ElementIdx begin, ElementIdx end) {
    if (begin >= end) return 0;
    auto lo = std::lower_bound(positions.begin(), positions.end(), begin);
    auto hi = std::lower_bound(lo, positions.end(), end);
    return static_cast<size_t>(hi - lo);
}

std::vector<std::pair<std::string, size_t>> PathIndex::type_counts(ElementIdx begin,
                                                                   ElementIdx end) const {
    std::vector<std::pair<std::string, size_t>> result;
    for (size_t i = 0; i < type_names_.size(); ++i) {
        size_t n = count_in_range(positions_by_type_[i], begin, end);
        if (n > 0) {
            result.emplace_back(type_names_[i], n);
        }
    }
    return result;
}

size_t PathIndex::count_type(const std::string& type, ElementIdx begin, ElementIdx end) const {
    auto it = std::lower_bound(type_names_.begin(), type_names_.end(), type);
    if (it == type_names_.end() || *it != type) return 0;
    return count_in_range(positions_by_type_[it - type_names_.begin()], begin, end);
}

// ═══════════════════════════════════════════════════════════════════
// Graph
// ═══════════════════════════════════════════════════════════════════

const Element& Graph::element(ElementIdx idx) const {
    if (idx >= elements_.size()) {
        throw Error(ErrorKind::InternalError,
                    "Element index " + std::to_string(idx) + " out of range (size " +
                    std::to_string(elements_.size()) + ")");
    }
    return elements_[idx];
}

const Association& Graph::association(AssocIdx idx) const {
    if (idx >= associations_.size()) {
        throw Error(ErrorKind::InternalError,
                    "Association index " + std::to_string(idx) + " out of range (size " +
                    std::to_string(associations_.size()) + ")");
    }
    return associations_[idx];
}

const Element* Graph::find(const std::string& path) const {
    auto idx = index_.find(path);
    if (!idx) return nullptr;
    return &element(*idx);
}

const Element& Graph::resolve(const std::string& path) const {
    const Element* e = find(path);
    if (!e) {
        throw Error(ErrorKind::ElementNotFound, "Element not found: " + path);
    }
    return *e;
}

const Element* Graph::parent(const Element& e) const {
    if (e.is_root()) return nullptr;
    return &element(e.parent);
}

ElementRange Graph::scope(const std::optional<std::string>& scope_path) const {
    if (!scope_path) {
        return ElementRange(elements_.begin(), elements_.end());
    }

    const Element* e = find(*scope_path);
    if (!e) {
        throw Error(ErrorKind::NotFound, "Scope path not found: " + *scope_path);
    }
    if (e->subtree_end > elements_.size() || e->subtree_end <= e->index) {
        throw Error(ErrorKind::InternalError, "Corrupt subtree range at " + e->path);
    }
    return ElementRange(elements_.begin() + e->index, elements_.begin() + e->subtree_end);
}

std::vector<const Element*> Graph::elements_under_scope(
    const std::optional<std::string>& scope_path) const
{
    ElementRange range = scope(scope_path);
    std::vector<const Element*> result;
    result.reserve(range.size());
    for (const auto& e : range) {
        result.push_back(&e);
    }
    return result;
}

// ═══════════════════════════════════════════════════════════════════
// GraphBuilder
// ═══════════════════════════════════════════════════════════════════

void GraphBuilder::check_name(const std::string& name, const std::string& where) {
    if (name.empty()) {
        throw Error(ErrorKind::LoadError, "Empty element name under " + where);
    }
    if (name.find(Graph::SEPARATOR) != std::string::npos) {
        throw Error(ErrorKind::LoadError,
                    "Element name '" + name + "' under " + where + " contains '/'");
    }
}

std::string GraphBuilder::set_root(const std::string& name, const std::string& type,
                                   Attributes attributes) {
    if (has_root_) {
        throw Error(ErrorKind::LoadError, "Graph root already set");
    }
    if (name.find(Graph::SEPARATOR) != std::string::npos) {
        throw Error(ErrorKind::LoadError, "Root name '" + name + "' contains '/'");
    }

    StagedElement root;
    root.path = name.empty() ? std::string() : std::string(1, Graph::SEPARATOR) + name;
    root.name = name;
    root.type = type;
    root.attributes = std::move(attributes);

    staged_by_path_.emplace(root.path, 0);
    staged_.push_back(std::move(root));
    has_root_ = true;
    return staged_.front().path;
}

std::string GraphBuilder::add_element(const std::string& parent_path, const std::string& name,
                                      const std::string& type, Attributes attributes) {
    auto parent_it = staged_by_path_.find(parent_path);
    if (parent_it == staged_by_path_.end()) {
        throw Error(ErrorKind::LoadError,
                    "Parent '" + parent_path + "' of element '" + name + "' does not exist");
    }
    check_name(name, parent_path.empty() ? std::string("root") : parent_path);

    std::string path = parent_path + Graph::SEPARATOR + name;
    if (staged_by_path_.count(path)) {
        throw Error(ErrorKind::LoadError, "Duplicate element path: " + path);
    }

    size_t parent_idx = parent_it->second;
    size_t idx = staged_.size();

    StagedElement e;
    e.path = path;
    e.name = name;
    e.type = type;
    e.attributes = std::move(attributes);
    e.parent = parent_idx;

    staged_.push_back(std::move(e));
    staged_[parent_idx].children.push_back(idx);
    staged_by_path_.emplace(path, idx);
    return path;
}

void GraphBuilder::add_association(const std::string& from, const std::string& to,
                                   const std::string& type, Attributes attributes) {
    associations_.push_back({from, to, type, std::move(attributes)});
}

GraphPtr GraphBuilder::build() {
    if (!has_root_) {
        throw Error(ErrorKind::LoadError, "Graph has no root element");
    }
    if (staged_.size() >= static_cast<size_t>(NO_ELEMENT)) {
        throw Error(ErrorKind::LoadError, "Graph exceeds the maximum element count");
    }

    std::shared_ptr<Graph> graph(new Graph());
    graph->elements_.reserve(staged_.size());

    // Pre-order layout with an explicit stack. The visited marks catch a
    // child list that loops back on itself instead of walking forever.
    std::vector<ElementIdx> new_index(staged_.size(), NO_ELEMENT);
    std::vector<size_t> stack;
    stack.push_back(0);

    while (!stack.empty()) {
        size_t s = stack.back();
        stack.pop_back();

        if (new_index[s] != NO_ELEMENT) {
            throw Error(ErrorKind::LoadError,
                        "Cycle in element hierarchy at " +
                        graph->elements_[new_index[s]].path);
        }

        StagedElement& src = staged_[s];
        Element e;
        e.index = static_cast<ElementIdx>(graph->elements_.size());
        e.path = std::move(src.path);
        e.name = std::move(src.name);
        e.type = std::move(src.type);
        e.attributes = std::move(src.attributes);

        if (src.parent != SIZE_MAX) {
            const Element& parent = graph->elements_[new_index[src.parent]];
            e.parent = parent.index;
            e.depth = parent.depth + 1;
            e.external = parent.external;
        }
        if (e.name == Graph::EXTERNAL_SEGMENT) {
            e.external = true;
        }

        new_index[s] = e.index;
        graph->elements_.push_back(std::move(e));

        for (auto it = src.children.rbegin(); it != src.children.rend(); ++it) {
            stack.push_back(*it);
        }
    }

    if (graph->elements_.size() != staged_.size()) {
        throw Error(ErrorKind::LoadError,
                    std::to_string(staged_.size() - graph->elements_.size()) +
                    " element(s) not reachable from the root");
    }

    // Children lists in new indices, declared order kept
    for (size_t s = 0; s < staged_.size(); ++s) {
        Element& e = graph->elements_[new_index[s]];
        e.children.reserve(staged_[s].children.size());
        for (size_t c : staged_[s].children) {
            e.children.push_back(new_index[c]);
        }
    }

    // Subtree ranges: reverse pre-order sees every child before its parent
    for (size_t i = graph->elements_.size(); i-- > 0;) {
        Element& e = graph->elements_[i];
        e.subtree_end = e.children.empty()
            ? e.index + 1
            : graph->elements_[e.children.back()].subtree_end;
    }

    graph->index_.build(graph->elements_);

    graph->associations_.reserve(associations_.size());
    for (auto& a : associations_) {
        auto from = graph->index_.find(a.from);
        if (!from) {
            throw Error(ErrorKind::LoadError,
                        "Association source does not exist: " + a.from + " -> " + a.to);
        }
        auto to = graph->index_.find(a.to);
        if (!to) {
            throw Error(ErrorKind::LoadError,
                        "Association target does not exist: " + a.from + " -> " + a.to);
        }

        AssocIdx idx = static_cast<AssocIdx>(graph->associations_.size());
        graph->associations_.push_back({*from, *to, std::move(a.type), std::move(a.attributes)});
        graph->elements_[*from].outgoing.push_back(idx);
        graph->elements_[*to].incoming.push_back(idx);
    }

    staged_.clear();
    staged_by_path_.clear();
    associations_.clear();
    has_root_ = false;

    return graph;
}

} // namespace arbor
