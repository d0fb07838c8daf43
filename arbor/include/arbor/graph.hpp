#pragma once
// The Graph: elements in a hierarchy, associations between them
//
// A Graph is built once by GraphBuilder and never mutated afterwards.
// Elements are stored in pre-order; parent/child links are indices into
// that vector, so the graph owns every element and nothing else does.

#include "error.hpp"
#include "path_index.hpp"
#include "types.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace arbor {

struct Element {
    std::string path;
    std::string name;
    std::string type;
    Attributes attributes;

    ElementIdx index = NO_ELEMENT;       // Own pre-order position
    ElementIdx parent = NO_ELEMENT;      // NO_ELEMENT for the root
    ElementIdx subtree_end = NO_ELEMENT; // One past the last descendant
    uint32_t depth = 0;
    bool external = false;               // Under a segment named "External"

    std::vector<ElementIdx> children;    // Declared order
    std::vector<AssocIdx> outgoing;      // Declared order, this element is `from`
    std::vector<AssocIdx> incoming;      // Declared order, this element is `to`

    bool is_root() const { return parent == NO_ELEMENT; }

    size_t descendant_count() const { return subtree_end - index - 1; }

    // True if `other` is this element or one of its descendants
    bool contains(const Element& other) const {
        return other.index >= index && other.index < subtree_end;
    }
};

struct Association {
    ElementIdx from = NO_ELEMENT;
    ElementIdx to = NO_ELEMENT;
    std::string type;
    Attributes attributes;
};

// Contiguous pre-order slice of a graph's elements
class ElementRange {
public:
    using const_iterator = std::vector<Element>::const_iterator;

    ElementRange(const_iterator first, const_iterator last)
        : first_(first), last_(last) {}

    const_iterator begin() const { return first_; }
    const_iterator end() const { return last_; }
    size_t size() const { return static_cast<size_t>(last_ - first_); }
    bool empty() const { return first_ == last_; }
    const Element& front() const { return *first_; }

private:
    const_iterator first_;
    const_iterator last_;
};

class Graph {
public:
    // Separator used in element paths and the segment marking external code
    static constexpr char SEPARATOR = '/';
    static constexpr const char* EXTERNAL_SEGMENT = "External";

    const Element& root() const { return elements_.front(); }

    const std::vector<Element>& elements() const { return elements_; }
    const std::vector<Association>& associations() const { return associations_; }

    size_t size() const { return elements_.size(); }
    size_t association_count() const { return associations_.size(); }

    // Index access; out of range is a defect, not a user error
    const Element& element(ElementIdx idx) const;
    const Association& association(AssocIdx idx) const;

    // nullptr if the path is unknown
    const Element* find(const std::string& path) const;

    // Throws ElementNotFound
    const Element& resolve(const std::string& path) const;

    // nullptr for the root
    const Element* parent(const Element& e) const;

    // Pre-order slice for a scope, scope element first. An absent scope is
    // the whole graph. Throws NotFound if the scope does not resolve.
    ElementRange scope(const std::optional<std::string>& scope_path) const;

    // Same slice as pointers
    std::vector<const Element*> elements_under_scope(
        const std::optional<std::string>& scope_path) const;

    const PathIndex& index() const { return index_; }

    const Element& from_of(const Association& a) const { return element(a.from); }
    const Element& to_of(const Association& a) const { return element(a.to); }

private:
    friend class GraphBuilder;
    Graph() = default;

    std::vector<Element> elements_;
    std::vector<Association> associations_;
    PathIndex index_;
};

using GraphPtr = std::shared_ptr<const Graph>;

// Assembles and validates a Graph. Structural errors throw Error(LoadError).
class GraphBuilder {
public:
    // Returns the root path ("/" + name, or "" for an unnamed root)
    std::string set_root(const std::string& name, const std::string& type,
                         Attributes attributes = {});

    // Returns the new element's path
    std::string add_element(const std::string& parent_path, const std::string& name,
                            const std::string& type, Attributes attributes = {});

    // Endpoints are checked in build(), so associations may be declared
    // before the elements they reference
    void add_association(const std::string& from, const std::string& to,
                         const std::string& type, Attributes attributes = {});

    size_t element_count() const { return staged_.size(); }

    // Lays out pre-order, derives depth/external/ranges, resolves associations.
    // The builder is left empty afterwards.
    GraphPtr build();

private:
    struct StagedElement {
        std::string path;
        std::string name;
        std::string type;
        Attributes attributes;
        size_t parent = SIZE_MAX;
        std::vector<size_t> children;
    };

    struct StagedAssociation {
        std::string from;
        std::string to;
        std::string type;
        Attributes attributes;
    };

    std::vector<StagedElement> staged_;
    std::unordered_map<std::string, size_t> staged_by_path_;
    std::vector<StagedAssociation> associations_;
    bool has_root_ = false;

    static void check_name(const std::string& name, const std::string& where);
};

} // namespace arbor
