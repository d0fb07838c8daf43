#pragma once
// PathIndex: path -> element lookup plus a per-type census
//
// Elements live in pre-order, so every subtree is one contiguous range
// [index, subtree_end). Scope enumeration is a slice of that range and
// the census answers "how many descendants of type T under X" with two
// binary searches instead of a walk.

#include "types.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace arbor {

struct Element;

class PathIndex {
public:
    // Build from elements already laid out in pre-order. Called once per graph.
    void build(const std::vector<Element>& elements);

    std::optional<ElementIdx> find(const std::string& path) const {
        auto it = by_path_.find(path);
        if (it == by_path_.end()) return std::nullopt;
        return it->second;
    }

    size_t size() const { return by_path_.size(); }

    // Number of elements of each type at pre-order positions [begin, end).
    // Ordered by type name.
    std::vector<std::pair<std::string, size_t>> type_counts(ElementIdx begin,
                                                            ElementIdx end) const;

    // Count of one type in [begin, end); 0 for unknown types
    size_t count_type(const std::string& type, ElementIdx begin, ElementIdx end) const;

private:
    std::unordered_map<std::string, ElementIdx> by_path_;
    // Sorted by name; positions_by_type_[i] belongs to type_names_[i]
    std::vector<std::string> type_names_;
    std::vector<std::vector<ElementIdx>> positions_by_type_;

    static size_t count_in_range(const std::vector<ElementIdx>& positions,
                                 ElementIdx begin, ElementIdx end);
};

} // namespace arbor
