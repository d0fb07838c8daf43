#pragma once
// Search: name pattern, type, and attribute queries over a scope
//
// All three walk the scope's pre-order slice; results come back in
// pre-order. Patterns and scopes are validated before the walk starts,
// so a bad pattern never yields a partial result.

#include "graph.hpp"
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace arbor {

enum class PatternKind {
    Regex,  // ECMAScript, matched anywhere in the name
    Glob    // *, ?, [set], [!set]; must match the whole name
};

// Throws Error(InvalidArgument) for anything but "regex" / "glob"
PatternKind pattern_kind_from_string(const std::string& s);
const char* pattern_kind_to_string(PatternKind kind);

// Throws Error(InvalidPattern) on an unterminated bracket set
std::string glob_to_regex(const std::string& glob);

class NameMatcher {
public:
    // Throws Error(InvalidPattern)
    static NameMatcher compile(const std::string& pattern, PatternKind kind);

    // Matches every name
    static NameMatcher any();

    bool matches(const std::string& name) const;

private:
    NameMatcher() = default;

    std::optional<std::regex> regex_;
    bool whole_name_ = false;
};

struct SearchResult {
    std::vector<const Element*> elements;
    bool truncated = false;  // limit reached before the scope was exhausted
};

struct NameQuery {
    std::string pattern;
    PatternKind kind = PatternKind::Regex;
    std::optional<std::string> element_type;
    std::optional<std::string> scope_path;
    size_t limit = 0;  // 0 = unlimited
};

namespace search {

SearchResult by_name(const Graph& graph, const NameQuery& query);

SearchResult by_type(const Graph& graph, const std::string& element_type,
                     const std::optional<std::string>& scope_path = std::nullopt,
                     size_t limit = 0);

// Every filter must exist on the element and compare equal, type included
SearchResult by_attributes(const Graph& graph, const Attributes& filters,
                           const std::optional<std::string>& scope_path = std::nullopt,
                           size_t limit = 0);

} // namespace search
} // namespace arbor
