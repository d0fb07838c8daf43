#include <arbor/search.hpp>
#include <arbor/log.hpp>
#include <cstring>

namespace arbor {

PatternKind pattern_kind_from_string(const std::string& s) {
    if (s == "regex") return PatternKind::Regex;
    if (s == "glob") return PatternKind::Glob;
    throw Error(ErrorKind::InvalidArgument,
                "Unknown pattern kind '" + s + "' (expected 'regex' or 'glob')");
}

const char* pattern_kind_to_string(PatternKind kind) {
    return kind == PatternKind::Glob ? "glob" : "regex";
}

std::string glob_to_regex(const std::string& glob) {
    static const char* special = ".^$|()+{}\\";
    std::string out;
    out.reserve(glob.size() * 2);

    for (size_t i = 0; i < glob.size(); ++i) {
        char c = glob[i];
        if (c == '*') {
            out += ".*";
        } else if (c == '?') {
            out += '.';
        } else if (c == '[') {
            size_t j = i + 1;
            std::string set = "[";
            if (j < glob.size() && (glob[j] == '!' || glob[j] == '^')) {
                set += '^';
                ++j;
            }
            // A ']' right after the opener is a literal member
            if (j < glob.size() && glob[j] == ']') {
                set += "\\]";
                ++j;
            }
            while (j < glob.size() && glob[j] != ']') {
                if (glob[j] == '\\' || glob[j] == '[') set += '\\';
                set += glob[j];
                ++j;
            }
            if (j >= glob.size()) {
                throw Error(ErrorKind::InvalidPattern,
                            "Invalid glob pattern '" + glob + "': unterminated '['");
            }
            set += ']';
            out += set;
            i = j;
        } else if (c == ']') {
            out += "\\]";
        } else if (c != '\0' && std::strchr(special, c)) {
            out += '\\';
            out += c;
        } else {
            out += c;
        }
    }
    return out;
}

NameMatcher NameMatcher::compile(const std::string& pattern, PatternKind kind) {
    if (pattern.empty()) {
        throw Error(ErrorKind::InvalidPattern, "Pattern cannot be empty");
    }

    NameMatcher m;
    std::string source = pattern;
    if (kind == PatternKind::Glob) {
        source = glob_to_regex(pattern);
        m.whole_name_ = true;
    }

    try {
        m.regex_.emplace(source, std::regex::ECMAScript | std::regex::optimize);
    } catch (const std::regex_error& e) {
        throw Error(ErrorKind::InvalidPattern,
                    std::string("Invalid ") + pattern_kind_to_string(kind) +
                    " pattern '" + pattern + "': " + e.what());
    }
    return m;
}

NameMatcher NameMatcher::any() {
    return NameMatcher();
}

bool NameMatcher::matches(const std::string& name) const {
    if (!regex_) return true;
    if (whole_name_) return std::regex_match(name, *regex_);
    return std::regex_search(name, *regex_);
}

namespace search {

namespace {

// Walks the scope slice in pre-order, collecting matches up to `limit`
template<typename Pred>
SearchResult collect(const ElementRange& range, size_t limit, Pred&& pred) {
    SearchResult result;
    for (const auto& e : range) {
        if (!pred(e)) continue;
        if (limit > 0 && result.elements.size() == limit) {
            result.truncated = true;
            break;
        }
        result.elements.push_back(&e);
    }
    return result;
}

std::string scope_label(const std::optional<std::string>& scope_path) {
    return scope_path ? "'" + *scope_path + "'" : std::string("<all>");
}

} // namespace

SearchResult by_name(const Graph& graph, const NameQuery& query) {
    NameMatcher matcher = NameMatcher::compile(query.pattern, query.kind);
    ElementRange range = graph.scope(query.scope_path);

    SearchResult result = collect(range, query.limit, [&](const Element& e) {
        if (query.element_type && e.type != *query.element_type) return false;
        return matcher.matches(e.name);
    });

    logging::debug("search", "by_name pattern='" + query.pattern + "' scope=" +
                   scope_label(query.scope_path) + ": " +
                   std::to_string(result.elements.size()) + " of " +
                   std::to_string(range.size()) + " elements");
    return result;
}

SearchResult by_type(const Graph& graph, const std::string& element_type,
                     const std::optional<std::string>& scope_path, size_t limit) {
    ElementRange range = graph.scope(scope_path);

    SearchResult result = collect(range, limit, [&](const Element& e) {
        return e.type == element_type;
    });

    logging::debug("search", "by_type type='" + element_type + "' scope=" +
                   scope_label(scope_path) + ": " +
                   std::to_string(result.elements.size()) + " elements");
    return result;
}

SearchResult by_attributes(const Graph& graph, const Attributes& filters,
                           const std::optional<std::string>& scope_path, size_t limit) {
    ElementRange range = graph.scope(scope_path);

    SearchResult result = collect(range, limit, [&](const Element& e) {
        for (const auto& [name, expected] : filters) {
            auto it = e.attributes.find(name);
            if (it == e.attributes.end() || !(it->second == expected)) {
                return false;
            }
        }
        return true;
    });

    logging::debug("search", "by_attributes filters=" + std::to_string(filters.size()) +
                   " scope=" + scope_label(scope_path) + ": " +
                   std::to_string(result.elements.size()) + " elements");
    return result;
}

} // namespace search
} // namespace arbor
