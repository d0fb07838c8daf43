#include <arbor/config.hpp>
#include <arbor/dependency.hpp>
#include <arbor/loader.hpp>
#include <arbor/mcp.hpp>
#include <arbor/model_cache.hpp>
#include <arbor/navigation.hpp>
#include <arbor/overview.hpp>
#include <arbor/search.hpp>
#include <arbor/views.hpp>
#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <sstream>
#include <thread>
#include <vector>

using namespace arbor;

#ifndef ARBOR_TEST_DATA_DIR
#define ARBOR_TEST_DATA_DIR "arbor/tests/data"
#endif

static const std::string SAMPLE_MODEL = std::string(ARBOR_TEST_DATA_DIR) + "/sample_model.json";

// Runs f and returns the kind of the arbor::Error it throws
template<typename F>
ErrorKind error_kind_of(F&& f) {
    try {
        f();
    } catch (const Error& e) {
        return e.kind();
    }
    assert(false && "expected arbor::Error");
    return ErrorKind::InternalError;
}

std::vector<std::string> paths_of(const std::vector<const Element*>& elements) {
    std::vector<std::string> out;
    for (const Element* e : elements) out.push_back(e->path);
    return out;
}

// /P -> a(file) -> Foo(class)
GraphPtr small_project() {
    GraphBuilder b;
    b.set_root("P", "repository");
    b.add_element("/P", "a", "file");
    b.add_element("/P/a", "Foo", "class");
    return b.build();
}

// small_project plus /P/b/Bar and Foo -call-> Bar
GraphPtr two_file_project() {
    GraphBuilder b;
    b.set_root("P", "repository");
    b.add_element("/P", "a", "file");
    b.add_element("/P/a", "Foo", "class");
    b.add_element("/P", "b", "file");
    b.add_element("/P/b", "Bar", "class");
    b.add_association("/P/a/Foo", "/P/b/Bar", "call");
    return b.build();
}

GraphPtr sample_graph() {
    return load_graph_file(SAMPLE_MODEL);
}

size_t assoc_index(const Graph& g, const Association* a) {
    return static_cast<size_t>(a - g.associations().data());
}

// ═══════════════════════════════════════════════════════════════════
// Graph and path index
// ═══════════════════════════════════════════════════════════════════

void test_builder_layout() {
    std::cout << "Testing GraphBuilder layout..." << std::endl;

    auto g = two_file_project();
    assert(g->size() == 5);
    assert(g->association_count() == 1);

    const Element& root = g->root();
    assert(root.path == "/P");
    assert(root.is_root());
    assert(root.depth == 0);
    assert(root.children.size() == 2);
    assert(root.descendant_count() == 4);

    const Element& foo = g->resolve("/P/a/Foo");
    assert(foo.name == "Foo");
    assert(foo.depth == 2);
    assert(g->parent(foo)->path == "/P/a");
    assert(g->resolve("/P/a").contains(foo));
    assert(!g->resolve("/P/b").contains(foo));
    assert(foo.outgoing.size() == 1);
    assert(g->resolve("/P/b/Bar").incoming.size() == 1);

    // Children keep declared order
    assert(g->element(root.children[0]).name == "a");
    assert(g->element(root.children[1]).name == "b");

    std::cout << "  PASS" << std::endl;
}

void test_builder_rejects_bad_structure() {
    std::cout << "Testing GraphBuilder validation..." << std::endl;

    {
        GraphBuilder b;
        b.set_root("P", "");
        b.add_element("/P", "a", "file");
        assert(error_kind_of([&] { b.add_element("/P", "a", "file"); }) == ErrorKind::LoadError);
    }
    {
        GraphBuilder b;
        b.set_root("P", "");
        assert(error_kind_of([&] { b.add_element("/P", "x/y", "file"); }) == ErrorKind::LoadError);
        assert(error_kind_of([&] { b.add_element("/P", "", "file"); }) == ErrorKind::LoadError);
        assert(error_kind_of([&] { b.add_element("/Q", "a", "file"); }) == ErrorKind::LoadError);
        assert(error_kind_of([&] { b.set_root("again", ""); }) == ErrorKind::LoadError);
    }
    {
        GraphBuilder b;
        b.set_root("P", "");
        b.add_element("/P", "a", "file");
        b.add_association("/P/a", "/P/missing", "call");
        assert(error_kind_of([&] { b.build(); }) == ErrorKind::LoadError);
    }
    {
        GraphBuilder b;
        assert(error_kind_of([&] { b.build(); }) == ErrorKind::LoadError);
    }

    std::cout << "  PASS" << std::endl;
}

void test_resolve_every_path() {
    std::cout << "Testing resolve round trip on every element..." << std::endl;

    auto g = sample_graph();
    assert(g->size() == 13);
    for (const auto& e : g->elements()) {
        assert(&g->resolve(e.path) == &e);
    }
    assert(g->find("/Shop/nope") == nullptr);
    assert(error_kind_of([&] { g->resolve("/Shop/nope"); }) == ErrorKind::ElementNotFound);
    assert(error_kind_of([&] { g->element(999); }) == ErrorKind::InternalError);

    std::cout << "  PASS" << std::endl;
}

void test_scope_enumeration() {
    std::cout << "Testing elements under scope..." << std::endl;

    auto g = small_project();
    auto under_a = paths_of(g->elements_under_scope(std::string("/P/a")));
    assert((under_a == std::vector<std::string>{"/P/a", "/P/a/Foo"}));

    auto all = g->elements_under_scope(std::nullopt);
    assert(all.size() == 3);
    assert(all.front() == &g->root());

    auto sample = sample_graph();
    for (const auto& e : sample->elements()) {
        auto scoped = sample->elements_under_scope(e.path);
        assert(!scoped.empty());
        assert(scoped.front() == &e);
        assert(scoped.size() == e.descendant_count() + 1);
    }

    assert(error_kind_of([&] { g->elements_under_scope(std::string("/P/z")); }) == ErrorKind::NotFound);

    std::cout << "  PASS" << std::endl;
}

void test_external_flag() {
    std::cout << "Testing external derivation..." << std::endl;

    auto g = sample_graph();
    assert(g->resolve("/Shop/External").external);
    assert(g->resolve("/Shop/External/requests").external);
    assert(g->resolve("/Shop/External/requests/get").external);
    assert(!g->resolve("/Shop/src").external);
    assert(!g->resolve("/Shop").external);

    std::cout << "  PASS" << std::endl;
}

void test_type_census() {
    std::cout << "Testing PathIndex type census..." << std::endl;

    auto g = sample_graph();
    const Element& src = g->resolve("/Shop/src");
    const PathIndex& idx = g->index();
    assert(idx.size() == g->size());

    assert(idx.count_type("function", src.index, src.subtree_end) == 2);
    assert(idx.count_type("function", 0, static_cast<ElementIdx>(g->size())) == 3);
    assert(idx.count_type("nope", 0, static_cast<ElementIdx>(g->size())) == 0);

    auto counts = idx.type_counts(src.index + 1, src.subtree_end);
    size_t total = 0;
    for (const auto& [type, n] : counts) total += n;
    assert(total == src.descendant_count());

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Loader
// ═══════════════════════════════════════════════════════════════════

void test_loader_parses_document() {
    std::cout << "Testing loader document parsing..." << std::endl;

    auto g = sample_graph();
    const Element& cart = g->resolve("/Shop/src/cart.py");
    assert(cart.type == "file");
    assert(std::get<std::string>(cart.attributes.at("language")) == "python");
    assert(std::get<double>(cart.attributes.at("lines")) == 120.0);
    assert(std::get<bool>(g->resolve("/Shop/src/orders.py/place_order").attributes.at("async")));
    assert(g->association_count() == 7);

    json doc = json::parse(R"({
        "root": {"name": "R", "children": [{"name": "x"}]},
        "associations": [{"from": "/R/x", "to": "/R"}]
    })");
    auto small = parse_graph_json(doc);
    assert(small->resolve("/R/x").type.empty());
    assert(small->associations().front().type == "unknown");

    std::cout << "  PASS" << std::endl;
}

void test_loader_errors() {
    std::cout << "Testing loader errors..." << std::endl;

    auto parse = [](const char* text) { return parse_graph_json(json::parse(text)); };

    assert(error_kind_of([&] { parse(R"([])"); }) == ErrorKind::LoadError);
    assert(error_kind_of([&] { parse(R"({"associations": []})"); }) == ErrorKind::LoadError);
    assert(error_kind_of([&] {
        parse(R"({"root": {"name": "R", "children": [{"name": "x"}, {"name": "x"}]}})");
    }) == ErrorKind::LoadError);
    assert(error_kind_of([&] {
        parse(R"({"root": {"name": "R", "attributes": {"bad": [1, 2]}}})");
    }) == ErrorKind::LoadError);
    assert(error_kind_of([&] {
        parse(R"({"root": {"name": "R"}, "associations": [{"from": "/R", "to": "/R/gone"}]})");
    }) == ErrorKind::LoadError);
    assert(error_kind_of([&] {
        parse(R"({"root": {"name": "R", "children": {"name": "x"}}})");
    }) == ErrorKind::LoadError);

    assert(error_kind_of([] { load_graph_file(""); }) == ErrorKind::LoadError);
    assert(error_kind_of([] { load_graph_file("../etc/model.json"); }) == ErrorKind::LoadError);
    assert(error_kind_of([] { load_graph_file("/nonexistent/arbor/model.json"); }) == ErrorKind::LoadError);

    auto broken = std::filesystem::temp_directory_path() / "arbor_test_broken.json";
    {
        std::ofstream out(broken);
        out << "{\"root\": {\"name\": ";
    }
    assert(error_kind_of([&] { load_graph_file(broken.string()); }) == ErrorKind::LoadError);
    std::filesystem::remove(broken);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Search
// ═══════════════════════════════════════════════════════════════════

void test_search_small_project() {
    std::cout << "Testing search on a small project..." << std::endl;

    auto g = small_project();

    NameQuery q;
    q.pattern = ".*oo";
    assert((paths_of(search::by_name(*g, q).elements) == std::vector<std::string>{"/P/a/Foo"}));
    assert((paths_of(search::by_type(*g, "file").elements) == std::vector<std::string>{"/P/a"}));

    std::cout << "  PASS" << std::endl;
}

void test_search_patterns() {
    std::cout << "Testing regex and glob patterns..." << std::endl;

    auto g = sample_graph();

    NameQuery glob;
    glob.pattern = "*.py";
    glob.kind = PatternKind::Glob;
    assert((paths_of(search::by_name(*g, glob).elements) == std::vector<std::string>{
        "/Shop/src/cart.py", "/Shop/src/orders.py", "/Shop/tests/test_cart.py"}));

    // Glob matches the whole name; regex matches anywhere
    NameQuery glob_part;
    glob_part.pattern = "cart";
    glob_part.kind = PatternKind::Glob;
    assert(search::by_name(*g, glob_part).elements.empty());

    NameQuery regex;
    regex.pattern = "art";
    assert((paths_of(search::by_name(*g, regex).elements) == std::vector<std::string>{
        "/Shop/src/cart.py", "/Shop/src/cart.py/Cart", "/Shop/tests/test_cart.py"}));

    NameQuery typed = regex;
    typed.element_type = "class";
    assert((paths_of(search::by_name(*g, typed).elements) == std::vector<std::string>{
        "/Shop/src/cart.py/Cart"}));

    NameQuery scoped = regex;
    scoped.scope_path = "/Shop/tests";
    assert(search::by_name(*g, scoped).elements.size() == 1);

    NameQuery set;
    set.pattern = "[!c]*.py";
    set.kind = PatternKind::Glob;
    assert((paths_of(search::by_name(*g, set).elements) == std::vector<std::string>{
        "/Shop/src/orders.py", "/Shop/tests/test_cart.py"}));

    assert(glob_to_regex("a.b*?") == "a\\.b.*.");

    std::cout << "  PASS" << std::endl;
}

void test_search_invalid_patterns() {
    std::cout << "Testing invalid patterns..." << std::endl;

    auto g = sample_graph();

    NameQuery bad;
    bad.pattern = "([";
    assert(error_kind_of([&] { search::by_name(*g, bad); }) == ErrorKind::InvalidPattern);

    NameQuery bad_glob;
    bad_glob.pattern = "[abc";
    bad_glob.kind = PatternKind::Glob;
    assert(error_kind_of([&] { search::by_name(*g, bad_glob); }) == ErrorKind::InvalidPattern);

    NameQuery empty;
    assert(error_kind_of([&] { search::by_name(*g, empty); }) == ErrorKind::InvalidPattern);

    // Pattern is validated before the scope
    NameQuery both = bad;
    both.scope_path = "/Shop/none";
    assert(error_kind_of([&] { search::by_name(*g, both); }) == ErrorKind::InvalidPattern);

    NameQuery bad_scope;
    bad_scope.pattern = "x";
    bad_scope.scope_path = "/Shop/none";
    assert(error_kind_of([&] { search::by_name(*g, bad_scope); }) == ErrorKind::NotFound);

    assert(error_kind_of([] { pattern_kind_from_string("fuzzy"); }) == ErrorKind::InvalidArgument);

    std::cout << "  PASS" << std::endl;
}

void test_search_match_all_equals_scope() {
    std::cout << "Testing match-all search equals scope..." << std::endl;

    auto g = sample_graph();
    for (const char* scope : {"/Shop", "/Shop/src", "/Shop/External/requests"}) {
        NameQuery q;
        q.pattern = ".*";
        q.scope_path = std::string(scope);
        auto found = search::by_name(*g, q).elements;
        assert(found == g->elements_under_scope(std::string(scope)));
    }

    std::cout << "  PASS" << std::endl;
}

void test_search_by_type_and_limit() {
    std::cout << "Testing search by type with limit..." << std::endl;

    auto g = sample_graph();

    auto functions = search::by_type(*g, "function", std::string("/Shop/src"));
    assert((paths_of(functions.elements) == std::vector<std::string>{
        "/Shop/src/cart.py/Cart/add", "/Shop/src/orders.py/place_order"}));
    assert(!functions.truncated);

    auto limited = search::by_type(*g, "function", std::string("/Shop/src"), 1);
    assert(limited.elements.size() == 1);
    assert(limited.truncated);

    auto exact = search::by_type(*g, "function", std::string("/Shop/src"), 2);
    assert(exact.elements.size() == 2);
    assert(!exact.truncated);

    assert(search::by_type(*g, "Function").elements.empty());

    std::cout << "  PASS" << std::endl;
}

void test_search_by_attributes() {
    std::cout << "Testing search by attributes..." << std::endl;

    auto g = sample_graph();

    Attributes python{{"language", std::string("python")}};
    assert(search::by_attributes(*g, python).elements.size() == 3);

    Attributes lines{{"lines", 120.0}};
    assert((paths_of(search::by_attributes(*g, lines).elements) ==
            std::vector<std::string>{"/Shop/src/cart.py"}));

    // Values compare with their type
    Attributes lines_text{{"lines", std::string("120")}};
    assert(search::by_attributes(*g, lines_text).elements.empty());

    Attributes async{{"async", true}};
    assert((paths_of(search::by_attributes(*g, async).elements) ==
            std::vector<std::string>{"/Shop/src/orders.py/place_order"}));

    Attributes both{{"language", std::string("python")}, {"lines", 80.0}};
    assert((paths_of(search::by_attributes(*g, both).elements) ==
            std::vector<std::string>{"/Shop/src/orders.py"}));

    Attributes scoped{{"language", std::string("python")}};
    assert(search::by_attributes(*g, scoped, std::string("/Shop/tests")).elements.size() == 1);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Dependency analysis
// ═══════════════════════════════════════════════════════════════════

void test_subtree_outgoing_only() {
    std::cout << "Testing subtree association outgoing only..." << std::endl;

    auto g = two_file_project();
    auto deps = analyze_subtree(*g, "/P/a");
    assert(deps.internal.empty());
    assert(deps.incoming.empty());
    assert(deps.outgoing.size() == 1);
    assert(g->from_of(*deps.outgoing[0].association).path == "/P/a/Foo");
    assert(g->to_of(*deps.outgoing[0].association).path == "/P/b/Bar");

    std::cout << "  PASS" << std::endl;
}

void test_subtree_classification() {
    std::cout << "Testing subtree classification..." << std::endl;

    auto g = sample_graph();
    auto deps = analyze_subtree(*g, "/Shop/src");
    assert(deps.analyzed.size() == 7);
    assert(deps.internal.size() == 4);
    assert(deps.incoming.size() == 2);
    assert(deps.outgoing.size() == 1);
    assert(deps.suppressed_external == 0);

    auto no_ext = analyze_subtree(*g, "/Shop/src", false);
    assert(no_ext.internal.size() == 4);
    assert(no_ext.incoming.size() == 1);
    assert(no_ext.outgoing.empty());
    assert(no_ext.suppressed_external == 2);

    assert(error_kind_of([&] { analyze_subtree(*g, "/Shop/gone"); }) == ErrorKind::ElementNotFound);

    std::cout << "  PASS" << std::endl;
}

void test_subtree_partition() {
    std::cout << "Testing subtree partition on every scope..." << std::endl;

    auto g = sample_graph();
    for (const auto& scope : g->elements()) {
        auto deps = analyze_subtree(*g, scope.path, true);

        std::multiset<size_t> seen;
        for (const auto* list : {&deps.internal, &deps.incoming, &deps.outgoing}) {
            for (const auto& sa : *list) seen.insert(assoc_index(*g, sa.association));
        }

        std::set<size_t> expected;
        for (size_t i = 0; i < g->association_count(); ++i) {
            const Association& a = g->associations()[i];
            if (scope.contains(g->from_of(a)) || scope.contains(g->to_of(a))) {
                expected.insert(i);
            }
        }

        assert(seen.size() == expected.size());
        for (size_t i : expected) assert(seen.count(i) == 1);

        for (const auto& sa : deps.internal) {
            assert(scope.contains(g->from_of(*sa.association)));
            assert(scope.contains(g->to_of(*sa.association)));
        }
        for (const auto& sa : deps.incoming) {
            assert(!scope.contains(g->from_of(*sa.association)));
        }
        for (const auto& sa : deps.outgoing) {
            assert(!scope.contains(g->to_of(*sa.association)));
        }
    }

    std::cout << "  PASS" << std::endl;
}

void test_subtree_depth_anchors() {
    std::cout << "Testing subtree depth limit anchors..." << std::endl;

    auto g = sample_graph();
    auto deps = analyze_subtree(*g, "/Shop/src", true, 1);

    assert((paths_of(deps.analyzed) == std::vector<std::string>{
        "/Shop/src", "/Shop/src/cart.py", "/Shop/src/orders.py"}));
    // Membership is still the whole subtree
    assert(deps.internal.size() == 4);

    bool found = false;
    for (const auto& sa : deps.internal) {
        if (g->from_of(*sa.association).path == "/Shop/src/cart.py/Cart/add") {
            assert(sa.from_anchor->path == "/Shop/src/cart.py");
            assert(sa.to_anchor->path == "/Shop/src/orders.py");
            found = true;
        }
    }
    assert(found);

    std::cout << "  PASS" << std::endl;
}

void test_chain_levels() {
    std::cout << "Testing dependency chain levels..." << std::endl;

    auto g = sample_graph();

    auto out = dependency_chain(*g, "/Shop/src/orders.py/place_order", Direction::Outgoing);
    assert(out.levels.size() == 2);
    assert(out.levels[0].steps.size() == 1);
    assert(out.levels[0].steps[0].via == nullptr);
    assert(out.levels[1].steps.size() == 2);
    assert(out.levels[1].steps[0].element->path == "/Shop/External/requests/get");
    assert(out.levels[1].steps[1].element->path == "/Shop/src/cart.py/Cart");
    assert(out.levels[1].steps[1].reached_from->path == "/Shop/src/orders.py/place_order");
    assert(out.visited == 3);
    assert(out.association_count() == 2);
    assert(!out.depth_limited);

    auto in = dependency_chain(*g, "/Shop/src/cart.py/Cart", "incoming");
    assert(in.levels.size() == 2);
    assert(in.levels[1].steps[0].element->path == "/Shop/src/orders.py/place_order");
    assert(in.levels[1].steps[1].element->path == "/Shop/tests/test_cart.py");

    assert(error_kind_of([&] { dependency_chain(*g, "/Shop", "sideways"); }) ==
           ErrorKind::InvalidDirection);
    assert(error_kind_of([&] { dependency_chain(*g, "/Shop/none", Direction::Outgoing); }) ==
           ErrorKind::ElementNotFound);

    std::cout << "  PASS" << std::endl;
}

void test_chain_cycle() {
    std::cout << "Testing dependency chain on a cycle..." << std::endl;

    auto g = sample_graph();
    // cart.py imports orders.py which imports cart.py
    auto chain = dependency_chain(*g, "/Shop/src/cart.py", Direction::Outgoing);
    assert(chain.visited == 2);
    assert(chain.levels.size() == 2);
    assert(chain.levels[1].steps[0].element->path == "/Shop/src/orders.py");

    for (const auto& e : g->elements()) {
        for (Direction d : {Direction::Outgoing, Direction::Incoming}) {
            auto c = dependency_chain(*g, e.path, d);
            std::set<std::string> paths;
            size_t steps = 0;
            for (const auto& level : c.levels) {
                for (const auto& step : level.steps) {
                    paths.insert(step.element->path);
                    steps++;
                }
            }
            assert(paths.size() == steps);
            assert(steps == c.visited);
            assert(c.visited <= g->size());
        }
    }

    std::cout << "  PASS" << std::endl;
}

void test_chain_depth_zero() {
    std::cout << "Testing dependency chain with max depth 0..." << std::endl;

    auto g = sample_graph();
    for (const auto& e : g->elements()) {
        for (Direction d : {Direction::Outgoing, Direction::Incoming}) {
            auto c = dependency_chain(*g, e.path, d, 0);
            assert(c.levels.size() == 1);
            assert(c.levels[0].steps.size() == 1);
            assert(c.levels[0].steps[0].element == &e);
            assert(c.association_count() == 0);
        }
    }

    auto limited = dependency_chain(*g, "/Shop/src/cart.py", Direction::Outgoing, 0);
    assert(limited.depth_limited);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Overview and batch retrieval
// ═══════════════════════════════════════════════════════════════════

void test_overview_depth_bound() {
    std::cout << "Testing overview depth bound..." << std::endl;

    auto g = sample_graph();

    auto ov = build_overview(*g, std::nullopt, 1, true);
    assert(ov.total_elements() == 4);
    assert(ov.depth_counts.at(0) == 1);
    assert(ov.depth_counts.at(1) == 3);
    assert(ov.type_distribution.at("directory") == 3);
    assert(ov.nodes[0].expanded);
    assert(ov.nodes[0].children.size() == 3);
    assert(!ov.nodes[1].expanded);

    size_t descendants = 0;
    for (const auto& [type, n] : ov.nodes[0].descendant_types) descendants += n;
    assert(descendants == 12);

    auto flat = build_overview(*g, std::nullopt, 0, false);
    assert(flat.total_elements() == 1);
    assert(flat.nodes[0].descendant_types.empty());

    auto scoped = build_overview(*g, std::string("/Shop/src"), 5, true);
    assert(scoped.total_elements() == 7);
    assert(scoped.nodes[0].depth == 0);

    assert(error_kind_of([&] { build_overview(*g, std::string("/Shop/x")); }) == ErrorKind::NotFound);

    json view = overview_view(ov);
    assert(view["tree_structure"]["children"].size() == 3);
    assert(view["tree_structure"]["children"][0]["has_more_children"] == 2);
    assert(view["summary"]["total_elements"] == 4);

    std::cout << "  PASS" << std::endl;
}

void test_multiple_elements() {
    std::cout << "Testing batch element retrieval..." << std::endl;

    auto g = sample_graph();
    auto lookups = get_multiple_elements(*g, {"/Shop/src", "/Shop/missing", "/Shop/tests"});
    assert(lookups.size() == 3);
    assert(lookups[0].found());
    assert(!lookups[1].found());
    assert(lookups[2].found());

    json view = multiple_elements_view(*g, lookups);
    assert(view["found_count"] == 2);
    assert(view["elements"][1]["error"]["kind"] == "NotFound");
    assert(view["not_found"][0] == "/Shop/missing");

    assert(incoming_associations(*g, "/Shop/src/cart.py/Cart").size() == 2);
    assert(outgoing_associations(*g, "/Shop/src/orders.py/place_order").size() == 2);
    assert(error_kind_of([&] { incoming_associations(*g, "/x"); }) == ErrorKind::ElementNotFound);

    std::cout << "  PASS" << std::endl;
}

void test_element_view() {
    std::cout << "Testing element view..." << std::endl;

    auto g = sample_graph();
    json root = element_view(*g, g->root());
    assert(root["path"] == "/Shop");
    assert(root["parent_path"].is_null());
    assert(root["child_paths"].size() == 3);
    assert(root["attributes"]["vcs"] == "git");

    json cart = element_view(*g, g->resolve("/Shop/src/cart.py"));
    assert(cart["attributes"]["lines"] == 120);
    assert(cart["attributes"]["lines"].is_number_integer());
    assert(cart["attributes"].dump().find("\"lines\":120}") != std::string::npos);
    assert(cart["external"] == false);

    std::cout << "  PASS" << std::endl;
}

void test_attribute_numbers() {
    std::cout << "Testing numeric attribute views..." << std::endl;

    json doc = json::parse(R"({
        "root": {"name": "R", "attributes": {
            "lines": 120, "ratio": 0.5, "delta": -3, "id": 9007199254740993}}
    })");
    auto g = parse_graph_json(doc);
    json attrs = element_view(*g, g->root())["attributes"];

    assert(attrs["lines"].is_number_integer());
    assert(attrs["lines"].get<int64_t>() == 120);
    assert(attrs["delta"].is_number_integer());
    assert(attrs["delta"].get<int64_t>() == -3);
    assert(attrs["ratio"].is_number_float());
    assert(attrs["ratio"].get<double>() == 0.5);
    // Stored as a double, so the nearest representable integer comes back
    assert(attrs["id"].is_number_integer());
    assert(attrs["id"].get<int64_t>() == 9007199254740992LL);
    assert(attrs.dump().find("e+") == std::string::npos);

    Attributes huge;
    huge["big"] = 1e300;
    assert(attributes_to_json(huge)["big"].is_number_float());

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Model cache
// ═══════════════════════════════════════════════════════════════════

void test_cache_lifecycle() {
    std::cout << "Testing model cache lifecycle..." << std::endl;

    ModelCache cache;
    std::string a = cache.load(SAMPLE_MODEL);
    std::string b = cache.load(SAMPLE_MODEL);
    assert(a != b);
    assert(is_valid_model_id(a));
    assert(cache.size() == 2);

    auto info = cache.info(a);
    assert(info.element_count == 13);
    assert(info.association_count == 7);
    assert(info.root_name == "Shop");
    assert(info.root_children == 3);

    auto listed = cache.list();
    assert(listed.size() == 2);
    assert(listed[0].id == a);
    assert(listed[1].id == b);

    GraphPtr held = cache.get(a);
    assert(cache.evict(a));
    assert(error_kind_of([&] { cache.get(a); }) == ErrorKind::NotLoaded);
    assert(!cache.evict(a));
    // A graph already handed out outlives its eviction
    assert(held->size() == 13);

    assert(error_kind_of([&] { cache.load("/nonexistent/model.json"); }) == ErrorKind::LoadError);
    assert(cache.size() == 1);

    assert(cache.clear() == 1);
    assert(cache.size() == 0);
    assert(!cache.contains(b));

    std::cout << "  PASS" << std::endl;
}

void test_cache_injected_loader() {
    std::cout << "Testing model cache with injected loader..." << std::endl;

    std::atomic<int> calls{0};
    ModelCache cache([&calls](const std::string& source) {
        calls++;
        if (source == "fail") {
            throw std::runtime_error("disk on fire");
        }
        return small_project();
    });

    std::string id = cache.load("anything");
    assert(calls == 1);
    assert(cache.get(id)->size() == 3);

    assert(error_kind_of([&] { cache.load("fail"); }) == ErrorKind::LoadError);

    ModelCache empty_cache([](const std::string&) { return GraphPtr(); });
    assert(error_kind_of([&] { empty_cache.load("x"); }) == ErrorKind::LoadError);

    std::cout << "  PASS" << std::endl;
}

void test_cache_load_timeout() {
    std::cout << "Testing model cache load timeout..." << std::endl;

    CacheConfig config;
    config.load_timeout = std::chrono::milliseconds(50);
    ModelCache cache([](const std::string&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        return small_project();
    }, config);

    try {
        cache.load("slow");
        assert(false && "expected timeout");
    } catch (const Error& e) {
        assert(e.kind() == ErrorKind::LoadError);
        assert(std::string(e.what()).find("timed out") != std::string::npos);
    }
    assert(cache.size() == 0);

    assert(cache.running_loads() == 1);

    // Let the abandoned worker finish
    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    assert(cache.running_loads() == 0);

    std::cout << "  PASS" << std::endl;
}

void test_model_ids_never_repeat() {
    std::cout << "Testing model id sequence..." << std::endl;

    std::string first = generate_model_id(0);
    std::string second = generate_model_id(1);
    assert(is_valid_model_id(first));
    assert(is_valid_model_id(second));
    assert(first.substr(0, MODEL_ID_SEQUENCE_CHARS) != second.substr(0, MODEL_ID_SEQUENCE_CHARS));
    assert(generate_model_id(64).substr(0, MODEL_ID_SEQUENCE_CHARS) !=
           generate_model_id(1).substr(0, MODEL_ID_SEQUENCE_CHARS));

    ModelCache cache([](const std::string&) { return small_project(); });
    std::set<std::string> seen;
    for (int i = 0; i < 200; i++) {
        std::string id = cache.load("m");
        assert(is_valid_model_id(id));
        assert(seen.insert(id).second);
        assert(cache.evict(id));
    }
    assert(cache.size() == 0);

    std::cout << "  PASS" << std::endl;
}

void test_cache_concurrent_access() {
    std::cout << "Testing concurrent get/evict..." << std::endl;

    ModelCache cache;
    std::string id = cache.load(SAMPLE_MODEL);

    std::atomic<int> hits{0};
    std::atomic<int> misses{0};
    std::atomic<int> unexpected{0};

    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&]() {
            for (int i = 0; i < 500; ++i) {
                try {
                    GraphPtr g = cache.get(id);
                    NameQuery q;
                    q.pattern = "art";
                    if (search::by_name(*g, q).elements.size() == 3) hits++;
                    else unexpected++;
                } catch (const Error& e) {
                    if (e.kind() == ErrorKind::NotLoaded) misses++;
                    else unexpected++;
                }
            }
        });
    }

    std::thread evicter([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        cache.evict(id);
    });

    for (auto& r : readers) r.join();
    evicter.join();

    assert(unexpected == 0);
    assert(hits + misses == 2000);
    assert(!cache.contains(id));

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Config
// ═══════════════════════════════════════════════════════════════════

void test_config() {
    std::cout << "Testing server config..." << std::endl;

    ServerConfig config;
    std::string err;

    const char* argv[] = {"arbor_mcp", "--load-timeout-ms", "2500", "--log-level", "debug",
                          "--preload", "a.json", "--preload", "b.json"};
    assert(apply_arguments(config, 9, const_cast<char**>(argv), err));
    assert(config.load_timeout.count() == 2500);
    assert(config.log_level == LogLevel::Debug);
    assert(config.preload.size() == 2);

    const char* bad[] = {"arbor_mcp", "--log-level", "loud"};
    assert(!apply_arguments(config, 3, const_cast<char**>(bad), err));
    assert(!err.empty());

    const char* unknown[] = {"arbor_mcp", "--frobnicate"};
    assert(!apply_arguments(config, 2, const_cast<char**>(unknown), err));

    setenv("ARBOR_LOAD_TIMEOUT_MS", "0", 1);
    ServerConfig env_config;
    assert(apply_environment(env_config, err));
    assert(env_config.load_timeout.count() == 0);
    setenv("ARBOR_LOAD_TIMEOUT_MS", "-5", 1);
    assert(!apply_environment(env_config, err));
    unsetenv("ARBOR_LOAD_TIMEOUT_MS");

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// MCP handler
// ═══════════════════════════════════════════════════════════════════

json rpc(mcp::Handler& h, const std::string& method, const json& params, int id = 1) {
    json req = {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
    return json::parse(h.handle(req.dump()));
}

json call_tool(mcp::Handler& h, const std::string& tool, const json& arguments) {
    return rpc(h, "tools/call", {{"name", tool}, {"arguments", arguments}});
}

std::string error_kind_in(const json& response) {
    assert(response["result"]["isError"] == true);
    return response["result"]["structuredContent"]["error"]["kind"];
}

void test_mcp_protocol() {
    std::cout << "Testing MCP protocol handling..." << std::endl;

    ModelCache cache;
    mcp::Handler h(&cache);

    json init = rpc(h, "initialize", json::object());
    assert(init["result"]["protocolVersion"] == ARBOR_PROTOCOL_VERSION);
    assert(init["result"]["serverInfo"]["name"] == "arbor");

    json list = rpc(h, "tools/list", json::object());
    assert(list["result"]["tools"].size() == 15);
    assert(h.tools().size() == 15);

    assert(h.handle(R"({"jsonrpc":"2.0","method":"notifications/initialized"})").empty());

    json parse_err = json::parse(h.handle("not json"));
    assert(parse_err["error"]["code"] == mcp::error::PARSE_ERROR);

    json invalid = json::parse(h.handle(R"({"id":3,"method":"tools/list"})"));
    assert(invalid["error"]["code"] == mcp::error::INVALID_REQUEST);

    json unknown_method = rpc(h, "resources/list", json::object());
    assert(unknown_method["error"]["code"] == mcp::error::METHOD_NOT_FOUND);

    json unknown_tool = call_tool(h, "format_disk", json::object());
    assert(unknown_tool["error"]["code"] == mcp::error::TOOL_NOT_FOUND);

    std::cout << "  PASS" << std::endl;
}

void test_mcp_tools() {
    std::cout << "Testing MCP tools end to end..." << std::endl;

    ModelCache cache;
    mcp::Handler h(&cache);

    json loaded = call_tool(h, "load_model", {{"path", SAMPLE_MODEL}});
    assert(loaded["result"]["isError"] == false);
    std::string id = loaded["result"]["structuredContent"]["model_id"];
    assert(id.size() == MODEL_ID_LENGTH);

    json listed = call_tool(h, "list_models", json::object());
    assert(listed["result"]["structuredContent"]["count"] == 1);

    json root = call_tool(h, "get_root_element", {{"model_id", id}});
    assert(root["result"]["structuredContent"]["path"] == "/Shop");

    json element = call_tool(h, "get_element", {{"model_id", id}, {"element_path", "/Shop/src/cart.py"}});
    assert(element["result"]["structuredContent"]["type"] == "file");

    json incoming = call_tool(h, "get_element_incoming_associations",
                              {{"model_id", id}, {"element_path", "/Shop/src/cart.py/Cart"}});
    assert(incoming["result"]["structuredContent"]["count"] == 2);

    json outgoing = call_tool(h, "get_element_outgoing_associations",
                              {{"model_id", id}, {"element_path", "/Shop/src/cart.py"}});
    assert(outgoing["result"]["structuredContent"]["associations"][0]["to"] == "/Shop/src/orders.py");

    json overview = call_tool(h, "get_model_overview", {{"model_id", id}, {"max_depth", 1}});
    assert(overview["result"]["structuredContent"]["summary"]["total_elements"] == 4);

    json by_name = call_tool(h, "search_elements_by_name",
                             {{"model_id", id}, {"pattern", "*.py"}, {"pattern_kind", "glob"}});
    assert(by_name["result"]["structuredContent"]["count"] == 3);

    json by_type = call_tool(h, "get_elements_by_type",
                             {{"model_id", id}, {"element_type", "function"}, {"limit", 1}});
    assert(by_type["result"]["structuredContent"]["count"] == 1);
    assert(by_type["result"]["structuredContent"]["truncated"] == true);

    json by_attr = call_tool(h, "search_elements_by_attributes",
                             {{"model_id", id}, {"attribute_filters", {{"lines", 80}}}});
    assert(by_attr["result"]["structuredContent"]["elements"][0]["path"] == "/Shop/src/orders.py");

    json subtree = call_tool(h, "get_subtree_dependencies",
                             {{"model_id", id}, {"root_path", "/Shop/src"}, {"include_external", false}});
    assert(subtree["result"]["structuredContent"]["counts"]["internal"] == 4);
    assert(subtree["result"]["structuredContent"]["suppressed_external"] == 2);

    json chain = call_tool(h, "get_dependency_chain",
                           {{"model_id", id}, {"element_path", "/Shop/src/cart.py/Cart"},
                            {"direction", "incoming"}});
    assert(chain["result"]["structuredContent"]["visited_count"] == 3);
    assert(chain["result"]["structuredContent"]["all_dependencies"].size() == 2);

    json batch = call_tool(h, "get_multiple_elements",
                           {{"model_id", id},
                            {"element_paths", {"/Shop/src", "/Shop/nope", "/Shop/tests"}}});
    assert(batch["result"]["isError"] == false);
    assert(batch["result"]["structuredContent"]["found_count"] == 2);

    json removed = call_tool(h, "remove_model", {{"model_id", id}});
    assert(removed["result"]["structuredContent"]["removed"] == true);
    json removed_again = call_tool(h, "remove_model", {{"model_id", id}});
    assert(removed_again["result"]["isError"] == false);
    assert(removed_again["result"]["structuredContent"]["removed"] == false);

    json cleared = call_tool(h, "clear_cache", json::object());
    assert(cleared["result"]["structuredContent"]["cleared"] == 0);

    std::cout << "  PASS" << std::endl;
}

void test_mcp_tool_errors() {
    std::cout << "Testing MCP tool errors..." << std::endl;

    ModelCache cache;
    mcp::Handler h(&cache);
    std::string id = cache.load(SAMPLE_MODEL);

    assert(error_kind_in(call_tool(h, "get_element", {{"model_id", "abc"}, {"element_path", "/Shop"}}))
           == "InvalidArgument");
    assert(error_kind_in(call_tool(h, "get_element",
                                   {{"model_id", std::string(MODEL_ID_LENGTH, 'A')},
                                    {"element_path", "/Shop"}}))
           == "NotLoaded");
    assert(error_kind_in(call_tool(h, "get_element", {{"model_id", id}, {"element_path", "/Shop/x"}}))
           == "ElementNotFound");
    assert(error_kind_in(call_tool(h, "get_element", {{"model_id", id}})) == "InvalidArgument");
    assert(error_kind_in(call_tool(h, "get_element", {{"model_id", id}, {"element_path", 7}}))
           == "InvalidArgument");
    assert(error_kind_in(call_tool(h, "search_elements_by_name", {{"model_id", id}, {"pattern", "("}}))
           == "InvalidPattern");
    assert(error_kind_in(call_tool(h, "search_elements_by_name",
                                   {{"model_id", id}, {"pattern", "x"}, {"pattern_kind", "fuzzy"}}))
           == "InvalidArgument");
    assert(error_kind_in(call_tool(h, "get_elements_by_type",
                                   {{"model_id", id}, {"element_type", "file"}, {"scope_path", "/no"}}))
           == "NotFound");
    assert(error_kind_in(call_tool(h, "get_dependency_chain",
                                   {{"model_id", id}, {"element_path", "/Shop"}, {"direction", "up"}}))
           == "InvalidDirection");
    assert(error_kind_in(call_tool(h, "search_elements_by_attributes",
                                   {{"model_id", id}, {"attribute_filters", {{"x", {1, 2}}}}}))
           == "InvalidArgument");
    assert(error_kind_in(call_tool(h, "get_elements_by_type",
                                   {{"model_id", id}, {"element_type", "file"}, {"limit", -1}}))
           == "InvalidArgument");
    assert(error_kind_in(call_tool(h, "load_model", {{"path", "../secret.json"}})) == "LoadError");
    assert(error_kind_in(call_tool(h, "get_dependency_chain",
                                   {{"model_id", id}, {"element_path", "/Shop"},
                                    {"direction", "outgoing"}, {"max_depth", 3000000000LL}}))
           == "InvalidArgument");

    json resp = call_tool(h, "get_element", {{"model_id", id}, {"element_path", "/Shop/x"}});
    assert(resp["result"]["content"][0]["type"] == "text");
    assert(!resp["result"]["structuredContent"]["error"]["message"].get<std::string>().empty());

    std::cout << "  PASS" << std::endl;
}

void test_mcp_integer_arguments() {
    std::cout << "Testing MCP integer argument range..." << std::endl;

    assert(mcp::args::optional_int(json{{"max_depth", 3}}, "max_depth") == 3);
    assert(mcp::args::optional_int(json{{"max_depth", -2}}, "max_depth") == -2);
    assert(!mcp::args::optional_int(json::object(), "max_depth"));
    assert(mcp::args::optional_int(json{{"n", 2147483647LL}}, "n") == 2147483647);

    assert(error_kind_of([] { mcp::args::optional_int(json{{"max_depth", 3000000000LL}}, "max_depth"); })
           == ErrorKind::InvalidArgument);
    assert(error_kind_of([] { mcp::args::optional_int(json{{"max_depth", -3000000000LL}}, "max_depth"); })
           == ErrorKind::InvalidArgument);
    assert(error_kind_of([] { mcp::args::optional_int(json{{"n", 18446744073709551615ULL}}, "n"); })
           == ErrorKind::InvalidArgument);

    try {
        mcp::args::limit_or(json{{"limit", 2147483648LL}}, "limit", 100);
        assert(false && "expected out of range");
    } catch (const Error& e) {
        assert(e.kind() == ErrorKind::InvalidArgument);
        assert(std::string(e.what()).find("out of range") != std::string::npos);
    }
    assert(mcp::args::limit_or(json::object(), "limit", 100) == 100);

    std::cout << "  PASS" << std::endl;
}

void test_mcp_server_stream() {
    std::cout << "Testing MCP server stream loop..." << std::endl;

    ModelCache cache;
    MCPServer server(&cache);

    std::istringstream in(
        R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})" "\n"
        R"({"jsonrpc":"2.0","method":"notifications/initialized"})" "\n"
        "\n"
        R"({"jsonrpc":"2.0","id":2,"method":"shutdown"})" "\n"
        R"({"jsonrpc":"2.0","id":3,"method":"tools/list"})" "\n");
    std::ostringstream out;

    size_t served = server.run(in, out);
    assert(served == 3);

    std::istringstream lines(out.str());
    std::string line;
    std::vector<json> responses;
    while (std::getline(lines, line)) responses.push_back(json::parse(line));
    assert(responses.size() == 2);
    assert(responses[0]["id"] == 1);
    assert(responses[1]["result"]["status"] == "ok");

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Arbor Tests ===" << std::endl;

    logging::set_level(LogLevel::Error);

    test_builder_layout();
    test_builder_rejects_bad_structure();
    test_resolve_every_path();
    test_scope_enumeration();
    test_external_flag();
    test_type_census();

    test_loader_parses_document();
    test_loader_errors();

    test_search_small_project();
    test_search_patterns();
    test_search_invalid_patterns();
    test_search_match_all_equals_scope();
    test_search_by_type_and_limit();
    test_search_by_attributes();

    test_subtree_outgoing_only();
    test_subtree_classification();
    test_subtree_partition();
    test_subtree_depth_anchors();
    test_chain_levels();
    test_chain_cycle();
    test_chain_depth_zero();

    test_overview_depth_bound();
    test_multiple_elements();
    test_element_view();
    test_attribute_numbers();

    test_cache_lifecycle();
    test_cache_injected_loader();
    test_cache_load_timeout();
    test_model_ids_never_repeat();
    test_cache_concurrent_access();

    test_config();

    test_mcp_protocol();
    test_mcp_tools();
    test_mcp_tool_errors();
    test_mcp_integer_arguments();
    test_mcp_server_stream();

    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
