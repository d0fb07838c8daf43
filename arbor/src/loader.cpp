#include <arbor/loader.hpp>
#include <arbor/log.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

namespace arbor {

namespace fs = std::filesystem;

namespace {

std::string string_field(const json& node, const char* key, const std::string& where,
                         const std::string& fallback) {
    auto it = node.find(key);
    if (it == node.end() || it->is_null()) return fallback;
    if (!it->is_string()) {
        throw Error(ErrorKind::LoadError,
                    std::string("Field '") + key + "' of " + where + " must be a string");
    }
    return it->get<std::string>();
}

const json* array_field(const json& node, const char* key, const std::string& where) {
    auto it = node.find(key);
    if (it == node.end() || it->is_null()) return nullptr;
    if (!it->is_array()) {
        throw Error(ErrorKind::LoadError,
                    std::string("Field '") + key + "' of " + where + " must be an array");
    }
    return &*it;
}

Attributes node_attributes(const json& node, const std::string& where) {
    auto it = node.find("attributes");
    if (it == node.end() || it->is_null()) return {};
    return attributes_from_json(*it, where);
}

} // namespace

AttributeValue attribute_from_json(const json& value, const std::string& where) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_number()) return value.get<double>();
    throw Error(ErrorKind::LoadError,
                "Attribute " + where + " must be a string, number or boolean");
}

Attributes attributes_from_json(const json& object, const std::string& where) {
    if (!object.is_object()) {
        throw Error(ErrorKind::LoadError, "Attributes of " + where + " must be an object");
    }
    Attributes attrs;
    for (auto it = object.begin(); it != object.end(); ++it) {
        attrs.emplace(it.key(), attribute_from_json(it.value(), "'" + it.key() + "' of " + where));
    }
    return attrs;
}

void validate_source_path(const std::string& path) {
    if (path.empty()) {
        throw Error(ErrorKind::LoadError, "Path cannot be empty");
    }
    for (const auto& segment : fs::path(path)) {
        if (segment == "..") {
            throw Error(ErrorKind::LoadError, "Path traversal detected: " + path);
        }
    }
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw Error(ErrorKind::LoadError, "Model file does not exist: " + path);
    }
}

GraphPtr load_graph_file(const std::string& path) {
    validate_source_path(path);

    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (!ec) {
        std::ostringstream ss;
        ss << "Reading " << path << " (" << (size / 1024) << " KiB)";
        logging::debug("loader", ss.str());
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw Error(ErrorKind::LoadError, "Cannot open model file: " + path);
    }

    json doc;
    try {
        doc = json::parse(in);
    } catch (const json::parse_error& e) {
        throw Error(ErrorKind::LoadError,
                    "Malformed model file " + path + ": " + e.what());
    }

    return parse_graph_json(doc);
}

GraphPtr parse_graph_json(const json& doc) {
    if (!doc.is_object()) {
        throw Error(ErrorKind::LoadError, "Model document must be a JSON object");
    }
    auto root_it = doc.find("root");
    if (root_it == doc.end() || !root_it->is_object()) {
        throw Error(ErrorKind::LoadError, "Model document has no 'root' object");
    }

    GraphBuilder builder;
    const json& root = *root_it;
    std::string root_path = builder.set_root(string_field(root, "name", "root", ""),
                                             string_field(root, "type", "root", ""),
                                             node_attributes(root, "root"));

    // Depth-first over the nested document; children pushed in reverse so
    // each parent receives them in declared order
    struct Pending {
        const json* node;
        std::string parent_path;
    };
    std::vector<Pending> stack;

    auto push_children = [&](const json& node, const std::string& path) {
        const json* children = array_field(node, "children", path.empty() ? "root" : path);
        if (!children) return;
        for (auto it = children->rbegin(); it != children->rend(); ++it) {
            if (!it->is_object()) {
                throw Error(ErrorKind::LoadError, "Child of " + path + " must be an object");
            }
            stack.push_back({&*it, path});
        }
    };

    push_children(root, root_path);
    while (!stack.empty()) {
        Pending p = stack.back();
        stack.pop_back();

        const std::string where = "child of " + (p.parent_path.empty() ? "root" : p.parent_path);
        std::string path = builder.add_element(p.parent_path,
                                               string_field(*p.node, "name", where, ""),
                                               string_field(*p.node, "type", where, ""),
                                               node_attributes(*p.node, where));
        push_children(*p.node, path);
    }

    if (const json* assocs = array_field(doc, "associations", "model")) {
        size_t n = 0;
        for (const auto& a : *assocs) {
            std::string where = "association #" + std::to_string(n++);
            if (!a.is_object()) {
                throw Error(ErrorKind::LoadError, where + " must be an object");
            }
            auto from = a.find("from");
            auto to = a.find("to");
            if (from == a.end() || !from->is_string() || to == a.end() || !to->is_string()) {
                throw Error(ErrorKind::LoadError, where + " needs string 'from' and 'to'");
            }
            builder.add_association(from->get<std::string>(), to->get<std::string>(),
                                    string_field(a, "type", where, "unknown"),
                                    node_attributes(a, where));
        }
    }

    return builder.build();
}

} // namespace arbor
