#include "flowdiff/parser.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <sstream>
#include <stdexcept>

namespace flowdiff {

namespace {

bool is_type(TSNode node, const char *type) {
    return !ts_node_is_null(node) && strcmp(ts_node_type(node), type) == 0;
}

TSNode field(TSNode node, const char *name) {
    return ts_node_child_by_field_name(node, name, static_cast<uint32_t>(strlen(name)));
}

// Decorator attribute -> HTTP verb
const char *const HTTP_VERBS[] = {"get", "post", "put", "delete", "patch"};

std::string to_upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

bool is_http_verb(const std::string &name) {
    for (const char *verb : HTTP_VERBS) {
        if (name == verb)
            return true;
    }
    return false;
}

// Statement types whose children may hold further module-level statements
bool is_compound_container(TSNode node) {
    static const char *const containers[] = {
        "block",          "if_statement",   "elif_clause",     "else_clause",
        "try_statement",  "except_clause",  "finally_clause",  "with_statement",
        "for_statement",  "while_statement", "except_group_clause"};
    for (const char *type : containers) {
        if (is_type(node, type))
            return true;
    }
    return false;
}

std::vector<TSNode> decorators_of(TSNode decorated) {
    std::vector<TSNode> decorators;
    uint32_t count = ts_node_named_child_count(decorated);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_named_child(decorated, i);
        if (is_type(child, "decorator"))
            decorators.push_back(child);
    }
    return decorators;
}

} // namespace

PythonParser::PythonParser() {
    parser_ = ts_parser_new();
    if (!parser_) {
        throw std::runtime_error("Failed to create tree-sitter parser");
    }

    if (!ts_parser_set_language(parser_, tree_sitter_python())) {
        ts_parser_delete(parser_);
        throw std::runtime_error("Failed to set parser language");
    }
}

PythonParser::~PythonParser() {
    if (tree_) ts_tree_delete(tree_);
    if (parser_) ts_parser_delete(parser_);
}

PythonParser::PythonParser(PythonParser&& other) noexcept
    : parser_(other.parser_)
    , tree_(other.tree_)
    , source_(std::move(other.source_)) {
    other.parser_ = nullptr;
    other.tree_ = nullptr;
}

PythonParser& PythonParser::operator=(PythonParser&& other) noexcept {
    if (this != &other) {
        if (tree_) ts_tree_delete(tree_);
        if (parser_) ts_parser_delete(parser_);

        parser_ = other.parser_;
        tree_ = other.tree_;
        source_ = std::move(other.source_);

        other.parser_ = nullptr;
        other.tree_ = nullptr;
    }
    return *this;
}

bool PythonParser::parse(const std::string& source) {
    source_ = source;

    if (tree_) {
        ts_tree_delete(tree_);
        tree_ = nullptr;
    }

    tree_ = ts_parser_parse_string(parser_, nullptr, source_.c_str(),
                                   static_cast<uint32_t>(source_.size()));
    return tree_ != nullptr;
}

bool PythonParser::has_errors() const {
    if (!tree_) return true;
    return ts_node_has_error(root());
}

TSNode PythonParser::root() const {
    if (!tree_) {
        return TSNode{};
    }
    return ts_tree_root_node(tree_);
}

std::string PythonParser::node_text(TSNode node) const {
    if (ts_node_is_null(node)) return "";
    uint32_t start = ts_node_start_byte(node);
    uint32_t end = ts_node_end_byte(node);
    if (start < source_.size() && end <= source_.size()) {
        return source_.substr(start, end - start);
    }
    return "";
}

void PythonParser::visit_nodes(TSNode node, const std::function<void(TSNode)>& visitor) const {
    if (ts_node_is_null(node)) return;

    // Use iterative approach with explicit stack to avoid recursion
    std::vector<TSNode> stack;
    stack.push_back(node);

    while (!stack.empty()) {
        TSNode current = stack.back();
        stack.pop_back();

        visitor(current);

        uint32_t child_count = ts_node_child_count(current);
        // Add children in reverse order so they're processed in order
        for (uint32_t i = child_count; i > 0; --i) {
            stack.push_back(ts_node_child(current, i - 1));
        }
    }
}

ParsedModule PythonParser::extract_module() const {
    ParsedModule module;
    if (!tree_) return module;

    collect_statements(root(), module);
    return module;
}

void PythonParser::collect_statements(TSNode block, ParsedModule& module) const {
    uint32_t count = ts_node_named_child_count(block);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode stmt = ts_node_named_child(block, i);

        if (is_type(stmt, "function_definition")) {
            ParsedFunction func = extract_function(stmt, {}, "");
            if (!func.name.empty())
                module.functions.push_back(std::move(func));
        }
        else if (is_type(stmt, "class_definition")) {
            extract_class(stmt, module);
        }
        else if (is_type(stmt, "decorated_definition")) {
            TSNode def = field(stmt, "definition");
            if (is_type(def, "function_definition")) {
                ParsedFunction func = extract_function(def, decorators_of(stmt), "");
                if (!func.name.empty())
                    module.functions.push_back(std::move(func));
            } else if (is_type(def, "class_definition")) {
                extract_class(def, module);
            }
        }
        else if (is_type(stmt, "import_statement") || is_type(stmt, "import_from_statement")) {
            extract_imports(stmt, module.imports);
        }
        else if (is_type(stmt, "if_statement")) {
            if (is_main_guard(stmt)) {
                module.has_main_guard = true;
                visit_nodes(field(stmt, "consequence"), [&](TSNode node) {
                    if (!is_type(node, "call")) return;
                    TSNode callee = field(node, "function");
                    if (is_type(callee, "identifier"))
                        module.main_guard_calls.push_back(node_text(callee));
                });
            }
            collect_statements(stmt, module);
        }
        else if (is_compound_container(stmt)) {
            collect_statements(stmt, module);
        }
    }
}

ParsedFunction PythonParser::extract_function(TSNode node, const std::vector<TSNode>& decorators,
                                              const std::string& class_name) const {
    ParsedFunction func;

    TSNode name_node = field(node, "name");
    if (ts_node_is_null(name_node)) return func;

    func.name = node_text(name_node);
    func.class_name = class_name;
    func.line = ts_node_start_point(node).row + 1;

    TSNode params = field(node, "parameters");
    if (!ts_node_is_null(params)) {
        extract_parameters(params, func);
    }

    TSNode return_type = field(node, "return_type");
    if (!ts_node_is_null(return_type)) {
        func.return_type = node_text(return_type);
    }

    for (TSNode decorator : decorators) {
        apply_decorator(decorator, func);
    }

    // Calls, sys.argv access and simple "var = Ctor(...)" bindings
    visit_nodes(node, [&](TSNode current) {
        if (is_type(current, "call")) {
            auto name = call_name(field(current, "function"));
            if (name) func.calls.push_back(*name);
        }
        else if (is_type(current, "attribute")) {
            if (node_text(current) == "sys.argv") func.reads_sys_argv = true;
        }
        else if (is_type(current, "assignment")) {
            TSNode left = field(current, "left");
            TSNode right = field(current, "right");
            if (!is_type(left, "identifier") || !is_type(right, "call")) return;
            if (!ts_node_is_null(field(current, "type"))) return;

            auto ctor = call_name(field(right, "function"));
            if (ctor) func.local_bindings[node_text(left)] = *ctor;
        }
    });

    // Annotated parameters bind their type unless reassigned in the body
    for (const auto& [param, type] : func.parameter_types) {
        func.local_bindings.emplace(param, type);
    }

    TSNode body = field(node, "body");
    visit_nodes(body, [&](TSNode current) {
        if (is_type(current, "import_statement") || is_type(current, "import_from_statement")) {
            extract_imports(current, func.local_imports);
        }
    });

    func.docstring = docstring_of(body);
    return func;
}

void PythonParser::extract_parameters(TSNode params, ParsedFunction& func) const {
    uint32_t count = ts_node_named_child_count(params);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode param = ts_node_named_child(params, i);

        if (is_type(param, "identifier")) {
            func.parameters.push_back(node_text(param));
        }
        else if (is_type(param, "typed_parameter")) {
            // "name: type" has no name field; the identifier is the first named child
            TSNode name = ts_node_named_child(param, 0);
            if (!is_type(name, "identifier")) continue;
            func.parameters.push_back(node_text(name));
            TSNode type = field(param, "type");
            if (!ts_node_is_null(type))
                func.parameter_types[node_text(name)] = node_text(type);
        }
        else if (is_type(param, "default_parameter")) {
            TSNode name = field(param, "name");
            if (is_type(name, "identifier"))
                func.parameters.push_back(node_text(name));
        }
        else if (is_type(param, "typed_default_parameter")) {
            TSNode name = field(param, "name");
            if (!is_type(name, "identifier")) continue;
            func.parameters.push_back(node_text(name));
            TSNode type = field(param, "type");
            if (!ts_node_is_null(type))
                func.parameter_types[node_text(name)] = node_text(type);
        }
    }

    func.parameter_types.erase("self");
    func.parameter_types.erase("cls");
}

void PythonParser::apply_decorator(TSNode decorator, ParsedFunction& func) const {
    TSNode expr = TSNode{};
    uint32_t count = ts_node_named_child_count(decorator);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_named_child(decorator, i);
        if (!is_type(child, "comment")) {
            expr = child;
            break;
        }
    }
    if (ts_node_is_null(expr)) return;

    TSNode target = is_type(expr, "call") ? field(expr, "function") : expr;
    std::string name;
    if (is_type(target, "identifier")) {
        name = node_text(target);
    } else if (is_type(target, "attribute")) {
        name = node_text(field(target, "attribute"));
    }
    if (name.empty()) return;
    func.decorators.push_back(name);

    // Route decorators: @app.get("/x"), @app.route("/x", methods=[...])
    if (!is_type(expr, "call") || !is_type(target, "attribute")) return;
    if (!is_http_verb(name) && name != "route") return;

    TSNode args = field(expr, "arguments");
    std::string path;
    std::string method = name == "route" ? "GET" : to_upper(name);
    bool seen_positional = false;

    uint32_t arg_count = ts_node_named_child_count(args);
    for (uint32_t i = 0; i < arg_count; ++i) {
        TSNode arg = ts_node_named_child(args, i);
        if (is_type(arg, "comment")) continue;

        if (is_type(arg, "keyword_argument")) {
            std::string key = node_text(field(arg, "name"));
            TSNode value = field(arg, "value");
            if (key == "path" && path.empty() && is_type(value, "string")) {
                path = string_value(value);
            } else if (key == "methods" && name == "route" &&
                       (is_type(value, "list") || is_type(value, "tuple")) &&
                       ts_node_named_child_count(value) > 0) {
                TSNode first = ts_node_named_child(value, 0);
                if (is_type(first, "string")) method = to_upper(string_value(first));
            }
            continue;
        }

        if (!seen_positional && is_type(arg, "string")) {
            path = string_value(arg);
        }
        seen_positional = true;
    }

    if (!path.empty()) {
        func.http_method = method;
        func.http_route = path;
    }
}

void PythonParser::extract_class(TSNode node, ParsedModule& module) const {
    ParsedClass cls;

    TSNode name_node = field(node, "name");
    if (ts_node_is_null(name_node)) return;
    cls.name = node_text(name_node);
    cls.line = ts_node_start_point(node).row + 1;

    TSNode bases = field(node, "superclasses");
    uint32_t base_count = ts_node_is_null(bases) ? 0 : ts_node_named_child_count(bases);
    for (uint32_t i = 0; i < base_count; ++i) {
        TSNode base = ts_node_named_child(bases, i);
        if (is_type(base, "identifier") || is_type(base, "attribute"))
            cls.base_classes.push_back(node_text(base));
    }

    TSNode body = field(node, "body");
    uint32_t count = ts_node_is_null(body) ? 0 : ts_node_named_child_count(body);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode stmt = ts_node_named_child(body, i);
        TSNode def = stmt;
        std::vector<TSNode> decorators;

        if (is_type(stmt, "decorated_definition")) {
            def = field(stmt, "definition");
            decorators = decorators_of(stmt);
        }
        if (!is_type(def, "function_definition")) continue;

        ParsedFunction method = extract_function(def, decorators, cls.name);
        if (method.name.empty()) continue;

        cls.methods.push_back(method.name);
        if (method.name == "__init__") {
            cls.instance_attributes = extract_instance_attributes(method, def);
        }
        module.functions.push_back(std::move(method));
    }

    module.classes.push_back(std::move(cls));
}

std::map<std::string, std::string>
PythonParser::extract_instance_attributes(const ParsedFunction& init, TSNode init_node) const {
    std::map<std::string, std::string> attributes;

    visit_nodes(field(init_node, "body"), [&](TSNode node) {
        if (!is_type(node, "assignment")) return;

        TSNode left = field(node, "left");
        if (!is_type(left, "attribute")) return;
        TSNode object = field(left, "object");
        if (!is_type(object, "identifier") || node_text(object) != "self") return;
        std::string attr = node_text(field(left, "attribute"));

        // self.x = Ctor(...)  >  self.x: T = ...  >  self.x = <annotated param>
        TSNode right = field(node, "right");
        TSNode type = field(node, "type");
        if (is_type(right, "call")) {
            auto ctor = call_name(field(right, "function"));
            if (ctor) {
                attributes[attr] = *ctor;
                return;
            }
        }
        if (!ts_node_is_null(type)) {
            attributes[attr] = node_text(type);
            return;
        }
        if (is_type(right, "identifier")) {
            auto it = init.parameter_types.find(node_text(right));
            if (it != init.parameter_types.end())
                attributes[attr] = it->second;
        }
    });

    return attributes;
}

void PythonParser::extract_imports(TSNode node, std::map<std::string, std::string>& imports) const {
    if (is_type(node, "import_statement")) {
        uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_named_child(node, i);
            if (is_type(child, "dotted_name")) {
                std::string name = node_text(child);
                imports[name] = name;
            } else if (is_type(child, "aliased_import")) {
                imports[node_text(field(child, "alias"))] = node_text(field(child, "name"));
            }
        }
        return;
    }

    // from <module> import a, b as c
    TSNode module_node = field(node, "module_name");
    std::string module;
    if (is_type(module_node, "dotted_name")) {
        module = node_text(module_node);
    } else if (is_type(module_node, "relative_import")) {
        // Leading dots are dropped; only the named part is kept
        uint32_t rel_count = ts_node_named_child_count(module_node);
        for (uint32_t i = 0; i < rel_count; ++i) {
            TSNode part = ts_node_named_child(module_node, i);
            if (is_type(part, "dotted_name")) module = node_text(part);
        }
    }

    auto qualify = [&](const std::string& name) {
        return module.empty() ? name : module + "." + name;
    };

    uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_named_child(node, i);
        if (!ts_node_is_null(module_node) && ts_node_eq(child, module_node)) continue;

        if (is_type(child, "dotted_name")) {
            std::string name = node_text(child);
            imports[name] = qualify(name);
        } else if (is_type(child, "aliased_import")) {
            imports[node_text(field(child, "alias"))] = qualify(node_text(field(child, "name")));
        }
    }
}

bool PythonParser::is_main_guard(TSNode if_node) const {
    TSNode cond = field(if_node, "condition");
    if (!is_type(cond, "comparison_operator") || ts_node_named_child_count(cond) != 2)
        return false;

    bool has_eq = false;
    uint32_t count = ts_node_child_count(cond);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_child(cond, i);
        if (!ts_node_is_named(child) && strcmp(ts_node_type(child), "==") == 0)
            has_eq = true;
    }

    TSNode left = ts_node_named_child(cond, 0);
    TSNode right = ts_node_named_child(cond, 1);
    return has_eq && is_type(left, "identifier") && node_text(left) == "__name__" &&
           is_type(right, "string") && string_value(right) == "__main__";
}

std::optional<std::string> PythonParser::call_name(TSNode node) const {
    if (is_type(node, "identifier")) {
        return node_text(node);
    }
    if (is_type(node, "attribute")) {
        std::string attr = node_text(field(node, "attribute"));
        auto base = call_name(field(node, "object"));
        // foo().bar collapses to "bar"
        return base ? *base + "." + attr : attr;
    }
    return std::nullopt;
}

std::string PythonParser::string_value(TSNode node) const {
    std::string text = node_text(node);

    size_t prefix = 0;
    while (prefix < text.size() && std::isalpha(static_cast<unsigned char>(text[prefix])))
        ++prefix;
    text = text.substr(prefix);

    if (text.size() >= 6 && (text.compare(0, 3, "\"\"\"") == 0 || text.compare(0, 3, "'''") == 0))
        return text.substr(3, text.size() - 6);
    if (text.size() >= 2)
        return text.substr(1, text.size() - 2);
    return "";
}

std::optional<std::string> PythonParser::docstring_of(TSNode body) const {
    if (ts_node_is_null(body)) return std::nullopt;

    uint32_t count = ts_node_named_child_count(body);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode stmt = ts_node_named_child(body, i);
        if (is_type(stmt, "comment")) continue;

        if (is_type(stmt, "expression_statement") && ts_node_named_child_count(stmt) == 1) {
            TSNode expr = ts_node_named_child(stmt, 0);
            if (is_type(expr, "string")) return clean_docstring(string_value(expr));
        }
        return std::nullopt;
    }
    return std::nullopt;
}

std::string clean_docstring(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(line);
    }
    if (lines.empty()) return "";

    auto is_blank = [](const std::string& s) {
        return s.find_first_not_of(" \t\r") == std::string::npos;
    };

    // Smallest indentation of the lines after the first
    size_t margin = std::string::npos;
    for (size_t i = 1; i < lines.size(); ++i) {
        if (is_blank(lines[i])) continue;
        margin = std::min(margin, lines[i].find_first_not_of(" \t"));
    }

    size_t first = lines[0].find_first_not_of(" \t");
    lines[0] = first == std::string::npos ? "" : lines[0].substr(first);
    for (size_t i = 1; i < lines.size(); ++i) {
        if (is_blank(lines[i])) {
            lines[i].clear();
        } else if (margin != std::string::npos) {
            lines[i] = lines[i].substr(margin);
        }
    }

    while (!lines.empty() && is_blank(lines.back())) lines.pop_back();
    size_t start = 0;
    while (start < lines.size() && is_blank(lines[start])) ++start;

    std::ostringstream out;
    for (size_t i = start; i < lines.size(); ++i) {
        if (i > start) out << "\n";
        out << lines[i];
    }
    return out.str();
}

} // namespace flowdiff
