#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <tree_sitter/api.h>
#include <vector>

// Forward declaration for the tree-sitter Python grammar
extern "C" {
const TSLanguage *tree_sitter_python();
}

namespace flowdiff {

// Parsed function or method definition
struct ParsedFunction {
    std::string name;                         // Simple name
    std::string class_name;                   // Containing class (if any)
    uint32_t line = 0;                        // Line of the "def" keyword
    std::vector<std::string> parameters;      // Parameter names
    std::map<std::string, std::string> parameter_types; // Annotated parameter -> type text
    std::string return_type;                  // Return annotation text
    std::vector<std::string> calls;           // Callee names as written
    std::map<std::string, std::string> local_bindings; // var -> constructor name
    std::map<std::string, std::string> local_imports;  // alias -> qualified target
    std::vector<std::string> decorators;      // Decorator names (last attribute segment)
    std::string http_method;
    std::string http_route;
    bool reads_sys_argv = false;
    std::optional<std::string> docstring;
};

// Parsed class definition
struct ParsedClass {
    std::string name;
    uint32_t line = 0;
    std::vector<std::string> base_classes;           // As written
    std::vector<std::string> methods;                // Method names
    std::map<std::string, std::string> instance_attributes; // attr -> type text (from __init__)
};

// Everything extracted from one module
struct ParsedModule {
    std::vector<ParsedFunction> functions; // Module functions and class methods
    std::vector<ParsedClass> classes;
    std::map<std::string, std::string> imports; // Module-level alias -> qualified target
    std::vector<std::string> main_guard_calls;  // Bare names called under __main__ guard
    bool has_main_guard = false;
};

// Tree-sitter backed Python parser
class PythonParser {
public:

    PythonParser();
    ~PythonParser();

    // Non-copyable
    PythonParser(const PythonParser &) = delete;
    PythonParser &operator=(const PythonParser &) = delete;

    // Movable
    PythonParser(PythonParser &&other) noexcept;
    PythonParser &operator=(PythonParser &&other) noexcept;

    // Parse source code
    bool parse(const std::string &source);

    // Check whether the last parse contained syntax errors
    bool has_errors() const;

    // Extract module contents (requires a successful parse)
    ParsedModule extract_module() const;

    // Get root node
    TSNode root() const;

    // Get source code
    const std::string &source() const { return source_; }

private:

    TSParser *parser_ = nullptr;
    TSTree *tree_ = nullptr;
    std::string source_;

    // Helper to get node text
    std::string node_text(TSNode node) const;

    // Iterative pre-order node visitor
    void visit_nodes(TSNode node, const std::function<void(TSNode)> &visitor) const;

    // Walk module-level statements (descending into compound statements)
    void collect_statements(TSNode block, ParsedModule &module) const;

    // Returns a function with an empty name when the node has no name
    ParsedFunction extract_function(TSNode node, const std::vector<TSNode> &decorators,
                                    const std::string &class_name) const;
    void extract_class(TSNode node, ParsedModule &module) const;
    void extract_imports(TSNode node, std::map<std::string, std::string> &imports) const;
    void extract_parameters(TSNode params, ParsedFunction &func) const;
    void apply_decorator(TSNode decorator, ParsedFunction &func) const;
    bool is_main_guard(TSNode if_node) const;

    std::map<std::string, std::string> extract_instance_attributes(const ParsedFunction &init,
                                                                   TSNode init_node) const;

    // Dotted callee name for identifier/attribute chains
    std::optional<std::string> call_name(TSNode node) const;

    // Value of a string literal without prefix and quotes
    std::string string_value(TSNode node) const;

    std::optional<std::string> docstring_of(TSNode body) const;
};

// Remove common indentation from a docstring (same rules as inspect.cleandoc)
std::string clean_docstring(const std::string &text);

} // namespace flowdiff
