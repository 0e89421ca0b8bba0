// Copyright 2025 Siddhant Biradar
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.


#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace flowdiff {

// Language identifiers, used as table keys everywhere
constexpr const char *PYTHON_LANGUAGE = "python";
constexpr const char *SHELL_LANGUAGE = "shell";

// Python facts recorded during extraction
struct PythonMetadata {
    std::string module;                                        // Dotted module name
    std::string class_name;                                    // Empty for module functions
    std::vector<std::string> parameters;                       // Parameter names as written
    std::string return_type;                                   // Annotation text, may be empty
    bool is_class_method = false;
    std::map<std::string, std::string> local_bindings;         // var -> type text
    std::map<std::string, std::string> function_local_imports; // alias -> qualified target
    std::string http_method;                                   // GET, POST, ... or empty
    std::string http_route;
    bool uses_cli_parsing = false;
    bool is_script = false; // Synthetic script-level symbol

    bool is_http_handler() const { return !http_method.empty(); }

    bool operator==(const PythonMetadata &other) const {
        return module == other.module && class_name == other.class_name &&
               parameters == other.parameters && return_type == other.return_type &&
               is_class_method == other.is_class_method &&
               local_bindings == other.local_bindings &&
               function_local_imports == other.function_local_imports &&
               http_method == other.http_method && http_route == other.http_route &&
               uses_cli_parsing == other.uses_cli_parsing && is_script == other.is_script;
    }
    bool operator!=(const PythonMetadata &other) const { return !(*this == other); }
};

// Shell facts recorded during extraction
struct ShellMetadata {
    std::string interpreter; // From the shebang line, may be empty

    bool operator==(const ShellMetadata &other) const { return interpreter == other.interpreter; }
    bool operator!=(const ShellMetadata &other) const { return !(*this == other); }
};

using SymbolMetadata = std::variant<std::monostate, PythonMetadata, ShellMetadata>;

// One callable unit of any language
struct Symbol {
    std::string name;           // Display name
    std::string qualified_name; // Globally unique key (e.g., "pkg.mod.Class.method")
    std::string language;
    std::string file_path;      // Relative to the analyzed root
    uint32_t line_number = 0;
    SymbolMetadata metadata;
    std::vector<std::string> raw_calls;      // Callees as written
    std::vector<std::string> resolved_calls; // Qualified callee names
    bool is_entry_point = false;
    bool has_changes = false; // Only set by the diff engine
    std::optional<std::string> documentation;

    const PythonMetadata *python() const { return std::get_if<PythonMetadata>(&metadata); }
    PythonMetadata *python() { return std::get_if<PythonMetadata>(&metadata); }
    const ShellMetadata *shell() const { return std::get_if<ShellMetadata>(&metadata); }

    bool operator==(const Symbol &other) const { return qualified_name == other.qualified_name; }
    bool operator!=(const Symbol &other) const { return !(*this == other); }
};

// Hash for Symbol
struct SymbolHash {
    size_t operator()(const Symbol &s) const { return std::hash<std::string>{}(s.qualified_name); }
};

// Per-language container of symbols. Subclasses add resolution indices.
class SymbolTable {
public:

    explicit SymbolTable(std::string language);
    virtual ~SymbolTable() = default;

    // Non-copyable
    SymbolTable(const SymbolTable &) = delete;
    SymbolTable &operator=(const SymbolTable &) = delete;

    // Add a symbol, replacing any symbol with the same qualified name
    void add_symbol(Symbol symbol);

    // Get symbol by qualified name (nullptr if absent)
    Symbol *get_symbol(const std::string &qualified_name);
    const Symbol *get_symbol(const std::string &qualified_name) const;

    bool contains(const std::string &qualified_name) const;

    // Symbols ordered by qualified name
    std::map<std::string, Symbol> &symbols() { return symbols_; }
    const std::map<std::string, Symbol> &symbols() const { return symbols_; }

    size_t size() const { return symbols_.size(); }
    bool empty() const { return symbols_.empty(); }

    const std::string &language() const { return language_; }

    // Recoverable diagnostics gathered while building this table
    void add_warning(std::string message) { warnings_.push_back(std::move(message)); }
    const std::vector<std::string> &warnings() const { return warnings_; }
    std::vector<std::string> take_warnings();

protected:

    std::string language_;
    std::map<std::string, Symbol> symbols_;
    std::vector<std::string> warnings_;
};

// Language name -> merged table for one analysis run
using SymbolTableMap = std::map<std::string, std::unique_ptr<SymbolTable>>;

// Flat qualified name -> symbol map spanning every language
using SymbolPtr = std::shared_ptr<Symbol>;
using SymbolUniverse = std::map<std::string, SymbolPtr>;

// Copy every symbol into a fresh universe. Tables are visited in language
// order, so a cross-language qualified-name clash keeps the later language.
SymbolUniverse flatten_symbols(const SymbolTableMap &tables);

// Entry points across all languages: every shell symbol plus flagged symbols
std::vector<const Symbol *> get_entry_points(const SymbolTableMap &tables);
std::vector<SymbolPtr> get_entry_points(const SymbolUniverse &universe);

// Last path component of a "/"-separated file path
std::string file_name_of(const std::string &file_path);

} // namespace flowdiff
