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

#include "analyzer.hpp"
#include "types.hpp"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace flowdiff {

// Class entry used for method and constructor resolution
struct ClassInfo {
    std::string name;
    std::string qualified_name; // module.Class
    std::string module;
    uint32_t line_number = 0;
    std::vector<std::string> base_classes;                  // As written in the source
    std::map<std::string, std::string> methods;             // method name -> qualified name
    std::map<std::string, std::string> instance_attributes; // attr -> type text
};

// Python symbols plus the indices the call resolver needs
class PythonSymbolTable : public SymbolTable {
public:

    PythonSymbolTable();

    // Register a class (replaces a class with the same qualified name)
    void add_class(ClassInfo info);

    // Get class by qualified name (nullptr if absent)
    const ClassInfo *get_class(const std::string &qualified_name) const;

    // Get the last registered class with this simple name (nullptr if absent)
    const ClassInfo *find_class_by_name(const std::string &name) const;

    const std::map<std::string, ClassInfo> &classes() const { return classes_; }

    // Record "alias -> target" for a module's top-level imports
    void add_import(const std::string &module, const std::string &alias,
                    const std::string &target);

    // Get top-level imports of a module (empty map if none)
    const std::map<std::string, std::string> &imports_of(const std::string &module) const;

    // Record a bare function name called under a module's __main__ guard
    void add_main_guard_call(const std::string &module, const std::string &name);
    bool is_called_in_main_guard(const std::string &module, const std::string &name) const;

    // Resolve a type expression as seen from a module to a known class.
    // Function-scoped imports (if given) take precedence over module imports.
    const ClassInfo *resolve_class(const std::string &type_name, const std::string &module,
                                   const std::map<std::string, std::string> *local_imports) const;

    // Move everything from other into this table; other wins on collisions
    void absorb(PythonSymbolTable &&other);

private:

    std::map<std::string, ClassInfo> classes_;
    std::map<std::string, std::string> class_names_; // simple name -> qualified name
    std::map<std::string, std::map<std::string, std::string>> module_imports_;
    std::map<std::string, std::set<std::string>> main_guard_calls_;
};

// Expand a dotted name through an import map, shortening it one segment at a
// time until a prefix matches ("np.linalg.norm" with np -> numpy gives
// "numpy.linalg.norm")
std::optional<std::string> expand_import(const std::string &name,
                                         const std::map<std::string, std::string> &imports);

// Resolves raw Python call expressions to qualified symbol names
class PythonCallResolver {
public:

    explicit PythonCallResolver(const PythonSymbolTable &table);

    // Resolve one raw call made from caller (nullopt if unresolved)
    std::optional<std::string> resolve(const std::string &call, const Symbol &caller) const;

private:

    const PythonSymbolTable &table_;

    std::optional<std::string> resolve_attribute_chain(const std::string &call,
                                                       const PythonMetadata &meta) const;
    std::optional<std::string> resolve_constructor(const std::string &call,
                                                   const PythonMetadata &meta) const;
    std::optional<std::string> resolve_prefix(const std::string &call,
                                              const PythonMetadata &meta) const;

    // Method lookup through the class and its known bases
    std::optional<std::string> find_method(const ClassInfo &cls, const std::string &method,
                                           int depth = 0) const;

    bool is_known(const std::string &qualified_name) const;
};

class PythonAnalyzer : public LanguageAnalyzer {
public:

    std::string get_language_name() const override { return PYTHON_LANGUAGE; }
    std::vector<std::string> file_extensions() const override { return {".py"}; }

    std::unique_ptr<SymbolTable> build_symbol_table(const fs::path &file,
                                                    const fs::path &root) const override;

    std::unique_ptr<SymbolTable>
    merge_symbol_tables(std::vector<std::unique_ptr<SymbolTable>> tables) const override;

    void resolve_calls(SymbolTable &table) const override;

    void mark_entry_points(SymbolTable &table) const override;

    // Get the dotted module name for a root-relative path ("pkg/mod.py" -> "pkg.mod")
    static std::string module_name_for(const std::string &relative_path);

    // Test-shaped symbol: test_* / setUp / tearDown names, or test_*.py / *_test.py files
    static bool is_test_symbol(const Symbol &symbol);

    // Private or dunder name
    static bool is_private_name(const std::string &name);

    // Check whether a symbol satisfies the entry-point heuristics
    static bool looks_like_entry_point(const Symbol &symbol, const PythonSymbolTable &table);
};

} // namespace flowdiff
