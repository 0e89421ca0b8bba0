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


#include "flowdiff/python_analyzer.hpp"
#include "flowdiff/parser.hpp"
#include <algorithm>
#include <exception>

namespace flowdiff {

namespace {

// Conventional runner names treated as entry points
const char *const RUNNER_NAMES[] = {"main", "run", "execute", "start", "init", "initialize"};

// Test framework hooks
const char *const TEST_HOOKS[] = {"setUp", "tearDown", "setUpClass", "tearDownClass",
                                  "setUpModule", "tearDownModule"};

// Decorators of click/typer style command line interfaces
const char *const CLI_DECORATORS[] = {"command", "group", "option", "argument"};

// Substrings of calls that parse command line arguments
const char *const CLI_CALLS[] = {"ArgumentParser", "parse_args", "add_argument"};

// Source fragments announcing a server start-up
const char *const SERVER_PATTERNS[] = {"uvicorn.run", "app.run(", "flask.run(", "gunicorn",
                                       "waitress.serve", "fastapi", "starlette"};

// Paths whose scripts never become script-level entry points
const char *const DEPRIORITIZED_PATHS[] = {"/tests/",    "/test/",     "test_",  "_test.py",
                                           "/scripts/",  "/examples/", "/example/", "/benchmarks/",
                                           "/migrations/", "conftest.py"};

template <size_t N> bool is_one_of(const std::string &value, const char *const (&list)[N]) {
    for (const char *item : list) {
        if (value == item)
            return true;
    }
    return false;
}

template <size_t N> bool contains_any(const std::string &value, const char *const (&list)[N]) {
    for (const char *item : list) {
        if (value.find(item) != std::string::npos)
            return true;
    }
    return false;
}

bool uses_cli_parsing(const ParsedFunction &func) {
    if (func.reads_sys_argv)
        return true;
    for (const auto &call : func.calls) {
        if (contains_any(call, CLI_CALLS))
            return true;
    }
    for (const auto &decorator : func.decorators) {
        if (is_one_of(decorator, CLI_DECORATORS))
            return true;
    }
    return false;
}

bool is_deprioritized_path(const std::string &relative_path) {
    std::string path = "/" + relative_path;
    std::transform(path.begin(), path.end(), path.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return contains_any(path, DEPRIORITIZED_PATHS);
}

} // namespace

// ============ PythonSymbolTable ============

PythonSymbolTable::PythonSymbolTable() : SymbolTable(PYTHON_LANGUAGE) {}

void PythonSymbolTable::add_class(ClassInfo info) {
    class_names_[info.name] = info.qualified_name;
    std::string key = info.qualified_name;
    classes_[key] = std::move(info);
}

const ClassInfo *PythonSymbolTable::get_class(const std::string &qualified_name) const {
    auto it = classes_.find(qualified_name);
    return it != classes_.end() ? &it->second : nullptr;
}

const ClassInfo *PythonSymbolTable::find_class_by_name(const std::string &name) const {
    auto it = class_names_.find(name);
    return it != class_names_.end() ? get_class(it->second) : nullptr;
}

void PythonSymbolTable::add_import(const std::string &module, const std::string &alias,
                                   const std::string &target) {
    module_imports_[module][alias] = target;
}

const std::map<std::string, std::string> &
PythonSymbolTable::imports_of(const std::string &module) const {
    static const std::map<std::string, std::string> empty;
    auto it = module_imports_.find(module);
    return it != module_imports_.end() ? it->second : empty;
}

void PythonSymbolTable::add_main_guard_call(const std::string &module, const std::string &name) {
    main_guard_calls_[module].insert(name);
}

bool PythonSymbolTable::is_called_in_main_guard(const std::string &module,
                                                const std::string &name) const {
    auto it = main_guard_calls_.find(module);
    return it != main_guard_calls_.end() && it->second.count(name) > 0;
}

const ClassInfo *
PythonSymbolTable::resolve_class(const std::string &type_name, const std::string &module,
                                 const std::map<std::string, std::string> *local_imports) const {
    if (type_name.empty())
        return nullptr;

    // Class defined in the same module
    if (const ClassInfo *cls = get_class(module + "." + type_name))
        return cls;

    // Imported class
    if (local_imports) {
        if (auto target = expand_import(type_name, *local_imports)) {
            if (const ClassInfo *cls = get_class(*target))
                return cls;
        }
    }
    if (auto target = expand_import(type_name, imports_of(module))) {
        if (const ClassInfo *cls = get_class(*target))
            return cls;
    }

    // Already qualified
    if (const ClassInfo *cls = get_class(type_name))
        return cls;

    // Bare class name defined anywhere in the project
    if (type_name.find('.') == std::string::npos)
        return find_class_by_name(type_name);

    return nullptr;
}

void PythonSymbolTable::absorb(PythonSymbolTable &&other) {
    for (auto &[qname, symbol] : other.symbols_) {
        symbols_[qname] = std::move(symbol);
    }
    for (auto &[qname, info] : other.classes_) {
        add_class(std::move(info));
    }
    for (auto &[module, imports] : other.module_imports_) {
        for (auto &[alias, target] : imports) {
            module_imports_[module][alias] = target;
        }
    }
    for (auto &[module, names] : other.main_guard_calls_) {
        main_guard_calls_[module].insert(names.begin(), names.end());
    }
    for (auto &warning : other.warnings_) {
        warnings_.push_back(std::move(warning));
    }

    other.symbols_.clear();
    other.classes_.clear();
    other.class_names_.clear();
    other.module_imports_.clear();
    other.main_guard_calls_.clear();
    other.warnings_.clear();
}

std::optional<std::string> expand_import(const std::string &name,
                                         const std::map<std::string, std::string> &imports) {
    std::string prefix = name;
    while (!prefix.empty()) {
        auto it = imports.find(prefix);
        if (it != imports.end()) {
            return it->second + name.substr(prefix.size());
        }
        size_t dot = prefix.rfind('.');
        if (dot == std::string::npos)
            break;
        prefix = prefix.substr(0, dot);
    }
    return std::nullopt;
}

// ============ PythonCallResolver ============

PythonCallResolver::PythonCallResolver(const PythonSymbolTable &table) : table_(table) {}

bool PythonCallResolver::is_known(const std::string &qualified_name) const {
    return table_.contains(qualified_name);
}

std::optional<std::string> PythonCallResolver::resolve(const std::string &call,
                                                       const Symbol &caller) const {
    const PythonMetadata *meta = caller.python();
    if (!meta || call.empty())
        return std::nullopt;

    // 1. obj.method / self.method / self.attr.method through inferred types
    if (auto target = resolve_attribute_chain(call, *meta))
        return target;

    // 2. Function-scoped import
    auto local = meta->function_local_imports.find(call);
    if (local != meta->function_local_imports.end() && is_known(local->second))
        return local->second;

    // 3. Constructor call
    if (auto target = resolve_constructor(call, *meta))
        return target;

    // 4. Module-level import
    const auto &imports = table_.imports_of(meta->module);
    auto imported = imports.find(call);
    if (imported != imports.end() && is_known(imported->second))
        return imported->second;

    // 5. Same module
    std::string same_module = meta->module + "." + call;
    if (is_known(same_module))
        return same_module;

    // 6. Prefix expansion through imports
    return resolve_prefix(call, *meta);
}

std::optional<std::string>
PythonCallResolver::resolve_attribute_chain(const std::string &call,
                                            const PythonMetadata &meta) const {
    size_t dot = call.find('.');
    if (dot == std::string::npos)
        return std::nullopt;

    std::string object = call.substr(0, dot);
    std::string rest = call.substr(dot + 1);

    if (object == "self" || object == "cls") {
        if (meta.class_name.empty())
            return std::nullopt;
        const ClassInfo *cls = table_.get_class(meta.module + "." + meta.class_name);
        if (!cls)
            return std::nullopt;

        size_t attr_dot = rest.find('.');
        if (attr_dot == std::string::npos)
            return find_method(*cls, rest);

        std::string attr = rest.substr(0, attr_dot);
        std::string method = rest.substr(attr_dot + 1);
        if (method.find('.') != std::string::npos)
            return std::nullopt;

        auto it = cls->instance_attributes.find(attr);
        if (it == cls->instance_attributes.end())
            return std::nullopt;
        const ClassInfo *attr_cls = table_.resolve_class(it->second, cls->module, nullptr);
        return attr_cls ? find_method(*attr_cls, method) : std::nullopt;
    }

    auto binding = meta.local_bindings.find(object);
    if (binding == meta.local_bindings.end() || rest.find('.') != std::string::npos)
        return std::nullopt;

    const ClassInfo *cls =
        table_.resolve_class(binding->second, meta.module, &meta.function_local_imports);
    if (!cls) {
        // "mod.Foo" bound but mod unknown: fall back to the bare class name
        size_t last = binding->second.rfind('.');
        if (last != std::string::npos)
            cls = table_.find_class_by_name(binding->second.substr(last + 1));
    }
    return cls ? find_method(*cls, rest) : std::nullopt;
}

std::optional<std::string>
PythonCallResolver::resolve_constructor(const std::string &call,
                                        const PythonMetadata &meta) const {
    const ClassInfo *cls = table_.resolve_class(call, meta.module, &meta.function_local_imports);
    if (!cls)
        return std::nullopt;

    auto init = cls->methods.find("__init__");
    if (init != cls->methods.end())
        return init->second;
    return cls->qualified_name;
}

std::optional<std::string>
PythonCallResolver::resolve_prefix(const std::string &call, const PythonMetadata &meta) const {
    if (auto target = expand_import(call, meta.function_local_imports)) {
        if (is_known(*target))
            return target;
    }
    if (auto target = expand_import(call, table_.imports_of(meta.module))) {
        if (is_known(*target))
            return target;
    }
    return std::nullopt;
}

std::optional<std::string> PythonCallResolver::find_method(const ClassInfo &cls,
                                                           const std::string &method,
                                                           int depth) const {
    auto it = cls.methods.find(method);
    if (it != cls.methods.end())
        return it->second;

    // Bounded walk up the inheritance chain
    if (depth >= 16)
        return std::nullopt;
    for (const auto &base_name : cls.base_classes) {
        const ClassInfo *base = table_.resolve_class(base_name, cls.module, nullptr);
        if (!base || base == &cls)
            continue;
        if (auto target = find_method(*base, method, depth + 1))
            return target;
    }
    return std::nullopt;
}

// ============ PythonAnalyzer ============

std::string PythonAnalyzer::module_name_for(const std::string &relative_path) {
    fs::path path(relative_path);
    std::string module;
    for (const auto &part : path.parent_path()) {
        std::string segment = part.string();
        if (segment.empty() || segment == "." || segment == "/")
            continue;
        module += segment + ".";
    }
    return module + path.stem().string();
}

std::unique_ptr<SymbolTable> PythonAnalyzer::build_symbol_table(const fs::path &file,
                                                                const fs::path &root) const {
    auto table = std::make_unique<PythonSymbolTable>();
    std::string rel = relative_path_string(file, root);
    std::string module = module_name_for(rel);

    std::string source;
    if (!read_source_file(file, source)) {
        table->add_warning("Could not read " + rel);
        return table;
    }

    ParsedModule parsed;
    try {
        PythonParser parser;
        if (!parser.parse(source) || parser.has_errors()) {
            table->add_warning("Failed to parse " + rel + ": syntax error");
            return table;
        }
        parsed = parser.extract_module();
    } catch (const std::exception &e) {
        table->add_warning("Failed to parse " + rel + ": " + e.what());
        return table;
    }

    for (const auto &[alias, target] : parsed.imports) {
        table->add_import(module, alias, target);
    }
    for (const auto &name : parsed.main_guard_calls) {
        table->add_main_guard_call(module, name);
    }

    for (const auto &cls : parsed.classes) {
        ClassInfo info;
        info.name = cls.name;
        info.qualified_name = module + "." + cls.name;
        info.module = module;
        info.line_number = cls.line;
        info.base_classes = cls.base_classes;
        info.instance_attributes = cls.instance_attributes;
        for (const auto &method : cls.methods) {
            info.methods[method] = info.qualified_name + "." + method;
        }
        table->add_class(std::move(info));
    }

    for (auto &func : parsed.functions) {
        PythonMetadata meta;
        meta.module = module;
        meta.class_name = func.class_name;
        meta.parameters = func.parameters;
        meta.return_type = func.return_type;
        meta.is_class_method = !func.class_name.empty();
        meta.local_bindings = func.local_bindings;
        meta.function_local_imports = func.local_imports;
        meta.http_method = func.http_method;
        meta.http_route = func.http_route;
        meta.uses_cli_parsing = uses_cli_parsing(func);

        Symbol symbol;
        symbol.name = func.name;
        symbol.qualified_name = func.class_name.empty()
                                    ? module + "." + func.name
                                    : module + "." + func.class_name + "." + func.name;
        symbol.language = PYTHON_LANGUAGE;
        symbol.file_path = rel;
        symbol.line_number = func.line;
        symbol.raw_calls = std::move(func.calls);
        symbol.documentation = func.docstring;
        symbol.metadata = std::move(meta);
        table->add_symbol(std::move(symbol));
    }

    // Script-level entry point for server start-up files without a runner function
    if (parsed.has_main_guard && contains_any(source, SERVER_PATTERNS) &&
        !is_deprioritized_path(rel)) {
        std::string stem = fs::path(rel).stem().string();
        std::string qname = module + "." + stem;
        if (!table->contains(qname)) {
            PythonMetadata meta;
            meta.module = module;
            meta.is_script = true;

            Symbol script;
            script.name = "<script:" + stem + ">";
            script.qualified_name = qname;
            script.language = PYTHON_LANGUAGE;
            script.file_path = rel;
            script.line_number = 1;
            script.metadata = std::move(meta);
            table->add_symbol(std::move(script));
        }
    }

    return table;
}

std::unique_ptr<SymbolTable>
PythonAnalyzer::merge_symbol_tables(std::vector<std::unique_ptr<SymbolTable>> tables) const {
    auto merged = std::make_unique<PythonSymbolTable>();
    for (auto &table : tables) {
        auto *python_table = dynamic_cast<PythonSymbolTable *>(table.get());
        if (python_table)
            merged->absorb(std::move(*python_table));
    }
    return merged;
}

void PythonAnalyzer::resolve_calls(SymbolTable &table) const {
    auto *python_table = dynamic_cast<PythonSymbolTable *>(&table);
    if (!python_table)
        return;

    PythonCallResolver resolver(*python_table);

    // Resolve against a snapshot so earlier results never feed later lookups
    std::map<std::string, std::vector<std::string>> resolved;
    for (const auto &[qname, symbol] : python_table->symbols()) {
        auto &calls = resolved[qname];
        for (const auto &raw : symbol.raw_calls) {
            auto target = resolver.resolve(raw, symbol);
            if (target && std::find(calls.begin(), calls.end(), *target) == calls.end())
                calls.push_back(*target);
        }
    }

    for (auto &[qname, symbol] : python_table->symbols()) {
        symbol.resolved_calls = std::move(resolved[qname]);
    }
}

bool PythonAnalyzer::is_private_name(const std::string &name) {
    return !name.empty() && name[0] == '_';
}

bool PythonAnalyzer::is_test_symbol(const Symbol &symbol) {
    if (symbol.name.compare(0, 5, "test_") == 0 || is_one_of(symbol.name, TEST_HOOKS))
        return true;

    std::string file = file_name_of(symbol.file_path);
    const std::string suffix = "_test.py";
    return file.compare(0, 5, "test_") == 0 ||
           (file.size() > suffix.size() &&
            file.compare(file.size() - suffix.size(), suffix.size(), suffix) == 0);
}

bool PythonAnalyzer::looks_like_entry_point(const Symbol &symbol,
                                            const PythonSymbolTable &table) {
    const PythonMetadata *meta = symbol.python();
    if (!meta || is_private_name(symbol.name))
        return false;

    if (meta->is_script || meta->is_http_handler() || is_test_symbol(symbol))
        return true;
    if (meta->class_name.empty() && table.is_called_in_main_guard(meta->module, symbol.name))
        return true;
    if (meta->uses_cli_parsing)
        return true;
    return is_one_of(symbol.name, RUNNER_NAMES);
}

void PythonAnalyzer::mark_entry_points(SymbolTable &table) const {
    auto *python_table = dynamic_cast<PythonSymbolTable *>(&table);
    if (!python_table)
        return;

    for (auto &[qname, symbol] : python_table->symbols()) {
        symbol.is_entry_point = looks_like_entry_point(symbol, *python_table);
    }
}

} // namespace flowdiff
