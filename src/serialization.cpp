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


#include "flowdiff/serialization.hpp"
#include "flowdiff/version.hpp"

namespace flowdiff {

json metadata_to_json(const SymbolMetadata &metadata) {
    if (const auto *python = std::get_if<PythonMetadata>(&metadata)) {
        json j;
        j["module"] = python->module;
        if (!python->class_name.empty())
            j["class_name"] = python->class_name;
        j["parameters"] = python->parameters;
        if (!python->return_type.empty())
            j["return_type"] = python->return_type;
        j["is_class_method"] = python->is_class_method;
        j["local_bindings"] = python->local_bindings;
        j["function_local_imports"] = python->function_local_imports;
        if (python->is_http_handler()) {
            j["http_method"] = python->http_method;
            j["http_route"] = python->http_route;
        }
        j["uses_cli_parsing"] = python->uses_cli_parsing;
        if (python->is_script)
            j["is_script"] = true;
        return j;
    }
    if (const auto *shell = std::get_if<ShellMetadata>(&metadata)) {
        json j = json::object();
        if (!shell->interpreter.empty())
            j["interpreter"] = shell->interpreter;
        return j;
    }
    return json::object();
}

json symbol_to_json(const Symbol &symbol) {
    json j;
    j["name"] = symbol.name;
    j["qualified_name"] = symbol.qualified_name;
    j["language"] = symbol.language;
    j["file_path"] = symbol.file_path;
    j["file_name"] = file_name_of(symbol.file_path);
    j["line_number"] = symbol.line_number;
    j["metadata"] = metadata_to_json(symbol.metadata);
    j["raw_calls"] = symbol.raw_calls;
    j["resolved_calls"] = symbol.resolved_calls;
    j["is_entry_point"] = symbol.is_entry_point;
    j["has_changes"] = symbol.has_changes;
    j["documentation"] = symbol.documentation ? json(*symbol.documentation) : json(nullptr);
    return j;
}

json tables_to_json(const SymbolTableMap &tables) {
    json j = json::object();
    for (const auto &[language, table] : tables) {
        json symbols = json::array();
        if (table) {
            for (const auto &[qname, symbol] : table->symbols()) {
                symbols.push_back(symbol_to_json(symbol));
            }
        }
        j[language] = symbols;
    }
    return j;
}

json tree_to_json(const CallTreeNode &node, int max_depth) {
    const Symbol &symbol = *node.symbol;

    json j;
    j["name"] = symbol.name;
    j["qualified_name"] = symbol.qualified_name;
    j["language"] = symbol.language;
    j["file_path"] = symbol.file_path;
    j["line_number"] = symbol.line_number;
    j["depth"] = node.depth;
    j["is_expanded"] = node.is_expanded;
    j["has_changes"] = symbol.has_changes;

    if (max_depth >= 0 && node.depth >= max_depth) {
        j["children"] = json::array();
        j["truncated_children"] = node.children.size();
        return j;
    }

    json children = json::array();
    for (const auto &child : node.children) {
        children.push_back(tree_to_json(child, max_depth));
    }
    j["children"] = children;
    return j;
}

json trees_to_json(const std::vector<CallTreeNode> &trees, int max_depth) {
    json j = json::array();
    for (const auto &tree : trees) {
        j.push_back(tree_to_json(tree, max_depth));
    }
    return j;
}

json file_change_to_json(const FileChange &change) {
    json j;
    j["path"] = change.path;
    j["change_type"] = file_change_type_to_string(change.type);
    if (!change.old_path.empty())
        j["old_path"] = change.old_path;
    return j;
}

json symbol_change_to_json(const SymbolChange &change) {
    json j;
    j["qualified_name"] = change.qualified_name;
    j["change_type"] = change_kind_to_string(change.kind);
    j["before"] = change.before ? symbol_to_json(*change.before) : json(nullptr);
    j["after"] = change.after ? symbol_to_json(*change.after) : json(nullptr);
    return j;
}

json diff_result_to_json(const DiffResult &result) {
    json j;
    j["schema_version"] = OUTPUT_SCHEMA_VERSION;
    j["before_ref"] = result.before_ref;
    j["after_ref"] = result.after_ref;
    j["before_description"] = result.before_description;
    j["after_description"] = result.after_description;

    json files = json::array();
    for (const auto &change : result.file_changes) {
        files.push_back(file_change_to_json(change));
    }
    j["file_changes"] = files;

    json changes = json::object();
    for (const auto &[qname, change] : result.symbol_changes) {
        changes[qname] = symbol_change_to_json(change);
    }
    j["symbol_changes"] = changes;

    j["summary"] = {{"added", result.added},
                    {"modified", result.modified},
                    {"deleted", result.deleted}};
    j["before_trees"] = trees_to_json(result.before_trees);
    j["after_trees"] = trees_to_json(result.after_trees);
    return j;
}

} // namespace flowdiff
