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


#include "flowdiff/commands.hpp"
#include "flowdiff/flowdiff.hpp"
#include "flowdiff/serialization.hpp"
#include "flowdiff/version.hpp"
#include <iostream>

namespace flowdiff {

int cmd_analyze(const std::string &path, const AnalysisConfig &config) {
    try {
        SymbolTableMap tables = analyze(path, config);
        SymbolUniverse universe = flatten_symbols(tables);
        auto trees =
            build_call_trees(get_entry_points(universe), universe, config.default_expansion_depth);

        json output;
        output["schema_version"] = OUTPUT_SCHEMA_VERSION;
        output["project_root"] = path;
        output["symbols"] = tables_to_json(tables);
        output["call_trees"] = trees_to_json(trees);

        json called_by = json::object();
        for (const auto &[callee, callers] : build_called_by(universe)) {
            called_by[callee] = callers;
        }
        output["called_by"] = called_by;

        std::cout << output.dump(2) << std::endl;
        return 0;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int cmd_entry_points(const std::string &path, const AnalysisConfig &config) {
    try {
        SymbolTableMap tables = analyze(path, config);
        auto entry_points = get_entry_points(tables);

        std::cout << entry_points.size() << " Entry points found" << std::endl;
        if (entry_points.empty()) {
            std::cout << "  (none found)" << std::endl;
        }
        for (const Symbol *symbol : entry_points) {
            std::cout << "  " << symbol->qualified_name << "  [" << symbol->language << "] "
                      << symbol->file_path << ":" << symbol->line_number << std::endl;
        }
        return 0;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int cmd_diff(const std::string &path, const std::string &before_ref, const std::string &after_ref,
             const AnalysisConfig &config, bool summary_only) {
    try {
        DiffResult result = analyze_diff(path, before_ref, after_ref, config);

        if (!summary_only) {
            std::cout << diff_result_to_json(result).dump(2) << std::endl;
            return 0;
        }

        std::cout << "Before: " << result.before_description << std::endl;
        std::cout << "After:  " << result.after_description << std::endl;
        std::cout << result.file_changes.size() << " files changed" << std::endl;
        for (const auto &change : result.file_changes) {
            std::cout << "  " << file_change_type_to_string(change.type) << "  ";
            if (!change.old_path.empty())
                std::cout << change.old_path << " -> ";
            std::cout << change.path << std::endl;
        }

        std::cout << "\n" << result.added << " added, " << result.modified << " modified, "
                  << result.deleted << " deleted" << std::endl;
        for (const auto &[qname, change] : result.symbol_changes) {
            std::cout << "  " << change_kind_to_string(change.kind) << "  " << qname << std::endl;
        }
        return 0;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

} // namespace flowdiff
