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

#include "call_tree.hpp"
#include "config.hpp"
#include "types.hpp"
#include "vcs.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace flowdiff {

enum class ChangeKind { Added, Modified, Deleted };

// Convert change kind to string
const char *change_kind_to_string(ChangeKind kind);

// Classification of one qualified name across two states
struct SymbolChange {
    std::string qualified_name;
    ChangeKind kind = ChangeKind::Modified;
    SymbolPtr before; // Null for ADDED
    SymbolPtr after;  // Null for DELETED
};

// Everything produced by one analyze_diff call
struct DiffResult {
    std::string before_ref;
    std::string after_ref;
    std::string before_description;
    std::string after_description;
    std::vector<FileChange> file_changes;
    std::map<std::string, SymbolChange> symbol_changes;
    std::vector<CallTreeNode> before_trees;
    std::vector<CallTreeNode> after_trees;
    size_t added = 0;
    size_t modified = 0;
    size_t deleted = 0;
};

// Check whether two versions of a symbol differ in metadata, the set of
// resolved calls, or documentation. Line numbers are not compared.
bool symbol_differs(const Symbol &before, const Symbol &after);

// Classify every qualified name present on either side
std::map<std::string, SymbolChange> diff_symbols(const SymbolUniverse &before,
                                                 const SymbolUniverse &after);

// Set has_changes on both universes from the change map
void stamp_changes(const std::map<std::string, SymbolChange> &changes, SymbolUniverse &before,
                   SymbolUniverse &after);

// Structural diff of the project between two references
class DiffEngine {
public:

    // Uses GitRepository over project_root unless vcs is given
    explicit DiffEngine(fs::path project_root, const AnalysisConfig &config = AnalysisConfig{},
                        std::shared_ptr<VersionControl> vcs = nullptr);

    DiffResult analyze_diff(const std::string &before_ref, const std::string &after_ref);

private:

    fs::path root_;
    AnalysisConfig config_;
    std::shared_ptr<VersionControl> vcs_;

    // Analyze one side (working tree in place, or an extracted commit)
    SymbolUniverse analyze_state(const std::optional<std::string> &commit);
};

} // namespace flowdiff
