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

#include "config.hpp"
#include "types.hpp"
#include <map>
#include <string>
#include <unordered_set>
#include <vector>

namespace flowdiff {

// One occurrence of a symbol in a call tree
struct CallTreeNode {
    SymbolPtr symbol; // Shared with the universe the tree was built from
    std::vector<CallTreeNode> children;
    int depth = 0;
    bool is_expanded = false;
};

// Builds rooted call trees from entry points over one symbol universe.
//
// Construction carries the set of symbols on the current path: a symbol that
// is already on the path becomes a leaf, so recursion terminates. The depth of
// the deepest node whose symbol has_changes is recorded, and once every tree is
// built all nodes shallower than max(default depth, that depth) are expanded.
class CallTreeBuilder {
public:

    explicit CallTreeBuilder(const SymbolUniverse &universe,
                             int default_depth = DEFAULT_EXPANSION_DEPTH);

    // Build one tree per entry point
    std::vector<CallTreeNode> build(const std::vector<SymbolPtr> &entry_points);

    // Deepest changed node seen by the last build (0 if none)
    int max_changed_depth() const { return max_changed_depth_; }

    // Expansion depth applied by the last build
    int expansion_depth() const { return expansion_depth_; }

private:

    const SymbolUniverse &universe_;
    int default_depth_;
    int max_changed_depth_ = 0;
    int expansion_depth_ = 0;

    CallTreeNode build_node(const SymbolPtr &symbol, int depth,
                            std::unordered_set<std::string> &in_path);

    static void apply_expansion(CallTreeNode &node, int expansion_depth);
};

// Build trees with a fresh builder
std::vector<CallTreeNode> build_call_trees(const std::vector<SymbolPtr> &entry_points,
                                           const SymbolUniverse &universe,
                                           int default_depth = DEFAULT_EXPANSION_DEPTH);

// Reverse edges: callee qualified name -> callers (known symbols only)
std::map<std::string, std::vector<std::string>> build_called_by(const SymbolUniverse &universe);

// Count nodes in a tree
size_t count_nodes(const CallTreeNode &node);

} // namespace flowdiff
