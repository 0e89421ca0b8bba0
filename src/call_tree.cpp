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


#include "flowdiff/call_tree.hpp"
#include <algorithm>

namespace flowdiff {

CallTreeBuilder::CallTreeBuilder(const SymbolUniverse &universe, int default_depth)
    : universe_(universe), default_depth_(clamp_expansion_depth(default_depth)) {}

std::vector<CallTreeNode> CallTreeBuilder::build(const std::vector<SymbolPtr> &entry_points) {
    std::vector<CallTreeNode> trees;
    trees.reserve(entry_points.size());
    max_changed_depth_ = 0;

    // Pass 1: construction
    for (const auto &entry : entry_points) {
        if (!entry)
            continue;
        std::unordered_set<std::string> in_path;
        in_path.reserve(64);
        trees.push_back(build_node(entry, 0, in_path));
    }

    // Pass 2: expansion policy over the finished forest
    expansion_depth_ = std::max(default_depth_, max_changed_depth_);
    for (auto &tree : trees) {
        apply_expansion(tree, expansion_depth_);
    }
    return trees;
}

CallTreeNode CallTreeBuilder::build_node(const SymbolPtr &symbol, int depth,
                                         std::unordered_set<std::string> &in_path) {
    CallTreeNode node;
    node.symbol = symbol;
    node.depth = depth;

    if (symbol->has_changes)
        max_changed_depth_ = std::max(max_changed_depth_, depth);

    // Already on this branch: stop here
    if (in_path.count(symbol->qualified_name))
        return node;

    in_path.insert(symbol->qualified_name);
    for (const auto &callee : symbol->resolved_calls) {
        auto it = universe_.find(callee);
        if (it == universe_.end() || !it->second)
            continue;
        node.children.push_back(build_node(it->second, depth + 1, in_path));
    }
    in_path.erase(symbol->qualified_name);

    return node;
}

void CallTreeBuilder::apply_expansion(CallTreeNode &node, int expansion_depth) {
    // Iterative walk to avoid deep recursion on long chains
    std::vector<CallTreeNode *> stack;
    stack.push_back(&node);
    while (!stack.empty()) {
        CallTreeNode *current = stack.back();
        stack.pop_back();
        current->is_expanded = current->depth < expansion_depth;
        for (auto &child : current->children) {
            stack.push_back(&child);
        }
    }
}

std::vector<CallTreeNode> build_call_trees(const std::vector<SymbolPtr> &entry_points,
                                           const SymbolUniverse &universe, int default_depth) {
    CallTreeBuilder builder(universe, default_depth);
    return builder.build(entry_points);
}

std::map<std::string, std::vector<std::string>> build_called_by(const SymbolUniverse &universe) {
    std::map<std::string, std::vector<std::string>> called_by;
    for (const auto &[qname, symbol] : universe) {
        for (const auto &callee : symbol->resolved_calls) {
            if (universe.count(callee) == 0)
                continue;
            auto &callers = called_by[callee];
            if (std::find(callers.begin(), callers.end(), qname) == callers.end())
                callers.push_back(qname);
        }
    }
    return called_by;
}

size_t count_nodes(const CallTreeNode &node) {
    size_t count = 1;
    for (const auto &child : node.children) {
        count += count_nodes(child);
    }
    return count;
}

} // namespace flowdiff
