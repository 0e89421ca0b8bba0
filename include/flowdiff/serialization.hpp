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
#include "diff.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace flowdiff {

using json = nlohmann::json;

json metadata_to_json(const SymbolMetadata &metadata);
json symbol_to_json(const Symbol &symbol);
json tables_to_json(const SymbolTableMap &tables);

// Nodes beyond max_depth are summarized by their child count (-1 = unlimited)
json tree_to_json(const CallTreeNode &node, int max_depth = -1);
json trees_to_json(const std::vector<CallTreeNode> &trees, int max_depth = -1);

json file_change_to_json(const FileChange &change);
json symbol_change_to_json(const SymbolChange &change);
json diff_result_to_json(const DiffResult &result);

} // namespace flowdiff
