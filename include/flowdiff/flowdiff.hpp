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
#include "diff.hpp"
#include "orchestrator.hpp"
#include "types.hpp"
#include <filesystem>
#include <string>

namespace flowdiff {

// One-shot analysis of a project directory
SymbolTableMap analyze(const fs::path &project_root,
                       const AnalysisConfig &config = AnalysisConfig{});

// Structural diff between two git references ("working" = uncommitted state)
DiffResult analyze_diff(const fs::path &project_root, const std::string &before_ref,
                        const std::string &after_ref,
                        const AnalysisConfig &config = AnalysisConfig{});

} // namespace flowdiff
