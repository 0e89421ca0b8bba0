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


#include "flowdiff/flowdiff.hpp"

namespace flowdiff {

SymbolTableMap analyze(const fs::path &project_root, const AnalysisConfig &config) {
    Orchestrator orchestrator(project_root, config);
    return orchestrator.analyze();
}

DiffResult analyze_diff(const fs::path &project_root, const std::string &before_ref,
                        const std::string &after_ref, const AnalysisConfig &config) {
    DiffEngine engine(project_root, config);
    return engine.analyze_diff(before_ref, after_ref);
}

} // namespace flowdiff
