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
#include "config.hpp"
#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace flowdiff {

class PythonSymbolTable;

// Context handed to an entry-point filter for one heuristic candidate
struct EntryPointCandidate {
    std::string name;
    std::string qualified_name;
    std::string file_name;
    std::string file_path;
    std::vector<std::string> parameters;
    bool uses_cli_parsing = false;
    bool called_in_main_guard = false;
    bool is_test = false;
    bool is_private = false;
    size_t caller_count = 0;
    size_t callee_count = 0;
};

// Optional collaborator narrowing heuristic entry points
class EntryPointFilter {
public:

    virtual ~EntryPointFilter() = default;

    // Return the qualified names to keep. May throw; callers then keep every candidate.
    virtual std::vector<std::string> filter(const std::vector<EntryPointCandidate> &candidates) = 0;
};

// Build filter candidates for the Python symbols currently marked as entry points
std::vector<EntryPointCandidate> build_entry_point_candidates(const PythonSymbolTable &table);

// Runs the analysis pipeline over one directory tree
class Orchestrator {
public:

    // Registers the Python and shell analyzers and the HTTP bridge
    explicit Orchestrator(fs::path project_root, const AnalysisConfig &config = AnalysisConfig{});

    // Discover, build, merge, resolve, mark entry points, bridge
    SymbolTableMap analyze();

    // Get analyzable files under the root, sorted by path
    std::vector<fs::path> discover_files() const;

    // Check if a root-relative path should be skipped
    bool should_ignore(const fs::path &relative_path) const;

    // Check whether a registered analyzer owns the path
    bool is_analyzable(const fs::path &path) const;

    LanguageRegistry &registry() { return registry_; }
    CrossLanguageResolver &resolver() { return resolver_; }

    void set_entry_point_filter(std::shared_ptr<EntryPointFilter> filter) {
        entry_point_filter_ = std::move(filter);
    }

    const fs::path &root() const { return root_; }

    // Get statistics of the last run
    struct Stats {
        std::atomic<size_t> files_analyzed{0};
        std::atomic<size_t> files_failed{0};
        std::atomic<size_t> symbols_found{0};
    };
    const Stats &stats() const { return stats_; }

private:

    fs::path root_;
    AnalysisConfig config_;
    LanguageRegistry registry_;
    CrossLanguageResolver resolver_;
    std::shared_ptr<EntryPointFilter> entry_point_filter_;
    Stats stats_;

    // Thread synchronization
    mutable std::mutex output_mutex_;

    void warn(const std::string &message) const;
    void log(const std::string &message) const;

    // Build one table per file (per-file slots keep input order)
    std::vector<std::unique_ptr<SymbolTable>> build_tables(const LanguageAnalyzer &analyzer,
                                                           const std::vector<fs::path> &files);

    // Worker function for thread pool
    void worker_build_tables(const LanguageAnalyzer &analyzer, const std::vector<fs::path> &files,
                             size_t start_idx, size_t end_idx,
                             std::vector<std::unique_ptr<SymbolTable>> &out);

    void apply_entry_point_filter(SymbolTableMap &tables);
};

} // namespace flowdiff
