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


#include "flowdiff/orchestrator.hpp"
#include "flowdiff/bridges.hpp"
#include "flowdiff/python_analyzer.hpp"
#include "flowdiff/shell_analyzer.hpp"
#include <algorithm>
#include <iostream>
#include <map>
#include <set>
#include <thread>

namespace flowdiff {

std::vector<EntryPointCandidate> build_entry_point_candidates(const PythonSymbolTable &table) {
    // Callers per target, counted once per calling symbol
    std::map<std::string, size_t> caller_counts;
    for (const auto &[qname, symbol] : table.symbols()) {
        for (const auto &target : symbol.resolved_calls) {
            caller_counts[target]++;
        }
    }

    std::vector<EntryPointCandidate> candidates;
    for (const auto &[qname, symbol] : table.symbols()) {
        const PythonMetadata *meta = symbol.python();
        if (!meta || !symbol.is_entry_point)
            continue;

        EntryPointCandidate candidate;
        candidate.name = symbol.name;
        candidate.qualified_name = qname;
        candidate.file_name = file_name_of(symbol.file_path);
        candidate.file_path = symbol.file_path;
        candidate.parameters = meta->parameters;
        candidate.uses_cli_parsing = meta->uses_cli_parsing;
        candidate.called_in_main_guard =
            meta->class_name.empty() && table.is_called_in_main_guard(meta->module, symbol.name);
        candidate.is_test = PythonAnalyzer::is_test_symbol(symbol);
        candidate.is_private = PythonAnalyzer::is_private_name(symbol.name);
        auto callers = caller_counts.find(qname);
        candidate.caller_count = callers != caller_counts.end() ? callers->second : 0;
        candidate.callee_count = symbol.resolved_calls.size();
        candidates.push_back(std::move(candidate));
    }
    return candidates;
}

Orchestrator::Orchestrator(fs::path project_root, const AnalysisConfig &config)
    : root_(std::move(project_root)), config_(config) {
    if (config_.num_threads == 0) {
        config_.num_threads = std::thread::hardware_concurrency();
        if (config_.num_threads == 0)
            config_.num_threads = 4; // Fallback
    }

    registry_.register_analyzer(std::make_unique<PythonAnalyzer>());
    registry_.register_analyzer(std::make_unique<ShellAnalyzer>());
    resolver_.register_bridge(std::make_unique<HttpToPythonBridge>());
}

void Orchestrator::warn(const std::string &message) const {
    std::lock_guard<std::mutex> lock(output_mutex_);
    std::cerr << "Warning: " << message << std::endl;
}

void Orchestrator::log(const std::string &message) const {
    if (!config_.verbose)
        return;
    std::lock_guard<std::mutex> lock(output_mutex_);
    std::cout << message << std::endl;
}

bool Orchestrator::should_ignore(const fs::path &relative_path) const {
    for (const auto &component : relative_path) {
        std::string comp = component.string();

        // Ignore hidden files/directories
        if (!comp.empty() && comp[0] == '.' && comp != "." && comp != "..")
            return true;

        for (const auto &pattern : config_.exclude_dirs) {
            if (comp == pattern)
                return true;
        }
    }
    return false;
}

bool Orchestrator::is_analyzable(const fs::path &path) const {
    return registry_.get_analyzer_for_file(path) != nullptr;
}

std::vector<fs::path> Orchestrator::discover_files() const {
    std::vector<fs::path> files;

    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        warn("Path does not exist or is not a directory: " + root_.string());
        return files;
    }

    // Iterative directory traversal
    std::vector<fs::path> dirs_to_visit;
    dirs_to_visit.push_back(root_);

    while (!dirs_to_visit.empty()) {
        fs::path current_dir = dirs_to_visit.back();
        dirs_to_visit.pop_back();

        for (const auto &entry : fs::directory_iterator(current_dir, ec)) {
            const fs::path &path = entry.path();
            if (should_ignore(path.lexically_relative(root_)))
                continue;

            std::error_code status_ec;
            if (entry.is_directory(status_ec)) {
                if (!entry.is_symlink(status_ec))
                    dirs_to_visit.push_back(path);
            } else if (entry.is_regular_file(status_ec) && is_analyzable(path)) {
                files.push_back(path);
            }
        }
        if (ec) {
            warn("Could not list " + current_dir.string() + ": " + ec.message());
            ec.clear();
        }
    }

    // Lexicographic order makes merge tie-breaks reproducible
    std::sort(files.begin(), files.end());
    return files;
}

void Orchestrator::worker_build_tables(const LanguageAnalyzer &analyzer,
                                       const std::vector<fs::path> &files, size_t start_idx,
                                       size_t end_idx,
                                       std::vector<std::unique_ptr<SymbolTable>> &out) {
    for (size_t i = start_idx; i < end_idx; ++i) {
        const auto &filepath = files[i];
        std::string rel = relative_path_string(filepath, root_);

        std::unique_ptr<SymbolTable> table;
        try {
            table = analyzer.build_symbol_table(filepath, root_);
        } catch (const std::exception &e) {
            warn("Failed to analyze " + rel + ": " + e.what());
        }

        if (!table) {
            stats_.files_failed++;
            continue;
        }

        auto warnings = table->take_warnings();
        for (const auto &warning : warnings) {
            warn(warning);
        }
        if (warnings.empty()) {
            stats_.files_analyzed++;
            log("Parsed: " + rel);
        } else {
            stats_.files_failed++;
        }

        stats_.symbols_found += table->size();
        out[i] = std::move(table);
    }
}

std::vector<std::unique_ptr<SymbolTable>>
Orchestrator::build_tables(const LanguageAnalyzer &analyzer, const std::vector<fs::path> &files) {
    std::vector<std::unique_ptr<SymbolTable>> slots(files.size());
    if (files.empty())
        return slots;

    unsigned int num_threads =
        static_cast<unsigned int>(std::min<size_t>(config_.num_threads, files.size()));
    if (num_threads <= 1) {
        worker_build_tables(analyzer, files, 0, files.size(), slots);
    } else {
        // Create worker threads
        std::vector<std::thread> threads;
        size_t files_per_thread = (files.size() + num_threads - 1) / num_threads;

        for (unsigned int t = 0; t < num_threads; ++t) {
            size_t start_idx = t * files_per_thread;
            size_t end_idx = std::min(start_idx + files_per_thread, files.size());

            if (start_idx >= files.size())
                break;

            threads.emplace_back(&Orchestrator::worker_build_tables, this, std::cref(analyzer),
                                 std::cref(files), start_idx, end_idx, std::ref(slots));
        }

        // Wait for all threads
        for (auto &t : threads) {
            t.join();
        }
    }

    // Unreadable files leave empty slots; merge only what was built
    std::vector<std::unique_ptr<SymbolTable>> tables;
    tables.reserve(slots.size());
    for (auto &slot : slots) {
        if (slot)
            tables.push_back(std::move(slot));
    }
    return tables;
}

void Orchestrator::apply_entry_point_filter(SymbolTableMap &tables) {
    auto it = tables.find(PYTHON_LANGUAGE);
    if (it == tables.end())
        return;
    auto *python = dynamic_cast<PythonSymbolTable *>(it->second.get());
    if (!python)
        return;

    auto candidates = build_entry_point_candidates(*python);
    if (candidates.empty())
        return;

    std::vector<std::string> accepted;
    try {
        accepted = entry_point_filter_->filter(candidates);
    } catch (const std::exception &e) {
        warn(std::string("Entry point filter failed, keeping all candidates: ") + e.what());
        return;
    }

    std::set<std::string> keep(accepted.begin(), accepted.end());
    for (const auto &candidate : candidates) {
        if (keep.count(candidate.qualified_name) == 0) {
            if (Symbol *symbol = python->get_symbol(candidate.qualified_name))
                symbol->is_entry_point = false;
        }
    }
    log("Entry point filter kept " + std::to_string(keep.size()) + " of " +
        std::to_string(candidates.size()) + " candidates.");
}

SymbolTableMap Orchestrator::analyze() {
    SymbolTableMap tables;
    stats_.files_analyzed = 0;
    stats_.files_failed = 0;
    stats_.symbols_found = 0;

    // Phase 1: Discover files
    auto files = discover_files();
    log("Found " + std::to_string(files.size()) + " source files to analyze.");

    // Phase 2: Group by owning analyzer (sorted order preserved)
    std::map<std::string, std::vector<fs::path>> by_language;
    for (const auto &file : files) {
        if (const LanguageAnalyzer *analyzer = registry_.get_analyzer_for_file(file))
            by_language[analyzer->get_language_name()].push_back(file);
    }

    // Phase 3: Build per-file tables and merge
    for (auto &[language, language_files] : by_language) {
        const LanguageAnalyzer *analyzer = registry_.get_analyzer(language);
        auto per_file = build_tables(*analyzer, language_files);
        tables[language] = analyzer->merge_symbol_tables(std::move(per_file));
        log("Merged " + std::to_string(tables[language]->size()) + " " + language + " symbols.");
    }

    // Phase 4: Intra-language resolution
    for (auto &[language, table] : tables) {
        registry_.get_analyzer(language)->resolve_calls(*table);
    }

    // Phase 5: Entry points
    for (auto &[language, table] : tables) {
        registry_.get_analyzer(language)->mark_entry_points(*table);
    }
    if (entry_point_filter_)
        apply_entry_point_filter(tables);

    // Phase 6: Cross-language bridges
    auto cross_refs = resolver_.resolve_cross_language_calls(
        tables, [this](const std::string &message) { warn(message); });
    CrossLanguageResolver::apply_cross_refs(tables, cross_refs);
    log("Resolved " + std::to_string(cross_refs.size()) + " cross-language callers.");

    return tables;
}

} // namespace flowdiff
