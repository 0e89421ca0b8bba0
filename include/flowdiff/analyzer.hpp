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

#include "types.hpp"
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace flowdiff {

namespace fs = std::filesystem;

// Get path relative to root with "/" separators (file unchanged if not under root)
std::string relative_path_string(const fs::path &file, const fs::path &root);

// Read a whole file into out
bool read_source_file(const fs::path &file, std::string &out);

// Source qualified name -> target qualified names in another language
using CrossReferences = std::map<std::string, std::vector<std::string>>;

// Turns source files of one language into symbol tables
class LanguageAnalyzer {
public:

    virtual ~LanguageAnalyzer() = default;

    // Get language name (stable map key)
    virtual std::string get_language_name() const = 0;

    // Get file extensions owned by this analyzer (with leading dot)
    virtual std::vector<std::string> file_extensions() const = 0;

    // Check whether this analyzer owns the file
    virtual bool can_analyze(const fs::path &file) const;

    // Build a table for one file. Never throws on malformed input: returns an
    // empty table carrying a warning instead. root is the project root used to
    // derive module and relative path names.
    virtual std::unique_ptr<SymbolTable> build_symbol_table(const fs::path &file,
                                                            const fs::path &root) const = 0;

    // Merge per-file tables in input order; later tables win name collisions
    virtual std::unique_ptr<SymbolTable>
    merge_symbol_tables(std::vector<std::unique_ptr<SymbolTable>> tables) const = 0;

    // Recompute resolved_calls from raw_calls
    virtual void resolve_calls(SymbolTable &table) const = 0;

    // Apply entry-point heuristics (default: none)
    virtual void mark_entry_points(SymbolTable &table) const { (void)table; }
};

// Resolves calls that cross a language boundary
class LanguageBridge {
public:

    virtual ~LanguageBridge() = default;

    // Get bridge name (used in diagnostics)
    virtual std::string get_bridge_name() const = 0;

    // Check whether calls from one language into another are handled
    virtual bool can_bridge(const std::string &from_language,
                            const std::string &to_language) const = 0;

    // Compute cross references. Missing partner tables yield an empty map.
    virtual CrossReferences resolve(const SymbolTableMap &tables) const = 0;
};

// Open registry of analyzers keyed by language name
class LanguageRegistry {
public:

    // Register an analyzer, replacing any analyzer for the same language
    void register_analyzer(std::unique_ptr<LanguageAnalyzer> analyzer);

    // Get analyzer by language name (nullptr if absent)
    const LanguageAnalyzer *get_analyzer(const std::string &language) const;

    // Get the first registered analyzer owning the file (nullptr if none)
    const LanguageAnalyzer *get_analyzer_for_file(const fs::path &file) const;

    // Get registered language names in registration order
    std::vector<std::string> supported_languages() const;

    bool empty() const { return analyzers_.empty(); }

private:

    std::vector<std::unique_ptr<LanguageAnalyzer>> analyzers_;
};

// Warning sink used by the resolver (message already formatted)
using WarningCallback = std::function<void(const std::string &message)>;

// Runs bridges and applies their cross references
class CrossLanguageResolver {
public:

    void register_bridge(std::unique_ptr<LanguageBridge> bridge);

    // Run every bridge. A bridge that throws contributes nothing and is
    // reported through on_warning.
    CrossReferences resolve_cross_language_calls(const SymbolTableMap &tables,
                                                 const WarningCallback &on_warning) const;

    // Append targets to the matching symbols' resolved_calls
    static void apply_cross_refs(SymbolTableMap &tables, const CrossReferences &cross_refs);

    size_t bridge_count() const { return bridges_.size(); }

private:

    std::vector<std::unique_ptr<LanguageBridge>> bridges_;
};

} // namespace flowdiff
