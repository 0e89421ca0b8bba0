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
#include <optional>
#include <string>
#include <vector>

namespace flowdiff {

// Prefix of shell raw calls describing an HTTP request ("HTTP:POST:/analyze")
constexpr const char *HTTP_CALL_PREFIX = "HTTP:";

// Prefix of shell raw calls describing a Python invocation ("PYTHON:pkg.mod")
constexpr const char *PYTHON_CALL_PREFIX = "PYTHON:";

// Shell scripts: one symbol per file, calls found by pattern matching
class ShellAnalyzer : public LanguageAnalyzer {
public:

    std::string get_language_name() const override { return SHELL_LANGUAGE; }
    std::vector<std::string> file_extensions() const override { return {".sh"}; }

    std::unique_ptr<SymbolTable> build_symbol_table(const fs::path &file,
                                                    const fs::path &root) const override;

    std::unique_ptr<SymbolTable>
    merge_symbol_tables(std::vector<std::unique_ptr<SymbolTable>> tables) const override;

    // Shell calls have no intra-language targets
    void resolve_calls(SymbolTable &table) const override;

    // Every script is an entry point
    void mark_entry_points(SymbolTable &table) const override;

    // Extract raw calls from script text, in line order
    static std::vector<std::string> extract_calls(const std::string &script);

    // Parse one curl line into "HTTP:METHOD:PATH" (nullopt if no path found)
    static std::optional<std::string> parse_curl(const std::string &line);
};

} // namespace flowdiff
