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

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace flowdiff {

namespace fs = std::filesystem;

// Call tree expansion depth bounds
constexpr int DEFAULT_EXPANSION_DEPTH = 6;
constexpr int MIN_EXPANSION_DEPTH = 1;
constexpr int MAX_EXPANSION_DEPTH = 20;

// Optional per-project configuration file
constexpr const char *CONFIG_FILE = ".flowdiff.json";

// Analysis configuration
struct AnalysisConfig {
    bool verbose = false;

    // Threading config
    unsigned int num_threads = 0; // 0 = auto-detect

    // Directory names skipped during discovery (hidden directories are always skipped)
    std::vector<std::string> exclude_dirs = {".git",        "venv",          "node_modules",
                                             "__pycache__", ".pytest_cache", ".mypy_cache",
                                             "build",       "dist",          ".venv"};

    int default_expansion_depth = DEFAULT_EXPANSION_DEPTH;

    // External process timeouts
    std::chrono::seconds archive_timeout{30};
    std::chrono::seconds diff_timeout{10};
    std::chrono::seconds command_timeout{60};
};

// Clamp an expansion depth into [MIN_EXPANSION_DEPTH, MAX_EXPANSION_DEPTH]
int clamp_expansion_depth(int depth);

// Load CONFIG_FILE from project_root (defaults if absent), then apply
// FLOWDIFF_THREADS / FLOWDIFF_EXPANSION_DEPTH / FLOWDIFF_VERBOSE overrides.
// Throws ConfigError on malformed input.
AnalysisConfig load_config(const fs::path &project_root);

// Parse configuration JSON text over the defaults
AnalysisConfig parse_config(const std::string &json_text);

} // namespace flowdiff
