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


#include "flowdiff/config.hpp"
#include "flowdiff/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace flowdiff {

using json = nlohmann::json;

namespace {

int parse_int_env(const char *name, const std::string &value) {
    try {
        size_t used = 0;
        int parsed = std::stoi(value, &used);
        if (used != value.size())
            throw ConfigError(std::string("Invalid integer in ") + name + ": " + value);
        return parsed;
    } catch (const std::logic_error &) {
        throw ConfigError(std::string("Invalid integer in ") + name + ": " + value);
    }
}

bool parse_bool_env(const std::string &value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "1" || lower == "true" || lower == "yes" || lower == "on";
}

void apply_env_overrides(AnalysisConfig &config) {
    if (const char *threads = std::getenv("FLOWDIFF_THREADS")) {
        int value = parse_int_env("FLOWDIFF_THREADS", threads);
        if (value < 0)
            throw ConfigError("FLOWDIFF_THREADS must not be negative");
        config.num_threads = static_cast<unsigned int>(value);
    }
    if (const char *depth = std::getenv("FLOWDIFF_EXPANSION_DEPTH")) {
        config.default_expansion_depth =
            clamp_expansion_depth(parse_int_env("FLOWDIFF_EXPANSION_DEPTH", depth));
    }
    if (const char *verbose = std::getenv("FLOWDIFF_VERBOSE")) {
        config.verbose = parse_bool_env(verbose);
    }
}

} // namespace

int clamp_expansion_depth(int depth) {
    return std::max(MIN_EXPANSION_DEPTH, std::min(MAX_EXPANSION_DEPTH, depth));
}

AnalysisConfig parse_config(const std::string &json_text) {
    AnalysisConfig config;

    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::parse_error &e) {
        throw ConfigError(std::string("Failed to parse configuration: ") + e.what());
    }
    if (!j.is_object())
        throw ConfigError("Configuration must be a JSON object");

    try {
        if (j.contains("verbose"))
            config.verbose = j["verbose"].get<bool>();
        if (j.contains("threads"))
            config.num_threads = j["threads"].get<unsigned int>();
        if (j.contains("exclude_dirs"))
            config.exclude_dirs = j["exclude_dirs"].get<std::vector<std::string>>();
        if (j.contains("expansion_depth"))
            config.default_expansion_depth = clamp_expansion_depth(j["expansion_depth"].get<int>());

        if (j.contains("timeouts")) {
            const json &timeouts = j["timeouts"];
            if (timeouts.contains("archive"))
                config.archive_timeout = std::chrono::seconds(timeouts["archive"].get<int>());
            if (timeouts.contains("diff"))
                config.diff_timeout = std::chrono::seconds(timeouts["diff"].get<int>());
            if (timeouts.contains("command"))
                config.command_timeout = std::chrono::seconds(timeouts["command"].get<int>());
        }
    } catch (const json::exception &e) {
        throw ConfigError(std::string("Invalid configuration value: ") + e.what());
    }

    return config;
}

AnalysisConfig load_config(const fs::path &project_root) {
    AnalysisConfig config;

    fs::path config_path = project_root / CONFIG_FILE;
    std::error_code ec;
    if (fs::is_regular_file(config_path, ec)) {
        std::ifstream file(config_path);
        if (!file.is_open())
            throw ConfigError("Failed to open file for reading: " + config_path.string());
        std::stringstream buffer;
        buffer << file.rdbuf();
        config = parse_config(buffer.str());
    }

    apply_env_overrides(config);
    return config;
}

} // namespace flowdiff
