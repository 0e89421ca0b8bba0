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


#include "flowdiff/analyzer.hpp"
#include <algorithm>
#include <exception>
#include <fstream>
#include <sstream>

namespace flowdiff {

std::string relative_path_string(const fs::path &file, const fs::path &root) {
    std::error_code ec;
    fs::path rel = fs::relative(file, root, ec);
    if (ec || rel.empty() || *rel.begin() == "..")
        return file.generic_string();
    return rel.generic_string();
}

bool read_source_file(const fs::path &file, std::string &out) {
    std::ifstream in(file, std::ios::binary);
    if (!in.is_open())
        return false;

    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad())
        return false;
    out = buffer.str();
    return true;
}

bool LanguageAnalyzer::can_analyze(const fs::path &file) const {
    std::string ext = file.extension().string();
    for (const auto &owned : file_extensions()) {
        if (ext == owned)
            return true;
    }
    return false;
}

// ============ LanguageRegistry ============

void LanguageRegistry::register_analyzer(std::unique_ptr<LanguageAnalyzer> analyzer) {
    if (!analyzer)
        return;
    std::string language = analyzer->get_language_name();
    for (auto &existing : analyzers_) {
        if (existing->get_language_name() == language) {
            existing = std::move(analyzer);
            return;
        }
    }
    analyzers_.push_back(std::move(analyzer));
}

const LanguageAnalyzer *LanguageRegistry::get_analyzer(const std::string &language) const {
    for (const auto &analyzer : analyzers_) {
        if (analyzer->get_language_name() == language)
            return analyzer.get();
    }
    return nullptr;
}

const LanguageAnalyzer *LanguageRegistry::get_analyzer_for_file(const fs::path &file) const {
    for (const auto &analyzer : analyzers_) {
        if (analyzer->can_analyze(file))
            return analyzer.get();
    }
    return nullptr;
}

std::vector<std::string> LanguageRegistry::supported_languages() const {
    std::vector<std::string> languages;
    languages.reserve(analyzers_.size());
    for (const auto &analyzer : analyzers_) {
        languages.push_back(analyzer->get_language_name());
    }
    return languages;
}

// ============ CrossLanguageResolver ============

void CrossLanguageResolver::register_bridge(std::unique_ptr<LanguageBridge> bridge) {
    if (bridge)
        bridges_.push_back(std::move(bridge));
}

CrossReferences
CrossLanguageResolver::resolve_cross_language_calls(const SymbolTableMap &tables,
                                                    const WarningCallback &on_warning) const {
    CrossReferences merged;
    for (const auto &bridge : bridges_) {
        CrossReferences refs;
        try {
            refs = bridge->resolve(tables);
        } catch (const std::exception &e) {
            if (on_warning)
                on_warning("Bridge " + bridge->get_bridge_name() + " failed: " + e.what());
            continue;
        }

        for (auto &[source, targets] : refs) {
            auto &slot = merged[source];
            slot.insert(slot.end(), targets.begin(), targets.end());
        }
    }
    return merged;
}

void CrossLanguageResolver::apply_cross_refs(SymbolTableMap &tables,
                                             const CrossReferences &cross_refs) {
    for (const auto &[source, targets] : cross_refs) {
        for (auto &[language, table] : tables) {
            Symbol *symbol = table ? table->get_symbol(source) : nullptr;
            if (!symbol)
                continue;
            for (const auto &target : targets) {
                auto &calls = symbol->resolved_calls;
                if (std::find(calls.begin(), calls.end(), target) == calls.end())
                    calls.push_back(target);
            }
        }
    }
}

} // namespace flowdiff
