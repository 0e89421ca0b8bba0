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


#include "flowdiff/types.hpp"

namespace flowdiff {

SymbolTable::SymbolTable(std::string language) : language_(std::move(language)) {}

void SymbolTable::add_symbol(Symbol symbol) {
    std::string key = symbol.qualified_name;
    symbols_[key] = std::move(symbol);
}

Symbol *SymbolTable::get_symbol(const std::string &qualified_name) {
    auto it = symbols_.find(qualified_name);
    return it != symbols_.end() ? &it->second : nullptr;
}

const Symbol *SymbolTable::get_symbol(const std::string &qualified_name) const {
    auto it = symbols_.find(qualified_name);
    return it != symbols_.end() ? &it->second : nullptr;
}

bool SymbolTable::contains(const std::string &qualified_name) const {
    return symbols_.find(qualified_name) != symbols_.end();
}

std::vector<std::string> SymbolTable::take_warnings() {
    std::vector<std::string> out;
    out.swap(warnings_);
    return out;
}

SymbolUniverse flatten_symbols(const SymbolTableMap &tables) {
    SymbolUniverse universe;
    for (const auto &[language, table] : tables) {
        if (!table)
            continue;
        for (const auto &[qname, symbol] : table->symbols()) {
            universe[qname] = std::make_shared<Symbol>(symbol);
        }
    }
    return universe;
}

static bool is_entry_point_symbol(const Symbol &symbol) {
    return symbol.language == SHELL_LANGUAGE || symbol.is_entry_point;
}

std::vector<const Symbol *> get_entry_points(const SymbolTableMap &tables) {
    std::vector<const Symbol *> entry_points;
    for (const auto &[language, table] : tables) {
        if (!table)
            continue;
        for (const auto &[qname, symbol] : table->symbols()) {
            if (is_entry_point_symbol(symbol))
                entry_points.push_back(&symbol);
        }
    }
    return entry_points;
}

std::vector<SymbolPtr> get_entry_points(const SymbolUniverse &universe) {
    std::vector<SymbolPtr> entry_points;
    for (const auto &[qname, symbol] : universe) {
        if (is_entry_point_symbol(*symbol))
            entry_points.push_back(symbol);
    }
    return entry_points;
}

std::string file_name_of(const std::string &file_path) {
    size_t slash = file_path.rfind('/');
    return slash == std::string::npos ? file_path : file_path.substr(slash + 1);
}

} // namespace flowdiff
