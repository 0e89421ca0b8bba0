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


#include "flowdiff/shell_analyzer.hpp"
#include <cctype>
#include <regex>
#include <set>
#include <sstream>

namespace flowdiff {

namespace {

const std::regex CURL_COMMAND(R"((^|[\s;|&(`])curl(\s|$))");
const std::regex VERB_FLAG(R"((?:-X|--request)\s*['"]?([A-Za-z]+))");

// URL path patterns for one curl argument, tried in order
const std::regex URL_PATTERNS[] = {
    std::regex(R"(^https?://[^/\s"']+(/[^\s"'?#]*))"),
    std::regex(R"(^\$[A-Za-z_][A-Za-z0-9_]*(/[^\s"'?#]*))"),
    std::regex(R"(^\$\{[A-Za-z_][A-Za-z0-9_]*\}(/[^\s"'?#]*))"),
    std::regex(R"(^[A-Za-z0-9.-]+:[0-9]+(/[^\s"'?#]*))"),
    std::regex(R"(^(/[a-zA-Z0-9_/-]+))"),
};

// curl options whose value is the following argument
const std::set<std::string> VALUE_FLAGS = {
    "-H", "--header", "-d", "--data", "--data-raw", "--data-binary", "--data-urlencode",
    "-X", "--request", "-o", "--output", "-u", "--user", "-A", "--user-agent",
    "-e", "--referer", "-b", "--cookie", "-c", "--cookie-jar", "-F", "--form",
    "-T", "--upload-file", "-m", "--max-time", "--connect-timeout", "-w", "--write-out",
};

const std::set<std::string> COMMAND_SEPARATORS = {"|", "||", "&&", ";", "&", ">", ">>", "<"};

const std::regex PYTHON_MODULE(R"(\bpython[0-9.]*\s+-m\s+([a-zA-Z0-9_.]+))");
const std::regex PYTHON_SCRIPT(R"(\bpython[0-9.]*\s+([a-zA-Z0-9_/.-]+\.py)\b)");

std::string to_upper(std::string text) {
    for (auto &c : text) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return text;
}

std::string trim(const std::string &text) {
    size_t start = text.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    size_t end = text.find_last_not_of(" \t\r");
    return text.substr(start, end - start + 1);
}

// Split a command line into words, honouring single and double quotes
std::vector<std::string> split_words(const std::string &text) {
    std::vector<std::string> words;
    std::string word;
    bool in_word = false;
    char quote = 0;
    for (char c : text) {
        if (quote) {
            if (c == quote)
                quote = 0;
            else
                word += c;
        } else if (c == '\'' || c == '"') {
            quote = c;
            in_word = true;
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            if (in_word)
                words.push_back(word);
            word.clear();
            in_word = false;
        } else {
            word += c;
            in_word = true;
        }
    }
    if (in_word)
        words.push_back(word);
    return words;
}

} // namespace

std::optional<std::string> ShellAnalyzer::parse_curl(const std::string &line) {
    std::string method = "GET";
    std::smatch verb;
    if (std::regex_search(line, verb, VERB_FLAG)) {
        method = to_upper(verb[1].str());
    }

    // Only look for the URL after the curl command itself
    std::smatch command;
    std::string rest = line;
    if (std::regex_search(line, command, CURL_COMMAND)) {
        rest = command.suffix().str();
    }

    // Option values such as headers and request bodies are never the URL
    auto words = split_words(rest);
    for (size_t i = 0; i < words.size(); ++i) {
        const std::string &word = words[i];
        if (COMMAND_SEPARATORS.count(word))
            break;
        if (!word.empty() && word[0] == '-') {
            if (VALUE_FLAGS.count(word))
                ++i;
            continue;
        }
        for (const auto &pattern : URL_PATTERNS) {
            std::smatch match;
            if (std::regex_search(word, match, pattern)) {
                return std::string(HTTP_CALL_PREFIX) + method + ":" + match[1].str();
            }
        }
    }
    return std::nullopt;
}

std::vector<std::string> ShellAnalyzer::extract_calls(const std::string &script) {
    std::vector<std::string> calls;
    std::istringstream stream(script);
    std::string raw_line;

    while (std::getline(stream, raw_line)) {
        std::string line = trim(raw_line);
        if (line.empty() || line[0] == '#')
            continue;

        if (std::regex_search(line, CURL_COMMAND)) {
            if (auto call = parse_curl(line))
                calls.push_back(*call);
        }

        std::smatch match;
        if (std::regex_search(line, match, PYTHON_MODULE)) {
            calls.push_back(std::string(PYTHON_CALL_PREFIX) + match[1].str());
        } else if (std::regex_search(line, match, PYTHON_SCRIPT)) {
            calls.push_back(std::string(PYTHON_CALL_PREFIX) + match[1].str());
        }
    }
    return calls;
}

std::unique_ptr<SymbolTable> ShellAnalyzer::build_symbol_table(const fs::path &file,
                                                               const fs::path &root) const {
    auto table = std::make_unique<SymbolTable>(SHELL_LANGUAGE);
    std::string rel = relative_path_string(file, root);

    std::string script;
    if (!read_source_file(file, script)) {
        table->add_warning("Could not read " + rel);
        return table;
    }

    ShellMetadata meta;
    if (script.compare(0, 2, "#!") == 0) {
        meta.interpreter = trim(script.substr(2, script.find('\n') - 2));
    }

    fs::path rel_path(rel);
    std::string qname;
    for (const auto &part : rel_path.parent_path()) {
        qname += part.string() + ".";
    }
    qname += rel_path.stem().string();

    Symbol symbol;
    symbol.name = rel_path.filename().string();
    symbol.qualified_name = qname;
    symbol.language = SHELL_LANGUAGE;
    symbol.file_path = rel;
    symbol.line_number = 1;
    symbol.metadata = std::move(meta);
    symbol.raw_calls = extract_calls(script);
    symbol.is_entry_point = true;
    table->add_symbol(std::move(symbol));

    return table;
}

std::unique_ptr<SymbolTable>
ShellAnalyzer::merge_symbol_tables(std::vector<std::unique_ptr<SymbolTable>> tables) const {
    auto merged = std::make_unique<SymbolTable>(SHELL_LANGUAGE);
    for (auto &table : tables) {
        if (!table || table->language() != SHELL_LANGUAGE)
            continue;
        for (auto &[qname, symbol] : table->symbols()) {
            merged->add_symbol(std::move(symbol));
        }
        for (auto &warning : table->take_warnings()) {
            merged->add_warning(std::move(warning));
        }
    }
    return merged;
}

void ShellAnalyzer::resolve_calls(SymbolTable &table) const {
    (void)table;
}

void ShellAnalyzer::mark_entry_points(SymbolTable &table) const {
    for (auto &[qname, symbol] : table.symbols()) {
        symbol.is_entry_point = true;
    }
}

} // namespace flowdiff
