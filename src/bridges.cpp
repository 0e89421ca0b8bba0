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


#include "flowdiff/bridges.hpp"
#include "flowdiff/shell_analyzer.hpp"

namespace flowdiff {

bool HttpToPythonBridge::can_bridge(const std::string &from_language,
                                    const std::string &to_language) const {
    return from_language == SHELL_LANGUAGE && to_language == PYTHON_LANGUAGE;
}

std::map<std::string, std::string>
HttpToPythonBridge::build_endpoint_index(const SymbolTable &python) {
    std::map<std::string, std::string> endpoints;
    for (const auto &[qname, symbol] : python.symbols()) {
        const PythonMetadata *meta = symbol.python();
        if (meta && meta->is_http_handler() && !meta->http_route.empty())
            endpoints[meta->http_method + " " + meta->http_route] = qname;
    }
    return endpoints;
}

CrossReferences HttpToPythonBridge::resolve(const SymbolTableMap &tables) const {
    CrossReferences refs;

    auto python_it = tables.find(PYTHON_LANGUAGE);
    auto shell_it = tables.find(SHELL_LANGUAGE);
    if (python_it == tables.end() || shell_it == tables.end() || !python_it->second ||
        !shell_it->second)
        return refs;

    auto endpoints = build_endpoint_index(*python_it->second);
    if (endpoints.empty())
        return refs;

    const std::string prefix = HTTP_CALL_PREFIX;
    for (const auto &[qname, symbol] : shell_it->second->symbols()) {
        for (const auto &call : symbol.raw_calls) {
            if (call.compare(0, prefix.size(), prefix) != 0)
                continue;

            // HTTP:METHOD:PATH
            size_t sep = call.find(':', prefix.size());
            if (sep == std::string::npos)
                continue;
            std::string method = call.substr(prefix.size(), sep - prefix.size());
            std::string path = call.substr(sep + 1);

            auto hit = endpoints.find(method + " " + path);
            if (hit != endpoints.end())
                refs[qname].push_back(hit->second);
        }
    }
    return refs;
}

} // namespace flowdiff
