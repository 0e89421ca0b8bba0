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
#include <map>
#include <string>

namespace flowdiff {

// Shell HTTP requests -> Python route handlers
class HttpToPythonBridge : public LanguageBridge {
public:

    std::string get_bridge_name() const override { return "http-to-python"; }

    bool can_bridge(const std::string &from_language,
                    const std::string &to_language) const override;

    CrossReferences resolve(const SymbolTableMap &tables) const override;

    // Get "METHOD PATH" -> handler qualified name for a Python table
    static std::map<std::string, std::string> build_endpoint_index(const SymbolTable &python);
};

} // namespace flowdiff
