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


#include <cxxopts.hpp>
#include <iostream>

#include "flowdiff/commands.hpp"
#include "flowdiff/config.hpp"
#include "flowdiff/vcs.hpp"
#include "flowdiff/version.hpp"

using namespace flowdiff;

void print_banner() {
    std::cout << R"(
   __ _                 _ _  __  __ 
  / _| | _____      __ | (_)/ _|/ _|
 | |_| |/ _ \ \ /\ / / | | | |_| |_ 
 |  _| | (_) \ V  V / _| | |  _|  _|
 |_| |_|\___/ \_/\_/ \__,_|_|_| |_|  
                                    
)" << "  Cross-Language Call Graph Diff v"
              << VERSION_STRING << "\n"
              << std::endl;
}

int main(int argc, char *argv[]) {
    cxxopts::Options options(
        "flowdiff", "Call graph and structural diff for Python and shell projects");

    auto opts = options.add_options();
    opts("h,help", "Print help");
    opts("v,version", "Print version");
    opts("analyze", "Analyze the project and print symbols and call trees as JSON");
    opts("entry-points", "List entry points of the project");
    opts("diff", "Structural diff between two references");
    opts("before", "Reference for the before side",
         cxxopts::value<std::string>()->default_value("HEAD"));
    opts("after", "Reference for the after side (\"working\" = uncommitted state)",
         cxxopts::value<std::string>()->default_value(WORKING_TREE_REF));
    opts("summary", "Print a text summary instead of JSON for --diff");
    opts("C,path", "Project root", cxxopts::value<std::string>()->default_value("."));
    opts("j,jobs", "Number of threads for analysis (0 = auto)",
         cxxopts::value<unsigned int>());
    opts("depth", "Call tree expansion depth", cxxopts::value<int>());
    opts("verbose", "Print progress information");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_banner();
            std::cout << options.help() << std::endl;
            std::cout << "Examples:" << std::endl;
            std::cout << "  flowdiff --analyze                     Analyze current directory"
                      << std::endl;
            std::cout << "  flowdiff --analyze -C repo -j 8        Analyze repo using 8 threads"
                      << std::endl;
            std::cout << "  flowdiff --entry-points                List entry points" << std::endl;
            std::cout << "  flowdiff --diff                        HEAD vs uncommitted changes"
                      << std::endl;
            std::cout << "  flowdiff --diff --before main --after HEAD --summary" << std::endl;
            return 0;
        }

        if (result.count("version")) {
            std::cout << "flowdiff v" << VERSION_STRING << std::endl;
            return 0;
        }

        std::string path = result["path"].as<std::string>();
        AnalysisConfig config = load_config(path);
        if (result.count("jobs"))
            config.num_threads = result["jobs"].as<unsigned int>();
        if (result.count("depth"))
            config.default_expansion_depth = clamp_expansion_depth(result["depth"].as<int>());
        if (result.count("verbose"))
            config.verbose = true;

        if (result.count("analyze")) {
            return cmd_analyze(path, config);
        }

        if (result.count("entry-points")) {
            return cmd_entry_points(path, config);
        }

        if (result.count("diff")) {
            return cmd_diff(path, result["before"].as<std::string>(),
                            result["after"].as<std::string>(), config, result.count("summary") > 0);
        }

        print_banner();
        std::cout << options.help() << std::endl;
        return 0;

    } catch (const cxxopts::exceptions::exception &e) {
        std::cerr << "Error parsing options: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
