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

// Exit code reported when a command is killed after its timeout
constexpr int TIMEOUT_EXIT_CODE = -2;

// Outcome of one external command
struct CommandResult {
    int exit_code = -1; // -1: could not start, TIMEOUT_EXIT_CODE: timed out
    std::string stdout_output;
    std::string stderr_output;

    bool ok() const { return exit_code == 0; }
    bool timed_out() const { return exit_code == TIMEOUT_EXIT_CODE; }
};

// Run argv[0] with arguments in working_dir, capturing output. The process is
// terminated (SIGTERM, then SIGKILL) once timeout elapses.
CommandResult run_command(const std::vector<std::string> &argv, const fs::path &working_dir,
                          std::chrono::milliseconds timeout);

// Render argv as a shell-style command line for messages
std::string format_command(const std::vector<std::string> &argv);

// Private temporary directory removed on destruction
class ScopedTempDir {
public:

    // Creates <system temp>/<prefix>XXXXXX; throws FlowdiffError on failure
    explicit ScopedTempDir(const std::string &prefix = "flowdiff-");
    ~ScopedTempDir();

    // Non-copyable
    ScopedTempDir(const ScopedTempDir &) = delete;
    ScopedTempDir &operator=(const ScopedTempDir &) = delete;

    const fs::path &path() const { return path_; }

private:

    fs::path path_;
};

} // namespace flowdiff
