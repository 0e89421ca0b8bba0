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

#include <stdexcept>
#include <string>

namespace flowdiff {

// Base class for all errors raised by flowdiff
class FlowdiffError : public std::runtime_error {
public:
    explicit FlowdiffError(const std::string &message) : std::runtime_error(message) {}
};

// Target directory is not under version control
class RepositoryError : public FlowdiffError {
public:
    RepositoryError(const std::string &message, std::string path)
        : FlowdiffError(message), path_(std::move(path)) {}

    const std::string &path() const { return path_; }

private:
    std::string path_;
};

// Reference string could not be resolved to a commit
class RefResolutionError : public FlowdiffError {
public:
    RefResolutionError(const std::string &message, std::string ref)
        : FlowdiffError(message), ref_(std::move(ref)) {}

    const std::string &ref() const { return ref_; }

private:
    std::string ref_;
};

// External command failed, could not start, or timed out
class CommandError : public FlowdiffError {
public:
    CommandError(const std::string &message, std::string command, std::string ref, int exit_code,
                 std::string stderr_output, bool timed_out)
        : FlowdiffError(message), command_(std::move(command)), ref_(std::move(ref)),
          exit_code_(exit_code), stderr_output_(std::move(stderr_output)), timed_out_(timed_out) {}

    const std::string &command() const { return command_; }
    const std::string &ref() const { return ref_; }
    int exit_code() const { return exit_code_; }
    const std::string &stderr_output() const { return stderr_output_; }
    bool timed_out() const { return timed_out_; }

private:
    std::string command_;
    std::string ref_;
    int exit_code_;
    std::string stderr_output_;
    bool timed_out_;
};

// Configuration file is malformed
class ConfigError : public FlowdiffError {
public:
    explicit ConfigError(const std::string &message) : FlowdiffError(message) {}
};

} // namespace flowdiff
