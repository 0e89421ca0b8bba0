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

#include "config.hpp"
#include "process.hpp"
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace flowdiff {

namespace fs = std::filesystem;

// Reference token meaning "the uncommitted working tree"
constexpr const char *WORKING_TREE_REF = "working";

// Check for the working tree token (case-insensitive)
bool is_working_tree_ref(const std::string &ref);

enum class FileChangeType { Added, Modified, Deleted, Renamed };

// Convert change type to its status letter ("A", "M", "D", "R")
const char *file_change_type_to_string(FileChangeType type);

// One changed path between two states
struct FileChange {
    std::string path;
    FileChangeType type = FileChangeType::Modified;
    std::string old_path; // Renames only

    bool operator==(const FileChange &other) const {
        return path == other.path && type == other.type && old_path == other.old_path;
    }
};

// Version control operations needed by the diff engine
class VersionControl {
public:

    virtual ~VersionControl() = default;

    // Throws RepositoryError if the project is not under version control
    virtual void verify() const = 0;

    // Resolve a reference to a commit id; nullopt for the working tree.
    // Throws RefResolutionError for unknown references.
    virtual std::optional<std::string> resolve_ref(const std::string &ref) const = 0;

    // Human-readable description of a resolved reference
    virtual std::string describe_ref(const std::string &ref,
                                     const std::optional<std::string> &commit) const = 0;

    // Paths changed going from before to after (nullopt = working tree)
    virtual std::vector<FileChange> changed_files(const std::optional<std::string> &before,
                                                  const std::optional<std::string> &after) const = 0;

    // Write the full tree of a commit into destination
    virtual void materialize(const std::string &commit, const fs::path &destination) const = 0;
};

// Git command line backed implementation
class GitRepository : public VersionControl {
public:

    explicit GitRepository(fs::path root, const AnalysisConfig &config = AnalysisConfig{});

    void verify() const override;

    std::optional<std::string> resolve_ref(const std::string &ref) const override;

    std::string describe_ref(const std::string &ref,
                             const std::optional<std::string> &commit) const override;

    std::vector<FileChange> changed_files(const std::optional<std::string> &before,
                                          const std::optional<std::string> &after) const override;

    void materialize(const std::string &commit, const fs::path &destination) const override;

    // Parse "git diff --name-status" output
    static std::vector<FileChange> parse_name_status(const std::string &output);

    // Compose "REF (BRANCH, SHORT) - SUBJECT" from its optional parts
    static std::string format_description(const std::string &ref, const std::string &commit,
                                          const std::string &branch, const std::string &subject);

private:

    fs::path root_;
    std::chrono::seconds archive_timeout_;
    std::chrono::seconds diff_timeout_;
    std::chrono::seconds command_timeout_;

    CommandResult git(const std::vector<std::string> &args, std::chrono::seconds timeout) const;

    // Run git and throw CommandError unless it succeeds
    std::string git_checked(const std::vector<std::string> &args, std::chrono::seconds timeout,
                            const std::string &ref) const;
};

} // namespace flowdiff
