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


#include "flowdiff/vcs.hpp"
#include "flowdiff/errors.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace flowdiff {

namespace {

// Commit subjects longer than this are shortened in descriptions
constexpr size_t MAX_SUBJECT_LENGTH = 60;

std::string trim(const std::string &text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos)
        return "";
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string &text, char sep) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream stream(text);
    while (std::getline(stream, part, sep)) {
        parts.push_back(part);
    }
    return parts;
}

} // namespace

bool is_working_tree_ref(const std::string &ref) {
    std::string lower = trim(ref);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == WORKING_TREE_REF;
}

const char *file_change_type_to_string(FileChangeType type) {
    switch (type) {
    case FileChangeType::Added:
        return "A";
    case FileChangeType::Modified:
        return "M";
    case FileChangeType::Deleted:
        return "D";
    case FileChangeType::Renamed:
        return "R";
    default:
        return "?";
    }
}

GitRepository::GitRepository(fs::path root, const AnalysisConfig &config)
    : root_(std::move(root)), archive_timeout_(config.archive_timeout),
      diff_timeout_(config.diff_timeout), command_timeout_(config.command_timeout) {}

CommandResult GitRepository::git(const std::vector<std::string> &args,
                                 std::chrono::seconds timeout) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back("git");
    argv.insert(argv.end(), args.begin(), args.end());
    return run_command(argv, root_, timeout);
}

std::string GitRepository::git_checked(const std::vector<std::string> &args,
                                       std::chrono::seconds timeout,
                                       const std::string &ref) const {
    CommandResult result = git(args, timeout);
    if (result.ok())
        return result.stdout_output;

    std::vector<std::string> argv = {"git"};
    argv.insert(argv.end(), args.begin(), args.end());
    std::string command = format_command(argv);

    std::string message = result.timed_out()
                              ? "Git command timed out after " +
                                    std::to_string(timeout.count()) + "s: " + command
                              : "Git command failed (exit " + std::to_string(result.exit_code) +
                                    "): " + command;
    if (!ref.empty())
        message += " [ref: " + ref + "]";
    std::string stderr_text = trim(result.stderr_output);
    if (!stderr_text.empty())
        message += ": " + stderr_text;

    throw CommandError(message, command, ref, result.exit_code, result.stderr_output,
                       result.timed_out());
}

void GitRepository::verify() const {
    std::error_code ec;
    if (!fs::exists(root_ / ".git", ec)) {
        throw RepositoryError("Not a git repository: " + root_.string(), root_.string());
    }
}

std::optional<std::string> GitRepository::resolve_ref(const std::string &ref) const {
    if (is_working_tree_ref(ref))
        return std::nullopt;

    if (trim(ref).empty() || ref[0] == '-')
        throw RefResolutionError("Invalid git reference: '" + ref + "'", ref);

    CommandResult result = git({"rev-parse", "--verify", "--quiet", ref + "^{commit}"},
                               command_timeout_);
    if (result.timed_out()) {
        throw CommandError("Timed out resolving git reference '" + ref + "'",
                           "git rev-parse --verify --quiet " + ref + "^{commit}", ref,
                           result.exit_code, result.stderr_output, true);
    }

    // --quiet exits 1 for an unknown ref; anything else is a git failure
    std::string commit = trim(result.stdout_output);
    if (!result.ok() && result.exit_code != 1) {
        throw CommandError("Failed to resolve git reference '" + ref + "': " +
                               trim(result.stderr_output),
                           "git rev-parse --verify --quiet " + ref + "^{commit}", ref,
                           result.exit_code, result.stderr_output, false);
    }
    if (!result.ok() || commit.empty()) {
        throw RefResolutionError("Invalid git reference: '" + ref + "'", ref);
    }
    return commit;
}

std::string GitRepository::format_description(const std::string &ref, const std::string &commit,
                                              const std::string &branch,
                                              const std::string &subject) {
    std::string short_sha = commit.substr(0, 7);
    std::string message = subject;
    if (message.size() > MAX_SUBJECT_LENGTH) {
        // Never cut inside a multibyte UTF-8 sequence
        size_t cut = MAX_SUBJECT_LENGTH - 3;
        while (cut > 0 && (static_cast<unsigned char>(message[cut]) & 0xC0) == 0x80)
            --cut;
        message = message.substr(0, cut) + "...";
    }

    std::string description = ref + " (";
    if (!branch.empty())
        description += branch + ", ";
    description += short_sha + ")";
    if (!message.empty())
        description += " - " + message;
    return description;
}

std::string GitRepository::describe_ref(const std::string &ref,
                                        const std::optional<std::string> &commit) const {
    if (!commit)
        return "Working directory (uncommitted changes)";

    // Descriptions are cosmetic: failures leave the part empty
    std::string branch;
    CommandResult name = git({"name-rev", "--name-only", *commit}, command_timeout_);
    if (name.ok()) {
        branch = trim(name.stdout_output);
        if (branch == "undefined")
            branch.clear();
    }

    std::string subject;
    CommandResult log = git({"log", "-1", "--format=%s", *commit}, command_timeout_);
    if (log.ok())
        subject = trim(log.stdout_output);

    return format_description(ref, *commit, branch, subject);
}

std::vector<FileChange> GitRepository::parse_name_status(const std::string &output) {
    std::vector<FileChange> changes;
    for (const auto &raw_line : split(output, '\n')) {
        std::string line = trim(raw_line);
        if (line.empty())
            continue;

        auto parts = split(line, '\t');
        if (parts.size() < 2 || parts[0].empty())
            continue;

        FileChange change;
        switch (parts[0][0]) {
        case 'A':
            change.type = FileChangeType::Added;
            change.path = parts[1];
            break;
        case 'M':
        case 'T':
            change.type = FileChangeType::Modified;
            change.path = parts[1];
            break;
        case 'D':
            change.type = FileChangeType::Deleted;
            change.path = parts[1];
            break;
        case 'R':
            if (parts.size() < 3)
                continue;
            change.type = FileChangeType::Renamed;
            change.old_path = parts[1];
            change.path = parts[2];
            break;
        case 'C':
            if (parts.size() < 3)
                continue;
            change.type = FileChangeType::Added;
            change.path = parts[2];
            break;
        default:
            continue;
        }
        changes.push_back(std::move(change));
    }
    return changes;
}

std::vector<FileChange> GitRepository::changed_files(const std::optional<std::string> &before,
                                                     const std::optional<std::string> &after) const {
    if (!before && !after)
        return {};

    std::vector<std::string> args = {"diff", "--name-status", "-M"};
    std::string label;
    if (before && after) {
        label = *before + ".." + *after;
        args.push_back(label);
    } else if (before) {
        // Commit -> working tree
        label = *before;
        args.push_back(*before);
    } else {
        // Working tree -> commit
        label = *after;
        args.push_back("-R");
        args.push_back(*after);
    }
    args.push_back("--");

    return parse_name_status(git_checked(args, diff_timeout_, label));
}

void GitRepository::materialize(const std::string &commit, const fs::path &destination) const {
    std::error_code ec;
    fs::create_directories(destination, ec);
    if (ec) {
        throw FlowdiffError("Failed to create " + destination.string() + ": " + ec.message());
    }

    // Hidden archive name keeps it out of discovery
    fs::path archive = fs::absolute(destination, ec) / ".flowdiff-snapshot.tar";
    git_checked({"archive", "--format=tar", "-o", archive.string(), commit}, archive_timeout_,
                commit);

    CommandResult extract =
        run_command({"tar", "-xf", archive.string(), "-C", destination.string()}, root_,
                    archive_timeout_);
    fs::remove(archive, ec);
    if (!extract.ok()) {
        std::string command =
            format_command({"tar", "-xf", archive.string(), "-C", destination.string()});
        std::string what = extract.timed_out() ? "Extraction timed out for "
                                               : "Extraction failed for ";
        throw CommandError(what + commit + ": " + trim(extract.stderr_output), command, commit,
                           extract.exit_code, extract.stderr_output, extract.timed_out());
    }
}

} // namespace flowdiff
