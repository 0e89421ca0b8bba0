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


#include "flowdiff/diff.hpp"
#include "flowdiff/orchestrator.hpp"
#include <iostream>
#include <set>

namespace flowdiff {

const char *change_kind_to_string(ChangeKind kind) {
    switch (kind) {
    case ChangeKind::Added:
        return "added";
    case ChangeKind::Modified:
        return "modified";
    case ChangeKind::Deleted:
        return "deleted";
    default:
        return "unknown";
    }
}

bool symbol_differs(const Symbol &before, const Symbol &after) {
    if (before.metadata != after.metadata)
        return true;

    std::set<std::string> before_calls(before.resolved_calls.begin(), before.resolved_calls.end());
    std::set<std::string> after_calls(after.resolved_calls.begin(), after.resolved_calls.end());
    if (before_calls != after_calls)
        return true;

    return before.documentation != after.documentation;
}

std::map<std::string, SymbolChange> diff_symbols(const SymbolUniverse &before,
                                                 const SymbolUniverse &after) {
    std::map<std::string, SymbolChange> changes;

    for (const auto &[qname, symbol] : before) {
        auto it = after.find(qname);
        if (it == after.end()) {
            changes[qname] = SymbolChange{qname, ChangeKind::Deleted, symbol, nullptr};
        } else if (symbol_differs(*symbol, *it->second)) {
            changes[qname] = SymbolChange{qname, ChangeKind::Modified, symbol, it->second};
        }
    }

    for (const auto &[qname, symbol] : after) {
        if (before.count(qname) == 0)
            changes[qname] = SymbolChange{qname, ChangeKind::Added, nullptr, symbol};
    }

    return changes;
}

void stamp_changes(const std::map<std::string, SymbolChange> &changes, SymbolUniverse &before,
                   SymbolUniverse &after) {
    for (const auto &[qname, change] : changes) {
        if (change.kind == ChangeKind::Modified || change.kind == ChangeKind::Deleted) {
            auto it = before.find(qname);
            if (it != before.end())
                it->second->has_changes = true;
        }
        if (change.kind == ChangeKind::Modified || change.kind == ChangeKind::Added) {
            auto it = after.find(qname);
            if (it != after.end())
                it->second->has_changes = true;
        }
    }
}

DiffEngine::DiffEngine(fs::path project_root, const AnalysisConfig &config,
                       std::shared_ptr<VersionControl> vcs)
    : root_(std::move(project_root)), config_(config), vcs_(std::move(vcs)) {
    if (!vcs_)
        vcs_ = std::make_shared<GitRepository>(root_, config_);
}

SymbolUniverse DiffEngine::analyze_state(const std::optional<std::string> &commit) {
    if (!commit) {
        Orchestrator orchestrator(root_, config_);
        return flatten_symbols(orchestrator.analyze());
    }

    ScopedTempDir workspace("flowdiff-");
    fs::path checkout = workspace.path() / "checkout";
    vcs_->materialize(*commit, checkout);

    if (config_.verbose)
        std::cout << "Analyzing " << commit->substr(0, 7) << " in " << checkout.string()
                  << std::endl;

    Orchestrator orchestrator(checkout, config_);
    return flatten_symbols(orchestrator.analyze());
}

DiffResult DiffEngine::analyze_diff(const std::string &before_ref, const std::string &after_ref) {
    vcs_->verify();

    DiffResult result;
    result.before_ref = before_ref;
    result.after_ref = after_ref;

    // Ref resolution
    auto before_commit = vcs_->resolve_ref(before_ref);
    auto after_commit = vcs_->resolve_ref(after_ref);
    result.before_description = vcs_->describe_ref(before_ref, before_commit);
    result.after_description = vcs_->describe_ref(after_ref, after_commit);

    // File-change detection, restricted to files discovery would analyze
    Orchestrator orchestrator(root_, config_);
    auto tracked = [&orchestrator](const std::string &path) {
        return !path.empty() && orchestrator.is_analyzable(path) &&
               !orchestrator.should_ignore(path);
    };
    for (auto &change : vcs_->changed_files(before_commit, after_commit)) {
        if (tracked(change.path) || tracked(change.old_path))
            result.file_changes.push_back(std::move(change));
    }

    // Isolated extraction and analysis of each side
    SymbolUniverse before = analyze_state(before_commit);
    SymbolUniverse after = analyze_state(after_commit);

    // Symbol diff
    result.symbol_changes = diff_symbols(before, after);
    for (const auto &[qname, change] : result.symbol_changes) {
        switch (change.kind) {
        case ChangeKind::Added:
            result.added++;
            break;
        case ChangeKind::Modified:
            result.modified++;
            break;
        case ChangeKind::Deleted:
            result.deleted++;
            break;
        }
    }

    // Pre-stamping, then one forest per side
    stamp_changes(result.symbol_changes, before, after);
    result.before_trees =
        build_call_trees(get_entry_points(before), before, config_.default_expansion_depth);
    result.after_trees =
        build_call_trees(get_entry_points(after), after, config_.default_expansion_depth);

    return result;
}

} // namespace flowdiff
