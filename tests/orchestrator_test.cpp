#include "flowdiff/orchestrator.hpp"
#include "flowdiff/python_analyzer.hpp"
#include "test_support/temporary_project.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>

namespace flowdiff {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::UnorderedElementsAre;

std::vector<std::string> RelativePaths(const std::vector<fs::path> &files, const fs::path &root) {
    std::vector<std::string> paths;
    for (const auto &file : files) {
        paths.push_back(relative_path_string(file, root));
    }
    return paths;
}

std::vector<std::string> PythonEntryPoints(const SymbolTableMap &tables) {
    std::vector<std::string> names;
    for (const auto &[qname, symbol] : tables.at(PYTHON_LANGUAGE)->symbols()) {
        if (symbol.is_entry_point)
            names.push_back(qname);
    }
    return names;
}

class KeepNamedFilter : public EntryPointFilter {
public:
    explicit KeepNamedFilter(std::vector<std::string> keep) : keep_(std::move(keep)) {}

    std::vector<std::string> filter(const std::vector<EntryPointCandidate> &candidates) override {
        seen_ = candidates;
        return keep_;
    }

    std::vector<EntryPointCandidate> seen_;

private:
    std::vector<std::string> keep_;
};

class ThrowingFilter : public EntryPointFilter {
public:
    std::vector<std::string> filter(const std::vector<EntryPointCandidate> &) override {
        throw std::runtime_error("service unavailable");
    }
};

TEST(OrchestratorTest, DiscoversSortedFilesAndSkipsExcludedDirectories) {
    test::TemporaryProject project;
    project.AddFile("b.py", "def b():\n    pass\n");
    project.AddFile("a/mod.py", "def a():\n    pass\n");
    project.AddFile("run.sh", "echo\n");
    project.AddFile("README.md", "docs\n");
    project.AddFile("venv/lib/site.py", "def hidden():\n    pass\n");
    project.AddFile("node_modules/x.sh", "echo\n");
    project.AddFile(".cache/c.py", "def c():\n    pass\n");

    AnalysisConfig config;
    config.num_threads = 1;
    Orchestrator orchestrator(project.root(), config);

    EXPECT_THAT(RelativePaths(orchestrator.discover_files(), project.root()),
                ElementsAre("a/mod.py", "b.py", "run.sh"));
}

TEST(OrchestratorTest, ShouldIgnoreHiddenAndConfiguredDirectories) {
    AnalysisConfig config;
    config.exclude_dirs = {"generated"};
    Orchestrator orchestrator("/nonexistent", config);

    EXPECT_TRUE(orchestrator.should_ignore("generated/api.py"));
    EXPECT_TRUE(orchestrator.should_ignore(".tox/env/x.py"));
    EXPECT_FALSE(orchestrator.should_ignore("src/venv_tools.py"));
    EXPECT_FALSE(orchestrator.should_ignore("venv/x.py"));
}

TEST(OrchestratorTest, MissingRootYieldsNoTables) {
    Orchestrator orchestrator("/nonexistent/flowdiff/root");
    EXPECT_THAT(orchestrator.analyze(), IsEmpty());
}

TEST(OrchestratorTest, RegistersPythonAndShell) {
    Orchestrator orchestrator("/nonexistent");
    EXPECT_THAT(orchestrator.registry().supported_languages(),
                ElementsAre(PYTHON_LANGUAGE, SHELL_LANGUAGE));
    EXPECT_TRUE(orchestrator.is_analyzable("pkg/mod.py"));
    EXPECT_TRUE(orchestrator.is_analyzable("deploy.sh"));
    EXPECT_FALSE(orchestrator.is_analyzable("notes.txt"));
}

TEST(OrchestratorTest, MultiThreadedRunMatchesSingleThreaded) {
    test::TemporaryProject project;
    for (int i = 0; i < 12; ++i) {
        std::string name = "mod" + std::to_string(i);
        project.AddFile("pkg/" + name + ".py",
                        "from pkg.shared import util\n"
                        "def " + name + "_main():\n    util()\n");
    }
    project.AddFile("pkg/shared.py", "def util():\n    pass\n");

    AnalysisConfig single;
    single.num_threads = 1;
    AnalysisConfig multi;
    multi.num_threads = 4;

    auto first = Orchestrator(project.root(), single).analyze();
    auto second = Orchestrator(project.root(), multi).analyze();

    const auto &a = first.at(PYTHON_LANGUAGE)->symbols();
    const auto &b = second.at(PYTHON_LANGUAGE)->symbols();
    ASSERT_EQ(a.size(), 13u);
    ASSERT_EQ(a.size(), b.size());
    for (const auto &[qname, symbol] : a) {
        ASSERT_TRUE(b.count(qname)) << qname;
        EXPECT_EQ(symbol.resolved_calls, b.at(qname).resolved_calls) << qname;
    }
    EXPECT_THAT(a.at("pkg.mod3.mod3_main").resolved_calls, ElementsAre("pkg.shared.util"));
}

TEST(OrchestratorTest, SyntaxErrorDoesNotAbortAnalysis) {
    test::TemporaryProject project;
    project.AddFile("good.py", "def main():\n    pass\n");
    project.AddFile("bad.py", "def broken(:\n");

    AnalysisConfig config;
    config.num_threads = 1;
    Orchestrator orchestrator(project.root(), config);
    auto tables = orchestrator.analyze();

    EXPECT_TRUE(tables.at(PYTHON_LANGUAGE)->contains("good.main"));
    EXPECT_EQ(orchestrator.stats().files_analyzed.load(), 1u);
    EXPECT_EQ(orchestrator.stats().files_failed.load(), 1u);
}

TEST(OrchestratorTest, EntryPointFilterNarrowsCandidates) {
    test::TemporaryProject project;
    project.AddFile("app.py",
                    "def main():\n    run()\n"
                    "def run():\n    pass\n");

    auto filter = std::make_shared<KeepNamedFilter>(std::vector<std::string>{"app.main"});
    Orchestrator orchestrator(project.root());
    orchestrator.set_entry_point_filter(filter);
    auto tables = orchestrator.analyze();

    EXPECT_THAT(PythonEntryPoints(tables), ElementsAre("app.main"));

    ASSERT_EQ(filter->seen_.size(), 2u);
    const EntryPointCandidate &run = filter->seen_[1];
    EXPECT_EQ(run.qualified_name, "app.run");
    EXPECT_EQ(run.file_name, "app.py");
    EXPECT_EQ(run.caller_count, 1u);
    EXPECT_EQ(run.callee_count, 0u);
    EXPECT_FALSE(run.is_private);
}

TEST(OrchestratorTest, FailingEntryPointFilterKeepsAllCandidates) {
    test::TemporaryProject project;
    project.AddFile("app.py",
                    "def main():\n    pass\n"
                    "def run():\n    pass\n");

    Orchestrator orchestrator(project.root());
    orchestrator.set_entry_point_filter(std::make_shared<ThrowingFilter>());
    auto tables = orchestrator.analyze();

    EXPECT_THAT(PythonEntryPoints(tables), UnorderedElementsAre("app.main", "app.run"));
}

TEST(OrchestratorTest, ThrowingBridgeIsNotFatal) {
    class ExplodingBridge : public LanguageBridge {
    public:
        std::string get_bridge_name() const override { return "exploding"; }
        bool can_bridge(const std::string &, const std::string &) const override { return true; }
        CrossReferences resolve(const SymbolTableMap &) const override {
            throw std::runtime_error("bridge exploded");
        }
    };

    test::TemporaryProject project;
    project.AddFile("api.py", "@app.get('/ping')\ndef ping():\n    pass\n");
    project.AddFile("ping.sh", "curl http://localhost:8000/ping\n");

    Orchestrator orchestrator(project.root());
    orchestrator.resolver().register_bridge(std::make_unique<ExplodingBridge>());
    auto tables = orchestrator.analyze();

    EXPECT_THAT(tables.at(SHELL_LANGUAGE)->get_symbol("ping")->resolved_calls,
                ElementsAre("api.ping"));
}

} // namespace
} // namespace flowdiff
