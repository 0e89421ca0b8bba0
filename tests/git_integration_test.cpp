#include "flowdiff/diff.hpp"
#include "flowdiff/errors.hpp"
#include "flowdiff/process.hpp"
#include "flowdiff/vcs.hpp"
#include "test_support/temporary_project.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace flowdiff {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::StartsWith;

constexpr std::chrono::seconds GIT_TIMEOUT{30};

bool GitAvailable() {
    return run_command({"git", "--version"}, ".", GIT_TIMEOUT).ok();
}

class GitIntegrationTest : public ::testing::Test {
protected:

    void SetUp() override {
        if (!GitAvailable())
            GTEST_SKIP() << "git is not installed";

        Git({"init", "-q"});
        project_.AddFile("api.py",
                         "def main():\n    helper()\n\n"
                         "def helper():\n    pass\n");
        project_.AddFile("README.md", "docs\n");
        Commit("Initial version");

        project_.AddFile("api.py",
                         "def main():\n    helper()\n    audit()\n\n"
                         "def helper():\n    pass\n\n"
                         "def audit():\n    pass\n");
        project_.AddFile("README.md", "more docs\n");
        Commit("Add audit step to the main entry point of the service api module");
    }

    void Git(const std::vector<std::string> &args) {
        std::vector<std::string> argv = {"git", "-c", "user.name=Flowdiff Test", "-c",
                                         "user.email=test@example.com", "-c",
                                         "commit.gpgsign=false"};
        argv.insert(argv.end(), args.begin(), args.end());
        CommandResult result = run_command(argv, project_.root(), GIT_TIMEOUT);
        ASSERT_TRUE(result.ok()) << format_command(argv) << ": " << result.stderr_output;
    }

    void Commit(const std::string &message) {
        Git({"add", "-A"});
        Git({"commit", "-q", "-m", message});
    }

    test::TemporaryProject project_;
};

TEST_F(GitIntegrationTest, ResolvesReferences) {
    GitRepository repo(project_.root());
    EXPECT_NO_THROW(repo.verify());

    auto head = repo.resolve_ref("HEAD");
    ASSERT_TRUE(head.has_value());
    EXPECT_EQ(head->size(), 40u);
    EXPECT_FALSE(repo.resolve_ref("working").has_value());
    EXPECT_FALSE(repo.resolve_ref("WORKING").has_value());
    EXPECT_THROW(repo.resolve_ref("no-such-branch"), RefResolutionError);
    EXPECT_THROW(repo.resolve_ref("--output=x"), RefResolutionError);
}

TEST_F(GitIntegrationTest, DescribesCommits) {
    GitRepository repo(project_.root());
    auto head = repo.resolve_ref("HEAD");

    std::string description = repo.describe_ref("HEAD", head);
    EXPECT_THAT(description, StartsWith("HEAD ("));
    EXPECT_THAT(description, HasSubstr(head->substr(0, 7)));
    EXPECT_THAT(description, HasSubstr(" - Add audit step"));
    EXPECT_THAT(description, HasSubstr("..."));
    EXPECT_EQ(repo.describe_ref("working", std::nullopt),
              "Working directory (uncommitted changes)");
}

TEST_F(GitIntegrationTest, ListsChangedFilesBetweenCommits) {
    GitRepository repo(project_.root());
    auto before = repo.resolve_ref("HEAD~1");
    auto after = repo.resolve_ref("HEAD");

    auto changes = repo.changed_files(before, after);
    ASSERT_EQ(changes.size(), 2u);
    EXPECT_EQ(changes[0].path, "README.md");
    EXPECT_EQ(changes[1].path, "api.py");
    EXPECT_EQ(changes[1].type, FileChangeType::Modified);

    EXPECT_TRUE(repo.changed_files(std::nullopt, std::nullopt).empty());
}

TEST_F(GitIntegrationTest, MaterializesCommitTree) {
    GitRepository repo(project_.root());
    auto before = repo.resolve_ref("HEAD~1");

    ScopedTempDir workspace;
    fs::path checkout = workspace.path() / "checkout";
    repo.materialize(*before, checkout);

    EXPECT_TRUE(fs::exists(checkout / "api.py"));
    EXPECT_FALSE(fs::exists(checkout / ".flowdiff-snapshot.tar"));
    EXPECT_FALSE(fs::exists(checkout / ".git"));
}

TEST_F(GitIntegrationTest, DiffsTwoCommits) {
    AnalysisConfig config;
    config.num_threads = 1;
    DiffEngine engine(project_.root(), config);

    DiffResult result = engine.analyze_diff("HEAD~1", "HEAD");
    EXPECT_EQ(result.added, 1u);
    EXPECT_EQ(result.modified, 1u);
    EXPECT_EQ(result.deleted, 0u);
    EXPECT_EQ(result.symbol_changes.at("api.audit").kind, ChangeKind::Added);
    EXPECT_EQ(result.symbol_changes.at("api.main").kind, ChangeKind::Modified);

    ASSERT_EQ(result.file_changes.size(), 1u);
    EXPECT_EQ(result.file_changes[0].path, "api.py");
}

TEST_F(GitIntegrationTest, DiffsUncommittedChanges) {
    project_.AddFile("api.py", "def main():\n    helper()\n\n"
                               "def helper():\n    pass\n");

    DiffEngine engine(project_.root());
    DiffResult result = engine.analyze_diff("HEAD", "working");
    EXPECT_EQ(result.deleted, 1u);
    EXPECT_EQ(result.symbol_changes.at("api.audit").kind, ChangeKind::Deleted);
    ASSERT_EQ(result.file_changes.size(), 1u);
    EXPECT_EQ(result.file_changes[0].type, FileChangeType::Modified);

    DiffResult reverse = engine.analyze_diff("working", "HEAD");
    EXPECT_EQ(reverse.added, 1u);
    ASSERT_EQ(reverse.file_changes.size(), 1u);
    EXPECT_EQ(reverse.file_changes[0].path, "api.py");
}

TEST_F(GitIntegrationTest, WorkingAgainstWorkingIsEmpty) {
    DiffEngine engine(project_.root());
    DiffResult result = engine.analyze_diff("working", "working");
    EXPECT_TRUE(result.file_changes.empty());
    EXPECT_TRUE(result.symbol_changes.empty());
}

TEST(GitRepositoryTest, MissingRepositoryIsReported) {
    test::TemporaryProject project;
    GitRepository repo(project.root());
    EXPECT_THROW(repo.verify(), RepositoryError);
}

TEST(GitRepositoryTest, ParsesNameStatus) {
    auto changes = GitRepository::parse_name_status("M\tapi.py\n"
                                                    "A\tnew.sh\n"
                                                    "D\told.py\n"
                                                    "R087\tsrc/a.py\tsrc/b.py\n"
                                                    "\n"
                                                    "garbage\n");
    ASSERT_EQ(changes.size(), 4u);
    EXPECT_EQ(changes[0], (FileChange{"api.py", FileChangeType::Modified, ""}));
    EXPECT_EQ(changes[1], (FileChange{"new.sh", FileChangeType::Added, ""}));
    EXPECT_EQ(changes[2], (FileChange{"old.py", FileChangeType::Deleted, ""}));
    EXPECT_EQ(changes[3], (FileChange{"src/b.py", FileChangeType::Renamed, "src/a.py"}));
}

TEST(GitRepositoryTest, FormatsDescriptions) {
    const std::string sha = "0123456789abcdef0123456789abcdef01234567";
    EXPECT_EQ(GitRepository::format_description("HEAD", sha, "main", "Fix parser"),
              "HEAD (main, 0123456) - Fix parser");
    EXPECT_EQ(GitRepository::format_description("v1.0", sha, "", ""), "v1.0 (0123456)");

    std::string subject(61, 'x');
    EXPECT_EQ(GitRepository::format_description("HEAD", sha, "", subject),
              "HEAD (0123456) - " + std::string(57, 'x') + "...");
    EXPECT_EQ(GitRepository::format_description("HEAD", sha, "", std::string(60, 'y')),
              "HEAD (0123456) - " + std::string(60, 'y'));

    // Byte 57 falls inside a two-byte character, so the cut moves back one byte
    std::string accented = std::string(56, 'a') + "\xC3\xA9\xC3\xA9 caf\xC3\xA9";
    EXPECT_EQ(GitRepository::format_description("HEAD", sha, "", accented),
              "HEAD (0123456) - " + std::string(56, 'a') + "...");
}

TEST(GitRepositoryTest, BrokenRepositoryIsCommandError) {
    if (!GitAvailable())
        GTEST_SKIP() << "git is not installed";

    test::TemporaryProject project;
    project.AddFile(".git", "gitdir: does-not-exist\n");
    GitRepository repo(project.root());
    try {
        repo.resolve_ref("HEAD");
        FAIL() << "expected CommandError";
    } catch (const RefResolutionError &) {
        FAIL() << "git failure reported as an unknown reference";
    } catch (const CommandError &e) {
        EXPECT_NE(e.exit_code(), 1);
        EXPECT_THAT(e.command(), HasSubstr("rev-parse"));
        EXPECT_FALSE(e.stderr_output().empty());
    }
}

TEST(ProcessTest, CapturesOutputAndExitCode) {
    CommandResult result = run_command({"sh", "-c", "echo out; echo err >&2; exit 3"}, ".",
                                       std::chrono::seconds(10));
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.stdout_output, "out\n");
    EXPECT_EQ(result.stderr_output, "err\n");
}

TEST(ProcessTest, KillsCommandAfterTimeout) {
    CommandResult result = run_command({"sleep", "10"}, ".", std::chrono::milliseconds(200));
    EXPECT_TRUE(result.timed_out());
    EXPECT_EQ(result.exit_code, TIMEOUT_EXIT_CODE);
}

TEST(ProcessTest, MissingProgramFails) {
    CommandResult result =
        run_command({"flowdiff-no-such-program"}, ".", std::chrono::seconds(10));
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.exit_code, 127);
}

TEST(ProcessTest, FormatsCommandLines) {
    EXPECT_EQ(format_command({"git", "log", "-1", "--format=%s"}), "git log -1 --format=%s");
    EXPECT_EQ(format_command({"git", "commit", "-m", "it's done"}),
              "git commit -m 'it'\\''s done'");
}

} // namespace
} // namespace flowdiff
