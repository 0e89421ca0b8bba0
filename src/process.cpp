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


#include "flowdiff/process.hpp"
#include "flowdiff/errors.hpp"
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sstream>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace flowdiff {

namespace {

void drain(int fd, std::string &out) {
    char buffer[4096];
    ssize_t n;
    while ((n = read(fd, buffer, sizeof(buffer))) > 0) {
        out.append(buffer, static_cast<size_t>(n));
    }
}

} // namespace

std::string format_command(const std::vector<std::string> &argv) {
    std::ostringstream cmd;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0)
            cmd << " ";
        const std::string &arg = argv[i];
        if (arg.find_first_of(" \t\"'$`\\") != std::string::npos) {
            cmd << "'";
            for (char c : arg) {
                if (c == '\'')
                    cmd << "'\\''";
                else
                    cmd << c;
            }
            cmd << "'";
        } else {
            cmd << arg;
        }
    }
    return cmd.str();
}

CommandResult run_command(const std::vector<std::string> &argv, const fs::path &working_dir,
                          std::chrono::milliseconds timeout) {
    CommandResult result;
    if (argv.empty())
        return result;

    int stdout_pipe[2];
    int stderr_pipe[2];

    if (pipe(stdout_pipe) < 0) {
        result.stderr_output = std::strerror(errno);
        return result;
    }
    if (pipe(stderr_pipe) < 0) {
        result.stderr_output = std::strerror(errno);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        return result;
    }

    // Build argv before forking
    std::vector<char *> args;
    args.reserve(argv.size() + 1);
    for (const auto &arg : argv) {
        args.push_back(const_cast<char *>(arg.c_str()));
    }
    args.push_back(nullptr);

    const pid_t pid = fork();
    if (pid < 0) {
        result.stderr_output = std::strerror(errno);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        close(stderr_pipe[0]);
        close(stderr_pipe[1]);
        return result;
    }

    if (pid == 0) {
        // Child process
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);

        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);

        close(stdout_pipe[1]);
        close(stderr_pipe[1]);

        if (chdir(working_dir.c_str()) != 0) {
            _exit(127);
        }

        execvp(args[0], args.data());
        _exit(127);
    }

    // Parent process
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    // Set non-blocking
    fcntl(stdout_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(stderr_pipe[0], F_SETFL, O_NONBLOCK);

    const auto timeout_point = std::chrono::steady_clock::now() + timeout;
    int status = 0;
    bool finished = false;

    while (!finished) {
        if (std::chrono::steady_clock::now() > timeout_point) {
            kill(pid, SIGTERM);
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            kill(pid, SIGKILL);
            waitpid(pid, &status, 0);
            result.exit_code = TIMEOUT_EXIT_CODE;
            finished = true;
            continue;
        }

        // Read available output
        drain(stdout_pipe[0], result.stdout_output);
        drain(stderr_pipe[0], result.stderr_output);

        // Has process finished?
        pid_t wpid = waitpid(pid, &status, WNOHANG);
        if (wpid > 0) {
            drain(stdout_pipe[0], result.stdout_output);
            drain(stderr_pipe[0], result.stderr_output);

            if (WIFEXITED(status)) {
                result.exit_code = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                result.exit_code = 128 + WTERMSIG(status);
            }
            finished = true;
        } else if (wpid < 0 && errno != EINTR) {
            result.exit_code = -1;
            finished = true;
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    close(stdout_pipe[0]);
    close(stderr_pipe[0]);

    return result;
}

ScopedTempDir::ScopedTempDir(const std::string &prefix) {
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec)
        base = "/tmp";

    std::string pattern = (base / (prefix + "XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    if (mkdtemp(buffer.data()) == nullptr) {
        throw FlowdiffError("Failed to create temporary directory under " + base.string() + ": " +
                            std::strerror(errno));
    }
    path_ = fs::path(buffer.data());
}

ScopedTempDir::~ScopedTempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

} // namespace flowdiff
