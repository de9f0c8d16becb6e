// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hdfetch/media/process.hpp>
#include <array>
#include <cerrno>
#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace hdfetch::media {

namespace {

// Closes both pipe ends that are still open
struct Pipe {
    int fds[2]{-1, -1};

    ~Pipe() {
        for (int& fd : fds) {
            if (fd >= 0) ::close(fd);
        }
    }
};

} // namespace

std::expected<ProcessResult, std::error_code>
run_process(const std::vector<std::string>& argv, bool capture) {
    if (argv.empty()) {
        return std::unexpected(std::make_error_code(std::errc::invalid_argument));
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) {
        args.push_back(const_cast<char*>(a.c_str()));
    }
    args.push_back(nullptr);

    Pipe out;
    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);

    if (capture) {
        // Close-on-exec, so children spawned concurrently by other threads
        // never hold our write end open
        if (::pipe2(out.fds, O_CLOEXEC) != 0) {
            posix_spawn_file_actions_destroy(&actions);
            return std::unexpected(std::error_code(errno, std::generic_category()));
        }
        posix_spawn_file_actions_adddup2(&actions, out.fds[1], STDOUT_FILENO);
    }

    pid_t pid = 0;
    int rc = ::posix_spawnp(&pid, args[0], &actions, nullptr, args.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    if (rc != 0) {
        return std::unexpected(std::error_code(rc, std::generic_category()));
    }

    ProcessResult result;
    if (capture) {
        ::close(out.fds[1]);
        out.fds[1] = -1;

        std::array<char, 4096> buffer;
        while (true) {
            ssize_t n = ::read(out.fds[0], buffer.data(), buffer.size());
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) break;
            result.output.append(buffer.data(), static_cast<std::size_t>(n));
        }
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return std::unexpected(std::error_code(errno, std::generic_category()));
        }
    }

    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
    return result;
}

} // namespace hdfetch::media
