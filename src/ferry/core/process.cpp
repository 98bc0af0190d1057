// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/process.hpp>
#include <ferry/core/log.hpp>
#include <array>
#include <cerrno>
#include <cstring>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace ferry::core {

namespace {

// RAII pipe pair
struct Pipe {
    int fds[2]{-1, -1};

    Pipe() = default;
    ~Pipe() { close_read(); close_write(); }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    [[nodiscard]] bool open() noexcept { return ::pipe(fds) == 0; }

    void close_read() noexcept {
        if (fds[0] >= 0) { ::close(fds[0]); fds[0] = -1; }
    }
    void close_write() noexcept {
        if (fds[1] >= 0) { ::close(fds[1]); fds[1] = -1; }
    }
};

} // namespace

std::expected<ProcessResult, Failure> run_process(const std::vector<std::string>& args) {
    if (args.empty()) {
        return std::unexpected(Failure{TaskErrc::process_failed, "no command specified"});
    }

    Pipe out;
    if (!out.open()) {
        return std::unexpected(Failure{TaskErrc::resource_error, std::strerror(errno)});
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, out.fds[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, out.fds[1], STDERR_FILENO);
    posix_spawn_file_actions_addclose(&actions, out.fds[0]);

    // posix_spawnp wants mutable char*; the strings outlive the call
    std::vector<std::string> storage(args);
    std::vector<char*> argv;
    argv.reserve(storage.size() + 1);
    for (auto& arg : storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    pid_t pid = -1;
    const int spawn_status = posix_spawnp(&pid, argv[0], &actions, nullptr, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    out.close_write();

    if (spawn_status != 0) {
        if (spawn_status == ENOENT) {
            return std::unexpected(Failure{TaskErrc::tool_missing, args[0]});
        }
        return std::unexpected(Failure{TaskErrc::process_failed,
                                       args[0] + ": " + std::strerror(spawn_status)});
    }

    logger("process")->debug("spawned {} (pid {})", args[0], pid);

    ProcessResult result;
    std::array<char, 4096> buffer{};
    ssize_t n = 0;
    while ((n = ::read(out.fds[0], buffer.data(), buffer.size())) > 0 ||
           (n < 0 && errno == EINTR)) {
        if (n > 0) {
            result.output.append(buffer.data(), static_cast<std::size_t>(n));
        }
    }
    out.close_read();

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return std::unexpected(Failure{TaskErrc::process_failed, std::strerror(errno)});
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else {
        result.exit_code = -1;
    }

    // posix_spawnp reports a missing binary as exit 127 on some libcs
    if (result.exit_code == 127 && result.output.empty()) {
        return std::unexpected(Failure{TaskErrc::tool_missing, args[0]});
    }

    return result;
}

std::string tail_output(std::string_view output, std::size_t max_chars) {
    auto first = output.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    auto last = output.find_last_not_of(" \t\r\n");
    output = output.substr(first, last - first + 1);
    if (output.size() > max_chars) {
        output = output.substr(output.size() - max_chars);
    }
    return std::string(output);
}

} // namespace ferry::core
