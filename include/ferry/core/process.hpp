// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/error.hpp>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace ferry::core {

// Finished child process: exit status and merged stdout+stderr
struct ProcessResult {
    int exit_code{-1};
    std::string output;

    [[nodiscard]] bool ok() const noexcept { return exit_code == 0; }
};

// Run `args[0]` (looked up on PATH) with the remaining arguments and wait for it.
// Fails with tool_missing when the binary cannot be found and with
// process_failed when it cannot be spawned at all. A non-zero exit is
// returned as a ProcessResult, not as an error.
//
// The call blocks until the child exits; there is no way to interrupt it.
[[nodiscard]] std::expected<ProcessResult, Failure>
run_process(const std::vector<std::string>& args);

// Trim surrounding whitespace and keep at most the last `max_chars`
[[nodiscard]] std::string tail_output(std::string_view output, std::size_t max_chars = 1500);

} // namespace ferry::core
