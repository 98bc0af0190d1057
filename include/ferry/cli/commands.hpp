// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/task_coordinator.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ferry::cli {

// Command line arguments
struct CliArgs {
    std::string command;                // extract, audio, links, variants, remux, sweep, classify
    std::vector<std::string> operands;
    std::string config_path{"ferry.json"};
    std::string output_dir;
    std::optional<std::string> password;
    core::UserId user{1};
    bool send_all{false};
    bool clean{false};
    bool download{false};
    bool verbose{false};
    bool version{false};
    bool help{false};
    std::string error;                  // Set when parsing failed
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]);

// Run the selected command; returns the process exit code
[[nodiscard]] int run(const CliArgs& args);

// Show help message
void print_help(std::string_view program_name);

// Show version information
void print_version();

} // namespace ferry::cli
