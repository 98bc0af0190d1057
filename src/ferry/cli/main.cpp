// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/cli/commands.hpp>
#include <cstdlib>
#include <exception>
#include <iostream>

using namespace ferry::cli;

// Report exceptions escaping noexcept code before aborting
static void ferry_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called" << std::endl;
    if (auto current = std::current_exception()) {
        try {
            std::rethrow_exception(current);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Unknown exception" << std::endl;
        }
    }
    std::abort();
}

int main(int argc, char* argv[]) {
    std::set_terminate(ferry_terminate_handler);

    CliArgs args = parse_args(argc, argv);

    if (args.help) {
        print_help(argv[0]);
        return 0;
    }
    if (args.version) {
        print_version();
        return 0;
    }
    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << std::endl;
        return 1;
    }
    if (args.command.empty()) {
        std::cerr << "Error: No command specified" << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 1;
    }

    return run(args);
}
