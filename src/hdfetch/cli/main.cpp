// Copyright (c) 2026 changcheng967. All rights reserved.

#include <hdfetch/cli/commands.hpp>
#include <hdfetch/core/log.hpp>
#include <csignal>
#include <exception>
#include <iostream>

using namespace hdfetch::cli;

// SIGINT: cancel the scheduler, progress loop picks it up
static void on_sigint(int) {
    request_interrupt();
}

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (!args) {
        std::cerr << "Error: " << args.error().message << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return EXIT_USAGE;
    }

    if (args->help) {
        print_help(argv[0]);
        return EXIT_ALL_DONE;
    }
    if (args->version) {
        print_version();
        return EXIT_ALL_DONE;
    }

    try {
        hdfetch::core::init_logging(args->verbose, args->quiet);
    } catch (const std::exception& e) {
        std::cerr << "Error: cannot set up logging: " << e.what() << std::endl;
        return EXIT_USAGE;
    }

    if (args->list_formats) {
        return list_formats(*args);
    }

    std::signal(SIGINT, on_sigint);
    return download(*args);
}
