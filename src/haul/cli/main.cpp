// Copyright (c) 2026 changcheng967. All rights reserved.

#include <haul/cli/commands.hpp>
#include <haul/core/http_session.hpp>
#include <haul/core/log.hpp>
#include <cstdlib>
#include <exception>
#include <iostream>

using namespace haul::cli;

// Terminate handler to report exceptions escaping noexcept functions
static void haul_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();  // Prevent re-entrant abort
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called!" << std::endl;
    if (auto current = std::current_exception()) {
        try {
            std::rethrow_exception(current);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        }
    }
    haul::log::shutdown();
    std::cerr << "Aborting..." << std::endl;
    std::abort();
}

int main(int argc, char* argv[]) {
    std::set_terminate(haul_terminate_handler);

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
        std::cout << "Use -h for help" << std::endl;
        return 2;
    }

    if (args.command.empty()) {
        std::cerr << "Error: No command specified" << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 2;
    }

    haul::core::HttpSession::global_init();
    auto result = execute(args);
    haul::core::HttpSession::global_cleanup();
    haul::log::shutdown();

    if (!result) {
        return 1;
    }
    return *result;
}
