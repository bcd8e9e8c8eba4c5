// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/cli/commands.hpp>
#include <ferry/cli/worker_host.hpp>
#include <ferry/core/http_session.hpp>
#include <ferry/core/log.hpp>
#include <cstdlib>
#include <exception>
#include <iostream>

using namespace ferry::cli;

// Terminate handler to report exceptions escaping noexcept code
static void ferry_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called!" << std::endl;
    if (auto current = std::current_exception()) {
        try {
            std::rethrow_exception(current);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Unknown exception in noexcept context" << std::endl;
        }
    }
    std::abort();
}

namespace {

// libcurl global state for the lifetime of main
struct CurlGlobal {
    CurlGlobal() { ferry::core::HttpSession::global_init(); }
    ~CurlGlobal() { ferry::core::HttpSession::global_cleanup(); }
};

} // namespace

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
    for (const auto& error : args.errors) {
        std::cerr << "Error: " << error << std::endl;
    }
    if (!args.errors.empty()) {
        std::cout << "Use -h for help" << std::endl;
        return 1;
    }

    auto settings = resolve_settings(args);
    if (!settings) {
        std::cerr << "Error: cannot load settings: " << settings.error().message() << std::endl;
        return 1;
    }

    // Worker mode keeps stderr for the failure message
    if (args.worker && !args.verbose) {
        settings->log.level = "error";
    }
    if (auto ec = ferry::core::init_logging(settings->log)) {
        std::cerr << "Error: cannot initialize logging: " << ec.message() << std::endl;
        return 1;
    }

    CurlGlobal curl;

    if (args.worker) {
        return run_worker(std::cin, std::cout, std::cerr);
    }

    if (args.urls.empty()) {
        std::cerr << "Error: No URL specified" << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 1;
    }

    if (args.info_only) {
        for (const auto& url : args.urls) {
            auto result = info(url, *settings);
            if (!result) {
                return 1;
            }
        }
        return 0;
    }

    auto result = download(args, *settings);
    return result ? *result : 1;
}
