/**
 * @file melt.cpp
 * @brief Entry point of the interactive flake input updater.
 */

#include <chrono>
#include <exception>
#include <iostream>
#include <string>

#include "git_utils.hpp"
#include "help_text.hpp"
#include "http_client.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "thread_utils.hpp"
#include "ui_loop.hpp"
#include "version.hpp"

namespace {

// Give git calls abandoned on quit a moment to return before teardown.
void drain_blocking_calls() {
    if (!melt::wait_for_blocking_calls(std::chrono::seconds(2)))
        log_warning("Exiting with git operations still running",
                    {{"count", std::to_string(melt::blocking_calls_in_flight())}});
}

} // namespace

#ifndef MELT_NO_MAIN
int main(int argc, char* argv[]) {
    git::GitInitGuard git_guard;
    melt::CurlGlobalGuard curl_guard;
    try {
        Options opts = parse_options(argc, argv);
        if (opts.show_help) {
            print_help(argv[0]);
            return 0;
        }
        if (opts.print_version) {
            std::cout << "melt " << MELT_VERSION << "\n";
            return 0;
        }

        std::string log_path =
            opts.logging.log_file.empty() ? default_log_path().string() : opts.logging.log_file;
        set_json_logging(opts.logging.json_log);
        set_log_compression(opts.logging.compress_logs);
        init_logger(log_path, opts.logging.log_level, opts.logging.max_log_size,
                    opts.logging.max_log_files);
        if (!opts.config_file.empty())
            log_info("Loaded config", {{"path", opts.config_file.string()}});

        int rc = melt::run_event_loop(opts);
        drain_blocking_calls();
        shutdown_logger();
        return rc;
    } catch (const std::exception& e) {
        log_error("Fatal error", {{"error", e.what()}});
        drain_blocking_calls();
        shutdown_logger();
        std::cerr << "melt: " << e.what() << "\n";
        return 1;
    }
}
#endif // MELT_NO_MAIN
