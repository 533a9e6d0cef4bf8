#ifndef SYSTEM_UTILS_HPP
#define SYSTEM_UTILS_HPP
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "errors.hpp"
#include "thread_utils.hpp"

namespace procutil {

/** Captured result of a finished child process. */
struct ProcessResult {
    int exit_code = -1;
    std::string out;
    std::string err;

    bool success() const { return exit_code == 0; }
};

/**
 * @brief Run @p program with @p args and capture its output.
 *
 * The program is looked up on `PATH`. Standard input is connected to
 * `/dev/null`. The child is killed once @p timeout elapses or @p cancel is
 * set.
 *
 * @param error Receives ErrorKind::Timeout, ErrorKind::Cancelled or
 *              ErrorKind::Process when the child could not be started.
 * @return Exit code and output, or `std::nullopt` when the child did not run
 *         to completion.
 */
std::optional<ProcessResult> run_process(const std::string& program,
                                         const std::vector<std::string>& args,
                                         std::chrono::milliseconds timeout,
                                         const melt::CancellationToken& cancel,
                                         melt::Error* error = nullptr);

/**
 * @brief Check whether an executable named @p program is found on `PATH`.
 */
bool find_in_path(const std::string& program);

} // namespace procutil

#endif // SYSTEM_UTILS_HPP
