#include "system_utils.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>
#include "logger.hpp"

namespace procutil {

namespace {

struct Pipe {
    int fds[2] = {-1, -1};
    ~Pipe() { close_all(); }
    bool open() { return pipe2(fds, O_CLOEXEC) == 0; }
    void close_read() {
        if (fds[0] >= 0)
            close(fds[0]);
        fds[0] = -1;
    }
    void close_write() {
        if (fds[1] >= 0)
            close(fds[1]);
        fds[1] = -1;
    }
    void close_all() {
        close_read();
        close_write();
    }
};

void kill_and_reap(pid_t pid) {
    kill(pid, SIGKILL);
    int status = 0;
    waitpid(pid, &status, 0);
}

} // namespace

bool find_in_path(const std::string& program) {
    const char* path = std::getenv("PATH");
    if (!path)
        return false;
    std::string p(path);
    size_t start = 0;
    while (start <= p.size()) {
        size_t end = p.find(':', start);
        std::string dir = p.substr(start, end == std::string::npos ? std::string::npos : end - start);
        if (!dir.empty()) {
            std::filesystem::path candidate = std::filesystem::path(dir) / program;
            if (access(candidate.c_str(), X_OK) == 0)
                return true;
        }
        if (end == std::string::npos)
            break;
        start = end + 1;
    }
    return false;
}

std::optional<ProcessResult> run_process(const std::string& program,
                                         const std::vector<std::string>& args,
                                         std::chrono::milliseconds timeout,
                                         const melt::CancellationToken& cancel,
                                         melt::Error* error) {
    using melt::ErrorKind;
    if (cancel.is_cancelled()) {
        melt::set_error(error, ErrorKind::Cancelled, program);
        return std::nullopt;
    }
    Pipe out_pipe;
    Pipe err_pipe;
    if (!out_pipe.open() || !err_pipe.open()) {
        melt::set_error(error, ErrorKind::Process, std::strerror(errno));
        return std::nullopt;
    }

    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(program.c_str()));
    for (const auto& a : args)
        argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        melt::set_error(error, ErrorKind::Process, std::strerror(errno));
        return std::nullopt;
    }
    if (pid == 0) {
        int devnull = open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devnull >= 0)
            dup2(devnull, STDIN_FILENO);
        dup2(out_pipe.fds[1], STDOUT_FILENO);
        dup2(err_pipe.fds[1], STDERR_FILENO);
        close(out_pipe.fds[0]);
        close(err_pipe.fds[0]);
        execvp(program.c_str(), argv.data());
        _exit(127);
    }
    out_pipe.close_write();
    err_pipe.close_write();

    ProcessResult result;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    bool out_open = true;
    bool err_open = true;
    char buf[4096];
    while (out_open || err_open) {
        if (cancel.is_cancelled()) {
            kill_and_reap(pid);
            melt::set_error(error, ErrorKind::Cancelled, program);
            return std::nullopt;
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            kill_and_reap(pid);
            log_warning("Process timed out", {{"program", program}});
            melt::set_error(error, ErrorKind::Timeout, program + " did not finish in time");
            return std::nullopt;
        }
        pollfd fds[2] = {{out_open ? out_pipe.fds[0] : -1, POLLIN, 0},
                         {err_open ? err_pipe.fds[0] : -1, POLLIN, 0}};
        int rc = poll(fds, 2, 50);
        if (rc < 0) {
            if (errno == EINTR)
                continue;
            kill_and_reap(pid);
            melt::set_error(error, ErrorKind::Process, std::strerror(errno));
            return std::nullopt;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR)))
                continue;
            ssize_t n = read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                (i == 0 ? result.out : result.err).append(buf, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                (i == 0 ? out_open : err_open) = false;
            }
        }
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            melt::set_error(error, ErrorKind::Process, std::strerror(errno));
            return std::nullopt;
        }
    }
    if (WIFEXITED(status))
        result.exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status))
        result.exit_code = 128 + WTERMSIG(status);
    if (result.exit_code == 127 && result.out.empty() && result.err.empty()) {
        melt::set_error(error, ErrorKind::Process, "failed to run " + program);
        return std::nullopt;
    }
    return result;
}

} // namespace procutil
