#include "ui_loop.hpp"

#include <atomic>
#include <csignal>
#include <cerrno>
#include <iostream>
#include <memory>
#include <string>

#include <poll.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

#include "app.hpp"
#include "git_service.hpp"
#include "logger.hpp"
#include "nix_service.hpp"

namespace melt {

namespace {

std::atomic<bool> g_stop_requested{false};

void handle_signal(int) { g_stop_requested.store(true); }

void write_all(int fd, const std::string& data) {
    const char* p = data.data();
    std::size_t left = data.size();
    while (left > 0) {
        ssize_t n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN)
                continue;
            return;
        }
        p += n;
        left -= static_cast<std::size_t>(n);
    }
}

/** Raw, non-echoing input for the lifetime of the guard. */
struct TermGuard {
    int fd;
    termios orig{};
    bool active = false;

    explicit TermGuard(int fd_) : fd(fd_) {
        if (tcgetattr(fd, &orig) != 0)
            return;
        termios t = orig;
        t.c_iflag &= ~(BRKINT | ICRNL | INPCK | ISTRIP | IXON);
        t.c_lflag &= ~(ICANON | ECHO | ISIG | IEXTEN);
        t.c_cflag |= CS8;
        t.c_cc[VMIN] = 0;
        t.c_cc[VTIME] = 0;
        active = tcsetattr(fd, TCSANOW, &t) == 0;
    }
    ~TermGuard() {
        if (active)
            tcsetattr(fd, TCSANOW, &orig);
    }
    TermGuard(const TermGuard&) = delete;
    TermGuard& operator=(const TermGuard&) = delete;
};

struct AltScreenGuard {
    int fd;
    explicit AltScreenGuard(int fd_) : fd(fd_) { write_all(fd, "\033[?1049h\033[?25l\033[2J"); }
    ~AltScreenGuard() { write_all(fd, "\033[0m\033[?25h\033[?1049l"); }
    AltScreenGuard(const AltScreenGuard&) = delete;
    AltScreenGuard& operator=(const AltScreenGuard&) = delete;
};

void terminal_size(int fd, std::size_t& width, std::size_t& height) {
    winsize ws{};
    if (ioctl(fd, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0 && ws.ws_row > 0) {
        width = ws.ws_col;
        height = ws.ws_row;
    } else {
        width = 80;
        height = 24;
    }
}

} // namespace

std::vector<KeyEvent> decode_keys(const std::string& bytes) {
    std::vector<KeyEvent> keys;
    const std::size_t n = bytes.size();
    std::size_t i = 0;
    while (i < n) {
        auto b = static_cast<unsigned char>(bytes[i]);
        if (b == 0x1b) {
            if (i + 1 < n && (bytes[i + 1] == '[' || bytes[i + 1] == 'O')) {
                std::size_t j = i + 2;
                while (j < n && !(bytes[j] >= 0x40 && bytes[j] <= 0x7E))
                    ++j;
                if (j >= n) {
                    keys.push_back(KeyEvent::key(KeyCode::Esc));
                    break;
                }
                switch (bytes[j]) {
                case 'A':
                    keys.push_back(KeyEvent::key(KeyCode::Up));
                    break;
                case 'B':
                    keys.push_back(KeyEvent::key(KeyCode::Down));
                    break;
                case 'C':
                    keys.push_back(KeyEvent::key(KeyCode::Right));
                    break;
                case 'D':
                    keys.push_back(KeyEvent::key(KeyCode::Left));
                    break;
                default:
                    break;
                }
                i = j + 1;
                continue;
            }
            keys.push_back(KeyEvent::key(KeyCode::Esc));
            ++i;
            continue;
        }
        if (b == '\r' || b == '\n')
            keys.push_back(KeyEvent::key(KeyCode::Enter));
        else if (b == '\t')
            keys.push_back(KeyEvent::key(KeyCode::Tab));
        else if (b == 0x7f || b == 0x08)
            keys.push_back(KeyEvent::key(KeyCode::Backspace));
        else if (b >= 1 && b <= 26)
            keys.push_back(KeyEvent::ctrl_chr(static_cast<char>('a' + b - 1)));
        else if (b >= 0x20 && b < 0x7f)
            keys.push_back(KeyEvent::chr(static_cast<char>(b)));
        ++i;
    }
    return keys;
}

std::optional<KeyEvent> KeyReader::poll(std::chrono::milliseconds timeout) {
    if (pending_.empty()) {
        pollfd pfd{fd_, POLLIN, 0};
        int rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        if (rc > 0 && (pfd.revents & POLLIN)) {
            char buf[256];
            ssize_t got = ::read(fd_, buf, sizeof(buf));
            if (got > 0) {
                for (const auto& k : decode_keys(std::string(buf, static_cast<std::size_t>(got))))
                    pending_.push_back(k);
            }
        }
    }
    if (pending_.empty())
        return std::nullopt;
    KeyEvent k = pending_.front();
    pending_.pop_front();
    return k;
}

void run_tui(App& app, const TuiColors& colors, int in_fd, int out_fd) {
    KeyReader keys(in_fd);
    const auto frame = std::chrono::milliseconds(16);
    app.start();
    while (!app.quitting()) {
        std::size_t width = 0;
        std::size_t height = 0;
        terminal_size(out_fd, width, height);
        write_all(out_fd, compose_frame(render_app(app, width, height, colors)));

        if (auto key = keys.poll(frame))
            app.handle_key(*key);
        if (g_stop_requested.load()) {
            log_info("Termination signal received");
            app.execute(Action::of(Action::Kind::CancelAndQuit));
        }
        app.drain_results();
        app.tick();
    }
}

int run_event_loop(const Options& opts) {
    if (!isatty(STDIN_FILENO) || !isatty(STDOUT_FILENO)) {
        std::cerr << "melt needs an interactive terminal\n";
        return 1;
    }
    std::signal(SIGTERM, handle_signal);
    std::signal(SIGHUP, handle_signal);

    CancellationToken cancel;
    GitServiceConfig git_cfg;
    git_cfg.concurrency = opts.concurrency;
    git_cfg.http_timeout = opts.http_timeout;
    git_cfg.timeouts.update_check = opts.update_timeout;
    git_cfg.timeouts.changelog = opts.changelog_timeout;
    git_cfg.github_token = opts.github_token;
    git_cfg.cache_dir = opts.cache_dir;

    auto nix = std::make_shared<NixService>(cancel, opts.nix_timeout);
    auto git = std::make_shared<GitService>(cancel, git_cfg);
    TuiColors colors = make_tui_colors(opts.no_colors, opts.theme);

    App app(opts.flake, nix, git, cancel);
    {
        TermGuard term(STDIN_FILENO);
        AltScreenGuard screen(STDOUT_FILENO);
        run_tui(app, colors, STDIN_FILENO, STDOUT_FILENO);
    }
    log_info("Exiting");
    return 0;
}

} // namespace melt
