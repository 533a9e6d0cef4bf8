#include "logger.hpp"
#include <zlib.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "time_utils.hpp"

namespace fs = std::filesystem;

namespace {

struct LogMessage {
    LogLevel level;
    std::string timestamp;
    std::string msg;
    LogFields fields;
};

std::ofstream g_log_ofs;
std::string g_log_path; // NOLINT(runtime/string)
std::atomic<LogLevel> g_min_level{LogLevel::INFO};
std::atomic<std::size_t> g_max_size{0};
std::atomic<std::size_t> g_max_files{1};
std::atomic<bool> g_json_log{false};
std::atomic<bool> g_compress_logs{false};

std::queue<std::unique_ptr<LogMessage>> g_log_queue;
std::size_t g_in_flight = 0;
std::mutex g_queue_mtx;
std::condition_variable g_queue_cv;
std::condition_variable g_idle_cv;
bool g_running = false;
std::thread g_log_thread;
std::mutex g_init_mtx;

void stop_log_thread() {
    {
        std::lock_guard<std::mutex> lk(g_queue_mtx);
        g_running = false;
    }
    g_queue_cv.notify_all();
    if (g_log_thread.joinable())
        g_log_thread.join();
}

bool gzip_file(const fs::path& src, const fs::path& dst) {
    std::ifstream in(src, std::ios::binary);
    gzFile out = gzopen(dst.string().c_str(), "wb");
    if (!in.is_open() || out == nullptr) {
        if (out)
            gzclose(out);
        return false;
    }
    char buf[8192];
    bool ok = true;
    while (in && ok) {
        in.read(buf, sizeof(buf));
        std::streamsize n = in.gcount();
        if (n > 0)
            ok = gzwrite(out, buf, static_cast<unsigned int>(n)) == static_cast<int>(n);
    }
    return gzclose(out) == Z_OK && ok;
}

fs::path rotated_name(std::size_t i, bool gz) {
    std::string name = g_log_path + "." + std::to_string(i);
    if (gz)
        name += ".gz";
    return name;
}

// Shift log.N to log.N+1, drop the oldest and move the active file to log.1.
void rotate() {
    g_log_ofs.close();
    std::size_t keep = g_max_files.load();
    bool gz = g_compress_logs.load();
    std::error_code ec;
    if (keep > 0) {
        fs::remove(rotated_name(keep, gz), ec);
        for (std::size_t i = keep - 1; i > 0; --i)
            fs::rename(rotated_name(i, gz), rotated_name(i + 1, gz), ec);
        fs::path first = rotated_name(1, false);
        fs::rename(g_log_path, first, ec);
        if (gz && gzip_file(first, rotated_name(1, true)))
            fs::remove(first, ec);
    }
    g_log_ofs.open(g_log_path, std::ios::trunc);
}

std::string format_line(const LogMessage& m) {
    if (g_json_log.load()) {
        nlohmann::json j;
        j["timestamp"] = m.timestamp;
        j["level"] = log_level_name(m.level);
        j["msg"] = m.msg;
        for (const auto& [k, v] : m.fields)
            j[k] = v;
        return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    std::string line = "[" + m.timestamp + "] [" + log_level_name(m.level) + "] " + m.msg;
    for (const auto& [k, v] : m.fields)
        line += " " + k + "=" + v;
    return line;
}

void write_entry(const LogMessage& m) {
    if (!g_log_ofs.is_open())
        return;
    g_log_ofs << format_line(m) << '\n';
    if (g_max_size.load() == 0)
        return;
    g_log_ofs.flush();
    std::error_code ec;
    auto size = fs::file_size(g_log_path, ec);
    if (!ec && size > g_max_size.load())
        rotate();
}

void log_worker() {
    std::vector<std::unique_ptr<LogMessage>> batch;
    while (true) {
        std::unique_lock<std::mutex> lk(g_queue_mtx);
        g_queue_cv.wait(lk, [] { return !g_log_queue.empty() || !g_running; });
        if (g_log_queue.empty() && !g_running)
            break;
        while (!g_log_queue.empty() && batch.size() < 32) {
            batch.push_back(std::move(g_log_queue.front()));
            g_log_queue.pop();
        }
        g_in_flight = batch.size();
        lk.unlock();
        for (const auto& m : batch)
            write_entry(*m);
        batch.clear();
        g_log_ofs.flush();
        lk.lock();
        g_in_flight = 0;
        lk.unlock();
        g_idle_cv.notify_all();
    }
    g_log_ofs.flush();
    g_idle_cv.notify_all();
}

void enqueue(LogLevel level, const std::string& msg, const LogFields& fields) {
    if (level < g_min_level.load())
        return;
    auto entry = std::make_unique<LogMessage>(LogMessage{level, timestamp(), msg, fields});
    {
        std::lock_guard<std::mutex> lk(g_queue_mtx);
        if (!g_running)
            return;
        g_log_queue.push(std::move(entry));
    }
    g_queue_cv.notify_one();
}

} // namespace

bool init_logger(const std::string& path, LogLevel level, std::size_t max_size,
                 std::size_t max_files) {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    stop_log_thread();
    std::string prev_path = g_log_path;
    if (g_log_ofs.is_open())
        g_log_ofs.close();
    g_log_ofs.clear();

    std::error_code ec;
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty())
        fs::create_directories(parent, ec);

    std::string target = path;
    g_log_ofs.open(target, std::ios::app);
    if (!g_log_ofs.is_open() && !prev_path.empty()) {
        target = prev_path;
        g_log_ofs.clear();
        g_log_ofs.open(target, std::ios::app);
    }
    g_log_path = target;
    g_max_size.store(max_size);
    g_max_files.store(max_files);
    g_min_level.store(level);
    {
        std::lock_guard<std::mutex> qlk(g_queue_mtx);
        g_running = true;
    }
    g_log_thread = std::thread(log_worker);
    return g_log_ofs.is_open();
}

void set_log_level(LogLevel level) { g_min_level.store(level); }

LogLevel log_level() { return g_min_level.load(); }

void set_json_logging(bool enable) { g_json_log.store(enable); }

void set_log_compression(bool enable) { g_compress_logs.store(enable); }

bool logger_initialized() {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    return g_log_ofs.is_open();
}

void flush_logger() {
    std::unique_lock<std::mutex> lk(g_queue_mtx);
    g_idle_cv.wait(lk, [] { return (g_log_queue.empty() && g_in_flight == 0) || !g_running; });
}

void shutdown_logger() {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    stop_log_thread();
    if (g_log_ofs.is_open()) {
        g_log_ofs.flush();
        g_log_ofs.close();
    }
    std::lock_guard<std::mutex> qlk(g_queue_mtx);
    while (!g_log_queue.empty())
        g_log_queue.pop();
}

std::optional<LogLevel> parse_log_level(const std::string& name) {
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "debug" || s == "trace")
        return LogLevel::DEBUG;
    if (s == "info")
        return LogLevel::INFO;
    if (s == "warning" || s == "warn")
        return LogLevel::WARNING;
    if (s == "error")
        return LogLevel::ERR;
    return std::nullopt;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARNING:
        return "WARNING";
    case LogLevel::ERR:
        return "ERROR";
    }
    return "INFO";
}

void log_debug(const std::string& msg) { enqueue(LogLevel::DEBUG, msg, {}); }
void log_debug(const std::string& msg, const LogFields& fields) {
    enqueue(LogLevel::DEBUG, msg, fields);
}
void log_info(const std::string& msg) { enqueue(LogLevel::INFO, msg, {}); }
void log_info(const std::string& msg, const LogFields& fields) {
    enqueue(LogLevel::INFO, msg, fields);
}
void log_warning(const std::string& msg) { enqueue(LogLevel::WARNING, msg, {}); }
void log_warning(const std::string& msg, const LogFields& fields) {
    enqueue(LogLevel::WARNING, msg, fields);
}
void log_error(const std::string& msg) { enqueue(LogLevel::ERR, msg, {}); }
void log_error(const std::string& msg, const LogFields& fields) {
    enqueue(LogLevel::ERR, msg, fields);
}
