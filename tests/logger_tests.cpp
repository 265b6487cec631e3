#include <zlib.h>
#include <cstdarg>
#include <cstdio>
#ifdef __linux__
#include <syslog.h>
#endif
#include <atomic>
#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include "test_common.hpp"

#ifdef __linux__
static std::vector<std::string> g_syslog_messages;
extern "C" void openlog(const char*, int, int) {}
extern "C" void syslog(int, const char* fmt, ...) {
    char buf[256];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);
    g_syslog_messages.emplace_back(buf);
}
extern "C" void closelog() {}
#endif

namespace {

struct LoggerGuard {
    ~LoggerGuard() {
        shutdown_logger();
        set_console_logging(false);
        set_json_logging(false);
        set_log_level(LogLevel::INFO);
    }
};

std::vector<std::string> read_lines(const fs::path& file) {
    std::ifstream ifs(file);
    REQUIRE(ifs.good());
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(ifs, line))
        lines.push_back(line);
    return lines;
}

/// Redirects std::cerr into a buffer while alive.
class CerrCapture {
  public:
    CerrCapture() : old_(std::cerr.rdbuf(buf_.rdbuf())) {}
    ~CerrCapture() { std::cerr.rdbuf(old_); }
    std::string str() const { return buf_.str(); }

  private:
    std::ostringstream buf_;
    std::streambuf* old_;
};

} // namespace

TEST_CASE("Logger rotates and limits files") {
    fs::path log = fs::temp_directory_path() / "fleetfix_logger_rotate.log";
    fs::path log1 = log;
    log1 += ".1";
    fs::path log2 = log;
    log2 += ".2";
    fs::path log3 = log;
    log3 += ".3";
    for (const auto& p : {log, log1, log2, log3})
        fs::remove(p);

    init_logger(log.string(), LogLevel::INFO, 100, 2);
    LoggerGuard guard;
    REQUIRE(logger_initialized());
    for (int i = 0; i < 200; ++i)
        log_info("entry " + std::to_string(i));
    flush_logger();
    shutdown_logger();
    REQUIRE(fs::exists(log));
    REQUIRE(fs::exists(log1));
    REQUIRE(fs::exists(log2));
    REQUIRE_FALSE(fs::exists(log3));

    for (const auto& p : {log, log1, log2})
        fs::remove(p);
}

TEST_CASE("Logger compresses rotated files") {
    fs::path log = fs::temp_directory_path() / "fleetfix_logger_compress.log";
    fs::path log1 = log;
    log1 += ".1.gz";
    fs::path log2 = log;
    log2 += ".2.gz";
    for (const auto& p : {log, log1, log2})
        fs::remove(p);

    set_log_compression(true);
    init_logger(log.string(), LogLevel::INFO, 100, 2);
    LoggerGuard guard;
    for (int i = 0; i < 200; ++i)
        log_info("entry " + std::to_string(i));
    shutdown_logger();

    REQUIRE(fs::exists(log));
    REQUIRE(fs::exists(log1));
    REQUIRE(fs::exists(log2));

    gzFile zf = gzopen(log1.c_str(), "rb");
    REQUIRE(zf != nullptr);
    char buf[32];
    int n = gzread(zf, buf, sizeof(buf));
    gzclose(zf);
    REQUIRE(n > 0);

    for (const auto& p : {log, log1, log2})
        fs::remove(p);
    set_log_compression(false);
}

TEST_CASE("Logger writes fields in JSON and plain form") {
    fs::path log = fs::temp_directory_path() / "fleetfix_logger_format.log";
    fs::remove(log);
    init_logger(log.string());
    LoggerGuard guard;
    set_json_logging(true);
    log_info("fix step", {{"action", "push"}, {"repo", "code/widget"}});
    flush_logger();
    set_json_logging(false);
    log_warning("probe failed", {{"remote", "origin"}, {"access", "unknown"}});
    std::string payload = "raw";
    log_error("with data", payload);
    shutdown_logger();

    auto lines = read_lines(log);
    REQUIRE(lines.size() == 3);
    REQUIRE(lines[0][0] == '{');
    REQUIRE(lines[0].find("\"action\":\"push\"") != std::string::npos);
    REQUIRE(lines[0].find("\"msg\":\"fix step\"") != std::string::npos);
    REQUIRE(lines[1][0] == '[');
    REQUIRE(lines[1].find("[WARNING] probe failed") != std::string::npos);
    REQUIRE(lines[1].find(" access=unknown remote=origin") != std::string::npos);
    REQUIRE(lines[2].find("data=raw") != std::string::npos);
    fs::remove(log);
}

TEST_CASE("Logger filters below the minimum level") {
    fs::path log = fs::temp_directory_path() / "fleetfix_logger_level.log";
    fs::remove(log);
    init_logger(log.string(), LogLevel::WARNING);
    LoggerGuard guard;
    log_debug("hidden debug");
    log_info("hidden info");
    log_warning("shown");
    shutdown_logger();
    auto lines = read_lines(log);
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].find("shown") != std::string::npos);
    fs::remove(log);
}

TEST_CASE("log level names") {
    LogLevel level = LogLevel::INFO;
    REQUIRE(parse_log_level("debug", level));
    REQUIRE(level == LogLevel::DEBUG);
    REQUIRE(parse_log_level("Warn", level));
    REQUIRE(level == LogLevel::WARNING);
    REQUIRE(parse_log_level("ERROR", level));
    REQUIRE(level == LogLevel::ERR);
    REQUIRE_FALSE(parse_log_level("loud", level));
    REQUIRE(level == LogLevel::ERR);
}

TEST_CASE("console logging mirrors messages to stderr") {
    LoggerGuard guard;
    set_log_level(LogLevel::INFO);
    CerrCapture capture;
    set_console_logging(true);
    log_info("pushed", {{"branch", "main"}, {"remote", "origin"}});
    log_debug("not mirrored");
    set_console_logging(false);
    log_info("silent");
    REQUIRE(capture.str() == "fleetfix: pushed branch=main remote=origin\n");
}

TEST_CASE("shutdown_logger drains queued messages") {
    fs::path log = fs::temp_directory_path() / "fleetfix_logger_drain.log";
    fs::remove(log);
    init_logger(log.string());
    for (int i = 0; i < 50; ++i)
        log_info("queued " + std::to_string(i));
    shutdown_logger();
    REQUIRE(read_lines(log).size() == 50);
    fs::remove(log);
}

TEST_CASE("init_logger preserves queued messages during reinit") {
    fs::path log = fs::temp_directory_path() / "fleetfix_logger_reinit.log";
    fs::remove(log);
    init_logger(log.string());
    std::atomic<bool> run{true};
    std::atomic<int> produced{0};
    std::thread t([&] {
        while (run.load()) {
            log_info("entry " + std::to_string(produced.fetch_add(1)));
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    init_logger(log.string());
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    run.store(false);
    t.join();
    shutdown_logger();
    REQUIRE(read_lines(log).size() >= static_cast<size_t>(produced.load()));
    fs::remove(log);
}

TEST_CASE("init_logger keeps the previous file on failed reopen") {
    fs::path log = fs::temp_directory_path() / "fleetfix_logger_fail_reinit.log";
    fs::remove(log);
    init_logger(log.string());
    log_info("before");
    fs::path bad = log.parent_path() / "fleetfix_missing_dir" / "logger.log";
    {
        CerrCapture capture;
        init_logger(bad.string());
        REQUIRE(capture.str().find("failed to open log file") != std::string::npos);
    }
    log_info("after");
    shutdown_logger();
    REQUIRE(read_lines(log).size() >= 2);
    fs::remove(log);
}

#ifdef __linux__
TEST_CASE("init_syslog routes messages") {
    fs::path log = fs::temp_directory_path() / "fleetfix_logger_syslog.log";
    fs::remove(log);
    g_syslog_messages.clear();
    init_logger(log.string());
    init_syslog(LOG_USER);
    log_info("syslog entry");
    shutdown_logger();
    REQUIRE_FALSE(g_syslog_messages.empty());
    REQUIRE(g_syslog_messages.back().find("syslog entry") != std::string::npos);
    fs::remove(log);
}
#endif
