#include "lock_utils.hpp"
#include <cerrno>
#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <system_error>
#include "system_utils.hpp"
#include "time_utils.hpp"

namespace procutil {

bool acquire_lock_file(const std::filesystem::path& path, const LockInfo& info) {
    UniqueFd fd(open(path.c_str(), O_RDWR | O_CREAT | O_EXCL, 0644));
    if (!fd)
        return false;
    std::string payload = "pid=" + std::to_string(info.pid) + "\nhostname=" + info.hostname +
                          "\ncreated_at=" + info.created_at + "\n";
    const char* p = payload.data();
    size_t left = payload.size();
    while (left > 0) {
        ssize_t w = write(fd.get(), p, left);
        if (w < 0) {
            if (errno == EINTR)
                continue;
            fd.reset();
            unlink(path.c_str());
            return false;
        }
        p += w;
        left -= static_cast<size_t>(w);
    }
    return true;
}

void release_lock_file(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
}

std::optional<LockInfo> read_lock_info(const std::filesystem::path& path) {
    std::ifstream f(path);
    if (!f.is_open())
        return std::nullopt;
    LockInfo info;
    std::string line;
    bool first = true;
    while (std::getline(f, line)) {
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            if (first && !line.empty()) {
                try {
                    info.pid = std::stoul(line);
                } catch (const std::exception&) {
                }
            }
            first = false;
            continue;
        }
        first = false;
        std::string key = line.substr(0, eq);
        std::string val = line.substr(eq + 1);
        if (key == "pid") {
            try {
                info.pid = std::stoul(val);
            } catch (const std::exception&) {
                info.pid = 0;
            }
        } else if (key == "hostname") {
            info.hostname = val;
        } else if (key == "created_at") {
            info.created_at = val;
        }
    }
    return info;
}

bool process_running(unsigned long pid) {
    if (pid == 0)
        return false;
    if (kill(static_cast<pid_t>(pid), 0) == 0)
        return true;
    return errno != ESRCH;
}

std::optional<std::chrono::system_clock::time_point>
lock_file_mtime(const std::filesystem::path& path) {
    struct stat st {};
    if (stat(path.c_str(), &st) != 0)
        return std::nullopt;
    return std::chrono::system_clock::from_time_t(st.st_mtime);
}

namespace {

bool same_host(std::string a, std::string b) {
    auto lower = [](std::string& s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    };
    lower(a);
    lower(b);
    return a == b;
}

std::chrono::system_clock::duration age_at(std::chrono::system_clock::time_point t,
                                           std::chrono::system_clock::time_point now) {
    auto age = now - t;
    if (age < std::chrono::system_clock::duration::zero())
        return std::chrono::system_clock::duration::zero();
    return age;
}

} // namespace

bool lock_is_stale(const LockInfo& info, const std::string& host,
                   std::chrono::system_clock::time_point now,
                   std::chrono::system_clock::time_point modified) {
    auto file_age = age_at(modified, now);
    auto created = parse_rfc3339(info.created_at);
    // An unreadable payload may belong to a holder that has not finished writing it.
    if (info.pid == 0 || !created)
        return file_age >= LOCK_STALE_AFTER;
    if (age_at(*created, now) >= LOCK_STALE_AFTER || file_age >= LOCK_STALE_AFTER)
        return true;
    if (info.hostname.empty() || !same_host(info.hostname, host))
        return false;
    return !process_running(info.pid);
}

LockFileGuard::LockFileGuard(const std::filesystem::path& p, const LockInfo& info) : path(p) {
    locked = acquire_lock_file(path, info);
}

LockFileGuard::~LockFileGuard() {
    if (locked)
        release_lock_file(path);
}

} // namespace procutil
