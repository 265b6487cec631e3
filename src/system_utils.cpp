#include "system_utils.hpp"
#include <climits>
#include <cstdlib>

namespace procutil {

std::optional<std::string> safe_getenv(const char* name) {
    const char* v = std::getenv(name);
    if (v)
        return std::string(v);
    return std::nullopt;
}

std::string hostname() {
    char buf[HOST_NAME_MAX + 1] = {};
    if (gethostname(buf, sizeof(buf) - 1) != 0 || buf[0] == '\0')
        return "localhost";
    return std::string(buf);
}

std::filesystem::path home_dir() {
    auto home = safe_getenv("HOME");
    if (home && !home->empty())
        return *home;
    return std::filesystem::temp_directory_path();
}

} // namespace procutil
