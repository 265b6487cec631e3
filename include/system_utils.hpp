#ifndef SYSTEM_UTILS_HPP
#define SYSTEM_UTILS_HPP
#include <filesystem>
#include <optional>
#include <string>
#include <unistd.h>

namespace procutil {

/**
 * @brief Read an environment variable.
 *
 * @return The value, or `std::nullopt` when the variable is unset. An empty
 *         but present variable yields an empty string.
 */
std::optional<std::string> safe_getenv(const char* name);

/**
 * @brief Host name of the current machine, or "localhost" if unavailable.
 */
std::string hostname();

/**
 * @brief Home directory of the current user taken from `HOME`.
 */
std::filesystem::path home_dir();

/**
 * @brief RAII wrapper for POSIX-style file descriptors.
 *
 * Closes the descriptor when the object goes out of scope. Use to manage
 * ownership of file descriptors returned by open, pipe and similar calls.
 */
class UniqueFd {
  public:
    UniqueFd() noexcept : fd(-1) {}
    explicit UniqueFd(int f) noexcept : fd(f) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd(other.fd) { other.fd = -1; }

    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd = other.fd;
            other.fd = -1;
        }
        return *this;
    }

    int get() const noexcept { return fd; }
    explicit operator bool() const noexcept { return fd >= 0; }

    int release() noexcept {
        int tmp = fd;
        fd = -1;
        return tmp;
    }

    void reset(int f = -1) noexcept {
        if (fd >= 0)
            close(fd);
        fd = f;
    }

  private:
    int fd;
};

} // namespace procutil

#endif // SYSTEM_UTILS_HPP
