#include "process_utils.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#include "system_utils.hpp"

extern char** environ;

namespace procutil {

namespace {

/// The current environment with @p overrides applied, as `KEY=VALUE` strings.
std::vector<std::string> merged_environment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> out;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq != std::string::npos && overrides.count(entry.substr(0, eq)))
            continue;
        out.push_back(std::move(entry));
    }
    for (const auto& [k, v] : overrides)
        out.push_back(k + "=" + v);
    return out;
}

std::vector<char*> c_strings(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings)
        out.push_back(s.data());
    out.push_back(nullptr);
    return out;
}

} // namespace

CommandResult run_command(const std::vector<std::string>& args, const std::filesystem::path& cwd,
                          const std::map<std::string, std::string>& env) {
    CommandResult result;
    if (args.empty()) {
        result.output = "empty command";
        return result;
    }
    // The child may only make async-signal-safe calls, so everything it needs
    // is allocated before fork.
    std::vector<std::string> arg_strings(args);
    std::vector<std::string> env_strings = merged_environment(env);
    std::vector<char*> argv = c_strings(arg_strings);
    std::vector<char*> envp = c_strings(env_strings);

    int fds[2];
    if (pipe(fds) != 0) {
        result.output = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }
    UniqueFd read_end(fds[0]);
    UniqueFd write_end(fds[1]);

    pid_t pid = fork();
    if (pid < 0) {
        result.output = std::string("fork failed: ") + std::strerror(errno);
        return result;
    }
    if (pid == 0) {
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(write_end.get(), STDOUT_FILENO);
        dup2(write_end.get(), STDERR_FILENO);
        close(read_end.get());
        close(write_end.get());
        if (!cwd.empty() && chdir(cwd.c_str()) != 0)
            _exit(126);
        execvpe(argv[0], argv.data(), envp.data());
        _exit(127);
    }
    write_end.reset();

    char buf[4096];
    while (true) {
        ssize_t n = read(read_end.get(), buf, sizeof(buf));
        if (n > 0) {
            result.output.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR)
            continue;
        break;
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            result.output += std::string("waitpid failed: ") + std::strerror(errno);
            return result;
        }
    }
    if (WIFEXITED(status))
        result.exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status))
        result.exit_code = 128 + WTERMSIG(status);
    return result;
}

std::string join_command(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& a : args) {
        if (!out.empty())
            out += ' ';
        if (a.empty() || a.find_first_of(" \t\"'") != std::string::npos)
            out += "\"" + a + "\"";
        else
            out += a;
    }
    return out;
}

} // namespace procutil
