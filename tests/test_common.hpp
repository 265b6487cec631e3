#pragma once
#include <catch2/catch_test_macros.hpp>
#include "config_utils.hpp"
#include "eligibility.hpp"
#include "fix_action.hpp"
#include "fix_engine.hpp"
#include "fix_executor.hpp"
#include "git_client.hpp"
#include "git_utils.hpp"
#include "github_client.hpp"
#include "lock_utils.hpp"
#include "logger.hpp"
#include "origin_utils.hpp"
#include "repo.hpp"
#include "repo_scanner.hpp"
#include "risk_snapshot.hpp"
#include "state_store.hpp"
#include "sync_feasibility.hpp"
#include "time_utils.hpp"
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <system_error>
#include <vector>

#if !defined(REDIR)
#define REDIR " > /dev/null 2>&1"
#endif

static inline bool have_git() { return std::system("git --version " REDIR) == 0; }

namespace fs = std::filesystem;

namespace fleetfix::test_support {
namespace detail {
inline bool remove_once(const fs::path& target, bool recursive, std::error_code& ec) {
    ec.clear();
    if (recursive)
        fs::remove_all(target, ec);
    else
        fs::remove(target, ec);
    return !ec || ec == std::errc::no_such_file_or_directory;
}

inline void remove_with_retry(const fs::path& target, bool recursive) {
    std::error_code ec;
    if (remove_once(target, recursive, ec))
        return;
    INFO("Failed to remove '" << target.string() << "': " << ec.message());
    REQUIRE(false);
}
} // namespace detail

inline void remove_path(const fs::path& target) { detail::remove_with_retry(target, false); }

inline void remove_all(const fs::path& target) { detail::remove_with_retry(target, true); }

/// Fresh empty directory under the system temp directory.
inline fs::path fresh_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / ("fleetfix_" + name);
    remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

/// Run `git -C <repo> <args>` quietly.
inline bool git_ok(const fs::path& repo, const std::string& args) {
    std::string cmd = "git -C \"" + repo.string() + "\" " + args + REDIR;
    return std::system(cmd.c_str()) == 0;
}

inline void write_file(const fs::path& file, const std::string& content) {
    fs::create_directories(file.parent_path());
    std::ofstream(file, std::ios::binary | std::ios::trunc) << content;
}

/// Initialise a repository on branch `main` with a local identity.
inline void init_repo(const fs::path& repo) {
    fs::create_directories(repo);
    REQUIRE(git_ok(repo, "init"));
    REQUIRE(git_ok(repo, "symbolic-ref HEAD refs/heads/main"));
    git_ok(repo, "config user.email you@example.com");
    git_ok(repo, "config user.name tester");
    git_ok(repo, "config commit.gpgsign false");
}

inline void commit_file(const fs::path& repo, const std::string& file, const std::string& content,
                        const std::string& message) {
    write_file(repo / file, content);
    REQUIRE(git_ok(repo, "add -A"));
    REQUIRE(git_ok(repo, "commit -m \"" + message + "\""));
}

/// Bare remote at @p remote plus a clone at @p repo tracking `origin/main`.
inline void clone_with_remote(const fs::path& remote, const fs::path& repo) {
    fs::path seed = remote.parent_path() / (remote.stem().string() + "_seed");
    remove_all(seed);
    fs::create_directories(remote.parent_path());
    REQUIRE(std::system(("git init --bare \"" + remote.string() + "\"" REDIR).c_str()) == 0);
    REQUIRE(git_ok(remote, "symbolic-ref HEAD refs/heads/main"));
    init_repo(seed);
    commit_file(seed, "README.md", "hello\n", "init");
    REQUIRE(git_ok(seed, "remote add origin \"" + remote.string() + "\""));
    REQUIRE(git_ok(seed, "push -u origin main"));
    remove_all(seed);
    REQUIRE(std::system(("git clone \"" + remote.string() + "\" \"" + repo.string() + "\"" REDIR)
                            .c_str()) == 0);
    git_ok(repo, "config user.email you@example.com");
    git_ok(repo, "config user.name tester");
    git_ok(repo, "config commit.gpgsign false");
}

/// Sets an environment variable for the lifetime of the object.
class ScopedEnv {
  public:
    ScopedEnv(const char* name, const std::string& value) : name_(name) {
        if (const char* old = std::getenv(name))
            old_ = std::string(old);
        setenv(name, value.c_str(), 1);
    }
    ~ScopedEnv() {
        if (old_)
            setenv(name_.c_str(), old_->c_str(), 1);
        else
            unsetenv(name_.c_str());
    }
    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

  private:
    std::string name_;
    std::optional<std::string> old_;
};

/// Config and state directories under one temp root.
inline StatePaths temp_state_paths(const fs::path& root) {
    StatePaths p;
    p.config_dir = root / "config";
    p.state_dir = root / "state";
    fs::create_directories(p.config_dir);
    fs::create_directories(p.state_dir);
    return p;
}

} // namespace fleetfix::test_support

#ifndef FS_REMOVE
#define FS_REMOVE(path) ::fleetfix::test_support::remove_path((path))
#endif
#ifndef FS_REMOVE_ALL
#define FS_REMOVE_ALL(path) ::fleetfix::test_support::remove_all((path))
#endif
