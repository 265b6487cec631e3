#include "git_utils.hpp"
#include <algorithm>

using namespace std;

namespace git {

GitInitGuard::GitInitGuard() { git_libgit2_init(); }

GitInitGuard::~GitInitGuard() { git_libgit2_shutdown(); }

bool is_git_repo(const fs::path& p) {
    std::error_code ec;
    return fs::exists(p / ".git", ec);
}

/**
 * @brief Convert a libgit2 object ID to a hexadecimal string.
 */
static string oid_to_hex(const git_oid& oid) {
    char buf[GIT_OID_HEXSZ + 1];
    git_oid_tostr(buf, sizeof(buf), &oid);
    return string(buf);
}

/**
 * @brief Populate an error string with the last libgit2 error message.
 */
static void set_error(std::string* error) {
    if (!error)
        return;
    const git_error* e = git_error_last();
    if (e && e->message)
        *error = e->message;
    else
        *error = "unknown libgit2 error";
}

static git_repository* open_repo(const fs::path& repo, string* error) {
    git_repository* raw = nullptr;
    if (git_repository_open(&raw, repo.string().c_str()) != 0) {
        set_error(error);
        return nullptr;
    }
    return raw;
}

optional<string> get_local_hash(const fs::path& repo, string* error) {
    repo_ptr r(open_repo(repo, error));
    if (!r.get())
        return nullopt;
    git_oid oid;
    if (git_reference_name_to_id(&oid, r.get(), "HEAD") != 0) {
        set_error(error);
        return nullopt;
    }
    return oid_to_hex(oid);
}

optional<string> get_current_branch(const fs::path& repo, string* error) {
    repo_ptr r(open_repo(repo, error));
    if (!r.get())
        return nullopt;
    git_reference* raw_head = nullptr;
    if (git_reference_lookup(&raw_head, r.get(), "HEAD") != 0) {
        set_error(error);
        return nullopt;
    }
    reference_ptr head(raw_head);
    if (git_reference_type(head.get()) != GIT_REFERENCE_SYMBOLIC) {
        if (error)
            *error = "HEAD is detached";
        return nullopt;
    }
    const char* target = git_reference_symbolic_target(head.get());
    string name = target ? target : "";
    const string prefix = "refs/heads/";
    if (name.rfind(prefix, 0) != 0) {
        if (error)
            *error = "HEAD does not point at a branch";
        return nullopt;
    }
    return name.substr(prefix.size());
}

optional<string> get_remote_url(const fs::path& repo, const string& remote, string* error) {
    repo_ptr r(open_repo(repo, error));
    if (!r.get())
        return nullopt;
    git_remote* raw_remote = nullptr;
    if (git_remote_lookup(&raw_remote, r.get(), remote.c_str()) != 0) {
        set_error(error);
        return nullopt;
    }
    remote_ptr remote_handle(raw_remote);
    const char* url = git_remote_url(remote_handle.get());
    if (!url) {
        set_error(error);
        return nullopt;
    }
    return string(url);
}

vector<string> list_remotes(const fs::path& repo, string* error) {
    vector<string> out;
    repo_ptr r(open_repo(repo, error));
    if (!r.get())
        return out;
    git_strarray names{};
    if (git_remote_list(&names, r.get()) != 0) {
        set_error(error);
        return out;
    }
    for (size_t i = 0; i < names.count; ++i)
        out.emplace_back(names.strings[i]);
    git_strarray_dispose(&names);
    sort(out.begin(), out.end());
    return out;
}

optional<string> get_upstream(const fs::path& repo, string* error) {
    repo_ptr r(open_repo(repo, error));
    if (!r.get())
        return nullopt;
    git_reference* raw_head = nullptr;
    if (git_repository_head(&raw_head, r.get()) != 0) {
        set_error(error);
        return nullopt;
    }
    reference_ptr head(raw_head);
    if (!git_reference_is_branch(head.get()))
        return nullopt;
    git_reference* raw_up = nullptr;
    if (git_branch_upstream(&raw_up, head.get()) != 0) {
        set_error(error);
        return nullopt;
    }
    reference_ptr up(raw_up);
    const char* name = git_reference_shorthand(up.get());
    if (!name || !*name)
        return nullopt;
    return string(name);
}

optional<string> resolve_ref(const fs::path& repo, const string& ref, string* error) {
    repo_ptr r(open_repo(repo, error));
    if (!r.get())
        return nullopt;
    git_oid oid;
    if (git_reference_name_to_id(&oid, r.get(), ref.c_str()) == 0)
        return oid_to_hex(oid);
    git_reference* raw_ref = nullptr;
    if (git_reference_dwim(&raw_ref, r.get(), ref.c_str()) != 0) {
        set_error(error);
        return nullopt;
    }
    reference_ptr resolved(raw_ref);
    const git_oid* target = git_reference_target(resolved.get());
    if (!target) {
        set_error(error);
        return nullopt;
    }
    return oid_to_hex(*target);
}

optional<pair<int, int>> get_ahead_behind(const fs::path& repo, const string& upstream,
                                          string* error) {
    repo_ptr r(open_repo(repo, error));
    if (!r.get())
        return nullopt;
    git_oid local;
    if (git_reference_name_to_id(&local, r.get(), "HEAD") != 0) {
        set_error(error);
        return nullopt;
    }
    git_reference* raw_up = nullptr;
    if (git_reference_dwim(&raw_up, r.get(), upstream.c_str()) != 0) {
        set_error(error);
        return nullopt;
    }
    reference_ptr up(raw_up);
    const git_oid* up_oid = git_reference_target(up.get());
    if (!up_oid) {
        set_error(error);
        return nullopt;
    }
    size_t ahead = 0, behind = 0;
    if (git_graph_ahead_behind(&ahead, &behind, r.get(), &local, up_oid) != 0) {
        set_error(error);
        return nullopt;
    }
    return make_pair(static_cast<int>(ahead), static_cast<int>(behind));
}

optional<WorktreeStatus> get_worktree_status(const fs::path& repo, string* error) {
    repo_ptr r(open_repo(repo, error));
    if (!r.get())
        return nullopt;
    git_status_options opts = GIT_STATUS_OPTIONS_INIT;
    opts.show = GIT_STATUS_SHOW_INDEX_AND_WORKDIR;
    opts.flags = GIT_STATUS_OPT_INCLUDE_UNTRACKED | GIT_STATUS_OPT_RENAMES_HEAD_TO_INDEX |
                 GIT_STATUS_OPT_EXCLUDE_SUBMODULES;
    git_status_list* raw_list = nullptr;
    if (git_status_list_new(&raw_list, r.get(), &opts) != 0) {
        set_error(error);
        return nullopt;
    }
    status_list_ptr list(raw_list);
    WorktreeStatus st;
    size_t n = git_status_list_entrycount(list.get());
    for (size_t i = 0; i < n; ++i) {
        const git_status_entry* e = git_status_byindex(list.get(), i);
        if (!e || e->status == GIT_STATUS_CURRENT || (e->status & GIT_STATUS_IGNORED))
            continue;
        if (e->status == GIT_STATUS_WT_NEW)
            st.untracked = true;
        else
            st.dirty_tracked = true;
    }
    return st;
}

optional<fleetfix::GitOperation> get_operation(const fs::path& repo, string* error) {
    repo_ptr r(open_repo(repo, error));
    if (!r.get())
        return nullopt;
    using fleetfix::GitOperation;
    switch (git_repository_state(r.get())) {
    case GIT_REPOSITORY_STATE_MERGE:
        return GitOperation::Merge;
    case GIT_REPOSITORY_STATE_REBASE:
    case GIT_REPOSITORY_STATE_REBASE_INTERACTIVE:
    case GIT_REPOSITORY_STATE_REBASE_MERGE:
    case GIT_REPOSITORY_STATE_APPLY_MAILBOX_OR_REBASE:
        return GitOperation::Rebase;
    case GIT_REPOSITORY_STATE_CHERRYPICK:
    case GIT_REPOSITORY_STATE_CHERRYPICK_SEQUENCE:
        return GitOperation::CherryPick;
    case GIT_REPOSITORY_STATE_BISECT:
        return GitOperation::Bisect;
    default:
        return GitOperation::None;
    }
}

optional<string> get_remote_default_branch(const fs::path& repo, const string& remote) {
    repo_ptr r(open_repo(repo, nullptr));
    if (!r.get())
        return nullopt;
    string name = "refs/remotes/" + remote + "/HEAD";
    git_reference* raw_ref = nullptr;
    if (git_reference_lookup(&raw_ref, r.get(), name.c_str()) != 0)
        return nullopt;
    reference_ptr ref(raw_ref);
    if (git_reference_type(ref.get()) != GIT_REFERENCE_SYMBOLIC)
        return nullopt;
    const char* target = git_reference_symbolic_target(ref.get());
    string t = target ? target : "";
    string prefix = "refs/remotes/" + remote + "/";
    if (t.rfind(prefix, 0) != 0 || t.size() == prefix.size())
        return nullopt;
    return t.substr(prefix.size());
}

} // namespace git
