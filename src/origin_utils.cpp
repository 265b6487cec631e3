#include "origin_utils.hpp"
#include <algorithm>
#include <cctype>
#include <vector>

namespace fleetfix {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim_identity(std::string s) {
    while (!s.empty() && (s.back() == '/' || std::isspace(static_cast<unsigned char>(s.back()))))
        s.pop_back();
    if (s.size() > 4 && s.compare(s.size() - 4, 4, ".git") == 0)
        s.resize(s.size() - 4);
    while (!s.empty() && s.back() == '/')
        s.pop_back();
    size_t start = 0;
    while (start < s.size() && s[start] == '/')
        ++start;
    return s.substr(start);
}

void replace_all(std::string& s, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

bool valid_name_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
}

} // namespace

const char* to_string(RemoteProtocol protocol) {
    switch (protocol) {
    case RemoteProtocol::Ssh:
        return "ssh";
    case RemoteProtocol::Https:
        return "https";
    }
    return "ssh";
}

std::optional<RemoteProtocol> parse_remote_protocol(const std::string& text) {
    std::string v = lower(text);
    if (v.empty() || v == "ssh")
        return RemoteProtocol::Ssh;
    if (v == "https")
        return RemoteProtocol::Https;
    return std::nullopt;
}

std::string normalize_origin_identity(const std::string& url) {
    std::string u = url;
    while (!u.empty() && std::isspace(static_cast<unsigned char>(u.front())))
        u.erase(u.begin());
    while (!u.empty() && std::isspace(static_cast<unsigned char>(u.back())))
        u.pop_back();
    if (u.empty())
        return "";
    if (u.front() == '/')
        return lower("file/" + trim_identity(u));
    auto scheme = u.find("://");
    if (scheme != std::string::npos) {
        std::string proto = lower(u.substr(0, scheme));
        std::string rest = u.substr(scheme + 3);
        if (proto == "file")
            return lower("file/" + trim_identity(rest));
        auto slash = rest.find('/');
        std::string host = rest.substr(0, slash);
        std::string path = slash == std::string::npos ? "" : rest.substr(slash);
        auto at = host.rfind('@');
        if (at != std::string::npos)
            host = host.substr(at + 1);
        auto colon = host.find(':');
        if (colon != std::string::npos)
            host = host.substr(0, colon);
        std::string p = trim_identity(path);
        return lower(p.empty() ? host : host + "/" + p);
    }
    // scp-like syntax: [user@]host:path
    auto colon = u.find(':');
    if (colon != std::string::npos && u.find('/') > colon) {
        std::string host = u.substr(0, colon);
        auto at = host.rfind('@');
        if (at != std::string::npos)
            host = host.substr(at + 1);
        return lower(host + "/" + trim_identity(u.substr(colon + 1)));
    }
    return lower("file/" + trim_identity(u));
}

bool same_origin_identity(const std::string& a, const std::string& b) {
    std::string ia = normalize_origin_identity(a);
    return !ia.empty() && ia == normalize_origin_identity(b);
}

std::optional<RemoteRepoRef> parse_remote_repo(const std::string& origin_url) {
    std::string id = normalize_origin_identity(origin_url);
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= id.size()) {
        size_t end = id.find('/', start);
        if (end == std::string::npos)
            end = id.size();
        if (end > start)
            parts.push_back(id.substr(start, end - start));
        start = end + 1;
    }
    if (parts.size() < 3)
        return std::nullopt;
    RemoteRepoRef ref{parts[parts.size() - 2], parts.back()};
    if (ref.owner.empty() || ref.name.empty())
        return std::nullopt;
    return ref;
}

std::string remote_repo_url(const std::string& owner, const std::string& name,
                            RemoteProtocol protocol, const std::string& url_template) {
    if (!url_template.empty()) {
        std::string out = url_template;
        replace_all(out, "${owner}", owner);
        replace_all(out, "${org}", owner);
        replace_all(out, "${repo}", name);
        return out;
    }
    if (protocol == RemoteProtocol::Https)
        return "https://github.com/" + owner + "/" + name + ".git";
    return "git@github.com:" + owner + "/" + name + ".git";
}

std::string sanitize_repo_name(const std::string& raw) {
    std::string out;
    bool pending_dash = false;
    for (char ch : raw) {
        char c = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        if (valid_name_char(c)) {
            if (pending_dash && !out.empty())
                out += '-';
            pending_dash = false;
            out += c;
        } else {
            pending_dash = true;
        }
    }
    size_t start = out.find_first_not_of('-');
    out = start == std::string::npos ? "" : out.substr(start);
    if (out.size() > MAX_REPO_NAME_LENGTH)
        out.resize(MAX_REPO_NAME_LENGTH);
    return out;
}

bool validate_repo_name(const std::string& name, std::string* error) {
    auto fail = [&](const std::string& msg) {
        if (error)
            *error = msg;
        return false;
    };
    if (name.empty())
        return fail("repository name is required");
    if (name.size() > MAX_REPO_NAME_LENGTH)
        return fail("repository name \"" + name + "\" is longer than 100 characters");
    if (name == "." || name == "..")
        return fail("repository name \"" + name + "\" is reserved");
    if (!std::all_of(name.begin(), name.end(), valid_name_char))
        return fail("repository name \"" + name +
                    "\" may only contain lowercase letters, digits, '.', '_' and '-'");
    return true;
}

} // namespace fleetfix
