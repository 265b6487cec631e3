#include "risk_snapshot.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace fleetfix {

namespace {

const char* const NOISY_SEGMENTS[] = {"node_modules", ".venv",    "venv",  "dist", "build",
                                      "target",       "coverage", ".next", ".turbo"};

void trim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> split_lines(const std::string& raw) {
    std::vector<std::string> lines;
    std::istringstream in(raw);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

bool parse_count(std::string raw, int& out) {
    trim(raw);
    if (raw.empty() || raw == "-")
        return false;
    try {
        size_t used = 0;
        out = std::stoi(raw, &used);
        return used == raw.size();
    } catch (const std::exception&) {
        return false;
    }
}

struct DiffCounts {
    int added = 0;
    int deleted = 0;
};

void merge_numstat(const std::string& raw, std::map<std::string, DiffCounts>& out) {
    for (const auto& line : split_lines(raw)) {
        std::vector<std::string> parts;
        std::istringstream fields(line);
        std::string part;
        while (std::getline(fields, part, '\t'))
            parts.push_back(part);
        if (parts.size() < 3)
            continue;
        int added = 0;
        int deleted = 0;
        if (!parse_count(parts[0], added) || !parse_count(parts[1], deleted))
            continue;
        auto& entry = out[parts.back()];
        entry.added += added;
        entry.deleted += deleted;
    }
}

int count_file_lines(const std::filesystem::path& file) {
    std::ifstream in(file, std::ios::binary);
    if (!in)
        return 0;
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (data.empty())
        return 0;
    return 1 + static_cast<int>(std::count(data.begin(), data.end(), '\n'));
}

std::vector<std::string> sorted_unique(std::vector<std::string> items) {
    std::sort(items.begin(), items.end());
    items.erase(std::unique(items.begin(), items.end()), items.end());
    return items;
}

std::set<std::string> read_gitignore_entries(const std::filesystem::path& file) {
    std::set<std::string> entries;
    std::ifstream in(file);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        trim(line);
        if (line.empty() || line[0] == '#')
            continue;
        entries.insert(line);
    }
    return entries;
}

} // namespace

std::vector<ChangedFile> parse_porcelain_status(const std::string& raw) {
    std::vector<ChangedFile> out;
    for (const auto& line : split_lines(raw)) {
        if (line.size() < 4)
            continue;
        std::string code = line.substr(0, 2);
        std::string path = line.substr(3);
        trim(path);
        if (path.empty())
            continue;
        auto arrow = path.rfind(" -> ");
        if (arrow != std::string::npos)
            path = path.substr(arrow + 4);
        if (path.size() >= 2 && path.front() == '"' && path.back() == '"')
            path = path.substr(1, path.size() - 2);

        ChangedFile file;
        file.path = path;
        if (code == "??")
            file.status = "untracked";
        else if (code.find('D') != std::string::npos)
            file.status = "deleted";
        else if (code.find('A') != std::string::npos)
            file.status = "added";
        else if (code.find('R') != std::string::npos)
            file.status = "renamed";
        else
            file.status = "modified";
        out.push_back(file);
    }
    return out;
}

bool is_secret_like_path(const std::string& path) {
    std::string base = lower(std::filesystem::path(path).filename().string());
    if (base == ".env" || base == "id_rsa" || base == "id_dsa" || base == "id_ecdsa" ||
        base == "id_ed25519")
        return true;
    auto dot = base.rfind('.');
    if (dot == std::string::npos || dot == 0)
        return false;
    std::string ext = base.substr(dot);
    return ext == ".pem" || ext == ".key" || ext == ".p12" || ext == ".pfx" || ext == ".jks" ||
           ext == ".keystore";
}

std::string noisy_pattern_for_path(const std::string& path) {
    std::istringstream in(lower(path));
    std::string seg;
    while (std::getline(in, seg, '/')) {
        for (const char* noisy : NOISY_SEGMENTS) {
            if (seg == noisy)
                return seg + "/";
        }
    }
    return "";
}

RiskSnapshot collect_risk_snapshot(GitClient& git, const std::filesystem::path& repo) {
    RiskSnapshot out;
    std::error_code ec;
    out.missing_root_gitignore = !std::filesystem::exists(repo / ".gitignore", ec);

    std::vector<ChangedFile> entries = parse_porcelain_status(git.status_porcelain(repo));
    std::map<std::string, DiffCounts> stats;
    merge_numstat(git.diff_numstat(repo, false), stats);
    merge_numstat(git.diff_numstat(repo, true), stats);

    std::vector<std::string> patterns;
    for (auto& file : entries) {
        auto it = stats.find(file.path);
        if (it != stats.end()) {
            file.added = it->second.added;
            file.deleted = it->second.deleted;
        } else if (file.status == "untracked") {
            file.added = count_file_lines(repo / file.path);
        }
        if (is_secret_like_path(file.path))
            out.secret_like_changes.push_back(file.path);
        std::string pattern = noisy_pattern_for_path(file.path);
        if (!pattern.empty()) {
            out.noisy_changed_paths.push_back(file.path);
            patterns.push_back(pattern);
        }
    }
    std::sort(entries.begin(), entries.end(),
              [](const ChangedFile& a, const ChangedFile& b) { return a.path < b.path; });
    out.changed_files = std::move(entries);
    out.secret_like_changes = sorted_unique(std::move(out.secret_like_changes));
    out.noisy_changed_paths = sorted_unique(std::move(out.noisy_changed_paths));

    for (const char* dir : NOISY_SEGMENTS) {
        if (std::filesystem::is_directory(repo / dir, ec))
            patterns.push_back(std::string(dir) + "/");
    }
    out.suggested_gitignore_patterns = sorted_unique(std::move(patterns));
    out.missing_gitignore_patterns = missing_gitignore_patterns(repo, out.suggested_gitignore_patterns);
    return out;
}

std::vector<std::string> missing_gitignore_patterns(const std::filesystem::path& repo,
                                                    const std::vector<std::string>& patterns) {
    auto existing = read_gitignore_entries(repo / ".gitignore");
    std::vector<std::string> out;
    for (std::string p : patterns) {
        trim(p);
        if (p.empty() || existing.count(p))
            continue;
        // `node_modules` and `node_modules/` ignore the same directory.
        if (p.back() == '/' && existing.count(p.substr(0, p.size() - 1)))
            continue;
        out.push_back(p);
    }
    return sorted_unique(std::move(out));
}

std::vector<std::string> write_gitignore_patterns(const std::filesystem::path& repo,
                                                  const std::vector<std::string>& patterns) {
    const auto file = repo / ".gitignore";
    std::error_code ec;
    const bool exists = std::filesystem::exists(file, ec);
    std::vector<std::string> wanted = missing_gitignore_patterns(repo, patterns);
    if (wanted.empty())
        return wanted;

    std::string content;
    if (exists) {
        std::ifstream in(file, std::ios::binary);
        content.assign((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (!content.empty() && content.back() != '\n')
            content += '\n';
        content += "# Added by fleetfix\n";
    } else {
        content = "# Generated by fleetfix\n";
    }
    for (const auto& p : wanted)
        content += p + "\n";

    std::ofstream out(file, std::ios::trunc | std::ios::binary);
    if (!out)
        throw std::runtime_error("cannot write " + file.string());
    out << content;
    if (!out.good())
        throw std::runtime_error("cannot write " + file.string());
    return wanted;
}

} // namespace fleetfix
