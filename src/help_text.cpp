#include "help_text.hpp"
#include <algorithm>
#include <cstring>
#include <iomanip>
#include <map>
#include <string>
#include <vector>
#include "fix_action.hpp"

struct OptionInfo {
    const char* long_flag;
    const char* short_flag;
    const char* arg;
    const char* desc;
    const char* category;
};

void print_help(const char* prog, std::ostream& os) {
    static const std::vector<OptionInfo> opts = {
        {"--catalog", "-c", "<name>", "Limit to a catalog (repeatable)", "Selection"},
        {"--no-refresh", "", "", "Use the saved snapshot without rescanning", "Selection"},
        {"--refresh", "", "", "Rescan catalogs even when the snapshot is fresh", "Selection"},
        {"--plan", "", "", "Print the steps of ACTION without running them", "Fix"},
        {"--message", "-m", "<msg>", "Commit message for stage-commit-push", "Fix"},
        {"--sync-strategy", "", "<rebase|merge>", "Strategy for sync-with-upstream", "Fix"},
        {"--project-name", "", "<name>", "Repository name for create-project", "Fix"},
        {"--visibility", "", "<private|public>", "Visibility for create-project", "Fix"},
        {"--gitignore", "", "<pattern>", "Add a .gitignore pattern before committing (repeatable)",
         "Fix"},
        {"--config", "", "<file>", "Read configuration from a YAML or JSON file", "Config"},
        {"--verbose", "-v", "", "Echo progress messages to stderr", "Logging"},
        {"--log-file", "", "<file>", "Write log messages to a file", "Logging"},
        {"--log-level", "", "<level>", "Minimum level: DEBUG, INFO, WARNING, ERROR", "Logging"},
        {"--json-log", "", "", "Write log lines as JSON", "Logging"},
        {"--version", "-V", "", "Show the version", "Basics"},
        {"--help", "-h", "", "Show this message", "Basics"}};

    std::map<std::string, std::vector<const OptionInfo*>> groups;
    size_t width = 0;
    auto flag_text = [](const OptionInfo& o) {
        std::string flag = "  ";
        if (std::strlen(o.short_flag))
            flag += std::string(o.short_flag) + ", ";
        else
            flag += "    ";
        flag += o.long_flag;
        if (std::strlen(o.arg))
            flag += " " + std::string(o.arg);
        return flag;
    };
    for (const auto& o : opts) {
        groups[o.category].push_back(&o);
        width = std::max(width, flag_text(o).size());
    }

    os << "fleetfix - repair repositories that cannot be synchronized\n";
    os << "Explains why a repository is unsyncable and applies a fix action.\n\n";
    os << "Usage: " << prog << " fix [PROJECT [ACTION]] [options]\n";
    os << "       " << prog << " list [options]\n\n";
    const std::vector<std::string> order{"Selection", "Fix", "Config", "Logging", "Basics"};
    for (const auto& cat : order) {
        if (!groups.count(cat))
            continue;
        os << cat << ":\n";
        for (const auto* o : groups[cat])
            os << std::left << std::setw(static_cast<int>(width) + 2) << flag_text(*o) << o->desc
               << "\n";
        os << "\n";
    }

    os << "Actions:\n";
    size_t action_width = 0;
    for (auto a : fleetfix::all_fix_actions())
        action_width = std::max(action_width, std::strlen(fleetfix::to_string(a)));
    for (auto a : fleetfix::all_fix_actions()) {
        os << "  " << std::left << std::setw(static_cast<int>(action_width) + 2)
           << fleetfix::to_string(a) << fleetfix::fix_action_description(a);
        if (fleetfix::fix_action_risky(a))
            os << " (risky)";
        os << "\n";
    }
}
