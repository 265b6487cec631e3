#include <algorithm>
#include <optional>
#include <string>
#include <vector>

#include "cli_commands.hpp"
#include "eligibility.hpp"
#include "logger.hpp"

namespace cli {

namespace {

std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty())
            out += sep;
        out += item;
    }
    return out;
}

std::string action_list(const std::vector<fleetfix::FixAction>& actions) {
    std::vector<std::string> names;
    for (auto a : actions)
        names.push_back(fleetfix::to_string(a));
    return names.empty() ? "none" : join(names, ", ");
}

void report_ineligible(std::ostream& err, fleetfix::FixAction action, const std::string& name,
                       const std::string& reason) {
    err << "action \"" << fleetfix::to_string(action) << "\" is not eligible for " << name
        << "\n";
    if (!reason.empty())
        err << "reason: " << reason << "\n";
}

} // namespace

void setup_logging(const LoggingOptions& flags, const fleetfix::LoggingConfig& cfg) {
    LogLevel level = LogLevel::INFO;
    if (flags.log_level_set)
        level = flags.log_level;
    else if (!cfg.level.empty() && !parse_log_level(cfg.level, level))
        log_warning("ignoring invalid logging.level", cfg.level);
    set_log_level(level);
    set_json_logging(flags.json_log || cfg.json);
    set_log_compression(cfg.compress);
    set_console_logging(flags.verbose);
    const std::string file = flags.log_file.empty() ? cfg.file : flags.log_file;
    if (!file.empty())
        init_logger(file, level, cfg.max_size, cfg.max_files);
    if (cfg.syslog)
        init_syslog();
}

void print_status(std::ostream& out, const fleetfix::FixRepoState& state,
                  const std::vector<fleetfix::FixAction>& actions) {
    const auto& rec = state.record;
    std::vector<std::string> reasons;
    for (auto r : rec.unsyncable_reasons)
        reasons.push_back(fleetfix::to_string(r));
    std::sort(reasons.begin(), reasons.end());

    out << "repo: " << rec.name << "\n";
    out << "path: " << rec.path.string() << "\n";
    out << "catalog: " << rec.catalog << (state.is_default_catalog ? " (default)" : "") << "\n";
    out << "branch: " << (rec.branch.empty() ? "(detached)" : rec.branch) << "\n";
    out << "syncable: " << (rec.syncable ? "true" : "false") << "\n";
    out << "reasons: " << (reasons.empty() ? "none" : join(reasons, ", ")) << "\n";
    out << "actions: " << action_list(actions) << "\n";
}

void print_step(std::ostream& out, const fleetfix::StepEvent& event) {
    out << "[" << fleetfix::to_string(event.status) << "] " << event.entry.id << ": "
        << event.entry.summary;
    if (event.status == fleetfix::StepStatus::Failed && !event.error.empty())
        out << " (" << event.error << ")";
    out << "\n";
    out.flush();
}

int run_fix(const Options& opts, fleetfix::FixEngine& engine, std::ostream& out,
            std::ostream& err) {
    std::optional<fleetfix::FixAction> action;
    if (!opts.action.empty()) {
        action = fleetfix::parse_fix_action(opts.action);
        if (!action) {
            err << "unknown fix action \"" << opts.action << "\"\n";
            return 2;
        }
        if (*action == fleetfix::FixAction::Ignore) {
            err << "ignore action is interactive-only; use `fleetfix fix` from an interactive "
                   "session\n";
            return 2;
        }
    }

    auto repos = engine.load_fix_repos(opts.catalogs, opts.refresh);
    fleetfix::FixRepoState target = fleetfix::resolve_fix_target(opts.project, repos);
    if (!action) {
        print_status(out, target, engine.eligible_actions(target));
        return target.record.syncable ? 0 : 1;
    }

    fleetfix::FixOptions fix_opts = to_fix_options(opts);
    if (opts.plan_only) {
        auto plan = engine.plan_fix_action(*action, target, fix_opts);
        out << "plan for " << fleetfix::to_string(*action) << " on " << target.record.name
            << ":\n";
        int n = 1;
        for (const auto& entry : plan)
            out << "  " << n++ << ". " << entry.id << ": " << entry.summary << "\n";
        return 0;
    }

    const auto strategy = fleetfix::resolve_sync_strategy(fix_opts, engine.config());
    auto ctx = fleetfix::make_eligibility_context(target, strategy);
    if (!fleetfix::is_fix_action_eligible(*action, target.record, target.metadata, ctx)) {
        print_status(out, target, engine.eligible_actions(target));
        report_ineligible(err, *action, target.record.name,
                          fleetfix::ineligible_fix_reason(*action, target.record, ctx));
        return 1;
    }

    fleetfix::FixRepoState result;
    try {
        result = engine.apply_fix_action(
            opts.catalogs, target.record.path, *action, fix_opts,
            [&out](const fleetfix::StepEvent& event) { print_step(out, event); });
    } catch (const fleetfix::FixIneligibleError& e) {
        report_ineligible(err, *action, target.record.name, e.reason());
        return 1;
    }
    out << "applied " << fleetfix::to_string(*action) << " to " << result.record.name << "\n";
    print_status(out, result, engine.eligible_actions(result));
    return result.record.syncable ? 0 : 1;
}

int run_list(const Options& opts, fleetfix::FixEngine& engine, std::ostream& out) {
    auto repos = engine.load_fix_repos(opts.catalogs, opts.refresh);
    for (const auto& r : repos) {
        out << r.record.name << "\t" << (r.record.syncable ? "syncable" : "unsyncable") << "\t"
            << r.record.path.string() << "\t" << action_list(engine.eligible_actions(r)) << "\n";
    }
    return 0;
}

} // namespace cli
