#ifndef ARG_PARSER_HPP
#define ARG_PARSER_HPP
#include <string>
#include <set>
#include <vector>
#include <map>

/**
 * @brief Simple command line argument parser.
 *
 * Long options are written `--flag`, `--opt value` or `--opt=value`. Only
 * options listed in @a value_flags consume the following argument, so a
 * boolean flag never swallows a positional. A mapping of short options (like
 * `-h`) to their long counterparts can optionally be supplied; stacked short
 * flags such as `-vh` are expanded. Everything after `--` is positional.
 */
class ArgParser {
    std::set<std::string> flags_;                ///< Flags present on the command line
    std::map<std::string, std::string> options_; ///< Last value for each option
    std::map<std::string, std::vector<std::string>>
        multi_options_;                      ///< All values for repeatable options
    std::vector<std::string> positional_;    ///< Positional arguments in order
    std::vector<std::string> unknown_flags_; ///< Flags not present in known_flags
    std::vector<std::string> missing_values_; ///< Value options given without a value
    std::set<std::string> known_flags_;      ///< Accepted flags, empty accepts all
    std::set<std::string> value_flags_;      ///< Flags that take a value
    std::map<char, std::string> short_map_;  ///< Mapping of short to long flags

    bool known(const std::string& key) const {
        return known_flags_.empty() || known_flags_.count(key) > 0;
    }

    void store(const std::string& key, const std::string& val) {
        flags_.insert(key);
        options_[key] = val;
        multi_options_[key].push_back(val);
    }

  public:
    /**
     * @brief Parse the given command line arguments.
     *
     * @param argc Argument count from `main`.
     * @param argv Argument vector from `main`.
     * @param known_flags Flags that are considered valid. If empty, all flags
     *        are treated as known.
     * @param value_flags Flags whose value is the next argument when not
     *        given with `=`.
     * @param short_map Mapping from single character options (e.g. '-h') to
     *        their long form (e.g. '--help').
     */
    ArgParser(int argc, char* argv[], const std::set<std::string>& known_flags = {},
              const std::set<std::string>& value_flags = {},
              const std::map<char, std::string>& short_map = {})
        : known_flags_(known_flags), value_flags_(value_flags), short_map_(short_map) {
        bool options_done = false;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (options_done || arg == "-" || arg.empty() || arg[0] != '-') {
                positional_.push_back(arg);
                continue;
            }
            if (arg == "--") {
                options_done = true;
                continue;
            }
            if (arg.rfind("--", 0) == 0) {
                size_t eq = arg.find('=');
                std::string key = arg.substr(0, eq);
                if (!known(key)) {
                    unknown_flags_.push_back(key);
                    continue;
                }
                if (eq != std::string::npos) {
                    store(key, arg.substr(eq + 1));
                } else if (value_flags_.count(key)) {
                    if (i + 1 < argc)
                        store(key, argv[++i]);
                    else
                        missing_values_.push_back(key);
                } else {
                    flags_.insert(key);
                }
                continue;
            }
            // Short flags, possibly stacked; a value flag takes the rest of
            // the argument or the next one.
            for (size_t j = 1; j < arg.size(); ++j) {
                auto it = short_map_.find(arg[j]);
                if (it == short_map_.end() || !known(it->second)) {
                    unknown_flags_.push_back(std::string("-") + arg[j]);
                    break;
                }
                const std::string& key = it->second;
                if (!value_flags_.count(key)) {
                    flags_.insert(key);
                    continue;
                }
                std::string rest = arg.substr(j + 1);
                if (!rest.empty() && rest[0] == '=')
                    rest.erase(0, 1);
                if (!rest.empty())
                    store(key, rest);
                else if (i + 1 < argc)
                    store(key, argv[++i]);
                else
                    missing_values_.push_back(key);
                break;
            }
        }
    }

    /**
     * @brief Check whether a flag was provided on the command line.
     *
     * @param flag Flag name including the leading `--`.
     */
    bool has_flag(const std::string& flag) const { return flags_.count(flag) > 0; }

    /**
     * @brief Retrieve the last value given for an option.
     *
     * @return Stored option value or empty string if missing.
     */
    std::string get_option(const std::string& opt) const {
        auto it = options_.find(opt);
        if (it != options_.end())
            return it->second;
        return "";
    }

    /**
     * @brief Retrieve all values associated with a repeatable option.
     */
    std::vector<std::string> get_all_options(const std::string& opt) const {
        auto it = multi_options_.find(opt);
        if (it != multi_options_.end())
            return it->second;
        return {};
    }

    const std::set<std::string>& flags() const { return flags_; }
    const std::map<std::string, std::string>& options() const { return options_; }
    const std::vector<std::string>& positional() const { return positional_; }
    const std::vector<std::string>& unknown_flags() const { return unknown_flags_; }
    const std::vector<std::string>& missing_values() const { return missing_values_; }
};

#endif // ARG_PARSER_HPP
