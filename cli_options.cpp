#include "cli_options.h"

#include <spdlog/spdlog.h>

namespace stock_dbn {

namespace {

bool take_flag(const std::string& arg, const std::string& name, std::string& value) {
    std::string prefix = "--" + name + "=";
    if (arg.compare(0, prefix.size(), prefix) != 0) return false;
    value = arg.substr(prefix.size());
    return true;
}

}  // namespace

bool is_log_level(const std::string& name) {
    static const char* const levels[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};
    for (const char* level : levels) {
        if (name == level) return true;
    }
    return false;
}

bool parse_cli_options(const std::vector<std::string>& all_args, CliOptions& options) {
    if (all_args.size() < 2) return false;
    options.command = all_args[0];
    options.path = all_args[1];
    if (options.command != "run" && options.command != "export") {
        spdlog::error("unknown command '{}'", options.command);
        return false;
    }
    std::vector<std::string> args(all_args.begin() + 2, all_args.end());

    // The configuration file is read first so flags can override it.
    std::string config_path;
    for (const std::string& arg : args) {
        take_flag(arg, "config", config_path);
    }
    if (!config_path.empty()) {
        options.config = Config::load_file(config_path);
    }
    std::vector<std::string> rest = options.config.apply_flags(args);
    bool overrides = !config_path.empty() || rest.size() != args.size();

    for (const std::string& arg : rest) {
        std::string ignored;
        if (take_flag(arg, "config", ignored)) continue;
        if (take_flag(arg, "bars", options.bars)) continue;
        if (take_flag(arg, "checkpoint", options.checkpoint)) continue;
        if (take_flag(arg, "resume", options.resume)) continue;
        if (take_flag(arg, "log-level", options.log_level)) continue;
        spdlog::error("unknown argument: {}", arg);
        return false;
    }
    if (!is_log_level(options.log_level)) {
        spdlog::error("--log-level must be one of trace, debug, info, warn, error, critical, off; got '{}'",
                      options.log_level);
        return false;
    }
    if (!options.resume.empty() && overrides) {
        spdlog::error("--resume takes its configuration from the checkpoint; drop --config and option flags");
        return false;
    }
    options.config.validate();
    return true;
}

}  // namespace stock_dbn
