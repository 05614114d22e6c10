#pragma once

#include <string>
#include <vector>

#include "config.h"

namespace stock_dbn {

struct CliOptions {
    std::string command;
    std::string path;
    std::string bars;
    std::string checkpoint;
    std::string resume;
    std::string log_level = "info";
    Config config;
};

bool is_log_level(const std::string& name);

// args excludes the program name. Returns false on a usage error: missing
// arguments, unknown command or flag, a bad --log-level, or option flags
// combined with --resume (the checkpoint carries its own configuration).
// Throws ConfigError for an unreadable configuration file or a bad option value.
bool parse_cli_options(const std::vector<std::string>& args, CliOptions& options);

}  // namespace stock_dbn
