#include "cli_options.h"

#include "errors.h"
#include "test_support.h"

using namespace stock_dbn;

static int test_run_with_flags()
{
    CliOptions options;
    bool ok = parse_cli_options({"run", "bars.csv", "--decay=0.9", "--checkpoint=out.json", "--log-level=debug"},
                                options);
    EXPECT(ok, "valid command line");
    EXPECT(options.command == "run" && options.path == "bars.csv", "command and path");
    EXPECT(options.config.decay == 0.9, "option flag applied");
    EXPECT(options.checkpoint == "out.json", "checkpoint path");
    EXPECT(options.log_level == "debug", "log level");
    return 0;
}

static int test_usage_errors()
{
    CliOptions a;
    EXPECT(!parse_cli_options({"run"}, a), "missing path");
    CliOptions b;
    EXPECT(!parse_cli_options({"train", "bars.csv"}, b), "unknown command");
    CliOptions c;
    EXPECT(!parse_cli_options({"run", "bars.csv", "--verbose"}, c), "unknown flag");
    CliOptions d;
    EXPECT_THROWS(parse_cli_options({"run", "bars.csv", "--decay=2"}, d), ConfigError, "decay out of range");
    return 0;
}

static int test_log_level_validated()
{
    EXPECT(is_log_level("warn") && is_log_level("off"), "known levels");
    EXPECT(!is_log_level("loud") && !is_log_level(""), "unknown levels");
    CliOptions options;
    EXPECT(!parse_cli_options({"run", "bars.csv", "--log-level=loud"}, options), "bad level is a usage error");
    return 0;
}

static int test_resume_rejects_overrides()
{
    CliOptions plain;
    EXPECT(parse_cli_options({"run", "bars.csv", "--resume=state.json", "--checkpoint=next.json"}, plain),
           "resume with output flags only");
    EXPECT(plain.resume == "state.json", "resume path");

    CliOptions with_option;
    EXPECT(!parse_cli_options({"run", "bars.csv", "--resume=state.json", "--forecastHorizon=3"}, with_option),
           "option flag ignored by resume is refused");
    CliOptions with_decay;
    EXPECT(!parse_cli_options({"export", "out.json", "--decay=0.5", "--resume=state.json"}, with_decay),
           "order does not matter");
    return 0;
}

int main()
{
    if (test_run_with_flags() != 0) return 1;
    if (test_usage_errors() != 0) return 1;
    if (test_log_level_validated() != 0) return 1;
    if (test_resume_rejects_overrides() != 0) return 1;
    return 0;
}
