#pragma once
#include <ctime>
#include <string>

#include "config.h"

namespace hosthealth {

struct CliOptions {
    bool json = false;
    bool to_stdout = false;
    bool help = false;
    std::string out_path;
    std::string config_path;
    std::string verify_log_path;   // check a run log's hash chain instead of collecting
};

// Accepts --json, --stdout, --out PATH, --out=PATH, --config PATH,
// --config=PATH, --verify-log PATH, --verify-log=PATH, --help/-h.
// Returns false with *err on anything else.
bool parse_cli(int argc, const char* const* argv, CliOptions* out, std::string* err);

std::string usage_text(const char* prog);

// $HOME, else the passwd entry of the effective user, else ".".
std::string home_directory();

// <dir>/HostHealth_<yyyyMMdd_HHmmss>.html|.json (local time)
std::string default_output_path(const std::string& dir, bool json, std::time_t now);

// HOSTHEALTH_PROC_ROOT, HOSTHEALTH_SYS_ROOT, HOSTHEALTH_ETC_ROOT,
// HOSTHEALTH_LOG_LEVEL, HOSTHEALTH_RUN_LOG
void apply_env_overrides(CollectorConfig* cfg);

} // namespace hosthealth
