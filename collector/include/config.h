#pragma once
#include <string>

namespace hosthealth {

// Where probes read host instrumentation from. Defaults are the live host;
// tests and containers point these at other trees.
struct InstrumentationRoots {
    std::string proc = "/proc";
    std::string sys  = "/sys";
    std::string etc  = "/etc";
};

struct CollectorConfig {
    InstrumentationRoots roots;

    // Physical disk health via smartmontools. When disabled or missing,
    // health is reported as "Unknown".
    bool smartctl = true;
    std::string smartctl_path = "smartctl";

    // stderr diagnostics: quiet | info | debug
    std::string log_level = "info";

    // Hash-chained JSONL run log. Empty path disables it.
    std::string run_log_path;
    std::string run_log_min_level = "INFO";
};

/*
Load a JSON config file into *out. Keys not present keep their current value.

Expected format (every key optional):
{
  "roots": { "proc": "/proc", "sys": "/sys", "etc": "/etc" },
  "physical_disks": { "smartctl": true, "smartctl_path": "smartctl" },
  "log_level": "info",
  "run_log": { "path": "", "min_level": "INFO" }
}

Returns false with *err set on I/O, parse or type errors; *out is left
untouched in that case.
*/
bool load_config_file(const std::string& path, CollectorConfig* out, std::string* err);

// Same as load_config_file, from an in-memory document.
bool load_config_json(const std::string& text, CollectorConfig* out, std::string* err);

} // namespace hosthealth
