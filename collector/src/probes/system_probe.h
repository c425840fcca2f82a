#pragma once
#include <string>

#include "config.h"
#include "report.h"

namespace hosthealth::probes {

    // "{days}d {hours}h {minutes}m"; hours and minutes are remainders.
    // Negative input is treated as 0.
    std::string format_uptime(long long seconds);

    // Boot time (epoch seconds) from the "btime" row of /proc/stat, or -1.
    long long parse_btime(const std::string& proc_stat_text);

    // PRETTY_NAME from an os-release document ("" if absent).
    std::string parse_os_pretty_name(const std::string& os_release_text);

    SystemInfo probe_system(const InstrumentationRoots& roots);

} // namespace hosthealth::probes
