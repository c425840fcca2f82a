#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "config.h"
#include "report.h"

namespace hosthealth::probes {

    // One "cpu..." row of /proc/stat.
    struct CpuJiffies {
        std::string name;   // "cpu", "cpu0", ...
        std::uint64_t user = 0, nice = 0, system = 0, idle = 0, iowait = 0, irq = 0, softirq = 0, steal = 0;
    };

    // Parses the cpu rows of a /proc/stat document.
    std::vector<CpuJiffies> parse_proc_stat_cpu(const std::string& text);

    // Drops the aggregate "cpu" row and orders cpuN rows by N (not lexically).
    std::vector<CpuJiffies> per_core_rows(std::vector<CpuJiffies> rows);

    // Busy share of the deltas between two reads of the same cores, rounded
    // to integer percent. Cores missing from either read, with a counter
    // reset, or with no elapsed jiffies are skipped.
    std::vector<int> busy_between(const std::vector<CpuJiffies>& prev,
                                  const std::vector<CpuJiffies>& cur);

    // Rounded arithmetic mean (0 for an empty input).
    int mean_rounded(const std::vector<int>& v);

    // What one load tier produced.
    struct CpuLoadSample {
        std::vector<int> per_core;
        std::optional<int> overall;   // set directly only by tiers without per-core data
        std::string source;
    };

    // One tier of the fallback chain. acquire() may throw or return nullopt;
    // either moves on to the next tier.
    struct CpuLoadStrategy {
        std::string name;
        std::function<std::optional<CpuLoadSample>()> acquire;
    };

    /*
    Walks the chain in order and returns the first usable sample:
      - a sample with a non-empty per-core array wins immediately and its
        overall load is mean_rounded(per_core);
      - a sample with only an overall value is kept and the walk continues,
        so a later tier with per-core data is still preferred;
    Later tiers are never invoked once a per-core sample has been found.
    Returns nullopt when no tier produced anything.
    */
    std::optional<CpuLoadSample> acquire_cpu_load(const std::vector<CpuLoadStrategy>& chain);

    // Runs between the two /proc/stat reads of the sample tier.
    using SampleWait = std::function<void()>;

    // Two reads of <proc>/stat separated by wait(); per-core busy share of
    // the deltas. nullopt when no core accumulated any jiffies.
    std::optional<CpuLoadSample> sample_proc_stat(const std::string& stat_path, const SampleWait& wait);

    // sample (1 s) -> loadavg. An empty wait sleeps one second.
    std::vector<CpuLoadStrategy> default_cpu_strategies(const InstrumentationRoots& roots,
                                                        SampleWait wait = SampleWait());

    struct CpuTopology {
        std::string name;
        int cores = 0;
        int logical_processors = 0;
    };

    // From a /proc/cpuinfo document.
    CpuTopology parse_cpuinfo(const std::string& text);

    // Legacy single load value: 1-min loadavg / logical cpus * 100, clamped, rounded.
    std::optional<int> loadavg_percent(const std::string& loadavg_text, int logical_processors);

    CpuInfo probe_cpu(const InstrumentationRoots& roots,
                      const std::vector<CpuLoadStrategy>& chain);

} // namespace hosthealth::probes
