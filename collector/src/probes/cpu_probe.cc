#include "cpu_probe.h"

#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <map>
#include <set>
#include <sstream>
#include <thread>
#include <utility>

#include "hh_util.h"
#include "diag.h"
#include "probe_error.h"

namespace hosthealth::probes {

/*
CPU probe
=========

Name and topology come from /proc/cpuinfo. Load comes from an ordered chain
of tiers, each independently testable:

  1. sample     two reads of the per-processor jiffies in /proc/stat one
                second apart; busy share of the deltas
  2. loadavg    single value derived from /proc/loadavg, no per-core detail

The cumulative counters alone are never reported: they average over the
whole uptime and say nothing about current load.

The one-second wait in tier 1 is the only blocking operation of a run. It is
single-shot; there is no retry loop.
*/

static inline std::uint64_t idle_all(const CpuJiffies& c) { return c.idle + c.iowait; }
static inline std::uint64_t total_all(const CpuJiffies& c) {
    return c.user + c.nice + c.system + c.irq + c.softirq + c.steal + idle_all(c);
}

// "cpu12" -> 12; -1 for the aggregate row or anything non-numeric.
static long core_index(const std::string& name) {
    if (name.size() <= 3 || name.compare(0, 3, "cpu") != 0) return -1;
    long idx = 0;
    for (size_t i = 3; i < name.size(); i++) {
        const char c = name[i];
        if (c < '0' || c > '9') return -1;
        idx = idx * 10 + (c - '0');
    }
    return idx;
}

static int pct_rounded(std::uint64_t busy, std::uint64_t total) {
    if (total == 0) return 0;
    double pct = (double)busy * 100.0 / (double)total;
    if (pct < 0.0) pct = 0.0;
    if (pct > 100.0) pct = 100.0;
    return (int)std::lround(pct);
}

std::vector<CpuJiffies> parse_proc_stat_cpu(const std::string& text) {
    std::vector<CpuJiffies> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (line.rfind("cpu", 0) != 0) continue;

        CpuJiffies c;
        std::istringstream iss(line);
        iss >> c.name;
        if (c.name.empty()) continue;

        // cpuN user nice system idle iowait irq softirq steal ...
        if (!(iss >> c.user >> c.nice >> c.system >> c.idle)) continue;
        if (!(iss >> c.iowait)) c.iowait = 0;
        if (!(iss >> c.irq)) c.irq = 0;
        if (!(iss >> c.softirq)) c.softirq = 0;
        if (!(iss >> c.steal)) c.steal = 0;

        out.push_back(c);
    }
    return out;
}

std::vector<CpuJiffies> per_core_rows(std::vector<CpuJiffies> rows) {
    rows.erase(std::remove_if(rows.begin(), rows.end(),
                              [](const CpuJiffies& c) { return core_index(c.name) < 0; }),
               rows.end());
    std::stable_sort(rows.begin(), rows.end(), [](const CpuJiffies& a, const CpuJiffies& b) {
        return core_index(a.name) < core_index(b.name);
    });
    return rows;
}

std::vector<int> busy_between(const std::vector<CpuJiffies>& prev,
                              const std::vector<CpuJiffies>& cur) {
    std::map<std::string, const CpuJiffies*> before;
    for (const auto& p : prev) before[p.name] = &p;

    std::vector<int> out;
    for (const auto& c : cur) {
        auto it = before.find(c.name);
        if (it == before.end()) continue;
        const CpuJiffies& p = *it->second;

        const std::uint64_t t1 = total_all(p), t2 = total_all(c);
        const std::uint64_t i1 = idle_all(p), i2 = idle_all(c);
        if (t2 < t1 || i2 < i1) continue; // counter reset (hotplug)

        const std::uint64_t totald = t2 - t1;
        const std::uint64_t idled = i2 - i1;
        if (totald == 0) continue;
        out.push_back(pct_rounded(totald >= idled ? totald - idled : 0, totald));
    }
    return out;
}

int mean_rounded(const std::vector<int>& v) {
    if (v.empty()) return 0;
    double sum = 0.0;
    for (int x : v) sum += x;
    return (int)std::lround(sum / (double)v.size());
}

std::optional<CpuLoadSample> acquire_cpu_load(const std::vector<CpuLoadStrategy>& chain) {
    std::optional<CpuLoadSample> scalar_only;

    for (const auto& tier : chain) {
        std::optional<CpuLoadSample> s;
        try {
            if (tier.acquire) s = tier.acquire();
        } catch (const std::exception& e) {
            diag_debug("cpu", "tier " + tier.name + " failed: " + e.what());
            continue;
        } catch (...) {
            diag_debug("cpu", "tier " + tier.name + " failed: non-standard exception");
            continue;
        }

        if (!s) {
            diag_debug("cpu", "tier " + tier.name + " yielded nothing");
            continue;
        }

        if (s->source.empty()) s->source = tier.name;

        if (!s->per_core.empty()) {
            s->overall = mean_rounded(s->per_core);
            diag_debug("cpu", "using tier " + tier.name);
            return s;
        }

        if (s->overall && !scalar_only) scalar_only = std::move(s);
        else diag_debug("cpu", "tier " + tier.name + " yielded no per-core data");
    }

    return scalar_only;
}

static std::vector<CpuJiffies> read_core_rows(const std::string& stat_path) {
    std::string text, err;
    if (!read_text_file(stat_path, &text, &err)) throw_read_error(err);
    return per_core_rows(parse_proc_stat_cpu(text));
}

static int logical_from_sysconf() {
    long n = ::sysconf(_SC_NPROCESSORS_ONLN);
    return n < 1 ? 1 : (int)n;
}

std::optional<CpuLoadSample> sample_proc_stat(const std::string& stat_path, const SampleWait& wait) {
    auto before = read_core_rows(stat_path);
    if (before.empty()) return std::nullopt;
    if (wait) wait();
    auto after = read_core_rows(stat_path);

    CpuLoadSample s;
    s.per_core = busy_between(before, after);
    if (s.per_core.empty()) return std::nullopt;
    s.source = "sample";
    return s;
}

std::vector<CpuLoadStrategy> default_cpu_strategies(const InstrumentationRoots& roots, SampleWait wait) {
    const std::string stat_path = join_path(roots.proc, "stat");
    const std::string loadavg_path = join_path(roots.proc, "loadavg");
    const std::string cpuinfo_path = join_path(roots.proc, "cpuinfo");

    if (!wait) wait = []() { std::this_thread::sleep_for(std::chrono::seconds(1)); };

    std::vector<CpuLoadStrategy> chain;

    chain.push_back({"sample", [stat_path, wait]() {
        return sample_proc_stat(stat_path, wait);
    }});

    chain.push_back({"loadavg", [loadavg_path, cpuinfo_path]() -> std::optional<CpuLoadSample> {
        std::string text, err;
        if (!read_text_file(loadavg_path, &text, &err)) throw_read_error(err);

        int logical = 0;
        std::string info;
        if (read_text_file(cpuinfo_path, &info, nullptr)) logical = parse_cpuinfo(info).logical_processors;
        if (logical < 1) logical = logical_from_sysconf();

        auto pct = loadavg_percent(text, logical);
        if (!pct) return std::nullopt;
        CpuLoadSample s;
        s.overall = pct;
        s.source = "loadavg";
        return s;
    }});

    return chain;
}

CpuTopology parse_cpuinfo(const std::string& text) {
    CpuTopology t;

    std::map<std::string, int> package_cores;              // physical id -> cpu cores
    std::set<std::pair<std::string, std::string>> core_ids; // (physical id, core id)
    std::string fallback_name;

    std::string cur_pkg, cur_core;
    int cur_cpu_cores = 0;
    bool in_block = false;

    auto close_block = [&]() {
        if (!in_block) return;
        if (!cur_pkg.empty()) {
            if (cur_cpu_cores > 0 && !package_cores.count(cur_pkg)) package_cores[cur_pkg] = cur_cpu_cores;
            if (!cur_core.empty()) core_ids.insert({cur_pkg, cur_core});
        }
        cur_pkg.clear();
        cur_core.clear();
        cur_cpu_cores = 0;
        in_block = false;
    };

    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (trim_ws(line).empty()) { close_block(); continue; }

        auto pos = line.find(':');
        if (pos == std::string::npos) continue;
        const std::string key = trim_ws(line.substr(0, pos));
        const std::string val = trim_ws(line.substr(pos + 1));

        if (key == "processor") {
            close_block();
            in_block = true;
            t.logical_processors++;
        } else if (key == "model name") {
            if (t.name.empty()) t.name = val;
        } else if (key == "Hardware" || key == "cpu model" || key == "Processor") {
            if (fallback_name.empty()) fallback_name = val;
        } else if (key == "physical id") {
            cur_pkg = val;
        } else if (key == "core id") {
            cur_core = val;
        } else if (key == "cpu cores") {
            try { cur_cpu_cores = std::stoi(val); }
            catch (const std::exception&) { cur_cpu_cores = 0; }
        }
    }
    close_block();

    if (t.name.empty()) t.name = fallback_name;

    if (!package_cores.empty()) {
        for (const auto& kv : package_cores) t.cores += kv.second;
    } else if (!core_ids.empty()) {
        t.cores = (int)core_ids.size();
    } else {
        t.cores = t.logical_processors;
    }
    return t;
}

std::optional<int> loadavg_percent(const std::string& loadavg_text, int logical_processors) {
    std::istringstream iss(loadavg_text);
    double one = 0.0;
    if (!(iss >> one)) return std::nullopt;
    if (logical_processors < 1) logical_processors = 1;

    double pct = one / (double)logical_processors * 100.0;
    if (pct < 0.0) pct = 0.0;
    if (pct > 100.0) pct = 100.0;
    return (int)std::lround(pct);
}

CpuInfo probe_cpu(const InstrumentationRoots& roots,
                  const std::vector<CpuLoadStrategy>& chain) {
    CpuInfo out;

    std::string text;
    if (read_text_file(join_path(roots.proc, "cpuinfo"), &text, nullptr)) {
        CpuTopology t = parse_cpuinfo(text);
        out.name = t.name;
        out.cores = t.cores;
        out.logical_processors = t.logical_processors;
    }
    if (out.logical_processors < 1) out.logical_processors = logical_from_sysconf();
    if (out.cores < 1) out.cores = out.logical_processors;
    if (out.name.empty()) out.name = "Unknown";

    auto load = acquire_cpu_load(chain);
    if (load) {
        out.load_percent = load->overall;
        out.per_core = std::move(load->per_core);
        out.source = load->source;
    } else {
        out.load_percent.reset();
        out.per_core.clear();
        out.source = "none";
    }
    return out;
}

} // namespace hosthealth::probes
