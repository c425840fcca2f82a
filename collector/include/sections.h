#pragma once
#include <optional>
#include <string>
#include <variant>

#include "report.h"

namespace hosthealth {

// Raw probe output: domain data, or the failure it was converted into.
template <typename T>
using ProbeResult = std::variant<T, ProbeFailure>;

template <typename T>
bool probe_ok(const ProbeResult<T>& r) { return std::holds_alternative<T>(r); }

ProbeFailure make_probe_failure(const std::string& probe_name,
                                const std::string& category,
                                const std::string& message);

namespace detail {
    // Classifies the in-flight exception. Must be called from a catch block.
    ProbeFailure failure_from_current_exception(const std::string& probe_name);
}

// Invokes a probe and contains anything it throws.
// This is the only place probe exceptions are caught.
template <typename T, typename Fn>
ProbeResult<T> run_probe(const std::string& probe_name, Fn&& fn) {
    try {
        return ProbeResult<T>(std::in_place_index<0>, fn());
    } catch (...) {
        return ProbeResult<T>(std::in_place_index<1>,
                              detail::failure_from_current_exception(probe_name));
    }
}

// Volume rollup computed across all measured volumes.
struct VolumeAggregate {
    Severity worst = Severity::Info;
    std::optional<double> max_used;
    std::optional<double> min_free;
};

// Annotates each record with free_pct/severity/status and returns the rollup.
// A record without used_pct is non-conforming: it gets Warn/"Unknown" and
// lifts the rollup to at least Warn.
VolumeAggregate aggregate_volumes(VolumeMap& volumes);

// "85.3" or "n/a"
std::string format_pct_or_na(const std::optional<double>& pct);

Section build_system_section(ProbeResult<SystemInfo> r);
Section build_cpu_section(ProbeResult<CpuInfo> r);
Section build_memory_section(ProbeResult<MemoryInfo> r);
Section build_volumes_section(ProbeResult<VolumeMap> r);
Section build_physical_disks_section(ProbeResult<PhysicalDiskReport> r);

} // namespace hosthealth
