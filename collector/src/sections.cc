#include "sections.h"

#include <exception>
#include <system_error>

#include <nlohmann/json.hpp>

#include "hh_util.h"
#include "probes/probe_error.h"

namespace hosthealth {

/*
Section aggregator
==================

Turns raw probe results into Sections:

  System, CPU      informational, Severity::Info (Warn if the probe failed)
  Memory           used_pct classified against 80/90
  Volumes          each volume classified against 85/90, then rolled up
  Physical Disks   Warn only if the probe failed; the Unavailable/NoDevices
                   markers are not errors

Missing data is a caution signal: whenever a percentage cannot be obtained
the Section is Warn, never Info and never Error.
*/

ProbeFailure make_probe_failure(const std::string& probe_name,
                                const std::string& category,
                                const std::string& message) {
    ProbeFailure f;
    f.message = message;
    f.category = category;
    f.fully_qualified_id = probe_name + "," + category;
    return f;
}

namespace detail {

ProbeFailure failure_from_current_exception(const std::string& probe_name) {
    try {
        throw;
    } catch (const probes::ProbeError& e) {
        return make_probe_failure(probe_name, e.category(), e.what());
    } catch (const nlohmann::json::exception& e) {
        return make_probe_failure(probe_name, "ParseError", e.what());
    } catch (const std::system_error& e) {
        return make_probe_failure(probe_name, "SystemError", e.what());
    } catch (const std::exception& e) {
        return make_probe_failure(probe_name, "Unexpected", e.what());
    } catch (...) {
        return make_probe_failure(probe_name, "Unexpected", "non-standard exception");
    }
}

} // namespace detail

std::string format_pct_or_na(const std::optional<double>& pct) {
    if (!pct) return "n/a";
    return format_fixed(*pct, 1);
}

static std::string thresholds_text(const Thresholds& t) {
    return "warn " + format_fixed(t.warn, 0) + "% / crit " + format_fixed(t.error, 0) + "%";
}

Section build_system_section(ProbeResult<SystemInfo> r) {
    Section s;
    s.kind = SectionKind::System;
    s.title = "System";
    s.severity = probe_ok(r) ? Severity::Info : Severity::Warn;
    if (probe_ok(r)) s.data = std::move(std::get<SystemInfo>(r));
    else s.data = std::move(std::get<ProbeFailure>(r));
    return s;
}

Section build_cpu_section(ProbeResult<CpuInfo> r) {
    Section s;
    s.kind = SectionKind::Cpu;
    s.title = "CPU";
    s.severity = probe_ok(r) ? Severity::Info : Severity::Warn;
    if (probe_ok(r)) s.data = std::move(std::get<CpuInfo>(r));
    else s.data = std::move(std::get<ProbeFailure>(r));
    return s;
}

Section build_memory_section(ProbeResult<MemoryInfo> r) {
    Section s;
    s.kind = SectionKind::Memory;

    std::optional<double> used;
    if (probe_ok(r)) {
        MemoryInfo m = std::move(std::get<MemoryInfo>(r));
        used = m.used_pct;
        s.severity = classify(m.used_pct, kMemoryThresholds);
        m.free_pct = round_to(100.0 - m.used_pct, 2);
        m.status = severity_label(s.severity);
        s.data = std::move(m);
    } else {
        s.severity = Severity::Warn;
        s.data = std::move(std::get<ProbeFailure>(r));
    }

    s.title = std::string("Memory - ") + severity_label(s.severity) +
              " (" + thresholds_text(kMemoryThresholds) +
              ", used " + format_pct_or_na(used) + (used ? "%" : "") + ")";
    return s;
}

VolumeAggregate aggregate_volumes(VolumeMap& volumes) {
    VolumeAggregate agg;

    for (auto& kv : volumes) {
        VolumeRecord& v = kv.second;

        if (!v.used_pct) {
            // Non-conforming record: nothing to classify.
            v.free_pct.reset();
            v.severity = Severity::Warn;
            v.status = "Unknown";
            agg.worst = worst_of(agg.worst, Severity::Warn);
            continue;
        }

        const double used = *v.used_pct;
        const double free_pct = round_to(100.0 - used, 2);
        const Severity sev = classify(used, kVolumeThresholds);

        v.free_pct = free_pct;
        v.severity = sev;
        v.status = severity_label(sev);

        agg.worst = worst_of(agg.worst, sev);
        if (!agg.max_used || used > *agg.max_used) agg.max_used = used;
        if (!agg.min_free || free_pct < *agg.min_free) agg.min_free = free_pct;
    }

    return agg;
}

Section build_volumes_section(ProbeResult<VolumeMap> r) {
    Section s;
    s.kind = SectionKind::Volumes;

    VolumeAggregate agg;
    if (probe_ok(r)) {
        VolumeMap vols = std::move(std::get<VolumeMap>(r));
        agg = aggregate_volumes(vols);
        s.severity = agg.worst;
        s.data = std::move(vols);
    } else {
        s.severity = Severity::Warn;
        s.data = std::move(std::get<ProbeFailure>(r));
    }

    s.title = std::string("Volumes - ") + severity_label(s.severity) +
              " (" + thresholds_text(kVolumeThresholds) +
              ", max used " + format_pct_or_na(agg.max_used) + (agg.max_used ? "%" : "") +
              ", min free " + format_pct_or_na(agg.min_free) + (agg.min_free ? "%" : "") + ")";
    return s;
}

Section build_physical_disks_section(ProbeResult<PhysicalDiskReport> r) {
    Section s;
    s.kind = SectionKind::PhysicalDisks;
    s.title = "Physical Disks";
    if (probe_ok(r)) {
        s.severity = Severity::Info;
        s.data = std::move(std::get<PhysicalDiskReport>(r));
    } else {
        s.severity = Severity::Warn;
        s.data = std::move(std::get<ProbeFailure>(r));
    }
    return s;
}

} // namespace hosthealth
