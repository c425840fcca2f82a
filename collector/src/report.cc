#include "report.h"
#include "sections.h"
#include "hh_util.h"

#include <stdexcept>

namespace hosthealth {

const char* section_kind_name(SectionKind k) {
    switch (k) {
        case SectionKind::System:        return "System";
        case SectionKind::Cpu:           return "CPU";
        case SectionKind::Memory:        return "Memory";
        case SectionKind::Volumes:       return "Volumes";
        case SectionKind::PhysicalDisks: return "PhysicalDisks";
    }
    return "Unknown";
}

// Missing probe entries count as probe faults, not programming errors:
// the report still gets all five Sections.
template <typename T>
static ProbeResult<T> call_probe(const char* name, const std::function<T()>& fn) {
    return run_probe<T>(name, [&]() -> T {
        if (!fn) throw std::runtime_error(std::string("no probe bound for ") + name);
        return fn();
    });
}

Report assemble_report(const Probes& probes) {
    Report r;
    r.generated_at = now_iso_utc();
    r.sections.reserve(5);

    r.sections.push_back(build_system_section(call_probe<SystemInfo>("System", probes.system)));
    r.sections.push_back(build_cpu_section(call_probe<CpuInfo>("CPU", probes.cpu)));
    r.sections.push_back(build_memory_section(call_probe<MemoryInfo>("Memory", probes.memory)));
    r.sections.push_back(build_volumes_section(call_probe<VolumeMap>("Volumes", probes.volumes)));
    r.sections.push_back(build_physical_disks_section(
        call_probe<PhysicalDiskReport>("PhysicalDisks", probes.physical_disks)));

    return r;
}

Severity worst_severity(const Report& r) {
    Severity w = Severity::Info;
    for (const auto& s : r.sections) w = worst_of(w, s.severity);
    return w;
}

int exit_code_for(const Report& r) {
    switch (worst_severity(r)) {
        case Severity::Info:  return 0;
        case Severity::Warn:  return 2;
        case Severity::Error: return 3;
    }
    return 0;
}

const Section* find_section_by_title_prefix(const Report& r, const std::string& prefix) {
    for (const auto& s : r.sections) {
        if (s.title.rfind(prefix, 0) == 0) return &s;
    }
    return nullptr;
}

} // namespace hosthealth
