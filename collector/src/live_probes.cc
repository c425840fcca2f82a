#include "live_probes.h"

#include "probes/cpu_probe.h"
#include "probes/disk_health.h"
#include "probes/memory_probe.h"
#include "probes/physical_disk_probe.h"
#include "probes/system_probe.h"
#include "probes/volume_probe.h"

namespace hosthealth {

Probes default_probes(const CollectorConfig& cfg) {
    const InstrumentationRoots roots = cfg.roots;
    Probes p;

    p.system = [roots]() { return probes::probe_system(roots); };

    p.cpu = [roots]() {
        return probes::probe_cpu(roots, probes::default_cpu_strategies(roots));
    };

    p.memory = [roots]() { return probes::probe_memory(roots); };

    p.volumes = [roots]() { return probes::probe_volumes(roots, probes::statvfs_usage); };

    const bool use_smartctl = cfg.smartctl;
    const std::string smartctl_path = cfg.smartctl_path;
    p.physical_disks = [roots, use_smartctl, smartctl_path]() {
        auto inventory = probes::make_sysfs_inventory(roots.sys);
        auto health = use_smartctl ? probes::make_smartctl_health_provider(smartctl_path)
                                   : probes::make_unknown_health_provider();
        return probes::probe_physical_disks(*inventory, *health);
    };

    return p;
}

} // namespace hosthealth
