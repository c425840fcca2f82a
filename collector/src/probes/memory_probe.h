#pragma once
#include <cstdint>
#include <string>

#include "config.h"
#include "report.h"

namespace hosthealth::probes {

    struct MemInfoBytes {
        std::uint64_t total = 0;
        std::uint64_t available = 0;
    };

    // MemTotal and MemAvailable from a /proc/meminfo document. Kernels without
    // MemAvailable fall back to MemFree + Buffers + Cached.
    // Throws ProbeError("ParseError") if MemTotal is missing.
    MemInfoBytes parse_meminfo(const std::string& text);

    // GiB figures and used percent, all rounded to 2 decimals; used_pct is 0
    // when total is 0.
    MemoryInfo memory_from_bytes(const MemInfoBytes& m);

    MemoryInfo probe_memory(const InstrumentationRoots& roots);

} // namespace hosthealth::probes
