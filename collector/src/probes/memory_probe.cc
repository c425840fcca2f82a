#include "memory_probe.h"

#include <sstream>

#include "hh_util.h"
#include "probe_error.h"

namespace hosthealth::probes {

MemInfoBytes parse_meminfo(const std::string& text) {
    long long total_kb = -1, avail_kb = -1;
    long long free_kb = -1, buffers_kb = 0, cached_kb = 0;

    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        std::istringstream iss(line);
        std::string k;
        long long v = 0;
        if (!(iss >> k >> v)) continue;

        // MemTotal:       16303412 kB
        if (k == "MemTotal:") total_kb = v;
        else if (k == "MemAvailable:") avail_kb = v;
        else if (k == "MemFree:") free_kb = v;
        else if (k == "Buffers:") buffers_kb = v;
        else if (k == "Cached:") cached_kb = v;
    }

    if (total_kb < 0) throw_parse_error("meminfo: MemTotal not found");
    if (avail_kb < 0) {
        if (free_kb < 0) throw_parse_error("meminfo: neither MemAvailable nor MemFree found");
        avail_kb = free_kb + buffers_kb + cached_kb;
    }
    if (avail_kb > total_kb) avail_kb = total_kb;

    MemInfoBytes m;
    m.total = (std::uint64_t)total_kb * 1024ULL;
    m.available = (std::uint64_t)avail_kb * 1024ULL;
    return m;
}

MemoryInfo memory_from_bytes(const MemInfoBytes& m) {
    MemoryInfo out;
    const std::uint64_t used = m.total >= m.available ? m.total - m.available : 0;

    out.total_gb = bytes_to_gb(m.total);
    out.used_gb = bytes_to_gb(used);
    out.free_gb = bytes_to_gb(m.available);
    out.used_pct = m.total == 0 ? 0.0 : round_to((double)used * 100.0 / (double)m.total, 2);
    return out;
}

MemoryInfo probe_memory(const InstrumentationRoots& roots) {
    std::string text, err;
    if (!read_text_file(join_path(roots.proc, "meminfo"), &text, &err)) throw_read_error(err);
    return memory_from_bytes(parse_meminfo(text));
}

} // namespace hosthealth::probes
