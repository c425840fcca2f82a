#include "render.h"

namespace hosthealth {

using json = nlohmann::json;

/*
JSON contract
=============

  {
    "GeneratedAt": "2026-10-19T12:34:56.123Z",
    "Sections": [
      { "Title": "System", "Severity": "info",
        "Data": { ComputerName, UserName, OSVersion, Kernel, IsAdmin, Uptime, Timestamp } },
      { "Title": "CPU", ...
        "Data": { Name, Cores, LogicalProcessors, LoadPercent, PerCore[], Source } },
      { "Title": "Memory - ...",
        "Data": { TotalGB, UsedGB, FreeGB, UsedPct, FreePct, Status } },
      { "Title": "Volumes - ...",
        "Data": { "<mount>": { TotalGB, UsedGB, FreeGB, UsedPct, FreePct, Severity, Status,
                               FileSystem, Source } } },
      { "Title": "Physical Disks",
        "Data": { "<friendly name>": { HealthStatus, OperationalStatus, MediaType, SizeGB, Device } }
             |  { "Unavailable": true, "Message" }
             |  { "NoDevices": true, "Message" } }
    ]
  }

A failed probe's Data is { Error: true, Message, Category, FullyQualifiedId }.
Absent numbers are null, except a volume's UsedPct which is omitted.
*/

template <typename T>
static json opt_or_null(const std::optional<T>& v) {
    if (v) return json(*v);
    return json(nullptr);
}

static json to_json_value(const SystemInfo& s) {
    return json{
        {"ComputerName", s.computer_name},
        {"UserName", s.user_name},
        {"OSVersion", s.os_version},
        {"Kernel", s.kernel},
        {"IsAdmin", s.is_admin},
        {"Uptime", s.uptime},
        {"Timestamp", s.timestamp}
    };
}

static json to_json_value(const CpuInfo& c) {
    json per_core = json::array();
    for (int p : c.per_core) per_core.push_back(p);
    return json{
        {"Name", c.name},
        {"Cores", c.cores},
        {"LogicalProcessors", c.logical_processors},
        {"LoadPercent", opt_or_null(c.load_percent)},
        {"PerCore", std::move(per_core)},
        {"Source", c.source}
    };
}

static json to_json_value(const MemoryInfo& m) {
    return json{
        {"TotalGB", m.total_gb},
        {"UsedGB", m.used_gb},
        {"FreeGB", m.free_gb},
        {"UsedPct", m.used_pct},
        {"FreePct", opt_or_null(m.free_pct)},
        {"Status", m.status}
    };
}

static json to_json_value(const VolumeMap& vols) {
    json out = json::object();
    for (const auto& kv : vols) {
        const VolumeRecord& v = kv.second;
        json row = {
            {"TotalGB", v.total_gb},
            {"UsedGB", v.used_gb},
            {"FreeGB", v.free_gb},
            {"FreePct", opt_or_null(v.free_pct)},
            {"Status", v.status},
            {"FileSystem", v.filesystem},
            {"Source", v.source}
        };
        if (v.used_pct) row["UsedPct"] = *v.used_pct;
        row["Severity"] = v.severity ? json(severity_str(*v.severity)) : json(nullptr);
        out[kv.first] = std::move(row);
    }
    return out;
}

static json to_json_value(const PhysicalDiskReport& r) {
    switch (r.state) {
        case PhysicalDiskReport::State::Unavailable:
            return json{{"Unavailable", true}, {"Message", r.message}};
        case PhysicalDiskReport::State::NoDevices:
            return json{{"NoDevices", true}, {"Message", r.message}};
        case PhysicalDiskReport::State::Devices:
            break;
    }

    json out = json::object();
    for (const auto& kv : r.disks) {
        const PhysicalDisk& d = kv.second;
        out[kv.first] = {
            {"HealthStatus", d.health_status},
            {"OperationalStatus", d.operational_status},
            {"MediaType", d.media_type},
            {"SizeGB", d.size_gb},
            {"Device", d.device}
        };
    }
    return out;
}

static json to_json_value(const ProbeFailure& f) {
    return json{
        {"Error", true},
        {"Message", f.message},
        {"Category", f.category},
        {"FullyQualifiedId", f.fully_qualified_id}
    };
}

json section_data_to_json(const SectionData& d) {
    return std::visit([](const auto& v) { return to_json_value(v); }, d);
}

json report_to_json(const Report& r) {
    json sections = json::array();
    for (const auto& s : r.sections) {
        sections.push_back({
            {"Title", s.title},
            {"Data", section_data_to_json(s.data)},
            {"Severity", severity_str(s.severity)}
        });
    }
    return json{
        {"GeneratedAt", r.generated_at},
        {"Sections", std::move(sections)}
    };
}

// Host strings (mount points, disk models, hostnames) are raw bytes and need
// not be UTF-8; invalid sequences are written as U+FFFD.
std::string render_json(const Report& r) {
    return report_to_json(r).dump(2, ' ', false, json::error_handler_t::replace);
}

} // namespace hosthealth
