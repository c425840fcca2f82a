#pragma once
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "severity.h"

namespace hosthealth {

/*
Report model
============

A Report is the single artifact a run produces:

  Report
    generated_at       ISO-8601 UTC, captured once when assembly starts
    sections[5]        System, CPU, Memory, Volumes, Physical Disks (fixed order)

Each Section carries a domain tag (SectionKind), a title, exactly one
Severity and a payload. The payload is a variant over the per-domain
records below plus ProbeFailure, so renderers dispatch on the tag and never
have to guess the shape of the data.

Ownership: the Report owns its Sections by value; Sections own their payload.
Nothing here is shared across runs.
*/

struct SystemInfo {
    std::string computer_name;
    std::string user_name;
    std::string os_version;
    std::string kernel;
    bool is_admin = false;
    std::string uptime;      // "{d}d {h}h {m}m"
    std::string timestamp;   // when the probe ran (ISO-8601 UTC)
};

struct CpuInfo {
    std::string name;
    int cores = 0;                     // physical, summed across packages
    int logical_processors = 0;
    std::optional<int> load_percent;   // null when every tier failed
    std::vector<int> per_core;         // cpu0..cpuN, empty for the loadavg tier
    std::string source = "none";       // "sample" | "loadavg" | "none"
};

struct MemoryInfo {
    double total_gb = 0.0;
    double used_gb = 0.0;
    double free_gb = 0.0;
    double used_pct = 0.0;

    // Derived by the aggregator.
    std::optional<double> free_pct;
    std::string status;
};

struct VolumeRecord {
    double total_gb = 0.0;
    double used_gb = 0.0;
    double free_gb = 0.0;
    std::optional<double> used_pct;    // absent: the volume could not be measured
    std::string filesystem;
    std::string source;

    // Derived by the aggregator.
    std::optional<double> free_pct;
    std::optional<Severity> severity;
    std::string status;
};

// Keyed by mount point.
using VolumeMap = std::map<std::string, VolumeRecord>;

struct PhysicalDisk {
    std::string health_status;        // Healthy | Unhealthy | Unknown
    std::string operational_status;   // OK | <sysfs state> | Unknown
    std::string media_type;           // SSD | HDD | Unspecified
    double size_gb = 0.0;
    std::string device;               // kernel name, e.g. "sda"
};

struct PhysicalDiskReport {
    enum class State {
        Devices,
        Unavailable,   // enumeration capability not present on this host
        NoDevices,     // capability present, nothing physical found
    };

    State state = State::Devices;
    std::string message;                          // marker text for Unavailable/NoDevices
    std::map<std::string, PhysicalDisk> disks;    // keyed by friendly name
};

// Structured error payload a failed probe is converted into.
struct ProbeFailure {
    std::string message;
    std::string category;             // ReadError, ParseError, SystemError, CommandError, ProbeError, Unexpected
    std::string fully_qualified_id;   // "<Probe>,<Category>"
};

enum class SectionKind {
    System,
    Cpu,
    Memory,
    Volumes,
    PhysicalDisks,
};

const char* section_kind_name(SectionKind k);

using SectionData = std::variant<SystemInfo,
                                 CpuInfo,
                                 MemoryInfo,
                                 VolumeMap,
                                 PhysicalDiskReport,
                                 ProbeFailure>;

struct Section {
    SectionKind kind = SectionKind::System;
    std::string title;
    SectionData data;
    Severity severity = Severity::Info;
};

struct Report {
    std::string generated_at;
    std::vector<Section> sections;
};

// The probe set a run uses. Each entry is called exactly once, in order.
// Any exception it throws is contained (see run_probe in sections.h).
struct Probes {
    std::function<SystemInfo()> system;
    std::function<CpuInfo()> cpu;
    std::function<MemoryInfo()> memory;
    std::function<VolumeMap()> volumes;
    std::function<PhysicalDiskReport()> physical_disks;
};

// Runs every probe sequentially and returns the five Sections in fixed order.
// Never throws because of a probe; a failed probe yields a degraded Section.
Report assemble_report(const Probes& probes);

// Highest severity over all Sections (Info for an empty report).
Severity worst_severity(const Report& r);

// CLI exit status: 0 info, 2 warn, 3 error.
int exit_code_for(const Report& r);

// First Section whose title starts with `prefix`, or nullptr.
const Section* find_section_by_title_prefix(const Report& r, const std::string& prefix);

} // namespace hosthealth
