#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "config.h"
#include "report.h"

namespace hosthealth::probes {

    struct MountEntry {
        std::string mount_point;
        std::string fstype;
        std::string source;
    };

    // Decodes the octal escapes mountinfo uses for blanks ("\040" -> ' ').
    std::string unescape_mountinfo(const std::string& s);

    // Parses /proc/self/mountinfo. A mount point listed more than once keeps
    // its last (top-most) entry. "/" sorts first, the rest lexicographically.
    std::vector<MountEntry> parse_mountinfo(const std::string& text);

    bool is_pseudo_fstype(const std::string& fs);
    bool is_network_fstype(const std::string& fs);
    bool is_optical_fstype(const std::string& fs);
    bool is_hidden_mount(const std::string& mp);

    // "sdb1" -> "sdb", "nvme0n1p2" -> "nvme0n1", "mmcblk0p1" -> "mmcblk0".
    std::string parent_block_device(const std::string& name);

    // True if the block device behind `source` (e.g. /dev/sdb1) is flagged
    // removable in sysfs. Sources that are not /dev nodes are never removable.
    bool is_removable_source(const std::string& sys_root, const std::string& source);

    // Fixed local volume: a real, local, non-removable, non-optical filesystem.
    bool is_fixed_local_volume(const std::string& sys_root, const MountEntry& m);

    struct FsUsage {
        std::uint64_t total_bytes = 0;
        std::uint64_t free_bytes = 0;   // available to unprivileged users
    };

    using StatvfsFn = std::function<bool(const std::string& path, FsUsage* out, std::string* err)>;

    // statvfs(3) wrapper.
    bool statvfs_usage(const std::string& path, FsUsage* out, std::string* err);

    // GB figures (2 decimals) and used percent (2 decimals, 0 when total is 0).
    VolumeRecord volume_from_usage(const FsUsage& u);

    // Enumerates fixed local volumes keyed by mount point. A volume whose usage
    // cannot be read is still listed, with all figures 0.
    VolumeMap probe_volumes(const InstrumentationRoots& roots, const StatvfsFn& stat_fn);

} // namespace hosthealth::probes
