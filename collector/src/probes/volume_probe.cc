#include "volume_probe.h"

#include <sys/statvfs.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <map>
#include <sstream>

#include "hh_util.h"
#include "diag.h"
#include "probe_error.h"

namespace hosthealth::probes {

/*
Volume probe
============

Source of truth is /proc/self/mountinfo:

  id parent major:minor root mount_point options ... - fstype source superoptions

Only fixed local volumes are reported. Excluded:
  - pseudo filesystems (proc, sysfs, tmpfs, overlay, squashfs, ...)
  - network filesystems (nfs, cifs, sshfs, 9p, ...)
  - optical media (iso9660, udf)
  - block devices sysfs flags as removable (USB sticks, card readers)
  - kernel/runtime mount trees (/proc, /sys, /dev, /run, snap internals)

Usage comes from statvfs(). free is f_bavail (what an unprivileged user can
still write), used = total - free.
*/

std::string unescape_mountinfo(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); i++) {
        if (s[i] == '\\' && i + 3 < s.size()) {
            const char a = s[i + 1], b = s[i + 2], c = s[i + 3];
            if (a >= '0' && a <= '7' && b >= '0' && b <= '7' && c >= '0' && c <= '7') {
                out.push_back((char)(((a - '0') << 6) | ((b - '0') << 3) | (c - '0')));
                i += 3;
                continue;
            }
        }
        out.push_back(s[i]);
    }
    return out;
}

std::vector<MountEntry> parse_mountinfo(const std::string& text) {
    std::map<std::string, MountEntry> by_mp;

    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;

        // split around " - "
        const std::string sep = " - ";
        auto pos = line.find(sep);
        if (pos == std::string::npos) continue;

        const std::string left = line.substr(0, pos);
        const std::string right = line.substr(pos + sep.size());

        // left: id(1) parent(2) major:minor(3) root(4) mount_point(5) ...
        std::istringstream lss(left);
        std::string tok, mount_point;
        int idx = 0;
        while (lss >> tok) {
            idx++;
            if (idx == 5) { mount_point = tok; break; }
        }
        if (mount_point.empty()) continue;

        MountEntry m;
        m.mount_point = unescape_mountinfo(mount_point);
        std::istringstream rss(right);
        rss >> m.fstype >> m.source;
        m.source = unescape_mountinfo(m.source);

        by_mp[m.mount_point] = std::move(m);
    }

    std::vector<MountEntry> out;
    out.reserve(by_mp.size());
    for (auto& kv : by_mp) out.push_back(std::move(kv.second));

    std::sort(out.begin(), out.end(), [](const MountEntry& a, const MountEntry& b) {
        if (a.mount_point == "/") return b.mount_point != "/";
        if (b.mount_point == "/") return false;
        return a.mount_point < b.mount_point;
    });
    return out;
}

static bool in_list(const std::string& fs, const char* const* list, size_t n) {
    for (size_t i = 0; i < n; i++) if (fs == list[i]) return true;
    return false;
}

bool is_pseudo_fstype(const std::string& fs) {
    static const char* const k[] = {
        "proc", "sysfs", "devtmpfs", "devpts", "tmpfs", "cgroup", "cgroup2", "pstore",
        "securityfs", "tracefs", "debugfs", "hugetlbfs", "mqueue", "fusectl", "configfs",
        "overlay", "squashfs", "ramfs", "autofs", "binfmt_misc", "bpf", "efivarfs",
        "rpc_pipefs", "nsfs", "selinuxfs", "fuse.portal", "fuse.gvfsd-fuse", "none"
    };
    return in_list(fs, k, sizeof(k) / sizeof(k[0]));
}

bool is_network_fstype(const std::string& fs) {
    static const char* const k[] = {
        "nfs", "nfs4", "cifs", "smb3", "smbfs", "ncpfs", "afs", "9p", "ceph",
        "glusterfs", "lustre", "davfs", "fuse.sshfs", "fuse.rclone", "fuse.s3fs",
        "fuse.glusterfs", "fuse.ceph"
    };
    return in_list(fs, k, sizeof(k) / sizeof(k[0]));
}

bool is_optical_fstype(const std::string& fs) {
    return fs == "iso9660" || fs == "udf";
}

bool is_hidden_mount(const std::string& mp) {
    if (mp.empty()) return true;
    if (mp == "/") return false;

    auto under = [&](const char* root) {
        const size_t n = std::strlen(root);
        return mp.compare(0, n, root) == 0 && (mp.size() == n || mp[n] == '/');
    };

    return under("/proc") || under("/sys") || under("/dev") || under("/run") ||
           under("/snap") || under("/var/snap") || under("/var/lib/snapd");
}

std::string parent_block_device(const std::string& name) {
    size_t end = name.size();
    while (end > 0 && name[end - 1] >= '0' && name[end - 1] <= '9') end--;
    if (end == name.size() || end == 0) return name;   // no numeric suffix

    // nvme0n1p2 / mmcblk0p1: partition suffix is "p<N>" after a digit
    if (name[end - 1] == 'p' && end >= 2 && name[end - 2] >= '0' && name[end - 2] <= '9')
        return name.substr(0, end - 1);

    // nvme0n1 / mmcblk0 themselves: trailing digits belong to the disk name
    if (name.rfind("nvme", 0) == 0 || name.rfind("mmcblk", 0) == 0) return name;

    return name.substr(0, end);
}

static bool read_removable_flag(const std::string& sys_root, const std::string& dev, bool* removable) {
    std::string text;
    if (!read_text_file(join_path(sys_root, "class/block/" + dev + "/removable"), &text, nullptr))
        return false;
    *removable = (trim_ws(text) == "1");
    return true;
}

bool is_removable_source(const std::string& sys_root, const std::string& source) {
    if (source.rfind("/dev/", 0) != 0) return false;
    if (source.rfind("/dev/mapper/", 0) == 0) return false;

    const std::string dev = source.substr(source.rfind('/') + 1);
    if (dev.empty()) return false;

    bool removable = false;
    if (read_removable_flag(sys_root, dev, &removable)) return removable;

    const std::string parent = parent_block_device(dev);
    if (parent != dev && read_removable_flag(sys_root, parent, &removable)) return removable;
    return false;
}

bool is_fixed_local_volume(const std::string& sys_root, const MountEntry& m) {
    if (is_hidden_mount(m.mount_point)) return false;
    if (is_pseudo_fstype(m.fstype)) return false;
    if (is_network_fstype(m.fstype)) return false;
    if (is_optical_fstype(m.fstype)) return false;
    if (is_removable_source(sys_root, m.source)) return false;
    return true;
}

bool statvfs_usage(const std::string& path, FsUsage* out, std::string* err) {
    struct statvfs v {};
    if (::statvfs(path.c_str(), &v) != 0) {
        if (err) *err = "statvfs(" + path + ") failed: " + std::strerror(errno);
        return false;
    }

    const unsigned long long bs = (v.f_frsize ? v.f_frsize : v.f_bsize);
    out->total_bytes = bs * (unsigned long long)v.f_blocks;
    out->free_bytes = bs * (unsigned long long)v.f_bavail;
    return true;
}

VolumeRecord volume_from_usage(const FsUsage& u) {
    VolumeRecord r;
    const std::uint64_t free = std::min(u.free_bytes, u.total_bytes);
    const std::uint64_t used = u.total_bytes - free;

    r.total_gb = bytes_to_gb(u.total_bytes);
    r.used_gb = bytes_to_gb(used);
    r.free_gb = bytes_to_gb(free);
    r.used_pct = u.total_bytes == 0 ? 0.0 : round_to((double)used * 100.0 / (double)u.total_bytes, 2);
    return r;
}

VolumeMap probe_volumes(const InstrumentationRoots& roots, const StatvfsFn& stat_fn) {
    std::string text, err;
    if (!read_text_file(join_path(roots.proc, "self/mountinfo"), &text, &err)) throw_read_error(err);

    VolumeMap out;
    for (const auto& m : parse_mountinfo(text)) {
        if (!is_fixed_local_volume(roots.sys, m)) continue;

        // Unreadable sizes count as 0, not as a probe failure.
        FsUsage u;
        std::string serr;
        if (!stat_fn || !stat_fn(m.mount_point, &u, &serr)) {
            diag_debug("volumes", "cannot measure " + m.mount_point + ": " + serr);
            u = FsUsage{};
        }
        VolumeRecord r = volume_from_usage(u);
        r.filesystem = m.fstype;
        r.source = m.source;
        out[m.mount_point] = std::move(r);
    }
    return out;
}

} // namespace hosthealth::probes
