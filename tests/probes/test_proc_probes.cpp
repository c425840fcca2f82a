// tests/probes/test_proc_probes.cpp
//
// Linux probes against fixture proc/sys/etc trees.
//
// What it tests:
// 1) /proc/meminfo parsing, MemAvailable fallback, missing MemTotal
// 2) mountinfo parsing and fixed-local-volume filtering
// 3) os-release, btime and uptime formatting; probe_system on a fixture root
// 4) physical disk outcomes: Unavailable, NoDevices, Devices (+ duplicate names)
// 5) smartctl JSON health mapping

#include <map>
#include <string>
#include <vector>

#include "probes/disk_health.h"
#include "probes/memory_probe.h"
#include "probes/physical_disk_probe.h"
#include "probes/probe_error.h"
#include "probes/system_probe.h"
#include "probes/volume_probe.h"
#include "../common/test_support.h"

using namespace hosthealth;
using namespace hosthealth::probes;
using test_support::check;
using test_support::near;
using test_support::write_text;

static InstrumentationRoots roots_under(const test_support::TempDir& dir) {
    InstrumentationRoots r;
    r.proc = dir.sub("proc");
    r.sys = dir.sub("sys");
    r.etc = dir.sub("etc");
    return r;
}

static void test_meminfo() {
    // 32 GiB total, 8 GiB available
    MemInfoBytes m = parse_meminfo(
        "MemTotal:       33554432 kB\n"
        "MemFree:         1048576 kB\n"
        "MemAvailable:    8388608 kB\n"
        "Buffers:          524288 kB\n"
        "Cached:          4194304 kB\n");
    check(m.total == 33554432ULL * 1024 && m.available == 8388608ULL * 1024, "meminfo_fields");

    MemoryInfo info = memory_from_bytes(m);
    check(near(info.total_gb, 32.0) && near(info.used_gb, 24.0) && near(info.free_gb, 8.0), "meminfo_gb");
    check(near(info.used_pct, 75.0), "meminfo_used_pct");

    // Old kernels: no MemAvailable.
    MemInfoBytes old = parse_meminfo(
        "MemTotal:        1000 kB\n"
        "MemFree:          100 kB\n"
        "Buffers:           50 kB\n"
        "Cached:           150 kB\n");
    check(old.available == 300ULL * 1024, "meminfo_available_fallback");

    bool threw = false;
    try {
        parse_meminfo("MemFree: 1 kB\n");
    } catch (const ProbeError& e) {
        threw = e.category() == "ParseError";
    }
    check(threw, "meminfo_missing_total_parse_error");

    test_support::TempDir dir("hh_mem_");
    bool read_err = false;
    try {
        probe_memory(roots_under(dir));
    } catch (const ProbeError& e) {
        read_err = e.category() == "ReadError";
    }
    check(read_err, "meminfo_missing_file_read_error");

    write_text(dir.sub("proc/meminfo"), "MemTotal: 2097152 kB\nMemAvailable: 1048576 kB\n");
    MemoryInfo live = probe_memory(roots_under(dir));
    check(near(live.total_gb, 2.0) && near(live.used_pct, 50.0), "probe_memory_fixture");
}

static const char* kMountinfo =
    "22 1 8:2 / / rw,relatime shared:1 - ext4 /dev/sda2 rw\n"
    "23 22 0:21 / /proc rw,nosuid - proc proc rw\n"
    "24 22 0:22 / /sys rw,nosuid - sysfs sysfs rw\n"
    "25 22 0:5 / /dev rw,nosuid - devtmpfs udev rw\n"
    "26 22 0:23 / /run rw,nosuid - tmpfs tmpfs rw\n"
    "30 22 8:3 / /home rw,relatime - xfs /dev/sda3 rw\n"
    "31 22 0:40 / /mnt/share rw - nfs4 server:/export rw\n"
    "32 22 11:0 / /media/cdrom ro - iso9660 /dev/sr0 ro\n"
    "33 22 8:17 / /media/usb rw - vfat /dev/sdb1 rw\n"
    "34 22 8:4 / /srv/My\\040Data rw - ext4 /dev/sda4 rw\n"
    "35 22 0:50 / /tmp rw - tmpfs tmpfs rw\n"
    "36 22 8:5 / /data rw - ext4 /dev/sda5 rw\n";

static void test_mountinfo() {
    check(unescape_mountinfo("/srv/My\\040Data") == "/srv/My Data", "mountinfo_unescape");
    check(unescape_mountinfo("tail\\04") == "tail\\04", "mountinfo_short_escape_kept");

    auto mounts = parse_mountinfo(kMountinfo);
    check(!mounts.empty() && mounts[0].mount_point == "/", "mountinfo_root_first");

    // Shadowed mount: last entry wins.
    auto shadow = parse_mountinfo(
        "40 1 8:1 / /data rw - ext4 /dev/sdc1 rw\n"
        "41 1 8:2 / /data rw - xfs /dev/sdd1 rw\n");
    check(shadow.size() == 1 && shadow[0].fstype == "xfs", "mountinfo_last_wins");

    check(parent_block_device("sdb1") == "sdb", "parent_sd");
    check(parent_block_device("sdb") == "sdb", "parent_whole_sd");
    check(parent_block_device("nvme0n1p2") == "nvme0n1", "parent_nvme_part");
    check(parent_block_device("nvme0n1") == "nvme0n1", "parent_nvme_whole");
    check(parent_block_device("mmcblk0p1") == "mmcblk0", "parent_mmc");

    check(is_hidden_mount("/run/user/1000") && !is_hidden_mount("/runtime"), "hidden_prefix_boundary");

    test_support::TempDir dir("hh_vol_");
    check(dir.ok(), "vol_tempdir");
    if (!dir.ok()) return;

    write_text(dir.sub("proc/self/mountinfo"), kMountinfo);
    write_text(dir.sub("sys/class/block/sdb/removable"), "1\n");
    write_text(dir.sub("sys/class/block/sda/removable"), "0\n");

    std::vector<std::string> stat_calls;
    StatvfsFn fake = [&stat_calls](const std::string& path, FsUsage* out, std::string* err) {
        stat_calls.push_back(path);
        if (path == "/data") {
            if (err) *err = "permission denied";
            return false;
        }
        out->total_bytes = 100ULL * 1024 * 1024 * 1024;
        out->free_bytes = path == "/" ? 8ULL * 1024 * 1024 * 1024 : 60ULL * 1024 * 1024 * 1024;
        return true;
    };

    VolumeMap vols = probe_volumes(roots_under(dir), fake);

    std::vector<std::string> keys;
    for (const auto& kv : vols) keys.push_back(kv.first);
    check(keys == std::vector<std::string>({"/", "/data", "/home", "/srv/My Data"}), "volumes_fixed_local_only");
    check(!vols.count("/media/usb"), "volumes_removable_excluded");
    check(!vols.count("/mnt/share") && !vols.count("/media/cdrom") && !vols.count("/tmp"),
          "volumes_network_optical_pseudo_excluded");

    if (vols.count("/")) {
        const VolumeRecord& root = vols["/"];
        check(root.used_pct && near(*root.used_pct, 92.0), "volume_root_used_pct");
        check(near(root.total_gb, 100.0) && near(root.free_gb, 8.0) && near(root.used_gb, 92.0), "volume_root_gb");
        check(root.filesystem == "ext4" && root.source == "/dev/sda2", "volume_root_fs");
    }
    if (vols.count("/data")) {
        const VolumeRecord& d = vols["/data"];
        check(d.used_pct && *d.used_pct == 0.0 && d.total_gb == 0.0 && d.free_gb == 0.0,
              "volume_unmeasurable_zeros");
    }

    // Missing mountinfo is a probe failure.
    test_support::TempDir empty("hh_vol_empty_");
    bool threw = false;
    try {
        probe_volumes(roots_under(empty), fake);
    } catch (const ProbeError& e) {
        threw = e.category() == "ReadError";
    }
    check(threw, "volumes_missing_mountinfo_read_error");

    VolumeRecord zero = volume_from_usage(FsUsage{});
    check(zero.used_pct && *zero.used_pct == 0.0, "volume_zero_total");
}

static void test_system() {
    check(format_uptime(93784) == "1d 2h 3m", "uptime_format");
    check(format_uptime(59) == "0d 0h 0m", "uptime_under_minute");
    check(format_uptime(-5) == "0d 0h 0m", "uptime_negative");

    check(parse_btime("cpu 1 2 3 4\nbtime 1700000000\nprocesses 5\n") == 1700000000LL, "btime_parsed");
    check(parse_btime("cpu 1 2 3 4\n") == -1, "btime_missing");

    check(parse_os_pretty_name("NAME=\"Debian\"\n# comment\nPRETTY_NAME=\"Debian GNU/Linux 12 (bookworm)\"\n") ==
              "Debian GNU/Linux 12 (bookworm)", "os_release_pretty_name");
    check(parse_os_pretty_name("NAME=Alpine\n").empty(), "os_release_no_pretty_name");

    test_support::TempDir dir("hh_sys_");
    write_text(dir.sub("etc/os-release"), "PRETTY_NAME='Fixture Linux 1.0'\n");
    write_text(dir.sub("proc/uptime"), "93784.55 100.00\n");
    SystemInfo s = probe_system(roots_under(dir));
    check(s.os_version == "Fixture Linux 1.0", "probe_system_os", s.os_version);
    check(s.uptime == "1d 2h 3m", "probe_system_uptime_fallback", s.uptime);
    check(!s.computer_name.empty() && !s.user_name.empty() && !s.timestamp.empty(), "probe_system_identity");

    test_support::TempDir bare("hh_sys_bare_");
    bool threw = false;
    try {
        probe_system(roots_under(bare));
    } catch (const ProbeError& e) {
        threw = e.category() == "ReadError";
    }
    check(threw, "probe_system_no_boot_time");
}

class FakeInventory final : public DiskInventory {
public:
    bool avail = true;
    std::vector<BlockDevice> devices;
    bool available() const override { return avail; }
    std::vector<BlockDevice> list_devices() override { return devices; }
};

class MapHealth final : public DiskHealthProvider {
public:
    std::map<std::string, std::string> verdicts;
    std::string health_status(const std::string& dev) override {
        auto it = verdicts.find(dev);
        return it == verdicts.end() ? "Unknown" : it->second;
    }
};

static BlockDevice dev(const std::string& name, const std::string& vendor, const std::string& model,
                       int rotational, std::uint64_t sectors) {
    BlockDevice d;
    d.name = name;
    d.vendor = vendor;
    d.model = model;
    d.state = "running";
    d.rotational = rotational;
    d.size_sectors = sectors;
    return d;
}

static void test_physical_disks() {
    MapHealth health;

    FakeInventory none;
    none.avail = false;
    PhysicalDiskReport u = probe_physical_disks(none, health);
    check(u.state == PhysicalDiskReport::State::Unavailable && !u.message.empty() && u.disks.empty(),
          "disks_unavailable");

    FakeInventory empty;
    PhysicalDiskReport n = probe_physical_disks(empty, health);
    check(n.state == PhysicalDiskReport::State::NoDevices && n.message == "No physical disks found",
          "disks_no_devices");

    FakeInventory inv;
    inv.devices.push_back(dev("nvme0n1", "", "Samsung SSD 980 1TB", -1, 1953525168ULL));
    inv.devices.push_back(dev("sda", "ATA", "WDC WD40EFRX", 1, 7814037168ULL));
    inv.devices.push_back(dev("sdb", "ATA", "WDC WD40EFRX", 1, 7814037168ULL));
    health.verdicts["nvme0n1"] = "Healthy";
    health.verdicts["sda"] = "Unhealthy";

    PhysicalDiskReport r = probe_physical_disks(inv, health);
    check(r.state == PhysicalDiskReport::State::Devices && r.disks.size() == 3, "disks_three");
    check(r.disks.count("Samsung SSD 980 1TB") == 1, "disk_nvme_key");
    check(r.disks.count("WDC WD40EFRX") == 1 && r.disks.count("WDC WD40EFRX (sdb)") == 1, "disk_duplicate_suffix");
    if (r.disks.count("Samsung SSD 980 1TB")) {
        const PhysicalDisk& d = r.disks["Samsung SSD 980 1TB"];
        check(d.media_type == "SSD" && d.health_status == "Healthy" && d.operational_status == "OK", "disk_nvme_fields");
        check(near(d.size_gb, 931.51), "disk_nvme_size", std::to_string(d.size_gb));
    }
    if (r.disks.count("WDC WD40EFRX (sdb)")) {
        check(r.disks["WDC WD40EFRX (sdb)"].health_status == "Unknown", "disk_unknown_health");
        check(r.disks["WDC WD40EFRX (sdb)"].media_type == "HDD", "disk_hdd");
    }

    BlockDevice odd = dev("sdc", "Seagate", "ST4000", -1, 0);
    odd.state = "offline";
    check(friendly_name(odd) == "Seagate ST4000", "friendly_vendor_model");
    check(media_type(odd) == "Unspecified", "media_unspecified");
    check(operational_status(odd) == "offline", "opstatus_verbatim");
    odd.state.clear();
    check(operational_status(odd) == "Unknown", "opstatus_unknown");
    check(friendly_name(dev("sdd", "", "", 0, 0)) == "sdd", "friendly_kernel_name");

    check(is_virtual_block_device("loop0") && is_virtual_block_device("dm-1") && !is_virtual_block_device("sda"),
          "virtual_block_devices");

    // sysfs inventory on a fixture tree
    test_support::TempDir dir("hh_disk_");
    auto missing = make_sysfs_inventory(dir.sub("sys"));
    check(!missing->available(), "sysfs_inventory_unavailable");

    write_text(dir.sub("sys/block/loop0/size"), "0\n");
    auto only_loop = make_sysfs_inventory(dir.sub("sys"));
    check(only_loop->available() && only_loop->list_devices().empty(), "sysfs_inventory_virtual_only");

    write_text(dir.sub("sys/block/sda/size"), "1000215216\n");
    write_text(dir.sub("sys/block/sda/queue/rotational"), "0\n");
    write_text(dir.sub("sys/block/sda/device/model"), "Fixture SSD\n");
    write_text(dir.sub("sys/block/sda/device/state"), "running\n");
    auto inv2 = make_sysfs_inventory(dir.sub("sys"));
    auto unknown = make_unknown_health_provider();
    PhysicalDiskReport fr = probe_physical_disks(*inv2, *unknown);
    check(fr.disks.size() == 1 && fr.disks.count("Fixture SSD") == 1, "sysfs_inventory_device");
    if (fr.disks.count("Fixture SSD")) {
        const PhysicalDisk& d = fr.disks["Fixture SSD"];
        check(d.device == "sda" && d.media_type == "SSD" && d.operational_status == "OK" &&
              d.health_status == "Unknown", "sysfs_inventory_fields");
    }
}

static void test_smartctl() {
    check(parse_smartctl_health("{\"smart_status\":{\"passed\":true}}") == "Healthy", "smart_passed");
    check(parse_smartctl_health("{\"smart_status\":{\"passed\":false}}") == "Unhealthy", "smart_failed");
    check(parse_smartctl_health("{\"device\":{}}") == "Unknown", "smart_no_status");
    check(parse_smartctl_health("not json") == "Unknown", "smart_garbage");

    auto p = make_smartctl_health_provider("/nonexistent/smartctl");
    check(p->health_status("sda") == "Unknown", "smart_missing_binary_unknown");

    CmdOutput o = run_cmd_capture_stdout({"/nonexistent/binary"});
    check(!o.started, "cmd_missing_not_started");
}

int main() {
    test_meminfo();
    test_mountinfo();
    test_system();
    test_physical_disks();
    test_smartctl();
    return test_support::finish("probes");
}
