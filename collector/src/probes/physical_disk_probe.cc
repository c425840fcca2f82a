#include "physical_disk_probe.h"

#include <algorithm>
#include <filesystem>

#include "hh_util.h"

namespace hosthealth::probes {

/*
Physical disk probe
===================

Three outcomes, none of which is an error:

  Unavailable   the enumeration capability (sysfs <sys>/block) is absent
  NoDevices     enumeration works but only virtual devices exist
  Devices       one record per physical disk, keyed by friendly name

A fault while enumerating (I/O error on sysfs) is an exception and becomes a
ProbeFailure upstream. Health comes from DiskHealthProvider; a device it
cannot assess is "Unknown", which does not raise severity.
*/

namespace fs = std::filesystem;

bool is_virtual_block_device(const std::string& name) {
    static const char* const prefixes[] = {
        "loop", "ram", "zram", "dm-", "md", "nbd", "sr", "fd", "rbd", "drbd", "zd", "vnd"
    };
    for (const char* p : prefixes) {
        if (name.rfind(p, 0) == 0) return true;
    }
    return false;
}

std::string friendly_name(const BlockDevice& d) {
    const std::string vendor = trim_ws(d.vendor);
    const std::string model = trim_ws(d.model);
    if (model.empty()) return d.name;
    // Generic SCSI vendor strings ("ATA") add nothing.
    if (vendor.empty() || vendor == "ATA" || model.rfind(vendor, 0) == 0) return model;
    return vendor + " " + model;
}

std::string media_type(const BlockDevice& d) {
    if (d.name.rfind("nvme", 0) == 0) return "SSD";
    if (d.rotational == 0) return "SSD";
    if (d.rotational == 1) return "HDD";
    return "Unspecified";
}

std::string operational_status(const BlockDevice& d) {
    const std::string st = trim_ws(d.state);
    if (st.empty()) return "Unknown";
    if (st == "running" || st == "live") return "OK";
    return st;
}

namespace {

class SysfsInventory final : public DiskInventory {
public:
    explicit SysfsInventory(std::string sys_root) : block_dir_(join_path(sys_root, "block")) {}

    bool available() const override {
        std::error_code ec;
        return fs::is_directory(block_dir_, ec);
    }

    std::vector<BlockDevice> list_devices() override {
        std::vector<BlockDevice> out;

        // Throws fs::filesystem_error on I/O failure; the caller contains it.
        for (const auto& entry : fs::directory_iterator(block_dir_)) {
            const std::string name = entry.path().filename().string();
            if (is_virtual_block_device(name)) continue;

            const std::string dir = entry.path().string();
            BlockDevice d;
            d.name = name;
            d.vendor = read_attr(dir, "device/vendor");
            d.model = read_attr(dir, "device/model");
            d.state = read_attr(dir, "device/state");

            const std::string rot = read_attr(dir, "queue/rotational");
            if (rot == "0") d.rotational = 0;
            else if (rot == "1") d.rotational = 1;

            const std::string size = read_attr(dir, "size");
            try {
                if (!size.empty()) d.size_sectors = std::stoull(size);
            } catch (const std::exception&) {
                d.size_sectors = 0;
            }

            out.push_back(std::move(d));
        }

        std::sort(out.begin(), out.end(), [](const BlockDevice& a, const BlockDevice& b) {
            return a.name < b.name;
        });
        return out;
    }

private:
    static std::string read_attr(const std::string& dir, const char* rel) {
        std::string v;
        if (!read_text_file(join_path(dir, rel), &v, nullptr)) return "";
        return trim_ws(v);
    }

    std::string block_dir_;
};

} // namespace

std::unique_ptr<DiskInventory> make_sysfs_inventory(std::string sys_root) {
    return std::make_unique<SysfsInventory>(std::move(sys_root));
}

PhysicalDiskReport probe_physical_disks(DiskInventory& inventory, DiskHealthProvider& health) {
    PhysicalDiskReport out;

    if (!inventory.available()) {
        out.state = PhysicalDiskReport::State::Unavailable;
        out.message = "Physical disk enumeration is not available on this host";
        return out;
    }

    const auto devices = inventory.list_devices();
    if (devices.empty()) {
        out.state = PhysicalDiskReport::State::NoDevices;
        out.message = "No physical disks found";
        return out;
    }

    out.state = PhysicalDiskReport::State::Devices;
    for (const auto& d : devices) {
        PhysicalDisk p;
        p.device = d.name;
        p.health_status = health.health_status(d.name);
        p.operational_status = operational_status(d);
        p.media_type = media_type(d);
        p.size_gb = bytes_to_gb(d.size_sectors * 512ULL);

        std::string key = friendly_name(d);
        if (out.disks.count(key)) key += " (" + d.name + ")";
        out.disks[key] = std::move(p);
    }
    return out;
}

} // namespace hosthealth::probes
