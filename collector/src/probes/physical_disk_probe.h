#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "report.h"
#include "disk_health.h"

namespace hosthealth::probes {

    // What sysfs tells us about one whole-disk block device.
    struct BlockDevice {
        std::string name;            // kernel name: sda, nvme0n1
        std::string vendor;
        std::string model;
        std::string state;           // device/state, "" if absent
        int rotational = -1;         // queue/rotational: 1, 0, or -1 unknown
        std::uint64_t size_sectors = 0;   // 512-byte sectors
    };

    // Optional enumeration capability. available() == false means the host
    // cannot enumerate physical devices at all, which is not an error.
    class DiskInventory {
    public:
        virtual ~DiskInventory() = default;
        virtual bool available() const = 0;
        virtual std::vector<BlockDevice> list_devices() = 0;
    };

    // <sys>/block based inventory.
    std::unique_ptr<DiskInventory> make_sysfs_inventory(std::string sys_root);

    // loop, ram, zram, dm-, md, nbd, sr, fd ... are not physical disks.
    bool is_virtual_block_device(const std::string& name);

    // "Vendor Model", model alone, or the kernel name when sysfs has neither.
    std::string friendly_name(const BlockDevice& d);

    std::string media_type(const BlockDevice& d);           // SSD | HDD | Unspecified
    std::string operational_status(const BlockDevice& d);   // OK | <state> | Unknown

    PhysicalDiskReport probe_physical_disks(DiskInventory& inventory, DiskHealthProvider& health);

} // namespace hosthealth::probes
