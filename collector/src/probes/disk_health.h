#pragma once
#include <memory>
#include <string>
#include <vector>

namespace hosthealth::probes {

    struct CmdOutput {
        bool started = false;   // false: fork/exec failed or binary missing (exit 127)
        int exit_status = -1;
        std::string out;        // stdout (stderr is discarded)
    };

    // fork/exec without a shell; argv[0] is looked up in PATH.
    CmdOutput run_cmd_capture_stdout(const std::vector<std::string>& argv);

    // Maps `smartctl -H -j` output to Healthy | Unhealthy | Unknown.
    std::string parse_smartctl_health(const std::string& json_text);

    // Health verdict per block device ("sda", "nvme0n1").
    // Implementations never throw for a device they cannot assess: they
    // return "Unknown".
    class DiskHealthProvider {
    public:
        virtual ~DiskHealthProvider() = default;
        virtual std::string health_status(const std::string& device_name) = 0;
    };

    std::unique_ptr<DiskHealthProvider> make_smartctl_health_provider(std::string smartctl_path);

    // Always "Unknown"; used when smartctl is disabled.
    std::unique_ptr<DiskHealthProvider> make_unknown_health_provider();

} // namespace hosthealth::probes
