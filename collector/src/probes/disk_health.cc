#include "disk_health.h"

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "diag.h"

namespace hosthealth::probes {

CmdOutput run_cmd_capture_stdout(const std::vector<std::string>& argv) {
    CmdOutput r;
    if (argv.empty()) return r;

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& s : argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    int pipefd[2];
    if (pipe(pipefd) != 0) return r;

    pid_t pid = fork();
    if (pid < 0) {
        ::close(pipefd[0]); ::close(pipefd[1]);
        return r;
    }

    if (pid == 0) {
        dup2(pipefd[1], STDOUT_FILENO);
        int devnull = ::open("/dev/null", O_WRONLY);
        if (devnull >= 0) { dup2(devnull, STDERR_FILENO); ::close(devnull); }
        ::close(pipefd[0]);
        ::close(pipefd[1]);
        execvp(cargv[0], cargv.data());
        _exit(127);
    }

    ::close(pipefd[1]);
    char buf[4096];
    for (;;) {
        ssize_t n = read(pipefd[0], buf, sizeof(buf));
        if (n <= 0) break;
        r.out.append(buf, buf + n);
    }
    ::close(pipefd[0]);

    int st = 0;
    if (waitpid(pid, &st, 0) < 0) return r;

    if (!WIFEXITED(st)) return r;
    r.exit_status = WEXITSTATUS(st);
    r.started = (r.exit_status != 127);
    return r;
}

std::string parse_smartctl_health(const std::string& json_text) {
    const auto j = nlohmann::json::parse(json_text, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) return "Unknown";

    const auto it = j.find("smart_status");
    if (it == j.end() || !it->is_object()) return "Unknown";

    const auto passed = it->find("passed");
    if (passed == it->end() || !passed->is_boolean()) return "Unknown";
    return passed->get<bool>() ? "Healthy" : "Unhealthy";
}

namespace {

class SmartctlHealthProvider final : public DiskHealthProvider {
public:
    explicit SmartctlHealthProvider(std::string path) : path_(std::move(path)) {}

    std::string health_status(const std::string& device_name) override {
        if (missing_) return "Unknown";

        CmdOutput r = run_cmd_capture_stdout({path_, "-H", "-j", "/dev/" + device_name});
        if (!r.started) {
            // Not installed: stop trying for the remaining devices.
            diag_debug("disks", "smartctl not runnable (" + path_ + "), health unknown");
            missing_ = true;
            return "Unknown";
        }

        // smartctl exit status is a bit mask; bits 0/1 mean the device was
        // never queried (bad arguments / open failed, typically no privileges).
        if (r.exit_status < 0 || (r.exit_status & 0x3) != 0) {
            diag_debug("disks", "smartctl could not query " + device_name +
                                " (exit " + std::to_string(r.exit_status) + ")");
            return "Unknown";
        }
        return parse_smartctl_health(r.out);
    }

private:
    std::string path_;
    bool missing_ = false;
};

class UnknownHealthProvider final : public DiskHealthProvider {
public:
    std::string health_status(const std::string&) override { return "Unknown"; }
};

} // namespace

std::unique_ptr<DiskHealthProvider> make_smartctl_health_provider(std::string smartctl_path) {
    return std::make_unique<SmartctlHealthProvider>(std::move(smartctl_path));
}

std::unique_ptr<DiskHealthProvider> make_unknown_health_provider() {
    return std::make_unique<UnknownHealthProvider>();
}

} // namespace hosthealth::probes
