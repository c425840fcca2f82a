#include "system_probe.h"

#include <pwd.h>
#include <sys/utsname.h>
#include <unistd.h>

#include <chrono>
#include <cmath>
#include <sstream>
#include <vector>

#include "hh_util.h"
#include "probe_error.h"

namespace hosthealth::probes {

static std::string unquote(const std::string& s) {
    if (s.size() >= 2) {
        if ((s.front() == '"' && s.back() == '"') || (s.front() == '\'' && s.back() == '\'')) {
            return s.substr(1, s.size() - 2);
        }
    }
    return s;
}

std::string format_uptime(long long seconds) {
    if (seconds < 0) seconds = 0;
    const long long days = seconds / 86400;
    const long long hours = (seconds % 86400) / 3600;
    const long long minutes = (seconds % 3600) / 60;

    std::ostringstream ss;
    ss << days << "d " << hours << "h " << minutes << "m";
    return ss.str();
}

long long parse_btime(const std::string& proc_stat_text) {
    std::istringstream in(proc_stat_text);
    std::string line;
    while (std::getline(in, line)) {
        if (line.rfind("btime ", 0) == 0) {
            std::istringstream ls(line);
            std::string k;
            long long v = -1;
            if (ls >> k >> v) return v;
            return -1;
        }
    }
    return -1;
}

std::string parse_os_pretty_name(const std::string& os_release_text) {
    std::istringstream in(os_release_text);
    std::string line;
    while (std::getline(in, line)) {
        line = trim_ws(line);
        if (line.empty() || line[0] == '#') continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        if (trim_ws(line.substr(0, eq)) == "PRETTY_NAME")
            return unquote(trim_ws(line.substr(eq + 1)));
    }
    return "";
}

static std::string host_name() {
    char host[256] = {0};
    if (::gethostname(host, sizeof(host) - 1) != 0) return "";
    return std::string(host);
}

static std::string effective_user_name() {
    const uid_t uid = ::geteuid();

    long sz = ::sysconf(_SC_GETPW_R_SIZE_MAX);
    if (sz < 1024) sz = 16384;
    std::vector<char> buf((size_t)sz);

    struct passwd pw {};
    struct passwd* res = nullptr;
    if (::getpwuid_r(uid, &pw, buf.data(), buf.size(), &res) == 0 && res && res->pw_name)
        return std::string(res->pw_name);

    if (const char* l = ::getlogin()) return std::string(l);
    return "uid " + std::to_string((unsigned long)uid);
}

// Seconds since boot: now - btime, or /proc/uptime when btime is missing.
static long long uptime_seconds(const InstrumentationRoots& roots) {
    std::string stat;
    if (read_text_file(join_path(roots.proc, "stat"), &stat, nullptr)) {
        const long long btime = parse_btime(stat);
        if (btime > 0) {
            const long long now = (long long)std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::system_clock::now().time_since_epoch()).count();
            return now - btime;
        }
    }

    std::string up, err;
    if (!read_text_file(join_path(roots.proc, "uptime"), &up, &err))
        throw_read_error("boot time unavailable: " + err);

    std::istringstream iss(up);
    double s = 0.0;
    if (!(iss >> s)) throw_parse_error("uptime: cannot parse " + shorten(up, 64));
    return (long long)std::floor(s);
}

SystemInfo probe_system(const InstrumentationRoots& roots) {
    SystemInfo out;
    out.timestamp = now_iso_utc();
    out.computer_name = host_name();
    out.user_name = effective_user_name();
    out.is_admin = (::geteuid() == 0);

    struct utsname u {};
    const bool have_uname = (::uname(&u) == 0);
    if (have_uname) {
        std::ostringstream ss;
        ss << u.sysname << " " << u.release << " " << u.version << " " << u.machine;
        out.kernel = ss.str();
    }

    std::string os_release;
    if (read_text_file(join_path(roots.etc, "os-release"), &os_release, nullptr))
        out.os_version = parse_os_pretty_name(os_release);
    if (out.os_version.empty() && have_uname)
        out.os_version = std::string(u.sysname) + " " + u.release;

    out.uptime = format_uptime(uptime_seconds(roots));
    return out;
}

} // namespace hosthealth::probes
