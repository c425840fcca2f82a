#include "cli_options.h"

#include <pwd.h>
#include <unistd.h>

#include <cstdlib>
#include <sstream>
#include <vector>

#include "hh_util.h"

namespace hosthealth {

static bool take_value(int argc, const char* const* argv, int* i,
                       const std::string& flag, std::string* dst, std::string* err) {
    const std::string a = argv[*i];
    const std::string eq = flag + "=";
    if (a.rfind(eq, 0) == 0) {
        *dst = a.substr(eq.size());
    } else {
        if (*i + 1 >= argc) {
            if (err) *err = flag + " requires a value";
            return false;
        }
        *dst = argv[++(*i)];
    }
    if (dst->empty()) {
        if (err) *err = flag + " requires a non-empty value";
        return false;
    }
    return true;
}

static bool is_flag(const std::string& a, const std::string& flag) {
    return a == flag || a.rfind(flag + "=", 0) == 0;
}

bool parse_cli(int argc, const char* const* argv, CliOptions* out, std::string* err) {
    CliOptions o;
    for (int i = 1; i < argc; i++) {
        const std::string a = argv[i];
        if (a == "--json") {
            o.json = true;
        } else if (a == "--stdout") {
            o.to_stdout = true;
        } else if (a == "--help" || a == "-h") {
            o.help = true;
        } else if (is_flag(a, "--out")) {
            if (!take_value(argc, argv, &i, "--out", &o.out_path, err)) return false;
        } else if (is_flag(a, "--config")) {
            if (!take_value(argc, argv, &i, "--config", &o.config_path, err)) return false;
        } else if (is_flag(a, "--verify-log")) {
            if (!take_value(argc, argv, &i, "--verify-log", &o.verify_log_path, err)) return false;
        } else {
            if (err) *err = "unknown argument: " + a;
            return false;
        }
    }

    if (o.to_stdout && !o.out_path.empty()) {
        if (err) *err = "--stdout and --out are mutually exclusive";
        return false;
    }

    *out = std::move(o);
    return true;
}

std::string usage_text(const char* prog) {
    std::ostringstream ss;
    ss << "usage: " << (prog ? prog : "hosthealth")
       << " [--json] [--out PATH | --stdout] [--config PATH] [--help]\n"
       << "       " << (prog ? prog : "hosthealth") << " --verify-log PATH\n"
       << "\n"
       << "Collects system, CPU, memory, volume and physical disk health and writes\n"
       << "an HTML report (or JSON with --json).\n"
       << "--verify-log checks the hash chain of a run log and exits 0 if intact.\n"
       << "\n"
       << "Exit status: 0 all normal, 2 warnings present, 3 critical present,\n"
       << "             1 usage or output error.\n";
    return ss.str();
}

std::string home_directory() {
    if (const char* h = std::getenv("HOME")) {
        if (*h) return std::string(h);
    }

    long sz = ::sysconf(_SC_GETPW_R_SIZE_MAX);
    if (sz < 1024) sz = 16384;
    std::vector<char> buf((size_t)sz);
    struct passwd pw {};
    struct passwd* res = nullptr;
    if (::getpwuid_r(::geteuid(), &pw, buf.data(), buf.size(), &res) == 0 && res && res->pw_dir)
        return std::string(res->pw_dir);

    return ".";
}

std::string default_output_path(const std::string& dir, bool json, std::time_t now) {
    std::tm tm{};
    localtime_r(&now, &tm);

    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &tm);

    return join_path(dir, std::string("HostHealth_") + stamp + (json ? ".json" : ".html"));
}

void apply_env_overrides(CollectorConfig* cfg) {
    if (const char* v = std::getenv("HOSTHEALTH_PROC_ROOT")) cfg->roots.proc = v;
    if (const char* v = std::getenv("HOSTHEALTH_SYS_ROOT")) cfg->roots.sys = v;
    if (const char* v = std::getenv("HOSTHEALTH_ETC_ROOT")) cfg->roots.etc = v;
    if (const char* v = std::getenv("HOSTHEALTH_LOG_LEVEL")) cfg->log_level = v;
    if (const char* v = std::getenv("HOSTHEALTH_RUN_LOG")) cfg->run_log_path = v;
}

} // namespace hosthealth
