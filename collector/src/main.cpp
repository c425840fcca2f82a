/*
hosthealth
==========

On-demand health report for the local Linux host.

One run:
  1. parse the command line and load the optional JSON config
  2. run the five probes (system, CPU, memory, volumes, physical disks)
     sequentially; each probe is isolated, a failing probe yields a degraded
     Section instead of aborting the run
  3. classify and roll up severities into a Report
  4. render the Report as HTML (default) or JSON and write it out
  5. exit with the worst severity: 0 normal, 2 warning, 3 critical

With --verify-log PATH the collector runs nothing and only checks the hash
chain of an existing run log: exit 0 when every line verifies, 1 otherwise.

Exit status 1 is reserved for problems with the invocation itself (bad
arguments, unreadable config, unwritable output). The run never fails because
of the host it inspects.

Nothing persists between runs except the optional run log.
*/

#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include "cli_options.h"
#include "config.h"
#include "live_probes.h"
#include "render.h"
#include "report.h"

#include "diag.h"
#include "run_log.h"

using namespace hosthealth;

static void log_event(RunLog* log, RunEvent e, RunLog::MinLevel level = RunLog::MinLevel::INFO) {
    if (!log) return;
    if (!log->append(e, level))
        diag_info("run_log", "WARNING: failed to append to " + log->path());
}

static bool write_file(const std::string& path, const std::string& body, std::string* err) {
    std::ofstream f(path, std::ios::trunc | std::ios::binary);
    if (!f.good()) {
        *err = "cannot open for writing: " + path;
        return false;
    }
    f << body;
    f.flush();
    if (!f.good()) {
        *err = "write failed: " + path;
        return false;
    }
    return true;
}

int main(int argc, char** argv) {
    CliOptions opts;
    std::string err;
    if (!parse_cli(argc, argv, &opts, &err)) {
        std::cerr << "[cli] " << err << "\n" << usage_text(argv[0]);
        return 1;
    }
    if (opts.help) {
        std::cout << usage_text(argv[0]);
        return 0;
    }
    if (!opts.verify_log_path.empty()) {
        if (!RunLog::verify_file(opts.verify_log_path, &err)) {
            diag_error("run_log", "verify failed: " + err);
            return 1;
        }
        std::cout << "[run_log] OK: " << opts.verify_log_path << "\n";
        return 0;
    }

    // ---- config ----
    CollectorConfig cfg;
    std::string config_path = opts.config_path;
    if (config_path.empty()) {
        if (const char* p = std::getenv("HOSTHEALTH_CONFIG")) config_path = p;
    }
    if (!config_path.empty()) {
        if (!load_config_file(config_path, &cfg, &err)) {
            diag_error("config", "failed to load " + config_path + ": " + err);
            return 1;
        }
    }
    apply_env_overrides(&cfg);

    if (!set_diag_level_str(cfg.log_level)) {
        diag_error("config", "invalid log level: " + cfg.log_level + " (expected quiet|info|debug)");
        return 1;
    }
    diag_debug("config", "roots proc=" + cfg.roots.proc + " sys=" + cfg.roots.sys + " etc=" + cfg.roots.etc);

    // ---- run log ----
    std::unique_ptr<RunLog> run_log;
    if (!cfg.run_log_path.empty()) {
        run_log = std::make_unique<RunLog>(cfg.run_log_path);
        if (!run_log->set_min_level_str(cfg.run_log_min_level)) {
            diag_error("config", "invalid run_log min_level: " + cfg.run_log_min_level +
                                 " (expected DEBUG|INFO|WARN)");
            return 1;
        }
    }

    log_event(run_log.get(), RunEvent{"", "run.start", "ok",
                                      {{"format", opts.json ? "json" : "html"}}});

    // ---- collect ----
    const Report report = assemble_report(default_probes(cfg));

    for (const auto& s : report.sections) {
        if (const auto* f = std::get_if<ProbeFailure>(&s.data)) {
            diag_info("probe", f->fully_qualified_id + ": " + f->message);
            log_event(run_log.get(),
                      RunEvent{"", "probe.fail", "warn",
                               {{"probe", section_kind_name(s.kind)},
                                {"id", f->fully_qualified_id},
                                {"message", f->message}}},
                      RunLog::MinLevel::WARN);
        }
    }

    // ---- render + write ----
    const std::string body = opts.json ? render_json(report) : render_html(report);
    const int code = exit_code_for(report);

    if (opts.to_stdout) {
        std::cout << body;
        if (opts.json) std::cout << "\n";
        std::cout.flush();
    } else {
        const std::string path = opts.out_path.empty()
            ? default_output_path(home_directory(), opts.json, std::time(nullptr))
            : opts.out_path;

        if (!write_file(path, body, &err)) {
            diag_error("report", err);
            log_event(run_log.get(), RunEvent{"", "report.written", "fail", {{"path", path}, {"error", err}}},
                      RunLog::MinLevel::WARN);
            return 1;
        }
        diag_info("report", "written to " + path);
        log_event(run_log.get(), RunEvent{"", "report.written", "ok", {{"path", path}}});
    }

    log_event(run_log.get(), RunEvent{"", "run.finish", severity_str(worst_severity(report)),
                                      {{"exit_code", std::to_string(code)}}});
    return code;
}
