#include "config.h"

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "hh_util.h"

using json = nlohmann::json;

namespace hosthealth {

/*
Configuration loading
=====================

The file is optional; a run with no config uses the live host roots and
default logging. Loading is all-or-nothing: the document is parsed and
validated into a temporary copy which replaces *out only on success, so a
half-applied config never reaches the probes.

Severity thresholds are fixed and not configurable.
*/

static bool read_string(const json& obj, const char* key, std::string* dst, std::string* err) {
    if (!obj.contains(key)) return true;
    if (!obj[key].is_string()) {
        if (err) *err = std::string("\"") + key + "\" must be a string";
        return false;
    }
    *dst = obj[key].get<std::string>();
    return true;
}

static bool read_bool(const json& obj, const char* key, bool* dst, std::string* err) {
    if (!obj.contains(key)) return true;
    if (!obj[key].is_boolean()) {
        if (err) *err = std::string("\"") + key + "\" must be a boolean";
        return false;
    }
    *dst = obj[key].get<bool>();
    return true;
}

static bool read_object(const json& root, const char* key, const json** out, std::string* err) {
    *out = nullptr;
    if (!root.contains(key)) return true;
    if (!root[key].is_object()) {
        if (err) *err = std::string("\"") + key + "\" must be an object";
        return false;
    }
    *out = &root[key];
    return true;
}

bool load_config_json(const std::string& text, CollectorConfig* out, std::string* err) {
    json j;
    try {
        j = json::parse(text);
    } catch (const std::exception& e) {
        if (err) *err = std::string("parse error: ") + e.what();
        return false;
    }

    if (!j.is_object()) {
        if (err) *err = "invalid format (expected a JSON object)";
        return false;
    }

    CollectorConfig tmp = *out;

    const json* roots = nullptr;
    if (!read_object(j, "roots", &roots, err)) return false;
    if (roots) {
        if (!read_string(*roots, "proc", &tmp.roots.proc, err)) return false;
        if (!read_string(*roots, "sys", &tmp.roots.sys, err)) return false;
        if (!read_string(*roots, "etc", &tmp.roots.etc, err)) return false;
    }

    const json* disks = nullptr;
    if (!read_object(j, "physical_disks", &disks, err)) return false;
    if (disks) {
        if (!read_bool(*disks, "smartctl", &tmp.smartctl, err)) return false;
        if (!read_string(*disks, "smartctl_path", &tmp.smartctl_path, err)) return false;
    }

    if (!read_string(j, "log_level", &tmp.log_level, err)) return false;
    if (tmp.log_level != "quiet" && tmp.log_level != "info" && tmp.log_level != "debug") {
        if (err) *err = "invalid log_level: " + tmp.log_level + " (expected quiet|info|debug)";
        return false;
    }

    const json* run_log = nullptr;
    if (!read_object(j, "run_log", &run_log, err)) return false;
    if (run_log) {
        if (!read_string(*run_log, "path", &tmp.run_log_path, err)) return false;
        if (!read_string(*run_log, "min_level", &tmp.run_log_min_level, err)) return false;
        const std::string lvl = lower_ascii(trim_ws(tmp.run_log_min_level));
        if (lvl != "debug" && lvl != "info" && lvl != "warn") {
            if (err) *err = "invalid run_log.min_level: " + tmp.run_log_min_level + " (expected DEBUG|INFO|WARN)";
            return false;
        }
    }

    *out = std::move(tmp);
    return true;
}

bool load_config_file(const std::string& path, CollectorConfig* out, std::string* err) {
    std::ifstream f(path);
    if (!f.good()) {
        if (err) *err = "file not found: " + path;
        return false;
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    return load_config_json(ss.str(), out, err);
}

} // namespace hosthealth
