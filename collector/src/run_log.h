#pragma once
#include <map>
#include <string>

namespace hosthealth {

/*
RunEvent
========

One line of the run log.

  event    "<subsystem>.<action>": run.start, probe.fail, report.written, run.finish
  outcome  "ok" | "fail" | "warn" | "error"
  f        flat string -> string context (probe id, path, exit code ...)
*/
struct RunEvent {
    std::string ts_utc;    // filled in by append() when empty
    std::string event;
    std::string outcome;
    std::map<std::string, std::string> f;
};

/*
RunLog
======

Append-only, hash-chained JSONL record of what each run did.

Each line carries:
  prev_hash : line_hash of the previous line ("000..0" for the first)
  line_hash : SHA-256(prev_hash + json_without_line_hash), lowercase hex

The last committed hash lives in a small state file next to the log so an
append does not rescan the whole file. Editing, inserting, deleting or
reordering lines breaks the chain from that point on.

The log records run outcomes only. It is not read back by the collector and
holds no metrics history.
*/
class RunLog {
public:
    enum class MinLevel : int {
        DEBUG = 0,
        INFO  = 1,
        WARN  = 2,
    };

    // state file defaults to jsonl_path + ".state"
    explicit RunLog(std::string jsonl_path, std::string state_path = "");

    // Appends when `level` >= min level. Returns false if the file could not
    // be written (the chain is not advanced in that case).
    bool append(const RunEvent& e, MinLevel level = MinLevel::INFO);

    // DEBUG | INFO | WARN. Returns false (level unchanged) otherwise.
    bool set_min_level_str(const std::string& s);
    std::string min_level_str() const;

    const std::string& path() const { return jsonl_path_; }

    static std::string sha256_hex(const std::string& s);

    // JSON text of e without line_hash, with prev_hash embedded.
    static std::string line_without_hash(const RunEvent& e, const std::string& prev_hash);

    /*
    Walks a log file and checks every link of the chain.
    Returns true if all lines verify; otherwise false with *err naming the
    first bad line (1-based).
    */
    static bool verify_file(const std::string& jsonl_path, std::string* err);

private:
    std::string load_prev_hash_();
    bool store_prev_hash_(const std::string& h);

    MinLevel min_level_ = MinLevel::INFO;
    std::string jsonl_path_;
    std::string state_path_;
};

} // namespace hosthealth
