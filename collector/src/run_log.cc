#include "run_log.h"

#include <fstream>

#include <nlohmann/json.hpp>
#include <openssl/sha.h>

#include "hh_util.h"

namespace hosthealth {

using json = nlohmann::json;

static const std::string kGenesisHash(64, '0');

// Hex encode bytes (lowercase).
static std::string to_hex(const unsigned char* p, size_t n) {
    static const char* kHex = "0123456789abcdef";
    std::string out;
    out.resize(n * 2);
    for (size_t i = 0; i < n; i++) {
        out[i * 2 + 0] = kHex[(p[i] >> 4) & 0xF];
        out[i * 2 + 1] = kHex[(p[i] >> 0) & 0xF];
    }
    return out;
}

RunLog::RunLog(std::string jsonl_path, std::string state_path)
    : jsonl_path_(std::move(jsonl_path)), state_path_(std::move(state_path)) {
    if (state_path_.empty()) state_path_ = jsonl_path_ + ".state";
}

std::string RunLog::sha256_hex(const std::string& s) {
    unsigned char h[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(s.data()), s.size(), h);
    return to_hex(h, sizeof(h));
}

bool RunLog::set_min_level_str(const std::string& s) {
    const std::string u = lower_ascii(trim_ws(s));
    if (u == "debug") { min_level_ = MinLevel::DEBUG; return true; }
    if (u == "info")  { min_level_ = MinLevel::INFO;  return true; }
    if (u == "warn")  { min_level_ = MinLevel::WARN;  return true; }
    return false;
}

std::string RunLog::min_level_str() const {
    switch (min_level_) {
        case MinLevel::DEBUG: return "DEBUG";
        case MinLevel::INFO:  return "INFO";
        case MinLevel::WARN:  return "WARN";
    }
    return "INFO";
}

// Object keys serialize in sorted order, so the same event always yields the
// same bytes; verify_file() depends on that.
std::string RunLog::line_without_hash(const RunEvent& e, const std::string& prev_hash) {
    json j = {
        {"ts", e.ts_utc},
        {"event", e.event},
        {"outcome", e.outcome},
        {"prev_hash", prev_hash}
    };
    if (!e.f.empty()) {
        json f = json::object();
        for (const auto& kv : e.f) f[kv.first] = kv.second;
        j["f"] = std::move(f);
    }
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string RunLog::load_prev_hash_() {
    std::ifstream f(state_path_);
    if (!f.good()) return kGenesisHash;
    std::string line;
    std::getline(f, line);
    if (line.size() != 64) return kGenesisHash;
    return line;
}

bool RunLog::store_prev_hash_(const std::string& h) {
    std::ofstream f(state_path_, std::ios::trunc);
    f << h << "\n";
    f.flush();
    return f.good();
}

bool RunLog::append(const RunEvent& e_in, MinLevel level) {
    if (level < min_level_) return true;

    RunEvent e = e_in;
    if (e.ts_utc.empty()) e.ts_utc = now_iso_utc();

    const std::string prev = load_prev_hash_();
    const std::string body = line_without_hash(e, prev);
    const std::string line_hash = sha256_hex(prev + body);

    json full = json::parse(body);
    full["line_hash"] = line_hash;

    std::ofstream out(jsonl_path_, std::ios::app);
    if (!out.good()) return false;
    out << full.dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
    out.flush();
    if (!out.good()) return false;

    return store_prev_hash_(line_hash);
}

bool RunLog::verify_file(const std::string& jsonl_path, std::string* err) {
    std::ifstream f(jsonl_path);
    if (!f.good()) {
        if (err) *err = "cannot open " + jsonl_path;
        return false;
    }

    std::string prev = kGenesisHash;
    std::string line;
    size_t n = 0;
    while (std::getline(f, line)) {
        n++;
        if (line.empty()) continue;

        const json j = json::parse(line, nullptr, /*allow_exceptions=*/false);
        if (j.is_discarded() || !j.is_object() ||
            !j.contains("line_hash") || !j["line_hash"].is_string() ||
            !j.contains("prev_hash") || !j["prev_hash"].is_string()) {
            if (err) *err = "line " + std::to_string(n) + ": malformed";
            return false;
        }

        if (j["prev_hash"].get<std::string>() != prev) {
            if (err) *err = "line " + std::to_string(n) + ": prev_hash does not match previous line";
            return false;
        }

        json body = j;
        body.erase("line_hash");
        const std::string expect =
            sha256_hex(prev + body.dump(-1, ' ', false, json::error_handler_t::replace));
        const std::string got = j["line_hash"].get<std::string>();
        if (got != expect) {
            if (err) *err = "line " + std::to_string(n) + ": line_hash mismatch";
            return false;
        }
        prev = got;
    }
    return true;
}

} // namespace hosthealth
