#pragma once
#include <cstdint>
#include <string>

namespace hosthealth {

    // ISO-8601 UTC with milliseconds, e.g. 2026-10-19T12:34:56.123Z
    std::string now_iso_utc();

    std::string lower_ascii(std::string s);
    std::string trim_ws(const std::string& s);

    // Round half away from zero to `decimals` places.
    double round_to(double v, int decimals);

    // Bytes -> GiB, rounded to 2 decimals.
    double bytes_to_gb(std::uint64_t bytes);

    // "85.3" style fixed formatting (no locale).
    std::string format_fixed(double v, int decimals);

    // Joins an instrumentation root with a relative path ("/proc" + "meminfo").
    std::string join_path(const std::string& root, const std::string& rel);

    // Reads a whole file. Returns false with err set if it cannot be opened.
    bool read_text_file(const std::string& path, std::string* out, std::string* err);

    inline std::string shorten(const std::string& s, size_t maxlen = 200) {
        if (s.size() <= maxlen) return s;
        return s.substr(0, maxlen) + "...";
    }

} // namespace hosthealth
