#pragma once
#include <string>

namespace hosthealth {

// Ordering matters: Info < Warn < Error. worst_of() relies on it.
enum class Severity : int {
    Info  = 0,
    Warn  = 1,
    Error = 2,
};

struct Thresholds {
    double warn;
    double error;
};

// Fixed per-domain thresholds (percent used).
constexpr Thresholds kMemoryThresholds{80.0, 90.0};
constexpr Thresholds kVolumeThresholds{85.0, 90.0};

// error if pct >= error, warn if pct >= warn, else info.
// A value sitting exactly on a threshold belongs to the higher tier.
Severity classify(double pct, double warn_threshold, double error_threshold);
Severity classify(double pct, const Thresholds& t);

// "Normal" / "Warning" / "Critical"
const char* severity_label(Severity s);

// Wire spelling used in JSON and as HTML class suffix: "info" / "warn" / "error"
const char* severity_str(Severity s);

inline Severity worst_of(Severity a, Severity b) {
    return static_cast<int>(a) >= static_cast<int>(b) ? a : b;
}

} // namespace hosthealth
