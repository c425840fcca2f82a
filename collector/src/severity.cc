#include "severity.h"

namespace hosthealth {

Severity classify(double pct, double warn_threshold, double error_threshold) {
    if (pct >= error_threshold) return Severity::Error;
    if (pct >= warn_threshold) return Severity::Warn;
    return Severity::Info;
}

Severity classify(double pct, const Thresholds& t) {
    return classify(pct, t.warn, t.error);
}

const char* severity_label(Severity s) {
    switch (s) {
        case Severity::Info:  return "Normal";
        case Severity::Warn:  return "Warning";
        case Severity::Error: return "Critical";
    }
    return "Normal";
}

const char* severity_str(Severity s) {
    switch (s) {
        case Severity::Info:  return "info";
        case Severity::Warn:  return "warn";
        case Severity::Error: return "error";
    }
    return "info";
}

} // namespace hosthealth
