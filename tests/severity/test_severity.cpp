// tests/severity/test_severity.cpp
//
// Threshold classification and labels.
//
// What it tests:
// 1) classify() tiers, including values sitting exactly on a threshold
// 2) fixed per-domain thresholds
// 3) label / wire spelling
// 4) worst_of ordering

#include <string>

#include "severity.h"
#include "../common/test_support.h"

using namespace hosthealth;
using test_support::check;

int main() {
    // Boundaries: equal to a threshold belongs to the higher tier.
    check(classify(79.99, 80, 90) == Severity::Info, "classify_below_warn");
    check(classify(80.0, 80, 90) == Severity::Warn, "classify_at_warn");
    check(classify(89.99, 80, 90) == Severity::Warn, "classify_between");
    check(classify(90.0, 80, 90) == Severity::Error, "classify_at_error");
    check(classify(100.0, 80, 90) == Severity::Error, "classify_full");
    check(classify(0.0, 80, 90) == Severity::Info, "classify_zero");

    // Property sweep over 0..100 in 0.5 steps.
    bool sweep_ok = true;
    for (int i = 0; i <= 200; i++) {
        const double p = i * 0.5;
        const Severity s = classify(p, 85, 90);
        const Severity expect = p >= 90 ? Severity::Error : (p >= 85 ? Severity::Warn : Severity::Info);
        if (s != expect) { sweep_ok = false; break; }
    }
    check(sweep_ok, "classify_sweep");

    check(classify(85.0, kVolumeThresholds) == Severity::Warn, "volume_thresholds_warn");
    check(classify(84.9, kVolumeThresholds) == Severity::Info, "volume_thresholds_info");
    check(classify(80.0, kMemoryThresholds) == Severity::Warn, "memory_thresholds_warn");
    check(kMemoryThresholds.error == 90.0 && kVolumeThresholds.error == 90.0, "error_thresholds");

    check(std::string(severity_label(Severity::Info)) == "Normal", "label_info");
    check(std::string(severity_label(Severity::Warn)) == "Warning", "label_warn");
    check(std::string(severity_label(Severity::Error)) == "Critical", "label_error");

    check(std::string(severity_str(Severity::Warn)) == "warn", "wire_warn");
    check(std::string(severity_str(Severity::Error)) == "error", "wire_error");

    check(worst_of(Severity::Info, Severity::Warn) == Severity::Warn, "worst_info_warn");
    check(worst_of(Severity::Error, Severity::Warn) == Severity::Error, "worst_error_warn");
    check(worst_of(Severity::Info, Severity::Info) == Severity::Info, "worst_info_info");

    return test_support::finish("severity");
}
