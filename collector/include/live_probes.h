#pragma once
#include "config.h"
#include "report.h"

namespace hosthealth {

    // Binds the Linux probes to the configured instrumentation roots.
    // Nothing is read until the returned callables are invoked.
    Probes default_probes(const CollectorConfig& cfg);

} // namespace hosthealth
