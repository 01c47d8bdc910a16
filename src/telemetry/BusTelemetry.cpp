// © 2026 Beatrix Zselezny. All rights reserved.
// Preflight Bootstrap Framework

#include "telemetry/BusTelemetry.hpp"

namespace Preflight::Core {

BusTelemetry::BusTelemetry()
    : window_start(std::chrono::steady_clock::now())
{
}

TelemetrySnapshot BusTelemetry::snapshot() const {
    TelemetrySnapshot snap{};

    snap.total    = total_notices.load();
    snap.steps    = step_notices.load();
    snap.warnings = warning_notices.load();
    snap.errors   = error_notices.load();

    snap.window_ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - window_start
        ).count());

    return snap;
}

} // namespace Preflight::Core
