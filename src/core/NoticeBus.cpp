// © 2026 Beatrix Zselezny. All rights reserved.
// Preflight Bootstrap Framework

#include "core/NoticeBus.hpp"

namespace Preflight::Core {

    NoticeBus::~NoticeBus() {
        complete();
    }

    void NoticeBus::pushEvent(const std::string& source, const std::string& message) {
        publish(Notice{source, Severity::Info, message});
    }

    void NoticeBus::pushStep(const std::string& source, const std::string& message) {
        publish(Notice{source, Severity::Step, message});
    }

    void NoticeBus::pushWarning(const std::string& source, const std::string& message) {
        publish(Notice{source, Severity::Warning, message});
    }

    void NoticeBus::pushError(const std::string& source, const std::string& message) {
        publish(Notice{source, Severity::Error, message});
    }

    void NoticeBus::publish(const Notice& notice) {
        if (completed) return;

        telemetry.total_notices++;
        switch (notice.severity) {
            case Severity::Step:    telemetry.step_notices++; break;
            case Severity::Warning: telemetry.warning_notices++; break;
            case Severity::Error:   telemetry.error_notices++; break;
            case Severity::Info:    break;
        }

        notice_bus.get_subscriber().on_next(notice);
    }

    void NoticeBus::complete() {
        if (completed) return;
        completed = true;
        notice_bus.get_subscriber().on_completed();
    }

    TelemetrySnapshot NoticeBus::getTelemetrySnapshot() const {
        return telemetry.snapshot();
    }

} // namespace Preflight::Core
