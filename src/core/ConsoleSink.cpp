// © 2026 Beatrix Zselezny. All rights reserved.
// Preflight Bootstrap Framework

#include "core/ConsoleSink.hpp"
#include <unistd.h>

namespace Preflight::Core {

    namespace {
        const char* const CYAN_BOLD = "\033[1;36m";
        const char* const RED_BOLD  = "\033[1;31m";
        const char* const RESET     = "\033[0m";
    }

    ConsoleSink::ConsoleSink(std::ostream& outRef, std::ostream& errRef, bool outUseColor, bool errUseColor)
        : out(outRef), err(errRef), outColor(outUseColor), errColor(errUseColor) {}

    bool ConsoleSink::streamIsTerminal(int fd) {
        return isatty(fd) == 1;
    }

    std::string ConsoleSink::render(const Notice& notice) const {
        switch (notice.severity) {
            case Severity::Step:
                if (outColor) return "\n" + std::string(CYAN_BOLD) + "▶ " + notice.message + RESET;
                return "\n▶ " + notice.message;
            case Severity::Error:
                if (errColor) return std::string(RED_BOLD) + "✗ " + notice.message + RESET;
                return "✗ " + notice.message;
            case Severity::Warning:
                return "[bootstrap] warning: " + notice.message;
            case Severity::Info:
                break;
        }
        return "[bootstrap] " + notice.message;
    }

    void ConsoleSink::attach(NoticeBus& bus, rxcpp::composite_subscription& lifetime) {
        auto isError = [](const Notice& n) { return n.severity == Severity::Error; };

        bus.notices()
            .filter([isError](const Notice& n) { return !isError(n); })
            .subscribe(lifetime, [this](const Notice& n) {
                out << render(n) << std::endl;
            });

        bus.notices()
            .filter(isError)
            .subscribe(lifetime, [this](const Notice& n) {
                err << render(n) << std::endl;
            });
    }
}
