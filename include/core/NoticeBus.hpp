// © 2026 Beatrix Zselezny. All rights reserved.
// Preflight Bootstrap Framework

#ifndef NOTICE_BUS_HPP
#define NOTICE_BUS_HPP

#include <string>
#include "rxcpp/rx.hpp"

#include "telemetry/BusTelemetry.hpp"

namespace Preflight::Core {

    enum class Severity {
        Info,    // [bootstrap] sor
        Step,    // Lépés-fejléc (▶)
        Warning,
        Error    // Egyetlen, jól jelölt hibasor a stderr-en
    };

    /**
     * @brief Egy értesítés a buszon.
     */
    struct Notice {
        std::string source;
        Severity severity = Severity::Info;
        std::string message;
    };

    /**
     * @brief Értesítési busz: minden lépés ide publikál, std::cout helyett.
     * A feliratkozók (konzol, tesztek) a hívó szálon, szinkron kapják meg az eseményeket.
     */
    class NoticeBus {
    private:
        rxcpp::subjects::subject<Notice> notice_bus;
        BusTelemetry telemetry;
        bool completed = false;

    public:
        NoticeBus() = default;
        ~NoticeBus();

        NoticeBus(const NoticeBus&) = delete;
        NoticeBus& operator=(const NoticeBus&) = delete;

        // --- Publishing ---
        void pushEvent(const std::string& source, const std::string& message);
        void pushStep(const std::string& source, const std::string& message);
        void pushWarning(const std::string& source, const std::string& message);
        void pushError(const std::string& source, const std::string& message);
        void publish(const Notice& notice);

        // --- Subscribing ---
        [[nodiscard]] rxcpp::observable<Notice> notices() const {
            return notice_bus.get_observable();
        }

        // Lezárja a streamet; utána a publish no-op.
        void complete();

        // --- Diagnostics ---
        [[nodiscard]] TelemetrySnapshot getTelemetrySnapshot() const;
    };
}

#endif
