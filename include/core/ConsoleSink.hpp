// © 2026 Beatrix Zselezny. All rights reserved.
// Preflight Bootstrap Framework

#ifndef CONSOLE_SINK_HPP
#define CONSOLE_SINK_HPP

#include <ostream>
#include <string>
#include "core/NoticeBus.hpp"

namespace Preflight::Core {

    /**
     * @brief A NoticeBus konzolos megjelenítője.
     * Info/Step/Warning -> out, Error -> err. Színek folyamonként, csak TTY esetén.
     */
    class ConsoleSink {
    public:
        ConsoleSink(std::ostream& out, std::ostream& err, bool outColor, bool errColor);

        void attach(NoticeBus& bus, rxcpp::composite_subscription& lifetime);

        // A színezés annak a folyamnak a beállítását követi, ahová a notice kerül
        [[nodiscard]] std::string render(const Notice& notice) const;

        static bool streamIsTerminal(int fd);

    private:
        std::ostream& out;
        std::ostream& err;
        bool outColor;
        bool errColor;
    };
}

#endif
