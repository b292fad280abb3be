#pragma once

#include <string>
#include "Types.hpp"

namespace mockapi {

    // Wall-clock helpers for generated payloads. All output is UTC.
    class Clock {
    public:
        // Current time as epoch microseconds
        static Timestamp nowMicros();

        // "YYYY-MM-DDTHH:MM:SS.ffffffZ"
        static std::string formatIsoMicros(Timestamp us);

        // "YYYY-MM-DDTHH:MM:SSZ"
        static std::string formatIsoSeconds(Timestamp us);

        static std::string nowIsoMicros() { return formatIsoMicros(nowMicros()); }
        static std::string nowIsoSeconds() { return formatIsoSeconds(nowMicros()); }
    };

} // namespace mockapi
