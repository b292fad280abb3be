#include "Clock.hpp"
#include <chrono>
#include <sstream>
#include <iomanip>
#include <ctime>

namespace mockapi {

    namespace {

        std::tm toUtc(Timestamp us) {
            time_t t = static_cast<time_t>(us / 1000000);
            std::tm tm;
#ifdef _WIN32
            gmtime_s(&tm, &t);
#else
            gmtime_r(&t, &tm);
#endif
            return tm;
        }

    } // namespace

    Timestamp Clock::nowMicros() {
        auto now = std::chrono::system_clock::now();
        return static_cast<Timestamp>(
            std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count());
    }

    std::string Clock::formatIsoMicros(Timestamp us) {
        std::tm tm = toUtc(us);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setw(6) << std::setfill('0') << (us % 1000000)
            << 'Z';
        return ss.str();
    }

    std::string Clock::formatIsoSeconds(Timestamp us) {
        std::tm tm = toUtc(us);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

} // namespace mockapi
