#include "common.h"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace vortex_l0 {

std::string to_iso8601(WallClock::time_point tp) {
    auto time_t = WallClock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    gmtime_r(&time_t, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
        << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";
    return oss.str();
}

} // namespace vortex_l0
