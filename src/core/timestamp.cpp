#include <factstore/core/timestamp.h>

#include <ctime>
#include <iomanip>
#include <sstream>

namespace factstore::core {

std::string formatUtc(TimePoint tp) {
    auto time_t_value = std::chrono::system_clock::to_time_t(tp);

    std::tm tm_utc;
#ifdef _WIN32
    gmtime_s(&tm_utc, &time_t_value);
#else
    gmtime_r(&time_t_value, &tm_utc);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S") << 'Z';
    return oss.str();
}

std::string utcNow() {
    return formatUtc(std::chrono::system_clock::now());
}

} // namespace factstore::core
