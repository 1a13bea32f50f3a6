// common/utils/time_utils.cpp
#include "common/utils/time_utils.h"
#include <ctime>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace ucop {

Timestamp now() {
    return Clock::now();
}

std::string to_iso8601(Timestamp ts) {
    int64_t micros = to_epoch_micros(ts);
    std::time_t seconds = static_cast<std::time_t>(micros / 1000000);
    int64_t fraction = micros % 1000000;
    if (fraction < 0) {
        fraction += 1000000;
        seconds -= 1;
    }

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setw(6) << std::setfill('0') << fraction << 'Z';
    return oss.str();
}

int64_t to_epoch_micros(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::microseconds>(ts.time_since_epoch()).count();
}

Timestamp from_epoch_micros(int64_t micros) {
    return Timestamp(std::chrono::duration_cast<Clock::duration>(std::chrono::microseconds(micros)));
}

std::string generate_id(std::string_view prefix) {
    static std::mutex rng_mutex;
    static std::mt19937_64 rng{std::random_device{}()};

    uint32_t suffix = 0;
    {
        std::lock_guard<std::mutex> lock(rng_mutex);
        suffix = static_cast<uint32_t>(rng());
    }

    std::ostringstream oss;
    oss << prefix << '_'
        << std::hex << std::setw(12) << std::setfill('0') << to_epoch_micros(now()) << '_'
        << std::setw(8) << suffix;
    return oss.str();
}

} // namespace ucop
