#ifndef UCOP_COMMON_UTILS_TIME_UTILS_H
#define UCOP_COMMON_UTILS_TIME_UTILS_H

#include "core/types/context.h"
#include <cstdint>
#include <string>
#include <string_view>

namespace ucop {

Timestamp now();

// "2024-05-01T12:30:45.123456Z"
std::string to_iso8601(Timestamp ts);

int64_t to_epoch_micros(Timestamp ts);
Timestamp from_epoch_micros(int64_t micros);

// "<prefix>_<12 hex digits of epoch micros>_<8 random hex digits>"; ids sort by creation time
std::string generate_id(std::string_view prefix);

} // namespace ucop

#endif // UCOP_COMMON_UTILS_TIME_UTILS_H
