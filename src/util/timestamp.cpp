#include <feedstore/timestamp.hpp>
#include <cmath>
#include <limits>

namespace feedstore {

using std::chrono::microseconds;

static constexpr int64_t MICROS_PER_SEC = 1000000;
static constexpr int64_t REFERENCE_EPOCH_US = REFERENCE_EPOCH_UNIX_SEC * MICROS_PER_SEC;

Timestamp now() {
    return std::chrono::time_point_cast<microseconds>(std::chrono::system_clock::now());
}

double to_reference_seconds(Timestamp ts) {
    // Both operands are exact in a double for any clock value within
    // 2^53 us of the epoch, so ordinary timestamps convert without loss.
    double us = static_cast<double>(ts.time_since_epoch().count())
                - static_cast<double>(REFERENCE_EPOCH_US);
    return us / static_cast<double>(MICROS_PER_SEC);
}

bool is_valid_reference_seconds(double seconds) {
    return std::isfinite(seconds)
           && seconds >= -MAX_REFERENCE_SECONDS
           && seconds <= MAX_REFERENCE_SECONDS;
}

Timestamp from_reference_seconds(double seconds) {
    if (std::isnan(seconds)) return Timestamp(microseconds(REFERENCE_EPOCH_US));
    if (seconds > MAX_REFERENCE_SECONDS) return Timestamp::max();
    if (seconds < -MAX_REFERENCE_SECONDS) return Timestamp::min();

    // Round to the nearest microsecond so values written by to_reference_seconds
    // come back exactly.
    auto us = static_cast<int64_t>(std::llround(seconds * static_cast<double>(MICROS_PER_SEC)));
    return Timestamp(microseconds(us + REFERENCE_EPOCH_US));
}

} // namespace feedstore
