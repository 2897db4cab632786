#pragma once

#include <chrono>
#include <cstdint>

namespace feedstore {

using Timestamp = std::chrono::time_point<std::chrono::system_clock,
                                          std::chrono::microseconds>;

// Persisted timestamps are seconds since 2001-01-01T00:00:00Z,
// which is 978307200 seconds after the UNIX epoch.
constexpr int64_t REFERENCE_EPOCH_UNIX_SEC = 978307200;

Timestamp now();

// Largest magnitude accepted from storage, about 285000 years either side of
// the reference epoch; beyond it the microsecond count would leave int64.
constexpr double MAX_REFERENCE_SECONDS = 9.0e12;

double to_reference_seconds(Timestamp ts);

// False for NaN, infinities and magnitudes above MAX_REFERENCE_SECONDS
bool is_valid_reference_seconds(double seconds);

// Out-of-range input saturates to Timestamp::min()/max(); NaN maps to the
// reference epoch. Callers reading stored values check
// is_valid_reference_seconds first.
Timestamp from_reference_seconds(double seconds);

} // namespace feedstore
