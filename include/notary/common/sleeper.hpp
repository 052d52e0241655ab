#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <stop_token>

namespace notary::common {

/// Suspend the calling thread for `delay`.
///
/// Returns false when `stop` was requested before or during the wait, in
/// which case the caller must abandon its retry loop.
using sleeper_t =
    std::function<bool(std::chrono::milliseconds delay,
                       const std::stop_token& stop)>;

/// Wall clock in milliseconds since the Unix epoch.
using millis_clock_t = std::function<uint64_t()>;

/// Sleeper backed by a condition variable that wakes early on stop requests.
sleeper_t make_thread_sleeper();

/// Sleeper that returns immediately; honours stop requests.
sleeper_t make_immediate_sleeper();

millis_clock_t make_system_clock();

uint64_t now_milliseconds();

}  // namespace notary::common
