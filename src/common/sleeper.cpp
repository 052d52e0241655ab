#include <notary/common/sleeper.hpp>

#include <condition_variable>
#include <mutex>

namespace notary::common {

sleeper_t make_thread_sleeper() {
  return [](std::chrono::milliseconds delay, const std::stop_token& stop) {
    if (stop.stop_requested()) {
      return false;
    }
    auto mutex = std::mutex{};
    auto condition = std::condition_variable_any{};
    auto lock = std::unique_lock{mutex};
    condition.wait_for(lock, stop, delay, [] { return false; });
    return !stop.stop_requested();
  };
}

sleeper_t make_immediate_sleeper() {
  return [](std::chrono::milliseconds, const std::stop_token& stop) {
    return !stop.stop_requested();
  };
}

millis_clock_t make_system_clock() {
  return [] { return now_milliseconds(); };
}

uint64_t now_milliseconds() {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

}  // namespace notary::common
