#pragma once

#include <notary/common/sleeper.hpp>
#include <notary/service/errors.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <exception>
#include <stop_token>
#include <string_view>

namespace notary::service {

struct retry_policy final {
  uint32_t attempts{3};
  std::chrono::milliseconds base_delay{1000};
  /// Wait base_delay * attempt between attempts instead of a fixed delay.
  bool linear_backoff{true};

  std::chrono::milliseconds delay_after(const uint32_t attempt) const {
    return linear_backoff ? base_delay * attempt : base_delay;
  }
};

/// Invoke `fn(attempt)` until it returns, up to `policy.attempts` times,
/// sleeping between attempts. The last failure is rethrown. Throws
/// operation_cancelled when `stop` is requested before an attempt or during
/// a wait.
template <typename Fn>
auto with_retries(const retry_policy& policy,
                  const notary::common::sleeper_t& sleeper,
                  const std::stop_token& stop,
                  const std::string_view what,
                  Fn&& fn) -> decltype(fn(uint32_t{})) {
  auto last_error = std::exception_ptr{};
  for (auto attempt = uint32_t{1}; attempt <= policy.attempts; ++attempt) {
    if (stop.stop_requested()) {
      throw operation_cancelled{std::string{what} + " cancelled"};
    }
    try {
      return fn(attempt);
    } catch (const operation_cancelled&) {
      throw;
    } catch (const std::exception& e) {
      last_error = std::current_exception();
      spdlog::warn("{} attempt {}/{} failed: {}", what, attempt,
                   policy.attempts, e.what());
    }
    if (attempt < policy.attempts &&
        !sleeper(policy.delay_after(attempt), stop)) {
      throw operation_cancelled{std::string{what} + " cancelled"};
    }
  }
  if (last_error) {
    std::rethrow_exception(last_error);
  }
  throw operation_cancelled{std::string{what} + " made no attempts"};
}

}  // namespace notary::service
