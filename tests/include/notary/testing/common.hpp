#pragma once

#include <notary/common/sleeper.hpp>
#include <notary/crypto/ed25519.hpp>
#include <notary/ledger/address.hpp>
#include <notary/ledger/mnemonic.hpp>
#include <notary/schema/identity.hpp>
#include <notary/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace notary::testing {

inline notary::schema::ed25519_seed_t make_seed(const uint8_t seed) {
  auto out = notary::schema::ed25519_seed_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

/// Deterministic identity derived from make_seed(seed).
inline notary::schema::identity_t make_identity(const uint8_t seed) {
  auto pair = notary::crypto::ed25519_from_seed(make_seed(seed));
  auto identity = notary::schema::identity_t{};
  identity.address = notary::ledger::encode_address(pair->public_key);
  identity.private_key.assign(std::begin(pair->seed), std::end(pair->seed));
  identity.private_key.insert(std::end(identity.private_key),
                              std::begin(pair->public_key),
                              std::end(pair->public_key));
  return identity;
}

/// 64 hex characters, all `digit`.
inline std::string make_fingerprint(const char digit) {
  return std::string(64, digit);
}

/// "w0000" .. "w2047".
inline std::vector<std::string> make_synthetic_words() {
  auto words = std::vector<std::string>{};
  words.reserve(notary::ledger::kWordListSize);
  for (std::size_t i = 0; i < notary::ledger::kWordListSize; ++i) {
    auto digits = std::to_string(i);
    words.push_back("w" + std::string(4 - digits.size(), '0') + digits);
  }
  return words;
}

inline notary::ledger::word_list make_word_list() {
  return *notary::ledger::word_list::from_words(make_synthetic_words());
}

/// Sleeper that records each requested delay and returns immediately.
struct recording_sleeper final {
  std::mutex mutex;
  std::vector<std::chrono::milliseconds> delays;

  notary::common::sleeper_t sleeper() {
    return [this](const std::chrono::milliseconds delay,
                  const std::stop_token& stop) {
      auto lock = std::lock_guard{mutex};
      delays.push_back(delay);
      return !stop.stop_requested();
    };
  }
};

inline notary::common::millis_clock_t make_fixed_clock(const uint64_t now) {
  return [now] { return now; };
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace notary::testing
