#include <notary/crypto/digest.hpp>
#include <notary/ledger/address.hpp>
#include <notary/service/errors.hpp>
#include <notary/service/identity_provisioner.hpp>

#include <spdlog/spdlog.h>
#include <sys/utsname.h>

#include <algorithm>
#include <chrono>
#include <random>
#include <stdexcept>

namespace notary::service {

namespace {

notary::schema::ed25519_seed_t to_seed(
    const notary::schema::bytes_view_t& bytes) {
  auto seed = notary::schema::ed25519_seed_t{};
  std::copy_n(std::begin(bytes), seed.size(), std::begin(seed));
  return seed;
}

std::string platform_id() {
  auto info = utsname{};
  if (uname(&info) != 0) {
    return "unknown";
  }
  return std::string{info.sysname} + "/" + info.nodename + "/" +
         info.release + "/" + info.machine;
}

}  // namespace

identity_strategy make_keygen_strategy() {
  return {"openssl_keygen", [] { return notary::crypto::generate_ed25519(); }};
}

identity_strategy make_mnemonic_strategy(
    const notary::ledger::word_list* words) {
  return {"mnemonic_roundtrip",
          [words]() -> std::optional<notary::crypto::ed25519_key_pair> {
            if (words == nullptr) {
              throw std::runtime_error{"no word list loaded"};
            }
            auto entropy = notary::crypto::random_bytes(32);
            if (!entropy) {
              return std::nullopt;
            }
            auto phrase =
                notary::ledger::seed_to_mnemonic(to_seed(*entropy), *words);
            auto seed = notary::ledger::mnemonic_to_seed(phrase, *words);
            if (!seed) {
              return std::nullopt;
            }
            return notary::crypto::ed25519_from_seed(*seed);
          }};
}

identity_strategy make_random_device_strategy() {
  return {"random_device", [] {
            auto device = std::random_device{};
            auto seed = notary::schema::ed25519_seed_t{};
            for (auto i = std::size_t{0}; i < seed.size(); i += 4) {
              auto value = device();
              for (auto j = std::size_t{0}; j < 4; ++j) {
                seed[i + j] = static_cast<uint8_t>((value >> (8 * j)) & 0xFFu);
              }
            }
            return notary::crypto::ed25519_from_seed(seed);
          }};
}

identity_strategy make_clock_platform_strategy() {
  return {"clock_platform", [] {
            auto now = std::chrono::system_clock::now().time_since_epoch();
            auto material =
                std::to_string(
                    std::chrono::duration_cast<std::chrono::nanoseconds>(now)
                        .count()) +
                "|" + platform_id();
            auto seed = notary::crypto::sha512_256(
                notary::schema::make_bytes_view(material));
            return notary::crypto::ed25519_from_seed(seed);
          }};
}

identity_provisioner::identity_provisioner(
    const notary::ledger::word_list* words)
    : identity_provisioner{{make_keygen_strategy(),
                            make_mnemonic_strategy(words),
                            make_random_device_strategy(),
                            make_clock_platform_strategy()},
                           words} {}

identity_provisioner::identity_provisioner(
    std::vector<identity_strategy> strategies,
    const notary::ledger::word_list* words)
    : strategies_{std::move(strategies)}, words_{words} {}

notary::schema::identity_t identity_provisioner::make_identity(
    const notary::crypto::ed25519_key_pair& pair) const {
  auto identity = notary::schema::identity_t{};
  identity.address = notary::ledger::encode_address(pair.public_key);
  identity.private_key.reserve(notary::schema::kPrivateKeyLength);
  identity.private_key.insert(std::end(identity.private_key),
                              std::begin(pair.seed), std::end(pair.seed));
  identity.private_key.insert(std::end(identity.private_key),
                              std::begin(pair.public_key),
                              std::end(pair.public_key));
  if (words_ != nullptr) {
    identity.mnemonic = notary::ledger::seed_to_mnemonic(pair.seed, *words_);
  }
  return identity;
}

notary::schema::identity_t identity_provisioner::generate() const {
  for (const auto& strategy : strategies_) {
    try {
      auto pair = strategy.generate();
      if (!pair) {
        spdlog::warn("identity strategy {} produced no key pair",
                     strategy.name);
        continue;
      }
      auto identity = make_identity(*pair);
      if (!validate(identity)) {
        spdlog::warn("identity strategy {} produced an invalid identity",
                     strategy.name);
        continue;
      }
      spdlog::info("generated identity {} using {}", identity.address,
                   strategy.name);
      return identity;
    } catch (const std::exception& e) {
      spdlog::warn("identity strategy {} failed: {}", strategy.name, e.what());
    }
  }
  throw identity_generation_exhausted{"all " +
                                      std::to_string(strategies_.size()) +
                                      " identity strategies failed"};
}

bool identity_provisioner::validate(
    const notary::schema::identity_t& candidate) const {
  if (candidate.address.size() != notary::schema::kAddressLength) {
    spdlog::debug("identity address has length {}", candidate.address.size());
    return false;
  }
  auto public_key = notary::ledger::try_decode_address(candidate.address);
  if (!public_key) {
    spdlog::debug("identity address {} fails its checksum", candidate.address);
    return false;
  }
  if (candidate.private_key.size() != notary::schema::kPrivateKeyLength) {
    spdlog::debug("identity private key has length {}",
                  candidate.private_key.size());
    return false;
  }
  if (!std::equal(std::begin(*public_key), std::end(*public_key),
                  std::begin(candidate.private_key) + 32)) {
    spdlog::debug("identity private key does not belong to {}",
                  candidate.address);
    return false;
  }
  return true;
}

notary::schema::identity_t identity_provisioner::restore(
    const std::string_view mnemonic) const {
  if (words_ == nullptr) {
    throw invalid_identity{"no word list loaded, cannot restore a mnemonic"};
  }
  auto seed = notary::ledger::mnemonic_to_seed(mnemonic, *words_);
  if (!seed) {
    throw invalid_identity{"mnemonic is not a valid 25 word phrase"};
  }
  auto pair = notary::crypto::ed25519_from_seed(*seed);
  if (!pair) {
    throw invalid_identity{"mnemonic seed was rejected by the key generator"};
  }
  return make_identity(*pair);
}

notary::schema::identity_t identity_provisioner::from_private_key(
    const notary::schema::bytes_view_t& private_key) const {
  if (private_key.size() != 32 &&
      private_key.size() != notary::schema::kPrivateKeyLength) {
    throw invalid_identity{"private key must be 32 or 64 bytes, got " +
                           std::to_string(private_key.size())};
  }
  auto pair = notary::crypto::ed25519_from_seed(to_seed(private_key));
  if (!pair) {
    throw invalid_identity{"private key was rejected by the key generator"};
  }
  if (private_key.size() == notary::schema::kPrivateKeyLength &&
      !std::equal(std::begin(pair->public_key), std::end(pair->public_key),
                  std::begin(private_key) + 32)) {
    throw invalid_identity{"public half of the private key does not match"};
  }
  return make_identity(*pair);
}

std::optional<notary::schema::public_key_t> identity_provisioner::public_key_of(
    const notary::schema::identity_t& identity) {
  return notary::ledger::try_decode_address(identity.address);
}

std::optional<notary::schema::ed25519_seed_t> identity_provisioner::seed_of(
    const notary::schema::identity_t& identity) {
  if (identity.private_key.size() != notary::schema::kPrivateKeyLength) {
    return std::nullopt;
  }
  return to_seed(identity.private_key);
}

}  // namespace notary::service
