#pragma once

#include <notary/schema/commitment_error_code.hpp>

#include <stdexcept>
#include <string>

namespace notary::service {

/// Every identity generation strategy failed.
class identity_generation_exhausted final : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// An identity, mnemonic or private key failed validation.
class invalid_identity final : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

/// The richest note format alone exceeds the ledger note ceiling.
class note_too_large final : public std::length_error {
 public:
  using std::length_error::length_error;
};

/// A stop request interrupted a retry loop.
class operation_cancelled final : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class commitment_failed final : public std::runtime_error {
 public:
  commitment_failed(const notary::schema::commitment_error_code_t code,
                    const std::string& reason)
      : std::runtime_error{std::string{notary::schema::to_string(code)} +
                           ": " + reason},
        code_{code},
        reason_{reason} {}

  notary::schema::commitment_error_code_t code() const { return code_; }
  const std::string& reason() const { return reason_; }

 private:
  notary::schema::commitment_error_code_t code_;
  std::string reason_;
};

}  // namespace notary::service
