#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace notary::rpc {

/// HTTP level failure talking to a node or faucet. `status()` is the HTTP
/// status code, or 0 when no response was received.
class rpc_error : public std::runtime_error {
 public:
  rpc_error(const unsigned status, const std::string& message,
            std::string body = {})
      : std::runtime_error{message}, status_{status}, body_{std::move(body)} {}

  unsigned status() const { return status_; }
  const std::string& body() const { return body_; }
  bool transport_failure() const { return status_ == 0; }

 private:
  unsigned status_{};
  std::string body_;
};

/// The node dropped the transaction from its pool.
class transaction_rejected final : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// The transaction was not confirmed within the requested number of rounds.
class confirmation_timeout final : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace notary::rpc
