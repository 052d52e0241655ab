#pragma once

#include <notary/rpc/http_client.hpp>
#include <notary/schema/funding_source.hpp>

#include <chrono>
#include <string>
#include <string_view>

namespace notary::rpc {

/// Faucet boundary. `request_funds` returns on a 2xx acknowledgment and
/// throws rpc_error otherwise.
class faucet_client {
 public:
  virtual ~faucet_client() = default;

  virtual void request_funds(const notary::schema::funding_source_t& source,
                             std::string_view address) = 0;
};

/// `account=<address>` for form faucets, `{"account":"<address>"}` for JSON.
std::string make_faucet_body(const notary::schema::funding_source_t& source,
                             std::string_view address);

class http_faucet_client final : public faucet_client {
 public:
  explicit http_faucet_client(
      std::chrono::seconds timeout = std::chrono::seconds{30});

  void request_funds(const notary::schema::funding_source_t& source,
                     std::string_view address) override;

 private:
  http_client http_;
};

}  // namespace notary::rpc
