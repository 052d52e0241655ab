#include <notary/ledger/explorer.hpp>

namespace notary::ledger {

namespace {

std::string join(std::string_view base,
                 const std::string_view section,
                 const std::string_view value) {
  while (!base.empty() && base.back() == '/') {
    base.remove_suffix(1);
  }
  auto url = std::string{base};
  url += '/';
  url += section;
  url += '/';
  url += value;
  return url;
}

}  // namespace

std::string_view default_explorer_base(
    const notary::schema::network_t network) {
  using enum notary::schema::network_t;
  switch (network) {
    case mainnet:
      return "https://algoexplorer.io";
    case betanet:
      return "https://betanet.algoexplorer.io";
    case testnet:
    default:
      return "https://testnet.algoexplorer.io";
  }
}

std::string transaction_url(const std::string_view base,
                            const std::string_view transaction_id) {
  return join(base, "tx", transaction_id);
}

std::string address_url(const std::string_view base,
                        const std::string_view address) {
  return join(base, "address", address);
}

std::string application_url(const std::string_view base,
                            const uint64_t application_id) {
  return join(base, "application", std::to_string(application_id));
}

}  // namespace notary::ledger
