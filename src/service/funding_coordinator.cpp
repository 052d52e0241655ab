#include <notary/rpc/errors.hpp>
#include <notary/service/funding_coordinator.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace notary::service {

std::vector<notary::schema::funding_source_t> default_funding_sources() {
  using notary::schema::body_format_t;
  auto make = [](std::string name, std::string url, body_format_t format) {
    auto source = notary::schema::funding_source_t{};
    source.name = std::move(name);
    source.url = std::move(url);
    source.body_format = format;
    return source;
  };
  return {make("Algorand Testnet Dispenser",
               "https://dispenser.testnet.aws.algodev.network/",
               body_format_t::form),
          make("Algorand Bank", "https://bank.testnet.algorand.network/",
               body_format_t::form),
          make("AlgoExplorer Faucet",
               "https://testnet.algoexplorerapi.io/v1/faucet",
               body_format_t::json)};
}

funding_coordinator::funding_coordinator(notary::rpc::node_client& node,
                                         notary::rpc::faucet_client& faucet,
                                         funding_options options,
                                         notary::common::sleeper_t sleeper)
    : node_{node},
      faucet_{faucet},
      options_{std::move(options)},
      sleeper_{std::move(sleeper)} {}

const funding_options& funding_coordinator::options() const {
  return options_;
}

std::optional<notary::schema::microalgos_t> funding_coordinator::balance(
    const std::string_view address,
    const std::stop_token& stop) const {
  try {
    return with_retries(
        options_.balance_retry, sleeper_, stop, "balance query",
        [&](uint32_t) { return node_.account_info(address).amount; });
  } catch (const operation_cancelled&) {
    spdlog::info("balance query for {} cancelled", address);
  } catch (const std::exception& e) {
    spdlog::error("balance query for {} failed: {}", address, e.what());
  }
  return std::nullopt;
}

bool funding_coordinator::ensure_funded(const std::string_view address,
                                        const std::stop_token& stop) const {
  return ensure_funded(address, options_.minimum_balance, stop);
}

bool funding_coordinator::ensure_funded(
    const std::string_view address,
    const notary::schema::microalgos_t minimum_balance,
    const std::stop_token& stop) const {
  auto current = balance(address, stop);
  if (!current) {
    log_manual_guidance(address);
    return false;
  }
  if (*current >= minimum_balance) {
    spdlog::debug("{} holds {} microAlgos, no funding needed", address,
                  *current);
    return true;
  }

  spdlog::info("{} holds {} of {} microAlgos, requesting faucet funds",
               address, *current, minimum_balance);
  for (const auto& source : options_.sources) {
    if (stop.stop_requested()) {
      spdlog::info("funding of {} cancelled", address);
      return false;
    }
    try {
      faucet_.request_funds(source, address);
    } catch (const std::exception& e) {
      spdlog::warn("{} failed: {}", source.name, e.what());
      continue;
    }

    spdlog::info("{} accepted the request, waiting {} ms", source.name,
                 options_.settle_delay.count());
    if (!sleeper_(options_.settle_delay, stop)) {
      spdlog::info("funding of {} cancelled", address);
      return false;
    }
    auto updated = balance(address, stop);
    if (updated && *updated >= minimum_balance) {
      spdlog::info("{} funded by {}, balance {} microAlgos", address,
                   source.name, *updated);
      return true;
    }
    spdlog::warn("{} balance still below {} after {}", address,
                 minimum_balance, source.name);
  }

  log_manual_guidance(address);
  return false;
}

std::vector<std::string> funding_coordinator::manual_funding_guidance(
    const std::string_view address) const {
  auto steps = std::vector<std::string>{};
  steps.push_back("Fund this address manually: " + std::string{address});
  for (const auto& source : options_.sources) {
    steps.push_back(source.name + ": " + source.url);
  }
  steps.push_back("Paste the address into one of the faucets, request test "
                  "ALGO and retry once the balance shows at least " +
                  std::to_string(options_.minimum_balance) + " microAlgos.");
  return steps;
}

void funding_coordinator::log_manual_guidance(
    const std::string_view address) const {
  for (const auto& line : manual_funding_guidance(address)) {
    spdlog::warn("{}", line);
  }
}

}  // namespace notary::service
