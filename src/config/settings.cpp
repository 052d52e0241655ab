#include <notary/config/settings.hpp>
#include <notary/ledger/explorer.hpp>

#include <chrono>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace notary::config {

namespace po = boost::program_options;

namespace {

std::chrono::milliseconds milliseconds_option(
    const po::variables_map& variables,
    const char* name) {
  return std::chrono::milliseconds{variables[name].as<uint64_t>()};
}

uint32_t attempts_option(const po::variables_map& variables,
                         const char* name) {
  auto value = variables[name].as<uint32_t>();
  if (value == 0) {
    throw std::invalid_argument{std::string{name} + " must be at least 1"};
  }
  return value;
}

}  // namespace

std::string_view settings::explorer() const {
  if (!explorer_base.empty()) {
    return explorer_base;
  }
  return notary::ledger::default_explorer_base(network);
}

po::options_description make_options() {
  auto description = po::options_description{"Settings"};
  // clang-format off
  description.add_options()
      ("node-url", po::value<std::string>()->default_value(
           std::string{notary::rpc::kDefaultNodeUrl}),
       "Ledger node REST endpoint")
      ("node-token", po::value<std::string>()->default_value(""),
       "X-Algo-API-Token sent to the node")
      ("node-timeout", po::value<uint32_t>()->default_value(10),
       "Per request timeout in seconds")
      ("network", po::value<std::string>()->default_value("testnet"),
       "testnet, mainnet or betanet")
      ("explorer-base", po::value<std::string>()->default_value(""),
       "Block explorer base URL, empty for the network default")
      ("minimum-balance", po::value<uint64_t>()->default_value(
           notary::service::kDefaultMinimumBalance),
       "Balance in microAlgos required before committing")
      ("settle-delay-ms", po::value<uint64_t>()->default_value(5000),
       "Wait after a faucet accepts a request")
      ("faucet", po::value<std::vector<std::string>>()->composing(),
       "Faucet as name,url,form|json; repeatable")
      ("no-funding", po::bool_switch(), "Skip the funding check on commit")
      ("confirmation-rounds", po::value<uint64_t>()->default_value(10),
       "Rounds to wait for confirmation")
      ("commit-attempts", po::value<uint32_t>()->default_value(3),
       "Attempts of the whole commit sequence")
      ("commit-backoff-ms", po::value<uint64_t>()->default_value(2000),
       "Commit backoff, multiplied by the attempt number")
      ("verify-attempts", po::value<uint32_t>()->default_value(3),
       "Transaction lookups before giving up")
      ("verify-delay-ms", po::value<uint64_t>()->default_value(2000),
       "Delay between transaction lookups")
      ("fallback-delay-ms", po::value<uint64_t>()->default_value(5000),
       "Wait before the fallback note search")
      ("fallback-attempts", po::value<uint32_t>()->default_value(3),
       "Fallback lookups")
      ("fallback-backoff-ms", po::value<uint64_t>()->default_value(3000),
       "Fallback backoff, multiplied by the attempt number")
      ("application", po::value<std::string>()->default_value("HealthGuardian"),
       "Application name written into notes")
      ("digest", po::value<std::string>()->default_value("sha256"),
       "Fingerprint digest: sha256 or blake3")
      ("word-list", po::value<std::string>()->default_value(""),
       "2048 word mnemonic dictionary, one word per line")
      ("storage-path", po::value<std::string>()->default_value("notary-db"),
       "Commitment ledger directory")
      ("log-level", po::value<std::string>()->default_value("info"),
       "trace, debug, info, warn, error, critical or off")
      ("log-file", po::value<std::string>()->default_value("notary.log"),
       "Log file, empty to disable");
  // clang-format on
  return description;
}

void load_config_file(const std::string& path,
                      const po::options_description& options,
                      po::variables_map& variables) {
  auto input = std::ifstream{path};
  if (!input) {
    throw std::runtime_error{"cannot read config file " + path};
  }
  po::store(po::parse_config_file(input, options), variables);
}

notary::schema::funding_source_t parse_funding_source(
    const std::string_view value) {
  auto fields = std::vector<std::string>{};
  auto start = std::size_t{0};
  while (true) {
    auto comma = value.find(',', start);
    fields.emplace_back(value.substr(start, comma - start));
    if (comma == std::string_view::npos) {
      break;
    }
    start = comma + 1;
  }
  if (fields.size() != 3 || fields[0].empty() || fields[1].empty()) {
    throw std::invalid_argument{"faucet must be name,url,form|json: " +
                                std::string{value}};
  }
  auto source = notary::schema::funding_source_t{};
  source.name = fields[0];
  source.url = fields[1];
  source.body_format =
      notary::schema::parse_enum(fields[2],
                                 notary::schema::kBodyFormatMappings);
  return source;
}

settings from_variables(const po::variables_map& variables) {
  auto out = settings{};

  out.node.url = variables["node-url"].as<std::string>();
  out.node.token = variables["node-token"].as<std::string>();
  out.node.timeout =
      std::chrono::seconds{variables["node-timeout"].as<uint32_t>()};
  out.network = notary::schema::parse_enum(
      variables["network"].as<std::string>(), notary::schema::kNetworkMappings);
  out.explorer_base = variables["explorer-base"].as<std::string>();

  out.funding.minimum_balance = variables["minimum-balance"].as<uint64_t>();
  out.funding.settle_delay = milliseconds_option(variables, "settle-delay-ms");
  if (variables.contains("faucet")) {
    out.funding.sources.clear();
    for (const auto& faucet :
         variables["faucet"].as<std::vector<std::string>>()) {
      out.funding.sources.push_back(parse_funding_source(faucet));
    }
  }

  out.commitment.ensure_funding = !variables["no-funding"].as<bool>();
  out.commitment.confirmation_rounds =
      variables["confirmation-rounds"].as<uint64_t>();
  out.commitment.commit_retry.attempts =
      attempts_option(variables, "commit-attempts");
  out.commitment.commit_retry.base_delay =
      milliseconds_option(variables, "commit-backoff-ms");
  out.commitment.note_template.application =
      variables["application"].as<std::string>();

  out.verification.fetch_retry.attempts =
      attempts_option(variables, "verify-attempts");
  out.verification.fetch_retry.base_delay =
      milliseconds_option(variables, "verify-delay-ms");
  out.verification.fallback_delay =
      milliseconds_option(variables, "fallback-delay-ms");
  out.verification.fallback_retry.attempts =
      attempts_option(variables, "fallback-attempts");
  out.verification.fallback_retry.base_delay =
      milliseconds_option(variables, "fallback-backoff-ms");

  out.digest = notary::schema::parse_enum(
      variables["digest"].as<std::string>(),
      notary::fingerprint::kDigestAlgorithmMappings);
  out.word_list_path = variables["word-list"].as<std::string>();
  out.storage_path = variables["storage-path"].as<std::string>();
  out.log_level = variables["log-level"].as<std::string>();
  out.log_file = variables["log-file"].as<std::string>();
  return out;
}

}  // namespace notary::config
