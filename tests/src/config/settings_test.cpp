#include <gtest/gtest.h>
#include <notary/config/settings.hpp>
#include <notary/testing/common.hpp>

#include <boost/program_options.hpp>

#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

namespace po = boost::program_options;

po::variables_map parse(std::vector<std::string> arguments) {
  auto argv = std::vector<const char*>{"notary"};
  for (const auto& argument : arguments) {
    argv.push_back(argument.c_str());
  }
  auto variables = po::variables_map{};
  po::store(po::parse_command_line(static_cast<int>(argv.size()), argv.data(),
                                   notary::config::make_options()),
            variables);
  po::notify(variables);
  return variables;
}

}  // namespace

TEST(config_settings, defaults_match_service_defaults) {
  auto settings = notary::config::from_variables(parse({}));
  EXPECT_EQ(settings.node.url, notary::rpc::kDefaultNodeUrl);
  EXPECT_EQ(settings.network, notary::schema::network_t::testnet);
  EXPECT_EQ(settings.explorer(), "https://testnet.algoexplorer.io");
  EXPECT_EQ(settings.funding.minimum_balance, 100000u);
  EXPECT_EQ(settings.funding.sources.size(), 3u);
  EXPECT_TRUE(settings.commitment.ensure_funding);
  EXPECT_EQ(settings.commitment.confirmation_rounds, 10u);
  EXPECT_EQ(settings.commitment.commit_retry.attempts, 3u);
  EXPECT_EQ(settings.verification.fetch_retry.base_delay.count(), 2000);
  EXPECT_FALSE(settings.verification.fetch_retry.linear_backoff);
  EXPECT_EQ(settings.verification.fallback_delay.count(), 5000);
  EXPECT_EQ(settings.commitment.note_template.application, "HealthGuardian");
  EXPECT_EQ(settings.digest, notary::fingerprint::digest_algorithm_t::sha256);
}

TEST(config_settings, applies_command_line_overrides) {
  auto settings = notary::config::from_variables(
      parse({"--network", "mainnet", "--no-funding", "--commit-attempts", "5",
             "--faucet", "local,http://localhost:9000/fund,json",
             "--digest", "blake3"}));
  EXPECT_EQ(settings.network, notary::schema::network_t::mainnet);
  EXPECT_EQ(settings.explorer(), "https://algoexplorer.io");
  EXPECT_FALSE(settings.commitment.ensure_funding);
  EXPECT_EQ(settings.commitment.commit_retry.attempts, 5u);
  ASSERT_EQ(settings.funding.sources.size(), 1u);
  EXPECT_EQ(settings.funding.sources[0].name, "local");
  EXPECT_EQ(settings.funding.sources[0].body_format,
            notary::schema::body_format_t::json);
  EXPECT_EQ(settings.digest, notary::fingerprint::digest_algorithm_t::blake3);
}

TEST(config_settings, rejects_malformed_values) {
  EXPECT_THROW(static_cast<void>(notary::config::from_variables(
                   parse({"--network", "devnet"}))),
               std::invalid_argument);
  EXPECT_THROW(static_cast<void>(notary::config::from_variables(
                   parse({"--verify-attempts", "0"}))),
               std::invalid_argument);
  EXPECT_THROW(static_cast<void>(notary::config::from_variables(
                   parse({"--digest", "md5"}))),
               std::invalid_argument);
}

TEST(config_settings, parses_funding_sources) {
  auto source = notary::config::parse_funding_source(
      "Bank,https://bank.testnet.algorand.network/,form");
  EXPECT_EQ(source.name, "Bank");
  EXPECT_EQ(source.url, "https://bank.testnet.algorand.network/");
  EXPECT_EQ(source.body_format, notary::schema::body_format_t::form);

  EXPECT_THROW(
      static_cast<void>(notary::config::parse_funding_source("Bank,url")),
      std::invalid_argument);
  EXPECT_THROW(static_cast<void>(
                   notary::config::parse_funding_source("Bank,url,xml")),
               std::invalid_argument);
}

TEST(config_settings, command_line_takes_precedence_over_file) {
  auto path = notary::testing::make_db_path("notary_config") + ".ini";
  {
    auto out = std::ofstream{path};
    out << "network = betanet\n"
        << "confirmation-rounds = 20\n";
  }
  auto options = notary::config::make_options();
  auto argv = std::vector<const char*>{"notary", "--network", "mainnet"};
  auto variables = po::variables_map{};
  po::store(po::parse_command_line(static_cast<int>(argv.size()), argv.data(),
                                   options),
            variables);
  notary::config::load_config_file(path, options, variables);
  po::notify(variables);

  auto settings = notary::config::from_variables(variables);
  EXPECT_EQ(settings.network, notary::schema::network_t::mainnet);
  EXPECT_EQ(settings.commitment.confirmation_rounds, 20u);
  notary::testing::remove_path(path);

  EXPECT_THROW(notary::config::load_config_file(path, options, variables),
               std::runtime_error);
}
