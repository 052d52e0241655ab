#include <gtest/gtest.h>
#include <notary/service/funding_coordinator.hpp>
#include <notary/testing/common.hpp>
#include <notary/testing/fake_faucet_client.hpp>
#include <notary/testing/fake_node_client.hpp>

#include <chrono>
#include <stop_token>
#include <vector>

namespace {

constexpr auto kAddress = std::string_view{"FUNDEDADDRESS"};

struct fixture final {
  notary::testing::fake_node_client node;
  notary::testing::fake_faucet_client faucet;
  notary::testing::recording_sleeper sleeper;

  notary::service::funding_coordinator make(
      notary::service::funding_options options = {}) {
    return notary::service::funding_coordinator{node, faucet,
                                                std::move(options),
                                                sleeper.sleeper()};
  }
};

}  // namespace

TEST(funding_coordinator, skips_faucets_when_balance_suffices) {
  auto f = fixture{};
  f.node.balances = {250000};
  auto funding = f.make();

  EXPECT_TRUE(funding.ensure_funded(kAddress));
  EXPECT_TRUE(f.faucet.requests.empty());
  EXPECT_EQ(f.node.account_calls, 1);
}

TEST(funding_coordinator, stops_after_first_successful_faucet) {
  auto f = fixture{};
  f.node.balances = {0, 150000};
  auto funding = f.make();

  EXPECT_TRUE(funding.ensure_funded(kAddress, 100000));
  ASSERT_EQ(f.faucet.requests.size(), 1u);
  EXPECT_EQ(f.faucet.requests[0].first, "Algorand Testnet Dispenser");
  EXPECT_EQ(f.faucet.requests[0].second, kAddress);
  EXPECT_EQ(f.sleeper.delays,
            (std::vector<std::chrono::milliseconds>{
                std::chrono::milliseconds{5000}}));
}

TEST(funding_coordinator, moves_on_when_a_faucet_fails) {
  auto f = fixture{};
  f.node.balances = {0, 150000};
  f.faucet.failing = {"Algorand Testnet Dispenser"};
  auto funding = f.make();

  EXPECT_TRUE(funding.ensure_funded(kAddress));
  ASSERT_EQ(f.faucet.requests.size(), 2u);
  EXPECT_EQ(f.faucet.requests[1].first, "Algorand Bank");
}

TEST(funding_coordinator, reports_failure_when_every_faucet_fails) {
  auto f = fixture{};
  f.node.balances = {0};
  f.faucet.failing = {"Algorand Testnet Dispenser", "Algorand Bank"};
  auto funding = f.make();

  EXPECT_FALSE(funding.ensure_funded(kAddress));
  EXPECT_EQ(f.faucet.requests.size(), 3u);
}

TEST(funding_coordinator, gives_up_when_balance_cannot_be_read) {
  auto f = fixture{};
  f.node.account_failures = 3;
  auto funding = f.make();

  EXPECT_FALSE(funding.balance(kAddress).has_value());
  EXPECT_EQ(f.node.account_calls, 3);
  EXPECT_EQ(f.sleeper.delays,
            (std::vector<std::chrono::milliseconds>{
                std::chrono::milliseconds{1000},
                std::chrono::milliseconds{2000}}));

  f.node.account_failures = 3;
  EXPECT_FALSE(funding.ensure_funded(kAddress));
  EXPECT_TRUE(f.faucet.requests.empty());
}

TEST(funding_coordinator, honours_stop_requests) {
  auto f = fixture{};
  f.node.balances = {0};
  auto funding = f.make();
  auto source = std::stop_source{};
  source.request_stop();

  EXPECT_FALSE(funding.ensure_funded(kAddress, source.get_token()));
  EXPECT_TRUE(f.faucet.requests.empty());
}

TEST(funding_coordinator, lists_manual_guidance_for_every_source) {
  auto f = fixture{};
  auto funding = f.make();
  auto steps = funding.manual_funding_guidance(kAddress);
  ASSERT_EQ(steps.size(), 2u + funding.options().sources.size());
  EXPECT_NE(steps.front().find(kAddress), std::string::npos);
  EXPECT_NE(steps[1].find("https://dispenser.testnet.aws.algodev.network/"),
            std::string::npos);
}
