#include <gtest/gtest.h>
#include <notary/rpc/errors.hpp>
#include <notary/testing/fake_node_client.hpp>

TEST(rpc_node_client, wait_for_confirmation_polls_until_confirmed) {
  auto node = notary::testing::fake_node_client{};
  node.infos = {notary::schema::transaction_info_t{},
                notary::schema::transaction_info_t{},
                notary::testing::make_confirmed(103)};

  auto info = node.wait_for_confirmation("T1", 10);
  EXPECT_EQ(info.confirmed_round, uint64_t{103});
  EXPECT_EQ(node.waited_rounds,
            (std::vector<notary::schema::round_t>{101, 102}));
  EXPECT_EQ(node.looked_up.size(), 3u);
}

TEST(rpc_node_client, wait_for_confirmation_raises_pool_errors) {
  auto node = notary::testing::fake_node_client{};
  auto rejected = notary::schema::transaction_info_t{};
  rejected.pool_error = "overspend";
  node.infos = {rejected};

  EXPECT_THROW(static_cast<void>(node.wait_for_confirmation("T1", 10)),
               notary::rpc::transaction_rejected);
}

TEST(rpc_node_client, wait_for_confirmation_times_out) {
  auto node = notary::testing::fake_node_client{};
  EXPECT_THROW(static_cast<void>(node.wait_for_confirmation("T1", 4)),
               notary::rpc::confirmation_timeout);
  EXPECT_EQ(node.looked_up.size(), 4u);
}
