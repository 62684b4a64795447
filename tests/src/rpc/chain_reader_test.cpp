#include <gtest/gtest.h>
#include <a402/rpc/chain_reader.hpp>
#include <a402/testing/common.hpp>
#include <a402/testing/fake_node.hpp>

#include <string>

namespace {

using a402::testing::make_address;
using a402::testing::make_hash;

}  // namespace

TEST(chain_reader, call_sends_latest_block_eth_call) {
  auto seen_method = std::string{};
  auto seen_params = nlohmann::json{};
  auto reader = a402::rpc::chain_reader{
      [&](const std::string_view method, const nlohmann::json& params) {
        seen_method = std::string{method};
        seen_params = params;
        return nlohmann::json("0x00ff");
      }};

  auto data = a402::schema::bytes_t{0x13, 0xbd, 0x20, 0xe2};
  auto result =
      reader.call(make_address(0x01), a402::schema::make_bytes_view(data));

  EXPECT_EQ(seen_method, "eth_call");
  ASSERT_EQ(seen_params.size(), 2u);
  EXPECT_EQ(seen_params[0]["to"],
            a402::schema::to_hex_prefixed(make_address(0x01)));
  EXPECT_EQ(seen_params[0]["data"], "0x13bd20e2");
  EXPECT_EQ(seen_params[1], "latest");
  EXPECT_EQ(result, (a402::schema::bytes_t{0x00, 0xff}));
}

TEST(chain_reader, null_call_result_is_empty) {
  auto reader = a402::rpc::chain_reader{
      [](std::string_view, const nlohmann::json&) { return nlohmann::json{}; }};
  auto data = a402::schema::bytes_t{};
  EXPECT_TRUE(
      reader.call(make_address(0x01), a402::schema::make_bytes_view(data))
          .empty());
}

TEST(chain_reader, receipt_parses_status_and_logs) {
  auto node = a402::testing::fake_node{};
  auto tx = a402::testing::make_transaction_id(0x20);
  auto logs = nlohmann::json::array();
  logs.push_back(a402::testing::make_log_json(
      make_address(0x01), {make_hash(0x01), make_hash(0x02)},
      a402::schema::bytes_t{0xAA}, 11));
  node.add_receipt(tx, a402::testing::make_receipt_json(tx, "0x1", logs));
  auto reader = a402::rpc::chain_reader{node.transport()};

  auto receipt = reader.get_receipt(tx);
  ASSERT_TRUE(receipt.has_value());
  EXPECT_TRUE(receipt->succeeded());
  EXPECT_EQ(receipt->block_number, 16u);
  EXPECT_EQ(receipt->transaction_hash, make_hash(0x20));
  ASSERT_EQ(receipt->logs.size(), 1u);
  EXPECT_EQ(receipt->logs[0].address, make_address(0x01));
  ASSERT_EQ(receipt->logs[0].topics.size(), 2u);
  EXPECT_EQ(receipt->logs[0].topics[1], make_hash(0x02));
  EXPECT_EQ(receipt->logs[0].data, (a402::schema::bytes_t{0xAA}));
  EXPECT_EQ(receipt->logs[0].log_index, 11u);
  EXPECT_EQ(node.count("eth_getTransactionReceipt"), 1u);
}

TEST(chain_reader, failed_status_is_not_success) {
  auto node = a402::testing::fake_node{};
  auto tx = a402::testing::make_transaction_id(0x21);
  node.add_receipt(
      tx, a402::testing::make_receipt_json(tx, "0x0", nlohmann::json::array()));
  auto reader = a402::rpc::chain_reader{node.transport()};
  auto receipt = reader.get_receipt(tx);
  ASSERT_TRUE(receipt.has_value());
  EXPECT_FALSE(receipt->succeeded());
}

TEST(chain_reader, unknown_transaction_is_absent) {
  auto node = a402::testing::fake_node{};
  auto reader = a402::rpc::chain_reader{node.transport()};
  auto tx = a402::testing::make_transaction_id(0x22);
  EXPECT_FALSE(reader.get_receipt(tx).has_value());
  EXPECT_FALSE(reader.get_transaction(tx).has_value());
}

TEST(chain_reader, transaction_without_destination_parses) {
  auto node = a402::testing::fake_node{};
  auto tx = a402::testing::make_transaction_id(0x23);
  node.add_transaction(tx, a402::testing::make_transaction_json(
                               tx, make_address(0x05), std::nullopt));
  auto reader = a402::rpc::chain_reader{node.transport()};
  auto parsed = reader.get_transaction(tx);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->from, make_address(0x05));
  EXPECT_FALSE(parsed->to.has_value());
  EXPECT_EQ(parsed->value, a402::schema::amount_t{1000000000000000ull});
}

TEST(chain_reader, malformed_fields_raise_response_error) {
  auto tx = a402::testing::make_transaction_id(0x24);
  auto receipt = a402::testing::make_receipt_json(
      tx, "0x1",
      nlohmann::json::array({nlohmann::json{{"address", "0x1234"},
                                            {"topics", nlohmann::json::array()},
                                            {"data", "0x"}}}));
  auto node = a402::testing::fake_node{};
  node.add_receipt(tx, receipt);
  auto reader = a402::rpc::chain_reader{node.transport()};
  EXPECT_THROW(static_cast<void>(reader.get_receipt(tx)),
               a402::rpc::response_error);

  receipt["logs"] = nlohmann::json::array(
      {nlohmann::json{{"address", a402::schema::to_hex_prefixed(make_address(1))},
                      {"topics", nlohmann::json::array()},
                      {"data", "0xabc"}}});
  node.add_receipt(tx, receipt);
  EXPECT_THROW(static_cast<void>(reader.get_receipt(tx)),
               a402::rpc::response_error);

  receipt["logs"] = "not a list";
  node.add_receipt(tx, receipt);
  EXPECT_THROW(static_cast<void>(reader.get_receipt(tx)),
               a402::rpc::response_error);
}

TEST(chain_reader, transport_errors_propagate) {
  auto node = a402::testing::fake_node{};
  node.fail_method("eth_getTransactionReceipt");
  auto reader = a402::rpc::chain_reader{node.transport()};
  EXPECT_THROW(static_cast<void>(reader.get_receipt(
                   a402::testing::make_transaction_id(0x25))),
               a402::rpc::transport_error);
}
