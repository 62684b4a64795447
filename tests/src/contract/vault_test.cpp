#include <gtest/gtest.h>
#include <a402/abi/codec.hpp>
#include <a402/contract/vault.hpp>
#include <a402/testing/common.hpp>
#include <a402/testing/fake_node.hpp>

#include <algorithm>
#include <string>

namespace {

using a402::schema::amount_t;
using a402::schema::bytes_t;
using a402::testing::make_address;

std::string hex(const bytes_t& bytes) {
  return a402::schema::to_hex_prefixed(a402::schema::make_bytes_view(bytes));
}

bytes_t resource_return(const amount_t& price,
                        const std::string& content_type,
                        const std::string& content_ref) {
  auto values = a402::abi::encode_arguments(
      {a402::abi::abi_type_t::uint256, a402::abi::abi_type_t::boolean,
       a402::abi::abi_type_t::boolean, a402::abi::abi_type_t::boolean,
       a402::abi::abi_type_t::string, a402::abi::abi_type_t::string,
       a402::abi::abi_type_t::uint256},
      {price, true, true, true, content_type, content_ref, amount_t{3}});
  return values;
}

}  // namespace

TEST(vault, has_access_true_and_false) {
  auto node = a402::testing::fake_node{};
  auto granted_user = make_address(0x40);
  auto other_user = make_address(0x50);
  node.set_call_result(
      hex(a402::contract::encode_has_access("video-001", granted_user)),
      hex(bytes_t(a402::abi::encode_arguments({a402::abi::abi_type_t::boolean},
                                              {true}))));
  node.set_call_result(
      hex(a402::contract::encode_has_access("video-001", other_user)),
      hex(a402::abi::encode_arguments({a402::abi::abi_type_t::boolean},
                                      {false})));

  auto reader = a402::rpc::chain_reader{node.transport()};
  auto vault = a402::contract::vault_client{reader, make_address(0x01)};
  EXPECT_TRUE(vault.has_access("video-001", granted_user));
  EXPECT_FALSE(vault.has_access("video-001", other_user));
  ASSERT_EQ(node.calls().size(), 2u);
  EXPECT_EQ(node.calls()[0][0]["to"],
            a402::schema::to_hex_prefixed(make_address(0x01)));
}

TEST(vault, empty_has_access_result_means_no_access) {
  auto node = a402::testing::fake_node{};
  auto reader = a402::rpc::chain_reader{node.transport()};
  auto vault = a402::contract::vault_client{reader, make_address(0x01)};
  EXPECT_FALSE(vault.has_access("video-001", make_address(0x40)));
}

TEST(vault, get_resource_decodes_all_fields) {
  auto node = a402::testing::fake_node{};
  node.set_call_result(
      hex(a402::contract::encode_get_resource("video-001")),
      hex(resource_return(amount_t{1000000000000000ull}, "ipfs",
                          "ipfs://bafybeigdyr")));
  auto reader = a402::rpc::chain_reader{node.transport()};
  auto vault = a402::contract::vault_client{reader, make_address(0x01)};

  auto resource = vault.get_resource("video-001");
  EXPECT_EQ(resource.resource_id, "video-001");
  EXPECT_EQ(resource.price, amount_t{1000000000000000ull});
  EXPECT_TRUE(resource.lifetime);
  EXPECT_TRUE(resource.active);
  EXPECT_TRUE(resource.exists);
  EXPECT_EQ(resource.content_type, "ipfs");
  EXPECT_EQ(resource.content_ref, "ipfs://bafybeigdyr");
  EXPECT_EQ(resource.total_payments, amount_t{3});
}

TEST(vault, empty_resource_result_is_truncated) {
  auto node = a402::testing::fake_node{};
  auto reader = a402::rpc::chain_reader{node.transport()};
  auto vault = a402::contract::vault_client{reader, make_address(0x01)};
  try {
    static_cast<void>(vault.get_resource("missing"));
    FAIL() << "expected abi_error";
  } catch (const a402::abi::abi_error& e) {
    EXPECT_EQ(e.code(), a402::abi::abi_error_code::truncated_data);
  }
}

TEST(vault, pay_for_access_calldata_carries_nonce) {
  auto nonce = a402::testing::make_hash(0x77);
  auto call = a402::contract::encode_pay_for_access("video-001", nonce);
  EXPECT_EQ(hex(bytes_t{call.begin(), call.begin() + 4}), "0xc5367d0d");
  auto args = a402::abi::strip_selector(a402::schema::make_bytes_view(call));
  EXPECT_TRUE(std::equal(nonce.begin(), nonce.end(), args.begin() + 32));
}

TEST(vault, payment_event_fields_come_from_topics_and_second_word) {
  auto log = a402::schema::log_entry_t{};
  log.address = make_address(0x01);
  log.topics = {a402::testing::make_hash(0x01),
                a402::testing::address_topic(make_address(0x60)),
                a402::testing::address_topic(make_address(0x70))};
  log.data = a402::testing::payment_data(amount_t{12345});

  auto event = a402::contract::try_decode_payment_event(log);
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->payer, make_address(0x60));
  EXPECT_EQ(event->beneficiary, make_address(0x70));
  EXPECT_EQ(event->amount, amount_t{12345});
}

TEST(vault, logs_without_payment_layout_are_ignored) {
  auto log = a402::schema::log_entry_t{};
  log.topics = {a402::testing::make_hash(0x01),
                a402::testing::address_topic(make_address(0x60))};
  log.data = a402::testing::payment_data(amount_t{1});
  EXPECT_FALSE(a402::contract::try_decode_payment_event(log).has_value());

  log.topics.push_back(a402::testing::address_topic(make_address(0x70)));
  log.data.resize(63);
  EXPECT_FALSE(a402::contract::try_decode_payment_event(log).has_value());
}

TEST(vault, event_resource_id_decodes_from_leading_string) {
  auto log = a402::schema::log_entry_t{};
  log.data = a402::abi::encode_arguments(
      {a402::abi::abi_type_t::string, a402::abi::abi_type_t::uint256},
      {std::string{"video-001"}, amount_t{5}});
  EXPECT_EQ(a402::contract::try_decode_event_resource_id(log), "video-001");

  log.data = bytes_t(64, 0);
  log.data[31] = 0xFF;
  EXPECT_FALSE(a402::contract::try_decode_event_resource_id(log).has_value());
}
