#include <gtest/gtest.h>
#include <a402/abi/codec.hpp>
#include <a402/access/access_gate.hpp>
#include <a402/testing/common.hpp>
#include <a402/testing/fake_node.hpp>

#include <string>

namespace {

using a402::schema::access_source_t;
using a402::testing::make_address;

const auto kContract = make_address(0x01);

std::string hex(const a402::schema::bytes_t& bytes) {
  return a402::schema::to_hex_prefixed(a402::schema::make_bytes_view(bytes));
}

std::string encoded_bool(const bool value) {
  return hex(
      a402::abi::encode_arguments({a402::abi::abi_type_t::boolean}, {value}));
}

a402::schema::verification_record_t session_record(
    const a402::schema::address_t& payer) {
  auto record = a402::schema::verification_record_t{};
  record.transaction_id = a402::testing::make_transaction_id(0x31);
  record.verified = true;
  record.payer = payer;
  record.beneficiary = make_address(0x70);
  record.amount = a402::schema::amount_t{1};
  return record;
}

class access_gate_test : public ::testing::Test {
 protected:
  a402::access::access_gate make_gate(const bool lifetime_access) const {
    return a402::access::access_gate{store, vault, "video-001",
                                     lifetime_access};
  }

  a402::testing::fake_node node;
  a402::rpc::chain_reader reader{node.transport()};
  a402::contract::vault_client vault{reader, kContract};
  a402::verification::verification_store_t store;
};

}  // namespace

TEST_F(access_gate_test, session_payment_grants_without_chain_reads) {
  auto user = make_address(0x40);
  store.insert(session_record(user));

  auto decision = make_gate(true).check(user);
  EXPECT_TRUE(decision.granted);
  EXPECT_EQ(decision.source, access_source_t::session);
  ASSERT_TRUE(decision.record.has_value());
  EXPECT_EQ(decision.record->payer, user);
  EXPECT_EQ(node.total(), 0u);
}

TEST_F(access_gate_test, lifetime_grant_on_chain) {
  auto user = make_address(0x41);
  node.set_call_result(hex(a402::contract::encode_has_access("video-001", user)),
                       encoded_bool(true));
  auto decision = make_gate(true).check(user);
  EXPECT_TRUE(decision.granted);
  EXPECT_EQ(decision.source, access_source_t::on_chain);
  EXPECT_EQ(node.count("eth_call"), 1u);
}

TEST_F(access_gate_test, contract_saying_no_denies) {
  auto user = make_address(0x42);
  node.set_call_result(hex(a402::contract::encode_has_access("video-001", user)),
                       encoded_bool(false));
  auto decision = make_gate(true).check(user);
  EXPECT_FALSE(decision.granted);
  EXPECT_EQ(decision.source, access_source_t::none);
}

TEST_F(access_gate_test, lifetime_access_disabled_skips_the_contract) {
  auto user = make_address(0x43);
  node.set_call_result(hex(a402::contract::encode_has_access("video-001", user)),
                       encoded_bool(true));
  auto decision = make_gate(false).check(user);
  EXPECT_FALSE(decision.granted);
  EXPECT_EQ(node.total(), 0u);
}

TEST_F(access_gate_test, chain_failures_fail_closed) {
  auto user = make_address(0x44);
  node.fail_method("eth_call");
  EXPECT_FALSE(make_gate(true).check(user).granted);
}

TEST_F(access_gate_test, undecodable_answer_fails_closed) {
  auto user = make_address(0x45);
  node.set_call_result(hex(a402::contract::encode_has_access("video-001", user)),
                       "0x02");
  EXPECT_FALSE(make_gate(true).check(user).granted);
}

TEST(access_source, names_round_trip) {
  EXPECT_EQ(a402::schema::to_string(access_source_t::on_chain), "on-chain");
  EXPECT_EQ(a402::schema::try_from_string<access_source_t>("session"),
            access_source_t::session);
  EXPECT_FALSE(
      a402::schema::try_from_string<access_source_t>("wallet").has_value());
}
