#include <a402/abi/codec.hpp>
#include <a402/contract/vault.hpp>

#include <spdlog/spdlog.h>

namespace a402::contract {

namespace {

using a402::abi::abi_type_t;
using a402::abi::field_shape_t;

}  // namespace

const std::vector<field_shape_t>& resource_shape() {
  static const auto shape = std::vector<field_shape_t>{
      {.name = "price", .type = abi_type_t::uint256, .components = {}},
      {.name = "lifetime", .type = abi_type_t::boolean, .components = {}},
      {.name = "active", .type = abi_type_t::boolean, .components = {}},
      {.name = "exists", .type = abi_type_t::boolean, .components = {}},
      {.name = "content_type", .type = abi_type_t::string, .components = {}},
      {.name = "content_ref", .type = abi_type_t::string, .components = {}},
      {.name = "total_payments", .type = abi_type_t::uint256, .components = {}},
  };
  return shape;
}

a402::schema::bytes_t encode_has_access(const std::string_view resource_id,
                                        const a402::schema::address_t& user) {
  return a402::abi::encode_call(kHasAccessSignature,
                                {std::string{resource_id}, user});
}

a402::schema::bytes_t encode_get_resource(const std::string_view resource_id) {
  return a402::abi::encode_call(kGetResourceSignature,
                                {std::string{resource_id}});
}

a402::schema::bytes_t encode_pay_for_access(
    const std::string_view resource_id,
    const a402::schema::hash32_t& nonce) {
  return a402::abi::encode_call(kPayForAccessSignature,
                                {std::string{resource_id}, nonce});
}

a402::schema::resource_t decode_resource(
    const std::string_view resource_id,
    const a402::schema::bytes_view_t& data) {
  auto decoded = a402::abi::decode_return(data, resource_shape());
  return a402::schema::resource_t{
      .resource_id = std::string{resource_id},
      .price = decoded.get<a402::schema::amount_t>("price"),
      .lifetime = decoded.get<bool>("lifetime"),
      .active = decoded.get<bool>("active"),
      .exists = decoded.get<bool>("exists"),
      .content_type = decoded.get<std::string>("content_type"),
      .content_ref = decoded.get<std::string>("content_ref"),
      .total_payments = decoded.get<a402::schema::amount_t>("total_payments")};
}

std::optional<payment_event_t> try_decode_payment_event(
    const a402::schema::log_entry_t& log) {
  if (log.topics.size() < kMinimumPaymentTopics ||
      log.data.size() < kMinimumPaymentDataBytes) {
    return std::nullopt;
  }
  auto data = a402::schema::make_bytes_view(log.data);
  return payment_event_t{
      .payer = a402::abi::word_to_address(log.topics[kPayerTopic]),
      .beneficiary = a402::abi::word_to_address(log.topics[kBeneficiaryTopic]),
      .amount = a402::abi::read_uint_word(data, kAmountWord * abi::kWordSize)};
}

std::optional<std::string> try_decode_event_resource_id(
    const a402::schema::log_entry_t& log) {
  static const auto shape = std::vector<field_shape_t>{
      {.name = "resource_id", .type = abi_type_t::string, .components = {}},
      {.name = "amount", .type = abi_type_t::uint256, .components = {}},
  };
  auto decoded = a402::abi::try_decode_return(
      a402::schema::make_bytes_view(log.data), shape);
  if (!decoded.has_value()) {
    return std::nullopt;
  }
  return decoded->get<std::string>("resource_id");
}

vault_client::vault_client(const a402::rpc::chain_reader& reader,
                           a402::schema::address_t contract)
    : reader_{reader}, contract_{contract} {}

bool vault_client::has_access(const std::string_view resource_id,
                              const a402::schema::address_t& user) const {
  auto call = encode_has_access(resource_id, user);
  auto result = reader_.call(contract_, a402::schema::make_bytes_view(call));
  if (result.empty()) {
    spdlog::debug("hasAccess({}, {}) returned no data", resource_id,
                  a402::schema::to_hex_prefixed(user));
    return false;
  }
  static const auto shape = std::vector<field_shape_t>{
      {.name = "granted", .type = abi_type_t::boolean, .components = {}}};
  return a402::abi::decode_return(a402::schema::make_bytes_view(result), shape)
      .get<bool>("granted");
}

a402::schema::resource_t vault_client::get_resource(
    const std::string_view resource_id) const {
  auto call = encode_get_resource(resource_id);
  auto result = reader_.call(contract_, a402::schema::make_bytes_view(call));
  return decode_resource(resource_id, a402::schema::make_bytes_view(result));
}

}  // namespace a402::contract
