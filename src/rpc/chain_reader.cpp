#include <a402/rpc/chain_reader.hpp>

#include <spdlog/spdlog.h>

#include <limits>
#include <string>
#include <utility>

namespace a402::rpc {

namespace {

using a402::schema::address_t;
using a402::schema::bytes_t;
using a402::schema::hash32_t;

const nlohmann::json& require_field(const nlohmann::json& object,
                                    const std::string_view name) {
  auto it = object.find(std::string{name});
  if (it == object.end() || it->is_null()) {
    throw response_error{"response is missing '" + std::string{name} + "'"};
  }
  return *it;
}

std::string require_string(const nlohmann::json& value,
                           const std::string_view name) {
  if (!value.is_string()) {
    throw response_error{"'" + std::string{name} + "' is not a string"};
  }
  return value.get<std::string>();
}

bytes_t parse_data(const nlohmann::json& value, const std::string_view name) {
  auto decoded = a402::schema::try_from_hex(require_string(value, name));
  if (!decoded.has_value()) {
    throw response_error{"'" + std::string{name} + "' is not hex data"};
  }
  return *decoded;
}

hash32_t parse_hash(const nlohmann::json& value, const std::string_view name) {
  auto hash = a402::schema::try_make_hash32(require_string(value, name));
  if (!hash.has_value()) {
    throw response_error{"'" + std::string{name} + "' is not a 32-byte hash"};
  }
  return *hash;
}

address_t parse_address(const nlohmann::json& value,
                        const std::string_view name) {
  auto address = a402::schema::try_make_address(require_string(value, name));
  if (!address.has_value()) {
    throw response_error{"'" + std::string{name} + "' is not an address"};
  }
  return *address;
}

a402::schema::amount_t parse_quantity(const nlohmann::json& value,
                                      const std::string_view name) {
  auto quantity = a402::schema::try_parse_quantity(require_string(value, name));
  if (!quantity.has_value()) {
    throw response_error{"'" + std::string{name} + "' is not a quantity"};
  }
  return *quantity;
}

std::optional<uint64_t> optional_u64(const nlohmann::json& object,
                                     const std::string_view name) {
  auto it = object.find(std::string{name});
  if (it == object.end() || it->is_null()) {
    return std::nullopt;
  }
  auto value = parse_quantity(*it, name);
  if (value > std::numeric_limits<uint64_t>::max()) {
    throw response_error{"'" + std::string{name} + "' overflows 64 bits"};
  }
  return value.convert_to<uint64_t>();
}

std::optional<address_t> optional_address(const nlohmann::json& object,
                                          const std::string_view name) {
  auto it = object.find(std::string{name});
  if (it == object.end() || it->is_null()) {
    return std::nullopt;
  }
  return parse_address(*it, name);
}

a402::schema::log_entry_t parse_log(const nlohmann::json& value) {
  if (!value.is_object()) {
    throw response_error{"log entry is not an object"};
  }
  auto log = a402::schema::log_entry_t{};
  log.address = parse_address(require_field(value, "address"), "address");
  const auto& topics = require_field(value, "topics");
  if (!topics.is_array()) {
    throw response_error{"'topics' is not an array"};
  }
  log.topics.reserve(topics.size());
  for (const auto& topic : topics) {
    log.topics.push_back(parse_hash(topic, "topics"));
  }
  log.data = parse_data(require_field(value, "data"), "data");
  log.log_index = optional_u64(value, "logIndex").value_or(0);
  return log;
}

a402::schema::receipt_t parse_receipt(const nlohmann::json& value) {
  if (!value.is_object()) {
    throw response_error{"receipt is not an object"};
  }
  auto receipt = a402::schema::receipt_t{};
  receipt.transaction_hash = parse_hash(
      require_field(value, "transactionHash"), "transactionHash");
  receipt.status = optional_u64(value, "status");
  receipt.block_number = optional_u64(value, "blockNumber");
  receipt.to = optional_address(value, "to");
  if (auto logs = value.find("logs"); logs != value.end() && !logs->is_null()) {
    if (!logs->is_array()) {
      throw response_error{"'logs' is not an array"};
    }
    receipt.logs.reserve(logs->size());
    for (const auto& log : *logs) {
      receipt.logs.push_back(parse_log(log));
    }
  }
  return receipt;
}

a402::schema::chain_transaction_t parse_transaction(
    const nlohmann::json& value) {
  if (!value.is_object()) {
    throw response_error{"transaction is not an object"};
  }
  auto tx = a402::schema::chain_transaction_t{};
  tx.hash = parse_hash(require_field(value, "hash"), "hash");
  tx.from = parse_address(require_field(value, "from"), "from");
  tx.to = optional_address(value, "to");
  if (auto it = value.find("value"); it != value.end() && !it->is_null()) {
    tx.value = parse_quantity(*it, "value");
  }
  if (auto it = value.find("input"); it != value.end() && !it->is_null()) {
    tx.input = parse_data(*it, "input");
  }
  tx.block_number = optional_u64(value, "blockNumber");
  return tx;
}

}  // namespace

chain_reader::chain_reader(transport_t transport)
    : transport_{std::move(transport)} {}

bytes_t chain_reader::call(const address_t& to,
                           const a402::schema::bytes_view_t& data) const {
  spdlog::debug("eth_call to {} ({} bytes)", a402::schema::to_hex_prefixed(to),
                data.size());
  auto params = nlohmann::json::array(
      {nlohmann::json{{"to", a402::schema::to_hex_prefixed(to)},
                      {"data", a402::schema::to_hex_prefixed(data)}},
       "latest"});
  auto result = transport_("eth_call", params);
  if (result.is_null()) {
    return {};
  }
  return parse_data(result, "eth_call result");
}

std::optional<a402::schema::receipt_t> chain_reader::get_receipt(
    const std::string_view transaction_id) const {
  spdlog::debug("eth_getTransactionReceipt {}", transaction_id);
  auto result = transport_("eth_getTransactionReceipt",
                           nlohmann::json::array({std::string{transaction_id}}));
  if (result.is_null()) {
    return std::nullopt;
  }
  return parse_receipt(result);
}

std::optional<a402::schema::chain_transaction_t> chain_reader::get_transaction(
    const std::string_view transaction_id) const {
  spdlog::debug("eth_getTransactionByHash {}", transaction_id);
  auto result = transport_("eth_getTransactionByHash",
                           nlohmann::json::array({std::string{transaction_id}}));
  if (result.is_null()) {
    return std::nullopt;
  }
  return parse_transaction(result);
}

}  // namespace a402::rpc
