#pragma once

#include <a402/rpc/transport.hpp>
#include <a402/schema/primitives.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace a402::testing {

/// In-process JSON-RPC node behind the transport seam. Serves canned
/// receipts, transactions and eth_call results and counts every request.
/// Must outlive any transport obtained from it.
class fake_node final {
 public:
  a402::rpc::transport_t transport() {
    return [this](const std::string_view method, const nlohmann::json& params) {
      return handle(method, params);
    };
  }

  void add_receipt(const std::string& transaction_id, nlohmann::json receipt) {
    receipts_[a402::schema::to_lower(transaction_id)] = std::move(receipt);
  }

  void add_transaction(const std::string& transaction_id,
                       nlohmann::json transaction) {
    transactions_[a402::schema::to_lower(transaction_id)] =
        std::move(transaction);
  }

  /// Result for eth_call whose data equals `call_data` (hex, any case).
  void set_call_result(const std::string& call_data, std::string result) {
    call_results_[a402::schema::to_lower(call_data)] = std::move(result);
  }

  void fail_method(const std::string& method) { failing_.insert(method); }

  std::size_t count(const std::string& method) const {
    auto it = counts_.find(method);
    return it == counts_.end() ? 0 : it->second;
  }

  std::size_t total() const {
    auto sum = std::size_t{};
    for (const auto& [_, n] : counts_) {
      sum += n;
    }
    return sum;
  }

  const std::vector<nlohmann::json>& calls() const { return calls_; }

 private:
  nlohmann::json handle(const std::string_view method,
                        const nlohmann::json& params) {
    auto name = std::string{method};
    ++counts_[name];
    if (failing_.contains(name)) {
      throw a402::rpc::transport_error{"connection refused"};
    }
    if (name == "eth_getTransactionReceipt") {
      return lookup(receipts_, params.at(0).get<std::string>());
    }
    if (name == "eth_getTransactionByHash") {
      return lookup(transactions_, params.at(0).get<std::string>());
    }
    if (name == "eth_call") {
      calls_.push_back(params);
      auto data =
          a402::schema::to_lower(params.at(0).at("data").get<std::string>());
      auto it = call_results_.find(data);
      return it == call_results_.end() ? nlohmann::json("0x")
                                       : nlohmann::json(it->second);
    }
    throw a402::rpc::transport_error{"method not found: " + name};
  }

  static nlohmann::json lookup(const std::map<std::string, nlohmann::json>& table,
                               const std::string& key) {
    auto it = table.find(a402::schema::to_lower(key));
    return it == table.end() ? nlohmann::json{} : it->second;
  }

  std::map<std::string, nlohmann::json> receipts_;
  std::map<std::string, nlohmann::json> transactions_;
  std::map<std::string, std::string> call_results_;
  std::set<std::string> failing_;
  std::map<std::string, std::size_t> counts_;
  std::vector<nlohmann::json> calls_;
};

inline std::string quantity(const uint64_t value) {
  auto out = std::ostringstream{};
  out << "0x" << std::hex << value;
  return out.str();
}

/// Receipt JSON as a node returns it. `status` is "0x1" or "0x0".
inline nlohmann::json make_receipt_json(const std::string& transaction_id,
                                        const std::string& status,
                                        nlohmann::json logs) {
  return nlohmann::json{{"transactionHash", transaction_id},
                        {"status", status},
                        {"blockNumber", "0x10"},
                        {"logs", std::move(logs)}};
}

inline nlohmann::json make_log_json(
    const a402::schema::address_t& address,
    const std::vector<a402::schema::hash32_t>& topics,
    const a402::schema::bytes_t& data,
    const uint64_t index = 0) {
  auto topic_list = nlohmann::json::array();
  for (const auto& topic : topics) {
    topic_list.push_back(a402::schema::to_hex_prefixed(topic));
  }
  return nlohmann::json{
      {"address", a402::schema::to_hex_prefixed(address)},
      {"topics", topic_list},
      {"data",
       a402::schema::to_hex_prefixed(a402::schema::make_bytes_view(data))},
      {"logIndex", quantity(index)}};
}

inline nlohmann::json make_transaction_json(
    const std::string& transaction_id,
    const a402::schema::address_t& from,
    const std::optional<a402::schema::address_t>& to) {
  return nlohmann::json{
      {"hash", transaction_id},
      {"from", a402::schema::to_hex_prefixed(from)},
      {"to", to ? nlohmann::json(a402::schema::to_hex_prefixed(*to))
                : nlohmann::json{}},
      {"value", "0x38d7ea4c68000"},
      {"input", "0x"},
      {"blockNumber", "0x10"}};
}

}  // namespace a402::testing
