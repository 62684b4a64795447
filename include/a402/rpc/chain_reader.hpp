#pragma once

#include <a402/rpc/transport.hpp>
#include <a402/schema/chain_transaction.hpp>
#include <a402/schema/primitives.hpp>
#include <a402/schema/receipt.hpp>

#include <optional>
#include <string_view>

namespace a402::rpc {

/// Stateless reads against a node. Holds no state besides the transport, so
/// concurrent use is as safe as the transport it wraps.
class chain_reader final {
 public:
  explicit chain_reader(transport_t transport);

  /// `eth_call` against the latest block; returns the raw return data.
  a402::schema::bytes_t call(const a402::schema::address_t& to,
                             const a402::schema::bytes_view_t& data) const;

  /// std::nullopt while the transaction is unknown or not yet mined.
  std::optional<a402::schema::receipt_t> get_receipt(
      std::string_view transaction_id) const;

  std::optional<a402::schema::chain_transaction_t> get_transaction(
      std::string_view transaction_id) const;

 private:
  transport_t transport_;
};

}  // namespace a402::rpc
