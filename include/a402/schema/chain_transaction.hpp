#pragma once

#include <a402/schema/primitives.hpp>

#include <optional>

// Schema type: chain transaction.
// The subset of a transaction object the verifier needs. `to` is empty for
// contract creation.
namespace a402::schema {

struct chain_transaction_t final {
  hash32_t hash{};
  address_t from{};
  std::optional<address_t> to;
  amount_t value{};
  bytes_t input;
  std::optional<uint64_t> block_number;
};

}  // namespace a402::schema
