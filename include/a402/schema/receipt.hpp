#pragma once

#include <a402/schema/log_entry.hpp>
#include <a402/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <vector>

// Schema type: receipt.
// Outcome of a mined transaction. `status` is absent on nodes that predate
// status codes; only an explicit 1 counts as success.
namespace a402::schema {

struct receipt_t final {
  hash32_t transaction_hash{};
  std::optional<uint64_t> status;
  std::optional<uint64_t> block_number;
  std::optional<address_t> to;
  std::vector<log_entry_t> logs;

  bool succeeded() const { return status.has_value() && *status == 1; }
};

}  // namespace a402::schema
