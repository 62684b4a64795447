#pragma once

#include <a402/schema/primitives.hpp>

#include <cstdint>
#include <vector>

// Schema type: log entry.
// One event emitted during transaction execution, as reported in a receipt.
namespace a402::schema {

struct log_entry_t final {
  address_t address{};
  std::vector<hash32_t> topics;
  bytes_t data;
  uint64_t log_index{};
};

}  // namespace a402::schema
