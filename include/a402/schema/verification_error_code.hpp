#pragma once

#include <cstdint>

namespace a402::schema {

enum class verification_error_code : uint32_t {
  ok = 0,
  invalid_transaction_id = 1,
  transport_failure = 2,
  not_found = 3,
  pending = 4,
  reverted = 5,
  wrong_destination = 6,
  no_contract_events = 7,
  no_matching_payment = 8,
  decode_error = 9,
};

}  // namespace a402::schema
