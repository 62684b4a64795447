#pragma once

#include <a402/schema/primitives.hpp>

#include <cstdint>
#include <string>

// Schema type: verification record.
// Stored once per normalized transaction id after a successful payment
// proof; subsequent lookups return it unchanged.
namespace a402::schema {

template <uint16_t Version>
struct verification_record;

template <>
struct verification_record<1> final {
  uint16_t version{1};
  std::string transaction_id;
  bool verified{};
  address_t payer{};
  address_t beneficiary{};
  amount_t amount{};
  timestamp_milliseconds_t timestamp{};

  bool operator==(const verification_record&) const = default;
};

using verification_record_t = verification_record<1>;

}  // namespace a402::schema
