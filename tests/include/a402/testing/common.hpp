#pragma once

#include <a402/abi/codec.hpp>
#include <a402/schema/primitives.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace a402::testing {

inline a402::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = a402::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline a402::schema::address_t make_address(const uint8_t seed) {
  auto out = a402::schema::address_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

/// Lower-case `0x...` transaction id derived from `seed`.
inline std::string make_transaction_id(const uint8_t seed) {
  return a402::schema::to_hex_prefixed(make_hash(seed));
}

/// Upper-case hex digits with a lower-case prefix, as some wallets report.
inline std::string to_upper_hex(std::string_view hex) {
  auto out = std::string{hex};
  for (std::size_t i = 2; i < out.size(); ++i) {
    if (out[i] >= 'a' && out[i] <= 'f') {
      out[i] = static_cast<char>(out[i] - 'a' + 'A');
    }
  }
  return out;
}

inline a402::schema::hash32_t address_topic(
    const a402::schema::address_t& address) {
  return a402::abi::encode_word(address);
}

/// Payment event data: word 0 left empty, word 1 the amount.
inline a402::schema::bytes_t payment_data(const a402::schema::amount_t& amount) {
  auto out = a402::schema::bytes_t(a402::abi::kWordSize, 0);
  auto word = a402::abi::encode_word(amount);
  out.insert(out.end(), word.begin(), word.end());
  return out;
}

}  // namespace a402::testing
