#pragma once
#include <a402/schema/primitives.hpp>
#include <array>
#include <cstdint>
#include <span>
#include <string_view>

namespace a402::keccak {

/// Incremental Keccak-256 as used for Ethereum selectors, event topics and
/// addresses. This is the original Keccak submission padding (0x01 .. 0x80),
/// not the FIPS-202 SHA3-256 padding (0x06 .. 0x80); the two produce
/// different digests for every input.
class hasher final {
 public:
  static constexpr auto kRateBytes = std::size_t{136};

  hasher() = default;

  void update(const a402::schema::bytes_view_t& bytes);
  void update(const std::string_view& str);

  /// Pad, permute and squeeze `out.size()` bytes. The hasher is reset
  /// afterwards.
  void finalize(std::span<uint8_t> out);
  a402::schema::hash32_t finalize();

 private:
  void absorb_byte(uint8_t value);
  void reset();

  std::array<uint64_t, 25> state_{};
  std::size_t position_{};
};

a402::schema::hash32_t hash(const std::string_view& str);
a402::schema::hash32_t hash(const a402::schema::bytes_view_t& bytes);

/// First four digest bytes of a canonical signature such as
/// `hasAccess(string,address)`.
a402::schema::selector_t selector(const std::string_view& signature);

/// Full digest of an event signature, matched against log topic 0.
a402::schema::hash32_t event_topic(const std::string_view& signature);

}  // namespace a402::keccak
