#pragma once

#include <a402/schema/enum_string.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: verification status.
// Payment lifecycle of one transaction id: unseen until first asked about,
// pending while the node knows the transaction but has no receipt, then one
// of the terminal states.
namespace a402::schema {

enum class verification_status_t : uint8_t {
  unseen = 0,
  pending = 1,
  verified = 2,
  reverted = 3,
  rejected = 4,
  not_found = 5,
  decode_error = 6,
  transport_failure = 7
};

inline constexpr auto kVerificationStatusNames =
    enum_names_t<verification_status_t, 8>{{
    {"unseen", verification_status_t::unseen},
    {"pending", verification_status_t::pending},
    {"verified", verification_status_t::verified},
    {"reverted", verification_status_t::reverted},
    {"rejected", verification_status_t::rejected},
    {"not_found", verification_status_t::not_found},
    {"decode_error", verification_status_t::decode_error},
    {"transport_failure", verification_status_t::transport_failure},
}};

template <>
inline std::optional<verification_status_t>
try_from_string<verification_status_t>(const std::string_view value) {
  return lookup_enum(value, kVerificationStatusNames);
}

inline constexpr std::string_view to_string(const verification_status_t value) {
  return name_of(value, kVerificationStatusNames, "unknown");
}

/// Terminal states never change for the same transaction id.
inline constexpr bool is_terminal(const verification_status_t value) {
  using enum verification_status_t;
  return value == verified || value == reverted || value == rejected;
}

}  // namespace a402::schema
