#pragma once

#include <a402/schema/enum_string.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: access source.
// Why a user was let in: a payment verified during this process lifetime, or
// a lifetime grant recorded by the contract.
namespace a402::schema {

enum class access_source_t : uint8_t { none = 0, session = 1, on_chain = 2 };

inline constexpr auto kAccessSourceNames = enum_names_t<access_source_t, 3>{{
    {"none", access_source_t::none},
    {"session", access_source_t::session},
    {"on-chain", access_source_t::on_chain},
}};

template <>
inline std::optional<access_source_t> try_from_string<access_source_t>(
    const std::string_view value) {
  return lookup_enum(value, kAccessSourceNames);
}

inline constexpr std::string_view to_string(const access_source_t value) {
  return name_of(value, kAccessSourceNames, "none");
}

}  // namespace a402::schema
