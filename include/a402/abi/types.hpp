#pragma once

#include <a402/abi/error.hpp>
#include <a402/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace a402::abi {

inline constexpr auto kWordSize = std::size_t{32};
inline constexpr auto kSelectorSize = std::size_t{4};

enum class abi_type_t : uint8_t {
  uint256 = 0,
  address = 1,
  boolean = 2,
  bytes32 = 3,
  string = 4,
  bytes = 5,
  tuple = 6
};

/// Canonical type names only; anything else (`uint8`, `int256`, arrays) is
/// unsupported rather than guessed at.
std::optional<abi_type_t> try_parse_type(std::string_view name);
std::string_view type_name(abi_type_t type);

/// Outgoing call argument. The alternative must agree with the declared
/// parameter type: uint256 = amount_t, address = address_t, bool = bool,
/// bytes32 = hash32_t, string = std::string, bytes = bytes_t.
using abi_arg_t = std::variant<a402::schema::amount_t,
                               bool,
                               a402::schema::address_t,
                               a402::schema::hash32_t,
                               std::string,
                               a402::schema::bytes_t>;

/// Declared output field. `components` is only used for tuples.
struct field_shape_t final {
  std::string name;
  abi_type_t type{abi_type_t::uint256};
  std::vector<field_shape_t> components;
};

bool is_dynamic(const field_shape_t& shape);
/// Bytes the field occupies in the head of its enclosing tuple.
std::size_t head_size(const field_shape_t& shape);

struct decoded_field_t;

/// Ordered fields of a decoded tuple, addressable by declared name.
struct decoded_tuple_t final {
  std::vector<decoded_field_t> fields;

  bool contains(std::string_view name) const;

  /// Typed access; throws abi_error when the field is missing or holds a
  /// different type.
  template <typename T>
  const T& get(std::string_view name) const;

  bool operator==(const decoded_tuple_t&) const;
};

using abi_value_t = std::variant<a402::schema::amount_t,
                                 bool,
                                 a402::schema::address_t,
                                 a402::schema::hash32_t,
                                 std::string,
                                 a402::schema::bytes_t,
                                 decoded_tuple_t>;

struct decoded_field_t final {
  std::string name;
  abi_value_t value;

  bool operator==(const decoded_field_t&) const = default;
};

inline bool decoded_tuple_t::operator==(const decoded_tuple_t& other) const {
  return fields == other.fields;
}

inline bool decoded_tuple_t::contains(std::string_view name) const {
  for (const auto& field : fields) {
    if (field.name == name) {
      return true;
    }
  }
  return false;
}

template <typename T>
const T& decoded_tuple_t::get(std::string_view name) const {
  for (const auto& field : fields) {
    if (field.name != name) {
      continue;
    }
    if (const auto* value = std::get_if<T>(&field.value)) {
      return *value;
    }
    throw abi_error{abi_error_code::type_mismatch,
                    "field '" + std::string{name} + "' has a different type"};
  }
  throw abi_error{abi_error_code::missing_field,
                  "field '" + std::string{name} + "' not present"};
}

/// Parsed `name(type,type,...)`.
struct function_signature_t final {
  std::string name;
  std::vector<abi_type_t> inputs;

  /// Canonical text hashed for the selector.
  std::string canonical() const;
};

/// Throws abi_error(invalid_signature | unsupported_type).
function_signature_t parse_signature(std::string_view signature);

}  // namespace a402::abi
