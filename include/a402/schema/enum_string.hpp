#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

// Name tables for schema enums. Names are what appears in logs, CLI output
// and config values; lookups ignore ASCII case and accept '_' for '-'.
namespace a402::schema {

template <typename Enum>
struct enum_name_t final {
  std::string_view name;
  Enum value;
};

template <typename Enum, std::size_t N>
using enum_names_t = std::array<enum_name_t<Enum>, N>;

constexpr char fold_name_char(const char c) {
  if (c >= 'A' && c <= 'Z') {
    return static_cast<char>(c - 'A' + 'a');
  }
  return c == '_' ? '-' : c;
}

constexpr bool same_enum_name(const std::string_view lhs,
                              const std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    if (fold_name_char(lhs[i]) != fold_name_char(rhs[i])) {
      return false;
    }
  }
  return true;
}

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> lookup_enum(const std::string_view name,
                                          const enum_names_t<Enum, N>& names) {
  for (const auto& entry : names) {
    if (same_enum_name(entry.name, name)) {
      return entry.value;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::string_view name_of(const Enum value,
                                   const enum_names_t<Enum, N>& names,
                                   const std::string_view fallback) {
  for (const auto& entry : names) {
    if (entry.value == value) {
      return entry.name;
    }
  }
  return fallback;
}

/// Specialized next to each enum that has a name table.
template <typename Enum>
std::optional<Enum> try_from_string(const std::string_view value) = delete;

}  // namespace a402::schema
