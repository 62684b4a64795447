#pragma once

#include <a402/schema/primitives.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace a402::schema {

inline constexpr auto kNativeDecimals = 18u;

/// Convert a decimal currency amount ("0.001") to base units. Fractional
/// digits beyond `decimals` are truncated. Returns std::nullopt for anything
/// that is not `digits[.digits]`.
std::optional<amount_t> try_to_base_units(std::string_view amount,
                                          unsigned decimals = kNativeDecimals);
amount_t to_base_units(std::string_view amount,
                       unsigned decimals = kNativeDecimals);

/// Inverse of to_base_units with trailing fractional zeros trimmed.
std::string format_base_units(const amount_t& value,
                              unsigned decimals = kNativeDecimals);

}  // namespace a402::schema
