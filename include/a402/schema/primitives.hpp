#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace a402::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using address_t = std::array<uint8_t, 20>;
using selector_t = std::array<uint8_t, 4>;
using amount_t = boost::multiprecision::uint256_t;
using timestamp_milliseconds_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

hash32_t make_hash32(const bytes_t& bytes);
hash32_t make_hash32(const std::string_view& hex);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

/// Parse a 20-byte account address from `0x`-prefixed or bare hex.
address_t make_address(const std::string_view& hex);
std::optional<address_t> try_make_address(const std::string_view& hex);

/// Lower-case hex without prefix.
std::string to_hex(const bytes_view_t& bytes);
/// Lower-case hex with `0x` prefix, the form JSON-RPC expects.
std::string to_hex_prefixed(const bytes_view_t& bytes);
std::string to_hex_prefixed(const address_t& address);
std::string to_hex_prefixed(const hash32_t& hash);

std::optional<bytes_t> try_from_hex(const std::string_view hex);
bytes_t from_hex(const std::string_view hex);

/// Parse a JSON-RPC quantity (`0x1a`, `0x0`) into a 256-bit value.
std::optional<amount_t> try_parse_quantity(const std::string_view hex);

/// Lower-case ASCII copy; transaction ids and addresses compare this way.
std::string to_lower(std::string_view value);
bool iequals(std::string_view lhs, std::string_view rhs);

}  // namespace a402::schema
